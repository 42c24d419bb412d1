// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <map>
#include <stdexcept>
#include <cpprest/asyncrt_utils.h>
#include <cpprest/base_uri.h>

#include "RequestSigner.hh"
#include "OperationContext.hh"
#include "TableConst.hh"
#include "Crypto.hh"
#include "Utility.hh"
#include "Trace.hh"

using namespace xtable;

SasSigner::SasSigner(
    const std::string & token
    ) :
    m_token(token)
{
    if (!m_token.empty() && m_token[0] == '?') {
        m_token.erase(0, 1);
    }
    if (m_token.empty()) {
        throw std::invalid_argument("SasSigner: empty shared access signature");
    }
}

void
SasSigner::Sign(
    TableHttpRequest & request,
    OperationContext &
    ) const
{
    web::uri_builder builder(request.uri);
    builder.append_query(m_token, false);
    request.uri = builder.to_uri();
}

SharedKeyLiteSigner::SharedKeyLiteSigner(
    const std::string & accountName,
    const std::string & base64Key
    ) :
    m_accountName(accountName)
{
    if (accountName.empty()) {
        throw std::invalid_argument("SharedKeyLiteSigner: empty account name");
    }
    try {
        m_key = utility::conversions::from_base64(base64Key);
    }
    catch (const std::exception & ex) {
        throw std::invalid_argument(std::string("SharedKeyLiteSigner: account key is not valid base64: ") + ex.what());
    }
    if (m_key.empty()) {
        throw std::invalid_argument("SharedKeyLiteSigner: empty account key");
    }
}

std::string
SharedKeyLiteSigner::StringToSign(
    const std::string & accountName,
    const TableHttpRequest & request
    )
{
    std::string date;
    auto iter = request.headers.find(header::c_Date);
    if (iter != request.headers.end()) {
        date = iter->second;
    }

    std::string result = date;
    result.append("\n/").append(accountName).append(request.uri.path());

    std::map<std::string, std::string> query;
    XTableUtil::ParseQueryString(request.uri.query(), query);
    auto comp = query.find("comp");
    if (comp != query.end()) {
        result.append("?comp=").append(comp->second);
    }
    return result;
}

void
SharedKeyLiteSigner::Sign(
    TableHttpRequest & request,
    OperationContext & context
    ) const
{
    Trace trace(Trace::Signing, "SharedKeyLiteSigner::Sign", context.ClientRequestId());

    if (request.headers.find(header::c_Date) == request.headers.end()) {
        request.headers.add(header::c_Date, XTableUtil::Rfc1123Now());
    }

    auto stringToSign = StringToSign(m_accountName, request);
    auto signature = utility::conversions::to_base64(Crypto::HmacSha256(m_key, stringToSign));

    request.headers[header::c_Authorization] = "SharedKeyLite " + m_accountName + ":" + signature;
    TRACEINFO(trace, "Signed for account " << m_accountName);
}
