// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <gtest/gtest.h>
#include <stdexcept>

#include "RequestSigner.hh"
#include "OperationContext.hh"
#include "FakeTransport.hh"

using namespace xtable;
using namespace xtable::test;

namespace
{

TableHttpRequest
RequestFor(const std::string & uri, const std::string & date = "Thu, 15 Aug 2013 10:00:00 GMT")
{
    TableHttpRequest request;
    request.method = web::http::methods::GET;
    request.uri = web::uri(uri);
    if (!date.empty()) {
        request.headers.add("x-ms-date", date);
    }
    return request;
}

}

TEST(SharedKeyLiteSigner, StringToSign)
{
    auto request = RequestFor("https://acct.table.core.windows.net/T(PartitionKey='a',RowKey='1')?timeout=30");
    EXPECT_EQ("Thu, 15 Aug 2013 10:00:00 GMT\n/acct/T(PartitionKey='a',RowKey='1')",
              SharedKeyLiteSigner::StringToSign("acct", request));
}

TEST(SharedKeyLiteSigner, StringToSignKeepsComp)
{
    auto request = RequestFor("https://acct.table.core.windows.net/?timeout=30&comp=properties");
    EXPECT_EQ("Thu, 15 Aug 2013 10:00:00 GMT\n/acct/?comp=properties",
              SharedKeyLiteSigner::StringToSign("acct", request));
}

TEST(SharedKeyLiteSigner, KnownSignature)
{
    SharedKeyLiteSigner signer("acct", "a2V5");
    OperationContext context;
    auto request = RequestFor("https://acct.table.core.windows.net/T(PartitionKey='a',RowKey='1')");

    signer.Sign(request, context);

    EXPECT_EQ("SharedKeyLite acct:QijOBwm2QIeaS1WDiTGLMIPVTeiAL7DC3Ezn0b+9dX8=", HeaderOf(request, "Authorization"));
}

TEST(SharedKeyLiteSigner, AddsDateWhenMissing)
{
    SharedKeyLiteSigner signer("acct", "a2V5");
    OperationContext context;
    auto request = RequestFor("https://acct.table.core.windows.net/T", "");

    signer.Sign(request, context);

    EXPECT_NE("<none>", HeaderOf(request, "x-ms-date"));
    EXPECT_EQ(0u, HeaderOf(request, "Authorization").find("SharedKeyLite acct:"));
}

TEST(SharedKeyLiteSigner, ResigningReplacesAuthorization)
{
    SharedKeyLiteSigner signer("acct", "a2V5");
    OperationContext context;
    auto request = RequestFor("https://acct.table.core.windows.net/T(PartitionKey='a',RowKey='1')");

    signer.Sign(request, context);
    signer.Sign(request, context);

    EXPECT_EQ("SharedKeyLite acct:QijOBwm2QIeaS1WDiTGLMIPVTeiAL7DC3Ezn0b+9dX8=", HeaderOf(request, "Authorization"));
}

TEST(SharedKeyLiteSigner, RejectsBadCredentials)
{
    EXPECT_THROW(SharedKeyLiteSigner("", "a2V5"), std::invalid_argument);
    EXPECT_THROW(SharedKeyLiteSigner("acct", ""), std::invalid_argument);
    EXPECT_THROW(SharedKeyLiteSigner("acct", "not base64!"), std::invalid_argument);
}

TEST(SasSigner, AppendsToken)
{
    SasSigner signer("?sv=2013-08-15&tn=T&sig=abc%3D");
    OperationContext context;
    auto request = RequestFor("https://acct.table.core.windows.net/T?timeout=30");

    signer.Sign(request, context);

    EXPECT_EQ("timeout=30&sv=2013-08-15&tn=T&sig=abc%3D", request.uri.query());
    EXPECT_EQ("<none>", HeaderOf(request, "Authorization"));
}

TEST(SasSigner, TokenOnlyQuery)
{
    SasSigner signer("sv=2013-08-15&sig=x");
    OperationContext context;
    auto request = RequestFor("https://acct.table.core.windows.net/T");

    signer.Sign(request, context);

    EXPECT_EQ("sv=2013-08-15&sig=x", request.uri.query());
}

TEST(SasSigner, RejectsEmptyToken)
{
    EXPECT_THROW(SasSigner(""), std::invalid_argument);
    EXPECT_THROW(SasSigner("?"), std::invalid_argument);
}
