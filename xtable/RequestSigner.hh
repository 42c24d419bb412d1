// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _REQUESTSIGNER_HH_
#define _REQUESTSIGNER_HH_

#include <string>
#include <vector>
#include "TableHttpRequest.hh"

namespace xtable
{

class OperationContext;

/// <summary>
/// Adds the credentials of an account to an outgoing request. Called once per
/// attempt, after every other header has been set.
/// </summary>
class IRequestSigner
{
public:
    virtual ~IRequestSigner() {}
    virtual void Sign(TableHttpRequest & request, OperationContext & context) const = 0;
};

class AnonymousSigner : public IRequestSigner
{
public:
    void Sign(TableHttpRequest &, OperationContext &) const override {}
};

/// Appends a shared access signature token to the request's query string.
class SasSigner : public IRequestSigner
{
public:
    /// token may carry a leading '?'.
    explicit SasSigner(const std::string & token);

    void Sign(TableHttpRequest & request, OperationContext & context) const override;

private:
    std::string m_token;
};

/// <summary>
/// Signs with the account key, SharedKeyLite scheme for the table service:
///     Authorization: SharedKeyLite account:base64(HMAC-SHA256(key, StringToSign))
/// where StringToSign is the x-ms-date header, a newline, and the canonicalized
/// resource "/account/path", followed by "?comp=..." if the query has a comp parameter.
/// </summary>
class SharedKeyLiteSigner : public IRequestSigner
{
public:
    /// Throws std::invalid_argument for an empty account name or a key that isn't base64.
    SharedKeyLiteSigner(const std::string & accountName, const std::string & base64Key);

    void Sign(TableHttpRequest & request, OperationContext & context) const override;

    static std::string StringToSign(const std::string & accountName, const TableHttpRequest & request);

private:
    std::string m_accountName;
    std::vector<unsigned char> m_key;
};

}

#endif // _REQUESTSIGNER_HH_
