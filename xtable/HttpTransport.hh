// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _HTTPTRANSPORT_HH_
#define _HTTPTRANSPORT_HH_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <cpprest/http_client.h>
#include "TableHttpRequest.hh"

namespace xtable
{

class TableRequestOptions;

/// <summary>
/// Sends one attempt's request and waits for the response. A request that got
/// no HTTP response at all (connect failure, timeout, reset) is reported by
/// throwing a retryable StorageException with status 0. Any HTTP status,
/// success or not, is returned.
/// Implementations must allow concurrent calls.
/// </summary>
class ITransport
{
public:
    virtual ~ITransport() {}
    virtual TransportResponse Send(const TableHttpRequest & request, const TableRequestOptions & options) = 0;
};

/// <summary>
/// Transport over the cpprestsdk HTTP client. Keeps one http_client per
/// scheme://authority; the client timeout is the server timeout plus
/// XTableConstants::TransportTimeoutMargin() so the service times out first.
/// A client that failed is dropped from the cache and rebuilt on next use.
/// </summary>
class HttpTransport : public ITransport
{
public:
    HttpTransport() {}
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    TransportResponse Send(const TableHttpRequest & request, const TableRequestOptions & options) override;

private:
    std::shared_ptr<web::http::client::http_client> GetClient(const web::uri & uri, int timeoutSeconds);
    void ResetClient(const web::uri & uri, int timeoutSeconds);

    std::map<std::string, std::shared_ptr<web::http::client::http_client>> m_clients;
    std::mutex m_mutex;
};

}

#endif // _HTTPTRANSPORT_HH_
