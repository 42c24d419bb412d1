// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _FAKETRANSPORT_HH_
#define _FAKETRANSPORT_HH_

#include <deque>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "HttpTransport.hh"
#include "CloudTableClient.hh"
#include "StorageException.hh"
#include "TablePayloadCodec.hh"
#include "RetryPolicy.hh"

namespace xtable { namespace test {

// Transport that plays back scripted responses and records every request it got.
class FakeTransport : public ITransport
{
public:
    FakeTransport & Respond(int status, const std::string & etag = std::string(), const std::string & body = std::string())
    {
        TransportResponse response;
        response.statusCode = status;
        response.reasonPhrase = "Scripted";
        response.body = body;
        response.headers.add("x-ms-request-id", "service-request-" + std::to_string(m_script.size() + 1));
        if (!etag.empty()) {
            response.headers.add("ETag", etag);
        }
        m_script.push_back([response]() { return response; });
        return *this;
    }

    FakeTransport & Fail(const std::string & message)
    {
        m_script.push_back([message]() -> TransportResponse {
            throw StorageException("Transport failure: " + message, 0, std::string(), true);
        });
        return *this;
    }

    TransportResponse Send(const TableHttpRequest & request, const TableRequestOptions &) override
    {
        requests.push_back(request);
        if (m_script.empty()) {
            throw std::logic_error("FakeTransport: no scripted response left");
        }
        auto next = m_script.front();
        m_script.pop_front();
        return next();
    }

    std::vector<TableHttpRequest> requests;

private:
    std::deque<std::function<TransportResponse()>> m_script;
};

// JSON codec that counts how often it is asked to encode.
class CountingCodec : public JsonPayloadCodec
{
public:
    std::vector<unsigned char> WriteEntity(const TableEntity & entity, TablePayloadFormat format,
                                           bool isTableEntry, OperationContext & context) const override
    {
        writes++;
        return JsonPayloadCodec::WriteEntity(entity, format, isTableEntry, context);
    }

    mutable int writes = 0;
};

inline std::string
HeaderOf(const TableHttpRequest & request, const std::string & name)
{
    auto iter = request.headers.find(name);
    return (iter == request.headers.end()) ? std::string("<none>") : iter->second;
}

inline CloudTableClient
MakeClient(std::shared_ptr<FakeTransport> transport, bool withSecondary = false)
{
    StorageUri uri = withSecondary
        ? StorageUri(web::uri("https://acct.table.core.windows.net"), web::uri("https://acct-secondary.table.core.windows.net"))
        : StorageUri(web::uri("https://acct.table.core.windows.net"));
    return CloudTableClient(uri, nullptr, transport);
}

// Options that retry up to maxRetries times without waiting.
inline TableRequestOptions
FastRetries(int maxRetries)
{
    TableRequestOptions options;
    options.SetRetryPolicy(std::make_shared<LinearRetryPolicy>(std::chrono::milliseconds(0), maxRetries));
    return options;
}

inline TableRequestOptions
NoRetries()
{
    TableRequestOptions options;
    options.SetRetryPolicy(std::make_shared<NoRetryPolicy>());
    return options;
}

} }

#endif // _FAKETRANSPORT_HH_
