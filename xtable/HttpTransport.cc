// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <sstream>
#include <cpprest/http_client.h>

#include "HttpTransport.hh"
#include "TableRequestOptions.hh"
#include "StorageException.hh"
#include "XTableConst.hh"
#include "Logger.hh"
#include "Trace.hh"

using namespace xtable;
using namespace web::http;
using namespace web::http::client;

static std::string
ClientKey(
    const web::uri & uri,
    int timeoutSeconds
    )
{
    std::ostringstream strm;
    strm << uri.scheme() << "://" << uri.authority().to_string() << "#" << timeoutSeconds;
    return strm.str();
}

static http_request
CreateRequest(
    const TableHttpRequest & request
    )
{
    http_request req(request.method);
    req.set_request_uri(request.uri.resource());

    if (request.HasBody()) {
        req.set_body(*request.body);
    }
    // After set_body: it installs its own Content-Type, ours must win.
    for (const auto & item : request.headers) {
        req.headers()[item.first] = item.second;
    }
    return req;
}

HttpTransport::~HttpTransport()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_clients.clear();
}

std::shared_ptr<http_client>
HttpTransport::GetClient(
    const web::uri & uri,
    int timeoutSeconds
    )
{
    auto key = ClientKey(uri, timeoutSeconds);

    std::lock_guard<std::mutex> lock(m_mutex);
    auto iter = m_clients.find(key);
    if (iter != m_clients.end()) {
        return iter->second;
    }

    Trace trace(Trace::Transport, "HttpTransport::GetClient");
    TRACEINFO(trace, "Creating http client for " << key);

    http_client_config config;
    config.set_timeout(std::chrono::seconds(timeoutSeconds));
    auto client = std::make_shared<http_client>(uri.authority(), config);
    m_clients[key] = client;
    return client;
}

void
HttpTransport::ResetClient(
    const web::uri & uri,
    int timeoutSeconds
    )
{
    Trace trace(Trace::Transport, "HttpTransport::ResetClient");

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_clients.erase(ClientKey(uri, timeoutSeconds))) {
        trace.NOTE("Http client will be reset due to previous failure.");
    }
}

TransportResponse
HttpTransport::Send(
    const TableHttpRequest & request,
    const TableRequestOptions & options
    )
{
    Trace trace(Trace::Transport, "HttpTransport::Send");

    int timeout = static_cast<int>(options.ServerTimeout().count());
    if (timeout <= 0) {
        timeout = XTableConstants::DefaultServerTimeout();
    }
    timeout += XTableConstants::TransportTimeoutMargin();

    TransportResponse result;
    try {
        auto client = GetClient(request.uri, timeout);
        auto response = client->request(CreateRequest(request)).get();

        result.statusCode = response.status_code();
        result.reasonPhrase = response.reason_phrase();
        result.headers = response.headers();
        auto body = response.extract_vector().get();
        result.body.assign(body.begin(), body.end());
    }
    catch (const http_exception & ex) {
        ResetClient(request.uri, timeout);
        std::ostringstream msg;
        msg << "HTTP transport failure on " << request.method << " " << request.uri.to_string()
            << ": " << ex.what() << " (" << ex.error_code().value() << ")";
        Logger::LogWarn(msg);
        throw StorageException(msg.str(), 0, std::string(), true);
    }
    catch (const std::exception & ex) {
        ResetClient(request.uri, timeout);
        std::ostringstream msg;
        msg << "Transport failure on " << request.method << " " << request.uri.to_string() << ": " << ex.what();
        Logger::LogWarn(msg);
        throw StorageException(msg.str(), 0, std::string(), true);
    }

    TRACEINFO(trace, request.method << " " << request.uri.to_string() << " -> " << result.statusCode
              << " " << result.reasonPhrase << ", " << result.body.size() << " bytes");
    return result;
}
