// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEHTTPREQUEST_HH_
#define _TABLEHTTPREQUEST_HH_

#include <memory>
#include <string>
#include <vector>
#include <cpprest/http_msg.h>

namespace xtable
{

typedef std::shared_ptr<const std::vector<unsigned char>> PayloadBuffer;

/// <summary>
/// One attempt's wire request: method, full URI (query included), headers and an
/// optional body. The body is shared: every attempt of an operation points at the
/// same buffer, which was encoded once when the operation started.
/// </summary>
struct TableHttpRequest
{
    web::http::method method;
    web::uri uri;
    web::http::http_headers headers;
    PayloadBuffer body;

    bool HasBody() const { return body && !body->empty(); }
};

/// <summary>
/// The parts of an HTTP response the interpreters look at. Status 0 never
/// appears here: a missing response is reported by the transport as an exception.
/// </summary>
struct TransportResponse
{
    int statusCode = 0;
    std::string reasonPhrase;
    web::http::http_headers headers;
    std::string body;

    /// Value of header name, or an empty string.
    std::string Header(const std::string & name) const
    {
        std::string value;
        auto iter = headers.find(name);
        if (iter != headers.end()) {
            value = iter->second;
        }
        return value;
    }
};

}

#endif // _TABLEHTTPREQUEST_HH_
