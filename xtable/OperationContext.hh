// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _OPERATIONCONTEXT_HH_
#define _OPERATIONCONTEXT_HH_

#include <string>
#include <vector>
#include <cpprest/asyncrt_utils.h>
#include "StorageUri.hh"

namespace xtable
{

/// What happened on one attempt of an operation.
class RequestResult
{
public:
    RequestResult(utility::datetime startTime, StorageLocation location)
        : m_startTime(startTime), m_location(location) {}

    int HttpStatusCode() const { return m_httpStatusCode; }
    const std::string & ServiceRequestId() const { return m_serviceRequestId; }
    const std::string & Etag() const { return m_etag; }
    const std::string & ErrorMessage() const { return m_errorMessage; }
    const utility::datetime & StartTime() const { return m_startTime; }
    const utility::datetime & EndTime() const { return m_endTime; }
    StorageLocation TargetLocation() const { return m_location; }

    void SetResponse(int httpStatusCode, std::string serviceRequestId, std::string etag)
    {
        m_httpStatusCode = httpStatusCode;
        m_serviceRequestId = std::move(serviceRequestId);
        m_etag = std::move(etag);
    }
    void SetErrorMessage(std::string msg) { m_errorMessage = std::move(msg); }
    void SetEndTime(utility::datetime endTime) { m_endTime = endTime; }

private:
    int m_httpStatusCode = 0;
    std::string m_serviceRequestId;
    std::string m_etag;
    std::string m_errorMessage;
    utility::datetime m_startTime;
    utility::datetime m_endTime;
    StorageLocation m_location;
};

/// <summary>
/// Per-call state of an operation: the client request id sent on every attempt
/// and the results of the attempts made so far. Not thread-safe; one context
/// belongs to one executing operation.
/// </summary>
class OperationContext
{
public:
    OperationContext() = default;

    /// Start a new execution. Keeps a caller-assigned client request id,
    /// otherwise generates one. Clears the results of any previous execution.
    void Initialize();

    const std::string & ClientRequestId() const { return m_clientRequestId; }
    void SetClientRequestId(std::string id) { m_clientRequestId = std::move(id); m_userRequestId = true; }

    const utility::datetime & StartTime() const { return m_startTime; }

    const std::vector<RequestResult> & RequestResults() const { return m_results; }
    void AddRequestResult(RequestResult result) { m_results.push_back(std::move(result)); }

    /// Throws std::logic_error if no attempt has been made.
    const RequestResult & LastResult() const;

private:
    std::string m_clientRequestId;
    bool m_userRequestId = false;
    utility::datetime m_startTime;
    std::vector<RequestResult> m_results;
};

}

#endif // _OPERATIONCONTEXT_HH_
