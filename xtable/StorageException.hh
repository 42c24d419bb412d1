// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef __STORAGEEXCEPTION__HH__
#define __STORAGEEXCEPTION__HH__

#include <string>
#include <exception>

namespace xtable
{

/// <summary>
/// Error reported for an operation against the table service: a remote failure,
/// a transport failure or a payload that could not be serialized.
///
/// IsRetryable() decides whether the execution engine may hand the failure to
/// the retry policy. Conflicts and not-found answers to conditional operations
/// are not retryable: they reflect the state of the row, not a transient fault.
/// HttpStatusCode() is 0 when no response was received.
/// </summary>
class StorageException : public std::exception
{
public:
    StorageException(std::string message,
                     int httpStatusCode,
                     std::string serviceRequestId,
                     bool retryable);

    virtual ~StorageException() noexcept {}

    virtual const char * what() const noexcept
    {
        return m_msg.c_str();
    }

    int HttpStatusCode() const { return m_httpStatusCode; }
    const std::string & ServiceRequestId() const { return m_serviceRequestId; }
    bool IsRetryable() const { return m_retryable; }

private:
    std::string m_msg;
    int m_httpStatusCode;
    std::string m_serviceRequestId;
    bool m_retryable;
};

/// <summary>
/// Error response from the table service, with the error payload the
/// service returned (code and message may be empty if the body carried none).
/// </summary>
class TableServiceException : public StorageException
{
public:
    TableServiceException(int httpStatusCode,
                          std::string reasonPhrase,
                          std::string errorCode,
                          std::string serviceMessage,
                          std::string serviceRequestId,
                          bool retryable);

    const std::string & ErrorCode() const { return m_errorCode; }
    const std::string & ServiceMessage() const { return m_serviceMessage; }

private:
    std::string m_errorCode;
    std::string m_serviceMessage;
};

}

#endif // __STORAGEEXCEPTION__HH__
