// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <sstream>
#include "StorageException.hh"

using namespace xtable;

StorageException::StorageException(
    std::string message,
    int httpStatusCode,
    std::string serviceRequestId,
    bool retryable
    ) :
    std::exception(),
    m_msg(std::move(message)),
    m_httpStatusCode(httpStatusCode),
    m_serviceRequestId(std::move(serviceRequestId)),
    m_retryable(retryable)
{
}

static std::string
FormatServiceError(
    int httpStatusCode,
    const std::string & reasonPhrase,
    const std::string & errorCode,
    const std::string & serviceMessage
    )
{
    std::ostringstream strm;
    strm << "Table service returned HTTP " << httpStatusCode;
    if (!reasonPhrase.empty()) {
        strm << " (" << reasonPhrase << ")";
    }
    if (!errorCode.empty()) {
        strm << "; ErrorCode=" << errorCode;
    }
    if (!serviceMessage.empty()) {
        strm << "; Message=" << serviceMessage;
    }
    return strm.str();
}

TableServiceException::TableServiceException(
    int httpStatusCode,
    std::string reasonPhrase,
    std::string errorCode,
    std::string serviceMessage,
    std::string serviceRequestId,
    bool retryable
    ) :
    StorageException(FormatServiceError(httpStatusCode, reasonPhrase, errorCode, serviceMessage),
                     httpStatusCode, std::move(serviceRequestId), retryable),
    m_errorCode(std::move(errorCode)),
    m_serviceMessage(std::move(serviceMessage))
{
}
