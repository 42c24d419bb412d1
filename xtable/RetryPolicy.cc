// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <algorithm>
#include <stdexcept>
#include <cpprest/http_msg.h>

#include "RetryPolicy.hh"
#include "OperationContext.hh"
#include "Trace.hh"

namespace xtable
{

StorageLocation
NextLocation(
    StorageLocation lastLocation,
    LocationMode mode,
    bool hasSecondary
    )
{
    switch (mode) {
        case LocationMode::PrimaryOnly:
            return StorageLocation::Primary;
        case LocationMode::SecondaryOnly:
            return StorageLocation::Secondary;
        default:
            if (!hasSecondary) {
                return StorageLocation::Primary;
            }
            return (lastLocation == StorageLocation::Primary) ? StorageLocation::Secondary : StorageLocation::Primary;
    }
}

RetryInfo
NoRetryPolicy::Evaluate(
    const RetryContext & context,
    OperationContext &
    ) const
{
    return RetryInfo { false, std::chrono::milliseconds(0), context.lastLocation };
}

RetryPolicyBase::RetryPolicyBase(
    std::chrono::milliseconds deltaBackoff,
    int maxAttempts
    ) :
    m_deltaBackoff(deltaBackoff),
    m_maxAttempts(maxAttempts)
{
    if (deltaBackoff.count() < 0) {
        throw std::invalid_argument("RetryPolicy: deltaBackoff cannot be negative");
    }
    if (maxAttempts < 0) {
        throw std::invalid_argument("RetryPolicy: maxAttempts cannot be negative");
    }
}

static bool
IsRetryableStatus(
    int statusCode
    )
{
    using web::http::status_codes;

    if (statusCode >= 400 && statusCode < 500) {
        return statusCode == status_codes::RequestTimeout;
    }
    return statusCode != status_codes::NotImplemented && statusCode != status_codes::HttpVersionNotSupported;
}

RetryInfo
RetryPolicyBase::Evaluate(
    const RetryContext & context,
    OperationContext & opContext
    ) const
{
    Trace trace(Trace::Retry, "RetryPolicyBase::Evaluate", opContext.ClientRequestId());

    RetryInfo info { false, std::chrono::milliseconds(0), context.lastLocation };

    if (context.currentRetryCount >= m_maxAttempts) {
        TRACEINFO(trace, "Retry limit " << m_maxAttempts << " reached");
        return info;
    }
    if (!IsRetryableStatus(context.lastHttpStatusCode)) {
        TRACEINFO(trace, "Status " << context.lastHttpStatusCode << " is not retryable");
        return info;
    }

    info.shouldRetry = true;
    info.interval = Interval(context.currentRetryCount + 1);
    info.targetLocation = NextLocation(context.lastLocation, context.locationMode, context.hasSecondary);
    TRACEINFO(trace, "Retry #" << context.currentRetryCount + 1 << " in " << info.interval.count() << " ms against " << info.targetLocation);
    return info;
}

std::chrono::milliseconds
ExponentialRetryPolicy::Interval(
    int retryCount
    ) const
{
    auto interval = m_deltaBackoff;
    for (int i = 1; i < retryCount && interval < MaxBackoff(); i++) {
        interval = interval * 2 + m_deltaBackoff;
    }
    return std::min(interval, MaxBackoff());
}

}
