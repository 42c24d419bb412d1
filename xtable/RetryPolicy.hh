// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _RETRYPOLICY_HH_
#define _RETRYPOLICY_HH_

#include <chrono>
#include <memory>
#include "StorageUri.hh"

namespace xtable
{

class OperationContext;

/// What the execution engine knows about the attempt that just failed.
struct RetryContext
{
    int currentRetryCount;          // Retries made so far (0 after the first attempt)
    int lastHttpStatusCode;         // 0 if no response was received
    StorageLocation lastLocation;
    LocationMode locationMode;
    bool hasSecondary;
};

/// A retry policy's answer.
struct RetryInfo
{
    bool shouldRetry;
    std::chrono::milliseconds interval;
    StorageLocation targetLocation;
};

/// <summary>
/// Decides whether a failed attempt is tried again, after how long and where.
/// The execution engine only consults the policy for failures that are
/// retryable in the first place; a policy can only narrow that further.
/// Implementations must be stateless: one instance serves concurrent operations.
/// </summary>
class IRetryPolicy
{
public:
    virtual ~IRetryPolicy() {}
    virtual RetryInfo Evaluate(const RetryContext & context, OperationContext & opContext) const = 0;
};

class NoRetryPolicy : public IRetryPolicy
{
public:
    RetryInfo Evaluate(const RetryContext & context, OperationContext & opContext) const override;
};

/// Common rules of the retrying policies: a bounded number of retries, no retry of
/// client errors (4xx except 408 Request Timeout) nor of 501/505, and alternation
/// between primary and secondary when the location mode allows it.
class RetryPolicyBase : public IRetryPolicy
{
public:
    RetryInfo Evaluate(const RetryContext & context, OperationContext & opContext) const override;

    int MaxAttempts() const { return m_maxAttempts; }

protected:
    RetryPolicyBase(std::chrono::milliseconds deltaBackoff, int maxAttempts);

    virtual std::chrono::milliseconds Interval(int retryCount) const = 0;

    std::chrono::milliseconds m_deltaBackoff;
    int m_maxAttempts;
};

/// Retry after deltaBackoff * (2^n - 1) for the n-th retry, capped at MaxBackoff().
class ExponentialRetryPolicy : public RetryPolicyBase
{
public:
    ExponentialRetryPolicy(std::chrono::milliseconds deltaBackoff, int maxAttempts)
        : RetryPolicyBase(deltaBackoff, maxAttempts) {}

    static std::chrono::milliseconds MaxBackoff() { return std::chrono::seconds(90); }

protected:
    std::chrono::milliseconds Interval(int retryCount) const override;
};

/// Retry after a constant deltaBackoff.
class LinearRetryPolicy : public RetryPolicyBase
{
public:
    LinearRetryPolicy(std::chrono::milliseconds deltaBackoff, int maxAttempts)
        : RetryPolicyBase(deltaBackoff, maxAttempts) {}

protected:
    std::chrono::milliseconds Interval(int) const override { return m_deltaBackoff; }
};

/// Location the next attempt goes to after an attempt against lastLocation.
StorageLocation NextLocation(StorageLocation lastLocation, LocationMode mode, bool hasSecondary);

}

#endif // _RETRYPOLICY_HH_
