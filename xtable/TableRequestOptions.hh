// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _TABLEREQUESTOPTIONS_HH_
#define _TABLEREQUESTOPTIONS_HH_

#include <chrono>
#include <memory>
#include <boost/optional.hpp>

#include "RetryPolicy.hh"
#include "StorageUri.hh"
#include "TableConst.hh"

namespace xtable
{

/// <summary>
/// Options of one operation. Every option is optional; an operation resolves the
/// unset ones from its client's defaults (ApplyDefaults) before running.
/// </summary>
class TableRequestOptions
{
public:
    TableRequestOptions() = default;

    /// Options built from XTableConstants: exponential retry, server timeout,
    /// maximum execution time, minimal-metadata JSON, primary only, no MD5.
    static TableRequestOptions FromConstants();

    /// Fill every unset option from defaults. Options set on this object win.
    void ApplyDefaults(const TableRequestOptions & defaults);

    TablePayloadFormat PayloadFormat() const { return m_payloadFormat.value_or(TablePayloadFormat::JsonMinimalMetadata); }
    void SetPayloadFormat(TablePayloadFormat format) { m_payloadFormat = format; }

    std::shared_ptr<IRetryPolicy> RetryPolicy() const;
    void SetRetryPolicy(std::shared_ptr<IRetryPolicy> policy) { m_retryPolicy = std::move(policy); }

    /// Timeout the service applies to each attempt; zero means none is sent.
    std::chrono::seconds ServerTimeout() const { return m_serverTimeout.value_or(std::chrono::seconds(0)); }
    void SetServerTimeout(std::chrono::seconds timeout) { m_serverTimeout = timeout; }

    /// Bound on the whole operation including retries; zero means unbounded.
    std::chrono::seconds MaximumExecutionTime() const { return m_maxExecutionTime.value_or(std::chrono::seconds(0)); }
    void SetMaximumExecutionTime(std::chrono::seconds timeout) { m_maxExecutionTime = timeout; }

    LocationMode GetLocationMode() const { return m_locationMode.value_or(LocationMode::PrimaryOnly); }
    void SetLocationMode(LocationMode mode) { m_locationMode = mode; }

    bool UseTransactionalMD5() const { return m_useMD5.value_or(false); }
    void SetUseTransactionalMD5(bool use) { m_useMD5 = use; }

private:
    boost::optional<TablePayloadFormat> m_payloadFormat;
    std::shared_ptr<IRetryPolicy> m_retryPolicy;
    boost::optional<std::chrono::seconds> m_serverTimeout;
    boost::optional<std::chrono::seconds> m_maxExecutionTime;
    boost::optional<LocationMode> m_locationMode;
    boost::optional<bool> m_useMD5;
};

}

#endif // _TABLEREQUESTOPTIONS_HH_
