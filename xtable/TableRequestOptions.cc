// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "TableRequestOptions.hh"
#include "XTableConst.hh"

using namespace xtable;

TableRequestOptions
TableRequestOptions::FromConstants()
{
    TableRequestOptions options;

    options.SetRetryPolicy(std::make_shared<ExponentialRetryPolicy>(
        std::chrono::seconds(XTableConstants::RetryPolicyInterval()), XTableConstants::RetryPolicyLimit()));
    options.SetServerTimeout(std::chrono::seconds(XTableConstants::DefaultServerTimeout()));
    options.SetMaximumExecutionTime(std::chrono::seconds(XTableConstants::MaxExecutionTime()));
    options.SetPayloadFormat(TablePayloadFormat::JsonMinimalMetadata);
    options.SetLocationMode(LocationMode::PrimaryOnly);
    options.SetUseTransactionalMD5(false);

    return options;
}

void
TableRequestOptions::ApplyDefaults(
    const TableRequestOptions & defaults
    )
{
    if (!m_payloadFormat) {
        m_payloadFormat = defaults.m_payloadFormat;
    }
    if (!m_retryPolicy) {
        m_retryPolicy = defaults.m_retryPolicy;
    }
    if (!m_serverTimeout) {
        m_serverTimeout = defaults.m_serverTimeout;
    }
    if (!m_maxExecutionTime) {
        m_maxExecutionTime = defaults.m_maxExecutionTime;
    }
    if (!m_locationMode) {
        m_locationMode = defaults.m_locationMode;
    }
    if (!m_useMD5) {
        m_useMD5 = defaults.m_useMD5;
    }
}

std::shared_ptr<IRetryPolicy>
TableRequestOptions::RetryPolicy() const
{
    if (!m_retryPolicy) {
        return std::make_shared<NoRetryPolicy>();
    }
    return m_retryPolicy;
}
