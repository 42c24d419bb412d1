// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <stdexcept>
#include "OperationContext.hh"
#include "Utility.hh"

using namespace xtable;

void
OperationContext::Initialize()
{
    if (!m_userRequestId) {
        m_clientRequestId = XTableUtil::NewRequestId();
    }
    m_startTime = utility::datetime::utc_now();
    m_results.clear();
}

const RequestResult &
OperationContext::LastResult() const
{
    if (m_results.empty()) {
        throw std::logic_error("OperationContext::LastResult(): no request has been made");
    }
    return m_results.back();
}
