// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "XTableConst.hh"
#include "Logger.hh"
#include "Trace.hh"
#include "Utility.hh"

#include <boost/lexical_cast.hpp>

using namespace xtable;

int XTableConstants::_retryPolicyInterval = 3;
int XTableConstants::_retryPolicyLimit = 5;
int XTableConstants::_defaultServerTimeout = 30;
int XTableConstants::_maxExecutionTime = 30;

static void
OverrideFromEnvironment(const char * name, void (*setter)(int))
{
	Trace trace(Trace::Config, "XTableConstants::OverrideFromEnvironment");

	auto value = XTableUtil::GetEnvironmentVariableOrEmpty(name);
	if (XTableUtil::IsEmptyOrWhiteSpace(value)) {
		return;
	}
	try {
		auto parsed = boost::lexical_cast<int>(value);
		if (parsed < 0) {
			throw boost::bad_lexical_cast();
		}
		TRACEINFO(trace, name << "=" << parsed);
		setter(parsed);
	}
	catch (const boost::bad_lexical_cast &) {
		Logger::LogWarn(std::string("Ignoring invalid value '") + value + "' of environment variable " + name);
	}
}

void
XTableConstants::LoadFromEnvironment()
{
	OverrideFromEnvironment("XTABLE_RETRY_INTERVAL", &XTableConstants::SetRetryPolicyInterval);
	OverrideFromEnvironment("XTABLE_RETRY_LIMIT", &XTableConstants::SetRetryPolicyLimit);
	OverrideFromEnvironment("XTABLE_SERVER_TIMEOUT", &XTableConstants::SetDefaultServerTimeout);
	OverrideFromEnvironment("XTABLE_MAX_EXECUTION_TIME", &XTableConstants::SetMaxExecutionTime);
}

// vim: se sw=8 :
