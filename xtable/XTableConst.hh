// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#ifndef _XTABLECONST_HH_
#define _XTABLECONST_HH_

// "Constants" used to build the default request options of a CloudTableClient.
// These are run-time constants. They've been encapsulated in this class so they
// can be manipulated at run-time by test code, generally to reduce timeouts or retry counts,
// and by deployments through the environment (see LoadFromEnvironment).

namespace xtable
{

class XTableConstants
{
public:
    // Getters
	static int RetryPolicyInterval()    { return _retryPolicyInterval; }
	static int RetryPolicyLimit()       { return _retryPolicyLimit; }
	static int DefaultServerTimeout()   { return _defaultServerTimeout; }
	static int MaxExecutionTime()       { return _maxExecutionTime; }

	static int TransportTimeoutMargin() { return 5; }	// Not alterable

    // Setters
	static void SetRetryPolicyInterval(int val) { _retryPolicyInterval = val; }
	static void SetRetryPolicyLimit(int val) { _retryPolicyLimit = val; }
	static void SetDefaultServerTimeout(int val) { _defaultServerTimeout = val; }
	static void SetMaxExecutionTime(int val) { _maxExecutionTime = val; }

	// Override the values above from XTABLE_RETRY_INTERVAL, XTABLE_RETRY_LIMIT,
	// XTABLE_SERVER_TIMEOUT and XTABLE_MAX_EXECUTION_TIME (all in seconds, except the
	// limit which counts retries). Unset variables are left alone; a value that is not a
	// non-negative integer is logged and ignored.
	static void LoadFromEnvironment();

private:
	XTableConstants();
	XTableConstants(const XTableConstants&) = delete;

	static int _retryPolicyInterval;
	static int _retryPolicyLimit;
	static int _defaultServerTimeout;
	static int _maxExecutionTime;
};

}

#endif // _XTABLECONST_HH_

// vim: se sw=8 :
