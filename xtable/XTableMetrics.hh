// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _XTABLEMETRICS_HH_
#define _XTABLEMETRICS_HH_

#include <map>
#include <unordered_set>
#include <mutex>
#include <string>

namespace xtable
{

// Operation counters. Each thread counts into its own instance; reading a metric
// sums over the live instances plus the counts left by threads that have exited.
// A thread's instance is folded into those retired counts and freed when the
// thread exits.
class XTableMetrics
{
public:
	static XTableMetrics &GetInstance();

	static void Count(const std::string &metric) { GetInstance().CountThis(metric); }
	static void Count(const std::string &metric, unsigned long long delta) { GetInstance().CountThis(metric, delta); }
	void CountThis(const std::string &metric);
	void CountThis(const std::string &metric, unsigned long long delta);

	static std::map<std::string, unsigned long long> AggregateAll();
	static unsigned long long AggregateMetric(const std::string &metric);

	/// Number of threads currently holding counters.
	static size_t LiveInstances();

private:
	// Frees the thread's instance at thread exit
	class Owner
	{
	public:
		~Owner();
		XTableMetrics * instance = nullptr;
	};

	// One instance in each thread
	static thread_local Owner _owner;

	// One global list of all live per-thread instances...
	static std::unordered_set<XTableMetrics *> _instances;

	// ...and the counts of the threads that have exited
	static std::map<std::string, unsigned long long> _retired;

	// One lock protects the global list, and the counters while they are read
	static std::mutex _setLock;

	std::map<std::string, unsigned long long> _metrics;

	XTableMetrics() {}
};

}

#endif // _XTABLEMETRICS_HH_
// vim: se sw=8 :
