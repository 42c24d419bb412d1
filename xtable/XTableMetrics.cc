// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "XTableMetrics.hh"

using namespace xtable;

thread_local XTableMetrics::Owner XTableMetrics::_owner;

std::unordered_set<XTableMetrics *> XTableMetrics::_instances;

std::map<std::string, unsigned long long> XTableMetrics::_retired;

std::mutex XTableMetrics::_setLock;

XTableMetrics::Owner::~Owner()
{
	if (instance == nullptr) {
		return;
	}
	std::lock_guard<std::mutex> lock(_setLock);
	for (const auto & item : instance->_metrics) {
		_retired[item.first] += item.second;
	}
	_instances.erase(instance);
	delete instance;
	instance = nullptr;
}

XTableMetrics &
XTableMetrics::GetInstance()
{
	if (_owner.instance == nullptr) {
		std::lock_guard<std::mutex> lock(_setLock);
		_owner.instance = new XTableMetrics();
		_instances.insert(_owner.instance);
	}
	return *_owner.instance;
}

size_t
XTableMetrics::LiveInstances()
{
	std::lock_guard<std::mutex> lock(_setLock);
	return _instances.size();
}

void
XTableMetrics::CountThis(const std::string &metric)
{
	std::lock_guard<std::mutex> lock(_setLock);
	_metrics[metric]++;
}

void
XTableMetrics::CountThis(const std::string &metric, unsigned long long delta)
{
	std::lock_guard<std::mutex> lock(_setLock);
	_metrics[metric] += delta;
}

std::map<std::string, unsigned long long>
XTableMetrics::AggregateAll()
{
	std::lock_guard<std::mutex> lock(_setLock);
	std::map<std::string, unsigned long long> totals = _retired;

	for (const XTableMetrics * pinstance : _instances) {
		for (const auto & item : pinstance->_metrics) {
			totals[item.first] += item.second;
		}
	}

	return totals;
}

unsigned long long
XTableMetrics::AggregateMetric(const std::string &metric)
{
	std::lock_guard<std::mutex> lock(_setLock);

	unsigned long long total = 0;
	auto retired = _retired.find(metric);
	if (retired != _retired.end()) {
		total = retired->second;
	}
	for (const XTableMetrics * pinstance : _instances) {
		auto & inst_map = pinstance->_metrics;
		auto iter = inst_map.find(metric);
		if (iter != inst_map.end()) {
			total += iter->second;
		}
	}

	return total;
}

// vim: se sw=8 :
