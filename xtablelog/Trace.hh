// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _XTABLE_TRACE_HH_
#define _XTABLE_TRACE_HH_

#include <string>
#include <sstream>

#define NOTE(MSG) Note(__FILE__, __LINE__, MSG)

#define TRACEINFO(trace,body) trace.IsActive() && (trace.Prefix(__FILE__, __LINE__, Trace::Type::INFO) << body).flush()
#define TRACEERROR(trace,body) trace.IsActive() && (trace.Prefix(__FILE__, __LINE__, Trace::Type::ERROR) << body).flush()

// Function-scoped tracing of table operations. A Trace covers one or more areas;
// it writes to the info log only when one of them is of interest. A trace built
// with a client request id tags every line it writes with that id, so the lines
// of one operation can be picked out of a busy log.
class Trace
{
public:
	enum Flags
	{
		None = 0, Operation = 1, Request = 2, Response = 4,
		Retry = 8, Codec = 0x10, Transport = 0x20, Config = 0x40,
		Signing = 0x80, All = 0xff
	};

	enum Type {INFO, ERROR};

	Trace(Flags covers, const char * calling_fn);
	Trace(Flags covers, const char * calling_fn, const std::string & requestId);
	~Trace();

	Trace(const Trace&) = delete;
	Trace& operator=(const Trace&) = delete;

	void Note(const char * filename, int lineno, const std::string& msg) const;
	bool IsActive() const { return _active; }
	const std::string & RequestId() const { return _requestId; }

	// Pushes the tracing line prefix into the accumulated message
	Trace& Prefix(const char * filename, int lineno, Type level);
	// Adds the item to the stream holding the accumulated message
	template <typename T> friend Trace& operator<<(Trace& trace, const T & item)
	{
		if (trace.IsActive()) { trace._msg << item; } return trace;
	}

	bool flush();

	static std::string TruncateFilename(const std::string&);
	static void SetInterests(Flags flags) { _interests = flags; }
	static Flags Interests() { return _interests; }
	static void AddInterests(Flags flags)
	{
		_interests = static_cast<Flags>(static_cast<unsigned int>(_interests) | static_cast<unsigned int>(flags));
	}

	/// Areas named in a comma separated list ("retry,codec", "all") or given as a
	/// number ("0x18"). Throws std::invalid_argument for an unknown name.
	static Flags ParseInterests(const std::string & list);

private:
	std::string Tag() const;

	std::string _fn;
	std::string _requestId;
	bool _active;			// True if the calling function covers any of the areas of interest

	std::ostringstream _msg;	// Accumulates a trace message
	Type _level;			// The severity level of the message being accumulated

	static Flags _interests;
};

#endif // _XTABLE_TRACE_HH_

// vim: set tabstop=4 softtabstop=4 shiftwidth=4 noexpandtab :
