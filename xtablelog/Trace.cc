// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "Trace.hh"
#include "Logger.hh"
#include <cctype>
#include <map>
#include <sstream>
#include <stdexcept>
#include <boost/tokenizer.hpp>

Trace::Flags Trace::_interests = Trace::Flags::None;

Trace::Trace(Flags covers, const char *calling_fn)
	: Trace(covers, calling_fn, std::string())
{
}

Trace::Trace(Flags covers, const char *calling_fn, const std::string & requestId)
	: _fn(calling_fn), _requestId(requestId), _active((_interests & covers) != 0), _level(Type::INFO)
{
	if (_active) {
		Logger::LogInfo("Entering " + Tag());
	}
}

Trace::~Trace()
{
	if (_active) {
		Logger::LogInfo("Leaving " + Tag());
	}
}

std::string
Trace::Tag() const
{
	if (_requestId.empty()) {
		return _fn;
	}
	return _fn + " [" + _requestId + "]";
}

void
Trace::Note(const char *filename, int lineno, const std::string& msg) const
{
	if (_active) {
		std::ostringstream message;
		message << Tag() << " (" << TruncateFilename(filename) << " +" << lineno << ") " << msg;
		Logger::LogInfo(message);
	}
}

std::string
Trace::TruncateFilename(const std::string & filename)
{
	size_t slash = filename.find_last_of('/');
	if (slash == std::string::npos || slash <= 1) {
		return filename;
	}
	slash = filename.find_last_of('/', slash-1);
	if (slash == std::string::npos || slash == 0) {
		return filename;
	}
	return std::string("...").append(filename.substr(slash));
}

Trace&
Trace::Prefix(const char * filename, int lineno, Trace::Type level)
{
	if (IsActive()) {
		_msg << Tag() << " (" << TruncateFilename(filename) << " +" << lineno << ") ";
		_level = level;
	}
	return *this;
}

bool
Trace::flush()
{
	if (IsActive()) {
		auto msg = _msg.str();
		Logger::LogInfo(msg);
		if (_level == Trace::Type::ERROR) {
			Logger::LogError(msg);
		}

		_msg.str("");
		_msg.clear();
		_level = Trace::Type::INFO;
	}
	return true;
}

Trace::Flags
Trace::ParseInterests(const std::string & list)
{
	static const std::map<std::string, Flags> names = {
		{ "none", None }, { "operation", Operation }, { "request", Request },
		{ "response", Response }, { "retry", Retry }, { "codec", Codec },
		{ "transport", Transport }, { "config", Config }, { "signing", Signing },
		{ "all", All }
	};

	if (!list.empty() && std::isdigit(static_cast<unsigned char>(list[0]))) {
		size_t used = 0;
		unsigned long val = std::stoul(list, &used, 0);
		if (used != list.size()) {
			throw std::invalid_argument("Bad trace flags '" + list + "'");
		}
		return static_cast<Flags>(val & All);
	}

	unsigned int flags = None;
	boost::char_separator<char> sep(", ");
	boost::tokenizer<boost::char_separator<char>> tokens(list, sep);
	for (const auto & token : tokens) {
		std::string name;
		for (char c : token) {
			name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
		}
		auto iter = names.find(name);
		if (iter == names.end()) {
			throw std::invalid_argument("Unknown trace area '" + token + "'");
		}
		flags |= static_cast<unsigned int>(iter->second);
	}
	return static_cast<Flags>(flags);
}

// vim: se sw=8 :
