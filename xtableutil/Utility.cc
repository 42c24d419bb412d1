// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "Utility.hh"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>

#include <boost/tokenizer.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cpprest/asyncrt_utils.h>
#include <cpprest/base_uri.h>

extern "C" {
#include <pthread.h>
}

namespace XTableUtil {

std::string
SafeEncode(const std::string& str)
{
	return web::uri::encode_data_string(str);
}

void
ParseKeyValueList(const std::string& list, const char* separators, std::map<std::string, std::string> & elements)
{
	typedef boost::tokenizer<boost::char_separator<char> > tokenizer;
	boost::char_separator<char> sep(separators);

	tokenizer tokens(list, sep);
	for (const std::string& tok : tokens) {
		size_t pos = tok.find("=");
		if (pos != std::string::npos && pos > 0) {
			elements[tok.substr(0, pos)] = tok.substr(pos+1);
		}
	}
}

bool
IsEmptyOrWhiteSpace(const std::string& str)
{
	return std::all_of(str.cbegin(), str.cend(), [](char c) { return isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string
GetEnvironmentVariableOrEmpty(const std::string & VariableName)
{
	char * envariable = getenv(VariableName.c_str());
	if (!envariable) {
		return std::string();
	}

	return std::string(envariable);
}

std::string GetTid()
{
    pthread_t tid = pthread_self();
    return "Tid-" + std::to_string(tid);
}

std::string
NewRequestId()
{
	static thread_local boost::uuids::random_generator generator;
	return boost::uuids::to_string(generator());
}

std::string
Rfc1123Now()
{
	return utility::datetime::utc_now().to_string(utility::datetime::RFC_1123);
}

}

// vim: se sw=8 :
