// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once
#ifndef _XTABLE_UTILITY_HH_
#define _XTABLE_UTILITY_HH_

#include <string>
#include <map>

namespace XTableUtil {

/// <summary>Percent-encode every character outside the URI unreserved set (A-Z a-z 0-9 - . _ ~)</summary>
std::string SafeEncode(const std::string& str);

/// <summary>Split a "key=value" list into a [key,value] map. Tokens are separated by any of
/// the characters in separators; tokens without '=' or with an empty key are ignored.
/// Only the first '=' of a token separates key from value.</summary>
void ParseKeyValueList(const std::string& list, const char* separators, std::map<std::string, std::string> & elements);

/// <summary>Split a query string into a [key,value] map</summary>
inline void ParseQueryString(const std::string& qry, std::map<std::string, std::string> & elements)
{
    ParseKeyValueList(qry, "&", elements);
}

/// <summary> To check whether a given string is empty or all white spaces </summary>
bool IsEmptyOrWhiteSpace(const std::string& str);

/// <summary>
/// Get the value of a variable from the process environment. Does not throw an exception
/// if the variable is not defined in the environment; in that case it returns an empty string.
/// </summary>
std::string GetEnvironmentVariableOrEmpty(const std::string &);

/// Return current thread id as a string.
std::string GetTid();

/// Return a new random UUID in its canonical 8-4-4-4-12 form.
std::string NewRequestId();

/// Current UTC time in RFC 1123 form, as used by the x-ms-date header.
std::string Rfc1123Now();

inline std::string ToString(bool b)
{
    return b? "true" : "false";
}

}

#endif // _XTABLE_UTILITY_HH_

// vim: se sw=8
