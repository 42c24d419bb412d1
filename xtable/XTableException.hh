// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#pragma once

#ifndef __XTABLEEXCEPTION__HH__
#define __XTABLEEXCEPTION__HH__

#include <string>
#include <exception>

#define XTABLEEXCEPTION(message) \
    xtable::XTableException(__FILE__, __LINE__, message)
/**/

namespace xtable
{

/// Local failure inside the library (bad property access, unencodable value, ...).
/// The message is prefixed with "<file>:<line> " when a filename is given.
class XTableException : public std::exception
{
private:
    std::string m_msg;

public:
    XTableException(const char* filename,
                    int lineno,
                    const std::string & message);

    XTableException(const char* filename,
                    int lineno,
                    const char* message);

    virtual const char * what() const noexcept
    {
        return m_msg.c_str();
    }
};

}

#endif // __XTABLEEXCEPTION__HH__
