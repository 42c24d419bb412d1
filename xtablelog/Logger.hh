// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#ifndef _XTABLE_LOGGER_HH_
#define _XTABLE_LOGGER_HH_

#include <string>
#include <sstream>
#include <memory>

struct timeval;

// Process-wide error, warning and info logs. Each log is a file descriptor
// opened for append; a line is written with a single writev() so lines from
// concurrent operations do not interleave. A line reads
//     <ISO 8601 time> <severity>: <message>
// Lines about a table operation start with "Request <client request id>: ".
// A log that has not been opened drops its messages.
class Logger
{
public:
	enum Severity { Error = 0, Warn = 1, Info = 2 };

	/// Route any log that has not been opened yet to stderr.
	static void Init();

	static void SetLog(Severity severity, const char * pathname);
	static void SetErrorLog(const char * pathname) { SetLog(Error, pathname); }
	static void SetWarnLog(const char * pathname) { SetLog(Warn, pathname); }
	static void SetInfoLog(const char * pathname) { SetLog(Info, pathname); }
	static void CloseAllLogs();

	static void Log(Severity severity, const std::string& msg);

	static void LogError(const std::string& msg) { Log(Error, msg); }
	static void LogError(const std::ostringstream& msg) { Log(Error, msg.str()); }
	static void LogWarn(const std::string& msg) { Log(Warn, msg); }
	static void LogWarn(const std::ostringstream& msg) { Log(Warn, msg.str()); }
	static void LogInfo(const std::string& msg) { Log(Info, msg); }
	static void LogInfo(const std::ostringstream& msg) { Log(Info, msg.str()); }

	/// Log a message about the table operation with the given client request id.
	static void LogRequest(Severity severity, const std::string& requestId, const std::string& msg);
	static void LogRequest(Severity severity, const std::string& requestId, const std::ostringstream& msg)
	{
		LogRequest(severity, requestId, msg.str());
	}

	static const char * SeverityName(Severity severity);

	/// Formats tv as 2013-08-15T10:00:00.1234560Z; returns the length written.
	static size_t FormatTime(const struct timeval & tv, char * buffer, size_t buflen);

private:
	class LogWriter
	{
	public:
		explicit LogWriter(const char * filename);
		LogWriter();
		~LogWriter();

		LogWriter(const LogWriter& orig) = delete;
		LogWriter& operator=(const LogWriter & orig) = delete;

		void Write(Severity severity, const std::string& msg);

	private:
		int m_fd;
	};

	static std::unique_ptr<LogWriter> logs[3];

	Logger() = delete;
};

#endif //_XTABLE_LOGGER_HH_

// vim: set ai sw=8 :
