// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include "Logger.hh"

#include <cstdio>
#include <cstring>
#include <cerrno>
#include <ctime>
#include <string>

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <sys/time.h>
#include <sys/uio.h>
}

std::unique_ptr<Logger::LogWriter> Logger::logs[3];

const char *
Logger::SeverityName(Severity severity)
{
	switch (severity) {
	case Error: return "ERROR";
	case Warn: return "WARN";
	default: return "INFO";
	}
}

size_t
Logger::FormatTime(const struct timeval & tv, char * buffer, size_t buflen)
{
	struct tm zulu;

	if (!buffer || buflen < 29) {
		return 0;
	}

	(void)gmtime_r(&(tv.tv_sec), &zulu);
	size_t length = strftime(buffer, buflen, "%Y-%m-%dT%H:%M:%S", &zulu);
	// Seven fractional digits
	int added = snprintf(buffer + length, buflen - length, ".%06ld0Z", static_cast<long>(tv.tv_usec));
	if (added < 0) {
		return length;
	}
	return length + static_cast<size_t>(added);
}

Logger::LogWriter::LogWriter(const char * filename)
{
	int tmp_fd = open(filename, O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
	if (tmp_fd < 0) {
		auto saved_errno = errno;
		m_fd = dup(2);		// Use whatever was stderr
		std::string msg = std::string("Cannot open log ") + filename + ": " + strerror(saved_errno);
		Write(Error, msg);
	} else {
		m_fd = tmp_fd;
	}
}

Logger::LogWriter::LogWriter() { m_fd = dup(2); }

Logger::LogWriter::~LogWriter() { close(m_fd); }

void
Logger::LogWriter::Write(Severity severity, const std::string& msg)
{
	char timebuffer[64];
	struct timeval tv;
	(void)gettimeofday(&tv, 0);
	size_t timeLength = FormatTime(tv, timebuffer, sizeof(timebuffer));

	static const char newline = '\n';
	std::string tag = std::string(" ") + SeverityName(severity) + ": ";

	// writev() never writes through iov_base
	struct iovec iov[4];
	iov[0].iov_base = timebuffer;
	iov[0].iov_len = timeLength;
	iov[1].iov_base = const_cast<char*>(tag.data());
	iov[1].iov_len = tag.size();
	iov[2].iov_base = const_cast<char*>(msg.data());
	iov[2].iov_len = msg.size();
	iov[3].iov_base = const_cast<char*>(&newline);
	iov[3].iov_len = 1;

	// Nowhere is left to report a failure of the log itself, so only EINTR is handled
	while (writev(m_fd, iov, sizeof(iov)/sizeof(struct iovec)) == -1 && errno == EINTR) {
	}
}

void
Logger::Init()
{
	for (auto & log : logs) {
		if (!log) {
			log.reset(new LogWriter());
		}
	}
}

void
Logger::SetLog(Severity severity, const char * pathname)
{
	logs[severity].reset(new LogWriter(pathname));
}

void
Logger::CloseAllLogs()
{
	for (auto & log : logs) {
		log.reset();
	}
}

void
Logger::Log(Severity severity, const std::string& msg)
{
	if (logs[severity]) {
		logs[severity]->Write(severity, msg);
	}
}

void
Logger::LogRequest(Severity severity, const std::string& requestId, const std::string& msg)
{
	if (logs[severity]) {
		logs[severity]->Write(severity, "Request " + requestId + ": " + msg);
	}
}

// vim: se sw=8 :
