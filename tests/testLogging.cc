// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the MIT license.

#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <stdexcept>
#include <thread>

extern "C" {
#include <unistd.h>
#include <sys/time.h>
}

#include "Logger.hh"
#include "Trace.hh"
#include "XTableMetrics.hh"

using namespace xtable;

namespace
{

// Points all three logs at a private file for the duration of a test.
class LoggingTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        path = "/tmp/xtable_logtest_" + std::to_string(getpid()) + ".log";
        std::remove(path.c_str());
        Logger::SetErrorLog(path.c_str());
        Logger::SetWarnLog(path.c_str());
        Logger::SetInfoLog(path.c_str());
        savedInterests = Trace::Interests();
    }

    void TearDown() override
    {
        Trace::SetInterests(savedInterests);
        Logger::CloseAllLogs();
        std::remove(path.c_str());
    }

    std::string Contents() const
    {
        std::ifstream in(path);
        std::ostringstream text;
        text << in.rdbuf();
        return text.str();
    }

    std::string path;
    Trace::Flags savedInterests;
};

}

TEST_F(LoggingTest, LinesCarryTimestampsAndSeverity)
{
    Logger::LogError("first failure");
    std::ostringstream msg;
    msg << "second " << 2;
    Logger::LogWarn(msg);
    Logger::LogInfo("third");

    auto text = Contents();
    EXPECT_NE(std::string::npos, text.find("Z ERROR: first failure\n"));
    EXPECT_NE(std::string::npos, text.find("Z WARN: second 2\n"));
    EXPECT_NE(std::string::npos, text.find("Z INFO: third\n"));
}

TEST_F(LoggingTest, RequestLinesNameTheRequest)
{
    std::ostringstream msg;
    msg << "attempt " << 1 << " failed";
    Logger::LogRequest(Logger::Warn, "c9da6455", msg);

    EXPECT_NE(std::string::npos, Contents().find("Z WARN: Request c9da6455: attempt 1 failed\n"));
}

TEST_F(LoggingTest, ClosedLogsDropMessages)
{
    Logger::CloseAllLogs();
    Logger::LogError("nowhere");
    EXPECT_EQ(std::string::npos, Contents().find("nowhere"));
}

TEST_F(LoggingTest, InactiveTraceWritesNothing)
{
    Trace::SetInterests(Trace::None);
    {
        Trace trace(Trace::Codec, "Quiet");
        TRACEINFO(trace, "hidden " << 1);
    }
    EXPECT_EQ(std::string::npos, Contents().find("Quiet"));
}

TEST_F(LoggingTest, TraceTagsLinesWithRequestId)
{
    Trace::SetInterests(Trace::Operation);
    {
        Trace trace(Trace::Operation, "Execute", "req-1");
        EXPECT_EQ("req-1", trace.RequestId());
        TRACEINFO(trace, "attempt " << 2);
        TRACEERROR(trace, "broken");
    }

    auto text = Contents();
    EXPECT_NE(std::string::npos, text.find("INFO: Entering Execute [req-1]\n"));
    EXPECT_NE(std::string::npos, text.find("INFO: Execute [req-1] ("));
    EXPECT_NE(std::string::npos, text.find(") attempt 2\n"));
    EXPECT_NE(std::string::npos, text.find("ERROR: Execute [req-1] ("));
    EXPECT_NE(std::string::npos, text.find("INFO: Leaving Execute [req-1]\n"));
}

TEST_F(LoggingTest, ActiveTraceWritesEntryExitAndMessages)
{
    Trace::SetInterests(Trace::None);
    Trace::AddInterests(Trace::Retry);
    Trace::AddInterests(Trace::Codec);
    {
        Trace trace(Trace::Codec, "Loud");
        EXPECT_TRUE(trace.IsActive());
        TRACEINFO(trace, "value " << 42);
        trace.NOTE("noted");
    }

    auto text = Contents();
    EXPECT_NE(std::string::npos, text.find("Entering Loud"));
    EXPECT_NE(std::string::npos, text.find("value 42"));
    EXPECT_NE(std::string::npos, text.find("noted"));
    EXPECT_NE(std::string::npos, text.find("Leaving Loud"));
}

TEST(Trace, ParseInterests)
{
    EXPECT_EQ(static_cast<unsigned int>(Trace::Retry | Trace::Codec),
              static_cast<unsigned int>(Trace::ParseInterests("retry,Codec")));
    EXPECT_EQ(Trace::All, Trace::ParseInterests("all"));
    EXPECT_EQ(Trace::None, Trace::ParseInterests(""));
    EXPECT_EQ(static_cast<unsigned int>(Trace::Retry | Trace::Codec),
              static_cast<unsigned int>(Trace::ParseInterests("0x18")));
    EXPECT_THROW(Trace::ParseInterests("retry,bogus"), std::invalid_argument);
    EXPECT_THROW(Trace::ParseInterests("12abc"), std::invalid_argument);
}

TEST(Logger, FormatTime)
{
    struct timeval tv;
    tv.tv_sec = 1376560800;
    tv.tv_usec = 42;
    char buffer[64];

    auto length = Logger::FormatTime(tv, buffer, sizeof(buffer));
    EXPECT_EQ("2013-08-15T10:00:00.0000420Z", std::string(buffer, length));
    EXPECT_EQ(0u, Logger::FormatTime(tv, buffer, 10));
}

TEST(Trace, TruncateFilename)
{
    EXPECT_EQ(".../xtable/TableRequests.cc", Trace::TruncateFilename("/src/repo/xtable/TableRequests.cc"));
    EXPECT_EQ("TableRequests.cc", Trace::TruncateFilename("TableRequests.cc"));
}

TEST(XTableMetrics, SumsAcrossThreads)
{
    auto before = XTableMetrics::AggregateMetric("test_metric");

    XTableMetrics::Count("test_metric");
    std::thread other([]() { XTableMetrics::Count("test_metric", 5); });
    other.join();

    EXPECT_EQ(before + 6, XTableMetrics::AggregateMetric("test_metric"));
    EXPECT_EQ(before + 6, XTableMetrics::AggregateAll()["test_metric"]);
    EXPECT_EQ(0u, XTableMetrics::AggregateMetric("never_counted"));
}

TEST(XTableMetrics, ExitedThreadsReleaseTheirCounters)
{
    XTableMetrics::Count("test_release");
    auto live = XTableMetrics::LiveInstances();
    auto before = XTableMetrics::AggregateMetric("test_release");

    for (int i = 0; i < 20; i++) {
        std::thread worker([]() { XTableMetrics::Count("test_release", 2); });
        worker.join();
    }

    EXPECT_EQ(live, XTableMetrics::LiveInstances());
    EXPECT_EQ(before + 40, XTableMetrics::AggregateMetric("test_release"));
    EXPECT_EQ(before + 40, XTableMetrics::AggregateAll()["test_release"]);
}
