#include <gtest/gtest.h>
#include <unistd.h>
#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include "../../../src/appusage/log/logging_framework.h"
#include "../../../src/appusage/log/sink/file_log_sink.h"

namespace appusage
{
    namespace log
    {
        class LoggingFrameworkFileTest : public ::testing::Test
        {
        protected:
            std::string mLogFilePath;

            void SetUp() override
            {
                mLogFilePath =
                    "/tmp/appusage_logging_framework_test_" +
                    std::to_string(::getpid()) + ".log";
                std::remove(mLogFilePath.c_str());
            }

            void TearDown() override
            {
                std::remove(mLogFilePath.c_str());
            }

            std::string ReadLogFile() const
            {
                std::ifstream _stream(mLogFilePath);
                return std::string(
                    (std::istreambuf_iterator<char>(_stream)),
                    std::istreambuf_iterator<char>());
            }

            std::unique_ptr<LoggingFramework> CreateFramework(LogLevel logLevel) const
            {
                return std::unique_ptr<LoggingFramework>(
                    LoggingFramework::Create(
                        "APUS", LogMode::kFile, logLevel, "Test", mLogFilePath));
            }
        };

        TEST(LoggingFrameworkTest, FileModeRequiresPath)
        {
            EXPECT_THROW(
                LoggingFramework::Create("APUS", LogMode::kFile),
                std::invalid_argument);
        }

        TEST(LoggingFrameworkTest, ConsoleMode)
        {
            std::unique_ptr<LoggingFramework> _loggingFramework{
                LoggingFramework::Create("APUS", LogMode::kConsole)};
            EXPECT_EQ(LogLevel::kWarn, _loggingFramework->GetDefaultLogLevel());

            const Logger cLogger{_loggingFramework->CreateLogger("MAIN", "Daemon main")};
            EXPECT_EQ(LogLevel::kWarn, cLogger.GetLogLevel());

            LogStream _logStream;
            _logStream << "console line";
            EXPECT_NO_THROW(_loggingFramework->Log(cLogger, LogLevel::kError, _logStream));
        }

        TEST(LoggingFrameworkTest, LineFormat)
        {
            const std::string cLine{sink::LogSink::FormatLine("APUS", "[MAIN] [info] Starting")};

            // "YYYY-MM-DD HH:MM:SS.mmm APUS [MAIN] [info] Starting"
            ASSERT_EQ(23U + 1U + 4U + 1U + 22U, cLine.size());
            EXPECT_EQ('-', cLine[4]);
            EXPECT_EQ(' ', cLine[10]);
            EXPECT_EQ('.', cLine[19]);
            EXPECT_EQ(" APUS [MAIN] [info] Starting", cLine.substr(23U));
        }

        TEST_F(LoggingFrameworkFileTest, FileModeAppendsLines)
        {
            auto _loggingFramework{CreateFramework(LogLevel::kInfo)};
            const Logger cLogger{_loggingFramework->CreateLogger("MAIN", "Daemon main")};

            LogStream _first;
            _first << "Starting";
            _loggingFramework->Log(cLogger, LogLevel::kInfo, _first);

            LogStream _second;
            _second << "Install request received";
            _loggingFramework->Log(cLogger, LogLevel::kInfo, _second);

            const std::string cContent{ReadLogFile()};
            EXPECT_NE(std::string::npos, cContent.find(" APUS [MAIN] [Daemon main] [info] Starting\n"));
            EXPECT_NE(std::string::npos, cContent.find("Install request received\n"));
            EXPECT_EQ(2, std::count(cContent.begin(), cContent.end(), '\n'));
        }

        TEST_F(LoggingFrameworkFileTest, FilteredLevelIsNotWritten)
        {
            auto _loggingFramework{CreateFramework(LogLevel::kWarn)};
            const Logger cLogger{_loggingFramework->CreateLogger("XTRC", "Metadata extractor")};

            LogStream _logStream;
            _logStream << "Bundle URL is unavailable";
            _loggingFramework->Log(cLogger, LogLevel::kDebug, _logStream);

            EXPECT_TRUE(ReadLogFile().empty());
        }

        TEST_F(LoggingFrameworkFileTest, ContextLevelOverridesDefault)
        {
            auto _loggingFramework{CreateFramework(LogLevel::kWarn)};
            const Logger cLogger{
                _loggingFramework->CreateLogger("XTRC", "Metadata extractor", LogLevel::kDebug)};

            LogStream _logStream;
            _logStream << "No version information";
            _loggingFramework->Log(cLogger, LogLevel::kDebug, _logStream);

            EXPECT_NE(std::string::npos, ReadLogFile().find("[debug] No version information"));
        }

        TEST(FileLogSinkTest, UnwritableFileIsReported)
        {
            const sink::FileLogSink cSink{"APUS", "Test", "/nonexistent_appusage_dir/daemon.log"};
            EXPECT_FALSE(cSink.HasFailed());

            LogStream _logStream;
            _logStream << "lost line";
            cSink.Log(_logStream);

            EXPECT_TRUE(cSink.HasFailed());
            EXPECT_EQ("/nonexistent_appusage_dir/daemon.log", cSink.GetLogFilePath());
        }
    }
}
