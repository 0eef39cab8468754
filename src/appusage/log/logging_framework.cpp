/// @file src/appusage/log/logging_framework.cpp
/// @brief Implementation for logging framework.

#include "./logging_framework.h"
#include <stdexcept>
#include "./sink/console_log_sink.h"
#include "./sink/file_log_sink.h"

namespace appusage
{
    namespace log
    {
        LoggingFramework::LoggingFramework(
            std::unique_ptr<sink::LogSink> logSink,
            LogLevel logLevel) noexcept : mLogSink{std::move(logSink)},
                                          mDefaultLogLevel{logLevel}
        {
        }

        LoggingFramework *LoggingFramework::Create(
            std::string appId,
            LogMode logMode,
            LogLevel logLevel,
            std::string appDescription,
            std::string logFilePath)
        {
            std::unique_ptr<sink::LogSink> _logSink;

            if (logMode == LogMode::kConsole)
            {
                _logSink.reset(
                    new sink::ConsoleLogSink(std::move(appId), std::move(appDescription)));
            }
            else if (logMode == LogMode::kFile)
            {
                if (logFilePath.empty())
                {
                    throw std::invalid_argument(
                        "File logging mode requires a log file path.");
                }

                _logSink.reset(
                    new sink::FileLogSink(
                        std::move(appId), std::move(appDescription), std::move(logFilePath)));
            }
            else
            {
                throw std::invalid_argument("The log mode is not supported.");
            }

            return new LoggingFramework(std::move(_logSink), logLevel);
        }

        Logger LoggingFramework::CreateLogger(
            std::string ctxId,
            std::string ctxDescription) const
        {
            return Logger::CreateLogger(
                std::move(ctxId), std::move(ctxDescription), mDefaultLogLevel);
        }

        Logger LoggingFramework::CreateLogger(
            std::string ctxId,
            std::string ctxDescription,
            LogLevel logLevel) const
        {
            return Logger::CreateLogger(
                std::move(ctxId), std::move(ctxDescription), logLevel);
        }

        void LoggingFramework::Log(
            const Logger &logger,
            LogLevel logLevel,
            const LogStream &logStream)
        {
            if (!logger.IsEnabled(logLevel))
            {
                return;
            }

            LogStream _line{logger.MakePrefix(logLevel)};
            _line << logStream;

            std::lock_guard<std::mutex> _lock(mMutex);
            mLogSink->Log(_line);
        }

        LogLevel LoggingFramework::GetDefaultLogLevel() const noexcept
        {
            return mDefaultLogLevel;
        }
    }
}
