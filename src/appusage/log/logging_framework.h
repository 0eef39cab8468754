/// @file src/appusage/log/logging_framework.h
/// @brief Declarations for logging framework.

#ifndef APPUSAGE_LOG_LOGGING_FRAMEWORK_H
#define APPUSAGE_LOG_LOGGING_FRAMEWORK_H

#include <memory>
#include <mutex>
#include <string>
#include "./logger.h"
#include "./sink/log_sink.h"

namespace appusage
{
    namespace log
    {
        /// @brief Process-wide logging entry point owning the configured sink
        /// @note Log() is thread-safe; notification sources log from their reader threads.
        class LoggingFramework
        {
        private:
            std::unique_ptr<sink::LogSink> mLogSink;
            const LogLevel mDefaultLogLevel;
            std::mutex mMutex;

            LoggingFramework(std::unique_ptr<sink::LogSink> logSink, LogLevel logLevel) noexcept;

        public:
            LoggingFramework() = delete;
            LoggingFramework(const LoggingFramework &) = delete;
            LoggingFramework &operator=(const LoggingFramework &) = delete;
            ~LoggingFramework() noexcept = default;

            /// @brief Logging framework factory
            /// @param appId Application ID written on every line
            /// @param logMode Console or file output
            /// @param logLevel Level of the loggers created without an explicit one
            /// @param appDescription Application description
            /// @param logFilePath Log file path, required in the file mode
            /// @returns Logging framework to be deleted by the caller
            /// @throws std::invalid_argument Thrown if the file mode has no file path
            static LoggingFramework *Create(
                std::string appId,
                LogMode logMode,
                LogLevel logLevel = LogLevel::kWarn,
                std::string appDescription = "",
                std::string logFilePath = "");

            /// @brief Create a logger at the framework default level
            Logger CreateLogger(
                std::string ctxId,
                std::string ctxDescription) const;

            Logger CreateLogger(
                std::string ctxId,
                std::string ctxDescription,
                LogLevel logLevel) const;

            /// @brief Write a message in a logger context
            /// @param logger Context logger
            /// @param logLevel Message severity
            /// @param logStream Message
            /// @note The message is dropped if the context filters the level out.
            void Log(
                const Logger &logger,
                LogLevel logLevel,
                const LogStream &logStream);

            LogLevel GetDefaultLogLevel() const noexcept;
        };
    }
}

#endif
