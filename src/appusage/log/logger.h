/// @file src/appusage/log/logger.h
/// @brief Declarations for logger.

#ifndef APPUSAGE_LOG_LOGGER_H
#define APPUSAGE_LOG_LOGGER_H

#include <string>
#include "./log_stream.h"

namespace appusage
{
    namespace log
    {
        /// @brief Logging context of one daemon component
        /// @details A context is identified by a short ID (e.g. "SUBS") that prefixes
        ///          every line, and filters out messages more verbose than its level.
        class Logger
        {
        public:
            /// @brief Maximum length of a context ID
            static const std::size_t cMaxContextIdLength{4U};

        private:
            std::string mContextId;
            std::string mContextDescription;
            LogLevel mLogLevel;

            Logger(std::string ctxId,
                   std::string ctxDescription,
                   LogLevel logLevel) noexcept;

        public:
            Logger() = delete;

            /// @brief Check whether a message of the given level passes the filter
            bool IsEnabled(LogLevel logLevel) const noexcept;

            void SetLogLevel(LogLevel logLevel) noexcept;

            LogLevel GetLogLevel() const noexcept;

            const std::string &GetContextId() const noexcept;

            const std::string &GetContextDescription() const noexcept;

            /// @brief Create the line prefix "[<ctx>] [<description>] [<level>] "
            /// @param logLevel Level of the message to be prefixed
            /// @returns Stream holding the prefix
            LogStream MakePrefix(LogLevel logLevel) const;

            /// @brief Logger factory
            /// @param ctxId Context ID, one to four characters
            /// @param ctxDescription Context description
            /// @param logLevel Most verbose level that passes the filter
            /// @returns Context logger
            /// @throws std::invalid_argument Thrown if the context ID is empty or too long
            static Logger CreateLogger(
                std::string ctxId,
                std::string ctxDescription,
                LogLevel logLevel);
        };
    }
}

#endif
