/// @file src/appusage/log/log_stream.h
/// @brief Declarations for log stream.

#ifndef APPUSAGE_LOG_LOG_STREAM_H
#define APPUSAGE_LOG_LOG_STREAM_H

#include <cstdint>
#include <string>
#include "../core/error_code.h"
#include "../core/optional.h"
#include "./common.h"

namespace appusage
{
    namespace log
    {
        /// @brief Message builder passed to LoggingFramework::Log
        /// @note Values are appended verbatim; the caller supplies the separators.
        class LogStream final
        {
        private:
            std::string mMessage;

        public:
            /// @brief Drop the collected message
            void Flush() noexcept;

            /// @brief Check whether nothing has been appended yet
            bool IsEmpty() const noexcept;

            LogStream &operator<<(const LogStream &value);
            LogStream &operator<<(bool value);
            LogStream &operator<<(int32_t value);
            LogStream &operator<<(uint32_t value);
            LogStream &operator<<(int64_t value);
            LogStream &operator<<(uint64_t value);
            LogStream &operator<<(const std::string &value);

            /// @brief Append a C string
            /// @param value Character array, ignored if null
            LogStream &operator<<(const char *value);

            /// @brief Append the level name
            LogStream &operator<<(LogLevel value);

            /// @brief Append an error as "<domain>:<value> (<message>)"
            LogStream &operator<<(const core::ErrorCode &value);

            /// @brief Append an optional string
            /// @param value The value itself, or "<absent>" if it is empty
            LogStream &operator<<(const core::Optional<std::string> &value);

            /// @brief Get the collected message
            const std::string &ToString() const noexcept;
        };
    }
}

#endif
