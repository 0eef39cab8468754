/// @file src/appusage/log/common.h
/// @brief Common logging enumerations.

#ifndef APPUSAGE_LOG_COMMON_H
#define APPUSAGE_LOG_COMMON_H

#include <stdint.h>

namespace appusage
{
    /// @brief Diagnostic logging namespace
    namespace log
    {
        /// @brief Logging severity level, ordered from the least to the most verbose
        enum class LogLevel : uint8_t
        {
            kOff = 0x00,
            kFatal = 0x01,
            kError = 0x02,
            kWarn = 0x03,
            kInfo = 0x04,
            kDebug = 0x05,
            kVerbose = 0x06
        };

        /// @brief Log message destination
        enum class LogMode : uint8_t
        {
            kConsole = 0x01, ///< Standard output, for foreground runs
            kFile = 0x02     ///< Append-only diagnostic file
        };

        /// @brief Get the lower-case name of a level as used in the log line
        /// @param level Log severity level
        /// @returns Level name, "unknown" for out-of-range values
        inline const char *GetLevelName(LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::kOff:
                return "off";
            case LogLevel::kFatal:
                return "fatal";
            case LogLevel::kError:
                return "error";
            case LogLevel::kWarn:
                return "warn";
            case LogLevel::kInfo:
                return "info";
            case LogLevel::kDebug:
                return "debug";
            case LogLevel::kVerbose:
                return "verbose";
            default:
                return "unknown";
            }
        }
    }
}

#endif
