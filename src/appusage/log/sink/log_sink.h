/// @file src/appusage/log/sink/log_sink.h
/// @brief Declarations for log sink.

#ifndef APPUSAGE_LOG_SINK_LOG_SINK_H
#define APPUSAGE_LOG_SINK_LOG_SINK_H

#include <string>
#include "../log_stream.h"

namespace appusage
{
    namespace log
    {
        /// @brief Log message destinations
        namespace sink
        {
            /// @brief Destination of complete log lines
            /// @details Every line reads "<local time with ms> <app ID> <message>".
            ///          Derived sinks only decide where the line goes.
            class LogSink
            {
            private:
                const std::string mApplicationId;
                const std::string mApplicationDescription;

            protected:
                LogSink(std::string appId, std::string appDescription);

                /// @brief Write a formatted line without a trailing newline
                virtual void WriteLine(const std::string &line) const = 0;

            public:
                LogSink() = delete;
                LogSink(const LogSink &) = delete;
                LogSink &operator=(const LogSink &) = delete;
                virtual ~LogSink() noexcept = default;

                /// @brief Format a message and write it as one line
                /// @param logStream Message to be logged
                void Log(const LogStream &logStream) const;

                const std::string &GetApplicationId() const noexcept;

                const std::string &GetApplicationDescription() const noexcept;

                /// @brief Format a line the way Log() writes it
                /// @param appId Application ID
                /// @param message Log message
                /// @returns Line with the current timestamp
                static std::string FormatLine(
                    const std::string &appId,
                    const std::string &message);
            };
        }
    }
}

#endif
