/// @file src/appusage/log/sink/console_log_sink.h
/// @brief Declarations for console log sink.

#ifndef APPUSAGE_LOG_SINK_CONSOLE_LOG_SINK_H
#define APPUSAGE_LOG_SINK_CONSOLE_LOG_SINK_H

#include "./log_sink.h"

namespace appusage
{
    namespace log
    {
        namespace sink
        {
            /// @brief Sink for foreground runs, writing to standard output
            class ConsoleLogSink final : public LogSink
            {
            protected:
                void WriteLine(const std::string &line) const override;

            public:
                ConsoleLogSink(
                    std::string appId,
                    std::string appDescription);
            };
        }
    }
}

#endif
