/// @file src/appusage/log/sink/console_log_sink.cpp
/// @brief Implementation for console log sink.

#include "./console_log_sink.h"
#include <iostream>

namespace appusage
{
    namespace log
    {
        namespace sink
        {
            ConsoleLogSink::ConsoleLogSink(
                std::string appId,
                std::string appDescription) : LogSink(std::move(appId), std::move(appDescription))
            {
            }

            void ConsoleLogSink::WriteLine(const std::string &line) const
            {
                std::cout << line << std::endl;
            }
        }
    }
}
