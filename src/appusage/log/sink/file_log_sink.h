/// @file src/appusage/log/sink/file_log_sink.h
/// @brief Declarations for file log sink.

#ifndef APPUSAGE_LOG_SINK_FILE_LOG_SINK_H
#define APPUSAGE_LOG_SINK_FILE_LOG_SINK_H

#include <atomic>
#include "./log_sink.h"

namespace appusage
{
    namespace log
    {
        namespace sink
        {
            /// @brief Sink appending to the diagnostic log file
            /// @note The file is reopened for every line, so a rotated file is
            ///       picked up without a restart. A failed write is reported once
            ///       on standard error and the line is dropped.
            class FileLogSink final : public LogSink
            {
            private:
                const std::string mLogFilePath;
                mutable std::atomic<bool> mFailureReported;

            protected:
                void WriteLine(const std::string &line) const override;

            public:
                /// @brief Constructor
                /// @param appId Application ID
                /// @param appDescription Application description
                /// @param logFilePath Path of the log file
                FileLogSink(
                    std::string appId,
                    std::string appDescription,
                    std::string logFilePath);

                const std::string &GetLogFilePath() const noexcept;

                /// @brief Check whether a write has failed since construction
                bool HasFailed() const noexcept;
            };
        }
    }
}

#endif
