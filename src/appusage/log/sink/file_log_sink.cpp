/// @file src/appusage/log/sink/file_log_sink.cpp
/// @brief Implementation for file log sink.

#include "./file_log_sink.h"
#include <fstream>
#include <iostream>

namespace appusage
{
    namespace log
    {
        namespace sink
        {
            FileLogSink::FileLogSink(
                std::string appId,
                std::string appDescription,
                std::string logFilePath) : LogSink(std::move(appId), std::move(appDescription)),
                                           mLogFilePath{std::move(logFilePath)},
                                           mFailureReported{false}
            {
            }

            void FileLogSink::WriteLine(const std::string &line) const
            {
                std::ofstream _fileStream(
                    mLogFilePath, std::ofstream::out | std::ofstream::app);
                _fileStream << line << '\n';
                _fileStream.close();

                if (_fileStream.fail() && !mFailureReported.exchange(true))
                {
                    std::cerr << GetApplicationId() << ": cannot write log file "
                              << mLogFilePath << std::endl;
                }
            }

            const std::string &FileLogSink::GetLogFilePath() const noexcept
            {
                return mLogFilePath;
            }

            bool FileLogSink::HasFailed() const noexcept
            {
                return mFailureReported.load();
            }
        }
    }
}
