/// @file src/appusage/usage/file_usage_recorder.h
/// @brief Declarations for the append-only file usage recorder.

#ifndef APPUSAGE_USAGE_FILE_USAGE_RECORDER_H
#define APPUSAGE_USAGE_FILE_USAGE_RECORDER_H

#include <cstdint>
#include <mutex>
#include "./recorder.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Recorder that appends one line per record to a file
        class FileUsageRecorder final : public Recorder
        {
        private:
            const std::string mFilePath;
            std::mutex mMutex;

            void append(const std::string &line);

        public:
            /// @brief Constructor
            /// @param filePath Usage file path
            /// @throws std::invalid_argument Thrown if the path is empty
            explicit FileUsageRecorder(std::string filePath);

            FileUsageRecorder() = delete;
            FileUsageRecorder(const FileUsageRecorder &) = delete;
            FileUsageRecorder &operator=(const FileUsageRecorder &) = delete;

            /// @throws std::runtime_error Thrown if the usage file cannot be written
            void LogApplicationUsage(
                const std::string &event,
                const AppDescriptor &app) override;

            /// @throws std::runtime_error Thrown if the usage file cannot be written
            void LogInstallRequest(
                const std::map<std::string, std::string> &payload) override;

            /// @brief Get the usage file path
            /// @returns Path of the file the recorder appends to
            const std::string &GetFilePath() const noexcept;

            /// @brief Format a usage event line
            /// @param epochMs Record time in milliseconds since the Unix epoch
            /// @param event Recorder event name
            /// @param app Application descriptor
            /// @returns Line without the trailing newline
            static std::string FormatUsageLine(
                std::int64_t epochMs,
                const std::string &event,
                const AppDescriptor &app);

            /// @brief Format an install request line
            /// @param epochMs Record time in milliseconds since the Unix epoch
            /// @param payload Install request payload
            /// @returns Line without the trailing newline
            static std::string FormatInstallRequestLine(
                std::int64_t epochMs,
                const std::map<std::string, std::string> &payload);
        };
    }
}

#endif
