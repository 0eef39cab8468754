/// @file src/appusage/usage/file_usage_recorder.cpp
/// @brief Implementation for the append-only file usage recorder.

#include "./file_usage_recorder.h"

#include <chrono>
#include <fstream>
#include <stdexcept>

namespace appusage
{
    namespace usage
    {
        namespace
        {
            const std::string cAbsentField{"-"};

            std::int64_t GetEpochMilliseconds()
            {
                return std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                    .count();
            }

            // Keeps every record on a single line and every field unambiguous.
            std::string EscapeField(const std::string &value)
            {
                if (value == cAbsentField)
                {
                    return "\\-";
                }

                std::string _result;
                _result.reserve(value.size());
                for (const char c : value)
                {
                    switch (c)
                    {
                    case '\\':
                        _result += "\\\\";
                        break;
                    case '\n':
                        _result += "\\n";
                        break;
                    case '\r':
                        _result += "\\r";
                        break;
                    case ' ':
                        _result += "\\s";
                        break;
                    case '=':
                        _result += "\\=";
                        break;
                    default:
                        _result.push_back(c);
                        break;
                    }
                }

                return _result;
            }

            std::string FieldOrAbsent(const core::Optional<std::string> &value)
            {
                return value.HasValue() ? EscapeField(value.Value()) : cAbsentField;
            }
        }

        FileUsageRecorder::FileUsageRecorder(std::string filePath)
            : mFilePath{std::move(filePath)}
        {
            if (mFilePath.empty())
            {
                throw std::invalid_argument("Usage file path cannot be empty.");
            }
        }

        void FileUsageRecorder::append(const std::string &line)
        {
            std::lock_guard<std::mutex> _lock(mMutex);

            std::ofstream _fileStream(
                mFilePath, std::ofstream::out | std::ofstream::app);
            if (!_fileStream.is_open())
            {
                throw std::runtime_error("Cannot open usage file " + mFilePath);
            }

            _fileStream << line << '\n';
            _fileStream.close();
            if (_fileStream.fail())
            {
                throw std::runtime_error("Cannot write usage file " + mFilePath);
            }
        }

        std::string FileUsageRecorder::FormatUsageLine(
            std::int64_t epochMs,
            const std::string &event,
            const AppDescriptor &app)
        {
            std::string _result{std::to_string(epochMs)};
            _result += " usage event=";
            _result += EscapeField(event);
            _result += " bundle_id=";
            _result += FieldOrAbsent(app.BundleId);
            _result += " path=";
            _result += FieldOrAbsent(app.Path);
            _result += " version=";
            _result += EscapeField(app.Version);

            return _result;
        }

        std::string FileUsageRecorder::FormatInstallRequestLine(
            std::int64_t epochMs,
            const std::map<std::string, std::string> &payload)
        {
            std::string _result{std::to_string(epochMs)};
            _result += " install_request";
            for (const auto &entry : payload)
            {
                _result += ' ';
                _result += EscapeField(entry.first);
                _result += '=';
                _result += EscapeField(entry.second);
            }

            return _result;
        }

        void FileUsageRecorder::LogApplicationUsage(
            const std::string &event,
            const AppDescriptor &app)
        {
            append(FormatUsageLine(GetEpochMilliseconds(), event, app));
        }

        void FileUsageRecorder::LogInstallRequest(
            const std::map<std::string, std::string> &payload)
        {
            append(FormatInstallRequestLine(GetEpochMilliseconds(), payload));
        }

        const std::string &FileUsageRecorder::GetFilePath() const noexcept
        {
            return mFilePath;
        }
    }
}
