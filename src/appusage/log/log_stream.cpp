/// @file src/appusage/log/log_stream.cpp
/// @brief Implementation for log stream.

#include "./log_stream.h"

namespace appusage
{
    namespace log
    {
        void LogStream::Flush() noexcept
        {
            mMessage.clear();
        }

        bool LogStream::IsEmpty() const noexcept
        {
            return mMessage.empty();
        }

        LogStream &LogStream::operator<<(const LogStream &value)
        {
            mMessage += value.mMessage;
            return *this;
        }

        LogStream &LogStream::operator<<(bool value)
        {
            mMessage += value ? "true" : "false";
            return *this;
        }

        LogStream &LogStream::operator<<(int32_t value)
        {
            mMessage += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(uint32_t value)
        {
            mMessage += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(int64_t value)
        {
            mMessage += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(uint64_t value)
        {
            mMessage += std::to_string(value);
            return *this;
        }

        LogStream &LogStream::operator<<(const std::string &value)
        {
            mMessage += value;
            return *this;
        }

        LogStream &LogStream::operator<<(const char *value)
        {
            if (value != nullptr)
            {
                mMessage += value;
            }

            return *this;
        }

        LogStream &LogStream::operator<<(LogLevel value)
        {
            mMessage += GetLevelName(value);
            return *this;
        }

        LogStream &LogStream::operator<<(const core::ErrorCode &value)
        {
            mMessage += value.ToString();
            return *this;
        }

        LogStream &LogStream::operator<<(const core::Optional<std::string> &value)
        {
            mMessage += value.HasValue() ? value.Value() : "<absent>";
            return *this;
        }

        const std::string &LogStream::ToString() const noexcept
        {
            return mMessage;
        }
    }
}
