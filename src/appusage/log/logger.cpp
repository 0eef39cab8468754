/// @file src/appusage/log/logger.cpp
/// @brief Implementation for logger.

#include "./logger.h"
#include <stdexcept>

namespace appusage
{
    namespace log
    {
        const std::size_t Logger::cMaxContextIdLength;

        Logger::Logger(std::string ctxId,
                       std::string ctxDescription,
                       LogLevel logLevel) noexcept : mContextId{std::move(ctxId)},
                                                     mContextDescription{std::move(ctxDescription)},
                                                     mLogLevel{logLevel}
        {
        }

        Logger Logger::CreateLogger(
            std::string ctxId,
            std::string ctxDescription,
            LogLevel logLevel)
        {
            if (ctxId.empty() || ctxId.size() > cMaxContextIdLength)
            {
                throw std::invalid_argument(
                    "Context ID must have one to four characters: '" + ctxId + "'");
            }

            return Logger(std::move(ctxId), std::move(ctxDescription), logLevel);
        }

        bool Logger::IsEnabled(LogLevel logLevel) const noexcept
        {
            return logLevel != LogLevel::kOff &&
                   mLogLevel != LogLevel::kOff &&
                   static_cast<uint8_t>(logLevel) <= static_cast<uint8_t>(mLogLevel);
        }

        void Logger::SetLogLevel(LogLevel logLevel) noexcept
        {
            mLogLevel = logLevel;
        }

        LogLevel Logger::GetLogLevel() const noexcept
        {
            return mLogLevel;
        }

        const std::string &Logger::GetContextId() const noexcept
        {
            return mContextId;
        }

        const std::string &Logger::GetContextDescription() const noexcept
        {
            return mContextDescription;
        }

        LogStream Logger::MakePrefix(LogLevel logLevel) const
        {
            LogStream _result;
            _result << "[" << mContextId << "] ";
            if (!mContextDescription.empty())
            {
                _result << "[" << mContextDescription << "] ";
            }
            _result << "[" << logLevel << "] ";

            return _result;
        }
    }
}
