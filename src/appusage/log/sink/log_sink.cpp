/// @file src/appusage/log/sink/log_sink.cpp
/// @brief Implementation for log sink.

#include "./log_sink.h"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace appusage
{
    namespace log
    {
        namespace sink
        {
            LogSink::LogSink(
                std::string appId,
                std::string appDescription) : mApplicationId{std::move(appId)},
                                              mApplicationDescription{std::move(appDescription)}
            {
            }

            void LogSink::Log(const LogStream &logStream) const
            {
                WriteLine(FormatLine(mApplicationId, logStream.ToString()));
            }

            const std::string &LogSink::GetApplicationId() const noexcept
            {
                return mApplicationId;
            }

            const std::string &LogSink::GetApplicationDescription() const noexcept
            {
                return mApplicationDescription;
            }

            std::string LogSink::FormatLine(
                const std::string &appId,
                const std::string &message)
            {
                const auto cNow{std::chrono::system_clock::now()};
                const std::time_t cSeconds{std::chrono::system_clock::to_time_t(cNow)};
                const int cMilliseconds{
                    static_cast<int>(
                        std::chrono::duration_cast<std::chrono::milliseconds>(
                            cNow.time_since_epoch())
                            .count() %
                        1000)};

                std::tm _localTime{};
                ::localtime_r(&cSeconds, &_localTime);

                char _buffer[40];
                const std::size_t cLength{
                    std::strftime(_buffer, sizeof(_buffer), "%Y-%m-%d %H:%M:%S", &_localTime)};
                std::snprintf(
                    _buffer + cLength, sizeof(_buffer) - cLength, ".%03d", cMilliseconds);

                std::string _result{_buffer};
                _result += ' ';
                _result += appId;
                _result += ' ';
                _result += message;

                return _result;
            }
        }
    }
}
