#include <gtest/gtest.h>
#include <stdexcept>
#include "../../../src/appusage/log/logger.h"

namespace appusage
{
    namespace log
    {
        TEST(LoggerTest, OffDisablesEveryLevel)
        {
            const Logger cLogger{Logger::CreateLogger("SUBS", "Subscription manager", LogLevel::kOff)};

            for (auto logLevel : {LogLevel::kFatal, LogLevel::kError, LogLevel::kWarn,
                                  LogLevel::kInfo, LogLevel::kDebug, LogLevel::kVerbose})
            {
                EXPECT_FALSE(cLogger.IsEnabled(logLevel));
            }
        }

        TEST(LoggerTest, InfoFilter)
        {
            const Logger cLogger{Logger::CreateLogger("INST", "Install request adapter", LogLevel::kInfo)};

            EXPECT_TRUE(cLogger.IsEnabled(LogLevel::kFatal));
            EXPECT_TRUE(cLogger.IsEnabled(LogLevel::kInfo));
            EXPECT_FALSE(cLogger.IsEnabled(LogLevel::kDebug));
            EXPECT_FALSE(cLogger.IsEnabled(LogLevel::kOff));
        }

        TEST(LoggerTest, ContextIdLength)
        {
            EXPECT_NO_THROW(Logger::CreateLogger("X", "", LogLevel::kInfo));
            EXPECT_THROW(Logger::CreateLogger("", "Empty", LogLevel::kInfo), std::invalid_argument);
            EXPECT_THROW(Logger::CreateLogger("CTX01", "Too long", LogLevel::kInfo), std::invalid_argument);
        }

        TEST(LoggerTest, Prefix)
        {
            const Logger cLogger{Logger::CreateLogger("XTRC", "Metadata extractor", LogLevel::kWarn)};
            EXPECT_EQ(
                "[XTRC] [Metadata extractor] [warn] ",
                cLogger.MakePrefix(LogLevel::kWarn).ToString());

            const Logger cBare{Logger::CreateLogger("PROC", "", LogLevel::kWarn)};
            EXPECT_EQ("[PROC] [error] ", cBare.MakePrefix(LogLevel::kError).ToString());
        }

        TEST(LoggerTest, RuntimeLevelChange)
        {
            Logger _logger{Logger::CreateLogger("CHNL", "Datagram channel", LogLevel::kOff)};
            EXPECT_FALSE(_logger.IsEnabled(LogLevel::kFatal));

            _logger.SetLogLevel(LogLevel::kDebug);
            EXPECT_EQ(LogLevel::kDebug, _logger.GetLogLevel());
            EXPECT_TRUE(_logger.IsEnabled(LogLevel::kDebug));
            EXPECT_FALSE(_logger.IsEnabled(LogLevel::kVerbose));
            EXPECT_EQ("CHNL", _logger.GetContextId());
            EXPECT_EQ("Datagram channel", _logger.GetContextDescription());
        }
    }
}
