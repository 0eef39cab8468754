/// @file src/appusage/usage/event_normalizer.cpp
/// @brief Implementation for the lifecycle event normalizer.

#include "./event_normalizer.h"

#include <exception>
#include "../workspace/notification.h"

namespace appusage
{
    namespace usage
    {
        EventNormalizer::EventNormalizer(
            const MetadataExtractor &extractor,
            Recorder &recorder,
            log::LoggingFramework &loggingFramework)
            : mExtractor{extractor},
              mRecorder{recorder},
              mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("NORM", "Event normalizer")}
        {
        }

        core::Result<UsageEventKind> EventNormalizer::ToEventKind(
            const std::string &notificationName)
        {
            if (notificationName == workspace::cDidLaunchApplicationNotification)
            {
                return core::Result<UsageEventKind>::FromValue(UsageEventKind::kLaunch);
            }
            else if (notificationName == workspace::cDidActivateApplicationNotification)
            {
                return core::Result<UsageEventKind>::FromValue(UsageEventKind::kActivate);
            }
            else if (notificationName == workspace::cDidTerminateApplicationNotification)
            {
                return core::Result<UsageEventKind>::FromValue(UsageEventKind::kTerminate);
            }
            else
            {
                return core::Result<UsageEventKind>::FromError(
                    MakeErrorCode(UsageErrc::kUnrecognizedNotification));
            }
        }

        core::Result<UsageEvent> EventNormalizer::Normalize(
            const std::string &notificationName,
            const workspace::RunningApplication *app)
        {
            const auto cKind{ToEventKind(notificationName)};
            if (!cKind.HasValue())
            {
                return core::Result<UsageEvent>::FromError(cKind.Error());
            }

            UsageEvent _event{cKind.Value(), mExtractor.Extract(app)};
            const char *cEventName{ToRecorderEventName(_event.Kind)};

            try
            {
                mRecorder.LogApplicationUsage(cEventName, _event.App);
            }
            catch (const std::exception &ex)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Recording the " << cEventName << " event failed: " << ex.what());
            }

            return core::Result<UsageEvent>::FromValue(std::move(_event));
        }
    }
}
