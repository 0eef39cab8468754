/// @file src/appusage/usage/event_normalizer.h
/// @brief Declarations for the lifecycle event normalizer.

#ifndef APPUSAGE_USAGE_EVENT_NORMALIZER_H
#define APPUSAGE_USAGE_EVENT_NORMALIZER_H

#include "../core/result.h"
#include "./metadata_extractor.h"
#include "./recorder.h"
#include "./usage_error_domain.h"
#include "./usage_event.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Maps lifecycle notifications to usage events and forwards them
        class EventNormalizer
        {
        private:
            const MetadataExtractor &mExtractor;
            Recorder &mRecorder;
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;

        public:
            /// @brief Constructor
            /// @param extractor Application metadata extractor
            /// @param recorder Usage recorder receiving the events
            /// @param loggingFramework Logging framework for diagnostics
            EventNormalizer(
                const MetadataExtractor &extractor,
                Recorder &recorder,
                log::LoggingFramework &loggingFramework);

            EventNormalizer(const EventNormalizer &) = delete;
            EventNormalizer &operator=(const EventNormalizer &) = delete;

            /// @brief Get the usage event kind of a notification name
            /// @param notificationName Workspace notification name
            /// @returns Usage event kind, or kUnrecognizedNotification
            static core::Result<UsageEventKind> ToEventKind(
                const std::string &notificationName);

            /// @brief Normalize a lifecycle notification and forward it to the recorder
            /// @param notificationName Workspace notification name
            /// @param app Application handle, may be null
            /// @returns Forwarded usage event, or kUnrecognizedNotification in which
            ///          case nothing is forwarded
            core::Result<UsageEvent> Normalize(
                const std::string &notificationName,
                const workspace::RunningApplication *app);
        };
    }
}

#endif
