/// @file src/appusage/workspace/notification_source.h
/// @brief Declarations for notification sources.

#ifndef APPUSAGE_WORKSPACE_NOTIFICATION_SOURCE_H
#define APPUSAGE_WORKSPACE_NOTIFICATION_SOURCE_H

#include <functional>
#include <string>
#include "../core/result.h"
#include "./notification.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Abstract native event producer attached to a notification center.
        ///        Implementations exist for the kernel process connector and for
        ///        named datagram channels.
        class NotificationSource
        {
        public:
            /// @brief Callback used by a source to hand over a notification
            /// @note It may be invoked from the source's own reader thread.
            using PostHandler = std::function<void(Notification &&)>;

            virtual ~NotificationSource() noexcept = default;

            /// @brief Start producing notifications
            /// @param handler Callback receiving the produced notifications
            /// @returns Void Result on success, kFacilityUnavailable if the native
            ///          facility cannot be used
            virtual core::Result<void> Start(PostHandler handler) = 0;

            /// @brief Stop producing notifications and release native resources
            /// @note Safe to call on a source that has not been started.
            virtual void Stop() noexcept = 0;

            /// @brief Check whether the source is producing notifications
            /// @returns True between a successful Start() and Stop()
            virtual bool IsRunning() const noexcept = 0;

            /// @brief Get a human readable description of the source
            /// @returns Source description for diagnostics
            virtual std::string GetDescription() const = 0;
        };
    }
}

#endif
