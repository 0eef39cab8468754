/// @file src/appusage/usage/usage_event.h
/// @brief Declarations for usage events.

#ifndef APPUSAGE_USAGE_USAGE_EVENT_H
#define APPUSAGE_USAGE_USAGE_EVENT_H

#include <cstdint>
#include "./app_descriptor.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Canonical application lifecycle event kinds
        enum class UsageEventKind : std::uint8_t
        {
            kLaunch = 0,   ///< Application has been launched
            kActivate = 1, ///< Application became frontmost
            kTerminate = 2 ///< Application has terminated
        };

        /// @brief Get the recorder event name of a usage event kind
        /// @param kind Usage event kind
        /// @returns "launch", "activate" or "quit"
        const char *ToRecorderEventName(UsageEventKind kind) noexcept;

        /// @brief A normalized application lifecycle event
        struct UsageEvent
        {
            /// @brief Event kind
            UsageEventKind Kind;
            /// @brief Application the event is about
            AppDescriptor App;
        };
    }
}

#endif
