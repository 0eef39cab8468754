/// @file src/appusage/usage/usage_event.cpp
/// @brief Implementation for usage events.

#include "./usage_event.h"

namespace appusage
{
    namespace usage
    {
        const std::string cUnknownVersion{"0"};

        const char *ToRecorderEventName(UsageEventKind kind) noexcept
        {
            switch (kind)
            {
            case UsageEventKind::kLaunch:
                return "launch";
            case UsageEventKind::kActivate:
                return "activate";
            case UsageEventKind::kTerminate:
                return "quit";
            default:
                return "unknown";
            }
        }
    }
}
