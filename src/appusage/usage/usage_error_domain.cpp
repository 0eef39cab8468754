/// @file src/appusage/usage/usage_error_domain.cpp
/// @brief Implementation for usage error domain.

#include "./usage_error_domain.h"

namespace appusage
{
    namespace usage
    {
        UsageErrorDomain::UsageErrorDomain() noexcept : ErrorDomain{cDomainId, "Usage"}
        {
        }

        const char *UsageErrorDomain::Message(
            core::ErrorDomain::CodeType errorCode) const noexcept
        {
            UsageErrc _code{static_cast<UsageErrc>(errorCode)};

            switch (_code)
            {
            case UsageErrc::kFacilityUnavailable:
                return "Notification center is unavailable.";
            case UsageErrc::kSubscriptionFailed:
                return "Subscription has been rejected.";
            case UsageErrc::kUnrecognizedNotification:
                return "Notification is not recognized.";
            default:
                return "Unknown usage error.";
            }
        }

        core::ErrorCode MakeErrorCode(UsageErrc code) noexcept
        {
            static const UsageErrorDomain cDomain;
            return core::ErrorCode{
                static_cast<core::ErrorDomain::CodeType>(code),
                cDomain};
        }
    }
}
