/// @file src/appusage/usage/usage_error_domain.h
/// @brief Declarations for usage error domain.

#ifndef APPUSAGE_USAGE_USAGE_ERROR_DOMAIN_H
#define APPUSAGE_USAGE_USAGE_ERROR_DOMAIN_H

#include "../core/error_domain.h"
#include "../core/error_code.h"

namespace appusage
{
    /// @brief Usage event normalization and subscription pipeline
    namespace usage
    {
        /// @brief Usage error codes
        enum class UsageErrc : core::ErrorDomain::CodeType
        {
            kFacilityUnavailable = 1,      ///< Notification center is not available
            kSubscriptionFailed = 2,       ///< Observer registration has been rejected
            kUnrecognizedNotification = 3  ///< Notification name is not handled
        };

        /// @brief Usage ErrorDomain
        class UsageErrorDomain final : public core::ErrorDomain
        {
        private:
            static const core::ErrorDomain::IdType cDomainId{0x8000000000000a02};

        public:
            UsageErrorDomain() noexcept;

            const char *Message(
                core::ErrorDomain::CodeType errorCode) const noexcept override;
        };

        /// @brief Create core::ErrorCode in usage domain
        /// @param code Usage error code
        /// @returns Error code bound to UsageErrorDomain
        core::ErrorCode MakeErrorCode(UsageErrc code) noexcept;
    }
}

#endif
