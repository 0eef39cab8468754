/// @file src/appusage/workspace/workspace_error_domain.h
/// @brief Declarations for workspace error domain.

#ifndef APPUSAGE_WORKSPACE_WORKSPACE_ERROR_DOMAIN_H
#define APPUSAGE_WORKSPACE_WORKSPACE_ERROR_DOMAIN_H

#include "../core/error_domain.h"
#include "../core/error_code.h"

namespace appusage
{
    /// @brief Platform event-delivery and application handle layer
    namespace workspace
    {
        /// @brief Workspace error codes
        enum class WorkspaceErrc : core::ErrorDomain::CodeType
        {
            kCapabilityUnsupported = 1,  ///< Handle does not support the requested property
            kProcessNotFound = 2,        ///< Process vanished or is not accessible
            kFacilityUnavailable = 3,    ///< Notification delivery facility cannot be used
            kSocketFailure = 4,          ///< Socket creation, binding or transfer failed
            kChannelNameInvalid = 5,     ///< Channel name is empty or too long
            kPayloadMalformed = 6,       ///< Channel payload cannot be decoded
            kAlreadyActive = 7,          ///< Source or center has already been started
            kPropertyListUnreadable = 8, ///< Property list file cannot be read
            kPropertyListMalformed = 9,  ///< Property list document is malformed
            kInvalidArgument = 10        ///< Invalid argument passed to an API
        };

        /// @brief Workspace ErrorDomain
        class WorkspaceErrorDomain final : public core::ErrorDomain
        {
        private:
            static const core::ErrorDomain::IdType cDomainId{0x8000000000000a01};

        public:
            WorkspaceErrorDomain() noexcept;

            const char *Message(
                core::ErrorDomain::CodeType errorCode) const noexcept override;
        };

        /// @brief Create core::ErrorCode in workspace domain
        /// @param code Workspace error code
        /// @returns Error code bound to WorkspaceErrorDomain
        core::ErrorCode MakeErrorCode(WorkspaceErrc code) noexcept;
    }
}

#endif
