/// @file src/appusage/workspace/workspace_error_domain.cpp
/// @brief Implementation for workspace error domain.

#include "./workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        WorkspaceErrorDomain::WorkspaceErrorDomain() noexcept : ErrorDomain{cDomainId, "Workspace"}
        {
        }

        const char *WorkspaceErrorDomain::Message(
            core::ErrorDomain::CodeType errorCode) const noexcept
        {
            WorkspaceErrc _code{static_cast<WorkspaceErrc>(errorCode)};

            switch (_code)
            {
            case WorkspaceErrc::kCapabilityUnsupported:
                return "Capability is not supported by the application handle.";
            case WorkspaceErrc::kProcessNotFound:
                return "Process does not exist or is not accessible.";
            case WorkspaceErrc::kFacilityUnavailable:
                return "Notification delivery facility is unavailable.";
            case WorkspaceErrc::kSocketFailure:
                return "Socket operation failed.";
            case WorkspaceErrc::kChannelNameInvalid:
                return "Channel name is invalid.";
            case WorkspaceErrc::kPayloadMalformed:
                return "Channel payload is malformed.";
            case WorkspaceErrc::kAlreadyActive:
                return "Already active.";
            case WorkspaceErrc::kPropertyListUnreadable:
                return "Property list file cannot be read.";
            case WorkspaceErrc::kPropertyListMalformed:
                return "Property list document is malformed.";
            case WorkspaceErrc::kInvalidArgument:
                return "Invalid argument.";
            default:
                return "Unknown workspace error.";
            }
        }

        core::ErrorCode MakeErrorCode(WorkspaceErrc code) noexcept
        {
            static const WorkspaceErrorDomain cDomain;
            return core::ErrorCode{
                static_cast<core::ErrorDomain::CodeType>(code),
                cDomain};
        }
    }
}
