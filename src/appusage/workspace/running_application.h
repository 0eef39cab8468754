/// @file src/appusage/workspace/running_application.h
/// @brief Declarations for the running application handle.

#ifndef APPUSAGE_WORKSPACE_RUNNING_APPLICATION_H
#define APPUSAGE_WORKSPACE_RUNNING_APPLICATION_H

#include <sys/types.h>
#include <string>
#include "../core/optional.h"
#include "../core/result.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Opaque handle of an application carried by lifecycle notifications
        /// @note Implementations may populate only a subset of the properties.
        class RunningApplication
        {
        public:
            virtual ~RunningApplication() noexcept = default;

            /// @brief Get the process ID of the application
            /// @returns Process ID, or zero if unknown
            virtual pid_t ProcessIdentifier() const noexcept = 0;

            /// @brief Get the URL of the application bundle
            /// @returns File URL of the bundle directory, or kCapabilityUnsupported
            ///          if the application does not live in a bundle
            virtual core::Result<std::string> BundleUrl() const = 0;

            /// @brief Get the declared bundle identifier
            /// @returns Reverse-DNS identifier if the application declares one
            virtual core::Optional<std::string> BundleIdentifier() const = 0;
        };
    }
}

#endif
