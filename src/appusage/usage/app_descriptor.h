/// @file src/appusage/usage/app_descriptor.h
/// @brief Declarations for application descriptors.

#ifndef APPUSAGE_USAGE_APP_DESCRIPTOR_H
#define APPUSAGE_USAGE_APP_DESCRIPTOR_H

#include <string>
#include "../core/optional.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Version reported when it cannot be resolved
        extern const std::string cUnknownVersion;

        /// @brief Best-effort identity of an application at the time of an event
        struct AppDescriptor
        {
            /// @brief Declared bundle identifier, or the bundle base name as fallback
            core::Optional<std::string> BundleId;
            /// @brief Absolute path of the application bundle
            core::Optional<std::string> Path;
            /// @brief Short version string, never empty
            std::string Version;

            AppDescriptor() : Version{cUnknownVersion}
            {
            }
        };

        inline bool operator==(const AppDescriptor &lhs, const AppDescriptor &rhs)
        {
            return lhs.BundleId == rhs.BundleId &&
                   lhs.Path == rhs.Path &&
                   lhs.Version == rhs.Version;
        }

        inline bool operator!=(const AppDescriptor &lhs, const AppDescriptor &rhs)
        {
            return !(lhs == rhs);
        }
    }
}

#endif
