/// @file src/appusage/usage/metadata_extractor.h
/// @brief Declarations for the application metadata extractor.

#ifndef APPUSAGE_USAGE_METADATA_EXTRACTOR_H
#define APPUSAGE_USAGE_METADATA_EXTRACTOR_H

#include "../log/logging_framework.h"
#include "../workspace/running_application.h"
#include "./app_descriptor.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Derives an application descriptor from an application handle
        /// @details The bundle path comes from the handle's bundle URL. The bundle ID
        ///          is the declared identifier, or the base name of the bundle path.
        ///          The version is read from the bundle's Info.plist, preferring the
        ///          short version string over the bundle version. Every failure only
        ///          leaves the related field absent or defaulted.
        class MetadataExtractor
        {
        private:
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;

            core::Optional<std::string> extractPath(
                const workspace::RunningApplication &app) const;
            core::Optional<std::string> extractBundleId(
                const workspace::RunningApplication &app) const;
            std::string extractVersion(const std::string &path) const;

        public:
            /// @brief Constructor
            /// @param loggingFramework Logging framework for diagnostics
            explicit MetadataExtractor(log::LoggingFramework &loggingFramework);

            MetadataExtractor(const MetadataExtractor &) = delete;
            MetadataExtractor &operator=(const MetadataExtractor &) = delete;

            /// @brief Extract the descriptor of an application
            /// @param app Application handle, may be null
            /// @returns Application descriptor
            AppDescriptor Extract(const workspace::RunningApplication *app) const noexcept;

            /// @brief Convert a bundle URL to a local file system path
            /// @param url File URL, or a bare absolute path
            /// @returns Path without trailing slash, or nothing if the URL is not local
            static core::Optional<std::string> PathFromBundleUrl(const std::string &url);

            /// @brief Get the last component of a path
            /// @param path File system path
            /// @returns Base name, empty if the path has no name component
            static std::string BaseName(const std::string &path);
        };
    }
}

#endif
