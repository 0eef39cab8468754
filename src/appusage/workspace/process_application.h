/// @file src/appusage/workspace/process_application.h
/// @brief Declarations for the process-backed application handle.

#ifndef APPUSAGE_WORKSPACE_PROCESS_APPLICATION_H
#define APPUSAGE_WORKSPACE_PROCESS_APPLICATION_H

#include <memory>
#include "./running_application.h"
#include "./workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Application handle built from a snapshot of a running process
        /// @details The bundle of a process is the nearest ancestor directory of its
        ///          executable whose name ends in ".app". The bundle identifier is
        ///          the CFBundleIdentifier entry of the bundle's Info.plist. The
        ///          snapshot is taken once, so the handle stays meaningful after the
        ///          process has exited.
        class ProcessApplication final : public RunningApplication
        {
        private:
            pid_t mProcessId;
            std::string mExecutablePath;
            core::Optional<std::string> mBundlePath;
            core::Optional<std::string> mBundleIdentifier;

        public:
            /// @brief Default procfs mount point
            static const std::string cDefaultProcRoot;

            /// @brief Constructor
            /// @param processId Process ID
            /// @param executablePath Absolute path of the process image
            /// @param bundlePath Enclosing application bundle path, if any
            /// @param bundleIdentifier Declared bundle identifier, if any
            ProcessApplication(
                pid_t processId,
                std::string executablePath,
                core::Optional<std::string> bundlePath,
                core::Optional<std::string> bundleIdentifier);

            /// @brief Take a snapshot of a running process
            /// @param processId Process ID
            /// @param procRoot procfs mount point
            /// @returns Application handle, or kProcessNotFound if the process image cannot be resolved
            static core::Result<std::shared_ptr<ProcessApplication>> FromProcess(
                pid_t processId,
                const std::string &procRoot = cDefaultProcRoot);

            /// @brief Find the application bundle enclosing an executable
            /// @param executablePath Absolute executable path
            /// @returns Bundle directory path without a trailing slash, if any
            static core::Optional<std::string> FindEnclosingBundle(
                const std::string &executablePath);

            /// @brief Convert an absolute path to a file URL
            /// @param path Absolute filesystem path
            /// @returns `file://` URL with reserved characters percent-encoded
            static std::string ToFileUrl(const std::string &path);

            pid_t ProcessIdentifier() const noexcept override;

            core::Result<std::string> BundleUrl() const override;

            core::Optional<std::string> BundleIdentifier() const override;

            /// @brief Get the process image path
            /// @returns Absolute executable path
            const std::string &GetExecutablePath() const noexcept;

            /// @brief Check whether the process lives inside an application bundle
            /// @returns True if an enclosing bundle was found
            bool IsBundled() const noexcept;
        };
    }
}

#endif
