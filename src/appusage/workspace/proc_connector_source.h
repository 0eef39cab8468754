/// @file src/appusage/workspace/proc_connector_source.h
/// @brief Declarations for the kernel process connector notification source.

#ifndef APPUSAGE_WORKSPACE_PROC_CONNECTOR_SOURCE_H
#define APPUSAGE_WORKSPACE_PROC_CONNECTOR_SOURCE_H

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "../log/logging_framework.h"
#include "./notification_source.h"
#include "./process_application.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Source of application launch and termination notifications
        ///        based on the Linux netlink process connector
        /// @note Subscribing to the connector requires CAP_NET_ADMIN.
        class ProcConnectorSource final : public NotificationSource
        {
        public:
            /// @brief Source options
            struct Options
            {
                /// @brief Only report processes that live inside an application bundle
                bool BundledOnly;
                /// @brief Root of the proc file system
                std::string ProcRoot;

                Options() : BundledOnly{true}, ProcRoot{ProcessApplication::cDefaultProcRoot}
                {
                }
            };

        private:
            static const int cPollTimeoutMs;

            const Options mOptions;
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;
            PostHandler mHandler;
            int mSocket;
            std::atomic_bool mRunning;
            std::thread mReaderThread;
            mutable std::mutex mMutex;
            std::map<pid_t, std::shared_ptr<const ProcessApplication>> mApplications;

            core::Result<void> setListening(bool listen);
            void readLoop();
            void closeSocket() noexcept;

        public:
            /// @brief Constructor
            /// @param loggingFramework Logging framework for diagnostics
            /// @param options Source options
            ProcConnectorSource(
                log::LoggingFramework &loggingFramework,
                Options options = Options());

            ProcConnectorSource(const ProcConnectorSource &) = delete;
            ProcConnectorSource &operator=(const ProcConnectorSource &) = delete;
            ~ProcConnectorSource() noexcept override;

            core::Result<void> Start(PostHandler handler) override;

            void Stop() noexcept override;

            bool IsRunning() const noexcept override;

            std::string GetDescription() const override;

            /// @brief Record the applications that are already running
            /// @returns Number of recorded applications
            /// @note Called by Start(); seeded applications are not reported as launched.
            std::size_t SeedRunningApplications();

            /// @brief Handle a process image replacement
            /// @param processId Process ID
            /// @returns Termination notification for a tracked image that was replaced,
            /// followed by the launch notification if the new image is reported
            std::vector<Notification> HandleExec(pid_t processId);

            /// @brief Handle a process exit
            /// @param processId Process ID
            /// @returns Termination notification if the process is reported
            core::Optional<Notification> HandleExit(pid_t processId);

            /// @brief Get the number of tracked applications
            /// @returns Tracked application count
            std::size_t GetTrackedCount() const;
        };
    }
}

#endif
