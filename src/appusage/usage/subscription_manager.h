/// @file src/appusage/usage/subscription_manager.h
/// @brief Declarations for the usage subscription manager.

#ifndef APPUSAGE_USAGE_SUBSCRIPTION_MANAGER_H
#define APPUSAGE_USAGE_SUBSCRIPTION_MANAGER_H

#include <utility>
#include <vector>
#include "../workspace/notification_center.h"
#include "./event_normalizer.h"
#include "./install_request_adapter.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Subscription manager state
        enum class SubscriptionState : std::uint8_t
        {
            kUnregistered = 0, ///< No observer is registered
            kRegistered = 1    ///< All observers are registered
        };

        /// @brief Registers the usage observers and routes their notifications
        /// @details Three application lifecycle observers are registered on the
        ///          workspace center and one install request observer on the
        ///          distributed center. Either all four are active or none is.
        class SubscriptionManager
        {
        private:
            using Registration =
                std::pair<workspace::NotificationCenter *, workspace::NotificationCenter::ObserverId>;

            workspace::NotificationCenter &mWorkspaceCenter;
            workspace::NotificationCenter &mDistributedCenter;
            const std::string mInstallRequestName;
            EventNormalizer &mNormalizer;
            InstallRequestAdapter &mAdapter;
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;
            std::vector<Registration> mRegistrations;
            SubscriptionState mState;

            core::Result<void> subscribe(
                workspace::NotificationCenter &center,
                const std::string &name);

        public:
            /// @brief Constructor
            /// @param workspaceCenter Center delivering application lifecycle notifications
            /// @param distributedCenter Center delivering inter-process notifications
            /// @param installRequestName Name of the install request notification
            /// @param normalizer Lifecycle event normalizer
            /// @param adapter Install request adapter
            /// @param loggingFramework Logging framework for diagnostics
            SubscriptionManager(
                workspace::NotificationCenter &workspaceCenter,
                workspace::NotificationCenter &distributedCenter,
                std::string installRequestName,
                EventNormalizer &normalizer,
                InstallRequestAdapter &adapter,
                log::LoggingFramework &loggingFramework);

            SubscriptionManager(const SubscriptionManager &) = delete;
            SubscriptionManager &operator=(const SubscriptionManager &) = delete;
            ~SubscriptionManager() noexcept;

            /// @brief Register all the observers
            /// @returns Void Result on success; kFacilityUnavailable if a center is
            ///          not available, or kSubscriptionFailed if a registration is
            ///          rejected. On failure no observer stays registered.
            /// @note Subscribing while registered has no effect.
            core::Result<void> Subscribe();

            /// @brief Remove all the registered observers
            /// @note Idempotent
            void Unsubscribe() noexcept;

            /// @brief Route a delivered notification
            /// @param notification Delivered notification
            void Dispatch(const workspace::Notification &notification);

            /// @brief Get the current state
            /// @returns Subscription state
            SubscriptionState GetState() const noexcept;

            /// @brief Get the number of active registrations
            /// @returns Registration count
            std::size_t GetRegistrationCount() const noexcept;
        };
    }
}

#endif
