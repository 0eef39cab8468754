/// @file src/appusage/workspace/notification_center.h
/// @brief Declarations for the notification center.

#ifndef APPUSAGE_WORKSPACE_NOTIFICATION_CENTER_H
#define APPUSAGE_WORKSPACE_NOTIFICATION_CENTER_H

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "../core/result.h"
#include "./notification_source.h"
#include "./run_loop.h"
#include "./workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Name-based notification dispatcher bound to a run loop
        /// @details Native sources attached to the center post notifications from
        ///          any thread; the center defers their delivery to the run loop, so
        ///          observers are always called on the pumping thread.
        class NotificationCenter
        {
        public:
            /// @brief Observer registration identifier
            using ObserverId = std::uint64_t;
            /// @brief Observer callback type
            using Handler = std::function<void(const Notification &)>;

        private:
            struct Observer
            {
                std::string Name;
                Handler Callback;
            };

            RunLoop &mRunLoop;
            const std::string mDescription;
            std::vector<std::unique_ptr<NotificationSource>> mSources;
            mutable std::mutex mMutex;
            std::map<ObserverId, Observer> mObservers;
            ObserverId mNextObserverId;
            bool mActive;

            void deliver(const Notification &notification) const;

        public:
            /// @brief Constructor
            /// @param runLoop Run loop executing the deliveries
            /// @param description Center description for diagnostics
            NotificationCenter(RunLoop &runLoop, std::string description);

            NotificationCenter() = delete;
            NotificationCenter(const NotificationCenter &) = delete;
            NotificationCenter &operator=(const NotificationCenter &) = delete;
            ~NotificationCenter() noexcept;

            /// @brief Attach a native source
            /// @param source Source to be owned by the center
            /// @returns kAlreadyActive if the center is active, kInvalidArgument if the source is null
            core::Result<void> AddSource(std::unique_ptr<NotificationSource> source);

            /// @brief Start all the attached sources
            /// @returns Void Result on success; otherwise the first start error
            /// @note On failure the already started sources are stopped again.
            core::Result<void> Activate();

            /// @brief Stop all the attached sources
            void Deactivate() noexcept;

            /// @brief Check whether the center can deliver notifications
            /// @returns True if the center has been activated successfully
            bool IsAvailable() const noexcept;

            /// @brief Register an observer for a notification name
            /// @param name Notification name
            /// @param handler Callback invoked on the run loop thread
            /// @returns Observer ID, kFacilityUnavailable if the center is not active,
            ///          or kInvalidArgument if the name or the handler is empty
            core::Result<ObserverId> AddObserver(const std::string &name, Handler handler);

            /// @brief Remove an observer registration
            /// @param observerId Observer ID returned by AddObserver
            /// @returns True if the observer was registered, otherwise false
            bool RemoveObserver(ObserverId observerId) noexcept;

            /// @brief Get the number of registered observers
            /// @returns Observer count
            std::size_t GetObserverCount() const;

            /// @brief Post a notification for deferred delivery
            /// @param notification Notification to be delivered
            /// @note Thread-safe
            void Post(Notification notification);

            /// @brief Get the center description
            /// @returns Description given at construction
            const std::string &GetDescription() const noexcept;
        };
    }
}

#endif
