/// @file src/appusage/workspace/notification_center.cpp
/// @brief Implementation for the notification center.

#include "./notification_center.h"

namespace appusage
{
    namespace workspace
    {
        NotificationCenter::NotificationCenter(
            RunLoop &runLoop,
            std::string description) : mRunLoop{runLoop},
                                       mDescription{std::move(description)},
                                       mNextObserverId{1U},
                                       mActive{false}
        {
        }

        NotificationCenter::~NotificationCenter() noexcept
        {
            Deactivate();
        }

        core::Result<void> NotificationCenter::AddSource(
            std::unique_ptr<NotificationSource> source)
        {
            if (!source)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kInvalidArgument));
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            if (mActive)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kAlreadyActive));
            }

            mSources.push_back(std::move(source));
            return core::Result<void>::FromValue();
        }

        core::Result<void> NotificationCenter::Activate()
        {
            {
                std::lock_guard<std::mutex> _lock(mMutex);
                if (mActive)
                {
                    return core::Result<void>::FromError(
                        MakeErrorCode(WorkspaceErrc::kAlreadyActive));
                }
            }

            for (auto &source : mSources)
            {
                auto _startResult{
                    source->Start(
                        [this](Notification &&notification)
                        { Post(std::move(notification)); })};

                if (!_startResult.HasValue())
                {
                    for (auto &startedSource : mSources)
                    {
                        startedSource->Stop();
                    }

                    return _startResult;
                }
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            mActive = true;

            return core::Result<void>::FromValue();
        }

        void NotificationCenter::Deactivate() noexcept
        {
            for (auto &source : mSources)
            {
                source->Stop();
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            mActive = false;
        }

        bool NotificationCenter::IsAvailable() const noexcept
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mActive;
        }

        core::Result<NotificationCenter::ObserverId> NotificationCenter::AddObserver(
            const std::string &name,
            Handler handler)
        {
            if (name.empty() || !handler)
            {
                return core::Result<ObserverId>::FromError(
                    MakeErrorCode(WorkspaceErrc::kInvalidArgument));
            }

            std::lock_guard<std::mutex> _lock(mMutex);
            if (!mActive)
            {
                return core::Result<ObserverId>::FromError(
                    MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
            }

            const ObserverId cObserverId{mNextObserverId++};
            mObservers[cObserverId] = Observer{name, std::move(handler)};

            return core::Result<ObserverId>::FromValue(cObserverId);
        }

        bool NotificationCenter::RemoveObserver(ObserverId observerId) noexcept
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mObservers.erase(observerId) > 0U;
        }

        std::size_t NotificationCenter::GetObserverCount() const
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mObservers.size();
        }

        void NotificationCenter::Post(Notification notification)
        {
            auto _notification{
                std::make_shared<const Notification>(std::move(notification))};

            mRunLoop.Post(
                [this, _notification]()
                { deliver(*_notification); });
        }

        void NotificationCenter::deliver(const Notification &notification) const
        {
            std::vector<Handler> _handlers;
            {
                std::lock_guard<std::mutex> _lock(mMutex);
                for (const auto &observer : mObservers)
                {
                    if (observer.second.Name == notification.Name)
                    {
                        _handlers.push_back(observer.second.Callback);
                    }
                }
            }

            // Handlers run unlocked so that they may add or remove observers.
            for (const auto &handler : _handlers)
            {
                handler(notification);
            }
        }

        const std::string &NotificationCenter::GetDescription() const noexcept
        {
            return mDescription;
        }
    }
}
