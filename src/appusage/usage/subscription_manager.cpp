/// @file src/appusage/usage/subscription_manager.cpp
/// @brief Implementation for the usage subscription manager.

#include "./subscription_manager.h"

#include <cstdint>

namespace appusage
{
    namespace usage
    {
        SubscriptionManager::SubscriptionManager(
            workspace::NotificationCenter &workspaceCenter,
            workspace::NotificationCenter &distributedCenter,
            std::string installRequestName,
            EventNormalizer &normalizer,
            InstallRequestAdapter &adapter,
            log::LoggingFramework &loggingFramework)
            : mWorkspaceCenter{workspaceCenter},
              mDistributedCenter{distributedCenter},
              mInstallRequestName{std::move(installRequestName)},
              mNormalizer{normalizer},
              mAdapter{adapter},
              mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("SUBS", "Subscription manager")},
              mState{SubscriptionState::kUnregistered}
        {
        }

        SubscriptionManager::~SubscriptionManager() noexcept
        {
            Unsubscribe();
        }

        core::Result<void> SubscriptionManager::subscribe(
            workspace::NotificationCenter &center,
            const std::string &name)
        {
            if (!center.IsAvailable())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << center.GetDescription() << " is unavailable for " << name);

                return core::Result<void>::FromError(
                    MakeErrorCode(UsageErrc::kFacilityUnavailable));
            }

            auto _observerId{
                center.AddObserver(
                    name,
                    [this](const workspace::Notification &notification)
                    {
                        Dispatch(notification);
                    })};

            if (!_observerId.HasValue())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Observing " << name << " on " << center.GetDescription()
                        << " failed: " << _observerId.Error());

                const bool cUnavailable{
                    _observerId.Error() ==
                    workspace::MakeErrorCode(workspace::WorkspaceErrc::kFacilityUnavailable)};

                return core::Result<void>::FromError(
                    MakeErrorCode(
                        cUnavailable ? UsageErrc::kFacilityUnavailable
                                     : UsageErrc::kSubscriptionFailed));
            }

            mRegistrations.emplace_back(&center, _observerId.Value());

            return core::Result<void>::FromValue();
        }

        core::Result<void> SubscriptionManager::Subscribe()
        {
            if (mState == SubscriptionState::kRegistered)
            {
                return core::Result<void>::FromValue();
            }

            const std::vector<Registration::first_type> cCenters{
                &mWorkspaceCenter, &mWorkspaceCenter, &mWorkspaceCenter, &mDistributedCenter};
            const std::vector<std::string> cNames{
                workspace::cDidLaunchApplicationNotification,
                workspace::cDidActivateApplicationNotification,
                workspace::cDidTerminateApplicationNotification,
                mInstallRequestName};

            for (std::size_t i = 0U; i < cNames.size(); ++i)
            {
                auto _result{subscribe(*cCenters[i], cNames[i])};
                if (!_result.HasValue())
                {
                    Unsubscribe();
                    return _result;
                }
            }

            mState = SubscriptionState::kRegistered;

            mLoggingFramework.Log(
                mLogger,
                log::LogLevel::kDebug,
                log::LogStream()
                    << "Subscribed with "
                    << static_cast<std::uint64_t>(mRegistrations.size()) << " observers");

            return core::Result<void>::FromValue();
        }

        void SubscriptionManager::Unsubscribe() noexcept
        {
            for (const Registration &registration : mRegistrations)
            {
                registration.first->RemoveObserver(registration.second);
            }

            mRegistrations.clear();
            mState = SubscriptionState::kUnregistered;
        }

        void SubscriptionManager::Dispatch(const workspace::Notification &notification)
        {
            if (notification.Name == mInstallRequestName)
            {
                mAdapter.Adapt(notification.UserInfo);
                return;
            }

            const auto cEvent{
                mNormalizer.Normalize(notification.Name, notification.Application.get())};
            if (!cEvent.HasValue())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Dropped notification " << notification.Name << ": "
                        << cEvent.Error());
            }
        }

        SubscriptionState SubscriptionManager::GetState() const noexcept
        {
            return mState;
        }

        std::size_t SubscriptionManager::GetRegistrationCount() const noexcept
        {
            return mRegistrations.size();
        }
    }
}
