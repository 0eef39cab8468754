#include <gtest/gtest.h>
#include <vector>
#include "../../../src/appusage/workspace/notification_center.h"
#include "./fake_notification_source.h"

namespace appusage
{
    namespace workspace
    {
        namespace
        {
            const std::chrono::milliseconds cPumpTimeout{10};

            Notification MakeNotification(const std::string &name)
            {
                Notification _result;
                _result.Name = name;
                return _result;
            }
        }

        TEST(NotificationCenterTest, ObserversNeedAnActiveCenter)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");

            EXPECT_FALSE(_center.IsAvailable());
            const auto cResult{
                _center.AddObserver(
                    cDidLaunchApplicationNotification,
                    [](const Notification &) {})};
            EXPECT_TRUE(cResult.CheckError(MakeErrorCode(WorkspaceErrc::kFacilityUnavailable)));
        }

        TEST(NotificationCenterTest, InvalidObserverArguments)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            ASSERT_TRUE(_center.Activate().HasValue());

            const core::ErrorCode cExpected{MakeErrorCode(WorkspaceErrc::kInvalidArgument)};
            EXPECT_TRUE(_center.AddObserver("", [](const Notification &) {}).CheckError(cExpected));
            EXPECT_TRUE(_center.AddObserver("name", nullptr).CheckError(cExpected));
            EXPECT_TRUE(_center.AddSource(nullptr).CheckError(cExpected));
        }

        TEST(NotificationCenterTest, DeliveryIsDeferredToTheRunLoop)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            auto *_source{new FakeNotificationSource()};
            ASSERT_TRUE(_center.AddSource(std::unique_ptr<NotificationSource>(_source)).HasValue());
            ASSERT_TRUE(_center.Activate().HasValue());
            EXPECT_TRUE(_source->IsRunning());

            std::vector<std::string> _received;
            ASSERT_TRUE(
                _center.AddObserver(
                           cDidLaunchApplicationNotification,
                           [&_received](const Notification &notification)
                           { _received.push_back(notification.Name); })
                    .HasValue());

            _source->Emit(MakeNotification(cDidLaunchApplicationNotification));
            _source->Emit(MakeNotification(cDidTerminateApplicationNotification));
            EXPECT_TRUE(_received.empty());

            EXPECT_EQ(2U, _runLoop.RunOnce(cPumpTimeout));
            ASSERT_EQ(1U, _received.size());
            EXPECT_EQ(cDidLaunchApplicationNotification, _received.front());
        }

        TEST(NotificationCenterTest, RemovedObserverIsNotCalled)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            ASSERT_TRUE(_center.Activate().HasValue());

            int _calls{0};
            const auto cFirst{
                _center.AddObserver(
                    cDidActivateApplicationNotification,
                    [&_calls](const Notification &) { ++_calls; })};
            const auto cSecond{
                _center.AddObserver(
                    cDidActivateApplicationNotification,
                    [&_calls](const Notification &) { _calls += 10; })};
            ASSERT_TRUE(cFirst.HasValue());
            ASSERT_TRUE(cSecond.HasValue());
            EXPECT_NE(cFirst.Value(), cSecond.Value());
            EXPECT_EQ(2U, _center.GetObserverCount());

            EXPECT_TRUE(_center.RemoveObserver(cFirst.Value()));
            EXPECT_FALSE(_center.RemoveObserver(cFirst.Value()));
            EXPECT_EQ(1U, _center.GetObserverCount());

            _center.Post(MakeNotification(cDidActivateApplicationNotification));
            _runLoop.RunOnce(cPumpTimeout);

            EXPECT_EQ(10, _calls);
        }

        TEST(NotificationCenterTest, FailedActivationStopsStartedSources)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            auto *_healthy{new FakeNotificationSource()};
            auto *_failing{new FakeNotificationSource()};
            _failing->FailStart = true;
            ASSERT_TRUE(_center.AddSource(std::unique_ptr<NotificationSource>(_healthy)).HasValue());
            ASSERT_TRUE(_center.AddSource(std::unique_ptr<NotificationSource>(_failing)).HasValue());

            const auto cResult{_center.Activate()};

            EXPECT_TRUE(cResult.CheckError(MakeErrorCode(WorkspaceErrc::kFacilityUnavailable)));
            EXPECT_FALSE(_center.IsAvailable());
            EXPECT_FALSE(_healthy->IsRunning());
            EXPECT_EQ(1, _healthy->StopCount);
        }

        TEST(NotificationCenterTest, SourcesCannotBeAddedWhileActive)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            ASSERT_TRUE(_center.Activate().HasValue());

            const auto cResult{
                _center.AddSource(
                    std::unique_ptr<NotificationSource>(new FakeNotificationSource()))};
            EXPECT_TRUE(cResult.CheckError(MakeErrorCode(WorkspaceErrc::kAlreadyActive)));
            EXPECT_TRUE(_center.Activate().CheckError(MakeErrorCode(WorkspaceErrc::kAlreadyActive)));
        }

        TEST(NotificationCenterTest, DeactivateStopsSources)
        {
            RunLoop _runLoop;
            NotificationCenter _center(_runLoop, "test center");
            auto *_source{new FakeNotificationSource()};
            ASSERT_TRUE(_center.AddSource(std::unique_ptr<NotificationSource>(_source)).HasValue());
            ASSERT_TRUE(_center.Activate().HasValue());

            _center.Deactivate();

            EXPECT_FALSE(_center.IsAvailable());
            EXPECT_FALSE(_source->IsRunning());
            EXPECT_EQ("test center", _center.GetDescription());
        }
    }
}
