#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include "../../../src/appusage/usage/subscription_manager.h"
#include "./mock_running_application.h"
#include "./recording_recorder.h"

namespace appusage
{
    namespace usage
    {
        class SubscriptionManagerTest : public ::testing::Test
        {
        protected:
            const std::string cInstallRequestName{"com.example.appusage.install-request"};

            std::unique_ptr<log::LoggingFramework> mLoggingFramework;
            workspace::RunLoop mRunLoop;
            std::unique_ptr<workspace::NotificationCenter> mWorkspaceCenter;
            std::unique_ptr<workspace::NotificationCenter> mDistributedCenter;
            RecordingRecorder mRecorder;
            std::unique_ptr<MetadataExtractor> mExtractor;
            std::unique_ptr<EventNormalizer> mNormalizer;
            std::unique_ptr<InstallRequestAdapter> mAdapter;

            void SetUp() override
            {
                mLoggingFramework.reset(
                    log::LoggingFramework::Create(
                        "TEST", log::LogMode::kConsole, log::LogLevel::kOff));
                mWorkspaceCenter.reset(
                    new workspace::NotificationCenter(mRunLoop, "workspace center"));
                mDistributedCenter.reset(
                    new workspace::NotificationCenter(mRunLoop, "distributed center"));
                mExtractor.reset(new MetadataExtractor(*mLoggingFramework));
                mNormalizer.reset(
                    new EventNormalizer(*mExtractor, mRecorder, *mLoggingFramework));
                mAdapter.reset(new InstallRequestAdapter(mRecorder, *mLoggingFramework));
            }

            std::unique_ptr<SubscriptionManager> CreateManager()
            {
                return std::unique_ptr<SubscriptionManager>(
                    new SubscriptionManager(
                        *mWorkspaceCenter,
                        *mDistributedCenter,
                        cInstallRequestName,
                        *mNormalizer,
                        *mAdapter,
                        *mLoggingFramework));
            }

            void ActivateCenters()
            {
                ASSERT_TRUE(mWorkspaceCenter->Activate().HasValue());
                ASSERT_TRUE(mDistributedCenter->Activate().HasValue());
            }

            void Pump()
            {
                mRunLoop.RunOnce(std::chrono::milliseconds(0));
            }
        };

        TEST_F(SubscriptionManagerTest, Constructor)
        {
            auto _manager{CreateManager()};

            EXPECT_EQ(SubscriptionState::kUnregistered, _manager->GetState());
            EXPECT_EQ(0U, _manager->GetRegistrationCount());
        }

        TEST_F(SubscriptionManagerTest, SubscribeRegistersFourObservers)
        {
            ActivateCenters();
            auto _manager{CreateManager()};

            ASSERT_TRUE(_manager->Subscribe().HasValue());
            EXPECT_EQ(SubscriptionState::kRegistered, _manager->GetState());
            EXPECT_EQ(4U, _manager->GetRegistrationCount());
            EXPECT_EQ(3U, mWorkspaceCenter->GetObserverCount());
            EXPECT_EQ(1U, mDistributedCenter->GetObserverCount());

            // Subscribing again keeps the existing registrations.
            ASSERT_TRUE(_manager->Subscribe().HasValue());
            EXPECT_EQ(4U, _manager->GetRegistrationCount());
            EXPECT_EQ(3U, mWorkspaceCenter->GetObserverCount());
        }

        TEST_F(SubscriptionManagerTest, UnavailableDistributedCenterRollsBack)
        {
            ASSERT_TRUE(mWorkspaceCenter->Activate().HasValue());
            auto _manager{CreateManager()};

            const auto cResult{_manager->Subscribe()};

            ASSERT_FALSE(cResult.HasValue());
            EXPECT_EQ(MakeErrorCode(UsageErrc::kFacilityUnavailable), cResult.Error());
            EXPECT_EQ(SubscriptionState::kUnregistered, _manager->GetState());
            EXPECT_EQ(0U, _manager->GetRegistrationCount());
            EXPECT_EQ(0U, mWorkspaceCenter->GetObserverCount());
        }

        TEST_F(SubscriptionManagerTest, UnavailableWorkspaceCenter)
        {
            ASSERT_TRUE(mDistributedCenter->Activate().HasValue());
            auto _manager{CreateManager()};

            const auto cResult{_manager->Subscribe()};

            ASSERT_FALSE(cResult.HasValue());
            EXPECT_EQ(MakeErrorCode(UsageErrc::kFacilityUnavailable), cResult.Error());
            EXPECT_EQ(0U, mDistributedCenter->GetObserverCount());
        }

        TEST_F(SubscriptionManagerTest, EmptyInstallRequestNameFailsSubscription)
        {
            ActivateCenters();
            SubscriptionManager _manager(
                *mWorkspaceCenter,
                *mDistributedCenter,
                "",
                *mNormalizer,
                *mAdapter,
                *mLoggingFramework);

            const auto cResult{_manager.Subscribe()};

            ASSERT_FALSE(cResult.HasValue());
            EXPECT_EQ(MakeErrorCode(UsageErrc::kSubscriptionFailed), cResult.Error());
            EXPECT_EQ(0U, mWorkspaceCenter->GetObserverCount());
        }

        TEST_F(SubscriptionManagerTest, LifecycleNotificationsAreRecorded)
        {
            ActivateCenters();
            auto _manager{CreateManager()};
            ASSERT_TRUE(_manager->Subscribe().HasValue());

            auto _app{std::make_shared<MockRunningApplication>()};
            _app->Url = std::string("file:///Applications/Foo.app");
            _app->Identifier = std::string("com.example.foo");

            workspace::Notification _launch;
            _launch.Name = workspace::cDidLaunchApplicationNotification;
            _launch.Application = _app;
            mWorkspaceCenter->Post(_launch);

            workspace::Notification _terminate;
            _terminate.Name = workspace::cDidTerminateApplicationNotification;
            mWorkspaceCenter->Post(_terminate);

            EXPECT_TRUE(mRecorder.UsageCalls.empty());
            Pump();

            ASSERT_EQ(2U, mRecorder.UsageCalls.size());
            EXPECT_EQ("launch", mRecorder.UsageCalls[0].first);
            EXPECT_EQ("com.example.foo", mRecorder.UsageCalls[0].second.BundleId.Value());
            EXPECT_EQ("quit", mRecorder.UsageCalls[1].first);
            EXPECT_EQ(AppDescriptor(), mRecorder.UsageCalls[1].second);
            EXPECT_TRUE(mRecorder.InstallRequestCalls.empty());
        }

        TEST_F(SubscriptionManagerTest, InstallRequestIsRecorded)
        {
            ActivateCenters();
            auto _manager{CreateManager()};
            ASSERT_TRUE(_manager->Subscribe().HasValue());

            workspace::Notification _request;
            _request.Name = cInstallRequestName;
            _request.UserInfo = {{"name", "Editor"}, {"version", "3.2"}};
            mDistributedCenter->Post(_request);
            Pump();

            ASSERT_EQ(1U, mRecorder.InstallRequestCalls.size());
            EXPECT_EQ(_request.UserInfo, mRecorder.InstallRequestCalls[0]);
            EXPECT_TRUE(mRecorder.UsageCalls.empty());
        }

        TEST_F(SubscriptionManagerTest, UnknownNotificationIsDropped)
        {
            auto _manager{CreateManager()};

            workspace::Notification _unknown;
            _unknown.Name = "NSWorkspaceDidWakeNotification";
            EXPECT_NO_THROW(_manager->Dispatch(_unknown));

            EXPECT_TRUE(mRecorder.UsageCalls.empty());
            EXPECT_TRUE(mRecorder.InstallRequestCalls.empty());
        }

        TEST_F(SubscriptionManagerTest, UnsubscribeStopsDelivery)
        {
            ActivateCenters();
            auto _manager{CreateManager()};
            ASSERT_TRUE(_manager->Subscribe().HasValue());

            _manager->Unsubscribe();
            EXPECT_EQ(SubscriptionState::kUnregistered, _manager->GetState());
            EXPECT_EQ(0U, mWorkspaceCenter->GetObserverCount());
            EXPECT_EQ(0U, mDistributedCenter->GetObserverCount());

            _manager->Unsubscribe();
            EXPECT_EQ(0U, _manager->GetRegistrationCount());

            workspace::Notification _activate;
            _activate.Name = workspace::cDidActivateApplicationNotification;
            mWorkspaceCenter->Post(_activate);
            Pump();

            EXPECT_TRUE(mRecorder.UsageCalls.empty());
        }

        TEST_F(SubscriptionManagerTest, DestructorUnsubscribes)
        {
            ActivateCenters();
            {
                auto _manager{CreateManager()};
                ASSERT_TRUE(_manager->Subscribe().HasValue());
                EXPECT_EQ(4U, mWorkspaceCenter->GetObserverCount() +
                                  mDistributedCenter->GetObserverCount());
            }

            EXPECT_EQ(0U, mWorkspaceCenter->GetObserverCount());
            EXPECT_EQ(0U, mDistributedCenter->GetObserverCount());
        }
    }
}
