#ifndef APPUSAGE_TEST_WORKSPACE_FAKE_NOTIFICATION_SOURCE_H
#define APPUSAGE_TEST_WORKSPACE_FAKE_NOTIFICATION_SOURCE_H

#include "../../../src/appusage/workspace/notification_source.h"
#include "../../../src/appusage/workspace/workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Source whose start outcome is scripted and which emits on demand
        class FakeNotificationSource : public NotificationSource
        {
        private:
            PostHandler mHandler;
            bool mRunning{false};

        public:
            bool FailStart{false};
            int StartCount{0};
            int StopCount{0};

            core::Result<void> Start(PostHandler handler) override
            {
                ++StartCount;
                if (FailStart)
                {
                    return core::Result<void>::FromError(
                        MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
                }

                mHandler = std::move(handler);
                mRunning = true;
                return core::Result<void>::FromValue();
            }

            void Stop() noexcept override
            {
                ++StopCount;
                mRunning = false;
            }

            bool IsRunning() const noexcept override
            {
                return mRunning;
            }

            std::string GetDescription() const override
            {
                return "fake source";
            }

            void Emit(Notification notification)
            {
                mHandler(std::move(notification));
            }
        };
    }
}

#endif
