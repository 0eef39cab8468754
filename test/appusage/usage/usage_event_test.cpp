#include <gtest/gtest.h>
#include <string>
#include "../../../src/appusage/usage/usage_event.h"

namespace appusage
{
    namespace usage
    {
        TEST(UsageEventTest, RecorderEventNames)
        {
            EXPECT_EQ(std::string("launch"), ToRecorderEventName(UsageEventKind::kLaunch));
            EXPECT_EQ(std::string("activate"), ToRecorderEventName(UsageEventKind::kActivate));
            EXPECT_EQ(std::string("quit"), ToRecorderEventName(UsageEventKind::kTerminate));
        }

        TEST(UsageEventTest, DefaultDescriptor)
        {
            const AppDescriptor cDescriptor;

            EXPECT_FALSE(cDescriptor.BundleId.HasValue());
            EXPECT_FALSE(cDescriptor.Path.HasValue());
            EXPECT_EQ(cUnknownVersion, cDescriptor.Version);
            EXPECT_EQ(AppDescriptor(), cDescriptor);
        }
    }
}
