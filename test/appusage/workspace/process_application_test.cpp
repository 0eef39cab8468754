#include <gtest/gtest.h>
#include "../../../src/appusage/workspace/process_application.h"
#include "./fake_proc_root.h"

namespace appusage
{
    namespace workspace
    {
        TEST(ProcessApplicationTest, FindEnclosingBundle)
        {
            const auto cNested{
                ProcessApplication::FindEnclosingBundle(
                    "/Applications/Foo.app/Contents/MacOS/Foo")};
            ASSERT_TRUE(cNested.HasValue());
            EXPECT_EQ("/Applications/Foo.app", cNested.Value());

            const auto cInner{
                ProcessApplication::FindEnclosingBundle(
                    "/Applications/Foo.app/Contents/Helpers/Bar.app/Contents/MacOS/Bar")};
            ASSERT_TRUE(cInner.HasValue());
            EXPECT_EQ("/Applications/Foo.app/Contents/Helpers/Bar.app", cInner.Value());

            EXPECT_FALSE(ProcessApplication::FindEnclosingBundle("/usr/bin/bash").HasValue());
            EXPECT_FALSE(ProcessApplication::FindEnclosingBundle("/opt/.app/tool").HasValue());
            EXPECT_FALSE(ProcessApplication::FindEnclosingBundle("bash").HasValue());
        }

        TEST(ProcessApplicationTest, ToFileUrl)
        {
            EXPECT_EQ(
                "file:///Applications/Foo.app",
                ProcessApplication::ToFileUrl("/Applications/Foo.app"));
            EXPECT_EQ(
                "file:///Applications/My%20App.app",
                ProcessApplication::ToFileUrl("/Applications/My App.app"));
            EXPECT_EQ(
                "file:///opt/%C3%A9t%C3%A9.app",
                ProcessApplication::ToFileUrl("/opt/\xc3\xa9t\xc3\xa9.app"));
        }

        TEST(ProcessApplicationTest, UnbundledApplication)
        {
            const ProcessApplication cApplication{
                100, "/usr/bin/bash", core::Optional<std::string>{}, core::Optional<std::string>{}};

            EXPECT_EQ(100, cApplication.ProcessIdentifier());
            EXPECT_FALSE(cApplication.IsBundled());
            EXPECT_TRUE(
                cApplication.BundleUrl().CheckError(
                    MakeErrorCode(WorkspaceErrc::kCapabilityUnsupported)));
            EXPECT_FALSE(cApplication.BundleIdentifier().HasValue());
        }

        TEST(ProcessApplicationTest, FromProcessWithInfoPlist)
        {
            FakeProcRoot _root;
            const std::string cBundle{
                _root.AddBundle(
                    "Applications/Foo.app",
                    FakeProcRoot::MakeInfoPlist(
                        {{"CFBundleIdentifier", "com.example.foo"},
                         {"CFBundleShortVersionString", "2.1"}}))};
            _root.AddProcess(321, cBundle + "/Contents/MacOS/Foo");

            const auto cResult{ProcessApplication::FromProcess(321, _root.GetProcRoot())};
            ASSERT_TRUE(cResult.HasValue());

            const auto &cApplication{cResult.Value()};
            EXPECT_EQ(321, cApplication->ProcessIdentifier());
            EXPECT_TRUE(cApplication->IsBundled());
            EXPECT_EQ(cBundle + "/Contents/MacOS/Foo", cApplication->GetExecutablePath());
            EXPECT_EQ(ProcessApplication::ToFileUrl(cBundle), cApplication->BundleUrl().Value());
            ASSERT_TRUE(cApplication->BundleIdentifier().HasValue());
            EXPECT_EQ("com.example.foo", cApplication->BundleIdentifier().Value());
        }

        TEST(ProcessApplicationTest, FromProcessWithoutInfoPlist)
        {
            FakeProcRoot _root;
            const std::string cBundle{_root.AddBundle("Applications/Bar.app")};
            _root.AddProcess(322, cBundle + "/Contents/MacOS/Bar");

            const auto cResult{ProcessApplication::FromProcess(322, _root.GetProcRoot())};
            ASSERT_TRUE(cResult.HasValue());
            EXPECT_TRUE(cResult.Value()->IsBundled());
            EXPECT_FALSE(cResult.Value()->BundleIdentifier().HasValue());
        }

        TEST(ProcessApplicationTest, FromProcessStripsDeletedSuffix)
        {
            FakeProcRoot _root;
            const std::string cBundle{_root.AddBundle("Applications/Baz.app")};
            _root.AddProcess(323, cBundle + "/Contents/MacOS/Baz (deleted)");

            const auto cResult{ProcessApplication::FromProcess(323, _root.GetProcRoot())};
            ASSERT_TRUE(cResult.HasValue());
            EXPECT_EQ(cBundle + "/Contents/MacOS/Baz", cResult.Value()->GetExecutablePath());
        }

        TEST(ProcessApplicationTest, FromMissingProcess)
        {
            FakeProcRoot _root;

            const auto cResult{ProcessApplication::FromProcess(999, _root.GetProcRoot())};
            EXPECT_TRUE(cResult.CheckError(MakeErrorCode(WorkspaceErrc::kProcessNotFound)));
        }
    }
}
