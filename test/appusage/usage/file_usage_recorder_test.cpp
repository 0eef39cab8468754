#include <gtest/gtest.h>
#include <unistd.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <vector>
#include "../../../src/appusage/usage/file_usage_recorder.h"

namespace appusage
{
    namespace usage
    {
        class FileUsageRecorderTest : public ::testing::Test
        {
        protected:
            std::string mFilePath;

            void SetUp() override
            {
                mFilePath = "/tmp/appusage_recorder_test_" + std::to_string(::getpid()) + ".log";
                std::remove(mFilePath.c_str());
            }

            void TearDown() override
            {
                std::remove(mFilePath.c_str());
            }

            std::vector<std::string> ReadLines() const
            {
                std::vector<std::string> _result;
                std::ifstream _stream(mFilePath);
                std::string _line;
                while (std::getline(_stream, _line))
                {
                    _result.push_back(_line);
                }

                return _result;
            }
        };

        TEST(FileUsageRecorderFormatTest, UsageLine)
        {
            AppDescriptor _app;
            _app.BundleId = std::string("com.example.foo");
            _app.Path = std::string("/Applications/Foo.app");
            _app.Version = "2.1";

            EXPECT_EQ(
                "1700000000000 usage event=launch bundle_id=com.example.foo "
                "path=/Applications/Foo.app version=2.1",
                FileUsageRecorder::FormatUsageLine(1700000000000, "launch", _app));
        }

        TEST(FileUsageRecorderFormatTest, AbsentFields)
        {
            EXPECT_EQ(
                "5 usage event=quit bundle_id=- path=- version=0",
                FileUsageRecorder::FormatUsageLine(5, "quit", AppDescriptor()));
        }

        TEST(FileUsageRecorderFormatTest, EscapedFields)
        {
            AppDescriptor _app;
            _app.BundleId = std::string("My App.app");
            _app.Path = std::string("/Applications/My App.app");

            EXPECT_EQ(
                "7 usage event=activate bundle_id=My\\sApp.app "
                "path=/Applications/My\\sApp.app version=0",
                FileUsageRecorder::FormatUsageLine(7, "activate", _app));

            EXPECT_EQ(
                "7 install_request note=two\\nlines\\r path=C:\\\\dir",
                FileUsageRecorder::FormatInstallRequestLine(
                    7, {{"note", "two\nlines\r"}, {"path", "C:\\dir"}}));
        }

        TEST(FileUsageRecorderFormatTest, LiteralDashDiffersFromAbsent)
        {
            AppDescriptor _app;
            _app.BundleId = std::string("-");
            _app.Path = std::string("/Applications/-");

            EXPECT_EQ(
                "3 usage event=launch bundle_id=\\- path=/Applications/- version=0",
                FileUsageRecorder::FormatUsageLine(3, "launch", _app));
        }

        TEST(FileUsageRecorderFormatTest, EqualsSignsAreEscaped)
        {
            EXPECT_EQ(
                "4 install_request a\\=b=c\\=d",
                FileUsageRecorder::FormatInstallRequestLine(4, {{"a=b", "c=d"}}));
        }

        TEST(FileUsageRecorderFormatTest, InstallRequestLine)
        {
            EXPECT_EQ(
                "9 install_request name=Editor version=3.2",
                FileUsageRecorder::FormatInstallRequestLine(
                    9, {{"version", "3.2"}, {"name", "Editor"}}));
            EXPECT_EQ(
                "9 install_request",
                FileUsageRecorder::FormatInstallRequestLine(9, {}));
        }

        TEST(FileUsageRecorderFormatTest, EmptyPathThrows)
        {
            EXPECT_THROW(FileUsageRecorder(""), std::invalid_argument);
        }

        TEST_F(FileUsageRecorderTest, AppendsRecords)
        {
            FileUsageRecorder _recorder(mFilePath);
            EXPECT_EQ(mFilePath, _recorder.GetFilePath());

            AppDescriptor _app;
            _app.BundleId = std::string("com.example.foo");
            _recorder.LogApplicationUsage("launch", _app);
            _recorder.LogInstallRequest({{"name", "Editor"}});
            _recorder.LogApplicationUsage("quit", _app);

            const std::vector<std::string> cLines{ReadLines()};
            ASSERT_EQ(3U, cLines.size());
            EXPECT_NE(std::string::npos, cLines[0].find(" usage event=launch bundle_id=com.example.foo path=- version=0"));
            EXPECT_NE(std::string::npos, cLines[1].find(" install_request name=Editor"));
            EXPECT_NE(std::string::npos, cLines[2].find(" usage event=quit "));
        }

        TEST_F(FileUsageRecorderTest, ExistingContentIsKept)
        {
            {
                std::ofstream _stream(mFilePath);
                _stream << "previous\n";
            }

            FileUsageRecorder _recorder(mFilePath);
            _recorder.LogApplicationUsage("activate", AppDescriptor());

            const std::vector<std::string> cLines{ReadLines()};
            ASSERT_EQ(2U, cLines.size());
            EXPECT_EQ("previous", cLines[0]);
        }

        TEST(FileUsageRecorderFailureTest, UnwritablePathThrows)
        {
            FileUsageRecorder _recorder("/nonexistent_appusage_dir/usage.log");

            EXPECT_THROW(
                _recorder.LogApplicationUsage("launch", AppDescriptor()),
                std::runtime_error);
        }
    }
}
