#include <gtest/gtest.h>
#include "../../../src/appusage/log/log_stream.h"
#include "../../../src/appusage/workspace/workspace_error_domain.h"

namespace appusage
{
    namespace log
    {
        TEST(LogStreamTest, ConcatenatesValues)
        {
            LogStream _logStream;
            EXPECT_TRUE(_logStream.IsEmpty());

            _logStream << "pid " << static_cast<std::int32_t>(42)
                       << " bundled " << true
                       << " entries " << static_cast<std::uint64_t>(3)
                       << " level " << LogLevel::kVerbose;

            EXPECT_FALSE(_logStream.IsEmpty());
            EXPECT_EQ("pid 42 bundled true entries 3 level verbose", _logStream.ToString());
        }

        TEST(LogStreamTest, ErrorCodeInsertion)
        {
            LogStream _logStream;
            _logStream << workspace::MakeErrorCode(workspace::WorkspaceErrc::kProcessNotFound);

            EXPECT_EQ(
                "Workspace:2 (Process does not exist or is not accessible.)",
                _logStream.ToString());
        }

        TEST(LogStreamTest, OptionalInsertion)
        {
            const core::Optional<std::string> cPresent{std::string("com.example.foo")};
            const core::Optional<std::string> cAbsent;

            LogStream _logStream;
            _logStream << cPresent << " " << cAbsent;

            EXPECT_EQ("com.example.foo <absent>", _logStream.ToString());
        }

        TEST(LogStreamTest, NullCharPointerIsIgnored)
        {
            const char *cNull{nullptr};
            LogStream _logStream;
            _logStream << "a" << cNull << "b";

            EXPECT_EQ("ab", _logStream.ToString());
        }

        TEST(LogStreamTest, Flush)
        {
            LogStream _logStream;
            _logStream << "install request";
            _logStream.Flush();

            EXPECT_TRUE(_logStream.IsEmpty());
        }
    }
}
