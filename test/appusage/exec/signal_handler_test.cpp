#include <gtest/gtest.h>
#include <csignal>
#include "../../../src/appusage/exec/signal_handler.h"

namespace appusage
{
    namespace exec
    {
        class SignalHandlerTest : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                SignalHandler::Reset();
                ASSERT_TRUE(SignalHandler::Register());
            }

            void TearDown() override
            {
                SignalHandler::Reset();
            }
        };

        TEST_F(SignalHandlerTest, NothingReceivedInitially)
        {
            EXPECT_FALSE(SignalHandler::IsTerminationRequested());
            EXPECT_EQ(0, SignalHandler::GetReceivedSignal());
        }

        TEST_F(SignalHandlerTest, TerminationSignals)
        {
            std::raise(SIGTERM);
            EXPECT_TRUE(SignalHandler::IsTerminationRequested());
            EXPECT_EQ(SIGTERM, SignalHandler::GetReceivedSignal());

            SignalHandler::Reset();
            std::raise(SIGINT);
            EXPECT_EQ(SIGINT, SignalHandler::GetReceivedSignal());
        }

        TEST_F(SignalHandlerTest, BrokenPipeIsIgnored)
        {
            std::raise(SIGPIPE);
            EXPECT_FALSE(SignalHandler::IsTerminationRequested());
        }

        TEST_F(SignalHandlerTest, ResetForgetsSignal)
        {
            std::raise(SIGTERM);
            SignalHandler::Reset();
            EXPECT_FALSE(SignalHandler::IsTerminationRequested());
            EXPECT_EQ(0, SignalHandler::GetReceivedSignal());
        }
    }
}
