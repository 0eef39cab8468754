/// @file src/appusage/exec/signal_handler.cpp
/// @brief Implementation for the daemon signal handler.

#include "./signal_handler.h"
#include <signal.h>
#include <cstring>

namespace appusage
{
    namespace exec
    {
        std::atomic<int> SignalHandler::mReceivedSignal{0};

        void SignalHandler::handleSignal(int signal)
        {
            mReceivedSignal.store(signal);
        }

        bool SignalHandler::Register() noexcept
        {
            struct sigaction _termination;
            std::memset(&_termination, 0, sizeof(_termination));
            _termination.sa_handler = &SignalHandler::handleSignal;
            sigemptyset(&_termination.sa_mask);

            struct sigaction _ignore;
            std::memset(&_ignore, 0, sizeof(_ignore));
            _ignore.sa_handler = SIG_IGN;
            sigemptyset(&_ignore.sa_mask);

            const bool cSucceed{
                ::sigaction(SIGTERM, &_termination, nullptr) == 0 &&
                ::sigaction(SIGINT, &_termination, nullptr) == 0 &&
                ::sigaction(SIGPIPE, &_ignore, nullptr) == 0};

            return cSucceed;
        }

        bool SignalHandler::IsTerminationRequested() noexcept
        {
            return mReceivedSignal.load() != 0;
        }

        int SignalHandler::GetReceivedSignal() noexcept
        {
            return mReceivedSignal.load();
        }

        void SignalHandler::Reset() noexcept
        {
            mReceivedSignal.store(0);
        }
    }
}
