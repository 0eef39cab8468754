/// @file src/appusage/exec/signal_handler.h
/// @brief Declarations for the daemon signal handler.

#ifndef APPUSAGE_EXEC_SIGNAL_HANDLER_H
#define APPUSAGE_EXEC_SIGNAL_HANDLER_H

#include <atomic>

namespace appusage
{
    /// @brief Process execution helpers
    namespace exec
    {
        /// @brief Shutdown request latch fed by SIGTERM and SIGINT
        /// @note The handler only stores the signal number. The run loop polls
        ///       IsTerminationRequested() between two pumps.
        class SignalHandler
        {
        private:
            static std::atomic<int> mReceivedSignal;

            static void handleSignal(int signal);

        public:
            SignalHandler() = delete;

            /// @brief Install the termination handlers and ignore SIGPIPE
            /// @returns False if any of the dispositions could not be installed
            static bool Register() noexcept;

            /// @brief Check whether termination has been requested
            static bool IsTerminationRequested() noexcept;

            /// @brief Get the signal that requested the termination
            /// @returns Signal number, or zero if none has been received
            static int GetReceivedSignal() noexcept;

            /// @brief Forget a received signal
            static void Reset() noexcept;
        };
    }
}

#endif
