/// @file src/appusage/usage/recorder.h
/// @brief Declarations for the usage recorder interface.

#ifndef APPUSAGE_USAGE_RECORDER_H
#define APPUSAGE_USAGE_RECORDER_H

#include <map>
#include <string>
#include "./app_descriptor.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Persistence backend of usage records
        /// @note Calls are fire-and-forget. An implementation may throw a
        ///       std::exception which is logged and discarded by the caller.
        class Recorder
        {
        public:
            virtual ~Recorder() noexcept = default;

            /// @brief Record an application usage event
            /// @param event Event name: "launch", "activate" or "quit"
            /// @param app Application descriptor
            virtual void LogApplicationUsage(
                const std::string &event,
                const AppDescriptor &app) = 0;

            /// @brief Record an install request
            /// @param payload Sender supplied payload
            virtual void LogInstallRequest(
                const std::map<std::string, std::string> &payload) = 0;
        };
    }
}

#endif
