/// @file src/appusage/usage/install_request_adapter.h
/// @brief Declarations for the install request adapter.

#ifndef APPUSAGE_USAGE_INSTALL_REQUEST_ADAPTER_H
#define APPUSAGE_USAGE_INSTALL_REQUEST_ADAPTER_H

#include "../log/logging_framework.h"
#include "./install_request_record.h"
#include "./recorder.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Forwards install request payloads to the recorder untouched
        class InstallRequestAdapter
        {
        private:
            Recorder &mRecorder;
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;

        public:
            /// @brief Constructor
            /// @param recorder Usage recorder receiving the requests
            /// @param loggingFramework Logging framework for diagnostics
            InstallRequestAdapter(
                Recorder &recorder,
                log::LoggingFramework &loggingFramework);

            InstallRequestAdapter(const InstallRequestAdapter &) = delete;
            InstallRequestAdapter &operator=(const InstallRequestAdapter &) = delete;

            /// @brief Adapt and forward an install request
            /// @param payload Sender supplied payload
            /// @returns Forwarded install request record
            InstallRequestRecord Adapt(const std::map<std::string, std::string> &payload);
        };
    }
}

#endif
