/// @file src/appusage/usage/install_request_adapter.cpp
/// @brief Implementation for the install request adapter.

#include "./install_request_adapter.h"

#include <cstdint>
#include <exception>

namespace appusage
{
    namespace usage
    {
        InstallRequestAdapter::InstallRequestAdapter(
            Recorder &recorder,
            log::LoggingFramework &loggingFramework)
            : mRecorder{recorder},
              mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("INST", "Install request adapter")}
        {
        }

        InstallRequestRecord InstallRequestAdapter::Adapt(
            const std::map<std::string, std::string> &payload)
        {
            InstallRequestRecord _record{payload};

            mLoggingFramework.Log(
                mLogger,
                log::LogLevel::kInfo,
                log::LogStream()
                    << "Install request received with "
                    << static_cast<std::uint64_t>(payload.size()) << " entries");

            try
            {
                mRecorder.LogInstallRequest(_record.Payload);
            }
            catch (const std::exception &ex)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream() << "Recording the install request failed: " << ex.what());
            }

            return _record;
        }
    }
}
