/// @file src/main_app_usage_daemon.cpp
/// @brief Resident daemon that records application usage and install requests.

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "./application/helper/daemon_configuration.h"
#include "./appusage/exec/signal_handler.h"
#include "./appusage/log/logging_framework.h"
#include "./appusage/usage/event_normalizer.h"
#include "./appusage/usage/file_usage_recorder.h"
#include "./appusage/usage/install_request_adapter.h"
#include "./appusage/usage/metadata_extractor.h"
#include "./appusage/usage/subscription_manager.h"
#include "./appusage/workspace/activation_translator.h"
#include "./appusage/workspace/datagram_channel_source.h"
#include "./appusage/workspace/notification_center.h"
#include "./appusage/workspace/proc_connector_source.h"
#include "./appusage/workspace/run_loop.h"

namespace
{
    const std::string cAppId{"APUS"};
    const std::string cAppDescription{"Application usage daemon"};

    bool ActivateCenter(
        appusage::workspace::NotificationCenter &center,
        appusage::log::LoggingFramework &loggingFramework,
        const appusage::log::Logger &logger)
    {
        const auto cResult{center.Activate()};
        if (!cResult.HasValue())
        {
            loggingFramework.Log(
                logger,
                appusage::log::LogLevel::kFatal,
                appusage::log::LogStream()
                    << "Cannot activate " << center.GetDescription()
                    << ": " << cResult.Error());
            return false;
        }

        return true;
    }

    int Run(
        const application::helper::DaemonConfiguration &configuration,
        appusage::log::LoggingFramework &loggingFramework,
        bool signalsRegistered)
    {
        const appusage::log::Logger cLogger{
            loggingFramework.CreateLogger("MAIN", "Daemon main")};

        loggingFramework.Log(
            cLogger,
            appusage::log::LogLevel::kInfo,
            appusage::log::LogStream()
                << "Starting with install request channel "
                << configuration.GetInstallRequestChannel()
                << ", activation channel " << configuration.GetActivationChannel()
                << ", usage file " << configuration.GetUsageFilePath());

        if (!configuration.GetConfigFileError().empty())
        {
            loggingFramework.Log(
                cLogger,
                appusage::log::LogLevel::kWarn,
                appusage::log::LogStream()
                    << "Ignored configuration file " << configuration.GetConfigFilePath()
                    << ": " << configuration.GetConfigFileError());
        }

        if (!signalsRegistered)
        {
            loggingFramework.Log(
                cLogger,
                appusage::log::LogLevel::kWarn,
                appusage::log::LogStream()
                    << "Signal handlers are not installed, termination signals kill the process");
        }

        appusage::workspace::RunLoop runLoop;

        appusage::workspace::NotificationCenter workspaceCenter(
            runLoop, "workspace notification center");
        appusage::workspace::ProcConnectorSource::Options procOptions;
        procOptions.BundledOnly = configuration.IsBundledOnly();
        std::unique_ptr<appusage::workspace::NotificationSource> procSource{
            new appusage::workspace::ProcConnectorSource(loggingFramework, procOptions)};
        std::unique_ptr<appusage::workspace::NotificationSource> activationSource{
            new appusage::workspace::DatagramChannelSource(
                configuration.GetActivationChannel(),
                loggingFramework,
                appusage::workspace::ActivationTranslator())};

        appusage::workspace::NotificationCenter distributedCenter(
            runLoop, "distributed notification center");
        std::unique_ptr<appusage::workspace::NotificationSource> installRequestSource{
            new appusage::workspace::DatagramChannelSource(
                configuration.GetInstallRequestChannel(),
                loggingFramework)};

        workspaceCenter.AddSource(std::move(procSource)).Value();
        workspaceCenter.AddSource(std::move(activationSource)).Value();
        distributedCenter.AddSource(std::move(installRequestSource)).Value();

        if (!ActivateCenter(workspaceCenter, loggingFramework, cLogger) ||
            !ActivateCenter(distributedCenter, loggingFramework, cLogger))
        {
            return EXIT_FAILURE;
        }

        appusage::usage::FileUsageRecorder recorder(configuration.GetUsageFilePath());
        appusage::usage::MetadataExtractor extractor(loggingFramework);
        appusage::usage::EventNormalizer normalizer(extractor, recorder, loggingFramework);
        appusage::usage::InstallRequestAdapter adapter(recorder, loggingFramework);
        appusage::usage::SubscriptionManager subscriptionManager(
            workspaceCenter,
            distributedCenter,
            configuration.GetInstallRequestChannel(),
            normalizer,
            adapter,
            loggingFramework);

        const auto cSubscribeResult{subscriptionManager.Subscribe()};
        if (!cSubscribeResult.HasValue())
        {
            loggingFramework.Log(
                cLogger,
                appusage::log::LogLevel::kFatal,
                appusage::log::LogStream() << "Subscription failed: " << cSubscribeResult.Error());
            return EXIT_FAILURE;
        }

        runLoop.Run(
            configuration.GetPumpInterval(),
            []()
            {
                return appusage::exec::SignalHandler::IsTerminationRequested();
            });

        loggingFramework.Log(
            cLogger,
            appusage::log::LogLevel::kInfo,
            appusage::log::LogStream()
                << "Stopping on signal "
                << static_cast<std::int32_t>(
                       appusage::exec::SignalHandler::GetReceivedSignal()));

        return EXIT_SUCCESS;
    }
}

int main()
{
    const bool cSignalsRegistered{appusage::exec::SignalHandler::Register()};

    const application::helper::DaemonConfiguration configuration;

    std::unique_ptr<appusage::log::LoggingFramework> loggingFramework;
    try
    {
        loggingFramework.reset(
            appusage::log::LoggingFramework::Create(
                cAppId,
                configuration.GetLogMode(),
                configuration.GetLogLevel(),
                cAppDescription,
                configuration.GetLogFilePath()));
    }
    catch (const std::invalid_argument &ex)
    {
        std::cerr << "appusaged: cannot set up logging: " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    try
    {
        return Run(configuration, *loggingFramework, cSignalsRegistered);
    }
    catch (const std::exception &ex)
    {
        const appusage::log::Logger cLogger{
            loggingFramework->CreateLogger("MAIN", "Daemon main")};
        loggingFramework->Log(
            cLogger,
            appusage::log::LogLevel::kFatal,
            appusage::log::LogStream() << "Unhandled exception: " << ex.what());
        return EXIT_FAILURE;
    }
}
