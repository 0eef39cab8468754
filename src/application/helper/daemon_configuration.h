/// @file src/application/helper/daemon_configuration.h
/// @brief Declarations for daemon configuration.

#ifndef DAEMON_CONFIGURATION_H
#define DAEMON_CONFIGURATION_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <yaml-cpp/yaml.h>
#include "../../appusage/log/common.h"

namespace application
{
    namespace helper
    {
        /// @brief A helper class to collect the daemon settings
        /// @details Built-in defaults are overridden by the YAML configuration file,
        ///          which is in turn overridden by the environment variables.
        ///          Invalid values keep the lower layer's setting.
        class DaemonConfiguration
        {
        public:
            /// @brief Environment variable lookup, returns null for an unset variable
            using EnvironmentLookup = std::function<const char *(const char *)>;

            static const char *const cConfigFileVariable;
            static const char *const cLogModeVariable;
            static const char *const cLogFileVariable;
            static const char *const cLogLevelVariable;
            static const char *const cUsageFileVariable;
            static const char *const cInstallRequestChannelVariable;
            static const char *const cActivationChannelVariable;
            static const char *const cPumpIntervalVariable;
            static const char *const cBundledOnlyVariable;

            /// @brief Default configuration file path
            static const std::string cDefaultConfigFile;
            /// @brief Default install request channel name
            static const std::string cDefaultInstallRequestChannel;
            /// @brief Default activation channel name
            static const std::string cDefaultActivationChannel;

        private:
            static const std::uint32_t cMinPumpIntervalMs{10U};
            static const std::uint32_t cMaxPumpIntervalMs{10000U};

            EnvironmentLookup mLookup;
            std::string mConfigFilePath;
            bool mConfigFileLoaded;
            std::string mConfigFileError;
            appusage::log::LogMode mLogMode;
            std::string mLogFilePath;
            appusage::log::LogLevel mLogLevel;
            std::string mUsageFilePath;
            std::string mInstallRequestChannel;
            std::string mActivationChannel;
            std::chrono::milliseconds mPumpInterval;
            bool mBundledOnly;

            void loadFile();
            void applyYaml(const YAML::Node &root);
            void applyEnvironment();
            void setLogMode(const std::string &text);
            void setPumpInterval(const std::string &text);
            void setBundledOnly(const std::string &text);
            static void setNonEmpty(std::string &field, const std::string &value);

        public:
            /// @brief Constructor
            /// @param lookup Environment variable lookup, the process environment by default
            explicit DaemonConfiguration(EnvironmentLookup lookup = nullptr);

            /// @brief Parse a log level name
            /// @param text Level name from "off" to "verbose"
            /// @param fallback Level returned for an unknown name
            /// @returns Parsed log level
            static appusage::log::LogLevel ParseLogLevel(
                const std::string &text,
                appusage::log::LogLevel fallback) noexcept;

            /// @brief Parse a boolean setting
            /// @param text "1", "true", "TRUE", "on", "0", "false", "FALSE" or "off"
            /// @param fallback Value returned for any other text
            /// @returns Parsed value
            static bool ParseBool(const std::string &text, bool fallback) noexcept;

            /// @brief Get the configuration file path
            /// @returns Path of the YAML configuration file
            const std::string &GetConfigFilePath() const noexcept;

            /// @brief Check whether the configuration file has been applied
            /// @returns True if the file existed and could be parsed
            bool IsConfigFileLoaded() const noexcept;

            /// @brief Get the configuration file parsing error
            /// @returns Error description, empty if the file is absent or valid
            const std::string &GetConfigFileError() const noexcept;

            appusage::log::LogMode GetLogMode() const noexcept;
            const std::string &GetLogFilePath() const noexcept;
            appusage::log::LogLevel GetLogLevel() const noexcept;
            const std::string &GetUsageFilePath() const noexcept;
            const std::string &GetInstallRequestChannel() const noexcept;
            const std::string &GetActivationChannel() const noexcept;
            std::chrono::milliseconds GetPumpInterval() const noexcept;
            bool IsBundledOnly() const noexcept;
        };
    }
}

#endif
