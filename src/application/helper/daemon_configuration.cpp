/// @file src/application/helper/daemon_configuration.cpp
/// @brief Implementation for daemon configuration.

#include "./daemon_configuration.h"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace application
{
    namespace helper
    {
        namespace
        {
            bool FileExists(const std::string &path)
            {
                std::ifstream ifs(path.c_str());
                return ifs.good();
            }

            bool TryGetScalar(const YAML::Node &node, std::string &value)
            {
                if (!node || !node.IsScalar())
                {
                    return false;
                }

                value = node.as<std::string>();
                return true;
            }
        }

        const char *const DaemonConfiguration::cConfigFileVariable{"APPUSAGE_CONFIG_FILE"};
        const char *const DaemonConfiguration::cLogModeVariable{"APPUSAGE_LOG_MODE"};
        const char *const DaemonConfiguration::cLogFileVariable{"APPUSAGE_LOG_FILE"};
        const char *const DaemonConfiguration::cLogLevelVariable{"APPUSAGE_LOG_LEVEL"};
        const char *const DaemonConfiguration::cUsageFileVariable{"APPUSAGE_USAGE_FILE"};
        const char *const DaemonConfiguration::cInstallRequestChannelVariable{
            "APPUSAGE_INSTALL_REQUEST_CHANNEL"};
        const char *const DaemonConfiguration::cActivationChannelVariable{
            "APPUSAGE_ACTIVATION_CHANNEL"};
        const char *const DaemonConfiguration::cPumpIntervalVariable{"APPUSAGE_PUMP_INTERVAL_MS"};
        const char *const DaemonConfiguration::cBundledOnlyVariable{"APPUSAGE_BUNDLED_ONLY"};

        const std::string DaemonConfiguration::cDefaultConfigFile{
            "/etc/appusage/appusaged.yaml"};
        const std::string DaemonConfiguration::cDefaultInstallRequestChannel{
            "org.appusage.managedsoftwareupdate.installrequest"};
        const std::string DaemonConfiguration::cDefaultActivationChannel{
            "org.appusage.workspace.didactivateapplication"};

        DaemonConfiguration::DaemonConfiguration(EnvironmentLookup lookup)
            : mLookup{std::move(lookup)},
              mConfigFilePath{cDefaultConfigFile},
              mConfigFileLoaded{false},
              mLogMode{appusage::log::LogMode::kFile},
              mLogFilePath{"/var/log/appusaged.log"},
              mLogLevel{appusage::log::LogLevel::kInfo},
              mUsageFilePath{"/var/lib/appusage/usage.log"},
              mInstallRequestChannel{cDefaultInstallRequestChannel},
              mActivationChannel{cDefaultActivationChannel},
              mPumpInterval{100},
              mBundledOnly{true}
        {
            if (!mLookup)
            {
                mLookup = [](const char *key) -> const char *
                {
                    return std::getenv(key);
                };
            }

            const char *cConfigFile{mLookup(cConfigFileVariable)};
            if (cConfigFile != nullptr && *cConfigFile != '\0')
            {
                mConfigFilePath = cConfigFile;
            }

            loadFile();
            applyEnvironment();
        }

        void DaemonConfiguration::loadFile()
        {
            if (!FileExists(mConfigFilePath))
            {
                return;
            }

            try
            {
                const YAML::Node cRoot{YAML::LoadFile(mConfigFilePath)};
                if (cRoot.IsMap())
                {
                    applyYaml(cRoot);
                    mConfigFileLoaded = true;
                }
                else if (!cRoot.IsNull())
                {
                    mConfigFileError = "top-level node is not a mapping";
                }
            }
            catch (const YAML::Exception &ex)
            {
                mConfigFileError = ex.what();
            }
        }

        void DaemonConfiguration::applyYaml(const YAML::Node &root)
        {
            std::string _value;

            const YAML::Node cLog{root["log"]};
            if (cLog && cLog.IsMap())
            {
                if (TryGetScalar(cLog["mode"], _value))
                {
                    setLogMode(_value);
                }
                if (TryGetScalar(cLog["file"], _value))
                {
                    setNonEmpty(mLogFilePath, _value);
                }
                if (TryGetScalar(cLog["level"], _value))
                {
                    mLogLevel = ParseLogLevel(_value, mLogLevel);
                }
            }

            if (TryGetScalar(root["usage_file"], _value))
            {
                setNonEmpty(mUsageFilePath, _value);
            }

            const YAML::Node cChannels{root["channels"]};
            if (cChannels && cChannels.IsMap())
            {
                if (TryGetScalar(cChannels["install_request"], _value))
                {
                    setNonEmpty(mInstallRequestChannel, _value);
                }
                if (TryGetScalar(cChannels["activation"], _value))
                {
                    setNonEmpty(mActivationChannel, _value);
                }
            }

            if (TryGetScalar(root["pump_interval_ms"], _value))
            {
                setPumpInterval(_value);
            }

            if (TryGetScalar(root["bundled_only"], _value))
            {
                setBundledOnly(_value);
            }
        }

        void DaemonConfiguration::applyEnvironment()
        {
            const char *value{nullptr};

            if ((value = mLookup(cLogModeVariable)) != nullptr)
            {
                setLogMode(value);
            }
            if ((value = mLookup(cLogFileVariable)) != nullptr)
            {
                setNonEmpty(mLogFilePath, value);
            }
            if ((value = mLookup(cLogLevelVariable)) != nullptr)
            {
                mLogLevel = ParseLogLevel(value, mLogLevel);
            }
            if ((value = mLookup(cUsageFileVariable)) != nullptr)
            {
                setNonEmpty(mUsageFilePath, value);
            }
            if ((value = mLookup(cInstallRequestChannelVariable)) != nullptr)
            {
                setNonEmpty(mInstallRequestChannel, value);
            }
            if ((value = mLookup(cActivationChannelVariable)) != nullptr)
            {
                setNonEmpty(mActivationChannel, value);
            }
            if ((value = mLookup(cPumpIntervalVariable)) != nullptr)
            {
                setPumpInterval(value);
            }
            if ((value = mLookup(cBundledOnlyVariable)) != nullptr)
            {
                setBundledOnly(value);
            }
        }

        void DaemonConfiguration::setLogMode(const std::string &text)
        {
            if (text == "console")
            {
                mLogMode = appusage::log::LogMode::kConsole;
            }
            else if (text == "file")
            {
                mLogMode = appusage::log::LogMode::kFile;
            }
        }

        void DaemonConfiguration::setPumpInterval(const std::string &text)
        {
            try
            {
                std::size_t _consumed{0U};
                const unsigned long long cParsed{std::stoull(text, &_consumed)};
                if (_consumed == text.size() &&
                    cParsed >= cMinPumpIntervalMs &&
                    cParsed <= cMaxPumpIntervalMs)
                {
                    mPumpInterval = std::chrono::milliseconds(cParsed);
                }
            }
            catch (const std::invalid_argument &)
            {
                // Keep the current interval.
            }
            catch (const std::out_of_range &)
            {
                // Keep the current interval.
            }
        }

        void DaemonConfiguration::setBundledOnly(const std::string &text)
        {
            mBundledOnly = ParseBool(text, mBundledOnly);
        }

        void DaemonConfiguration::setNonEmpty(std::string &field, const std::string &value)
        {
            if (!value.empty())
            {
                field = value;
            }
        }

        appusage::log::LogLevel DaemonConfiguration::ParseLogLevel(
            const std::string &text,
            appusage::log::LogLevel fallback) noexcept
        {
            if (text == "off")
            {
                return appusage::log::LogLevel::kOff;
            }
            else if (text == "fatal")
            {
                return appusage::log::LogLevel::kFatal;
            }
            else if (text == "error")
            {
                return appusage::log::LogLevel::kError;
            }
            else if (text == "warn")
            {
                return appusage::log::LogLevel::kWarn;
            }
            else if (text == "info")
            {
                return appusage::log::LogLevel::kInfo;
            }
            else if (text == "debug")
            {
                return appusage::log::LogLevel::kDebug;
            }
            else if (text == "verbose")
            {
                return appusage::log::LogLevel::kVerbose;
            }
            else
            {
                return fallback;
            }
        }

        bool DaemonConfiguration::ParseBool(const std::string &text, bool fallback) noexcept
        {
            if (text == "1" || text == "true" || text == "TRUE" || text == "on")
            {
                return true;
            }
            if (text == "0" || text == "false" || text == "FALSE" || text == "off")
            {
                return false;
            }

            return fallback;
        }

        const std::string &DaemonConfiguration::GetConfigFilePath() const noexcept
        {
            return mConfigFilePath;
        }

        bool DaemonConfiguration::IsConfigFileLoaded() const noexcept
        {
            return mConfigFileLoaded;
        }

        const std::string &DaemonConfiguration::GetConfigFileError() const noexcept
        {
            return mConfigFileError;
        }

        appusage::log::LogMode DaemonConfiguration::GetLogMode() const noexcept
        {
            return mLogMode;
        }

        const std::string &DaemonConfiguration::GetLogFilePath() const noexcept
        {
            return mLogFilePath;
        }

        appusage::log::LogLevel DaemonConfiguration::GetLogLevel() const noexcept
        {
            return mLogLevel;
        }

        const std::string &DaemonConfiguration::GetUsageFilePath() const noexcept
        {
            return mUsageFilePath;
        }

        const std::string &DaemonConfiguration::GetInstallRequestChannel() const noexcept
        {
            return mInstallRequestChannel;
        }

        const std::string &DaemonConfiguration::GetActivationChannel() const noexcept
        {
            return mActivationChannel;
        }

        std::chrono::milliseconds DaemonConfiguration::GetPumpInterval() const noexcept
        {
            return mPumpInterval;
        }

        bool DaemonConfiguration::IsBundledOnly() const noexcept
        {
            return mBundledOnly;
        }
    }
}
