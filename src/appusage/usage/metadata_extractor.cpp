/// @file src/appusage/usage/metadata_extractor.cpp
/// @brief Implementation for the application metadata extractor.

#include "./metadata_extractor.h"

#include <cstdint>
#include <exception>
#include "../workspace/property_list.h"

namespace appusage
{
    namespace usage
    {
        namespace
        {
            const std::string cFileScheme{"file://"};
            const std::string cLocalHost{"localhost"};

            int HexValue(char c) noexcept
            {
                if (c >= '0' && c <= '9')
                {
                    return c - '0';
                }
                else if (c >= 'a' && c <= 'f')
                {
                    return c - 'a' + 10;
                }
                else if (c >= 'A' && c <= 'F')
                {
                    return c - 'A' + 10;
                }
                else
                {
                    return -1;
                }
            }

            bool PercentDecode(const std::string &text, std::string &result)
            {
                result.clear();
                for (std::size_t i = 0U; i < text.size(); ++i)
                {
                    if (text[i] != '%')
                    {
                        result.push_back(text[i]);
                        continue;
                    }

                    if (i + 2U >= text.size())
                    {
                        return false;
                    }

                    const int cHigh{HexValue(text[i + 1U])};
                    const int cLow{HexValue(text[i + 2U])};
                    if (cHigh < 0 || cLow < 0)
                    {
                        return false;
                    }

                    result.push_back(static_cast<char>((cHigh << 4) | cLow));
                    i += 2U;
                }

                return true;
            }
        }

        MetadataExtractor::MetadataExtractor(log::LoggingFramework &loggingFramework)
            : mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("XTRC", "Metadata extractor")}
        {
        }

        core::Optional<std::string> MetadataExtractor::PathFromBundleUrl(
            const std::string &url)
        {
            std::string _path;

            if (url.compare(0U, cFileScheme.size(), cFileScheme) == 0)
            {
                std::string _remainder{url.substr(cFileScheme.size())};
                const std::size_t cSlash{_remainder.find('/')};
                if (cSlash == std::string::npos)
                {
                    return core::Optional<std::string>{};
                }

                const std::string cHost{_remainder.substr(0U, cSlash)};
                if (!cHost.empty() && cHost != cLocalHost)
                {
                    return core::Optional<std::string>{};
                }

                if (!PercentDecode(_remainder.substr(cSlash), _path))
                {
                    return core::Optional<std::string>{};
                }
            }
            else if (!url.empty() && url.front() == '/')
            {
                _path = url;
            }
            else
            {
                return core::Optional<std::string>{};
            }

            while (_path.size() > 1U && _path.back() == '/')
            {
                _path.pop_back();
            }

            return core::Optional<std::string>{_path};
        }

        std::string MetadataExtractor::BaseName(const std::string &path)
        {
            std::string _trimmed{path};
            while (_trimmed.size() > 1U && _trimmed.back() == '/')
            {
                _trimmed.pop_back();
            }

            const std::size_t cSlash{_trimmed.rfind('/')};
            if (cSlash == std::string::npos)
            {
                return _trimmed;
            }

            return _trimmed.substr(cSlash + 1U);
        }

        core::Optional<std::string> MetadataExtractor::extractPath(
            const workspace::RunningApplication &app) const
        {
            const auto cUrl{app.BundleUrl()};
            if (!cUrl.HasValue())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kDebug,
                    log::LogStream()
                        << "Bundle URL of pid "
                        << static_cast<std::int32_t>(app.ProcessIdentifier())
                        << " is unavailable: " << cUrl.Error());

                return core::Optional<std::string>{};
            }

            core::Optional<std::string> _result{PathFromBundleUrl(cUrl.Value())};
            if (!_result.HasValue())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kDebug,
                    log::LogStream()
                        << "Bundle URL " << cUrl.Value() << " is not a local path");
            }

            return _result;
        }

        core::Optional<std::string> MetadataExtractor::extractBundleId(
            const workspace::RunningApplication &app) const
        {
            core::Optional<std::string> _result{app.BundleIdentifier()};
            if (_result.HasValue() && _result.Value().empty())
            {
                _result.Reset();
            }

            return _result;
        }

        std::string MetadataExtractor::extractVersion(const std::string &path) const
        {
            const auto cInfo{
                workspace::PropertyList::ReadFile(
                    workspace::PropertyList::InfoPlistPath(path))};
            if (!cInfo.HasValue())
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kDebug,
                    log::LogStream()
                        << "No version information for " << path << ": " << cInfo.Error());

                return cUnknownVersion;
            }

            const workspace::PropertyList::Dictionary &cDictionary{cInfo.Value()};
            for (const std::string *cKey : {&workspace::PropertyList::cShortVersionKey,
                                            &workspace::PropertyList::cBundleVersionKey})
            {
                const auto cEntry{cDictionary.find(*cKey)};
                if (cEntry != cDictionary.end() && !cEntry->second.empty())
                {
                    return cEntry->second;
                }
            }

            return cUnknownVersion;
        }

        AppDescriptor MetadataExtractor::Extract(
            const workspace::RunningApplication *app) const noexcept
        {
            AppDescriptor _result;
            if (app == nullptr)
            {
                return _result;
            }

            try
            {
                _result.Path = extractPath(*app);
            }
            catch (const std::exception &ex)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kWarn,
                    log::LogStream() << "Reading the bundle URL failed: " << ex.what());
            }

            try
            {
                _result.BundleId = extractBundleId(*app);
            }
            catch (const std::exception &ex)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kWarn,
                    log::LogStream() << "Reading the bundle identifier failed: " << ex.what());
            }

            if (!_result.BundleId.HasValue() && _result.Path.HasValue())
            {
                const std::string cBaseName{BaseName(_result.Path.Value())};
                if (!cBaseName.empty() && cBaseName != "/")
                {
                    _result.BundleId = cBaseName;
                }
            }

            if (_result.Path.HasValue())
            {
                try
                {
                    _result.Version = extractVersion(_result.Path.Value());
                }
                catch (const std::exception &ex)
                {
                    mLoggingFramework.Log(
                        mLogger,
                        log::LogLevel::kWarn,
                        log::LogStream() << "Reading the version failed: " << ex.what());
                }
            }

            return _result;
        }
    }
}
