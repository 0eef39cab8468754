/// @file src/appusage/workspace/process_application.cpp
/// @brief Implementation for the process-backed application handle.

#include "./process_application.h"

#include <unistd.h>
#include <cstdio>
#include "./property_list.h"

namespace appusage
{
    namespace workspace
    {
        namespace
        {
            const std::string cBundleSuffix{".app"};
            const std::string cDeletedSuffix{" (deleted)"};

            bool EndsWith(const std::string &text, const std::string &suffix)
            {
                return text.size() >= suffix.size() &&
                       text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
            }

            core::Result<std::string> ReadExecutableLink(const std::string &linkPath)
            {
                const std::size_t cBufferSize{4096U};
                char _buffer[cBufferSize];
                const ssize_t cLength{::readlink(linkPath.c_str(), _buffer, cBufferSize - 1U)};
                if (cLength <= 0)
                {
                    return core::Result<std::string>::FromError(
                        MakeErrorCode(WorkspaceErrc::kProcessNotFound));
                }

                std::string _result(_buffer, static_cast<std::size_t>(cLength));
                if (EndsWith(_result, cDeletedSuffix))
                {
                    _result.erase(_result.size() - cDeletedSuffix.size());
                }

                return core::Result<std::string>::FromValue(std::move(_result));
            }
        }

        const std::string ProcessApplication::cDefaultProcRoot{"/proc"};

        ProcessApplication::ProcessApplication(
            pid_t processId,
            std::string executablePath,
            core::Optional<std::string> bundlePath,
            core::Optional<std::string> bundleIdentifier) : mProcessId{processId},
                                                            mExecutablePath{std::move(executablePath)},
                                                            mBundlePath{std::move(bundlePath)},
                                                            mBundleIdentifier{std::move(bundleIdentifier)}
        {
        }

        core::Result<std::shared_ptr<ProcessApplication>> ProcessApplication::FromProcess(
            pid_t processId,
            const std::string &procRoot)
        {
            const std::string cLinkPath{
                procRoot + "/" + std::to_string(processId) + "/exe"};
            auto _executableResult{ReadExecutableLink(cLinkPath)};
            if (!_executableResult.HasValue())
            {
                return core::Result<std::shared_ptr<ProcessApplication>>::FromError(
                    _executableResult.Error());
            }

            std::string _executablePath{std::move(_executableResult).Value()};
            core::Optional<std::string> _bundlePath{FindEnclosingBundle(_executablePath)};
            core::Optional<std::string> _bundleIdentifier;

            if (_bundlePath.HasValue())
            {
                const auto cInfo{
                    PropertyList::ReadFile(PropertyList::InfoPlistPath(_bundlePath.Value()))};
                if (cInfo.HasValue())
                {
                    const auto cIdentifier{cInfo.Value().find(PropertyList::cBundleIdentifierKey)};
                    if (cIdentifier != cInfo.Value().end() && !cIdentifier->second.empty())
                    {
                        _bundleIdentifier = cIdentifier->second;
                    }
                }
            }

            std::shared_ptr<ProcessApplication> _result{
                std::make_shared<ProcessApplication>(
                    processId,
                    std::move(_executablePath),
                    std::move(_bundlePath),
                    std::move(_bundleIdentifier))};

            return core::Result<std::shared_ptr<ProcessApplication>>::FromValue(
                std::move(_result));
        }

        core::Optional<std::string> ProcessApplication::FindEnclosingBundle(
            const std::string &executablePath)
        {
            std::string _directory{executablePath};
            while (true)
            {
                const std::size_t cSlash{_directory.rfind('/')};
                if (cSlash == std::string::npos || cSlash == 0U)
                {
                    return core::Optional<std::string>{};
                }

                _directory.erase(cSlash);
                const std::string cName{_directory.substr(_directory.rfind('/') + 1U)};
                if (cName.size() > cBundleSuffix.size() && EndsWith(cName, cBundleSuffix))
                {
                    return core::Optional<std::string>{_directory};
                }
            }
        }

        std::string ProcessApplication::ToFileUrl(const std::string &path)
        {
            std::string _result{"file://"};
            for (const char c : path)
            {
                const unsigned char cByte{static_cast<unsigned char>(c)};
                const bool cUnreserved{
                    (cByte >= 'a' && cByte <= 'z') || (cByte >= 'A' && cByte <= 'Z') ||
                    (cByte >= '0' && cByte <= '9') || cByte == '-' || cByte == '.' ||
                    cByte == '_' || cByte == '~' || cByte == '/'};

                if (cUnreserved)
                {
                    _result.push_back(c);
                }
                else
                {
                    char _escaped[4];
                    std::snprintf(_escaped, sizeof(_escaped), "%%%02X", cByte);
                    _result.append(_escaped);
                }
            }

            return _result;
        }

        pid_t ProcessApplication::ProcessIdentifier() const noexcept
        {
            return mProcessId;
        }

        core::Result<std::string> ProcessApplication::BundleUrl() const
        {
            if (!mBundlePath.HasValue())
            {
                return core::Result<std::string>::FromError(
                    MakeErrorCode(WorkspaceErrc::kCapabilityUnsupported));
            }

            return core::Result<std::string>::FromValue(ToFileUrl(mBundlePath.Value()));
        }

        core::Optional<std::string> ProcessApplication::BundleIdentifier() const
        {
            return mBundleIdentifier;
        }

        const std::string &ProcessApplication::GetExecutablePath() const noexcept
        {
            return mExecutablePath;
        }

        bool ProcessApplication::IsBundled() const noexcept
        {
            return mBundlePath.HasValue();
        }
    }
}
