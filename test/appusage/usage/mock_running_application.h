#ifndef APPUSAGE_TEST_USAGE_MOCK_RUNNING_APPLICATION_H
#define APPUSAGE_TEST_USAGE_MOCK_RUNNING_APPLICATION_H

#include <stdexcept>
#include "../../../src/appusage/workspace/running_application.h"
#include "../../../src/appusage/workspace/workspace_error_domain.h"

namespace appusage
{
    namespace usage
    {
        /// @brief Application handle with scripted properties
        class MockRunningApplication : public workspace::RunningApplication
        {
        public:
            core::Optional<std::string> Url;
            core::Optional<std::string> Identifier;
            bool ThrowOnUrl{false};
            bool ThrowOnIdentifier{false};

            pid_t ProcessIdentifier() const noexcept override
            {
                return 4242;
            }

            core::Result<std::string> BundleUrl() const override
            {
                if (ThrowOnUrl)
                {
                    throw std::runtime_error("bundle URL failure");
                }

                if (!Url.HasValue())
                {
                    return core::Result<std::string>::FromError(
                        workspace::MakeErrorCode(
                            workspace::WorkspaceErrc::kCapabilityUnsupported));
                }

                return core::Result<std::string>::FromValue(Url.Value());
            }

            core::Optional<std::string> BundleIdentifier() const override
            {
                if (ThrowOnIdentifier)
                {
                    throw std::runtime_error("bundle identifier failure");
                }

                return Identifier;
            }
        };
    }
}

#endif
