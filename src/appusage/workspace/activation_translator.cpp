/// @file src/appusage/workspace/activation_translator.cpp
/// @brief Implementation for the activation channel translator.

#include "./activation_translator.h"

#include <cstdlib>

namespace appusage
{
    namespace workspace
    {
        const std::string ActivationTranslator::cProcessIdKey{"pid"};

        ActivationTranslator::ActivationTranslator(std::string procRoot)
            : mProcRoot{std::move(procRoot)}
        {
        }

        Notification ActivationTranslator::operator()(
            const std::string &,
            DatagramChannel::Payload &&payload) const
        {
            Notification _result;
            _result.Name = cDidActivateApplicationNotification;

            const auto cProcessId{payload.find(cProcessIdKey)};
            if (cProcessId != payload.end())
            {
                char *_end{nullptr};
                const long cValue{std::strtol(cProcessId->second.c_str(), &_end, 10)};
                if (_end != cProcessId->second.c_str() && *_end == '\0' && cValue > 0)
                {
                    auto _application{
                        ProcessApplication::FromProcess(static_cast<pid_t>(cValue), mProcRoot)};
                    if (_application.HasValue())
                    {
                        _result.Application = _application.Value();
                    }
                }
            }

            _result.UserInfo = std::move(payload);

            return _result;
        }
    }
}
