/// @file src/appusage/workspace/datagram_channel.cpp
/// @brief Implementation for named datagram channels.

#include "./datagram_channel.h"

#include <unistd.h>
#include <cstddef>
#include <cstring>
#include <sstream>

namespace appusage
{
    namespace workspace
    {
        namespace
        {
            std::string EscapeField(const std::string &value, bool isKey)
            {
                std::string _result;
                _result.reserve(value.size());
                for (const char c : value)
                {
                    switch (c)
                    {
                    case '\\':
                        _result += "\\\\";
                        break;
                    case '=':
                        _result += isKey ? "\\=" : "=";
                        break;
                    case '\n':
                        _result += "\\n";
                        break;
                    case '\r':
                        _result += "\\r";
                        break;
                    default:
                        _result.push_back(c);
                        break;
                    }
                }

                return _result;
            }

            bool UnescapeField(const std::string &value, std::string &result)
            {
                result.clear();
                for (std::size_t i = 0U; i < value.size(); ++i)
                {
                    if (value[i] != '\\')
                    {
                        result.push_back(value[i]);
                        continue;
                    }

                    if (++i == value.size())
                    {
                        return false;
                    }

                    switch (value[i])
                    {
                    case '\\':
                        result.push_back('\\');
                        break;
                    case 'n':
                        result.push_back('\n');
                        break;
                    case 'r':
                        result.push_back('\r');
                        break;
                    case '=':
                        result.push_back('=');
                        break;
                    default:
                        return false;
                    }
                }

                return true;
            }

            /// @returns Position of the first unescaped '=' or npos
            std::size_t FindDelimiter(const std::string &line)
            {
                for (std::size_t i = 0U; i < line.size(); ++i)
                {
                    if (line[i] == '\\')
                    {
                        ++i;
                    }
                    else if (line[i] == '=')
                    {
                        return i;
                    }
                }

                return std::string::npos;
            }
        }

        const std::size_t DatagramChannel::cMaxDatagramSize{65536U};

        core::Result<void> DatagramChannel::MakeAddress(
            const std::string &channelName,
            sockaddr_un &address,
            socklen_t &addressLength)
        {
            // The leading null byte places the name in the abstract namespace.
            const std::size_t cMaxNameLength{sizeof(address.sun_path) - 1U};
            if (channelName.empty() || channelName.size() > cMaxNameLength)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kChannelNameInvalid));
            }

            std::memset(&address, 0, sizeof(address));
            address.sun_family = AF_UNIX;
            std::memcpy(address.sun_path + 1, channelName.data(), channelName.size());
            addressLength = static_cast<socklen_t>(
                offsetof(sockaddr_un, sun_path) + 1U + channelName.size());

            return core::Result<void>::FromValue();
        }

        std::string DatagramChannel::Encode(const Payload &payload)
        {
            std::string _result;
            for (const auto &entry : payload)
            {
                _result += EscapeField(entry.first, true);
                _result += '=';
                _result += EscapeField(entry.second, false);
                _result += '\n';
            }

            return _result;
        }

        core::Result<DatagramChannel::Payload> DatagramChannel::Decode(
            const std::string &body)
        {
            Payload _result;
            std::istringstream _stream{body};
            std::string _line;

            while (std::getline(_stream, _line))
            {
                if (_line.empty())
                {
                    continue;
                }

                const std::size_t cDelimiter{FindDelimiter(_line)};
                if (cDelimiter == std::string::npos || cDelimiter == 0U)
                {
                    return core::Result<Payload>::FromError(
                        MakeErrorCode(WorkspaceErrc::kPayloadMalformed));
                }

                std::string _key;
                std::string _value;
                if (!UnescapeField(_line.substr(0U, cDelimiter), _key) ||
                    !UnescapeField(_line.substr(cDelimiter + 1U), _value))
                {
                    return core::Result<Payload>::FromError(
                        MakeErrorCode(WorkspaceErrc::kPayloadMalformed));
                }

                _result[_key] = std::move(_value);
            }

            return core::Result<Payload>::FromValue(std::move(_result));
        }

        core::Result<void> DatagramChannel::Post(
            const std::string &channelName,
            const Payload &payload)
        {
            sockaddr_un _address;
            socklen_t _addressLength{0};
            auto _addressResult{MakeAddress(channelName, _address, _addressLength)};
            if (!_addressResult.HasValue())
            {
                return _addressResult;
            }

            if (payload.count(std::string()) > 0U)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kPayloadMalformed));
            }

            const std::string cBody{Encode(payload)};
            if (cBody.size() > cMaxDatagramSize)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kPayloadMalformed));
            }

            const int cSocket{::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0)};
            if (cSocket < 0)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kSocketFailure));
            }

            const ssize_t cSent{
                ::sendto(
                    cSocket, cBody.data(), cBody.size(), 0,
                    reinterpret_cast<const sockaddr *>(&_address), _addressLength)};
            ::close(cSocket);

            if (cSent < 0 || static_cast<std::size_t>(cSent) != cBody.size())
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kSocketFailure));
            }

            return core::Result<void>::FromValue();
        }
    }
}
