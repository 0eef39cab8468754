/// @file src/appusage/workspace/datagram_channel.h
/// @brief Declarations for named datagram channels.
/// @details A channel is a UNIX datagram socket in the abstract namespace named
///          after the channel (e.g. "org.appusage.managedsoftwareupdate.installrequest").
///          Each datagram carries one key-value payload encoded as "key=value"
///          lines, with backslash, newline and carriage return escaped in values.

#ifndef APPUSAGE_WORKSPACE_DATAGRAM_CHANNEL_H
#define APPUSAGE_WORKSPACE_DATAGRAM_CHANNEL_H

#include <sys/socket.h>
#include <sys/un.h>
#include <map>
#include <string>
#include "../core/result.h"
#include "./workspace_error_domain.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Named inter-process broadcast channel helpers
        class DatagramChannel
        {
        public:
            /// @brief Channel payload type
            using Payload = std::map<std::string, std::string>;

            /// @brief Maximum datagram size accepted by a channel
            static const std::size_t cMaxDatagramSize;

            DatagramChannel() = delete;

            /// @brief Build the abstract socket address of a channel
            /// @param channelName Channel name
            /// @param address Socket address to be filled
            /// @param addressLength Effective address length to be filled
            /// @returns Void Result on success, kChannelNameInvalid if the name is empty or too long
            static core::Result<void> MakeAddress(
                const std::string &channelName,
                sockaddr_un &address,
                socklen_t &addressLength);

            /// @brief Encode a payload into a datagram body
            /// @param payload Key-value payload
            /// @returns Datagram body
            static std::string Encode(const Payload &payload);

            /// @brief Decode a datagram body into a payload
            /// @param body Datagram body
            /// @returns Key-value payload, or kPayloadMalformed
            static core::Result<Payload> Decode(const std::string &body);

            /// @brief Send a payload to the listener of a channel
            /// @param channelName Channel name
            /// @param payload Key-value payload
            /// @returns Void Result on success, kSocketFailure if nobody listens on the channel,
            /// kPayloadMalformed for an empty key or a body above cMaxDatagramSize
            static core::Result<void> Post(
                const std::string &channelName,
                const Payload &payload);
        };
    }
}

#endif
