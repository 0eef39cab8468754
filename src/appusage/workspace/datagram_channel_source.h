/// @file src/appusage/workspace/datagram_channel_source.h
/// @brief Declarations for the datagram channel notification source.

#ifndef APPUSAGE_WORKSPACE_DATAGRAM_CHANNEL_SOURCE_H
#define APPUSAGE_WORKSPACE_DATAGRAM_CHANNEL_SOURCE_H

#include <atomic>
#include <functional>
#include <thread>
#include "../log/logging_framework.h"
#include "./datagram_channel.h"
#include "./notification_source.h"

namespace appusage
{
    namespace workspace
    {
        /// @brief Source that listens on a named datagram channel
        class DatagramChannelSource final : public NotificationSource
        {
        public:
            /// @brief Converter from a received payload to a notification
            using Translator =
                std::function<Notification(const std::string &, DatagramChannel::Payload &&)>;

        private:
            static const int cPollTimeoutMs;

            const std::string mChannelName;
            log::LoggingFramework &mLoggingFramework;
            log::Logger mLogger;
            Translator mTranslator;
            PostHandler mHandler;
            int mSocket;
            std::atomic_bool mRunning;
            std::thread mReaderThread;

            static Notification defaultTranslate(
                const std::string &channelName,
                DatagramChannel::Payload &&payload);

            void readLoop();
            void closeSocket() noexcept;

        public:
            /// @brief Constructor
            /// @param channelName Name of the channel to listen on
            /// @param loggingFramework Logging framework for diagnostics
            /// @param translator Payload translator; by default the notification is
            ///        named after the channel and carries the payload as user info
            DatagramChannelSource(
                std::string channelName,
                log::LoggingFramework &loggingFramework,
                Translator translator = nullptr);

            DatagramChannelSource(const DatagramChannelSource &) = delete;
            DatagramChannelSource &operator=(const DatagramChannelSource &) = delete;
            ~DatagramChannelSource() noexcept override;

            core::Result<void> Start(PostHandler handler) override;

            void Stop() noexcept override;

            bool IsRunning() const noexcept override;

            std::string GetDescription() const override;

            /// @brief Get the listened channel name
            /// @returns Channel name
            const std::string &GetChannelName() const noexcept;
        };
    }
}

#endif
