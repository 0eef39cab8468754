/// @file src/appusage/workspace/datagram_channel_source.cpp
/// @brief Implementation for the datagram channel notification source.

#include "./datagram_channel_source.h"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <vector>

namespace appusage
{
    namespace workspace
    {
        const int DatagramChannelSource::cPollTimeoutMs{100};

        DatagramChannelSource::DatagramChannelSource(
            std::string channelName,
            log::LoggingFramework &loggingFramework,
            Translator translator)
            : mChannelName{std::move(channelName)},
              mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("CHNL", "Datagram channel source")},
              mTranslator{translator ? std::move(translator) : Translator(defaultTranslate)},
              mSocket{-1},
              mRunning{false}
        {
        }

        DatagramChannelSource::~DatagramChannelSource() noexcept
        {
            Stop();
        }

        Notification DatagramChannelSource::defaultTranslate(
            const std::string &channelName,
            DatagramChannel::Payload &&payload)
        {
            Notification _result;
            _result.Name = channelName;
            _result.UserInfo = std::move(payload);

            return _result;
        }

        core::Result<void> DatagramChannelSource::Start(PostHandler handler)
        {
            if (mRunning.load())
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kAlreadyActive));
            }

            if (!handler)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kInvalidArgument));
            }

            sockaddr_un _address;
            socklen_t _addressLength{0};
            auto _addressResult{
                DatagramChannel::MakeAddress(mChannelName, _address, _addressLength)};
            if (!_addressResult.HasValue())
            {
                return _addressResult;
            }

            mSocket = ::socket(AF_UNIX, SOCK_DGRAM | SOCK_CLOEXEC, 0);
            if (mSocket < 0)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kSocketFailure));
            }

            if (::bind(
                    mSocket,
                    reinterpret_cast<const sockaddr *>(&_address),
                    _addressLength) != 0)
            {
                const int cError{errno};
                closeSocket();

                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Binding channel " << mChannelName
                        << " failed, errno: " << static_cast<std::int32_t>(cError));

                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
            }

            mHandler = std::move(handler);
            mRunning.store(true);
            mReaderThread = std::thread(&DatagramChannelSource::readLoop, this);

            mLoggingFramework.Log(
                mLogger,
                log::LogLevel::kDebug,
                log::LogStream() << "Listening on channel " << mChannelName);

            return core::Result<void>::FromValue();
        }

        void DatagramChannelSource::readLoop()
        {
            std::vector<char> _buffer(DatagramChannel::cMaxDatagramSize);

            while (mRunning.load())
            {
                pollfd _pollFd;
                _pollFd.fd = mSocket;
                _pollFd.events = POLLIN;
                _pollFd.revents = 0;

                const int cReady{::poll(&_pollFd, 1, cPollTimeoutMs)};
                if (cReady < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }

                    mLoggingFramework.Log(
                        mLogger,
                        log::LogLevel::kError,
                        log::LogStream()
                            << "Polling channel " << mChannelName << " failed");
                    break;
                }

                if (cReady == 0 || (_pollFd.revents & POLLIN) == 0)
                {
                    continue;
                }

                // MSG_TRUNC reports the full datagram length even when it exceeds the buffer.
                const ssize_t cReceived{
                    ::recv(
                        mSocket, _buffer.data(), _buffer.size(),
                        MSG_DONTWAIT | MSG_TRUNC)};
                if (cReceived < 0)
                {
                    continue;
                }

                if (static_cast<std::size_t>(cReceived) > _buffer.size())
                {
                    mLoggingFramework.Log(
                        mLogger,
                        log::LogLevel::kWarn,
                        log::LogStream()
                            << "Dropped oversized datagram on channel " << mChannelName
                            << ": " << static_cast<uint64_t>(cReceived) << " bytes");
                    continue;
                }

                const std::string cBody(
                    _buffer.data(), static_cast<std::size_t>(cReceived));
                auto _payload{DatagramChannel::Decode(cBody)};
                if (!_payload.HasValue())
                {
                    mLoggingFramework.Log(
                        mLogger,
                        log::LogLevel::kWarn,
                        log::LogStream()
                            << "Dropped datagram on channel " << mChannelName
                            << ": " << _payload.Error());
                    continue;
                }

                mHandler(mTranslator(mChannelName, std::move(_payload).Value()));
            }
        }

        void DatagramChannelSource::closeSocket() noexcept
        {
            if (mSocket >= 0)
            {
                ::close(mSocket);
                mSocket = -1;
            }
        }

        void DatagramChannelSource::Stop() noexcept
        {
            mRunning.store(false);
            if (mReaderThread.joinable())
            {
                mReaderThread.join();
            }

            closeSocket();
        }

        bool DatagramChannelSource::IsRunning() const noexcept
        {
            return mRunning.load();
        }

        std::string DatagramChannelSource::GetDescription() const
        {
            return "datagram channel " + mChannelName;
        }

        const std::string &DatagramChannelSource::GetChannelName() const noexcept
        {
            return mChannelName;
        }
    }
}
