/// @file src/appusage/workspace/proc_connector_source.cpp
/// @brief Implementation for the kernel process connector notification source.

#include "./proc_connector_source.h"

#include <dirent.h>
#include <linux/cn_proc.h>
#include <linux/connector.h>
#include <linux/netlink.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>

namespace appusage
{
    namespace workspace
    {
        namespace
        {
            const std::size_t cReceiveBufferSize{8192U};

            bool TryParseProcessId(const char *name, pid_t &processId)
            {
                if (name == nullptr || *name == '\0')
                {
                    return false;
                }

                char *_end{nullptr};
                const long cValue{std::strtol(name, &_end, 10)};
                if (*_end != '\0' || cValue <= 0)
                {
                    return false;
                }

                processId = static_cast<pid_t>(cValue);
                return true;
            }
        }

        const int ProcConnectorSource::cPollTimeoutMs{100};

        ProcConnectorSource::ProcConnectorSource(
            log::LoggingFramework &loggingFramework,
            Options options)
            : mOptions{std::move(options)},
              mLoggingFramework{loggingFramework},
              mLogger{loggingFramework.CreateLogger("PROC", "Process connector source")},
              mSocket{-1},
              mRunning{false}
        {
        }

        ProcConnectorSource::~ProcConnectorSource() noexcept
        {
            Stop();
        }

        core::Result<void> ProcConnectorSource::setListening(bool listen)
        {
            // cn_msg ends in a flexible array member, so the request is laid
            // out in a byte buffer: nlmsghdr | cn_msg | proc_cn_mcast_op.
            alignas(nlmsghdr) unsigned char _request[
                sizeof(nlmsghdr) + sizeof(cn_msg) + sizeof(proc_cn_mcast_op)];

            std::memset(&_request, 0, sizeof(_request));
            nlmsghdr *const cHeader{reinterpret_cast<nlmsghdr *>(_request)};
            cn_msg *const cMessage{
                reinterpret_cast<cn_msg *>(_request + sizeof(nlmsghdr))};
            const proc_cn_mcast_op cOperation{
                listen ? PROC_CN_MCAST_LISTEN : PROC_CN_MCAST_IGNORE};

            cHeader->nlmsg_len = sizeof(_request);
            cHeader->nlmsg_pid = static_cast<__u32>(::getpid());
            cHeader->nlmsg_type = NLMSG_DONE;
            cMessage->id.idx = CN_IDX_PROC;
            cMessage->id.val = CN_VAL_PROC;
            cMessage->len = sizeof(proc_cn_mcast_op);
            std::memcpy(
                _request + sizeof(nlmsghdr) + sizeof(cn_msg),
                &cOperation,
                sizeof(cOperation));

            if (::send(mSocket, &_request, sizeof(_request), 0) < 0)
            {
                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
            }

            return core::Result<void>::FromValue();
        }

        core::Result<void> ProcConnectorSource::Start(PostHandler handler)
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

            mSocket = ::socket(PF_NETLINK, SOCK_DGRAM | SOCK_CLOEXEC, NETLINK_CONNECTOR);
            if (mSocket < 0)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Creating the netlink connector socket failed, errno: "
                        << static_cast<std::int32_t>(errno));

                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
            }

            sockaddr_nl _address;
            std::memset(&_address, 0, sizeof(_address));
            _address.nl_family = AF_NETLINK;
            _address.nl_groups = CN_IDX_PROC;
            _address.nl_pid = static_cast<__u32>(::getpid());

            if (::bind(
                    mSocket,
                    reinterpret_cast<const sockaddr *>(&_address),
                    sizeof(_address)) != 0)
            {
                const int cError{errno};
                closeSocket();

                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Binding the netlink connector socket failed, errno: "
                        << static_cast<std::int32_t>(cError));

                return core::Result<void>::FromError(
                    MakeErrorCode(WorkspaceErrc::kFacilityUnavailable));
            }

            auto _listenResult{setListening(true)};
            if (!_listenResult.HasValue())
            {
                const int cError{errno};
                closeSocket();

                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kError,
                    log::LogStream()
                        << "Subscribing to process events failed, errno: "
                        << static_cast<std::int32_t>(cError));

                return _listenResult;
            }

            const std::size_t cSeeded{SeedRunningApplications()};

            mHandler = std::move(handler);
            mRunning.store(true);
            mReaderThread = std::thread(&ProcConnectorSource::readLoop, this);

            mLoggingFramework.Log(
                mLogger,
                log::LogLevel::kDebug,
                log::LogStream()
                    << "Process connector started with "
                    << static_cast<std::uint64_t>(cSeeded) << " running applications");

            return core::Result<void>::FromValue();
        }

        std::size_t ProcConnectorSource::SeedRunningApplications()
        {
            DIR *_directory{::opendir(mOptions.ProcRoot.c_str())};
            if (_directory == nullptr)
            {
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kWarn,
                    log::LogStream() << "Cannot list " << mOptions.ProcRoot);

                return 0U;
            }

            std::map<pid_t, std::shared_ptr<const ProcessApplication>> _applications;
            while (const dirent *_entry = ::readdir(_directory))
            {
                pid_t _processId{0};
                if (!TryParseProcessId(_entry->d_name, _processId))
                {
                    continue;
                }

                auto _application{
                    ProcessApplication::FromProcess(_processId, mOptions.ProcRoot)};
                if (_application.HasValue() &&
                    (_application.Value()->IsBundled() || !mOptions.BundledOnly))
                {
                    _applications[_processId] = _application.Value();
                }
            }
            ::closedir(_directory);

            std::lock_guard<std::mutex> _lock(mMutex);
            mApplications = std::move(_applications);

            return mApplications.size();
        }

        std::vector<Notification> ProcConnectorSource::HandleExec(pid_t processId)
        {
            std::vector<Notification> _result;
            std::shared_ptr<const ProcessApplication> _replaced;

            auto _application{
                ProcessApplication::FromProcess(processId, mOptions.ProcRoot)};
            const bool cReported{
                _application.HasValue() &&
                (_application.Value()->IsBundled() || !mOptions.BundledOnly)};

            {
                std::lock_guard<std::mutex> _lock(mMutex);
                auto _itr{mApplications.find(processId)};
                if (_itr != mApplications.end())
                {
                    _replaced = std::move(_itr->second);
                    mApplications.erase(_itr);
                }

                if (cReported)
                {
                    mApplications[processId] = _application.Value();
                }
            }

            // The tracked image ends when the process execs into another one.
            if (_replaced)
            {
                Notification _termination;
                _termination.Name = cDidTerminateApplicationNotification;
                _termination.Application = std::move(_replaced);
                _result.push_back(std::move(_termination));
            }

            if (!_application.HasValue())
            {
                // The process may be gone already.
                mLoggingFramework.Log(
                    mLogger,
                    log::LogLevel::kVerbose,
                    log::LogStream()
                        << "Skipped exec of pid " << static_cast<std::int32_t>(processId)
                        << ": " << _application.Error());
                return _result;
            }

            if (cReported)
            {
                Notification _launch;
                _launch.Name = cDidLaunchApplicationNotification;
                _launch.Application = _application.Value();
                _result.push_back(std::move(_launch));
            }

            return _result;
        }

        core::Optional<Notification> ProcConnectorSource::HandleExit(pid_t processId)
        {
            std::shared_ptr<const ProcessApplication> _handle;
            bool _known{false};

            {
                std::lock_guard<std::mutex> _lock(mMutex);
                auto _itr{mApplications.find(processId)};
                if (_itr != mApplications.end())
                {
                    _handle = std::move(_itr->second);
                    mApplications.erase(_itr);
                    _known = true;
                }
            }

            if (!_known && mOptions.BundledOnly)
            {
                return core::Optional<Notification>{};
            }

            Notification _notification;
            _notification.Name = cDidTerminateApplicationNotification;
            _notification.Application = std::move(_handle);

            return core::Optional<Notification>{std::move(_notification)};
        }

        void ProcConnectorSource::readLoop()
        {
            std::uint8_t _buffer[cReceiveBufferSize]
                __attribute__((aligned(NLMSG_ALIGNTO)));

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
                        log::LogStream() << "Polling the netlink connector failed");
                    break;
                }

                if (cReady == 0 || (_pollFd.revents & POLLIN) == 0)
                {
                    continue;
                }

                const ssize_t cReceived{
                    ::recv(mSocket, _buffer, sizeof(_buffer), MSG_DONTWAIT)};
                if (cReceived <= 0)
                {
                    if (cReceived < 0 && errno == ENOBUFS)
                    {
                        mLoggingFramework.Log(
                            mLogger,
                            log::LogLevel::kWarn,
                            log::LogStream() << "Process events were lost due to overrun");
                    }
                    continue;
                }

                int _remaining{static_cast<int>(cReceived)};
                for (auto *_header = reinterpret_cast<nlmsghdr *>(_buffer);
                     NLMSG_OK(_header, _remaining);
                     _header = NLMSG_NEXT(_header, _remaining))
                {
                    if (_header->nlmsg_type == NLMSG_NOOP ||
                        _header->nlmsg_type == NLMSG_ERROR)
                    {
                        continue;
                    }

                    const auto *cMessage{
                        reinterpret_cast<const cn_msg *>(NLMSG_DATA(_header))};
                    if (cMessage->id.idx != CN_IDX_PROC ||
                        cMessage->id.val != CN_VAL_PROC)
                    {
                        continue;
                    }

                    const auto *cEvent{
                        reinterpret_cast<const proc_event *>(cMessage->data)};
                    std::vector<Notification> _notifications;
                    switch (cEvent->what)
                    {
                    case proc_event::PROC_EVENT_EXEC:
                        _notifications =
                            HandleExec(static_cast<pid_t>(cEvent->event_data.exec.process_tgid));
                        break;
                    case proc_event::PROC_EVENT_EXIT:
                        // Thread exits are not application terminations.
                        if (cEvent->event_data.exit.process_pid ==
                            cEvent->event_data.exit.process_tgid)
                        {
                            auto _exit{
                                HandleExit(static_cast<pid_t>(cEvent->event_data.exit.process_tgid))};
                            if (_exit.HasValue())
                            {
                                _notifications.push_back(std::move(_exit.Value()));
                            }
                        }
                        break;
                    default:
                        break;
                    }

                    for (auto &_notification : _notifications)
                    {
                        mHandler(std::move(_notification));
                    }
                }
            }
        }

        void ProcConnectorSource::closeSocket() noexcept
        {
            if (mSocket >= 0)
            {
                ::close(mSocket);
                mSocket = -1;
            }
        }

        void ProcConnectorSource::Stop() noexcept
        {
            const bool cWasRunning{mRunning.exchange(false)};
            if (mReaderThread.joinable())
            {
                mReaderThread.join();
            }

            if (cWasRunning && mSocket >= 0)
            {
                // Best effort; the kernel drops the subscription with the socket anyway.
                static_cast<void>(setListening(false));
            }

            closeSocket();
        }

        bool ProcConnectorSource::IsRunning() const noexcept
        {
            return mRunning.load();
        }

        std::string ProcConnectorSource::GetDescription() const
        {
            return "process connector on " + mOptions.ProcRoot;
        }

        std::size_t ProcConnectorSource::GetTrackedCount() const
        {
            std::lock_guard<std::mutex> _lock(mMutex);
            return mApplications.size();
        }
    }
}
