/*
* @license
* (C) zachbabanov
*
*/

#include <channel.hpp>
#include <common.hpp>
#include <logger.hpp>
#include <translator.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace iptv::common;
using namespace iptv::log;
using namespace iptv::playback;
using iptv::task::Poll;

namespace iptv::channel {

    UnixStream::UnixStream(int fd) : fd_(fd) {}

    UnixStream::~UnixStream() {
        closeFd(fd_);
    }

    IoResult UnixStream::send_some(const char *buf, size_t len, size_t &sent) {
        sent = 0;
        ssize_t n = ::send(fd_, buf, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return IoResult::WouldBlock;
            if (errno == EPIPE || errno == ECONNRESET) return IoResult::Closed;
            LOG_IPC_WARN("send failed fd={} err={}", fd_, strerror(errno));
            return IoResult::Error;
        }
        sent = static_cast<size_t>(n);
        return IoResult::Done;
    }

    IoResult UnixStream::recv_some(char *buf, size_t len, size_t &got) {
        got = 0;
        ssize_t n = ::recv(fd_, buf, len, 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return IoResult::WouldBlock;
            if (errno == ECONNRESET) return IoResult::Closed;
            LOG_IPC_WARN("recv failed fd={} err={}", fd_, strerror(errno));
            return IoResult::Error;
        }
        if (n == 0) return IoResult::Closed;
        got = static_cast<size_t>(n);
        return IoResult::Done;
    }

    ConnectAttempt UnixConnector::try_connect(const std::string &address, std::unique_ptr<Stream> &out,
                                              std::string &why) {
        sockaddr_un addr{};
        if (address.empty() || address.size() >= sizeof(addr.sun_path)) {
            why = "endpoint path empty or too long";
            return ConnectAttempt::Failed;
        }
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, address.c_str(), sizeof(addr.sun_path) - 1);

        int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
        if (fd < 0) {
            why = std::string("socket(AF_UNIX) failed: ") + strerror(errno);
            return ConnectAttempt::Failed;
        }
        if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
            int e = errno;
            closeFd(fd);
            why = std::string("connect() failed: ") + strerror(e);
            switch (e) {
                case ENOENT:
                case ENOTDIR:
                    return ConnectAttempt::Absent;
                case ECONNREFUSED:
                    return ConnectAttempt::Refused;
                case EAGAIN:       // listen backlog full; player is alive but busy
                case EINPROGRESS:
                    return ConnectAttempt::Absent;
                case EACCES:
                case EPERM:
                    return ConnectAttempt::PermissionDenied;
                default:
                    return ConnectAttempt::Failed;
            }
        }
        LOG_IPC_DEBUG("Connected to control endpoint '{}' fd={}", address, fd);
        out.reset(new UnixStream(fd));
        return ConnectAttempt::Connected;
    }

    void UnixConnector::remove_endpoint(const std::string &address) {
        if (::unlink(address.c_str()) == 0) {
            LOG_IPC_INFO("Removed stale control endpoint '{}'", address);
        } else if (errno != ENOENT) {
            LOG_IPC_WARN("Failed to remove endpoint '{}': {}", address, strerror(errno));
        }
    }

    Channel::Channel(std::unique_ptr<Stream> stream, std::string address)
            : stream_(std::move(stream)), address_(std::move(address)), last_request_id_(0) {}

    ConnectTask::ConnectTask(task::Clock &clock, Connector &connector, std::string address,
                             std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval)
            : Task(clock),
              connector_(connector),
              address_(std::move(address)),
              timeout_(timeout),
              poll_interval_(poll_interval),
              started_(false),
              attempts_(0),
              last_(ConnectAttempt::Absent),
              error_(ConnectError::None) {}

    Poll ConnectTask::step() {
        const task::TimePoint t = now();
        if (!started_) {
            started_ = true;
            deadline_ = t + timeout_;
            next_attempt_ = t;
        }
        if (t < next_attempt_) {
            sleep_until(next_attempt_);
            return Poll::Pending;
        }

        ++attempts_;
        std::unique_ptr<Stream> stream;
        last_ = connector_.try_connect(address_, stream, detail_);
        switch (last_) {
            case ConnectAttempt::Connected:
                LOG_IPC_DEBUG("Control endpoint '{}' reachable after {} attempt(s)", address_, attempts_);
                channel_.reset(new Channel(std::move(stream), address_));
                return Poll::Ready;
            case ConnectAttempt::PermissionDenied:
                LOG_IPC_WARN("Control endpoint '{}': {}", address_, detail_);
                error_ = ConnectError::PermissionDenied;
                return Poll::Ready;
            case ConnectAttempt::Failed:
                LOG_IPC_WARN("Control endpoint '{}': {}", address_, detail_);
                error_ = ConnectError::IoFailure;
                return Poll::Ready;
            case ConnectAttempt::Absent:
            case ConnectAttempt::Refused:
                break;
        }

        if (t >= deadline_) {
            LOG_IPC_DEBUG("Control endpoint '{}' not reachable after {} attempt(s): {}", address_, attempts_, detail_);
            error_ = ConnectError::Timeout;
            return Poll::Ready;
        }
        next_attempt_ = std::min(t + poll_interval_, deadline_);
        LOG_IPC_TRACE("Control endpoint '{}' not ready (attempt {}), retrying", address_, attempts_);
        sleep_until(next_attempt_);
        return Poll::Pending;
    }

    RequestTask::RequestTask(task::Clock &clock, Channel &channel, ControlRequest request,
                             std::chrono::milliseconds timeout)
            : Task(clock),
              channel_(channel),
              request_(std::move(request)),
              timeout_(timeout),
              started_(false),
              request_id_(0),
              sent_(0),
              error_(ChannelError::None) {}

    Poll RequestTask::fail(ChannelError e, std::string why) {
        error_ = e;
        detail_ = std::move(why);
        LOG_IPC_WARN("{} request {} on '{}' failed: {} ({})", playback::to_string(request_.kind), request_id_,
                     channel_.address(), to_string(e), detail_);
        return Poll::Ready;
    }

    Poll RequestTask::step() {
        if (!started_) {
            started_ = true;
            deadline_ = now() + timeout_;
            request_id_ = channel_.next_request_id();
            outgoing_ = protocol::encode_request(request_, request_id_);
            LOG_IPC_DEBUG("-> {}", outgoing_.substr(0, outgoing_.size() - 1));
        }

        Stream &stream = channel_.stream();

        while (sent_ < outgoing_.size()) {
            size_t n = 0;
            switch (stream.send_some(outgoing_.data() + sent_, outgoing_.size() - sent_, n)) {
                case IoResult::Done:
                    sent_ += n;
                    break;
                case IoResult::WouldBlock:
                    if (now() >= deadline_) return fail(ChannelError::Timeout, "write timed out");
                    wait_on(stream.fd(), POLLOUT);
                    sleep_until(deadline_);
                    return Poll::Pending;
                case IoResult::Closed:
                case IoResult::Error:
                    return fail(ChannelError::ConnectionReset, "peer closed while sending");
            }
        }

        std::string &inbox = channel_.inbox();
        char buf[READ_CHUNK];
        for (;;) {
            size_t nl;
            while ((nl = inbox.find('\n')) != std::string::npos) {
                std::string line = inbox.substr(0, nl);
                inbox.erase(0, nl + 1);
                if (line.empty()) continue;

                std::string why;
                switch (protocol::decode_response(line, request_.kind, request_id_, response_, why)) {
                    case protocol::Decoded::Response:
                        LOG_IPC_DEBUG("<- {}", line);
                        return Poll::Ready;
                    case protocol::Decoded::Skip:
                        LOG_IPC_TRACE("<- (skipped) {}", line);
                        continue;
                    case protocol::Decoded::Invalid:
                        return fail(ChannelError::Protocol, why);
                }
            }
            if (inbox.size() > MAX_RESPONSE_LINE) {
                return fail(ChannelError::Protocol, "reply line exceeds limit");
            }

            size_t got = 0;
            switch (stream.recv_some(buf, sizeof(buf), got)) {
                case IoResult::Done:
                    inbox.append(buf, got);
                    break;
                case IoResult::WouldBlock:
                    if (now() >= deadline_) return fail(ChannelError::Timeout, "no reply before deadline");
                    wait_on(stream.fd(), POLLIN);
                    sleep_until(deadline_);
                    return Poll::Pending;
                case IoResult::Closed:
                case IoResult::Error:
                    return fail(ChannelError::ConnectionReset, "peer closed before replying");
            }
        }
    }

} // namespace iptv::channel
