/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_CHANNEL_HPP
#define IPTV_CHANNEL_HPP

#pragma once

#include <errors.hpp>
#include <playback.hpp>
#include <task.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace iptv::channel {

    enum class IoResult {
        Done,
        WouldBlock,
        Closed,
        Error
    };

/**
 * @brief Non-blocking byte stream to one player endpoint.
 */
    class Stream {
    public:
        virtual ~Stream() = default;

        virtual IoResult send_some(const char *buf, size_t len, size_t &sent) = 0;
        virtual IoResult recv_some(char *buf, size_t len, size_t &got) = 0;

        /// Descriptor to wait on, or -1 when the stream has none.
        virtual int fd() const { return -1; }
    };

    enum class ConnectAttempt {
        Connected,
        Absent,            // endpoint does not exist (yet)
        Refused,           // endpoint exists, nobody listening: stale
        PermissionDenied,
        Failed
    };

/**
 * @brief Opens streams to filesystem-addressed endpoints. Never creates the endpoint.
 */
    class Connector {
    public:
        virtual ~Connector() = default;

        virtual ConnectAttempt try_connect(const std::string &address, std::unique_ptr<Stream> &out,
                                           std::string &why) = 0;

        /// Delete a stale endpoint left behind by a dead player.
        virtual void remove_endpoint(const std::string &address) = 0;
    };

/**
 * @brief AF_UNIX stream socket; the fd is closed on destruction.
 */
    class UnixStream : public Stream {
    public:
        explicit UnixStream(int fd);
        ~UnixStream() override;

        IoResult send_some(const char *buf, size_t len, size_t &sent) override;
        IoResult recv_some(char *buf, size_t len, size_t &got) override;
        int fd() const override { return fd_; }

    private:
        int fd_;

        UnixStream(const UnixStream&) = delete;
        UnixStream& operator=(const UnixStream&) = delete;
    };

    class UnixConnector : public Connector {
    public:
        ConnectAttempt try_connect(const std::string &address, std::unique_ptr<Stream> &out,
                                   std::string &why) override;
        void remove_endpoint(const std::string &address) override;
    };

/**
 * @brief A connected control channel: stream plus framing state.
 *
 * Requests on one Channel are strictly sequential; each logical operation opens its own
 * Channel so probes never steal replies from an in-flight request.
 */
    class Channel {
    public:
        Channel(std::unique_ptr<Stream> stream, std::string address);

        Stream &stream() { return *stream_; }
        const std::string &address() const { return address_; }
        std::string &inbox() { return inbox_; }
        uint64_t next_request_id() { return ++last_request_id_; }

    private:
        std::unique_ptr<Stream> stream_;
        std::string address_;
        std::string inbox_;      // bytes received but not yet consumed as a line
        uint64_t last_request_id_;
    };

/**
 * @brief connect(address, timeout): retry until the endpoint accepts or the deadline passes.
 *
 * The player creates its endpoint some time after spawn, so absent/refused endpoints are
 * retried every poll_interval. The first attempt happens on the first poll; the last one at
 * the deadline. timeout == 0 means a single attempt.
 */
    class ConnectTask : public task::Task {
    public:
        ConnectTask(task::Clock &clock, Connector &connector, std::string address,
                    std::chrono::milliseconds timeout, std::chrono::milliseconds poll_interval);

        const char *name() const override { return "connect"; }

        ConnectError error() const { return error_; }
        const std::string &detail() const { return detail_; }
        int attempts() const { return attempts_; }
        /// Outcome of the last attempt (Refused means a stale endpoint file exists).
        ConnectAttempt last_attempt() const { return last_; }

        std::unique_ptr<Channel> take_channel() { return std::move(channel_); }

    protected:
        task::Poll step() override;

    private:
        Connector &connector_;
        std::string address_;
        std::chrono::milliseconds timeout_;
        std::chrono::milliseconds poll_interval_;

        bool started_;
        task::TimePoint deadline_;
        task::TimePoint next_attempt_;
        int attempts_;
        ConnectAttempt last_;
        ConnectError error_;
        std::string detail_;
        std::unique_ptr<Channel> channel_;
    };

/**
 * @brief send(channel, request, timeout): write one framed request and await its reply.
 *
 * The per-call timeout covers both the write and the read. Events and replies to other
 * request ids are skipped.
 */
    class RequestTask : public task::Task {
    public:
        RequestTask(task::Clock &clock, Channel &channel, playback::ControlRequest request,
                    std::chrono::milliseconds timeout);

        const char *name() const override { return "request"; }

        ChannelError error() const { return error_; }
        const std::string &detail() const { return detail_; }
        const playback::ControlResponse &response() const { return response_; }

    protected:
        task::Poll step() override;

    private:
        task::Poll fail(ChannelError e, std::string why);

        Channel &channel_;
        playback::ControlRequest request_;
        std::chrono::milliseconds timeout_;

        bool started_;
        task::TimePoint deadline_;
        uint64_t request_id_;
        std::string outgoing_;
        size_t sent_;
        ChannelError error_;
        std::string detail_;
        playback::ControlResponse response_;
    };

} // namespace iptv::channel

#endif // IPTV_CHANNEL_HPP
