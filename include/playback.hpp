/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_PLAYBACK_HPP
#define IPTV_PLAYBACK_HPP

#pragma once

#include <cstdint>
#include <string>

#include <sys/types.h>

namespace iptv::playback {

    enum class MediaKind {
        Unknown,
        Live,
        Movie,
        Episode
    };

/**
 * @brief What to play. Immutable once constructed.
 */
    class PlaybackTarget {
    public:
        explicit PlaybackTarget(std::string url, std::string title = {}, MediaKind kind = MediaKind::Unknown);

        /**
         * @brief Build an Xtream-Codes stream locator:
         *        <base>/{live|movie|series}/<user>/<pass>/<id>.<ext>
         *
         * Trailing slashes on base are dropped; an empty extension defaults to "m3u8".
         */
        static PlaybackTarget for_stream(const std::string &base_url, const std::string &username,
                                         const std::string &password, uint32_t stream_id,
                                         MediaKind kind, const std::string &extension = {},
                                         const std::string &title = {});

        const std::string &url() const { return url_; }
        const std::string &title() const { return title_; }
        MediaKind kind() const { return kind_; }

        /// Title when present, URL otherwise
        const std::string &display_name() const { return title_.empty() ? url_ : title_; }

    private:
        std::string url_;
        std::string title_;
        MediaKind kind_;
    };

/**
 * @brief How a player process relates to us.
 *
 * Background    - our child, output discarded, driven over the control channel.
 * Terminal      - our child in the foreground; play() blocks until it exits.
 * Detached      - our child, confirmed started, then never looked at again.
 * Disassociated - own session, not our child; survives us unconditionally.
 */
    enum class PlaybackMode {
        Background,
        Terminal,
        Detached,
        Disassociated
    };

    enum class Ownership {
        Owned,
        Discovered
    };

/**
 * @brief A live external player. pid is -1 for discovered instances.
 */
    struct PlayerInstance {
        uint64_t id;
        pid_t pid;
        std::string channel_address;
        bool live;          // verified reachable by the operation registering it; never trusted later
        Ownership ownership;
        PlaybackMode mode;
        std::string now_playing;

        PlayerInstance()
                : id(0), pid(-1), live(false), ownership(Ownership::Owned), mode(PlaybackMode::Background) {}

        bool has_channel() const { return !channel_address.empty(); }
        bool has_process() const { return pid > 0; }
    };

    enum class RequestKind {
        LoadFile,
        Stop,
        QueryStatus
    };

    struct ControlRequest {
        RequestKind kind;
        std::string url; // LoadFile only

        static ControlRequest load_file(std::string url) { return ControlRequest{RequestKind::LoadFile, std::move(url)}; }
        static ControlRequest stop() { return ControlRequest{RequestKind::Stop, {}}; }
        static ControlRequest query_status() { return ControlRequest{RequestKind::QueryStatus, {}}; }
    };

    enum class ResponseKind {
        Ok,
        NowPlaying,
        Error
    };

/**
 * @brief Ok, Ok(NowPlaying(url)) or Error(message). payload holds the url or the message.
 */
    struct ControlResponse {
        ResponseKind kind;
        std::string payload;

        ControlResponse() : kind(ResponseKind::Ok) {}
        ControlResponse(ResponseKind k, std::string p) : kind(k), payload(std::move(p)) {}
        bool ok() const { return kind != ResponseKind::Error; }
    };

    enum class PlaybackOutcome {
        Spawned,   // new Background instance, stream loaded
        Reused,    // existing instance took the stream
        Launched,  // Detached / Disassociated process confirmed started
        Finished   // Terminal process ran to completion
    };

    enum class StatusKind {
        Idle,
        Playing,
        Unknown   // channel unreachable but process plausibly alive
    };

    struct PlaybackStatus {
        StatusKind kind;
        std::string url;

        PlaybackStatus() : kind(StatusKind::Idle) {}
        PlaybackStatus(StatusKind k, std::string u) : kind(k), url(std::move(u)) {}
    };

    const char *to_string(MediaKind kind);
    const char *to_string(PlaybackMode mode);
    const char *to_string(Ownership ownership);
    const char *to_string(RequestKind kind);
    const char *to_string(PlaybackOutcome outcome);
    const char *to_string(StatusKind kind);

    bool parse_mode(const std::string &s, PlaybackMode &out);
    bool parse_kind(const std::string &s, MediaKind &out);

} // namespace iptv::playback

#endif // IPTV_PLAYBACK_HPP
