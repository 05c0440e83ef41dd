/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_TRANSLATOR_HPP
#define IPTV_TRANSLATOR_HPP

#pragma once

#include <config.hpp>
#include <playback.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace iptv::protocol {

/**
 * @brief Everything the process layer needs to start one player.
 *
 * endpoint is non-empty only for Background mode, where the stream is not on the command
 * line but delivered afterwards with LoadFile over the control channel.
 */
    struct SpawnCommand {
        std::string binary;
        std::vector<std::string> args;
        playback::PlaybackMode mode;
        std::string endpoint;
    };

    SpawnCommand build_spawn_command(const config::PlayerConfig &cfg,
                                     const playback::PlaybackTarget &target,
                                     playback::PlaybackMode mode,
                                     const std::vector<std::string> &extra_args = {});

    /// One newline-terminated mpv JSON IPC message.
    std::string encode_request(const playback::ControlRequest &req, uint64_t request_id);

    enum class Decoded {
        Response,   // `out` holds the answer to our request
        Skip,       // event or reply to someone else's request
        Invalid     // not a valid reply; protocol violation
    };

    /**
     * @brief Interpret one line received from the player.
     *
     * A QueryStatus answered with a path yields NowPlaying(path); "property unavailable"
     * means the player is idle and yields Ok.
     */
    Decoded decode_response(const std::string &line, playback::RequestKind kind, uint64_t request_id,
                            playback::ControlResponse &out, std::string &why);

    /// Logical status for a QueryStatus answer.
    playback::PlaybackStatus status_from_response(const playback::ControlResponse &resp);

} // namespace iptv::protocol

#endif // IPTV_TRANSLATOR_HPP
