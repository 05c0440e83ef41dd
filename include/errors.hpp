/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_ERRORS_HPP
#define IPTV_ERRORS_HPP

#pragma once

#include <string>

namespace iptv {

    enum class SpawnError {
        None = 0,
        BinaryNotFound,
        ImmediateExit,  // exit code carried alongside
        IoFailure
    };

    enum class ConnectError {
        None = 0,
        Timeout,           // endpoint never became reachable before the deadline
        PermissionDenied,
        IoFailure
    };

    enum class ChannelError {
        None = 0,
        Timeout,
        Protocol,
        ConnectionReset
    };

    enum class PlayErrorKind {
        Spawn,
        Connect,
        Channel,
        Rejected,          // the player answered Error(message)
        NoCurrentInstance
    };

/**
 * @brief Failure of a facade operation. Exactly one of spawn/connect/channel is set, matching kind.
 */
    struct PlayError {
        PlayErrorKind kind;
        SpawnError spawn;
        ConnectError connect;
        ChannelError channel;
        int exit_code;
        std::string message;

        PlayError()
                : kind(PlayErrorKind::NoCurrentInstance), spawn(SpawnError::None),
                  connect(ConnectError::None), channel(ChannelError::None), exit_code(0) {}

        static PlayError from_spawn(SpawnError e, int exit_code, std::string message);
        static PlayError from_connect(ConnectError e, std::string message);
        static PlayError from_channel(ChannelError e, std::string message);
        static PlayError rejected(std::string message);
        static PlayError no_instance();
    };

    const char *to_string(SpawnError e);
    const char *to_string(ConnectError e);
    const char *to_string(ChannelError e);
    std::string to_string(const PlayError &e);

} // namespace iptv

#endif // IPTV_ERRORS_HPP
