/*
* @license
* (C) zachbabanov
*
*/

#include <errors.hpp>

#include <fmt/core.h>

namespace iptv {

    PlayError PlayError::from_spawn(SpawnError e, int exit_code, std::string message) {
        PlayError p;
        p.kind = PlayErrorKind::Spawn;
        p.spawn = e;
        p.exit_code = exit_code;
        p.message = std::move(message);
        return p;
    }

    PlayError PlayError::from_connect(ConnectError e, std::string message) {
        PlayError p;
        p.kind = PlayErrorKind::Connect;
        p.connect = e;
        p.message = std::move(message);
        return p;
    }

    PlayError PlayError::from_channel(ChannelError e, std::string message) {
        PlayError p;
        p.kind = PlayErrorKind::Channel;
        p.channel = e;
        p.message = std::move(message);
        return p;
    }

    PlayError PlayError::rejected(std::string message) {
        PlayError p;
        p.kind = PlayErrorKind::Rejected;
        p.message = std::move(message);
        return p;
    }

    PlayError PlayError::no_instance() {
        PlayError p;
        p.kind = PlayErrorKind::NoCurrentInstance;
        p.message = "no player instance";
        return p;
    }

    const char *to_string(SpawnError e) {
        switch (e) {
            case SpawnError::None:           return "none";
            case SpawnError::BinaryNotFound: return "binary not found";
            case SpawnError::ImmediateExit:  return "immediate exit";
            case SpawnError::IoFailure:      return "i/o failure";
        }
        return "?";
    }

    const char *to_string(ConnectError e) {
        switch (e) {
            case ConnectError::None:             return "none";
            case ConnectError::Timeout:          return "timeout";
            case ConnectError::PermissionDenied: return "permission denied";
            case ConnectError::IoFailure:        return "i/o failure";
        }
        return "?";
    }

    const char *to_string(ChannelError e) {
        switch (e) {
            case ChannelError::None:            return "none";
            case ChannelError::Timeout:         return "timeout";
            case ChannelError::Protocol:        return "protocol violation";
            case ChannelError::ConnectionReset: return "connection reset";
        }
        return "?";
    }

    std::string to_string(const PlayError &e) {
        switch (e.kind) {
            case PlayErrorKind::Spawn:
                if (e.spawn == SpawnError::ImmediateExit)
                    return fmt::format("spawn failed: {} (code {}): {}", to_string(e.spawn), e.exit_code, e.message);
                return fmt::format("spawn failed: {}: {}", to_string(e.spawn), e.message);
            case PlayErrorKind::Connect:
                return fmt::format("connect failed: {}: {}", to_string(e.connect), e.message);
            case PlayErrorKind::Channel:
                return fmt::format("control channel: {}: {}", to_string(e.channel), e.message);
            case PlayErrorKind::Rejected:
                return fmt::format("player rejected request: {}", e.message);
            case PlayErrorKind::NoCurrentInstance:
                return "no current player instance";
        }
        return e.message;
    }

} // namespace iptv
