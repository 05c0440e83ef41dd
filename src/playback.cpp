/*
* @license
* (C) zachbabanov
*
*/

#include <playback.hpp>

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

namespace iptv::playback {

    PlaybackTarget::PlaybackTarget(std::string url, std::string title, MediaKind kind)
            : url_(std::move(url)), title_(std::move(title)), kind_(kind) {}

    PlaybackTarget PlaybackTarget::for_stream(const std::string &base_url, const std::string &username,
                                              const std::string &password, uint32_t stream_id,
                                              MediaKind kind, const std::string &extension,
                                              const std::string &title) {
        std::string base = base_url;
        while (!base.empty() && base.back() == '/') base.pop_back();

        const char *section = "live";
        switch (kind) {
            case MediaKind::Movie:   section = "movie"; break;
            case MediaKind::Episode: section = "series"; break;
            case MediaKind::Live:
            case MediaKind::Unknown: section = "live"; break;
        }
        const std::string ext = extension.empty() ? "m3u8" : extension;
        return PlaybackTarget(fmt::format("{}/{}/{}/{}/{}.{}", base, section, username, password, stream_id, ext),
                              title, kind);
    }

    const char *to_string(MediaKind kind) {
        switch (kind) {
            case MediaKind::Live:    return "live";
            case MediaKind::Movie:   return "movie";
            case MediaKind::Episode: return "episode";
            case MediaKind::Unknown: break;
        }
        return "unknown";
    }

    const char *to_string(PlaybackMode mode) {
        switch (mode) {
            case PlaybackMode::Background:    return "background";
            case PlaybackMode::Terminal:      return "terminal";
            case PlaybackMode::Detached:      return "detached";
            case PlaybackMode::Disassociated: return "disassociated";
        }
        return "?";
    }

    const char *to_string(Ownership ownership) {
        return ownership == Ownership::Owned ? "owned" : "discovered";
    }

    const char *to_string(RequestKind kind) {
        switch (kind) {
            case RequestKind::LoadFile:    return "LoadFile";
            case RequestKind::Stop:        return "Stop";
            case RequestKind::QueryStatus: return "QueryStatus";
        }
        return "?";
    }

    const char *to_string(PlaybackOutcome outcome) {
        switch (outcome) {
            case PlaybackOutcome::Spawned:  return "spawned";
            case PlaybackOutcome::Reused:   return "reused";
            case PlaybackOutcome::Launched: return "launched";
            case PlaybackOutcome::Finished: return "finished";
        }
        return "?";
    }

    const char *to_string(StatusKind kind) {
        switch (kind) {
            case StatusKind::Idle:    return "idle";
            case StatusKind::Playing: return "playing";
            case StatusKind::Unknown: return "unknown";
        }
        return "?";
    }

    static std::string lowered(const std::string &s) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return v;
    }

    bool parse_mode(const std::string &s, PlaybackMode &out) {
        std::string v = lowered(s);
        if (v == "background" || v == "bg") { out = PlaybackMode::Background; return true; }
        if (v == "terminal" || v == "fg") { out = PlaybackMode::Terminal; return true; }
        if (v == "detached") { out = PlaybackMode::Detached; return true; }
        if (v == "disassociated") { out = PlaybackMode::Disassociated; return true; }
        return false;
    }

    bool parse_kind(const std::string &s, MediaKind &out) {
        std::string v = lowered(s);
        if (v == "live") { out = MediaKind::Live; return true; }
        if (v == "movie" || v == "vod") { out = MediaKind::Movie; return true; }
        if (v == "episode" || v == "series") { out = MediaKind::Episode; return true; }
        return false;
    }

} // namespace iptv::playback
