/*
* @license
* (C) zachbabanov
*
*/

#include <translator.hpp>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

using namespace iptv::playback;

namespace iptv::protocol {

    SpawnCommand build_spawn_command(const config::PlayerConfig &cfg, const PlaybackTarget &target,
                                     PlaybackMode mode, const std::vector<std::string> &extra_args) {
        SpawnCommand cmd;
        cmd.binary = cfg.binary;
        cmd.mode = mode;

        std::string title = cfg.window_title;
        if (!target.title().empty()) title += " - " + target.title();

        switch (mode) {
            case PlaybackMode::Background:
                cmd.endpoint = cfg.endpoint_path();
                cmd.args = {
                        "--input-ipc-server=" + cmd.endpoint,
                        "--idle=yes",
                        "--force-window=yes",
                        "--keep-open=yes",
                        "--no-terminal",
                        "--really-quiet",
                        "--osc=yes",
                        "--title=" + cfg.window_title,
                };
                break;
            case PlaybackMode::Terminal:
            case PlaybackMode::Detached:
            case PlaybackMode::Disassociated:
                cmd.args = {
                        target.url(),
                        "--force-window=yes",
                        "--keep-open=yes",
                        "--title=" + title,
                };
                break;
        }
        if (!cfg.window_geometry.empty()) {
            cmd.args.push_back("--geometry=" + cfg.window_geometry);
            cmd.args.push_back("--autofit-larger=90%x90%");
        }
        cmd.args.insert(cmd.args.end(), cfg.extra_args.begin(), cfg.extra_args.end());
        cmd.args.insert(cmd.args.end(), extra_args.begin(), extra_args.end());
        return cmd;
    }

    std::string encode_request(const ControlRequest &req, uint64_t request_id) {
        json j;
        switch (req.kind) {
            case RequestKind::LoadFile:
                j["command"] = json::array({"loadfile", req.url, "replace"});
                break;
            case RequestKind::Stop:
                j["command"] = json::array({"stop"});
                break;
            case RequestKind::QueryStatus:
                j["command"] = json::array({"get_property", "path"});
                break;
        }
        j["request_id"] = request_id;
        return j.dump() + "\n";
    }

    Decoded decode_response(const std::string &line, RequestKind kind, uint64_t request_id,
                            ControlResponse &out, std::string &why) {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            why = "malformed reply: " + line;
            return Decoded::Invalid;
        }
        if (j.contains("event")) return Decoded::Skip;

        auto rid = j.find("request_id");
        if (rid != j.end()) {
            if (!rid->is_number_unsigned() && !rid->is_number_integer()) {
                why = "non-numeric request_id";
                return Decoded::Invalid;
            }
            if (rid->get<uint64_t>() != request_id) return Decoded::Skip;
        }

        auto err = j.find("error");
        if (err == j.end() || !err->is_string()) {
            why = "reply without error field: " + line;
            return Decoded::Invalid;
        }
        const std::string status = err->get<std::string>();

        if (status == "success") {
            auto data = j.find("data");
            if (kind == RequestKind::QueryStatus && data != j.end() && data->is_string()) {
                out = ControlResponse(ResponseKind::NowPlaying, data->get<std::string>());
            } else {
                out = ControlResponse(ResponseKind::Ok, {});
            }
            return Decoded::Response;
        }
        if (kind == RequestKind::QueryStatus && status == "property unavailable") {
            // nothing loaded
            out = ControlResponse(ResponseKind::Ok, {});
            return Decoded::Response;
        }
        out = ControlResponse(ResponseKind::Error, status);
        return Decoded::Response;
    }

    PlaybackStatus status_from_response(const ControlResponse &resp) {
        switch (resp.kind) {
            case ResponseKind::NowPlaying: return PlaybackStatus(StatusKind::Playing, resp.payload);
            case ResponseKind::Ok:         return PlaybackStatus(StatusKind::Idle, {});
            case ResponseKind::Error:      return PlaybackStatus(StatusKind::Unknown, {});
        }
        return PlaybackStatus(StatusKind::Unknown, {});
    }

} // namespace iptv::protocol
