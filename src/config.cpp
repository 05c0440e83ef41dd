/*
* @license
* (C) zachbabanov
*
*/

#include <config.hpp>
#include <common.hpp>
#include <logger.hpp>

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace iptv::config {

    PlayerConfig::PlayerConfig()
            : binary(common::DEFAULT_PLAYER_BINARY),
              endpoint_name(common::DEFAULT_ENDPOINT_NAME),
              window_title("IPTV Player"),
              window_geometry("1280x720"),
              poll_interval_ms(100),
              connect_timeout_ms(10000),
              request_timeout_ms(2000),
              spawn_confirm_ms(300),
              probe_timeout_ms(500),
              stop_terminates(false) {}

    std::string PlayerConfig::endpoint_path() const {
        std::string dir = endpoint_dir.empty() ? common::stateDirectory() : endpoint_dir;
        if (dir.empty()) return common::tempEndpointPath();
        return common::joinPath(dir, endpoint_name);
    }

    // Timeouts must stay positive; a zero poll interval would spin the scheduler.
    static void read_duration(const json &j, const char *key, int &out) {
        if (!j.contains(key)) return;
        int v = j[key].get<int>();
        if (v <= 0) {
            LOG_GEN_WARN("Config key '{}' must be positive (got {}), keeping {}", key, v, out);
            return;
        }
        out = v;
    }

    bool parse_config(const std::string &json_text, PlayerConfig &cfg, std::string &error) {
        PlayerConfig next = cfg;
        try {
            json j = json::parse(json_text);
            if (!j.is_object()) {
                error = "top-level value is not an object";
                return false;
            }
            if (j.contains("player")) next.binary = j["player"].get<std::string>();
            if (j.contains("player_args")) next.extra_args = j["player_args"].get<std::vector<std::string>>();
            if (j.contains("endpoint_dir")) next.endpoint_dir = j["endpoint_dir"].get<std::string>();
            if (j.contains("endpoint_name")) next.endpoint_name = j["endpoint_name"].get<std::string>();
            if (j.contains("window_title")) next.window_title = j["window_title"].get<std::string>();
            if (j.contains("window_geometry")) next.window_geometry = j["window_geometry"].get<std::string>();
            read_duration(j, "poll_interval_ms", next.poll_interval_ms);
            read_duration(j, "connect_timeout_ms", next.connect_timeout_ms);
            read_duration(j, "request_timeout_ms", next.request_timeout_ms);
            read_duration(j, "spawn_confirm_ms", next.spawn_confirm_ms);
            read_duration(j, "probe_timeout_ms", next.probe_timeout_ms);
            if (j.contains("stop_terminates")) next.stop_terminates = j["stop_terminates"].get<bool>();
            if (j.contains("log_file")) next.log_file = j["log_file"].get<std::string>();
            if (j.contains("log_level")) next.log_level = j["log_level"].get<std::string>();
        } catch (const json::exception &e) {
            error = e.what();
            return false;
        }
        if (next.binary.empty()) {
            error = "player binary must not be empty";
            return false;
        }
        cfg = std::move(next);
        return true;
    }

    bool load_config(const std::string &path, PlayerConfig &cfg, std::string &error) {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "cannot open '" + path + "'";
            return false;
        }
        std::stringstream ss;
        ss << ifs.rdbuf();
        if (!parse_config(ss.str(), cfg, error)) {
            error = "'" + path + "': " + error;
            return false;
        }
        LOG_GEN_INFO("Loaded player config from '{}'", path);
        return true;
    }

} // namespace iptv::config
