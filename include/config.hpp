/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_CONFIG_HPP
#define IPTV_CONFIG_HPP

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace iptv::config {

/**
 * @brief Read-only inputs of the playback core.
 *
 * All durations are in milliseconds. Defaults are applied by the constructor; load_config()
 * only overrides the keys it finds.
 *
 * JSON keys: "player" (binary), "player_args" (array), "endpoint_dir", "endpoint_name",
 * "poll_interval_ms", "connect_timeout_ms", "request_timeout_ms", "spawn_confirm_ms",
 * "probe_timeout_ms", "stop_terminates", "window_title", "window_geometry",
 * "log_file", "log_level".
 */
    struct PlayerConfig {
        std::string binary;                   // resolved through PATH by execvp
        std::vector<std::string> extra_args;  // appended to every spawn
        std::string endpoint_dir;             // empty -> per-user state directory
        std::string endpoint_name;
        std::string window_title;
        std::string window_geometry;

        int poll_interval_ms;
        int connect_timeout_ms;
        int request_timeout_ms;
        int spawn_confirm_ms;
        int probe_timeout_ms;

        bool stop_terminates;                 // Stop also ends the player process

        // front-end settings carried in the same file
        std::string log_file;
        std::string log_level;

        PlayerConfig();

        /// Full path of the Background control endpoint
        std::string endpoint_path() const;

        std::chrono::milliseconds poll_interval() const { return std::chrono::milliseconds(poll_interval_ms); }
        std::chrono::milliseconds connect_timeout() const { return std::chrono::milliseconds(connect_timeout_ms); }
        std::chrono::milliseconds request_timeout() const { return std::chrono::milliseconds(request_timeout_ms); }
        std::chrono::milliseconds spawn_confirm() const { return std::chrono::milliseconds(spawn_confirm_ms); }
        std::chrono::milliseconds probe_timeout() const { return std::chrono::milliseconds(probe_timeout_ms); }
    };

    /**
     * @brief Overlay values from a JSON file onto cfg.
     * @return false (with error filled) when the file is unreadable or malformed; cfg is left unchanged.
     */
    bool load_config(const std::string &path, PlayerConfig &cfg, std::string &error);

    /// Same as load_config but from an in-memory JSON document.
    bool parse_config(const std::string &json_text, PlayerConfig &cfg, std::string &error);

} // namespace iptv::config

#endif // IPTV_CONFIG_HPP
