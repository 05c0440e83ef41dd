/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_LOGGER_HPP
#define IPTV_LOGGER_HPP

#pragma once

#include <atomic>
#include <fstream>
#include <mutex>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace iptv::log {

/**
 * @brief Log level enumeration
 */
    enum class Level {
        TRACE = 0,
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

/**
 * @brief Subsystem a log line comes from.
 */
    enum class Category {
        GENERAL,
        PROCESS,   // spawning, reaping, signals
        IPC,       // control channel traffic
        REGISTRY,
        PLAYER     // facade operations
    };

    const char *to_string(Level lvl);
    const char *to_string(Category cat);

    /// Parse "trace|debug|info|warn|error"; returns false for anything else.
    bool parse_level(const std::string &s, Level &out);

/**
 * @brief Process-wide logger, fmt formatted.
 *
 * Lines go to stderr (stdout belongs to the command's own output) and, when opened, to an
 * append-only log file. Every line carries the pid, because separate CLI invocations share
 * one log file.
 *
 *   LOG_PLAYER_INFO("Loaded '{}' into player id={}", url, id);
 *
 * Interactive front-ends call set_console(false) so log lines do not interleave with
 * their prompt; the log file keeps receiving everything.
 */
    class Logger {
    public:
        static Logger &instance();

        void set_level(Level l);
        bool enabled(Level l) const { return l >= min_level_.load(); }

        /// Enable or disable the stderr sink
        void set_console(bool enabled);

        bool open_logfile(const std::string &path);
        void close_logfile();

        void write(Level lvl, Category cat, const std::string &msg, const char *file = nullptr, int line = 0);

        template<typename... Args>
        void logf(Level lvl, Category cat, const char *file, int line, fmt::format_string<Args...> fmt_str,
                  Args&&... args) {
            if (!enabled(lvl)) return;
            std::string msg;
            try {
                msg = fmt::format(fmt_str, std::forward<Args>(args)...);
            } catch (const fmt::format_error &e) {
                const fmt::string_view raw = fmt_str;
                msg = fmt::format("<bad log format: {}> {}", e.what(), raw);
            }
            write(lvl, cat, msg, file, line);
        }

    private:
        Logger();
        ~Logger();

        std::mutex mtx_;
        std::ofstream file_;
        std::atomic<Level> min_level_;
        std::atomic<bool> console_;
        int pid_;

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;
    };

} // namespace iptv::log

#define IPTV_LOG(lvl, cat, fmt, ...) \
    iptv::log::Logger::instance().logf(iptv::log::Level::lvl, iptv::log::Category::cat, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_GEN_TRACE(fmt, ...) IPTV_LOG(TRACE, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_DEBUG(fmt, ...) IPTV_LOG(DEBUG, GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_INFO(fmt, ...)  IPTV_LOG(INFO,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_WARN(fmt, ...)  IPTV_LOG(WARN,  GENERAL, fmt, ##__VA_ARGS__)
#define LOG_GEN_ERROR(fmt, ...) IPTV_LOG(ERROR, GENERAL, fmt, ##__VA_ARGS__)

#define LOG_PROC_TRACE(fmt, ...) IPTV_LOG(TRACE, PROCESS, fmt, ##__VA_ARGS__)
#define LOG_PROC_DEBUG(fmt, ...) IPTV_LOG(DEBUG, PROCESS, fmt, ##__VA_ARGS__)
#define LOG_PROC_INFO(fmt, ...)  IPTV_LOG(INFO,  PROCESS, fmt, ##__VA_ARGS__)
#define LOG_PROC_WARN(fmt, ...)  IPTV_LOG(WARN,  PROCESS, fmt, ##__VA_ARGS__)
#define LOG_PROC_ERROR(fmt, ...) IPTV_LOG(ERROR, PROCESS, fmt, ##__VA_ARGS__)

#define LOG_IPC_TRACE(fmt, ...) IPTV_LOG(TRACE, IPC, fmt, ##__VA_ARGS__)
#define LOG_IPC_DEBUG(fmt, ...) IPTV_LOG(DEBUG, IPC, fmt, ##__VA_ARGS__)
#define LOG_IPC_INFO(fmt, ...)  IPTV_LOG(INFO,  IPC, fmt, ##__VA_ARGS__)
#define LOG_IPC_WARN(fmt, ...)  IPTV_LOG(WARN,  IPC, fmt, ##__VA_ARGS__)
#define LOG_IPC_ERROR(fmt, ...) IPTV_LOG(ERROR, IPC, fmt, ##__VA_ARGS__)

#define LOG_REG_DEBUG(fmt, ...) IPTV_LOG(DEBUG, REGISTRY, fmt, ##__VA_ARGS__)
#define LOG_REG_INFO(fmt, ...)  IPTV_LOG(INFO,  REGISTRY, fmt, ##__VA_ARGS__)
#define LOG_REG_WARN(fmt, ...)  IPTV_LOG(WARN,  REGISTRY, fmt, ##__VA_ARGS__)

#define LOG_PLAYER_DEBUG(fmt, ...) IPTV_LOG(DEBUG, PLAYER, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_INFO(fmt, ...)  IPTV_LOG(INFO,  PLAYER, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_WARN(fmt, ...)  IPTV_LOG(WARN,  PLAYER, fmt, ##__VA_ARGS__)
#define LOG_PLAYER_ERROR(fmt, ...) IPTV_LOG(ERROR, PLAYER, fmt, ##__VA_ARGS__)

#endif // IPTV_LOGGER_HPP
