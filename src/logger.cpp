#include "logger.hpp"
#include <fmt/chrono.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>

#include <unistd.h>

namespace iptv::log {

    namespace {

        // "2024-05-01 12:00:00.123"
        std::string local_timestamp() {
            using namespace std::chrono;
            const auto now = system_clock::now();
            const std::time_t secs = system_clock::to_time_t(now);
            std::tm tm{};
            localtime_r(&secs, &tm);
            const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
            return fmt::format("{:%Y-%m-%d %H:%M:%S}.{:03}", tm, static_cast<int>(ms));
        }

        const char *basename_of(const char *path) {
            const char *slash = std::strrchr(path, '/');
            return slash ? slash + 1 : path;
        }

    } // namespace

    const char *to_string(Level lvl) {
        switch (lvl) {
            case Level::TRACE: return "trace";
            case Level::DEBUG: return "debug";
            case Level::INFO:  return "info";
            case Level::WARN:  return "warn";
            case Level::ERROR: return "error";
        }
        return "?";
    }

    const char *to_string(Category cat) {
        switch (cat) {
            case Category::GENERAL:  return "main";
            case Category::PROCESS:  return "proc";
            case Category::IPC:      return "ipc";
            case Category::REGISTRY: return "registry";
            case Category::PLAYER:   return "player";
        }
        return "?";
    }

    bool parse_level(const std::string &s, Level &out) {
        std::string v = s;
        std::transform(v.begin(), v.end(), v.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (v == "warning") v = "warn";
        if (v == "err") v = "error";
        for (Level l : {Level::TRACE, Level::DEBUG, Level::INFO, Level::WARN, Level::ERROR}) {
            if (v == to_string(l)) {
                out = l;
                return true;
            }
        }
        return false;
    }

    Logger &Logger::instance() {
        static Logger lg;
        return lg;
    }

    Logger::Logger() : min_level_(Level::INFO), console_(true), pid_(static_cast<int>(::getpid())) {}

    Logger::~Logger() {
        close_logfile();
    }

    void Logger::set_level(Level l) {
        min_level_.store(l);
    }

    void Logger::set_console(bool enabled) {
        console_.store(enabled);
    }

    bool Logger::open_logfile(const std::string &path) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
        file_.open(path, std::ios::out | std::ios::app);
        return file_.is_open();
    }

    void Logger::close_logfile() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (file_.is_open()) file_.close();
    }

    void Logger::write(Level lvl, Category cat, const std::string &msg, const char *file, int line) {
        if (!enabled(lvl)) return;

        std::string out = fmt::format("{} {:<5} [{}] {}", local_timestamp(), to_string(lvl), pid_, to_string(cat));
        if (file && lvl != Level::INFO) {
            out += fmt::format(" {}:{}", basename_of(file), line);
        }
        out += ": ";
        out += msg;
        out += '\n';

        std::lock_guard<std::mutex> lk(mtx_);
        if (console_.load()) {
            std::fwrite(out.data(), 1, out.size(), stderr);
        }
        if (file_.is_open()) {
            file_ << out;
            file_.flush();
        }
    }

} // namespace iptv::log
