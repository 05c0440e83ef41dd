#include "common.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace iptv {
    namespace common {

        using namespace iptv::log;

        void closeFd(int fd) {
            if (fd >= 0) {
                close(fd);
                LOG_IPC_TRACE("fd closed: {}", fd);
            }
        }

        bool fileExists(const std::string &path) {
            struct stat st;
            return stat(path.c_str(), &st) == 0;
        }

        std::string joinPath(const std::string &dir, const std::string &name) {
            if (dir.empty()) return name;
            if (dir.back() == '/') return dir + name;
            return dir + "/" + name;
        }

        static bool ensureDirectory(const std::string &path) {
            // create each missing component; only the leaf gets 0700
            for (size_t pos = 1; pos != std::string::npos; ) {
                pos = path.find('/', pos);
                std::string part = path.substr(0, pos);
                if (!part.empty() && mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
                    LOG_GEN_WARN("Failed to create directory '{}': {}", part, strerror(errno));
                    return false;
                }
                if (pos != std::string::npos) ++pos;
            }
            if (chmod(path.c_str(), 0700) != 0) {
                LOG_GEN_WARN("Failed to set permissions on '{}': {}", path, strerror(errno));
            }
            return true;
        }

        std::string stateDirectory() {
            std::string base;
            const char *xdg = std::getenv("XDG_STATE_HOME");
            if (xdg && xdg[0] != '\0') {
                base = xdg;
            } else {
                const char *home = std::getenv("HOME");
                if (!home || home[0] == '\0') return "";
                base = joinPath(joinPath(home, ".local"), "state");
            }
            std::string dir = joinPath(base, STATE_SUBDIR);
            if (!fileExists(dir) && !ensureDirectory(dir)) return "";
            return dir;
        }

        std::string tempEndpointPath() {
            const char *tmp = std::getenv("TMPDIR");
            std::string dir = (tmp && tmp[0] != '\0') ? tmp : "/tmp";
            return joinPath(dir, "iptv-mpv-" + std::to_string(getuid()) + ".sock");
        }

        std::string exeDirectory(const char *argv0) {
            char buf[PATH_MAX];
            ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
            if (len > 0) {
                buf[len] = '\0';
                std::string p(buf);
                size_t pos = p.find_last_of('/');
                if (pos != std::string::npos) return p.substr(0, pos);
            }
            if (argv0) {
                std::string p(argv0);
                size_t pos = p.find_last_of('/');
                if (pos != std::string::npos) return p.substr(0, pos);
            }
            return ".";
        }

        LineReader::LineReader(int fd) : fd_(fd), eof_(false) {}

        bool LineReader::fill() {
            if (eof_) return false;
            char chunk[READ_CHUNK];
            ssize_t n = read(fd_, chunk, sizeof(chunk));
            if (n > 0) {
                buf_.append(chunk, static_cast<size_t>(n));
                return true;
            }
            if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) return true;
            if (n < 0) LOG_GEN_WARN("read failed: fd={} err={}", fd_, strerror(errno));
            eof_ = true;
            return false;
        }

        bool LineReader::next(std::string &line) {
            size_t nl = buf_.find('\n');
            if (nl == std::string::npos) {
                if (!eof_ || buf_.empty()) return false;
                nl = buf_.size();
            }
            line = buf_.substr(0, nl);
            buf_.erase(0, std::min(nl + 1, buf_.size()));
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }

    } // namespace common
} // namespace iptv
