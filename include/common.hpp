/*
* @license
* (C) zachbabanov
*
*/

#ifndef IPTV_COMMON_HPP
#define IPTV_COMMON_HPP

#pragma once

#include <cstddef>
#include <string>

namespace iptv {
    namespace common {

// Defaults shared by config and the control channel
        constexpr const char *DEFAULT_PLAYER_BINARY = "mpv";
        constexpr const char *DEFAULT_ENDPOINT_NAME = "mpv.sock";
        constexpr const char *STATE_SUBDIR = "iptv";
        constexpr size_t MAX_RESPONSE_LINE = 64 * 1024;   // longest accepted IPC line
        constexpr size_t READ_CHUNK = 4096;

//
// Utility functions
//
        void closeFd(int fd);

        bool fileExists(const std::string &path);

        /**
         * @brief Per-user runtime state directory for the control endpoint.
         *
         * $XDG_STATE_HOME/iptv, else $HOME/.local/state/iptv. The directory is created with
         * mode 0700 when missing. Returns an empty string when neither variable is usable or the
         * directory cannot be created; callers then fall back to tempEndpointPath().
         */
        std::string stateDirectory();

        /// $TMPDIR (or /tmp) based endpoint name unique per uid, e.g. /tmp/iptv-mpv-1000.sock
        std::string tempEndpointPath();

        /// Directory containing the running executable (falls back to argv0's dir, then ".")
        std::string exeDirectory(const char *argv0);

        /// Join two path fragments with exactly one '/'
        std::string joinPath(const std::string &dir, const std::string &name);

/**
 * @brief Splits a byte stream read from fd into '\n' terminated lines.
 *
 * fill() does a single read(2) and is meant to be called after poll() reported the fd readable,
 * so it never waits for the rest of a line. The unfinished tail stays buffered until its newline
 * arrives. At end of input a final unterminated line is still handed out.
 */
        class LineReader {
        public:
            explicit LineReader(int fd);

            /// Read what is available. Returns false once the input is closed or failed.
            bool fill();

            /// Pop the next complete line (without '\n' or a trailing '\r').
            bool next(std::string &line);

            bool eof() const { return eof_; }

            /// Bytes of an unfinished line waiting for more input
            size_t pending() const { return buf_.size(); }

        private:
            int fd_;
            std::string buf_;
            bool eof_;
        };

    } // namespace common
} // namespace iptv

#endif // IPTV_COMMON_HPP
