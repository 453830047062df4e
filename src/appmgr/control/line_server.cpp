/**
 * @file line_server.cpp
 * @brief fd-level line reader for the control channel.
 */
#include "appmgr/control/line_server.hpp"

#include <cerrno>
#include <poll.h>
#include <thread>
#include <unistd.h>

namespace appmgr::control {

std::optional<std::string> LineBuffer::next_line() {
    const auto nl = buf_.find('\n');
    if (nl == std::string::npos) return std::nullopt;
    std::string line = buf_.substr(0, nl);
    buf_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') line.pop_back();
    return line;
}

std::optional<std::string> LineBuffer::finish() {
    if (buf_.empty()) return std::nullopt;
    std::string rest;
    rest.swap(buf_);
    if (rest.back() == '\r') rest.pop_back();
    return rest;
}

const char* to_string(ServeExit e) noexcept {
    switch (e) {
        case ServeExit::Quit:      return "quit";
        case ServeExit::Eof:       return "eof";
        case ServeExit::Stopped:   return "stopped";
        case ServeExit::ReadError: return "read_error";
    }
    return "unknown";
}

ServeExit serve(int fd,
                ControlChannel& channel,
                const std::function<void(const std::string&)>& reply,
                const std::atomic<bool>& stop,
                ServeOptions opts) {
    // true when the line asks the server to quit
    auto dispatch = [&](const std::string& line) {
        if (line.empty()) return false;
        if (line == "quit" || line == "exit") return true;
        reply(format_response(channel.handle_line(line)));
        return false;
    };

    LineBuffer lines;
    bool open = true;
    char chunk[4096];

    while (!stop.load(std::memory_order_acquire)) {
        if (!open) {
            if (opts.exit_on_eof) return ServeExit::Eof;
            std::this_thread::sleep_for(opts.poll_interval);
            continue;
        }

        pollfd pfd{fd, POLLIN, 0};
        const int n = ::poll(&pfd, 1, static_cast<int>(opts.poll_interval.count()));
        if (n < 0) {
            if (errno == EINTR) continue;
            return ServeExit::ReadError;
        }
        if (n == 0) continue;

        const ssize_t got = ::read(fd, chunk, sizeof(chunk));
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return ServeExit::ReadError;
        }
        if (got == 0) {
            open = false;
            if (auto last = lines.finish(); last && dispatch(*last)) return ServeExit::Quit;
            continue;
        }

        lines.append(std::string_view(chunk, static_cast<std::size_t>(got)));
        while (auto line = lines.next_line()) {
            if (dispatch(*line)) return ServeExit::Quit;
        }
    }
    return ServeExit::Stopped;
}

} // namespace appmgr::control
