#pragma once
/**
 * @file line_server.hpp
 * @brief Serves control lines from a file descriptor.
 *
 * Input is read with ::read() into a buffer owned here; every complete line in
 * the buffer is answered before the descriptor is polled again, so commands
 * that arrive in one write are all answered without further input.
 */

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "appmgr/control/control_channel.hpp"

namespace appmgr::control {

/// Splits a byte stream into newline-terminated lines.
class LineBuffer {
public:
    void append(std::string_view chunk) { buf_.append(chunk); }

    /// Next complete line without its terminator ("\n" or "\r\n").
    std::optional<std::string> next_line();

    /// Trailing bytes with no terminator (stream ended). Empties the buffer.
    std::optional<std::string> finish();

    [[nodiscard]] std::size_t buffered() const noexcept { return buf_.size(); }

private:
    std::string buf_;
};

enum class ServeExit : std::uint8_t {
    Quit,      ///< "quit" or "exit" received
    Eof,       ///< Input closed and exit_on_eof set
    Stopped,   ///< Stop flag raised
    ReadError  ///< poll/read failed
};

const char* to_string(ServeExit e) noexcept;

struct ServeOptions {
    bool                      exit_on_eof{false};
    std::chrono::milliseconds poll_interval{200}; ///< Stop-flag check interval
};

/**
 * @brief Answer every command read from @p fd until quit, EOF, stop or error.
 * @param reply Receives one formatted line per non-empty command.
 */
ServeExit serve(int fd,
                ControlChannel& channel,
                const std::function<void(const std::string&)>& reply,
                const std::atomic<bool>& stop,
                ServeOptions opts = {});

} // namespace appmgr::control
