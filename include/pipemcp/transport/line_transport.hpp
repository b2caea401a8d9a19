#pragma once

#include "pipemcp/transport.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace pipemcp {

// ═══════════════════════════════════════════════════════════════════════════
// LineTransport Configuration
// ═══════════════════════════════════════════════════════════════════════════

struct LineTransportConfig {
    /// Upper bound on one poll() wait; liveness and the deadline are
    /// re-checked at this interval
    std::chrono::milliseconds poll_interval{50};

    /// Longer lines are dropped up to their newline
    std::size_t max_line_length = 8 * 1024 * 1024;
};

// ═══════════════════════════════════════════════════════════════════════════
// LineTransport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited JSON over a pair of pipe descriptors. The child may print
// banners, logs or stray JSON on the same stream, so receive() scans forward
// and returns the first line that is a JSON object carrying "jsonrpc".
//
// Unread bytes and partial lines stay buffered between receive() calls.
// Not thread-safe: callers serialize exchanges. Descriptors are borrowed.

class LineTransport {
public:
    using LivenessProbe = std::function<bool()>;

    LineTransport(int write_fd, int read_fd,
                  LivenessProbe is_alive = {},
                  LineTransportConfig config = {});

    /// One JSON document followed by '\n'. A closed peer yields Closed.
    [[nodiscard]] TransportResult<void> send(const Json& message);

    /// Next protocol message, or Timeout / ProcessExited / Closed / Network
    [[nodiscard]] TransportResult<Json> receive(std::chrono::milliseconds timeout);

    [[nodiscard]] std::size_t buffered_bytes() const noexcept { return buffer_.size(); }

private:
    /// Next complete line from the buffer; at end of stream, the remainder
    std::optional<std::string> take_line();
    void append(const char* data, std::size_t size);

    int write_fd_;
    int read_fd_;
    LivenessProbe is_alive_;
    LineTransportConfig config_;

    std::string buffer_;
    bool discarding_ = false;
    bool eof_ = false;
};

/// Trims `line` and returns it parsed when it is a JSON object with the
/// "jsonrpc" marker. Rejected lines are logged at debug level.
[[nodiscard]] std::optional<Json> parse_protocol_line(std::string_view line);

}  // namespace pipemcp
