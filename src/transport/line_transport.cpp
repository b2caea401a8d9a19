#include "pipemcp/transport/line_transport.hpp"
#include "pipemcp/protocol/json_rpc.hpp"
#include "pipemcp/log/logger.hpp"

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>

namespace pipemcp {

namespace {

constexpr std::size_t kReadChunk = 8192;
constexpr std::size_t kLogPreview = 100;
constexpr std::size_t kLogKeys = 5;

std::string_view trim(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n\f\v";
    const auto begin = s.find_first_not_of(kSpace);
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = s.find_last_not_of(kSpace);
    return s.substr(begin, end - begin + 1);
}

std::string preview(std::string_view line) {
    return std::string(line.substr(0, kLogPreview));
}

std::string first_keys(const Json& object) {
    std::string keys;
    std::size_t count = 0;
    for (const auto& item : object.items()) {
        if (count++ == kLogKeys) {
            keys += ", ...";
            break;
        }
        if (!keys.empty()) {
            keys += ", ";
        }
        keys += item.key();
    }
    return keys;
}

}  // namespace

std::optional<Json> parse_protocol_line(std::string_view raw) {
    const auto line = trim(raw);
    if (line.empty()) {
        return std::nullopt;
    }

    if (line.front() != '{') {
        PIPEMCP_LOG_DEBUG("Skipping non-JSON line: {}", preview(line));
        return std::nullopt;
    }

    Json parsed = Json::parse(line, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        PIPEMCP_LOG_DEBUG("Skipping unparseable line: {}", preview(line));
        return std::nullopt;
    }

    if (!is_protocol_message(parsed)) {
        PIPEMCP_LOG_DEBUG("Skipping JSON without '{}' (keys: {})", kJsonRpcMarker, first_keys(parsed));
        return std::nullopt;
    }

    return parsed;
}

LineTransport::LineTransport(int write_fd, int read_fd,
                             LivenessProbe is_alive,
                             LineTransportConfig config)
    : write_fd_(write_fd)
    , read_fd_(read_fd)
    , is_alive_(std::move(is_alive))
    , config_(config)
{}

TransportResult<void> LineTransport::send(const Json& message) {
    if (write_fd_ < 0) {
        return tl::unexpected(TransportError::closed("Transport has no stdin"));
    }

    // dump() without indentation never emits a raw newline
    std::string data = message.dump(-1, ' ', false, Json::error_handler_t::replace);
    data += '\n';

    const char* ptr = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        const ssize_t written = ::write(write_fd_, ptr, remaining);
        if (written == -1) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE) {
                return tl::unexpected(TransportError::closed("MCP server closed its stdin"));
            }
            return tl::unexpected(TransportError::network(
                "Failed to write to process: " + std::string(std::strerror(errno))));
        }
        ptr += written;
        remaining -= static_cast<std::size_t>(written);
    }

    PIPEMCP_LOG_TRACE("Sent: {}", preview(data));
    return {};
}

TransportResult<Json> LineTransport::receive(std::chrono::milliseconds timeout) {
    if (read_fd_ < 0) {
        return tl::unexpected(TransportError::closed("Transport has no stdout"));
    }

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, kReadChunk> chunk{};

    while (true) {
        while (auto line = take_line()) {
            if (auto message = parse_protocol_line(*line)) {
                return std::move(*message);
            }
        }

        if (eof_) {
            return tl::unexpected(TransportError::closed("MCP server closed stdout"));
        }

        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return tl::unexpected(TransportError::timeout(
                "No response within " + std::to_string(timeout.count()) + " ms"));
        }

        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        const auto wait = std::max(std::chrono::milliseconds(1), std::min(left, config_.poll_interval));

        struct pollfd pfd{};
        pfd.fd = read_fd_;
        pfd.events = POLLIN;
        const int ready = ::poll(&pfd, 1, static_cast<int>(wait.count()));

        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            return tl::unexpected(TransportError::network(
                "poll failed: " + std::string(std::strerror(errno))));
        }

        if (ready == 0) {
            if (is_alive_ && !is_alive_()) {
                return tl::unexpected(TransportError::process_exited(
                    "MCP server exited while waiting for a response", std::nullopt));
            }
            continue;
        }

        const ssize_t n = ::read(read_fd_, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return tl::unexpected(TransportError::network(
                "Failed to read from process: " + std::string(std::strerror(errno))));
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        append(chunk.data(), static_cast<std::size_t>(n));
    }
}

void LineTransport::append(const char* data, std::size_t size) {
    std::string_view incoming(data, size);

    if (discarding_) {
        const auto newline = incoming.find('\n');
        if (newline == std::string_view::npos) {
            return;
        }
        incoming.remove_prefix(newline + 1);
        discarding_ = false;
    }

    buffer_.append(incoming);

    // Only the unterminated tail can be oversized; complete lines are
    // consumed by take_line() before the next read.
    const auto last_newline = buffer_.rfind('\n');
    const std::size_t tail_start = (last_newline == std::string::npos) ? 0 : last_newline + 1;
    if (buffer_.size() - tail_start > config_.max_line_length) {
        PIPEMCP_LOG_WARN("Discarding stdout line longer than {} bytes", config_.max_line_length);
        buffer_.erase(tail_start);
        discarding_ = true;
    }
}

std::optional<std::string> LineTransport::take_line() {
    const auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
        if (eof_ && !buffer_.empty() && !discarding_) {
            std::string rest = std::move(buffer_);
            buffer_.clear();
            return rest;
        }
        return std::nullopt;
    }
    std::string line = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    return line;
}

}  // namespace pipemcp
