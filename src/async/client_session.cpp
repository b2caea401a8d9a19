#include "pipemcp/async/client_session.hpp"
#include "pipemcp/log/logger.hpp"

#include <asio/co_spawn.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/strand.hpp>
#include <asio/use_awaitable.hpp>

#include <atomic>
#include <memory>

namespace pipemcp {

namespace {

/// Shared by the worker job and the timeout timer; whichever finishes first
/// delivers the result.
struct ConnectAttempt {
    ConnectAttempt(asio::any_io_executor executor, ClientSession::ConnectHandler h)
        : strand(asio::make_strand(std::move(executor)))
        , timer(strand)
        , handler(std::move(h))
    {}

    asio::strand<asio::any_io_executor> strand;
    asio::steady_timer timer;
    ClientSession::ConnectHandler handler;
    std::atomic<bool> done{false};

    void finish(bool connected) {
        if (done.exchange(true)) {
            return;
        }
        timer.cancel();
        if (handler) {
            handler(connected);
        }
    }
};

}  // namespace

ClientSession::ClientSession(asio::any_io_executor completion_executor, ClientSessionConfig config)
    : completion_executor_(std::move(completion_executor))
    , config_(std::move(config))
    , client_(config_.client)
{}

ClientSession::~ClientSession() {
    client_.disconnect();
    pool_.join();
}

void ClientSession::connect(
    std::string command,
    std::optional<std::string> args,
    std::optional<std::string> working_directory,
    ConnectHandler handler
) {
    auto attempt = std::make_shared<ConnectAttempt>(completion_executor_, std::move(handler));

    attempt->timer.expires_after(config_.connect_timeout);
    attempt->timer.async_wait([attempt, timeout = config_.connect_timeout](const std::error_code& ec) {
        if (ec) {
            return;
        }
        PIPEMCP_LOG_WARN("Connect did not finish within {} ms", timeout.count());
        attempt->finish(false);
    });

    asio::post(pool_, [this, attempt,
                       command = std::move(command),
                       args = std::move(args),
                       working_directory = std::move(working_directory)] {
        const bool connected = client_.connect(command, args, working_directory);
        asio::post(attempt->strand, [attempt, connected] {
            attempt->finish(connected);
        });
    });
}

void ClientSession::disconnect() {
    client_.disconnect();
}

bool ClientSession::is_connected() const {
    return client_.is_connected();
}

std::optional<std::string> ClientSession::last_connection_error() const {
    return client_.last_connection_error();
}

asio::awaitable<std::vector<ToolDescriptor>> ClientSession::list_tools() {
    co_return co_await asio::co_spawn(
        pool_.get_executor(),
        [this]() -> asio::awaitable<std::vector<ToolDescriptor>> {
            co_return client_.list_tools();
        },
        asio::use_awaitable
    );
}

asio::awaitable<std::optional<Json>> ClientSession::call_tool(std::string name, ToolArguments arguments) {
    co_return co_await asio::co_spawn(
        pool_.get_executor(),
        [this, name = std::move(name), arguments = std::move(arguments)]() -> asio::awaitable<std::optional<Json>> {
            co_return client_.call_tool(name, arguments);
        },
        asio::use_awaitable
    );
}

}  // namespace pipemcp
