#pragma once

#include <atomic>
#include <iosfwd>
#include <memory>
#include <string>
#include <thread>

#include <asio/any_io_executor.hpp>
#include <asio/awaitable.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/experimental/channel.hpp>
#include <asio/io_context.hpp>
#include <asio/strand.hpp>

#include "daxmcp/protocol/json_rpc.hpp"
#include "daxmcp/transport/transport.hpp"

namespace daxmcp {

struct StdioTransportConfig {
    std::istream* input{nullptr};
    std::ostream* output{nullptr};
    bool auto_flush{true};
    std::size_t max_line_length{1 << 20};  // 1 MiB
};

// ═══════════════════════════════════════════════════════════════════════════
// StdioTransport
// ═══════════════════════════════════════════════════════════════════════════
// Newline-delimited messages. A reader thread pulls lines off the input
// stream and hands them to the io thread through a bounded channel; the
// reader blocks while the channel is full, so no line is ever dropped.
//
// Blank lines are skipped and a trailing '\r' is removed. The last item
// delivered is always a Network error ("end of stream").
//
// stop() joins the reader, which returns once the input reaches end of
// stream or the channel is closed while it waits to deliver. A reader blocked
// inside the input stream cannot be woken; check reader_finished() before
// stopping early.

class StdioTransport {
public:
    explicit StdioTransport(StdioTransportConfig config);
    ~StdioTransport();

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// Blocking read of the next non-blank line.
    [[nodiscard]] TransportResult<std::string> read_line();

    /// Writes one encoded message followed by '\n'.
    [[nodiscard]] TransportResult<void> write_line(const Json& message);

    asio::awaitable<TransportResult<std::string>> async_read_line();
    asio::awaitable<TransportResult<void>> async_write_line(Json message);

    void start();
    void stop();

    /// True once the reader thread has delivered end of stream or given up.
    [[nodiscard]] bool reader_finished() const noexcept;

    [[nodiscard]] asio::any_io_executor executor() noexcept;
    [[nodiscard]] const StdioTransportConfig& config() const noexcept;

private:
    void reader_loop();

    StdioTransportConfig config_;
    asio::io_context io_;
    asio::strand<asio::io_context::executor_type> strand_;
    asio::experimental::channel<void(asio::error_code, TransportResult<std::string>)> channel_;
    std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_guard_;
    std::thread io_thread_;
    std::thread reader_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> reader_finished_{false};
};

}  // namespace daxmcp
