#include "daxmcp/transport/stdio_transport.hpp"

#include "daxmcp/log/logger.hpp"

#include <asio/as_tuple.hpp>
#include <asio/co_spawn.hpp>
#include <asio/post.hpp>
#include <asio/use_awaitable.hpp>
#include <asio/use_future.hpp>

#include <istream>
#include <limits>
#include <ostream>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace daxmcp {
namespace {

TransportResult<std::string> protocol_error(std::string message) {
    return tl::unexpected(TransportError{
        TransportError::Category::Protocol,
        std::move(message)});
}

TransportResult<std::string> stream_closed_error() {
    return tl::unexpected(TransportError{
        TransportError::Category::Network,
        "end of stream"});
}

bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t") == std::string::npos;
}

}  // namespace

StdioTransport::StdioTransport(StdioTransportConfig config)
    : config_(std::move(config)),
      strand_(asio::make_strand(io_)),
      channel_(io_, 16) {
    work_guard_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
}

StdioTransport::~StdioTransport() {
    stop();
}

const StdioTransportConfig& StdioTransport::config() const noexcept {
    return config_;
}

asio::any_io_executor StdioTransport::executor() noexcept {
    return io_.get_executor();
}

TransportResult<std::string> StdioTransport::read_line() {
    if (config_.input == nullptr) {
        return protocol_error("input stream is not set");
    }

    std::istream& input = *config_.input;
    // One extra byte leaves room for a trailing '\r'
    const std::size_t buffer_limit = config_.max_line_length + 1;

    while (true) {
        std::string line;
        bool extracted = false;
        bool oversized = false;
        char ch = 0;
        while (input.get(ch)) {
            extracted = true;
            if (ch == '\n') {
                break;
            }
            if (line.size() == buffer_limit) {
                oversized = true;
                input.ignore(std::numeric_limits<std::streamsize>::max(), '\n');
                break;
            }
            line.push_back(ch);
        }

        if (extracted == false) {
            return stream_closed_error();
        }
        if ((line.empty() == false) && (line.back() == '\r')) {
            line.pop_back();
        }
        if ((oversized == true) || (line.size() > config_.max_line_length)) {
            return protocol_error("line exceeds maximum length of " +
                                  std::to_string(config_.max_line_length) + " bytes");
        }
        if (is_blank(line)) {
            continue;
        }
        return line;
    }
}

TransportResult<void> StdioTransport::write_line(const Json& message) {
    if (config_.output == nullptr) {
        return tl::unexpected(TransportError{
            TransportError::Category::Protocol,
            "output stream is not set"});
    }

    // dump() escapes control characters, so the body never spans lines
    *config_.output << encode(message) << '\n';

    if (config_.auto_flush == true) {
        config_.output->flush();
    }

    if (config_.output->fail()) {
        return tl::unexpected(TransportError{
            TransportError::Category::Network,
            "failed to write to output stream"});
    }
    return TransportResult<void>{};
}

asio::awaitable<TransportResult<void>> StdioTransport::async_write_line(Json message) {
    co_await asio::post(strand_, asio::use_awaitable);
    co_return write_line(message);
}

asio::awaitable<TransportResult<std::string>> StdioTransport::async_read_line() {
    auto [ec, result] = co_await channel_.async_receive(asio::as_tuple(asio::use_awaitable));
    if (ec) {
        co_return stream_closed_error();
    }
    co_return std::move(result);
}

void StdioTransport::start() {
    if (running_.exchange(true)) {
        return;
    }
    const bool input_is_null = (config_.input == nullptr);
    const bool output_is_null = (config_.output == nullptr);
    if ((input_is_null == true) || (output_is_null == true)) {
        running_ = false;
        throw std::invalid_argument("StdioTransport::start() requires non-null input and output streams");
    }
    io_.restart();
    reader_finished_ = false;
    io_thread_ = std::thread([this]() { io_.run(); });
    reader_thread_ = std::thread([this]() { reader_loop(); });
}

void StdioTransport::stop() {
    if (running_.exchange(false) == false) {
        return;
    }

    // The channel belongs to the io thread; close it there
    try {
        asio::post(io_, asio::use_future([this]() { channel_.close(); })).get();
    } catch (const std::exception& e) {
        get_logger().error_fmt("Failed to close input channel: {}", e.what());
    }

    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    io_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

bool StdioTransport::reader_finished() const noexcept {
    return reader_finished_.load();
}

void StdioTransport::reader_loop() {
    while (running_) {
        auto result = read_line();
        const bool end_of_stream =
            (result.has_value() == false) &&
            (result.error().category == TransportError::Category::Network);

        // Waits for room in the channel; throws once the channel is closed
        try {
            asio::co_spawn(io_, [this, &result]() -> asio::awaitable<void> {
                co_await channel_.async_send(asio::error_code{}, std::move(result), asio::use_awaitable);
            }, asio::use_future).get();
        } catch (const std::system_error& e) {
            get_logger().debug_fmt("Input channel closed: {}", e.what());
            break;
        }

        if (end_of_stream) {
            break;
        }
    }
    reader_finished_ = true;
}

}  // namespace daxmcp
