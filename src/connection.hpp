#pragma once
#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <system_error>

#include "log.hpp"
#include "protocol.hpp"

// One TCP peer channel carrying newline-delimited JSON frames.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using Ptr = std::shared_ptr<Connection>;
    using WriteHandler = std::function<void(std::error_code)>;
    using ConnectHandler = std::function<void(std::error_code)>;

    struct Handlers {
        std::function<void(const Ptr&, PeerMessage)> on_message;
        std::function<void(const Ptr&, const std::string& reason)> on_protocol_error;
        // Fires once, whether the remote hung up or close() was called.
        std::function<void(const Ptr&, std::error_code)> on_closed;
    };

    // A base64 encoded 50 MiB song plus the JSON envelope fits under this.
    static constexpr std::size_t kMaxFrameBytes = 72u * 1024u * 1024u;

    static Ptr create_incoming(asio::io_context& io,
                               asio::ip::tcp::socket sock,
                               std::shared_ptr<Logger> logger);
    static Ptr create_outgoing(asio::io_context& io, std::shared_ptr<Logger> logger);

    ~Connection();

    void set_handlers(Handlers handlers) { handlers_ = std::move(handlers); }

    // Resolve and connect; the read loop starts on success.
    void async_connect(const std::string& host, uint16_t port, ConnectHandler done);
    void start(); // start read loop (for incoming)
    void async_send(const PeerMessage& message, WriteHandler done = {});
    void close();

    bool is_open() const { return !closed_ && socket_.is_open(); }
    const std::string& remote_address() const { return remote_address_; }

private:
    Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::shared_ptr<Logger> logger);
    void do_read();
    void handle_line(const std::string& line);
    void do_write();
    void shutdown(std::error_code ec);

    struct PendingWrite {
        std::string frame;
        WriteHandler done;
    };

    asio::io_context& io_;
    asio::ip::tcp::socket socket_;
    asio::ip::tcp::resolver resolver_;
    std::shared_ptr<Logger> logger_;
    asio::streambuf read_buf_;
    std::deque<PendingWrite> write_queue_;
    Handlers handlers_;
    std::string remote_address_;
    bool closed_ = false;
};
