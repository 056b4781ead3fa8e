#include "connection.hpp"

#include <istream>

#include "utils.hpp"

Connection::Ptr Connection::create_incoming(asio::io_context& io,
                                            asio::ip::tcp::socket sock,
                                            std::shared_ptr<Logger> logger)
{
    auto c = Ptr(new Connection(io, std::move(sock), std::move(logger)));
    std::error_code ec;
    auto ep = c->socket_.remote_endpoint(ec);
    if(!ec){
        c->remote_address_ = format_host_port(ep.address().to_string(), ep.port());
    }
    return c;
}

Connection::Ptr Connection::create_outgoing(asio::io_context& io, std::shared_ptr<Logger> logger)
{
    return Ptr(new Connection(io, asio::ip::tcp::socket(io), std::move(logger)));
}

Connection::Connection(asio::io_context& io, asio::ip::tcp::socket sock, std::shared_ptr<Logger> logger)
: io_(io), socket_(std::move(sock)), resolver_(io), logger_(std::move(logger)), read_buf_(kMaxFrameBytes)
{
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::async_connect(const std::string& host, uint16_t port, ConnectHandler done){
    remote_address_ = format_host_port(host, port);
    auto self = shared_from_this();
    resolver_.async_resolve(host, std::to_string(port),
        [this, self, host, port, done](std::error_code ec, asio::ip::tcp::resolver::results_type results){
            if(closed_){
                done(asio::error::operation_aborted);
                return;
            }
            if(ec){
                log_info(logger_.get(), "Resolve failed for {}:{}  {}", host, port, ec.message());
                done(ec);
                return;
            }
            asio::async_connect(socket_, results,
                [this, self, done](std::error_code ec, const asio::ip::tcp::endpoint& ep){
                    if(closed_){
                        done(asio::error::operation_aborted);
                        return;
                    }
                    if(ec){
                        log_info(logger_.get(), "Connect to {} failed: {}", remote_address_, ec.message());
                        done(ec);
                        return;
                    }
                    log_debug(logger_.get(), "Connected outgoing to {}:{}", ep.address().to_string(), ep.port());
                    do_read();
                    done({});
                });
        });
}

void Connection::start(){
    do_read();
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
        [this, self](std::error_code ec, std::size_t){
            if(closed_) return;
            if(ec == asio::error::not_found){
                auto on_error = handlers_.on_protocol_error;
                if(on_error) on_error(self, "frame exceeds size limit");
                shutdown(ec);
                return;
            }
            if(ec){
                log_debug(logger_.get(), "Connection read error from {}: {}", remote_address_, ec.message());
                shutdown(ec);
                return;
            }
            std::istream is(&read_buf_);
            std::string line;
            std::getline(is, line);
            if(!line.empty() && line.back() == '\r') line.pop_back();
            if(!line.empty()){
                handle_line(line);
            }
            if(!closed_) do_read();
        });
}

void Connection::handle_line(const std::string& line){
    auto self = shared_from_this();
    PeerMessage message;
    try{
        message = decode_line(line);
    } catch(const ProtocolError& ex){
        log_warn(logger_.get(), "Protocol error from {}: {}", remote_address_, ex.what());
        auto on_error = handlers_.on_protocol_error;
        if(on_error) on_error(self, ex.what());
        return;
    }
    auto on_message = handlers_.on_message;
    if(on_message) on_message(self, std::move(message));
}

void Connection::async_send(const PeerMessage& message, WriteHandler done){
    if(closed_){
        if(done) asio::post(io_, [done](){ done(asio::error::not_connected); });
        return;
    }
    bool start_write = write_queue_.empty();
    write_queue_.push_back(PendingWrite{encode_message(message).dump() + "\n", std::move(done)});
    if(start_write){
        do_write();
    }
}

void Connection::do_write(){
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front().frame),
        [this, self](std::error_code ec, std::size_t){
            if(write_queue_.empty()) return;
            auto done = std::move(write_queue_.front().done);
            write_queue_.pop_front();
            if(done) done(ec);
            if(ec){
                log_debug(logger_.get(), "Connection write error to {}: {}", remote_address_, ec.message());
                shutdown(ec);
                return;
            }
            if(!write_queue_.empty()){
                do_write();
            }
        });
}

void Connection::close(){
    shutdown(asio::error::operation_aborted);
}

void Connection::shutdown(std::error_code reason){
    if(closed_) return;
    closed_ = true;
    std::error_code ec;
    resolver_.cancel();
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);

    // Handlers usually hold the owner of this connection; drop them to break the cycle.
    auto handlers = std::move(handlers_);
    handlers_ = Handlers{};
    if(handlers.on_closed) handlers.on_closed(shared_from_this(), reason);
}
