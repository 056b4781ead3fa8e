#pragma once

#include <asio.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "connection.hpp"
#include "library_error.hpp"
#include "log.hpp"

// The one listening endpoint of a session plus the outbound dialer.
class PeerTransport {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 0;
    std::string advertise_host; // empty: listen_ip, or 127.0.0.1 for a wildcard bind
  };

  using InboundHandler = std::function<void(Connection::Ptr)>;
  using TeardownHandler = std::function<void(const LibraryError&)>;

  PeerTransport(asio::io_context& io, std::shared_ptr<Logger> logger = nullptr);
  ~PeerTransport();

  void set_inbound_handler(InboundHandler handler) { inbound_ = std::move(handler); }
  void set_teardown_handler(TeardownHandler handler) { teardown_ = std::move(handler); }

  // Binds and starts accepting; returns the error instead of throwing.
  std::optional<LibraryError> open(const Options& options);
  void close();

  // New outbound connection per call. The returned connection can be closed
  // to abandon the attempt; `done` then reports operation_aborted.
  Connection::Ptr dial(const std::string& address, Connection::ConnectHandler done);

  bool is_open() const { return acceptor_ != nullptr; }
  const std::string& address() const { return address_; }
  uint16_t port() const { return port_; }

  // Called on an accept failure: one re-open on the same port, then teardown.
  void handle_accept_error(const std::error_code& ec);

private:
  std::optional<LibraryError> bind_acceptor(const asio::ip::tcp::endpoint& endpoint);
  void start_accept();
  void track(const Connection::Ptr& conn);

  asio::io_context& io_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  asio::ip::tcp::endpoint endpoint_;
  InboundHandler inbound_;
  TeardownHandler teardown_;
  std::vector<std::weak_ptr<Connection>> connections_;
  std::string address_;
  uint16_t port_ = 0;
  bool reopened_ = false;
  uint64_t generation_ = 0;
};
