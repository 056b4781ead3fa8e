#include "peer_transport.hpp"

#include <algorithm>

#include "utils.hpp"

using tcp = asio::ip::tcp;

PeerTransport::PeerTransport(asio::io_context& io, std::shared_ptr<Logger> logger)
  : io_(io), logger_(std::move(logger)) {}

PeerTransport::~PeerTransport() {
  close();
}

std::optional<LibraryError> PeerTransport::bind_acceptor(const tcp::endpoint& endpoint) {
  auto acceptor = std::make_unique<tcp::acceptor>(io_);
  std::error_code ec;
  acceptor->open(endpoint.protocol(), ec);
  if(!ec) acceptor->set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor->bind(endpoint, ec);
  if(!ec) acceptor->listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    return LibraryError{LibraryErrorKind::TransportUnavailable,
                        "Cannot listen on " + format_host_port(endpoint.address().to_string(), endpoint.port()) +
                        ": " + ec.message()};
  }
  acceptor_ = std::move(acceptor);
  return std::nullopt;
}

std::optional<LibraryError> PeerTransport::open(const Options& options) {
  close();

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options.listen_ip);
  } catch(const std::exception& e) {
    return LibraryError{LibraryErrorKind::TransportUnavailable,
                        "Invalid listen_ip '" + options.listen_ip + "': " + e.what()};
  }

  if(auto error = bind_acceptor(tcp::endpoint(listen_address, options.listen_port))) {
    log_error(logger_.get(), "{}", error->message);
    return error;
  }

  endpoint_ = acceptor_->local_endpoint();
  port_ = endpoint_.port();
  std::string host = options.advertise_host;
  if(host.empty()) {
    host = listen_address.is_unspecified() ? std::string("127.0.0.1") : options.listen_ip;
  }
  address_ = format_host_port(host, port_);
  reopened_ = false;
  ++generation_;
  log_info(logger_.get(), "Peer transport listening on {} (advertised as {})",
           format_host_port(options.listen_ip, port_), address_);
  start_accept();
  return std::nullopt;
}

void PeerTransport::start_accept() {
  if(!acceptor_) return;
  auto generation = generation_;
  acceptor_->async_accept(
    [this, generation](std::error_code ec, tcp::socket socket){
      if(generation != generation_ || ec == asio::error::operation_aborted) return;
      if(ec) {
        handle_accept_error(ec);
        return;
      }
      auto conn = Connection::create_incoming(io_, std::move(socket), logger_);
      log_debug(logger_.get(), "Accepted connection from {}", conn->remote_address());
      track(conn);
      if(inbound_) {
        inbound_(conn);
      } else {
        conn->close();
      }
      start_accept();
    });
}

void PeerTransport::handle_accept_error(const std::error_code& ec) {
  log_warn(logger_.get(), "Accept error on {}: {}", address_, ec.message());
  if(!reopened_) {
    reopened_ = true;
    std::error_code ignored;
    if(acceptor_) acceptor_->close(ignored);
    acceptor_.reset();
    if(!bind_acceptor(endpoint_)) {
      log_info(logger_.get(), "Peer transport re-opened on {}", address_);
      ++generation_;
      start_accept();
      return;
    }
  }
  LibraryError error{LibraryErrorKind::TransportUnavailable,
                     "Peer transport lost: " + ec.message()};
  log_error(logger_.get(), "{}", error.message);
  close();
  if(teardown_) teardown_(error);
}

void PeerTransport::close() {
  ++generation_;
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  acceptor_.reset();
  auto connections = std::move(connections_);
  connections_.clear();
  for(auto& weak : connections) {
    if(auto conn = weak.lock()) conn->close();
  }
  address_.clear();
  port_ = 0;
}

Connection::Ptr PeerTransport::dial(const std::string& address, Connection::ConnectHandler done) {
  auto conn = Connection::create_outgoing(io_, logger_);
  auto target = parse_host_port(address);
  if(!target) {
    asio::post(io_, [done](){ done(std::make_error_code(std::errc::invalid_argument)); });
    return conn;
  }
  track(conn);
  conn->async_connect(target->host, target->port, std::move(done));
  return conn;
}

void PeerTransport::track(const Connection::Ptr& conn) {
  connections_.erase(std::remove_if(connections_.begin(), connections_.end(),
                                    [](const std::weak_ptr<Connection>& w){ return w.expired(); }),
                     connections_.end());
  connections_.push_back(conn);
}
