#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

using DiscoveryRequest = boost::beast::http::request<boost::beast::http::string_body>;
using DiscoveryResponse = boost::beast::http::response<boost::beast::http::string_body>;

// Rendezvous service: GET /health, POST /register, POST /heartbeat,
// GET /peers, DELETE /unregister. Peers expire without heartbeats.
class DiscoveryServer {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    uint16_t port = 3456; // 0 = ephemeral
    std::chrono::milliseconds peer_timeout{std::chrono::seconds(45)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(15)};
  };

  explicit DiscoveryServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~DiscoveryServer();

  DiscoveryServer(const DiscoveryServer&) = delete;
  DiscoveryServer& operator=(const DiscoveryServer&) = delete;

  // Binds the listener; throws std::system_error when the port is taken.
  void start();
  void run();
  void start_background();
  void stop();

  uint16_t port() const { return port_; }
  std::string base_url() const;
  std::size_t peer_count() const;
  std::size_t request_count(const std::string& route) const;

  // Routing entry point, also driven directly by unit tests.
  DiscoveryResponse handle(const DiscoveryRequest& request);

private:
  struct PeerEntry {
    nlohmann::json record;
    std::chrono::steady_clock::time_point last_seen;
  };

  class HttpSession;

  void start_accept();
  void schedule_sweep();
  std::size_t sweep_expired();

  DiscoveryResponse upsert(const DiscoveryRequest& request, bool registering);
  DiscoveryResponse list_peers(const DiscoveryRequest& request);
  DiscoveryResponse remove_peer(const DiscoveryRequest& request);

  Options options_;
  std::shared_ptr<Logger> logger_;
  boost::asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
  std::unique_ptr<boost::asio::steady_timer> sweep_timer_;
  std::vector<std::weak_ptr<HttpSession>> sessions_;
  bool started_ = false;
  uint16_t port_ = 0;

  mutable std::mutex m_;
  std::map<std::string, PeerEntry> peers_;
  std::map<std::string, std::size_t> request_counts_;
};
