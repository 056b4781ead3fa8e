#include "discovery_server.hpp"

#include <algorithm>
#include <optional>

#include "utils.hpp"

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr std::uint64_t kMaxBodyBytes = 16 * 1024 * 1024;
constexpr std::chrono::seconds kIdleTimeout{30};

DiscoveryResponse text_response(const DiscoveryRequest& request, http::status status, std::string body) {
  DiscoveryResponse r{status, request.version()};
  r.set(http::field::server, "songmesh-discovery");
  r.set(http::field::content_type, "text/plain; charset=utf-8");
  r.keep_alive(request.keep_alive());
  r.body() = std::move(body);
  r.prepare_payload();
  return r;
}

DiscoveryResponse json_response(const DiscoveryRequest& request, const nlohmann::json& body) {
  DiscoveryResponse r{http::status::ok, request.version()};
  r.set(http::field::server, "songmesh-discovery");
  r.set(http::field::content_type, "application/json");
  r.keep_alive(request.keep_alive());
  r.body() = body.dump();
  r.prepare_payload();
  return r;
}

// Strips the query string: "/peers?x=1" -> "/peers".
std::string route_of(beast::string_view target) {
  std::string path(target.data(), target.size());
  auto q = path.find('?');
  if(q != std::string::npos) path.resize(q);
  while(path.size() > 1 && path.back() == '/') path.pop_back();
  return path;
}

bool is_parse_error(const beast::error_code& ec) {
  return ec.category() == http::make_error_code(http::error::bad_target).category();
}

} // namespace

class DiscoveryServer::HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket socket, DiscoveryServer& server)
    : stream_(std::move(socket)), server_(server) {}

  void start() { do_read(); }

  void close() {
    beast::error_code ignored;
    stream_.socket().shutdown(tcp::socket::shutdown_both, ignored);
    stream_.close();
  }

private:
  void do_read() {
    parser_.emplace();
    parser_->body_limit(kMaxBodyBytes);
    stream_.expires_after(kIdleTimeout);
    auto self = shared_from_this();
    http::async_read(stream_, buffer_, *parser_, [self](beast::error_code ec, std::size_t){
      self->on_read(ec);
    });
  }

  void on_read(beast::error_code ec) {
    if(ec == http::error::end_of_stream) {
      beast::error_code ignored;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
      return;
    }
    if(ec) {
      if(is_parse_error(ec)) {
        DiscoveryRequest request;
        request.keep_alive(false);
        respond(text_response(request, http::status::bad_request, "Bad Request"));
      }
      return;
    }
    respond(server_.handle(parser_->get()));
  }

  void respond(DiscoveryResponse response) {
    response_.emplace(std::move(response));
    auto self = shared_from_this();
    http::async_write(stream_, *response_, [self](beast::error_code ec, std::size_t){
      if(ec) return;
      bool keep_alive = self->response_->keep_alive();
      self->response_.reset();
      if(!keep_alive) {
        beast::error_code ignored;
        self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
        return;
      }
      self->do_read();
    });
  }

  beast::tcp_stream stream_;
  DiscoveryServer& server_;
  beast::flat_buffer buffer_;
  std::optional<http::request_parser<http::string_body>> parser_;
  std::optional<DiscoveryResponse> response_;
};

DiscoveryServer::DiscoveryServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("discovery")) {}

DiscoveryServer::~DiscoveryServer() {
  stop();
}

std::string DiscoveryServer::base_url() const {
  auto host = options_.listen_ip == "0.0.0.0" ? std::string("127.0.0.1") : options_.listen_ip;
  return "http://" + format_host_port(host, port_);
}

void DiscoveryServer::start() {
  if(started_) return;

  auto address = net::ip::make_address(options_.listen_ip);
  tcp::endpoint endpoint(address, options_.port);
  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  port_ = acceptor_->local_endpoint().port();
  started_ = true;

  logger_->info("Discovery server listening on {}", format_host_port(options_.listen_ip, port_));
  start_accept();
  sweep_timer_ = std::make_unique<net::steady_timer>(io_);
  schedule_sweep();
}

void DiscoveryServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept([this](beast::error_code ec, tcp::socket socket){
    if(ec == net::error::operation_aborted || !started_) return;
    if(ec) {
      logger_->warn("Discovery accept error: {}", ec.message());
    } else {
      auto session = std::make_shared<HttpSession>(std::move(socket), *this);
      sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                     [](const std::weak_ptr<HttpSession>& w){ return w.expired(); }),
                      sessions_.end());
      sessions_.push_back(session);
      session->start();
    }
    start_accept();
  });
}

void DiscoveryServer::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(options_.sweep_interval);
  sweep_timer_->async_wait([this](const beast::error_code& ec){
    if(ec || !started_) return;
    auto removed = sweep_expired();
    if(removed > 0) {
      logger_->info("Cleaned up {} stale peers, {} remaining", removed, peer_count());
    }
    schedule_sweep();
  });
}

std::size_t DiscoveryServer::sweep_expired() {
  std::lock_guard lg(m_);
  auto now = std::chrono::steady_clock::now();
  std::size_t removed = 0;
  for(auto it = peers_.begin(); it != peers_.end();) {
    if(now - it->second.last_seen >= options_.peer_timeout) {
      it = peers_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

void DiscoveryServer::run() {
  if(!started_) start();
  io_.run();
}

void DiscoveryServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void DiscoveryServer::stop() {
  if(!started_) return;
  started_ = false;
  net::post(io_, [this](){
    beast::error_code ec;
    if(sweep_timer_) sweep_timer_->cancel(ec);
    if(acceptor_) acceptor_->close(ec);
    for(auto& weak : sessions_) {
      if(auto session = weak.lock()) session->close();
    }
    sessions_.clear();
  });
  if(io_thread_.joinable()) {
    io_thread_.join();
  } else {
    io_.run();
  }
  sweep_timer_.reset();
  acceptor_.reset();
  io_.restart();
  logger_->info("Discovery server stopped");
}

std::size_t DiscoveryServer::peer_count() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

std::size_t DiscoveryServer::request_count(const std::string& route) const {
  std::lock_guard lg(m_);
  auto it = request_counts_.find(route);
  return it == request_counts_.end() ? 0 : it->second;
}

DiscoveryResponse DiscoveryServer::handle(const DiscoveryRequest& request) {
  auto route = route_of(request.target());
  {
    std::lock_guard lg(m_);
    request_counts_[route]++;
  }
  if(route == "/health") {
    if(request.method() != http::verb::get) return text_response(request, http::status::method_not_allowed, "Method Not Allowed");
    return text_response(request, http::status::ok, "OK");
  }
  if(route == "/register" || route == "/heartbeat") {
    if(request.method() != http::verb::post) return text_response(request, http::status::method_not_allowed, "Method Not Allowed");
    return upsert(request, route == "/register");
  }
  if(route == "/peers") {
    if(request.method() != http::verb::get) return text_response(request, http::status::method_not_allowed, "Method Not Allowed");
    return list_peers(request);
  }
  if(route == "/unregister") {
    if(request.method() != http::verb::delete_) return text_response(request, http::status::method_not_allowed, "Method Not Allowed");
    return remove_peer(request);
  }
  return text_response(request, http::status::not_found, "Not Found");
}

DiscoveryResponse DiscoveryServer::upsert(const DiscoveryRequest& request, bool registering) {
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(request.body());
  } catch(const nlohmann::json::parse_error& e) {
    return text_response(request, http::status::bad_request, std::string("Invalid JSON: ") + e.what());
  }
  if(!body.is_object() || !body.contains("peer_id") || !body["peer_id"].is_string() ||
     !body.contains("name") || !body["name"].is_string() ||
     !body.contains("songs") || !body["songs"].is_array()) {
    return text_response(request, http::status::bad_request, "Expected {peer_id, webrtc_id, name, songs}");
  }
  auto id = body["peer_id"].get<std::string>();
  if(id.empty()) return text_response(request, http::status::bad_request, "peer_id must not be empty");

  nlohmann::json record = {
    {"peer_id", id},
    {"webrtc_id", body.contains("webrtc_id") && body["webrtc_id"].is_string() ? body["webrtc_id"] : nlohmann::json(nullptr)},
    {"name", body["name"]},
    {"songs", body["songs"]}
  };

  std::size_t peers = 0;
  std::size_t songs = 0;
  {
    std::lock_guard lg(m_);
    peers_[id] = PeerEntry{std::move(record), std::chrono::steady_clock::now()};
    peers = peers_.size();
    for(const auto& kv : peers_) songs += kv.second.record["songs"].size();
  }
  if(registering) {
    logger_->info("Peer registered: {} peers, {} songs total", peers, songs);
  }
  return text_response(request, http::status::ok, "");
}

DiscoveryResponse DiscoveryServer::list_peers(const DiscoveryRequest& request) {
  nlohmann::json peers = nlohmann::json::array();
  std::size_t total_songs = 0;
  {
    std::lock_guard lg(m_);
    for(const auto& kv : peers_) {
      peers.push_back(kv.second.record);
      total_songs += kv.second.record["songs"].size();
    }
  }
  return json_response(request, {{"peers", peers}, {"total_songs", total_songs}});
}

DiscoveryResponse DiscoveryServer::remove_peer(const DiscoveryRequest& request) {
  nlohmann::json body;
  try {
    body = nlohmann::json::parse(request.body());
  } catch(const nlohmann::json::parse_error& e) {
    return text_response(request, http::status::bad_request, std::string("Invalid JSON: ") + e.what());
  }
  if(!body.is_string()) return text_response(request, http::status::bad_request, "Expected a JSON string peer id");
  std::size_t remaining = 0;
  {
    std::lock_guard lg(m_);
    peers_.erase(body.get<std::string>());
    remaining = peers_.size();
  }
  logger_->info("Peer unregistered, {} remaining", remaining);
  return text_response(request, http::status::ok, "");
}
