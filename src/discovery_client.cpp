#include "discovery_client.hpp"

const char* to_string(DiscoveryState state) {
  switch(state) {
    case DiscoveryState::Disconnected: return "disconnected";
    case DiscoveryState::Connecting: return "connecting";
    case DiscoveryState::Connected: return "connected";
  }
  return "disconnected";
}

nlohmann::json peer_record_to_json(const PeerRecord& record) {
  nlohmann::json songs = nlohmann::json::array();
  for(const auto& song : record.songs) songs.push_back(song);
  return nlohmann::json{
    {"peer_id", record.client_identity},
    {"webrtc_id", record.transport_address},
    {"name", record.display_name},
    {"songs", songs}
  };
}

std::optional<PeerRecord> peer_record_from_json(const nlohmann::json& j) {
  if(!j.is_object()) return std::nullopt;
  auto id = j.find("peer_id");
  if(id == j.end() || !id->is_string() || id->get<std::string>().empty()) return std::nullopt;

  PeerRecord record;
  record.client_identity = id->get<std::string>();
  if(j.contains("webrtc_id") && j["webrtc_id"].is_string()) {
    record.transport_address = j["webrtc_id"].get<std::string>();
  }
  if(j.contains("name") && j["name"].is_string()) {
    record.display_name = j["name"].get<std::string>();
  }
  if(j.contains("songs") && j["songs"].is_array()) {
    for(const auto& s : j["songs"]) {
      if(!s.is_object()) continue;
      record.songs.push_back(s.get<SongDescriptor>());
    }
  }
  return record;
}

std::vector<GlobalCatalogEntry> flatten_peers(const nlohmann::json& doc,
                                              const std::string& self_identity,
                                              std::size_t& online_peers) {
  std::vector<GlobalCatalogEntry> entries;
  online_peers = 0;
  for(const auto& item : doc.at("peers")) {
    auto record = peer_record_from_json(item);
    if(!record) continue;
    if(record->client_identity == self_identity) continue;
    if(record->transport_address.empty()) continue;
    ++online_peers;
    for(auto& song : record->songs) {
      GlobalCatalogEntry entry;
      entry.song = std::move(song);
      entry.transport_address = record->transport_address;
      entry.display_name = record->display_name;
      entry.owner_identity = record->client_identity;
      entries.push_back(std::move(entry));
    }
  }
  return entries;
}

DiscoveryClient::DiscoveryClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(std::move(logger)),
    http_(io, logger_),
    heartbeat_timer_(io),
    fetch_timer_(io) {}

bool DiscoveryClient::set_server_url(const std::string& url) {
  auto parsed = parse_server_url(url);
  if(!parsed) return false;
  server_url_ = std::move(parsed);
  server_url_text_ = url;
  return true;
}

void DiscoveryClient::set_identity(std::string client_identity, std::string display_name) {
  client_identity_ = std::move(client_identity);
  display_name_ = std::move(display_name);
}

void DiscoveryClient::set_state(DiscoveryState state) {
  if(state_ == state) return;
  state_ = state;
  if(state_listener_) state_listener_(state);
}

nlohmann::json DiscoveryClient::registration_body() {
  PeerRecord record;
  record.client_identity = client_identity_;
  record.transport_address = transport_address_;
  record.display_name = display_name_;
  if(catalog_supplier_) record.songs = catalog_supplier_();
  return peer_record_to_json(record);
}

void DiscoveryClient::send(const char* method, const std::string& route, std::string body, HttpClient::Callback done) {
  http_.async_request(method, server_url_->route(route), std::move(body), options_.http_timeout, std::move(done));
}

void DiscoveryClient::register_peer(const std::string& transport_address, RegisterHandler done) {
  if(!server_url_) {
    done(LibraryError{LibraryErrorKind::DiscoveryUnavailable, "No discovery server configured"});
    return;
  }
  ++generation_;
  std::error_code ignored;
  heartbeat_timer_.cancel(ignored);
  fetch_timer_.cancel(ignored);
  transport_address_ = transport_address;
  heartbeat_failures_ = 0;
  set_state(DiscoveryState::Connecting);

  auto body = registration_body();
  log_info(logger_.get(), "Registering {} ({} songs) with {}",
           transport_address_, body["songs"].size(), server_url_text_);
  auto generation = generation_;
  send("POST", "/register", body.dump(), [this, generation, done](std::error_code ec, HttpResponse response){
    if(generation != generation_) {
      done(LibraryError{LibraryErrorKind::DiscoveryUnavailable, "Registration superseded"});
      return;
    }
    if(ec || !response.ok()) {
      auto reason = ec ? ec.message() : "Server returned " + std::to_string(response.status);
      log_warn(logger_.get(), "Registration failed: {}", reason);
      set_state(DiscoveryState::Disconnected);
      done(LibraryError{LibraryErrorKind::DiscoveryUnavailable, "Failed to register with server: " + reason});
      return;
    }
    log_info(logger_.get(), "Registered with discovery server");
    set_state(DiscoveryState::Connected);
    schedule_heartbeat();
    schedule_fetch();
    fetch_global_catalog();
    done(std::nullopt);
  });
}

void DiscoveryClient::schedule_heartbeat() {
  auto generation = generation_;
  heartbeat_timer_.expires_after(options_.heartbeat_interval);
  heartbeat_timer_.async_wait([this, generation](const std::error_code& ec){
    if(ec || generation != generation_) return;
    heartbeat([this, generation](bool){
      if(generation == generation_) schedule_heartbeat();
    });
  });
}

void DiscoveryClient::schedule_fetch() {
  auto generation = generation_;
  fetch_timer_.expires_after(options_.fetch_interval);
  fetch_timer_.async_wait([this, generation](const std::error_code& ec){
    if(ec || generation != generation_) return;
    fetch_global_catalog([this, generation](bool){
      if(generation == generation_) schedule_fetch();
    });
  });
}

void DiscoveryClient::heartbeat(TickHandler done) {
  if(!server_url_ || client_identity_.empty() || transport_address_.empty() || heartbeat_in_flight_) {
    if(done) done(false);
    return;
  }
  heartbeat_in_flight_ = true;
  auto generation = generation_;
  send("POST", "/heartbeat", registration_body().dump(), [this, generation, done](std::error_code ec, HttpResponse response){
    heartbeat_in_flight_ = false;
    bool ok = !ec && response.ok();
    if(generation == generation_) {
      if(ok) {
        heartbeat_failures_ = 0;
      } else {
        ++heartbeat_failures_;
        log_warn(logger_.get(), "Heartbeat failed ({} in a row): {}", heartbeat_failures_,
                 ec ? ec.message() : "Server returned " + std::to_string(response.status));
      }
    }
    if(done) done(ok);
  });
}

void DiscoveryClient::fetch_global_catalog(TickHandler done) {
  if(done) fetch_waiters_.push_back(std::move(done));
  if(!server_url_) {
    finish_fetch(false);
    return;
  }
  if(fetch_in_flight_) return;
  fetch_in_flight_ = true;

  auto generation = generation_;
  send("GET", "/peers", {},
    [this, generation](std::error_code ec, HttpResponse response){
      fetch_in_flight_ = false;
      if(ec == asio::error::operation_aborted) {
        finish_fetch(false);
        return;
      }
      if(ec || !response.ok()) {
        log_warn(logger_.get(), "Failed to fetch songs: {}",
                 ec ? ec.message() : "Server returned " + std::to_string(response.status));
        finish_fetch(false);
        return;
      }
      std::vector<GlobalCatalogEntry> entries;
      std::size_t peers = 0;
      try {
        entries = flatten_peers(nlohmann::json::parse(response.body), client_identity_, peers);
      } catch(const std::exception& e) {
        log_warn(logger_.get(), "Failed to fetch songs: bad /peers document: {}", e.what());
        finish_fetch(false);
        return;
      }
      if(generation != generation_) {
        finish_fetch(false);
        return;
      }
      global_catalog_ = std::move(entries);
      online_peers_ = peers;
      log_debug(logger_.get(), "Fetched {} songs from {} peers", global_catalog_.size(), online_peers_);
      if(catalog_listener_) catalog_listener_(global_catalog_, online_peers_);
      finish_fetch(true);
    });
}

void DiscoveryClient::finish_fetch(bool ok) {
  auto waiters = std::move(fetch_waiters_);
  fetch_waiters_.clear();
  for(auto& waiter : waiters) {
    if(waiter) waiter(ok);
  }
}

void DiscoveryClient::unregister(std::function<void()> done) {
  if(!server_url_ || client_identity_.empty()) {
    if(done) done();
    return;
  }
  send("DELETE", "/unregister", nlohmann::json(client_identity_).dump(),
    [this, done](std::error_code ec, HttpResponse response){
      if(ec || !response.ok()) {
        log_warn(logger_.get(), "Unregister failed: {}",
                 ec ? ec.message() : "Server returned " + std::to_string(response.status));
      } else {
        log_info(logger_.get(), "Unregistered from discovery server");
      }
      if(done) done();
    });
}

void DiscoveryClient::stop() {
  ++generation_;
  http_.cancel_all();
  std::error_code ignored;
  heartbeat_timer_.cancel(ignored);
  fetch_timer_.cancel(ignored);
  global_catalog_.clear();
  online_peers_ = 0;
  transport_address_.clear();
  set_state(DiscoveryState::Disconnected);
}
