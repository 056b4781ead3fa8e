#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "catalog_provider.hpp"
#include "http_client.hpp"
#include "library_error.hpp"
#include "log.hpp"

struct PeerRecord {
  std::string client_identity;
  std::string transport_address;
  std::string display_name;
  std::vector<SongDescriptor> songs;
};

struct GlobalCatalogEntry {
  SongDescriptor song;
  std::string transport_address;
  std::string display_name;
  std::string owner_identity;
};

enum class DiscoveryState { Disconnected, Connecting, Connected };

const char* to_string(DiscoveryState state);

// Wire shape {peer_id, webrtc_id, name, songs}.
nlohmann::json peer_record_to_json(const PeerRecord& record);
std::optional<PeerRecord> peer_record_from_json(const nlohmann::json& j);

// Flattens a /peers document, dropping our own identity and peers without a
// transport address. Throws nlohmann::json::exception on a malformed document.
std::vector<GlobalCatalogEntry> flatten_peers(const nlohmann::json& doc,
                                              const std::string& self_identity,
                                              std::size_t& online_peers);

class DiscoveryClient {
public:
  struct Options {
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds fetch_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds http_timeout{std::chrono::seconds(5)};
  };

  using CatalogSupplier = std::function<std::vector<SongDescriptor>()>;
  using CatalogListener = std::function<void(const std::vector<GlobalCatalogEntry>&, std::size_t online_peers)>;
  using StateListener = std::function<void(DiscoveryState)>;
  using RegisterHandler = std::function<void(std::optional<LibraryError>)>;
  using TickHandler = std::function<void(bool ok)>;

  DiscoveryClient(asio::io_context& io, Options options, std::shared_ptr<Logger> logger = nullptr);

  // false when the URL is not http(s)://host[:port][/base].
  bool set_server_url(const std::string& url);
  std::string server_url() const { return server_url_text_; }

  void set_identity(std::string client_identity, std::string display_name);
  void set_catalog_supplier(CatalogSupplier supplier) { catalog_supplier_ = std::move(supplier); }
  void set_catalog_listener(CatalogListener listener) { catalog_listener_ = std::move(listener); }
  void set_state_listener(StateListener listener) { state_listener_ = std::move(listener); }

  // One bounded POST /register. On success the heartbeat and fetch loops start
  // and an immediate fetch runs. Never retried here.
  void register_peer(const std::string& transport_address, RegisterHandler done);

  void heartbeat(TickHandler done = {});
  void fetch_global_catalog(TickHandler done = {});
  void refresh(TickHandler done = {}) { fetch_global_catalog(std::move(done)); }

  // Best-effort DELETE /unregister; `done` always runs, after the response or the timeout.
  void unregister(std::function<void()> done = {});

  // Stops both loops and aborts any request still in flight.
  void stop();

  DiscoveryState state() const { return state_; }
  const std::vector<GlobalCatalogEntry>& global_catalog() const { return global_catalog_; }
  std::size_t online_peers() const { return online_peers_; }

private:
  nlohmann::json registration_body();
  void send(const char* method, const std::string& route, std::string body, HttpClient::Callback done);
  void set_state(DiscoveryState state);
  void schedule_heartbeat();
  void schedule_fetch();
  void finish_fetch(bool ok);

  Options options_;
  std::shared_ptr<Logger> logger_;
  HttpClient http_;
  asio::steady_timer heartbeat_timer_;
  asio::steady_timer fetch_timer_;

  std::optional<ServerUrl> server_url_;
  std::string server_url_text_;
  std::string client_identity_;
  std::string display_name_;
  std::string transport_address_;
  CatalogSupplier catalog_supplier_;
  CatalogListener catalog_listener_;
  StateListener state_listener_;

  DiscoveryState state_ = DiscoveryState::Disconnected;
  uint64_t generation_ = 0;
  bool heartbeat_in_flight_ = false;
  bool fetch_in_flight_ = false;
  std::vector<TickHandler> fetch_waiters_;
  std::size_t heartbeat_failures_ = 0;
  std::vector<GlobalCatalogEntry> global_catalog_;
  std::size_t online_peers_ = 0;
};
