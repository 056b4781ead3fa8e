#include "library_session.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <stdexcept>

#include "settings_manager.hpp"

namespace {

uint32_t random_index(uint32_t bound) {
  uint32_t value = 0;
  if(RAND_bytes(reinterpret_cast<unsigned char*>(&value), sizeof(value)) != 1) {
    throw std::runtime_error("RAND_bytes failed while generating display name");
  }
  return value % bound;
}

} // namespace

std::string LibrarySession::generate_display_name() {
  static const std::array<const char*, 6> adjectives = {"Happy", "Swift", "Calm", "Brave", "Wise", "Kind"};
  static const std::array<const char*, 6> nouns = {"Musician", "Player", "Artist", "Bard", "Minstrel", "Maestro"};
  return std::string(adjectives[random_index(adjectives.size())]) +
         nouns[random_index(nouns.size())] +
         std::to_string(random_index(100));
}

LibrarySession::LibrarySession(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(std::move(options)),
    settings_(settings ? settings : std::make_shared<SettingsManager>()),
    logger_(std::make_shared<Logger>("library")) {
  if(options_.workspace_root.empty()) {
    options_.workspace_root = std::filesystem::current_path();
  }
  if(!settings) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
    settings_->load();
  }
}

LibrarySession::~LibrarySession() {
  stop();
}

void LibrarySession::persist_setting(const std::string& key, const nlohmann::json& value) {
  std::string error;
  if(!settings_->set_from_json(key, value, error)) {
    logger_->warn("Unable to set {}: {}", key, error);
    return;
  }
  if(!settings_->save()) {
    logger_->warn("Unable to persist settings to {}", settings_->settings_path().string());
  }
}

void LibrarySession::start() {
  if(started_) return;

  std::error_code ec;
  std::filesystem::create_directories(options_.workspace_root, ec);
  if(!settings_->has_settings_path()) {
    settings_->set_settings_path(options_.workspace_root / ".config" / "settings.json");
  }

  init(settings_->get<bool>("verbose"));

  album_ = options_.catalog_source;
  if(!album_) {
    auto album_dir = std::filesystem::path(settings_->get<std::string>("album_dir"));
    album_ = std::make_shared<AlbumDirectory>(options_.workspace_root / album_dir, logger_);
  }
  catalog_ = std::make_shared<CatalogProvider>(settings_, album_, logger_);
  client_identity_ = catalog_->get_or_create_identity();

  display_name_ = settings_->get<std::string>("display_name");
  if(display_name_.empty()) {
    display_name_ = generate_display_name();
    persist_setting("display_name", display_name_);
  }
  logger_->set_name(display_name_);

  int listen_port = settings_->get<int>("listen_port");
  if(listen_port < 0 || listen_port > 65535) {
    logger_->error("Invalid listen_port '{}'", listen_port);
    throw std::runtime_error("Invalid listen_port");
  }

  transport_ = std::make_unique<PeerTransport>(io_, logger_);
  transport_->set_inbound_handler([this](Connection::Ptr conn){ on_inbound(std::move(conn)); });
  transport_->set_teardown_handler([this](const LibraryError& error){ on_transport_lost(error); });

  DiscoveryClient::Options discovery_options;
  discovery_options.heartbeat_interval = options_.heartbeat_interval;
  discovery_options.fetch_interval = options_.fetch_interval;
  discovery_options.http_timeout = options_.http_timeout;
  discovery_ = std::make_unique<DiscoveryClient>(io_, discovery_options, logger_);
  auto url = settings_->get<std::string>("discovery_url");
  if(!discovery_->set_server_url(url)) {
    logger_->error("Invalid discovery_url '{}'", url);
    throw std::runtime_error("Invalid discovery_url");
  }
  discovery_->set_identity(client_identity_, display_name_);
  discovery_->set_catalog_supplier([this](){ return catalog_->shareable_catalog(); });
  discovery_->set_catalog_listener([this](const std::vector<GlobalCatalogEntry>& catalog, std::size_t peers){
    status_.set_catalog(catalog, peers);
  });
  discovery_->set_state_listener([this](DiscoveryState state){
    status_.set_discovery_state(state);
  });

  progress_clear_timer_ = std::make_unique<asio::steady_timer>(io_);
  work_.emplace(asio::make_work_guard(io_));
  started_ = true;

  logger_->info("Library session {} ({}) ready, album {}", display_name_, client_identity_,
                std::filesystem::path(options_.workspace_root / settings_->get<std::string>("album_dir")).string());

  if(settings_->get<bool>("library_enabled")) {
    connect();
  }
}

void LibrarySession::run() {
  if(!started_) start();
  io_.run();
}

void LibrarySession::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void LibrarySession::stop() {
  if(!started_) return;
  started_ = false;
  asio::post(io_, [this](){
    do_disconnect([this](){
      std::error_code ec;
      progress_clear_timer_->cancel(ec);
      status_.set_progress(std::nullopt);
      work_.reset();
    });
  });
  // run() returns once every aborted handler has been delivered.
  if(io_thread_.joinable()) {
    io_thread_.join();
  } else {
    io_.run();
  }
  downloads_.clear();
  io_.restart();
}

void LibrarySession::connect() {
  asio::post(io_, [this](){ do_connect(); });
}

void LibrarySession::disconnect() {
  asio::post(io_, [this](){ do_disconnect(); });
}

void LibrarySession::toggle_library() {
  bool enabled = !settings_->get<bool>("library_enabled");
  persist_setting("library_enabled", enabled);
  log_action(logger_.get(), "library.toggle", "completed", {{"enabled", enabled}});
  if(enabled) {
    status_.clear_error();
    connect();
  } else {
    disconnect();
  }
}

PeerTransport::Options LibrarySession::transport_options() const {
  PeerTransport::Options opts;
  opts.listen_ip = settings_->get<std::string>("listen_ip");
  opts.listen_port = static_cast<uint16_t>(settings_->get<int>("listen_port"));
  opts.advertise_host = settings_->get<std::string>("advertise_host");
  return opts;
}

void LibrarySession::do_connect() {
  nlohmann::json context = {{"server", discovery_->server_url()}, {"shareAll", catalog_->share_all()}};
  if(registered_ || registering_) {
    log_action(logger_.get(), "library.connect", "warn", {{"reason", "already_connected"}});
    return;
  }
  log_action(logger_.get(), "library.connect", "started", context);

  if(!transport_->is_open()) {
    if(auto error = transport_->open(transport_options())) {
      status_.set_error(*error);
      context["error"] = error->message;
      log_action(logger_.get(), "library.connect", "error", context);
      return;
    }
  }
  status_.set_connection(false, transport_->address());

  registering_ = true;
  auto epoch = epoch_;
  discovery_->register_peer(transport_->address(), [this, epoch](std::optional<LibraryError> error){
    if(epoch != epoch_) return;
    registering_ = false;
    on_registered(error);
  });
}

void LibrarySession::on_registered(const std::optional<LibraryError>& error) {
  nlohmann::json context = {{"server", discovery_->server_url()}, {"peerId", transport_->address()}};
  if(error) {
    status_.set_error(LibraryError{LibraryErrorKind::DiscoveryUnavailable,
                                   "Cannot connect to discovery server"});
    context["reason"] = "registration_failed";
    context["error"] = error->message;
    log_action(logger_.get(), "library.connect", "error", context);
    return;
  }
  if(!transport_->is_open()) return;
  registered_ = true;
  status_.clear_error();
  status_.set_connection(true, transport_->address());
  context["registered"] = true;
  log_action(logger_.get(), "library.connect", "completed", context);
}

void LibrarySession::do_disconnect(std::function<void()> done) {
  ++epoch_;
  bool was_registered = registered_ || registering_;
  registered_ = false;
  registering_ = false;
  discovery_->stop();
  transport_->close();
  status_.reset_connection();

  if(was_registered) {
    log_action(logger_.get(), "library.disconnect", "started");
    discovery_->unregister([this, done](){
      log_action(logger_.get(), "library.disconnect", "completed");
      if(done) done();
    });
  } else if(done) {
    done();
  }
}

void LibrarySession::on_transport_lost(const LibraryError& error) {
  ++epoch_;
  bool was_registered = registered_ || registering_;
  registered_ = false;
  registering_ = false;
  discovery_->stop();
  status_.reset_connection();
  status_.set_error(error);
  log_action(logger_.get(), "library.transport", "error", {{"error", error.message}});
  if(was_registered) discovery_->unregister();
}

void LibrarySession::report_listener_error(const std::error_code& ec) {
  asio::post(io_, [this, ec](){
    if(transport_->is_open()) transport_->handle_accept_error(ec);
  });
}

void LibrarySession::on_inbound(Connection::Ptr conn) {
  auto serve = SongServe::create(std::move(conn), catalog_,
    [this](const ShareNotification& note){
      log_action(logger_.get(), "library.share", "completed",
                      {{"songName", note.song_name}, {"peerName", note.peer_display_name}});
      status_.notify_share(note);
    },
    logger_);
  serve->start();
}

void LibrarySession::request_song(const GlobalCatalogEntry& entry) {
  asio::post(io_, [this, entry](){
    nlohmann::json context = {{"peerId", entry.transport_address},
                              {"hash", entry.song.hash},
                              {"songName", entry.song.name}};
    if(!transport_->is_open()) {
      status_.set_error(LibraryError{LibraryErrorKind::TransportUnavailable, "Not connected"});
      context["reason"] = "not_connected";
      log_action(logger_.get(), "library.requestSong", "error", context);
      return;
    }
    log_action(logger_.get(), "library.requestSong", "started", context);

    SongDownload::Request request;
    request.hash = entry.song.hash;
    request.song_name = entry.song.name;
    request.peer_address = entry.transport_address;
    request.peer_display_name = entry.display_name;
    request.requester_name = display_name_;

    auto download = std::make_shared<SongDownload::Ptr>();
    SongDownload::Hooks hooks;
    hooks.on_progress = [this](const DownloadProgress& progress){ set_progress(progress); };
    hooks.on_finished = [this, download](const TransferOutcome& outcome){
      on_download_finished(*download, outcome);
    };
    *download = SongDownload::create(io_, *transport_, album_, std::move(request),
                                     options_.transfer_timeout, std::move(hooks), logger_);
    downloads_.push_back(*download);
    (*download)->start();
  });
}

void LibrarySession::on_download_finished(const SongDownload::Ptr& download, const TransferOutcome& outcome) {
  downloads_.erase(std::remove(downloads_.begin(), downloads_.end(), download), downloads_.end());

  nlohmann::json context = {{"hash", outcome.hash}, {"songName", outcome.song_name}};
  if(outcome.succeeded()) {
    context["savedPath"] = outcome.saved_path;
    log_action(logger_.get(), "library.requestSong", "completed", context);
    progress_clear_timer_->expires_after(options_.progress_clear_delay);
    progress_clear_timer_->async_wait([this](const std::error_code& ec){
      if(ec) return;
      status_.set_progress(std::nullopt);
    });
  } else {
    context["error"] = outcome.error->message;
    context["kind"] = to_string(outcome.error->kind);
    log_action(logger_.get(), "library.requestSong", "error", context);
    set_progress(std::nullopt);
    status_.set_error(*outcome.error);
  }
  status_.finish_transfer(outcome);
}

void LibrarySession::set_progress(std::optional<DownloadProgress> progress) {
  // A newer write owns the slot; a pending clear from an older transfer must not erase it.
  std::error_code ec;
  progress_clear_timer_->cancel(ec);
  status_.set_progress(std::move(progress));
}

void LibrarySession::refresh() {
  asio::post(io_, [this](){
    discovery_->refresh();
  });
}

void LibrarySession::rescan() {
  asio::post(io_, [this](){
    try {
      album_->rescan();
    } catch(const std::exception& e) {
      logger_->warn("Rescan failed: {}", e.what());
    }
    if(registered_) discovery_->heartbeat();
  });
}

void LibrarySession::set_share_all(bool enabled) {
  catalog_->set_share_all(enabled);
  asio::post(io_, [this](){ if(registered_) discovery_->heartbeat(); });
}

void LibrarySession::set_shared_songs(const std::vector<std::string>& paths) {
  catalog_->set_shared_paths(paths);
  asio::post(io_, [this](){ if(registered_) discovery_->heartbeat(); });
}

void LibrarySession::share_song(const std::string& path) {
  catalog_->share_path(path);
  asio::post(io_, [this](){ if(registered_) discovery_->heartbeat(); });
}

void LibrarySession::unshare_song(const std::string& path) {
  catalog_->unshare_path(path);
  asio::post(io_, [this](){ if(registered_) discovery_->heartbeat(); });
}

bool LibrarySession::set_discovery_server(const std::string& url) {
  if(!parse_server_url(url)) return false;
  persist_setting("discovery_url", url);
  asio::post(io_, [this, url](){
    bool reconnect = registered_;
    auto apply = [this, url, reconnect](){
      discovery_->set_server_url(url);
      if(reconnect) do_connect();
    };
    if(reconnect) {
      do_disconnect(apply);
    } else {
      apply();
    }
  });
  return true;
}

std::vector<LocalSong> LibrarySession::local_songs() {
  if(!catalog_) return {};
  return catalog_->local_songs();
}
