#pragma once

#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "album_directory.hpp"
#include "catalog_provider.hpp"
#include "discovery_client.hpp"
#include "library_status.hpp"
#include "log.hpp"
#include "peer_transport.hpp"
#include "song_transfer.hpp"

class SettingsManager;

// One running library: transport endpoint, discovery registration, transfers
// and the observable status. All network work runs on the session's own
// io_context; the public entry points are safe to call from any thread.
class LibrarySession {
public:
  struct Options {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds fetch_interval{std::chrono::seconds(15)};
    std::chrono::milliseconds http_timeout{std::chrono::seconds(5)};
    std::chrono::milliseconds transfer_timeout{std::chrono::seconds(15)};
    std::chrono::milliseconds progress_clear_delay{std::chrono::seconds(2)};
    // Null: an AlbumDirectory over <workspace_root>/<album_dir>.
    std::shared_ptr<CatalogSource> catalog_source;
  };

  LibrarySession(std::shared_ptr<SettingsManager> settings, Options options);
  ~LibrarySession();

  LibrarySession(const LibrarySession&) = delete;
  LibrarySession& operator=(const LibrarySession&) = delete;

  void start();
  void run();
  void start_background();
  void stop();

  // Opens the transport and registers; retries registration only when asked again.
  void connect();
  void disconnect();
  // Flips library_enabled and connects or disconnects to match.
  void toggle_library();
  void request_song(const GlobalCatalogEntry& entry);
  void refresh();
  void rescan();

  void set_share_all(bool enabled);
  void set_shared_songs(const std::vector<std::string>& paths);
  void share_song(const std::string& path);
  void unshare_song(const std::string& path);
  // false for a URL that is not http(s)://host[:port]; reconnects when connected.
  bool set_discovery_server(const std::string& url);

  std::vector<LocalSong> local_songs();

  // Feeds a listener failure to the transport as its accept loop would:
  // the first one re-opens the listener, a second one tears it down.
  void report_listener_error(const std::error_code& ec);

  LibraryStatus& status() { return status_; }
  const LibraryStatus& status() const { return status_; }
  std::shared_ptr<SettingsManager> settings() const { return settings_; }
  std::shared_ptr<CatalogProvider> catalog() const { return catalog_; }
  std::shared_ptr<Logger> logger() const { return logger_; }
  const std::string& client_identity() const { return client_identity_; }
  const std::string& display_name() const { return display_name_; }
  std::string transport_address() const { return status_.snapshot().transport_address; }
  const std::filesystem::path& workspace_root() const { return options_.workspace_root; }

  static std::string generate_display_name();

private:
  void do_connect();
  void do_disconnect(std::function<void()> done = {});
  void on_registered(const std::optional<LibraryError>& error);
  void on_transport_lost(const LibraryError& error);
  void on_inbound(Connection::Ptr conn);
  void on_download_finished(const SongDownload::Ptr& download, const TransferOutcome& outcome);
  void set_progress(std::optional<DownloadProgress> progress);
  void persist_setting(const std::string& key, const nlohmann::json& value);
  PeerTransport::Options transport_options() const;

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::unique_ptr<PeerTransport> transport_;
  std::unique_ptr<DiscoveryClient> discovery_;
  std::unique_ptr<asio::steady_timer> progress_clear_timer_;
  std::shared_ptr<CatalogSource> album_;
  std::shared_ptr<CatalogProvider> catalog_;
  std::vector<SongDownload::Ptr> downloads_;
  LibraryStatus status_;
  std::string client_identity_;
  std::string display_name_;
  bool started_ = false;
  bool registered_ = false;
  bool registering_ = false;
  uint64_t epoch_ = 0; // bumped on every disconnect; stale register replies are dropped
};
