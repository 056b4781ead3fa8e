#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "discovery_client.hpp"
#include "library_error.hpp"

struct DownloadProgress {
  std::string song_name;
  int progress = 0; // 0..100
  std::string status;
};

struct ShareNotification {
  std::string song_name;
  std::string peer_display_name;
  std::chrono::system_clock::time_point timestamp;
};

struct TransferOutcome {
  std::string hash;
  std::string song_name;
  std::string saved_path;            // set on success
  std::optional<LibraryError> error; // set on failure

  bool succeeded() const { return !error; }
};

enum class StatusEvent {
  ProgressChanged,
  ErrorChanged,
  ShareNotified,
  CatalogChanged,
  ConnectionChanged,
  TransferFinished
};

const char* to_string(StatusEvent event);

// Observable state for front ends. Every mutator notifies listeners with a
// snapshot taken right after the change, outside the lock.
class LibraryStatus {
public:
  struct Snapshot {
    std::optional<DownloadProgress> download_progress;
    std::optional<LibraryError> last_error;
    std::optional<ShareNotification> share_notification;
    std::optional<TransferOutcome> last_transfer;
    bool connected = false;
    std::size_t online_peers = 0;
    std::vector<GlobalCatalogEntry> global_catalog;
    std::string transport_address;
    DiscoveryState discovery_state = DiscoveryState::Disconnected;
  };

  using Listener = std::function<void(StatusEvent, const Snapshot&)>;
  using ListenerHandle = std::size_t;

  ListenerHandle add_listener(Listener listener);
  void remove_listener(ListenerHandle handle);

  Snapshot snapshot() const;
  std::optional<DownloadProgress> download_progress() const;
  std::optional<LibraryError> last_error() const;
  std::vector<GlobalCatalogEntry> global_catalog() const;
  std::size_t online_peers() const;
  bool connected() const;

  // Single slot: the latest writer wins.
  void set_progress(std::optional<DownloadProgress> progress);
  void set_error(LibraryError error);
  void clear_error();
  void notify_share(ShareNotification notification);
  void set_catalog(std::vector<GlobalCatalogEntry> catalog, std::size_t online_peers);
  void set_connection(bool connected, std::string transport_address);
  void set_discovery_state(DiscoveryState state);
  void finish_transfer(TransferOutcome outcome);

  // Disconnect: peer count, catalog and connected flag reset together.
  void reset_connection();

private:
  void publish(StatusEvent event);

  mutable std::mutex m_;
  Snapshot state_;
  std::mutex listener_mutex_;
  std::unordered_map<ListenerHandle, Listener> listeners_;
  ListenerHandle next_listener_id_ = 1;
};
