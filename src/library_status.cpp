#include "library_status.hpp"

const char* to_string(StatusEvent event) {
  switch(event) {
    case StatusEvent::ProgressChanged: return "progress";
    case StatusEvent::ErrorChanged: return "error";
    case StatusEvent::ShareNotified: return "share";
    case StatusEvent::CatalogChanged: return "catalog";
    case StatusEvent::ConnectionChanged: return "connection";
    case StatusEvent::TransferFinished: return "transfer";
  }
  return "unknown";
}

LibraryStatus::ListenerHandle LibraryStatus::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard lg(listener_mutex_);
  auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void LibraryStatus::remove_listener(ListenerHandle handle) {
  std::lock_guard lg(listener_mutex_);
  listeners_.erase(handle);
}

LibraryStatus::Snapshot LibraryStatus::snapshot() const {
  std::lock_guard lg(m_);
  return state_;
}

std::optional<DownloadProgress> LibraryStatus::download_progress() const {
  std::lock_guard lg(m_);
  return state_.download_progress;
}

std::optional<LibraryError> LibraryStatus::last_error() const {
  std::lock_guard lg(m_);
  return state_.last_error;
}

std::vector<GlobalCatalogEntry> LibraryStatus::global_catalog() const {
  std::lock_guard lg(m_);
  return state_.global_catalog;
}

std::size_t LibraryStatus::online_peers() const {
  std::lock_guard lg(m_);
  return state_.online_peers;
}

bool LibraryStatus::connected() const {
  std::lock_guard lg(m_);
  return state_.connected;
}

void LibraryStatus::set_progress(std::optional<DownloadProgress> progress) {
  {
    std::lock_guard lg(m_);
    state_.download_progress = std::move(progress);
  }
  publish(StatusEvent::ProgressChanged);
}

void LibraryStatus::set_error(LibraryError error) {
  {
    std::lock_guard lg(m_);
    state_.last_error = std::move(error);
  }
  publish(StatusEvent::ErrorChanged);
}

void LibraryStatus::clear_error() {
  {
    std::lock_guard lg(m_);
    if(!state_.last_error) return;
    state_.last_error.reset();
  }
  publish(StatusEvent::ErrorChanged);
}

void LibraryStatus::notify_share(ShareNotification notification) {
  {
    std::lock_guard lg(m_);
    state_.share_notification = std::move(notification);
  }
  publish(StatusEvent::ShareNotified);
}

void LibraryStatus::set_catalog(std::vector<GlobalCatalogEntry> catalog, std::size_t online_peers) {
  {
    std::lock_guard lg(m_);
    state_.global_catalog = std::move(catalog);
    state_.online_peers = online_peers;
  }
  publish(StatusEvent::CatalogChanged);
}

void LibraryStatus::set_connection(bool connected, std::string transport_address) {
  {
    std::lock_guard lg(m_);
    state_.connected = connected;
    state_.transport_address = std::move(transport_address);
  }
  publish(StatusEvent::ConnectionChanged);
}

void LibraryStatus::set_discovery_state(DiscoveryState state) {
  {
    std::lock_guard lg(m_);
    if(state_.discovery_state == state) return;
    state_.discovery_state = state;
  }
  publish(StatusEvent::ConnectionChanged);
}

void LibraryStatus::finish_transfer(TransferOutcome outcome) {
  {
    std::lock_guard lg(m_);
    state_.last_transfer = std::move(outcome);
  }
  publish(StatusEvent::TransferFinished);
}

void LibraryStatus::reset_connection() {
  {
    std::lock_guard lg(m_);
    state_.connected = false;
    state_.transport_address.clear();
    state_.online_peers = 0;
    state_.global_catalog.clear();
    state_.discovery_state = DiscoveryState::Disconnected;
  }
  publish(StatusEvent::ConnectionChanged);
  publish(StatusEvent::CatalogChanged);
}

void LibraryStatus::publish(StatusEvent event) {
  std::vector<Listener> listeners;
  {
    std::lock_guard lg(listener_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& kv : listeners_) listeners.push_back(kv.second);
  }
  if(listeners.empty()) return;
  auto snap = snapshot();
  for(auto& listener : listeners) {
    listener(event, snap);
  }
}
