#include "catalog_provider.hpp"

#include <algorithm>
#include <filesystem>

#include "settings_manager.hpp"
#include "utils.hpp"

void to_json(nlohmann::json& j, const SongDescriptor& song) {
  j = nlohmann::json{{"name", song.name}, {"hash", song.hash}, {"size", song.size}};
  j["duration"] = song.duration ? nlohmann::json(*song.duration) : nlohmann::json(nullptr);
  j["bpm"] = song.bpm ? nlohmann::json(*song.bpm) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, SongDescriptor& song) {
  song.name = j.value("name", "");
  song.hash = j.value("hash", "");
  song.size = 0;
  if(j.contains("size") && j["size"].is_number()) {
    song.size = j["size"].get<uint64_t>();
  }
  song.duration.reset();
  if(j.contains("duration") && j["duration"].is_number()) {
    song.duration = j["duration"].get<double>();
  }
  song.bpm.reset();
  if(j.contains("bpm") && j["bpm"].is_number()) {
    song.bpm = static_cast<int>(j["bpm"].get<double>());
  }
}

CatalogProvider::CatalogProvider(std::shared_ptr<SettingsManager> settings,
                                 std::shared_ptr<CatalogSource> source,
                                 std::shared_ptr<Logger> logger)
  : settings_(std::move(settings)), source_(std::move(source)), logger_(std::move(logger)) {}

std::string CatalogProvider::get_or_create_identity() {
  auto id = settings_->get<std::string>("client_id");
  if(!id.empty()) return id;

  id = generate_uuid_v4();
  std::string error;
  if(!settings_->set_from_json("client_id", id, error)) {
    throw std::runtime_error("Unable to store client id: " + error);
  }
  persist();
  log_info(logger_.get(), "Generated client id {}", id);
  return id;
}

std::string CatalogProvider::normalize_path(const std::string& path) {
  std::error_code ec;
  auto abs = std::filesystem::absolute(std::filesystem::path(path), ec);
  if(ec) return std::filesystem::path(path).lexically_normal().string();
  return abs.lexically_normal().string();
}

std::string CatalogProvider::fallback_hash(const std::string& path) {
  if(auto digest = sha256_file_hex(path)) return *digest;
  return sha256_hex(path);
}

bool CatalogProvider::share_all() const {
  return settings_->get<bool>("share_all");
}

std::vector<std::string> CatalogProvider::shared_paths() const {
  return settings_->get<std::vector<std::string>>("shared_songs");
}

bool CatalogProvider::is_shared(const LocalSong& song) const {
  if(share_all()) return true;
  auto paths = shared_paths();
  auto target = normalize_path(song.path);
  return std::any_of(paths.begin(), paths.end(), [&](const std::string& p){
    return normalize_path(p) == target;
  });
}

void CatalogProvider::set_share_all(bool enabled) {
  std::string error;
  if(!settings_->set_from_json("share_all", enabled, error)) {
    log_warn(logger_.get(), "share_all: {}", error);
    return;
  }
  persist();
}

void CatalogProvider::set_shared_paths(const std::vector<std::string>& paths) {
  nlohmann::json list = nlohmann::json::array();
  for(const auto& p : paths) {
    auto normalized = normalize_path(p);
    if(std::find(list.begin(), list.end(), normalized) == list.end()) {
      list.push_back(normalized);
    }
  }
  std::string error;
  if(!settings_->set_from_json("shared_songs", list, error)) {
    log_warn(logger_.get(), "shared_songs: {}", error);
    return;
  }
  persist();
}

void CatalogProvider::share_path(const std::string& path) {
  auto paths = shared_paths();
  paths.push_back(path);
  set_shared_paths(paths);
}

void CatalogProvider::unshare_path(const std::string& path) {
  auto target = normalize_path(path);
  auto paths = shared_paths();
  paths.erase(std::remove_if(paths.begin(), paths.end(), [&](const std::string& p){
    return normalize_path(p) == target;
  }), paths.end());
  set_shared_paths(paths);
}

void CatalogProvider::persist() {
  if(!settings_->save()) {
    log_warn(logger_.get(), "Unable to persist settings to {}", settings_->settings_path().string());
  }
}

std::vector<LocalSong> CatalogProvider::list_with_hashes() {
  auto songs = source_->list_songs();
  for(auto& song : songs) {
    if(song.hash.empty()) {
      song.hash = fallback_hash(song.path);
    }
  }
  return songs;
}

std::vector<LocalSong> CatalogProvider::local_songs() {
  try {
    return list_with_hashes();
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Catalog query failed: {}", e.what());
    return {};
  }
}

std::vector<SongDescriptor> CatalogProvider::shareable_catalog() {
  std::vector<SongDescriptor> out;
  for(const auto& song : local_songs()) {
    if(!is_shared(song)) continue;
    SongDescriptor d;
    d.name = song.name;
    d.hash = song.hash;
    d.duration = song.duration;
    d.bpm = song.bpm;
    d.size = song.size;
    out.push_back(std::move(d));
  }
  return out;
}

SongLookup CatalogProvider::lookup(const std::string& hash) {
  SongLookup result;
  if(hash.empty()) return result;
  for(auto& song : local_songs()) {
    if(song.hash != hash) continue;
    result.status = is_shared(song) ? LookupStatus::Shared : LookupStatus::NotShared;
    result.song = std::move(song);
    return result;
  }
  return result;
}
