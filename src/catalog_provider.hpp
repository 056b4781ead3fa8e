#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "album_directory.hpp"

class SettingsManager;

struct SongDescriptor {
  std::string name;
  std::string hash;
  std::optional<double> duration;
  std::optional<int> bpm;
  uint64_t size = 0;
};

void to_json(nlohmann::json& j, const SongDescriptor& song);
void from_json(const nlohmann::json& j, SongDescriptor& song);

enum class LookupStatus { NotFound, NotShared, Shared };

struct SongLookup {
  LookupStatus status = LookupStatus::NotFound;
  LocalSong song; // filled for NotShared and Shared
};

// Identity and share policy live in SettingsManager (client_id, share_all,
// shared_songs); the song list comes from the CatalogSource.
class CatalogProvider {
public:
  CatalogProvider(std::shared_ptr<SettingsManager> settings,
                  std::shared_ptr<CatalogSource> source,
                  std::shared_ptr<Logger> logger = nullptr);

  std::string get_or_create_identity();

  // Never throws: a failing source shares nothing.
  std::vector<SongDescriptor> shareable_catalog();
  SongLookup lookup(const std::string& hash);

  bool share_all() const;
  std::vector<std::string> shared_paths() const;
  void set_share_all(bool enabled);
  void set_shared_paths(const std::vector<std::string>& paths);
  void share_path(const std::string& path);
  void unshare_path(const std::string& path);
  bool is_shared(const LocalSong& song) const;

  std::vector<LocalSong> local_songs();
  const std::shared_ptr<CatalogSource>& source() const { return source_; }

  // Fingerprint used when the source has none: SHA-256 of the contents,
  // SHA-256 of the path when the file cannot be read.
  static std::string fallback_hash(const std::string& path);
  static std::string normalize_path(const std::string& path);

private:
  std::vector<LocalSong> list_with_hashes();
  void persist();

  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<CatalogSource> source_;
  std::shared_ptr<Logger> logger_;
};
