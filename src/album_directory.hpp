#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "log.hpp"

struct LocalSong {
  std::string path;  // absolute path, also the key of the share allow-list
  std::string name;  // file stem
  std::string hash;  // may be empty when the source could not fingerprint the file
  uint64_t size = 0;
  std::optional<double> duration;
  std::optional<int> bpm;
};

// The library the session shares from and saves downloads into.
class CatalogSource {
public:
  virtual ~CatalogSource() = default;

  // May throw; callers treat a throw as "nothing to share".
  virtual std::vector<LocalSong> list_songs() = 0;

  // Writes a validated song under a bare file name and returns the final path.
  // Throws std::runtime_error when the bytes cannot be stored.
  virtual std::string store_song(const std::string& filename, const std::string& bytes) = 0;

  // Whole file contents of a listed song. Throws std::runtime_error on failure.
  virtual std::string read_song(const std::string& path) = 0;

  // Called once after a download lands so the new song shows up.
  virtual void rescan() = 0;
};

// Directory of .mid files with a small metadata cache (.metadata_cache.json).
class AlbumDirectory : public CatalogSource {
public:
  explicit AlbumDirectory(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);

  std::vector<LocalSong> list_songs() override;
  std::string store_song(const std::string& filename, const std::string& bytes) override;
  std::string read_song(const std::string& path) override;
  void rescan() override;

  const std::filesystem::path& root() const { return root_; }
  std::size_t rescan_count() const;

  // 16 hex digits: size-seeded h = h*31 + byte over the first 8 KiB.
  static std::optional<std::string> quick_fingerprint(const std::filesystem::path& path);

private:
  struct CacheEntry {
    int64_t mtime = 0;
    uint64_t size = 0;
    std::string hash;
  };

  std::filesystem::path cache_path() const;
  void load_cache_locked();
  void save_cache_locked() const;

  std::filesystem::path root_;
  std::shared_ptr<Logger> logger_;
  mutable std::mutex m_;
  bool cache_loaded_ = false;
  std::unordered_map<std::string, CacheEntry> cache_;
  std::size_t rescans_ = 0;
};
