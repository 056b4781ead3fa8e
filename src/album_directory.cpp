#include "album_directory.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <fstream>
#include <iterator>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "content_validator.hpp"
#include "utils.hpp"

namespace {

constexpr int kCacheVersion = 1;
constexpr std::size_t kFingerprintWindow = 8192;

bool has_midi_extension(const std::filesystem::path& p) {
  auto ext = to_lower_copy(p.extension().string());
  return ext == ".mid" || ext == ".midi";
}

int64_t mtime_of(const std::filesystem::path& p) {
  std::error_code ec;
  auto t = std::filesystem::last_write_time(p, ec);
  if(ec) return 0;
  return static_cast<int64_t>(t.time_since_epoch().count());
}

} // namespace

AlbumDirectory::AlbumDirectory(std::filesystem::path root, std::shared_ptr<Logger> logger)
  : root_(std::move(root)), logger_(std::move(logger)) {}

std::filesystem::path AlbumDirectory::cache_path() const {
  return root_ / ".metadata_cache.json";
}

std::optional<std::string> AlbumDirectory::quick_fingerprint(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) return std::nullopt;
  std::array<char, kFingerprintWindow> buffer{};
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  auto got = in.gcount();
  if(in.bad()) return std::nullopt;

  std::error_code ec;
  auto file_size = std::filesystem::file_size(path, ec);
  if(ec) return std::nullopt;

  uint64_t hash = static_cast<uint64_t>(file_size);
  for(std::streamsize i = 0; i < got; ++i) {
    hash = hash * 31u + static_cast<unsigned char>(buffer[static_cast<std::size_t>(i)]);
  }
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << hash;
  return oss.str();
}

void AlbumDirectory::load_cache_locked() {
  if(cache_loaded_) return;
  cache_loaded_ = true;
  cache_.clear();
  std::ifstream in(cache_path());
  if(!in) return;
  try {
    nlohmann::json doc;
    in >> doc;
    if(doc.value("version", 0) != kCacheVersion) return;
    for(const auto& item : doc.value("files", nlohmann::json::object()).items()) {
      CacheEntry entry;
      entry.mtime = item.value().value("mtime", int64_t{0});
      entry.size = item.value().value("size", uint64_t{0});
      entry.hash = item.value().value("hash", "");
      cache_[item.key()] = std::move(entry);
    }
  } catch(const std::exception& e) {
    log_warn(logger_.get(), "Ignoring unreadable metadata cache {}: {}", cache_path().string(), e.what());
    cache_.clear();
  }
}

void AlbumDirectory::save_cache_locked() const {
  nlohmann::json files = nlohmann::json::object();
  for(const auto& kv : cache_) {
    files[kv.first] = {{"mtime", kv.second.mtime}, {"size", kv.second.size}, {"hash", kv.second.hash}};
  }
  nlohmann::json doc = {{"version", kCacheVersion}, {"files", files}};
  std::ofstream out(cache_path(), std::ios::trunc);
  if(!out) {
    log_warn(logger_.get(), "Unable to write metadata cache {}", cache_path().string());
    return;
  }
  out << doc.dump();
}

std::vector<LocalSong> AlbumDirectory::list_songs() {
  std::lock_guard lg(m_);
  std::vector<LocalSong> songs;
  std::error_code ec;
  if(!std::filesystem::is_directory(root_, ec)) return songs;

  load_cache_locked();
  bool cache_modified = false;

  std::filesystem::directory_iterator it(root_, ec);
  if(ec) {
    throw std::runtime_error("Cannot list " + root_.string() + ": " + ec.message());
  }
  for(const auto& entry : it) {
    if(!entry.is_regular_file(ec) || !has_midi_extension(entry.path())) continue;

    LocalSong song;
    song.path = std::filesystem::absolute(entry.path(), ec).lexically_normal().string();
    song.name = entry.path().stem().string();
    auto mtime = mtime_of(entry.path());

    auto cached = cache_.find(song.path);
    if(cached != cache_.end() && cached->second.mtime == mtime && !cached->second.hash.empty()) {
      song.hash = cached->second.hash;
      song.size = cached->second.size;
    } else {
      song.size = static_cast<uint64_t>(entry.file_size(ec));
      if(auto fp = quick_fingerprint(entry.path())) {
        song.hash = *fp;
        cache_[song.path] = CacheEntry{mtime, song.size, song.hash};
        cache_modified = true;
      }
    }
    songs.push_back(std::move(song));
  }

  std::sort(songs.begin(), songs.end(), [](const LocalSong& a, const LocalSong& b){
    return a.name < b.name;
  });
  if(cache_modified) save_cache_locked();
  return songs;
}

std::string AlbumDirectory::store_song(const std::string& filename, const std::string& bytes) {
  std::lock_guard lg(m_);
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if(ec) {
    throw std::runtime_error("Failed to create album directory: " + ec.message());
  }

  std::filesystem::path base(filename);
  auto stem = base.stem().string();
  auto ext = base.extension().string();
  auto target = root_ / filename;
  for(int counter = 1; std::filesystem::exists(target, ec); ++counter) {
    target = root_ / (stem + " (" + std::to_string(counter) + ")" + ext);
  }

  std::ofstream out(target, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw std::runtime_error("Failed to save file: cannot open " + target.string());
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.close();
  if(!out) {
    std::filesystem::remove(target, ec);
    throw std::runtime_error("Failed to save file: write error on " + target.string());
  }
  log_info(logger_.get(), "Saved {} ({} bytes)", target.string(), bytes.size());
  return target.string();
}

std::string AlbumDirectory::read_song(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if(!in) {
    throw std::runtime_error("Cannot open file");
  }
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  if(!ec && size > kMaxSongBytes) {
    throw std::runtime_error("File too large (>50MB)");
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if(in.bad()) {
    throw std::runtime_error("Failed to read file");
  }
  return bytes;
}

void AlbumDirectory::rescan() {
  {
    std::lock_guard lg(m_);
    ++rescans_;
    cache_loaded_ = false;
  }
  auto songs = list_songs();
  log_debug(logger_.get(), "Album rescan found {} songs", songs.size());
}

std::size_t AlbumDirectory::rescan_count() const {
  std::lock_guard lg(m_);
  return rescans_;
}
