#pragma once

#include <cstddef>
#include <optional>
#include <string>

inline constexpr std::size_t kMaxSongBytes = 50 * 1024 * 1024;

struct ValidationResult {
  bool accepted = false;
  std::string reason;             // empty when accepted
  std::string sanitized_filename; // bare file name safe to write, set when accepted

  explicit operator bool() const { return accepted; }
};

// Every byte that arrives from a peer passes through validate() before it is
// written or handed to the album. Pure: no I/O.
ValidationResult validate_song(const std::string& bytes, const std::string& proposed_filename);

// Reasons are returned instead of thrown; an empty optional means "ok".
std::optional<std::string> check_size(const std::string& bytes);
std::optional<std::string> detect_executable(const std::string& bytes);
std::optional<std::string> check_midi_structure(const std::string& bytes);

// Bare file name with a .mid extension, or nullopt when nothing usable is left.
std::optional<std::string> sanitize_filename(const std::string& proposed);
