#include "content_validator.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <cstring>

#include "utils.hpp"

namespace {

bool starts_with_bytes(const std::string& bytes, const char* magic, std::size_t len) {
  return bytes.size() >= len && std::memcmp(bytes.data(), magic, len) == 0;
}

uint32_t read_be32(const std::string& bytes, std::size_t offset) {
  auto b = [&](std::size_t i){ return static_cast<uint32_t>(static_cast<unsigned char>(bytes[offset + i])); };
  return (b(0) << 24) | (b(1) << 16) | (b(2) << 8) | b(3);
}

std::string lowered_prefix(const std::string& bytes, std::size_t len) {
  return to_lower_copy(bytes.substr(0, std::min(len, bytes.size())));
}

// Variable-length quantity, at most four bytes.
std::optional<uint32_t> read_vlq(const std::string& bytes, std::size_t& pos, std::size_t end) {
  uint32_t value = 0;
  for(int i = 0; i < 4; ++i) {
    if(pos >= end) return std::nullopt;
    auto b = static_cast<unsigned char>(bytes[pos++]);
    value = (value << 7) | (b & 0x7F);
    if(!(b & 0x80)) return value;
  }
  return std::nullopt;
}

// Event walk over one MTrk body: delta times, running status, channel
// messages, meta and sysex events. Stops at End of Track.
std::optional<std::string> check_track_events(const std::string& bytes, std::size_t pos, std::size_t end) {
  unsigned char running = 0;
  while(pos < end) {
    if(!read_vlq(bytes, pos, end)) return "Invalid delta time in track";
    if(pos >= end) return "Truncated track event";

    auto status = static_cast<unsigned char>(bytes[pos]);
    if(status & 0x80) {
      ++pos;
    } else if(running) {
      status = running;
    } else {
      return "Track data without a status byte";
    }

    if(status == 0xFF) {
      if(pos >= end) return "Truncated meta event";
      auto type = static_cast<unsigned char>(bytes[pos++]);
      auto length = read_vlq(bytes, pos, end);
      if(!length || *length > end - pos) return "Truncated meta event";
      pos += *length;
      if(type == 0x2F) return std::nullopt;
      continue;
    }
    if(status == 0xF0 || status == 0xF7) {
      auto length = read_vlq(bytes, pos, end);
      if(!length || *length > end - pos) return "Truncated sysex event";
      pos += *length;
      continue;
    }
    if(status > 0xF0) return "Unexpected system message in track";

    running = status;
    std::size_t data_bytes = ((status & 0xF0) == 0xC0 || (status & 0xF0) == 0xD0) ? 1 : 2;
    if(data_bytes > end - pos) return "Truncated channel message";
    for(std::size_t i = 0; i < data_bytes; ++i) {
      if(static_cast<unsigned char>(bytes[pos + i]) & 0x80) return "Invalid channel message data";
    }
    pos += data_bytes;
  }
  return std::nullopt;
}

constexpr std::size_t kHeaderChunkSize = 14; // "MThd" + length + 6 bytes of header data
constexpr std::size_t kMinMidiSize = 22;     // header chunk + one track chunk header

} // namespace

std::optional<std::string> check_size(const std::string& bytes) {
  if(bytes.size() > kMaxSongBytes) {
    return "File too large (>50MB)";
  }
  return std::nullopt;
}

std::optional<std::string> detect_executable(const std::string& bytes) {
  if(bytes.size() < 4) return std::nullopt;

  if(starts_with_bytes(bytes, "MZ", 2)) return "Windows executable (MZ)";
  if(starts_with_bytes(bytes, "\x7F" "ELF", 4)) return "Linux executable (ELF)";

  static const std::array<const char*, 4> kMachO = {
    "\xFE\xED\xFA\xCE", "\xFE\xED\xFA\xCF", "\xCE\xFA\xED\xFE", "\xCF\xFA\xED\xFE"
  };
  for(const auto* magic : kMachO) {
    if(starts_with_bytes(bytes, magic, 4)) return "macOS executable (Mach-O)";
  }
  if(starts_with_bytes(bytes, "\xCA\xFE\xBA\xBE", 4)) return "Java class file";
  if(starts_with_bytes(bytes, "#!", 2)) return "Shell script";

  auto head = lowered_prefix(bytes, 10);
  if(head.rfind("@echo", 0) == 0 || head.rfind("rem ", 0) == 0) return "Windows batch file";

  if(bytes.size() >= 10) {
    auto prefix = lowered_prefix(bytes, 100);
    for(const char* marker : {"powershell", "invoke-", "$env:", "set-executionpolicy"}) {
      if(prefix.find(marker) != std::string::npos) return "PowerShell script";
    }
  }

  const std::size_t scan = std::min<std::size_t>(1024, bytes.size());
  for(std::size_t i = 0; i + 4 <= scan; ++i) {
    if(std::memcmp(bytes.data() + i, "PE\0\0", 4) == 0) return "Embedded PE executable";
  }
  return std::nullopt;
}

std::optional<std::string> check_midi_structure(const std::string& bytes) {
  if(bytes.size() < 4 || !starts_with_bytes(bytes, "MThd", 4)) {
    return "Missing MIDI header (MThd)";
  }
  if(bytes.size() < kHeaderChunkSize) {
    return "Truncated MIDI header";
  }
  if(read_be32(bytes, 4) != 6) {
    return "Unexpected MIDI header length";
  }
  auto format = (static_cast<unsigned char>(bytes[8]) << 8) | static_cast<unsigned char>(bytes[9]);
  if(format > 2) {
    return "Unsupported MIDI format";
  }
  if(bytes.size() < kMinMidiSize) {
    return "Missing track header (MTrk)";
  }
  if(!starts_with_bytes(bytes.substr(kHeaderChunkSize, 4), "MTrk", 4)) {
    return "Missing track header (MTrk)";
  }

  // Walk every chunk after the header; each declared length must fit.
  std::size_t offset = kHeaderChunkSize;
  std::size_t tracks = 0;
  while(offset < bytes.size()) {
    if(bytes.size() - offset < 8) {
      return "Truncated chunk header";
    }
    uint32_t length = read_be32(bytes, offset + 4);
    if(length > bytes.size() - offset - 8) {
      return "Chunk length exceeds file size";
    }
    if(std::memcmp(bytes.data() + offset, "MTrk", 4) == 0) {
      if(auto reason = check_track_events(bytes, offset + 8, offset + 8 + length)) return reason;
      ++tracks;
    }
    offset += 8 + static_cast<std::size_t>(length);
  }
  if(tracks == 0) {
    return "Missing track header (MTrk)";
  }
  return std::nullopt;
}

std::optional<std::string> sanitize_filename(const std::string& proposed) {
  std::string name = proposed;
  auto sep = name.find_last_of("/\\");
  if(sep != std::string::npos) name = name.substr(sep + 1);

  static const std::string kForbidden = ":*?\"<>|";
  name.erase(std::remove_if(name.begin(), name.end(), [](unsigned char c){
    return c < 0x20 || c == 0x7F || kForbidden.find(static_cast<char>(c)) != std::string::npos;
  }), name.end());

  auto not_trimmed = [](unsigned char c){ return c != ' ' && c != '.'; };
  auto first = std::find_if(name.begin(), name.end(), not_trimmed);
  auto last = std::find_if(name.rbegin(), name.rend(), not_trimmed).base();
  name = (first < last) ? std::string(first, last) : std::string();

  if(name.empty()) return std::nullopt;

  auto lowered = to_lower_copy(name);
  auto ends_with = [&](const std::string& suffix){
    return lowered.size() > suffix.size() &&
           lowered.compare(lowered.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  if(!ends_with(".mid") && !ends_with(".midi")) {
    name += ".mid";
  }
  return name;
}

ValidationResult validate_song(const std::string& bytes, const std::string& proposed_filename) {
  ValidationResult result;
  if(auto reason = check_size(bytes)) {
    result.reason = *reason;
    return result;
  }
  if(auto kind = detect_executable(bytes)) {
    result.reason = "Blocked " + *kind;
    return result;
  }
  if(auto reason = check_midi_structure(bytes)) {
    result.reason = *reason;
    return result;
  }
  auto safe_name = sanitize_filename(proposed_filename);
  if(!safe_name) {
    result.reason = "Invalid filename";
    return result;
  }
  result.accepted = true;
  result.sanitized_filename = *safe_name;
  return result;
}
