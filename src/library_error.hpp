#pragma once

#include <string>

enum class LibraryErrorKind {
  DiscoveryUnavailable, // register/heartbeat/fetch failed; stale data kept
  TransportUnavailable, // endpoint bring-up or reconnect failed; user must re-enable
  PeerUnreachable,      // dial failure or transfer timeout
  PeerRejected,         // song_error from the remote, or a protocol violation
  InvalidContent,       // validator rejected the payload; nothing written
  PersistenceFailure    // validated bytes could not be stored
};

const char* to_string(LibraryErrorKind kind);

struct LibraryError {
  LibraryErrorKind kind = LibraryErrorKind::DiscoveryUnavailable;
  std::string message;

  std::string describe() const;
};

inline bool operator==(const LibraryError& a, const LibraryError& b) {
  return a.kind == b.kind && a.message == b.message;
}
