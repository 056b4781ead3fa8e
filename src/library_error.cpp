#include "library_error.hpp"

const char* to_string(LibraryErrorKind kind) {
  switch(kind) {
    case LibraryErrorKind::DiscoveryUnavailable: return "DiscoveryUnavailable";
    case LibraryErrorKind::TransportUnavailable: return "TransportUnavailable";
    case LibraryErrorKind::PeerUnreachable: return "PeerUnreachable";
    case LibraryErrorKind::PeerRejected: return "PeerRejected";
    case LibraryErrorKind::InvalidContent: return "InvalidContent";
    case LibraryErrorKind::PersistenceFailure: return "PersistenceFailure";
  }
  return "Unknown";
}

std::string LibraryError::describe() const {
  return std::string(to_string(kind)) + ": " + message;
}
