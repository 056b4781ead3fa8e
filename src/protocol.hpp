#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

#include <nlohmann/json.hpp>

// Peer wire messages, one JSON object per line.
//   {"type":"request_song","hash":...,"peerName":...}
//   {"type":"song_data","hash":...,"name":...,"filename":...,"data":<base64>}
//   {"type":"song_error","hash":...,"error":...}

struct RequestSong {
  std::string hash;
  std::string peer_name;
};

struct SongData {
  std::string hash;
  std::string name;
  std::string filename;
  std::string data; // base64 text as carried on the wire
};

struct SongError {
  std::string hash;
  std::string error;
};

using PeerMessage = std::variant<RequestSong, SongData, SongError>;

class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

nlohmann::json encode_message(const PeerMessage& message);

// Throws ProtocolError for a non-object, a missing/unknown "type", or a
// required field of the wrong type.
PeerMessage decode_message(const nlohmann::json& j);
PeerMessage decode_line(const std::string& line);

const char* message_type(const PeerMessage& message);

SongData make_song_data(const std::string& hash,
                        const std::string& name,
                        const std::string& filename,
                        const std::string& bytes);

// nullopt when the payload is not valid base64.
std::optional<std::string> decode_payload(const SongData& message);
