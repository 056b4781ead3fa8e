#include "protocol.hpp"

#include "base64.h"

#include <cctype>

namespace {

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

std::string required_string(const nlohmann::json& j, const char* key, const std::string& type) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) {
    throw ProtocolError(type + " is missing string field '" + key + "'");
  }
  return it->get<std::string>();
}

std::string optional_string(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return std::string();
  return it->get<std::string>();
}

bool is_base64_text(const std::string& s) {
  if(s.size() % 4 != 0) return false;
  std::size_t padding = 0;
  for(std::size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if(c == '=') {
      ++padding;
      continue;
    }
    if(padding > 0) return false;
    if(!std::isalnum(c) && c != '+' && c != '/') return false;
  }
  return padding <= 2;
}

} // namespace

nlohmann::json encode_message(const PeerMessage& message) {
  return std::visit(overloaded{
    [](const RequestSong& m) {
      return nlohmann::json{{"type", "request_song"}, {"hash", m.hash}, {"peerName", m.peer_name}};
    },
    [](const SongData& m) {
      return nlohmann::json{{"type", "song_data"}, {"hash", m.hash}, {"name", m.name},
                            {"filename", m.filename}, {"data", m.data}};
    },
    [](const SongError& m) {
      return nlohmann::json{{"type", "song_error"}, {"hash", m.hash}, {"error", m.error}};
    }
  }, message);
}

PeerMessage decode_message(const nlohmann::json& j) {
  if(!j.is_object()) {
    throw ProtocolError("message is not a JSON object");
  }
  auto type = required_string(j, "type", "message");
  if(type == "request_song") {
    RequestSong m;
    m.hash = required_string(j, "hash", type);
    m.peer_name = optional_string(j, "peerName");
    return m;
  }
  if(type == "song_data") {
    SongData m;
    m.hash = required_string(j, "hash", type);
    m.name = optional_string(j, "name");
    m.filename = optional_string(j, "filename");
    m.data = required_string(j, "data", type);
    return m;
  }
  if(type == "song_error") {
    SongError m;
    m.hash = optional_string(j, "hash");
    m.error = required_string(j, "error", type);
    return m;
  }
  throw ProtocolError("unknown message type '" + type + "'");
}

PeerMessage decode_line(const std::string& line) {
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(line);
  } catch(const nlohmann::json::parse_error& e) {
    throw ProtocolError(std::string("malformed frame: ") + e.what());
  }
  return decode_message(j);
}

const char* message_type(const PeerMessage& message) {
  return std::visit(overloaded{
    [](const RequestSong&) { return "request_song"; },
    [](const SongData&) { return "song_data"; },
    [](const SongError&) { return "song_error"; }
  }, message);
}

SongData make_song_data(const std::string& hash,
                        const std::string& name,
                        const std::string& filename,
                        const std::string& bytes) {
  SongData m;
  m.hash = hash;
  m.name = name;
  m.filename = filename;
  m.data = base64_encode(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
  return m;
}

std::optional<std::string> decode_payload(const SongData& message) {
  if(!is_base64_text(message.data)) return std::nullopt;
  try {
    return base64_decode(message.data);
  } catch(const std::exception&) {
    return std::nullopt;
  }
}
