#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::vector<unsigned char> sha256_bytes(const std::string &data);
std::string sha256_hex(const std::string &data);

// Streams the file through SHA-256; nullopt when it cannot be read.
std::optional<std::string> sha256_file_hex(const std::string& path);

// Random RFC 4122 version-4 token, e.g. "3f2b...-....-4...-a...-............".
std::string generate_uuid_v4();

struct HostPort {
  std::string host;
  uint16_t port = 0;
};

// "host:port" or "[v6]:port"; nullopt for a missing or out-of-range port.
std::optional<HostPort> parse_host_port(const std::string& address);
std::string format_host_port(const std::string& host, uint16_t port);

std::string trim_copy(std::string value);
std::string to_lower_copy(std::string value);
