#include "utils.hpp"
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> sha256_bytes(const std::string &data){
    std::vector<unsigned char> out(SHA256_DIGEST_LENGTH);
    SHA256((const unsigned char*)data.data(), data.size(), out.data());
    return out;
}

std::string sha256_hex(const std::string &data){
    return hex_from_bytes(sha256_bytes(data));
}

std::optional<std::string> sha256_file_hex(const std::string& path){
    std::ifstream in(path, std::ios::binary);
    if(!in) return std::nullopt;
    SHA256_CTX ctx;
    if(SHA256_Init(&ctx) != 1) return std::nullopt;
    std::array<char, 64 * 1024> buffer{};
    while(in){
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = in.gcount();
        if(got > 0 && SHA256_Update(&ctx, buffer.data(), static_cast<std::size_t>(got)) != 1){
            return std::nullopt;
        }
    }
    if(in.bad()) return std::nullopt;
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    if(SHA256_Final(digest.data(), &ctx) != 1) return std::nullopt;
    return hex_from_bytes(digest);
}

std::string generate_uuid_v4(){
    std::vector<unsigned char> raw(16);
    if(RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1){
        throw std::runtime_error("RAND_bytes failed while generating client id");
    }
    raw[6] = static_cast<unsigned char>((raw[6] & 0x0F) | 0x40);
    raw[8] = static_cast<unsigned char>((raw[8] & 0x3F) | 0x80);
    auto hex = hex_from_bytes(raw);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::optional<HostPort> parse_host_port(const std::string& address){
    auto clean = trim_copy(address);
    std::string host;
    std::string port_text;
    if(!clean.empty() && clean.front() == '['){
        auto close = clean.find(']');
        if(close == std::string::npos || close + 1 >= clean.size() || clean[close + 1] != ':') return std::nullopt;
        host = clean.substr(1, close - 1);
        port_text = clean.substr(close + 2);
    } else {
        auto pos = clean.rfind(':');
        if(pos == std::string::npos) return std::nullopt;
        host = clean.substr(0, pos);
        port_text = clean.substr(pos + 1);
    }
    if(host.empty() || port_text.empty()) return std::nullopt;
    if(!std::all_of(port_text.begin(), port_text.end(), [](unsigned char c){ return std::isdigit(c); })) return std::nullopt;
    if(port_text.size() > 5) return std::nullopt;
    int port = std::stoi(port_text);
    if(port <= 0 || port > 65535) return std::nullopt;
    return HostPort{host, static_cast<uint16_t>(port)};
}

std::string format_host_port(const std::string& host, uint16_t port){
    if(host.find(':') != std::string::npos) return "[" + host + "]:" + std::to_string(port);
    return host + ":" + std::to_string(port);
}

std::string trim_copy(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::string to_lower_copy(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}
