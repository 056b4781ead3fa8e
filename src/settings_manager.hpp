#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

// One row per setting: key, aliases, type (bool|int|string|list), default,
// description, and whether `save` writes it to settings.json.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","library_enabled"}, {"aliases", {"enabled","le"}},     {"type","bool"},   {"default",false},       {"description","Connect to the song library at start-up"}, {"persistent", true}},
  {{"key","share_all"},       {"aliases", {"sa"}},               {"type","bool"},   {"default",false},       {"description","Share every song in the album directory"}, {"persistent", true}},
  {{"key","shared_songs"},    {"aliases", {"shared"}},           {"type","list"},   {"default",nlohmann::json::array()}, {"description","Paths shared when share_all is off"}, {"persistent", true}},
  {{"key","discovery_url"},   {"aliases", {"server","du"}},      {"type","string"}, {"default","http://127.0.0.1:3456"}, {"description","Discovery server base URL"}, {"persistent", true}},
  {{"key","client_id"},       {"aliases", {"id"}},               {"type","string"}, {"default",""},          {"description","Persistent client identity (generated when empty)"}, {"persistent", true}},
  {{"key","display_name"},    {"aliases", {"name","dn"}},        {"type","string"}, {"default",""},          {"description","Name shown to other peers"}, {"persistent", true}},
  {{"key","album_dir"},       {"aliases", {"album"}},            {"type","string"}, {"default","album"},     {"description","Directory holding .mid files (relative to workspace)"}, {"persistent", true}},
  {{"key","listen_ip"},       {"aliases", {"li"}},               {"type","string"}, {"default","127.0.0.1"}, {"description","Interface/IP the peer transport binds"}, {"persistent", true}},
  {{"key","listen_port"},     {"aliases", {"lp"}},               {"type","int"},    {"default",0},           {"description","Peer transport port (0 = ephemeral)"}, {"persistent", true}},
  {{"key","advertise_host"},  {"aliases", {"ah"}},               {"type","string"}, {"default",""},          {"description","Host other peers dial (defaults to listen_ip)"}, {"persistent", true}},
  {{"key","host_discovery"},  {"aliases", {"hd","devserver"}},   {"type","bool"},   {"default",false},       {"description","Run a discovery server in-process"}, {"persistent", true}},
  {{"key","discovery_port"},  {"aliases", {"dp"}},               {"type","int"},    {"default",3456},        {"description","Port for the in-process discovery server"}, {"persistent", true}},
  {{"key","verbose"},         {"aliases", {"v"}},                {"type","bool"},   {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},            {"aliases", {"h","?"}},            {"type","bool"},   {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},            {"aliases", {"persist"}},          {"type","bool"},   {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::string description(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);
  bool has_settings_path() const;

  nlohmann::json get_json(bool persistent_only = true) const;
  const nlohmann::json& specification() const { return specification_; }

private:
  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::string description;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  const SettingSpec* find_spec(const std::string& token) const;

  void merge_from_json(const nlohmann::json& doc);
  bool convert_and_store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  nlohmann::json parse_string_value(const SettingSpec& spec, const std::string& value, std::string& error) const;

  nlohmann::json specification_;
  std::vector<SettingSpec> setting_specs_;
  mutable std::mutex m_;
  nlohmann::json settings_;
  std::filesystem::path settings_path_override_;
};

template<typename T>
T SettingsManager::get(const std::string& key) const {
  std::lock_guard lg(m_);
  if(!settings_.contains(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return settings_.at(key).get<T>();
}
