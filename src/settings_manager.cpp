#include "settings_manager.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "log.hpp"
#include "utils.hpp"

std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    if(entry.contains("aliases")) {
      spec.aliases = entry.at("aliases").get<std::vector<std::string>>();
      for(auto& alias : spec.aliases) alias = to_lower_copy(alias);
    }
    spec.type = entry.at("type").get<std::string>();
    spec.default_value = entry.at("default");
    spec.description = entry.value("description", "");
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specification_(specification),
    setting_specs_(build_setting_specs(specification)),
    settings_(nlohmann::json::object()) {
  for(const auto& spec : setting_specs_) {
    settings_[spec.key] = spec.default_value;
  }
}

const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower_copy(token);
  for(const auto& spec : setting_specs_) {
    if(lowered == to_lower_copy(spec.key)) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  out.reserve(setting_specs_.size());
  for(const auto& spec : setting_specs_) out.push_back(spec.key);
  return out;
}

std::string SettingsManager::value_as_string(const std::string& key) const {
  std::lock_guard lg(m_);
  if(!settings_.contains(key)) return "<unknown>";
  const auto& value = settings_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

std::string SettingsManager::description(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec ? spec->description : std::string();
}

std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == "bool";
}

void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  std::lock_guard lg(m_);
  settings_path_override_ = path;
}

std::filesystem::path SettingsManager::settings_path() const {
  std::lock_guard lg(m_);
  if(!settings_path_override_.empty()) return settings_path_override_;
  return std::filesystem::current_path() / ".config" / "settings.json";
}

bool SettingsManager::has_settings_path() const {
  std::lock_guard lg(m_);
  return !settings_path_override_.empty();
}

bool SettingsManager::load() {
  return load_from_file(settings_path());
}

bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const std::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  auto doc = get_json(true);
  std::ofstream out(path, std::ios::trunc);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << doc.dump(2);
  return static_cast<bool>(out);
}

void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  std::lock_guard lg(m_);
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!convert_and_store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  std::lock_guard lg(m_);
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : setting_specs_) {
    if(persistent_only && !spec.persistent) continue;
    if(settings_.contains(spec.key)) doc[spec.key] = settings_.at(spec.key);
  }
  return doc;
}

bool SettingsManager::convert_and_store(const SettingSpec& spec,
                                        const nlohmann::json& value,
                                        std::string& error) {
  if(spec.type == "bool") {
    if(value.is_boolean()) {
      settings_[spec.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      settings_[spec.key] = (value.get<int>() != 0);
      return true;
    }
    error = "expected boolean";
    return false;
  }
  if(spec.type == "int") {
    if(value.is_number_integer()) {
      settings_[spec.key] = value.get<int>();
      return true;
    }
    error = "expected integer";
    return false;
  }
  if(spec.type == "string") {
    if(value.is_string()) {
      settings_[spec.key] = value.get<std::string>();
      return true;
    }
    error = "expected string";
    return false;
  }
  if(spec.type == "list") {
    if(!value.is_array()) {
      error = "expected list of strings";
      return false;
    }
    nlohmann::json items = nlohmann::json::array();
    for(const auto& item : value) {
      if(!item.is_string()) {
        error = "expected list of strings";
        return false;
      }
      items.push_back(item);
    }
    settings_[spec.key] = std::move(items);
    return true;
  }
  error = "unknown type";
  return false;
}

nlohmann::json SettingsManager::parse_string_value(const SettingSpec& spec,
                                                   const std::string& value,
                                                   std::string& error) const {
  error.clear();
  std::string clean = trim_copy(value);
  if(spec.type == "bool") {
    std::string v = to_lower_copy(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(spec.type == "int") {
    try {
      std::size_t consumed = 0;
      int parsed = std::stoi(clean, &consumed);
      if(consumed != clean.size()) {
        error = "expected integer";
        return {};
      }
      return parsed;
    } catch(const std::exception& e) {
      error = e.what();
      return {};
    }
  }
  if(spec.type == "string") {
    return clean;
  }
  if(spec.type == "list") {
    // Either a JSON array or a comma separated list.
    if(!clean.empty() && clean.front() == '[') {
      try {
        return nlohmann::json::parse(clean);
      } catch(const std::exception& e) {
        error = e.what();
        return {};
      }
    }
    nlohmann::json items = nlohmann::json::array();
    std::istringstream iss(clean);
    std::string item;
    while(std::getline(iss, item, ',')) {
      item = trim_copy(item);
      if(!item.empty()) items.push_back(item);
    }
    return items;
  }
  error = "unsupported type";
  return {};
}

bool SettingsManager::set_from_string(const std::string& key,
                                      const std::string& value,
                                      std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  auto parsed = parse_string_value(*spec, value, error);
  if(!error.empty()) return false;
  std::lock_guard lg(m_);
  return convert_and_store(*spec, parsed, error);
}

bool SettingsManager::set_from_json(const std::string& key,
                                    const nlohmann::json& value,
                                    std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  std::lock_guard lg(m_);
  return convert_and_store(*spec, value, error);
}
