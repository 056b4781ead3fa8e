#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "songmesh",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","album_dir"}},
                      {{"index",1},{"key","discovery_url"}},
                      {{"index",2},{"key","display_name"}}
                    }));

  // Returns false (after printing the problem and usage) on a bad argument.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);
  static bool is_bool_literal(const std::string& value);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};
