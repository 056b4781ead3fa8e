#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

#include "log.hpp"
#include "utils.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe;
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw std::runtime_error("ARGV specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower_copy(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  auto fail = [&](const std::string& message){
    print_err(nullptr, "{}", message);
    usage(settings);
    return false;
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];
    std::string key_token;
    bool long_form = false;

    if(token.rfind("--", 0) == 0) {
      key_token = token.substr(2);
      long_form = true;
    } else if(token.size() > 1 && token[0] == '-') {
      key_token = token.substr(1);
    }

    if(!key_token.empty()) {
      // --key=value is accepted as well as --key value
      std::string inline_value;
      bool has_inline = false;
      auto eq = key_token.find('=');
      if(eq != std::string::npos) {
        inline_value = key_token.substr(eq + 1);
        key_token = key_token.substr(0, eq);
        has_inline = true;
      }

      auto resolved = settings.resolve_key(key_token);
      if(resolved) {
        std::string value;
        if(has_inline) {
          value = inline_value;
        } else if(settings.is_bool_setting(*resolved)) {
          if(i + 1 < args.size() && !is_option_token(args[i + 1]) && is_bool_literal(args[i + 1])) {
            value = args[++i];
          } else {
            value = "true";
          }
        } else {
          if(i + 1 >= args.size()) {
            return fail("Missing value for option '" + key_token + "'");
          }
          value = args[++i];
        }
        std::string error;
        if(!settings.set_from_string(*resolved, value, error)) {
          return fail("Invalid value for option '" + key_token + "': " + error);
        }
        continue;
      }
      if(long_form) {
        return fail("Unknown option --" + key_token);
      }
      // unknown short alias falls through to positional
    }

    if(positional_index >= positional_specs_.size()) {
      return fail("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      return fail("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - peer-to-peer song library", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings.specification()) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    if(entry.contains("aliases")) {
      const auto alias_list = entry.at("aliases").get<std::vector<std::string>>();
      if(!alias_list.empty()) {
        aliases << " (alias: ";
        for(std::size_t i = 0; i < alias_list.size(); ++i) {
          if(i > 0) aliases << ", ";
          aliases << "-" << alias_list[i];
        }
        aliases << ")";
      }
    }
    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{:<16} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              entry.value("description", ""),
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
