#include "command_line_parser.hpp"

#include <algorithm>
#include <sstream>

#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
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

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          throw UsageError("Unknown option --" + key_token);
        }
        return false;
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw UsageError("Missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw UsageError("Invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      auto key = token.substr(2);
      auto eq = key.find('=');
      if(eq != std::string::npos) {
        auto resolved = settings.resolve_key(key.substr(0, eq));
        if(!resolved) throw UsageError("Unknown option --" + key.substr(0, eq));
        std::string error;
        if(!settings.set_from_string(*resolved, key.substr(eq + 1), error)) {
          throw UsageError("Invalid value for option '" + key.substr(0, eq) + "': " + error);
        }
        continue;
      }
      handle_option(key, true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      if(handle_option(token.substr(1), false)) {
        continue;
      }
    }

    if(positional_index >= positional_specs_.size()) {
      throw UsageError("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw UsageError("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

void CommandLineParser::usage() const {
  print_out(nullptr, "{} - directory tree checksum inventory", process_name_);
  print_out(nullptr, "Usage:");

  std::string cmd = process_name_ + " [options]";
  for(const auto& pos : positional_specs_) {
    cmd += " [" + pos.key + "]";
  }
  print_out(nullptr, "  {}", cmd);
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    auto type = entry.at("type").get<std::string>();
    std::string argument_hint = (type == "bool") ? "" : "<" + type + ">";
    std::ostringstream aliases;
    const auto alias_list = entry.value("aliases", std::vector<std::string>{});
    if(!alias_list.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << alias_list[i];
      }
      aliases << ")";
    }
    auto description = entry.value("description", "");
    const auto& default_value = entry.at("default");
    std::string default_str = default_value.is_string()
      ? default_value.get<std::string>()
      : default_value.dump();
    print_out(nullptr, "  --{:<26} {:<9} {}{} (default: {})",
              key,
              argument_hint,
              description,
              aliases.str(),
              default_str);
  }
  print_out(nullptr, "");
}
