#include "bflow/config/config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <sstream>

#include <toml++/toml.hpp>

#include "bflow/outline/section_locator.hpp"
#include "bflow/util/filesystem.hpp"
#include "bflow/util/xdg.hpp"

namespace bflow::config {

namespace {

constexpr int kMaxIndentWidth = 16;

std::string joinStates(const std::vector<std::string>& states) {
  std::string joined;
  for (size_t i = 0; i < states.size(); ++i) {
    if (i > 0) joined += ",";
    joined += states[i];
  }
  return joined;
}

std::vector<std::string> splitStates(const std::string& value) {
  std::vector<std::string> states;
  std::istringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    auto begin = part.find_first_not_of(" \t");
    if (begin == std::string::npos) continue;
    auto end = part.find_last_not_of(" \t");
    states.push_back(part.substr(begin, end - begin + 1));
  }
  return states;
}

Result<bool> parseBool(const std::string& value) {
  if (value == "true" || value == "yes" || value == "1") return true;
  if (value == "false" || value == "no" || value == "0") return false;
  return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid boolean value: " + value));
}

Result<int> parseInt(const std::string& value) {
  int result = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
  if (ec != std::errc{} || ptr != value.data() + value.size()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Invalid integer value: " + value));
  }
  return result;
}

}  // namespace

Result<void> Config::load(const std::filesystem::path& config_path) {
  config_path_ = config_path;

  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["todo_heading"].value<std::string>()) {
      todo_heading = *value;
    }
    if (auto value = config_data["log_heading"].value<std::string>()) {
      log_heading = *value;
    }
    if (auto value = config_data["indent_width"].value<int64_t>()) {
      indent_width = static_cast<int>(*value);
    }
    if (auto states = config_data["trigger_states"].as_array()) {
      trigger_states.clear();
      for (const auto& item : *states) {
        if (auto state = item.value<std::string>()) {
          trigger_states.push_back(*state);
        }
      }
    }
    if (auto value = config_data["reopen_scheduled"].value<bool>()) {
      reopen_scheduled = *value;
    }

    if (auto logging_table = config_data["logging"].as_table()) {
      if (auto value = (*logging_table)["level"].value<std::string>()) {
        logging.level = *value;
      }
      if (auto value = (*logging_table)["file"].value<bool>()) {
        logging.file = *value;
      }
      if (auto value = (*logging_table)["file_path"].value<std::string>()) {
        logging.file_path = *value;
      }
    }

    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::save(const std::filesystem::path& config_path) const {
  std::filesystem::path save_path = config_path.empty() ? config_path_ : config_path;

  if (save_path.empty()) {
    save_path = defaultConfigPath();
  }

  try {
    toml::table config_data;

    config_data.insert_or_assign("todo_heading", todo_heading);
    config_data.insert_or_assign("log_heading", log_heading);
    config_data.insert_or_assign("indent_width", indent_width);

    auto states_array = toml::array{};
    for (const auto& state : trigger_states) {
      states_array.push_back(state);
    }
    config_data.insert_or_assign("trigger_states", states_array);
    config_data.insert_or_assign("reopen_scheduled", reopen_scheduled);

    auto logging_table = toml::table{};
    logging_table.insert_or_assign("level", logging.level);
    logging_table.insert_or_assign("file", logging.file);
    if (!logging.file_path.empty()) {
      logging_table.insert_or_assign("file_path", logging.file_path);
    }
    config_data.insert_or_assign("logging", logging_table);

    std::stringstream ss;
    ss << config_data;
    auto write_result = util::FileSystem::writeFileAtomic(save_path, ss.str());
    if (!write_result.has_value()) {
      return std::unexpected(makeError(ErrorCode::kConfigError,
                                       "Cannot write config file: " + write_result.error().message()));
    }

    return {};

  } catch (const std::exception& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config save error: " + std::string(e.what())));
  }
}

Result<std::string> Config::get(const std::string& key) const {
  auto path = splitPath(key);
  return getValueByPath(path);
}

Result<void> Config::set(const std::string& key, const std::string& value) {
  auto path = splitPath(key);
  return setValueByPath(path, value);
}

std::vector<std::pair<std::string, std::string>> Config::list() const {
  return {
      {"todo_heading", todo_heading},
      {"log_heading", log_heading},
      {"indent_width", std::to_string(indent_width)},
      {"trigger_states", joinStates(trigger_states)},
      {"reopen_scheduled", reopen_scheduled ? "true" : "false"},
      {"logging.level", logging.level},
      {"logging.file", logging.file ? "true" : "false"},
      {"logging.file_path", logging.file_path},
  };
}

Result<void> Config::validate() const {
  if (outline::parseTargetHeading(todo_heading).title.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "todo_heading has no title"));
  }
  if (outline::parseTargetHeading(log_heading).title.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "log_heading has no title"));
  }
  if (outline::parseTargetHeading(todo_heading).toString() ==
      outline::parseTargetHeading(log_heading).toString()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "todo_heading and log_heading must differ"));
  }

  if (indent_width < 1 || indent_width > kMaxIndentWidth) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid indent_width: " + std::to_string(indent_width)));
  }

  if (trigger_states.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "trigger_states is empty"));
  }
  for (const auto& state : trigger_states) {
    if (!outline::taskStateFromString(state)) {
      return std::unexpected(makeError(ErrorCode::kConfigError, "Unknown task state: " + state));
    }
  }

  if (!util::isValidLogLevel(logging.level)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid logging.level: " + logging.level));
  }

  return {};
}

move::MoveOptions Config::moveOptions() const {
  move::MoveOptions options;
  options.trigger_states.clear();
  for (const auto& name : trigger_states) {
    if (auto state = outline::taskStateFromString(name)) {
      options.trigger_states.push_back(*state);
    }
  }
  options.reopen_scheduled = reopen_scheduled;
  options.indent_width = indent_width;
  return options;
}

util::LoggingOptions Config::loggingOptions() const {
  util::LoggingOptions options;
  options.level = logging.level;
  options.file = logging.file;
  options.file_path = logging.file_path;
  return options;
}

std::filesystem::path Config::defaultConfigPath() {
  const char* env_path = std::getenv("BFLOW_CONFIG");
  if (env_path != nullptr && *env_path != '\0') {
    return std::filesystem::path(env_path);
  }
  return util::Xdg::configFile();
}

Config Config::createDefault() {
  Config config;
  config.config_path_ = defaultConfigPath();
  return config;
}

Result<Config> Config::loadEffective(const std::filesystem::path& explicit_path) {
  Config config = createDefault();
  std::filesystem::path path = explicit_path.empty() ? defaultConfigPath() : explicit_path;

  if (explicit_path.empty() && !std::filesystem::exists(path)) {
    return config;
  }

  auto loaded = config.load(path);
  if (!loaded.has_value()) {
    return std::unexpected(loaded.error());
  }

  auto valid = config.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }
  return config;
}

Result<std::string> Config::getValueByPath(const std::vector<std::string>& path) const {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "todo_heading") return todo_heading;
    if (key == "log_heading") return log_heading;
    if (key == "indent_width") return std::to_string(indent_width);
    if (key == "trigger_states") return joinStates(trigger_states);
    if (key == "reopen_scheduled") return std::string(reopen_scheduled ? "true" : "false");
  } else if (path.size() == 2) {
    if (path[0] == "logging") {
      if (path[1] == "level") return logging.level;
      if (path[1] == "file") return std::string(logging.file ? "true" : "false");
      if (path[1] == "file_path") return logging.file_path;
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

Result<void> Config::setValueByPath(const std::vector<std::string>& path, const std::string& value) {
  if (path.empty()) {
    return std::unexpected(makeError(ErrorCode::kConfigError, "Empty config path"));
  }

  if (path.size() == 1) {
    const std::string& key = path[0];

    if (key == "todo_heading") { todo_heading = value; return {}; }
    if (key == "log_heading") { log_heading = value; return {}; }
    if (key == "indent_width") {
      auto parsed = parseInt(value);
      if (!parsed.has_value()) return std::unexpected(parsed.error());
      indent_width = *parsed;
      return {};
    }
    if (key == "trigger_states") { trigger_states = splitStates(value); return {}; }
    if (key == "reopen_scheduled") {
      auto parsed = parseBool(value);
      if (!parsed.has_value()) return std::unexpected(parsed.error());
      reopen_scheduled = *parsed;
      return {};
    }
  } else if (path.size() == 2) {
    if (path[0] == "logging") {
      if (path[1] == "level") { logging.level = value; return {}; }
      if (path[1] == "file") {
        auto parsed = parseBool(value);
        if (!parsed.has_value()) return std::unexpected(parsed.error());
        logging.file = *parsed;
        return {};
      }
      if (path[1] == "file_path") { logging.file_path = value; return {}; }
    }
  }

  return std::unexpected(makeError(ErrorCode::kConfigError,
                                   "Unknown config key: " + path[0]));
}

std::vector<std::string> Config::splitPath(const std::string& path) const {
  std::vector<std::string> parts;
  std::istringstream stream(path);
  std::string part;

  while (std::getline(stream, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }

  return parts;
}

}  // namespace bflow::config
