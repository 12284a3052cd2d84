#include "bflow/cli/commands/config_command.hpp"

#include <filesystem>
#include <iostream>

#include <nlohmann/json.hpp>

#include "bflow/cli/command_error_handler.hpp"

namespace bflow::cli {

ConfigCommand::ConfigCommand(Application& app) : app_(app) {}

void ConfigCommand::setupCommand(CLI::App* cmd) {
  auto get_cmd = cmd->add_subcommand("get", "Get configuration value");
  get_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  get_cmd->callback([this]() { get_mode_ = true; });

  auto set_cmd = cmd->add_subcommand("set", "Set configuration value");
  set_cmd->add_option("key", key_, "Configuration key (dot notation)")->required();
  set_cmd->add_option("value", value_, "Configuration value")->required();
  set_cmd->callback([this]() { set_mode_ = true; });

  auto list_cmd = cmd->add_subcommand("list", "List all configuration settings");
  list_cmd->callback([this]() { list_mode_ = true; });

  auto path_cmd = cmd->add_subcommand("path", "Show configuration file path");
  path_cmd->callback([this]() { path_mode_ = true; });

  auto validate_cmd = cmd->add_subcommand("validate", "Validate current configuration");
  validate_cmd->callback([this]() { validate_mode_ = true; });

  cmd->require_subcommand(1);
}

Result<int> ConfigCommand::execute(const GlobalOptions& options) {
  if (get_mode_) {
    return executeGet(options);
  } else if (set_mode_) {
    return executeSet(options);
  } else if (list_mode_) {
    return executeList(options);
  } else if (path_mode_) {
    return executePath(options);
  } else if (validate_mode_) {
    return executeValidate(options);
  }

  return std::unexpected(makeError(ErrorCode::kInvalidArgument, "No subcommand specified"));
}

Result<int> ConfigCommand::executeGet(const GlobalOptions& options) {
  auto result = app_.config().get(key_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["key"] = key_;
    output["value"] = *result;
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << *result << std::endl;
  }
  return 0;
}

Result<int> ConfigCommand::executeSet(const GlobalOptions& options) {
  // Work on a copy so a rejected value never reaches the file
  config::Config updated = app_.config();

  auto result = updated.set(key_, value_);
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  auto valid = updated.validate();
  if (!valid.has_value()) {
    return std::unexpected(valid.error());
  }

  auto save_result = updated.save();
  if (!save_result.has_value()) {
    return std::unexpected(save_result.error());
  }
  app_.config() = updated;

  if (options.json) {
    nlohmann::json output;
    output["success"] = true;
    output["key"] = key_;
    output["value"] = value_;
    output["path"] = updated.path().string();
    std::cout << output.dump(2) << std::endl;
  } else {
    CommandErrorHandler(options).displaySuccess("Configuration updated: " + key_ + " = " + value_);
  }
  return 0;
}

Result<int> ConfigCommand::executeList(const GlobalOptions& options) {
  auto entries = app_.config().list();

  if (options.json) {
    nlohmann::json output = nlohmann::json::object();
    for (const auto& [key, value] : entries) {
      output[key] = value;
    }
    std::cout << output.dump(2) << std::endl;
  } else {
    for (const auto& [key, value] : entries) {
      std::cout << key << " = " << value << "\n";
    }
    std::cout.flush();
  }
  return 0;
}

Result<int> ConfigCommand::executePath(const GlobalOptions& options) {
  const auto& config_path = app_.config().path();
  bool exists = std::filesystem::exists(config_path);

  if (options.json) {
    nlohmann::json output;
    output["config_path"] = config_path.string();
    output["exists"] = exists;
    std::cout << output.dump(2) << std::endl;
  } else {
    std::cout << config_path.string() << std::endl;
    if (!exists && !options.quiet) {
      std::cout << "File not found (using defaults)" << std::endl;
    }
  }
  return 0;
}

Result<int> ConfigCommand::executeValidate(const GlobalOptions& options) {
  auto result = app_.config().validate();
  if (!result.has_value()) {
    return std::unexpected(result.error());
  }

  if (options.json) {
    nlohmann::json output;
    output["valid"] = true;
    std::cout << output.dump(2) << std::endl;
  } else if (!options.quiet) {
    std::cout << "Configuration is valid" << std::endl;
  }
  return 0;
}

}  // namespace bflow::cli
