#include "bflow/cli/application.hpp"

#include <iostream>
#include <stdexcept>

#include "bflow/cli/command_error_handler.hpp"
#include "bflow/util/logging.hpp"

// Command includes
#include "bflow/cli/commands/block_command.hpp"
#include "bflow/cli/commands/classify_command.hpp"
#include "bflow/cli/commands/config_command.hpp"
#include "bflow/cli/commands/extract_command.hpp"
#include "bflow/cli/commands/migrate_command.hpp"
#include "bflow/cli/commands/move_command.hpp"
#include "bflow/cli/commands/section_command.hpp"
#include "bflow/cli/commands/sweep_command.hpp"

namespace bflow::cli {

Application::Application()
    : app_("bflow", "Move finished tasks between sections of outline notes") {
  app_.set_version_flag("--version", bflow::getVersion().toString());
  app_.set_help_all_flag("--help-all", "Expand all help");
  app_.require_subcommand(1);

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose output");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Suppress normal output");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
  app_.add_flag("--no-color", global_options_.no_color, "Disable colored output");
}

void Application::setupCommands() {
  // Moving tasks
  registerCommand(std::make_unique<MoveCommand>(*this));
  registerCommand(std::make_unique<SweepCommand>(*this));

  // Moving lines between notes
  registerCommand(std::make_unique<ExtractCommand>(*this));
  registerCommand(std::make_unique<MigrateCommand>(*this));

  // Inspecting outline structure
  registerCommand(std::make_unique<BlockCommand>(*this));
  registerCommand(std::make_unique<SectionCommand>(*this));
  registerCommand(std::make_unique<ClassifyCommand>(*this));

  // Configuration management
  registerCommand(std::make_unique<ConfigCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  bflow move today.md --line 4              # move the task on line 4 to ## Log
  bflow move today.md --line 4 --dry-run    # show the result without writing
  bflow sweep today.md --to "## Done"
  bflow extract today.md --line 9           # file the lines under a [[link]] in the linked note
  bflow migrate today.md -l 3 -l 5 --to tomorrow.md
  bflow block today.md --line 7 --json
  bflow section today.md "## Log"
  bflow config set log_heading "## Journal"

Line numbers are 1-based. For more information on a specific command, run:
  bflow <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  cmd_ptr->setupCommand(sub);

  sub->callback([this, cmd_ptr]() {
    CommandErrorHandler handler(global_options_);

    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      throw CLI::RuntimeError(handler.handleLegacyError(init_result.error(), "initialize"));
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      int code = handler.handleLegacyError(result.error(), cmd_ptr->name());
      if (code != 0) {
        throw CLI::RuntimeError(code);
      }
      return;
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (services_initialized_) {
    return {};
  }

  auto config_result = config::Config::loadEffective(global_options_.config_file);
  if (!config_result.has_value()) {
    return std::unexpected(config_result.error());
  }
  config_ = std::move(*config_result);

  // Command line verbosity overrides the configured console level
  auto logging = config_->loggingOptions();
  if (global_options_.verbose > 1) {
    logging.level = "debug";
  } else if (global_options_.verbose == 1) {
    logging.level = "info";
  } else if (global_options_.quiet) {
    logging.level = "error";
  }

  auto logging_result = util::setupLogging(logging);
  if (!logging_result.has_value()) {
    return logging_result;
  }

  services_initialized_ = true;
  return {};
}

const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!services_initialized_ || !config_) {
    throw std::runtime_error("Services not initialized");
  }
  return *config_;
}

}  // namespace bflow::cli
