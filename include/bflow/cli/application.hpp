#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "bflow/common.hpp"
#include "bflow/config/config.hpp"

namespace bflow::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Suppress normal output
  std::string config_file;     // --config: Path to config file
  bool no_color = false;       // --no-color: Disable colored output
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
 public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  virtual std::string name() const = 0;
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 *
 * One Application handles one command line; create a new one per run.
 */
class Application {
 public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;

  // Effective configuration; available once a command started executing
  config::Config& config();

 private:
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  void registerCommand(std::unique_ptr<Command> command);

  // Load configuration and install logging
  Result<void> initializeServices();

  CLI::App app_;
  GlobalOptions global_options_;

  std::optional<config::Config> config_;
  bool services_initialized_ = false;

  std::vector<std::unique_ptr<Command>> commands_;
};

}  // namespace bflow::cli
