#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/core/result.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace workflow_tracker {

// Environment lookup; returns nullopt when the variable is unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

// Reads the process environment via std::getenv.
EnvLookup ProcessEnvironment();

// Values given on the command line. Unset fields leave the lower layers alone.
struct CliOptions {
    std::optional<std::string> config_file;
    std::optional<std::string> repository_path;
    std::optional<std::string> output_path;
    std::optional<std::string> log_file;
    std::optional<int> workers;
    std::optional<ColorMode> color;
    bool no_edges = false;
    bool no_workflows = false;
    bool print_stories = false;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    bool show_version = false;
};

// Expand ${VAR} and ${VAR:-default}. Unset variables without a default
// expand to the empty string.
std::string ExpandEnvVars(std::string_view value, const EnvLookup& env);

// Parse a YAML config file on top of the built-in defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      const EnvLookup& env = ProcessEnvironment());

// Parse CLI arguments. A leading "scan" subcommand word is accepted.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply environment overrides (REPOSITORY_PATH).
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env = ProcessEnvironment());

// Merge CLI overrides onto a base config: set fields in `cli` win.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Scanner settings only: non-empty include list, positive windows, cadence,
// schema caps and max_line_length, non-negative workers.
Result<void, Error> ValidateScanConfig(const ScanConfig& scan);

// Repository path and CLI switches, then ValidateScanConfig.
Result<void, Error> ValidateConfig(const AppConfig& config);

// defaults < YAML (-c) < environment < CLI, then ValidateConfig.
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli,
                                       const EnvLookup& env = ProcessEnvironment());

} // namespace workflow_tracker
