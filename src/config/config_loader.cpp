#include <workflow_tracker/config/config_loader.hpp>

#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <regex>
#include <vector>

namespace workflow_tracker {

namespace {

Error MakeConfigError(const std::string& message, const std::string& path = "") {
    return Error{"ConfigLoader", path, message, std::nullopt, ErrorCategory::Configuration};
}

std::string ScalarString(const YAML::Node& node, const EnvLookup& env) {
    return ExpandEnvVars(node.as<std::string>(), env);
}

std::vector<std::string> StringList(const YAML::Node& node, const EnvLookup& env) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(ScalarString(node, env));
        return values;
    }
    for (const auto& item : node) {
        values.push_back(ScalarString(item, env));
    }
    return values;
}

template <typename T>
void ReadIf(const YAML::Node& parent, const char* key, T& target) {
    if (parent[key]) {
        target = parent[key].as<T>();
    }
}

void ParseDetect(const YAML::Node& node, DetectionToggles& detect) {
    ReadIf(node, "database", detect.database);
    ReadIf(node, "api_calls", detect.api_calls);
    ReadIf(node, "file_io", detect.file_io);
    ReadIf(node, "message_queues", detect.message_queues);
    ReadIf(node, "data_transforms", detect.data_transforms);
    ReadIf(node, "cache", detect.cache);
}

void ParseEdgeInference(const YAML::Node& node, EdgeInferenceConfig& edges) {
    ReadIf(node, "enabled", edges.enabled);
    ReadIf(node, "proximity_edges", edges.proximity_edges);
    ReadIf(node, "data_flow_edges", edges.data_flow_edges);
    ReadIf(node, "max_line_distance", edges.max_line_distance);
    ReadIf(node, "ingestion_window", edges.ingestion_window);
    ReadIf(node, "processing_window", edges.processing_window);
}

void ParseScanner(const YAML::Node& node, ScanConfig& scan, const EnvLookup& env) {
    if (node["include_extensions"]) {
        scan.include_extensions = StringList(node["include_extensions"], env);
    }
    if (node["exclude_dirs"]) {
        scan.exclude_dirs = StringList(node["exclude_dirs"], env);
    }
    if (node["exclude_patterns"]) {
        scan.exclude_patterns = StringList(node["exclude_patterns"], env);
    }
    if (node["detect"]) {
        ParseDetect(node["detect"], scan.detect);
    }
    if (node["edge_inference"]) {
        ParseEdgeInference(node["edge_inference"], scan.edge_inference);
    }
    if (const auto ui = node["ui_linking"]) {
        ReadIf(ui, "single_file_window", scan.ui_linking.single_file_window);
        ReadIf(ui, "paired_file_window", scan.ui_linking.paired_file_window);
    }
    if (const auto progress = node["progress"]) {
        ReadIf(progress, "every_files", scan.progress.every_files);
        ReadIf(progress, "interval_seconds", scan.progress.interval_seconds);
    }
    if (const auto schema = node["schema"]) {
        ReadIf(schema, "max_files", scan.schema.max_files);
        ReadIf(schema, "max_schemas", scan.schema.max_schemas);
    }
    ReadIf(node, "workers", scan.workers);
    ReadIf(node, "max_line_length", scan.max_line_length);
    ReadIf(node, "analyze_workflows", scan.analyze_workflows);
}

} // anonymous namespace

EnvLookup ProcessEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

// ---------------------------------------------------------------------------
// ExpandEnvVars
// ---------------------------------------------------------------------------
std::string ExpandEnvVars(std::string_view value, const EnvLookup& env) {
    static const std::regex kVarPattern(R"(\$\{([^}:]+)(?::-([^}]*))?\})");

    const std::string input(value);
    std::string out;
    auto last = input.cbegin();
    for (std::sregex_iterator it(input.cbegin(), input.cend(), kVarPattern), end;
         it != end; ++it) {
        const auto& match = *it;
        out.append(last, match[0].first);
        auto resolved = env(match[1].str());
        if (resolved.has_value()) {
            out += *resolved;
        } else if (match[2].matched) {
            out += match[2].str();
        }
        last = match[0].second;
    }
    out.append(last, input.cend());
    return out;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, const EnvLookup& env) {
    const std::string path(file_path);
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()), path));
    }

    AppConfig config;
    try {
        if (const auto repo = root["repository"]) {
            if (repo["path"]) {
                config.repository_path = ScalarString(repo["path"], env);
            }
        }
        if (root["scanner"]) {
            ParseScanner(root["scanner"], config.scan, env);
        }
        if (const auto output = root["output"]) {
            if (output["path"]) {
                config.output_path = ScalarString(output["path"], env);
            }
        }
        if (root["log_file"]) {
            config.log_file = ScalarString(root["log_file"], env);
        }
        ReadIf(root, "verbose", config.verbose);
        ReadIf(root, "quiet", config.quiet);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what()), path));
    }

    LogDebug("config", "loaded " + path);
    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    if (args.size() > 1 && args[1] == "scan") {
        args.erase(args.begin() + 1);
    }

    // -v is --verbose here, so --version is registered by hand.
    argparse::ArgumentParser program("workflow-tracker", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-r", "--repo")
        .help("Path to the repository to scan");
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("-o", "--output")
        .help("Write the full JSON result to this file");
    program.add_argument("--workers")
        .help("Scan worker threads (0 = hardware concurrency)")
        .scan<'i', int>();
    program.add_argument("--no-edges")
        .help("Skip edge inference")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-workflows")
        .help("Skip workflow analysis")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--stories")
        .help("Print workflow stories")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--json")
        .help("JSON output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("-v", "--verbose")
        .help("Verbose output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Quiet output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print the version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(args);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.repository_path = program.present("--repo");
    cli.config_file = program.present("--config");
    cli.output_path = program.present("--output");
    cli.log_file = program.present("--log-file");
    cli.workers = program.present<int>("--workers");
    cli.no_edges = program.get<bool>("--no-edges");
    cli.no_workflows = program.get<bool>("--no-workflows");
    cli.print_stories = program.get<bool>("--stories");
    cli.json_output = program.get<bool>("--json");
    cli.verbose = program.get<bool>("--verbose");
    cli.quiet = program.get<bool>("--quiet");
    cli.show_version = program.get<bool>("--version");

    const bool force_color = program.get<bool>("--color");
    const bool no_color = program.get<bool>("--no-color");
    if (force_color && no_color) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("Cannot use both --color and --no-color"));
    }
    if (force_color) {
        cli.color = ColorMode::Always;
    } else if (no_color) {
        cli.color = ColorMode::Never;
    }

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
AppConfig ApplyEnvironment(AppConfig config, const EnvLookup& env) {
    if (auto repo = env("REPOSITORY_PATH"); repo.has_value() && !repo->empty()) {
        config.repository_path = *repo;
    }
    return config;
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;

    if (cli.repository_path.has_value()) {
        merged.repository_path = *cli.repository_path;
    }
    if (cli.output_path.has_value()) {
        merged.output_path = cli.output_path;
    }
    if (cli.log_file.has_value()) {
        merged.log_file = cli.log_file;
    }
    if (cli.workers.has_value()) {
        merged.scan.workers = *cli.workers;
    }
    if (cli.color.has_value()) {
        merged.color = *cli.color;
    }
    if (cli.no_edges) {
        merged.scan.edge_inference.enabled = false;
    }
    if (cli.no_workflows) {
        merged.scan.analyze_workflows = false;
    }
    if (cli.print_stories) {
        merged.print_stories = true;
    }
    if (cli.json_output) {
        merged.json_output = true;
    }
    if (cli.verbose) {
        merged.verbose = true;
    }
    if (cli.quiet) {
        merged.quiet = true;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateScanConfig / ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateScanConfig(const ScanConfig& scan) {
    if (scan.include_extensions.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("include_extensions must not be empty"));
    }
    if (scan.edge_inference.max_line_distance <= 0 ||
        scan.edge_inference.ingestion_window <= 0 ||
        scan.edge_inference.processing_window <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Edge inference windows must be positive"));
    }
    if (scan.ui_linking.single_file_window <= 0 ||
        scan.ui_linking.paired_file_window <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("UI linking windows must be positive"));
    }
    if (scan.workers < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("workers must not be negative, got " +
                            std::to_string(scan.workers)));
    }
    if (scan.progress.every_files <= 0 || scan.progress.interval_seconds <= 0.0) {
        return Result<void, Error>::Err(
            MakeConfigError("Progress cadence must be positive"));
    }
    if (scan.schema.max_files <= 0 || scan.schema.max_schemas <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Schema limits must be positive"));
    }
    if (scan.max_line_length <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_line_length must be positive"));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.repository_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing repository path"));
    }
    auto scan = ValidateScanConfig(config.scan);
    if (scan.IsErr()) {
        return scan;
    }
    if (config.verbose && config.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// ResolveConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ResolveConfig(const CliOptions& cli, const EnvLookup& env) {
    AppConfig base;
    if (cli.config_file.has_value()) {
        auto yaml = LoadFromYaml(*cli.config_file, env);
        if (yaml.IsErr()) {
            return Result<AppConfig, Error>::Err(std::move(yaml).Error());
        }
        base = std::move(yaml).Value();
    }

    auto merged = MergeConfigs(ApplyEnvironment(std::move(base), env), cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

} // namespace workflow_tracker
