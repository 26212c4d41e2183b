#include <catch2/catch_test_macros.hpp>

#include <workflow_tracker/config/config_loader.hpp>

#include <map>
#include <string>
#include <vector>

using namespace workflow_tracker;

namespace {

// Tests run from the build directory; derive testdata from this file's path.
std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));     // .../test/config
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));      // .../test
    return test_root + "/testdata/" + filename;
}

EnvLookup FakeEnv(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end()) {
            return std::nullopt;
        }
        return it->second;
    };
}

Result<CliOptions, Error> ParseArgs(std::vector<const char*> args) {
    args.insert(args.begin(), "workflow-tracker");
    return LoadFromCli(static_cast<int>(args.size()), args.data());
}

} // namespace

// ===========================================================================
// ExpandEnvVars
// ===========================================================================

TEST_CASE("ExpandEnvVars: substitutes set variables", "[config]") {
    auto env = FakeEnv({{"HOME_DIR", "/home/dev"}});
    CHECK(ExpandEnvVars("${HOME_DIR}/repo", env) == "/home/dev/repo");
}

TEST_CASE("ExpandEnvVars: default used only when unset", "[config]") {
    auto env = FakeEnv({{"SET", "yes"}});
    CHECK(ExpandEnvVars("${MISSING:-fallback}", env) == "fallback");
    CHECK(ExpandEnvVars("${SET:-fallback}", env) == "yes");
    CHECK(ExpandEnvVars("a${MISSING}b", env) == "ab");
    CHECK(ExpandEnvVars("no variables", env) == "no variables");
}

// ===========================================================================
// LoadFromYaml
// ===========================================================================

TEST_CASE("LoadFromYaml: reads every scanner section", "[config]") {
    auto result = LoadFromYaml(TestDataPath("full_config.yaml"),
                               FakeEnv({{"OUT_DIR", "/tmp/out"}}));
    REQUIRE(result.IsOk());
    const auto& config = result.Value();
    const auto& scan = config.scan;

    CHECK(config.repository_path == "/srv/checkout");
    CHECK(scan.include_extensions == std::vector<std::string>{".cs", ".ts"});
    CHECK(scan.exclude_dirs == std::vector<std::string>{"node_modules", "generated"});
    CHECK(scan.exclude_patterns == std::vector<std::string>{"*.g.cs"});

    CHECK(scan.detect.database);
    CHECK_FALSE(scan.detect.file_io);
    CHECK_FALSE(scan.detect.message_queues);
    CHECK_FALSE(scan.detect.cache);

    CHECK(scan.edge_inference.enabled);
    CHECK_FALSE(scan.edge_inference.proximity_edges);
    CHECK(scan.edge_inference.max_line_distance == 12);
    CHECK(scan.edge_inference.ingestion_window == 40);
    CHECK(scan.edge_inference.processing_window == 25);

    CHECK(scan.ui_linking.single_file_window == 30);
    CHECK(scan.ui_linking.paired_file_window == 80);
    CHECK(scan.progress.every_files == 25);
    CHECK(scan.progress.interval_seconds == 2.5);
    CHECK(scan.schema.max_files == 100);
    CHECK(scan.schema.max_schemas == 50);
    CHECK(scan.workers == 4);
    CHECK(scan.max_line_length == 1000);
    CHECK_FALSE(scan.analyze_workflows);

    CHECK(config.output_path == std::optional<std::string>("/tmp/out/results.json"));
    CHECK(config.log_file == std::optional<std::string>("scan.log"));
    CHECK(config.verbose);
}

TEST_CASE("LoadFromYaml: missing file is a configuration error", "[config]") {
    auto result = LoadFromYaml(TestDataPath("does_not_exist.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
    CHECK(result.Error().ExitCode() == 2);
}

TEST_CASE("LoadFromYaml: malformed YAML is an error", "[config]") {
    auto result = LoadFromYaml(TestDataPath("invalid_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().operation == "ConfigLoader");
}

TEST_CASE("LoadFromYaml: wrongly typed value is an error", "[config]") {
    auto result = LoadFromYaml(TestDataPath("bad_value_config.yaml"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Invalid value") != std::string::npos);
}

// ===========================================================================
// LoadFromCli
// ===========================================================================

TEST_CASE("LoadFromCli: parses scan flags", "[config]") {
    auto result = ParseArgs({"scan", "--repo", "/code/app", "-o", "out.json", "--workers", "3",
                             "--no-edges", "--stories", "--json", "-v"});
    REQUIRE(result.IsOk());
    const auto& cli = result.Value();
    CHECK(cli.repository_path == std::optional<std::string>("/code/app"));
    CHECK(cli.output_path == std::optional<std::string>("out.json"));
    CHECK(cli.workers == std::optional<int>(3));
    CHECK(cli.no_edges);
    CHECK_FALSE(cli.no_workflows);
    CHECK(cli.print_stories);
    CHECK(cli.json_output);
    CHECK(cli.verbose);
    CHECK_FALSE(cli.color.has_value());
}

TEST_CASE("LoadFromCli: scan subcommand word is optional", "[config]") {
    auto result = ParseArgs({"-r", "/code/app", "--no-color"});
    REQUIRE(result.IsOk());
    CHECK(result.Value().repository_path == std::optional<std::string>("/code/app"));
    CHECK(result.Value().color == std::optional<ColorMode>(ColorMode::Never));
}

TEST_CASE("LoadFromCli: --color with --no-color is rejected", "[config]") {
    auto result = ParseArgs({"--color", "--no-color"});
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);
}

TEST_CASE("LoadFromCli: -v means verbose, --version is separate", "[config]") {
    auto verbose = ParseArgs({"-v", "--repo", "/code/app"});
    REQUIRE(verbose.IsOk());
    CHECK(verbose.Value().verbose);
    CHECK_FALSE(verbose.Value().show_version);

    auto version = ParseArgs({"--version"});
    REQUIRE(version.IsOk());
    CHECK(version.Value().show_version);
    CHECK_FALSE(version.Value().verbose);
}

TEST_CASE("LoadFromCli: unknown flag is rejected", "[config]") {
    auto result = ParseArgs({"--frobnicate"});
    CHECK(result.IsErr());
}

// ===========================================================================
// Layering and validation
// ===========================================================================

TEST_CASE("ResolveConfig: CLI beats environment beats YAML", "[config]") {
    CliOptions cli;
    cli.config_file = TestDataPath("full_config.yaml");
    cli.workers = 2;

    auto env = FakeEnv({{"REPOSITORY_PATH", "/from/env"}, {"OUT_DIR", "/o"}});
    auto resolved = ResolveConfig(cli, env);
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value().repository_path == "/from/env");
    CHECK(resolved.Value().scan.workers == 2);
    CHECK(resolved.Value().scan.max_line_length == 1000);

    cli.repository_path = "/from/cli";
    resolved = ResolveConfig(cli, env);
    REQUIRE(resolved.IsOk());
    CHECK(resolved.Value().repository_path == "/from/cli");
}

TEST_CASE("ResolveConfig: defaults without a config file", "[config]") {
    auto resolved = ResolveConfig(CliOptions{}, FakeEnv({}));
    REQUIRE(resolved.IsOk());
    const auto& config = resolved.Value();
    CHECK(config.repository_path == ".");
    CHECK(config.scan.edge_inference.max_line_distance == 20);
    CHECK(config.scan.edge_inference.ingestion_window == 50);
    CHECK(config.scan.edge_inference.processing_window == 30);
    CHECK(config.scan.workers == 1);
}

TEST_CASE("MergeConfigs: switches turn phases off", "[config]") {
    CliOptions cli;
    cli.no_edges = true;
    cli.no_workflows = true;
    auto merged = MergeConfigs(AppConfig{}, cli);
    CHECK_FALSE(merged.scan.edge_inference.enabled);
    CHECK_FALSE(merged.scan.analyze_workflows);
}

TEST_CASE("ValidateScanConfig: scanner settings without a repository", "[config]") {
    CHECK(ValidateScanConfig(ScanConfig{}).IsOk());

    ScanConfig bad;
    bad.max_line_length = 0;
    auto result = ValidateScanConfig(bad);
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Configuration);

    AppConfig app;
    app.repository_path = "/code/app";
    app.scan = bad;
    CHECK(ValidateConfig(app).IsErr());
}

TEST_CASE("ValidateConfig: rejects bad values", "[config]") {
    AppConfig base;
    REQUIRE(ValidateConfig(base).IsOk());

    SECTION("empty include list") {
        base.scan.include_extensions.clear();
        CHECK(ValidateConfig(base).IsErr());
    }
    SECTION("non-positive proximity threshold") {
        base.scan.edge_inference.max_line_distance = 0;
        CHECK(ValidateConfig(base).IsErr());
    }
    SECTION("negative ingestion window") {
        base.scan.edge_inference.ingestion_window = -5;
        CHECK(ValidateConfig(base).IsErr());
    }
    SECTION("negative workers") {
        base.scan.workers = -1;
        CHECK(ValidateConfig(base).IsErr());
    }
    SECTION("zero progress cadence") {
        base.scan.progress.every_files = 0;
        CHECK(ValidateConfig(base).IsErr());
    }
    SECTION("verbose and quiet together") {
        base.verbose = true;
        base.quiet = true;
        auto result = ValidateConfig(base);
        REQUIRE(result.IsErr());
        CHECK(result.Error().ExitCode() == 2);
    }
}
