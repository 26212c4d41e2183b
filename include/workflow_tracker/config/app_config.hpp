#pragma once

#include <workflow_tracker/core/terminal.hpp>

#include <optional>
#include <string>
#include <vector>

namespace workflow_tracker {

// Per-category detection switches (scanner.detect.* in YAML).
struct DetectionToggles {
    bool database = true;
    bool api_calls = true;
    bool file_io = true;
    bool message_queues = true;
    bool data_transforms = true;
    bool cache = true;
};

// scanner.edge_inference.*
struct EdgeInferenceConfig {
    bool enabled = true;
    bool proximity_edges = true;
    bool data_flow_edges = true;
    int max_line_distance = 20;
    int ingestion_window = 50;   // API call -> DB write
    int processing_window = 30;  // DB read -> transform
};

// Line windows used to pair a UI trigger with an outbound call.
struct UiLinkingConfig {
    int single_file_window = 50;   // React components
    int paired_file_window = 100;  // Angular template + component, XAML + code-behind
};

// How often the scan loop reports progress: whichever comes first.
struct ProgressConfig {
    int every_files = 10;
    double interval_seconds = 5.0;
};

// Caps for the schema resolver pre-pass.
struct SchemaLimits {
    int max_files = 5000;
    int max_schemas = 2000;
};

struct ScanConfig {
    std::vector<std::string> include_extensions = {
        ".cs", ".ts", ".tsx", ".js", ".jsx", ".html", ".xaml"};
    std::vector<std::string> exclude_dirs = {
        "node_modules", "bin", "obj", "dist", "build", "packages", "vendor"};
    std::vector<std::string> exclude_patterns = {"*.min.js", "*.d.ts", "*.bundle.js"};

    DetectionToggles detect;
    EdgeInferenceConfig edge_inference;
    UiLinkingConfig ui_linking;
    ProgressConfig progress;
    SchemaLimits schema;

    int workers = 1;  // 0 = hardware concurrency
    int max_line_length = 4000;
    bool analyze_workflows = true;
};

struct AppConfig {
    std::string repository_path = ".";
    ScanConfig scan;
    std::optional<std::string> output_path;
    std::optional<std::string> log_file;
    bool json_output = false;
    bool verbose = false;
    bool quiet = false;
    bool print_stories = false;
    ColorMode color = ColorMode::Auto;
};

} // namespace workflow_tracker
