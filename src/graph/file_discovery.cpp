#include <workflow_tracker/graph/file_discovery.hpp>

#include <workflow_tracker/core/log.hpp>
#include <workflow_tracker/scanner/source_file.hpp>

#include <fnmatch.h>

#include <algorithm>
#include <filesystem>
#include <set>
#include <system_error>

namespace workflow_tracker {

namespace fs = std::filesystem;

namespace {

Error RepositoryError(const std::string& root, std::string message,
                      std::optional<std::string> detail = std::nullopt) {
    return Error{"DiscoverFiles", root, std::move(message), std::move(detail),
                 ErrorCategory::InvalidRepository};
}

} // namespace

bool MatchesGlob(std::string_view pattern, std::string_view name) {
    const std::string p(pattern);
    const std::string n(name);
    return ::fnmatch(p.c_str(), n.c_str(), 0) == 0;
}

bool HasIncludedExtension(std::string_view name, const std::vector<std::string>& extensions) {
    return std::any_of(extensions.begin(), extensions.end(),
                       [&](const std::string& ext) { return EndsWith(name, ext); });
}

Result<DiscoveryResult, Error> DiscoverFiles(const std::string& root,
                                             const ScanConfig& config,
                                             const CancellationToken* cancel) {
    std::error_code ec;
    const auto root_path = fs::absolute(root, ec).lexically_normal();
    if (ec) {
        return Result<DiscoveryResult, Error>::Err(
            RepositoryError(root, "cannot resolve path", ec.message()));
    }
    if (!fs::exists(root_path, ec)) {
        return Result<DiscoveryResult, Error>::Err(
            RepositoryError(root, "repository path does not exist"));
    }
    if (!fs::is_directory(root_path, ec)) {
        return Result<DiscoveryResult, Error>::Err(
            RepositoryError(root, "repository path is not a directory"));
    }

    const std::set<std::string> excluded(config.exclude_dirs.begin(),
                                         config.exclude_dirs.end());
    DiscoveryResult result;

    fs::recursive_directory_iterator it(
        root_path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Result<DiscoveryResult, Error>::Err(
            RepositoryError(root, "cannot read repository directory", ec.message()));
    }

    const fs::recursive_directory_iterator end;
    while (it != end && !IsCancelled(cancel)) {
        const auto& entry = *it;
        const auto name = entry.path().filename().string();

        std::error_code type_ec;
        if (entry.is_directory(type_ec)) {
            if (excluded.count(name) > 0 || (!name.empty() && name[0] == '.')) {
                it.disable_recursion_pending();
                ++result.dirs_pruned;
            }
        } else if (entry.is_regular_file(type_ec) &&
                   HasIncludedExtension(name, config.include_extensions)) {
            const bool pattern_excluded = std::any_of(
                config.exclude_patterns.begin(), config.exclude_patterns.end(),
                [&](const std::string& pattern) { return MatchesGlob(pattern, name); });
            if (pattern_excluded) {
                ++result.files_excluded;
            } else {
                result.files.push_back(entry.path().string());
            }
        }

        it.increment(ec);
        if (ec) {
            // The walk cannot continue past a failed increment.
            result.warnings.push_back(
                RepositoryError(root, "directory walk stopped early", ec.message()).ToString());
            break;
        }
    }

    std::sort(result.files.begin(), result.files.end());

    if (result.dirs_pruned > 0 || result.files_excluded > 0) {
        LogInfo("discovery", "Filtered: " + std::to_string(result.dirs_pruned) +
                                 " directories, " + std::to_string(result.files_excluded) +
                                 " files (minified/generated)");
    }
    return Result<DiscoveryResult, Error>::Ok(std::move(result));
}

} // namespace workflow_tracker
