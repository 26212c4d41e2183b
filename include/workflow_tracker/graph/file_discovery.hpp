#pragma once

#include <workflow_tracker/config/app_config.hpp>
#include <workflow_tracker/core/cancellation.hpp>
#include <workflow_tracker/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace workflow_tracker {

struct DiscoveryResult {
    std::vector<std::string> files;  // sorted, absolute
    std::size_t dirs_pruned = 0;
    std::size_t files_excluded = 0;  // matched an exclude pattern
    std::vector<std::string> warnings;
};

/// Shell-style glob match of a file name (fnmatch semantics).
[[nodiscard]] bool MatchesGlob(std::string_view pattern, std::string_view name);

/// True if `name` ends with one of `extensions`.
[[nodiscard]] bool HasIncludedExtension(std::string_view name,
                                        const std::vector<std::string>& extensions);

/// Walk `root` collecting candidate files. Excluded and hidden directories
/// are pruned without being descended into. Err if `root` is not a
/// readable directory.
[[nodiscard]] Result<DiscoveryResult, Error> DiscoverFiles(
    const std::string& root, const ScanConfig& config,
    const CancellationToken* cancel = nullptr);

} // namespace workflow_tracker
