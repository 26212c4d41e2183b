#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace workflow_tracker::testing {

// ---------------------------------------------------------------------------
// TempRepo: a throwaway directory tree under the system temp directory,
// removed on destruction.
// ---------------------------------------------------------------------------
class TempRepo {
public:
    TempRepo() {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path() /
                ("workflow_tracker_test_" + std::to_string(stamp) + "_" +
                 std::to_string(counter.fetch_add(1)));
        std::filesystem::create_directories(root_);
    }

    ~TempRepo() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    TempRepo(const TempRepo&) = delete;
    TempRepo& operator=(const TempRepo&) = delete;

    /// Writes `content` verbatim (binary) and returns the absolute path.
    std::string Write(const std::string& relative, const std::string& content) const {
        const auto path = root_ / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
        out << content;
        return path.string();
    }

    void MakeDir(const std::string& relative) const {
        std::filesystem::create_directories(root_ / relative);
    }

    [[nodiscard]] std::string Path(const std::string& relative = "") const {
        return relative.empty() ? root_.string() : (root_ / relative).string();
    }

private:
    std::filesystem::path root_;
};

} // namespace workflow_tracker::testing
