#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace workflow_tracker {

enum class ErrorCategory {
    Configuration,
    InvalidRepository,
    FileRead,
    Encoding,
    Scan,
    Schema,
    Output,
    Internal,
};

// A failed operation. `path` names the file or directory involved, if any.
struct Error {
    std::string operation;
    std::string path;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;

    /// Process exit status for the CLI: 2 configuration or repository,
    /// 3 output, 99 anything else.
    [[nodiscard]] int ExitCode() const;

    /// snake_case category, e.g. "invalid_repository".
    [[nodiscard]] std::string CategoryName() const;

    /// "operation [path]: message (detail)", omitting empty parts.
    [[nodiscard]] std::string ToString() const;

    bool operator==(const Error& other) const;
    bool operator!=(const Error& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace workflow_tracker
