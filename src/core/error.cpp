#include <workflow_tracker/core/error.hpp>

#include <tuple>

namespace workflow_tracker {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Configuration:
        case ErrorCategory::InvalidRepository:
            return 2;
        case ErrorCategory::Output:
            return 3;
        default:
            return 99;
    }
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Configuration:     return "configuration";
        case ErrorCategory::InvalidRepository: return "invalid_repository";
        case ErrorCategory::FileRead:          return "file_read";
        case ErrorCategory::Encoding:          return "encoding";
        case ErrorCategory::Scan:              return "scan";
        case ErrorCategory::Schema:            return "schema";
        case ErrorCategory::Output:            return "output";
        case ErrorCategory::Internal:          break;
    }
    return "internal";
}

std::string Error::ToString() const {
    std::string text = operation;
    if (!path.empty()) {
        text += " [" + path + "]";
    }
    text += ": " + message;
    if (detail && !detail->empty()) {
        text += " (" + *detail + ")";
    }
    return text;
}

bool Error::operator==(const Error& other) const {
    return std::tie(operation, path, message, detail, category) ==
           std::tie(other.operation, other.path, other.message, other.detail,
                    other.category);
}

std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << error.ToString();
}

} // namespace workflow_tracker
