#pragma once

#include <workflow_tracker/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace workflow_tracker {

// One attribute of interest on a XAML element.
struct XamlAttribute {
    std::string element;   // e.g. "Button"
    std::string name;      // e.g. "Click", "Command"
    std::string value;     // e.g. "SaveButton_Click", "{Binding SaveCommand}"
    int line_number = 0;
};

struct XamlDocument {
    std::optional<std::string> class_name;  // x:Class of the root element
    std::vector<XamlAttribute> attributes;  // document order
};

/// Parse XAML with tinyxml2 and collect every attribute in document order.
/// Returns Err when the markup is not well-formed.
[[nodiscard]] Result<XamlDocument, Error> ParseXaml(std::string_view xaml,
                                                    const std::string& path);

} // namespace workflow_tracker
