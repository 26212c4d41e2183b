#include <workflow_tracker/scanner/xaml_document.hpp>

#include <tinyxml2.h>

namespace workflow_tracker {

namespace {

std::string Attr(const tinyxml2::XMLElement* element, const char* name) {
    if (!element || !name) {
        return {};
    }
    const char* value = element->Attribute(name);
    return value ? value : "";
}

void CollectAttributes(const tinyxml2::XMLElement* element,
                       std::vector<XamlAttribute>& out) {
    for (; element != nullptr; element = element->NextSiblingElement()) {
        for (const auto* attr = element->FirstAttribute(); attr != nullptr;
             attr = attr->Next()) {
            out.push_back(XamlAttribute{element->Name(), attr->Name(), attr->Value(),
                                        attr->GetLineNum()});
        }
        CollectAttributes(element->FirstChildElement(), out);
    }
}

} // anonymous namespace

Result<XamlDocument, Error> ParseXaml(std::string_view xaml, const std::string& path) {
    tinyxml2::XMLDocument doc;
    auto err = doc.Parse(xaml.data(), xaml.size());
    if (err != tinyxml2::XML_SUCCESS) {
        return Result<XamlDocument, Error>::Err(
            Error{"ParseXaml", path, std::string("XML parse error: ") + doc.ErrorStr(),
                  std::nullopt, ErrorCategory::Scan});
    }

    XamlDocument result;
    const auto* root = doc.RootElement();
    if (root == nullptr) {
        return Result<XamlDocument, Error>::Ok(std::move(result));
    }
    auto class_name = Attr(root, "x:Class");
    if (!class_name.empty()) {
        result.class_name = std::move(class_name);
    }
    CollectAttributes(root, result.attributes);
    return Result<XamlDocument, Error>::Ok(std::move(result));
}

} // namespace workflow_tracker
