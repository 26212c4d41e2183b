#include <workflow_tracker/scanner/scanner_registry.hpp>

#include <workflow_tracker/scanner/angular_scanner.hpp>
#include <workflow_tracker/scanner/csharp_scanner.hpp>
#include <workflow_tracker/scanner/react_scanner.hpp>
#include <workflow_tracker/scanner/typescript_scanner.hpp>
#include <workflow_tracker/scanner/wpf_scanner.hpp>

namespace workflow_tracker {

ScannerRegistry ScannerRegistry::CreateDefault(const ScanConfig& config) {
    ScannerRegistry registry;
    registry.Register(std::make_unique<WpfScanner>(config));
    registry.Register(std::make_unique<AngularScanner>(config));
    registry.Register(std::make_unique<ReactScanner>(config));
    registry.Register(std::make_unique<CSharpScanner>(config));
    registry.Register(std::make_unique<TypeScriptScanner>(config));
    return registry;
}

void ScannerRegistry::Register(std::unique_ptr<IScanner> scanner) {
    scanners_.push_back(std::move(scanner));
}

const IScanner* ScannerRegistry::Select(const std::string& file_path) const {
    for (const auto& scanner : scanners_) {
        if (scanner->CanScan(file_path)) {
            return scanner.get();
        }
    }
    return nullptr;
}

} // namespace workflow_tracker
