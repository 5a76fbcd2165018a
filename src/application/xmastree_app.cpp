#include "xmastree/application/xmastree_app.hpp"
#include "xmastree/core/functional_core.hpp"
#include "xmastree/io/file_system.hpp"
#include "xmastree/output/report_formatter.hpp"
#include <filesystem>
#include <utility>

namespace xmastree {

XmastreeApp::XmastreeApp(std::unique_ptr<IFileSystem> filesystem)
    : filesystem_(std::move(filesystem)) {}

auto XmastreeApp::run(const Config& config, std::istream& in, std::ostream& out) -> int {
    if (config.input_paths.empty()) {
        auto violations = check_stream(in);
        write_report(out, STDIN_NAME, violations);
        return 0;
    }

    for (const auto& path : config.input_paths) {
        auto violations = check_file(path);
        write_report(out, display_name(path), violations);
    }

    return 0;
}

auto XmastreeApp::check_stream(std::istream& in) -> std::vector<Violation> {
    auto lines = read_lines(in, STDIN_NAME);
    return functional_core::check_lines(lines);
}

auto XmastreeApp::check_file(const std::string& path) -> std::vector<Violation> {
    // Fresh state per file: nothing carries over between inputs
    auto lines = filesystem_->read_lines(path);
    return functional_core::check_lines(lines);
}

auto display_name(const std::string& path) -> std::string {
    return std::filesystem::path(path).filename().string();
}

} // namespace xmastree
