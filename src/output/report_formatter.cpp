#include "xmastree/output/report_formatter.hpp"

namespace xmastree {

auto format_report(const std::string& name, std::span<const Violation> violations)
    -> std::vector<std::string> {
    std::vector<std::string> lines;

    if (violations.empty()) {
        lines.push_back("No problems found in " + name);
        return lines;
    }

    lines.reserve(1 + violations.size() * 3);
    lines.push_back("WARNING: Violation(s) in " + name);
    for (const auto& violation : violations) {
        lines.push_back("Line " + std::to_string(reported_line(violation)));
        lines.push_back("\t" + violation.previous);
        lines.push_back("\t" + violation.current);
    }

    return lines;
}

auto write_report(std::ostream& out, const std::string& name,
                  std::span<const Violation> violations) -> void {
    for (const auto& line : format_report(name, violations)) {
        out << line << "\n";
    }
}

} // namespace xmastree
