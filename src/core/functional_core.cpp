#include "xmastree/core/functional_core.hpp"
#include "xmastree/core/declaration_detector.hpp"
#include <utility>

namespace xmastree::functional_core {

auto scan_line(ScanState state, std::string_view line) -> LineResult {
    static const HunkHeaderParser parser{};

    auto step = advance(std::move(state), line, parser);
    if (step.kind != LineKind::CONTENT) {
        return LineResult{.state = std::move(step.state), .kind = step.kind, .violation = {}};
    }

    auto detected = detect(std::move(step.state), step.content, step.added);
    return LineResult{.state = std::move(detected.state),
                      .kind = LineKind::CONTENT,
                      .violation = std::move(detected.violation)};
}

auto check_lines(std::span<const std::string> lines) -> std::vector<Violation> {
    std::vector<Violation> violations;
    ScanState state;

    for (const auto& line : lines) {
        auto result = scan_line(std::move(state), line);
        if (result.violation) {
            violations.push_back(std::move(*result.violation));
        }
        state = std::move(result.state);
    }

    return violations;
}

auto check_text(std::string_view text) -> std::vector<Violation> {
    auto lines = split_lines(text);
    return check_lines(lines);
}

auto split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;

    while (!text.empty()) {
        auto newline = text.find('\n');
        auto line = text.substr(0, newline);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);

        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }

    return lines;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n\f\v");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n\f\v");
    return std::string(text.substr(start, end - start + 1));
}

} // namespace xmastree::functional_core
