#include "xmastree/core/declaration_detector.hpp"
#include "xmastree/core/keyword_classifier.hpp"
#include <string>
#include <utility>

namespace xmastree {

auto character_count(std::string_view text) -> size_t {
    size_t count = 0;
    for (char c : text) {
        // Continuation bytes look like 10xxxxxx
        if ((static_cast<unsigned char>(c) & 0xC0U) != 0x80U) {
            count++;
        }
    }
    return count;
}

auto should_compare(const ScanState& state, bool added) -> bool {
    if (!state.last_declaration) {
        return false;
    }
    return added || state.last_declaration->added || !state.is_diff;
}

auto detect(ScanState state, std::string_view trimmed_line, bool added) -> DetectorStep {
    DetectorStep step{.state = std::move(state), .violation = std::nullopt};
    auto& current = step.state;

    if (is_declaration(trimmed_line) && current.in_function()) {
        if (should_compare(current, added)
            && character_count(trimmed_line) > character_count(current.last_declaration->text)) {
            step.violation = Violation{.previous = current.last_declaration->text,
                                       .current = std::string(trimmed_line),
                                       .line_number = current.line_number};
        }
        current.last_declaration
            = RetainedDeclaration{.text = std::string(trimmed_line), .added = added};
    } else if (!trimmed_line.empty()) {
        current.last_declaration.reset();
    }

    return step;
}

} // namespace xmastree
