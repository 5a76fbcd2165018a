#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace xmastree {

// Which kind of block the cursor is in. Comment state is tracked separately
// because a line can be inside a function and inside a comment at once.
enum class ContextKind {
    TOP_LEVEL,       // File scope, or nothing known yet
    IN_FUNCTION,     // Function body: declarations are checked
    IN_STRUCT_LIKE   // struct/union/enum body or struct literal: ignored
};

enum class DiffMarker {
    NOT_DIFF,   // No marker character
    ADDED,      // '+'
    CONTEXT,    // ' '
    REMOVED     // '-'
};

// One physical line after its diff marker has been removed
struct RawLine {
    DiffMarker marker = DiffMarker::NOT_DIFF;
    size_t line_number{};
    std::string content;

    auto added() const -> bool { return marker == DiffMarker::ADDED; }
};

// Last declaration of the current run
struct RetainedDeclaration {
    std::string text;
    bool added = false;   // Came from a '+' line of a diff

    auto operator==(const RetainedDeclaration& other) const -> bool = default;
};

// Everything the checker remembers between two lines of one input.
// A fresh value is created per input and discarded at end of input.
struct ScanState {
    ContextKind context = ContextKind::TOP_LEVEL;
    std::string context_descriptor;   // Hunk context text or the line that opened the block
    bool in_comment = false;
    bool is_diff = false;             // Set for good by the first hunk header
    size_t line_number = 0;
    std::optional<RetainedDeclaration> last_declaration;

    auto in_function() const -> bool { return context == ContextKind::IN_FUNCTION; }
    auto in_struct_like() const -> bool { return context == ContextKind::IN_STRUCT_LIKE; }

    // Leave any function or struct-like body
    auto leave_block() -> void {
        context = ContextKind::TOP_LEVEL;
        context_descriptor.clear();
    }

    auto enter_block(ContextKind kind, std::string descriptor) -> void {
        context = kind;
        context_descriptor = std::move(descriptor);
    }
};

} // namespace xmastree
