#pragma once

#include "xmastree/core/scan_state.hpp"
#include "xmastree/parsers/hunk_header_parser.hpp"
#include <string>
#include <string_view>

namespace xmastree {

// What the tracker decided a physical line is
enum class LineKind {
    HUNK_HEADER,    // "@@ ... @@" line of a unified diff
    REMOVED,        // '-' line of a diff, not part of the new file
    COMMENT,        // Inside a block comment or starting with "/*"
    PREPROCESSOR,   // '#' directive
    BLOCK_CLOSE,    // Unindented '}'
    BLOCK_OPEN,     // Unindented line opening a function or struct-like body
    TOP_LEVEL,      // Any other unindented line
    CONTENT         // Indented line, candidate for the declaration check
};

struct LineStep {
    ScanState state;
    LineKind kind = LineKind::TOP_LEVEL;
    std::string content;   // Trimmed text, only set for CONTENT
    bool added = false;    // CONTENT came from a '+' line
};

// Split the diff marker off a line. Plain source lines should never start
// with '-' or be indented by a single space, so this is safe for them too.
auto strip_diff_marker(std::string_view line, size_t line_number) -> RawLine;

// Hunk context naming a function ("foo(", "label:") or a struct-like type
auto classify_hunk_context(std::string_view context) -> ContextKind;

// Counts non-overlapping occurrences, like Python's str.count
auto count_occurrences(std::string_view text, std::string_view needle) -> size_t;

// Consume one physical line and update the block, comment and line counter
// state. Never fails; odd formatting only degrades the heuristics.
auto advance(ScanState state, std::string_view line,
             const HunkHeaderParser& parser = HunkHeaderParser{}) -> LineStep;

} // namespace xmastree
