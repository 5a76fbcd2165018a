#include "xmastree/core/context_tracker.hpp"
#include "xmastree/core/functional_core.hpp"
#include <utility>

namespace xmastree {

namespace {

auto apply_hunk_header(LineStep step, std::string_view line, const HunkHeaderParser& parser)
    -> LineStep {
    auto& state = step.state;
    auto header = parser.parse(line);

    state.is_diff = true;
    if (header.new_start) {
        state.line_number = *header.new_start;
    }

    // A hunk can start anywhere, so forget everything about the previous one
    state.in_comment = false;
    state.leave_block();
    state.last_declaration.reset();

    auto kind = classify_hunk_context(header.context);
    if (kind != ContextKind::TOP_LEVEL) {
        state.enter_block(kind, header.context);
    }

    step.kind = LineKind::HUNK_HEADER;
    return step;
}

} // namespace

auto strip_diff_marker(std::string_view line, size_t line_number) -> RawLine {
    RawLine raw{.marker = DiffMarker::NOT_DIFF, .line_number = line_number, .content = {}};

    if (line.starts_with('-')) {
        raw.marker = DiffMarker::REMOVED;
        line.remove_prefix(1);
    } else if (line.starts_with('+')) {
        raw.marker = DiffMarker::ADDED;
        line.remove_prefix(1);
    } else if (line.starts_with(' ')) {
        raw.marker = DiffMarker::CONTEXT;
        line.remove_prefix(1);
    }

    raw.content = std::string(line);
    return raw;
}

auto classify_hunk_context(std::string_view context) -> ContextKind {
    if (context.find(':') != std::string_view::npos
        || context.find('(') != std::string_view::npos) {
        return ContextKind::IN_FUNCTION;
    }
    if (context.find("struct") != std::string_view::npos
        || context.find("enum") != std::string_view::npos
        || context.find("union") != std::string_view::npos) {
        return ContextKind::IN_STRUCT_LIKE;
    }
    return ContextKind::TOP_LEVEL;
}

auto count_occurrences(std::string_view text, std::string_view needle) -> size_t {
    if (needle.empty()) {
        return 0;
    }

    size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string_view::npos;
         pos = text.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

auto advance(ScanState state, std::string_view line, const HunkHeaderParser& parser)
    -> LineStep {
    LineStep step{.state = std::move(state), .kind = LineKind::TOP_LEVEL, .content = {},
                  .added = false};
    auto& current = step.state;
    current.line_number++;

    if (HunkHeaderParser::is_hunk_header(line)) {
        return apply_hunk_header(std::move(step), line, parser);
    }

    auto raw = strip_diff_marker(line, current.line_number);
    if (raw.marker == DiffMarker::REMOVED) {
        // Removed lines do not exist in the patched file
        current.line_number--;
        step.kind = LineKind::REMOVED;
        return step;
    }
    const std::string& text = raw.content;

    auto opens = count_occurrences(text, "/*");
    auto closes = count_occurrences(text, "*/");
    if (opens > closes) {
        current.in_comment = true;
    }
    if (closes > opens) {
        current.in_comment = false;
    }
    // A line starting with "/*" is taken as a whole-line comment
    if (current.in_comment || functional_core::trim(text).starts_with("/*")) {
        step.kind = LineKind::COMMENT;
        return step;
    }

    if (text.starts_with('#')) {
        step.kind = LineKind::PREPROCESSOR;
        return step;
    }

    // An unindented closing brace ends whatever block we were in
    if (text.starts_with('}')) {
        current.leave_block();
        current.in_comment = false;
        step.kind = LineKind::BLOCK_CLOSE;
    }

    // Without a leading tab the line cannot be inside a body
    if (!text.starts_with('\t')) {
        current.leave_block();
        if (text.starts_with('{')) {
            // Structs keep '{' at the end of the line, so this opens a function
            current.enter_block(ContextKind::IN_FUNCTION, functional_core::trim(text));
            current.last_declaration.reset();
            step.kind = LineKind::BLOCK_OPEN;
        } else if (text.find('{') != std::string::npos) {
            // Struct definition, or a static struct variable being initialised
            current.enter_block(ContextKind::IN_STRUCT_LIKE, functional_core::trim(text));
            step.kind = LineKind::BLOCK_OPEN;
        } else if (step.kind != LineKind::BLOCK_CLOSE) {
            step.kind = LineKind::TOP_LEVEL;
        }
        return step;
    }

    step.kind = LineKind::CONTENT;
    step.content = functional_core::trim(text);
    step.added = raw.added();
    return step;
}

} // namespace xmastree
