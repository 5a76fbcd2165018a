#pragma once

#include "xmastree/core/scan_state.hpp"
#include "xmastree/core/violation.hpp"
#include <cstddef>
#include <optional>
#include <string_view>

namespace xmastree {

struct DetectorStep {
    ScanState state;
    std::optional<Violation> violation;
};

// Length as the reader sees it: UTF-8 code points, not bytes
auto character_count(std::string_view text) -> size_t;

// When reading a diff, only pairs touching the change are worth flagging.
// Two context lines in the wrong order were not introduced by this patch.
auto should_compare(const ScanState& state, bool added) -> bool;

// Feed one trimmed, indented line to the run tracker. A declaration inside a
// function that is longer than the retained one is a violation; either way it
// becomes the retained declaration. Any other non-blank line ends the run.
auto detect(ScanState state, std::string_view trimmed_line, bool added) -> DetectorStep;

} // namespace xmastree
