#pragma once

#include "xmastree/core/context_tracker.hpp"
#include "xmastree/core/scan_state.hpp"
#include "xmastree/core/violation.hpp"
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace xmastree::functional_core {

// Result of feeding one line to the checker (pure state transition)
struct LineResult {
    ScanState state;
    LineKind kind = LineKind::TOP_LEVEL;
    std::optional<Violation> violation;
};

auto scan_line(ScanState state, std::string_view line) -> LineResult;

// Check one whole input, plain source or unified diff. Violations come back
// in input order; the same lines always give the same result.
auto check_lines(std::span<const std::string> lines) -> std::vector<Violation>;
auto check_text(std::string_view text) -> std::vector<Violation>;

// Text helpers (pure)
auto split_lines(std::string_view text) -> std::vector<std::string>;
auto trim(std::string_view text) -> std::string;

} // namespace xmastree::functional_core
