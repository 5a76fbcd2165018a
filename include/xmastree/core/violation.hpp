#pragma once

#include <cstddef>
#include <string>

namespace xmastree {

// Two consecutive declarations in one run where the second is the longer one
struct Violation {
    std::string previous;   // Retained declaration, trimmed
    std::string current;    // Declaration that broke the ordering, trimmed
    size_t line_number{};   // Line counter value at the current declaration

    auto operator==(const Violation& other) const -> bool = default;
};

// Line number shown in reports (the line before the flagged one)
auto reported_line(const Violation& violation) -> size_t;

} // namespace xmastree
