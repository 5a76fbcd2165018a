#pragma once

#include "xmastree/core/violation.hpp"
#include <ostream>
#include <span>
#include <string>
#include <vector>

namespace xmastree {

// Report for one input, one entry per output line:
//   No problems found in <name>
// or
//   WARNING: Violation(s) in <name>
//   Line <n>
//   \t<previous declaration>
//   \t<current declaration>
auto format_report(const std::string& name, std::span<const Violation> violations)
    -> std::vector<std::string>;

auto write_report(std::ostream& out, const std::string& name,
                  std::span<const Violation> violations) -> void;

} // namespace xmastree
