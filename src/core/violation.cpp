#include "xmastree/core/violation.hpp"

namespace xmastree {

auto reported_line(const Violation& violation) -> size_t {
    if (violation.line_number == 0) {
        return 0;
    }
    return violation.line_number - 1;
}

} // namespace xmastree
