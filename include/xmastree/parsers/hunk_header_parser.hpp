#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace xmastree {

// Parsed "@@ -<old>,<count> +<new>,<count> @@ <context>" line
struct HunkHeader {
    std::optional<size_t> new_start;   // Unset when the range does not match
    std::string context;               // Text after the closing "@@", trimmed

    auto operator==(const HunkHeader& other) const -> bool = default;
};

class HunkHeaderParser {
public:
    static auto is_hunk_header(std::string_view line) -> bool;

    // Never fails: a malformed range only leaves new_start empty
    auto parse(std::string_view line) const -> HunkHeader;

private:
    auto parse_new_start(const std::string& location) const -> std::optional<size_t>;

    // Both counts are required; "@@ -1 +1 @@" does not re-seed the counter
    static inline const std::regex location_pattern_{R"(-\d+,\d+ \+(\d+),\d+)"};
};

} // namespace xmastree
