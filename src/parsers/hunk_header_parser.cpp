#include "xmastree/parsers/hunk_header_parser.hpp"
#include "xmastree/core/functional_core.hpp"
#include <exception>

namespace xmastree {

auto HunkHeaderParser::is_hunk_header(std::string_view line) -> bool {
    return line.starts_with("@@");
}

auto HunkHeaderParser::parse(std::string_view line) const -> HunkHeader {
    HunkHeader header;
    if (!is_hunk_header(line)) {
        return header;
    }

    // Split what follows the opening "@@" at the closing one
    auto rest = line.substr(2);
    auto close = rest.find("@@");
    std::string location{rest.substr(0, close)};
    if (close != std::string_view::npos) {
        header.context = functional_core::trim(rest.substr(close + 2));
    }

    header.new_start = parse_new_start(location);
    return header;
}

auto HunkHeaderParser::parse_new_start(const std::string& location) const
    -> std::optional<size_t> {
    std::smatch match;
    if (!std::regex_search(location, match, location_pattern_)) {
        return std::nullopt;
    }

    try {
        return static_cast<size_t>(std::stoul(match[1].str()));
    } catch (const std::exception&) {
        // Out of range offset, keep counting from where we are
        return std::nullopt;
    }
}

} // namespace xmastree
