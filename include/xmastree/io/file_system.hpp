#pragma once

#include "xmastree/interfaces.hpp"
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace xmastree {

class FileSystem : public IFileSystem {
public:
    auto read_lines(const std::string& path) -> std::vector<std::string> override;
};

// Read a stream to the end. `name` only labels the InputError thrown for
// undecodable content.
auto read_lines(std::istream& input, const std::string& name) -> std::vector<std::string>;

auto is_valid_utf8(std::string_view text) -> bool;

} // namespace xmastree
