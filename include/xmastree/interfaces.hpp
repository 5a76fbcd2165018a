#pragma once

#include <string>
#include <vector>

namespace xmastree {

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Whole file as lines without terminators. Throws InputError when the
    // file cannot be opened or is not valid UTF-8.
    virtual auto read_lines(const std::string& path) -> std::vector<std::string> = 0;
};

} // namespace xmastree
