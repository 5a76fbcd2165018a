#pragma once

#include "xmastree/interfaces.hpp"
#include "xmastree/core/violation.hpp"
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace xmastree {

struct Config {
    std::vector<std::string> input_paths;   // Empty: read standard input
};

class XmastreeApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;

public:
    static constexpr const char* STDIN_NAME = "input";

    explicit XmastreeApp(std::unique_ptr<IFileSystem> filesystem);

    // Check every input in order and print one report each. The exit code
    // does not depend on violations. An unreadable input throws InputError
    // and stops the run before any later input is read.
    auto run(const Config& config, std::istream& in, std::ostream& out) -> int;

private:
    auto check_stream(std::istream& in) -> std::vector<Violation>;
    auto check_file(const std::string& path) -> std::vector<Violation>;
};

// Name used in reports for a path: its last component
auto display_name(const std::string& path) -> std::string;

} // namespace xmastree
