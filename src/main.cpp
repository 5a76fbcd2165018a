#include "xmastree/application/xmastree_app.hpp"
#include "xmastree/io/file_system.hpp"

#include <exception>
#include <iostream>
#include <memory>

namespace {

// Every argument names an input file; no arguments means stdin
auto parse_args(int argc, char* argv[]) -> xmastree::Config {
    xmastree::Config config;

    for (int i = 1; i < argc; ++i) {
        config.input_paths.emplace_back(argv[i]);
    }

    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    auto config = parse_args(argc, argv);
    xmastree::XmastreeApp app(std::make_unique<xmastree::FileSystem>());

    try {
        return app.run(config, std::cin, std::cout);
    } catch (const std::exception& e) {
        std::cout.flush();
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
