#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace xmastree {

// An input that cannot be opened or decoded. Fatal for the whole run.
class InputError : public std::runtime_error {
public:
    InputError(std::string name, const std::string& reason)
        : std::runtime_error(name + ": " + reason), name_(std::move(name)) {}

    auto name() const -> const std::string& { return name_; }

private:
    std::string name_;
};

} // namespace xmastree
