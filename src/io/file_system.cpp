#include "xmastree/io/file_system.hpp"
#include "xmastree/core/functional_core.hpp"
#include "xmastree/io/input_error.hpp"
#include <fstream>
#include <iterator>

namespace xmastree {

auto FileSystem::read_lines(const std::string& path) -> std::vector<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw InputError(path, "cannot open file");
    }
    return xmastree::read_lines(file, path);
}

auto read_lines(std::istream& input, const std::string& name) -> std::vector<std::string> {
    std::string content{std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>()};
    if (input.bad()) {
        throw InputError(name, "read error");
    }
    if (!is_valid_utf8(content)) {
        throw InputError(name, "invalid UTF-8");
    }
    return functional_core::split_lines(content);
}

auto is_valid_utf8(std::string_view text) -> bool {
    size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<unsigned char>(text[i]);
        size_t length = 0;
        unsigned int code_point = 0;

        if (lead < 0x80U) {
            i++;
            continue;
        } else if ((lead & 0xE0U) == 0xC0U) {
            length = 2;
            code_point = lead & 0x1FU;
        } else if ((lead & 0xF0U) == 0xE0U) {
            length = 3;
            code_point = lead & 0x0FU;
        } else if ((lead & 0xF8U) == 0xF0U) {
            length = 4;
            code_point = lead & 0x07U;
        } else {
            return false;
        }

        if (i + length > text.size()) {
            return false;
        }
        for (size_t k = 1; k < length; ++k) {
            auto byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0U) != 0x80U) {
                return false;
            }
            code_point = (code_point << 6U) | (byte & 0x3FU);
        }

        // Reject overlong forms, surrogates and anything past U+10FFFF
        static constexpr unsigned int MIN_FOR_LENGTH[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code_point < MIN_FOR_LENGTH[length] || code_point > 0x10FFFFU
            || (code_point >= 0xD800U && code_point <= 0xDFFFU)) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace xmastree
