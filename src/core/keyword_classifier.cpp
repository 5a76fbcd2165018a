#include "xmastree/core/keyword_classifier.hpp"
#include <array>
#include <unordered_set>

namespace xmastree {

namespace {

constexpr std::array<std::string_view, 16> PRIMITIVE_TYPES{
    "signed", "unsigned", "char", "short", "int", "long", "size_t", "intptr_t",
    "uintptr_t", "void", "bool", "float", "double", "struct", "union", "enum"};

constexpr std::array<std::string_view, 9> KERNEL_TYPEDEFS{
    "u8", "u16", "u32", "u64", "s8", "s16", "s32", "s64", "cpumask_var_t"};

constexpr std::array<std::string_view, 4> STORAGE_CLASSES{"auto", "static", "register",
                                                          "extern"};

constexpr std::array<std::string_view, 3> TYPE_QUALIFIERS{"const", "volatile", "restrict"};

auto build_opener_set() -> std::unordered_set<std::string_view> {
    std::unordered_set<std::string_view> openers;
    for (auto category : {std::span<const std::string_view>(PRIMITIVE_TYPES),
                          std::span<const std::string_view>(KERNEL_TYPEDEFS),
                          std::span<const std::string_view>(STORAGE_CLASSES),
                          std::span<const std::string_view>(TYPE_QUALIFIERS)}) {
        openers.insert(category.begin(), category.end());
    }
    return openers;
}

} // namespace

auto primitive_types() -> std::span<const std::string_view> { return PRIMITIVE_TYPES; }

auto kernel_typedefs() -> std::span<const std::string_view> { return KERNEL_TYPEDEFS; }

auto storage_classes() -> std::span<const std::string_view> { return STORAGE_CLASSES; }

auto type_qualifiers() -> std::span<const std::string_view> { return TYPE_QUALIFIERS; }

auto first_token(std::string_view line) -> std::string_view {
    auto space = line.find(' ');
    if (space == std::string_view::npos) {
        return line;
    }
    return line.substr(0, space);
}

auto is_declaration_opener(std::string_view token) -> bool {
    // Built once; the views point at the constexpr arrays above
    static const auto openers = build_opener_set();
    return openers.contains(token);
}

auto is_declaration(std::string_view trimmed_line) -> bool {
    return is_declaration_opener(first_token(trimmed_line));
}

} // namespace xmastree
