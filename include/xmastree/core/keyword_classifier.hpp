#pragma once

#include <span>
#include <string>
#include <string_view>

namespace xmastree {

// Token-prefix heuristic: a declaration begins with a type name, a
// storage class or a type qualifier. No real parsing happens here, so
// unusual formatting can be misclassified.

// 'bool' is a typedef, and 'float'/'double' should not appear in kernel
// code, but all of them still open a declaration.
auto primitive_types() -> std::span<const std::string_view>;

// Non-exhaustive; most kernel types are bare structs rather than typedefs
auto kernel_typedefs() -> std::span<const std::string_view>;

auto storage_classes() -> std::span<const std::string_view>;
auto type_qualifiers() -> std::span<const std::string_view>;

// Text up to the first space (the whole line if there is none)
auto first_token(std::string_view line) -> std::string_view;

auto is_declaration_opener(std::string_view token) -> bool;

// Expects a line with surrounding whitespace already removed
auto is_declaration(std::string_view trimmed_line) -> bool;

} // namespace xmastree
