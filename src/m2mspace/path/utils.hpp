#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace M2M {

/**
 * @brief Glob match of a single name against a pattern.
 *
 * Supports '*' (any run, including empty), '?' (one character), '[...]' character
 * classes with ranges and '!' negation, and '\' escapes.
 */
auto match_names(std::string_view const pattern, std::string_view const name) -> bool;

auto is_glob(std::string_view text) -> bool;

/**
 * @brief Split a path on '/' keeping empty components.
 */
auto split_path(std::string_view path) -> std::vector<std::string_view>;

auto join_path(std::vector<std::string_view> const& segments, std::size_t first) -> std::string;

} // namespace M2M
