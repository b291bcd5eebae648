#pragma once
#include <string_view>

namespace RS {

// Glob match of a single name against a pattern: `*`, `?`, `[a-z]`, `[!x]` and `\` escapes.
auto match_names(std::string_view const pattern, std::string_view const name) -> bool;
auto is_glob(std::string_view text) -> bool;

} // namespace RS
