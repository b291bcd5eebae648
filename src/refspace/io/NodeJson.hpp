#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace RS {

using Json = nlohmann::json;

// Integers that do not fit int64 become doubles.
[[nodiscard]] auto FromJson(Json const& json) -> Node;
[[nodiscard]] auto ToJson(Node const& node) -> Json;

[[nodiscard]] auto ParseJson(std::string_view text) -> Expected<Node>;
// indent < 0 produces the compact form.
[[nodiscard]] auto DumpJson(Node const& node, int indent = -1) -> std::string;

} // namespace RS
