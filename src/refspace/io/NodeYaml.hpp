#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <string>
#include <string_view>

namespace YAML {
class Node;
}

namespace RS {

/**
 * YAML is decoded with the YAML 1.2 core schema: plain scalars become null,
 * bool, integer or float when they spell one, quoted scalars always stay
 * strings. Only the first document of a stream is read.
 */
[[nodiscard]] auto FromYaml(YAML::Node const& yaml) -> Expected<Node>;
[[nodiscard]] auto ParseYaml(std::string_view text) -> Expected<Node>;

// Strings that would read back as another kind are double-quoted.
[[nodiscard]] auto DumpYaml(Node const& node) -> std::string;

// Value a plain (unquoted) scalar takes under the core schema.
[[nodiscard]] auto ResolvePlainScalar(std::string_view text) -> Node;

} // namespace RS
