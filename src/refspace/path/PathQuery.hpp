#pragma once
#include "core/Node.hpp"

#include <optional>
#include <string_view>

namespace RS {

/**
 * Path-query capability: looks a path expression up inside a document.
 * Returns std::nullopt when nothing matches. Implementations must be safe to
 * call concurrently; the evaluator shares one instance across eval() calls.
 */
class PathQuery {
public:
    virtual ~PathQuery() = default;

    [[nodiscard]] virtual auto query(Node const& document, std::string_view path) const -> std::optional<Node> = 0;
};

} // namespace RS
