#pragma once
#include "path/PathQuery.hpp"

#include <string>
#include <vector>

namespace RS {

/**
 * Default path-query engine.
 *
 * Grammar, segments separated by '.':
 *   name            mapping key; "\." keeps a literal dot inside the name
 *   3               sequence index (or key "3" on a mapping)
 *   #               sequence length when last; otherwise the rest of the path
 *                   is applied to every element and the matches collected
 *   pat*[a-z]?      glob over mapping keys, first match in key order
 *   #(lhs op rhs)   first sequence element satisfying the predicate
 *   #(lhs op rhs)#  every element satisfying the predicate
 *
 * Predicate operators are == != < <= > >= % !% where % is a glob match. The
 * left side is a path relative to the element, empty for the element itself.
 * The right side is a quoted string, a number, true, false or null. A
 * predicate without an operator tests that the left side exists.
 */
class DottedPathQuery final : public PathQuery {
public:
    [[nodiscard]] auto query(Node const& document, std::string_view path) const -> std::optional<Node> override;

    // Splits on unescaped dots outside predicate parentheses.
    [[nodiscard]] static auto splitSegments(std::string_view path) -> std::vector<std::string>;

private:
    [[nodiscard]] auto walk(Node const& current, std::vector<std::string> const& segments, std::size_t index) const -> std::optional<Node>;
};

} // namespace RS
