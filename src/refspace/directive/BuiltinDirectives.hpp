#pragma once
#include "directive/Directive.hpp"

#include <vector>

namespace RS {

// $ref: "scope::path[!merge:<opts>]", the evaluated target.
auto RefDirective() -> Directive;
// $use: "component(scope::path)[!merge:<opts>]", the target wrapped by the transform.
auto UseDirective() -> Directive;
// $merge: a list of sources, or {strategy, key_conflict, sources}, folded left to right.
auto MergeDirective() -> Directive;

auto BuiltinDirectives() -> std::vector<Directive>;

} // namespace RS
