#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "merge/MergeOptions.hpp"

namespace RS {

/**
 * Combines `left` and `right` according to `options`.
 *
 * Object strategies:
 *   replace  the result is `right`, whatever the kinds involved.
 *   shallow  two mappings combine key by key; a shared key takes `right`'s value wholesale.
 *   deep     two mappings combine recursively. Shared keys holding two mappings recurse,
 *            two sequences use the array strategy, anything else takes `right`'s value.
 *            Two top-level sequences use the array strategy directly.
 *
 * Shared top-level mapping keys are first subject to `options.keyConflict`:
 * `first` keeps `left`'s value, `error` fails with KeyConflict{key}.
 *
 * Any other combination of kinds falls back to replace. A null `left` yields `right`.
 */
[[nodiscard]] auto mergeValues(Node const& left, Node const& right, MergeOptions const& options) -> Expected<Node>;

// Array sub-strategy on two sequences. unique/union keep the first occurrence of each value.
[[nodiscard]] auto mergeArrays(Node::Sequence const& left, Node::Sequence const& right, ArrayStrategy strategy) -> Node::Sequence;

/**
 * Combines a directive result with the evaluated sibling keys of the mapping that held
 * the directive. A null result yields the siblings. Sequences and other scalars cannot
 * absorb siblings and fail with ValidationError. With the replace object strategy the
 * result is returned untouched.
 */
[[nodiscard]] auto mergeInline(Node const& result, Node::Mapping const& siblings, MergeOptions const& options) -> Expected<Node>;

} // namespace RS
