#pragma once
#include "cache/ResolutionCache.hpp"
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "merge/MergeOptions.hpp"
#include "path/PathQuery.hpp"
#include "resolve/ResourceResolver.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace RS {

class DirectiveRegistry;

// Rewrites a $use target into the (key, value) pair placed in the output.
using TransformUseFn = std::function<Expected<std::pair<std::string, Node>>(std::string_view component, Node const& value)>;
// Runs on every node before it is evaluated.
using PreEvalFn = std::function<Expected<Node>(Node const& node)>;

struct EvaluatorOptions {
    std::optional<Node> localScope;
    std::optional<Node> globalScope;

    TransformUseFn transformUse;
    PreEvalFn      preEval;

    std::shared_ptr<ResourceResolver>        resourceResolver;
    std::shared_ptr<PathQuery const>         pathQuery;  // DottedPathQuery when null
    std::shared_ptr<DirectiveRegistry const> directives; // DefaultDirectiveRegistry() when null

    // Used when a reference token carries no "!merge:" suffix.
    MergeOptions inlineMergeDefaults{};
    CacheConfig  cache{};
    std::size_t  maxReferenceDepth = 128;
};

/**
 * Reads REFSPACE_CACHE_ENABLED, REFSPACE_CACHE_MAX_COST, REFSPACE_CACHE_NUM_COUNTERS,
 * REFSPACE_MAX_REFERENCE_DEPTH and REFSPACE_INLINE_MERGE. Returns false on the first
 * malformed value after reporting it on stderr; that key is left untouched.
 */
bool ApplyEvaluatorEnvOverrides(EvaluatorOptions& options);
auto ValidateEvaluatorOptions(EvaluatorOptions const& options) -> std::optional<std::string>;

} // namespace RS
