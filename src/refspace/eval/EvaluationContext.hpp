#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "merge/MergeOptions.hpp"
#include "path/TransparentString.hpp"
#include "resolve/DocMetadata.hpp"
#include "resolve/Reference.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace RS {

class Evaluator;

/**
 * State owned by a single Evaluator::eval() call.
 *
 * Holds the in-progress reference chain used for cycle detection, the inline
 * merge options requested by the most recent directive handler, and the memo
 * of resource documents fetched during the call. Directive handlers receive
 * the context and use it to evaluate nested nodes and resolve references.
 */
class EvaluationContext {
public:
    class ReferenceGuard;

    explicit EvaluationContext(Evaluator const& evaluator);

    EvaluationContext(EvaluationContext const&)            = delete;
    EvaluationContext& operator=(EvaluationContext const&) = delete;

    [[nodiscard]] auto evaluator() const -> Evaluator const& { return *this->owner; }

    // Evaluates a node as part of this call, sharing the cycle guard.
    [[nodiscard]] auto evaluate(Node const& node) -> Expected<Node>;
    // Resolves a reference target and evaluates it. Cycle guarded and cached.
    [[nodiscard]] auto resolve(Reference const& reference, MergeOptions const& inlineOptions) -> Expected<Node>;

    // Asks the evaluator to merge the handler's result with sibling keys using `options`.
    auto requestInlineMerge(MergeOptions options) -> void { this->pendingInlineMerge = options; }
    [[nodiscard]] auto takeInlineMerge() -> std::optional<MergeOptions>;

    /**
     * Marks `identity` as in progress until the returned guard is destroyed.
     * Fails with CycleDetected when it is already in progress, and with
     * DepthExceeded when the chain would grow past the configured limit.
     */
    [[nodiscard]] auto enter(std::string identity) -> Expected<ReferenceGuard>;

    [[nodiscard]] auto referenceChain() const -> std::vector<std::string> const& { return this->chain; }

    // Deepest chain length reached so far, including levels charged for cache hits.
    [[nodiscard]] auto peakDepth() const -> std::size_t { return this->peak; }
    auto notePeakDepth(std::size_t depth) -> void { this->peak = std::max(this->peak, depth); }
    // Restarts peak tracking at `depth` and returns the previous peak.
    auto resetPeakDepth(std::size_t depth) -> std::size_t { return std::exchange(this->peak, depth); }
    [[nodiscard]] auto isInProgress(std::string_view identity) const -> bool;
    [[nodiscard]] auto metadata() -> DocMetadata& { return this->docMetadata; }

private:
    auto leave() -> void;

    Evaluator const*                                                        owner;
    std::vector<std::string>                                                chain;
    phmap::flat_hash_set<std::string, TransparentStringHash, std::equal_to<>> inProgress;
    std::optional<MergeOptions>                                             pendingInlineMerge;
    std::size_t                                                             peak = 0;
    DocMetadata                                                             docMetadata;
};

class EvaluationContext::ReferenceGuard {
public:
    explicit ReferenceGuard(EvaluationContext* context)
        : context(context) {}
    ReferenceGuard(ReferenceGuard&& other) noexcept
        : context(std::exchange(other.context, nullptr)) {}
    ReferenceGuard(ReferenceGuard const&)            = delete;
    ReferenceGuard& operator=(ReferenceGuard const&) = delete;
    ReferenceGuard& operator=(ReferenceGuard&&)      = delete;
    ~ReferenceGuard() {
        if (this->context)
            this->context->leave();
    }

private:
    EvaluationContext* context;
};

} // namespace RS
