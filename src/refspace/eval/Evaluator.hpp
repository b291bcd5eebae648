#pragma once
#include "cache/ResolutionCache.hpp"
#include "config/EvaluatorOptions.hpp"
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "directive/DirectiveRegistry.hpp"
#include "eval/EvaluationContext.hpp"
#include "resolve/ScopeResolver.hpp"

#include <memory>
#include <string_view>

namespace RS {

/**
 * Resolves directives in a Node tree.
 *
 * Scalars are returned as they are. Sequences are evaluated element by
 * element. A mapping without a directive key has each value evaluated; a
 * mapping holding exactly one directive key is replaced by the directive's
 * result, merged with the remaining (evaluated) sibling keys when there are
 * any. The pre-evaluation hook, when set, rewrites every node first.
 *
 * Mapping keys are visited in sorted key order, not in document order. When
 * several keys fail, the error reported is the one for the smallest key, and
 * the pre-evaluation hook sees sibling values in that same order.
 *
 * An Evaluator is immutable after construction apart from its cache, which
 * locks internally, so eval() may be called concurrently.
 */
class Evaluator {
public:
    explicit Evaluator(EvaluatorOptions options = {});
    ~Evaluator();

    Evaluator(Evaluator const&)            = delete;
    Evaluator& operator=(Evaluator const&) = delete;

    [[nodiscard]] auto eval(Node const& node) const -> Expected<Node>;

    // Resolves "scope::path" and evaluates the target, as a $ref would.
    [[nodiscard]] auto resolvePath(std::string_view scope, std::string_view path) const -> Expected<Node>;

    [[nodiscard]] auto options() const -> EvaluatorOptions const& { return this->opts; }
    [[nodiscard]] auto directives() const -> DirectiveRegistry const& { return *this->registry; }
    [[nodiscard]] auto scopes() const -> ScopeResolver const& { return this->scopeResolver; }
    // nullptr when caching is disabled.
    [[nodiscard]] auto cache() const -> ResolutionCache* { return this->resultCache.get(); }

private:
    friend class EvaluationContext;

    [[nodiscard]] auto evaluateNode(EvaluationContext& context, Node const& node) const -> Expected<Node>;
    [[nodiscard]] auto evaluateMapping(EvaluationContext& context, Node::Mapping const& mapping) const -> Expected<Node>;
    [[nodiscard]] auto evaluateSequence(EvaluationContext& context, Node::Sequence const& sequence) const -> Expected<Node>;
    [[nodiscard]] auto applyDirective(EvaluationContext& context, Directive const& directive, Node::Mapping const& mapping, std::string const& key) const -> Expected<Node>;
    [[nodiscard]] auto resolveReference(EvaluationContext& context, Reference const& reference, MergeOptions const& inlineOptions) const -> Expected<Node>;

    EvaluatorOptions                         opts;
    ScopeResolver                            scopeResolver;
    std::shared_ptr<DirectiveRegistry const> registry;
    std::unique_ptr<ResolutionCache>         resultCache;
};

} // namespace RS
