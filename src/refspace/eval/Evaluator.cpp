#include "Evaluator.hpp"

#include "log/TaggedLogger.hpp"
#include "merge/Merge.hpp"

namespace RS {

Evaluator::Evaluator(EvaluatorOptions options)
    : opts(std::move(options)),
      scopeResolver(this->opts.localScope, this->opts.globalScope, this->opts.resourceResolver, this->opts.pathQuery),
      registry(this->opts.directives ? this->opts.directives : DefaultDirectiveRegistry()) {
    if (this->opts.cache.enabled) {
        this->resultCache = std::make_unique<ResolutionCache>(this->opts.cache);
    }
}

Evaluator::~Evaluator() = default;

auto Evaluator::eval(Node const& node) const -> Expected<Node> {
    EvaluationContext context{*this};
    return this->evaluateNode(context, node);
}

auto Evaluator::resolvePath(std::string_view scope, std::string_view path) const -> Expected<Node> {
    std::string token{scope};
    token.append("::");
    token.append(path);
    auto reference = parseReference(token);
    if (!reference)
        return std::unexpected(reference.error());

    auto inlineOptions = this->opts.inlineMergeDefaults;
    if (reference->mergeSpec) {
        auto parsed = parseInlineMergeSpec(*reference->mergeSpec, inlineOptions);
        if (!parsed)
            return std::unexpected(parsed.error());
        inlineOptions = *parsed;
    }
    EvaluationContext context{*this};
    return this->resolveReference(context, *reference, inlineOptions);
}

auto Evaluator::evaluateNode(EvaluationContext& context, Node const& node) const -> Expected<Node> {
    Node const* current = &node;
    Node        rewritten;
    if (this->opts.preEval) {
        auto result = this->opts.preEval(node);
        if (!result) {
            auto message = std::string{"pre-evaluation hook failed"};
            if (result.error().message && !result.error().message->empty())
                message += ": " + *result.error().message;
            return std::unexpected(Error{Error::Code::PreEvalError, std::move(message), result.error().subjects});
        }
        rewritten = std::move(*result);
        current   = &rewritten;
    }

    if (auto const* mapping = current->tryMapping())
        return this->evaluateMapping(context, *mapping);
    if (auto const* sequence = current->trySequence())
        return this->evaluateSequence(context, *sequence);
    return *current;
}

auto Evaluator::evaluateMapping(EvaluationContext& context, Node::Mapping const& mapping) const -> Expected<Node> {
    std::shared_ptr<Directive const> directive;
    std::string const*               directiveKey = nullptr;
    for (auto const& [key, value] : mapping) {
        if (key.empty() || key.front() != DirectiveRegistry::Sigil)
            continue;
        if (auto found = this->registry->find(key)) {
            if (directive)
                return std::unexpected(validationError("multiple directives are not allowed in a map"));
            directive    = std::move(found);
            directiveKey = &key;
        }
    }
    if (directive)
        return this->applyDirective(context, *directive, mapping, *directiveKey);

    Node::Mapping result;
    for (auto const& [key, value] : mapping) {
        auto evaluated = this->evaluateNode(context, value);
        if (!evaluated)
            return std::unexpected(withContext(std::move(evaluated.error()), "failed to evaluate key '" + key + "'"));
        result.emplace(key, std::move(*evaluated));
    }
    return Node{std::move(result)};
}

auto Evaluator::evaluateSequence(EvaluationContext& context, Node::Sequence const& sequence) const -> Expected<Node> {
    Node::Sequence result;
    result.reserve(sequence.size());
    for (std::size_t i = 0; i < sequence.size(); ++i) {
        auto evaluated = this->evaluateNode(context, sequence[i]);
        if (!evaluated)
            return std::unexpected(withContext(std::move(evaluated.error()), "failed to evaluate index " + std::to_string(i)));
        result.push_back(std::move(*evaluated));
    }
    return Node{std::move(result)};
}

auto Evaluator::applyDirective(EvaluationContext& context, Directive const& directive, Node::Mapping const& mapping, std::string const& key) const -> Expected<Node> {
    auto const& payload     = mapping.find(key)->second;
    bool const  hasSiblings = mapping.size() > 1;
    if (hasSiblings && !directive.allowsSiblings)
        return std::unexpected(validationError(directive.name + " directive cannot have sibling keys"));

    if (directive.validator) {
        if (auto error = directive.validator(payload))
            return std::unexpected(std::move(*error));
    }

    // Clear anything left behind by a handler that failed before its result was consumed.
    (void)context.takeInlineMerge();
    auto result = directive.handler(context, payload);
    if (!result)
        return std::unexpected(std::move(result.error()));
    auto const requested = context.takeInlineMerge();

    Node value = std::move(*result);
    if (!directive.resolvesResult) {
        auto evaluated = this->evaluateNode(context, value);
        if (!evaluated)
            return std::unexpected(std::move(evaluated.error()));
        value = std::move(*evaluated);
    }
    if (!hasSiblings)
        return value;

    Node::Mapping siblings;
    for (auto const& [siblingKey, siblingValue] : mapping) {
        if (siblingKey == key)
            continue;
        auto evaluated = this->evaluateNode(context, siblingValue);
        if (!evaluated)
            return std::unexpected(withContext(std::move(evaluated.error()), "failed to evaluate key '" + siblingKey + "'"));
        siblings.emplace(siblingKey, std::move(*evaluated));
    }
    return mergeInline(value, siblings, requested.value_or(this->opts.inlineMergeDefaults));
}

auto Evaluator::resolveReference(EvaluationContext& context, Reference const& reference, MergeOptions const& inlineOptions) const -> Expected<Node> {
    auto guard = context.enter(reference.identity());
    if (!guard)
        return std::unexpected(std::move(guard.error()));
    // Reference levels held by the callers of this one.
    auto const above = context.referenceChain().size() - 1;

    std::string fingerprint;
    if (this->resultCache) {
        fingerprint = ResolutionCache::fingerprint(reference.scope, reference.canonicalPath(), inlineOptions);
        // A hit is used only when the levels its target needed still fit below the limit.
        auto cached = this->resultCache->lookup(fingerprint);
        if (cached && above + cached->depth <= this->opts.maxReferenceDepth) {
            context.notePeakDepth(above + cached->depth);
            return std::move(cached->value);
        }
    }

    rs_log("Resolving " + reference.identity(), "Resolve", "Trace");
    auto const outerPeak = context.resetPeakDepth(above + 1);
    auto       evaluated = [&]() -> Expected<Node> {
        auto target = this->scopeResolver.resolve(reference, context.metadata());
        if (!target)
            return std::unexpected(std::move(target.error()));
        return this->evaluateNode(context, *target);
    }();
    auto const reached = context.resetPeakDepth(outerPeak);
    context.notePeakDepth(reached);

    if (evaluated && this->resultCache)
        this->resultCache->set(fingerprint, *evaluated, reached - above);
    return evaluated;
}

} // namespace RS
