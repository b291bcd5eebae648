#include "BuiltinDirectives.hpp"

#include "directive/DirectiveRegistry.hpp"
#include "eval/EvaluationContext.hpp"
#include "eval/Evaluator.hpp"
#include "merge/Merge.hpp"
#include "resolve/Reference.hpp"

#include <optional>
#include <string>

namespace RS {

namespace {

auto requireString(std::string_view directive) -> Directive::Validator {
    return [message = std::string{directive} + " must be a string"](Node const& payload) -> std::optional<Error> {
        if (!payload.isString())
            return validationError(message);
        return std::nullopt;
    };
}

auto inlineOptionsFor(EvaluationContext const& context, Reference const& reference) -> Expected<MergeOptions> {
    auto const& defaults = context.evaluator().options().inlineMergeDefaults;
    if (!reference.mergeSpec)
        return defaults;
    return parseInlineMergeSpec(*reference.mergeSpec, defaults);
}

auto handleRef(EvaluationContext& context, Node const& payload) -> Expected<Node> {
    auto reference = parseReference(payload.asString());
    if (!reference)
        return std::unexpected(reference.error());
    auto options = inlineOptionsFor(context, *reference);
    if (!options)
        return std::unexpected(options.error());

    auto value = context.resolve(*reference, *options);
    if (!value)
        return std::unexpected(value.error());
    context.requestInlineMerge(*options);
    return value;
}

auto handleUse(EvaluationContext& context, Node const& payload) -> Expected<Node> {
    auto use = parseUseReference(payload.asString());
    if (!use)
        return std::unexpected(use.error());
    auto options = inlineOptionsFor(context, use->target);
    if (!options)
        return std::unexpected(options.error());

    auto value = context.resolve(use->target, *options);
    if (!value)
        return std::unexpected(value.error());

    Node::Mapping wrapped;
    if (auto const& transform = context.evaluator().options().transformUse) {
        auto transformed = transform(use->component, *value);
        if (!transformed) {
            auto message = "transform of " + use->component + " failed";
            if (transformed.error().message && !transformed.error().message->empty())
                message += ": " + *transformed.error().message;
            return std::unexpected(Error{Error::Code::TransformError, std::move(message), {use->component}});
        }
        wrapped.emplace(std::move(transformed->first), std::move(transformed->second));
    } else {
        wrapped.emplace(use->component, std::move(*value));
    }
    context.requestInlineMerge(*options);
    return Node{std::move(wrapped)};
}

auto isDirectiveBearing(EvaluationContext const& context, Node::Mapping const& mapping) -> bool {
    auto const& registry = context.evaluator().directives();
    for (auto const& [key, _] : mapping) {
        if (!key.empty() && key.front() == DirectiveRegistry::Sigil && registry.contains(key))
            return true;
    }
    return false;
}

struct MergeRequest {
    Node::Sequence             sources;
    bool                       evaluated = false;
    std::optional<std::string> strategy;
    KeyConflict                keyConflict = KeyConflict::Replace;
};

auto parseMergePayload(EvaluationContext& context, Node const& payload) -> Expected<MergeRequest> {
    MergeRequest request;
    if (auto const* sequence = payload.trySequence()) {
        request.sources = *sequence;
        return request;
    }

    auto const& mapping = payload.asMapping();
    if (isDirectiveBearing(context, mapping)) {
        auto evaluated = context.evaluate(payload);
        if (!evaluated)
            return std::unexpected(evaluated.error());
        if (!evaluated->isSequence())
            return std::unexpected(validationError("$merge payload must evaluate to a sequence of sources"));
        request.sources   = std::move(evaluated->asSequence());
        request.evaluated = true;
        return request;
    }

    Node const* sources = nullptr;
    for (auto const& [key, value] : mapping) {
        if (key == "sources") {
            sources = &value;
        } else if (key == "strategy") {
            if (!value.isString())
                return std::unexpected(validationError("$merge strategy must be a string"));
            request.strategy = value.asString();
        } else if (key == "key_conflict") {
            if (!value.isString())
                return std::unexpected(validationError("invalid key_conflict: must be a string"));
            auto conflict = parseKeyConflict(value.asString());
            if (!conflict)
                return std::unexpected(conflict.error());
            request.keyConflict = *conflict;
        } else {
            return std::unexpected(validationError("unknown key in $merge: '" + key + "'"));
        }
    }
    if (!sources)
        return std::unexpected(validationError("$merge object must contain 'sources' key"));
    if (!sources->isSequence())
        return std::unexpected(validationError("$merge sources must be a sequence"));
    request.sources = sources->asSequence();
    return request;
}

auto handleMerge(EvaluationContext& context, Node const& payload) -> Expected<Node> {
    auto request = parseMergePayload(context, payload);
    if (!request)
        return std::unexpected(request.error());
    if (request->sources.empty())
        return std::unexpected(validationError("$merge sources cannot be empty"));

    Node::Sequence sources;
    sources.reserve(request->sources.size());
    for (std::size_t i = 0; i < request->sources.size(); ++i) {
        Node source;
        if (request->evaluated) {
            source = std::move(request->sources[i]);
        } else {
            auto evaluated = context.evaluate(request->sources[i]);
            if (!evaluated)
                return std::unexpected(withContext(std::move(evaluated.error()), "failed to evaluate $merge source " + std::to_string(i)));
            source = std::move(*evaluated);
        }
        if (source.isNull())
            continue;
        if (source.isScalar())
            return std::unexpected(validationError("$merge source " + std::to_string(i) + " must be an object or array"));
        if (!sources.empty() && sources.front().isMapping() != source.isMapping())
            return std::unexpected(validationError("$merge sources must be all objects or all arrays"));
        sources.push_back(std::move(source));
    }
    if (sources.empty())
        return Node{};

    MergeOptions options;
    options.keyConflict = request->keyConflict;
    if (request->strategy) {
        if (sources.front().isMapping()) {
            auto object = parseObjectStrategy(*request->strategy);
            if (!object)
                return std::unexpected(object.error());
            options.object = *object;
        } else {
            auto array = parseArrayStrategy(*request->strategy);
            if (!array)
                return std::unexpected(array.error());
            options.array = *array;
        }
    }

    Node accumulator = std::move(sources.front());
    for (std::size_t i = 1; i < sources.size(); ++i) {
        auto merged = mergeValues(accumulator, sources[i], options);
        if (!merged)
            return std::unexpected(merged.error());
        accumulator = std::move(*merged);
    }
    return accumulator;
}

} // namespace

auto RefDirective() -> Directive {
    return Directive{.name           = "$ref",
                     .kind           = DirectiveKind::Ref,
                     .validator      = requireString("$ref"),
                     .handler        = handleRef,
                     .allowsSiblings = true,
                     .resolvesResult = true};
}

auto UseDirective() -> Directive {
    return Directive{.name           = "$use",
                     .kind           = DirectiveKind::Use,
                     .validator      = requireString("$use"),
                     .handler        = handleUse,
                     .allowsSiblings = true,
                     .resolvesResult = true};
}

auto MergeDirective() -> Directive {
    return Directive{.name      = "$merge",
                     .kind      = DirectiveKind::Merge,
                     .validator = [](Node const& payload) -> std::optional<Error> {
                         if (!payload.isSequence() && !payload.isMapping())
                             return validationError("$merge must be a sequence or an object");
                         return std::nullopt;
                     },
                     .handler        = handleMerge,
                     .allowsSiblings = false,
                     .resolvesResult = true};
}

auto BuiltinDirectives() -> std::vector<Directive> {
    std::vector<Directive> directives;
    directives.push_back(RefDirective());
    directives.push_back(UseDirective());
    directives.push_back(MergeDirective());
    return directives;
}

} // namespace RS
