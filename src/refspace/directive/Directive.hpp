#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <functional>
#include <optional>
#include <string>

namespace RS {

class EvaluationContext;

enum class DirectiveKind {
    Ref,
    Use,
    Merge,
    Custom
};

/**
 * A reserved mapping key and the code that replaces the mapping holding it.
 *
 * The validator sees the raw payload and runs before the handler. The handler
 * receives the payload and the per-call context, through which it can evaluate
 * nodes, resolve references and request an inline merge of sibling keys.
 *
 * allowsSiblings  when false, a mapping holding the directive next to other keys is rejected.
 * resolvesResult  when true, the handler returns a fully evaluated value and the
 *                 evaluator does not walk it again.
 */
struct Directive {
    using Validator = std::function<std::optional<Error>(Node const& payload)>;
    using Handler   = std::function<Expected<Node>(EvaluationContext& context, Node const& payload)>;

    std::string   name;
    DirectiveKind kind = DirectiveKind::Custom;
    Validator     validator;
    Handler       handler;
    bool          allowsSiblings = true;
    bool          resolvesResult = false;
};

} // namespace RS
