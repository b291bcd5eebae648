#include "EvaluationContext.hpp"

#include "eval/Evaluator.hpp"

namespace RS {

EvaluationContext::EvaluationContext(Evaluator const& evaluator)
    : owner(&evaluator) {}

auto EvaluationContext::evaluate(Node const& node) -> Expected<Node> {
    return this->owner->evaluateNode(*this, node);
}

auto EvaluationContext::resolve(Reference const& reference, MergeOptions const& inlineOptions) -> Expected<Node> {
    return this->owner->resolveReference(*this, reference, inlineOptions);
}

auto EvaluationContext::takeInlineMerge() -> std::optional<MergeOptions> {
    return std::exchange(this->pendingInlineMerge, std::nullopt);
}

auto EvaluationContext::isInProgress(std::string_view identity) const -> bool {
    return this->inProgress.find(identity) != this->inProgress.end();
}

auto EvaluationContext::enter(std::string identity) -> Expected<ReferenceGuard> {
    if (this->isInProgress(identity)) {
        auto cycle = this->chain;
        cycle.push_back(identity);
        std::string message{"cyclic reference detected: "};
        for (std::size_t i = 0; i < cycle.size(); ++i) {
            if (i > 0)
                message.append(" -> ");
            message.append(cycle[i]);
        }
        return std::unexpected(Error{Error::Code::CycleDetected, std::move(message), std::move(cycle)});
    }
    auto const limit = this->owner->options().maxReferenceDepth;
    if (this->chain.size() >= limit) {
        return std::unexpected(Error{Error::Code::DepthExceeded,
                                     "reference depth limit of " + std::to_string(limit) + " exceeded at " + identity,
                                     {identity}});
    }
    this->inProgress.insert(identity);
    this->chain.push_back(std::move(identity));
    this->notePeakDepth(this->chain.size());
    return ReferenceGuard{this};
}

auto EvaluationContext::leave() -> void {
    if (this->chain.empty())
        return;
    this->inProgress.erase(this->chain.back());
    this->chain.pop_back();
}

} // namespace RS
