#include "Merge.hpp"

#include "log/TaggedLogger.hpp"

namespace RS {

namespace {

auto deepMergeValue(Node const& left, Node const& right, ArrayStrategy array) -> Node {
    if (left.isMapping() && right.isMapping()) {
        auto merged = left.asMapping();
        for (auto const& [key, value] : right.asMapping()) {
            auto it = merged.find(key);
            if (it == merged.end()) {
                merged.emplace(key, value);
            } else {
                it->second = deepMergeValue(it->second, value, array);
            }
        }
        return Node{std::move(merged)};
    }
    if (left.isSequence() && right.isSequence()) {
        return Node{mergeArrays(left.asSequence(), right.asSequence(), array)};
    }
    return right;
}

auto mergeMappings(Node::Mapping const& left, Node::Mapping const& right, MergeOptions const& options) -> Expected<Node> {
    auto merged = left;
    for (auto const& [key, value] : right) {
        auto it = merged.find(key);
        if (it == merged.end()) {
            merged.emplace(key, value);
            continue;
        }
        switch (options.keyConflict) {
        case KeyConflict::Error:
            return std::unexpected(keyConflictError(key));
        case KeyConflict::First:
            continue;
        case KeyConflict::Replace:
            break;
        }
        if (options.object == ObjectStrategy::Deep) {
            it->second = deepMergeValue(it->second, value, options.array);
        } else {
            it->second = value;
        }
    }
    return Node{std::move(merged)};
}

} // namespace

auto mergeArrays(Node::Sequence const& left, Node::Sequence const& right, ArrayStrategy strategy) -> Node::Sequence {
    Node::Sequence out;
    out.reserve(left.size() + right.size());
    switch (strategy) {
    case ArrayStrategy::Prepend:
        out.insert(out.end(), right.begin(), right.end());
        out.insert(out.end(), left.begin(), left.end());
        return out;
    case ArrayStrategy::Concat:
    case ArrayStrategy::Append:
        out.insert(out.end(), left.begin(), left.end());
        out.insert(out.end(), right.begin(), right.end());
        return out;
    case ArrayStrategy::Unique:
    case ArrayStrategy::Union:
        break;
    }

    auto const keep = [&out](Node const& candidate) {
        for (auto const& existing : out) {
            if (sameValue(existing, candidate))
                return;
        }
        out.push_back(candidate);
    };
    for (auto const& element : left)
        keep(element);
    for (auto const& element : right)
        keep(element);
    return out;
}

auto mergeValues(Node const& left, Node const& right, MergeOptions const& options) -> Expected<Node> {
    if (options.object == ObjectStrategy::Replace || left.isNull()) {
        return right;
    }
    if (left.isMapping() && right.isMapping()) {
        return mergeMappings(left.asMapping(), right.asMapping(), options);
    }
    if (left.isSequence() && right.isSequence()) {
        if (options.object == ObjectStrategy::Deep) {
            return Node{mergeArrays(left.asSequence(), right.asSequence(), options.array)};
        }
        return right;
    }
    rs_log("Merging " + std::string{kindToString(right.kind())} + " over " + std::string{kindToString(left.kind())} + " falls back to replace", "Merge", "Trace");
    return right;
}

auto mergeInline(Node const& result, Node::Mapping const& siblings, MergeOptions const& options) -> Expected<Node> {
    if (result.isNull()) {
        return Node{siblings};
    }
    if (result.isSequence()) {
        return std::unexpected(validationError("cannot merge array result with object siblings"));
    }
    if (!result.isMapping()) {
        return std::unexpected(validationError("cannot merge scalar result with siblings"));
    }
    if (options.object == ObjectStrategy::Replace) {
        return result;
    }
    return mergeMappings(result.asMapping(), siblings, options);
}

} // namespace RS
