#include "Node.hpp"

#include <limits>

namespace RS {

namespace {

constexpr std::int64_t kCostCap = std::numeric_limits<std::int64_t>::max() / 2;

auto saturatingAdd(std::int64_t lhs, std::int64_t rhs) noexcept -> std::int64_t {
    if (lhs >= kCostCap - rhs) {
        return kCostCap;
    }
    return lhs + rhs;
}

auto containerCost(std::int64_t base, std::int64_t perEntry, std::size_t count) noexcept -> std::int64_t {
    if (count > static_cast<std::size_t>(kCostCap / perEntry)) {
        return kCostCap;
    }
    return saturatingAdd(base, perEntry * static_cast<std::int64_t>(count));
}

} // namespace

auto Node::kind() const noexcept -> Kind {
    switch (value_.index()) {
    case 0:
        return Kind::Null;
    case 1:
        return Kind::Bool;
    case 2:
    case 3:
        return Kind::Number;
    case 4:
        return Kind::String;
    case 5:
        return Kind::Sequence;
    default:
        return Kind::Mapping;
    }
}

auto Node::asDouble() const -> double {
    if (auto const* integer = tryInteger()) {
        return static_cast<double>(*integer);
    }
    return std::get<double>(value_);
}

auto Node::find(std::string_view key) const -> Node const* {
    auto const* mapping = tryMapping();
    if (!mapping) {
        return nullptr;
    }
    auto it = mapping->find(key);
    if (it == mapping->end()) {
        return nullptr;
    }
    return &it->second;
}

auto Node::size() const noexcept -> std::size_t {
    if (auto const* sequence = trySequence()) {
        return sequence->size();
    }
    if (auto const* mapping = tryMapping()) {
        return mapping->size();
    }
    return 0;
}

auto Node::normalized() const -> Node {
    return std::visit(
        [](auto const& value) -> Node {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return Node{};
            } else if constexpr (std::is_same_v<T, std::int64_t>) {
                return Node{static_cast<double>(value)};
            } else if constexpr (std::is_same_v<T, Sequence>) {
                Sequence out;
                out.reserve(value.size());
                for (auto const& element : value) {
                    out.push_back(element.normalized());
                }
                return Node{std::move(out)};
            } else if constexpr (std::is_same_v<T, Mapping>) {
                Mapping out;
                for (auto const& [key, element] : value) {
                    out.emplace(key, element.normalized());
                }
                return Node{std::move(out)};
            } else {
                return Node{value};
            }
        },
        value_);
}

auto Node::costEstimate() const noexcept -> std::int64_t {
    switch (kind()) {
    case Kind::Null:
    case Kind::Bool:
        return 1;
    case Kind::Number:
        return 8;
    case Kind::String:
        return containerCost(10, 1, asString().size());
    case Kind::Sequence:
        return containerCost(30, 15, asSequence().size());
    case Kind::Mapping:
        return containerCost(50, 20, asMapping().size());
    }
    return 100;
}

auto sameValue(Node const& lhs, Node const& rhs) -> bool {
    if (lhs.isNumber() && rhs.isNumber()) {
        if (lhs.isInteger() && rhs.isInteger()) {
            return lhs.asInteger() == rhs.asInteger();
        }
        return lhs.asDouble() == rhs.asDouble();
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    if (auto const* left = lhs.trySequence()) {
        auto const& right = rhs.asSequence();
        if (left->size() != right.size()) {
            return false;
        }
        for (std::size_t i = 0; i < left->size(); ++i) {
            if (!sameValue((*left)[i], right[i])) {
                return false;
            }
        }
        return true;
    }
    if (auto const* left = lhs.tryMapping()) {
        auto const& right = rhs.asMapping();
        if (left->size() != right.size()) {
            return false;
        }
        for (auto const& [key, value] : *left) {
            auto it = right.find(key);
            if (it == right.end() || !sameValue(value, it->second)) {
                return false;
            }
        }
        return true;
    }
    return lhs == rhs;
}

auto kindToString(Node::Kind kind) -> std::string_view {
    switch (kind) {
    case Node::Kind::Null:
        return "null";
    case Node::Kind::Bool:
        return "bool";
    case Node::Kind::Number:
        return "number";
    case Node::Kind::String:
        return "string";
    case Node::Kind::Sequence:
        return "sequence";
    case Node::Kind::Mapping:
        return "mapping";
    }
    return "unknown";
}

} // namespace RS
