#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace RS {

/**
 * Generic value tree that directives are evaluated over.
 *
 * A Node is one of six kinds: Null, Bool, Number, String, Sequence or Mapping.
 * Numbers keep the representation they were created with (int64 or double);
 * `normalized()` produces a copy where every integer has become a double, for
 * callers comparing values that came from different decoders.
 *
 * Mappings are ordered by key so that traversal order is deterministic.
 * Nodes have value semantics: copying a Node deep-copies the subtree.
 */
class Node {
public:
    enum class Kind {
        Null,
        Bool,
        Number,
        String,
        Sequence,
        Mapping
    };

    using Sequence = std::vector<Node>;
    using Mapping  = std::map<std::string, Node, std::less<>>;

    Node() = default;
    Node(std::nullptr_t) {}
    Node(bool value)
        : value_(value) {}
    Node(int value)
        : value_(static_cast<std::int64_t>(value)) {}
    Node(long value)
        : value_(static_cast<std::int64_t>(value)) {}
    Node(long long value)
        : value_(static_cast<std::int64_t>(value)) {}
    Node(double value)
        : value_(value) {}
    Node(char const* value)
        : value_(std::string{value}) {}
    Node(std::string value)
        : value_(std::move(value)) {}
    Node(std::string_view value)
        : value_(std::string{value}) {}
    Node(Sequence value)
        : value_(std::move(value)) {}
    Node(Mapping value)
        : value_(std::move(value)) {}

    [[nodiscard]] auto kind() const noexcept -> Kind;

    [[nodiscard]] auto isNull() const noexcept -> bool { return std::holds_alternative<std::monostate>(value_); }
    [[nodiscard]] auto isBool() const noexcept -> bool { return std::holds_alternative<bool>(value_); }
    [[nodiscard]] auto isInteger() const noexcept -> bool { return std::holds_alternative<std::int64_t>(value_); }
    [[nodiscard]] auto isFloat() const noexcept -> bool { return std::holds_alternative<double>(value_); }
    [[nodiscard]] auto isNumber() const noexcept -> bool { return isInteger() || isFloat(); }
    [[nodiscard]] auto isString() const noexcept -> bool { return std::holds_alternative<std::string>(value_); }
    [[nodiscard]] auto isSequence() const noexcept -> bool { return std::holds_alternative<Sequence>(value_); }
    [[nodiscard]] auto isMapping() const noexcept -> bool { return std::holds_alternative<Mapping>(value_); }
    [[nodiscard]] auto isScalar() const noexcept -> bool { return !isSequence() && !isMapping(); }

    // Pointer accessors return nullptr when the node holds another kind.
    [[nodiscard]] auto tryBool() const noexcept -> bool const* { return std::get_if<bool>(&value_); }
    [[nodiscard]] auto tryInteger() const noexcept -> std::int64_t const* { return std::get_if<std::int64_t>(&value_); }
    [[nodiscard]] auto tryFloat() const noexcept -> double const* { return std::get_if<double>(&value_); }
    [[nodiscard]] auto tryString() const noexcept -> std::string const* { return std::get_if<std::string>(&value_); }
    [[nodiscard]] auto trySequence() const noexcept -> Sequence const* { return std::get_if<Sequence>(&value_); }
    [[nodiscard]] auto trySequence() noexcept -> Sequence* { return std::get_if<Sequence>(&value_); }
    [[nodiscard]] auto tryMapping() const noexcept -> Mapping const* { return std::get_if<Mapping>(&value_); }
    [[nodiscard]] auto tryMapping() noexcept -> Mapping* { return std::get_if<Mapping>(&value_); }

    // Checked accessors, throw std::bad_variant_access on a kind mismatch.
    [[nodiscard]] auto asBool() const -> bool { return std::get<bool>(value_); }
    [[nodiscard]] auto asInteger() const -> std::int64_t { return std::get<std::int64_t>(value_); }
    [[nodiscard]] auto asDouble() const -> double;
    [[nodiscard]] auto asString() const -> std::string const& { return std::get<std::string>(value_); }
    [[nodiscard]] auto asSequence() const -> Sequence const& { return std::get<Sequence>(value_); }
    [[nodiscard]] auto asSequence() -> Sequence& { return std::get<Sequence>(value_); }
    [[nodiscard]] auto asMapping() const -> Mapping const& { return std::get<Mapping>(value_); }
    [[nodiscard]] auto asMapping() -> Mapping& { return std::get<Mapping>(value_); }

    // Mapping lookup; nullptr for missing keys or non-mapping nodes.
    [[nodiscard]] auto find(std::string_view key) const -> Node const*;

    // Element count for sequences and mappings, 0 for scalars.
    [[nodiscard]] auto size() const noexcept -> std::size_t;

    [[nodiscard]] auto normalized() const -> Node;
    [[nodiscard]] auto costEstimate() const noexcept -> std::int64_t;

    auto operator==(Node const& other) const -> bool = default;

private:
    std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Mapping> value_;
};

// Value equality where integer and floating numbers compare by numeric value.
[[nodiscard]] auto sameValue(Node const& lhs, Node const& rhs) -> bool;

[[nodiscard]] auto kindToString(Node::Kind kind) -> std::string_view;

} // namespace RS
