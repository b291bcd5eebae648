#pragma once
#include "core/Error.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace RS {

inline constexpr std::string_view LocalScope    = "local";
inline constexpr std::string_view GlobalScope   = "global";
inline constexpr std::string_view ResourceScope = "resource";

inline constexpr std::array<std::string_view, 4> UseComponents{"agent", "tool", "task", "mcp"};

/**
 * Parsed form of a "scope::path[!merge:<opts>]" token.
 *
 * For the resource scope the token reads "resource::<id>[::<path>]"; `resourceId`
 * holds the id and `path` the optional selector inside the fetched document.
 */
struct Reference {
    std::string                scope;
    std::string                resourceId;
    std::string                path;
    std::optional<std::string> mergeSpec;

    // "local::a.b", "resource::id::a.b". Used by the cycle guard.
    [[nodiscard]] auto identity() const -> std::string;
    // Path part of the identity, i.e. everything after the scope.
    [[nodiscard]] auto canonicalPath() const -> std::string;
};

struct UseReference {
    std::string component;
    Reference   target;
};

// Fails with ValidationError "invalid $ref syntax: ..." on malformed tokens.
[[nodiscard]] auto parseReference(std::string_view token) -> Expected<Reference>;
// Fails with ValidationError "invalid $use syntax: ..." on malformed tokens.
[[nodiscard]] auto parseUseReference(std::string_view token) -> Expected<UseReference>;

[[nodiscard]] auto isUseComponent(std::string_view name) -> bool;

} // namespace RS
