#pragma once
#include "core/Error.hpp"

#include <string_view>

namespace RS {

enum class ObjectStrategy {
    Deep,
    Shallow,
    Replace
};

enum class ArrayStrategy {
    Concat,
    Prepend,
    Append,
    Unique,
    Union
};

enum class KeyConflict {
    Replace,
    First,
    Error
};

struct MergeOptions {
    ObjectStrategy object      = ObjectStrategy::Deep;
    ArrayStrategy  array       = ArrayStrategy::Concat;
    KeyConflict    keyConflict = KeyConflict::Replace;

    auto operator==(MergeOptions const&) const -> bool = default;
};

[[nodiscard]] auto parseObjectStrategy(std::string_view name) -> Expected<ObjectStrategy>;
[[nodiscard]] auto parseArrayStrategy(std::string_view name) -> Expected<ArrayStrategy>;
[[nodiscard]] auto parseKeyConflict(std::string_view name) -> Expected<KeyConflict>;

[[nodiscard]] auto toString(ObjectStrategy strategy) -> std::string_view;
[[nodiscard]] auto toString(ArrayStrategy strategy) -> std::string_view;
[[nodiscard]] auto toString(KeyConflict conflict) -> std::string_view;

/**
 * Parses the body of an inline merge suffix, "<strategy[,key_conflict]>".
 * The angle brackets are optional. The strategy token may name either an
 * object strategy or an array strategy; it overrides the matching field of
 * `base` and leaves the others alone.
 */
[[nodiscard]] auto parseInlineMergeSpec(std::string_view spec, MergeOptions base = {}) -> Expected<MergeOptions>;

// Canonical "object|array|conflict" rendering, used in cache fingerprints.
[[nodiscard]] auto canonicalString(MergeOptions const& options) -> std::string;

} // namespace RS
