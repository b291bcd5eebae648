#pragma once
#include "core/Error.hpp"
#include "directive/Directive.hpp"
#include "path/TransparentString.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace RS {

/**
 * Table of directives keyed by name.
 *
 * Lookups take a shared lock and hand out shared ownership of the entry, so a
 * handler stays valid for the duration of a call even if registration happens
 * concurrently. Registration is expected to be finished before evaluation
 * starts; it is still safe, only the visibility of the new name to evaluations
 * already running is unspecified.
 */
class DirectiveRegistry {
public:
    static constexpr char Sigil = '$';

    DirectiveRegistry() = default;
    DirectiveRegistry(DirectiveRegistry const& other);
    DirectiveRegistry& operator=(DirectiveRegistry const&) = delete;

    // A fresh registry holding $ref, $use and $merge.
    static auto WithBuiltins() -> std::shared_ptr<DirectiveRegistry>;

    auto registerDirective(Directive directive) -> std::optional<Error>;

    [[nodiscard]] auto find(std::string_view name) const -> std::shared_ptr<Directive const>;
    [[nodiscard]] auto contains(std::string_view name) const -> bool;
    [[nodiscard]] auto names() const -> std::vector<std::string>;
    [[nodiscard]] auto size() const -> std::size_t;

private:
    using Table = phmap::flat_hash_map<std::string, std::shared_ptr<Directive const>, TransparentStringHash, std::equal_to<>>;

    mutable std::shared_mutex mutex;
    Table                     directives;
};

// Process-wide registry, created with the built-ins on first use. Evaluators
// constructed without an explicit registry share it.
auto DefaultDirectiveRegistry() -> std::shared_ptr<DirectiveRegistry>;

} // namespace RS
