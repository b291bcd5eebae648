#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"

#include <functional>
#include <string_view>

namespace RS {

/**
 * Fetches the root document of a resource-scope reference. May block; the
 * evaluator applies no timeout. Called concurrently when several eval() calls
 * run on the same evaluator.
 */
class ResourceResolver {
public:
    virtual ~ResourceResolver() = default;

    [[nodiscard]] virtual auto resolveResource(std::string_view id) -> Expected<Node> = 0;
};

// Adapts a callable to the ResourceResolver interface.
class FunctionResourceResolver final : public ResourceResolver {
public:
    using Fn = std::function<Expected<Node>(std::string_view id)>;

    explicit FunctionResourceResolver(Fn fn)
        : fn(std::move(fn)) {}

    [[nodiscard]] auto resolveResource(std::string_view id) -> Expected<Node> override { return this->fn(id); }

private:
    Fn fn;
};

} // namespace RS
