#pragma once
#include "core/Error.hpp"
#include "core/Node.hpp"
#include "path/PathQuery.hpp"
#include "resolve/DocMetadata.hpp"
#include "resolve/Reference.hpp"
#include "resolve/ResourceResolver.hpp"

#include <memory>
#include <optional>
#include <string_view>

namespace RS {

/**
 * Maps references to sub-values of the configured scope roots.
 *
 * local and global query their caller-supplied roots. resource fetches the
 * document through the ResourceResolver, at most once per DocMetadata, and
 * queries the optional path inside it. Returned values are raw: directives
 * inside them are left for the evaluator.
 */
class ScopeResolver {
public:
    ScopeResolver(std::optional<Node>               local,
                  std::optional<Node>               global,
                  std::shared_ptr<ResourceResolver> resources,
                  std::shared_ptr<PathQuery const>  query);

    [[nodiscard]] auto resolve(Reference const& reference, DocMetadata& metadata) const -> Expected<Node>;

    [[nodiscard]] auto hasLocal() const noexcept -> bool { return this->local.has_value(); }
    [[nodiscard]] auto hasGlobal() const noexcept -> bool { return this->global.has_value(); }
    [[nodiscard]] auto hasResources() const noexcept -> bool { return this->resources != nullptr; }

private:
    [[nodiscard]] auto lookup(Node const& root, std::string_view scope, std::string const& path) const -> Expected<Node>;
    [[nodiscard]] auto fetchResource(std::string const& id, DocMetadata& metadata) const -> Expected<Node const*>;

    std::optional<Node>               local;
    std::optional<Node>               global;
    std::shared_ptr<ResourceResolver> resources;
    std::shared_ptr<PathQuery const>  query;
};

} // namespace RS
