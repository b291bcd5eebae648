#include "ScopeResolver.hpp"

#include "log/TaggedLogger.hpp"
#include "path/DottedPathQuery.hpp"

namespace RS {

ScopeResolver::ScopeResolver(std::optional<Node>               local,
                             std::optional<Node>               global,
                             std::shared_ptr<ResourceResolver> resources,
                             std::shared_ptr<PathQuery const>  query)
    : local(std::move(local)),
      global(std::move(global)),
      resources(std::move(resources)),
      query(query ? std::move(query) : std::make_shared<DottedPathQuery>()) {}

auto ScopeResolver::resolve(Reference const& reference, DocMetadata& metadata) const -> Expected<Node> {
    if (reference.scope == LocalScope) {
        if (!this->local)
            return std::unexpected(unknownScopeError(reference.scope, "local scope is not configured"));
        return this->lookup(*this->local, reference.scope, reference.path);
    }
    if (reference.scope == GlobalScope) {
        if (!this->global)
            return std::unexpected(unknownScopeError(reference.scope, "global scope is not configured"));
        return this->lookup(*this->global, reference.scope, reference.path);
    }
    if (reference.scope == ResourceScope) {
        auto document = this->fetchResource(reference.resourceId, metadata);
        if (!document)
            return std::unexpected(document.error());
        if (reference.path.empty())
            return **document;
        return this->lookup(**document, reference.scope, reference.path);
    }
    return std::unexpected(unknownScopeError(reference.scope, "unknown scope '" + reference.scope + "'"));
}

auto ScopeResolver::lookup(Node const& root, std::string_view scope, std::string const& path) const -> Expected<Node> {
    if (path.empty())
        return std::unexpected(validationError("invalid $ref syntax: empty path in " + std::string{scope} + " scope"));
    auto value = this->query->query(root, path);
    if (!value)
        return std::unexpected(pathNotFoundError(std::string{scope}, path));
    return std::move(*value);
}

auto ScopeResolver::fetchResource(std::string const& id, DocMetadata& metadata) const -> Expected<Node const*> {
    if (!this->resources)
        return std::unexpected(unknownScopeError(std::string{ResourceScope}, "resource scope is not configured"));

    if (auto it = metadata.resources.find(id); it != metadata.resources.end())
        return &it->second;

    rs_log("Fetching resource " + id, "Resolve");
    auto fetched = this->resources->resolveResource(id);
    if (!fetched) {
        auto const& cause   = fetched.error();
        auto        message = "failed to resolve resource '" + id + "'";
        if (cause.message && !cause.message->empty())
            message += ": " + *cause.message;
        return std::unexpected(Error{Error::Code::ResourceResolutionError, std::move(message), {id}});
    }
    ++metadata.fetchCount;
    auto it = metadata.resources.emplace(id, std::move(*fetched)).first;
    return &it->second;
}

} // namespace RS
