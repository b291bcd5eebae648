#include "Reference.hpp"

#include <algorithm>
#include <cctype>

namespace RS {

namespace {

constexpr std::string_view kMergeMarker = "!merge:";
constexpr std::string_view kSeparator   = "::";

auto isScopeName(std::string_view name) -> bool {
    if (name.empty() || !(std::isalpha(static_cast<unsigned char>(name.front())) || name.front() == '_'))
        return false;
    return std::all_of(name.begin(), name.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
    });
}

auto syntaxError(std::string_view directive, std::string_view token, std::string_view detail) -> Error {
    std::string message{"invalid "};
    message.append(directive);
    message.append(" syntax: '");
    message.append(token);
    message.append("'");
    if (!detail.empty()) {
        message.append(" (");
        message.append(detail);
        message.append(")");
    }
    return validationError(std::move(message));
}

auto parseReferenceBody(std::string_view token, std::string_view directive) -> Expected<Reference> {
    Reference       reference;
    std::string_view body = token;

    if (auto marker = body.rfind(kMergeMarker); marker != std::string_view::npos) {
        auto spec = body.substr(marker + kMergeMarker.size());
        if (spec.empty())
            return std::unexpected(syntaxError(directive, token, "empty merge options"));
        reference.mergeSpec = std::string{spec};
        body                = body.substr(0, marker);
    }

    auto const separator = body.find(kSeparator);
    if (separator == std::string_view::npos)
        return std::unexpected(syntaxError(directive, token, "expected scope::path"));

    auto const scope = body.substr(0, separator);
    auto const rest  = body.substr(separator + kSeparator.size());
    if (!isScopeName(scope))
        return std::unexpected(syntaxError(directive, token, "bad scope name"));
    reference.scope = std::string{scope};

    if (scope == ResourceScope) {
        auto const inner = rest.find(kSeparator);
        auto const id    = rest.substr(0, inner);
        if (id.empty())
            return std::unexpected(syntaxError(directive, token, "empty resource id"));
        reference.resourceId = std::string{id};
        if (inner != std::string_view::npos) {
            auto const path = rest.substr(inner + kSeparator.size());
            if (path.find(kSeparator) != std::string_view::npos)
                return std::unexpected(validationError("resource path cannot contain '::': '" + std::string{path} + "'"));
            reference.path = std::string{path};
        }
        return reference;
    }

    if (rest.empty())
        return std::unexpected(syntaxError(directive, token, "empty path"));
    reference.path = std::string{rest};
    return reference;
}

} // namespace

auto Reference::identity() const -> std::string {
    return this->scope + std::string{kSeparator} + this->canonicalPath();
}

auto Reference::canonicalPath() const -> std::string {
    if (this->scope == ResourceScope) {
        if (this->path.empty())
            return this->resourceId;
        return this->resourceId + std::string{kSeparator} + this->path;
    }
    return this->path;
}

auto isUseComponent(std::string_view name) -> bool {
    return std::find(UseComponents.begin(), UseComponents.end(), name) != UseComponents.end();
}

auto parseReference(std::string_view token) -> Expected<Reference> {
    return parseReferenceBody(token, "$ref");
}

auto parseUseReference(std::string_view token) -> Expected<UseReference> {
    std::string_view body = token;
    std::string_view suffix;
    if (auto marker = body.rfind(kMergeMarker); marker != std::string_view::npos) {
        suffix = body.substr(marker);
        body   = body.substr(0, marker);
    }

    auto const open = body.find('(');
    if (open == std::string_view::npos || !body.ends_with(')'))
        return std::unexpected(syntaxError("$use", token, "expected component(scope::path)"));

    auto const component = body.substr(0, open);
    if (!isUseComponent(component))
        return std::unexpected(syntaxError("$use", token, "unknown component"));

    std::string inner{body.substr(open + 1, body.size() - open - 2)};
    inner.append(suffix);
    auto target = parseReferenceBody(inner, "$use");
    if (!target)
        return std::unexpected(target.error());
    return UseReference{std::string{component}, std::move(*target)};
}

} // namespace RS
