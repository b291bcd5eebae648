#include "DirectiveRegistry.hpp"

#include "directive/BuiltinDirectives.hpp"
#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <mutex>

namespace RS {

namespace {

std::shared_ptr<DirectiveRegistry> gDefaultRegistry;
std::once_flag                     gDefaultRegistryFlag;

} // namespace

DirectiveRegistry::DirectiveRegistry(DirectiveRegistry const& other) {
    std::shared_lock lock(other.mutex);
    this->directives = other.directives;
}

auto DirectiveRegistry::WithBuiltins() -> std::shared_ptr<DirectiveRegistry> {
    auto registry = std::make_shared<DirectiveRegistry>();
    for (auto& directive : BuiltinDirectives()) {
        // Names are fixed and distinct, registration into an empty table cannot fail.
        [[maybe_unused]] auto error = registry->registerDirective(std::move(directive));
    }
    return registry;
}

auto DirectiveRegistry::registerDirective(Directive directive) -> std::optional<Error> {
    if (directive.name.empty())
        return validationError("directive name cannot be empty");
    if (directive.name.front() != Sigil)
        return validationError(std::string{"directive name must start with '"} + Sigil + "'");
    if (!directive.handler)
        return validationError("directive handler must be set");

    std::unique_lock lock(this->mutex);
    if (this->directives.find(directive.name) != this->directives.end())
        return Error{Error::Code::DuplicateDirective, "directive " + directive.name + " already registered", {directive.name}};

    rs_log("Registering directive " + directive.name, "Registry");
    auto name = directive.name;
    this->directives.emplace(std::move(name), std::make_shared<Directive const>(std::move(directive)));
    return std::nullopt;
}

auto DirectiveRegistry::find(std::string_view name) const -> std::shared_ptr<Directive const> {
    std::shared_lock lock(this->mutex);
    if (auto it = this->directives.find(name); it != this->directives.end())
        return it->second;
    return nullptr;
}

auto DirectiveRegistry::contains(std::string_view name) const -> bool {
    std::shared_lock lock(this->mutex);
    return this->directives.find(name) != this->directives.end();
}

auto DirectiveRegistry::names() const -> std::vector<std::string> {
    std::vector<std::string> out;
    {
        std::shared_lock lock(this->mutex);
        out.reserve(this->directives.size());
        for (auto const& [name, _] : this->directives)
            out.push_back(name);
    }
    std::sort(out.begin(), out.end());
    return out;
}

auto DirectiveRegistry::size() const -> std::size_t {
    std::shared_lock lock(this->mutex);
    return this->directives.size();
}

auto DefaultDirectiveRegistry() -> std::shared_ptr<DirectiveRegistry> {
    std::call_once(gDefaultRegistryFlag, [] { gDefaultRegistry = DirectiveRegistry::WithBuiltins(); });
    return gDefaultRegistry;
}

} // namespace RS
