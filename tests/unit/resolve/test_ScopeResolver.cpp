#include "resolve/ScopeResolver.hpp"

#include <doctest/doctest.h>

#include <atomic>
#include <memory>

using namespace RS;

namespace {

auto mustParse(std::string_view token) -> Reference {
    auto ref = parseReference(token);
    REQUIRE(ref.has_value());
    return *ref;
}

class CountingResolver final : public ResourceResolver {
public:
    auto resolveResource(std::string_view id) -> Expected<Node> override {
        ++this->calls;
        if (id == "broken")
            return std::unexpected(Error{Error::Code::UnknownError, "backend offline"});
        return Node{Node::Mapping{{"id", std::string{id}}, {"settings", Node::Mapping{{"level", 3}}}}};
    }

    std::atomic<int> calls{0};
};

} // namespace

TEST_SUITE("resolve.scope_resolver") {
    TEST_CASE("local and global lookups") {
        ScopeResolver resolver{Node{Node::Mapping{{"a", Node::Mapping{{"b", 1}}}}}, Node{Node::Mapping{{"g", "x"}}}, nullptr, nullptr};
        DocMetadata   metadata;

        auto local = resolver.resolve(mustParse("local::a.b"), metadata);
        REQUIRE(local.has_value());
        CHECK(*local == Node{1});

        auto global = resolver.resolve(mustParse("global::g"), metadata);
        REQUIRE(global.has_value());
        CHECK(*global == Node{"x"});

        auto missing = resolver.resolve(mustParse("local::a.c"), metadata);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::PathNotFound);
        CHECK(missing.error().subjects == std::vector<std::string>{"local", "a.c"});
        CHECK(*missing.error().message == "path 'a.c' not found in local scope");
    }

    TEST_CASE("unconfigured and unknown scopes") {
        ScopeResolver resolver{std::nullopt, std::nullopt, nullptr, nullptr};
        DocMetadata   metadata;
        CHECK_FALSE(resolver.hasLocal());
        CHECK_FALSE(resolver.hasGlobal());
        CHECK_FALSE(resolver.hasResources());

        auto local = resolver.resolve(mustParse("local::a"), metadata);
        REQUIRE_FALSE(local.has_value());
        CHECK(local.error().code == Error::Code::UnknownScope);
        CHECK(local.error().subjects == std::vector<std::string>{"local"});

        auto resource = resolver.resolve(mustParse("resource::x"), metadata);
        REQUIRE_FALSE(resource.has_value());
        CHECK(resource.error().code == Error::Code::UnknownScope);

        auto other = resolver.resolve(mustParse("remote::a"), metadata);
        REQUIRE_FALSE(other.has_value());
        CHECK(other.error().code == Error::Code::UnknownScope);
        CHECK(*other.error().message == "unknown scope 'remote'");
    }

    TEST_CASE("resources are fetched once per metadata") {
        auto          backend = std::make_shared<CountingResolver>();
        ScopeResolver resolver{std::nullopt, std::nullopt, backend, nullptr};
        DocMetadata   metadata;

        auto whole = resolver.resolve(mustParse("resource::alpha"), metadata);
        REQUIRE(whole.has_value());
        CHECK(*whole->find("id") == Node{"alpha"});

        auto nested = resolver.resolve(mustParse("resource::alpha::settings.level"), metadata);
        REQUIRE(nested.has_value());
        CHECK(*nested == Node{3});

        CHECK(backend->calls.load() == 1);
        CHECK(metadata.fetchCount == 1);

        DocMetadata fresh;
        CHECK(resolver.resolve(mustParse("resource::alpha"), fresh).has_value());
        CHECK(backend->calls.load() == 2);

        auto missing = resolver.resolve(mustParse("resource::alpha::nope"), metadata);
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code == Error::Code::PathNotFound);
        CHECK(missing.error().subjects == std::vector<std::string>{"resource", "nope"});
    }

    TEST_CASE("resolver failures are wrapped") {
        ScopeResolver resolver{std::nullopt, std::nullopt, std::make_shared<CountingResolver>(), nullptr};
        DocMetadata   metadata;
        auto          failed = resolver.resolve(mustParse("resource::broken"), metadata);
        REQUIRE_FALSE(failed.has_value());
        CHECK(failed.error().code == Error::Code::ResourceResolutionError);
        CHECK(*failed.error().message == "failed to resolve resource 'broken': backend offline");
        CHECK(failed.error().subjects == std::vector<std::string>{"broken"});
        CHECK(metadata.fetchCount == 0);
    }

    TEST_CASE("function resolver and custom path query") {
        struct UpperQuery final : PathQuery {
            auto query(Node const&, std::string_view path) const -> std::optional<Node> override {
                return Node{std::string{"queried:"} + std::string{path}};
            }
        };
        auto fn = std::make_shared<FunctionResourceResolver>([](std::string_view id) -> Expected<Node> { return Node{std::string{id}}; });
        ScopeResolver resolver{Node{Node::Mapping{}}, std::nullopt, fn, std::make_shared<UpperQuery>()};
        DocMetadata   metadata;

        auto local = resolver.resolve(mustParse("local::anything"), metadata);
        REQUIRE(local.has_value());
        CHECK(*local == Node{"queried:anything"});

        auto whole = resolver.resolve(mustParse("resource::doc"), metadata);
        REQUIRE(whole.has_value());
        CHECK(*whole == Node{"doc"});
    }
}
