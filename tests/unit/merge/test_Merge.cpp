#include "merge/Merge.hpp"

#include <doctest/doctest.h>

using namespace RS;

namespace {

auto map(Node::Mapping m) -> Node {
    return Node{std::move(m)};
}

auto seq(Node::Sequence s) -> Node {
    return Node{std::move(s)};
}

auto options(ObjectStrategy object, ArrayStrategy array = ArrayStrategy::Concat, KeyConflict conflict = KeyConflict::Replace) -> MergeOptions {
    return MergeOptions{object, array, conflict};
}

} // namespace

TEST_SUITE("merge.values") {
    TEST_CASE("deep merge recurses into nested mappings") {
        auto left  = map({{"server", map({{"host", "localhost"}, {"port", 80}})}, {"name", "a"}});
        auto right = map({{"server", map({{"port", 8080}, {"tls", true}})}});

        auto merged = mergeValues(left, right, MergeOptions{});
        REQUIRE(merged.has_value());
        auto expected = map({{"server", map({{"host", "localhost"}, {"port", 8080}, {"tls", true}})}, {"name", "a"}});
        CHECK(*merged == expected);
    }

    TEST_CASE("deep merge combines nested arrays with the array strategy") {
        auto left  = map({{"tags", seq({"a", "b"})}});
        auto right = map({{"tags", seq({"b", "c"})}});

        auto concat = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Concat));
        REQUIRE(concat.has_value());
        CHECK(*concat->find("tags") == seq({"a", "b", "b", "c"}));

        auto unique = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Unique));
        REQUIRE(unique.has_value());
        CHECK(*unique->find("tags") == seq({"a", "b", "c"}));
    }

    TEST_CASE("shallow merge replaces shared keys wholesale") {
        auto left  = map({{"server", map({{"host", "localhost"}, {"port", 80}})}, {"keep", 1}});
        auto right = map({{"server", map({{"port", 8080}})}});

        auto merged = mergeValues(left, right, options(ObjectStrategy::Shallow));
        REQUIRE(merged.has_value());
        CHECK(*merged == map({{"server", map({{"port", 8080}})}, {"keep", 1}}));
    }

    TEST_CASE("replace returns the right side") {
        auto merged = mergeValues(map({{"a", 1}}), seq({1}), options(ObjectStrategy::Replace));
        REQUIRE(merged.has_value());
        CHECK(*merged == seq({1}));
    }

    TEST_CASE("key conflict policies") {
        auto left  = map({{"port", 8080}, {"host", "a"}});
        auto right = map({{"port", 9090}});

        auto replaced = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Concat, KeyConflict::Replace));
        REQUIRE(replaced.has_value());
        CHECK(*replaced->find("port") == Node{9090});

        auto first = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Concat, KeyConflict::First));
        REQUIRE(first.has_value());
        CHECK(*first->find("port") == Node{8080});

        auto error = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Concat, KeyConflict::Error));
        REQUIRE_FALSE(error.has_value());
        CHECK(error.error().code == Error::Code::KeyConflict);
        CHECK(*error.error().message == "key conflict: 'port' already exists");
        CHECK(error.error().subjects == std::vector<std::string>{"port"});
    }

    TEST_CASE("key conflict applies only to top level keys") {
        auto left  = map({{"server", map({{"port", 1}})}});
        auto right = map({{"other", map({{"port", 2}})}});
        auto merged = mergeValues(left, right, options(ObjectStrategy::Deep, ArrayStrategy::Concat, KeyConflict::Error));
        CHECK(merged.has_value());
    }

    TEST_CASE("mismatched kinds and null left fall back to the right side") {
        auto scalar = mergeValues(map({{"a", 1}}), Node{"text"}, MergeOptions{});
        REQUIRE(scalar.has_value());
        CHECK(*scalar == Node{"text"});

        auto fromNull = mergeValues(Node{}, seq({1}), MergeOptions{});
        REQUIRE(fromNull.has_value());
        CHECK(*fromNull == seq({1}));
    }

    TEST_CASE("top level arrays") {
        auto deep = mergeValues(seq({1, 2}), seq({3}), options(ObjectStrategy::Deep, ArrayStrategy::Prepend));
        REQUIRE(deep.has_value());
        CHECK(*deep == seq({3, 1, 2}));

        auto shallow = mergeValues(seq({1, 2}), seq({3}), options(ObjectStrategy::Shallow));
        REQUIRE(shallow.has_value());
        CHECK(*shallow == seq({3}));
    }

    TEST_CASE("array strategies") {
        Node::Sequence left{"base", "common"};
        Node::Sequence right{"build", "common", "build"};

        CHECK(mergeArrays(left, right, ArrayStrategy::Concat) == Node::Sequence{"base", "common", "build", "common", "build"});
        CHECK(mergeArrays(left, right, ArrayStrategy::Append) == Node::Sequence{"base", "common", "build", "common", "build"});
        CHECK(mergeArrays(left, right, ArrayStrategy::Prepend) == Node::Sequence{"build", "common", "build", "base", "common"});
        CHECK(mergeArrays(left, right, ArrayStrategy::Unique) == Node::Sequence{"base", "common", "build"});
        CHECK(mergeArrays(left, right, ArrayStrategy::Union) == Node::Sequence{"base", "common", "build"});
    }

    TEST_CASE("unique compares numbers by value and keeps first occurrence") {
        Node::Sequence left{1, map({{"a", 1}})};
        Node::Sequence right{1.0, map({{"a", 1.0}}), 2};
        auto           merged = mergeArrays(left, right, ArrayStrategy::Unique);
        REQUIRE(merged.size() == 3);
        CHECK(merged[0].isInteger());
        CHECK(merged[2] == Node{2});
    }
}

TEST_SUITE("merge.inline") {
    TEST_CASE("mapping result absorbs siblings") {
        auto merged = mergeInline(map({{"host", "localhost"}, {"port", 8080}}), {{"port", 9090}, {"extra", true}}, MergeOptions{});
        REQUIRE(merged.has_value());
        CHECK(*merged == map({{"host", "localhost"}, {"port", 9090}, {"extra", true}}));
    }

    TEST_CASE("null result yields the siblings") {
        auto merged = mergeInline(Node{}, {{"a", 1}}, MergeOptions{});
        REQUIRE(merged.has_value());
        CHECK(*merged == map({{"a", 1}}));
    }

    TEST_CASE("replace keeps the result untouched") {
        auto merged = mergeInline(map({{"host", "localhost"}}), {{"extra", "ignored"}}, options(ObjectStrategy::Replace));
        REQUIRE(merged.has_value());
        CHECK(*merged == map({{"host", "localhost"}}));
    }

    TEST_CASE("sequence and scalar results cannot take siblings") {
        auto fromSequence = mergeInline(seq({1}), {{"a", 1}}, MergeOptions{});
        REQUIRE_FALSE(fromSequence.has_value());
        CHECK(*fromSequence.error().message == "cannot merge array result with object siblings");

        auto fromScalar = mergeInline(Node{"x"}, {{"a", 1}}, MergeOptions{});
        REQUIRE_FALSE(fromScalar.has_value());
        CHECK(*fromScalar.error().message == "cannot merge scalar result with siblings");
    }

    TEST_CASE("key conflict error applies to siblings") {
        auto merged = mergeInline(map({{"host", "a"}}), {{"host", "b"}}, options(ObjectStrategy::Deep, ArrayStrategy::Concat, KeyConflict::Error));
        REQUIRE_FALSE(merged.has_value());
        CHECK(*merged.error().message == "key conflict: 'host' already exists");
    }
}
