#include "core/Node.hpp"

#include <doctest/doctest.h>

#include <limits>

using namespace RS;

TEST_SUITE("core.node") {
    TEST_CASE("kinds and accessors") {
        CHECK(Node{}.kind() == Node::Kind::Null);
        CHECK(Node{nullptr}.isNull());
        CHECK(Node{true}.kind() == Node::Kind::Bool);
        CHECK(Node{3}.kind() == Node::Kind::Number);
        CHECK(Node{3}.isInteger());
        CHECK(Node{3.5}.isFloat());
        CHECK(Node{"text"}.kind() == Node::Kind::String);
        CHECK(Node{Node::Sequence{1, 2}}.kind() == Node::Kind::Sequence);
        CHECK(Node{Node::Mapping{{"a", 1}}}.kind() == Node::Kind::Mapping);

        Node n{7};
        REQUIRE(n.tryInteger() != nullptr);
        CHECK(*n.tryInteger() == 7);
        CHECK(n.tryString() == nullptr);
        CHECK(n.asDouble() == doctest::Approx(7.0));
        CHECK_THROWS_AS((void)n.asString(), std::bad_variant_access);

        CHECK(kindToString(Node::Kind::Mapping) == "mapping");
        CHECK(kindToString(Node::Kind::Sequence) == "sequence");
    }

    TEST_CASE("find and size") {
        Node m{Node::Mapping{{"a", 1}, {"b", Node::Sequence{1, 2, 3}}}};
        REQUIRE(m.find("b") != nullptr);
        CHECK(m.find("b")->size() == 3);
        CHECK(m.find("missing") == nullptr);
        CHECK(m.size() == 2);
        CHECK(Node{"abc"}.size() == 0);
        CHECK(Node{"abc"}.find("a") == nullptr);
    }

    TEST_CASE("mapping iteration is ordered by key") {
        Node::Mapping m{{"zeta", 1}, {"alpha", 2}, {"mid", 3}};
        std::vector<std::string> keys;
        for (auto const& [key, _] : m)
            keys.push_back(key);
        CHECK(keys == std::vector<std::string>{"alpha", "mid", "zeta"});
    }

    TEST_CASE("strict equality versus sameValue") {
        CHECK_FALSE(Node{1} == Node{1.0});
        CHECK(sameValue(Node{1}, Node{1.0}));
        CHECK(sameValue(Node{Node::Sequence{1, "x"}}, Node{Node::Sequence{1.0, "x"}}));
        CHECK(sameValue(Node{Node::Mapping{{"a", 2}}}, Node{Node::Mapping{{"a", 2.0}}}));
        CHECK_FALSE(sameValue(Node{Node::Mapping{{"a", 2}}}, Node{Node::Mapping{{"b", 2}}}));
        CHECK_FALSE(sameValue(Node{"1"}, Node{1}));
        CHECK_FALSE(sameValue(Node{Node::Sequence{1}}, Node{Node::Sequence{1, 2}}));
    }

    TEST_CASE("copies are deep") {
        Node original{Node::Mapping{{"list", Node::Sequence{1}}}};
        Node copy = original;
        copy.asMapping()["list"].asSequence().push_back(2);
        CHECK(original.find("list")->size() == 1);
        CHECK(copy.find("list")->size() == 2);
    }

    TEST_CASE("normalized converts every integer to double") {
        Node doc{Node::Mapping{{"n", 1}, {"nested", Node::Sequence{2, 2.5, "s"}}}};
        auto normal = doc.normalized();
        CHECK(normal.find("n")->isFloat());
        auto const& nested = normal.find("nested")->asSequence();
        CHECK(nested[0].isFloat());
        CHECK(nested[1].isFloat());
        CHECK(nested[2].isString());
        CHECK(doc.find("n")->isInteger());
    }

    TEST_CASE("cost estimate") {
        CHECK(Node{}.costEstimate() == 1);
        CHECK(Node{true}.costEstimate() == 1);
        CHECK(Node{42}.costEstimate() == 8);
        CHECK(Node{"abcd"}.costEstimate() == 14);
        CHECK(Node{Node::Sequence{1, 2}}.costEstimate() == 60);
        CHECK(Node{Node::Mapping{{"a", 1}}}.costEstimate() == 70);
        CHECK(Node{std::string(1000, 'x')}.costEstimate() == 1010);
        CHECK(Node{}.costEstimate() <= std::numeric_limits<std::int64_t>::max());
    }
}
