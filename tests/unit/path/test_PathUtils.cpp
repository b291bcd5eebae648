#include "path/path_utils.hpp"

#include <doctest/doctest.h>

using namespace RS;

TEST_SUITE("path.utils") {
    TEST_CASE("literal names") {
        CHECK(match_names("server", "server"));
        CHECK_FALSE(match_names("server", "servers"));
        CHECK_FALSE(match_names("", "a"));
        CHECK(match_names("", ""));
    }

    TEST_CASE("wildcards") {
        CHECK(match_names("ser*", "server"));
        CHECK(match_names("*", ""));
        CHECK(match_names("*er*", "server"));
        CHECK(match_names("s?rver", "server"));
        CHECK_FALSE(match_names("s?rver", "srver"));
        CHECK(match_names("a*b*c", "aXXbYYc"));
        CHECK_FALSE(match_names("a*b*c", "aXXbYY"));
    }

    TEST_CASE("character classes") {
        CHECK(match_names("item[0-9]", "item7"));
        CHECK_FALSE(match_names("item[0-9]", "itemx"));
        CHECK(match_names("item[!0-9]", "itemx"));
        CHECK(match_names("[abc]x", "bx"));
        CHECK_FALSE(match_names("[abc", "a"));
    }

    TEST_CASE("escapes") {
        CHECK(match_names("a\\*", "a*"));
        CHECK_FALSE(match_names("a\\*", "ab"));
    }

    TEST_CASE("is_glob") {
        CHECK(is_glob("a*"));
        CHECK(is_glob("a?"));
        CHECK(is_glob("[ab]"));
        CHECK_FALSE(is_glob("plain"));
        CHECK_FALSE(is_glob("a\\*"));
    }
}
