#include "./dym.hpp"

#include <catch2/catch.hpp>

#include <vector>

TEST_CASE("Basic string distance") {
    CHECK(drydock::lev_edit_distance("a", "a") == 0);
    CHECK(drydock::lev_edit_distance("a", "b") == 1);
    CHECK(drydock::lev_edit_distance("aa", "a") == 1);
    CHECK(drydock::lev_edit_distance("", "abc") == 3);
    CHECK(drydock::lev_edit_distance("kitten", "sitting") == 3);
}

TEST_CASE("Find the 'did-you-mean' candidate") {
    auto cand = drydock::did_you_mean("food", {"foo", "bar"});
    CHECK(cand == "foo");
    cand = drydock::did_you_mean("bundel", {"bundle", "lint", "clean"});
    CHECK(cand == "bundle");

    std::vector<std::string> none;
    CHECK_FALSE(drydock::did_you_mean("x", none).has_value());
}
