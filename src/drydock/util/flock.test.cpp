#include "./flock.hpp"

#include "./temp.hpp"

#include <catch2/catch.hpp>

using namespace drydock;

TEST_CASE("Two locks on one file exclude each other within a process") {
    auto tdir = temporary_dir::create();
    auto path = tdir.path() / "svc.lock";

    file_lock first{path};
    REQUIRE(first.try_lock());
    {
        file_lock second{path};
        CHECK_FALSE(second.try_lock());
        CHECK_FALSE(second.owns_lock());
    }
    // Closing the second handle leaves the first one's lock in place
    file_lock third{path};
    CHECK_FALSE(third.try_lock());

    first.unlock();
    CHECK(third.try_lock());
}
