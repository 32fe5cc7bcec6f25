#include "./io.hpp"

#include <drydock/util/temp.hpp>

#include <boost/leaf.hpp>
#include <catch2/catch.hpp>

#include <system_error>

using namespace drydock;

TEST_CASE("Write a file and read it back") {
    auto tdir = temporary_dir::create();
    auto path = tdir.path() / "notes.txt";
    write_file(path, "first\nsecond\n");
    CHECK(read_file(path) == "first\nsecond\n");
    write_file(path, "replaced");
    CHECK(read_file(path) == "replaced");
}

TEST_CASE("A missing file names itself in the error") {
    auto tdir    = temporary_dir::create();
    auto missing = tdir.path() / "nope.txt";
    bool handled = false;
    boost::leaf::try_catch([&] { (void)read_file(missing); },
                           [&](const std::system_error&, e_file_io io) {
                               handled = true;
                               CHECK(io.path == missing);
                               CHECK(io.action == "reading");
                           },
                           [] { FAIL("Expected a file error"); });
    CHECK(handled);
}

TEST_CASE("Writing into a missing directory fails") {
    auto tdir = temporary_dir::create();
    auto dest = tdir.path() / "no-such-dir" / "out.txt";
    boost::leaf::try_catch([&] { write_file(dest, "x"); },
                           [&](const std::system_error&, e_file_io io) {
                               CHECK(io.path == dest);
                               CHECK(io.action == "writing");
                           },
                           [] { FAIL("Expected a file error"); });
}
