#include "./file_handle.hpp"

#include <catch2/catch.hpp>

#include <fcntl.h>
#include <unistd.h>

namespace {

plumb::file_handle open_dev_null() {
    return plumb::file_handle::open("/dev/null", plumb::open_mode::read_write);
}

}  // namespace

TEST_CASE("Open and close a file handle") {
    auto fh = open_dev_null();
    REQUIRE(fh.is_open());
    CHECK(fh.readable());
    CHECK(fh.writable());
    CHECK(fh.mode() == plumb::open_mode::read_write);

    fh.close();
    CHECK_FALSE(fh.is_open());
    CHECK_FALSE(fh.readable());
    CHECK_FALSE(fh.writable());
    // Closing again is harmless
    fh.close();
    CHECK_THROWS_AS(fh.close(false), std::system_error);
}

TEST_CASE("Mode tags limit readability and writability") {
    auto r = plumb::file_handle::open("/dev/null", plumb::open_mode::read);
    CHECK(r.readable());
    CHECK_FALSE(r.writable());

    auto w = plumb::file_handle::open("/dev/null", plumb::open_mode::write);
    CHECK_FALSE(w.readable());
    CHECK(w.writable());
}

TEST_CASE("Closing a descriptor that was closed behind our back") {
    auto fh = open_dev_null();
    ::close(fh.get());
    CHECK_FALSE(fh.readable());

    SECTION("Tolerated by default") { CHECK_NOTHROW(fh.close()); }
    SECTION("Reported when asked") {
        try {
            fh.close(false);
            FAIL_CHECK("close(false) did not throw");
        } catch (const std::system_error& e) {
            CHECK(e.code() == std::errc::bad_file_descriptor);
        }
        CHECK_FALSE(fh.is_open());
    }
}

TEST_CASE("Release and reset") {
    auto fh = open_dev_null();
    int  fd = fh.release();
    CHECK_FALSE(fh.is_open());
    CHECK(::fcntl(fd, F_GETFD) != -1);

    plumb::file_handle adopted{std::move(fd), plumb::open_mode::read};
    CHECK(adopted.readable());
    auto moved = std::move(adopted);
    CHECK(moved.readable());
    CHECK_FALSE(adopted.is_open());
}

TEST_CASE("Open a non-existent file") {
    try {
        (void)plumb::file_handle::open("/this/path/does/not/exist", plumb::open_mode::read);
        FAIL_CHECK("Opening a missing file did not throw");
    } catch (const std::system_error& e) {
        CHECK(e.code() == std::errc::no_such_file_or_directory);
    }
}
