#include "./subprocess.hpp"

#include "./pipe.hpp"

#include <catch2/catch.hpp>

#include <csignal>

TEST_CASE("Spawn a simple subprocess") {
    auto proc = plumb::subprocess::spawn({.command = {"/bin/sh", "-c", "exit 0"}});
    auto rc   = proc.join();
    CHECK(rc.exit_code == 0);
    CHECK(rc.status() == 0);

    plumb::pipe out;
    proc = plumb::subprocess::spawn({
        .command = {"/bin/sh", "-c", "echo hello; exit 42"},
        .stdout_ = out.writer().ref(),
    });
    out.writer().close();
    CHECK(out.read() == "hello\n");
    CHECK(proc.join().exit_code == 42);
    CHECK(proc.is_joined());
    CHECK(proc.exit_result()->status() == 42);

    plumb::pipe in;
    proc = plumb::subprocess::spawn({
        .command = {"cat"},
        .stdin_  = in.reader().ref(),
        .stdout_ = plumb::stdio_null,
    });
    in.reader().close();
    REQUIRE_FALSE(proc.is_joined());
    in.writer().close();
    CHECK(proc.join().status() == 0);

    proc = plumb::subprocess::spawn({
        .command = {"/bin/sh", "-c", "kill -INT $$"},
        .stdin_  = plumb::stdio_null,
    });
    proc.join();
    CHECK(proc.exit_result()->signal_number == SIGINT);
    CHECK(proc.exit_result()->status() == -SIGINT);

    try {
        proc = plumb::subprocess::spawn({.command = {"this-exe-does-not-exist.exe"}});
        proc.join();
        FAIL_CHECK("No-executable test did not fail");
    } catch (const std::system_error& e) {
        CHECK(e.code() == std::errc::no_such_file_or_directory);
    }
}

TEST_CASE("Give a subprocess extra streams and an environment") {
    plumb::pipe out;
    auto        proc = plumb::subprocess::spawn({
        .command       = {"/bin/sh", "-c", "echo \"$GREETING\" >&3"},
        .env           = plumb::environment{{"GREETING", "howdy"}},
        .extra_streams = {{3, out.writer().ref()}},
    });
    CHECK(proc.pid() > 0);
    out.writer().close();
    CHECK(proc.join().status() == 0);
    CHECK(out.read() == "howdy\n");
}

TEST_CASE("Detach a subprocess") {
    auto proc = plumb::subprocess::spawn({.command = {"true"}});
    auto pid  = proc.pid();
    proc.detach();
    CHECK(proc.pid() == -1);
    // We are still its parent, so it can be reaped directly
    CHECK(plumb::posix_wait(pid) == 0);
}
