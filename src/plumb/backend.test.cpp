#include "./backend.hpp"

#include "./pipe.hpp"
#include "./signal.hpp"
#include "./subprocess_registry.hpp"

#include <catch2/catch.hpp>

#include <csignal>

namespace {

std::vector<std::string> sh(std::string script) { return {"/bin/sh", "-c", std::move(script)}; }

}  // namespace

TEST_CASE("Look up backends") {
    CHECK(plumb::backends().size() == 3);
    CHECK(&plumb::find_backend("posix_spawn") == &plumb::posix_spawn_backend);
    CHECK(&plumb::find_backend("fork_exec") == &plumb::fork_exec_backend);
    CHECK(&plumb::find_backend("subprocess") == &plumb::subprocess_backend);
    CHECK_THROWS_AS(plumb::find_backend("vfork"), std::invalid_argument);
}

TEST_CASE("Override the default backend") {
    auto& prev = plumb::default_backend();
    plumb::set_default_backend(plumb::fork_exec_backend);
    CHECK(&plumb::default_backend() == &plumb::fork_exec_backend);
    plumb::set_default_backend(prev);
    CHECK(&plumb::default_backend() == &prev);
}

TEST_CASE("Plan the descriptors of a child") {
    using plumb::open_mode;
    SECTION("Sources are closed once, after every dup") {
        plumb::detail::stream_plan plan{{
            {0, {7, open_mode::read}},
            {1, {8, open_mode::write}},
            {2, {8, open_mode::write}},
        }};
        CHECK(plan.dups == std::vector<std::pair<int, int>>{{7, 0}, {8, 1}, {8, 2}});
        CHECK(plan.closes == std::vector<int>{7, 8});
    }
    SECTION("A descriptor already in place is left alone") {
        plumb::detail::stream_plan plan{{
            {1, {1, open_mode::write}},
            {2, {1, open_mode::write}},
        }};
        CHECK(plan.dups == std::vector<std::pair<int, int>>{{1, 2}});
        CHECK(plan.closes.empty());
    }
}

TEST_CASE("Convert wait statuses") {
    // Exited with 3
    CHECK(plumb::status_from_wait(3 << 8) == 3);
    // Killed by SIGKILL
    CHECK(plumb::status_from_wait(SIGKILL) == -SIGKILL);
}

TEST_CASE("Spawn and wait with every backend") {
    const plumb::backend& be = *GENERATE(as<const plumb::backend*>{},
                                         &plumb::posix_spawn_backend,
                                         &plumb::fork_exec_backend,
                                         &plumb::subprocess_backend);
    INFO("Backend: " << be.name);

    SECTION("Exit codes") {
        auto pid = be.spawn(sh("exit 3"), std::nullopt, {});
        CHECK(be.wait(pid) == 3);
        pid = be.spawn(std::vector<std::string>{"true"}, std::nullopt, {});
        CHECK(be.wait(pid) == 0);
    }

    SECTION("Death by signal") {
        auto pid = be.spawn(sh("kill -TERM $$"), std::nullopt, {});
        CHECK(be.wait(pid) == -SIGTERM);
    }

    SECTION("Install streams") {
        plumb::pipe out;
        auto        pid = be.spawn(sh("echo out; echo err >&2"),
                            std::nullopt,
                            {{1, out.writer().ref()}, {2, out.writer().ref()}});
        out.writer().close();
        CHECK(be.wait(pid) == 0);
        CHECK(out.read() == "out\nerr\n");
    }

    SECTION("Extra descriptors") {
        plumb::pipe side;
        auto pid = be.spawn(sh("echo extra >&3"), std::nullopt, {{3, side.writer().ref()}});
        side.writer().close();
        CHECK(be.wait(pid) == 0);
        CHECK(side.read() == "extra\n");
    }

    SECTION("Environment") {
        plumb::pipe out;
        auto        pid = be.spawn(std::vector<std::string>{"env"},
                            plumb::environment{{"PLUMB_TEST_VARIABLE", "yes"}},
                            {{1, out.writer().ref()}});
        out.writer().close();
        CHECK(be.wait(pid) == 0);
        CHECK(out.read() == "PLUMB_TEST_VARIABLE=yes\n");
    }

    SECTION("Missing executable") {
        try {
            (void)be.spawn(std::vector<std::string>{"plumb-this-executable-does-not-exist"},
                           std::nullopt,
                           {});
            FAIL_CHECK("Spawning a missing executable did not fail");
        } catch (const std::system_error& e) {
            CHECK(e.code() == std::errc::no_such_file_or_directory);
        }
    }

    SECTION("Signals ignored by the parent are default in the child") {
        plumb::signal_handling_scope ignore{SIGPIPE, SIG_IGN};
        auto                         pid = be.spawn(sh("kill -PIPE $$"), std::nullopt, {});
        CHECK(be.wait(pid) == -SIGPIPE);
    }
}

TEST_CASE("The subprocess backend holds children until they are waited") {
    auto& registry = plumb::managed_process_registry::global();
    auto  before   = registry.size();

    auto pid = plumb::subprocess_backend.spawn(std::vector<std::string>{"true"}, std::nullopt, {});
    CHECK(registry.contains(pid));
    CHECK(registry.size() == before + 1);
    CHECK(plumb::subprocess_backend.wait(pid) == 0);
    CHECK_FALSE(registry.contains(pid));
    CHECK(registry.size() == before);

    // Processes from other backends are waited directly
    pid = plumb::posix_spawn_backend.spawn(sh("exit 5"), std::nullopt, {});
    CHECK_FALSE(registry.contains(pid));
    CHECK(plumb::subprocess_backend.wait(pid) == 5);
}
