#include "./proc_inspect.hpp"

#include "./process.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <filesystem>

#include <unistd.h>

namespace {

bool contains(const std::vector<::pid_t>& pids, ::pid_t pid) {
    return std::find(pids.begin(), pids.end(), pid) != pids.end();
}

}  // namespace

TEST_CASE("Inspect this process") {
    auto self = ::getpid();
    CHECK(contains(plumb::proc::pids(), self));
    CHECK(contains(plumb::proc::tasks(self), self));
    CHECK(plumb::proc::status(self, "Pid") == std::to_string(self));
    CHECK(plumb::proc::status(self).contains("Uid"));
    CHECK_FALSE(plumb::proc::status(self, "No Such Key"));
    CHECK(plumb::proc::owned(self));
    CHECK_FALSE(plumb::proc::owned(self, ::getuid() + 1));
}

TEST_CASE("Inspect a missing process") {
    // Larger than the largest possible pid_max
    ::pid_t nobody = 1 << 23;
    CHECK_THROWS_AS(plumb::proc::status(nobody), std::system_error);
    CHECK_THROWS_AS(plumb::proc::children(nobody), std::system_error);
}

TEST_CASE("Find the children of this process") {
    auto self = ::getpid();
    if (not std::filesystem::exists("/proc/self/task/" + std::to_string(self) + "/children")) {
        WARN("This kernel does not provide /proc/<pid>/task/<tid>/children");
        return;
    }
    auto child = plumb::process::spawn({"sleep", "10"}, {.stdin_ = plumb::stdio_null});
    CHECK(contains(plumb::proc::children(self), child.pid()));
    CHECK(contains(plumb::proc::children(self, true), child.pid()));
    child.kill();
    CHECK(child.wait().status() == -SIGTERM);
}
