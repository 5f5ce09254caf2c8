#include "./result.hpp"

#include "./backend.hpp"
#include "./pipe.hpp"

#include <catch2/catch.hpp>

#include <unistd.h>

TEST_CASE("Check a result") {
    plumb::result ok{{"true"}, 0};
    CHECK(ok.successful());
    CHECK(&ok.check() == &ok);

    plumb::result bad{{"grep", "needle"}, 1, "", "no such file\n"};
    CHECK_FALSE(bad.successful());
    try {
        bad.check();
        FAIL_CHECK("check() did not throw");
    } catch (const plumb::result_error& e) {
        CHECK(e.get_result() == bad);
        CHECK(e.argv() == bad.argv());
        CHECK(e.status() == 1);
        CHECK(e.stdout_() == "");
        CHECK(e.stderr_() == "no such file\n");
        CHECK(std::string_view(e.what()).find("grep needle") != std::string_view::npos);
    }

    plumb::result killed{{"sleep", "10"}, -15};
    CHECK_THROWS_AS(killed.check(), plumb::result_error);
    CHECK_THROWS_WITH(killed.check(), Catch::Contains("signal 15"));
}

TEST_CASE("die() on success returns") {
    plumb::result ok{{"true"}, 0, "output"};
    CHECK(&ok.die() == &ok);
}

TEST_CASE("die() on failure exits with the same status") {
    plumb::result bad{{"false"}, 3, std::nullopt, "oops\n"};
    plumb::pipe   err;
    auto          pid = ::fork();
    REQUIRE(pid != -1);
    if (pid == 0) {
        ::dup2(err.writer().get(), STDERR_FILENO);
        (void)bad.die();
        ::_exit(99);
    }
    err.writer().close();
    CHECK(err.read() == "oops\n");
    CHECK(plumb::posix_wait(pid) == 3);
}
