#include "./environ.hpp"

#include <catch2/catch.hpp>

TEST_CASE("Get an environment variable") {
    auto path = plumb::getenv("PATH");
    CHECK(path);
    CHECK_FALSE(plumb::getenv("PLUMB_THIS_VARIABLE_IS_NOT_SET"));
}

TEST_CASE("Render environment strings") {
    plumb::environment env{{"A", "1"}, {"B", "x=y"}};
    auto               strs = plumb::environment_strings(env);
    CHECK(strs == std::vector<std::string>{"A=1", "B=x=y"});
}
