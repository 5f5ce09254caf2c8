#include "./shell_words.hpp"

#include <catch2/catch.hpp>

using words = std::vector<std::string>;

TEST_CASE("Split command strings") {
    CHECK(plumb::shell_split("tr a-z A-Z") == words{"tr", "a-z", "A-Z"});
    CHECK(plumb::shell_split("  echo   abc  ") == words{"echo", "abc"});
    CHECK(plumb::shell_split("") == words{});
    CHECK(plumb::shell_split("sh -c 'echo abc | tr a-z A-Z'")
          == words{"sh", "-c", "echo abc | tr a-z A-Z"});
    CHECK(plumb::shell_split(R"(echo "a \"b\" \$c \d")") == words{"echo", R"(a "b" $c \d)"});
    CHECK(plumb::shell_split(R"(a\ b c)") == words{"a b", "c"});
    CHECK(plumb::shell_split("''") == words{""});
    CHECK(plumb::shell_split("x'y'\"z\"") == words{"xyz"});
}

TEST_CASE("Reject malformed command strings") {
    CHECK_THROWS_AS(plumb::shell_split("echo 'abc"), std::invalid_argument);
    CHECK_THROWS_AS(plumb::shell_split("echo \"abc"), std::invalid_argument);
    CHECK_THROWS_AS(plumb::shell_split("echo abc\\"), std::invalid_argument);
}

TEST_CASE("Quote arguments") {
    CHECK(plumb::quote_argv_arg("plain") == "plain");
    CHECK(plumb::quote_argv_arg("a-z") == "a-z");
    CHECK(plumb::quote_argv_arg("two words") == "'two words'");
    CHECK(plumb::quote_argv_arg("") == "''");
    CHECK(plumb::quote_argv_arg("it's") == R"('it'\''s')");

    words argv = {"sh", "-c", "echo it's | cat"};
    auto  str  = plumb::quote_argv_string(argv);
    CHECK(str == R"(sh -c 'echo it'\''s | cat')");
    CHECK(plumb::shell_split(str) == argv);
}
