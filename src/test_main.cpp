#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <spdlog/cfg/env.h>

int main(int argc, char** argv) {
    // SPDLOG_LEVEL=debug shows every spawn, wait, and kill
    spdlog::cfg::load_env_levels();
    return Catch::Session().run(argc, argv);
}
