#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace plumb {

/**
 * @brief A set of environment variables to give to a child process
 */
using environment = std::map<std::string, std::string>;

/**
 * @brief Get the environment variable named by the given key
 *
 * @param key The name of an environment variable to get
 */
std::optional<std::string> getenv(std::string_view key) noexcept;

/**
 * @brief Render an environment as the "KEY=value" strings expected by exec()
 */
std::vector<std::string> environment_strings(const environment& env);

}  // namespace plumb
