#pragma once

#include <string_view>
#include <system_error>

namespace plumb {

/// The `errno` of the calling thread, in the system category
[[nodiscard]] std::error_code get_current_error_code() noexcept;

/**
 * @brief Throw a std::system_error for an OS error number.
 *
 * @param code An `errno` value, or the return value of a function that reports errors that way,
 * e.g. posix_spawn()
 * @param message Context for the exception message
 */
[[noreturn]] void throw_for_system_error_code(int code, std::string_view message);

/**
 * @brief Throw a std::system_error for the `errno` of the calling thread
 */
[[noreturn]] void throw_current_error(std::string_view message);

}  // namespace plumb
