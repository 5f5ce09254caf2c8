#pragma once

#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace plumb {

/**
 * @brief Split a command string into words, following the POSIX shell rules for whitespace,
 * single quotes, double quotes, and backslash escapes.
 *
 * No expansion of any kind is performed.
 *
 * @throws std::invalid_argument if a quote is left unterminated or the string ends in a lone
 * backslash
 */
[[nodiscard]] std::vector<std::string> shell_split(std::string_view command);

/// Whether the argument needs to be quoted to survive a round-trip through a POSIX shell
[[nodiscard]] bool argv_arg_needs_quoting(std::string_view arg) noexcept;
/// Quote the argument for a POSIX shell, if it needs quoting
[[nodiscard]] std::string quote_argv_arg(std::string_view arg);

/// Join the arguments into a single string that a POSIX shell would split back into the same words
template <std::ranges::input_range R>
requires std::convertible_to<std::ranges::range_reference_t<R>, std::string_view>  //
    [[nodiscard]] std::string quote_argv_string(R&& r) {
    std::string acc;
    for (std::string_view arg : r) {
        acc.append(quote_argv_arg(arg));
        acc.push_back(' ');
    }
    if (!acc.empty()) {
        acc.pop_back();
    }
    return acc;
}

}  // namespace plumb
