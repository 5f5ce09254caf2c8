#pragma once

#include <sys/types.h>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Inspection of other processes through the Linux /proc filesystem.
 *
 * All of these throw std::system_error (or std::filesystem::filesystem_error) if the relevant
 * /proc entries cannot be read, e.g. because the process has already gone away.
 */
namespace plumb::proc {

/// Every process ID that currently appears in /proc
[[nodiscard]] std::vector<::pid_t> pids();

/// All key-value pairs of /proc/<pid>/status, with values as the raw text
[[nodiscard]] std::map<std::string, std::string, std::less<>> status(::pid_t pid);

/// A single value from /proc/<pid>/status, or nullopt if there is no such key
[[nodiscard]] std::optional<std::string> status(::pid_t pid, std::string_view key);

/// Whether the real user ID of the process is `uid` (default: the user ID of this process)
[[nodiscard]] bool owned(::pid_t pid, std::optional<::uid_t> uid = std::nullopt);

/// The task (thread) IDs of the process. There is usually one, equal to the pid.
[[nodiscard]] std::vector<::pid_t> tasks(::pid_t pid);

/**
 * @brief The children of the process, from /proc/<pid>/task/<tid>/children.
 *
 * @param recursive If `true`, also include children of children, in breadth-first order
 */
[[nodiscard]] std::vector<::pid_t> children(::pid_t pid, bool recursive = false);

}  // namespace plumb::proc
