#pragma once

#include "./environ.hpp"
#include "./file_handle.hpp"

#include <sys/types.h>

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace plumb {

/**
 * @brief The descriptors to install in a new child: child descriptor number -> parent descriptor.
 *
 * Each source descriptor is duplicated onto its child descriptor number, and then the redundant
 * source is closed in the child. Descriptors not named here are inherited as usual (unless they are
 * close-on-exec).
 */
using stream_map = std::map<int, file_handle_ref>;

using spawn_fn = ::pid_t (*)(std::span<const std::string>       argv,
                             const std::optional<environment>& env,
                             const stream_map&                 streams);
using wait_fn  = int (*)(::pid_t pid);

/**
 * @brief A strategy for spawning and reaping child processes.
 *
 * All backends have the same observable behavior:
 *
 * - `spawn()` looks the executable up on the PATH, installs the given streams, resets the
 *   dispositions of child_default_signals() to default, and returns the new pid. Failure to
 *   execute the program is thrown from `spawn()` as a std::system_error.
 * - `wait()` blocks until the process exits and returns its status: the exit code if it exited
 *   normally, or the negated signal number if it was killed by a signal.
 */
struct backend {
    std::string_view name;
    spawn_fn         spawn;
    wait_fn          wait;

    friend void do_repr(auto out, const backend* self) noexcept {
        out.type("plumb::backend");
        if (self) {
            out.bracket_value("{}", self->name);
        }
    }
};

/// Spawn with posix_spawnp()
::pid_t spawn_posix(std::span<const std::string>       argv,
                    const std::optional<environment>& env,
                    const stream_map&                 streams);

/// Spawn with fork() and execvpe(). Exec failures are reported through a control pipe.
::pid_t spawn_fork_exec(std::span<const std::string>       argv,
                        const std::optional<environment>& env,
                        const stream_map&                 streams);

/// Spawn a plumb::subprocess, and hold on to it in the managed_process_registry
::pid_t spawn_subprocess(std::span<const std::string>       argv,
                         const std::optional<environment>& env,
                         const stream_map&                 streams);

/// Wait with waitpid()
int posix_wait(::pid_t pid);

/// Join the plumb::subprocess that was registered for the pid, or fall back to posix_wait()
int subprocess_wait(::pid_t pid);

/**
 * @brief Convert a raw waitpid() status to the signed status convention
 */
int status_from_wait(int raw_status);

/// The `posix_spawn` backend
extern const backend posix_spawn_backend;
/// The `fork_exec` backend
extern const backend fork_exec_backend;
/// The `subprocess` backend, which delegates to plumb::subprocess
extern const backend subprocess_backend;

/// The name of the environment variable that selects the default backend
inline constexpr std::string_view backend_env_var = "PLUMB_BACKEND";

/// All available backends
[[nodiscard]] std::span<const backend* const> backends() noexcept;

/**
 * @brief Look up a backend by name.
 *
 * @throws std::invalid_argument if there is no backend of that name
 */
[[nodiscard]] const backend& find_backend(std::string_view name);

/**
 * @brief Obtain the backend used when none is requested explicitly.
 *
 * Unless set_default_backend() has been called, this is chosen once from the PLUMB_BACKEND
 * environment variable, and is `posix_spawn` if that is not set.
 *
 * @throws std::invalid_argument if PLUMB_BACKEND names an unknown backend
 */
[[nodiscard]] const backend& default_backend();

/// Replace the process-wide default backend
void set_default_backend(const backend& b) noexcept;

namespace detail {

/**
 * @brief A null-terminated array of C strings, as taken by exec() and posix_spawn().
 *
 * Must be fully built before fork(), since nothing may allocate in the child.
 */
class exec_strings {
    std::vector<std::string> _strings;
    std::vector<char*>       _ptrs;

public:
    explicit exec_strings(std::vector<std::string> strings);

    [[nodiscard]] char* const* data() const noexcept { return _ptrs.data(); }
    [[nodiscard]] const char*  front() const noexcept { return _strings.front().c_str(); }
};

/**
 * @brief The dup2() and close() steps that install a stream_map into a child.
 *
 * A source that already sits on its target is left alone. Each other source is closed exactly
 * once, after every dup2() has happened, and never if it is itself a target.
 */
struct stream_plan {
    std::vector<std::pair<int, int>> dups;
    std::vector<int>                 closes;

    explicit stream_plan(const stream_map& streams);
};

}  // namespace detail

}  // namespace plumb
