#pragma once

#include "./subprocess.hpp"

#include <sys/types.h>

#include <map>
#include <mutex>
#include <optional>

namespace plumb {

/**
 * @brief The process-wide table of subprocesses spawned by the `subprocess` backend.
 *
 * A plumb::subprocess insists on reaping its own child, so the backend must keep each one alive
 * between spawn() and wait(). Entries are added when spawned and removed by the first wait().
 *
 * All member functions are safe to call concurrently. Each registration or removal is a single
 * operation under the registry's lock. Joining happens outside of the lock.
 */
class managed_process_registry {
    mutable std::mutex              _mutex;
    std::map<::pid_t, subprocess> _procs;

public:
    managed_process_registry() = default;
    /// Detaches any subprocesses that were never waited
    ~managed_process_registry();

    managed_process_registry(managed_process_registry&&) = delete;

    /// The registry used by the `subprocess` backend
    [[nodiscard]] static managed_process_registry& global() noexcept;

    /// Take ownership of the subprocess, keyed by its pid
    void add(subprocess&& proc);

    /// Remove and return the subprocess with the given pid, if there is one
    [[nodiscard]] std::optional<subprocess> take(::pid_t pid);

    [[nodiscard]] bool        contains(::pid_t pid) const;
    [[nodiscard]] std::size_t size() const;
};

}  // namespace plumb
