#include "./backend.hpp"

#include "./shell_words.hpp"
#include "./signal.hpp"
#include "./subprocess_registry.hpp"

#include <neo/assert.hpp>
#include <spdlog/spdlog.h>

#include <unistd.h>

using namespace plumb;

managed_process_registry::~managed_process_registry() {
    for (auto& [pid, proc] : _procs) {
        proc.detach();
    }
}

managed_process_registry& managed_process_registry::global() noexcept {
    static managed_process_registry inst;
    return inst;
}

void managed_process_registry::add(subprocess&& proc) {
    std::lock_guard lk{_mutex};
    auto            pid           = proc.pid();
    auto [it, did_insert]         = _procs.emplace(pid, std::move(proc));
    neo_assert(invariant,
               did_insert,
               "A subprocess was registered with the pid of another live subprocess",
               pid);
}

std::optional<subprocess> managed_process_registry::take(::pid_t pid) {
    std::lock_guard lk{_mutex};
    auto            node = _procs.extract(pid);
    if (node.empty()) {
        return std::nullopt;
    }
    return std::optional<subprocess>{std::move(node.mapped())};
}

bool managed_process_registry::contains(::pid_t pid) const {
    std::lock_guard lk{_mutex};
    return _procs.contains(pid);
}

std::size_t managed_process_registry::size() const {
    std::lock_guard lk{_mutex};
    return _procs.size();
}

::pid_t plumb::spawn_subprocess(std::span<const std::string>       argv,
                                const std::optional<environment>& env,
                                const stream_map&                 streams) {
    subprocess_spawn_options opts;
    opts.command.assign(argv.begin(), argv.end());
    opts.env = env;
    for (auto& [child_fd, source] : streams) {
        switch (child_fd) {
        case STDIN_FILENO:
            opts.stdin_ = source;
            break;
        case STDOUT_FILENO:
            opts.stdout_ = source;
            break;
        case STDERR_FILENO:
            opts.stderr_ = source;
            break;
        default:
            opts.extra_streams.emplace(child_fd, source);
        }
    }
    auto proc = subprocess::spawn(std::move(opts));
    auto pid  = proc.pid();
    managed_process_registry::global().add(std::move(proc));
    spdlog::debug("subprocess: started process {}: {}", pid, quote_argv_string(argv));
    return pid;
}

int plumb::subprocess_wait(::pid_t pid) {
    auto& registry = managed_process_registry::global();
    auto  proc     = registry.take(pid);
    if (not proc) {
        return posix_wait(pid);
    }
    try {
        auto status = proc->join().status();
        spdlog::debug("Joined subprocess {} with status {}", pid, status);
        return status;
    } catch (const signal_exception&) {
        // Still unreaped. Put it back for the next wait().
        registry.add(std::move(*proc));
        throw;
    }
}
