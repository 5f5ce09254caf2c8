#include "./backend.hpp"

#include "./shell_words.hpp"
#include "./signal.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>
#include <spdlog/spdlog.h>

#include <spawn.h>
#include <unistd.h>

extern char** environ;

using namespace plumb;

namespace {

class spawn_file_actions {
    ::posix_spawn_file_actions_t _actions;

public:
    spawn_file_actions() {
        int rc = ::posix_spawn_file_actions_init(&_actions);
        if (rc != 0) {
            throw_for_system_error_code(rc, "::posix_spawn_file_actions_init() failed");
        }
    }
    ~spawn_file_actions() { ::posix_spawn_file_actions_destroy(&_actions); }

    spawn_file_actions(spawn_file_actions&&) = delete;

    void add_dup2(int from, int to) {
        int rc = ::posix_spawn_file_actions_adddup2(&_actions, from, to);
        if (rc != 0) {
            throw_for_system_error_code(rc, neo::ufmt("Failed to plan dup2({}, {})", from, to));
        }
    }

    void add_close(int fd) {
        int rc = ::posix_spawn_file_actions_addclose(&_actions, fd);
        if (rc != 0) {
            throw_for_system_error_code(rc, neo::ufmt("Failed to plan close({})", fd));
        }
    }

    const ::posix_spawn_file_actions_t* get() const noexcept { return &_actions; }
};

class spawn_attributes {
    ::posix_spawnattr_t _attr;

public:
    spawn_attributes() {
        int rc = ::posix_spawnattr_init(&_attr);
        if (rc != 0) {
            throw_for_system_error_code(rc, "::posix_spawnattr_init() failed");
        }
    }
    ~spawn_attributes() { ::posix_spawnattr_destroy(&_attr); }

    spawn_attributes(spawn_attributes&&) = delete;

    void set_default_signals(std::span<const int> signals) {
        ::sigset_t set;
        sigemptyset(&set);
        for (int sig : signals) {
            sigaddset(&set, sig);
        }
        int rc = ::posix_spawnattr_setsigdefault(&_attr, &set);
        if (rc == 0) {
            rc = ::posix_spawnattr_setflags(&_attr, POSIX_SPAWN_SETSIGDEF);
        }
        if (rc != 0) {
            throw_for_system_error_code(rc, "Failed to set the default signals of a new process");
        }
    }

    const ::posix_spawnattr_t* get() const noexcept { return &_attr; }
};

}  // namespace

::pid_t plumb::spawn_posix(std::span<const std::string>       argv,
                           const std::optional<environment>& env,
                           const stream_map&                 streams) {
    neo_assert(expects, !argv.empty(), "Cannot spawn a process from an empty command line");

    detail::exec_strings                args{{argv.begin(), argv.end()}};
    std::optional<detail::exec_strings> envp;
    if (env) {
        envp.emplace(environment_strings(*env));
    }

    detail::stream_plan plan{streams};
    spawn_file_actions  actions;
    for (auto [from, to] : plan.dups) {
        actions.add_dup2(from, to);
    }
    for (auto fd : plan.closes) {
        actions.add_close(fd);
    }

    spawn_attributes attr;
    attr.set_default_signals(child_default_signals());

    ::pid_t pid = 0;
    int     rc  = ::posix_spawnp(&pid,
                            args.front(),
                            actions.get(),
                            attr.get(),
                            args.data(),
                            envp ? envp->data() : ::environ);
    if (rc != 0) {
        throw_for_system_error_code(rc,
                                    neo::ufmt("posix_spawnp() failed for executable [{}]",
                                              argv.front()));
    }
    spdlog::debug("posix_spawn: started process {}: {}", pid, quote_argv_string(argv));
    return pid;
}
