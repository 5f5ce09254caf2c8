#include "./backend.hpp"

#include "./pipe.hpp"
#include "./shell_words.hpp"
#include "./signal.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>
#include <neo/utility.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

using namespace plumb;

namespace {

/**
 * Read the control pipe of a freshly forked child. The child closes it when exec() succeeds (it is
 * close-on-exec), or writes its errno followed by a message when it fails.
 */
void throw_if_error_on_pipe(file_handle& error_pipe, ::pid_t child) {
    int  child_errno = 0;
    auto nread       = error_pipe.read_into(&child_errno, 1);
    if (nread == 0) {
        // No error
        return;
    }
    std::string message = error_pipe.read();
    // The child has already given up. Reap it so that it does not linger as a zombie.
    int     raw = 0;
    ::pid_t rc  = 0;
    do {
        rc = ::waitpid(child, &raw, 0);
    } while (rc == -1 and errno == EINTR);
    throw_for_system_error_code(child_errno, message);
}

/// Write the whole buffer with nothing but async-signal-safe calls
void raw_write_all(int fd, const void* data, std::size_t size) noexcept {
    auto ptr = static_cast<const char*>(data);
    while (size != 0) {
        auto n = ::write(fd, ptr, size);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return;
        }
        ptr += n;
        size -= static_cast<std::size_t>(n);
    }
}

}  // namespace

::pid_t plumb::spawn_fork_exec(std::span<const std::string>       argv,
                               const std::optional<environment>& env,
                               const stream_map&                 streams) {
    neo_assert(expects, !argv.empty(), "Cannot spawn a process from an empty command line");

    // Everything the child needs is prepared up front. Between fork() and exec() the child may only
    // make async-signal-safe calls.
    detail::exec_strings                args{{argv.begin(), argv.end()}};
    std::optional<detail::exec_strings> envp;
    if (env) {
        envp.emplace(environment_strings(*env));
    }
    detail::stream_plan plan{streams};
    std::string         dup2_error_message = "Failed to dup2() a stream into the new process";
    std::string         execvp_error_message
        = neo::ufmt("execvpe() failed for executable [{}]", argv.front());
    auto default_signals = child_default_signals();

    plumb::pipe control;
    if (not streams.empty() and control.writer().get() <= streams.rbegin()->first) {
        // Keep the control pipe out of the way of the descriptors that are installed in the child
        int moved = ::fcntl(control.writer().get(), F_DUPFD_CLOEXEC, streams.rbegin()->first + 1);
        if (moved == -1) {
            throw_current_error("Failed to move the control pipe of a new process");
        }
        control.writer() = file_handle{std::move(moved), open_mode::write};
    }

    auto child_pid = ::fork();
    if (child_pid == -1) {
        throw_current_error("::fork() failed");
    }
    if (child_pid != 0) {
        // We are the parent
        control.writer().close();
        throw_if_error_on_pipe(control.reader(), child_pid);
        spdlog::debug("fork_exec: started process {}: {}", child_pid, quote_argv_string(argv));
        return child_pid;
    }

    // We are the child
    const int error_fd   = control.writer().get();
    auto      child_fail = [&](const std::string& message) {
        int err = errno;
        raw_write_all(error_fd, &err, sizeof err);
        raw_write_all(error_fd, message.data(), message.size());
        std::_Exit(127);
    };

    for (int sig : default_signals) {
        std::signal(sig, SIG_DFL);
    }

    for (auto [from, to] : plan.dups) {
        if (::dup2(from, to) == -1) {
            child_fail(dup2_error_message);
        }
    }
    for (auto fd : plan.closes) {
        ::close(fd);
    }

    ::execvpe(args.front(), args.data(), envp ? envp->data() : ::environ);

    // We should never get to this line if execvpe() succeeds
    child_fail(execvp_error_message);
    neo::unreachable();
}
