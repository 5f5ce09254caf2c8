#include "./backend.hpp"

#include "./signal.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <spdlog/spdlog.h>

#include <sys/wait.h>

using namespace plumb;

int plumb::status_from_wait(int raw_status) {
    if (WIFSIGNALED(raw_status)) {
        return -WTERMSIG(raw_status);
    } else if (WIFEXITED(raw_status)) {
        return WEXITSTATUS(raw_status);
    } else if (WIFSTOPPED(raw_status)) {
        return -WSTOPSIG(raw_status);
    }
    neo_assert(invariant,
               false,
               "Unexpected waitpid() child exit state. This is a bug in plumb.",
               raw_status);
    return raw_status;
}

int plumb::posix_wait(::pid_t pid) {
    int     raw = 0;
    ::pid_t rc  = 0;
    do {
        rc = ::waitpid(pid, &raw, 0);
        if (rc == -1 and errno == EINTR) {
            throw_if_signalled();
        }
    } while (rc == -1 and errno == EINTR);
    neo_assert(invariant,
               rc == pid,
               "::waitpid() did not reap the expected child. Was it waited twice, or by another "
               "backend?",
               pid,
               rc,
               get_current_error_code().message());
    auto status = status_from_wait(raw);
    spdlog::debug("Reaped child process {} with status {}", pid, status);
    return status;
}
