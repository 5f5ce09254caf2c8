#include "./subprocess.hpp"

#include "./signal.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/overload.hpp>

#include <sys/wait.h>
#include <unistd.h>

using namespace plumb;

void subprocess::_check_released() const noexcept {
    neo_assert_always(expects,
                      _pid == -1 or is_joined(),
                      "A plumb::subprocess was dropped without being joined or detached",
                      _pid,
                      _options);
}

subprocess subprocess::spawn(subprocess_spawn_options opts) {
    neo_assert(expects,
               !opts.command.empty(),
               "plumb::subprocess::spawn(): opts.command cannot be empty.",
               opts);

    stream_map streams = opts.extra_streams;
    // Our copies of the /dev/null handles. They are closed once the child has its own.
    std::vector<file_handle> nulls;

    auto add_stdio = [&](int child_fd, const subprocess_spawn_options::stdio_option& opt) {
        std::visit(  //
            neo::overload{
                [&](stdio_inherit_t) {
                    // Nothing to install. The child shares our stream.
                },
                [&](stdio_null_t) {
                    auto mode = child_fd == STDIN_FILENO ? open_mode::read : open_mode::write;
                    auto& fh  = nulls.emplace_back(file_handle::open("/dev/null", mode));
                    streams[child_fd] = fh.ref();
                },
                [&](file_handle_ref ref) { streams[child_fd] = ref; },
            },
            opt);
    };
    add_stdio(STDIN_FILENO, opts.stdin_);
    add_stdio(STDOUT_FILENO, opts.stdout_);
    add_stdio(STDERR_FILENO, opts.stderr_);

    auto pid = spawn_fork_exec(opts.command, opts.env, streams);
    return subprocess{pid, std::move(opts)};
}

const subprocess_exit& subprocess::join() {
    neo_assert(expects, _pid != -1, "subprocess::join() was called on a detached subprocess");
    neo_assert(expects,
               !is_joined(),
               "subprocess::join() was called on an already-joined subprocess",
               _pid,
               *exit_result());

    ::siginfo_t info = {};
    int         rc   = 0;
    do {
        rc = ::waitid(P_PID, static_cast<::id_t>(_pid), &info, WEXITED);
        if (rc == -1 and errno == EINTR) {
            throw_if_signalled();
        }
    } while (rc == -1 and errno == EINTR);
    neo_assert(invariant,
               rc == 0,
               "::waitid() failed to reap our own child",
               _pid,
               get_current_error_code().message());

    switch (info.si_code) {
    case CLD_EXITED:
        _exit_result = subprocess_exit{.exit_code = info.si_status};
        break;
    case CLD_KILLED:
    case CLD_DUMPED:
        _exit_result = subprocess_exit{.signal_number = info.si_status};
        break;
    default:
        neo_assert(invariant,
                   false,
                   "Unexpected waitid() child exit state. This is a bug in plumb.",
                   info.si_code,
                   info.si_status);
    }
    return *_exit_result;
}
