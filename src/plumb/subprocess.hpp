#pragma once

#include "./backend.hpp"
#include "./environ.hpp"
#include "./file_handle.hpp"
#include "./stream_spec.hpp"

#include <sys/types.h>

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace plumb {

/**
 * @brief How a joined subprocess ended.
 */
struct subprocess_exit {
    /// The exit code, if the child exited on its own
    int exit_code = 0;
    /// The signal that killed the child, or zero
    int signal_number = 0;

    /// The exit code, or the negated signal number if the child was killed by a signal
    [[nodiscard]] int status() const noexcept {
        return signal_number != 0 ? -signal_number : exit_code;
    }

    friend void do_repr(auto out, const subprocess_exit* self) noexcept {
        out.type("plumb::subprocess_exit");
        if (self) {
            if (self->signal_number != 0) {
                out.bracket_value("signal_number={}", self->signal_number);
            } else {
                out.bracket_value("exit_code={}", self->exit_code);
            }
        }
    }
};

/**
 * @brief Options for subprocess::spawn()
 */
struct subprocess_spawn_options {
    /// Where a standard stream of the child comes from. A file_handle_ref is duplicated into it.
    using stdio_option = std::variant<stdio_inherit_t, stdio_null_t, file_handle_ref>;

    /**
     * @brief The command to execute.
     *
     * The first argument is looked up on the PATH to find the executable.
     */
    std::vector<std::string> command;

    /// The environment of the child, or nullopt to inherit ours
    std::optional<environment> env{};

    stdio_option stdin_{stdio_inherit};
    stdio_option stdout_{stdio_inherit};
    stdio_option stderr_{stdio_inherit};

    /// Additional descriptors to install in the child, keyed by the child's descriptor number
    stream_map extra_streams{};

    friend void do_repr(auto out, const subprocess_spawn_options* self) noexcept {
        out.type("plumb::subprocess_spawn_options");
        if (self) {
            out.append("{command={}", out.repr_value(self->command));
            if (self->env) {
                out.append(", env=[{} variables]", self->env->size());
            }
            out.append("}");
        }
    }
};

/**
 * @brief An owning handle to a child process.
 *
 * A subprocess must be joined or detached before it is destroyed (or assigned over). Forgetting
 * to do so is a fatal error, since the child would otherwise be left unreaped.
 */
class subprocess {
    ::pid_t                        _pid = -1;
    subprocess_spawn_options       _options;
    std::optional<subprocess_exit> _exit_result;

    subprocess(::pid_t pid, subprocess_spawn_options opts) noexcept
        : _pid(pid)
        , _options(std::move(opts)) {}

    /// Fatal if we still own an unjoined child
    void _check_released() const noexcept;

public:
    subprocess(subprocess&& o) noexcept
        : _pid(std::exchange(o._pid, -1))
        , _options(std::move(o._options))
        , _exit_result(std::exchange(o._exit_result, std::nullopt)) {}

    subprocess& operator=(subprocess&& o) noexcept {
        _check_released();
        _pid         = std::exchange(o._pid, -1);
        _options     = std::move(o._options);
        _exit_result = std::exchange(o._exit_result, std::nullopt);
        return *this;
    }

    ~subprocess() { _check_released(); }

    /**
     * @brief Start a new child process.
     *
     * @throws std::system_error if the program cannot be executed
     */
    [[nodiscard]] static subprocess spawn(subprocess_spawn_options opts);

    /// The pid of the child, or -1 if detached
    [[nodiscard]] ::pid_t pid() const noexcept { return _pid; }

    [[nodiscard]] bool is_joined() const noexcept { return _exit_result.has_value(); }

    /**
     * @brief Wait for the child to exit, and reap it.
     *
     * @pre The subprocess is neither joined nor detached
     * @throws signal_exception if the wait is interrupted by a signal recorded with
     * notify_received_signal(). The child is left unreaped.
     */
    const subprocess_exit& join();

    /// Let go of the child without reaping it
    void detach() noexcept { _pid = -1; }

    [[nodiscard]] const std::optional<subprocess_exit>& exit_result() const noexcept {
        return _exit_result;
    }
};

}  // namespace plumb
