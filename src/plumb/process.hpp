#pragma once

#include "./backend.hpp"
#include "./environ.hpp"
#include "./pipe.hpp"
#include "./result.hpp"
#include "./stream_spec.hpp"

#include <signal.h>
#include <sys/types.h>

#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace plumb {

/// The shell used by process_options::shell when no other is requested
inline constexpr std::string_view default_shell = "sh -c";

/**
 * @brief Options for spawning a process
 */
struct process_options {
    /// The stdin of the child
    input_spec stdin_{};
    /// The stdout of the child
    output_spec stdout_{};
    /// The stderr of the child
    output_spec stderr_{};
    /**
     * @brief Run the command through this shell.
     *
     * The shell is split into words and the command is appended as a single argument. If the
     * shell is a single word, `-c` is inserted before the command.
     */
    std::optional<std::string> shell{};
    /// The environment of the child. If unset, the child inherits the environment of the parent
    std::optional<environment> env{};
    /// The backend that spawns and waits. If null, uses default_backend()
    const plumb::backend* backend = nullptr;
};

/**
 * @brief A running (or finished) child process, and the chain of upstream processes that feed
 * its stdin.
 *
 * A process is spawned with process::spawn(). Its captured streams are read with read() and it is
 * reaped with waitpid(), or all of that at once (for the whole chain) with wait_all() or wait().
 *
 * Processes are move-only. Destroying a process does not wait for the child.
 */
class process {
public:
    /// The captured output of a single process
    struct output {
        std::optional<std::string> stdout_;
        std::optional<std::string> stderr_;
    };

private:
    using input_slot = std::variant<std::monostate,
                                    file_handle_ref,
                                    file_handle,
                                    std::unique_ptr<streaming_input_pipe>>;
    using output_slot
        = std::variant<std::monostate, file_handle_ref, file_handle, streaming_output_pipe>;

    std::unique_ptr<process> _upstream;
    std::vector<std::string> _argv;
    const plumb::backend*    _backend = nullptr;
    ::pid_t                  _pid     = -1;
    bool                     _waited  = false;

    input_slot  _stdin;
    output_slot _stdout;
    output_slot _stderr;

    process() = default;

    /// The links of the chain, oldest first, ending with this
    std::vector<process*>       _chain();
    std::vector<const process*> _chain() const;

    static process _spawn(std::vector<std::string> argv, process_options&& opts);

    void               _resolve_stdin(input_spec&& spec);
    static output_slot _resolve_output(const output_spec& spec, std::string_view stream_name);
    stream_map         _child_streams() const;

public:
    process(process&&) noexcept = default;
    process& operator=(process&&) noexcept = default;
    ~process();

    /**
     * @brief Spawn a new process.
     *
     * @param argv The program to execute and its arguments. The program is looked up on the PATH.
     * @param opts Stream wiring, environment, shell, and backend
     *
     * @throws std::system_error if the program cannot be started
     * @throws stream_spec_error if a stream specification is invalid
     */
    [[nodiscard]] static process spawn(std::vector<std::string> argv, process_options opts = {});
    [[nodiscard]] static process spawn(std::initializer_list<std::string_view> argv,
                                       process_options                         opts = {});
    /**
     * @brief Spawn a new process from a single command string.
     *
     * If `opts.shell` is set, the string is given to the shell. Otherwise it is split into words
     * using POSIX shell rules.
     */
    [[nodiscard]] static process spawn(std::string_view command, process_options opts = {});

    [[nodiscard]] ::pid_t                         pid() const noexcept { return _pid; }
    [[nodiscard]] const std::vector<std::string>& argv() const noexcept { return _argv; }
    [[nodiscard]] const plumb::backend&           get_backend() const noexcept { return *_backend; }
    /// The process that feeds the stdin of this one, or null if there is none
    [[nodiscard]] const process* upstream() const noexcept { return _upstream.get(); }
    [[nodiscard]] process*       upstream() noexcept { return _upstream.get(); }
    /// Whether waitpid() has returned for this process
    [[nodiscard]] bool is_waited() const noexcept { return _waited; }

    /**
     * @brief Close the ends of pipes and other handles that the parent no longer needs after
     * spawning.
     *
     * Until this is called, the parent's copy of a capture pipe's write end keeps it from ever
     * reaching end-of-file.
     */
    void close_local();

    /**
     * @brief Read the captured stdout and/or stderr until end-of-file.
     *
     * Streams that are not captured (or not requested) are returned as nullopt. Both streams are
     * drained together, so a child that fills one of them can never block the other.
     */
    [[nodiscard]] output read(bool want_stdout = true, bool want_stderr = true);

    /**
     * @brief Close local handles of every link in the chain (last one first), then read from every
     * link (oldest first).
     *
     * Only the last link contributes stdout. The others can only contribute stderr.
     */
    [[nodiscard]] std::vector<output> read_all(bool want_stdout = true, bool want_stderr = true);

    /// The argv of every link in the chain, oldest first
    [[nodiscard]] std::vector<std::vector<std::string>> argv_all() const;

    /**
     * @brief Wait for the process to exit, and join the writer thread of a streaming stdin.
     *
     * @return The status: the exit code, or the negated signal number if killed by a signal
     *
     * @throws signal_exception if a signal recorded by a signal_handling_scope interrupts the
     * wait. The process is then still unwaited.
     * @throws Whatever the streaming stdin source threw, once the child has been reaped
     *
     * @pre The process must not have been waited already
     */
    int waitpid();

    /// Wait for every link in the chain (last one first). Returns the statuses oldest first.
    std::vector<int> waitpid_all();

    /**
     * @brief Read and wait for every link of the chain.
     *
     * @return One result per link, oldest first
     */
    [[nodiscard]] std::vector<result> wait_all();

    /// The result of the last link of wait_all()
    [[nodiscard]] result wait();

    /**
     * @brief Send a signal to the process.
     *
     * @param dead_ok Whether a process that has already exited is acceptable. Defaults to `true`
     * for SIGTERM and SIGKILL, and `false` otherwise.
     *
     * @throws std::system_error with std::errc::no_such_process if the process is gone and
     * `dead_ok` is false
     */
    void kill(int signum = SIGTERM, std::optional<bool> dead_ok = std::nullopt);

    /**
     * @brief Send a signal to every link of the chain.
     *
     * @param include_unmanaged If `true`, also signal the descendants of each link that are owned
     * by the same user, e.g. the children of a shell.
     */
    void kill_all(int                 signum            = SIGTERM,
                  std::optional<bool> dead_ok           = std::nullopt,
                  bool                include_unmanaged = false);

    friend void do_repr(auto out, const process* self) noexcept {
        out.type("plumb::process");
        if (self) {
            out.append("{pid={}, argv={}, waited={}",
                       self->pid(),
                       out.repr_value(self->argv()),
                       self->is_waited());
            if (self->upstream()) {
                out.append(", upstream={}", self->upstream()->pid());
            }
            out.append("}");
        }
    }
};

}  // namespace plumb
