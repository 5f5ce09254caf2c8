#pragma once

#include <signal.h>

#include <span>
#include <stdexcept>

namespace plumb {

/**
 * @brief The signals whose dispositions are reset to default in every spawned child.
 *
 * A parent commonly ignores SIGPIPE (and, less often, SIGXFSZ). Ignored dispositions survive
 * exec(), which would leave e.g. `yes | head -1` spinning forever in the child.
 */
[[nodiscard]] std::span<const int> child_default_signals() noexcept;

/**
 * @brief Record that a signal was received. Safe to install directly as a signal handler.
 */
void notify_received_signal(int signum) noexcept;

/// The most recently recorded signal, or zero
[[nodiscard]] int received_signal() noexcept;

/// Forget the recorded signal
void reset_signal() noexcept;

/**
 * @brief Installs a signal handler for the lifetime of the object, and restores the previous one
 * on destruction.
 *
 * The handler is installed without SA_RESTART, so blocking calls in plumb that wait on children
 * or their pipes return early, and check for a recorded signal with throw_if_signalled().
 */
class signal_handling_scope {
    int                _signum;
    struct ::sigaction _prev;

public:
    /// Install `handler` (which may be SIG_IGN or SIG_DFL) for `signum`
    [[nodiscard]] signal_handling_scope(int signum, void (*handler)(int));

    /// Install notify_received_signal() for `signum`
    [[nodiscard]] explicit signal_handling_scope(int signum)
        : signal_handling_scope(signum, notify_received_signal) {}

    ~signal_handling_scope();

    signal_handling_scope(signal_handling_scope&&) = delete;
    signal_handling_scope& operator=(signal_handling_scope&&) = delete;
};

/**
 * @brief Exception thrown when an operation is abandoned because the current process received a
 * signal.
 */
class signal_exception : public std::runtime_error {
    int _signal_number;

public:
    explicit signal_exception(int signum);

    [[nodiscard]] int signal_number() const noexcept { return _signal_number; }
};

/**
 * @brief If a signal has been recorded with notify_received_signal(), forget it and throw a
 * signal_exception for it.
 */
void throw_if_signalled();

}  // namespace plumb
