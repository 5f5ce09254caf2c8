#include "./signal.hpp"

#include "./syserror.hpp"

#include <neo/ufmt.hpp>

#include <array>

using namespace plumb;

namespace {

volatile std::sig_atomic_t S_received_signal = 0;

constexpr std::array S_child_default_signals = {SIGPIPE, SIGXFSZ};

}  // namespace

std::span<const int> plumb::child_default_signals() noexcept { return S_child_default_signals; }

void plumb::notify_received_signal(int signum) noexcept {
    S_received_signal = static_cast<std::sig_atomic_t>(signum);
}

int plumb::received_signal() noexcept { return S_received_signal; }

void plumb::reset_signal() noexcept { S_received_signal = 0; }

signal_handling_scope::signal_handling_scope(int signum, void (*handler)(int))
    : _signum(signum) {
    struct ::sigaction action = {};
    action.sa_handler         = handler;
    sigemptyset(&action.sa_mask);
    if (::sigaction(signum, &action, &_prev) == -1) {
        throw_current_error(neo::ufmt("::sigaction() failed to install a handler for signal {}",
                                      signum));
    }
}

signal_handling_scope::~signal_handling_scope() { ::sigaction(_signum, &_prev, nullptr); }

signal_exception::signal_exception(int signum)
    : runtime_error(neo::ufmt("Interrupted by signal {}", signum))
    , _signal_number(signum) {}

void plumb::throw_if_signalled() {
    if (int signum = received_signal()) {
        reset_signal();
        throw signal_exception(signum);
    }
}
