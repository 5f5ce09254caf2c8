#include "./process.hpp"

#include "./proc_inspect.hpp"
#include "./shell_words.hpp"
#include "./signal.hpp"
#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/overload.hpp>
#include <neo/ufmt.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>

#include <poll.h>
#include <unistd.h>

using namespace plumb;

namespace {

constexpr std::size_t read_chunk_size = 1024 * 64;

/// Prefix the command with the words of the shell, inserting `-c` for a single-word shell
std::vector<std::string> shell_command(std::string_view shell, std::string command) {
    auto words = shell_split(shell);
    if (words.empty()) {
        throw std::invalid_argument("plumb::process::spawn(): The shell must not be empty");
    }
    if (words.size() == 1) {
        words.emplace_back("-c");
    }
    words.push_back(std::move(command));
    return words;
}

}  // namespace

input_spec::input_spec() noexcept
    : _spec(stdio_inherit) {}
input_spec::~input_spec()                           = default;
input_spec::input_spec(input_spec&&) noexcept       = default;
input_spec& input_spec::operator=(input_spec&&) noexcept = default;

input_spec::input_spec(stdio_inherit_t) noexcept
    : _spec(stdio_inherit) {}
input_spec::input_spec(stdio_null_t) noexcept
    : _spec(stdio_null) {}
input_spec::input_spec(int fd) noexcept
    : _spec(file_handle_ref{fd, open_mode::read}) {}
input_spec::input_spec(file_handle_ref ref) noexcept
    : _spec(ref) {}
input_spec::input_spec(const file_handle& fh) noexcept
    : _spec(fh.ref()) {}
input_spec::input_spec(byte_source src) noexcept
    : _spec(std::in_place_type<byte_source>, std::move(src)) {}
input_spec::input_spec(std::string bytes) noexcept
    : _spec(std::in_place_type<byte_source>, std::move(bytes)) {}
input_spec::input_spec(std::string_view bytes)
    : _spec(std::in_place_type<byte_source>, bytes) {}
input_spec::input_spec(const char* bytes)
    : _spec(std::in_place_type<byte_source>, bytes) {}
input_spec::input_spec(process&& upstream)
    : _spec(std::make_unique<process>(std::move(upstream))) {}

output_spec::output_spec(int fd) noexcept {
    if (fd == PIPE) {
        _spec = stdio_pipe;
    } else {
        _spec = file_handle_ref{fd, open_mode::write};
    }
}

process::~process() = default;

process process::spawn(std::vector<std::string> argv, process_options opts) {
    if (opts.shell) {
        argv = shell_command(*opts.shell, quote_argv_string(argv));
    }
    return _spawn(std::move(argv), std::move(opts));
}

process process::spawn(std::initializer_list<std::string_view> argv, process_options opts) {
    return spawn(std::vector<std::string>(argv.begin(), argv.end()), std::move(opts));
}

process process::spawn(std::string_view command, process_options opts) {
    if (opts.shell) {
        auto argv = shell_command(*opts.shell, std::string(command));
        return _spawn(std::move(argv), std::move(opts));
    }
    return _spawn(shell_split(command), std::move(opts));
}

process process::_spawn(std::vector<std::string> argv, process_options&& opts) {
    neo_assert(expects,
               !argv.empty(),
               "plumb::process::spawn() requires a program to execute, but the argv is empty");

    process ret;
    ret._argv    = std::move(argv);
    ret._backend = opts.backend ? opts.backend : &default_backend();
    ret._resolve_stdin(std::move(opts.stdin_));
    ret._stdout = _resolve_output(opts.stdout_, "stdout");
    ret._stderr = _resolve_output(opts.stderr_, "stderr");

    ret._pid = ret._backend->spawn(ret._argv, opts.env, ret._child_streams());
    spdlog::debug("Spawned pid {} [{}] using the {} backend{}",
                  ret._pid,
                  quote_argv_string(ret._argv),
                  ret._backend->name,
                  ret._upstream ? neo::ufmt(", reading from pid {}", ret._upstream->_pid) : "");
    return ret;
}

void process::_resolve_stdin(input_spec&& spec) {
    std::visit(  //
        neo::overload{
            [&](stdio_inherit_t) {
                // The child shares our stdin
            },
            [&](stdio_null_t) { _stdin = file_handle::open("/dev/null", open_mode::read); },
            [&](file_handle_ref ref) {
                if (ref.get() < 0) {
                    throw stream_spec_error(
                        neo::ufmt("Cannot use descriptor {} as the stdin of a process", ref.get()));
                }
                _stdin = ref;
            },
            [&](byte_source& src) {
                auto          size = src.known_size();
                plumb::pipe   oneshot;
                if (size and *size <= oneshot.capacity()) {
                    // It all fits in the pipe buffer, so it can be written before the child starts
                    oneshot.write(std::move(src));
                    _stdin = std::move(oneshot.reader());
                } else {
                    _stdin = std::make_unique<streaming_input_pipe>(std::move(src));
                }
            },
            [&](std::unique_ptr<process>& up) {
                if (not up) {
                    throw stream_spec_error("Cannot chain from a null upstream process");
                }
                auto capture = std::get_if<streaming_output_pipe>(&up->_stdout);
                if (not capture or not capture->reader().is_open()) {
                    throw stream_spec_error(
                        neo::ufmt("Cannot chain from pid {} [{}]: its stdout is not captured",
                                  up->pid(),
                                  quote_argv_string(up->argv())));
                }
                _stdin    = std::move(capture->reader());
                _upstream = std::move(up);
            },
        },
        spec.get());
}

process::output_slot process::_resolve_output(const output_spec& spec,
                                              std::string_view   stream_name) {
    return std::visit(  //
        neo::overload{
            [](stdio_inherit_t) { return output_slot{}; },
            [](stdio_pipe_t) { return output_slot{std::in_place_type<streaming_output_pipe>}; },
            [](stdio_null_t) {
                return output_slot{file_handle::open("/dev/null", open_mode::write)};
            },
            [&](file_handle_ref ref) {
                if (ref.get() < 0) {
                    throw stream_spec_error(neo::ufmt("Cannot use descriptor {} as the {} of a "
                                                      "process (use plumb::PIPE to capture it)",
                                                      ref.get(),
                                                      stream_name));
                }
                return output_slot{ref};
            },
        },
        spec.get());
}

stream_map process::_child_streams() const {
    stream_map streams;
    std::visit(  //
        neo::overload{
            [](std::monostate) {},
            [&](file_handle_ref ref) { streams[STDIN_FILENO] = ref; },
            [&](const file_handle& fh) { streams[STDIN_FILENO] = fh.ref(); },
            [&](const std::unique_ptr<streaming_input_pipe>& p) {
                streams[STDIN_FILENO] = p->child_end();
            },
        },
        _stdin);

    auto add_output = [&](int child_fd, const output_slot& slot) {
        std::visit(  //
            neo::overload{
                [](std::monostate) {},
                [&](file_handle_ref ref) { streams[child_fd] = ref; },
                [&](const file_handle& fh) { streams[child_fd] = fh.ref(); },
                [&](const streaming_output_pipe& p) { streams[child_fd] = p.child_end(); },
            },
            slot);
    };
    add_output(STDOUT_FILENO, _stdout);
    add_output(STDERR_FILENO, _stderr);
    return streams;
}

std::vector<process*> process::_chain() {
    std::vector<process*> ret;
    for (auto link = this; link; link = link->_upstream.get()) {
        ret.push_back(link);
    }
    std::reverse(ret.begin(), ret.end());
    return ret;
}

std::vector<const process*> process::_chain() const {
    std::vector<const process*> ret;
    for (auto link = this; link; link = link->_upstream.get()) {
        ret.push_back(link);
    }
    std::reverse(ret.begin(), ret.end());
    return ret;
}

void process::close_local() {
    std::visit(  //
        neo::overload{
            [](std::monostate) {},
            [](file_handle_ref) {
                // Not ours to close
            },
            [](file_handle& fh) { fh.close(); },
            [](std::unique_ptr<streaming_input_pipe>& p) { p->close_local(); },
        },
        _stdin);

    auto close_output = [](output_slot& slot) {
        std::visit(  //
            neo::overload{
                [](std::monostate) {},
                [](file_handle_ref) {},
                [](file_handle& fh) { fh.close(); },
                [](streaming_output_pipe& p) { p.close_local(); },
            },
            slot);
    };
    close_output(_stdout);
    close_output(_stderr);
}

process::output process::read(bool want_stdout, bool want_stderr) {
    output ret;

    struct capture_stream {
        file_handle* handle;
        std::string* dest;
    };
    std::vector<capture_stream> active;

    auto add_capture = [&](output_slot& slot, bool wanted, std::optional<std::string>& dest) {
        auto capture = std::get_if<streaming_output_pipe>(&slot);
        if (wanted and capture and capture->readable()) {
            active.push_back({&capture->reader(), &dest.emplace()});
        }
    };
    add_capture(_stdout, want_stdout, ret.stdout_);
    add_capture(_stderr, want_stderr, ret.stderr_);

    std::vector<::pollfd> poll_fds;
    while (not active.empty()) {
        poll_fds.clear();
        for (auto& stream : active) {
            poll_fds.push_back(::pollfd{.fd = stream.handle->get(), .events = POLLIN, .revents = 0});
        }
        int rc = ::poll(poll_fds.data(), static_cast<::nfds_t>(poll_fds.size()), -1);
        if (rc == -1) {
            if (errno == EINTR) {
                // Interrupted, but maybe by a signal that the caller wants to hear about
                throw_if_signalled();
                continue;
            }
            throw_current_error("::poll() on the captured output of a child process failed");
        }

        // Walk backwards so that finished streams can be dropped in place
        for (auto idx = poll_fds.size(); idx-- > 0;) {
            if (poll_fds[idx].revents == 0) {
                continue;
            }
            auto& stream     = active[idx];
            auto  start_size = stream.dest->size();
            stream.dest->resize(start_size + read_chunk_size);
            auto nread = stream.handle->read_into(stream.dest->data() + start_size, read_chunk_size);
            stream.dest->resize(start_size + nread);
            if (nread == 0) {
                // End-of-file
                stream.handle->close();
                active.erase(active.begin() + static_cast<std::ptrdiff_t>(idx));
            }
        }
    }
    return ret;
}

std::vector<process::output> process::read_all(bool want_stdout, bool want_stderr) {
    auto links = _chain();
    std::for_each(links.rbegin(), links.rend(), [](process* link) { link->close_local(); });

    std::vector<output> ret;
    ret.reserve(links.size());
    for (auto link : links) {
        if (link == this) {
            ret.push_back(link->read(want_stdout, want_stderr));
        } else {
            ret.push_back(link->read(false, want_stderr));
        }
    }
    return ret;
}

std::vector<std::vector<std::string>> process::argv_all() const {
    std::vector<std::vector<std::string>> ret;
    for (auto link : _chain()) {
        ret.push_back(link->argv());
    }
    return ret;
}

int process::waitpid() {
    neo_assert(expects,
               !_waited,
               "plumb::process::waitpid() called on a process that was already waited",
               _pid,
               _argv);
    auto status = _backend->wait(_pid);
    _waited     = true;
    if (auto writer = std::get_if<std::unique_ptr<streaming_input_pipe>>(&_stdin)) {
        auto nwritten = (*writer)->wait();
        spdlog::debug("Input writer for pid {} finished after {} bytes", _pid, nwritten);
    }
    return status;
}

std::vector<int> process::waitpid_all() {
    auto             links = _chain();
    std::vector<int> ret(links.size());
    for (auto idx = links.size(); idx-- > 0;) {
        ret[idx] = links[idx]->waitpid();
    }
    return ret;
}

std::vector<result> process::wait_all() {
    auto argvs    = argv_all();
    auto outputs  = read_all();
    auto statuses = waitpid_all();

    std::vector<result> ret;
    ret.reserve(argvs.size());
    for (std::size_t idx = 0; idx < argvs.size(); ++idx) {
        ret.emplace_back(std::move(argvs[idx]),
                         statuses[idx],
                         std::move(outputs[idx].stdout_),
                         std::move(outputs[idx].stderr_));
    }
    return ret;
}

result process::wait() {
    auto results = wait_all();
    return std::move(results.back());
}

void process::kill(int signum, std::optional<bool> dead_ok) {
    bool tolerate_dead = dead_ok.value_or(signum == SIGTERM or signum == SIGKILL);
    if (_waited) {
        // The pid may already belong to somebody else. Never signal it.
        if (tolerate_dead) {
            return;
        }
        throw_for_system_error_code(ESRCH,
                                    neo::ufmt("Cannot send signal {} to pid {} [{}]: it has "
                                              "already exited and been waited",
                                              signum,
                                              _pid,
                                              quote_argv_string(_argv)));
    }
    spdlog::debug("Sending signal {} to pid {}", signum, _pid);
    if (::kill(_pid, signum) == -1) {
        if (errno == ESRCH and tolerate_dead) {
            return;
        }
        throw_current_error(neo::ufmt("::kill() failed to send signal {} to pid {}", signum, _pid));
    }
}

namespace {

/// Find the descendants of the given process that belong to our user
std::vector<::pid_t> owned_descendants(::pid_t pid) {
    std::vector<::pid_t> ret;
    std::vector<::pid_t> descendants;
    try {
        descendants = proc::children(pid, true);
    } catch (const std::system_error& e) {
        spdlog::warn("Unable to discover the descendants of pid {}: {}", pid, e.what());
        return ret;
    }
    for (auto child : descendants) {
        try {
            if (proc::owned(child)) {
                ret.push_back(child);
            }
        } catch (const std::system_error& e) {
            spdlog::debug("Descendant {} of pid {} is already gone: {}", child, pid, e.what());
        }
    }
    return ret;
}

}  // namespace

void process::kill_all(int signum, std::optional<bool> dead_ok, bool include_unmanaged) {
    for (auto link = this; link; link = link->_upstream.get()) {
        std::vector<::pid_t> unmanaged;
        if (include_unmanaged and not link->_waited) {
            // Collect them first. They get reparented once their parent dies.
            unmanaged = owned_descendants(link->_pid);
        }
        link->kill(signum, dead_ok);
        for (auto pid : unmanaged) {
            spdlog::debug("Sending signal {} to pid {}, a descendant of pid {}",
                          signum,
                          pid,
                          link->_pid);
            if (::kill(pid, signum) == -1 and errno != ESRCH) {
                throw_current_error(
                    neo::ufmt("::kill() failed to send signal {} to pid {}", signum, pid));
            }
        }
    }
}
