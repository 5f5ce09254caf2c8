#include "./pipe.hpp"

#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/scope.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <utility>

#include <fcntl.h>
#include <pthread.h>
#include <unistd.h>

using namespace plumb;

namespace {

/// Forwards writes to a file handle, keeping count of how much got through
class counting_writer : public byte_io_stream {
    file_handle& _out;
    std::size_t  _count = 0;

    std::size_t do_read_into(mutable_buffer) override {
        neo_assert(expects, false, "The write end of a pipe cannot be read");
        return 0;
    }

    std::size_t do_write(const_buffer buf) override {
        auto n = _out.write_some(buf);
        _count += n;
        return n;
    }

public:
    explicit counting_writer(file_handle& out) noexcept
        : _out(out) {}

    [[nodiscard]] std::size_t count() const noexcept { return _count; }
};

/// Block SIGPIPE for the calling thread, so that writes to a widowed pipe fail with EPIPE instead
void block_sigpipe_in_this_thread() {
    ::sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGPIPE);
    int rc = ::pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (rc != 0) {
        throw_for_system_error_code(rc, "::pthread_sigmask() failed to block SIGPIPE");
    }
}

}  // namespace

plumb::pipe::pipe() {
    int  p[2] = {};
    auto rc   = ::pipe2(p, O_CLOEXEC);
    if (rc == -1) {
        throw_current_error("::pipe2() failed in plumb::pipe::pipe()");
    }
    _reader = file_handle{std::move(p[0]), open_mode::read};
    _writer = file_handle{std::move(p[1]), open_mode::write};
}

void plumb::pipe::close(bool tolerate_already_closed) {
    _reader.close(tolerate_already_closed);
    _writer.close(tolerate_already_closed);
}

std::size_t plumb::pipe::write(byte_source source) {
    neo_assert(expects,
               _writer.is_open(),
               "Attempted a one-shot write into a pipe whose write end is closed");
    auto nwritten = source.write_into(_writer);
    _writer.close();
    return nwritten;
}

std::string plumb::pipe::read() {
    neo_assert(expects,
               _reader.is_open(),
               "Attempted a one-shot read from a pipe whose read end is closed");
    auto content = _reader.read();
    _reader.close();
    return content;
}

std::size_t plumb::pipe::capacity() const noexcept {
#ifdef F_GETPIPE_SZ
    auto fd = _writer.is_open() ? _writer.get() : _reader.get();
    if (fd != file_handle::null_handle) {
        int size = ::fcntl(fd, F_GETPIPE_SZ);
        if (size > 0) {
            return static_cast<std::size_t>(size);
        }
    }
#endif
    return 1024 * 64;
}

std::size_t streaming_input_pipe::_run_writer(file_handle& writer, byte_source& source) {
    // The child only sees EOF on its stdin once this end is closed, however we leave
    neo_defer { writer = file_handle{}; };
    block_sigpipe_in_this_thread();
    counting_writer out{writer};
    try {
        source.write_into(out);
    } catch (const std::system_error& e) {
        if (e.code() != std::errc::broken_pipe) {
            throw;
        }
        spdlog::debug("Reader of the input pipe went away after {} bytes", out.count());
        return out.count();
    }
    writer.close();
    return out.count();
}

streaming_input_pipe::streaming_input_pipe(byte_source source) {
    std::packaged_task<std::size_t()> task{
        [this, src = std::move(source)]() mutable { return _run_writer(writer(), src); }};
    _result = task.get_future();
    _thread = std::thread(std::move(task));
}

streaming_input_pipe::~streaming_input_pipe() {
    // Drop our read end, so that the writer cannot block forever on a pipe that nobody reads
    reader() = file_handle{};
    if (_thread.joinable()) {
        _thread.join();
    }
}

std::size_t streaming_input_pipe::wait() {
    if (_waited) {
        return _nwritten;
    }
    _thread.join();
    _waited   = true;
    _nwritten = _result.get();
    return _nwritten;
}
