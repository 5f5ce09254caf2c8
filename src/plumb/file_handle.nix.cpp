#include "./file_handle.hpp"

#include "./syserror.hpp"

#include <neo/assert.hpp>
#include <neo/ufmt.hpp>

#include <fcntl.h>
#include <unistd.h>

using namespace plumb;

std::string_view plumb::to_string(open_mode m) noexcept {
    switch (m) {
    case open_mode::read:
        return "read";
    case open_mode::write:
        return "write";
    case open_mode::read_write:
        return "read-write";
    }
    return "invalid";
}

int posix_fd_traits::close(int fd) noexcept {
    int rc = ::close(fd);
    // A close() interrupted by a signal has still released the descriptor on Linux, so it must
    // not be retried.
    if (rc == -1 and errno != EINTR) {
        return errno;
    }
    return 0;
}

std::size_t posix_fd_traits::write(int fd, const_buffer cbuf) {
    neo_assert(expects,
               fd != null_handle,
               "Attempted to write data to a closed file descriptor",
               cbuf.size());
    while (true) {
        auto nwritten = ::write(fd, cbuf.data(), cbuf.size());
        if (nwritten < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_current_error("::write() on file descriptor failed");
        }
        return static_cast<std::size_t>(nwritten);
    }
}

std::size_t posix_fd_traits::read(int fd, mutable_buffer buf) {
    neo_assert(expects,
               fd != null_handle,
               "Attempted to read data from a closed file descriptor",
               buf.size());
    while (true) {
        auto nread = ::read(fd, buf.data(), buf.size());
        if (nread < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw_current_error("::read() on file descriptor failed");
        }
        return static_cast<std::size_t>(nread);
    }
}

bool posix_fd_traits::is_valid(int fd) noexcept {
    if (fd == null_handle) {
        return false;
    }
    return ::fcntl(fd, F_GETFD) != -1;
}

bool file_handle_ref::readable() const noexcept {
    return (_mode == open_mode::read or _mode == open_mode::read_write)
        and posix_fd_traits::is_valid(_fd);
}

bool file_handle_ref::writable() const noexcept {
    return (_mode == open_mode::write or _mode == open_mode::read_write)
        and posix_fd_traits::is_valid(_fd);
}

void file_handle::close(bool tolerate_already_closed) {
    if (not is_open()) {
        if (not tolerate_already_closed) {
            throw_for_system_error_code(EBADF, "Attempted to close an already-closed file handle");
        }
        return;
    }
    int err = posix_fd_traits::close(release());
    if (err == 0 or (err == EBADF and tolerate_already_closed)) {
        return;
    }
    throw_for_system_error_code(err, "::close() on file descriptor failed");
}

file_handle file_handle::open(const std::filesystem::path& filepath, open_mode mode) {
    int flags = O_CLOEXEC;
    switch (mode) {
    case open_mode::read:
        flags |= O_RDONLY;
        break;
    case open_mode::write:
        flags |= O_WRONLY;
        break;
    case open_mode::read_write:
        flags |= O_RDWR;
        break;
    }
    int fd = ::open(filepath.c_str(), flags);
    if (fd < 0) {
        throw_current_error(
            neo::ufmt("Failed to open file [{}] for {}", filepath.string(), to_string(mode)));
    }
    return file_handle{std::move(fd), mode};
}
