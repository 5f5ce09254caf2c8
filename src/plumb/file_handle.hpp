#pragma once

#include "./io.hpp"

#include <neo/utility.hpp>

#include <filesystem>
#include <string_view>

namespace plumb {

/**
 * @brief The direction(s) in which a file handle was opened
 */
enum class open_mode {
    read,
    write,
    read_write,
};

std::string_view to_string(open_mode) noexcept;

/**
 * @brief Low-level operations on POSIX file descriptors
 */
struct posix_fd_traits {
    using handle_type = int;

    inline static const handle_type null_handle = -1;

    /// Close the descriptor. Returns zero on success, or the errno value on failure
    static int         close(handle_type) noexcept;
    static std::size_t write(handle_type, const_buffer);
    static std::size_t read(handle_type, mutable_buffer);
    /// Whether the descriptor refers to an open file description in this process
    static bool is_valid(handle_type) noexcept;
};

/**
 * @brief A non-owning reference to an open descriptor and its open-mode.
 *
 * This is what gets passed around when a descriptor is lent to someone else for a while, e.g. to a
 * spawn backend that will duplicate it into a child process.
 */
class file_handle_ref {
    int       _fd   = posix_fd_traits::null_handle;
    open_mode _mode = open_mode::read;

public:
    file_handle_ref() = default;
    file_handle_ref(int fd, open_mode mode) noexcept
        : _fd(fd)
        , _mode(mode) {}

    [[nodiscard]] int       get() const noexcept { return _fd; }
    [[nodiscard]] open_mode mode() const noexcept { return _mode; }
    [[nodiscard]] bool      is_open() const noexcept { return _fd != posix_fd_traits::null_handle; }

    /// The mode permits reading, and the descriptor is still open in this process
    [[nodiscard]] bool readable() const noexcept;
    /// The mode permits writing, and the descriptor is still open in this process
    [[nodiscard]] bool writable() const noexcept;

    friend bool operator==(file_handle_ref, file_handle_ref) noexcept = default;

    friend void do_repr(auto out, const file_handle_ref* self) noexcept {
        out.type("plumb::file_handle_ref");
        if (self) {
            out.bracket_value("fd={}, mode={}", self->get(), to_string(self->mode()));
        }
    }
};

/**
 * @brief An owning file descriptor, tagged with the mode it was opened with.
 *
 * The descriptor is closed when the handle is destroyed. Closing more than once is harmless.
 */
class file_handle : public byte_io_stream {
public:
    using handle_type = posix_fd_traits::handle_type;

    inline static const handle_type null_handle = posix_fd_traits::null_handle;

private:
    handle_type _handle = null_handle;
    open_mode   _mode   = open_mode::read;

public:
    /**
     * @brief Default-construct a null (unopened) handle
     */
    file_handle() = default;
    /// Move from another handle
    file_handle(file_handle&& other) noexcept
        : _mode(other._mode) {
        reset(other.release());
    }
    /// Move-assign from another handle
    file_handle& operator=(file_handle&& o) noexcept {
        _mode = o._mode;
        reset(o.release());
        return *this;
    }

    /// Adopt ownership of the given descriptor
    explicit file_handle(handle_type&& h, open_mode mode) noexcept
        : _mode(mode) {
        reset(NEO_MOVE(h));
    }

    /// Destroys and closes the handle
    ~file_handle() { reset(handle_type{null_handle}); }

    /**
     * @brief Open the file at the given path.
     *
     * @throws std::system_error if the file cannot be opened
     */
    [[nodiscard]] static file_handle open(const std::filesystem::path& filepath, open_mode mode);

    /**
     * @brief Obtain a copy of the descriptor managed by this object
     */
    [[nodiscard]] handle_type get() const noexcept { return _handle; }

    [[nodiscard]] open_mode mode() const noexcept { return _mode; }

    /// Determine whether this object holds a descriptor
    [[nodiscard]] bool is_open() const noexcept { return get() != null_handle; }

    /// The mode permits reading, and the descriptor is still open
    [[nodiscard]] bool readable() const noexcept { return ref().readable(); }
    /// The mode permits writing, and the descriptor is still open
    [[nodiscard]] bool writable() const noexcept { return ref().writable(); }

    /// Obtain a non-owning reference to the descriptor
    [[nodiscard]] file_handle_ref ref() const noexcept { return file_handle_ref{_handle, _mode}; }

    /**
     * @brief Close the descriptor.
     *
     * @param tolerate_already_closed If `true` (the default), an EBADF from the OS is ignored.
     * Otherwise it is thrown as a std::system_error. Other errors are always thrown.
     *
     * @note The handle is reset to null before anything is thrown, so the descriptor is never
     * closed twice by this object.
     */
    void close(bool tolerate_already_closed = true);

    /**
     * @brief Replace the descriptor managed by this object
     *
     * @param h A descriptor to swap into place. The old descriptor is closed.
     */
    void reset(handle_type&& h) noexcept {
        if (is_open()) {
            (void)posix_fd_traits::close(get());
        }
        _handle = h;
    }

    /**
     * @brief Relinquish ownership of the managed descriptor and return it to the caller.
     *
     * @note It is the duty of the caller to ensure the returned descriptor will be closed properly
     */
    [[nodiscard]] handle_type release() noexcept {
        auto h  = _handle;
        _handle = null_handle;
        return h;
    }

    friend void do_repr(auto out, const file_handle* self) noexcept {
        out.type("plumb::file_handle");
        if (self) {
            out.bracket_value("fd={}, mode={}", self->get(), to_string(self->mode()));
        }
    }

private:
    std::size_t do_write(const_buffer cbuf) override { return posix_fd_traits::write(get(), cbuf); }
    std::size_t do_read_into(mutable_buffer mbuf) override {
        return posix_fd_traits::read(get(), mbuf);
    }
};

/**
 * @brief A non-owning byte stream over a descriptor that someone else owns.
 */
class file_handle_stream : file_handle {
public:
    explicit file_handle_stream(file_handle_ref ref)
        : file_handle(ref.get(), ref.mode()) {}
    ~file_handle_stream() { (void)release(); }

    file_handle_stream(file_handle_stream&&) = delete;

    using file_handle::get;
    using file_handle::is_open;
    using file_handle::read;
    using file_handle::read_into;
    using file_handle::write;
    using file_handle::write_all;
};

}  // namespace plumb
