#pragma once

#include "./byte_source.hpp"
#include "./file_handle.hpp"

#include <cstdint>
#include <future>
#include <string>
#include <thread>

namespace plumb {

/**
 * @brief An anonymous kernel pipe: a connected reader/writer pair of file handles.
 *
 * Both ends are created close-on-exec, so they only reach a child process when they are explicitly
 * wired into it.
 */
class pipe {
    file_handle _reader;
    file_handle _writer;

public:
    /// Create a new anonymous IPC pipe within the current process
    pipe();

    pipe(pipe&&) noexcept = default;
    pipe& operator=(pipe&&) noexcept = default;

    /// The read-end of the pipe
    [[nodiscard]] file_handle&       reader() noexcept { return _reader; }
    [[nodiscard]] const file_handle& reader() const noexcept { return _reader; }
    /// The write-end of the pipe
    [[nodiscard]] file_handle&       writer() noexcept { return _writer; }
    [[nodiscard]] const file_handle& writer() const noexcept { return _writer; }

    [[nodiscard]] bool readable() const noexcept { return _reader.readable(); }
    [[nodiscard]] bool writable() const noexcept { return _writer.writable(); }

    /// Close both ends
    void close(bool tolerate_already_closed = true);

    /**
     * @brief Write everything from `source` into the pipe, then close the write end.
     *
     * This is a one-shot transfer: it is only safe if nobody needs to drain the pipe concurrently,
     * i.e. for payloads no larger than capacity(), or if the reader lives in another process that
     * is already running.
     *
     * @return std::size_t The number of bytes written
     */
    std::size_t write(byte_source source);

    /**
     * @brief Read everything until end-of-file, then close the read end.
     */
    [[nodiscard]] std::string read();

    /**
     * @brief The number of bytes the kernel will buffer in this pipe before a writer blocks.
     */
    [[nodiscard]] std::size_t capacity() const noexcept;

    friend void do_repr(auto out, const pipe* self) noexcept {
        out.type("plumb::pipe");
        if (self) {
            out.bracket_value("reader={}, writer={}", self->reader().get(), self->writer().get());
        }
    }
};

/**
 * @brief A pipe that captures the stdout or stderr of a child process.
 *
 * The child receives the write end. The parent keeps the read end, and must call close_local()
 * before reading, otherwise its own copy of the write end prevents end-of-file from ever arriving.
 */
class streaming_output_pipe : public pipe {
public:
    streaming_output_pipe() = default;

    /// The end that is given to the child
    [[nodiscard]] file_handle_ref child_end() const noexcept { return writer().ref(); }

    /// Close the parent's copy of the write end
    void close_local(bool tolerate_already_closed = true) {
        writer().close(tolerate_already_closed);
    }
};

/**
 * @brief A pipe that feeds the stdin of a child process from a background writer thread.
 *
 * The writer starts immediately upon construction, and closes the write end when the source is
 * exhausted. Writing from a separate thread means the child can fill its own output pipes while
 * its input is still being produced, which the caller can then drain.
 *
 * The writer thread blocks SIGPIPE. If the child goes away before consuming everything, the
 * writer stops and reports the number of bytes it managed to write.
 */
class streaming_input_pipe : public pipe {
    std::future<std::size_t> _result;
    std::thread              _thread;
    bool                     _waited = false;
    std::size_t              _nwritten = 0;

    static std::size_t _run_writer(file_handle& writer, byte_source& source);

public:
    /// Begin writing `source` into a new pipe
    explicit streaming_input_pipe(byte_source source);

    /// Closes the local read end and joins the writer thread
    ~streaming_input_pipe();

    // The writer thread refers to this object
    streaming_input_pipe(streaming_input_pipe&&) = delete;
    streaming_input_pipe& operator=(streaming_input_pipe&&) = delete;

    /// The end that is given to the child
    [[nodiscard]] file_handle_ref child_end() const noexcept { return reader().ref(); }

    /// Close the parent's copy of the read end
    void close_local(bool tolerate_already_closed = true) {
        reader().close(tolerate_already_closed);
    }

    /**
     * @brief Wait for the writer to finish.
     *
     * @return std::size_t The number of bytes that were written into the pipe.
     *
     * @throws Whatever error was encountered by the writer thread, other than a broken pipe.
     */
    std::size_t wait();

    /// Whether wait() has returned
    [[nodiscard]] bool is_waited() const noexcept { return _waited; }
};

}  // namespace plumb
