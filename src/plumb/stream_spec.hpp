#pragma once

#include "./byte_source.hpp"
#include "./file_handle.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace plumb {

class process;

/// Tag type: the child shares the stream with the parent
struct stdio_inherit_t {
    explicit stdio_inherit_t() = default;
};
/// Tag type: the stream is captured through a pipe and can be read by the parent
struct stdio_pipe_t {
    explicit stdio_pipe_t() = default;
};
/// Tag type: the stream is connected to /dev/null
struct stdio_null_t {
    explicit stdio_null_t() = default;
};

inline constexpr stdio_inherit_t stdio_inherit{};
inline constexpr stdio_pipe_t    stdio_pipe{};
inline constexpr stdio_null_t    stdio_null{};

/// The integer that requests capture of an output stream
inline constexpr int PIPE = -1;

/**
 * @brief Exception thrown when a stream specification cannot be used to spawn a process
 */
class stream_spec_error : public std::invalid_argument {
public:
    using invalid_argument::invalid_argument;
};

/**
 * @brief What to connect to the stdin of a new process.
 *
 * - Nothing given, or stdio_inherit: use the stdin of the parent
 * - stdio_null: read from /dev/null
 * - A descriptor (as an int, a file_handle_ref, or a file_handle): read from that descriptor. The
 *   descriptor is still owned by the caller.
 * - A byte_source or a string: feed those bytes through a pipe
 * - Another process (moved in): read from the captured stdout of that process. The new process
 *   takes ownership of the upstream one.
 */
class input_spec {
public:
    using variant_type = std::variant<stdio_inherit_t,
                                      stdio_null_t,
                                      file_handle_ref,
                                      byte_source,
                                      std::unique_ptr<process>>;

private:
    variant_type _spec;

public:
    input_spec() noexcept;
    ~input_spec();
    input_spec(input_spec&&) noexcept;
    input_spec& operator=(input_spec&&) noexcept;

    input_spec(stdio_inherit_t) noexcept;
    input_spec(stdio_null_t) noexcept;
    input_spec(int fd) noexcept;
    input_spec(file_handle_ref ref) noexcept;
    input_spec(const file_handle& fh) noexcept;
    input_spec(byte_source src) noexcept;
    input_spec(std::string bytes) noexcept;
    input_spec(std::string_view bytes);
    input_spec(const char* bytes);
    input_spec(process&& upstream);

    [[nodiscard]] variant_type&       get() noexcept { return _spec; }
    [[nodiscard]] const variant_type& get() const noexcept { return _spec; }
};

/**
 * @brief What to connect to the stdout or stderr of a new process.
 *
 * - Nothing given, or stdio_inherit: use the stream of the parent
 * - stdio_pipe, or the integer PIPE: capture through a pipe
 * - stdio_null: write to /dev/null
 * - A descriptor (as a non-negative int, a file_handle_ref, or a file_handle): write to that
 *   descriptor. The descriptor is still owned by the caller.
 */
class output_spec {
public:
    using variant_type = std::variant<stdio_inherit_t, stdio_pipe_t, stdio_null_t, file_handle_ref>;

private:
    variant_type _spec;

public:
    output_spec() noexcept
        : _spec(stdio_inherit) {}

    output_spec(stdio_inherit_t) noexcept
        : _spec(stdio_inherit) {}
    output_spec(stdio_pipe_t) noexcept
        : _spec(stdio_pipe) {}
    output_spec(stdio_null_t) noexcept
        : _spec(stdio_null) {}
    output_spec(int fd) noexcept;
    output_spec(file_handle_ref ref) noexcept
        : _spec(ref) {}
    output_spec(const file_handle& fh) noexcept
        : _spec(fh.ref()) {}

    [[nodiscard]] const variant_type& get() const noexcept { return _spec; }
};

}  // namespace plumb
