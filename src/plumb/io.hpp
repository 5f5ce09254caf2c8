#pragma once

#include <neo/const_buffer.hpp>
#include <neo/mutable_buffer.hpp>
#include <neo/trivial_range.hpp>

#include <cstdint>
#include <string>

namespace plumb {

using neo::const_buffer;
using neo::mutable_buffer;
using neo::mutable_trivial_range;
using neo::trivial_range;
using neo::trivial_type;

/**
 * @brief Interface of blocking byte streams: descriptors, and adapters that wrap them.
 *
 * Derived classes provide do_read_into() and do_write(). Both may transfer fewer bytes than asked
 * for. A read of zero bytes means end-of-stream.
 */
class byte_io_stream {
public:
    virtual ~byte_io_stream() = default;

private:
    virtual std::size_t do_read_into(mutable_buffer buf) = 0;
    virtual std::size_t do_write(const_buffer buf)       = 0;

public:
    /**
     * @brief Read up to `count` objects of type T into `out`.
     *
     * @return The number of whole objects that were read
     */
    template <trivial_type T>
    std::size_t read_into(T* out, std::size_t count) {
        auto nbytes = do_read_into(mutable_buffer(neo::byte_pointer(out), count * sizeof(T)));
        return nbytes / sizeof(T);
    }

    /// Read into a contiguous range of trivial objects. Returns the number of objects read.
    std::size_t read_into(mutable_trivial_range auto&& range) {
        return do_read_into(mutable_buffer(range)) / neo::data_type_size_v<decltype(range)>;
    }

    /// Read until end-of-stream
    std::string read();

    /// A single read of at most `count` bytes
    std::string read(std::size_t count);

    /// A single write from a contiguous range of trivial objects. Returns the number of objects.
    std::size_t write(trivial_range auto&& data) {
        auto nbytes = do_write(const_buffer(data));
        return nbytes / neo::data_type_size_v<decltype(data)>;
    }

    /// A single write of (some of) the bytes
    std::size_t write_some(const_buffer data) { return do_write(data); }

    /**
     * @brief Write all of the bytes, however many writes that takes.
     *
     * @return The number of bytes written. Less than `data.size()` only if the stream stopped
     * accepting data.
     */
    std::size_t write_all(const_buffer data);
};

}  // namespace plumb
