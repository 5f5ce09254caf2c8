#pragma once

#include "./io.hpp"

#include <neo/utility.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <variant>

namespace plumb {

/**
 * @brief A source of bytes that will be fed into the stdin of a child process.
 *
 * A byte_source is one of:
 *
 * - A fixed buffer of bytes (implicitly converted from strings)
 * - A pull-based reader, which is read until end-of-stream
 * - A producer function returning the whole payload
 * - A writer function that is handed the write end and returns the number of bytes it wrote
 * - A lazy sequence of chunks. Each chunk is written completely before the next one is pulled, so
 *   the payload never needs to exist in memory all at once.
 */
class byte_source {
public:
    using producer_fn = std::function<std::string()>;
    using writer_fn   = std::function<std::size_t(byte_io_stream&)>;
    using chunk_fn    = std::function<std::optional<std::string>()>;

    struct reader_ref {
        byte_io_stream* stream;
    };

    struct chunks {
        chunk_fn next;
    };

private:
    std::variant<std::string, reader_ref, producer_fn, writer_fn, chunks> _src;

    template <typename R>
    struct range_cursor {
        R                                         range;
        std::optional<std::ranges::iterator_t<R>> it{};

        std::optional<std::string> operator()() {
            if (not it) {
                it.emplace(std::ranges::begin(range));
            }
            if (*it == std::ranges::end(range)) {
                return std::nullopt;
            }
            std::string chunk{std::string_view(**it)};
            ++*it;
            return chunk;
        }
    };

    template <typename T>
    explicit byte_source(std::in_place_type_t<T>, auto&& arg)
        : _src(std::in_place_type<T>, NEO_FWD(arg)) {}

public:
    /// An empty fixed buffer
    byte_source() = default;

    /// Convert from an owned string of bytes
    byte_source(std::string bytes) noexcept
        : _src(std::move(bytes)) {}
    /// Copy from a view of bytes
    byte_source(std::string_view bytes)
        : _src(std::string(bytes)) {}
    /// Copy from a null-terminated string
    byte_source(const char* bytes)
        : _src(std::string(bytes)) {}

    [[nodiscard]] static byte_source from_bytes(std::string bytes) noexcept {
        return byte_source(std::move(bytes));
    }

    /**
     * @brief Read the given stream until end-of-stream.
     *
     * @note The stream is not owned, and must outlive the transfer.
     */
    [[nodiscard]] static byte_source from_reader(byte_io_stream& stream) noexcept {
        return byte_source(std::in_place_type<reader_ref>, reader_ref{&stream});
    }

    /// Call `fn` once, and write all of the bytes that it returns
    [[nodiscard]] static byte_source from_producer(producer_fn fn) {
        return byte_source(std::in_place_type<producer_fn>, std::move(fn));
    }

    /// Call `fn` with the writable end of the pipe. `fn` returns the number of bytes it wrote.
    [[nodiscard]] static byte_source from_writer(writer_fn fn) {
        return byte_source(std::in_place_type<writer_fn>, std::move(fn));
    }

    /// Call `fn` repeatedly, writing each chunk, until it returns nullopt
    [[nodiscard]] static byte_source from_chunks(chunk_fn fn) {
        return byte_source(std::in_place_type<chunks>, chunks{std::move(fn)});
    }

    /**
     * @brief Lazily iterate the given range, writing each element as a chunk.
     *
     * The range (or a copy of it) is held by the source, and is only iterated while the data is
     * being transferred.
     */
    template <std::ranges::input_range R>
    requires std::convertible_to<std::ranges::range_reference_t<R>, std::string_view>
    [[nodiscard]] static byte_source from_range(R&& r) {
        using range_type = std::remove_cvref_t<R>;
        auto cursor = std::make_shared<range_cursor<range_type>>(range_cursor<range_type>{NEO_FWD(r)});
        return from_chunks([cursor] { return (*cursor)(); });
    }

    /**
     * @brief The number of bytes that this source will produce, if that can be known up-front
     * without running anything.
     */
    [[nodiscard]] std::optional<std::size_t> known_size() const noexcept;

    /**
     * @brief Transfer all of the bytes of this source into the given stream.
     *
     * @return std::size_t The number of bytes that were written
     */
    std::size_t write_into(byte_io_stream& out);
};

}  // namespace plumb
