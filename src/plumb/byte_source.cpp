#include "./byte_source.hpp"

#include <neo/overload.hpp>

using namespace plumb;

std::optional<std::size_t> byte_source::known_size() const noexcept {
    if (auto str = std::get_if<std::string>(&_src)) {
        return str->size();
    }
    return std::nullopt;
}

std::size_t byte_source::write_into(byte_io_stream& out) {
    auto write_bytes = [&](std::string_view bytes) { return out.write_all(const_buffer(bytes)); };
    return std::visit(  //
        neo::overload{
            [&](const std::string& bytes) { return write_bytes(bytes); },
            [&](reader_ref r) {
                std::size_t total = 0;
                std::string buf;
                buf.resize(1024 * 64);
                while (auto nread = r.stream->read_into(buf)) {
                    total += write_bytes(std::string_view(buf).substr(0, nread));
                }
                return total;
            },
            [&](const producer_fn& fn) { return write_bytes(fn()); },
            [&](const writer_fn& fn) { return fn(out); },
            [&](const chunks& c) {
                std::size_t total = 0;
                while (auto chunk = c.next()) {
                    total += write_bytes(*chunk);
                }
                return total;
            },
        },
        _src);
}
