#include "./io.hpp"

using namespace plumb;

std::string byte_io_stream::read() {
    std::string ret;
    ret.resize(1024 * 4);
    std::size_t filled = 0;
    // Short reads are normal for pipes. Only a zero-length read is the end.
    while (auto nread = read_into(ret.data() + filled, ret.size() - filled)) {
        filled += nread;
        if (filled == ret.size()) {
            ret.resize(ret.size() * 2);
        }
    }
    ret.resize(filled);
    return ret;
}

std::string byte_io_stream::read(std::size_t count) {
    std::string ret(count, '\0');
    ret.resize(read_into(ret));
    return ret;
}

std::size_t byte_io_stream::write_all(const_buffer data) {
    std::size_t total = 0;
    while (data.size() != 0) {
        auto n = do_write(data);
        if (n == 0) {
            break;
        }
        data = data + n;
        total += n;
    }
    return total;
}
