#include "./pipe.hpp"

#include <catch2/catch.hpp>

#include <ranges>

TEST_CASE("Create a pipe") {
    plumb::pipe p;
    p.writer().write(std::string_view("I am a string"));
    auto b = p.reader().read(388);
    CHECK(b == "I am a string");

    p.writer().write(std::string_view("foobar"));
    b = p.reader().read(3);
    CHECK(b == "foo");
    b = p.reader().read(3);
    CHECK(b == "bar");

    CHECK(p.readable());
    CHECK(p.writable());
    p.close();
    CHECK_FALSE(p.readable());
    CHECK_FALSE(p.writable());
}

TEST_CASE("One-shot pipe transfers") {
    plumb::pipe p;
    CHECK(p.capacity() >= 4096);

    SECTION("Fixed bytes") {
        CHECK(p.write("hello") == 5);
        CHECK_FALSE(p.writable());
        CHECK(p.read() == "hello");
        CHECK_FALSE(p.readable());
    }

    SECTION("From another stream") {
        plumb::pipe src;
        src.write("123");
        CHECK(p.write(plumb::byte_source::from_reader(src.reader())) == 3);
        CHECK(p.read() == "123");
    }

    SECTION("From a producer") {
        CHECK(p.write(plumb::byte_source::from_producer([] { return std::string("123"); })) == 3);
        CHECK(p.read() == "123");
    }

    SECTION("From a writer callback") {
        auto n = p.write(plumb::byte_source::from_writer([](plumb::byte_io_stream& out) {
            return out.write_all(plumb::const_buffer(std::string_view("123")));
        }));
        CHECK(n == 3);
        CHECK(p.read() == "123");
    }

    SECTION("From a lazy range") {
        auto digits = std::views::iota(1, 4)
            | std::views::transform([](int i) { return std::to_string(i); });
        CHECK(p.write(plumb::byte_source::from_range(digits)) == 3);
        CHECK(p.read() == "123");
    }
}

TEST_CASE("Streaming input pipe carries more than a pipe-full") {
    const std::string payload(12'345'678, 'X');
    plumb::streaming_input_pipe p{payload};
    auto                        got = p.reader().read();
    CHECK(p.wait() == payload.size());
    CHECK(got.size() == payload.size());
    CHECK(got == payload);
    CHECK(p.is_waited());
}

TEST_CASE("Streaming input pipe pulls chunks lazily") {
    int  pulled = 0;
    auto source = plumb::byte_source::from_chunks([&]() -> std::optional<std::string> {
        if (pulled == 1000) {
            return std::nullopt;
        }
        ++pulled;
        return std::string(1024, 'a');
    });
    plumb::streaming_input_pipe p{std::move(source)};
    auto                        got = p.reader().read();
    CHECK(p.wait() == 1024 * 1000);
    CHECK(got.size() == 1024 * 1000);
    CHECK(pulled == 1000);
}

TEST_CASE("Streaming input pipe stops when the reader goes away") {
    plumb::streaming_input_pipe p{std::string(1024 * 1024 * 4, 'z')};
    auto                        first = p.reader().read(16);
    CHECK(first == std::string(16, 'z'));
    p.close_local();
    auto n = p.wait();
    CHECK(n >= 16);
    CHECK(n < 1024 * 1024 * 4);
}

TEST_CASE("Closing the local end of an output pipe") {
    plumb::streaming_output_pipe p;
    CHECK(p.child_end().writable());
    p.writer().write(std::string_view("data"));
    p.close_local();
    CHECK_FALSE(p.writable());
    // Closing twice is fine
    p.close_local();
    CHECK(p.read() == "data");
}
