#include <doctest/doctest.h>
#include <pngsynth/byte_source.hh>
#include <pngsynth/exceptions.hh>

#include <algorithm>
#include <vector>

using namespace pngsynth;

TEST_CASE("zero_source yields exactly N zero bytes") {
    for (std::size_t pull : {std::size_t(1), std::size_t(7), std::size_t(64), std::size_t(1000)}) {
        CAPTURE(pull);
        zero_source src(1000);
        std::vector<unsigned char> buffer(pull, 0xCC);

        std::uint64_t total = 0;
        while (true) {
            std::fill(buffer.begin(), buffer.end(), 0xCC);
            std::size_t n = src.read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            CHECK(n <= pull);
            CHECK(std::all_of(buffer.begin(), buffer.begin() + n, [](unsigned char c) { return c == 0; }));
            // Bytes past the returned count are untouched
            CHECK(std::all_of(buffer.begin() + n, buffer.end(), [](unsigned char c) { return c == 0xCC; }));
            total += n;
        }

        CHECK(total == 1000);
        CHECK(src.produced() == 1000);
        CHECK(src.remaining() == 0);

        // Exhaustion is sticky
        for (int i = 0; i < 3; i++) {
            CHECK(src.read(buffer.data(), buffer.size()) == 0);
        }
        CHECK(src.produced() == 1000);
    }
}

TEST_CASE("zero_source edge cases") {
    SUBCASE("empty source") {
        zero_source src(0);
        char c = 'x';
        CHECK(src.read(&c, 1) == 0);
        CHECK(c == 'x');
        CHECK(src.remaining() == 0);
    }

    SUBCASE("short final pull") {
        zero_source src(10);
        char buffer[8];
        CHECK(src.read(buffer, 8) == 8);
        CHECK(src.read(buffer, 8) == 2);
        CHECK(src.read(buffer, 8) == 0);
    }

    SUBCASE("zero sized read") {
        zero_source src(10);
        CHECK(src.read(nullptr, 0) == 0);
        CHECK(src.remaining() == 10);
    }

    SUBCASE("null buffer") {
        zero_source src(10);
        CHECK_THROWS_AS(src.read(nullptr, 4), io_error);
    }

    SUBCASE("totals beyond 32 bits") {
        const std::uint64_t total = (std::uint64_t(1) << 33) + 5;
        zero_source src(total);
        CHECK(src.total() == total);
        CHECK(src.remaining() == total);
        char buffer[16];
        CHECK(src.read(buffer, sizeof(buffer)) == sizeof(buffer));
        CHECK(src.remaining() == total - sizeof(buffer));
    }
}
