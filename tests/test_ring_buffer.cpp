#include <catch2/catch_test_macros.hpp>

#include "ring_buffer.hpp"

#include <numeric>
#include <vector>

TEST_CASE("RingBuffer", "[ring_buffer]") {
    constexpr size_t cap = 256;
    RingBuffer rb(cap);

    SECTION("WriteAndRead") {
        std::vector<float> data(64);
        std::iota(data.begin(), data.end(), 0.0f);

        REQUIRE(rb.write(data) == 64);
        REQUIRE(rb.available() == 64);

        std::vector<float> out(64);
        REQUIRE(rb.read(out) == 64);
        REQUIRE(out == data);
    }

    SECTION("Wraparound") {
        std::vector<float> fill(200);
        std::iota(fill.begin(), fill.end(), 1.0f);
        REQUIRE(rb.write(fill) == 200);

        std::vector<float> sink(200);
        REQUIRE(rb.read(sink) == 200);
        REQUIRE(sink == fill);

        // write_pos and read_pos are both at 200; 128 samples wrap past 256.
        std::vector<float> wrap(128);
        std::iota(wrap.begin(), wrap.end(), -42.0f);
        REQUIRE(rb.write(wrap) == 128);

        std::vector<float> out(128);
        REQUIRE(rb.read(out) == 128);
        REQUIRE(out == wrap);
    }

    SECTION("ShortWriteWhenFull") {
        std::vector<float> big(cap + 100, 0.5f);

        size_t written = rb.write(big);
        REQUIRE(written == cap);
        REQUIRE(rb.available() == cap);
        REQUIRE(rb.full());

        std::vector<float> more(10, 0.1f);
        REQUIRE(rb.write(more) == 0);
    }

    SECTION("DrainAll") {
        std::vector<float> samples = {0.1f, -0.2f, 0.3f, -0.4f, 0.5f};
        REQUIRE(rb.write(samples) == samples.size());

        auto drained = rb.drain_all();
        REQUIRE(drained == samples);
        REQUIRE(rb.available() == 0);
    }

    SECTION("DrainAllEmpty") {
        REQUIRE(rb.drain_all().empty());
    }

    SECTION("EmptyRead") {
        std::vector<float> buf(16);
        REQUIRE(rb.read(buf) == 0);
    }

    SECTION("ResetClearsState") {
        std::vector<float> data(32, 1.0f);
        rb.write(data);
        REQUIRE(rb.available() == 32);

        rb.reset();
        REQUIRE(rb.available() == 0);
        REQUIRE_FALSE(rb.full());
    }

    SECTION("MultipleWriteRead") {
        for (int round = 0; round < 20; ++round) {
            std::vector<float> data(20, static_cast<float>(round));

            REQUIRE(rb.write(data) == 20);
            std::vector<float> out(20);
            REQUIRE(rb.read(out) == 20);
            REQUIRE(out == data);
        }
        REQUIRE(rb.available() == 0);
    }
}
