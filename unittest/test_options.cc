//
// Test option validation and warning callbacks
//

#include <doctest/doctest.h>
#include <pngsynth/synth_options.hh>
#include <pngsynth/synthesizer.hh>
#include <pngsynth/exceptions.hh>
#include <algorithm>
#include <functional>
#include <sstream>
#include <string>
#include <vector>

#include "test_utils.hh"

using namespace pngsynth;

// Helper to track warnings
struct warning_tracker {
    struct warning_info {
        std::uint64_t offset;
        std::string category;
        std::string message;
    };

    std::vector<warning_info> warnings;

    void operator()(std::uint64_t offset, std::string_view category, std::string_view message) {
        warnings.push_back({offset, std::string(category), std::string(message)});
    }

    bool has_warning(std::string_view category) const {
        return std::any_of(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; });
    }

    std::size_t count_category(std::string_view category) const {
        return static_cast<std::size_t>(std::count_if(warnings.begin(), warnings.end(),
            [category](const warning_info& w) { return w.category == category; }));
    }
};

TEST_CASE("Default options are valid") {
    synth_options opts;
    CHECK(opts.strict);
    CHECK(opts.block_size == 64 * 1024);
    CHECK(opts.max_chunk_payload == max_chunk_length);
    CHECK(opts.compression.strategy == deflate_strategy::rle);
    CHECK_NOTHROW(opts.validate());
}

TEST_CASE("Strict mode rejects bad options") {
    SUBCASE("block size") {
        synth_options opts;
        opts.block_size = 0;
        CHECK_THROWS_AS(opts.validate(), config_error);
    }

    SUBCASE("oversized block") {
        synth_options opts;
        opts.block_size = max_block_size + 1;
        CHECK_THROWS_AS(opts.validate(), config_error);
        opts.block_size = max_block_size;
        CHECK_NOTHROW(opts.validate());
    }

    SUBCASE("chunk limit") {
        synth_options opts;
        opts.max_chunk_payload = 0;
        CHECK_THROWS_AS(opts.validate(), config_error);
        opts.max_chunk_payload = std::uint64_t(max_chunk_length) + 1;
        CHECK_THROWS_AS(opts.validate(), config_error);
    }

    SUBCASE("compression level") {
        synth_options opts;
        opts.compression.level = 12;
        CHECK_THROWS_AS(opts.validate(), config_error);
        opts.compression.level = -2;
        CHECK_THROWS_AS(opts.validate(), config_error);
    }

    SUBCASE("compression buffer") {
        synth_options opts;
        opts.compression.buffer_size = 0;
        CHECK_THROWS_AS(opts.validate(), config_error);
    }

    SUBCASE("nothing is written") {
        synth_options opts;
        opts.block_size = 0;
        image_header hdr;
        hdr.width = 4;
        hdr.height = 4;

        std::stringstream ss(std::ios::in | std::ios::out | std::ios::binary);
        CHECK_THROWS_AS(synthesize(ss, hdr, opts), config_error);
        CHECK(ss.str().empty());
    }
}

TEST_CASE("Warning callbacks - lenient mode") {
    warning_tracker tracker;
    synth_options opts;
    opts.strict = false;
    opts.on_warning = std::ref(tracker);

    SUBCASE("block_size") {
        opts.block_size = 0;
        CHECK_NOTHROW(opts.validate());
        CHECK(opts.block_size == 64 * 1024);
        CHECK(tracker.count_category("block_size") == 1);
    }

    SUBCASE("block_size cap") {
        opts.block_size = max_block_size * 16;
        CHECK_NOTHROW(opts.validate());
        CHECK(opts.block_size == max_block_size);
        REQUIRE(tracker.count_category("block_size") == 1);
        CHECK(tracker.warnings[0].message.find("capped") != std::string::npos);
    }

    SUBCASE("chunk_limit") {
        opts.max_chunk_payload = std::uint64_t(1) << 40;
        CHECK_NOTHROW(opts.validate());
        CHECK(opts.max_chunk_payload == max_chunk_length);
        CHECK(tracker.has_warning("chunk_limit"));
    }

    SUBCASE("compression_level") {
        opts.compression.level = 42;
        CHECK_NOTHROW(opts.validate());
        CHECK(opts.compression.level == 9);
        REQUIRE(tracker.count_category("compression_level") == 1);
        CHECK(tracker.warnings[0].message.find("42") != std::string::npos);
    }

    SUBCASE("buffer_size") {
        opts.compression.buffer_size = 0;
        CHECK_NOTHROW(opts.validate());
        CHECK(opts.compression.buffer_size > 0);
        CHECK(tracker.has_warning("buffer_size"));
    }

    SUBCASE("everything at once") {
        opts.block_size = 0;
        opts.max_chunk_payload = 0;
        opts.compression.level = -5;
        opts.compression.buffer_size = 0;
        CHECK_NOTHROW(opts.validate());
        CHECK(tracker.warnings.size() == 4);
        CHECK(opts.compression.level == -1);
        for (const auto& w : tracker.warnings) {
            CHECK(w.offset == 0);
        }
    }

    SUBCASE("valid options stay silent") {
        CHECK_NOTHROW(opts.validate());
        CHECK(tracker.warnings.empty());
    }
}

TEST_CASE("Warning callbacks - no handler installed") {
    synth_options opts;
    opts.strict = false;
    opts.block_size = 0;
    CHECK_NOTHROW(opts.validate());
    CHECK(opts.block_size == 64 * 1024);
}

TEST_CASE("Lenient options still produce a valid image") {
    warning_tracker tracker;
    synth_options opts;
    opts.strict = false;
    opts.on_warning = std::ref(tracker);
    opts.block_size = 0;
    opts.compression.level = 99;

    image_header hdr;
    hdr.width = 16;
    hdr.height = 16;
    hdr.bit_depth = 8;

    std::stringstream ss(std::ios::in | std::ios::out | std::ios::binary);
    synthesize(ss, hdr, opts);

    CHECK(tracker.warnings.size() == 2);
    auto chunks = parse_chunks(ss.str(), 8);
    REQUIRE(chunks.size() == 3);
    CHECK(inflate_all(concat_payloads(chunks, "IDAT")) == std::string(16 * 17, '\0'));
}

TEST_CASE("Stage names") {
    CHECK(std::string(to_string(synth_stage::header)) == "header");
    CHECK(std::string(to_string(synth_stage::image_data)) == "image data");
    CHECK(std::string(to_string(synth_stage::trailer)) == "trailer");
    CHECK(std::string(to_string(synth_stage::done)) == "done");
}

TEST_CASE("Synthesizer keeps the validated block size") {
    warning_tracker tracker;
    synth_options opts;
    opts.strict = false;
    opts.on_warning = std::ref(tracker);
    opts.block_size = max_block_size * 4;

    image_header hdr;
    hdr.width = 8;
    hdr.height = 8;
    image_synthesizer synth(hdr, opts);
    CHECK(synth.options().block_size == max_block_size);
    CHECK(tracker.has_warning("block_size"));

    opts.strict = true;
    CHECK_THROWS_AS(image_synthesizer(hdr, opts), config_error);
}
