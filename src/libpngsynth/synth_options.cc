//
// Created by igor on 14/08/2025.
//

#include <pngsynth/synth_options.hh>
#include <pngsynth/exceptions.hh>
#include <algorithm>
#include <string>

namespace pngsynth {

    static constexpr std::size_t default_block_size = 64 * 1024;
    static constexpr std::size_t default_buffer_size = 64 * 1024;

    const char* to_string(synth_stage stage) {
        switch (stage) {
            case synth_stage::header:
                return "header";
            case synth_stage::image_data:
                return "image data";
            case synth_stage::trailer:
                return "trailer";
            case synth_stage::done:
                return "done";
        }
        return "unknown";
    }

    void synth_options::validate() {
        auto warn = [this](std::string_view category, const std::string& message) {
            if (on_warning) {
                on_warning(0, category, message);
            }
        };

        if (block_size == 0) {
            THROW_CONFIG_IF(strict, "Block size must not be zero");
            warn("block_size", "Block size 0 replaced by " + std::to_string(default_block_size));
            block_size = default_block_size;
        } else if (block_size > max_block_size) {
            THROW_CONFIG_IF(strict, "Block size ", block_size, " exceeds maximum of ", max_block_size);
            warn("block_size", "Block size " + std::to_string(block_size) +
                               " capped to " + std::to_string(max_block_size));
            block_size = max_block_size;
        }

        if (max_chunk_payload == 0 || max_chunk_payload > max_chunk_length) {
            THROW_CONFIG_IF(strict, "Maximum chunk payload ", max_chunk_payload,
                            " is outside of [1, ", max_chunk_length, "]");
            warn("chunk_limit", "Maximum chunk payload " + std::to_string(max_chunk_payload) +
                                " replaced by " + std::to_string(max_chunk_length));
            max_chunk_payload = max_chunk_length;
        }

        if (compression.level < -1 || compression.level > 9) {
            THROW_CONFIG_IF(strict, "Compression level ", compression.level, " is outside of [-1, 9]");
            int clamped = std::clamp(compression.level, -1, 9);
            warn("compression_level", "Compression level " + std::to_string(compression.level) +
                                      " clamped to " + std::to_string(clamped));
            compression.level = clamped;
        }

        if (compression.buffer_size == 0) {
            THROW_CONFIG_IF(strict, "Compression buffer size must not be zero");
            warn("buffer_size", "Compression buffer size 0 replaced by " + std::to_string(default_buffer_size));
            compression.buffer_size = default_buffer_size;
        }
    }

} // namespace pngsynth
