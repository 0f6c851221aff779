//
// Created by igor on 14/08/2025.
//

#include <pngsynth/image_header.hh>
#include <pngsynth/chunk_writer.hh>
#include <pngsynth/exceptions.hh>
#include <pngsynth/endian.hh>

#include <algorithm>
#include <cctype>
#include <limits>

namespace pngsynth {

    std::ostream& operator<<(std::ostream& os, color_type ct) {
        switch (ct) {
            case color_type::grayscale:
                return os << "grayscale";
            case color_type::rgb:
                return os << "rgb";
            case color_type::indexed:
                return os << "indexed";
            case color_type::grayscale_alpha:
                return os << "grayscale+alpha";
            case color_type::rgba:
                return os << "rgba";
        }
        return os << "color type " << static_cast<unsigned>(ct);
    }

    color_type parse_color_type(const std::string& name) {
        std::string s = name;
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (s == "gray" || s == "grey" || s == "grayscale" || s == "l") {
            return color_type::grayscale;
        }
        if (s == "rgb") {
            return color_type::rgb;
        }
        if (s == "indexed" || s == "palette") {
            return color_type::indexed;
        }
        if (s == "gray-alpha" || s == "grayscale+alpha" || s == "grayscale_alpha" || s == "la") {
            return color_type::grayscale_alpha;
        }
        if (s == "rgba") {
            return color_type::rgba;
        }
        THROW_CONFIG("Unknown color type '", name, "'");
    }

    unsigned channels(color_type ct) {
        switch (ct) {
            case color_type::grayscale:
            case color_type::indexed:
                return 1;
            case color_type::grayscale_alpha:
                return 2;
            case color_type::rgb:
                return 3;
            case color_type::rgba:
                return 4;
        }
        THROW_CONFIG("Invalid color type ", static_cast<unsigned>(ct));
    }

    std::uint64_t packed_row_bytes(std::uint32_t width, unsigned bit_depth, unsigned channels) {
        std::uint64_t bits = std::uint64_t(width) * bit_depth * channels;
        return (bits + 7) / 8;
    }

    static bool depth_allowed(color_type ct, unsigned depth) {
        switch (ct) {
            case color_type::grayscale:
                return depth == 1 || depth == 2 || depth == 4 || depth == 8 || depth == 16;
            case color_type::indexed:
                return depth == 1 || depth == 2 || depth == 4 || depth == 8;
            case color_type::rgb:
            case color_type::grayscale_alpha:
            case color_type::rgba:
                return depth == 8 || depth == 16;
        }
        return false;
    }

    void image_header::validate() const {
        THROW_CONFIG_IF(width == 0 || width > max_chunk_length,
                        "Image width ", width, " is outside of [1, ", max_chunk_length, "]");
        THROW_CONFIG_IF(height == 0 || height > max_chunk_length,
                        "Image height ", height, " is outside of [1, ", max_chunk_length, "]");

        // channels() rejects codes outside the enum
        channels(color);

        THROW_CONFIG_IF(color == color_type::indexed,
                        "Indexed color needs a palette (PLTE chunk), which is not supported");
        THROW_CONFIG_UNLESS(depth_allowed(color, bit_depth),
                            "Bit depth ", static_cast<unsigned>(bit_depth), " is not allowed for ", color);

        THROW_CONFIG_IF(height > std::numeric_limits<std::uint64_t>::max() / scanline_bytes(),
                        "Image of ", width, "x", height, " does not fit in 64-bit size arithmetic");
    }

    std::uint64_t image_header::row_bytes() const {
        return packed_row_bytes(width, bit_depth, channels(color));
    }

    std::array<std::uint8_t, ihdr_size> image_header::serialize() const {
        std::array<std::uint8_t, ihdr_size> out{};
        store_be32(out.data(), width);
        store_be32(out.data() + 4, height);
        out[8] = bit_depth;
        out[9] = static_cast<std::uint8_t>(color);
        out[10] = 0;  // compression method: deflate
        out[11] = 0;  // filter method: adaptive, per-row type byte
        out[12] = 0;  // interlace method: none
        return out;
    }

} // namespace pngsynth
