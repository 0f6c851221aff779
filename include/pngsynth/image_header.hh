/**
 * @file image_header.hh
 * @brief Image parameters that go into the IHDR chunk
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <ostream>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/chunk_types.hh>

namespace pngsynth {

    /**
     * @enum color_type
     * @brief PNG color type codes
     */
    enum class color_type : std::uint8_t {
        grayscale = 0,
        rgb = 2,
        indexed = 3,
        grayscale_alpha = 4,
        rgba = 6
    };

    PNGSYNTH_EXPORT std::ostream& operator<<(std::ostream& os, color_type ct);

    /**
     * @brief Parse a color type name ("gray", "rgb", "gray-alpha", "rgba", ...)
     * @throws config_error for unknown names
     */
    PNGSYNTH_EXPORT color_type parse_color_type(const std::string& name);

    /**
     * @brief Number of samples per pixel for @p ct
     */
    PNGSYNTH_EXPORT unsigned channels(color_type ct);

    /**
     * @brief Bytes in one packed row, excluding the filter byte
     * 
     * Samples narrower than a byte are packed, and the row is padded up to
     * a whole byte.
     */
    PNGSYNTH_EXPORT std::uint64_t packed_row_bytes(std::uint32_t width, unsigned bit_depth, unsigned channels);

    /**
     * @struct image_header
     * @brief Geometry and sample format of the synthesized image
     */
    struct PNGSYNTH_EXPORT image_header {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::uint8_t bit_depth = 8;
        color_type color = color_type::grayscale;

        /**
         * @brief Throw config_error unless the header describes a
         *        non-interlaced image this library can produce
         */
        void validate() const;

        [[nodiscard]] std::uint64_t row_bytes() const;

        // One filter byte plus the packed row
        [[nodiscard]] std::uint64_t scanline_bytes() const { return row_bytes() + 1; }

        // All filtered scanlines of the image
        [[nodiscard]] std::uint64_t raw_data_size() const { return scanline_bytes() * height; }

        /**
         * @brief IHDR payload
         * 
         * Compression, filter and interlace method are always 0.
         */
        [[nodiscard]] std::array<std::uint8_t, ihdr_size> serialize() const;
    };

} // namespace pngsynth
