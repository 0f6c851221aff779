//
// Created by igor on 10/08/2025.
//

#pragma once

#include <array>
#include <cstdint>
#include <pngsynth/fourcc.hh>

namespace pngsynth {

    // Eight bytes every PNG stream starts with
    inline constexpr std::array<std::uint8_t, 8> png_signature{
        0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'
    };

    namespace chunk_id {
        inline constexpr fourcc IHDR('I', 'H', 'D', 'R');
        inline constexpr fourcc IDAT('I', 'D', 'A', 'T');
        inline constexpr fourcc IEND('I', 'E', 'N', 'D');
    }

    // IHDR payload: width, height, depth, color type, compression, filter, interlace
    inline constexpr std::uint32_t ihdr_size = 13;

    // CRC of the empty IEND chunk
    inline constexpr std::uint32_t iend_crc = 0xAE426082u;

} // namespace pngsynth
