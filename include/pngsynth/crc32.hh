/**
 * @file crc32.hh
 * @brief Running CRC-32 accumulator for chunk checksums
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/fourcc.hh>

namespace pngsynth {

    /**
     * @class crc32_accumulator
     * @brief Incremental CRC-32 (ISO 3309 / ITU-T V.42, as used by PNG and zlib)
     */
    class PNGSYNTH_EXPORT crc32_accumulator {
    public:
        crc32_accumulator();

        void update(const void* data, std::size_t size);
        void update(const fourcc& id) { update(id.data(), 4); }

        [[nodiscard]] std::uint32_t value() const { return m_value; }

        void reset();

        // One-shot helper
        static std::uint32_t compute(const void* data, std::size_t size);

    private:
        std::uint32_t m_value;
    };

} // namespace pngsynth
