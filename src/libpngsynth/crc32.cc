#include <pngsynth/crc32.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngsynth {

    crc32_accumulator::crc32_accumulator()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {
    }

    void crc32_accumulator::update(const void* data, std::size_t size) {
        // zlib takes uInt lengths
        const auto* p = static_cast<const Bytef*>(data);
        uLong crc = m_value;
        while (size > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(size, std::numeric_limits<uInt>::max()));
            crc = ::crc32(crc, p, n);
            p += n;
            size -= n;
        }
        m_value = static_cast<std::uint32_t>(crc);
    }

    void crc32_accumulator::reset() {
        m_value = static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0));
    }

    std::uint32_t crc32_accumulator::compute(const void* data, std::size_t size) {
        crc32_accumulator c;
        c.update(data, size);
        return c.value();
    }

} // namespace pngsynth
