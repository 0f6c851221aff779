//
// Created by igor on 14/08/2025.
//

#include <pngsynth/byte_source.hh>
#include <pngsynth/exceptions.hh>
#include <algorithm>
#include <cstring>

namespace pngsynth {

    zero_source::zero_source(std::uint64_t total)
        : m_total(total)
        , m_produced(0) {
    }

    std::size_t zero_source::read(void* dst, std::size_t size) {
        if (size == 0) {
            return 0;
        }
        THROW_IO_UNLESS(dst, "Null buffer in zero_source::read");

        std::uint64_t available = remaining();
        if (available == 0) {
            return 0;
        }

        auto n = static_cast<std::size_t>(std::min<std::uint64_t>(size, available));
        std::memset(dst, 0, n);
        m_produced += n;
        return n;
    }

    std::uint64_t zero_source::remaining() const {
        return m_total - m_produced;
    }

} // namespace pngsynth
