//
// Created by igor on 15/08/2025.
//

#include "idat_writer.hh"
#include <pngsynth/exceptions.hh>
#include <algorithm>

namespace pngsynth {

    idat_writer::idat_writer(std::unique_ptr<writer_base> out, fourcc type, std::uint64_t max_payload)
        : m_type(type)
        , m_max_payload(max_payload)
        , m_in_chunk(0)
        , m_chunks(1) {
        THROW_CONFIG_IF(max_payload == 0 || max_payload > max_chunk_length,
                        "Maximum chunk payload ", max_payload, " is outside of [1, ", max_chunk_length, "]");
        m_chunk.emplace(chunk_writer::begin(std::move(out), m_type, chunk_length::deferred()));
    }

    std::size_t idat_writer::write(const void* src, std::size_t size) {
        THROW_IO_UNLESS(m_chunk, "Write to finished ", m_type, " stream");

        const auto* p = static_cast<const unsigned char*>(src);
        std::size_t left = size;
        while (left > 0) {
            if (m_in_chunk == m_max_payload) {
                roll();
            }
            auto n = static_cast<std::size_t>(std::min<std::uint64_t>(left, m_max_payload - m_in_chunk));
            std::size_t actual = m_chunk->write(p, n);
            THROW_IO_IF(actual == 0, "Chunk ", m_type, " accepted no data");
            m_in_chunk += actual;
            p += actual;
            left -= actual;
        }
        return size;
    }

    void idat_writer::flush() {
        THROW_IO_UNLESS(m_chunk, "Flush of finished ", m_type, " stream");
        m_chunk->flush();
    }

    void idat_writer::roll() {
        auto out = std::move(*m_chunk).finish();
        m_chunk.reset();
        m_chunk.emplace(chunk_writer::begin(std::move(out), m_type, chunk_length::deferred()));
        m_in_chunk = 0;
        m_chunks++;
    }

    std::unique_ptr<writer_base> idat_writer::finish() {
        THROW_IO_UNLESS(m_chunk, "Stream of ", m_type, " chunks finished twice");
        auto out = std::move(*m_chunk).finish();
        m_chunk.reset();
        return out;
    }

} // namespace pngsynth
