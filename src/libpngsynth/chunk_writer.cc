//
// Created by igor on 14/08/2025.
//

#include <pngsynth/chunk_writer.hh>
#include <pngsynth/exceptions.hh>
#include <utility>

namespace pngsynth {

    chunk_writer chunk_writer::begin(std::unique_ptr<writer_base> out, fourcc type, chunk_length length) {
        THROW_IO_UNLESS(out, "Cannot begin chunk ", type, " on a null sink");
        THROW_LENGTH_IF(length.is_known() && length.value > max_chunk_length,
                        "Chunk ", type, " declared length ", length.value,
                        " exceeds maximum chunk length of ", max_chunk_length);

        // Position of the length field, needed to patch deferred chunks
        std::uint64_t start = out->tell();

        // Length is not part of the CRC
        out->write_value<std::uint32_t>(length.is_known() ? length.value : 0, byte_order::big);
        out->write_fourcc(type);

        return chunk_writer(std::move(out), type, length, start);
    }

    chunk_writer::chunk_writer(std::unique_ptr<writer_base> out, fourcc type, chunk_length length, std::uint64_t start)
        : m_out(std::move(out))
        , m_type(type)
        , m_length(length)
        , m_start(start)
        , m_crc()
        , m_finished(false) {
        m_crc.update(m_type);
    }

    chunk_writer::chunk_writer(chunk_writer&& other) noexcept
        : m_out(std::move(other.m_out))
        , m_type(other.m_type)
        , m_length(other.m_length)
        , m_start(other.m_start)
        , m_crc(other.m_crc)
        , m_finished(other.m_finished) {
        other.m_finished = true;
    }

    chunk_writer& chunk_writer::operator = (chunk_writer&& other) noexcept {
        if (this != &other) {
            m_out = std::move(other.m_out);
            m_type = other.m_type;
            m_length = other.m_length;
            m_start = other.m_start;
            m_crc = other.m_crc;
            m_finished = other.m_finished;
            other.m_finished = true;
        }
        return *this;
    }

    chunk_writer::~chunk_writer() = default;

    std::size_t chunk_writer::write(const void* src, std::size_t size) {
        THROW_IO_IF(m_finished || !m_out, "Write to finished chunk ", m_type);

        std::size_t actual = m_out->write(src, size);
        m_crc.update(src, actual);
        return actual;
    }

    void chunk_writer::flush() {
        THROW_IO_IF(m_finished || !m_out, "Flush of finished chunk ", m_type);
        m_out->flush();
    }

    std::uint64_t chunk_writer::payload_size() const {
        THROW_IO_IF(m_finished || !m_out, "Chunk ", m_type, " is finished");
        return m_out->tell() - m_start - chunk_header_size;
    }

    std::unique_ptr<writer_base> chunk_writer::finish() && {
        THROW_IO_IF(m_finished || !m_out, "Chunk ", m_type, " finished twice");
        m_finished = true;

        std::uint64_t end = m_out->tell();
        std::uint64_t written = end - m_start - chunk_header_size;

        if (m_length.is_known()) {
            THROW_LENGTH_IF(written != m_length.value,
                            "Chunk ", m_type, " at offset ", m_start, ": wrote ", written,
                            " bytes, but expected ", m_length.value);
        } else {
            THROW_LENGTH_IF(written > max_chunk_length,
                            "Chunk ", m_type, " at offset ", m_start, ": payload of ", written,
                            " bytes exceeds maximum chunk length of ", max_chunk_length);

            m_out->seek(m_start, writer_base::set);
            m_out->write_value(static_cast<std::uint32_t>(written), byte_order::big);
            m_out->seek(end, writer_base::set);
        }

        m_out->write_value(m_crc.value(), byte_order::big);
        return std::move(m_out);
    }

    std::unique_ptr<writer_base> write_chunk(std::unique_ptr<writer_base> out,
                                             fourcc type,
                                             const void* data,
                                             std::size_t size) {
        THROW_LENGTH_IF(size > max_chunk_length,
                        "Chunk ", type, " payload of ", size, " bytes exceeds maximum chunk length");
        auto chunk = chunk_writer::begin(std::move(out), type, chunk_length::known(static_cast<std::uint32_t>(size)));
        chunk.write_all(data, size);
        return std::move(chunk).finish();
    }

} // namespace pngsynth
