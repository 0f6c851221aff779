/**
 * @file chunk_writer.hh
 * @brief Streaming writer for length-prefixed, CRC-protected chunks
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/output.hh>
#include <pngsynth/crc32.hh>
#include <pngsynth/fourcc.hh>

namespace pngsynth {

    /**
     * @brief Largest value a chunk length field may hold (2^31 - 1)
     */
    inline constexpr std::uint64_t max_chunk_length = 0x7FFFFFFFu;

    /**
     * @brief Size of the length and type fields that precede the payload
     */
    inline constexpr std::uint64_t chunk_header_size = 8;

    /**
     * @enum length_mode
     * @brief How the length field of a chunk is produced
     */
    enum class length_mode {
        known,    ///< Declared before the first payload byte, written immediately
        deferred  ///< Unknown until finish, patched into a placeholder
    };

    /**
     * @struct chunk_length
     * @brief Declared length of a chunk
     */
    struct chunk_length {
        length_mode mode = length_mode::deferred;
        std::uint32_t value = 0;

        static constexpr chunk_length known(std::uint32_t n) {
            return {length_mode::known, n};
        }

        static constexpr chunk_length deferred() {
            return {length_mode::deferred, 0};
        }

        [[nodiscard]] constexpr bool is_known() const { return mode == length_mode::known; }
    };

    /**
     * @class chunk_writer
     * @brief One open chunk on an exclusively owned seekable sink
     * 
     * Layout produced: [length BE32][type][payload][CRC BE32]. The CRC
     * covers type and payload, never the length field.
     * 
     * The writer owns the sink from begin() until finish() hands it back.
     * A writer that is destroyed without finish() leaves the sink with an
     * unpatched length and no CRC.
     * 
     * @code
     * auto chunk = chunk_writer::begin(std::move(out), "IDAT"_4cc, chunk_length::deferred());
     * chunk.write_all(data, size);
     * out = std::move(chunk).finish();
     * @endcode
     */
    class PNGSYNTH_EXPORT chunk_writer : public byte_sink {
    public:
        /**
         * @brief Open a chunk at the current sink position
         * @param out Sink to write to; ownership passes to the chunk
         * @param type Chunk type tag
         * @param length Known length, or deferred
         * @return The open chunk
         * @throws io_error if the sink is null or the header cannot be written
         */
        [[nodiscard]] static chunk_writer begin(std::unique_ptr<writer_base> out, fourcc type, chunk_length length);

        chunk_writer(chunk_writer&& other) noexcept;
        chunk_writer& operator = (chunk_writer&& other) noexcept;

        chunk_writer(const chunk_writer&) = delete;
        chunk_writer& operator = (const chunk_writer&) = delete;

        ~chunk_writer() override;

        /**
         * @brief Write payload bytes and fold them into the CRC
         * @return Number of bytes written
         * @throws io_error if the chunk is already finished or the write fails
         */
        std::size_t write(const void* src, std::size_t size) override;

        void flush() override;

        /**
         * @brief Close the chunk and return the sink
         * 
         * Known chunks verify the payload size and throw
         * length_mismatch_error without writing a CRC on mismatch. Deferred
         * chunks seek back, patch the length and seek forward again. The
         * CRC is written last.
         */
        [[nodiscard]] std::unique_ptr<writer_base> finish() &&;

        [[nodiscard]] fourcc type() const { return m_type; }
        [[nodiscard]] chunk_length length() const { return m_length; }
        [[nodiscard]] std::uint64_t start_offset() const { return m_start; }
        [[nodiscard]] bool is_finished() const { return m_finished; }

        // Payload bytes written so far, from the sink position
        [[nodiscard]] std::uint64_t payload_size() const;

        // CRC of type and payload written so far
        [[nodiscard]] std::uint32_t checksum() const { return m_crc.value(); }

    private:
        chunk_writer(std::unique_ptr<writer_base> out, fourcc type, chunk_length length, std::uint64_t start);

        std::unique_ptr<writer_base> m_out;
        fourcc m_type;
        chunk_length m_length;
        std::uint64_t m_start;
        crc32_accumulator m_crc;
        bool m_finished;
    };

    /**
     * @brief Write a complete chunk whose payload is already in memory
     * @return The sink, positioned after the chunk
     */
    PNGSYNTH_EXPORT std::unique_ptr<writer_base> write_chunk(std::unique_ptr<writer_base> out,
                                                             fourcc type,
                                                             const void* data,
                                                             std::size_t size);

} // namespace pngsynth
