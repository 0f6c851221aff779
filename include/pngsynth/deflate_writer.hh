/**
 * @file deflate_writer.hh
 * @brief zlib stream compressor layered over a byte_sink
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/output.hh>

struct z_stream_s;

namespace pngsynth {

    /**
     * @enum deflate_strategy
     * @brief Match-finding strategy handed to zlib
     */
    enum class deflate_strategy {
        default_strategy,
        filtered,
        huffman_only,
        rle  ///< Run-length matches only; fast and effective on flat images
    };

    /**
     * @struct deflate_options
     * @brief Tuning for deflate_writer
     */
    struct deflate_options {
        /**
         * @brief zlib compression level, -1 (zlib default) or 0..9
         */
        int level = 6;

        deflate_strategy strategy = deflate_strategy::rle;

        /**
         * @brief Size of the compressed output buffer
         * 
         * Compressed bytes are forwarded to the inner sink each time this
         * buffer fills.
         */
        std::size_t buffer_size = 64 * 1024;
    };

    /**
     * @class deflate_writer
     * @brief Compresses everything written to it into a zlib stream
     * 
     * Output is forwarded to a borrowed inner sink as it becomes ready.
     * finish() must be called to emit the end of the stream; the inner
     * sink has to outlive the writer.
     */
    class PNGSYNTH_EXPORT deflate_writer : public byte_sink {
    public:
        explicit deflate_writer(byte_sink& inner, const deflate_options& options = {});
        ~deflate_writer() override;

        deflate_writer(const deflate_writer&) = delete;
        deflate_writer& operator = (const deflate_writer&) = delete;

        std::size_t write(const void* src, std::size_t size) override;

        // Sync flush: everything written so far becomes decodable
        void flush() override;

        /**
         * @brief Flush the remaining compressed data and end the stream
         * @return The inner sink
         */
        byte_sink& finish();

        [[nodiscard]] std::uint64_t total_in() const { return m_total_in; }
        [[nodiscard]] std::uint64_t total_out() const { return m_total_out; }
        [[nodiscard]] bool is_finished() const { return m_finished; }

    private:
        int run(int flush_mode);

        byte_sink& m_inner;
        std::unique_ptr<z_stream_s> m_stream;
        std::vector<unsigned char> m_buffer;
        std::uint64_t m_total_in;
        std::uint64_t m_total_out;
        bool m_finished;
    };

} // namespace pngsynth
