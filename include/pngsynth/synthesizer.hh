/**
 * @file synthesizer.hh
 * @brief Streams a complete PNG file onto a seekable sink
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <iosfwd>
#include <memory>
#include <filesystem>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/output.hh>
#include <pngsynth/byte_source.hh>
#include <pngsynth/image_header.hh>
#include <pngsynth/synth_options.hh>

namespace pngsynth {

    /**
     * @class image_synthesizer
     * @brief Writes signature, IHDR, IDAT and IEND in one pass
     * 
     * Runs the stages header, image_data, trailer and done strictly in
     * that order. The image data is never held in memory: scanlines are
     * pulled block by block, compressed and framed into deferred-length
     * IDAT chunks whose lengths are patched once they are complete.
     * 
     * Header and options are validated on construction, so invalid input
     * is rejected before anything is written.
     */
    class PNGSYNTH_EXPORT image_synthesizer {
    public:
        /**
         * @throws config_error if @p header or @p options is invalid
         */
        explicit image_synthesizer(const image_header& header, synth_options options = {});

        /**
         * @brief Synthesize an image whose scanlines are all zero
         * @param out Seekable sink positioned where the file starts
         * @return The sink, positioned after IEND
         */
        std::unique_ptr<writer_base> run(std::unique_ptr<writer_base> out);

        /**
         * @brief Synthesize an image from caller-provided scanlines
         * @param scanlines Source of filtered scanlines: for every row a
         *        filter type byte followed by the packed row, for
         *        header().raw_data_size() bytes in total
         * @throws io_error if @p scanlines runs dry early
         */
        std::unique_ptr<writer_base> run(std::unique_ptr<writer_base> out, byte_source& scanlines);

        [[nodiscard]] synth_stage stage() const { return m_stage; }
        [[nodiscard]] bool started() const { return m_started; }
        [[nodiscard]] const image_header& header() const { return m_header; }
        [[nodiscard]] const synth_options& options() const { return m_options; }

        // Number of IDAT chunks written by the last run
        [[nodiscard]] std::size_t data_chunks() const { return m_data_chunks; }

    private:
        void enter(synth_stage stage);

        std::unique_ptr<writer_base> write_header(std::unique_ptr<writer_base> out);
        std::unique_ptr<writer_base> write_image_data(std::unique_ptr<writer_base> out, byte_source& scanlines);
        std::unique_ptr<writer_base> write_trailer(std::unique_ptr<writer_base> out);

        image_header m_header;
        synth_options m_options;
        synth_stage m_stage;
        bool m_started;
        std::size_t m_data_chunks;
    };

    /**
     * @brief Synthesize a zero-filled image onto a seekable stream
     */
    PNGSYNTH_EXPORT void synthesize(std::ostream& os, const image_header& header, const synth_options& options = {});

    /**
     * @brief Synthesize a zero-filled image into a file
     * 
     * The file is only created once the header and options are validated.
     */
    PNGSYNTH_EXPORT void synthesize_file(const std::filesystem::path& path,
                                         const image_header& header,
                                         const synth_options& options = {});

} // namespace pngsynth
