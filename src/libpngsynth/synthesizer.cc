//
// Created by igor on 15/08/2025.
//

#include <pngsynth/synthesizer.hh>
#include <pngsynth/chunk_writer.hh>
#include <pngsynth/deflate_writer.hh>
#include <pngsynth/chunk_types.hh>
#include <pngsynth/exceptions.hh>
#include "idat_writer.hh"

#include <algorithm>
#include <ostream>
#include <utility>
#include <vector>

namespace pngsynth {

    image_synthesizer::image_synthesizer(const image_header& header, synth_options options)
        : m_header(header)
        , m_options(std::move(options))
        , m_stage(synth_stage::header)
        , m_started(false)
        , m_data_chunks(0) {
        m_header.validate();
        m_options.validate();
    }

    void image_synthesizer::enter(synth_stage stage) {
        m_stage = stage;
        if (m_options.on_stage) {
            m_options.on_stage(stage);
        }
    }

    std::unique_ptr<writer_base> image_synthesizer::run(std::unique_ptr<writer_base> out) {
        zero_source scanlines(m_header.raw_data_size());
        return run(std::move(out), scanlines);
    }

    std::unique_ptr<writer_base> image_synthesizer::run(std::unique_ptr<writer_base> out, byte_source& scanlines) {
        THROW_CONFIG_IF(m_started, "Image synthesizer can only run once");
        THROW_IO_UNLESS(out, "Cannot synthesize onto a null sink");
        m_started = true;

        out = write_header(std::move(out));
        out = write_image_data(std::move(out), scanlines);
        out = write_trailer(std::move(out));

        out->flush();
        enter(synth_stage::done);
        return out;
    }

    std::unique_ptr<writer_base> image_synthesizer::write_header(std::unique_ptr<writer_base> out) {
        enter(synth_stage::header);

        out->write_all(png_signature.data(), png_signature.size());

        auto ihdr = m_header.serialize();
        return write_chunk(std::move(out), chunk_id::IHDR, ihdr.data(), ihdr.size());
    }

    std::unique_ptr<writer_base> image_synthesizer::write_image_data(std::unique_ptr<writer_base> out,
                                                                     byte_source& scanlines) {
        enter(synth_stage::image_data);

        const std::uint64_t total = m_header.raw_data_size();
        const std::uint64_t scanline = m_header.scanline_bytes();

        idat_writer idat(std::move(out), chunk_id::IDAT, m_options.max_chunk_payload);
        deflate_writer compressor(idat, m_options.compression);

        std::vector<std::byte> block(static_cast<std::size_t>(std::min<std::uint64_t>(m_options.block_size, total)));
        std::uint64_t done = 0;
        while (done < total) {
            auto want = static_cast<std::size_t>(std::min<std::uint64_t>(block.size(), total - done));
            std::size_t got = scanlines.read(block.data(), want);
            THROW_IO_IF(got == 0, "Scanline source ran dry after ", done, " of ", total, " bytes");

            compressor.write_all(block.data(), got);
            done += got;

            if (m_options.on_progress) {
                m_options.on_progress(done, total, done / scanline);
            }
        }

        compressor.finish();
        m_data_chunks = idat.chunk_count();
        return idat.finish();
    }

    std::unique_ptr<writer_base> image_synthesizer::write_trailer(std::unique_ptr<writer_base> out) {
        enter(synth_stage::trailer);
        return write_chunk(std::move(out), chunk_id::IEND, nullptr, 0);
    }

    void synthesize(std::ostream& os, const image_header& header, const synth_options& options) {
        image_synthesizer synth(header, options);
        synth.run(std::make_unique<writer>(os));
    }

    void synthesize_file(const std::filesystem::path& path, const image_header& header, const synth_options& options) {
        image_synthesizer synth(header, options);
        synth.run(std::make_unique<file_writer>(path));
    }

} // namespace pngsynth
