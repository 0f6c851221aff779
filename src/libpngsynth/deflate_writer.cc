#include <pngsynth/deflate_writer.hh>
#include <pngsynth/exceptions.hh>

#include <algorithm>
#include <limits>
#include <zlib.h>

namespace pngsynth {

    static int to_zlib_strategy(deflate_strategy strategy) {
        switch (strategy) {
            case deflate_strategy::default_strategy:
                return Z_DEFAULT_STRATEGY;
            case deflate_strategy::filtered:
                return Z_FILTERED;
            case deflate_strategy::huffman_only:
                return Z_HUFFMAN_ONLY;
            case deflate_strategy::rle:
                return Z_RLE;
        }
        return Z_DEFAULT_STRATEGY;
    }

    static const char* zlib_message(const z_stream& zs) {
        return zs.msg ? zs.msg : "no message";
    }

    deflate_writer::deflate_writer(byte_sink& inner, const deflate_options& options)
        : m_inner(inner)
        , m_stream(std::make_unique<z_stream_s>())
        , m_total_in(0)
        , m_total_out(0)
        , m_finished(false) {
        THROW_CONFIG_IF(options.level < Z_DEFAULT_COMPRESSION || options.level > Z_BEST_COMPRESSION,
                        "Compression level ", options.level, " is outside of [-1, 9]");
        THROW_CONFIG_IF(options.buffer_size == 0, "Compression buffer size must not be zero");

        m_buffer.resize(std::min<std::size_t>(options.buffer_size, std::numeric_limits<uInt>::max()));

        m_stream->zalloc = Z_NULL;
        m_stream->zfree = Z_NULL;
        m_stream->opaque = Z_NULL;
        m_stream->next_in = Z_NULL;
        m_stream->avail_in = 0;

        int rc = deflateInit2(m_stream.get(), options.level, Z_DEFLATED, MAX_WBITS, 8,
                              to_zlib_strategy(options.strategy));
        if (rc != Z_OK) {
            std::string msg = zlib_message(*m_stream);
            m_stream.reset();
            THROW_COMPRESSION("deflateInit2 failed with code ", rc, ": ", msg);
        }
    }

    deflate_writer::~deflate_writer() {
        if (m_stream) {
            deflateEnd(m_stream.get());
        }
    }

    int deflate_writer::run(int flush_mode) {
        int rc;
        do {
            m_stream->next_out = m_buffer.data();
            m_stream->avail_out = static_cast<uInt>(m_buffer.size());

            rc = deflate(m_stream.get(), flush_mode);
            THROW_COMPRESSION_IF(rc == Z_STREAM_ERROR,
                                 "deflate failed with code ", rc, ": ", zlib_message(*m_stream));

            std::size_t produced = m_buffer.size() - m_stream->avail_out;
            if (produced > 0) {
                m_inner.write_all(m_buffer.data(), produced);
                m_total_out += produced;
            }
        } while (m_stream->avail_out == 0);
        return rc;
    }

    std::size_t deflate_writer::write(const void* src, std::size_t size) {
        THROW_COMPRESSION_IF(m_finished, "Write to finished deflate stream");
        if (size == 0) {
            return 0;
        }
        THROW_IO_UNLESS(src, "Null buffer in deflate write");

        const auto* p = static_cast<const Bytef*>(src);
        std::size_t left = size;
        while (left > 0) {
            auto n = static_cast<uInt>(std::min<std::size_t>(left, std::numeric_limits<uInt>::max()));
            m_stream->next_in = const_cast<Bytef*>(p);
            m_stream->avail_in = n;
            run(Z_NO_FLUSH);
            p += n;
            left -= n;
        }
        m_total_in += size;
        return size;
    }

    void deflate_writer::flush() {
        THROW_COMPRESSION_IF(m_finished, "Flush of finished deflate stream");
        m_stream->next_in = Z_NULL;
        m_stream->avail_in = 0;
        run(Z_SYNC_FLUSH);
        m_inner.flush();
    }

    byte_sink& deflate_writer::finish() {
        THROW_COMPRESSION_IF(m_finished, "Deflate stream finished twice");
        m_finished = true;

        m_stream->next_in = Z_NULL;
        m_stream->avail_in = 0;
        int rc = run(Z_FINISH);
        THROW_COMPRESSION_IF(rc != Z_STREAM_END,
                             "deflate did not reach end of stream, code ", rc, ": ", zlib_message(*m_stream));

        deflateEnd(m_stream.get());
        m_stream.reset();
        return m_inner;
    }

} // namespace pngsynth
