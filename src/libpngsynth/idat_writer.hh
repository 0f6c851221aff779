//
// Created by igor on 15/08/2025.
//

#pragma once

#include <pngsynth/chunk_writer.hh>
#include <memory>
#include <optional>

namespace pngsynth {

    // Sink that spreads a byte stream over consecutive deferred-length
    // chunks of one type, starting a new chunk whenever the current one
    // holds max_payload bytes. The first chunk is opened immediately, so
    // an empty stream still produces one (empty) chunk.
    class idat_writer : public byte_sink {
    public:
        idat_writer(std::unique_ptr<writer_base> out, fourcc type, std::uint64_t max_payload);

        std::size_t write(const void* src, std::size_t size) override;
        void flush() override;

        // Finish the open chunk and return the sink
        [[nodiscard]] std::unique_ptr<writer_base> finish();

        [[nodiscard]] std::size_t chunk_count() const { return m_chunks; }

    private:
        void roll();

        std::optional<chunk_writer> m_chunk;
        fourcc m_type;
        std::uint64_t m_max_payload;
        std::uint64_t m_in_chunk;  // rollover bookkeeping only
        std::size_t m_chunks;
    };

} // namespace pngsynth
