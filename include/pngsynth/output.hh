//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <array>
#include <memory>
#include <filesystem>

#include <pngsynth/export_pngsynth.h>
#include <pngsynth/exceptions.hh>
#include <pngsynth/byte_order.hh>
#include <pngsynth/fourcc.hh>

namespace pngsynth {

    /**
     * @class byte_sink
     * @brief Anything that accepts sequential byte writes
     * 
     * Writers are layered through this interface: a compressor writes
     * into an open chunk, an open chunk writes into a seekable sink.
     */
    class PNGSYNTH_EXPORT byte_sink {
        public:
            virtual ~byte_sink() = default;

            /**
             * @brief Write bytes to the sink
             * @param src Source buffer
             * @param size Number of bytes to write
             * @return Number of bytes actually accepted
             */
            virtual std::size_t write(const void* src, std::size_t size) = 0;

            /**
             * @brief Push buffered data down to the next layer
             */
            virtual void flush() = 0;

            // Loop until all of @p size bytes are accepted; throws io_error
            // if the sink stops accepting data.
            void write_all(const void* src, std::size_t size);
    };

    // Seekable sink interface
    class PNGSYNTH_EXPORT writer_base : public byte_sink {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            // Simple interface - throws on error
            virtual void seek(std::uint64_t offset, whence_t whence) = 0;
            virtual std::uint64_t tell() const = 0;

            // Get underlying stream
            virtual std::ostream& get_stream() = 0;

            template<typename T>
            void write_value(T value, byte_order bo) {
                if constexpr (sizeof(T) > 1) {
                    if (!byte_order_native(bo)) {
                        value = swap_byte_order(value);
                    }
                }
                std::array<std::byte, sizeof(T)> buff;
                std::memcpy(buff.data(), &value, sizeof(T));
                write_all(buff.data(), sizeof(T));
            }

            void write_fourcc(const fourcc& id);
    };

    // Main writer class - writes to a caller-owned stream
    class PNGSYNTH_EXPORT writer : public writer_base {
        public:
            explicit writer(std::ostream& os);
            ~writer() override = default;

            writer(const writer&) = delete;
            writer& operator = (const writer&) = delete;

            std::size_t write(const void* src, std::size_t size) override;
            void flush() override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;

            std::ostream& get_stream() override { return m_stream; }

        private:
            std::ostream& m_stream;
    };

    // Writer that owns the file it writes to
    class PNGSYNTH_EXPORT file_writer : public writer {
        public:
            explicit file_writer(const std::filesystem::path& path);
            ~file_writer() override;

            [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

        private:
            file_writer(std::unique_ptr<std::ofstream> file, const std::filesystem::path& path);

            std::unique_ptr<std::ofstream> m_file;
            std::filesystem::path m_path;
    };
}
