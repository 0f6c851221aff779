//
// Created by igor on 12/08/2025.
//

#include <ostream>
#include <fstream>
#include <string>

#include <pngsynth/output.hh>

namespace pngsynth {
    // byte_sink implementation
    void byte_sink::write_all(const void* src, std::size_t size) {
        const auto* p = static_cast<const unsigned char*>(src);
        while (size > 0) {
            std::size_t actual = write(p, size);
            THROW_IO_IF(actual == 0, "Sink stopped accepting data with ", size, " bytes left to write");
            p += actual;
            size -= actual;
        }
    }

    // writer_base implementation
    void writer_base::write_fourcc(const fourcc& id) {
        write_all(id.data(), 4);
    }

    // writer implementation
    writer::writer(std::ostream& os) : m_stream(os) {}

    std::size_t writer::write(const void* src, std::size_t size) {
        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(src, "Null buffer in write");
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.write(static_cast<const char*>(src), static_cast<std::streamsize>(size));
        THROW_IO_IF(!m_stream, "Stream write of ", size, " bytes failed");
        return size;
    }

    void writer::flush() {
        m_stream.flush();
        THROW_IO_IF(m_stream.bad(), "Stream flush failed");
    }

    void writer::seek(std::uint64_t offset, whence_t whence) {
        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                dir = std::ios_base::end;
                break;
            default:
                THROW_IO("Invalid whence value:", static_cast<int>(whence));
        }

        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state, cannot seek to offset ", offset);

        m_stream.seekp(static_cast<std::streamoff>(offset), dir);
        if (m_stream.fail()) {
            std::string error = "Cannot seek to offset " + std::to_string(offset);
            if (whence == writer_base::set) {
                error += " (absolute)";
            } else if (whence == writer_base::cur) {
                error += " (relative)";
            } else {
                error += " (from end)";
            }
            THROW_IO(error);
        }
    }

    std::uint64_t writer::tell() const {
        std::streampos pos = m_stream.tellp();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    // file_writer implementation
    static std::unique_ptr<std::ofstream> open_output(const std::filesystem::path& path) {
        auto file = std::make_unique<std::ofstream>(path, std::ios::binary | std::ios::out | std::ios::trunc);
        THROW_IO_UNLESS(file->is_open(), "Cannot open '", path.string(), "' for writing");
        return file;
    }

    file_writer::file_writer(const std::filesystem::path& path)
        : file_writer(open_output(path), path) {}

    file_writer::file_writer(std::unique_ptr<std::ofstream> file, const std::filesystem::path& path)
        : writer(*file), m_file(std::move(file)), m_path(path) {}

    file_writer::~file_writer() = default;
}
