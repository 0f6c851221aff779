/**
 * @file png_synth.cpp
 * @brief Writes a blank PNG of any size without holding it in memory
 *
 * The image data is streamed through zlib straight into the file, so
 * even very large images need only a few buffers worth of RAM.
 *
 * Usage: png_synth <output.png> [width] [height] [bit_depth] [color]
 */

#include <pngsynth/synthesizer.hh>
#include <pngsynth/exceptions.hh>
#include <iostream>
#include <iomanip>
#include <string>
#include <string_view>
#include <stdexcept>
#include <cstdint>

static void print_usage(const char* program) {
    std::cerr << "USAGE: " << program << " <output.png> [width] [height] [bit_depth] [color]\n";
    std::cerr << "\n";
    std::cerr << "Defaults: 10000 x 10000, 1 bit, gray\n";
    std::cerr << "Colors:   gray, rgb, gray-alpha, rgba\n";
}

static std::uint32_t parse_number(const std::string& text, const char* what) {
    std::size_t used = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(text, &used);
    } catch (const std::logic_error&) {
        THROW_CONFIG("Invalid ", what, ": '", text, "'");
    }
    THROW_CONFIG_IF(used != text.size() || value > 0xFFFFFFFFul, "Invalid ", what, ": '", text, "'");
    return static_cast<std::uint32_t>(value);
}

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 6) {
        print_usage(argv[0]);
        return 1;
    }

    pngsynth::image_header header;
    header.width = 10000;
    header.height = 10000;
    header.bit_depth = 1;
    header.color = pngsynth::color_type::grayscale;

    try {
        if (argc > 2) header.width = parse_number(argv[2], "width");
        if (argc > 3) header.height = parse_number(argv[3], "height");
        if (argc > 4) {
            auto depth = parse_number(argv[4], "bit depth");
            THROW_CONFIG_IF(depth > 255, "Invalid bit depth: ", depth);
            header.bit_depth = static_cast<std::uint8_t>(depth);
        }
        if (argc > 5) header.color = pngsynth::parse_color_type(argv[5]);
    } catch (const pngsynth::config_error& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    pngsynth::synth_options opts;

    opts.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    opts.on_stage = [](pngsynth::synth_stage stage) {
        switch (stage) {
            case pngsynth::synth_stage::header:
                std::cout << "Header: " << std::flush;
                break;
            case pngsynth::synth_stage::image_data:
                std::cout << "done!\n";
                break;
            case pngsynth::synth_stage::trailer:
                std::cout << "\nIEND: " << std::flush;
                break;
            case pngsynth::synth_stage::done:
                std::cout << "done!\n";
                break;
        }
    };

    // Redraw only when the percentage changes
    int last_percent = -1;
    opts.on_progress = [&last_percent, &header](std::uint64_t done, std::uint64_t total, std::uint64_t rows) {
        int percent = total ? static_cast<int>(done * 100 / total) : 100;
        if (percent == last_percent) {
            return;
        }
        last_percent = percent;
        std::cout << "\rIDAT: " << std::setw(3) << percent << "% ("
                  << rows << "/" << header.height << " rows)" << std::flush;
    };

    std::cout << "Generating PNG: " << header.width << "x" << header.height << ", "
              << static_cast<int>(header.bit_depth) << "bpp, " << header.color << "\n";

    try {
        pngsynth::synthesize_file(argv[1], header, opts);
    } catch (const pngsynth::config_error& e) {
        std::cerr << "\nError: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nError: " << e.what() << "\n";
        return 1;
    }

    std::cout << "Wrote " << argv[1] << "\n";
    return 0;
}
