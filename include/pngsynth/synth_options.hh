/**
 * @file synth_options.hh
 * @brief Options and callbacks for image synthesis
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <cstddef>
#include <pngsynth/export_pngsynth.h>
#include <pngsynth/deflate_writer.hh>
#include <pngsynth/chunk_writer.hh>

namespace pngsynth {

    /**
     * @enum synth_stage
     * @brief Stages of the synthesizer, in the order they run
     */
    enum class synth_stage {
        header,      ///< Signature and IHDR
        image_data,  ///< IDAT chunk(s)
        trailer,     ///< IEND
        done
    };

    PNGSYNTH_EXPORT const char* to_string(synth_stage stage);

    // Largest scanline block held in memory at once
    inline constexpr std::size_t max_block_size = 64 * 1024 * 1024;
    
    /**
     * @struct synth_options
     * @brief Configuration options for image synthesis
     * 
     * Controls buffering, compression, chunk limits, strictness and the
     * callbacks used for diagnostics and progress.
     */
    struct PNGSYNTH_EXPORT synth_options {
        /**
         * @brief Bytes pulled from the scanline source per step
         * 
         * Progress is reported once per block. Must be in
         * [1, max_block_size]. Default is 64KB.
         */
        std::size_t block_size = 64 * 1024;

        /**
         * @brief Settings for the IDAT compressor
         */
        deflate_options compression;

        /**
         * @brief Maximum payload of a single IDAT chunk
         * 
         * When the compressed stream grows past this, the current IDAT is
         * finished and a new one started. Must be in [1, 2^31 - 1].
         */
        std::uint64_t max_chunk_payload = max_chunk_length;

        /**
         * @brief Strict option checking
         * 
         * When true, out-of-range options throw config_error.
         * When false, they are replaced by the nearest valid value and a
         * warning is reported.
         */
        bool strict = true;
        
        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Output offset at the time of the warning
         * @param category Warning category (e.g., "block_size", "chunk_limit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @typedef progress_handler
         * @param bytes_done Uncompressed scanline bytes consumed so far
         * @param bytes_total Uncompressed scanline bytes of the whole image
         * @param rows_done Complete rows consumed so far
         */
        using progress_handler = std::function<void(
            std::uint64_t bytes_done,
            std::uint64_t bytes_total,
            std::uint64_t rows_done
        )>;

        using stage_handler = std::function<void(synth_stage stage)>;
        
        /**
         * @brief Optional warning handler callback
         * 
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        /**
         * @brief Optional progress callback, called after every block
         */
        progress_handler on_progress;

        /**
         * @brief Optional callback, called as each stage starts
         */
        stage_handler on_stage;

        /**
         * @brief Check and normalize the options
         * 
         * Throws config_error in strict mode; otherwise fixes the values in
         * place and reports each fix through on_warning.
         */
        void validate();
    };
    
} // namespace pngsynth
