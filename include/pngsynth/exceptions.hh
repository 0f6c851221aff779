/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngsynth library
 * @author Igor
 * @date 14/08/2025
 * 
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngsynth {
    
    /**
     * @class pngsynth_error
     * @brief Base exception class for all library errors
     * 
     * All library exceptions derive from this class, making it easy
     * to catch every library error with a single catch block.
     */
    class pngsynth_error : public std::runtime_error {
    public:
        explicit pngsynth_error(const std::string& msg) 
            : std::runtime_error(msg) {}
    };
    
    /**
     * @class io_error
     * @brief Exception for I/O related errors
     * 
     * Thrown when opening, writing, seeking or querying the position of
     * the output fails, or when a payload source runs dry early.
     */
    class io_error : public pngsynth_error {
    public:
        explicit io_error(const std::string& msg) 
            : pngsynth_error(msg) {}
    };
    
    /**
     * @class length_mismatch_error
     * @brief Exception for chunk length contract violations
     * 
     * Thrown when a known-length chunk is finished with a different number
     * of payload bytes than declared, or when a deferred chunk grew beyond
     * what the length field can encode. This is a programming error in the
     * caller, never a transient fault.
     */
    class length_mismatch_error : public pngsynth_error {
    public:
        explicit length_mismatch_error(const std::string& msg) 
            : pngsynth_error(msg) {}
    };

    /**
     * @class config_error
     * @brief Exception for invalid image parameters or options
     * 
     * Always thrown before the first byte of output is written.
     */
    class config_error : public pngsynth_error {
    public:
        explicit config_error(const std::string& msg) 
            : pngsynth_error(msg) {}
    };

    /**
     * @class compression_error
     * @brief Exception for failures reported by the deflate engine
     */
    class compression_error : public pngsynth_error {
    public:
        explicit compression_error(const std::string& msg) 
            : pngsynth_error(msg) {}
    };
    
    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }
    
    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */
    
    /**
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::pngsynth::io_error(::pngsynth::build_error_msg(__VA_ARGS__))
    
    /**
     * @def THROW_LENGTH
     * @brief Throw a length_mismatch_error with formatted message
     */
    #define THROW_LENGTH(...) \
        throw ::pngsynth::length_mismatch_error(::pngsynth::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CONFIG
     * @brief Throw a config_error with formatted message
     */
    #define THROW_CONFIG(...) \
        throw ::pngsynth::config_error(::pngsynth::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_COMPRESSION
     * @brief Throw a compression_error with formatted message
     */
    #define THROW_COMPRESSION(...) \
        throw ::pngsynth::compression_error(::pngsynth::build_error_msg(__VA_ARGS__))
    
    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)
    
    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_LENGTH_IF(condition, ...) \
        do { if (condition) THROW_LENGTH(__VA_ARGS__); } while(0)

    #define THROW_CONFIG_IF(condition, ...) \
        do { if (condition) THROW_CONFIG(__VA_ARGS__); } while(0)
    
    #define THROW_CONFIG_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_CONFIG(__VA_ARGS__); } while(0)

    #define THROW_COMPRESSION_IF(condition, ...) \
        do { if (condition) THROW_COMPRESSION(__VA_ARGS__); } while(0)
    
    /** @} */ // end of ExceptionMacros group
    
} // namespace pngsynth
