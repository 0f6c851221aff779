/**
 * @file byte_source.hh
 * @brief Pull interface for payload data and the zero-filled source
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <pngsynth/export_pngsynth.h>

namespace pngsynth {
    
    /**
     * @class byte_source
     * @brief Abstract interface for pulling payload bytes on demand
     * 
     * Exhaustion is signalled by returning fewer bytes than requested,
     * and eventually zero.
     */
    class PNGSYNTH_EXPORT byte_source {
    public:
        virtual ~byte_source() = default;
        
        /**
         * @brief Read data from the source
         * @param dst Destination buffer
         * @param size Number of bytes requested
         * @return Number of bytes actually produced
         */
        virtual std::size_t read(void* dst, std::size_t size) = 0;
        
        /**
         * @brief Get number of bytes the source will still produce
         */
        virtual std::uint64_t remaining() const = 0;
    };

    /**
     * @class zero_source
     * @brief Lazy sequence of @c total zero bytes
     * 
     * Stands in for generated pixel data without materializing it.
     */
    class PNGSYNTH_EXPORT zero_source : public byte_source {
    public:
        explicit zero_source(std::uint64_t total);

        std::size_t read(void* dst, std::size_t size) override;
        std::uint64_t remaining() const override;

        [[nodiscard]] std::uint64_t total() const { return m_total; }
        [[nodiscard]] std::uint64_t produced() const { return m_produced; }

    private:
        std::uint64_t m_total;
        std::uint64_t m_produced;
    };
    
} // namespace pngsynth
