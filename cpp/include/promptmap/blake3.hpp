#pragma once

#include "promptmap/types.hpp"
#include <span>
#include <string_view>
#include <memory>

namespace promptmap {

/**
 * BLAKE3 hashing for content addressing
 *
 * Portable single-threaded implementation of the reference algorithm,
 * 256-bit output. Node content hashes are built through Incremental so
 * attribute and text fragments never need to be concatenated first.
 */
class Blake3Hasher {
public:
    static ContentHash hash(std::span<const uint8_t> data) noexcept;

    static ContentHash hash(std::string_view str) noexcept;

    /**
     * Incremental hasher for streaming data
     */
    class Incremental {
    public:
        Incremental() noexcept;
        ~Incremental();

        Incremental(const Incremental&) = delete;
        Incremental& operator=(const Incremental&) = delete;
        Incremental(Incremental&&) noexcept;
        Incremental& operator=(Incremental&&) noexcept;

        void update(std::span<const uint8_t> data) noexcept;
        void update(std::string_view str) noexcept;
        ContentHash finalize() const noexcept;
        void reset() noexcept;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
};

} // namespace promptmap
