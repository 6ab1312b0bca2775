#include "promptmap/blake3.hpp"

#include <algorithm>
#include <cstring>

// BLAKE3 reference algorithm (portable C++, no SIMD).
// Only the default hash mode is needed: no keyed hashing, no key derivation.

namespace {

constexpr size_t OUT_LEN = 32;
constexpr size_t BLOCK_LEN = 64;
constexpr size_t CHUNK_LEN = 1024;
constexpr size_t MAX_DEPTH = 54;

constexpr uint32_t IV[8] = {
    0x6A09E667, 0xBB67AE85, 0x3C6EF372, 0xA54FF53A,
    0x510E527F, 0x9B05688C, 0x1F83D9AB, 0x5BE0CD19
};

constexpr uint8_t MSG_SCHEDULE[7][16] = {
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15},
    {2, 6, 3, 10, 7, 0, 4, 13, 1, 11, 12, 5, 9, 14, 15, 8},
    {3, 4, 10, 12, 13, 2, 7, 14, 6, 5, 9, 0, 11, 15, 8, 1},
    {10, 7, 12, 9, 14, 3, 13, 15, 4, 0, 11, 2, 5, 8, 1, 6},
    {12, 13, 9, 11, 15, 10, 14, 8, 7, 2, 5, 3, 0, 1, 6, 4},
    {9, 14, 11, 5, 8, 12, 15, 1, 13, 3, 0, 10, 2, 6, 4, 7},
    {11, 15, 5, 0, 1, 9, 8, 6, 14, 10, 2, 12, 3, 4, 7, 13},
};

enum Flags : uint8_t {
    CHUNK_START = 1 << 0,
    CHUNK_END = 1 << 1,
    PARENT = 1 << 2,
    ROOT = 1 << 3,
};

inline uint32_t rotr32(uint32_t x, int n) {
    return (x >> n) | (x << (32 - n));
}

inline uint32_t load32_le(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

inline void store32_le(uint8_t* p, uint32_t x) {
    p[0] = static_cast<uint8_t>(x);
    p[1] = static_cast<uint8_t>(x >> 8);
    p[2] = static_cast<uint8_t>(x >> 16);
    p[3] = static_cast<uint8_t>(x >> 24);
}

inline void mix(uint32_t* s, size_t a, size_t b, size_t c, size_t d, uint32_t mx, uint32_t my) {
    s[a] = s[a] + s[b] + mx;
    s[d] = rotr32(s[d] ^ s[a], 16);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 12);
    s[a] = s[a] + s[b] + my;
    s[d] = rotr32(s[d] ^ s[a], 8);
    s[c] = s[c] + s[d];
    s[b] = rotr32(s[b] ^ s[c], 7);
}

// Full 16-word compression output; callers keep the first 8 words as a chaining value
void compress(const uint32_t cv[8], const uint8_t block[BLOCK_LEN], uint8_t block_len,
              uint64_t counter, uint8_t flags, uint32_t out[16]) {
    uint32_t m[16];
    for (size_t i = 0; i < 16; ++i) {
        m[i] = load32_le(block + i * 4);
    }

    uint32_t s[16] = {
        cv[0], cv[1], cv[2], cv[3], cv[4], cv[5], cv[6], cv[7],
        IV[0], IV[1], IV[2], IV[3],
        static_cast<uint32_t>(counter),
        static_cast<uint32_t>(counter >> 32),
        block_len,
        flags
    };

    for (const auto& sched : MSG_SCHEDULE) {
        mix(s, 0, 4, 8, 12, m[sched[0]], m[sched[1]]);
        mix(s, 1, 5, 9, 13, m[sched[2]], m[sched[3]]);
        mix(s, 2, 6, 10, 14, m[sched[4]], m[sched[5]]);
        mix(s, 3, 7, 11, 15, m[sched[6]], m[sched[7]]);
        mix(s, 0, 5, 10, 15, m[sched[8]], m[sched[9]]);
        mix(s, 1, 6, 11, 12, m[sched[10]], m[sched[11]]);
        mix(s, 2, 7, 8, 13, m[sched[12]], m[sched[13]]);
        mix(s, 3, 4, 9, 14, m[sched[14]], m[sched[15]]);
    }

    for (size_t i = 0; i < 8; ++i) {
        out[i] = s[i] ^ s[i + 8];
        out[i + 8] = s[i + 8] ^ cv[i];
    }
}

void parent_cv(const uint32_t left[8], const uint32_t right[8], uint8_t flags, uint32_t out[8]) {
    uint8_t block[BLOCK_LEN];
    for (size_t i = 0; i < 8; ++i) {
        store32_le(block + i * 4, left[i]);
        store32_le(block + 32 + i * 4, right[i]);
    }
    uint32_t full[16];
    compress(IV, block, static_cast<uint8_t>(BLOCK_LEN), 0, flags | PARENT, full);
    std::copy(full, full + 8, out);
}

// One 1 KiB chunk being absorbed
class ChunkState {
public:
    void reset(uint64_t counter) noexcept {
        std::copy(IV, IV + 8, cv_);
        counter_ = counter;
        std::memset(buf_, 0, BLOCK_LEN);
        buf_len_ = 0;
        blocks_ = 0;
    }

    size_t len() const noexcept {
        return BLOCK_LEN * blocks_ + buf_len_;
    }

    uint64_t counter() const noexcept { return counter_; }

    void update(const uint8_t* input, size_t input_len) noexcept {
        while (input_len > 0) {
            if (buf_len_ == BLOCK_LEN) {
                uint32_t out[16];
                compress(cv_, buf_, static_cast<uint8_t>(BLOCK_LEN), counter_, start_flag(), out);
                std::copy(out, out + 8, cv_);
                ++blocks_;
                buf_len_ = 0;
                std::memset(buf_, 0, BLOCK_LEN);
            }
            size_t take = std::min(BLOCK_LEN - buf_len_, input_len);
            std::memcpy(buf_ + buf_len_, input, take);
            buf_len_ += take;
            input += take;
            input_len -= take;
        }
    }

    void output_cv(bool is_root, uint32_t out[8]) const noexcept {
        uint8_t flags = start_flag() | CHUNK_END;
        if (is_root) flags |= ROOT;
        uint32_t full[16];
        compress(cv_, buf_, static_cast<uint8_t>(buf_len_), counter_, flags, full);
        std::copy(full, full + 8, out);
    }

private:
    uint8_t start_flag() const noexcept {
        return blocks_ == 0 ? CHUNK_START : 0;
    }

    uint32_t cv_[8];
    uint64_t counter_ = 0;
    uint8_t buf_[BLOCK_LEN];
    size_t buf_len_ = 0;
    size_t blocks_ = 0;
};

// Chunk state plus the stack of completed subtree chaining values
class HasherState {
public:
    HasherState() noexcept { reset(); }

    void reset() noexcept {
        chunk_.reset(0);
        stack_len_ = 0;
    }

    void update(const uint8_t* input, size_t input_len) noexcept {
        while (input_len > 0) {
            if (chunk_.len() == CHUNK_LEN) {
                uint32_t cv[8];
                chunk_.output_cv(false, cv);
                uint64_t total_chunks = chunk_.counter() + 1;
                push_chunk_cv(cv, total_chunks);
                chunk_.reset(total_chunks);
            }
            size_t take = std::min(CHUNK_LEN - chunk_.len(), input_len);
            chunk_.update(input, take);
            input += take;
            input_len -= take;
        }
    }

    void finalize(uint8_t out[OUT_LEN]) const noexcept {
        uint32_t cv[8];
        chunk_.output_cv(stack_len_ == 0, cv);

        for (size_t i = stack_len_; i-- > 0;) {
            uint8_t flags = (i == 0) ? ROOT : 0;
            parent_cv(stack_[i], cv, flags, cv);
        }

        for (size_t i = 0; i < 8; ++i) {
            store32_le(out + i * 4, cv[i]);
        }
    }

private:
    // Merge completed subtrees while the chunk count has trailing zero bits
    void push_chunk_cv(uint32_t cv[8], uint64_t total_chunks) noexcept {
        while ((total_chunks & 1) == 0) {
            --stack_len_;
            parent_cv(stack_[stack_len_], cv, 0, cv);
            total_chunks >>= 1;
        }
        std::copy(cv, cv + 8, stack_[stack_len_]);
        ++stack_len_;
    }

    ChunkState chunk_;
    uint32_t stack_[MAX_DEPTH][8];
    size_t stack_len_ = 0;
};

} // anonymous namespace

namespace promptmap {

ContentHash Blake3Hasher::hash(std::span<const uint8_t> data) noexcept {
    HasherState state;
    state.update(data.data(), data.size());

    ContentHash result;
    state.finalize(result.data());
    return result;
}

ContentHash Blake3Hasher::hash(std::string_view str) noexcept {
    return hash(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(str.data()), str.size()));
}

struct Blake3Hasher::Incremental::Impl {
    HasherState state;
};

Blake3Hasher::Incremental::Incremental() noexcept
    : impl_(std::make_unique<Impl>()) {}

Blake3Hasher::Incremental::~Incremental() = default;

Blake3Hasher::Incremental::Incremental(Incremental&&) noexcept = default;
Blake3Hasher::Incremental& Blake3Hasher::Incremental::operator=(Incremental&&) noexcept = default;

void Blake3Hasher::Incremental::update(std::span<const uint8_t> data) noexcept {
    impl_->state.update(data.data(), data.size());
}

void Blake3Hasher::Incremental::update(std::string_view str) noexcept {
    impl_->state.update(reinterpret_cast<const uint8_t*>(str.data()), str.size());
}

ContentHash Blake3Hasher::Incremental::finalize() const noexcept {
    ContentHash result;
    impl_->state.finalize(result.data());
    return result;
}

void Blake3Hasher::Incremental::reset() noexcept {
    impl_->state.reset();
}

} // namespace promptmap
