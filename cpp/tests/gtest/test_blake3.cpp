// =============================================================================
// BLAKE3 Hash Tests
// =============================================================================

#include <gtest/gtest.h>
#include "promptmap/blake3.hpp"
#include <string>
#include <vector>

using namespace promptmap;

class Blake3Test : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Published test vectors
TEST_F(Blake3Test, KnownVectors) {
    EXPECT_EQ(Blake3Hasher::hash(std::string_view("")).to_hex(),
              "af1349b9f5f9a1a6a0404dea36dcc9499bcb25c9adc112b7cc9a93cae41f3262");
    EXPECT_EQ(Blake3Hasher::hash(std::string_view("abc")).to_hex(),
              "6437b3ac38465133ffb63b75273a8db548c558465d79db03fd359c6cd5bd9d85");
}

TEST_F(Blake3Test, SpanAndStringAgree) {
    std::vector<uint8_t> data = {0x48, 0x65, 0x6c, 0x6c, 0x6f};  // "Hello"
    auto from_span = Blake3Hasher::hash(std::span<const uint8_t>(data));
    auto from_string = Blake3Hasher::hash(std::string_view("Hello"));
    EXPECT_EQ(from_span, from_string);
}

TEST_F(Blake3Test, DifferentInputsDifferentHashes) {
    EXPECT_NE(Blake3Hasher::hash(std::string_view("Hello")),
              Blake3Hasher::hash(std::string_view("World")));
}

// Incremental updates must match one-shot hashing across chunk boundaries
TEST_F(Blake3Test, IncrementalMatchesOneShot) {
    std::string data;
    for (int i = 0; i < 5000; ++i) {
        data.push_back(static_cast<char>('a' + i % 26));
    }

    for (size_t split : {size_t{0}, size_t{1}, size_t{63}, size_t{64}, size_t{1023}, size_t{1024},
                         size_t{1025}, size_t{4096}}) {
        Blake3Hasher::Incremental hasher;
        hasher.update(std::string_view(data).substr(0, split));
        hasher.update(std::string_view(data).substr(split));
        EXPECT_EQ(hasher.finalize(), Blake3Hasher::hash(data)) << "split at " << split;
    }
}

TEST_F(Blake3Test, ResetStartsOver) {
    Blake3Hasher::Incremental hasher;
    hasher.update(std::string_view("garbage"));
    hasher.reset();
    hasher.update(std::string_view("abc"));
    EXPECT_EQ(hasher.finalize(), Blake3Hasher::hash(std::string_view("abc")));
}

TEST_F(Blake3Test, HexRoundTrip) {
    auto hash = Blake3Hasher::hash(std::string_view("A"));
    std::string hex = hash.to_hex();
    EXPECT_EQ(hex.length(), 64u);
    EXPECT_EQ(ContentHash::from_hex(hex), hash);
}
