#include "codec/chunk_codec.h"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace {
std::vector<std::byte> make_bytes(std::size_t size) {
    std::vector<std::byte> bytes(size);
    for (std::size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<std::byte>((i * 7 + 3) & 0xFF);
    }
    return bytes;
}

std::vector<std::byte> concat(const std::vector<codec::Chunk>& chunks) {
    std::vector<std::byte> out;
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.payload.begin(), chunk.payload.end());
    }
    return out;
}
} // namespace

TEST(ChunkCodecTest, EmptyPayloadYieldsSingleFinalChunk) {
    const std::vector<std::byte> empty;
    const auto chunks = codec::split(ConstDataBlock(empty), 1024, "t");
    ASSERT_EQ(chunks.size(), 1U);
    EXPECT_TRUE(chunks[0].is_final);
    EXPECT_TRUE(chunks[0].payload.empty());
    EXPECT_EQ(chunks[0].sequence_number, 0U);
    EXPECT_TRUE(codec::validate(chunks, 0));
}

TEST(ChunkCodecTest, ScenarioSizes) {
    struct Case {
        std::size_t size;
        std::vector<std::size_t> lengths;
    };
    const std::vector<Case> cases = {{0, {0}}, {1500, {1024, 476}}, {4096, {1024, 1024, 1024, 1024}}};

    for (const auto& test_case : cases) {
        const auto bytes = make_bytes(test_case.size);
        const auto chunks = codec::split(ConstDataBlock(bytes), 1024, "scenario");
        ASSERT_EQ(chunks.size(), test_case.lengths.size()) << "size " << test_case.size;
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            EXPECT_EQ(chunks[i].payload.size(), test_case.lengths[i]);
            EXPECT_EQ(chunks[i].sequence_number, i);
            EXPECT_EQ(chunks[i].is_final, i + 1 == chunks.size());
            EXPECT_EQ(chunks[i].transfer_id, "scenario");
        }
        EXPECT_EQ(concat(chunks), bytes);
    }
}

TEST(ChunkCodecTest, ReconstructsAcrossSizes) {
    for (const std::size_t chunk_size : {1U, 3U, 64U, 1000U}) {
        for (const std::size_t size : {1U, 2U, 63U, 64U, 65U, 999U, 1000U, 1001U, 4097U}) {
            const auto bytes = make_bytes(size);
            const auto chunks = codec::split(ConstDataBlock(bytes), chunk_size);
            EXPECT_EQ(chunks.size(), codec::chunk_count(size, chunk_size));
            EXPECT_EQ(chunks.size(), (size + chunk_size - 1) / chunk_size);

            std::size_t finals = 0;
            for (const auto& chunk : chunks) {
                EXPECT_LE(chunk.payload.size(), chunk_size);
                EXPECT_FALSE(chunk.payload.empty());
                finals += chunk.is_final ? 1 : 0;
            }
            EXPECT_EQ(finals, 1U);
            EXPECT_TRUE(chunks.back().is_final);
            EXPECT_EQ(concat(chunks), bytes);
        }
    }
}

TEST(ChunkCodecTest, ChunksAreViewsIntoInput) {
    const auto bytes = make_bytes(100);
    const auto chunks = codec::split(ConstDataBlock(bytes), 40);
    ASSERT_EQ(chunks.size(), 3U);
    EXPECT_EQ(chunks[0].payload.data(), bytes.data());
    EXPECT_EQ(chunks[1].payload.data(), bytes.data() + 40);
    EXPECT_EQ(chunks[2].payload.data(), bytes.data() + 80);
}

TEST(ChunkCodecTest, ZeroChunkSizeThrows) {
    const auto bytes = make_bytes(10);
    EXPECT_THROW(codec::split(ConstDataBlock(bytes), 0), std::invalid_argument);
    EXPECT_THROW(codec::chunk_count(10, 0), std::invalid_argument);
}

TEST(ChunkCodecTest, ValidateRejectsBrokenSequences) {
    const auto bytes = make_bytes(3000);
    const auto chunks = codec::split(ConstDataBlock(bytes), 1024, "t");
    ASSERT_TRUE(codec::validate(chunks, 3000));

    EXPECT_FALSE(codec::validate(chunks, 2999));
    EXPECT_FALSE(codec::validate({}, 0));

    auto reordered = chunks;
    std::swap(reordered[0], reordered[1]);
    EXPECT_FALSE(codec::validate(reordered, 3000));

    auto missing_final = chunks;
    missing_final.back().is_final = false;
    EXPECT_FALSE(codec::validate(missing_final, 3000));

    auto early_final = chunks;
    early_final[0].is_final = true;
    EXPECT_FALSE(codec::validate(early_final, 3000));

    auto mixed_ids = chunks;
    mixed_ids[1].transfer_id = "other";
    EXPECT_FALSE(codec::validate(mixed_ids, 3000));
}

TEST(ChunkCodecTest, ReassembleReturnsOriginalBytes) {
    const auto bytes = make_bytes(1500);
    const auto chunks = codec::split(ConstDataBlock(bytes), 1024, "t");
    const auto rebuilt = codec::reassemble(chunks, bytes.size());
    ASSERT_TRUE(rebuilt.has_value());
    EXPECT_EQ(*rebuilt, bytes);

    EXPECT_FALSE(codec::reassemble(chunks, 1024).has_value());
}
