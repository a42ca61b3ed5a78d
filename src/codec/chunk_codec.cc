#include "codec/chunk_codec.h"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace codec {

std::uint64_t chunk_count(std::uint64_t size, std::size_t max_chunk_size) {
    if (max_chunk_size == 0) {
        throw std::invalid_argument("max_chunk_size must be positive");
    }
    if (size == 0) {
        return 1;
    }
    return (size + max_chunk_size - 1) / max_chunk_size;
}

std::vector<Chunk> split(ConstDataBlock payload,
                         std::size_t max_chunk_size,
                         const std::string& transfer_id) {
    const auto total = chunk_count(payload.size(), max_chunk_size);

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(total));

    std::size_t offset = 0;
    for (std::uint64_t sequence = 0; sequence < total; ++sequence) {
        const std::size_t length = std::min(max_chunk_size, payload.size() - offset);
        chunks.push_back(Chunk{transfer_id,
                               sequence,
                               payload.subspan(offset, length),
                               sequence + 1 == total});
        offset += length;
    }
    return chunks;
}

bool validate(const std::vector<Chunk>& chunks, std::uint64_t declared_size) {
    if (chunks.empty()) {
        return false;
    }

    std::uint64_t cumulative = 0;
    const auto& transfer_id = chunks.front().transfer_id;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto& chunk = chunks[i];
        const bool last = i + 1 == chunks.size();
        if (chunk.transfer_id != transfer_id || chunk.sequence_number != i
            || chunk.is_final != last) {
            spdlog::debug("[codec::validate] chunk {} of {} breaks sequence or final flag",
                          i,
                          transfer_id);
            return false;
        }
        // only the final chunk of a non-empty transfer may be empty if it is also the first
        if (chunk.payload.empty() && !(last && i == 0)) {
            return false;
        }
        cumulative += chunk.payload.size();
    }
    return cumulative == declared_size;
}

std::optional<std::vector<std::byte>> reassemble(const std::vector<Chunk>& chunks,
                                                 std::uint64_t declared_size) {
    if (!validate(chunks, declared_size)) {
        return std::nullopt;
    }

    std::vector<std::byte> bytes;
    bytes.reserve(static_cast<std::size_t>(declared_size));
    for (const auto& chunk : chunks) {
        bytes.insert(bytes.end(), chunk.payload.begin(), chunk.payload.end());
    }
    return bytes;
}

} // namespace codec
