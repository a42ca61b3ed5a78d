#pragma once

#include "util/data_block.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace codec {

// One bounded slice of a transfer. The payload is a view into the caller's bytes,
// which must outlive the chunk.
struct Chunk {
    std::string transfer_id;
    std::uint64_t sequence_number = 0;
    ConstDataBlock payload;
    bool is_final = false;
};

// Number of chunks split() produces: ceil(size / max_chunk_size), but at least 1.
// Throws std::invalid_argument when max_chunk_size is 0.
std::uint64_t chunk_count(std::uint64_t size, std::size_t max_chunk_size);

// Splits payload into contiguous chunks of at most max_chunk_size bytes. An empty
// payload yields one empty final chunk so that empty files still complete.
// Throws std::invalid_argument when max_chunk_size is 0.
std::vector<Chunk> split(ConstDataBlock payload,
                         std::size_t max_chunk_size,
                         const std::string& transfer_id = {});

// Checks that the chunks form one transfer of declared_size bytes: a shared
// transfer id, sequence numbers 0..N-1 in order, a single final flag on the last
// chunk and payload lengths adding up to declared_size.
bool validate(const std::vector<Chunk>& chunks, std::uint64_t declared_size);

std::optional<std::vector<std::byte>> reassemble(const std::vector<Chunk>& chunks,
                                                 std::uint64_t declared_size);

} // namespace codec
