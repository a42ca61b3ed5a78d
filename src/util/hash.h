#pragma once

#include "util/data_block.h"
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace util::hash {
constexpr std::size_t kSha256Size = 32;

std::optional<std::array<std::byte, kSha256Size>> sha256(ConstDataBlock data);
std::optional<std::string> sha256_hex(ConstDataBlock data);

// 32-bit rolling hash h = 31 * h + unit with signed wrap-around, the String.hashCode()
// scheme the sync plugin keys paths and contents by.
// The string overload hashes UTF-16 code units of the UTF-8 input.
std::int32_t java_hash(std::string_view text);
// The byte overload feeds every byte as an unsigned unit.
std::int32_t java_hash(ConstDataBlock data);

// Decimal rendering used on the wire.
std::string java_hash_string(std::string_view text);
std::string java_hash_string(ConstDataBlock data);
} // namespace util::hash
