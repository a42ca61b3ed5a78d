#include "util/hash.h"
#include <memory>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace util::hash {
namespace {
struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx != nullptr) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

[[nodiscard]] std::string to_hex(std::span<const std::byte> data) {
    constexpr char kDigits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(data.size() * 2);
    for (const auto value : data) {
        const auto byte = std::to_integer<unsigned int>(value);
        hex.push_back(kDigits[(byte >> 4U) & 0x0FU]);
        hex.push_back(kDigits[byte & 0x0FU]);
    }
    return hex;
}

// Wrapping multiply-add on the unsigned representation, then reinterpreted; matches
// Java int overflow without relying on signed overflow.
constexpr std::uint32_t step(std::uint32_t h, std::uint32_t unit) {
    return (h << 5U) - h + unit;
}

// Decodes one UTF-8 sequence starting at text[i]; malformed input yields the raw byte.
std::uint32_t next_code_point(std::string_view text, std::size_t& i) {
    const auto lead = static_cast<unsigned char>(text[i]);
    std::size_t extra = 0;
    std::uint32_t cp = lead;
    if (lead >= 0xF0 && lead < 0xF8) {
        extra = 3;
        cp = lead & 0x07U;
    } else if (lead >= 0xE0) {
        extra = lead < 0xF0 ? 2 : 0;
        cp = lead & 0x0FU;
    } else if (lead >= 0xC0) {
        extra = 1;
        cp = lead & 0x1FU;
    }
    if (extra == 0 || i + extra >= text.size()) {
        ++i;
        return lead;
    }
    for (std::size_t k = 1; k <= extra; ++k) {
        const auto cont = static_cast<unsigned char>(text[i + k]);
        if ((cont & 0xC0U) != 0x80U) {
            ++i;
            return lead;
        }
        cp = (cp << 6U) | (cont & 0x3FU);
    }
    i += extra + 1;
    return cp;
}
} // namespace

std::optional<std::array<std::byte, kSha256Size>> sha256(ConstDataBlock data) {
    MdCtxPtr ctx{EVP_MD_CTX_new()};
    if (!ctx) {
        spdlog::error("[hash::sha256] EVP_MD_CTX_new failed");
        return std::nullopt;
    }

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        spdlog::error("[hash::sha256] EVP_DigestInit_ex failed");
        return std::nullopt;
    }
    if (!data.empty()) {
        if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
            spdlog::error("[hash::sha256] EVP_DigestUpdate failed");
            return std::nullopt;
        }
    }

    std::array<std::byte, kSha256Size> digest{};
    unsigned int digest_size = 0;
    if (EVP_DigestFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(digest.data()), &digest_size)
        != 1) {
        spdlog::error("[hash::sha256] EVP_DigestFinal_ex failed");
        return std::nullopt;
    }
    if (digest_size != digest.size()) {
        spdlog::error("[hash::sha256] Unexpected digest size: {}", digest_size);
        return std::nullopt;
    }
    return digest;
}

std::optional<std::string> sha256_hex(ConstDataBlock data) {
    const auto digest = sha256(data);
    if (!digest) {
        return std::nullopt;
    }
    return to_hex(std::span<const std::byte>(digest->data(), digest->size()));
}

std::int32_t java_hash(std::string_view text) {
    std::uint32_t h = 0;
    std::size_t i = 0;
    while (i < text.size()) {
        const std::uint32_t cp = next_code_point(text, i);
        if (cp >= 0x10000U) {
            const std::uint32_t v = cp - 0x10000U;
            h = step(h, 0xD800U + (v >> 10U));
            h = step(h, 0xDC00U + (v & 0x3FFU));
        } else {
            h = step(h, cp);
        }
    }
    return static_cast<std::int32_t>(h);
}

std::int32_t java_hash(ConstDataBlock data) {
    std::uint32_t h = 0;
    for (const auto value : data) {
        h = step(h, std::to_integer<std::uint32_t>(value));
    }
    return static_cast<std::int32_t>(h);
}

std::string java_hash_string(std::string_view text) {
    return std::to_string(java_hash(text));
}

std::string java_hash_string(ConstDataBlock data) {
    return std::to_string(java_hash(data));
}
} // namespace util::hash
