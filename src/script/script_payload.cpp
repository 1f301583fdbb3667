/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_payload.h"
#include "script/script_cipher.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace romc::script {
static std::uint32_t read_u32_le(std::span<const std::uint8_t> s, std::size_t off) {
    return static_cast<std::uint32_t>(s[off]) | (static_cast<std::uint32_t>(s[off + 1]) << 8)
           | (static_cast<std::uint32_t>(s[off + 2]) << 16)
           | (static_cast<std::uint32_t>(s[off + 3]) << 24);
}

static void write_u32_le(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFFu));
}

std::optional<std::vector<std::uint8_t>> unwrap_payload(std::span<const std::uint8_t> blob) {
    const auto it = std::search(blob.begin(), blob.end(), kRomSignature.begin(), kRomSignature.end());
    if (it == blob.end()) {
        return std::nullopt;
    }
    const std::size_t sig_off = static_cast<std::size_t>(it - blob.begin());
    const std::size_t size_off = sig_off + kRomSignature.size();
    if (blob.size() < size_off + 4) {
        return std::nullopt;
    }

    const std::uint32_t plain_len = read_u32_le(blob, size_off);
    const auto encrypted = blob.subspan(size_off + 4);
    const std::size_t block_len = encrypted.size() - (encrypted.size() % kDesBlockSize);
    if (block_len == 0) {
        return std::nullopt;
    }

    static const DesCipher cipher(kRomKey);
    auto plain = cipher.decrypt(encrypted.first(block_len));
    if (plain.size() > plain_len) {
        plain.resize(plain_len);
    }
    return plain;
}

std::vector<std::uint8_t> wrap_payload(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> prefix
) {
    if (plaintext.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("ROM payload too large");
    }
    std::vector<std::uint8_t> padded(plaintext.begin(), plaintext.end());
    padded.resize((padded.size() + kDesBlockSize - 1) / kDesBlockSize * kDesBlockSize, 0);

    static const DesCipher cipher(kRomKey);
    const auto encrypted = cipher.encrypt(padded);

    std::vector<std::uint8_t> out;
    out.reserve(prefix.size() + kRomSignature.size() + 4 + encrypted.size());
    out.insert(out.end(), prefix.begin(), prefix.end());
    out.insert(out.end(), kRomSignature.begin(), kRomSignature.end());
    write_u32_le(out, static_cast<std::uint32_t>(plaintext.size()));
    out.insert(out.end(), encrypted.begin(), encrypted.end());
    return out;
}
}  // namespace romc::script
