/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace romc::script {
constexpr std::string_view kRomSignature = "czjzgqde";
constexpr std::array<std::uint8_t, 8> kRomKey = {2, 5, 9, 3, 6, 1, 0, 1};

/**
 * Decrypts a ROM-wrapped payload: <anything> "czjzgqde" <u32 le plain_len> <ciphertext>.
 * The ciphertext is cut down to whole DES blocks before decrypting and the plaintext is cut to
 * plain_len afterwards. Returns std::nullopt when the signature is missing or nothing is left
 * to decrypt; that just means the blob is not ROM-encrypted.
 */
std::optional<std::vector<std::uint8_t>> unwrap_payload(std::span<const std::uint8_t> blob);

// Inverse of unwrap_payload. The plaintext is zero-padded to the block size.
std::vector<std::uint8_t> wrap_payload(
    std::span<const std::uint8_t> plaintext,
    std::span<const std::uint8_t> prefix = {}
);
}  // namespace romc::script
