/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace romc::script {
constexpr std::size_t kDesBlockSize = 8;
constexpr std::size_t kDesKeySize = 8;

enum class CipherDirection {
    Encrypt,
    Decrypt,
};

// 16 rounds x two packed 24-bit halves, in application order for the chosen direction.
using DesRoundKeys = std::array<std::uint32_t, 32>;

/**
 * DES key schedule. Key bytes are read least-significant bit first, which is how the game
 * client loads its key; feeding a bit-reversed key yields the textbook DES schedule.
 * Throws CipherError unless key is exactly 8 bytes.
 */
DesRoundKeys schedule_key(std::span<const std::uint8_t> key, CipherDirection direction);

// ECB over every 8-byte block. Throws CipherError if buffer size is not a multiple of 8.
std::vector<std::uint8_t> crypt(std::span<const std::uint8_t> buffer, const DesRoundKeys& keys);

std::vector<std::uint8_t> encrypt(
    std::span<const std::uint8_t> buffer,
    std::span<const std::uint8_t> key
);
std::vector<std::uint8_t> decrypt(
    std::span<const std::uint8_t> buffer,
    std::span<const std::uint8_t> key
);

class DesCipher {
   public:
    explicit DesCipher(std::span<const std::uint8_t> key);

    std::vector<std::uint8_t> encrypt(std::span<const std::uint8_t> buffer) const;
    std::vector<std::uint8_t> decrypt(std::span<const std::uint8_t> buffer) const;

   private:
    DesRoundKeys _encrypt_keys{};
    DesRoundKeys _decrypt_keys{};
};
}  // namespace romc::script
