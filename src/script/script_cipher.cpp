/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_cipher.h"
#include "script/script_errors.h"

#include <string>

namespace romc::script {
namespace {
constexpr std::array<std::uint8_t, 56> kPermutedChoice1 = {
    56, 48, 40, 32, 24, 16, 8, 0, 57, 49, 41, 33, 25, 17,
    9, 1, 58, 50, 42, 34, 26, 18, 10, 2, 59, 51, 43, 35,
    62, 54, 46, 38, 30, 22, 14, 6, 61, 53, 45, 37, 29, 21,
    13, 5, 60, 52, 44, 36, 28, 20, 12, 4, 27, 19, 11, 3,
};

constexpr std::array<std::uint8_t, 16> kTotalRotations = {
    1, 2, 4, 6, 8, 10, 12, 14, 15, 17, 19, 21, 23, 25, 27, 28,
};

constexpr std::array<std::uint8_t, 48> kPermutedChoice2 = {
    13, 16, 10, 23, 0, 4, 2, 27, 14, 5, 20, 9,
    22, 18, 11, 3, 25, 7, 15, 6, 26, 19, 12, 1,
    40, 51, 30, 36, 46, 54, 29, 39, 50, 44, 32, 47,
    43, 48, 38, 55, 33, 52, 45, 41, 49, 35, 28, 31,
};

constexpr std::array<std::array<std::uint32_t, 64>, 8> kSpBox = {{
    {{
        0x01010400u, 0x00000000u, 0x00010000u, 0x01010404u, 0x01010004u, 0x00010404u,
        0x00000004u, 0x00010000u, 0x00000400u, 0x01010400u, 0x01010404u, 0x00000400u,
        0x01000404u, 0x01010004u, 0x01000000u, 0x00000004u, 0x00000404u, 0x01000400u,
        0x01000400u, 0x00010400u, 0x00010400u, 0x01010000u, 0x01010000u, 0x01000404u,
        0x00010004u, 0x01000004u, 0x01000004u, 0x00010004u, 0x00000000u, 0x00000404u,
        0x00010404u, 0x01000000u, 0x00010000u, 0x01010404u, 0x00000004u, 0x01010000u,
        0x01010400u, 0x01000000u, 0x01000000u, 0x00000400u, 0x01010004u, 0x00010000u,
        0x00010400u, 0x01000004u, 0x00000400u, 0x00000004u, 0x01000404u, 0x00010404u,
        0x01010404u, 0x00010004u, 0x01010000u, 0x01000404u, 0x01000004u, 0x00000404u,
        0x00010404u, 0x01010400u, 0x00000404u, 0x01000400u, 0x01000400u, 0x00000000u,
        0x00010004u, 0x00010400u, 0x00000000u, 0x01010004u,
    }},
    {{
        0x80108020u, 0x80008000u, 0x00008000u, 0x00108020u, 0x00100000u, 0x00000020u,
        0x80100020u, 0x80008020u, 0x80000020u, 0x80108020u, 0x80108000u, 0x80000000u,
        0x80008000u, 0x00100000u, 0x00000020u, 0x80100020u, 0x00108000u, 0x00100020u,
        0x80008020u, 0x00000000u, 0x80000000u, 0x00008000u, 0x00108020u, 0x80100000u,
        0x00100020u, 0x80000020u, 0x00000000u, 0x00108000u, 0x00008020u, 0x80108000u,
        0x80100000u, 0x00008020u, 0x00000000u, 0x00108020u, 0x80100020u, 0x00100000u,
        0x80008020u, 0x80100000u, 0x80108000u, 0x00008000u, 0x80100000u, 0x80008000u,
        0x00000020u, 0x80108020u, 0x00108020u, 0x00000020u, 0x00008000u, 0x80000000u,
        0x00008020u, 0x80108000u, 0x00100000u, 0x80000020u, 0x00100020u, 0x80008020u,
        0x80000020u, 0x00100020u, 0x00108000u, 0x00000000u, 0x80008000u, 0x00008020u,
        0x80000000u, 0x80100020u, 0x80108020u, 0x00108000u,
    }},
    {{
        0x00000208u, 0x08020200u, 0x00000000u, 0x08020008u, 0x08000200u, 0x00000000u,
        0x00020208u, 0x08000200u, 0x00020008u, 0x08000008u, 0x08000008u, 0x00020000u,
        0x08020208u, 0x00020008u, 0x08020000u, 0x00000208u, 0x08000000u, 0x00000008u,
        0x08020200u, 0x00000200u, 0x00020200u, 0x08020000u, 0x08020008u, 0x00020208u,
        0x08000208u, 0x00020200u, 0x00020000u, 0x08000208u, 0x00000008u, 0x08020208u,
        0x00000200u, 0x08000000u, 0x08020200u, 0x08000000u, 0x00020008u, 0x00000208u,
        0x00020000u, 0x08020200u, 0x08000200u, 0x00000000u, 0x00000200u, 0x00020008u,
        0x08020208u, 0x08000200u, 0x08000008u, 0x00000200u, 0x00000000u, 0x08020008u,
        0x08000208u, 0x00020000u, 0x08000000u, 0x08020208u, 0x00000008u, 0x00020208u,
        0x00020200u, 0x08000008u, 0x08020000u, 0x08000208u, 0x00000208u, 0x08020000u,
        0x00020208u, 0x00000008u, 0x08020008u, 0x00020200u,
    }},
    {{
        0x00802001u, 0x00002081u, 0x00002081u, 0x00000080u, 0x00802080u, 0x00800081u,
        0x00800001u, 0x00002001u, 0x00000000u, 0x00802000u, 0x00802000u, 0x00802081u,
        0x00000081u, 0x00000000u, 0x00800080u, 0x00800001u, 0x00000001u, 0x00002000u,
        0x00800000u, 0x00802001u, 0x00000080u, 0x00800000u, 0x00002001u, 0x00002080u,
        0x00800081u, 0x00000001u, 0x00002080u, 0x00800080u, 0x00002000u, 0x00802080u,
        0x00802081u, 0x00000081u, 0x00800080u, 0x00800001u, 0x00802000u, 0x00802081u,
        0x00000081u, 0x00000000u, 0x00000000u, 0x00802000u, 0x00002080u, 0x00800080u,
        0x00800081u, 0x00000001u, 0x00802001u, 0x00002081u, 0x00002081u, 0x00000080u,
        0x00802081u, 0x00000081u, 0x00000001u, 0x00002000u, 0x00800001u, 0x00002001u,
        0x00802080u, 0x00800081u, 0x00002001u, 0x00002080u, 0x00800000u, 0x00802001u,
        0x00000080u, 0x00800000u, 0x00002000u, 0x00802080u,
    }},
    {{
        0x00000100u, 0x02080100u, 0x02080000u, 0x42000100u, 0x00080000u, 0x00000100u,
        0x40000000u, 0x02080000u, 0x40080100u, 0x00080000u, 0x02000100u, 0x40080100u,
        0x42000100u, 0x42080000u, 0x00080100u, 0x40000000u, 0x02000000u, 0x40080000u,
        0x40080000u, 0x00000000u, 0x40000100u, 0x42080100u, 0x42080100u, 0x02000100u,
        0x42080000u, 0x40000100u, 0x00000000u, 0x42000000u, 0x02080100u, 0x02000000u,
        0x42000000u, 0x00080100u, 0x00080000u, 0x42000100u, 0x00000100u, 0x02000000u,
        0x40000000u, 0x02080000u, 0x42000100u, 0x40080100u, 0x02000100u, 0x40000000u,
        0x42080000u, 0x02080100u, 0x40080100u, 0x00000100u, 0x02000000u, 0x42080000u,
        0x42080100u, 0x00080100u, 0x42000000u, 0x42080100u, 0x02080000u, 0x00000000u,
        0x40080000u, 0x42000000u, 0x00080100u, 0x02000100u, 0x40000100u, 0x00080000u,
        0x00000000u, 0x40080000u, 0x02080100u, 0x40000100u,
    }},
    {{
        0x20000010u, 0x20400000u, 0x00004000u, 0x20404010u, 0x20400000u, 0x00000010u,
        0x20404010u, 0x00400000u, 0x20004000u, 0x00404010u, 0x00400000u, 0x20000010u,
        0x00400010u, 0x20004000u, 0x20000000u, 0x00004010u, 0x00000000u, 0x00400010u,
        0x20004010u, 0x00004000u, 0x00404000u, 0x20004010u, 0x00000010u, 0x20400010u,
        0x20400010u, 0x00000000u, 0x00404010u, 0x20404000u, 0x00004010u, 0x00404000u,
        0x20404000u, 0x20000000u, 0x20004000u, 0x00000010u, 0x20400010u, 0x00404000u,
        0x20404010u, 0x00400000u, 0x00004010u, 0x20000010u, 0x00400000u, 0x20004000u,
        0x20000000u, 0x00004010u, 0x20000010u, 0x20404010u, 0x00404000u, 0x20400000u,
        0x00404010u, 0x20404000u, 0x00000000u, 0x20400010u, 0x00000010u, 0x00004000u,
        0x20400000u, 0x00404010u, 0x00004000u, 0x00400010u, 0x20004010u, 0x00000000u,
        0x20404000u, 0x20000000u, 0x00400010u, 0x20004010u,
    }},
    {{
        0x00200000u, 0x04200002u, 0x04000802u, 0x00000000u, 0x00000800u, 0x04000802u,
        0x00200802u, 0x04200800u, 0x04200802u, 0x00200000u, 0x00000000u, 0x04000002u,
        0x00000002u, 0x04000000u, 0x04200002u, 0x00000802u, 0x04000800u, 0x00200802u,
        0x00200002u, 0x04000800u, 0x04000002u, 0x04200000u, 0x04200800u, 0x00200002u,
        0x04200000u, 0x00000800u, 0x00000802u, 0x04200802u, 0x00200800u, 0x00000002u,
        0x04000000u, 0x00200800u, 0x04000000u, 0x00200800u, 0x00200000u, 0x04000802u,
        0x04000802u, 0x04200002u, 0x04200002u, 0x00000002u, 0x00200002u, 0x04000000u,
        0x04000800u, 0x00200000u, 0x04200800u, 0x00000802u, 0x00200802u, 0x04200800u,
        0x00000802u, 0x04000002u, 0x04200802u, 0x04200000u, 0x00200800u, 0x00000000u,
        0x00000002u, 0x04200802u, 0x00000000u, 0x00200802u, 0x04200000u, 0x00000800u,
        0x04000002u, 0x04000800u, 0x00000800u, 0x00200002u,
    }},
    {{
        0x10001040u, 0x00001000u, 0x00040000u, 0x10041040u, 0x10000000u, 0x10001040u,
        0x00000040u, 0x10000000u, 0x00040040u, 0x10040000u, 0x10041040u, 0x00041000u,
        0x10041000u, 0x00041040u, 0x00001000u, 0x00000040u, 0x10040000u, 0x10000040u,
        0x10001000u, 0x00001040u, 0x00041000u, 0x00040040u, 0x10040040u, 0x10041000u,
        0x00001040u, 0x00000000u, 0x00000000u, 0x10040040u, 0x10000040u, 0x10001000u,
        0x00041040u, 0x00040000u, 0x00041040u, 0x00040000u, 0x10041000u, 0x00001000u,
        0x00000040u, 0x10040040u, 0x00001000u, 0x00041040u, 0x10001000u, 0x00000040u,
        0x10000040u, 0x10040000u, 0x10040040u, 0x10000000u, 0x00040000u, 0x10001040u,
        0x00000000u, 0x10041040u, 0x00040040u, 0x10000040u, 0x10040000u, 0x10001000u,
        0x10001040u, 0x00000000u, 0x10041040u, 0x00041000u, 0x00041000u, 0x00001040u,
        0x00001040u, 0x00040040u, 0x10000000u, 0x10041000u,
    }},
}};

std::uint32_t read_u32_be(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16)
           | (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

void write_u32_be(std::uint8_t* p, std::uint32_t v) {
    p[0] = static_cast<std::uint8_t>((v >> 24) & 0xFFu);
    p[1] = static_cast<std::uint8_t>((v >> 16) & 0xFFu);
    p[2] = static_cast<std::uint8_t>((v >> 8) & 0xFFu);
    p[3] = static_cast<std::uint8_t>(v & 0xFFu);
}

std::uint32_t rotl(std::uint32_t v, int n) {
    return (v << n) | (v >> (32 - n));
}

std::uint32_t feistel(std::uint32_t half, std::uint32_t k0, std::uint32_t k1) {
    std::uint32_t work = rotl(half, 28) ^ k0;
    std::uint32_t fval = kSpBox[6][work & 0x3Fu] | kSpBox[4][(work >> 8) & 0x3Fu]
                         | kSpBox[2][(work >> 16) & 0x3Fu] | kSpBox[0][(work >> 24) & 0x3Fu];
    work = half ^ k1;
    fval |= kSpBox[7][work & 0x3Fu] | kSpBox[5][(work >> 8) & 0x3Fu]
            | kSpBox[3][(work >> 16) & 0x3Fu] | kSpBox[1][(work >> 24) & 0x3Fu];
    return fval;
}

void crypt_block(const DesRoundKeys& keys, const std::uint8_t* in, std::uint8_t* out) {
    std::uint32_t left = read_u32_be(in);
    std::uint32_t right = read_u32_be(in + 4);
    std::uint32_t work = 0;

    // Initial permutation.
    work = ((left >> 4) ^ right) & 0x0F0F0F0Fu;
    right ^= work;
    left ^= work << 4;
    work = ((left >> 16) ^ right) & 0x0000FFFFu;
    right ^= work;
    left ^= work << 16;
    work = ((right >> 2) ^ left) & 0x33333333u;
    left ^= work;
    right ^= work << 2;
    work = ((right >> 8) ^ left) & 0x00FF00FFu;
    left ^= work;
    right ^= work << 8;
    right = rotl(right, 1);
    work = (left ^ right) & 0xAAAAAAAAu;
    left ^= work;
    right ^= work;
    left = rotl(left, 1);

    for (std::size_t round = 0; round < 8; round++) {
        left ^= feistel(right, keys[round * 4], keys[round * 4 + 1]);
        right ^= feistel(left, keys[round * 4 + 2], keys[round * 4 + 3]);
    }

    // Final permutation.
    right = rotl(right, 31);
    work = (left ^ right) & 0xAAAAAAAAu;
    left ^= work;
    right ^= work;
    left = rotl(left, 31);
    work = ((left >> 8) ^ right) & 0x00FF00FFu;
    right ^= work;
    left ^= work << 8;
    work = ((left >> 2) ^ right) & 0x33333333u;
    right ^= work;
    left ^= work << 2;
    work = ((right >> 16) ^ left) & 0x0000FFFFu;
    left ^= work;
    right ^= work << 16;
    work = ((right >> 4) ^ left) & 0x0F0F0F0Fu;
    left ^= work;
    right ^= work << 4;

    write_u32_be(out, right);
    write_u32_be(out + 4, left);
}
}  // namespace

DesRoundKeys schedule_key(std::span<const std::uint8_t> key, CipherDirection direction) {
    if (key.size() != kDesKeySize) {
        throw CipherError(
            "DES key must be 8 bytes long (got " + std::to_string(key.size()) + ")"
        );
    }

    std::array<bool, 56> pc1m{};
    std::array<bool, 56> pcr{};
    for (std::size_t j = 0; j < 56; j++) {
        const std::uint8_t l = kPermutedChoice1[j];
        pc1m[j] = (key[l >> 3] & (1u << (l & 7u))) != 0;
    }

    DesRoundKeys raw{};
    for (std::size_t i = 0; i < 16; i++) {
        const std::size_t m = direction == CipherDirection::Encrypt ? (i << 1) : ((15 - i) << 1);
        const std::size_t n = m + 1;
        raw[m] = 0;
        raw[n] = 0;

        // Rotate each 28-bit half independently.
        for (std::size_t j = 0; j < 28; j++) {
            const std::size_t l = j + kTotalRotations[i];
            pcr[j] = l < 28 ? pc1m[l] : pc1m[l - 28];
        }
        for (std::size_t j = 28; j < 56; j++) {
            const std::size_t l = j + kTotalRotations[i];
            pcr[j] = l < 56 ? pc1m[l] : pc1m[l - 28];
        }

        for (std::size_t j = 0; j < 24; j++) {
            if (pcr[kPermutedChoice2[j]]) {
                raw[m] |= 0x800000u >> j;
            }
            if (pcr[kPermutedChoice2[j + 24]]) {
                raw[n] |= 0x800000u >> j;
            }
        }
    }

    // Regroup the 6-bit S-box inputs so each round key word lines up with the SP lookups.
    DesRoundKeys out{};
    for (std::size_t i = 0; i < 32; i += 2) {
        const std::uint32_t i1 = raw[i];
        const std::uint32_t i2 = raw[i + 1];
        out[i] = ((i1 & 0x00FC0000u) << 6) | ((i1 & 0x00000FC0u) << 10)
                 | ((i2 & 0x00FC0000u) >> 10) | ((i2 & 0x00000FC0u) >> 6);
        out[i + 1] = ((i1 & 0x0003F000u) << 12) | ((i1 & 0x0000003Fu) << 16)
                     | ((i2 & 0x0003F000u) >> 4) | (i2 & 0x0000003Fu);
    }
    return out;
}

std::vector<std::uint8_t> crypt(std::span<const std::uint8_t> buffer, const DesRoundKeys& keys) {
    if (buffer.size() % kDesBlockSize != 0) {
        throw CipherError(
            "Data length must be a multiple of 8 bytes (got " + std::to_string(buffer.size()) + ")"
        );
    }
    std::vector<std::uint8_t> out(buffer.size());
    for (std::size_t off = 0; off < buffer.size(); off += kDesBlockSize) {
        crypt_block(keys, buffer.data() + off, out.data() + off);
    }
    return out;
}

std::vector<std::uint8_t> encrypt(
    std::span<const std::uint8_t> buffer,
    std::span<const std::uint8_t> key
) {
    return crypt(buffer, schedule_key(key, CipherDirection::Encrypt));
}

std::vector<std::uint8_t> decrypt(
    std::span<const std::uint8_t> buffer,
    std::span<const std::uint8_t> key
) {
    return crypt(buffer, schedule_key(key, CipherDirection::Decrypt));
}

DesCipher::DesCipher(std::span<const std::uint8_t> key)
    : _encrypt_keys(schedule_key(key, CipherDirection::Encrypt)),
      _decrypt_keys(schedule_key(key, CipherDirection::Decrypt)) {}

std::vector<std::uint8_t> DesCipher::encrypt(std::span<const std::uint8_t> buffer) const {
    return crypt(buffer, _encrypt_keys);
}

std::vector<std::uint8_t> DesCipher::decrypt(std::span<const std::uint8_t> buffer) const {
    return crypt(buffer, _decrypt_keys);
}
}  // namespace romc::script
