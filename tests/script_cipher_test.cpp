/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include <gtest/gtest.h>

#include "script/script_cipher.h"
#include "script/script_errors.h"
#include "script/script_payload.h"
#include "test_helpers.h"

namespace romc::script {
namespace {
using test::from_hex;

TEST(DesCipherTest, ZeroBlockWithRomKey) {
    const std::vector<std::uint8_t> zero(8, 0);
    EXPECT_EQ(encrypt(zero, kRomKey), from_hex("e6118ceecfd243a8"));
}

TEST(DesCipherTest, TwoBlocksWithRomKey) {
    std::vector<std::uint8_t> plain(16);
    for (std::size_t i = 0; i < plain.size(); i++) {
        plain[i] = static_cast<std::uint8_t>(i);
    }
    EXPECT_EQ(encrypt(plain, kRomKey), from_hex("2731401c9d9392ba86bc498b3cf19ecd"));
}

// Key bytes are read LSB first, so the textbook key 133457799BBCDFF1 appears bit-reversed.
TEST(DesCipherTest, TextbookVectorWithBitReversedKey) {
    const auto key = from_hex("c82cea9ed93dfb8f");
    const auto plain = from_hex("0123456789abcdef");
    const auto cipher = encrypt(plain, key);
    EXPECT_EQ(cipher, from_hex("85e813540f0ab405"));
    EXPECT_EQ(decrypt(cipher, key), plain);
}

TEST(DesCipherTest, DecryptInvertsEncrypt) {
    std::vector<std::uint8_t> plain(64);
    for (std::size_t i = 0; i < plain.size(); i++) {
        plain[i] = static_cast<std::uint8_t>(i * 37 + 11);
    }
    const std::vector<std::vector<std::uint8_t>> keys = {
        {0, 0, 0, 0, 0, 0, 0, 0},
        {0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF},
        {2, 5, 9, 3, 6, 1, 0, 1},
        {0x13, 0x34, 0x57, 0x79, 0x9B, 0xBC, 0xDF, 0xF1},
    };
    for (const auto& key : keys) {
        const auto cipher = encrypt(plain, key);
        EXPECT_NE(cipher, plain);
        EXPECT_EQ(decrypt(cipher, key), plain);
    }
}

TEST(DesCipherTest, CipherObjectMatchesFreeFunctions) {
    const DesCipher cipher(kRomKey);
    const auto plain = from_hex("00112233445566778899aabbccddeeff");
    EXPECT_EQ(cipher.encrypt(plain), encrypt(plain, kRomKey));
    EXPECT_EQ(cipher.decrypt(cipher.encrypt(plain)), plain);
}

TEST(DesCipherTest, EmptyBufferIsEmpty) {
    EXPECT_TRUE(encrypt({}, kRomKey).empty());
}

TEST(DesCipherTest, RejectsBadKeyLength) {
    const std::vector<std::uint8_t> block(8, 0);
    const std::vector<std::uint8_t> short_key(7, 1);
    const std::vector<std::uint8_t> long_key(16, 1);
    EXPECT_THROW(encrypt(block, short_key), CipherError);
    EXPECT_THROW(decrypt(block, long_key), CipherError);
    EXPECT_THROW(DesCipher{short_key}, CipherError);
}

TEST(DesCipherTest, RejectsUnalignedBuffer) {
    const std::vector<std::uint8_t> buf(12, 0);
    EXPECT_THROW(encrypt(buf, kRomKey), CipherError);
    EXPECT_THROW(decrypt(buf, kRomKey), CipherError);
}
}  // namespace
}  // namespace romc::script
