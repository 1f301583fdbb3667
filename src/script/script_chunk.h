/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace romc::script {
constexpr std::uint8_t kScriptMarker = 0x2A;
constexpr std::size_t kOpaqueRegionSize = 0x100;
constexpr std::size_t kMinEncodedChunkSize = 1 + kOpaqueRegionSize;

struct LuacHeaderLayout {
    std::uint8_t version = 0x53;
    std::uint8_t format = 0x00;
    std::uint8_t sizeof_int = 4;
    std::uint8_t sizeof_size_t = 4;
    std::uint8_t sizeof_instruction = 4;
    std::uint8_t sizeof_integer = 8;
    std::uint8_t sizeof_number = 8;
    std::uint64_t check_integer = 0x5678;
    double check_number = 370.5;
};

// Lua 5.3 chunk header as the game's 32-bit interpreter writes it.
std::vector<std::uint8_t> build_luac_header(const LuacHeaderLayout& layout = {});

bool has_script_marker(std::span<const std::uint8_t> blob);

/**
 * Rebuilds a loadable chunk from a marker blob:
 *   0x2A | 256 opaque bytes | source path '\0' [padding '\0'...] | opcode stream
 * The opcode stream is returned behind a canonical header. Throws FormatError for short
 * blobs, a wrong marker, or a missing path terminator.
 */
std::vector<std::uint8_t> synthesize_chunk(std::span<const std::uint8_t> blob);
}  // namespace romc::script
