/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_chunk.h"
#include "script/script_errors.h"

#include <algorithm>
#include <array>
#include <cstring>

namespace romc::script {
static void write_u64_le(std::vector<std::uint8_t>& out, std::uint64_t v) {
    for (int i = 0; i < 8; i++) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
    }
}

std::vector<std::uint8_t> build_luac_header(const LuacHeaderLayout& layout) {
    static constexpr std::array<std::uint8_t, 4> kSignature = {0x1B, 'L', 'u', 'a'};
    static constexpr std::array<std::uint8_t, 6> kLuacData = {0x19, 0x93, 0x0D, 0x0A, 0x1A, 0x0A};

    std::vector<std::uint8_t> out;
    out.reserve(33);
    out.insert(out.end(), kSignature.begin(), kSignature.end());
    out.push_back(layout.version);
    out.push_back(layout.format);
    out.insert(out.end(), kLuacData.begin(), kLuacData.end());
    out.push_back(layout.sizeof_int);
    out.push_back(layout.sizeof_size_t);
    out.push_back(layout.sizeof_instruction);
    out.push_back(layout.sizeof_integer);
    out.push_back(layout.sizeof_number);
    write_u64_le(out, layout.check_integer);

    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(layout.check_number));
    std::memcpy(&bits, &layout.check_number, sizeof(bits));
    write_u64_le(out, bits);
    return out;
}

bool has_script_marker(std::span<const std::uint8_t> blob) {
    return !blob.empty() && blob[0] == kScriptMarker;
}

std::vector<std::uint8_t> synthesize_chunk(std::span<const std::uint8_t> blob) {
    if (blob.size() < kMinEncodedChunkSize || blob[0] != kScriptMarker) {
        throw FormatError("Unsupported Lua blob format");
    }

    const auto payload = blob.subspan(kMinEncodedChunkSize);
    const auto zero = std::find(payload.begin(), payload.end(), std::uint8_t{0});
    if (zero == payload.end()) {
        throw FormatError("Malformed Lua payload (missing null terminator)");
    }
    auto start = zero + 1;
    while (start != payload.end() && *start == 0) {
        ++start;
    }

    std::vector<std::uint8_t> out = build_luac_header();
    out.insert(out.end(), start, payload.end());
    return out;
}
}  // namespace romc::script
