/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "script/script_value.h"

#include <string>
#include <string_view>
#include <vector>

namespace romc::script {
/**
 * Top-level `{...}` snippets anchored on an `id=` field. For each `id=` the nearest unmatched
 * `{` to its left opens the snippet, unless that brace is assigned (`={`) or is the first
 * element of an assigned table (`={{`). Single-quoted strings are skipped while matching
 * braces.
 */
std::vector<std::string> scan_literal_tables(std::string_view text);

// Decodes one Lua literal (table constructor, string, number, boolean, nil or bare word).
// Throws FormatError on malformed input.
LuaValue decode_lua_literal(std::string_view text);

// scan_literal_tables + decode_lua_literal. Snippets that fail to decode are dropped.
std::vector<LuaValue> parse_records(std::string_view text);
}  // namespace romc::script
