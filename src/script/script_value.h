/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace romc::script {
// null, boolean, integer, float, string, array (dense 1..N table) or object (any other table).
using LuaValue = nlohmann::ordered_json;

struct TableSnapshot {
    std::string name;
    LuaValue value;
};

// Lua 5.3 tostring() for floats: "%.14g", plus ".0" when the result reads as an integer.
std::string format_lua_number(double v);

// String form used for a table key once the table is rendered as an object.
std::string key_to_string(const LuaValue& key);

/**
 * Collects the key/value pairs of one table and decides its shape. The result is an array
 * when every key is a positive integer and the keys are exactly 1..N; otherwise it is an
 * object with numeric keys first (ascending) and the rest ordered by their string form.
 */
class TableBuilder {
   public:
    void add(const LuaValue& key, LuaValue value);
    // Next implicit index for positional constructor fields ({a, b, c}).
    std::int64_t next_position() { return ++_position; }

    bool empty() const { return _positional.empty() && _keyed.empty(); }
    LuaValue build() &&;

   private:
    std::map<std::int64_t, LuaValue> _positional;
    std::vector<std::pair<LuaValue, LuaValue>> _keyed;
    bool _array_candidate = true;
    std::int64_t _position = 0;
};

// UTF-8 decode that drops invalid sequences instead of failing.
std::string decode_utf8_lossy(std::span<const std::uint8_t> bytes);

/**
 * Encodes script text held as UTF-16 code units. Text with a lone surrogate is emitted as
 * UTF-16LE with every unit preserved; anything else becomes UTF-8.
 */
std::vector<std::uint8_t> coerce_script_bytes(std::u16string_view text);
}  // namespace romc::script
