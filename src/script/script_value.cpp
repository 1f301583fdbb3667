/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_value.h"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace romc::script {
std::string format_lua_number(double v) {
    if (std::isnan(v)) {
        return std::signbit(v) ? "-nan" : "nan";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-inf" : "inf";
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.14g", v);
    std::string out(buf);
    if (out.find_first_of(".eEn") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string key_to_string(const LuaValue& key) {
    if (key.is_string()) {
        return key.get<std::string>();
    }
    if (key.is_number_integer()) {
        return std::to_string(key.get<std::int64_t>());
    }
    if (key.is_number_unsigned()) {
        return std::to_string(key.get<std::uint64_t>());
    }
    if (key.is_number_float()) {
        return format_lua_number(key.get<double>());
    }
    if (key.is_boolean()) {
        return key.get<bool>() ? "true" : "false";
    }
    return key.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

static bool positive_integer_key(const LuaValue& key, std::int64_t& out) {
    if (key.is_number_unsigned()) {
        const auto v = key.get<std::uint64_t>();
        if (v >= 1 && v <= static_cast<std::uint64_t>(INT64_MAX)) {
            out = static_cast<std::int64_t>(v);
            return true;
        }
        return false;
    }
    if (key.is_number_integer()) {
        const auto v = key.get<std::int64_t>();
        if (v >= 1) {
            out = v;
            return true;
        }
    }
    return false;
}

void TableBuilder::add(const LuaValue& key, LuaValue value) {
    // A table cannot hold a nil key. Null values stay: they mark cycles and unsupported types.
    if (key.is_null()) {
        return;
    }
    std::int64_t index = 0;
    if (positive_integer_key(key, index)) {
        _positional[index] = std::move(value);
        return;
    }
    _array_candidate = false;
    _keyed.emplace_back(key, std::move(value));
}

LuaValue TableBuilder::build() && {
    if (_array_candidate && !_positional.empty()
        && static_cast<std::uint64_t>(_positional.rbegin()->first) == _positional.size()) {
        LuaValue out = LuaValue::array();
        for (auto& [index, value] : _positional) {
            out.push_back(std::move(value));
        }
        return out;
    }

    std::vector<std::pair<LuaValue, LuaValue>> entries;
    entries.reserve(_positional.size() + _keyed.size());
    for (auto& [index, value] : _positional) {
        entries.emplace_back(LuaValue(index), std::move(value));
    }
    for (auto& kv : _keyed) {
        entries.push_back(std::move(kv));
    }
    std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        const bool an = a.first.is_number();
        const bool bn = b.first.is_number();
        if (an && bn) {
            if (a.first.is_number_float() || b.first.is_number_float()) {
                return a.first.template get<double>() < b.first.template get<double>();
            }
            return a.first.template get<std::int64_t>() < b.first.template get<std::int64_t>();
        }
        if (an != bn) {
            return an;
        }
        return key_to_string(a.first) < key_to_string(b.first);
    });

    LuaValue out = LuaValue::object();
    for (auto& [key, value] : entries) {
        out[key_to_string(key)] = std::move(value);
    }
    return out;
}

std::string decode_utf8_lossy(std::span<const std::uint8_t> bytes) {
    std::string out;
    out.reserve(bytes.size());
    std::size_t i = 0;
    while (i < bytes.size()) {
        const std::uint8_t b0 = bytes[i];
        if (b0 < 0x80) {
            out.push_back(static_cast<char>(b0));
            i++;
            continue;
        }

        std::size_t len = 0;
        std::uint32_t min_cp = 0;
        std::uint32_t cp = 0;
        if ((b0 & 0xE0u) == 0xC0u) {
            len = 2;
            min_cp = 0x80;
            cp = b0 & 0x1Fu;
        } else if ((b0 & 0xF0u) == 0xE0u) {
            len = 3;
            min_cp = 0x800;
            cp = b0 & 0x0Fu;
        } else if ((b0 & 0xF8u) == 0xF0u) {
            len = 4;
            min_cp = 0x10000;
            cp = b0 & 0x07u;
        } else {
            i++;
            continue;
        }

        bool ok = i + len <= bytes.size();
        for (std::size_t k = 1; ok && k < len; k++) {
            const std::uint8_t b = bytes[i + k];
            if ((b & 0xC0u) != 0x80u) {
                ok = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3Fu);
        }
        if (!ok || cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            i++;
            continue;
        }
        out.append(reinterpret_cast<const char*>(bytes.data() + i), len);
        i += len;
    }
    return out;
}

static void append_utf8(std::vector<std::uint8_t>& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<std::uint8_t>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<std::uint8_t>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<std::uint8_t>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<std::uint8_t>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<std::uint8_t>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<std::uint8_t>(0x80u | (cp & 0x3Fu)));
    } else {
        out.push_back(static_cast<std::uint8_t>(0xF0u | (cp >> 18)));
        out.push_back(static_cast<std::uint8_t>(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back(static_cast<std::uint8_t>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<std::uint8_t>(0x80u | (cp & 0x3Fu)));
    }
}

static bool is_high_surrogate(char16_t c) { return c >= 0xD800 && c <= 0xDBFF; }
static bool is_low_surrogate(char16_t c) { return c >= 0xDC00 && c <= 0xDFFF; }

std::vector<std::uint8_t> coerce_script_bytes(std::u16string_view text) {
    bool lone_surrogate = false;
    for (std::size_t i = 0; i < text.size(); i++) {
        if (is_high_surrogate(text[i]) && i + 1 < text.size() && is_low_surrogate(text[i + 1])) {
            i++;
            continue;
        }
        if (is_high_surrogate(text[i]) || is_low_surrogate(text[i])) {
            lone_surrogate = true;
            break;
        }
    }

    std::vector<std::uint8_t> out;
    if (lone_surrogate) {
        out.reserve(text.size() * 2);
        for (char16_t c : text) {
            out.push_back(static_cast<std::uint8_t>(c & 0xFFu));
            out.push_back(static_cast<std::uint8_t>((c >> 8) & 0xFFu));
        }
        return out;
    }

    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); i++) {
        std::uint32_t cp = text[i];
        if (is_high_surrogate(text[i])) {
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (static_cast<std::uint32_t>(text[i + 1]) - 0xDC00u);
            i++;
        }
        append_utf8(out, cp);
    }
    return out;
}
}  // namespace romc::script
