/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "script/script_literal.h"
#include "script/script_errors.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>

namespace romc::script {
namespace {
constexpr std::string_view kAnchor = "id=";
// Same limit the Lua 5.3 parser puts on nested constructors (LUAI_MAXCCALLS).
constexpr int kMaxTableNesting = 200;

enum class ScanState { Normal, InString, Escaped };

struct Anchor {
    std::size_t pos;
    // Innermost `{` still open at `pos`, skipping braces inside quoted strings.
    std::optional<std::size_t> open_brace;
};

std::vector<Anchor> find_anchors(std::string_view text) {
    std::vector<Anchor> anchors;
    std::vector<std::size_t> open;
    ScanState state = ScanState::Normal;
    for (std::size_t i = 0; i < text.size(); i++) {
        if (text.compare(i, kAnchor.size(), kAnchor) == 0) {
            Anchor anchor{i, std::nullopt};
            if (!open.empty()) {
                anchor.open_brace = open.back();
            }
            anchors.push_back(anchor);
        }
        const char c = text[i];
        switch (state) {
            case ScanState::Normal:
                if (c == '\'') {
                    state = ScanState::InString;
                } else if (c == '{') {
                    open.push_back(i);
                } else if (c == '}' && !open.empty()) {
                    open.pop_back();
                }
                break;
            case ScanState::InString:
                if (c == '\\') {
                    state = ScanState::Escaped;
                } else if (c == '\'') {
                    state = ScanState::Normal;
                }
                break;
            case ScanState::Escaped:
                state = ScanState::InString;
                break;
        }
    }
    return anchors;
}

bool is_assigned_table(std::string_view text, std::size_t brace) {
    if (brace == 0) {
        return false;
    }
    const char prev = text[brace - 1];
    if (prev == '=') {
        return true;
    }
    return prev == '{' && brace > 1 && text[brace - 2] == '=';
}

// End (exclusive) of the balanced block opened at `start`, or nullopt when it never closes.
std::optional<std::size_t> match_block(std::string_view text, std::size_t start) {
    ScanState state = ScanState::Normal;
    int depth = 0;
    for (std::size_t i = start; i < text.size(); i++) {
        const char c = text[i];
        switch (state) {
            case ScanState::Normal:
                if (c == '\'') {
                    state = ScanState::InString;
                } else if (c == '{') {
                    depth++;
                } else if (c == '}') {
                    depth--;
                    if (depth == 0) {
                        return i + 1;
                    }
                }
                break;
            case ScanState::InString:
                if (c == '\\') {
                    state = ScanState::Escaped;
                } else if (c == '\'') {
                    state = ScanState::Normal;
                }
                break;
            case ScanState::Escaped:
                state = ScanState::InString;
                break;
        }
    }
    return std::nullopt;
}

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_hex_digit(char c) {
    return is_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

int hex_value(char c) {
    if (is_digit(c)) {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    return c - 'A' + 10;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
        out.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        out.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    }
}

// Integral float keys index the same slot as the integer (t[1.0] is t[1]).
LuaValue normalize_key(LuaValue key) {
    if (key.is_number_float()) {
        const double d = key.get<double>();
        if (std::isfinite(d) && std::floor(d) == d && d >= -9.2233720368547758e18
            && d < 9.2233720368547758e18) {
            return LuaValue(static_cast<std::int64_t>(d));
        }
    }
    return key;
}

class LiteralReader {
   public:
    explicit LiteralReader(std::string_view text) : _text(text), _pos(0), _depth(0) {}

    LuaValue read_document() {
        LuaValue v = read_value();
        skip_space();
        if (_pos != _text.size()) {
            fail("trailing characters");
        }
        return v;
    }

   private:
    [[noreturn]] void fail(const std::string& what) const {
        throw FormatError("Lua literal: " + what + " at offset " + std::to_string(_pos));
    }

    bool at_end() const { return _pos >= _text.size(); }
    char peek(std::size_t ahead = 0) const {
        return _pos + ahead < _text.size() ? _text[_pos + ahead] : '\0';
    }

    // Level of a long bracket opening at _pos (`[[` is 0, `[==[` is 2), or -1.
    int long_bracket_level() const {
        if (peek() != '[') {
            return -1;
        }
        std::size_t i = 1;
        while (peek(i) == '=') {
            i++;
        }
        return peek(i) == '[' ? static_cast<int>(i - 1) : -1;
    }

    std::string read_long_bracket(int level) {
        _pos += static_cast<std::size_t>(level) + 2;
        // A newline right after the opening bracket is not part of the string.
        if (peek() == '\r' || peek() == '\n') {
            const char first = peek();
            _pos++;
            if ((peek() == '\r' || peek() == '\n') && peek() != first) {
                _pos++;
            }
        }
        const std::string close = "]" + std::string(static_cast<std::size_t>(level), '=') + "]";
        const std::size_t end = _text.find(close, _pos);
        if (end == std::string_view::npos) {
            fail("unterminated long bracket");
        }
        std::string out(_text.substr(_pos, end - _pos));
        _pos = end + close.size();
        return out;
    }

    void skip_space() {
        while (!at_end()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
                _pos++;
                continue;
            }
            if (c == '-' && peek(1) == '-') {
                _pos += 2;
                const int level = long_bracket_level();
                if (level >= 0) {
                    read_long_bracket(level);
                    continue;
                }
                while (!at_end() && peek() != '\n') {
                    _pos++;
                }
                continue;
            }
            break;
        }
    }

    LuaValue read_value() {
        skip_space();
        if (at_end()) {
            fail("unexpected end of input");
        }
        const char c = peek();
        if (c == '{') {
            return read_table();
        }
        if (c == '"' || c == '\'') {
            return read_quoted();
        }
        if (c == '[') {
            const int level = long_bracket_level();
            if (level < 0) {
                fail("unexpected '['");
            }
            return read_long_bracket(level);
        }
        if (is_digit(c) || c == '-' || c == '+' || (c == '.' && is_digit(peek(1)))) {
            return read_number();
        }
        if (is_ident_start(c)) {
            const std::string word = read_identifier();
            if (word == "true") {
                return true;
            }
            if (word == "false") {
                return false;
            }
            if (word == "nil") {
                return nullptr;
            }
            return word;
        }
        fail(std::string("unexpected character '") + c + "'");
    }

    std::string read_identifier() {
        const std::size_t start = _pos;
        while (!at_end() && is_ident_char(peek())) {
            _pos++;
        }
        return std::string(_text.substr(start, _pos - start));
    }

    LuaValue read_number() {
        bool negative = false;
        while (peek() == '-' || peek() == '+') {
            if (peek() == '-') {
                negative = !negative;
            }
            _pos++;
            skip_space();
        }

        const std::size_t start = _pos;
        const bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
        bool is_float = false;
        if (hex) {
            _pos += 2;
            while (!at_end()) {
                const char c = peek();
                if (is_hex_digit(c)) {
                    _pos++;
                } else if (c == '.') {
                    is_float = true;
                    _pos++;
                } else if (c == 'p' || c == 'P') {
                    is_float = true;
                    _pos++;
                    if (peek() == '+' || peek() == '-') {
                        _pos++;
                    }
                } else {
                    break;
                }
            }
        } else {
            while (!at_end()) {
                const char c = peek();
                if (is_digit(c)) {
                    _pos++;
                } else if (c == '.') {
                    is_float = true;
                    _pos++;
                } else if (c == 'e' || c == 'E') {
                    is_float = true;
                    _pos++;
                    if (peek() == '+' || peek() == '-') {
                        _pos++;
                    }
                } else {
                    break;
                }
            }
        }

        const std::string token(_text.substr(start, _pos - start));
        if (token.empty() || token == "0x" || token == "0X" || token == ".") {
            fail("malformed number");
        }

        if (hex && !is_float) {
            // Hex integers wrap around on overflow.
            std::uint64_t v = 0;
            for (std::size_t i = 2; i < token.size(); i++) {
                v = (v << 4) | static_cast<std::uint64_t>(hex_value(token[i]));
            }
            const auto s = static_cast<std::int64_t>(v);
            return LuaValue(negative ? static_cast<std::int64_t>(0 - v) : s);
        }

        if (!is_float) {
            errno = 0;
            char* end = nullptr;
            const unsigned long long v = std::strtoull(token.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') {
                const auto limit = static_cast<unsigned long long>(
                    std::numeric_limits<std::int64_t>::max()
                );
                if (v <= limit) {
                    const auto s = static_cast<std::int64_t>(v);
                    return LuaValue(negative ? -s : s);
                }
                if (negative && v == limit + 1) {
                    return LuaValue(std::numeric_limits<std::int64_t>::min());
                }
            }
            // Decimal integers that do not fit become floats.
        }

        char* end = nullptr;
        const double d = std::strtod(token.c_str(), &end);
        if (!end || *end != '\0') {
            fail("malformed number '" + token + "'");
        }
        return LuaValue(negative ? -d : d);
    }

    std::string read_quoted() {
        const char quote = peek();
        _pos++;
        std::string out;
        while (true) {
            if (at_end()) {
                fail("unterminated string");
            }
            const char c = peek();
            if (c == quote) {
                _pos++;
                return out;
            }
            if (c == '\n') {
                fail("unfinished string");
            }
            if (c != '\\') {
                out.push_back(c);
                _pos++;
                continue;
            }
            _pos++;
            read_escape(out);
        }
    }

    void read_escape(std::string& out) {
        if (at_end()) {
            fail("unterminated escape");
        }
        const char c = peek();
        _pos++;
        switch (c) {
            case 'n': out.push_back('\n'); return;
            case 't': out.push_back('\t'); return;
            case 'r': out.push_back('\r'); return;
            case 'a': out.push_back('\a'); return;
            case 'b': out.push_back('\b'); return;
            case 'f': out.push_back('\f'); return;
            case 'v': out.push_back('\v'); return;
            case '\\': out.push_back('\\'); return;
            case '"': out.push_back('"'); return;
            case '\'': out.push_back('\''); return;
            case '\n': out.push_back('\n'); return;
            case '\r':
                if (peek() == '\n') {
                    _pos++;
                }
                out.push_back('\n');
                return;
            case 'x': {
                if (!is_hex_digit(peek()) || !is_hex_digit(peek(1))) {
                    fail("hexadecimal digit expected");
                }
                out.push_back(static_cast<char>(hex_value(peek()) * 16 + hex_value(peek(1))));
                _pos += 2;
                return;
            }
            case 'z':
                while (!at_end() && (peek() == ' ' || peek() == '\t' || peek() == '\r'
                                     || peek() == '\n' || peek() == '\f' || peek() == '\v')) {
                    _pos++;
                }
                return;
            case 'u': {
                if (peek() != '{') {
                    fail("missing '{' in \\u{xxxx}");
                }
                _pos++;
                std::uint32_t cp = 0;
                bool any = false;
                while (is_hex_digit(peek())) {
                    cp = (cp << 4) | static_cast<std::uint32_t>(hex_value(peek()));
                    if (cp > 0x7FFFFFFFu) {
                        fail("UTF-8 value too large");
                    }
                    any = true;
                    _pos++;
                }
                if (!any || peek() != '}') {
                    fail("malformed \\u{xxxx} escape");
                }
                _pos++;
                append_utf8(out, cp);
                return;
            }
            default:
                break;
        }
        if (is_digit(c)) {
            int v = c - '0';
            for (int i = 0; i < 2 && is_digit(peek()); i++) {
                v = v * 10 + (peek() - '0');
                _pos++;
            }
            if (v > 255) {
                fail("decimal escape too large");
            }
            out.push_back(static_cast<char>(v));
            return;
        }
        fail(std::string("invalid escape sequence '\\") + c + "'");
    }

    LuaValue read_table() {
        if (++_depth > kMaxTableNesting) {
            fail("table nesting too deep");
        }
        _pos++;  // {
        TableBuilder builder;
        while (true) {
            skip_space();
            if (at_end()) {
                fail("unterminated table");
            }
            if (peek() == '}') {
                _pos++;
                break;
            }

            if (peek() == '[' && long_bracket_level() < 0) {
                _pos++;
                LuaValue key = normalize_key(read_value());
                skip_space();
                if (peek() != ']') {
                    fail("expected ']'");
                }
                _pos++;
                expect_assign();
                LuaValue value = read_value();
                if (key.is_null()) {
                    fail("table index is nil");
                }
                if (!value.is_null()) {
                    builder.add(key, std::move(value));
                }
            } else if (is_ident_start(peek()) && named_field_ahead()) {
                const std::string name = read_identifier();
                expect_assign();
                LuaValue value = read_value();
                if (!value.is_null()) {
                    builder.add(LuaValue(name), std::move(value));
                }
            } else {
                const std::int64_t index = builder.next_position();
                LuaValue value = read_value();
                if (!value.is_null()) {
                    builder.add(LuaValue(index), std::move(value));
                }
            }

            skip_space();
            if (peek() == ',' || peek() == ';') {
                _pos++;
                continue;
            }
            if (peek() == '}') {
                _pos++;
                break;
            }
            fail("expected ',' or '}'");
        }
        _depth--;
        return std::move(builder).build();
    }

    // Identifier followed by a single `=` (not `==`).
    bool named_field_ahead() const {
        std::size_t i = _pos;
        while (i < _text.size() && is_ident_char(_text[i])) {
            i++;
        }
        while (i < _text.size() && (_text[i] == ' ' || _text[i] == '\t' || _text[i] == '\r'
                                    || _text[i] == '\n')) {
            i++;
        }
        return i < _text.size() && _text[i] == '=' && (i + 1 >= _text.size() || _text[i + 1] != '=');
    }

    void expect_assign() {
        skip_space();
        if (peek() != '=') {
            fail("expected '='");
        }
        _pos++;
    }

    std::string_view _text;
    std::size_t _pos;
    int _depth;
};
}  // namespace

std::vector<std::string> scan_literal_tables(std::string_view text) {
    std::vector<std::string> out;
    std::size_t pos = 0;
    for (const auto& anchor : find_anchors(text)) {
        if (anchor.pos < pos) {
            continue;
        }
        if (!anchor.open_brace.has_value() || is_assigned_table(text, *anchor.open_brace)) {
            continue;
        }
        const std::size_t start = *anchor.open_brace;
        const auto end = match_block(text, start);
        if (!end.has_value()) {
            continue;
        }
        out.emplace_back(text.substr(start, *end - start));
        pos = *end;
    }
    return out;
}

LuaValue decode_lua_literal(std::string_view text) {
    LiteralReader reader(text);
    return reader.read_document();
}

std::vector<LuaValue> parse_records(std::string_view text) {
    std::vector<LuaValue> records;
    for (const auto& snippet : scan_literal_tables(text)) {
        try {
            records.push_back(decode_lua_literal(snippet));
        } catch (const FormatError&) {
            continue;
        }
    }
    return records;
}
}  // namespace romc::script
