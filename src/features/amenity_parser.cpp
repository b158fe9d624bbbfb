/// @file src/features/amenity_parser.cpp
/// @brief Amenity text parser.
///
/// Every failure path returns a Malformed parse; no function here throws on
/// bad text.

#include "strp/amenity.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace strp::features {

// ─── Internal helpers (file-local) ────────────────────────────────────────────

namespace {

[[nodiscard]] bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

[[nodiscard]] bool is_control(char c) noexcept {
    const auto u = static_cast<unsigned char>(c);
    return (u < 0x20 && !is_space(c)) || u == 0x7f;
}

[[nodiscard]] bool is_quote(char c) noexcept { return c == '"' || c == '\''; }

[[nodiscard]] bool is_bracket(char c) noexcept {
    return c == '[' || c == ']' || c == '{' || c == '}';
}

[[nodiscard]] std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
    return s;
}

[[nodiscard]] AmenityParse malformed() {
    return AmenityParse{.amenities = {}, .status = AmenityParseStatus::Malformed};
}

[[nodiscard]] std::optional<unsigned> hex_digit(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<unsigned>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<unsigned>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<unsigned>(c - 'A' + 10);
    return std::nullopt;
}

/// Four hex digits at `s[at..at+4)`.
[[nodiscard]] std::optional<char32_t> read_hex4(std::string_view s, std::size_t at) noexcept {
    if (at + 4 > s.size()) return std::nullopt;
    char32_t v = 0;
    for (std::size_t k = 0; k < 4; ++k) {
        const auto d = hex_digit(s[at + k]);
        if (!d) return std::nullopt;
        v = (v << 4) | *d;
    }
    return v;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    } else {
        out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
    }
}

/// Decode a `\uXXXX` escape (or a surrogate pair) whose `u` is at `body[i]`.
/// On success appends UTF-8 and advances `i` past the escape.
[[nodiscard]] bool decode_unicode_escape(std::string_view body, std::size_t& i, std::string& out) {
    const auto hi = read_hex4(body, i + 1);
    if (!hi) return false;
    if (*hi >= 0xdc00 && *hi <= 0xdfff) return false;
    if (*hi < 0xd800 || *hi > 0xdbff) {
        append_utf8(out, *hi);
        i += 5;
        return true;
    }
    // High surrogate: only a following low surrogate completes it.
    if (i + 6 >= body.size() || body[i + 5] != '\\' || body[i + 6] != 'u') return false;
    const auto lo = read_hex4(body, i + 7);
    if (!lo || *lo < 0xdc00 || *lo > 0xdfff) return false;
    append_utf8(out, 0x10000 + ((*hi - 0xd800) << 10) + (*lo - 0xdc00));
    i += 11;
    return true;
}

/// Parse the inside of a bracketed list. nullopt on malformed content.
///
/// An entry is quoted only when the quote is its first character; quotes
/// inside a bare entry (`Chef's kitchen`) are literal text.
[[nodiscard]] std::optional<std::set<std::string>> parse_list_body(std::string_view body) {
    std::set<std::string> out;
    std::size_t i = 0;
    const std::size_t n = body.size();

    auto skip_ws = [&] { while (i < n && is_space(body[i])) ++i; };

    while (true) {
        skip_ws();
        if (i == n) break;
        if (body[i] == ',') {  // empty entry
            ++i;
            continue;
        }

        std::string token;
        if (is_quote(body[i])) {
            const char q = body[i++];
            bool closed = false;
            while (i < n) {
                const char c = body[i++];
                if (c == '\\') {
                    if (i == n) return std::nullopt;
                    const char e = body[i];
                    if (e == 'u') {
                        // Undecodable \u sequences are kept verbatim.
                        if (!decode_unicode_escape(body, i, token)) token.push_back('\\');
                        continue;
                    }
                    ++i;
                    switch (e) {
                        case 'n': token.push_back('\n'); break;
                        case 't': token.push_back('\t'); break;
                        case 'r': token.push_back('\r'); break;
                        default:  token.push_back(e);     break;
                    }
                } else if (c == q) {
                    closed = true;
                    break;
                } else {
                    token.push_back(c);
                }
            }
            if (!closed) return std::nullopt;
        } else {
            while (i < n && body[i] != ',') {
                if (is_bracket(body[i])) return std::nullopt;
                token.push_back(body[i++]);
            }
        }

        const auto t = trim(token);
        if (!t.empty()) out.emplace(t);

        skip_ws();
        if (i == n) break;
        if (body[i] != ',') return std::nullopt;  // text after a closing quote
        ++i;
    }
    return out;
}

[[nodiscard]] std::optional<std::set<std::string>> parse_delimited(std::string_view text) {
    std::set<std::string> out;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto comma = text.find(',', start);
        const auto end   = comma == std::string_view::npos ? text.size() : comma;
        auto t = trim(text.substr(start, end - start));

        // A leading quote must be closed by the token's last character;
        // any other quote is part of the name.
        if (!t.empty() && is_quote(t.front())) {
            if (t.size() < 2 || t.back() != t.front()) return std::nullopt;
            t = trim(t.substr(1, t.size() - 2));
        }
        if (std::any_of(t.begin(), t.end(), is_bracket)) return std::nullopt;
        if (!t.empty()) out.emplace(t);

        if (comma == std::string_view::npos) break;
        start = comma + 1;
    }
    return out;
}

}  // namespace

// ─── Public API ──────────────────────────────────────────────────────────────

const char* to_string(AmenityParseStatus status) noexcept {
    switch (status) {
        case AmenityParseStatus::Empty:      return "empty";
        case AmenityParseStatus::Structured: return "structured";
        case AmenityParseStatus::Delimited:  return "delimited";
        case AmenityParseStatus::Malformed:  return "malformed";
    }
    return "unknown";
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

AmenityParse parse_amenities(std::string_view raw) {
    const auto text = trim(raw);
    if (text.empty()) return {};
    if (std::any_of(text.begin(), text.end(), is_control)) return malformed();

    const char open = text.front();
    if (open == '[' || open == '{') {
        const char close = open == '[' ? ']' : '}';
        if (text.size() < 2 || text.back() != close) return malformed();
        auto set = parse_list_body(text.substr(1, text.size() - 2));
        if (!set) return malformed();
        return AmenityParse{.amenities = std::move(*set), .status = AmenityParseStatus::Structured};
    }

    auto set = parse_delimited(text);
    if (!set) return malformed();
    return AmenityParse{.amenities = std::move(*set), .status = AmenityParseStatus::Delimited};
}

}  // namespace strp::features
