#include "http/text_util.hpp"

#include <cctype>
#include <cstdint>

namespace text {

namespace {

constexpr std::string_view kWhitespace = " \t\n\r\f\v";
constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

bool is_continuation(uint8_t b) { return (b & 0xC0) == 0x80; }

// Unicode whitespace, plus the C0 information separators.
bool is_unicode_space(char32_t cp) {
    switch (cp) {
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return (cp >= 0x09 && cp <= 0x0D) || (cp >= 0x1C && cp <= 0x20) ||
                   (cp >= 0x2000 && cp <= 0x200A);
    }
}

// Decodes the sequence starting at s[0]; len is 0 if it is not well formed.
char32_t decode_one(std::string_view s, size_t& len) {
    len = 0;
    if (s.empty()) return 0;
    auto lead = static_cast<uint8_t>(s[0]);
    size_t need;
    char32_t cp;
    if (lead < 0x80) { len = 1; return lead; }
    if ((lead & 0xE0) == 0xC0) { need = 1; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { need = 2; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { need = 3; cp = lead & 0x07; }
    else return 0;

    if (s.size() <= need) return 0;
    for (size_t k = 1; k <= need; ++k) {
        auto b = static_cast<uint8_t>(s[k]);
        if (!is_continuation(b)) return 0;
        cp = (cp << 6) | (b & 0x3F);
    }
    len = need + 1;
    return cp;
}

} // namespace

std::string_view trim(std::string_view s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string_view trim_unicode(std::string_view utf8) {
    size_t len;
    while (!utf8.empty()) {
        char32_t cp = decode_one(utf8, len);
        if (len == 0 || !is_unicode_space(cp)) break;
        utf8.remove_prefix(len);
    }
    while (!utf8.empty()) {
        size_t start = utf8.size() - 1;
        while (start > 0 && is_continuation(static_cast<uint8_t>(utf8[start]))) --start;
        char32_t cp = decode_one(utf8.substr(start), len);
        if (len != utf8.size() - start || !is_unicode_space(cp)) break;
        utf8.remove_suffix(len);
    }
    return utf8;
}

std::string utf8_replace_invalid(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        auto lead = static_cast<uint8_t>(bytes[i]);
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        size_t need = 0;
        uint8_t lo = 0x80, hi = 0xBF; // allowed range of the first continuation byte
        if (lead >= 0xC2 && lead <= 0xDF) {
            need = 1;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            need = 2;
            if (lead == 0xE0) lo = 0xA0;       // overlong
            else if (lead == 0xED) hi = 0x9F;  // surrogates
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            need = 3;
            if (lead == 0xF0) lo = 0x90;
            else if (lead == 0xF4) hi = 0x8F;  // above U+10FFFF
        } else {
            out.append(kReplacement);
            ++i;
            continue;
        }

        size_t consumed = 1;
        bool ok = true;
        for (size_t k = 0; k < need; ++k) {
            if (i + consumed >= bytes.size()) { ok = false; break; }
            auto b = static_cast<uint8_t>(bytes[i + consumed]);
            bool in_range = k == 0 ? (b >= lo && b <= hi) : is_continuation(b);
            if (!in_range) { ok = false; break; }
            ++consumed;
        }

        if (ok) {
            out.append(bytes.substr(i, consumed));
        } else {
            out.append(kReplacement);
        }
        i += consumed;
    }
    return out;
}

bool starts_with_icase(std::string_view s, std::string_view prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace text
