#include "window/search.hpp"

#include <locale>
#include <stdexcept>

namespace {

static_assert(sizeof(wchar_t) == sizeof(char32_t), "wide ctype must cover all code points");

constexpr char32_t REPLACEMENT = 0xFFFD;

const std::ctype<wchar_t>& wide_ctype() {
    static const std::locale loc = [] {
        for (const char* name : {"C.UTF-8", "C.utf8", "en_US.UTF-8"}) {
            try {
                return std::locale(name);
            } catch (const std::runtime_error&) {
                continue;
            }
        }
        return std::locale();
    }();
    return std::use_facet<std::ctype<wchar_t>>(loc);
}

// Decodes one code point starting at `i` and advances `i` past it.
char32_t decode_one(std::string_view s, size_t& i) {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };

    unsigned char lead = byte(i);
    size_t len;
    char32_t cp;
    if (lead < 0x80) { i += 1; return lead; }
    else if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; }
    else { i += 1; return REPLACEMENT; }

    if (i + len > s.size()) { i += 1; return REPLACEMENT; }
    for (size_t k = 1; k < len; k++) {
        if ((byte(i + k) & 0xC0) != 0x80) { i += 1; return REPLACEMENT; }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += len;

    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return REPLACEMENT;
    return cp;
}

} // namespace

std::u32string fold_case(std::string_view utf8) {
    const auto& ct = wide_ctype();

    std::u32string out;
    out.reserve(utf8.size());
    size_t i = 0;
    while (i < utf8.size()) {
        char32_t cp = decode_one(utf8, i);
        out.push_back(static_cast<char32_t>(ct.tolower(static_cast<wchar_t>(cp))));
    }
    return out;
}

bool contains_folded(std::string_view haystack, std::string_view needle) {
    if (needle.empty()) return true;
    return fold_case(haystack).find(fold_case(needle)) != std::u32string::npos;
}

std::vector<WindowRecord> search(std::string_view query, const std::vector<WindowRecord>& records) {
    if (query.empty()) return records;

    auto folded = fold_case(query);
    std::vector<WindowRecord> results;
    for (const auto& r : records) {
        if (fold_case(r.title).find(folded) != std::u32string::npos ||
            fold_case(r.owner_name).find(folded) != std::u32string::npos) {
            results.push_back(r);
        }
    }
    return results;
}
