#include "scrapeguard/validator.h"

#include <cstdint>
#include <utility>

namespace scrapeguard {

namespace {

bool is_space(unsigned char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool is_safe(unsigned char c) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) return true;
    return c == '_' || c == '@' || c == '.' || c == '-' || is_space(c);
}

enum class CharClass { KEEP, SPACE, DROP };

// Non-ASCII code points: letters and digits of any script are kept;
// Unicode spaces collapse like ASCII ones; punctuation, symbols, marks,
// emoji and controls are removed.
CharClass classify(uint32_t cp) {
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
        cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000) {
        return CharClass::SPACE;
    }
    static const std::pair<uint32_t, uint32_t> kDropped[] = {
        {0x80, 0xA9},       // C1 controls, Latin-1 punctuation and signs
        {0xAB, 0xB1},
        {0xB4, 0xB4},
        {0xB6, 0xB8},
        {0xBB, 0xBB},
        {0xBF, 0xBF},
        {0xD7, 0xD7},       // multiplication sign
        {0xF7, 0xF7},       // division sign
        {0x2C2, 0x2C5},     // modifier arrowheads
        {0x2D2, 0x2DF},
        {0x300, 0x36F},     // combining diacritics
        {0x200B, 0x200F},   // zero-width and direction marks
        {0x2010, 0x2BFF},   // general punctuation through misc symbols and arrows
        {0x2E00, 0x2E7F},   // supplemental punctuation
        {0x3001, 0x3004},   // CJK punctuation
        {0x3008, 0x3020},
        {0xD800, 0xDFFF},   // surrogates
        {0xE000, 0xF8FF},   // private use
        {0xFE00, 0xFE0F},   // variation selectors
        {0xFE30, 0xFE4F},   // CJK compatibility forms
        {0xFF01, 0xFF0F},   // fullwidth punctuation
        {0xFF1A, 0xFF20},
        {0xFF3B, 0xFF40},
        {0xFF5B, 0xFF65},
        {0xFFF0, 0xFFFF},   // specials
        {0x1F000, 0x1FAFF}, // emoji and pictographs
        {0xE0000, 0xE01EF}, // tags, variation selectors supplement
        {0xF0000, 0x10FFFF},
    };
    for (const auto& [lo, hi] : kDropped) {
        if (cp >= lo && cp <= hi) return CharClass::DROP;
    }
    return CharClass::KEEP;
}

// Length of the well-formed UTF-8 sequence at s[i], 0 if malformed.
size_t decode_utf8(const std::string& s, size_t i, uint32_t* cp) {
    const unsigned char c = (unsigned char)s[i];
    size_t len;
    uint32_t v;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
        v = c & 0x1F;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        v = c & 0x0F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        v = c & 0x07;
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (size_t k = 1; k < len; k++) {
        const unsigned char cc = (unsigned char)s[i + k];
        if ((cc & 0xC0) != 0x80) return 0;
        v = (v << 6) | (cc & 0x3F);
    }
    // overlong forms and out-of-range values
    if ((len == 3 && v < 0x800) || (len == 4 && (v < 0x10000 || v > 0x10FFFF))) return 0;
    *cp = v;
    return len;
}

Value deep_copy(const Value& v, int depth) {
    if (!v.is_list() && !v.is_map()) return v;
    if (depth >= kMaxValueDepth) return Value::nil();
    if (v.is_list()) {
        List items;
        items.reserve(v.list->size());
        for (const auto& x : *v.list) items.push_back(deep_copy(x, depth + 1));
        return Value::new_list(std::move(items));
    }
    Fields fields;
    fields.reserve(v.map->size());
    for (const auto& [k, x] : *v.map) fields.emplace_back(k, deep_copy(x, depth + 1));
    return Value::new_map(std::move(fields));
}

} // namespace

std::string clean_text(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (size_t i = 0; i < s.size();) {
        const unsigned char c = (unsigned char)s[i];
        size_t len = 1;
        CharClass cls;
        if (c < 0x80) {
            cls = !is_safe(c) ? CharClass::DROP : is_space(c) ? CharClass::SPACE : CharClass::KEEP;
        } else {
            uint32_t cp = 0;
            len = decode_utf8(s, i, &cp);
            if (len == 0) {
                len = 1;
                cls = CharClass::DROP;
            } else {
                cls = classify(cp);
            }
        }
        if (cls == CharClass::SPACE) {
            pending_space = !out.empty();
        } else if (cls == CharClass::KEEP) {
            if (pending_space) out.push_back(' ');
            pending_space = false;
            out.append(s, i, len);
        }
        i += len;
    }
    return out;
}

List validate_records(const Value& raw, ValidationStats* stats) {
    List items;
    if (raw.is_list()) {
        items = *raw.list;
    } else if (truthy(raw)) {
        items.push_back(raw);
    }

    ValidationStats st;
    st.input = items.size();

    List out;
    for (const Value& item : items) {
        if (!item.is_map()) {
            st.dropped_non_map++;
            continue;
        }
        Fields fields;
        fields.reserve(item.map->size());
        bool any = false;
        for (const auto& [key, val] : *item.map) {
            Value v = val.is_string() ? Value::string(clean_text(val.str)) : deep_copy(val, 0);
            if (truthy(v)) any = true;
            fields.emplace_back(key, std::move(v));
        }
        if (!any) {
            st.dropped_empty++;
            continue;
        }
        out.push_back(Value::new_map(std::move(fields)));
    }
    st.kept = out.size();
    if (stats) *stats = st;
    return out;
}

} // namespace scrapeguard
