#include "scrapeguard/export.h"

#include <algorithm>

namespace scrapeguard {

namespace {

std::string csv_field(const std::string& s) {
    if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += "\"\"";
        else out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

std::vector<std::string> record_columns(const List& records) {
    std::vector<std::string> cols;
    for (const auto& r : records) {
        if (!r.is_map() || !r.map) continue;
        for (const auto& f : *r.map) {
            if (std::find(cols.begin(), cols.end(), f.first) == cols.end()) cols.push_back(f.first);
        }
    }
    return cols;
}

std::string records_to_csv(const List& records) {
    const auto cols = record_columns(records);
    std::string out;
    for (size_t i = 0; i < cols.size(); i++) {
        if (i) out.push_back(',');
        out += csv_field(cols[i]);
    }
    out.push_back('\n');
    for (const auto& r : records) {
        if (!r.is_map()) continue;
        for (size_t i = 0; i < cols.size(); i++) {
            if (i) out.push_back(',');
            const Value* v = r.get(cols[i]);
            if (!v || v->is_nil()) continue;
            out += csv_field(v->is_string() ? v->str : to_display(*v));
        }
        out.push_back('\n');
    }
    return out;
}

} // namespace scrapeguard
