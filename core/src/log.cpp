#include "scrapeguard/log.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <sstream>
#include <string>
#include <vector>

namespace scrapeguard {

std::string iso_now() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm) == 0) return "";
    return buf;
}

namespace {

void write_json_string(const std::string& s, std::ostringstream& out) {
    json_object* tmp = json_object_new_string_len(s.c_str(), (int)s.size());
    out << json_object_to_json_string_ext(tmp, JSON_C_TO_STRING_PLAIN);
    json_object_put(tmp);
}

// Objects are written with their members ordered by key, at every depth.
void write_sorted(json_object* v, std::ostringstream& out) {
    const json_type type = v ? json_object_get_type(v) : json_type_null;
    if (type == json_type_object) {
        std::vector<std::pair<std::string, json_object*>> members;
        json_object_object_foreach(v, key, child) members.emplace_back(key, child);
        std::sort(members.begin(), members.end(),
                  [](const auto& a, const auto& b) { return a.first < b.first; });
        out << '{';
        bool first = true;
        for (const auto& [key, child] : members) {
            if (!first) out << ',';
            first = false;
            write_json_string(key, out);
            out << ':';
            write_sorted(child, out);
        }
        out << '}';
    } else if (type == json_type_array) {
        out << '[';
        const size_t n = json_object_array_length(v);
        for (size_t i = 0; i < n; i++) {
            if (i) out << ',';
            write_sorted(json_object_array_get_idx(v, i), out);
        }
        out << ']';
    } else if (!v) {
        out << "null";
    } else {
        out << json_object_to_json_string_ext(v, JSON_C_TO_STRING_PLAIN);
    }
}

} // namespace

EventLog::EventLog(RunHeader hdr, const std::string& path)
    : hdr_(std::move(hdr)), path_(path) {
    if (!path_.empty()) out_.open(path_, std::ios::out | std::ios::trunc);
}

void EventLog::event(int attempt, const std::string& name, json_object* payload) {
    if (!out_.is_open()) {
        if (payload) json_object_put(payload);
        return;
    }

    // Top-level keys are fixed, so they are emitted directly in sorted order.
    std::ostringstream rec;
    rec << "{\"attempt\":" << attempt << ",\"event\":";
    write_json_string(name, rec);
    rec << ",\"payload\":";
    if (payload) {
        write_sorted(payload, rec);
        json_object_put(payload);
    } else {
        rec << "{}";
    }
    if (!hdr_.request_id.empty()) {
        rec << ",\"request_id\":";
        write_json_string(hdr_.request_id, rec);
    }
    rec << ",\"run_id\":";
    write_json_string(hdr_.run_id, rec);
    rec << ",\"ts\":";
    write_json_string(iso_now(), rec);
    rec << "}\n";

    out_ << rec.str();
    out_.flush();
    written_++;
}

} // namespace scrapeguard
