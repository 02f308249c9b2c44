#include "scrapeguard/value.h"
#include "scrapeguard/document.h"

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <sstream>
#include <vector>

namespace scrapeguard {

namespace {

// Containers whose last reference is being released. Draining them one at a
// time turns nested destruction into a loop.
struct ReleaseQueue {
    std::vector<std::shared_ptr<List>> lists;
    std::vector<std::shared_ptr<Fields>> maps;
    bool draining{false};
};

ReleaseQueue& release_queue() {
    thread_local ReleaseQueue q;
    return q;
}

} // namespace

Value::~Value() {
    const bool last_list = list && list.use_count() == 1;
    const bool last_map = map && map.use_count() == 1;
    if (!last_list && !last_map) return;
    ReleaseQueue& q = release_queue();
    if (last_list) q.lists.push_back(std::move(list));
    if (last_map) q.maps.push_back(std::move(map));
    if (q.draining) return;
    q.draining = true;
    while (!q.lists.empty() || !q.maps.empty()) {
        if (!q.lists.empty()) {
            std::shared_ptr<List> l = std::move(q.lists.back());
            q.lists.pop_back();
            l.reset();
        } else {
            std::shared_ptr<Fields> m = std::move(q.maps.back());
            q.maps.pop_back();
            m.reset();
        }
    }
    q.draining = false;
}

Value Value::boolean(bool v) {
    Value out;
    out.type = Type::BOOL;
    out.b = v;
    return out;
}

Value Value::number(double v) {
    Value out;
    out.type = Type::NUMBER;
    out.num = v;
    return out;
}

Value Value::string(std::string v) {
    Value out;
    out.type = Type::STRING;
    out.str = std::move(v);
    return out;
}

Value Value::new_list(List items) {
    Value out;
    out.type = Type::LIST;
    out.list = std::make_shared<List>(std::move(items));
    return out;
}

Value Value::new_map(Fields fields) {
    Value out;
    out.type = Type::MAP;
    out.map = std::make_shared<Fields>(std::move(fields));
    return out;
}

Value Value::document(std::shared_ptr<const Document> d) {
    Value out;
    out.type = Type::DOCUMENT;
    out.doc = std::move(d);
    return out;
}

const Value* Value::get(const std::string& key) const {
    if (type != Type::MAP || !map) return nullptr;
    for (const auto& f : *map) {
        if (f.first == key) return &f.second;
    }
    return nullptr;
}

void Value::set(const std::string& key, Value v) {
    if (type != Type::MAP || !map) return;
    for (auto& f : *map) {
        if (f.first == key) {
            f.second = std::move(v);
            return;
        }
    }
    map->emplace_back(key, std::move(v));
}

const char* type_name(Value::Type t) {
    switch (t) {
        case Value::Type::NIL:      return "null";
        case Value::Type::BOOL:     return "bool";
        case Value::Type::NUMBER:   return "number";
        case Value::Type::STRING:   return "str";
        case Value::Type::LIST:     return "list";
        case Value::Type::MAP:      return "dict";
        case Value::Type::DOCUMENT: return "document";
    }
    return "null";
}

bool truthy(const Value& v) {
    switch (v.type) {
        case Value::Type::NIL:      return false;
        case Value::Type::BOOL:     return v.b;
        case Value::Type::NUMBER:   return v.num != 0.0 && !std::isnan(v.num);
        case Value::Type::STRING:   return !v.str.empty();
        case Value::Type::LIST:     return v.list && !v.list->empty();
        case Value::Type::MAP:      return v.map && !v.map->empty();
        case Value::Type::DOCUMENT: return v.doc != nullptr;
    }
    return false;
}

static bool equal_at(const Value& a, const Value& b, int depth) {
    if (a.type != b.type) return false;
    switch (a.type) {
        case Value::Type::NIL:      return true;
        case Value::Type::BOOL:     return a.b == b.b;
        case Value::Type::NUMBER:   return a.num == b.num;
        case Value::Type::STRING:   return a.str == b.str;
        case Value::Type::DOCUMENT: return a.doc == b.doc;
        case Value::Type::LIST: {
            if (a.list == b.list) return true;
            if (a.list->size() != b.list->size() || depth >= kMaxValueDepth) return false;
            for (size_t i = 0; i < a.list->size(); i++) {
                if (!equal_at((*a.list)[i], (*b.list)[i], depth + 1)) return false;
            }
            return true;
        }
        case Value::Type::MAP: {
            if (a.map == b.map) return true;
            if (a.map->size() != b.map->size() || depth >= kMaxValueDepth) return false;
            for (size_t i = 0; i < a.map->size(); i++) {
                if ((*a.map)[i].first != (*b.map)[i].first) return false;
                if (!equal_at((*a.map)[i].second, (*b.map)[i].second, depth + 1)) return false;
            }
            return true;
        }
    }
    return false;
}

bool values_equal(const Value& a, const Value& b) {
    return equal_at(a, b, 0);
}

static std::string format_number(double n) {
    if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
    }
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.15g", n);
    return buf;
}

static std::string quoted(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

static std::string display_at(const Value& v, int depth);

static std::string repr_inner(const Value& v, int depth) {
    return v.is_string() ? quoted(v.str) : display_at(v, depth);
}

static std::string display_at(const Value& v, int depth) {
    switch (v.type) {
        case Value::Type::NIL:    return "null";
        case Value::Type::BOOL:   return v.b ? "true" : "false";
        case Value::Type::NUMBER: return format_number(v.num);
        case Value::Type::STRING: return v.str;
        case Value::Type::DOCUMENT:
            return "<document " + (v.doc ? v.doc->url() : std::string()) + ">";
        case Value::Type::LIST: {
            if (depth >= kMaxValueDepth) return "[...]";
            std::ostringstream oss;
            oss << "[";
            for (size_t i = 0; i < v.list->size(); i++) {
                if (i) oss << ", ";
                oss << repr_inner((*v.list)[i], depth + 1);
            }
            oss << "]";
            return oss.str();
        }
        case Value::Type::MAP: {
            if (depth >= kMaxValueDepth) return "{...}";
            std::ostringstream oss;
            oss << "{";
            for (size_t i = 0; i < v.map->size(); i++) {
                if (i) oss << ", ";
                oss << quoted((*v.map)[i].first) << ": " << repr_inner((*v.map)[i].second, depth + 1);
            }
            oss << "}";
            return oss.str();
        }
    }
    return "";
}

std::string to_display(const Value& v) {
    return display_at(v, 0);
}

static json_object* json_at(const Value& v, int depth) {
    switch (v.type) {
        case Value::Type::NIL:
            return nullptr;
        case Value::Type::BOOL:
            return json_object_new_boolean(v.b ? 1 : 0);
        case Value::Type::NUMBER:
            if (std::isfinite(v.num) && v.num == std::floor(v.num) && std::fabs(v.num) < 9e15) {
                return json_object_new_int64(static_cast<int64_t>(v.num));
            }
            return json_object_new_double(v.num);
        case Value::Type::STRING:
            return json_object_new_string_len(v.str.c_str(), static_cast<int>(v.str.size()));
        case Value::Type::DOCUMENT: {
            std::string u = v.doc ? v.doc->url() : std::string();
            return json_object_new_string_len(u.c_str(), static_cast<int>(u.size()));
        }
        case Value::Type::LIST: {
            if (depth >= kMaxValueDepth) return nullptr;
            json_object* arr = json_object_new_array();
            for (const auto& el : *v.list) json_object_array_add(arr, json_at(el, depth + 1));
            return arr;
        }
        case Value::Type::MAP: {
            if (depth >= kMaxValueDepth) return nullptr;
            json_object* obj = json_object_new_object();
            for (const auto& f : *v.map) json_object_object_add(obj, f.first.c_str(), json_at(f.second, depth + 1));
            return obj;
        }
    }
    return nullptr;
}

json_object* value_to_json(const Value& v) {
    return json_at(v, 0);
}

Value value_from_json(json_object* obj) {
    if (!obj) return Value::nil();
    switch (json_object_get_type(obj)) {
        case json_type_null:
            return Value::nil();
        case json_type_boolean:
            return Value::boolean(json_object_get_boolean(obj) != 0);
        case json_type_int:
            return Value::number(static_cast<double>(json_object_get_int64(obj)));
        case json_type_double:
            return Value::number(json_object_get_double(obj));
        case json_type_string:
            return Value::string(std::string(json_object_get_string(obj),
                                             static_cast<size_t>(json_object_get_string_len(obj))));
        case json_type_array: {
            List items;
            const size_t n = json_object_array_length(obj);
            items.reserve(n);
            for (size_t i = 0; i < n; i++) {
                items.push_back(value_from_json(json_object_array_get_idx(obj, i)));
            }
            return Value::new_list(std::move(items));
        }
        case json_type_object: {
            Fields fields;
            json_object_object_foreach(obj, k, val) {
                fields.emplace_back(k, value_from_json(val));
            }
            return Value::new_map(std::move(fields));
        }
    }
    return Value::nil();
}

std::string value_to_json_string(const Value& v) {
    json_object* obj = value_to_json(v);
    if (!obj) return "null";
    std::string out = json_object_to_json_string_ext(obj, JSON_C_TO_STRING_PLAIN | JSON_C_TO_STRING_NOSLASHESCAPE);
    json_object_put(obj);
    return out;
}

Value value_from_json_string(const std::string& s, bool* ok) {
    json_tokener* tok = json_tokener_new();
    if (!tok) {
        if (ok) *ok = false;
        return Value::nil();
    }
    json_object* obj = json_tokener_parse_ex(tok, s.c_str(), static_cast<int>(s.size()));
    const bool parsed = json_tokener_get_error(tok) == json_tokener_success;
    json_tokener_free(tok);
    if (ok) *ok = parsed;
    if (!parsed) {
        if (obj) json_object_put(obj);
        return Value::nil();
    }
    Value v = value_from_json(obj);
    if (obj) json_object_put(obj);
    return v;
}

} // namespace scrapeguard
