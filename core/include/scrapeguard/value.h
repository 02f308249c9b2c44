#pragma once

#include <json-c/json.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scrapeguard {

class Document;
struct Value;

using List = std::vector<Value>;
using Field = std::pair<std::string, Value>;
// Insertion-ordered field map. Records keep the order the code emitted them in.
using Fields = std::vector<Field>;

// Walkers (equality, display, json-c conversion) stop descending below this
// many nested containers.
constexpr int kMaxValueDepth = 200;

// Dynamic value shared by the script interpreter and extracted records.
// Lists and maps are held by shared_ptr: copies alias the same container,
// which is what lets generated code append to `results` in place.
// Releasing the last reference to a container frees nested containers
// iteratively, so arbitrarily long chains do not recurse on destruction.
struct Value {
    enum class Type { NIL, BOOL, NUMBER, STRING, LIST, MAP, DOCUMENT };

    Value() = default;
    Value(const Value&) = default;
    Value(Value&&) noexcept = default;
    Value& operator=(const Value&) = default;
    Value& operator=(Value&&) noexcept = default;
    ~Value();

    Type type{Type::NIL};
    bool b{false};
    double num{0.0};
    std::string str;
    std::shared_ptr<List> list;
    std::shared_ptr<Fields> map;
    std::shared_ptr<const Document> doc;

    static Value nil() { return Value{}; }
    static Value boolean(bool v);
    static Value number(double v);
    static Value string(std::string v);
    static Value new_list(List items = {});
    static Value new_map(Fields fields = {});
    static Value document(std::shared_ptr<const Document> d);

    bool is_nil() const { return type == Type::NIL; }
    bool is_list() const { return type == Type::LIST; }
    bool is_map() const { return type == Type::MAP; }
    bool is_string() const { return type == Type::STRING; }

    // Map field lookup; nullptr when absent or not a map.
    const Value* get(const std::string& key) const;
    void set(const std::string& key, Value v);
};

const char* type_name(Value::Type t);

// Python-style truthiness: null, false, 0, "" and empty containers are false.
bool truthy(const Value& v);

// Structural equality (documents compare by identity). Below kMaxValueDepth
// containers compare by identity.
bool values_equal(const Value& a, const Value& b);

// Display form used by str() and string concatenation. Containers nested
// deeper than kMaxValueDepth print as [...] and {...}.
std::string to_display(const Value& v);

// json-c conversion. The caller owns the returned object. Containers nested
// deeper than kMaxValueDepth convert to null.
json_object* value_to_json(const Value& v);
Value value_from_json(json_object* obj);

std::string value_to_json_string(const Value& v);
// Returns nil on malformed input; *ok reports parse success when non-null.
Value value_from_json_string(const std::string& s, bool* ok = nullptr);

} // namespace scrapeguard
