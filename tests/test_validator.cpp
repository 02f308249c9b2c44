#include "test_common.h"
#include "scrapeguard/validator.h"

#include <string>

using namespace scrapeguard;

static Value rec(Fields f) { return Value::new_map(std::move(f)); }

int main() {
    // Test 1: clean_text strips unsafe characters and collapses whitespace
    expect_true(clean_text("  Hello,   <b>World</b>!  ") == "Hello bWorldb", "clean basic: " + clean_text("  Hello,   <b>World</b>!  "));
    expect_true(clean_text("a ! b") == "a b", "removed char between spaces collapses");
    expect_true(clean_text("mail: info@example.com\n\t tel: 555-0100") == "mail info@example.com tel 555-0100", "keeps @ . -");
    expect_true(clean_text("caf\xc3\xa9 \xe2\x82\xac") == "caf\xc3\xa9", "UTF-8 letters survive, currency sign removed");
    expect_true(clean_text("!!!").empty(), "all-unsafe becomes empty");
    expect_true(clean_text("").empty(), "empty stays empty");
    for (const char* s : {"  x  y  ", "a\tb\n\nc", "<<a>> [b] {c}", "--..@@", " \xc3\xa9 !"}) {
        const std::string once = clean_text(s);
        expect_true(clean_text(once) == once, std::string("idempotent on '") + s + "'");
    }

    // Test 2: empty and falsy inputs
    {
        ValidationStats st;
        expect_true(validate_records(Value::nil(), &st).empty(), "nil yields nothing");
        expect_eq_ll((long long)st.input, 0, "nil input count");
        expect_true(validate_records(Value::new_list(), &st).empty(), "empty list yields nothing");
        expect_eq_ll((long long)st.input, 0, "empty list input count");
        expect_true(validate_records(Value::string(""), &st).empty(), "empty string yields nothing");
    }

    // Test 3: a single truthy map is wrapped
    {
        List out = validate_records(rec({{"title", Value::string("  Hi  ")}}));
        expect_eq_ll((long long)out.size(), 1, "single map wrapped");
        expect_true(out[0].get("title")->str == "Hi", "field cleaned");
    }

    // Test 4: non-map and all-empty records dropped, order kept
    {
        Value raw = Value::new_list({
            rec({{"name", Value::string("first")}}),
            Value::string("stray"),
            rec({{"a", Value::string("  ")}, {"b", Value::nil()}, {"c", Value::number(0)}}),
            Value::number(7),
            rec({{"name", Value::string("second")}, {"count", Value::number(3)}}),
            rec({}),
        });
        ValidationStats st;
        List out = validate_records(raw, &st);
        expect_eq_ll((long long)out.size(), 2, "two kept");
        expect_true(out[0].get("name")->str == "first", "order 0");
        expect_true(out[1].get("name")->str == "second", "order 1");
        expect_true(out[1].get("count")->num == 3, "numbers kept as is");
        expect_eq_ll((long long)st.input, 6, "input count");
        expect_eq_ll((long long)st.dropped_non_map, 2, "non-map dropped");
        expect_eq_ll((long long)st.dropped_empty, 2, "empty dropped");
        expect_eq_ll((long long)st.kept, 2, "kept count");
    }

    // Test 5: a record survives on a single truthy field; empty fields stay
    {
        List out = validate_records(Value::new_list({rec({{"a", Value::string("")}, {"b", Value::boolean(true)}})}));
        expect_eq_ll((long long)out.size(), 1, "one truthy field suffices");
        expect_true(out[0].get("a") != nullptr, "empty field kept in surviving record");
    }

    // Test 6: a field that cleans to empty does not count
    {
        List out = validate_records(Value::new_list({rec({{"x", Value::string("<>!?")}})}));
        expect_true(out.empty(), "field cleaning to empty drops record");
    }

    // Test 7: input untouched, output shares no containers with it
    {
        Value tags = Value::new_list({Value::string("a")});
        Value r = rec({{"name", Value::string(" dirty! ")}, {"tags", tags}});
        Value raw = Value::new_list({r});
        List out = validate_records(raw);
        expect_true(r.get("name")->str == " dirty! ", "input string unchanged");
        out[0].get("tags")->list->push_back(Value::string("b"));
        expect_eq_ll((long long)tags.list->size(), 1, "nested list copied");
        out[0].set("extra", Value::string("y"));
        expect_true(r.get("extra") == nullptr, "record map copied");
    }

    // Test 8: non-empty output always has a truthy field per record
    {
        Value raw = Value::new_list({rec({{"t", Value::string(" . ")}}), rec({{"t", Value::string("-")}})});
        for (const auto& v : validate_records(raw)) {
            bool any = false;
            for (const auto& f : *v.map) any = any || truthy(f.second);
            expect_true(any, "every kept record has a truthy field");
        }
    }

    // Test 9: UTF-8 text: letters of any script kept, symbols removed,
    // Unicode spaces collapsed
    {
        expect_true(clean_text("\xd0\x9f\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82 \xe6\x9d\xb1\xe4\xba\xac") ==
                    "\xd0\x9f\xd1\x80\xd0\xb8\xd0\xb2\xd0\xb5\xd1\x82 \xe6\x9d\xb1\xe4\xba\xac", "Cyrillic and CJK kept");
        expect_true(clean_text("hi \xf0\x9f\x98\x80 there") == "hi there", "emoji removed: " + clean_text("hi \xf0\x9f\x98\x80 there"));
        expect_true(clean_text("\xe2\x9d\xa4\xef\xb8\x8f").empty(), "symbol with variation selector removed");
        expect_true(clean_text("a\xc2\xa0\xc2\xa0b") == "a b", "NBSP run collapses to one space");
        expect_true(clean_text("\xc2\xa0 x \xe3\x80\x80") == "x", "Unicode spaces trimmed");
        expect_true(clean_text("\xc2\xa3 5 \xc2\xbb next") == "5 next", "Latin-1 signs removed");
        expect_true(clean_text("a\xffb\xc3") == "ab", "malformed bytes removed");
        expect_true(clean_text("\xe2\x80\x9cquoted\xe2\x80\x9d \xe2\x80\x94 dash") == "quoted dash", "typographic punctuation removed");
        for (const char* s : {"a\xc2\xa0\xe2\x82\xac\xc2\xa0b", "\xf0\x9f\x98\x80\xf0\x9f\x98\x80 x", "caf\xc3\xa9\xe3\x80\x80 \xe2\x80\x8b!"}) {
            const std::string once = clean_text(s);
            expect_true(clean_text(once) == once, std::string("idempotent on UTF-8 '") + s + "'");
        }
    }

    // Test 10: validating validated records changes nothing
    {
        Value raw = Value::new_list({
            rec({{"title", Value::string("  Caf\xc3\xa9 <b>menu</b>!! \xc2\xa0")},
                 {"tags", Value::new_list({Value::string(" a! "), Value::new_map({{"k", Value::string("v?")}})})},
                 {"price", Value::number(4.5)},
                 {"ok", Value::boolean(true)},
                 {"none", Value::nil()}}),
            Value::string("stray"),
            rec({{"email", Value::string("x@y.com")},
                 {"nested", Value::new_map({{"inner", Value::new_list({Value::number(1), Value::nil()})}})}}),
            rec({{"blank", Value::string(" \xc2\xa0 ")}}),
        });
        ValidationStats first;
        Value once = Value::new_list(validate_records(raw, &first));
        ValidationStats second;
        Value twice = Value::new_list(validate_records(once, &second));
        expect_eq_ll((long long)first.kept, 2, "two records kept");
        expect_true(once.list->front().get("title")->str == "Caf\xc3\xa9 bmenub", "title cleaned: " + once.list->front().get("title")->str);
        expect_true(values_equal(once, twice), "second pass equals first: " + to_display(twice));
        expect_eq_ll((long long)second.input, (long long)first.kept, "second pass sees only kept records");
        expect_eq_ll((long long)second.kept, (long long)first.kept, "second pass drops nothing");
    }

    // Test 11: very deep nesting is copied up to the depth bound
    {
        Value chain = Value::new_list();
        for (int i = 0; i < 200000; i++) chain = Value::new_list({chain});
        List out = validate_records(rec({{"deep", chain}, {"name", Value::string("x")}}));
        expect_eq_ll((long long)out.size(), 1, "deep record kept");
        const Value* cur = out[0].get("deep");
        for (int i = 0; i < kMaxValueDepth; i++) {
            if (!cur->is_list() || cur->list->size() != 1) die("copy ends early at level " + std::to_string(i));
            cur = &(*cur->list)[0];
        }
        expect_true(cur->type == Value::Type::NIL, "levels past the bound become null");
    }

    std::cerr << "test_validator: ALL PASSED" << std::endl;
    return 0;
}
