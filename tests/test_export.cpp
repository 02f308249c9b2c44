#include "test_common.h"
#include "scrapeguard/export.h"

#include <string>

using namespace scrapeguard;

int main() {
    // Test 1: columns are the union of keys in first-seen order
    {
        List recs = {
            Value::new_map({{"name", Value::string("Acme")}, {"price", Value::string("$5")}}),
            Value::new_map({{"url", Value::string("https://a.test")}, {"name", Value::string("Beta")}}),
        };
        auto cols = record_columns(recs);
        expect_eq_ll((long long)cols.size(), 3, "three columns");
        expect_true(cols[0] == "name" && cols[1] == "price" && cols[2] == "url", "column order");
        expect_true(records_to_csv(recs) ==
                        "name,price,url\n"
                        "Acme,$5,\n"
                        "Beta,,https://a.test\n",
                    "csv: " + records_to_csv(recs));
    }

    // Test 2: quoting
    {
        List recs = {Value::new_map({{"a", Value::string("x, y")},
                                     {"b", Value::string("say \"hi\"")},
                                     {"c", Value::string("two\nlines")},
                                     {"d", Value::string("plain")}})};
        expect_true(records_to_csv(recs) == "a,b,c,d\n\"x, y\",\"say \"\"hi\"\"\",\"two\nlines\",plain\n",
                    "quoted: " + records_to_csv(recs));
    }

    // Test 3: non-string values and nulls
    {
        List recs = {Value::new_map({{"n", Value::number(3)},
                                     {"ok", Value::boolean(true)},
                                     {"none", Value::nil()},
                                     {"tags", Value::new_list({Value::string("a")})}})};
        const std::string csv = records_to_csv(recs);
        expect_true(csv.rfind("n,ok,none,tags\n3,true,,", 0) == 0, "scalars: " + csv);
    }

    // Test 4: no records
    expect_true(records_to_csv({}) == "\n", "empty input is a blank header");
    expect_true(record_columns({}).empty(), "no columns");

    std::cerr << "test_export: ALL PASSED" << std::endl;
    return 0;
}
