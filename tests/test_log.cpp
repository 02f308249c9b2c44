#include "test_common.h"
#include "scrapeguard/log.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace scrapeguard;

static std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream in(path);
    std::vector<std::string> out;
    std::string line;
    while (std::getline(in, line)) out.push_back(line);
    return out;
}

int main() {
    const std::string path = (std::filesystem::temp_directory_path() / "scrapeguard_test_log.jsonl").string();
    std::filesystem::remove(path);

    // Test 1: one canonical line per event, keys sorted at every level
    {
        EventLog log({"run-abc", "req-7"}, path);
        expect_true(log.enabled(), "log enabled");
        json_object* p = json_object_new_object();
        json_object_object_add(p, "zeta", json_object_new_int(1));
        json_object_object_add(p, "alpha", json_object_new_string("a"));
        json_object* nested = json_object_new_object();
        json_object_object_add(nested, "y", json_object_new_boolean(1));
        json_object_object_add(nested, "b", nullptr);
        json_object_object_add(p, "mid", nested);
        log.event(2, "gate", p);
        log.event(3, "result", nullptr);
        expect_eq_ll((long long)log.events_written(), 2, "two events");
    }
    {
        auto lines = read_lines(path);
        expect_eq_ll((long long)lines.size(), 2, "two lines");
        const std::string& l = lines[0];
        expect_true(l.rfind("{\"attempt\":2,\"event\":\"gate\",\"payload\":{\"alpha\":\"a\",\"mid\":{\"b\":null,\"y\":true},\"zeta\":1},"
                            "\"request_id\":\"req-7\",\"run_id\":\"run-abc\",\"ts\":\"", 0) == 0, "canonical line: " + l);
        expect_true(l.size() > 2 && l.compare(l.size() - 3, 3, "Z\"}") == 0, "ts is UTC: " + l);
        expect_true(lines[1].find("\"payload\":{}") != std::string::npos, "null payload becomes {}");
    }

    // Test 2: reopening truncates; no request id omits the key
    {
        EventLog log({"run-2", ""}, path);
        log.event(0, "generate", nullptr);
    }
    {
        auto lines = read_lines(path);
        expect_eq_ll((long long)lines.size(), 1, "truncated");
        expect_true(lines[0].find("request_id") == std::string::npos, "no request_id key");
    }

    // Test 3: an empty path disables the log
    {
        EventLog off({"run-3", ""}, "");
        expect_true(!off.enabled(), "disabled");
        off.event(0, "gate", json_object_new_object());
        expect_eq_ll((long long)off.events_written(), 0, "nothing written");
        EventLog def;
        expect_true(!def.enabled(), "default disabled");
    }

    // Test 4: timestamp shape
    {
        const std::string ts = iso_now();
        expect_eq_ll((long long)ts.size(), 20, "iso length: " + ts);
        expect_true(ts[4] == '-' && ts[10] == 'T' && ts[19] == 'Z', "iso shape: " + ts);
    }

    std::filesystem::remove(path);
    std::cerr << "test_log: ALL PASSED" << std::endl;
    return 0;
}
