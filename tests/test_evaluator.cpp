#include "test_common.h"
#include "scrapeguard/evaluator.h"

#include <atomic>
#include <string>

using namespace scrapeguard;

namespace {

class StaticPage : public IFetcher {
public:
    FetchResult fetch_static(const FetchRequest& req) override {
        FetchResult r;
        r.ok = true;
        r.url = req.url;
        r.body = "<html><head><title>Board</title></head><body><li>one</li><li>two</li></body></html>";
        return r;
    }
    FetchResult fetch_rendered(const FetchRequest& req) override { return fetch_static(req); }
};

} // namespace

int main() {
    // Test 1: limits follow the executor config
    {
        ExecutorConfig cfg;
        cfg.eval_max_steps = 1234;
        cfg.eval_timeout_ms = 5678;
        cfg.max_records = 9;
        ScriptLimits l = script_limits_from(cfg);
        expect_eq_ll(l.max_steps, 1234, "steps");
        expect_eq_ll(l.timeout_ms, 5678, "timeout");
        expect_eq_ll((long long)l.max_records, 9, "records");
    }

    // Test 2: request encoding survives the worker decoder
    {
        ScriptLimits l;
        l.max_steps = 77;
        l.timeout_ms = 88;
        l.max_records = 99;
        const std::string req = encode_eval_request("emit({\"q\": \"\\\"x\\\"\"})\n", "https://a.test/p?x=1", l);
        std::string code, url, err;
        ScriptLimits got;
        expect_true(decode_eval_request(req, &code, &url, &got, &err), "decode request: " + err);
        expect_true(code == "emit({\"q\": \"\\\"x\\\"\"})\n", "code preserved");
        expect_true(url == "https://a.test/p?x=1", "url preserved");
        expect_eq_ll(got.max_steps, 77, "steps");
        expect_eq_ll(got.timeout_ms, 88, "timeout");
        expect_eq_ll((long long)got.max_records, 99, "records");

        expect_true(!decode_eval_request("not json", &code, &url, &got, &err) && err == "invalid JSON request", "bad json");
        expect_true(!decode_eval_request("{\"url\": \"x\"}", &code, &url, &got, &err) && err == "missing code", "no code");
        ScriptLimits defaults;
        expect_true(decode_eval_request("{\"code\": \"\"}", &code, &url, &defaults, &err), "limits optional");
        expect_eq_ll(defaults.max_steps, ScriptLimits{}.max_steps, "default steps kept");
    }

    // Test 3: replies keep records, errors and flags
    {
        EvalOutcome o;
        o.ok = false;
        o.results = Value::new_list({Value::new_map({{"k", Value::string("v")}})});
        o.error = "line 3: TimeoutError: execution exceeded 10 ms";
        o.output = "dbg\n";
        o.steps = 4096;
        o.fetches = 2;
        o.timed_out = true;
        EvalOutcome back;
        std::string err;
        expect_true(decode_eval_reply(encode_eval_reply(o), &back, &err), "decode reply: " + err);
        expect_true(!back.ok && back.timed_out && !back.cancelled, "flags");
        expect_true(back.error == o.error && back.output == o.output, "texts");
        expect_eq_ll(back.steps, 4096, "steps");
        expect_eq_ll(back.fetches, 2, "fetches");
        expect_true(values_equal(back.results, o.results), "results");

        expect_true(!decode_eval_reply("[]", &back, &err) && err == "invalid worker reply", "array reply");
        expect_true(!decode_eval_reply("{\"error\": \"x\"}", &back, &err) && err == "worker reply missing ok", "no ok");

        // records nested as deep as the interpreter allows
        Value deep = Value::string("leaf");
        for (int i = 0; i < 100; i++) deep = Value::new_list({deep});
        o.results = Value::new_list({Value::new_map({{"deep", deep}})});
        expect_true(decode_eval_reply(encode_eval_reply(o), &back, &err), "decode deep reply: " + err);
        expect_true(values_equal(back.results, o.results), "deep results");
    }

    // Test 4: in-process evaluation
    {
        StaticPage page;
        ScriptLimits l;
        InProcessEvaluator ev(&page, FetchConfig{}, l);
        EvalOutcome o = ev.evaluate("page = fetch(url)\nfor item in select_text(page, \"li\") { emit({\"item\": item}) }",
                                    "https://board.test/");
        expect_true(o.ok, "eval ok: " + o.error);
        expect_eq_ll((long long)o.results.list->size(), 2, "two records");
        expect_eq_ll(o.fetches, 1, "fetch counted");
        expect_true(o.steps > 0, "steps counted");

        o = ev.evaluate("import socket", "https://board.test/");
        expect_true(!o.ok && o.error.find("SecurityError") != std::string::npos, "denied import: " + o.error);

        std::atomic<bool> cancel{true};
        InProcessEvaluator stopped(&page, FetchConfig{}, l, &cancel);
        o = stopped.evaluate("page = fetch(url)", "https://board.test/");
        expect_true(!o.ok && o.cancelled, "cancelled evaluation");
    }

    // Test 5: worker configuration errors
    {
        ExecutorConfig cfg;
        ProcessEvaluator none(cfg);
        EvalOutcome o = none.evaluate("results = []", "https://a.test/");
        expect_true(!o.ok && o.error == "worker binary not configured (SCRAPEGUARD_WORKER_BIN)", "unset worker: " + o.error);

        cfg.worker_bin = "/nonexistent/scrapeguard_worker";
        ProcessEvaluator missing(cfg);
        o = missing.evaluate("results = []", "https://a.test/");
        expect_true(!o.ok && !o.error.empty(), "missing worker reported");
    }

    std::cerr << "test_evaluator: ALL PASSED" << std::endl;
    return 0;
}
