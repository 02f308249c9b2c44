#include "test_common.h"
#include "scrapeguard/orchestrator.h"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace scrapeguard;

namespace {

// Replays outcomes in order; the last one repeats.
class ScriptedEvaluator : public IEvaluator {
public:
    std::vector<EvalOutcome> outcomes;
    std::vector<std::string> codes;
    std::atomic<bool>* cancel_on_call{nullptr};

    EvalOutcome evaluate(const std::string& code, const std::string&) override {
        codes.push_back(code);
        if (cancel_on_call) cancel_on_call->store(true);
        if (outcomes.empty()) return {};
        return outcomes[std::min(codes.size(), outcomes.size()) - 1];
    }
};

class FakeCodegen : public ICodeGenerator {
public:
    std::string generated{"results = []"};
    std::string generate_error;
    std::vector<std::string> repaired;   // handed out in order, last repeats
    std::string repair_error;
    std::vector<std::pair<std::string, std::string>> repair_calls;  // (code, error)

    CodegenResult generate(const std::string&, const std::string&) override {
        CodegenResult r;
        if (!generate_error.empty()) { r.error = generate_error; return r; }
        r.ok = true;
        r.code = generated;
        return r;
    }

    CodegenResult repair(const std::string& code, const std::string& error, const std::string&) override {
        repair_calls.emplace_back(code, error);
        CodegenResult r;
        if (!repair_error.empty()) { r.error = repair_error; return r; }
        r.ok = true;
        r.code = repaired.empty() ? code : repaired[std::min(repair_calls.size(), repaired.size()) - 1];
        return r;
    }
};

EvalOutcome ok_with(Value results) {
    EvalOutcome o;
    o.ok = true;
    o.results = std::move(results);
    return o;
}

EvalOutcome runtime_error(const std::string& msg) {
    EvalOutcome o;
    o.error = msg;
    return o;
}

Value one_record(const std::string& key, const std::string& val) {
    return Value::new_list({Value::new_map({{key, Value::string(val)}})});
}

FallbackTier title_tier(int* calls) {
    FallbackTier t;
    t.rank = 2;
    t.name = "rendered_fetch";
    t.fidelity = "rendered";
    t.producer = [calls](const std::string& url) {
        if (calls) (*calls)++;
        TierOutcome o;
        o.ok = true;
        o.records.push_back(Value::new_map({{"title", Value::string("Example Domain")},
                                            {"url", Value::string(url)},
                                            {"fidelity", Value::string("rendered")}}));
        return o;
    };
    return t;
}

FallbackLadder empty_ladder() {
    return FallbackLadder({});
}

const char* kCode = "page = fetch(url)\nemit({\"title\": title(page)})";

} // namespace

int main() {
    // Test 1: no output from the code, the rendered tier supplies one record
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(Value::new_list())};
        FakeCodegen cg;
        int tier_calls = 0;
        FallbackLadder ladder({title_tier(&tier_calls)});
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.ok, "fallback success: " + r.error);
        expect_eq_ll((long long)r.records.size(), 1, "one record");
        expect_true(r.records[0].get("fidelity")->str == "rendered", "tagged rendered");
        expect_true(r.diag.tier == "rendered_fetch", "producing tier");
        expect_eq_ll(r.diag.evaluations, 1, "one evaluation");
        expect_eq_ll(r.diag.repairs, 0, "no repair");
        expect_eq_ll(tier_calls, 1, "tier ran once");
        std::vector<OrchestratorState> want = {OrchestratorState::GATING, OrchestratorState::EVALUATING,
                                               OrchestratorState::FALLING_BACK, OrchestratorState::VALIDATING,
                                               OrchestratorState::SUCCEEDED};
        expect_true(r.diag.transitions == want, "state sequence");
        expect_true(r.diag.attempts.size() == 1 && r.diag.attempts[0].outcome == "empty", "attempt outcome");
        expect_eq_ll((long long)r.diag.ladder.size(), 1, "ladder attempts recorded");
    }

    // Test 2: a denied capability is rejected before any evaluation
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(one_record("a", "b"))};
        FakeCodegen cg;
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute("import os\nresults = os.listdir('/')", "https://example.com");
        expect_true(!r.ok, "rejected");
        expect_true(r.kind == ErrorKind::SAFETY_REJECTED, "kind");
        expect_true(r.error.find("'os'") != std::string::npos, "names the capability: " + r.error);
        expect_true(r.stage == "gating", "stage: " + r.stage);
        expect_eq_ll(r.diag.evaluations, 0, "zero evaluations");
        expect_eq_ll((long long)ev.codes.size(), 0, "evaluator untouched");
        expect_eq_ll((long long)cg.repair_calls.size(), 0, "no repair");
        expect_true(r.diag.transitions.back() == OrchestratorState::EXHAUSTED, "terminal state");
    }

    // Test 3: a runtime error on every attempt spends the whole budget
    {
        ScriptedEvaluator ev;
        ev.outcomes = {runtime_error("line 1: NameError: a"), runtime_error("line 2: NameError: b"),
                       runtime_error("line 3: KeyError: 'c'")};
        FakeCodegen cg;
        cg.repaired = {"x = 1\nresults = [y]", "x = 2\nresults = [z]"};
        FallbackLadder ladder = empty_ladder();
        OrchestratorOptions opts;
        opts.max_retries = 2;
        ExecutionOrchestrator orch(ev, &cg, ladder, opts);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(!r.ok, "exhausted");
        expect_true(r.kind == ErrorKind::BUDGET_EXHAUSTED, std::string("kind: ") + error_kind_name(r.kind));
        expect_true(r.error == "Code execution failed: line 3: KeyError: 'c'", "last error text: " + r.error);
        expect_true(r.diag.cause == ErrorKind::RUNTIME_ERROR, "cause");
        expect_eq_ll(r.diag.evaluations, 3, "max_retries + 1 evaluations");
        expect_eq_ll((long long)cg.repair_calls.size(), 2, "max_retries repairs");
        expect_true(cg.repair_calls[0].second == "Code execution failed: line 1: NameError: a", "repair sees first error");
        expect_true(cg.repair_calls[1].first == "x = 1\nresults = [y]", "repair sees current code");
        expect_true(ev.codes[2] == "x = 2\nresults = [z]", "repaired code evaluated");
        expect_true(r.final_code == "x = 2\nresults = [z]", "final code");
        expect_eq_ll((long long)r.diag.attempts.size(), 3, "three attempts");
        expect_true(r.diag.attempts[0].code_digest != r.diag.attempts[1].code_digest, "digests differ per attempt");
    }

    // Test 4: whitespace-only records trigger repair, the repaired code succeeds
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(Value::new_list({Value::new_map({{"name", Value::string("   ")}}),
                                                Value::new_map({{"name", Value::string("\n\t")}})})),
                       ok_with(one_record("name", "  Acme  "))};
        FakeCodegen cg;
        cg.repaired = {"emit({\"name\": \"Acme\"})"};
        int tier_calls = 0;
        FallbackLadder ladder({title_tier(&tier_calls)});
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.ok, "repaired success: " + r.error);
        expect_eq_ll((long long)r.records.size(), 1, "exactly one record");
        expect_true(r.records[0].get("name")->str == "Acme", "cleaned field");
        expect_true(r.diag.tier == "primary", "primary tier");
        expect_eq_ll(tier_calls, 0, "raw records skip the ladder");
        expect_eq_ll((long long)cg.repair_calls.size(), 1, "one repair");
        expect_true(cg.repair_calls[0].second == kInvalidResultsMessage, "invalid-results diagnostic");
        expect_true(r.diag.attempts[0].error_kind == ErrorKind::INVALID_EXTRACTION, "first attempt kind");
    }

    // Test 5: nothing from code or ladder is an empty extraction
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(Value::nil()), ok_with(one_record("k", "v"))};
        FakeCodegen cg;
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.ok, "second attempt succeeds");
        expect_true(cg.repair_calls[0].second == kNoResultsMessage, "no-results diagnostic");
        expect_true(std::string(kNoResultsMessage) != kInvalidResultsMessage, "distinct diagnostics");
        expect_true(r.diag.attempts[0].error_kind == ErrorKind::EMPTY_EXTRACTION, "first attempt kind");
    }

    // Test 6: repaired code passes the gate again
    {
        ScriptedEvaluator ev;
        ev.outcomes = {runtime_error("line 1: NameError: q")};
        FakeCodegen cg;
        cg.repaired = {"import subprocess\nsubprocess.run('ls')"};
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(!r.ok && r.kind == ErrorKind::SAFETY_REJECTED, "repaired code rejected");
        expect_true(r.error.find("subprocess") != std::string::npos, "reason: " + r.error);
        expect_eq_ll(r.diag.evaluations, 1, "rejected code never evaluated");
        expect_true(r.diag.attempts.back().attempt == 1, "rejection on attempt 1");
    }

    // Test 6b: module attributes without an import are rejected; re.compile is not
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(one_record("a", "b"))};
        FakeCodegen cg;
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute("results = os.listdir('/')", "https://example.com");
        expect_true(!r.ok && r.kind == ErrorKind::SAFETY_REJECTED, "bare module attribute rejected");
        expect_true(r.stage == "gating", "stage: " + r.stage);
        expect_eq_ll((long long)ev.codes.size(), 0, "never evaluated");

        ScriptedEvaluator ev2;
        ev2.outcomes = {runtime_error("line 1: SecurityError: capability 'compile' is denied (dynamic_eval)"),
                        ok_with(one_record("n", "42"))};
        FakeCodegen cg2;
        cg2.repaired = {"emit({\"n\": re.findall(\"[0-9]+\", \"n42\")[0]})"};
        ExecutionOrchestrator orch2(ev2, &cg2, ladder);
        r = orch2.execute("pat = re.compile(\"[0-9]+\")\nemit({\"n\": 1})", "https://example.com");
        expect_true(r.ok, "re.compile is repaired, not terminal: " + r.error);
        expect_eq_ll(r.diag.evaluations, 2, "compile reached the evaluator");
        expect_eq_ll((long long)cg2.repair_calls.size(), 1, "one repair");
        expect_true(cg2.repair_calls[0].second.find("SecurityError") != std::string::npos, "repair sees the error");
    }

    // Test 7: repair failure and missing repair capability
    {
        ScriptedEvaluator ev;
        ev.outcomes = {runtime_error("line 4: TypeError: bad")};
        FakeCodegen cg;
        cg.repair_error = "fix: codegen exited with code 1";
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.kind == ErrorKind::REPAIR_FAILED, "repair failed");
        expect_true(r.error == "Code execution failed and could not be fixed: Code execution failed: line 4: TypeError: bad",
                    "repair failure message: " + r.error);
        expect_true(r.diag.repair_error == cg.repair_error, "repair error kept");
        expect_true(r.diag.cause == ErrorKind::RUNTIME_ERROR, "cause kept");
        expect_eq_ll(r.diag.evaluations, 1, "no further evaluation");

        ScriptedEvaluator ev2;
        ev2.outcomes = {runtime_error("line 1: NameError: z")};
        ExecutionOrchestrator bare(ev2, nullptr, ladder);
        r = bare.execute(kCode, "https://example.com");
        expect_true(r.kind == ErrorKind::REPAIR_FAILED, "no codegen");
        expect_true(r.diag.repair_error == "no repair capability configured", "no codegen reason");
    }

    // Test 8: zero retries means one evaluation and no repair
    {
        ScriptedEvaluator ev;
        ev.outcomes = {runtime_error("line 1: NameError: z")};
        FakeCodegen cg;
        FallbackLadder ladder = empty_ladder();
        OrchestratorOptions opts;
        opts.max_retries = -3;
        ExecutionOrchestrator orch(ev, &cg, ladder, opts);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.kind == ErrorKind::BUDGET_EXHAUSTED, "exhausted immediately");
        expect_eq_ll(r.diag.evaluations, 1, "one evaluation");
        expect_eq_ll((long long)cg.repair_calls.size(), 0, "no repair");
    }

    // Test 9: cancellation
    {
        std::atomic<bool> cancel{true};
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(one_record("a", "b"))};
        FakeCodegen cg;
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder, {}, default_gate(), nullptr, &cancel);
        ExecutionResult r = orch.execute(kCode, "https://example.com");
        expect_true(r.kind == ErrorKind::CANCELLED && r.error == "Request cancelled", "cancelled up front");
        expect_eq_ll(r.diag.evaluations, 0, "no evaluation after cancel");

        cancel = false;
        ScriptedEvaluator ev2;
        EvalOutcome stopped;
        stopped.cancelled = true;
        stopped.error = "line 3: execution cancelled";
        ev2.outcomes = {stopped};
        ev2.cancel_on_call = &cancel;
        ExecutionOrchestrator orch2(ev2, &cg, ladder, {}, default_gate(), nullptr, &cancel);
        r = orch2.execute(kCode, "https://example.com");
        expect_true(r.kind == ErrorKind::CANCELLED, "cancelled mid evaluation");
        expect_eq_ll((long long)cg.repair_calls.size(), 0, "cancel is not repaired");
    }

    // Test 10: prompt path
    {
        ScriptedEvaluator ev;
        ev.outcomes = {ok_with(one_record("title", "Hello"))};
        FakeCodegen cg;
        cg.generated = "emit({\"title\": \"Hello\"})";
        FallbackLadder ladder = empty_ladder();
        ExecutionOrchestrator orch(ev, &cg, ladder);
        ExecutionResult r = orch.execute_prompt("get the title", "https://example.com");
        expect_true(r.ok, "prompt success: " + r.error);
        expect_true(ev.codes[0] == cg.generated, "generated code evaluated");

        cg.generate_error = "Failed to generate scraping code: timeout";
        r = orch.execute_prompt("get the title", "https://example.com");
        expect_true(r.kind == ErrorKind::GENERATION_FAILED && r.stage == "generating", "generation failure");
        expect_true(r.error == cg.generate_error, "generation error kept");

        ExecutionOrchestrator bare(ev, nullptr, ladder);
        r = bare.execute_prompt("x", "https://example.com");
        expect_true(r.kind == ErrorKind::GENERATION_FAILED, "no generator");
    }

    // Test 11: events are logged per stage
    {
        const std::string path = (std::filesystem::temp_directory_path() / "scrapeguard_test_orch.jsonl").string();
        std::filesystem::remove(path);
        {
            EventLog log({"run-1", "req-1"}, path);
            ScriptedEvaluator ev;
            ev.outcomes = {ok_with(Value::new_list())};
            FakeCodegen cg;
            FallbackLadder ladder({title_tier(nullptr)});
            ExecutionOrchestrator orch(ev, &cg, ladder, {}, default_gate(), &log);
            ExecutionResult r = orch.execute_prompt("title", "https://example.com");
            expect_true(r.ok, "logged run ok");
            expect_eq_ll((long long)log.events_written(), 6, "generate, gate, evaluate, fallback_tier, validate, result");
        }
        std::ifstream in(path);
        std::string line;
        std::vector<std::string> events;
        while (std::getline(in, line)) {
            auto p = line.find("\"event\":\"");
            if (p == std::string::npos) die("event key missing: " + line);
            p += 9;
            events.push_back(line.substr(p, line.find('"', p) - p));
        }
        std::vector<std::string> want = {"generate", "gate", "evaluate", "fallback_tier", "validate", "result"};
        expect_true(events == want, "event order");
        std::filesystem::remove(path);
    }

    std::cerr << "test_orchestrator: ALL PASSED" << std::endl;
    return 0;
}
