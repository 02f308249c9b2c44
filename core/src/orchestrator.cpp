#include "scrapeguard/orchestrator.h"
#include "scrapeguard/hash.h"
#include "scrapeguard/validator.h"

#include <chrono>

namespace scrapeguard {

const char* const kNoResultsMessage = "No results extracted from the scraping code";
const char* const kInvalidResultsMessage = "All extracted results were empty or invalid";
const char* const kBudgetExhaustedMessage = "Maximum retry attempts exceeded";

namespace {

long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now() - since).count();
}

size_t raw_count(const Value& v) {
    if (v.is_list()) return v.list->size();
    return truthy(v) ? 1 : 0;
}

json_object* jstr(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

} // namespace

const char* state_name(OrchestratorState s) {
    switch (s) {
        case OrchestratorState::GATING:       return "gating";
        case OrchestratorState::EVALUATING:   return "evaluating";
        case OrchestratorState::FALLING_BACK: return "falling_back";
        case OrchestratorState::VALIDATING:   return "validating";
        case OrchestratorState::REPAIRING:    return "repairing";
        case OrchestratorState::SUCCEEDED:    return "succeeded";
        case OrchestratorState::EXHAUSTED:    return "exhausted";
    }
    return "unknown";
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::SAFETY_REJECTED:    return "SafetyRejected";
        case ErrorKind::RUNTIME_ERROR:      return "RuntimeError";
        case ErrorKind::EMPTY_EXTRACTION:   return "EmptyExtraction";
        case ErrorKind::INVALID_EXTRACTION: return "InvalidExtraction";
        case ErrorKind::REPAIR_FAILED:      return "RepairFailed";
        case ErrorKind::BUDGET_EXHAUSTED:   return "BudgetExhausted";
        case ErrorKind::GENERATION_FAILED:  return "GenerationFailed";
        case ErrorKind::CANCELLED:          return "Cancelled";
    }
    return "unknown";
}

ExecutionOrchestrator::ExecutionOrchestrator(IEvaluator& evaluator,
                                             ICodeGenerator* codegen,
                                             const FallbackLadder& ladder,
                                             OrchestratorOptions opts,
                                             const StaticGate& gate,
                                             EventLog* log,
                                             const std::atomic<bool>* cancel)
    : evaluator_(evaluator), codegen_(codegen), ladder_(ladder), opts_(opts),
      gate_(gate), log_(log), cancel_(cancel) {
    if (opts_.max_retries < 0) opts_.max_retries = 0;
}

void ExecutionOrchestrator::log(const Run& r, const char* event, json_object* payload) {
    if (log_) {
        log_->event(r.attempt, event, payload);
    } else if (payload) {
        json_object_put(payload);
    }
}

void ExecutionOrchestrator::enter(Run& r, OrchestratorState s) {
    r.state = s;
    r.result.diag.transitions.push_back(s);
}

AttemptRecord& ExecutionOrchestrator::current(Run& r) {
    auto& attempts = r.result.diag.attempts;
    if (attempts.empty() || attempts.back().attempt != r.attempt) {
        AttemptRecord a;
        a.attempt = r.attempt;
        a.code_digest = hash::code_digest(r.code);
        attempts.push_back(std::move(a));
    }
    return attempts.back();
}

void ExecutionOrchestrator::fail(Run& r, ErrorKind kind, const std::string& message) {
    r.result.ok = false;
    r.result.records.clear();
    r.result.kind = kind;
    r.result.stage = state_name(r.state);
    r.result.error = message;
    if (r.last_kind != ErrorKind::NONE) r.result.diag.cause = r.last_kind;
    enter(r, OrchestratorState::EXHAUSTED);
}

void ExecutionOrchestrator::retryable(Run& r, ErrorKind kind, const std::string& message, const char* outcome) {
    r.last_kind = kind;
    r.last_error = message;
    AttemptRecord& a = current(r);
    if (outcome) a.outcome = outcome;
    a.error_kind = kind;
    a.error = message;
    enter(r, OrchestratorState::REPAIRING);
}

bool ExecutionOrchestrator::cancelled(Run& r) {
    if (!cancel_ || !cancel_->load()) return false;
    current(r).outcome = "cancelled";
    fail(r, ErrorKind::CANCELLED, "Request cancelled");
    return true;
}

void ExecutionOrchestrator::step_gate(Run& r) {
    if (cancelled(r)) return;
    AttemptRecord& a = current(r);
    GateVerdict v = gate_.screen(r.code);

    json_object* p = json_object_new_object();
    json_object_object_add(p, "approved", json_object_new_boolean(v.approved ? 1 : 0));
    json_object_object_add(p, "code_digest", jstr(a.code_digest));
    json_object_object_add(p, "code_bytes", json_object_new_int64((int64_t)r.code.size()));
    if (!v.approved) {
        json_object_object_add(p, "capability", jstr(v.capability));
        json_object_object_add(p, "reason", jstr(v.reason));
    }
    log(r, "gate", p);

    if (!v.approved) {
        a.outcome = "safety_rejected";
        a.error_kind = ErrorKind::SAFETY_REJECTED;
        a.error = v.reason;
        fail(r, ErrorKind::SAFETY_REJECTED, v.reason);
        return;
    }
    enter(r, OrchestratorState::EVALUATING);
}

void ExecutionOrchestrator::step_evaluate(Run& r) {
    if (cancelled(r)) return;
    const auto t0 = std::chrono::steady_clock::now();
    r.result.diag.evaluations++;
    EvalOutcome o = evaluator_.evaluate(r.code, r.url);
    const size_t n = o.ok ? raw_count(o.results) : 0;

    json_object* p = json_object_new_object();
    json_object_object_add(p, "ok", json_object_new_boolean(o.ok ? 1 : 0));
    json_object_object_add(p, "records", json_object_new_int64((int64_t)n));
    json_object_object_add(p, "steps", json_object_new_int64(o.steps));
    json_object_object_add(p, "fetches", json_object_new_int(o.fetches));
    json_object_object_add(p, "duration_ms", json_object_new_int64(elapsed_ms(t0)));
    if (o.timed_out) json_object_object_add(p, "timed_out", json_object_new_boolean(1));
    if (!o.error.empty()) json_object_object_add(p, "error", jstr(o.error));
    log(r, "evaluate", p);

    if (o.cancelled) {
        current(r).outcome = "cancelled";
        fail(r, ErrorKind::CANCELLED, "Request cancelled");
        return;
    }
    if (!o.ok) {
        retryable(r, ErrorKind::RUNTIME_ERROR, "Code execution failed: " + o.error, "runtime_error");
        return;
    }

    AttemptRecord& a = current(r);
    a.raw_records = n;
    r.raw = o.results;
    if (n > 0) {
        a.outcome = "records";
        r.tier = "primary";
        enter(r, OrchestratorState::VALIDATING);
    } else {
        a.outcome = "empty";
        enter(r, OrchestratorState::FALLING_BACK);
    }
}

void ExecutionOrchestrator::step_fallback(Run& r) {
    if (cancelled(r)) return;
    LadderResult lr = ladder_.run(r.url, cancel_);

    for (const auto& t : lr.attempts) {
        json_object* p = json_object_new_object();
        json_object_object_add(p, "tier", jstr(t.name));
        json_object_object_add(p, "rank", json_object_new_int(t.rank));
        json_object_object_add(p, "ok", json_object_new_boolean(t.ok ? 1 : 0));
        json_object_object_add(p, "records", json_object_new_int64((int64_t)t.records));
        json_object_object_add(p, "duration_ms", json_object_new_int64(t.duration_ms));
        if (!t.error.empty()) json_object_object_add(p, "error", jstr(t.error));
        log(r, "fallback_tier", p);
        r.result.diag.ladder.push_back(t);
    }

    if (lr.cancelled) {
        current(r).outcome = "cancelled";
        fail(r, ErrorKind::CANCELLED, "Request cancelled");
        return;
    }
    r.raw = Value::new_list(std::move(lr.records));
    r.tier = lr.tier;
    current(r).raw_records = raw_count(r.raw);
    enter(r, OrchestratorState::VALIDATING);
}

void ExecutionOrchestrator::step_validate(Run& r) {
    ValidationStats st;
    List valid = validate_records(r.raw, &st);
    AttemptRecord& a = current(r);
    a.validated = valid.size();
    a.tier = r.tier;

    json_object* p = json_object_new_object();
    json_object_object_add(p, "source", jstr(r.tier.empty() ? std::string("none") : r.tier));
    json_object_object_add(p, "input", json_object_new_int64((int64_t)st.input));
    json_object_object_add(p, "kept", json_object_new_int64((int64_t)st.kept));
    json_object_object_add(p, "dropped_non_map", json_object_new_int64((int64_t)st.dropped_non_map));
    json_object_object_add(p, "dropped_empty", json_object_new_int64((int64_t)st.dropped_empty));
    log(r, "validate", p);

    if (!valid.empty()) {
        r.result.ok = true;
        r.result.kind = ErrorKind::NONE;
        r.result.records = std::move(valid);
        r.result.diag.tier = r.tier;
        enter(r, OrchestratorState::SUCCEEDED);
        return;
    }
    if (st.input == 0) {
        retryable(r, ErrorKind::EMPTY_EXTRACTION, kNoResultsMessage, nullptr);
    } else {
        retryable(r, ErrorKind::INVALID_EXTRACTION, kInvalidResultsMessage, nullptr);
    }
}

void ExecutionOrchestrator::step_repair(Run& r) {
    if (r.attempt >= opts_.max_retries) {
        fail(r, ErrorKind::BUDGET_EXHAUSTED, r.last_error.empty() ? kBudgetExhaustedMessage : r.last_error);
        return;
    }
    if (cancelled(r)) return;

    CodegenResult cr;
    if (codegen_) {
        r.result.diag.repairs++;
        cr = codegen_->repair(r.code, r.last_error, r.url);
    } else {
        cr.error = "no repair capability configured";
    }

    json_object* p = json_object_new_object();
    json_object_object_add(p, "trigger", json_object_new_string(error_kind_name(r.last_kind)));
    json_object_object_add(p, "error", jstr(r.last_error));
    json_object_object_add(p, "ok", json_object_new_boolean(cr.ok ? 1 : 0));
    if (cr.ok) json_object_object_add(p, "new_code_digest", jstr(hash::code_digest(cr.code)));
    else json_object_object_add(p, "repair_error", jstr(cr.error));
    log(r, "repair", p);

    if (!cr.ok) {
        r.result.diag.repair_error = cr.error;
        fail(r, ErrorKind::REPAIR_FAILED, "Code execution failed and could not be fixed: " + r.last_error);
        return;
    }
    r.code = std::move(cr.code);
    r.attempt++;
    r.raw = Value::nil();
    r.tier.clear();
    enter(r, OrchestratorState::GATING);
}

ExecutionResult ExecutionOrchestrator::execute(const std::string& code, const std::string& url) {
    const auto t0 = std::chrono::steady_clock::now();
    Run r;
    r.code = code;
    r.url = url;
    enter(r, OrchestratorState::GATING);

    while (r.state != OrchestratorState::SUCCEEDED && r.state != OrchestratorState::EXHAUSTED) {
        switch (r.state) {
            case OrchestratorState::GATING:       step_gate(r); break;
            case OrchestratorState::EVALUATING:   step_evaluate(r); break;
            case OrchestratorState::FALLING_BACK: step_fallback(r); break;
            case OrchestratorState::VALIDATING:   step_validate(r); break;
            case OrchestratorState::REPAIRING:    step_repair(r); break;
            default: break;
        }
    }

    r.result.final_code = r.code;
    r.result.diag.elapsed_ms = elapsed_ms(t0);

    json_object* p = json_object_new_object();
    json_object_object_add(p, "ok", json_object_new_boolean(r.result.ok ? 1 : 0));
    json_object_object_add(p, "records", json_object_new_int64((int64_t)r.result.records.size()));
    json_object_object_add(p, "evaluations", json_object_new_int(r.result.diag.evaluations));
    json_object_object_add(p, "repairs", json_object_new_int(r.result.diag.repairs));
    json_object_object_add(p, "elapsed_ms", json_object_new_int64(r.result.diag.elapsed_ms));
    if (r.result.ok) {
        json_object_object_add(p, "tier", jstr(r.result.diag.tier));
    } else {
        json_object_object_add(p, "kind", json_object_new_string(error_kind_name(r.result.kind)));
        json_object_object_add(p, "stage", jstr(r.result.stage));
        json_object_object_add(p, "error", jstr(r.result.error));
    }
    log(r, "result", p);
    return std::move(r.result);
}

ExecutionResult ExecutionOrchestrator::execute_prompt(const std::string& prompt, const std::string& url) {
    CodegenResult cr;
    if (codegen_) {
        cr = codegen_->generate(prompt, url);
    } else {
        cr.error = "Failed to generate scraping code: no code generator configured";
    }

    json_object* p = json_object_new_object();
    json_object_object_add(p, "ok", json_object_new_boolean(cr.ok ? 1 : 0));
    json_object_object_add(p, "prompt_bytes", json_object_new_int64((int64_t)prompt.size()));
    if (cr.ok) json_object_object_add(p, "code_digest", jstr(hash::code_digest(cr.code)));
    else json_object_object_add(p, "error", jstr(cr.error));
    if (log_) log_->event(0, "generate", p);
    else json_object_put(p);

    if (!cr.ok) {
        ExecutionResult res;
        res.kind = ErrorKind::GENERATION_FAILED;
        res.stage = "generating";
        res.error = cr.error;
        return res;
    }
    return execute(cr.code, url);
}

} // namespace scrapeguard
