#pragma once

// ExecutionOrchestrator: gate -> evaluate -> fallback -> validate, with
// repair-and-retry bounded by max_retries.
//
//   GATING       -> EVALUATING on approval, EXHAUSTED on rejection
//   EVALUATING   -> VALIDATING with records, FALLING_BACK with none,
//                   REPAIRING on a runtime error
//   FALLING_BACK -> VALIDATING with whatever the ladder produced
//   VALIDATING   -> SUCCEEDED with at least one record, REPAIRING otherwise
//   REPAIRING    -> GATING(attempt + 1) while attempt < max_retries,
//                   EXHAUSTED when the budget is spent or repair fails
//
// Every attempt passes the gate again, repaired code included, and a gate
// rejection is terminal on any attempt.

#include "scrapeguard/codegen.h"
#include "scrapeguard/evaluator.h"
#include "scrapeguard/fallback.h"
#include "scrapeguard/gate.h"
#include "scrapeguard/log.h"
#include "scrapeguard/value.h"

#include <atomic>
#include <string>
#include <vector>

namespace scrapeguard {

enum class OrchestratorState {
    GATING,
    EVALUATING,
    FALLING_BACK,
    VALIDATING,
    REPAIRING,
    SUCCEEDED,
    EXHAUSTED,
};

enum class ErrorKind {
    NONE,
    SAFETY_REJECTED,     // terminal
    RUNTIME_ERROR,       // retried through repair
    EMPTY_EXTRACTION,    // retried through repair
    INVALID_EXTRACTION,  // retried through repair
    REPAIR_FAILED,       // terminal
    BUDGET_EXHAUSTED,    // terminal
    GENERATION_FAILED,   // terminal, execute_prompt only
    CANCELLED,           // terminal
};

const char* state_name(OrchestratorState s);
const char* error_kind_name(ErrorKind k);

// Diagnostic texts handed to repair, one per retryable cause.
extern const char* const kNoResultsMessage;       // EMPTY_EXTRACTION
extern const char* const kInvalidResultsMessage;  // INVALID_EXTRACTION
extern const char* const kBudgetExhaustedMessage;

struct AttemptRecord {
    int attempt{0};
    std::string code_digest;
    std::string outcome;      // "records", "empty", "runtime_error", "safety_rejected", "cancelled"
    size_t raw_records{0};
    size_t validated{0};
    std::string tier;         // producing tier: "primary" or a ladder tier name
    ErrorKind error_kind{ErrorKind::NONE};
    std::string error;
};

struct ExecutionDiagnostics {
    int evaluations{0};
    int repairs{0};
    std::string tier;                           // tier of the returned records
    ErrorKind cause{ErrorKind::NONE};           // last concrete error before a terminal one
    std::string repair_error;                   // set on REPAIR_FAILED
    std::vector<AttemptRecord> attempts;
    std::vector<OrchestratorState> transitions; // every state entered, in order
    std::vector<TierAttempt> ladder;            // tiers tried across all attempts
    long long elapsed_ms{0};
};

struct ExecutionResult {
    bool ok{false};
    List records;                 // non-empty when ok
    ErrorKind kind{ErrorKind::NONE};
    std::string stage;            // state_name() of the failing stage
    std::string error;            // user-facing message
    std::string final_code;       // code of the last attempt
    ExecutionDiagnostics diag;
};

struct OrchestratorOptions {
    int max_retries{3};
};

class ExecutionOrchestrator {
public:
    // codegen may be null: execute() then fails with REPAIR_FAILED on the
    // first retryable error and execute_prompt() with GENERATION_FAILED.
    ExecutionOrchestrator(IEvaluator& evaluator,
                          ICodeGenerator* codegen,
                          const FallbackLadder& ladder,
                          OrchestratorOptions opts = {},
                          const StaticGate& gate = default_gate(),
                          EventLog* log = nullptr,
                          const std::atomic<bool>* cancel = nullptr);

    ExecutionResult execute(const std::string& code, const std::string& url);

    // generate(), then execute(). A generation error aborts the call.
    ExecutionResult execute_prompt(const std::string& prompt, const std::string& url);

private:
    struct Run {
        int attempt{0};
        std::string code;
        std::string url;
        OrchestratorState state{OrchestratorState::GATING};
        Value raw;
        std::string tier;
        ErrorKind last_kind{ErrorKind::NONE};
        std::string last_error;
        ExecutionResult result;
    };

    void enter(Run& r, OrchestratorState s);
    void fail(Run& r, ErrorKind kind, const std::string& message);
    void retryable(Run& r, ErrorKind kind, const std::string& message, const char* outcome);
    bool cancelled(Run& r);

    void step_gate(Run& r);
    void step_evaluate(Run& r);
    void step_fallback(Run& r);
    void step_validate(Run& r);
    void step_repair(Run& r);

    AttemptRecord& current(Run& r);
    void log(const Run& r, const char* event, json_object* payload);

    IEvaluator& evaluator_;
    ICodeGenerator* codegen_;
    const FallbackLadder& ladder_;
    OrchestratorOptions opts_;
    const StaticGate& gate_;
    EventLog* log_;
    const std::atomic<bool>* cancel_;
};

} // namespace scrapeguard
