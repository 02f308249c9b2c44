#include "cmd_scrape.h"
#include "runner_utils.h"

#include "scrapeguard/codegen.h"
#include "scrapeguard/config.h"
#include "scrapeguard/evaluator.h"
#include "scrapeguard/export.h"
#include "scrapeguard/fallback.h"
#include "scrapeguard/fetch.h"
#include "scrapeguard/gate.h"
#include "scrapeguard/log.h"
#include "scrapeguard/orchestrator.h"
#include "scrapeguard/policy.h"
#include "scrapeguard/script.h"

#include <json-c/json.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>

using namespace scrapeguard;

static std::atomic<bool> g_cancel{false};

namespace {

struct JsonGuard {
    json_object* o;
    ~JsonGuard() { if (o) json_object_put(o); }
};

json_object* jstr(const std::string& s) {
    return json_object_new_string_len(s.c_str(), (int)s.size());
}

std::string get_str(json_object* obj, const char* key) {
    json_object* v = nullptr;
    if (json_object_object_get_ex(obj, key, &v) && json_object_is_type(v, json_type_string)) {
        return std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    }
    return "";
}

void print_json(json_object* o) {
    std::cout << json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN) << "\n";
    std::cout.flush();
}

int print_failure(const std::string& error, const std::string& message, const char* kind) {
    json_object* out = json_object_new_object();
    JsonGuard g{out};
    json_object_object_add(out, "success", json_object_new_boolean(0));
    json_object_object_add(out, "error", jstr(error));
    json_object_object_add(out, "message", jstr(message));
    if (kind) json_object_object_add(out, "kind", json_object_new_string(kind));
    print_json(out);
    return 1;
}

// Everything one request needs, wired from the environment.
struct Pipeline {
    ExecutorConfig exec_cfg;
    FetchConfig fetch_cfg;
    std::unique_ptr<ProcessFetcher> fetcher;
    std::unique_ptr<IEvaluator> evaluator;
    std::unique_ptr<ExternalCodeGenerator> codegen;
    std::unique_ptr<FallbackLadder> ladder;
    std::unique_ptr<EventLog> log;
    std::unique_ptr<ExecutionOrchestrator> orch;
};

void install_signal_handlers() {
    // A generator command that exits without reading its request must not take the CLI down.
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGTERM, [](int) { g_cancel.store(true); });
    std::signal(SIGINT,  [](int) { g_cancel.store(true); });
}

std::unique_ptr<Pipeline> build_pipeline(char* argv0, const std::string& request_id) {
    const auto root = resolve_root(argv0);
    const Profile profile = detect_profile();
    apply_profile_defaults(profile);
    set_env_if_missing("SCRAPEGUARD_WORKER_BIN",
                       (std::filesystem::path(argv0).parent_path() / "scrapeguard_worker").string());

    auto p = std::make_unique<Pipeline>();
    p->exec_cfg = load_executor_config();
    p->fetch_cfg = load_fetch_config();
    p->fetcher = std::make_unique<ProcessFetcher>(p->fetch_cfg, &g_cancel);
    if (p->exec_cfg.isolate) {
        p->evaluator = std::make_unique<ProcessEvaluator>(p->exec_cfg, &g_cancel);
    } else {
        p->evaluator = std::make_unique<InProcessEvaluator>(p->fetcher.get(), p->fetch_cfg,
                                                            script_limits_from(p->exec_cfg), &g_cancel);
    }
    p->codegen = std::make_unique<ExternalCodeGenerator>(load_codegen_config(), &g_cancel);
    p->ladder = std::make_unique<FallbackLadder>(default_ladder(*p->fetcher, p->fetch_cfg));

    RunHeader hdr;
    hdr.run_id = gen_run_id();
    hdr.request_id = request_id;
    std::string log_path;
    if (getenv_bool("SCRAPEGUARD_EVENT_LOG", true)) {
        std::error_code ec;
        const auto log_dir = root / "logs";
        std::filesystem::create_directories(log_dir, ec);
        if (ec) {
            std::cerr << "[warn] cannot create " << log_dir << ": " << ec.message() << "\n";
        } else {
            log_path = (log_dir / ("exec_" + hdr.run_id + ".jsonl")).string();
        }
    }
    p->log = std::make_unique<EventLog>(hdr, log_path);

    OrchestratorOptions opts;
    opts.max_retries = p->exec_cfg.max_retries;
    p->orch = std::make_unique<ExecutionOrchestrator>(*p->evaluator, p->codegen.get(), *p->ladder, opts,
                                                      default_gate(), p->log.get(), &g_cancel);

    std::cerr << "[scrape] profile=" << profile_name(profile)
              << " isolate=" << (p->exec_cfg.isolate ? 1 : 0)
              << " max_retries=" << opts.max_retries
              << " run_id=" << hdr.run_id << "\n";
    if (p->log->enabled()) std::cerr << "[scrape] event log: " << p->log->path() << "\n";
    return p;
}

int report(const ExecutionResult& res, long long started_ms, const std::string& format) {
    const double secs = (double)(now_ms() - started_ms) / 1000.0;
    std::cerr << "[scrape] " << (res.ok ? "ok" : error_kind_name(res.kind))
              << " evaluations=" << res.diag.evaluations
              << " repairs=" << res.diag.repairs
              << " elapsed_ms=" << res.diag.elapsed_ms << "\n";

    if (!res.ok) return print_failure(res.error, "Scraping failed", error_kind_name(res.kind));

    if (format == "csv") {
        std::cout << records_to_csv(res.records);
        std::cout.flush();
        return 0;
    }

    json_object* out = json_object_new_object();
    JsonGuard g{out};
    json_object* data = json_object_new_array();
    for (const auto& r : res.records) json_object_array_add(data, value_to_json(r));
    json_object_object_add(out, "success", json_object_new_boolean(1));
    json_object_object_add(out, "data", data);
    json_object_object_add(out, "message",
                           jstr("Successfully scraped " + std::to_string(res.records.size()) + " items"));
    json_object_object_add(out, "execution_time", json_object_new_double(secs));
    json_object_object_add(out, "total_results", json_object_new_int64((int64_t)res.records.size()));
    print_json(out);
    return 0;
}

} // namespace

// Request: {"prompt": "...", "url": "...", "format": "json"|"csv", "request_id": "..."}
int cmd_scrape(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: scrapeguard_cli scrape <request.json>\n";
        std::cerr << "env: SCRAPEGUARD_CODEGEN_CMD (required), SCRAPEGUARD_PROFILE=dev|prod\n";
        return 2;
    }
    const long long started = now_ms();

    std::string req;
    try {
        req = slurp(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[scrape] " << e.what() << "\n";
        return 2;
    }
    json_object* root = json_tokener_parse(req.c_str());
    if (!root || !json_object_is_type(root, json_type_object)) {
        if (root) json_object_put(root);
        return print_failure("invalid JSON request", "Scraping failed", nullptr);
    }
    JsonGuard g{root};
    const std::string prompt = get_str(root, "prompt");
    std::string url = get_str(root, "url");
    std::string format = get_str(root, "format");
    if (format.empty()) format = "json";
    if (prompt.empty() || url.empty()) {
        return print_failure("request requires prompt and url", "Scraping failed", nullptr);
    }
    if (format != "json" && format != "csv") {
        return print_failure("format must be json or csv", "Scraping failed", nullptr);
    }
    url = normalize_url(url);

    install_signal_handlers();
    auto p = build_pipeline(argv[0], get_str(root, "request_id"));
    std::cerr << "[scrape] url=" << url << "\n";
    return report(p->orch->execute_prompt(prompt, url), started, format);
}

int cmd_exec(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: scrapeguard_cli exec <code_file> <url> [json|csv]\n";
        return 2;
    }
    const long long started = now_ms();
    std::string code;
    try {
        code = slurp(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[scrape] " << e.what() << "\n";
        return 2;
    }
    const std::string format = argc > 4 ? argv[4] : "json";
    if (format != "json" && format != "csv") {
        std::cerr << "[scrape] format must be json or csv\n";
        return 2;
    }
    const std::string url = normalize_url(argv[3]);

    install_signal_handlers();
    auto p = build_pipeline(argv[0], "");
    std::cerr << "[scrape] url=" << url << "\n";
    return report(p->orch->execute(code, url), started, format);
}

// Screens a code file without running it: StaticGate, then the parser.
int cmd_check(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "usage: scrapeguard_cli check <code_file>\n";
        return 2;
    }
    std::string code;
    try {
        code = slurp(argv[2]);
    } catch (const std::exception& e) {
        std::cerr << "[check] " << e.what() << "\n";
        return 2;
    }
    const GateVerdict v = default_gate().screen(code);
    const std::string syntax = v.approved ? check_syntax(code) : std::string();

    json_object* out = json_object_new_object();
    JsonGuard g{out};
    json_object_object_add(out, "approved", json_object_new_boolean(v.approved ? 1 : 0));
    if (!v.approved) {
        json_object_object_add(out, "reason", jstr(v.reason));
        json_object_object_add(out, "capability", jstr(v.capability));
        if (v.denied_class) json_object_object_add(out, "class", json_object_new_string(denied_class_name(*v.denied_class)));
    }
    if (!syntax.empty()) json_object_object_add(out, "syntax_error", jstr(syntax));
    print_json(out);
    return v.approved && syntax.empty() ? 0 : 1;
}

// Dumps the capability tables.
int cmd_policy(int, char**) {
    const auto& pol = SandboxPolicy::instance();
    json_object* out = json_object_new_object();
    JsonGuard g{out};
    json_object* allowed = json_object_new_object();
    for (const auto& e : pol.allowed_entries()) {
        json_object_object_add(allowed, e.name, json_object_new_string(primitive_kind_name(e.kind)));
    }
    json_object* denied = json_object_new_object();
    for (const auto& e : pol.denied_entries()) {
        json_object_object_add(denied, e.name, json_object_new_string(denied_class_name(e.cls)));
    }
    json_object_object_add(out, "allowed", allowed);
    json_object_object_add(out, "denied", denied);
    std::cout << json_object_to_json_string_ext(out, JSON_C_TO_STRING_PRETTY) << "\n";
    return 0;
}
