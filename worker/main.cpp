#include "scrapeguard/config.h"
#include "scrapeguard/evaluator.h"
#include "scrapeguard/fetch.h"
#include "scrapeguard/script.h"

#include <json-c/json.h>

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>

using namespace scrapeguard;

// Out-of-process evaluation host. Launched by ProcessEvaluator under rlimits,
// no_new_privs and optionally seccomp; reads one request from stdin and
// writes one JSON reply to stdout. Fetch settings come from the inherited
// SCRAPEGUARD_* environment.

static std::string slurp_stdin(bool* too_large) {
    std::string result;
    result.reserve(4096);
    constexpr size_t MAX_STDIN_BYTES = 10ULL * 1024 * 1024;
    char buf[8192];
    while (std::cin.read(buf, sizeof(buf)) || std::cin.gcount()) {
        result.append(buf, (size_t)std::cin.gcount());
        if (result.size() > MAX_STDIN_BYTES) {
            *too_large = true;
            return "";
        }
    }
    return result;
}

static int print_error_json(const std::string& msg, int exit_code) {
    json_object* out = json_object_new_object();
    json_object_object_add(out, "ok", json_object_new_boolean(0));
    json_object_object_add(out, "error", json_object_new_string_len(msg.c_str(), (int)msg.size()));
    std::cout << json_object_to_json_string_ext(out, JSON_C_TO_STRING_PLAIN);
    std::cout.flush();
    json_object_put(out);
    return exit_code;
}

int main(int argc, char** argv) {
    if (argc > 1) {
        std::cerr << "usage: scrapeguard_worker < request.json\n"
                  << "  request: {\"code\": \"...\", \"url\": \"...\", \"limits\": {...}}\n";
        return 2;
    }
    (void)argv;
    // Fetch helpers feed curl and the browser through pipes.
    std::signal(SIGPIPE, SIG_IGN);

    bool too_large = false;
    const std::string req = slurp_stdin(&too_large);
    if (too_large) return print_error_json("stdin exceeds 10MB limit", 5);

    std::string code, url, err;
    ScriptLimits limits;
    if (!decode_eval_request(req, &code, &url, &limits, &err)) {
        return print_error_json(err, 5);
    }

    ProcessFetcher fetcher(load_fetch_config());

    ScriptContext ctx;
    ctx.url = url;
    ctx.fetcher = &fetcher;
    ctx.fetch = fetcher.config();
    ctx.limits = limits;

    const EvalOutcome o = outcome_from_run(run_script(code, ctx));

    std::cout << encode_eval_reply(o);
    std::cout.flush();
    return 0;
}
