#include "scrapeguard/codegen.h"
#include "scrapeguard/proc.h"

#include <json-c/json.h>

#include <string>
#include <vector>

namespace scrapeguard {

namespace {

struct JsonGuard {
    json_object* o;
    ~JsonGuard() { if (o) json_object_put(o); }
};

std::string trim_ws(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ' || s.back() == '\t')) s.pop_back();
    size_t i = 0;
    while (i < s.size() && (s[i] == '\n' || s[i] == '\r' || s[i] == ' ' || s[i] == '\t')) i++;
    if (i) s.erase(0, i);
    return s;
}

void add_str(json_object* o, const char* key, const std::string& v) {
    json_object_object_add(o, key, json_object_new_string_len(v.c_str(), (int)v.size()));
}

} // namespace

std::string extract_code_block(const std::string& text) {
    const size_t open = text.find("```");
    if (open == std::string::npos) return trim_ws(text);
    size_t body = text.find('\n', open + 3);
    if (body == std::string::npos) return "";
    body += 1;
    size_t close = text.find("```", body);
    if (close == std::string::npos) close = text.size();
    return trim_ws(text.substr(body, close - body));
}

ExternalCodeGenerator::ExternalCodeGenerator(CodegenConfig cfg, const std::atomic<bool>* cancel)
    : cfg_(std::move(cfg)), cancel_(cancel) {}

CodegenResult ExternalCodeGenerator::generate(const std::string& prompt, const std::string& url) {
    json_object* req = json_object_new_object();
    JsonGuard g{req};
    add_str(req, "op", "generate");
    add_str(req, "prompt", prompt);
    add_str(req, "url", url);
    return invoke(json_object_to_json_string_ext(req, JSON_C_TO_STRING_PLAIN), "generate");
}

CodegenResult ExternalCodeGenerator::repair(const std::string& code, const std::string& error, const std::string& url) {
    json_object* req = json_object_new_object();
    JsonGuard g{req};
    add_str(req, "op", "repair");
    add_str(req, "code", code);
    add_str(req, "error", error);
    add_str(req, "url", url);
    return invoke(json_object_to_json_string_ext(req, JSON_C_TO_STRING_PLAIN), "fix");
}

CodegenResult ExternalCodeGenerator::invoke(const std::string& request_json, const char* what) {
    CodegenResult r;
    const std::string prefix = std::string("Failed to ") + what + " scraping code: ";

    const std::vector<std::string> argv = split_argv_quoted(cfg_.cmd);
    if (argv.empty()) {
        r.error = prefix + "SCRAPEGUARD_CODEGEN_CMD is not set";
        return r;
    }

    ProcLimits lim;
    lim.timeout_ms = cfg_.timeout_ms;
    lim.stdout_max_bytes = cfg_.max_output_bytes;
    lim.rlimit_cpu_sec = 0;        // model clients mostly wait on the network
    lim.rlimit_as_mb = 0;
    lim.rlimit_nproc = 0;
    lim.merge_stderr = false;
    lim.cancel = cancel_;

    ProcResult pr;
    if (!proc_run_capture_sandboxed_stdin(argv, "", request_json, lim, &pr)) {
        r.error = prefix + (pr.error.empty() ? "command not started" : pr.error);
        return r;
    }
    if (pr.cancelled) {
        r.error = prefix + "cancelled";
        return r;
    }
    if (pr.timed_out) {
        r.error = prefix + "timed out after " + std::to_string(cfg_.timeout_ms) + " ms";
        return r;
    }
    if (pr.output_truncated) {
        r.error = prefix + "output exceeds " + std::to_string(cfg_.max_output_bytes) + " bytes";
        return r;
    }
    if (pr.exit_code != 0) {
        r.error = prefix + "exit_code=" + std::to_string(pr.exit_code);
        return r;
    }

    std::string text = trim_ws(pr.output);
    json_object* reply = json_tokener_parse(text.c_str());
    if (reply && json_object_is_type(reply, json_type_object)) {
        JsonGuard rg{reply};
        json_object* v = nullptr;
        if (json_object_object_get_ex(reply, "error", &v) && json_object_is_type(v, json_type_string) &&
            json_object_get_string_len(v) > 0) {
            r.error = prefix + json_object_get_string(v);
            return r;
        }
        if (!json_object_object_get_ex(reply, "code", &v) || !json_object_is_type(v, json_type_string)) {
            r.error = prefix + "reply has no code";
            return r;
        }
        text = std::string(json_object_get_string(v), (size_t)json_object_get_string_len(v));
    } else if (reply) {
        json_object_put(reply);
    }

    r.code = extract_code_block(text);
    if (r.code.empty()) {
        r.error = prefix + "empty code";
        return r;
    }
    r.ok = true;
    return r;
}

} // namespace scrapeguard
