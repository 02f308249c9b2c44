#pragma once

#include "scrapeguard/config.h"

#include <atomic>
#include <string>

namespace scrapeguard {

struct CodegenResult {
    bool ok{false};
    std::string code;
    std::string error;
};

// Source of extraction code. generate() writes code for a request, repair()
// rewrites failing code given the error it produced.
class ICodeGenerator {
public:
    virtual ~ICodeGenerator() = default;
    virtual CodegenResult generate(const std::string& prompt, const std::string& url) = 0;
    virtual CodegenResult repair(const std::string& code, const std::string& error, const std::string& url) = 0;
};

// Body of the first fenced block (``` or ```lang); the whole text, trimmed,
// when there is no fence. An unterminated fence runs to the end of the text.
std::string extract_code_block(const std::string& text);

// Runs SCRAPEGUARD_CODEGEN_CMD (no shell) once per request through the
// sandboxed process runner.
//   stdin : {"op":"generate","prompt":...,"url":...}
//           {"op":"repair","code":...,"error":...,"url":...}
//   stdout: {"code": "..."} or {"error": "..."}; anything that is not a JSON
//           object is taken as free text and unwrapped with extract_code_block.
class ExternalCodeGenerator : public ICodeGenerator {
public:
    explicit ExternalCodeGenerator(CodegenConfig cfg, const std::atomic<bool>* cancel = nullptr);

    CodegenResult generate(const std::string& prompt, const std::string& url) override;
    CodegenResult repair(const std::string& code, const std::string& error, const std::string& url) override;

private:
    CodegenResult invoke(const std::string& request_json, const char* what);

    CodegenConfig cfg_;
    const std::atomic<bool>* cancel_;
};

} // namespace scrapeguard
