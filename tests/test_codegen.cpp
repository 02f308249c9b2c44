#include "test_common.h"
#include "scrapeguard/codegen.h"

#include <filesystem>
#include <fstream>
#include <string>

using namespace scrapeguard;

namespace {

std::string write_script(const std::string& name, const std::string& body) {
    const auto path = std::filesystem::temp_directory_path() / ("scrapeguard_codegen_" + name + ".sh");
    std::ofstream(path) << body;
    return path.string();
}

ExternalCodeGenerator generator_for(const std::string& script) {
    CodegenConfig cfg;
    cfg.cmd = "/bin/sh " + script;
    cfg.timeout_ms = 10000;
    return ExternalCodeGenerator(cfg);
}

} // namespace

int main() {
    // Test 1: fenced and bare replies
    expect_true(extract_code_block("```python\nresults = []\n```") == "results = []", "fenced with language");
    expect_true(extract_code_block("Sure:\n```\na = 1\nb = 2\n```\nDone.") == "a = 1\nb = 2", "prose around fence");
    expect_true(extract_code_block("  x = 1\n") == "x = 1", "no fence");
    expect_true(extract_code_block("```\nx = 1\n") == "x = 1", "unterminated fence");
    expect_true(extract_code_block("```").empty(), "fence without body");
    expect_true(extract_code_block("```\nfirst\n```\n```\nsecond\n```") == "first", "first block wins");

    // Test 2: JSON reply with code
    {
        auto s = write_script("json", "cat >/dev/null\nprintf '{\"code\": \"results = [1]\"}'\n");
        CodegenResult r = generator_for(s).generate("titles", "https://example.com");
        expect_true(r.ok, "json reply: " + r.error);
        expect_true(r.code == "results = [1]", "json code: " + r.code);
        std::filesystem::remove(s);
    }

    // Test 3: free text reply is unwrapped
    {
        auto s = write_script("text",
            "cat >/dev/null\n"
            "echo 'Here is the code:'\n"
            "echo '```python'\n"
            "echo 'emit({\"a\": 1})'\n"
            "echo '```'\n");
        CodegenResult r = generator_for(s).generate("a", "https://example.com");
        expect_true(r.ok && r.code == "emit({\"a\": 1})", "text reply: " + r.code + r.error);
        std::filesystem::remove(s);
    }

    // Test 4: repair requests carry the code and the error
    {
        auto s = write_script("repair",
            "req=$(cat)\n"
            "case \"$req\" in\n"
            "  *'\"op\":\"repair\"'*'\"code\":\"results = [x]\"'*'NameError'*) printf '{\"code\": \"results = [1]\"}' ;;\n"
            "  *) printf '{\"error\": \"unexpected request\"}' ;;\n"
            "esac\n");
        auto gen = generator_for(s);
        CodegenResult r = gen.repair("results = [x]", "line 1: NameError: name 'x' is not defined", "https://example.com");
        expect_true(r.ok && r.code == "results = [1]", "repair request: " + r.code + r.error);
        r = gen.generate("titles", "https://example.com");
        expect_true(!r.ok && r.error == "Failed to generate scraping code: unexpected request", "generate request: " + r.error);
        std::filesystem::remove(s);

        s = write_script("echo", "cat\n");
        r = generator_for(s).generate("titles", "https://example.com");
        expect_true(!r.ok && r.error == "Failed to generate scraping code: reply has no code", "reply without code: " + r.error);
        std::filesystem::remove(s);
    }

    // Test 5: failures
    {
        auto s = write_script("err", "cat >/dev/null\nprintf '{\"error\": \"quota exceeded\"}'\n");
        CodegenResult r = generator_for(s).repair("x = 1", "boom", "https://example.com");
        expect_true(!r.ok && r.error == "Failed to fix scraping code: quota exceeded", "error reply: " + r.error);
        std::filesystem::remove(s);

        s = write_script("exit", "cat >/dev/null\nexit 3\n");
        r = generator_for(s).generate("p", "https://example.com");
        expect_true(!r.ok && r.error == "Failed to generate scraping code: exit_code=3", "exit code: " + r.error);
        std::filesystem::remove(s);

        s = write_script("empty", "cat >/dev/null\n");
        r = generator_for(s).generate("p", "https://example.com");
        expect_true(!r.ok && r.error == "Failed to generate scraping code: empty code", "empty: " + r.error);
        std::filesystem::remove(s);

        ExternalCodeGenerator unset{CodegenConfig{}};
        r = unset.generate("p", "https://example.com");
        expect_true(!r.ok && r.error.find("SCRAPEGUARD_CODEGEN_CMD is not set") != std::string::npos, "unset: " + r.error);
    }

    std::cerr << "test_codegen: ALL PASSED" << std::endl;
    return 0;
}
