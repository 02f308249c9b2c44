#include "test_common.h"
#include "scrapeguard/gate.h"

#include <string>

using namespace scrapeguard;

static void expect_rejected(const std::string& code, const std::string& capability) {
    GateVerdict v = default_gate().screen(code);
    expect_true(!v.approved, "should reject: " + code);
    expect_true(v.capability == capability, "capability for '" + code + "' got " + v.capability);
    expect_true(v.reason.rfind("Dangerous pattern detected: ", 0) == 0, "reason prefix: " + v.reason);
    expect_true(v.denied_class.has_value(), "denied class set");
}

static void expect_approved(const std::string& code) {
    GateVerdict v = default_gate().screen(code);
    expect_true(v.approved, "should approve: " + code + " (" + v.reason + ")");
    expect_true(v.reason.empty(), "no reason on approval");
}

int main() {
    // Test 1: module imports in every spelling
    expect_rejected("import os", "os");
    expect_rejected("IMPORT   OS", "os");
    expect_rejected("x = 1\n  import\tsubprocess\n", "subprocess");
    expect_rejected("import json, os", "os");
    expect_rejected("from os.path import join", "os");
    expect_rejected("from  Subprocess  import run", "subprocess");
    expect_rejected("import os.path", "os");

    // Test 2: denied callables, whitespace before the paren
    expect_rejected("y = eval('1+1')", "eval");
    expect_rejected("y = EXEC  (code)", "exec");
    expect_rejected("f = open ('/etc/passwd')", "open");
    expect_rejected("m = __import__('os')", "__import__");

    // Test 3: dunder attribute access
    expect_rejected("k = x.__class__", "__dunder__");

    // Test 3b: module attributes used without an import
    expect_rejected("x = os.listdir()", "os");
    expect_rejected("out = subprocess.run([\"ls\"])", "subprocess");
    expect_rejected("r = urllib . request", "urllib");
    {
        GateVerdict v = default_gate().screen("x = os.listdir()");
        expect_true(v.reason.find("os.") != std::string::npos, "reason names attribute form");
        expect_true(*v.denied_class == DeniedClass::FILESYSTEM, "os class");
    }
    expect_approved("photos.append(x)");
    expect_approved("u = \"https://www.stat.gov/data\"");
    expect_approved("n = ratio.x");

    // Test 3c: the regex module's compile is not the builtin
    expect_approved("pat = re.compile(\"[0-9]+\")");
    expect_approved("pat = re . compile (\"a\")");
    expect_rejected("c = compile(src, \"f\", \"exec\")", "compile");
    expect_rejected("pat = re.compile(\"a\")\nc = compile(src)", "compile");
    expect_rejected("c = are.compile(src)", "compile");

    // Test 4: reason names the pattern and class
    {
        GateVerdict v = default_gate().screen("import socket");
        expect_true(v.reason.find("import socket") != std::string::npos, "reason names pattern");
        expect_true(v.reason.find("network-raw") != std::string::npos, "reason names class");
        expect_true(*v.denied_class == DeniedClass::NETWORK_RAW, "socket class");
    }

    // Test 5: ordinary extraction code passes
    expect_approved(
        "import re\n"
        "page = fetch(url)\n"
        "for p in find_all(page, \"p\") {\n"
        "    emit({\"text\": p[\"text\"], \"source\": url})\n"
        "}\n");
    expect_approved("from bs4 import find_all");
    expect_approved("import osmosis_helpers");
    expect_approved("opening = 'hours'");
    expect_approved("valid = evaluate_later");
    expect_approved("");

    // Test 6: the gate is a pure function of the text
    StaticGate own;
    expect_true(own.pattern_count() == default_gate().pattern_count(), "same policy, same patterns");
    for (int i = 0; i < 3; i++) {
        expect_true(!own.screen("import pickle").approved, "stable rejection");
        expect_true(own.screen("x = len(results)").approved, "stable approval");
    }

    std::cerr << "test_gate: ALL PASSED" << std::endl;
    return 0;
}
