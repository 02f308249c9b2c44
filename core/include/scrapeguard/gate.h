#pragma once

// StaticGate: fast textual screen run before every evaluation attempt.
//
// Approximate by nature: text matching cannot prove a capability is absent,
// and it may reject harmless text that merely looks like a forbidden call.
// SandboxPolicy, consulted by the interpreter at every lookup, is the actual
// enforcement point.

#include "scrapeguard/policy.h"

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace scrapeguard {

struct GateVerdict {
    bool approved{true};
    std::string reason;      // "Dangerous pattern detected: ..." when rejected
    std::string capability;  // offending capability name
    std::optional<DeniedClass> denied_class;
};

class StaticGate {
public:
    // Patterns are derived from the policy's deny table.
    explicit StaticGate(const SandboxPolicy& policy = SandboxPolicy::instance());

    GateVerdict screen(const std::string& code) const;

    size_t pattern_count() const { return patterns_.size(); }

private:
    struct Pattern {
        std::string display;  // e.g. "import os", "os.", "eval("
        std::string capability;
        DeniedClass cls;
        std::regex re;
    };
    std::vector<Pattern> patterns_;
};

// Shared, lazily built gate for the default policy.
const StaticGate& default_gate();

} // namespace scrapeguard
