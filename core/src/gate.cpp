#include "scrapeguard/gate.h"

namespace scrapeguard {

namespace {

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

// Names in the table are plain identifiers, but escape anyway so a future
// entry with a regex metacharacter cannot change the pattern's meaning.
std::string regex_escape(const std::string& s) {
    static const std::string meta = R"(\^$.|?*+()[]{})";
    std::string out;
    for (char c : s) {
        if (meta.find(c) != std::string::npos) out.push_back('\\');
        out.push_back(c);
    }
    return out;
}

} // namespace

StaticGate::StaticGate(const SandboxPolicy& policy) {
    for (const auto& d : policy.denied_entries()) {
        const std::string name = d.name;
        const std::string n = regex_escape(name);
        if (d.form == DenyForm::MODULE) {
            // import X / import a, X / from X import ... / from X.sub import ...
            patterns_.push_back({"import " + name, name, d.cls,
                std::regex(R"(\bimport\s+(?:[\w.]+[ \t]*,[ \t]*)*)" + n + R"((?![\w]))", kFlags)});
            patterns_.push_back({"from " + name + " import", name, d.cls,
                std::regex(R"(\bfrom\s+)" + n + R"((?:\.[\w.]+)?\s+import\b)", kFlags)});
            // X.attr used without an import; not when X is itself an attribute
            patterns_.push_back({name + ".", name, d.cls,
                std::regex(R"((?:^|[^\w.]))" + n + R"(\s*\.\s*[A-Za-z_])", kFlags)});
        } else {
            // Group 1 marks re.<name>(, the regex module's own function.
            std::regex re = name.rfind("__", 0) == 0
                ? std::regex("(?:^|[^\\w])" + n + R"(\s*\()", kFlags)
                : std::regex(R"((\bre\s*\.\s*)?\b)" + n + R"(\s*\()", kFlags);
            patterns_.push_back({name + "(", name, d.cls, std::move(re)});
        }
    }
    patterns_.push_back({"__dunder__", "__dunder__", DeniedClass::INTROSPECTION,
        std::regex(R"(__[A-Za-z0-9_]+__)", kFlags)});
}

GateVerdict StaticGate::screen(const std::string& code) const {
    GateVerdict v;
    for (const auto& p : patterns_) {
        bool hit = false;
        for (std::sregex_iterator it(code.begin(), code.end(), p.re), end; it != end; ++it) {
            if (p.re.mark_count() > 0 && (*it)[1].matched) continue;
            hit = true;
            break;
        }
        if (hit) {
            v.approved = false;
            v.capability = p.capability;
            v.denied_class = p.cls;
            v.reason = "Dangerous pattern detected: " + p.display +
                       " (capability '" + p.capability + "', " + denied_class_name(p.cls) + ")";
            return v;
        }
    }
    return v;
}

const StaticGate& default_gate() {
    static const StaticGate gate;
    return gate;
}

} // namespace scrapeguard
