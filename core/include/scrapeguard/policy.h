#pragma once

// Scrapeguard SandboxPolicy: the capability surface visible to generated code.
//
// Design: static table, default deny. A name is resolved in three steps:
//   1. deny table (and the double-underscore rule)  -> DENIED with its class
//   2. allow table                                   -> ALLOWED with its kind
//   3. anything else                                 -> UNKNOWN (unavailable)
// The table cannot be changed at run time; generated code has no way to
// amend its own restrictions.

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrapeguard {

// Why a named capability is denied.
enum class DeniedClass {
    FILESYSTEM,
    PROCESS,
    NETWORK_RAW,
    NETWORK_UNSAFE,   // unmanaged network clients that bypass the fetch helpers' policy
    SERIALIZATION,
    HASHING,
    TIME_LOCALE,
    INTROSPECTION,
    DYNAMIC_EVAL,
    INTERACTIVE,
};

// What an allowed capability is. Only pure, total, non-I/O primitives,
// plus the pre-bound helpers and module names whose import is a no-op.
enum class PrimitiveKind {
    VALUE_OP,     // int, str, float, bool, abs, round, ...
    TYPE_QUERY,   // type(): read-only type name
    CONTAINER,    // list, dict, len, sorted, append, keys, ...
    STRING_OP,    // strip, split, lower, join, ...
    COMPARE,      // min, max, any, all
    OUTPUT,       // print (captured), fail
    HELPER,       // pre-bound helper objects (fetch, emit, find_all, ...)
    MODULE,       // import is accepted as a no-op; functionality comes from helpers
};

// How a denied name shows up in source text; drives StaticGate patterns.
enum class DenyForm {
    MODULE,    // import X / from X import
    CALLABLE,  // X(
};

struct DeniedEntry {
    const char* name;
    DeniedClass cls;
    DenyForm form;
};

struct AllowedEntry {
    const char* name;
    PrimitiveKind kind;
};

struct CapabilityDecision {
    enum class Verdict { ALLOWED, DENIED, UNKNOWN } verdict{Verdict::UNKNOWN};
    std::optional<DeniedClass> denied_class;
    std::optional<PrimitiveKind> kind;
    std::string reason; // empty when allowed

    bool allowed() const { return verdict == Verdict::ALLOWED; }
};

const char* denied_class_name(DeniedClass c);
const char* primitive_kind_name(PrimitiveKind k);

class SandboxPolicy {
public:
    // The single process-wide policy. Read-only after static initialization.
    static const SandboxPolicy& instance();

    CapabilityDecision authorize(std::string_view name) const;

    const std::vector<DeniedEntry>& denied_entries() const { return denied_; }
    const std::vector<AllowedEntry>& allowed_entries() const { return allowed_; }

private:
    SandboxPolicy();

    std::vector<DeniedEntry> denied_;
    std::vector<AllowedEntry> allowed_;
};

} // namespace scrapeguard
