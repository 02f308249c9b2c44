#include "scrapeguard/policy.h"

#include <unordered_map>

namespace scrapeguard {

namespace {

using DC = DeniedClass;
using DF = DenyForm;
using PK = PrimitiveKind;

const DeniedEntry kDenied[] = {
    // filesystem
    {"os", DC::FILESYSTEM, DF::MODULE},
    {"shutil", DC::FILESYSTEM, DF::MODULE},
    {"glob", DC::FILESYSTEM, DF::MODULE},
    {"tempfile", DC::FILESYSTEM, DF::MODULE},
    {"pathlib", DC::FILESYSTEM, DF::MODULE},
    {"io", DC::FILESYSTEM, DF::MODULE},
    {"fileinput", DC::FILESYSTEM, DF::MODULE},
    {"linecache", DC::FILESYSTEM, DF::MODULE},
    {"filecmp", DC::FILESYSTEM, DF::MODULE},
    {"stat", DC::FILESYSTEM, DF::MODULE},
    {"fnmatch", DC::FILESYSTEM, DF::MODULE},
    {"fcntl", DC::FILESYSTEM, DF::MODULE},
    {"open", DC::FILESYSTEM, DF::CALLABLE},
    {"file", DC::FILESYSTEM, DF::CALLABLE},

    // process control
    {"subprocess", DC::PROCESS, DF::MODULE},
    {"multiprocessing", DC::PROCESS, DF::MODULE},
    {"threading", DC::PROCESS, DF::MODULE},
    {"signal", DC::PROCESS, DF::MODULE},
    {"pty", DC::PROCESS, DF::MODULE},
    {"pipes", DC::PROCESS, DF::MODULE},
    {"resource", DC::PROCESS, DF::MODULE},
    {"ctypes", DC::PROCESS, DF::MODULE},
    {"system", DC::PROCESS, DF::CALLABLE},
    {"popen", DC::PROCESS, DF::CALLABLE},
    {"spawn", DC::PROCESS, DF::CALLABLE},
    {"fork", DC::PROCESS, DF::CALLABLE},
    {"kill", DC::PROCESS, DF::CALLABLE},

    // raw sockets
    {"socket", DC::NETWORK_RAW, DF::MODULE},
    {"ssl", DC::NETWORK_RAW, DF::MODULE},
    {"select", DC::NETWORK_RAW, DF::MODULE},
    {"selectors", DC::NETWORK_RAW, DF::MODULE},
    {"asyncio", DC::NETWORK_RAW, DF::MODULE},

    // network clients without the fetch helpers' timeout/header policy
    {"urllib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"urllib3", DC::NETWORK_UNSAFE, DF::MODULE},
    {"http", DC::NETWORK_UNSAFE, DF::MODULE},
    {"httplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"ftplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"smtplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"poplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"imaplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"nntplib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"telnetlib", DC::NETWORK_UNSAFE, DF::MODULE},
    {"webbrowser", DC::NETWORK_UNSAFE, DF::MODULE},
    {"cgi", DC::NETWORK_UNSAFE, DF::MODULE},
    {"wsgiref", DC::NETWORK_UNSAFE, DF::MODULE},
    {"xmlrpc", DC::NETWORK_UNSAFE, DF::MODULE},

    // serialization of arbitrary bytes
    {"pickle", DC::SERIALIZATION, DF::MODULE},
    {"marshal", DC::SERIALIZATION, DF::MODULE},
    {"shelve", DC::SERIALIZATION, DF::MODULE},
    {"dbm", DC::SERIALIZATION, DF::MODULE},
    {"sqlite3", DC::SERIALIZATION, DF::MODULE},
    {"base64", DC::SERIALIZATION, DF::MODULE},
    {"binascii", DC::SERIALIZATION, DF::MODULE},
    {"codecs", DC::SERIALIZATION, DF::MODULE},
    {"quopri", DC::SERIALIZATION, DF::MODULE},
    {"uu", DC::SERIALIZATION, DF::MODULE},
    {"zipfile", DC::SERIALIZATION, DF::MODULE},
    {"tarfile", DC::SERIALIZATION, DF::MODULE},
    {"gzip", DC::SERIALIZATION, DF::MODULE},
    {"bz2", DC::SERIALIZATION, DF::MODULE},
    {"lzma", DC::SERIALIZATION, DF::MODULE},
    {"zlib", DC::SERIALIZATION, DF::MODULE},
    {"copyreg", DC::SERIALIZATION, DF::MODULE},

    // hashing / secrets
    {"hashlib", DC::HASHING, DF::MODULE},
    {"hmac", DC::HASHING, DF::MODULE},
    {"secrets", DC::HASHING, DF::MODULE},
    {"crypt", DC::HASHING, DF::MODULE},
    {"uuid", DC::HASHING, DF::MODULE},

    // time / locale (sleep_jitter is the sanctioned way to wait)
    {"time", DC::TIME_LOCALE, DF::MODULE},
    {"datetime", DC::TIME_LOCALE, DF::MODULE},
    {"calendar", DC::TIME_LOCALE, DF::MODULE},
    {"locale", DC::TIME_LOCALE, DF::MODULE},
    {"zoneinfo", DC::TIME_LOCALE, DF::MODULE},
    {"unicodedata", DC::TIME_LOCALE, DF::MODULE},

    // host runtime state
    {"sys", DC::INTROSPECTION, DF::MODULE},
    {"platform", DC::INTROSPECTION, DF::MODULE},
    {"sysconfig", DC::INTROSPECTION, DF::MODULE},
    {"inspect", DC::INTROSPECTION, DF::MODULE},
    {"gc", DC::INTROSPECTION, DF::MODULE},
    {"builtins", DC::INTROSPECTION, DF::MODULE},
    {"importlib", DC::INTROSPECTION, DF::MODULE},
    {"types", DC::INTROSPECTION, DF::MODULE},
    {"weakref", DC::INTROSPECTION, DF::MODULE},
    {"getpass", DC::INTROSPECTION, DF::MODULE},
    {"pwd", DC::INTROSPECTION, DF::MODULE},
    {"grp", DC::INTROSPECTION, DF::MODULE},
    {"vars", DC::INTROSPECTION, DF::CALLABLE},
    {"locals", DC::INTROSPECTION, DF::CALLABLE},
    {"globals", DC::INTROSPECTION, DF::CALLABLE},
    {"dir", DC::INTROSPECTION, DF::CALLABLE},
    {"getattr", DC::INTROSPECTION, DF::CALLABLE},
    {"setattr", DC::INTROSPECTION, DF::CALLABLE},
    {"delattr", DC::INTROSPECTION, DF::CALLABLE},
    {"hasattr", DC::INTROSPECTION, DF::CALLABLE},
    {"id", DC::INTROSPECTION, DF::CALLABLE},

    // dynamic evaluation
    {"eval", DC::DYNAMIC_EVAL, DF::CALLABLE},
    {"exec", DC::DYNAMIC_EVAL, DF::CALLABLE},
    {"execfile", DC::DYNAMIC_EVAL, DF::CALLABLE},
    {"compile", DC::DYNAMIC_EVAL, DF::CALLABLE},
    {"reload", DC::DYNAMIC_EVAL, DF::CALLABLE},
    {"__import__", DC::DYNAMIC_EVAL, DF::CALLABLE},

    // interactive / session
    {"input", DC::INTERACTIVE, DF::CALLABLE},
    {"raw_input", DC::INTERACTIVE, DF::CALLABLE},
    {"help", DC::INTERACTIVE, DF::CALLABLE},
    {"quit", DC::INTERACTIVE, DF::CALLABLE},
    {"exit", DC::INTERACTIVE, DF::CALLABLE},
    {"copyright", DC::INTERACTIVE, DF::CALLABLE},
    {"credits", DC::INTERACTIVE, DF::CALLABLE},
    {"license", DC::INTERACTIVE, DF::CALLABLE},
    {"breakpoint", DC::INTERACTIVE, DF::CALLABLE},
};

const AllowedEntry kAllowed[] = {
    {"int", PK::VALUE_OP},
    {"float", PK::VALUE_OP},
    {"str", PK::VALUE_OP},
    {"bool", PK::VALUE_OP},
    {"abs", PK::VALUE_OP},
    {"round", PK::VALUE_OP},
    {"chr", PK::VALUE_OP},
    {"ord", PK::VALUE_OP},
    {"repr", PK::VALUE_OP},
    {"loads", PK::VALUE_OP},
    {"dumps", PK::VALUE_OP},
    {"uniform", PK::VALUE_OP},
    {"randint", PK::VALUE_OP},
    {"choice", PK::VALUE_OP},

    {"type", PK::TYPE_QUERY},

    {"len", PK::CONTAINER},
    {"list", PK::CONTAINER},
    {"dict", PK::CONTAINER},
    {"range", PK::CONTAINER},
    {"sorted", PK::CONTAINER},
    {"reversed", PK::CONTAINER},
    {"enumerate", PK::CONTAINER},
    {"zip", PK::CONTAINER},
    {"sum", PK::CONTAINER},
    {"append", PK::CONTAINER},
    {"extend", PK::CONTAINER},
    {"pop", PK::CONTAINER},
    {"get", PK::CONTAINER},
    {"keys", PK::CONTAINER},
    {"values", PK::CONTAINER},
    {"items", PK::CONTAINER},
    {"count", PK::CONTAINER},
    {"index", PK::CONTAINER},
    {"insert", PK::CONTAINER},
    {"update", PK::CONTAINER},

    {"strip", PK::STRING_OP},
    {"lstrip", PK::STRING_OP},
    {"rstrip", PK::STRING_OP},
    {"lower", PK::STRING_OP},
    {"upper", PK::STRING_OP},
    {"split", PK::STRING_OP},
    {"replace", PK::STRING_OP},
    {"startswith", PK::STRING_OP},
    {"endswith", PK::STRING_OP},
    {"find", PK::STRING_OP},
    {"join", PK::STRING_OP},
    {"isdigit", PK::STRING_OP},
    {"isalpha", PK::STRING_OP},
    {"isspace", PK::STRING_OP},
    {"findall", PK::STRING_OP},
    {"search", PK::STRING_OP},
    {"match", PK::STRING_OP},
    {"sub", PK::STRING_OP},

    {"min", PK::COMPARE},
    {"max", PK::COMPARE},
    {"any", PK::COMPARE},
    {"all", PK::COMPARE},

    {"print", PK::OUTPUT},
    {"fail", PK::OUTPUT},

    {"emit", PK::HELPER},
    {"fetch", PK::HELPER},
    {"fetch_rendered", PK::HELPER},
    {"title", PK::HELPER},
    {"text", PK::HELPER},
    {"links", PK::HELPER},
    {"select_text", PK::HELPER},
    {"find_all", PK::HELPER},
    {"extract_emails", PK::HELPER},
    {"extract_phones", PK::HELPER},
    {"clean_text", PK::HELPER},
    {"is_dynamic", PK::HELPER},
    {"sleep_jitter", PK::HELPER},

    {"re", PK::MODULE},
    {"json", PK::MODULE},
    {"random", PK::MODULE},
    {"requests", PK::MODULE},
    {"bs4", PK::MODULE},
    {"playwright", PK::MODULE},
};

struct Index {
    std::unordered_map<std::string_view, const DeniedEntry*> denied;
    std::unordered_map<std::string_view, const AllowedEntry*> allowed;
};

const Index& index() {
    static const Index idx = [] {
        Index out;
        for (const auto& d : kDenied) out.denied.emplace(d.name, &d);
        for (const auto& a : kAllowed) out.allowed.emplace(a.name, &a);
        return out;
    }();
    return idx;
}

} // namespace

const char* denied_class_name(DeniedClass c) {
    switch (c) {
        case DeniedClass::FILESYSTEM:     return "filesystem";
        case DeniedClass::PROCESS:        return "process";
        case DeniedClass::NETWORK_RAW:    return "network-raw";
        case DeniedClass::NETWORK_UNSAFE: return "network-retry-unsafe";
        case DeniedClass::SERIALIZATION:  return "serialization";
        case DeniedClass::HASHING:        return "hashing";
        case DeniedClass::TIME_LOCALE:    return "time/locale";
        case DeniedClass::INTROSPECTION:  return "introspection";
        case DeniedClass::DYNAMIC_EVAL:   return "dynamic-evaluation";
        case DeniedClass::INTERACTIVE:    return "interactive";
    }
    return "unknown";
}

const char* primitive_kind_name(PrimitiveKind k) {
    switch (k) {
        case PrimitiveKind::VALUE_OP:   return "value";
        case PrimitiveKind::TYPE_QUERY: return "type-query";
        case PrimitiveKind::CONTAINER:  return "container";
        case PrimitiveKind::STRING_OP:  return "string";
        case PrimitiveKind::COMPARE:    return "compare";
        case PrimitiveKind::OUTPUT:     return "output";
        case PrimitiveKind::HELPER:     return "helper";
        case PrimitiveKind::MODULE:     return "module";
    }
    return "unknown";
}

SandboxPolicy::SandboxPolicy()
    : denied_(std::begin(kDenied), std::end(kDenied)),
      allowed_(std::begin(kAllowed), std::end(kAllowed)) {}

const SandboxPolicy& SandboxPolicy::instance() {
    static const SandboxPolicy policy;
    return policy;
}

CapabilityDecision SandboxPolicy::authorize(std::string_view name) const {
    CapabilityDecision d;
    const Index& idx = index();

    // Deny first; double-underscore names always count as introspection.
    if (name.size() >= 2 && name.substr(0, 2) == "__") {
        auto it = idx.denied.find(name);
        d.verdict = CapabilityDecision::Verdict::DENIED;
        d.denied_class = it != idx.denied.end() ? it->second->cls : DeniedClass::INTROSPECTION;
        d.reason = "capability '" + std::string(name) + "' denied (" + denied_class_name(*d.denied_class) + ")";
        return d;
    }
    if (auto it = idx.denied.find(name); it != idx.denied.end()) {
        d.verdict = CapabilityDecision::Verdict::DENIED;
        d.denied_class = it->second->cls;
        d.reason = "capability '" + std::string(name) + "' denied (" + denied_class_name(it->second->cls) + ")";
        return d;
    }
    if (auto it = idx.allowed.find(name); it != idx.allowed.end()) {
        d.verdict = CapabilityDecision::Verdict::ALLOWED;
        d.kind = it->second->kind;
        return d;
    }
    d.verdict = CapabilityDecision::Verdict::UNKNOWN;
    d.reason = "name '" + std::string(name) + "' is not available in the sandbox";
    return d;
}

} // namespace scrapeguard
