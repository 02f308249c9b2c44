#include "script_ast.h"

#include "scrapeguard/document.h"
#include "scrapeguard/heuristics.h"
#include "scrapeguard/policy.h"
#include "scrapeguard/regex_scan.h"
#include "scrapeguard/validator.h"

#include <algorithm>
#include <chrono>
#include <climits>
#include <cmath>
#include <random>
#include <regex>
#include <thread>
#include <unordered_map>

namespace scrapeguard::script {

namespace {

using Args = std::vector<Value>;
using Clock = std::chrono::steady_clock;

enum class Flow { NORMAL, BREAK, CONTINUE };

std::string type_of(const Value& v) {
    return type_name(v.type);
}

bool is_numeric(const Value& v) {
    return v.type == Value::Type::NUMBER || v.type == Value::Type::BOOL;
}

double as_number(const Value& v) {
    return v.type == Value::Type::BOOL ? (v.b ? 1.0 : 0.0) : v.num;
}

size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

std::vector<std::string> utf8_chars(const std::string& s) {
    std::vector<std::string> out;
    for (size_t i = 0; i < s.size();) {
        size_t len = 1;
        unsigned char c = (unsigned char)s[i];
        if (c >= 0xF0) len = 4;
        else if (c >= 0xE0) len = 3;
        else if (c >= 0xC0) len = 2;
        len = std::min(len, s.size() - i);
        out.push_back(s.substr(i, len));
        i += len;
    }
    return out;
}

bool is_space_char(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string strip_chars(const std::string& s, const std::string* chars, bool left, bool right) {
    auto strip_it = [&](char c) {
        return chars ? chars->find(c) != std::string::npos : is_space_char(c);
    };
    size_t b = 0, e = s.size();
    if (left) while (b < e && strip_it(s[b])) b++;
    if (right) while (e > b && strip_it(s[e - 1])) e--;
    return s.substr(b, e - b);
}

// Python-style slice bounds on a sequence of length n.
std::pair<size_t, size_t> slice_bounds(const Value* lo, const Value* hi, size_t n) {
    auto clamp = [n](double d) -> size_t {
        if (std::isnan(d)) return 0;
        d = std::trunc(d);
        if (d < 0) d += (double)n;
        if (d <= 0) return 0;
        if (d >= (double)n) return n;
        return (size_t)d;
    };
    size_t b = lo ? clamp(as_number(*lo)) : 0;
    size_t e = hi ? clamp(as_number(*hi)) : n;
    if (e < b) e = b;
    return {b, e};
}

class Interpreter {
public:
    Interpreter(const ScriptContext& ctx, ScriptRun& run)
        : ctx_(ctx), run_(run), policy_(SandboxPolicy::instance()),
          rng_(std::random_device{}()) {
        start_ = Clock::now();
        if (ctx_.limits.timeout_ms > 0) deadline_ = start_ + std::chrono::milliseconds(ctx_.limits.timeout_ms);
        vars_["url"] = Value::string(ctx_.url);
        vars_["results"] = Value::new_list();
    }

    void execute(const Program& p) {
        Flow f = exec_block(p.body);
        if (f != Flow::NORMAL) throw ScriptError(0, "SyntaxError: 'break' or 'continue' outside loop");
        check_nested(vars_["results"], 0);
        run_.results = vars_["results"];
    }

private:
    [[noreturn]] void raise(int line, const std::string& msg) const {
        throw ScriptError(line, msg);
    }

    int remaining_ms() const {
        if (ctx_.limits.timeout_ms <= 0) return 1 << 30;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline_ - Clock::now()).count();
        return left > 0 ? (int)left : 0;
    }

    void check_clock(int line) {
        if (ctx_.cancel && ctx_.cancel->load()) {
            run_.cancelled = true;
            raise(line, "execution cancelled");
        }
        if (ctx_.limits.timeout_ms > 0 && Clock::now() >= deadline_) {
            run_.timed_out = true;
            raise(line, "TimeoutError: execution exceeded " + std::to_string(ctx_.limits.timeout_ms) + " ms");
        }
    }

    void tick(int line) {
        run_.steps++;
        if (ctx_.limits.max_steps > 0 && run_.steps > ctx_.limits.max_steps) {
            raise(line, "ResourceError: step budget of " + std::to_string(ctx_.limits.max_steps) + " exhausted");
        }
        if ((run_.steps & 0xFF) == 0) check_clock(line);
    }

    // ---- argument helpers ----

    void arity(const Args& a, size_t lo, size_t hi, const std::string& fn, int line) const {
        if (a.size() >= lo && a.size() <= hi) return;
        std::string want = lo == hi ? std::to_string(lo) : std::to_string(lo) + " to " + std::to_string(hi);
        raise(line, "TypeError: " + fn + "() takes " + want + " arguments (" + std::to_string(a.size()) + " given)");
    }

    double need_number(const Value& v, const std::string& fn, int line) const {
        if (!is_numeric(v)) raise(line, "TypeError: " + fn + "() expects a number, got " + type_of(v));
        return as_number(v);
    }

    // Integers are doubles underneath; beyond 2^53 they are no longer exact.
    static constexpr double kMaxExactInt = 9007199254740992.0;

    long long need_int(const Value& v, const std::string& fn, int line) const {
        double d = need_number(v, fn, line);
        if (!std::isfinite(d)) raise(line, "ValueError: " + fn + "() expects a finite number");
        if (std::fabs(d) > kMaxExactInt) raise(line, "OverflowError: " + fn + "() argument out of range");
        return (long long)d;
    }

    static int clamp_int(long long v) {
        return (int)std::clamp<long long>(v, INT_MIN, INT_MAX);
    }

    // NaN and negatives give 0
    static int seconds_to_ms(double seconds) {
        const double ms = seconds * 1000.0;
        if (!(ms > 0.0)) return 0;
        return ms < (double)INT_MAX ? (int)ms : INT_MAX;
    }

    const std::string& need_string(const Value& v, const std::string& fn, int line) const {
        if (!v.is_string()) raise(line, "TypeError: " + fn + "() expects a str, got " + type_of(v));
        return v.str;
    }

    const List& need_list(const Value& v, const std::string& fn, int line) const {
        if (!v.is_list()) raise(line, "TypeError: " + fn + "() expects a list, got " + type_of(v));
        return *v.list;
    }

    std::shared_ptr<const Document> need_doc(const Value& v, const std::string& fn, int line) const {
        if (v.type != Value::Type::DOCUMENT || !v.doc) {
            raise(line, "TypeError: " + fn + "() expects a document from fetch(), got " + type_of(v));
        }
        return v.doc;
    }

    // Text of a document, an element record or a plain string.
    std::string text_of(const Value& v, const std::string& fn, int line) const {
        if (v.type == Value::Type::DOCUMENT && v.doc) return v.doc->text();
        if (v.is_string()) return v.str;
        if (v.is_map()) {
            if (const Value* t = v.get("text"); t && t->is_string()) return t->str;
        }
        raise(line, "TypeError: " + fn + "() expects a document, element or str, got " + type_of(v));
    }

    std::string map_key(const Value& k, int line) const {
        if (!k.is_string()) raise(line, "TypeError: dict keys must be str, got " + type_of(k));
        return k.str;
    }

    void check_size(size_t n, int line) const {
        if (n > ctx_.limits.max_collection) {
            raise(line, "ResourceError: collection larger than " + std::to_string(ctx_.limits.max_collection) + " items");
        }
    }

    void check_string(const std::string& s, int line) const {
        if (s.size() > ctx_.limits.max_string_bytes) {
            raise(line, "ResourceError: string longer than " + std::to_string(ctx_.limits.max_string_bytes) + " bytes");
        }
    }

    static const void* container_id(const Value& v) {
        if (v.is_list()) return v.list.get();
        if (v.is_map()) return v.map.get();
        return nullptr;
    }

    void walk_nesting(const Value& v, const void* into, int budget, size_t& visited, int line) {
        const void* id = container_id(v);
        if (!id) return;
        if (into && id == into) raise(line, "ValueError: a list or dict cannot contain itself");
        if (budget <= 0) {
            raise(line, "ResourceError: lists and dicts nested deeper than " +
                        std::to_string(ctx_.limits.max_nesting) + " levels");
        }
        if (++visited > ctx_.limits.max_collection) {
            raise(line, "ResourceError: collection larger than " + std::to_string(ctx_.limits.max_collection) + " items");
        }
        if ((visited & 0xFFF) == 0) check_clock(line);
        if (v.is_list()) {
            for (const auto& x : *v.list) walk_nesting(x, into, budget - 1, visited, line);
        } else {
            for (const auto& f : *v.map) walk_nesting(f.second, into, budget - 1, visited, line);
        }
    }

    // Before `child` goes into a container: it must leave room for one more
    // level, and must not already hold `into` (that would close a cycle).
    void check_nesting(const Value& child, const Value* into, int line) {
        size_t visited = 0;
        walk_nesting(child, into ? container_id(*into) : nullptr, ctx_.limits.max_nesting - 1, visited, line);
    }

    // For values built by wrapping existing ones (enumerate, zip, items).
    void check_nested(const Value& v, int line) {
        size_t visited = 0;
        walk_nesting(v, nullptr, ctx_.limits.max_nesting, visited, line);
    }

    // ---- names ----

    Value lookup(const std::string& name, int line) {
        if (auto it = vars_.find(name); it != vars_.end()) return it->second;
        CapabilityDecision d = policy_.authorize(name);
        if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(line, "SecurityError: " + d.reason);
        if (d.verdict == CapabilityDecision::Verdict::UNKNOWN) raise(line, "NameError: name '" + name + "' is not defined");
        if (d.kind == PrimitiveKind::MODULE) raise(line, "TypeError: module '" + name + "' can only be used as " + name + ".<function>(...)");
        raise(line, "TypeError: '" + name + "' cannot be used as a value; call it");
    }

    void bind(const std::string& name, Value v, int line) {
        CapabilityDecision d = policy_.authorize(name);
        if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(line, "SecurityError: cannot bind name: " + d.reason);
        vars_[name] = std::move(v);
    }

    void assign(const Expr& target, Value v, int line) {
        if (target.kind == ExprKind::NAME) {
            bind(target.name, std::move(v), line);
            return;
        }
        Value container = eval(*target.a);
        Value key = eval(*target.b);
        if (container.is_list()) {
            List& l = *container.list;
            long long i = need_int(key, "list index", line);
            if (i < 0) i += (long long)l.size();
            if (i < 0 || i >= (long long)l.size()) raise(line, "IndexError: list assignment index out of range");
            check_nesting(v, &container, line);
            l[(size_t)i] = std::move(v);
            return;
        }
        if (container.is_map()) {
            const std::string k = map_key(key, line);
            check_nesting(v, &container, line);
            container.set(k, std::move(v));
            return;
        }
        raise(line, "TypeError: '" + type_of(container) + "' object does not support item assignment");
    }

    // ---- statements ----

    Flow exec_block(const Block& b) {
        for (const auto& s : b) {
            Flow f = exec(*s);
            if (f != Flow::NORMAL) return f;
        }
        return Flow::NORMAL;
    }

    std::vector<Value> iterate(const Value& v, int line) {
        switch (v.type) {
            case Value::Type::LIST:
                return *v.list;
            case Value::Type::STRING: {
                std::vector<Value> out;
                for (auto& c : utf8_chars(v.str)) out.push_back(Value::string(std::move(c)));
                return out;
            }
            case Value::Type::MAP: {
                std::vector<Value> out;
                for (const auto& f : *v.map) out.push_back(Value::string(f.first));
                return out;
            }
            default:
                raise(line, "TypeError: '" + type_of(v) + "' object is not iterable");
        }
    }

    void unpack(const std::vector<std::string>& names, const Value& v, int line) {
        if (names.size() == 1) {
            bind(names[0], v, line);
            return;
        }
        if (!v.is_list()) raise(line, "TypeError: cannot unpack non-list " + type_of(v));
        if (v.list->size() != names.size()) {
            raise(line, "ValueError: expected " + std::to_string(names.size()) + " values to unpack, got " +
                        std::to_string(v.list->size()));
        }
        List items = *v.list;
        for (size_t i = 0; i < names.size(); i++) bind(names[i], items[i], line);
    }

    Flow exec(const Stmt& s) {
        tick(s.line);
        switch (s.kind) {
            case StmtKind::EXPR:
                (void)eval(*s.value);
                return Flow::NORMAL;

            case StmtKind::ASSIGN: {
                Value v = eval(*s.value);
                if (s.targets.size() == 1) {
                    assign(*s.targets[0], std::move(v), s.line);
                } else {
                    std::vector<std::string> names;
                    for (const auto& t : s.targets) names.push_back(t->name);
                    unpack(names, v, s.line);
                }
                return Flow::NORMAL;
            }

            case StmtKind::AUG_ASSIGN: {
                const Expr& t = *s.targets[0];
                if (t.kind == ExprKind::NAME) {
                    Value cur = lookup(t.name, s.line);
                    bind(t.name, binary(s.op, cur, eval(*s.value), s.line), s.line);
                    return Flow::NORMAL;
                }
                Value container = eval(*t.a);
                Value key = eval(*t.b);
                Value cur = index(container, key, s.line);
                Value next = binary(s.op, cur, eval(*s.value), s.line);
                check_nesting(next, &container, s.line);
                if (container.is_list()) {
                    long long i = need_int(key, "list index", s.line);
                    if (i < 0) i += (long long)container.list->size();
                    (*container.list)[(size_t)i] = std::move(next);
                } else if (container.is_map()) {
                    container.set(map_key(key, s.line), std::move(next));
                } else {
                    raise(s.line, "TypeError: '" + type_of(container) + "' object does not support item assignment");
                }
                return Flow::NORMAL;
            }

            case StmtKind::IF:
                for (const auto& br : s.branches) {
                    if (!br.cond || truthy(eval(*br.cond))) return exec_block(br.body);
                }
                return Flow::NORMAL;

            case StmtKind::FOR: {
                Value it = eval(*s.value);
                for (const Value& item : iterate(it, s.line)) {
                    tick(s.line);
                    unpack(s.vars, item, s.line);
                    Flow f = exec_block(s.body);
                    if (f == Flow::BREAK) break;
                }
                return Flow::NORMAL;
            }

            case StmtKind::WHILE:
                while (truthy(eval(*s.value))) {
                    tick(s.line);
                    Flow f = exec_block(s.body);
                    if (f == Flow::BREAK) break;
                }
                return Flow::NORMAL;

            case StmtKind::BREAK:
                return Flow::BREAK;
            case StmtKind::CONTINUE:
                return Flow::CONTINUE;
            case StmtKind::PASS:
                return Flow::NORMAL;

            case StmtKind::IMPORT:
                for (const auto& m : s.modules) {
                    const std::string root = m.substr(0, m.find('.'));
                    CapabilityDecision d = policy_.authorize(root);
                    if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(s.line, "SecurityError: " + d.reason);
                    if (!d.allowed() || d.kind != PrimitiveKind::MODULE) {
                        raise(s.line, "ImportError: No module named '" + m + "'");
                    }
                    for (const auto& name : s.vars) {
                        CapabilityDecision nd = policy_.authorize(name);
                        if (nd.verdict == CapabilityDecision::Verdict::DENIED) raise(s.line, "SecurityError: " + nd.reason);
                        if (!nd.allowed()) raise(s.line, "ImportError: cannot import name '" + name + "' from '" + m + "'");
                    }
                }
                return Flow::NORMAL;
        }
        return Flow::NORMAL;
    }

    // ---- expressions ----

    Value eval(const Expr& e) {
        tick(e.line);
        switch (e.kind) {
            case ExprKind::LITERAL:
                return e.literal;
            case ExprKind::NAME:
                return lookup(e.name, e.line);
            case ExprKind::LIST: {
                List items;
                items.reserve(e.items.size());
                for (const auto& it : e.items) {
                    items.push_back(eval(*it));
                    check_nesting(items.back(), nullptr, e.line);
                }
                return Value::new_list(std::move(items));
            }
            case ExprKind::MAP: {
                Value m = Value::new_map();
                for (size_t i = 0; i + 1 < e.items.size(); i += 2) {
                    Value k = eval(*e.items[i]);
                    Value v = eval(*e.items[i + 1]);
                    check_nesting(v, nullptr, e.line);
                    m.set(map_key(k, e.line), std::move(v));
                }
                return m;
            }
            case ExprKind::UNARY: {
                Value v = eval(*e.a);
                if (!is_numeric(v)) raise(e.line, "TypeError: bad operand type for unary " + e.op + ": '" + type_of(v) + "'");
                return Value::number(e.op == "-" ? -as_number(v) : as_number(v));
            }
            case ExprKind::BINARY:
                return binary(e.op, eval(*e.a), eval(*e.b), e.line);
            case ExprKind::COMPARE:
                return Value::boolean(compare(e.op, eval(*e.a), eval(*e.b), e.line));
            case ExprKind::AND: {
                Value a = eval(*e.a);
                return truthy(a) ? eval(*e.b) : a;
            }
            case ExprKind::OR: {
                Value a = eval(*e.a);
                return truthy(a) ? a : eval(*e.b);
            }
            case ExprKind::NOT:
                return Value::boolean(!truthy(eval(*e.a)));
            case ExprKind::COND:
                return truthy(eval(*e.b)) ? eval(*e.a) : eval(*e.c);
            case ExprKind::CALL: {
                Args args;
                args.reserve(e.items.size());
                for (const auto& a : e.items) args.push_back(eval(*a));
                return call(e.name, args, e.line);
            }
            case ExprKind::METHOD:
                return method(e);
            case ExprKind::ATTR: {
                CapabilityDecision d = policy_.authorize(e.name);
                if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(e.line, "SecurityError: " + d.reason);
                raise(e.line, "AttributeError: attribute access is not supported ('." + e.name +
                              "'); call a method or index with [\"" + e.name + "\"]");
            }
            case ExprKind::INDEX:
                return index(eval(*e.a), eval(*e.b), e.line);
            case ExprKind::SLICE: {
                Value target = eval(*e.a);
                Value lo, hi;
                if (e.b) lo = eval(*e.b);
                if (e.c) hi = eval(*e.c);
                if (e.b && !is_numeric(lo)) raise(e.line, "TypeError: slice indices must be numbers");
                if (e.c && !is_numeric(hi)) raise(e.line, "TypeError: slice indices must be numbers");
                if (target.is_string()) {
                    auto [b, en] = slice_bounds(e.b ? &lo : nullptr, e.c ? &hi : nullptr, target.str.size());
                    return Value::string(target.str.substr(b, en - b));
                }
                if (target.is_list()) {
                    auto [b, en] = slice_bounds(e.b ? &lo : nullptr, e.c ? &hi : nullptr, target.list->size());
                    return Value::new_list(List(target.list->begin() + (long)b, target.list->begin() + (long)en));
                }
                raise(e.line, "TypeError: '" + type_of(target) + "' object is not sliceable");
            }
        }
        raise(e.line, "internal error: unknown expression");
    }

    Value index(const Value& target, const Value& key, int line) {
        if (target.is_list()) {
            long long i = need_int(key, "list index", line);
            const List& l = *target.list;
            if (i < 0) i += (long long)l.size();
            if (i < 0 || i >= (long long)l.size()) raise(line, "IndexError: list index out of range");
            return l[(size_t)i];
        }
        if (target.is_string()) {
            long long i = need_int(key, "string index", line);
            const std::string& s = target.str;
            if (i < 0) i += (long long)s.size();
            if (i < 0 || i >= (long long)s.size()) raise(line, "IndexError: string index out of range");
            return Value::string(std::string(1, s[(size_t)i]));
        }
        if (target.is_map()) {
            const std::string k = map_key(key, line);
            if (const Value* v = target.get(k)) return *v;
            raise(line, "KeyError: '" + k + "'");
        }
        raise(line, "TypeError: '" + type_of(target) + "' object is not subscriptable");
    }

    Value repeat(const Value& seq, double times, int line) {
        if (std::isnan(times) || times < 1.0) return seq.is_string() ? Value::string("") : Value::new_list();
        if (times > kMaxExactInt) raise(line, "OverflowError: repeat count out of range");
        long long n = (long long)times;
        if (seq.is_string() ? seq.str.empty() : seq.list->empty()) {
            return seq.is_string() ? Value::string("") : Value::new_list();
        }
        if (seq.is_string()) {
            if ((double)seq.str.size() * (double)n > (double)ctx_.limits.max_string_bytes) {
                raise(line, "ResourceError: string longer than " + std::to_string(ctx_.limits.max_string_bytes) + " bytes");
            }
            std::string out;
            out.reserve(seq.str.size() * (size_t)n);
            for (long long i = 0; i < n; i++) out += seq.str;
            return Value::string(std::move(out));
        }
        if ((double)seq.list->size() * (double)n > (double)ctx_.limits.max_collection) {
            check_size(ctx_.limits.max_collection + 1, line);
        }
        List out;
        for (long long i = 0; i < n; i++) out.insert(out.end(), seq.list->begin(), seq.list->end());
        return Value::new_list(std::move(out));
    }

    Value binary(const std::string& op, const Value& a, const Value& b, int line) {
        if (is_numeric(a) && is_numeric(b)) {
            double x = as_number(a), y = as_number(b);
            if (op == "+") return Value::number(x + y);
            if (op == "-") return Value::number(x - y);
            if (op == "*") return Value::number(x * y);
            if (y == 0.0 && (op == "/" || op == "//" || op == "%")) raise(line, "ZeroDivisionError: division by zero");
            if (op == "/") return Value::number(x / y);
            if (op == "//") return Value::number(std::floor(x / y));
            if (op == "%") {
                double r = std::fmod(x, y);
                if (r != 0.0 && ((r < 0) != (y < 0))) r += y;
                return Value::number(r);
            }
        }
        if (op == "+") {
            if (a.is_string() && b.is_string()) {
                std::string out = a.str + b.str;
                check_string(out, line);
                return Value::string(std::move(out));
            }
            if (a.is_list() && b.is_list()) {
                check_size(a.list->size() + b.list->size(), line);
                List out = *a.list;
                out.insert(out.end(), b.list->begin(), b.list->end());
                return Value::new_list(std::move(out));
            }
            if (a.is_string()) raise(line, "TypeError: can only concatenate str (not \"" + type_of(b) + "\") to str");
        }
        if (op == "*") {
            if ((a.is_string() || a.is_list()) && is_numeric(b)) return repeat(a, as_number(b), line);
            if ((b.is_string() || b.is_list()) && is_numeric(a)) return repeat(b, as_number(a), line);
        }
        raise(line, "TypeError: unsupported operand type(s) for " + op + ": '" + type_of(a) + "' and '" + type_of(b) + "'");
    }

    // <0, 0, >0 for ordered comparisons of numbers, strings and lists.
    int order(const Value& a, const Value& b, int line, int depth = 0) const {
        if (is_numeric(a) && is_numeric(b)) {
            double x = as_number(a), y = as_number(b);
            return x < y ? -1 : (x > y ? 1 : 0);
        }
        if (a.is_string() && b.is_string()) return a.str.compare(b.str) < 0 ? -1 : (a.str == b.str ? 0 : 1);
        if (a.is_list() && b.is_list()) {
            if (depth >= kMaxValueDepth) raise(line, "ResourceError: lists nested too deeply to compare");
            size_t n = std::min(a.list->size(), b.list->size());
            for (size_t i = 0; i < n; i++) {
                int c = order((*a.list)[i], (*b.list)[i], line, depth + 1);
                if (c != 0) return c;
            }
            return a.list->size() < b.list->size() ? -1 : (a.list->size() > b.list->size() ? 1 : 0);
        }
        raise(line, "TypeError: '<' not supported between '" + type_of(a) + "' and '" + type_of(b) + "'");
    }

    bool equal(const Value& a, const Value& b) const {
        if (is_numeric(a) && is_numeric(b)) return as_number(a) == as_number(b);
        return values_equal(a, b);
    }

    bool contains(const Value& container, const Value& item, int line) const {
        if (container.is_string()) {
            if (!item.is_string()) raise(line, "TypeError: 'in <str>' requires str as left operand, not " + type_of(item));
            return container.str.find(item.str) != std::string::npos;
        }
        if (container.is_list()) {
            for (const auto& v : *container.list) if (equal(v, item)) return true;
            return false;
        }
        if (container.is_map()) return item.is_string() && container.get(item.str) != nullptr;
        raise(line, "TypeError: argument of type '" + type_of(container) + "' is not iterable");
    }

    bool compare(const std::string& op, const Value& a, const Value& b, int line) const {
        if (op == "==") return equal(a, b);
        if (op == "!=") return !equal(a, b);
        if (op == "in") return contains(b, a, line);
        if (op == "not in") return !contains(b, a, line);
        int c = order(a, b, line);
        if (op == "<") return c < 0;
        if (op == "<=") return c <= 0;
        if (op == ">") return c > 0;
        return c >= 0;
    }

    // ---- calls ----

    Value call(const std::string& name, Args& a, int line) {
        CapabilityDecision d = policy_.authorize(name);
        if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(line, "SecurityError: " + d.reason);
        if (d.verdict == CapabilityDecision::Verdict::UNKNOWN) {
            if (auto it = vars_.find(name); it != vars_.end()) {
                raise(line, "TypeError: '" + type_of(it->second) + "' object is not callable");
            }
            raise(line, "NameError: name '" + name + "' is not defined");
        }
        if (d.kind == PrimitiveKind::HELPER) return helper(name, a, line);
        if (d.kind == PrimitiveKind::MODULE) raise(line, "TypeError: 'module' object is not callable");
        return builtin(name, a, line);
    }

    Value builtin(const std::string& fn, Args& a, int line) {
        if (fn == "print") {
            std::string out;
            for (size_t i = 0; i < a.size(); i++) {
                if (i) out.push_back(' ');
                out += to_display(a[i]);
            }
            out.push_back('\n');
            size_t room = ctx_.limits.max_output_bytes > run_.output.size()
                ? ctx_.limits.max_output_bytes - run_.output.size() : 0;
            run_.output.append(out, 0, std::min(room, out.size()));
            return Value::nil();
        }
        if (fn == "fail") {
            arity(a, 0, 1, fn, line);
            raise(line, "Error: " + (a.empty() ? std::string("fail() called") : to_display(a[0])));
        }
        if (fn == "len") {
            arity(a, 1, 1, fn, line);
            const Value& v = a[0];
            if (v.is_string()) return Value::number((double)utf8_length(v.str));
            if (v.is_list()) return Value::number((double)v.list->size());
            if (v.is_map()) return Value::number((double)v.map->size());
            raise(line, "TypeError: object of type '" + type_of(v) + "' has no len()");
        }
        if (fn == "str") {
            arity(a, 0, 1, fn, line);
            return Value::string(a.empty() ? "" : to_display(a[0]));
        }
        if (fn == "repr") {
            arity(a, 1, 1, fn, line);
            if (!a[0].is_string()) return Value::string(to_display(a[0]));
            const std::string wrapped = to_display(Value::new_list({a[0]}));
            return Value::string(wrapped.substr(1, wrapped.size() - 2));
        }
        if (fn == "bool") {
            arity(a, 0, 1, fn, line);
            return Value::boolean(!a.empty() && truthy(a[0]));
        }
        if (fn == "int" || fn == "float") {
            arity(a, 0, 1, fn, line);
            if (a.empty()) return Value::number(0);
            const Value& v = a[0];
            double d = 0;
            if (is_numeric(v)) {
                d = as_number(v);
            } else if (v.is_string()) {
                const std::string t = strip_chars(v.str, nullptr, true, true);
                size_t used = 0;
                try {
                    if (fn == "int") d = (double)std::stoll(t, &used, 10);
                    else d = std::stod(t, &used);
                } catch (const std::exception&) {
                    used = 0;
                }
                if (t.empty() || used != t.size()) {
                    raise(line, "ValueError: invalid literal for " + fn + "(): '" + v.str + "'");
                }
            } else {
                raise(line, "TypeError: " + fn + "() argument must be a str or a number, not '" + type_of(v) + "'");
            }
            if (fn == "int") {
                if (!std::isfinite(d)) raise(line, "ValueError: cannot convert non-finite number to int");
                d = std::trunc(d);
            }
            return Value::number(d);
        }
        if (fn == "abs") {
            arity(a, 1, 1, fn, line);
            return Value::number(std::fabs(need_number(a[0], fn, line)));
        }
        if (fn == "round") {
            arity(a, 1, 2, fn, line);
            double x = need_number(a[0], fn, line);
            if (a.size() == 1) return Value::number(std::nearbyint(x));
            double scale = std::pow(10.0, (double)need_int(a[1], fn, line));
            return Value::number(std::nearbyint(x * scale) / scale);
        }
        if (fn == "chr") {
            arity(a, 1, 1, fn, line);
            long long cp = need_int(a[0], fn, line);
            if (cp < 0 || cp > 0x10FFFF) raise(line, "ValueError: chr() arg not in range(0x110000)");
            std::string out;
            if (cp < 0x80) {
                out.push_back((char)cp);
            } else if (cp < 0x800) {
                out.push_back((char)(0xC0 | (cp >> 6)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            } else if (cp < 0x10000) {
                out.push_back((char)(0xE0 | (cp >> 12)));
                out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            } else {
                out.push_back((char)(0xF0 | (cp >> 18)));
                out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back((char)(0x80 | (cp & 0x3F)));
            }
            return Value::string(std::move(out));
        }
        if (fn == "ord") {
            arity(a, 1, 1, fn, line);
            const std::string& s = need_string(a[0], fn, line);
            auto chars = utf8_chars(s);
            if (chars.size() != 1) raise(line, "TypeError: ord() expected a character");
            const std::string& c = chars[0];
            unsigned long cp = (unsigned char)c[0];
            if (c.size() == 2) cp = ((cp & 0x1F) << 6) | ((unsigned char)c[1] & 0x3F);
            else if (c.size() == 3) cp = ((cp & 0x0F) << 12) | (((unsigned char)c[1] & 0x3F) << 6) | ((unsigned char)c[2] & 0x3F);
            else if (c.size() == 4) cp = ((cp & 0x07) << 18) | (((unsigned char)c[1] & 0x3F) << 12) |
                                         (((unsigned char)c[2] & 0x3F) << 6) | ((unsigned char)c[3] & 0x3F);
            return Value::number((double)cp);
        }
        if (fn == "type") {
            arity(a, 1, 1, fn, line);
            return Value::string(type_of(a[0]));
        }
        if (fn == "list") {
            arity(a, 0, 1, fn, line);
            if (a.empty()) return Value::new_list();
            return Value::new_list(iterate(a[0], line));
        }
        if (fn == "dict") {
            arity(a, 0, 1, fn, line);
            Value m = Value::new_map();
            if (a.empty()) return m;
            if (a[0].is_map()) return Value::new_map(*a[0].map);
            for (const auto& pair : need_list(a[0], fn, line)) {
                if (!pair.is_list() || pair.list->size() != 2) raise(line, "ValueError: dict() needs [key, value] pairs");
                check_nesting((*pair.list)[1], nullptr, line);
                m.set(map_key((*pair.list)[0], line), (*pair.list)[1]);
            }
            return m;
        }
        if (fn == "range") {
            arity(a, 1, 3, fn, line);
            long long start = 0, stop = 0, step = 1;
            if (a.size() == 1) {
                stop = need_int(a[0], fn, line);
            } else {
                start = need_int(a[0], fn, line);
                stop = need_int(a[1], fn, line);
                if (a.size() == 3) step = need_int(a[2], fn, line);
            }
            if (step == 0) raise(line, "ValueError: range() arg 3 must not be zero");
            // operands are within 2^53, so the sums below cannot overflow
            long long n = step > 0 ? (stop - start + step - 1) / step : (start - stop - step - 1) / -step;
            if (n < 0) n = 0;
            check_size((size_t)n, line);
            List out;
            out.reserve((size_t)n);
            for (long long i = 0; i < n; i++) out.push_back(Value::number((double)(start + i * step)));
            return Value::new_list(std::move(out));
        }
        if (fn == "sorted" || fn == "reversed") {
            arity(a, 1, 1, fn, line);
            List items = iterate(a[0], line);
            if (fn == "reversed") {
                std::reverse(items.begin(), items.end());
            } else {
                std::stable_sort(items.begin(), items.end(), [&](const Value& x, const Value& y) {
                    return order(x, y, line) < 0;
                });
            }
            return Value::new_list(std::move(items));
        }
        if (fn == "enumerate") {
            arity(a, 1, 2, fn, line);
            long long base = a.size() == 2 ? need_int(a[1], fn, line) : 0;
            List out;
            long long i = base;
            for (auto& v : iterate(a[0], line)) out.push_back(Value::new_list({Value::number((double)i++), v}));
            Value res = Value::new_list(std::move(out));
            check_nested(res, line);
            return res;
        }
        if (fn == "zip") {
            std::vector<List> seqs;
            for (const auto& v : a) seqs.push_back(iterate(v, line));
            size_t n = seqs.empty() ? 0 : seqs[0].size();
            for (const auto& s : seqs) n = std::min(n, s.size());
            List out;
            for (size_t i = 0; i < n; i++) {
                List row;
                for (const auto& s : seqs) row.push_back(s[i]);
                out.push_back(Value::new_list(std::move(row)));
            }
            Value res = Value::new_list(std::move(out));
            check_nested(res, line);
            return res;
        }
        if (fn == "sum") {
            arity(a, 1, 2, fn, line);
            double total = a.size() == 2 ? need_number(a[1], fn, line) : 0.0;
            for (const auto& v : need_list(a[0], fn, line)) total += need_number(v, fn, line);
            return Value::number(total);
        }
        if (fn == "min" || fn == "max") {
            if (a.empty()) raise(line, "TypeError: " + fn + "() expected at least 1 argument");
            List items = a.size() == 1 ? iterate(a[0], line) : a;
            if (items.empty()) raise(line, "ValueError: " + fn + "() arg is an empty sequence");
            Value best = items[0];
            for (size_t i = 1; i < items.size(); i++) {
                int c = order(items[i], best, line);
                if ((fn == "min" && c < 0) || (fn == "max" && c > 0)) best = items[i];
            }
            return best;
        }
        if (fn == "any" || fn == "all") {
            arity(a, 1, 1, fn, line);
            for (const auto& v : iterate(a[0], line)) {
                if (fn == "any" && truthy(v)) return Value::boolean(true);
                if (fn == "all" && !truthy(v)) return Value::boolean(false);
            }
            return Value::boolean(fn == "all");
        }
        raise(line, "TypeError: '" + fn + "' is a method, not a function");
    }

    // ---- helpers bound into the scope ----

    Value do_fetch(const std::string& target, bool rendered, int timeout_ms, int line) {
        if (!ctx_.fetcher) raise(line, "RuntimeError: fetching is not available in this context");
        if (run_.fetches >= ctx_.limits.max_fetches) {
            raise(line, "ResourceError: fetch limit of " + std::to_string(ctx_.limits.max_fetches) + " reached");
        }
        check_clock(line);
        run_.fetches++;

        FetchRequest req;
        req.url = target;
        req.headers = polite_headers();
        int budget = remaining_ms();
        if (rendered) {
            req.timeout_ms = std::min(ctx_.fetch.render_timeout_ms, budget);
            req.settle_ms = std::min(timeout_ms >= 0 ? timeout_ms : settle_jitter_ms(ctx_.fetch), budget);
        } else {
            req.timeout_ms = std::min(timeout_ms > 0 ? timeout_ms : ctx_.fetch.http_timeout_ms, budget);
        }
        if (req.timeout_ms <= 0) req.timeout_ms = 1;

        FetchResult r = rendered ? ctx_.fetcher->fetch_rendered(req) : ctx_.fetcher->fetch_static(req);
        if (r.cancelled) {
            run_.cancelled = true;
            raise(line, "execution cancelled");
        }
        if (!r.ok) raise(line, std::string(rendered ? "RenderError: " : "FetchError: ") + r.error + " (" + (r.url.empty() ? target : r.url) + ")");
        check_string(r.body, line);
        return Value::document(make_document(r.url, r.body));
    }

    Value element_record(const Element& el) const {
        Value attrs = Value::new_map();
        for (const auto& [k, v] : el.attrs) attrs.set(k, Value::string(v));
        return Value::new_map({{"tag", Value::string(el.tag)},
                               {"text", Value::string(el.text)},
                               {"attrs", attrs}});
    }

    static bool attr_matches(const Element& el, const std::string& key, const Value& want) {
        for (const auto& [k, v] : el.attrs) {
            if (k != key) continue;
            if (!want.is_string()) return truthy(want);
            if (key != "class") return v == want.str;
            size_t pos = 0;
            while (pos < v.size()) {
                size_t end = v.find_first_of(" \t\n\r\f", pos);
                if (end == std::string::npos) end = v.size();
                if (v.compare(pos, end - pos, want.str) == 0 && end - pos == want.str.size()) return true;
                pos = end + 1;
            }
            return false;
        }
        return want.type == Value::Type::BOOL && !want.b;
    }

    Value find_all(const Document& doc, const std::string& tag, const Value* filter, int line) {
        List out;
        for (const auto& el : doc.elements(tag)) {
            bool keep = true;
            if (filter) {
                for (const auto& [k, want] : *filter->map) {
                    if (!attr_matches(el, k, want)) { keep = false; break; }
                }
            }
            if (!keep) continue;
            out.push_back(element_record(el));
            check_size(out.size(), line);
        }
        return Value::new_list(std::move(out));
    }

    Value string_list(const std::vector<std::string>& items) const {
        List out;
        out.reserve(items.size());
        for (const auto& s : items) out.push_back(Value::string(s));
        return Value::new_list(std::move(out));
    }

    void sleep_for_ms(int ms, int line) {
        ms = std::min(ms, std::min(ctx_.limits.max_sleep_ms, remaining_ms()));
        if (ms <= 0) return;
        if (ctx_.sleeper) {
            ctx_.sleeper(ms);
        } else {
            auto until = Clock::now() + std::chrono::milliseconds(ms);
            while (Clock::now() < until) {
                if (ctx_.cancel && ctx_.cancel->load()) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }
        check_clock(line);
    }

    Value helper(const std::string& fn, Args& a, int line) {
        if (fn == "emit") {
            arity(a, 1, 1, fn, line);
            if (!a[0].is_map()) raise(line, "TypeError: emit() expects a dict, got " + type_of(a[0]));
            Value res = vars_["results"];
            if (!res.is_list()) raise(line, "TypeError: results must be a list to emit(), got " + type_of(res));
            if (res.list->size() >= ctx_.limits.max_records) {
                raise(line, "ResourceError: record limit of " + std::to_string(ctx_.limits.max_records) + " reached");
            }
            check_nesting(a[0], &res, line);
            res.list->push_back(a[0]);
            return Value::nil();
        }
        if (fn == "fetch" || fn == "fetch_rendered") {
            arity(a, 1, 2, fn, line);
            int extra = a.size() == 2 ? clamp_int(need_int(a[1], fn, line)) : (fn == "fetch" ? 0 : -1);
            return do_fetch(need_string(a[0], fn, line), fn == "fetch_rendered", extra, line);
        }
        if (fn == "title") {
            arity(a, 1, 1, fn, line);
            return Value::string(need_doc(a[0], fn, line)->title());
        }
        if (fn == "text") {
            arity(a, 1, 1, fn, line);
            return Value::string(text_of(a[0], fn, line));
        }
        if (fn == "links") {
            arity(a, 1, 1, fn, line);
            return string_list(need_doc(a[0], fn, line)->links());
        }
        if (fn == "select_text") {
            arity(a, 2, 2, fn, line);
            return string_list(need_doc(a[0], fn, line)->texts_of(need_string(a[1], fn, line)));
        }
        if (fn == "find_all") {
            arity(a, 2, 3, fn, line);
            auto doc = need_doc(a[0], fn, line);
            const Value* filter = nullptr;
            if (a.size() == 3) {
                if (!a[2].is_map()) raise(line, "TypeError: find_all() attribute filter must be a dict");
                filter = &a[2];
            }
            return find_all(*doc, need_string(a[1], fn, line), filter, line);
        }
        if (fn == "extract_emails") {
            arity(a, 1, 1, fn, line);
            return string_list(extract_emails(text_of(a[0], fn, line)));
        }
        if (fn == "extract_phones") {
            arity(a, 1, 1, fn, line);
            return string_list(extract_phones(text_of(a[0], fn, line)));
        }
        if (fn == "clean_text") {
            arity(a, 1, 1, fn, line);
            return Value::string(clean_text(need_string(a[0], fn, line)));
        }
        if (fn == "is_dynamic") {
            arity(a, 1, 1, fn, line);
            return Value::boolean(need_doc(a[0], fn, line)->looks_dynamic());
        }
        if (fn == "sleep_jitter") {
            arity(a, 0, 2, fn, line);
            double lo = a.size() >= 1 ? need_number(a[0], fn, line) : 1.0;
            double hi = a.size() == 2 ? need_number(a[1], fn, line) : std::max(lo, 3.0);
            if (!std::isfinite(lo) || !std::isfinite(hi)) raise(line, "ValueError: sleep_jitter() bounds must be finite");
            if (hi < lo) std::swap(lo, hi);
            std::uniform_real_distribution<double> dist(lo, hi);
            sleep_for_ms(seconds_to_ms(dist(rng_)), line);
            return Value::nil();
        }
        raise(line, "NameError: helper '" + fn + "' is not bound");
    }

    // ---- methods ----

    const std::regex& regex_for(const std::string& pattern, const std::string& flags, int line) {
        const std::string key = flags + '\x1f' + pattern;
        if (auto it = regex_cache_.find(key); it != regex_cache_.end()) return it->second;
        auto f = std::regex::ECMAScript;
        if (flags.find('i') != std::string::npos) f |= std::regex::icase;
        if (flags.find('m') != std::string::npos) f |= std::regex::multiline;
        try {
            return regex_cache_.emplace(key, std::regex(pattern, f)).first->second;
        } catch (const std::regex_error& e) {
            raise(line, std::string("re.error: ") + e.what());
        }
    }

    Value match_groups(const std::smatch& m) const {
        List groups;
        for (size_t i = 0; i < m.size(); i++) {
            groups.push_back(m[i].matched ? Value::string(m[i].str()) : Value::nil());
        }
        return Value::new_list(std::move(groups));
    }

    Value module_call(const std::string& mod, const std::string& fn, Args& a, int line) {
        const std::string q = mod + "." + fn;
        try {
            if (mod == "re") {
                if (fn == "findall") {
                    arity(a, 2, 3, q, line);
                    const std::string& s = need_string(a[1], q, line);
                    const std::regex& re = regex_for(need_string(a[0], q, line), a.size() == 3 ? need_string(a[2], q, line) : "", line);
                    List out;
                    for_each_match(s, re, [&](const std::smatch& m) {
                        if (re.mark_count() == 0) out.push_back(Value::string(m.str()));
                        else if (re.mark_count() == 1) out.push_back(Value::string(m.str(1)));
                        else {
                            List g;
                            for (size_t i = 1; i < m.size(); i++) g.push_back(Value::string(m.str(i)));
                            out.push_back(Value::new_list(std::move(g)));
                        }
                        check_size(out.size(), line);
                        if ((out.size() & 0xFF) == 0) check_clock(line);
                        return true;
                    });
                    return Value::new_list(std::move(out));
                }
                if (fn == "search" || fn == "match") {
                    arity(a, 2, 3, q, line);
                    const std::string& s = need_string(a[1], q, line);
                    const std::regex& re = regex_for(need_string(a[0], q, line), a.size() == 3 ? need_string(a[2], q, line) : "", line);
                    std::smatch m;
                    bool found = false;
                    if (fn == "match") {
                        found = match_at_start(s, re, &m);
                    } else {
                        for_each_match(s, re, [&](const std::smatch& hit) {
                            m = hit;
                            found = true;
                            return false;
                        });
                    }
                    if (!found) return Value::nil();
                    return match_groups(m);
                }
                if (fn == "sub") {
                    arity(a, 3, 4, q, line);
                    const std::regex& re = regex_for(need_string(a[0], q, line), a.size() == 4 ? need_string(a[3], q, line) : "", line);
                    // \1 style group references become $1; literal $ is escaped.
                    std::string fmt;
                    const std::string& repl = need_string(a[1], q, line);
                    for (size_t i = 0; i < repl.size(); i++) {
                        if (repl[i] == '\\' && i + 1 < repl.size() && repl[i + 1] >= '0' && repl[i + 1] <= '9') {
                            fmt += '$';
                            fmt += repl[++i];
                        } else if (repl[i] == '$') {
                            fmt += "$$";
                        } else {
                            fmt += repl[i];
                        }
                    }
                    const std::string& s = need_string(a[2], q, line);
                    std::string out;
                    size_t last = 0;
                    size_t hits = 0;
                    for_each_match(s, re, [&](const std::smatch& m) {
                        const size_t pos = (size_t)(m[0].first - s.begin());
                        out.append(s, last, pos - last);
                        out += m.format(fmt);
                        last = (size_t)(m[0].second - s.begin());
                        check_string(out, line);
                        if ((++hits & 0xFF) == 0) check_clock(line);
                        return true;
                    });
                    out.append(s, last, std::string::npos);
                    check_string(out, line);
                    return Value::string(std::move(out));
                }
                if (fn == "split") {
                    arity(a, 2, 2, q, line);
                    const std::string& s = need_string(a[1], q, line);
                    const std::regex& re = regex_for(need_string(a[0], q, line), "", line);
                    List out;
                    size_t last = 0;
                    for_each_match(s, re, [&](const std::smatch& m) {
                        if (m.length(0) == 0) return true;
                        const size_t pos = (size_t)(m[0].first - s.begin());
                        out.push_back(Value::string(s.substr(last, pos - last)));
                        last = (size_t)(m[0].second - s.begin());
                        check_size(out.size(), line);
                        if ((out.size() & 0xFF) == 0) check_clock(line);
                        return true;
                    });
                    out.push_back(Value::string(s.substr(last)));
                    return Value::new_list(std::move(out));
                }
            } else if (mod == "json") {
                if (fn == "loads") {
                    arity(a, 1, 1, q, line);
                    bool ok = false;
                    Value v = value_from_json_string(need_string(a[0], q, line), &ok);
                    if (!ok) raise(line, "ValueError: json.loads(): malformed JSON");
                    return v;
                }
                if (fn == "dumps") {
                    arity(a, 1, 1, q, line);
                    return Value::string(value_to_json_string(a[0]));
                }
            } else if (mod == "random") {
                if (fn == "uniform") {
                    arity(a, 2, 2, q, line);
                    double lo = need_number(a[0], q, line), hi = need_number(a[1], q, line);
                    if (!std::isfinite(lo) || !std::isfinite(hi)) raise(line, "ValueError: random.uniform() bounds must be finite");
                    if (hi < lo) std::swap(lo, hi);
                    return Value::number(std::uniform_real_distribution<double>(lo, hi)(rng_));
                }
                if (fn == "randint") {
                    arity(a, 2, 2, q, line);
                    long long lo = need_int(a[0], q, line), hi = need_int(a[1], q, line);
                    if (hi < lo) raise(line, "ValueError: empty range for randint()");
                    return Value::number((double)std::uniform_int_distribution<long long>(lo, hi)(rng_));
                }
                if (fn == "choice") {
                    arity(a, 1, 1, q, line);
                    const List& l = need_list(a[0], q, line);
                    if (l.empty()) raise(line, "IndexError: cannot choose from an empty sequence");
                    return l[std::uniform_int_distribution<size_t>(0, l.size() - 1)(rng_)];
                }
            } else if (mod == "requests") {
                if (fn == "get") {
                    arity(a, 1, 2, q, line);
                    int timeout = a.size() == 2 ? seconds_to_ms(need_number(a[1], q, line)) : 0;
                    return do_fetch(need_string(a[0], q, line), false, timeout, line);
                }
            }
        } catch (const std::regex_error& e) {
            raise(line, std::string("re.error: ") + e.what());
        }
        raise(line, "AttributeError: module '" + mod + "' has no function '" + fn + "'");
    }

    Value string_method(const std::string& s, const std::string& fn, Args& a, int line) {
        if (fn == "strip" || fn == "lstrip" || fn == "rstrip") {
            arity(a, 0, 1, fn, line);
            const std::string* chars = a.empty() || a[0].is_nil() ? nullptr : &need_string(a[0], fn, line);
            return Value::string(strip_chars(s, chars, fn != "rstrip", fn != "lstrip"));
        }
        if (fn == "lower" || fn == "upper") {
            arity(a, 0, 0, fn, line);
            std::string out = s;
            for (auto& c : out) {
                if (fn == "lower" && c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
                if (fn == "upper" && c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
            }
            return Value::string(std::move(out));
        }
        if (fn == "split") {
            arity(a, 0, 2, fn, line);
            long long maxsplit = a.size() == 2 ? need_int(a[1], fn, line) : -1;
            List out;
            if (a.empty() || a[0].is_nil()) {
                size_t i = 0;
                while (i < s.size()) {
                    while (i < s.size() && is_space_char(s[i])) i++;
                    if (i >= s.size()) break;
                    if (maxsplit >= 0 && (long long)out.size() == maxsplit) {
                        out.push_back(Value::string(strip_chars(s.substr(i), nullptr, false, true)));
                        break;
                    }
                    size_t j = i;
                    while (j < s.size() && !is_space_char(s[j])) j++;
                    out.push_back(Value::string(s.substr(i, j - i)));
                    i = j;
                }
                return Value::new_list(std::move(out));
            }
            const std::string& sep = need_string(a[0], fn, line);
            if (sep.empty()) raise(line, "ValueError: empty separator");
            size_t start = 0;
            while (true) {
                size_t pos = s.find(sep, start);
                if (pos == std::string::npos || (maxsplit >= 0 && (long long)out.size() == maxsplit)) {
                    out.push_back(Value::string(s.substr(start)));
                    break;
                }
                out.push_back(Value::string(s.substr(start, pos - start)));
                start = pos + sep.size();
                check_size(out.size(), line);
            }
            return Value::new_list(std::move(out));
        }
        if (fn == "replace") {
            arity(a, 2, 3, fn, line);
            const std::string& from = need_string(a[0], fn, line);
            const std::string& to = need_string(a[1], fn, line);
            long long limit = a.size() == 3 ? need_int(a[2], fn, line) : -1;
            if (from.empty()) return Value::string(s);
            std::string out;
            size_t start = 0;
            long long n = 0;
            while (true) {
                size_t pos = s.find(from, start);
                if (pos == std::string::npos || (limit >= 0 && n >= limit)) break;
                out.append(s, start, pos - start);
                out += to;
                start = pos + from.size();
                n++;
                check_string(out, line);
            }
            out.append(s, start, std::string::npos);
            return Value::string(std::move(out));
        }
        if (fn == "startswith" || fn == "endswith") {
            arity(a, 1, 1, fn, line);
            auto test = [&](const std::string& p) {
                if (p.size() > s.size()) return false;
                return fn == "startswith" ? s.compare(0, p.size(), p) == 0
                                          : s.compare(s.size() - p.size(), p.size(), p) == 0;
            };
            if (a[0].is_list()) {
                for (const auto& p : *a[0].list) if (test(need_string(p, fn, line))) return Value::boolean(true);
                return Value::boolean(false);
            }
            return Value::boolean(test(need_string(a[0], fn, line)));
        }
        if (fn == "find" || fn == "index") {
            arity(a, 1, 2, fn, line);
            size_t start = a.size() == 2 ? (size_t)std::max(0LL, need_int(a[1], fn, line)) : 0;
            size_t pos = s.find(need_string(a[0], fn, line), start);
            if (pos == std::string::npos) {
                if (fn == "index") raise(line, "ValueError: substring not found");
                return Value::number(-1);
            }
            return Value::number((double)pos);
        }
        if (fn == "count") {
            arity(a, 1, 1, fn, line);
            const std::string& sub = need_string(a[0], fn, line);
            if (sub.empty()) return Value::number((double)utf8_length(s) + 1);
            size_t n = 0;
            for (size_t pos = s.find(sub); pos != std::string::npos; pos = s.find(sub, pos + sub.size())) n++;
            return Value::number((double)n);
        }
        if (fn == "join") {
            arity(a, 1, 1, fn, line);
            std::string out;
            bool first = true;
            for (const auto& v : iterate(a[0], line)) {
                if (!v.is_string()) raise(line, "TypeError: join() expects a list of str, found " + type_of(v));
                if (!first) out += s;
                out += v.str;
                first = false;
                check_string(out, line);
            }
            return Value::string(std::move(out));
        }
        if (fn == "isdigit" || fn == "isalpha" || fn == "isspace") {
            arity(a, 0, 0, fn, line);
            if (s.empty()) return Value::boolean(false);
            for (unsigned char c : s) {
                bool ok = fn == "isdigit" ? (c >= '0' && c <= '9')
                        : fn == "isalpha" ? ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z'))
                        : is_space_char((char)c);
                if (!ok) return Value::boolean(false);
            }
            return Value::boolean(true);
        }
        raise(line, "AttributeError: 'str' object has no method '" + fn + "'");
    }

    Value list_method(const Value& self, const std::string& fn, Args& a, int line) {
        List& l = *self.list;
        if (fn == "append") {
            arity(a, 1, 1, fn, line);
            check_size(l.size() + 1, line);
            check_nesting(a[0], &self, line);
            l.push_back(a[0]);
            return Value::nil();
        }
        if (fn == "extend") {
            arity(a, 1, 1, fn, line);
            List items = iterate(a[0], line);
            check_size(l.size() + items.size(), line);
            for (const auto& x : items) check_nesting(x, &self, line);
            l.insert(l.end(), items.begin(), items.end());
            return Value::nil();
        }
        if (fn == "insert") {
            arity(a, 2, 2, fn, line);
            long long i = need_int(a[0], fn, line);
            if (i < 0) i += (long long)l.size();
            i = std::clamp(i, 0LL, (long long)l.size());
            check_size(l.size() + 1, line);
            check_nesting(a[1], &self, line);
            l.insert(l.begin() + (long)i, a[1]);
            return Value::nil();
        }
        if (fn == "pop") {
            arity(a, 0, 1, fn, line);
            if (l.empty()) raise(line, "IndexError: pop from empty list");
            long long i = a.empty() ? (long long)l.size() - 1 : need_int(a[0], fn, line);
            if (i < 0) i += (long long)l.size();
            if (i < 0 || i >= (long long)l.size()) raise(line, "IndexError: pop index out of range");
            Value v = l[(size_t)i];
            l.erase(l.begin() + (long)i);
            return v;
        }
        if (fn == "count") {
            arity(a, 1, 1, fn, line);
            size_t n = 0;
            for (const auto& v : l) if (equal(v, a[0])) n++;
            return Value::number((double)n);
        }
        if (fn == "index") {
            arity(a, 1, 1, fn, line);
            for (size_t i = 0; i < l.size(); i++) if (equal(l[i], a[0])) return Value::number((double)i);
            raise(line, "ValueError: value is not in list");
        }
        raise(line, "AttributeError: 'list' object has no method '" + fn + "'");
    }

    Value map_method(Value& self, const std::string& fn, Args& a, int line) {
        Fields& f = *self.map;
        if (fn == "get") {
            arity(a, 1, 2, fn, line);
            if (const Value* v = self.get(map_key(a[0], line))) return *v;
            return a.size() == 2 ? a[1] : Value::nil();
        }
        if (fn == "keys" || fn == "values" || fn == "items") {
            arity(a, 0, 0, fn, line);
            List out;
            for (const auto& [k, v] : f) {
                if (fn == "keys") out.push_back(Value::string(k));
                else if (fn == "values") out.push_back(v);
                else out.push_back(Value::new_list({Value::string(k), v}));
            }
            Value res = Value::new_list(std::move(out));
            if (fn == "items") check_nested(res, line);
            return res;
        }
        if (fn == "pop") {
            arity(a, 1, 2, fn, line);
            const std::string k = map_key(a[0], line);
            for (auto it = f.begin(); it != f.end(); ++it) {
                if (it->first != k) continue;
                Value v = it->second;
                f.erase(it);
                return v;
            }
            if (a.size() == 2) return a[1];
            raise(line, "KeyError: '" + k + "'");
        }
        if (fn == "update") {
            arity(a, 1, 1, fn, line);
            if (!a[0].is_map()) raise(line, "TypeError: update() expects a dict");
            Fields other = *a[0].map;
            for (const auto& [k, v] : other) check_nesting(v, &self, line);
            for (auto& [k, v] : other) self.set(k, v);
            return Value::nil();
        }
        raise(line, "AttributeError: 'dict' object has no method '" + fn + "'");
    }

    Value document_method(const Value& self, const std::string& fn, Args& a, int line) {
        static const char* kDocMethods[] = {"title", "text", "links", "select_text", "find_all", "is_dynamic",
                                            "extract_emails", "extract_phones"};
        for (const char* m : kDocMethods) {
            if (fn != m) continue;
            Args full;
            full.reserve(a.size() + 1);
            full.push_back(self);
            full.insert(full.end(), a.begin(), a.end());
            return helper(fn, full, line);
        }
        raise(line, "AttributeError: 'document' object has no method '" + fn + "'");
    }

    Value method(const Expr& e) {
        CapabilityDecision d = policy_.authorize(e.name);
        if (d.verdict == CapabilityDecision::Verdict::DENIED) raise(e.line, "SecurityError: " + d.reason);

        // module.function(...) on a module name that is not shadowed by a variable
        if (e.a->kind == ExprKind::NAME && !vars_.count(e.a->name)) {
            CapabilityDecision md = policy_.authorize(e.a->name);
            if (md.verdict == CapabilityDecision::Verdict::DENIED) raise(e.line, "SecurityError: " + md.reason);
            if (md.allowed() && md.kind == PrimitiveKind::MODULE) {
                if (!d.allowed()) {
                    raise(e.line, "AttributeError: module '" + e.a->name + "' has no function '" + e.name + "'");
                }
                Args args;
                for (const auto& it : e.items) args.push_back(eval(*it));
                return module_call(e.a->name, e.name, args, e.line);
            }
        }

        Value self = eval(*e.a);
        if (!d.allowed()) {
            raise(e.line, "AttributeError: '" + type_of(self) + "' object has no method '" + e.name + "'");
        }
        Args args;
        args.reserve(e.items.size());
        for (const auto& it : e.items) args.push_back(eval(*it));

        switch (self.type) {
            case Value::Type::STRING:   return string_method(self.str, e.name, args, e.line);
            case Value::Type::LIST:     return list_method(self, e.name, args, e.line);
            case Value::Type::MAP:      return map_method(self, e.name, args, e.line);
            case Value::Type::DOCUMENT: return document_method(self, e.name, args, e.line);
            default:
                raise(e.line, "AttributeError: '" + type_of(self) + "' object has no method '" + e.name + "'");
        }
    }

    const ScriptContext& ctx_;
    ScriptRun& run_;
    const SandboxPolicy& policy_;
    std::unordered_map<std::string, Value> vars_;
    std::unordered_map<std::string, std::regex> regex_cache_;
    std::mt19937 rng_;
    Clock::time_point start_;
    Clock::time_point deadline_;
};

} // namespace
} // namespace scrapeguard::script

namespace scrapeguard {

ScriptRun run_script(const std::string& code, const ScriptContext& ctx) {
    ScriptRun run;
    try {
        script::Program prog = script::parse(code);
        script::Interpreter interp(ctx, run);
        interp.execute(prog);
        run.ok = true;
    } catch (const ScriptError& e) {
        run.error_line = e.line();
        run.error = e.line() > 0 ? "line " + std::to_string(e.line()) + ": " + e.what() : e.what();
    } catch (const std::bad_alloc&) {
        run.error = "MemoryError: out of memory";
    } catch (const std::exception& e) {
        run.error = std::string("RuntimeError: ") + e.what();
    }
    return run;
}

} // namespace scrapeguard
