#include "script_ast.h"

#include <cstdio>
#include <cstdlib>
#include <unordered_set>

namespace scrapeguard::script {

namespace {

struct Token {
    enum class T { NAME, NUMBER, STRING, OP, NEWLINE, END };
    T t{T::END};
    std::string s;
    double num{0.0};
    int line{1};
};

const std::unordered_set<std::string>& keywords() {
    static const std::unordered_set<std::string> k = {
        "import", "from", "if", "elif", "else", "for", "in", "while", "break", "continue",
        "pass", "and", "or", "not", "true", "false", "null", "True", "False", "None",
        "def", "class", "return", "lambda", "try", "except", "finally", "with", "raise",
        "global", "nonlocal", "del", "yield", "assert", "async", "await", "is", "as",
    };
    return k;
}

void append_utf8(std::string& out, unsigned long cp) {
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
}

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

class Lexer {
public:
    explicit Lexer(const std::string& src) : src_(src) {}

    std::vector<Token> run() {
        std::vector<Token> out;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f') { pos_++; continue; }
            if (c == '\\' && peek(1) == '\n') { pos_ += 2; line_++; continue; }
            if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n') pos_++;
                continue;
            }
            if (c == '\n') {
                out.push_back(make(Token::T::NEWLINE, "\n"));
                pos_++;
                line_++;
                continue;
            }
            if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
                out.push_back(number());
                continue;
            }
            if (is_ident_start(c)) {
                const bool raw_prefix = (c == 'r' || c == 'R') && (peek(1) == '"' || peek(1) == '\'');
                if ((c == 'f' || c == 'F') && (peek(1) == '"' || peek(1) == '\'')) {
                    throw ScriptError(line_, "SyntaxError: f-strings are not supported; build strings with + and str()");
                }
                if (raw_prefix) {
                    pos_++;
                    out.push_back(string_lit(true));
                    continue;
                }
                size_t start = pos_;
                while (pos_ < src_.size() && is_ident(src_[pos_])) pos_++;
                out.push_back(make(Token::T::NAME, src_.substr(start, pos_ - start)));
                continue;
            }
            if (c == '"' || c == '\'') {
                out.push_back(string_lit(false));
                continue;
            }
            out.push_back(op());
        }
        out.push_back(make(Token::T::END, ""));
        return out;
    }

private:
    char peek(size_t ahead) const {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    Token make(Token::T t, std::string s) const {
        Token tok;
        tok.t = t;
        tok.s = std::move(s);
        tok.line = line_;
        return tok;
    }

    Token number() {
        size_t start = pos_;
        while (is_digit(peek(0))) pos_++;
        if (peek(0) == '.' && is_digit(peek(1))) {
            pos_++;
            while (is_digit(peek(0))) pos_++;
        }
        if ((peek(0) == 'e' || peek(0) == 'E') &&
            (is_digit(peek(1)) || ((peek(1) == '+' || peek(1) == '-') && is_digit(peek(2))))) {
            pos_ += 2;
            while (is_digit(peek(0))) pos_++;
        }
        if (is_ident_start(peek(0))) {
            throw ScriptError(line_, "SyntaxError: invalid number literal");
        }
        Token tok = make(Token::T::NUMBER, src_.substr(start, pos_ - start));
        tok.num = std::strtod(tok.s.c_str(), nullptr);
        return tok;
    }

    Token string_lit(bool raw) {
        const int start_line = line_;
        const char q = src_[pos_];
        const bool triple = peek(1) == q && peek(2) == q;
        pos_ += triple ? 3 : 1;

        std::string out;
        while (true) {
            if (pos_ >= src_.size()) throw ScriptError(start_line, "SyntaxError: unterminated string literal");
            char c = src_[pos_];
            if (c == q && (!triple || (peek(1) == q && peek(2) == q))) {
                pos_ += triple ? 3 : 1;
                break;
            }
            if (c == '\n') {
                if (!triple) throw ScriptError(start_line, "SyntaxError: unterminated string literal");
                line_++;
            }
            if (c == '\\' && pos_ + 1 < src_.size()) {
                char e = src_[pos_ + 1];
                if (raw) {
                    out.push_back('\\');
                    out.push_back(e);
                    if (e == '\n') line_++;
                    pos_ += 2;
                    continue;
                }
                pos_ += 2;
                switch (e) {
                    case 'n': out.push_back('\n'); break;
                    case 't': out.push_back('\t'); break;
                    case 'r': out.push_back('\r'); break;
                    case '0': out.push_back('\0'); break;
                    case '\\': out.push_back('\\'); break;
                    case '\'': out.push_back('\''); break;
                    case '"': out.push_back('"'); break;
                    case '\n': line_++; break;
                    case 'x':
                    case 'u': {
                        const size_t n = e == 'x' ? 2 : 4;
                        if (pos_ + n > src_.size()) throw ScriptError(line_, "SyntaxError: truncated \\" + std::string(1, e) + " escape");
                        const std::string hex = src_.substr(pos_, n);
                        char* end = nullptr;
                        unsigned long cp = std::strtoul(hex.c_str(), &end, 16);
                        if (!end || *end != '\0') throw ScriptError(line_, "SyntaxError: invalid \\" + std::string(1, e) + " escape");
                        append_utf8(out, cp);
                        pos_ += n;
                        break;
                    }
                    default:
                        out.push_back('\\');
                        out.push_back(e);
                        break;
                }
                continue;
            }
            out.push_back(c);
            pos_++;
        }
        Token tok = make(Token::T::STRING, std::move(out));
        tok.line = start_line;
        return tok;
    }

    Token op() {
        static const char* three[] = {"//="};
        static const char* two[] = {"==", "!=", "<=", ">=", "+=", "-=", "*=", "/=", "%=", "//"};
        for (const char* o : three) {
            if (src_.compare(pos_, 3, o) == 0) { pos_ += 3; return make(Token::T::OP, o); }
        }
        for (const char* o : two) {
            if (src_.compare(pos_, 2, o) == 0) { pos_ += 2; return make(Token::T::OP, o); }
        }
        const char c = src_[pos_];
        static const std::string single = "+-*/%<>=()[]{},:.;";
        if (single.find(c) == std::string::npos) {
            char shown[8];
            if ((unsigned char)c < 0x20 || (unsigned char)c >= 0x7f) {
                std::snprintf(shown, sizeof(shown), "\\x%02x", (unsigned)(unsigned char)c);
            } else {
                shown[0] = c;
                shown[1] = '\0';
            }
            throw ScriptError(line_, std::string("SyntaxError: unexpected character '") + shown + "'");
        }
        pos_++;
        return make(Token::T::OP, std::string(1, c));
    }

    const std::string& src_;
    size_t pos_{0};
    int line_{1};
};

class Parser {
public:
    explicit Parser(std::vector<Token> toks) : toks_(std::move(toks)) {}

    Program program() {
        Program p;
        while (!at_end()) {
            if (at(Token::T::NEWLINE) || at_op(";")) { pos_++; continue; }
            p.body.push_back(statement());
        }
        return p;
    }

private:
    const Token& cur() const { return toks_[pos_]; }
    bool at(Token::T t) const { return cur().t == t; }
    bool at_end() const { return at(Token::T::END); }
    bool at_op(const char* o) const { return at(Token::T::OP) && cur().s == o; }
    bool at_kw(const char* k) const { return at(Token::T::NAME) && cur().s == k; }

    [[noreturn]] void fail(const std::string& msg) const {
        throw ScriptError(cur().line, "SyntaxError: " + msg);
    }

    std::string describe() const {
        switch (cur().t) {
            case Token::T::NEWLINE: return "end of line";
            case Token::T::END:     return "end of input";
            case Token::T::STRING:  return "string literal";
            default:                return "'" + cur().s + "'";
        }
    }

    void expect_op(const char* o) {
        if (!at_op(o)) fail(std::string("expected '") + o + "' but found " + describe());
        pos_++;
    }

    void expect_kw(const char* k) {
        if (!at_kw(k)) fail(std::string("expected '") + k + "' but found " + describe());
        pos_++;
    }

    std::string expect_name() {
        if (!at(Token::T::NAME)) fail("expected a name but found " + describe());
        if (keywords().count(cur().s)) fail("'" + cur().s + "' is a reserved word");
        return toks_[pos_++].s;
    }

    void skip_newlines() {
        while (at(Token::T::NEWLINE)) pos_++;
    }

    void end_statement() {
        if (at(Token::T::NEWLINE) || at_op(";")) { pos_++; return; }
        if (at_end() || at_op("}")) return;
        fail("unexpected " + describe() + " after statement");
    }

    ExprPtr node(ExprKind k, int line) {
        auto e = std::make_unique<Expr>();
        e->kind = k;
        e->line = line;
        return e;
    }

    StmtPtr stmt_node(StmtKind k, int line) {
        auto s = std::make_unique<Stmt>();
        s->kind = k;
        s->line = line;
        return s;
    }

    std::string dotted_name() {
        std::string n = expect_name();
        while (at_op(".")) {
            pos_++;
            n += "." + expect_name();
        }
        return n;
    }

    Block block() {
        DepthGuard guard(*this);
        skip_newlines();
        expect_op("{");
        Block body;
        while (true) {
            if (at(Token::T::NEWLINE) || at_op(";")) { pos_++; continue; }
            if (at_op("}")) { pos_++; break; }
            if (at_end()) fail("expected '}' to close block");
            body.push_back(statement());
        }
        return body;
    }

    // True when, after optional newlines, the next token is keyword k.
    // Consumes the newlines only on a match.
    bool next_is_kw(const char* k) {
        size_t save = pos_;
        skip_newlines();
        if (at_kw(k)) return true;
        pos_ = save;
        return false;
    }

    StmtPtr statement() {
        const int line = cur().line;

        if (at_kw("import")) {
            pos_++;
            auto s = stmt_node(StmtKind::IMPORT, line);
            s->modules.push_back(dotted_name());
            while (at_op(",")) {
                pos_++;
                s->modules.push_back(dotted_name());
            }
            if (at_kw("as")) fail("'import ... as' is not supported");
            end_statement();
            return s;
        }
        if (at_kw("from")) {
            pos_++;
            auto s = stmt_node(StmtKind::IMPORT, line);
            s->modules.push_back(dotted_name());
            expect_kw("import");
            s->vars.push_back(expect_name());
            while (at_op(",")) {
                pos_++;
                s->vars.push_back(expect_name());
            }
            end_statement();
            return s;
        }
        if (at_kw("if")) {
            pos_++;
            auto s = stmt_node(StmtKind::IF, line);
            Branch first;
            first.cond = expr();
            first.body = block();
            s->branches.push_back(std::move(first));
            while (next_is_kw("elif")) {
                pos_++;
                Branch b;
                b.cond = expr();
                b.body = block();
                s->branches.push_back(std::move(b));
            }
            if (next_is_kw("else")) {
                pos_++;
                Branch b;
                b.body = block();
                s->branches.push_back(std::move(b));
            }
            return s;
        }
        if (at_kw("for")) {
            pos_++;
            auto s = stmt_node(StmtKind::FOR, line);
            s->vars.push_back(expect_name());
            while (at_op(",")) {
                pos_++;
                s->vars.push_back(expect_name());
            }
            expect_kw("in");
            s->value = expr();
            s->body = block();
            return s;
        }
        if (at_kw("while")) {
            pos_++;
            auto s = stmt_node(StmtKind::WHILE, line);
            s->value = expr();
            s->body = block();
            return s;
        }
        if (at_kw("break") || at_kw("continue") || at_kw("pass")) {
            StmtKind k = at_kw("break") ? StmtKind::BREAK : at_kw("continue") ? StmtKind::CONTINUE : StmtKind::PASS;
            pos_++;
            auto s = stmt_node(k, line);
            end_statement();
            return s;
        }
        if (at(Token::T::NAME) && keywords().count(cur().s) &&
            !at_kw("not") && !at_kw("true") && !at_kw("false") && !at_kw("null") &&
            !at_kw("True") && !at_kw("False") && !at_kw("None")) {
            fail("'" + cur().s + "' is not supported");
        }

        ExprPtr first = expr();
        if (at_op(",") || at_op("=")) {
            auto s = stmt_node(StmtKind::ASSIGN, line);
            s->targets.push_back(std::move(first));
            while (at_op(",")) {
                pos_++;
                s->targets.push_back(expr());
            }
            expect_op("=");
            for (const auto& t : s->targets) {
                if (t->kind == ExprKind::NAME) continue;
                if (t->kind == ExprKind::INDEX && s->targets.size() == 1) continue;
                throw ScriptError(t->line, "SyntaxError: cannot assign to expression");
            }
            s->value = expr();
            if (at_op(",")) {
                auto tuple = node(ExprKind::LIST, s->value->line);
                tuple->items.push_back(std::move(s->value));
                while (at_op(",")) {
                    pos_++;
                    tuple->items.push_back(expr());
                }
                s->value = std::move(tuple);
            }
            end_statement();
            return s;
        }
        static const char* aug[] = {"+=", "-=", "*=", "/=", "//=", "%="};
        for (const char* o : aug) {
            if (!at_op(o)) continue;
            pos_++;
            if (first->kind != ExprKind::NAME && first->kind != ExprKind::INDEX) {
                throw ScriptError(line, "SyntaxError: cannot assign to expression");
            }
            auto s = stmt_node(StmtKind::AUG_ASSIGN, line);
            s->op = std::string(o).substr(0, std::string(o).size() - 1);
            s->targets.push_back(std::move(first));
            s->value = expr();
            end_statement();
            return s;
        }
        auto s = stmt_node(StmtKind::EXPR, line);
        s->value = std::move(first);
        end_statement();
        return s;
    }

    // Bounds recursion on pathological nesting.
    struct DepthGuard {
        Parser& p;
        explicit DepthGuard(Parser& parser) : p(parser) {
            if (++p.depth_ > kMaxDepth) p.fail("expression nested too deeply");
        }
        ~DepthGuard() { --p.depth_; }
    };
    static constexpr int kMaxDepth = 200;

    // Left-associative chains (a + b + c, x.y[0].z) grow the tree one level
    // per operator; each link counts against the same depth budget.
    struct ChainGuard {
        Parser& p;
        int links{0};
        explicit ChainGuard(Parser& parser) : p(parser) {}
        void link() {
            ++links;
            if (++p.depth_ > kMaxDepth) p.fail("expression nested too deeply");
        }
        ~ChainGuard() { p.depth_ -= links; }
    };

    ExprPtr expr() {
        DepthGuard guard(*this);
        ExprPtr e = or_expr();
        if (at_kw("if")) {
            const int line = cur().line;
            pos_++;
            auto c = node(ExprKind::COND, line);
            c->b = or_expr();
            expect_kw("else");
            c->c = expr();
            c->a = std::move(e);
            return c;
        }
        return e;
    }

    ExprPtr or_expr() {
        ExprPtr e = and_expr();
        ChainGuard chain(*this);
        while (at_kw("or")) {
            chain.link();
            auto n = node(ExprKind::OR, cur().line);
            pos_++;
            n->a = std::move(e);
            n->b = and_expr();
            e = std::move(n);
        }
        return e;
    }

    ExprPtr and_expr() {
        ExprPtr e = not_expr();
        ChainGuard chain(*this);
        while (at_kw("and")) {
            chain.link();
            auto n = node(ExprKind::AND, cur().line);
            pos_++;
            n->a = std::move(e);
            n->b = not_expr();
            e = std::move(n);
        }
        return e;
    }

    ExprPtr not_expr() {
        if (at_kw("not")) {
            DepthGuard guard(*this);
            auto n = node(ExprKind::NOT, cur().line);
            pos_++;
            n->a = not_expr();
            return n;
        }
        return comparison();
    }

    // "" when the current token is not a comparison operator.
    std::string comparison_op() {
        static const char* ops[] = {"==", "!=", "<=", ">=", "<", ">"};
        for (const char* o : ops) {
            if (at_op(o)) { pos_++; return o; }
        }
        if (at_kw("in")) { pos_++; return "in"; }
        if (at_kw("not") && toks_[pos_ + 1].t == Token::T::NAME && toks_[pos_ + 1].s == "in") {
            pos_ += 2;
            return "not in";
        }
        if (at_kw("is")) fail("'is' is not supported; use == or !=");
        return "";
    }

    ExprPtr comparison() {
        ExprPtr e = additive();
        const int line = cur().line;
        std::string o = comparison_op();
        if (o.empty()) return e;
        auto n = node(ExprKind::COMPARE, line);
        n->op = o;
        n->a = std::move(e);
        n->b = additive();
        if (!comparison_op().empty()) {
            throw ScriptError(line, "SyntaxError: chained comparisons are not supported; combine with 'and'");
        }
        return n;
    }

    ExprPtr additive() {
        ExprPtr e = term();
        ChainGuard chain(*this);
        while (at_op("+") || at_op("-")) {
            chain.link();
            auto n = node(ExprKind::BINARY, cur().line);
            n->op = toks_[pos_++].s;
            n->a = std::move(e);
            n->b = term();
            e = std::move(n);
        }
        return e;
    }

    ExprPtr term() {
        ExprPtr e = unary();
        ChainGuard chain(*this);
        while (at_op("*") || at_op("/") || at_op("//") || at_op("%")) {
            chain.link();
            auto n = node(ExprKind::BINARY, cur().line);
            n->op = toks_[pos_++].s;
            n->a = std::move(e);
            n->b = unary();
            e = std::move(n);
        }
        return e;
    }

    ExprPtr unary() {
        if (at_op("-") || at_op("+")) {
            DepthGuard guard(*this);
            auto n = node(ExprKind::UNARY, cur().line);
            n->op = toks_[pos_++].s;
            n->a = unary();
            return n;
        }
        return postfix();
    }

    void call_args(std::vector<ExprPtr>& out) {
        expect_op("(");
        skip_newlines();
        while (!at_op(")")) {
            if (at(Token::T::NAME) && toks_[pos_ + 1].t == Token::T::OP && toks_[pos_ + 1].s == "=") {
                fail("keyword arguments are not supported (" + cur().s + "=...)");
            }
            out.push_back(expr());
            skip_newlines();
            if (at_op(",")) {
                pos_++;
                skip_newlines();
                continue;
            }
            if (!at_op(")")) fail("expected ',' or ')' but found " + describe());
        }
        pos_++;
    }

    ExprPtr postfix() {
        ExprPtr e = primary();
        ChainGuard chain(*this);
        while (true) {
            const int line = cur().line;
            if (at_op("(") || at_op("[") || at_op(".")) chain.link();
            if (at_op("(")) {
                if (e->kind != ExprKind::NAME) fail("only named functions and methods can be called");
                auto n = node(ExprKind::CALL, e->line);
                n->name = e->name;
                call_args(n->items);
                e = std::move(n);
            } else if (at_op("[")) {
                pos_++;
                skip_newlines();
                ExprPtr lo, hi;
                if (!at_op(":")) lo = expr();
                skip_newlines();
                if (at_op(":")) {
                    pos_++;
                    skip_newlines();
                    if (!at_op("]")) hi = expr();
                    skip_newlines();
                    expect_op("]");
                    auto n = node(ExprKind::SLICE, line);
                    n->a = std::move(e);
                    n->b = std::move(lo);
                    n->c = std::move(hi);
                    e = std::move(n);
                } else {
                    expect_op("]");
                    if (!lo) fail("empty index");
                    auto n = node(ExprKind::INDEX, line);
                    n->a = std::move(e);
                    n->b = std::move(lo);
                    e = std::move(n);
                }
            } else if (at_op(".")) {
                pos_++;
                if (!at(Token::T::NAME)) fail("expected a name after '.'");
                std::string name = toks_[pos_++].s;
                if (at_op("(")) {
                    auto n = node(ExprKind::METHOD, line);
                    n->name = std::move(name);
                    n->a = std::move(e);
                    call_args(n->items);
                    e = std::move(n);
                } else {
                    auto n = node(ExprKind::ATTR, line);
                    n->name = std::move(name);
                    n->a = std::move(e);
                    e = std::move(n);
                }
            } else {
                return e;
            }
        }
    }

    ExprPtr primary() {
        const Token& t = cur();
        const int line = t.line;
        switch (t.t) {
            case Token::T::NUMBER: {
                auto n = node(ExprKind::LITERAL, line);
                n->literal = Value::number(t.num);
                pos_++;
                return n;
            }
            case Token::T::STRING: {
                std::string s = t.s;
                pos_++;
                while (at(Token::T::STRING)) s += toks_[pos_++].s; // "a" "b"
                auto n = node(ExprKind::LITERAL, line);
                n->literal = Value::string(std::move(s));
                return n;
            }
            case Token::T::NAME: {
                auto n = node(ExprKind::LITERAL, line);
                if (t.s == "true" || t.s == "True") { n->literal = Value::boolean(true); pos_++; return n; }
                if (t.s == "false" || t.s == "False") { n->literal = Value::boolean(false); pos_++; return n; }
                if (t.s == "null" || t.s == "None") { pos_++; return n; }
                if (keywords().count(t.s)) fail("unexpected '" + t.s + "'");
                n->kind = ExprKind::NAME;
                n->name = t.s;
                pos_++;
                return n;
            }
            case Token::T::OP:
                if (t.s == "(") {
                    pos_++;
                    skip_newlines();
                    if (at_op(")")) {
                        pos_++;
                        return node(ExprKind::LIST, line);
                    }
                    ExprPtr e = expr();
                    skip_newlines();
                    if (at_op(",")) {
                        auto tuple = node(ExprKind::LIST, line);
                        tuple->items.push_back(std::move(e));
                        while (at_op(",")) {
                            pos_++;
                            skip_newlines();
                            if (at_op(")")) break;
                            tuple->items.push_back(expr());
                            skip_newlines();
                        }
                        e = std::move(tuple);
                    }
                    expect_op(")");
                    return e;
                }
                if (t.s == "[") {
                    pos_++;
                    auto n = node(ExprKind::LIST, line);
                    skip_newlines();
                    while (!at_op("]")) {
                        n->items.push_back(expr());
                        skip_newlines();
                        if (at_op(",")) { pos_++; skip_newlines(); continue; }
                        if (!at_op("]")) fail("expected ',' or ']' but found " + describe());
                    }
                    pos_++;
                    return n;
                }
                if (t.s == "{") {
                    pos_++;
                    auto n = node(ExprKind::MAP, line);
                    skip_newlines();
                    while (!at_op("}")) {
                        n->items.push_back(expr());
                        skip_newlines();
                        expect_op(":");
                        skip_newlines();
                        n->items.push_back(expr());
                        skip_newlines();
                        if (at_op(",")) { pos_++; skip_newlines(); continue; }
                        if (!at_op("}")) fail("expected ',' or '}' but found " + describe());
                    }
                    pos_++;
                    return n;
                }
                break;
            default:
                break;
        }
        fail("unexpected " + describe());
    }

    std::vector<Token> toks_;
    size_t pos_{0};
    int depth_{0};
};

} // namespace

Program parse(const std::string& code) {
    Lexer lex(code);
    Parser p(lex.run());
    return p.program();
}

} // namespace scrapeguard::script

namespace scrapeguard {

std::string check_syntax(const std::string& code) {
    try {
        (void)script::parse(code);
    } catch (const ScriptError& e) {
        return "line " + std::to_string(e.line()) + ": " + e.what();
    }
    return "";
}

} // namespace scrapeguard
