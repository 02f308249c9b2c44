#pragma once

// Internal to the script interpreter: syntax tree and parser entry point.

#include "scrapeguard/script.h"
#include "scrapeguard/value.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace scrapeguard::script {

struct Expr;
struct Stmt;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;
using Block = std::vector<StmtPtr>;

enum class ExprKind {
    LITERAL,   // literal
    NAME,      // name
    LIST,      // items
    MAP,       // items: key, value, key, value, ...
    UNARY,     // op, a
    BINARY,    // op, a, b  (+ - * / // %)
    COMPARE,   // op, a, b  (== != < <= > >= in "not in")
    AND,       // a, b
    OR,        // a, b
    NOT,       // a
    CALL,      // name, items (callee is always a plain name)
    METHOD,    // a . name ( items )
    ATTR,      // a . name  (not followed by a call)
    INDEX,     // a [ b ]
    SLICE,     // a [ b : c ], b/c may be null
    COND,      // a if b else c
};

struct Expr {
    ExprKind kind{ExprKind::LITERAL};
    int line{0};
    Value literal;
    std::string name;
    std::string op;
    std::vector<ExprPtr> items;
    ExprPtr a, b, c;
};

enum class StmtKind {
    EXPR,       // value
    ASSIGN,     // targets (one NAME/INDEX, or several NAMEs to unpack), value
    AUG_ASSIGN, // targets[0], op, value
    IF,         // branches (cond null for else)
    FOR,        // vars, value (iterable), body
    WHILE,      // value (cond), body
    BREAK,
    CONTINUE,
    PASS,
    IMPORT,     // modules
};

struct Branch {
    ExprPtr cond;
    Block body;
};

struct Stmt {
    StmtKind kind{StmtKind::PASS};
    int line{0};
    std::vector<ExprPtr> targets;
    std::string op;
    ExprPtr value;
    std::vector<Branch> branches;
    std::vector<std::string> vars;
    Block body;
    std::vector<std::string> modules;
};

struct Program {
    Block body;
};

// Throws ScriptError with the offending line.
Program parse(const std::string& code);

} // namespace scrapeguard::script
