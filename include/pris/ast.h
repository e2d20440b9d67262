#pragma once

// Pris AST
//
// The term tree produced by the parser and walked by the interpreter.
// Terms own their sub-terms. Function bodies are held by shared_ptr so that
// closures created during evaluation can keep them alive.
//
// Grammar overview (informal):
//   program    = statement*
//   statement  = IDENT '=' term | 'return' term | 'put' term ('at' term)?
//   term       = term ('+' | '-' | '*' | '/' | '^' | '~') term
//              | STRING | NUMBER UNIT? | COLOR | IDENT ('.' IDENT)*
//              | '(' term ',' term ')' | term '(' args ')'
//              | 'function' '(' params ')' block | block
//   block      = '{' statement* '}'

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pris::ast {

struct Term;
using TermPtr = std::unique_ptr<Term>;

//=============================================================================
// Leaf terms
//=============================================================================

struct StringLit {
    std::string value;
};

enum class Unit : uint8_t { W, H, Em, Pt };

struct Num {
    double value = 0.0;
    std::optional<Unit> unit;
};

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
};

// Dotted identifier path: a.b.c, never empty.
struct Idents {
    std::vector<std::string> parts;

    std::string toString() const;
};

//=============================================================================
// Compound terms
//=============================================================================

struct Coord {
    TermPtr x;
    TermPtr y;
};

enum class BinOp : uint8_t { Add, Sub, Mul, Div, Exp, Adj };

const char* binOpToString(BinOp op);

struct BinTerm {
    TermPtr lhs;
    BinOp op;
    TermPtr rhs;
};

struct FnCall {
    TermPtr callee;
    std::vector<TermPtr> args;
};

struct Block;

struct FnDef {
    std::vector<std::string> params;
    std::shared_ptr<const Block> body;
};

//=============================================================================
// Statements
//=============================================================================

struct Assign {
    std::string name;
    TermPtr value;
};

struct Return {
    TermPtr value;
};

struct Put {
    TermPtr frame;
    TermPtr at;  // null when placed at the origin
};

using Stmt = std::variant<Assign, Return, Put>;

struct Block {
    std::vector<Stmt> statements;
};

//=============================================================================
// Term
//=============================================================================

struct Term {
    using Node = std::variant<StringLit, Num, Color, Idents, Coord, BinTerm,
                              FnCall, FnDef, Block>;
    Node node;

    template<typename T> bool is() const { return std::holds_alternative<T>(node); }
    template<typename T> const T* as() const { return std::get_if<T>(&node); }

    // Construction helpers, mostly for tests and the parser boundary
    static TermPtr string(std::string value);
    static TermPtr number(double value, std::optional<Unit> unit = std::nullopt);
    static TermPtr color(uint8_t r, uint8_t g, uint8_t b);
    static TermPtr idents(std::vector<std::string> parts);
    static TermPtr coord(TermPtr x, TermPtr y);
    static TermPtr binop(TermPtr lhs, BinOp op, TermPtr rhs);
    static TermPtr call(TermPtr callee, std::vector<TermPtr> args);
    static TermPtr function(std::vector<std::string> params, Block body);
    static TermPtr block(Block body);
};

// Statement construction helpers
Stmt assign(std::string name, TermPtr value);
Stmt ret(TermPtr value);
Stmt put(TermPtr frame, TermPtr at = nullptr);

//=============================================================================
// Pretty printing
//
// The output is parseable: strings are quoted and escaped, coordinates print
// as (x, y), binary operations are fully parenthesized, colors print as
// #rrggbb in lowercase hex.
//=============================================================================

std::string toString(const Term& term);
std::string toString(const Stmt& stmt);
std::string toString(const Block& block);
std::string toString(Unit unit);
std::string formatNumber(double value);

} // namespace pris::ast
