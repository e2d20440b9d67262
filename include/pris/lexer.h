#pragma once

#include <pris/result.hpp>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace pris {

//=============================================================================
// Token kinds
//=============================================================================

enum class TokenKind : uint8_t {
    // Literals
    String,         // "hello"
    RawString,      // ---hello---
    Color,          // #ff8800
    Number,         // 42, 3.14
    Ident,          // font_size

    // Keywords
    KwAt,
    KwFunction,
    KwImport,
    KwPut,
    KwReturn,

    // Unit suffixes, emitted directly after a Number
    UnitEm,
    UnitH,
    UnitW,
    UnitPt,

    // Punctuation
    Comma,
    Dot,
    Equals,
    Hat,
    Minus,
    Plus,
    Slash,
    Star,
    Tilde,
    LParen,
    RParen,
    LBrace,
    RBrace
};

const char* tokenKindName(TokenKind kind);

// A token is a half-open byte range [start, end) into the source.
struct Token {
    size_t start;
    TokenKind kind;
    size_t end;

    bool operator==(const Token&) const = default;
};

/**
 * Lexer - byte-level state machine tokenizer
 *
 * Only spaces and newlines are whitespace. Tabs, carriage returns, control
 * characters, byte order marks and non-ASCII bytes outside of strings and
 * comments are rejected with a located error.
 *
 * State machine (Base re-inspects the byte that ended the previous state):
 *
 *   Base --' '/'\n'--> Space ----------(other)----------> Base
 *        --"//"------> InComment ------('\n')-----------> Space
 *        --'"'-------> InString -------(unescaped '"')--> Base
 *        --"---"-----> InRawString ----("---")----------> Base
 *        --'#'-------> InColor --------(6 hex digits)---> Base
 *        --[A-Za-z_]-> InIdent --------(other)----------> Base
 *        --[0-9]-----> InNumber -------(other or unit)--> Base
 *        --(end)-----> Done
 */
class Lexer {
public:
    enum class State : uint8_t {
        Base,
        Space,
        InIdent,
        InNumber,
        InString,
        InRawString,
        InColor,
        InComment,
        Done
    };

    explicit Lexer(std::string_view input) : _input(input) {}

    // Run the lexer over the full input.
    // Returns either all tokens, or the first lexical error.
    Result<std::vector<Token>> run();

private:
    // Outcome of one state: where the next state starts, and which it is.
    struct Step {
        size_t start;
        State state;
    };

    Result<Step> lexBase();
    Result<Step> lexSpace();
    Result<Step> lexIdent();
    Result<Step> lexNumber();
    Result<Step> lexString();
    Result<Step> lexRawString();
    Result<Step> lexColor();
    Result<Step> lexComment();

    bool hasAt(size_t at, std::string_view expected) const;
    void push(size_t start, TokenKind kind, size_t end);
    void pushSingle(size_t at, TokenKind kind);

    std::string_view _input;
    size_t _start = 0;
    State _state = State::Base;
    std::vector<Token> _tokens;
};

// Lex a UTF-8 source into (start, kind, end) tokens.
Result<std::vector<Token>> lex(std::string_view input);

} // namespace pris
