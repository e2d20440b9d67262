#include <pris/lexer.h>
#include <pris/utf8.h>

#include <cstdio>

namespace pris {

namespace {

bool isAlphabetic(uint8_t c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool isAlphabeticOrUnderscore(uint8_t c) {
    return isAlphabetic(c) || c == '_';
}

bool isDigit(uint8_t c) {
    return c >= '0' && c <= '9';
}

bool isAlphanumericOrUnderscore(uint8_t c) {
    return isAlphabeticOrUnderscore(c) || isDigit(c);
}

bool isHexadecimal(uint8_t c) {
    return isDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string hex(uint8_t c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%x", c);
    return buf;
}

// Quote a byte for a message: printable ASCII as 'c', anything else as hex.
std::string describeByte(uint8_t c) {
    if (c >= 0x20 && c < 0x7f) return std::string("'") + static_cast<char>(c) + "'";
    return "byte " + hex(c);
}

TokenKind classifyIdent(std::string_view word) {
    if (word == "at") return TokenKind::KwAt;
    if (word == "function") return TokenKind::KwFunction;
    if (word == "import") return TokenKind::KwImport;
    if (word == "put") return TokenKind::KwPut;
    if (word == "return") return TokenKind::KwReturn;
    return TokenKind::Ident;
}

// Error for a byte that is not allowed at this place.
Error makeParseError(std::string_view input, size_t at) {
    uint8_t c = static_cast<uint8_t>(input[at]);

    if (c == '\t') {
        return Error::lexical(at, at + 1, "Found tab character. Please use spaces instead.");
    }
    if (c == '\r') {
        return Error::lexical(at, at + 1,
            "Found carriage return. Please use Unix line endings instead.");
    }
    if (c < 0x20 || c == 0x7f) {
        return Error::lexical(at, at + 1,
            "Found unexpected control character " + hex(c) + ". "
            "Note that Pris expects UTF-8 encoded files.");
    }
    if (c < 0x7f) {
        return Error::lexical(at, at + 1,
            std::string("Found unexpected character '") + static_cast<char>(c) + "'.");
    }

    // Non-ASCII: if the bytes form a valid UTF-8 sequence, complain about
    // non-ASCII identifiers, otherwise about the encoding.
    if (auto d = utf8::decode(input.substr(at))) {
        return Error::lexical(at, at + d->length,
            "Found unexpected character '" + std::string(input.substr(at, d->length)) +
            "'. Note that identifiers must be ASCII.");
    }
    return Error::lexical(at, at + 1,
        "Found unexpected byte " + hex(c) + ". Note that Pris expects UTF-8 encoded files.");
}

// Error for a byte that may start a byte order mark.
Error makeEncodingError(std::string_view input, size_t at) {
    std::string_view rest = input.substr(at);

    static constexpr std::string_view UTF8_BOM("\xef\xbb\xbf", 3);
    static constexpr std::string_view UTF16_BE_BOM("\xfe\xff", 2);
    static constexpr std::string_view UTF16_LE_BOM("\xff\xfe", 2);
    static constexpr std::string_view UTF32_BE_BOM("\x00\x00\xfe\xff", 4);
    static constexpr std::string_view UTF32_LE_BOM("\xff\xfe\x00\x00", 4);

    // The UTF-32 little endian mark starts with the UTF-16 one, check it first.
    if (rest.starts_with(UTF8_BOM)) {
        return Error::lexical(at, at + 3, "Found UTF-8 byte order mark. Please remove it.");
    }
    if (rest.starts_with(UTF32_BE_BOM) || rest.starts_with(UTF32_LE_BOM)) {
        return Error::lexical(at, at + 4,
            "Expected UTF-8 encoded file, but found UTF-32 byte order mark.");
    }
    if (rest.starts_with(UTF16_BE_BOM) || rest.starts_with(UTF16_LE_BOM)) {
        return Error::lexical(at, at + 2,
            "Expected UTF-8 encoded file, but found UTF-16 byte order mark.");
    }
    return makeParseError(input, at);
}

} // namespace

//=============================================================================
// Token names
//=============================================================================

const char* tokenKindName(TokenKind kind) {
    switch (kind) {
        case TokenKind::String:     return "string";
        case TokenKind::RawString:  return "raw string";
        case TokenKind::Color:      return "color";
        case TokenKind::Number:     return "number";
        case TokenKind::Ident:      return "identifier";
        case TokenKind::KwAt:       return "'at'";
        case TokenKind::KwFunction: return "'function'";
        case TokenKind::KwImport:   return "'import'";
        case TokenKind::KwPut:      return "'put'";
        case TokenKind::KwReturn:   return "'return'";
        case TokenKind::UnitEm:     return "'em'";
        case TokenKind::UnitH:      return "'h'";
        case TokenKind::UnitW:      return "'w'";
        case TokenKind::UnitPt:     return "'pt'";
        case TokenKind::Comma:      return "','";
        case TokenKind::Dot:        return "'.'";
        case TokenKind::Equals:     return "'='";
        case TokenKind::Hat:        return "'^'";
        case TokenKind::Minus:      return "'-'";
        case TokenKind::Plus:       return "'+'";
        case TokenKind::Slash:      return "'/'";
        case TokenKind::Star:       return "'*'";
        case TokenKind::Tilde:      return "'~'";
        case TokenKind::LParen:     return "'('";
        case TokenKind::RParen:     return "')'";
        case TokenKind::LBrace:     return "'{'";
        case TokenKind::RBrace:     return "'}'";
    }
    return "?";
}

//=============================================================================
// Driver
//=============================================================================

Result<std::vector<Token>> lex(std::string_view input) {
    return Lexer(input).run();
}

Result<std::vector<Token>> Lexer::run() {
    while (_state != State::Done) {
        auto step = [this]() -> Result<Step> {
            switch (_state) {
                case State::Base:        return lexBase();
                case State::Space:       return lexSpace();
                case State::InIdent:     return lexIdent();
                case State::InNumber:    return lexNumber();
                case State::InString:    return lexString();
                case State::InRawString: return lexRawString();
                case State::InColor:     return lexColor();
                case State::InComment:   return lexComment();
                case State::Done:        break;
            }
            return Step{_input.size(), State::Done};
        }();

        if (!step) return std::unexpected(step.error());
        _start = step->start;
        _state = step->state;
    }
    return Ok(std::move(_tokens));
}

bool Lexer::hasAt(size_t at, std::string_view expected) const {
    if (at > _input.size()) return false;
    return _input.substr(at).starts_with(expected);
}

void Lexer::push(size_t start, TokenKind kind, size_t end) {
    _tokens.push_back(Token{start, kind, end});
}

void Lexer::pushSingle(size_t at, TokenKind kind) {
    push(at, kind, at + 1);
}

//=============================================================================
// States
//=============================================================================

Result<Lexer::Step> Lexer::lexBase() {
    for (size_t i = _start; i < _input.size(); i++) {
        uint8_t c = static_cast<uint8_t>(_input[i]);

        // '/' and '-' need a lookahead for "//" and "---". Without a match
        // they are single-character tokens below.
        if (c == '/' && hasAt(i + 1, "/")) return Step{i, State::InComment};
        if (c == '-' && hasAt(i + 1, "--")) return Step{i, State::InRawString};

        switch (c) {
            case '"':  return Step{i, State::InString};
            case ' ':
            case '\n': return Step{i, State::Space};
            case '#':  return Step{i, State::InColor};

            case ',': pushSingle(i, TokenKind::Comma); continue;
            case '.': pushSingle(i, TokenKind::Dot); continue;
            case '=': pushSingle(i, TokenKind::Equals); continue;
            case '^': pushSingle(i, TokenKind::Hat); continue;
            case '-': pushSingle(i, TokenKind::Minus); continue;
            case '+': pushSingle(i, TokenKind::Plus); continue;
            case '/': pushSingle(i, TokenKind::Slash); continue;
            case '*': pushSingle(i, TokenKind::Star); continue;
            case '~': pushSingle(i, TokenKind::Tilde); continue;
            case '(': pushSingle(i, TokenKind::LParen); continue;
            case ')': pushSingle(i, TokenKind::RParen); continue;
            case '{': pushSingle(i, TokenKind::LBrace); continue;
            case '}': pushSingle(i, TokenKind::RBrace); continue;

            // Possible start of a byte order mark
            case 0xef:
            case 0xfe:
            case 0xff:
            case 0x00:
                return std::unexpected(makeEncodingError(_input, i));

            default:
                break;
        }

        if (isAlphabeticOrUnderscore(c)) return Step{i, State::InIdent};
        if (isDigit(c)) return Step{i, State::InNumber};

        // Anything else is invalid here: tabs, carriage returns, control
        // characters and non-ASCII. Those are fine in strings and comments.
        return std::unexpected(makeParseError(_input, i));
    }

    return Step{_input.size(), State::Done};
}

Result<Lexer::Step> Lexer::lexSpace() {
    for (size_t i = _start; i < _input.size(); i++) {
        switch (_input[i]) {
            case ' ':
            case '\n':
                continue;
            case '\t':
            case '\r':
                return std::unexpected(makeParseError(_input, i));
            default:
                return Step{i, State::Base};
        }
    }
    return Step{_input.size(), State::Done};
}

Result<Lexer::Step> Lexer::lexComment() {
    // Skip the "//"
    for (size_t i = _start + 2; i < _input.size(); i++) {
        if (_input[i] == '\n') {
            // The newline was whitespace after all; continue past it.
            return Step{i + 1, State::Space};
        }
    }
    return Step{_input.size(), State::Done};
}

Result<Lexer::Step> Lexer::lexIdent() {
    for (size_t i = _start + 1; i < _input.size(); i++) {
        if (!isAlphanumericOrUnderscore(static_cast<uint8_t>(_input[i]))) {
            push(_start, classifyIdent(_input.substr(_start, i - _start)), i);
            return Step{i, State::Base};
        }
    }
    push(_start, classifyIdent(_input.substr(_start)), _input.size());
    return Step{_input.size(), State::Done};
}

Result<Lexer::Step> Lexer::lexNumber() {
    bool periodSeen = false;

    for (size_t i = _start + 1; i < _input.size(); i++) {
        char c = _input[i];

        if (isDigit(static_cast<uint8_t>(c))) continue;

        if (c == '.' && !periodSeen) {
            periodSeen = true;
            continue;
        }

        // Unit suffixes become a separate token right after the number.
        if (c == 'e' && hasAt(i + 1, "m")) {
            push(_start, TokenKind::Number, i);
            push(i, TokenKind::UnitEm, i + 2);
            return Step{i + 2, State::Base};
        }
        if (c == 'p' && hasAt(i + 1, "t")) {
            push(_start, TokenKind::Number, i);
            push(i, TokenKind::UnitPt, i + 2);
            return Step{i + 2, State::Base};
        }
        if (c == 'h') {
            push(_start, TokenKind::Number, i);
            pushSingle(i, TokenKind::UnitH);
            return Step{i + 1, State::Base};
        }
        if (c == 'w') {
            push(_start, TokenKind::Number, i);
            pushSingle(i, TokenKind::UnitW);
            return Step{i + 1, State::Base};
        }

        // Re-inspect this byte in the base state.
        push(_start, TokenKind::Number, i);
        return Step{i, State::Base};
    }

    push(_start, TokenKind::Number, _input.size());
    return Step{_input.size(), State::Done};
}

Result<Lexer::Step> Lexer::lexString() {
    // Anything after a backslash is skipped, valid escape or not. Escape
    // codes are interpreted by the parser.
    bool skipNext = false;
    for (size_t i = _start + 1; i < _input.size(); i++) {
        if (skipNext) {
            skipNext = false;
            continue;
        }
        if (_input[i] == '\\') {
            skipNext = true;
        } else if (_input[i] == '"') {
            push(_start, TokenKind::String, i + 1);
            return Step{i + 1, State::Base};
        }
    }

    return std::unexpected(Error::lexical(_start, _start + 1,
        "String was not closed with '\"' before end of input."));
}

Result<Lexer::Step> Lexer::lexRawString() {
    for (size_t i = _start + 3; i < _input.size(); i++) {
        if (_input[i] == '-' && hasAt(i + 1, "--")) {
            push(_start, TokenKind::RawString, i + 3);
            return Step{i + 3, State::Base};
        }
    }

    return std::unexpected(Error::lexical(_start, _start + 3,
        "Raw string was not closed with '---' before end of input."));
}

Result<Lexer::Step> Lexer::lexColor() {
    // '#' followed by exactly six hexadecimal digits
    constexpr size_t COLOR_LEN = 7;

    for (size_t i = _start + 1; i < _input.size(); i++) {
        size_t n = i - _start;
        uint8_t c = static_cast<uint8_t>(_input[i]);

        if (n < COLOR_LEN) {
            if (isHexadecimal(c)) continue;
            return std::unexpected(Error::lexical(i, i + 1,
                "Expected hexadecimal digit, found " + describeByte(c) + "."));
        }

        // A color directly followed by more alphanumerics would otherwise
        // continue as an identifier, which only leads to confusing errors.
        if (isHexadecimal(c)) {
            return std::unexpected(Error::lexical(_start, i + 1,
                "Expected only six hexadecimal digits, found one more."));
        }
        if (isAlphanumericOrUnderscore(c)) {
            return std::unexpected(Error::lexical(_start, i + 1,
                "Expected six hexadecimal digits, found extra " + describeByte(c) + "."));
        }

        push(_start, TokenKind::Color, i);
        return Step{i, State::Base};
    }

    if (_input.size() - _start == COLOR_LEN) {
        push(_start, TokenKind::Color, _input.size());
        return Step{_input.size(), State::Done};
    }

    return std::unexpected(Error::lexical(_start, _input.size(),
        "Expected six hexadecimal digits, found end of input."));
}

} // namespace pris
