#include <pris/result.hpp>

#include <algorithm>

namespace pris {

Error Error::lexical(size_t start, size_t end, std::string message) {
    Error err(Kind::Lexical, std::move(message));
    err._span = Span{start, end};
    return err;
}

Error Error::arity(std::string_view fn, uint32_t expected, uint32_t actual) {
    std::string msg = "'" + std::string(fn) + "' takes " + std::to_string(expected) +
                      (expected == 1 ? " argument" : " arguments") + ", but " +
                      std::to_string(actual) + (actual == 1 ? " was" : " were") +
                      " given.";
    return Error(Kind::Arity, std::move(msg));
}

Error Error::argType(std::string_view fn, uint32_t index,
                     std::string_view expected, std::string_view actual) {
    std::string msg = "Argument " + std::to_string(index) + " of '" + std::string(fn) +
                      "' must be a " + std::string(expected) + ", but a " +
                      std::string(actual) + " was given.";
    return Error(Kind::ArgType, std::move(msg));
}

Error Error::type(std::string_view what, std::string_view expected,
                  std::string_view actual) {
    std::string msg = "Expected " + std::string(what) + " to be a " +
                      std::string(expected) + ", but found a " +
                      std::string(actual) + ".";
    return Error(Kind::Type, std::move(msg));
}

Error Error::unresolved(std::string_view path) {
    return Error(Kind::UnresolvedName,
                 "The name '" + std::string(path) + "' is not defined.");
}

Error Error::value(std::string message) {
    return Error(Kind::Value, std::move(message));
}

Error Error::missingFont(std::string_view family, std::string_view style) {
    return Error(Kind::MissingFont, "Font '" + std::string(family) + "' in style '" +
                                        std::string(style) + "' could not be found.");
}

Error Error::missingFile(std::string_view path) {
    return Error(Kind::MissingFile,
                 "Cannot load '" + std::string(path) + "': file is missing or unreadable.");
}

Error Error::other(std::string message) {
    return Error(Kind::Other, std::move(message));
}

Error Error::wrap(std::string message) const {
    Error outer(_kind, std::move(message));
    outer._span = _span;
    outer._cause = std::make_shared<const Error>(*this);
    return outer;
}

std::string Error::fullMessage() const {
    std::string msg = _message;
    for (const Error* c = cause(); c; c = c->cause()) {
        msg += ": ";
        msg += c->message();
    }
    return msg;
}

std::string Error::excerpt(std::string_view source) const {
    if (!_span || _span->start > source.size()) {
        return fullMessage();
    }

    size_t start = _span->start;
    size_t lineStart = 0;
    if (start > 0) {
        size_t nl = source.rfind('\n', start - 1);
        if (nl != std::string_view::npos) lineStart = nl + 1;
    }

    size_t lineEnd = source.find('\n', start);
    if (lineEnd == std::string_view::npos) lineEnd = source.size();

    size_t lineNo = 1 + static_cast<size_t>(
        std::count(source.begin(), source.begin() + static_cast<ptrdiff_t>(lineStart), '\n'));
    size_t column = 1 + start - lineStart;

    // The marker covers the span, clipped to the line, and at least one byte.
    size_t markEnd = std::min(std::max(_span->end, start + 1), std::max(lineEnd, start + 1));

    std::string out = std::to_string(lineNo) + ":" + std::to_string(column) + ": " +
                      fullMessage() + "\n";
    out += source.substr(lineStart, lineEnd - lineStart);
    out += "\n";
    out += std::string(start - lineStart, ' ');
    out += std::string(markEnd - start, '^');
    out += "\n";
    return out;
}

const char* Error::kindName(Kind kind) {
    switch (kind) {
        case Kind::Lexical:        return "lexical error";
        case Kind::Arity:          return "arity error";
        case Kind::ArgType:        return "argument type error";
        case Kind::Type:           return "type error";
        case Kind::UnresolvedName: return "unresolved name";
        case Kind::Value:          return "value error";
        case Kind::MissingFont:    return "missing font";
        case Kind::MissingFile:    return "missing file";
        case Kind::Other:          return "error";
    }
    return "error";
}

} // namespace pris
