#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pris {

//=============================================================================
// Error - kind, message, optional source span and cause chain
//=============================================================================
class Error {
public:
    enum class Kind : uint8_t {
        Lexical,
        Arity,
        ArgType,
        Type,
        UnresolvedName,
        Value,
        MissingFont,
        MissingFile,
        Other
    };

    struct Span {
        size_t start;
        size_t end;
    };

    Error() = default;
    Error(Kind kind, std::string message)
        : _kind(kind), _message(std::move(message)) {}

    // Named constructors, one per kind
    static Error lexical(size_t start, size_t end, std::string message);
    static Error arity(std::string_view fn, uint32_t expected, uint32_t actual);
    static Error argType(std::string_view fn, uint32_t index,
                         std::string_view expected, std::string_view actual);
    static Error type(std::string_view what, std::string_view expected,
                      std::string_view actual);
    static Error unresolved(std::string_view path);
    static Error value(std::string message);
    static Error missingFont(std::string_view family, std::string_view style);
    static Error missingFile(std::string_view path);
    static Error other(std::string message);

    Kind kind() const { return _kind; }
    const std::string& message() const { return _message; }
    const std::optional<Span>& span() const { return _span; }

    // Wrap this error as the cause of a new, higher level error.
    // The kind and span of the innermost error are kept.
    Error wrap(std::string message) const;
    const Error* cause() const { return _cause.get(); }

    // Message including all causes: "outer: inner: innermost"
    std::string fullMessage() const;

    // Render the error against the source it was produced from:
    //
    //   3:5: Found tab character. Please use spaces instead.
    //   foo	bar
    //       ^
    //
    // Errors without a span render as their full message.
    std::string excerpt(std::string_view source) const;

    static const char* kindName(Kind kind);

private:
    Kind _kind = Kind::Other;
    std::string _message;
    std::optional<Span> _span;
    std::shared_ptr<const Error> _cause;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
std::unexpected<Error> Err(std::string message) {
    return std::unexpected(Error(Error::Kind::Other, std::move(message)));
}

template<typename T = void, typename U>
std::unexpected<Error> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(cause.error().wrap(std::move(message)));
}

template<typename T>
std::string error_msg(const Result<T>& result) {
    if (result) return {};
    return result.error().fullMessage();
}

} // namespace pris
