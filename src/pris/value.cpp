#include <pris/value.h>
#include <pris/ast.h>

#include <cmath>
#include <type_traits>

namespace pris {

namespace {

std::string dimName(int dim, const char* singular, const char* plural) {
    if (dim == 1) return singular;
    return std::string(plural) + "^" + std::to_string(dim);
}

} // namespace

//=============================================================================
// ValType
//=============================================================================

std::string ValType::toString() const {
    switch (tag) {
        case Tag::Num:
            if (dim == 0) return "number";
            return dimName(dim, "length", "length");
        case Tag::Coord:
            if (dim == 0) return "coordinate";
            return "coordinate of " + dimName(dim, "lengths", "length");
        case Tag::Color: return "color";
        case Tag::Str: return "string";
        case Tag::Frame: return "frame";
        case Tag::Fn: return "function";
    }
    return "unknown";
}

//=============================================================================
// Num
//=============================================================================

Result<Num> Num::plus(Num other) const {
    if (dim != other.dim) {
        return std::unexpected(Error::type("the right operand of '+'",
                                           ValType::num(dim).toString(),
                                           ValType::num(other.dim).toString()));
    }
    return Num{value + other.value, dim};
}

Result<Num> Num::minus(Num other) const {
    if (dim != other.dim) {
        return std::unexpected(Error::type("the right operand of '-'",
                                           ValType::num(dim).toString(),
                                           ValType::num(other.dim).toString()));
    }
    return Num{value - other.value, dim};
}

Num Num::times(Num other) const {
    return Num{value * other.value, dim + other.dim};
}

Result<Num> Num::dividedBy(Num other) const {
    if (other.value == 0.0) {
        return std::unexpected(Error::value("Division by zero."));
    }
    return Num{value / other.value, dim - other.dim};
}

Result<Num> Num::power(Num exponent) const {
    if (exponent.dim != 0) {
        return std::unexpected(Error::type("the exponent of '^'", "number",
                                           ValType::num(exponent.dim).toString()));
    }
    if (dim == 0) {
        return Num{std::pow(value, exponent.value), 0};
    }

    double integral = 0.0;
    if (std::modf(exponent.value, &integral) != 0.0 || std::abs(integral) > 64.0) {
        return std::unexpected(Error::value(
            "A " + ValType::num(dim).toString() +
            " can only be raised to an integer power, not to " +
            ast::formatNumber(exponent.value) + "."));
    }
    int n = static_cast<int>(integral);
    return Num{std::pow(value, integral), dim * n};
}

//=============================================================================
// Value
//=============================================================================

ValType Value::type() const {
    return std::visit([](const auto& v) -> ValType {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, Num>) return ValType::num(v.dim);
        else if constexpr (std::is_same_v<T, Coord>) return ValType::coord(v.dim);
        else if constexpr (std::is_same_v<T, Color>) return ValType::color();
        else if constexpr (std::is_same_v<T, std::string>) return ValType::str();
        else if constexpr (std::is_same_v<T, Frame::Ptr>) return ValType::frame();
        else return ValType::fn();
    }, _storage);
}

} // namespace pris
