#pragma once

#include <pris/elements.h>
#include <pris/frame.h>
#include <pris/result.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pris {

namespace ast {
struct Block;
}

class Env;
class ResourceMap;

//=============================================================================
// ValType - the type tag of a runtime value
//
// Numbers and coordinates carry their unit exponent as part of the type:
// Num(0) is a plain number, Num(1) a length, Num(2) an area.
//=============================================================================
struct ValType {
    enum class Tag : uint8_t { Num, Coord, Color, Str, Frame, Fn };

    Tag tag = Tag::Num;
    int dim = 0;

    static ValType num(int dim) { return {Tag::Num, dim}; }
    static ValType coord(int dim) { return {Tag::Coord, dim}; }
    static ValType color() { return {Tag::Color, 0}; }
    static ValType str() { return {Tag::Str, 0}; }
    static ValType frame() { return {Tag::Frame, 0}; }
    static ValType fn() { return {Tag::Fn, 0}; }

    bool operator==(const ValType&) const = default;

    // "number", "length", "length^2", "coordinate of lengths", ...
    std::string toString() const;
};

//=============================================================================
// Number algebra with unit exponents
//=============================================================================
struct Num {
    double value = 0.0;
    int dim = 0;

    // + and - need equal exponents, * and / add and subtract them.
    Result<Num> plus(Num other) const;
    Result<Num> minus(Num other) const;
    Num times(Num other) const;
    Result<Num> dividedBy(Num other) const;

    // The exponent must be dimensionless. A dimensioned base needs an
    // integral exponent, which multiplies its unit exponent.
    Result<Num> power(Num exponent) const;

    bool operator==(const Num&) const = default;
};

struct Coord {
    double x = 0.0;
    double y = 0.0;
    int dim = 0;

    Vec2 toVec2() const { return {x, y}; }

    bool operator==(const Coord&) const = default;
};

struct Closure;
struct Builtin;

//=============================================================================
// Value
//=============================================================================
class Value {
public:
    using Storage = std::variant<Num, Coord, Color, std::string, Frame::Ptr,
                                 std::shared_ptr<const Closure>,
                                 std::shared_ptr<const Builtin>>;

    Value() = default;
    Value(Num num) : _storage(num) {}
    Value(Coord coord) : _storage(coord) {}
    Value(Color color) : _storage(color) {}
    Value(std::string str) : _storage(std::move(str)) {}
    Value(Frame::Ptr frame) : _storage(std::move(frame)) {}
    Value(std::shared_ptr<const Closure> closure) : _storage(std::move(closure)) {}
    Value(std::shared_ptr<const Builtin> builtin) : _storage(std::move(builtin)) {}

    static Value number(double value, int dim = 0) { return Value(Num{value, dim}); }
    static Value length(double value) { return Value(Num{value, 1}); }
    static Value coord(double x, double y, int dim = 1) { return Value(Coord{x, y, dim}); }

    ValType type() const;

    template<typename T> bool is() const { return std::holds_alternative<T>(_storage); }
    template<typename T> const T* as() const { return std::get_if<T>(&_storage); }

    const Storage& storage() const { return _storage; }

private:
    Storage _storage;
};

//=============================================================================
// Callables
//=============================================================================

// A function defined in the program, with the scope it was defined in.
// Bound into that same scope it holds the scope weakly in selfScope and
// leaves env null; Env::lookup hands out a strong copy.
struct Closure {
    std::vector<std::string> params;
    std::shared_ptr<const ast::Block> body;
    std::shared_ptr<const Env> env;
    std::weak_ptr<const Env> selfScope;

    std::shared_ptr<const Env> scope() const { return env ? env : selfScope.lock(); }
};

using BuiltinFn = std::function<Result<Value>(ResourceMap&, const Env&, std::vector<Value>)>;

// A natively implemented function
struct Builtin {
    std::string name;
    BuiltinFn fn;
};

} // namespace pris
