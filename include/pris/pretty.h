#pragma once

#include <pris/ast.h>
#include <pris/value.h>
#include <string>
#include <string_view>

namespace pris {

// Formatter - accumulates text for diagnostics
//
//   Formatter fmt;
//   fmt.print("'");
//   fmt.print(align);
//   fmt.print("' is not a valid value for 'text_align'.");
//   return Error::value(std::move(fmt).intoString());
class Formatter {
public:
    void print(std::string_view text) { _out += text; }
    void printTerm(const ast::Term& term) { _out += ast::toString(term); }
    void printIdents(const ast::Idents& idents) { _out += idents.toString(); }
    void printValue(const Value& value);

    const std::string& str() const { return _out; }
    std::string intoString() && { return std::move(_out); }

private:
    std::string _out;
};

} // namespace pris
