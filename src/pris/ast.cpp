#include <pris/ast.h>

#include <charconv>
#include <cstdio>

namespace pris::ast {

//=============================================================================
// Construction helpers
//=============================================================================

TermPtr Term::string(std::string value) {
    return std::make_unique<Term>(Term{StringLit{std::move(value)}});
}

TermPtr Term::number(double value, std::optional<Unit> unit) {
    return std::make_unique<Term>(Term{Num{value, unit}});
}

TermPtr Term::color(uint8_t r, uint8_t g, uint8_t b) {
    return std::make_unique<Term>(Term{Color{r, g, b}});
}

TermPtr Term::idents(std::vector<std::string> parts) {
    return std::make_unique<Term>(Term{Idents{std::move(parts)}});
}

TermPtr Term::coord(TermPtr x, TermPtr y) {
    return std::make_unique<Term>(Term{Coord{std::move(x), std::move(y)}});
}

TermPtr Term::binop(TermPtr lhs, BinOp op, TermPtr rhs) {
    return std::make_unique<Term>(Term{BinTerm{std::move(lhs), op, std::move(rhs)}});
}

TermPtr Term::call(TermPtr callee, std::vector<TermPtr> args) {
    return std::make_unique<Term>(Term{FnCall{std::move(callee), std::move(args)}});
}

TermPtr Term::function(std::vector<std::string> params, Block body) {
    auto shared = std::make_shared<const Block>(std::move(body));
    return std::make_unique<Term>(Term{FnDef{std::move(params), std::move(shared)}});
}

TermPtr Term::block(Block body) {
    return std::make_unique<Term>(Term{std::move(body)});
}

Stmt assign(std::string name, TermPtr value) {
    return Assign{std::move(name), std::move(value)};
}

Stmt ret(TermPtr value) {
    return Return{std::move(value)};
}

Stmt put(TermPtr frame, TermPtr at) {
    return Put{std::move(frame), std::move(at)};
}

//=============================================================================
// Pretty printing
//=============================================================================

std::string Idents::toString() const {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += '.';
        out += parts[i];
    }
    return out;
}

const char* binOpToString(BinOp op) {
    switch (op) {
        case BinOp::Add: return "+";
        case BinOp::Sub: return "-";
        case BinOp::Mul: return "*";
        case BinOp::Div: return "/";
        case BinOp::Exp: return "^";
        case BinOp::Adj: return "~";
    }
    return "?";
}

std::string toString(Unit unit) {
    switch (unit) {
        case Unit::W:  return "w";
        case Unit::H:  return "h";
        case Unit::Em: return "em";
        case Unit::Pt: return "pt";
    }
    return "";
}

std::string formatNumber(double value) {
    // Fixed notation: the lexer has no exponent syntax. DBL_MAX needs 309 digits.
    char buf[400];
    auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::fixed);
    if (ec != std::errc()) return "nan";
    return std::string(buf, end);
}

namespace {

std::string quote(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            default:   out += c; break;
        }
    }
    out += '"';
    return out;
}

std::string hexByte(uint8_t v) {
    char buf[3];
    std::snprintf(buf, sizeof(buf), "%02x", v);
    return buf;
}

std::string commaList(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += ", ";
        out += items[i];
    }
    return out;
}

} // namespace

std::string toString(const Term& term) {
    struct Printer {
        std::string operator()(const StringLit& s) const { return quote(s.value); }

        std::string operator()(const Num& n) const {
            std::string out = formatNumber(n.value);
            if (n.unit) out += toString(*n.unit);
            return out;
        }

        std::string operator()(const Color& c) const {
            return "#" + hexByte(c.r) + hexByte(c.g) + hexByte(c.b);
        }

        std::string operator()(const Idents& i) const { return i.toString(); }

        std::string operator()(const Coord& c) const {
            return "(" + toString(*c.x) + ", " + toString(*c.y) + ")";
        }

        std::string operator()(const BinTerm& b) const {
            return "(" + toString(*b.lhs) + " " + binOpToString(b.op) + " " +
                   toString(*b.rhs) + ")";
        }

        std::string operator()(const FnCall& f) const {
            std::vector<std::string> args;
            for (const auto& a : f.args) args.push_back(toString(*a));
            return toString(*f.callee) + "(" + commaList(args) + ")";
        }

        std::string operator()(const FnDef& f) const {
            return "function(" + commaList(f.params) + ") " + toString(*f.body);
        }

        std::string operator()(const Block& b) const { return toString(b); }
    };
    return std::visit(Printer{}, term.node);
}

std::string toString(const Stmt& stmt) {
    struct Printer {
        std::string operator()(const Assign& a) const {
            return a.name + " = " + toString(*a.value);
        }
        std::string operator()(const Return& r) const {
            return "return " + toString(*r.value);
        }
        std::string operator()(const Put& p) const {
            std::string out = "put " + toString(*p.frame);
            if (p.at) out += " at " + toString(*p.at);
            return out;
        }
    };
    return std::visit(Printer{}, stmt);
}

std::string toString(const Block& block) {
    if (block.statements.empty()) return "{}";
    std::string out = "{\n";
    for (const auto& s : block.statements) {
        out += "  " + toString(s) + "\n";
    }
    out += "}";
    return out;
}

} // namespace pris::ast
