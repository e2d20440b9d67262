//=============================================================================
// AST Tests
//
// Printing must produce parseable source.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <pris/ast.h>
#include <pris/lexer.h>

using namespace boost::ut;
using namespace pris::ast;

namespace {

TermPtr id(const char* name) {
    return Term::idents({name});
}

} // namespace

suite ast_print_tests = [] {
    "numbers print shortest form"_test = [] {
        expect(toString(*Term::number(1.0)) == std::string("1"));
        expect(toString(*Term::number(0.5, Unit::W)) == std::string("0.5w"));
        expect(toString(*Term::number(12.0, Unit::Em)) == std::string("12em"));
        expect(toString(*Term::number(3.0, Unit::Pt)) == std::string("3pt"));
    };

    "large and tiny numbers stay lexable"_test = [] {
        expect(toString(*Term::number(1e21)) == std::string("1000000000000000000000"));
        expect(toString(*Term::number(1e-7)) == std::string("0.0000001"));

        for (double value : {1e21, 1e-7, 1.2345678901234569e23}) {
            auto text = toString(*Term::number(value));
            auto tokens = pris::lex(text);
            expect(tokens.has_value() >> fatal);
            expect((tokens->size() == 1_u) >> fatal);
            expect((*tokens)[0].kind == pris::TokenKind::Number);
            expect((*tokens)[0].start == 0u);
            expect((*tokens)[0].end == text.size());
        }
    };

    "strings are quoted and escaped"_test = [] {
        expect(toString(*Term::string("a\"b\\c\nd")) == std::string(R"("a\"b\\c\nd")"));
    };

    "colors are lowercase hex"_test = [] {
        expect(toString(*Term::color(255, 10, 0xab)) == std::string("#ff0aab"));
    };

    "dotted path"_test = [] {
        expect(toString(*Term::idents({"a", "b", "c"})) == std::string("a.b.c"));
    };

    "coordinate"_test = [] {
        auto term = Term::coord(Term::number(1.0, Unit::W), Term::number(2.0, Unit::H));
        expect(toString(*term) == std::string("(1w, 2h)"));
    };

    "binary operations are parenthesized"_test = [] {
        auto term = Term::binop(id("a"), BinOp::Add,
                                Term::binop(Term::number(2.0), BinOp::Mul, id("b")));
        expect(toString(*term) == std::string("(a + (2 * b))"));
        auto adj = Term::binop(id("x"), BinOp::Adj, id("y"));
        expect(toString(*adj) == std::string("(x ~ y)"));
    };

    "function call"_test = [] {
        std::vector<TermPtr> args;
        args.push_back(id("frame"));
        args.push_back(Term::coord(Term::number(1.0, Unit::W), Term::number(1.0, Unit::H)));
        auto term = Term::call(id("fit"), std::move(args));
        expect(toString(*term) == std::string("fit(frame, (1w, 1h))"));
    };

    "function definition and block"_test = [] {
        Block body;
        body.statements.push_back(assign("y", Term::binop(id("x"), BinOp::Exp, Term::number(2.0))));
        body.statements.push_back(ret(id("y")));
        auto term = Term::function({"x"}, std::move(body));
        expect(toString(*term) == std::string("function(x) {\n  y = (x ^ 2)\n  return y\n}"));
    };

    "put statements"_test = [] {
        Block block;
        block.statements.push_back(put(id("a")));
        block.statements.push_back(put(id("b"), Term::coord(Term::number(0.0), Term::number(1.0))));
        expect(toString(block) == std::string("{\n  put a\n  put b at (0, 1)\n}"));
        expect(toString(Block{}) == std::string("{}"));
    };
};

suite ast_access_tests = [] {
    "is and as"_test = [] {
        auto term = Term::number(4.0, Unit::H);
        expect(term->is<Num>());
        expect(!term->is<Idents>());
        expect((term->as<Num>() != nullptr) >> fatal);
        expect(term->as<Num>()->value == 4.0_d);
        expect(*term->as<Num>()->unit == Unit::H);
    };
};
