//=============================================================================
// Value and Env Tests
//
// Unit exponent algebra, scope chains and typed lookups.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include <pris/env.h>
#include <pris/pretty.h>
#include <pris/value.h>

using namespace boost::ut;
using namespace pris;

namespace {

ast::Idents path(std::vector<std::string> parts) {
    return ast::Idents{std::move(parts)};
}

} // namespace

suite value_type_tests = [] {
    "type names"_test = [] {
        expect(ValType::num(0).toString() == std::string("number"));
        expect(ValType::num(1).toString() == std::string("length"));
        expect(ValType::num(2).toString() == std::string("length^2"));
        expect(ValType::coord(1).toString() == std::string("coordinate of lengths"));
        expect(ValType::frame().toString() == std::string("frame"));
    };

    "value reports its type"_test = [] {
        expect(Value::number(1.0).type() == ValType::num(0));
        expect(Value::length(1.0).type() == ValType::num(1));
        expect(Value::coord(1.0, 2.0).type() == ValType::coord(1));
        expect(Value(std::string("x")).type() == ValType::str());
        expect(Value(Color{}).type() == ValType::color());
        expect(Value(Frame::Ptr(std::make_shared<Frame>())).type() == ValType::frame());
    };
};

suite num_algebra_tests = [] {
    "addition needs equal exponents"_test = [] {
        auto sum = Num{2.0, 1}.plus(Num{3.0, 1});
        expect(sum.has_value() >> fatal);
        expect(*sum == Num{5.0, 1});

        auto bad = Num{2.0, 1}.plus(Num{3.0, 0});
        expect(!bad.has_value() >> fatal);
        expect(bad.error().kind() == Error::Kind::Type);

        expect(!Num{2.0, 0}.minus(Num{3.0, 1}).has_value());
    };

    "multiplication and division combine exponents"_test = [] {
        expect(Num{2.0, 1}.times(Num{3.0, 1}) == Num{6.0, 2});
        auto ratio = Num{6.0, 1}.dividedBy(Num{3.0, 1});
        expect(ratio.has_value() >> fatal);
        expect(*ratio == Num{2.0, 0});
        auto inverse = Num{1.0, 0}.dividedBy(Num{4.0, 1});
        expect(inverse.has_value() >> fatal);
        expect(*inverse == Num{0.25, -1});
    };

    "division by zero"_test = [] {
        auto res = Num{1.0, 0}.dividedBy(Num{0.0, 0});
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Value);
    };

    "integer power multiplies the exponent"_test = [] {
        auto sq = Num{3.0, 1}.power(Num{2.0, 0});
        expect(sq.has_value() >> fatal);
        expect(*sq == Num{9.0, 2});
    };

    "fractional power of a length is rejected"_test = [] {
        auto res = Num{4.0, 1}.power(Num{0.5, 0});
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Value);
    };

    "fractional power of a number is fine"_test = [] {
        auto res = Num{4.0, 0}.power(Num{0.5, 0});
        expect(res.has_value() >> fatal);
        expect(*res == Num{2.0, 0});
    };

    "dimensioned exponent is rejected"_test = [] {
        auto res = Num{2.0, 0}.power(Num{2.0, 1});
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };
};

suite env_tests = [] {
    "lookup walks outward"_test = [] {
        auto outer = Env::create();
        expect(outer->bind("a", Value::number(1.0)).has_value());
        auto inner = Env::create(outer);
        expect(inner->bind("b", Value::number(2.0)).has_value());

        auto a = inner->lookupNum(path({"a"}));
        expect(a.has_value() >> fatal);
        expect(*a == 1.0_d);
        expect(inner->findLocal("a") == nullptr);
        expect(outer->find("b") == nullptr);
    };

    "child scope shadows parent"_test = [] {
        auto outer = Env::create();
        expect(outer->bind("x", Value::number(1.0)).has_value());
        auto inner = Env::create(outer);
        expect(inner->bind("x", Value::number(2.0)).has_value());
        expect(*inner->lookupNum(path({"x"})) == 2.0_d);
        expect(*outer->lookupNum(path({"x"})) == 1.0_d);
    };

    "rebinding in the same scope fails"_test = [] {
        auto env = Env::create();
        expect(env->bind("x", Value::number(1.0)).has_value());
        auto res = env->bind("x", Value::number(2.0));
        expect(!res.has_value() >> fatal);
        expect(*env->lookupNum(path({"x"})) == 1.0_d);
    };

    "unresolved name"_test = [] {
        auto env = Env::create();
        auto res = env->lookup(path({"missing"}));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::UnresolvedName);
    };

    "typed lookups report the found type"_test = [] {
        auto env = Env::create();
        expect(env->bind("color", Value(std::string("red"))).has_value());
        expect(env->bind("size", Value::number(3.0)).has_value());

        auto color = env->lookupColor(path({"color"}));
        expect(!color.has_value() >> fatal);
        expect(color.error().kind() == Error::Kind::Type);
        expect(color.error().message() ==
               std::string("Expected 'color' to be a color, but found a string."));

        auto len = env->lookupLen(path({"size"}));
        expect(!len.has_value() >> fatal);
        expect(len.error().kind() == Error::Kind::Type);

        auto str = env->lookupStr(path({"nope"}));
        expect(!str.has_value() >> fatal);
        expect(str.error().kind() == Error::Kind::UnresolvedName);
    };

    "dotted lookup reads frame members"_test = [] {
        auto members = Env::create();
        expect(members->bind("width", Value::length(12.0)).has_value());
        auto frame = std::make_shared<Frame>(members);

        auto env = Env::create();
        expect(env->bind("title", Value(Frame::Ptr(frame))).has_value());
        expect(env->bind("n", Value::number(1.0)).has_value());

        auto width = env->lookupLen(path({"title", "width"}));
        expect(width.has_value() >> fatal);
        expect(*width == 12.0_d);

        auto missing = env->lookup(path({"title", "height"}));
        expect(!missing.has_value() >> fatal);
        expect(missing.error().kind() == Error::Kind::UnresolvedName);

        auto notFrame = env->lookup(path({"n", "x"}));
        expect(!notFrame.has_value() >> fatal);
        expect(notFrame.error().kind() == Error::Kind::Type);
    };

    "local names are sorted"_test = [] {
        auto env = Env::create();
        expect(env->bind("zeta", Value::number(1.0)).has_value());
        expect(env->bind("alpha", Value::number(2.0)).has_value());
        auto child = Env::create(env);
        expect(child->localNames().empty());
        auto names = env->localNames();
        expect((names.size() == 2_u) >> fatal);
        expect(names[0] == std::string("alpha"));
        expect(names[1] == std::string("zeta"));
    };

    "closure bound in its own scope does not keep it alive"_test = [] {
        auto env = Env::create();
        auto fn = std::make_shared<const Closure>(Closure{{"x"}, nullptr, env});
        expect(env->bind("f", Value(std::move(fn))).has_value());

        auto found = env->lookup(path({"f"}));
        expect(found.has_value() >> fatal);
        const auto* closure = found->as<std::shared_ptr<const Closure>>();
        expect((closure != nullptr) >> fatal);
        expect((*closure)->env == env);
        found = Value::number(0.0);

        std::weak_ptr<const Env> weak = env;
        env.reset();
        expect(weak.expired());
    };

    "closure from another scope stays strong"_test = [] {
        auto outer = Env::create();
        auto other = Env::create();
        expect(other->bind("f", Value(std::make_shared<const Closure>(
                                    Closure{{}, nullptr, outer}))).has_value());
        std::weak_ptr<const Env> weak = outer;
        outer.reset();
        expect(!weak.expired());
    };

    "members do not see the enclosing scope"_test = [] {
        auto outer = Env::create();
        expect(outer->bind("shared", Value::number(1.0)).has_value());
        auto members = Env::create(outer);
        auto env = Env::create(outer);
        expect(env->bind("f", Value(Frame::Ptr(std::make_shared<Frame>(members)))).has_value());

        auto res = env->lookup(path({"f", "shared"}));
        expect(!res.has_value());
    };
};

suite formatter_tests = [] {
    "values print readably"_test = [] {
        Formatter fmt;
        fmt.printValue(Value::number(2.5));
        fmt.print(" ");
        fmt.printValue(Value::length(3.0));
        fmt.print(" ");
        fmt.printValue(Value(Color{1.0, 0.0, 0.5}));
        fmt.print(" ");
        fmt.printValue(Value(std::string("hi")));
        expect(fmt.str() == std::string("2.5 3 (length) #ff0080 \"hi\""));
    };

    "terms and paths"_test = [] {
        Formatter fmt;
        fmt.printIdents(ast::Idents{{"title", "width"}});
        fmt.print(" = ");
        fmt.printTerm(*ast::Term::number(0.5, ast::Unit::W));
        expect(fmt.str() == std::string("title.width = 0.5w"));
    };

    "into string moves the text out"_test = [] {
        Formatter fmt;
        fmt.print("'");
        fmt.print("middle");
        fmt.print("' is not valid.");
        expect(std::move(fmt).intoString() == std::string("'middle' is not valid."));
    };
};
