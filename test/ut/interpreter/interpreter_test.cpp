//=============================================================================
// Interpreter Tests
//
// Terms are built with the ast construction helpers; builtins run against
// fake resources.
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>

#include <boost/ut.hpp>
#include "harness/fake_resources.h"
#include <pris/interpreter.h>

using namespace boost::ut;
using namespace pris;
using ast::BinOp;
using ast::Term;
using ast::Unit;

namespace {

ast::TermPtr id(std::vector<std::string> parts) {
    return Term::idents(std::move(parts));
}

ast::TermPtr len(double x, Unit unit = Unit::Pt) {
    return Term::number(x, unit);
}

ast::TermPtr call1(const char* fn, ast::TermPtr arg) {
    std::vector<ast::TermPtr> args;
    args.push_back(std::move(arg));
    return Term::call(id({fn}), std::move(args));
}

ast::TermPtr rect(double w, double h) {
    return call1("fill_rectangle", Term::coord(len(w), len(h)));
}

// Interpreter with the standard prelude from default config
struct Fixture {
    test::FakeResources resources;
    Config::Ptr config;
    Env::Ptr prelude;
    Interpreter interpreter;

    Fixture()
        : config(*Config::create()),
          prelude(*makePrelude(*config, BuiltinRegistry::standard())),
          interpreter(resources.map, UnitScale{}) {}

    Result<Value> eval(const ast::Term& term) { return interpreter.evaluate(term, prelude); }
};

} // namespace

suite literal_tests = [] {
    "units scale to canvas"_test = [] {
        Fixture f;
        auto w = f.eval(*Term::number(0.5, Unit::W));
        expect(w.has_value() >> fatal);
        expect(*w->as<Num>() == Num{960.0, 1});
        auto h = f.eval(*Term::number(1.0, Unit::H));
        expect(*h->as<Num>() == Num{1080.0, 1});
        auto pt = f.eval(*Term::number(3.0, Unit::Pt));
        expect(*pt->as<Num>() == Num{3.0, 1});
        auto plain = f.eval(*Term::number(3.0));
        expect(*plain->as<Num>() == Num{3.0, 0});
    };

    "em reads the font size in scope"_test = [] {
        Fixture f;
        auto em = f.eval(*Term::number(2.0, Unit::Em));
        expect(em.has_value() >> fatal);
        expect(*em->as<Num>() == Num{128.0, 1});
    };

    "em without a font size"_test = [] {
        test::FakeResources resources;
        Interpreter interpreter(resources.map);
        auto em = interpreter.evaluate(*Term::number(1.0, Unit::Em), Env::create());
        expect(!em.has_value() >> fatal);
        expect(em.error().kind() == Error::Kind::UnresolvedName);
    };

    "configured canvas size"_test = [] {
        YAML::Node overrides;
        overrides["canvas"]["width"] = 1000;
        overrides["units"]["pt"] = 2.0;
        auto config = Config::create("", overrides);
        expect(config.has_value() >> fatal);
        auto units = UnitScale::fromConfig(**config);
        expect(units.width == 1000.0_d);
        expect(units.height == 1080.0_d);
        expect(units.pt == 2.0_d);
    };

    "colors are normalized"_test = [] {
        Fixture f;
        auto c = f.eval(*Term::color(255, 0, 51));
        expect(c.has_value() >> fatal);
        expect(*c->as<Color>() == Color{1.0, 0.0, 0.2});
    };

    "strings"_test = [] {
        Fixture f;
        auto s = f.eval(*Term::string("hello"));
        expect(*s->as<std::string>() == std::string("hello"));
    };

    "coordinates need matching components"_test = [] {
        Fixture f;
        auto ok = f.eval(*Term::coord(len(1.0), len(2.0)));
        expect(ok.has_value() >> fatal);
        expect(*ok->as<Coord>() == Coord{1.0, 2.0, 1});

        auto mixed = f.eval(*Term::coord(len(1.0), Term::number(2.0)));
        expect(!mixed.has_value() >> fatal);
        expect(mixed.error().kind() == Error::Kind::Type);

        auto str = f.eval(*Term::coord(Term::string("x"), Term::number(2.0)));
        expect(!str.has_value());
    };
};

suite binop_tests = [] {
    "arithmetic on lengths"_test = [] {
        Fixture f;
        auto sum = f.eval(*Term::binop(len(2.0), BinOp::Add, len(3.0)));
        expect(*sum->as<Num>() == Num{5.0, 1});
        auto area = f.eval(*Term::binop(len(2.0), BinOp::Mul, len(3.0)));
        expect(*area->as<Num>() == Num{6.0, 2});
        auto ratio = f.eval(*Term::binop(len(6.0), BinOp::Div, len(3.0)));
        expect(*ratio->as<Num>() == Num{2.0, 0});
        auto sq = f.eval(*Term::binop(len(3.0), BinOp::Exp, Term::number(2.0)));
        expect(*sq->as<Num>() == Num{9.0, 2});
    };

    "mismatched addition"_test = [] {
        Fixture f;
        auto res = f.eval(*Term::binop(len(2.0), BinOp::Add, Term::number(3.0)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };

    "division by zero"_test = [] {
        Fixture f;
        auto res = f.eval(*Term::binop(Term::number(1.0), BinOp::Div, Term::number(0.0)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Value);

        auto coord = f.eval(*Term::binop(Term::coord(len(1.0), len(1.0)), BinOp::Div,
                                         Term::number(0.0)));
        expect(!coord.has_value() >> fatal);
        expect(coord.error().kind() == Error::Kind::Value);
    };

    "coordinate arithmetic"_test = [] {
        Fixture f;
        auto sum = f.eval(*Term::binop(Term::coord(len(1.0), len(2.0)), BinOp::Add,
                                       Term::coord(len(3.0), len(4.0))));
        expect(*sum->as<Coord>() == Coord{4.0, 6.0, 1});
        auto diff = f.eval(*Term::binop(Term::coord(len(1.0), len(2.0)), BinOp::Sub,
                                        Term::coord(len(3.0), len(4.0))));
        expect(*diff->as<Coord>() == Coord{-2.0, -2.0, 1});
        auto scaled = f.eval(*Term::binop(Term::number(2.0), BinOp::Mul,
                                          Term::coord(len(1.0), len(2.0))));
        expect(*scaled->as<Coord>() == Coord{2.0, 4.0, 1});
        auto halved = f.eval(*Term::binop(Term::coord(len(1.0), len(2.0)), BinOp::Div,
                                          Term::number(2.0)));
        expect(*halved->as<Coord>() == Coord{0.5, 1.0, 1});
        auto lifted = f.eval(*Term::binop(Term::coord(Term::number(1.0), Term::number(2.0)),
                                          BinOp::Mul, len(3.0)));
        expect(*lifted->as<Coord>() == Coord{3.0, 6.0, 1});
    };

    "string concatenation"_test = [] {
        Fixture f;
        auto s = f.eval(*Term::binop(Term::string("ab"), BinOp::Add, Term::string("cd")));
        expect(*s->as<std::string>() == std::string("abcd"));
    };

    "unsupported operands"_test = [] {
        Fixture f;
        auto res = f.eval(*Term::binop(Term::string("a"), BinOp::Mul, Term::number(2.0)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
        expect(res.error().message() == std::string("Cannot apply '*' to a string and a number (\"a\" and 2)."));
    };

    "adjoining frames"_test = [] {
        Fixture f;
        auto res = f.eval(*Term::binop(rect(10.0, 5.0), BinOp::Adj, rect(3.0, 8.0)));
        expect(res.has_value() >> fatal);
        const Frame& frame = **res->as<Frame::Ptr>();
        expect((frame.elements().size() == 2_u) >> fatal);
        expect(frame.elements()[1].offset == Vec2{10.0, 5.0});
        expect(frame.anchor() == Vec2{13.0, 13.0});
        expect(frame.boundingBox() == BoundingBox::fromCorners(Vec2::zero(), Vec2{13.0, 13.0}));
    };
};

suite call_tests = [] {
    "builtin call"_test = [] {
        Fixture f;
        auto res = f.eval(*call1("str", Term::number(2.5)));
        expect(res.has_value() >> fatal);
        expect(*res->as<std::string>() == std::string("2.5"));
    };

    "builtins read styling from the calling scope"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::assign("line_width", len(7.0)));
        body.statements.push_back(ast::ret(call1("line", Term::coord(len(1.0), len(0.0)))));
        auto res = f.eval(*Term::block(std::move(body)));
        expect(res.has_value() >> fatal);
        const Frame& frame = **res->as<Frame::Ptr>();
        const auto& stroke = std::get<StrokePolygon>(frame.elements().at(0).element);
        expect(stroke.lineWidth == 7.0_d);
    };

    "closure call"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(Term::binop(id({"x"}), BinOp::Mul, Term::number(2.0))));

        ast::Block program;
        program.statements.push_back(ast::assign("double", Term::function({"x"}, std::move(body))));
        program.statements.push_back(ast::ret(call1("double", len(4.0))));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{8.0, 1});
    };

    "closures capture their defining scope"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(id({"k"})));

        ast::Block program;
        program.statements.push_back(ast::assign("k", Term::number(3.0)));
        program.statements.push_back(ast::assign("get", Term::function({}, std::move(body))));
        program.statements.push_back(ast::ret(Term::call(id({"get"}), {})));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{3.0, 0});
    };

    "returned closures keep their scope"_test = [] {
        Fixture f;
        ast::Block getBody;
        getBody.statements.push_back(ast::ret(id({"k"})));

        ast::Block makeBody;
        makeBody.statements.push_back(ast::assign("k", Term::number(5.0)));
        makeBody.statements.push_back(ast::assign("get", Term::function({}, std::move(getBody))));
        makeBody.statements.push_back(ast::ret(id({"get"})));

        ast::Block program;
        program.statements.push_back(ast::assign("make", Term::function({}, std::move(makeBody))));
        program.statements.push_back(ast::ret(Term::call(Term::call(id({"make"}), {}), {})));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{5.0, 0});
    };

    "function definitions do not keep their block alive"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(Term::number(1.0)));

        ast::Block block;
        block.statements.push_back(ast::assign("one", Term::function({}, std::move(body))));
        block.statements.push_back(ast::put(rect(1.0, 1.0)));

        auto res = f.eval(*Term::block(std::move(block)));
        expect(res.has_value() >> fatal);
        std::weak_ptr<const Env> scope = (*res->as<Frame::Ptr>())->env();
        expect(!scope.expired());
        res = Value::number(0.0);
        expect(scope.expired());
    };

    "closure arity"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(id({"a"})));

        ast::Block program;
        program.statements.push_back(ast::assign("f", Term::function({"a", "b"}, std::move(body))));
        program.statements.push_back(ast::ret(call1("f", Term::number(1.0))));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Arity);
        expect(res.error().message() == std::string("'f' takes 2 arguments, but 1 was given."));
    };

    "calling a non-function"_test = [] {
        Fixture f;
        auto res = f.eval(*call1("font_size", Term::number(1.0)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };

    "errors name the callee as written"_test = [] {
        Fixture f;
        std::vector<ast::TermPtr> args;
        args.push_back(Term::number(2.0));
        auto res = f.eval(*Term::call(call1("str", Term::number(1.0)), std::move(args)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
        expect(res.error().message() ==
               std::string("Expected 'str(1)' to be a function, but found a string."));
    };

    "runaway recursion is stopped"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(Term::call(id({"loop"}), {})));

        ast::Block program;
        program.statements.push_back(ast::assign("loop", Term::function({}, std::move(body))));
        program.statements.push_back(ast::ret(Term::call(id({"loop"}), {})));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(!res.has_value() >> fatal);
        expect(res.error().message().find("Maximum call depth") != std::string::npos);
    };
};

suite block_tests = [] {
    "put places frames and moves the anchor"_test = [] {
        Fixture f;
        ast::Block block;
        block.statements.push_back(ast::put(rect(10.0, 5.0)));
        block.statements.push_back(ast::put(rect(2.0, 2.0), Term::coord(len(20.0), len(0.0))));

        auto res = f.eval(*Term::block(std::move(block)));
        expect(res.has_value() >> fatal);
        const Frame& frame = **res->as<Frame::Ptr>();
        expect((frame.elements().size() == 2_u) >> fatal);
        expect(frame.elements()[1].offset == Vec2{20.0, 0.0});
        expect(frame.anchor() == Vec2{22.0, 2.0});
        expect(frame.boundingBox() == BoundingBox::sized(22.0, 5.0));
    };

    "put requires a frame"_test = [] {
        Fixture f;
        ast::Block block;
        block.statements.push_back(ast::put(Term::number(1.0)));
        auto res = f.eval(*Term::block(std::move(block)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };

    "put at requires a length coordinate"_test = [] {
        Fixture f;
        ast::Block block;
        block.statements.push_back(ast::put(rect(1.0, 1.0),
                                            Term::coord(Term::number(0.0), Term::number(1.0))));
        auto res = f.eval(*Term::block(std::move(block)));
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };

    "return ends the block"_test = [] {
        Fixture f;
        ast::Block block;
        block.statements.push_back(ast::ret(Term::number(1.0)));
        block.statements.push_back(ast::put(id({"undefined_name"})));
        auto res = f.eval(*Term::block(std::move(block)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{1.0, 0});
    };

    "rebinding in a block fails"_test = [] {
        Fixture f;
        ast::Block block;
        block.statements.push_back(ast::assign("x", Term::number(1.0)));
        block.statements.push_back(ast::assign("x", Term::number(2.0)));
        auto res = f.eval(*Term::block(std::move(block)));
        expect(!res.has_value());
    };

    "block members are reachable through the frame"_test = [] {
        Fixture f;
        ast::Block inner;
        inner.statements.push_back(ast::assign("width", len(42.0)));
        inner.statements.push_back(ast::put(rect(1.0, 1.0)));

        ast::Block program;
        program.statements.push_back(ast::assign("title", Term::block(std::move(inner))));
        program.statements.push_back(ast::ret(id({"title", "width"})));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{42.0, 1});
    };

    "block member functions can be called"_test = [] {
        Fixture f;
        ast::Block body;
        body.statements.push_back(ast::ret(Term::number(7.0)));

        ast::Block inner;
        inner.statements.push_back(ast::assign("seven", Term::function({}, std::move(body))));
        inner.statements.push_back(ast::put(rect(1.0, 1.0)));

        ast::Block program;
        program.statements.push_back(ast::assign("title", Term::block(std::move(inner))));
        program.statements.push_back(ast::ret(Term::call(id({"title", "seven"}), {})));

        auto res = f.eval(*Term::block(std::move(program)));
        expect(res.has_value() >> fatal);
        expect(*res->as<Num>() == Num{7.0, 0});
    };
};

suite program_tests = [] {
    "document must be a frame"_test = [] {
        Fixture f;
        ast::Block program;
        program.statements.push_back(ast::ret(Term::number(1.0)));
        auto res = f.interpreter.evaluateProgram(program, f.prelude);
        expect(!res.has_value() >> fatal);
        expect(res.error().kind() == Error::Kind::Type);
    };

    "text document"_test = [] {
        Fixture f;
        ast::Block program;
        program.statements.push_back(ast::put(call1("t", Term::string("Hi")),
                                              Term::coord(len(0.5, Unit::W), len(0.5, Unit::H))));
        auto res = f.interpreter.evaluateProgram(program, f.prelude);
        expect(res.has_value() >> fatal);
        const Frame& frame = **res;
        expect((frame.elements().size() == 1_u) >> fatal);
        expect(frame.elements()[0].offset == Vec2{960.0, 540.0});
        const auto& text = std::get<Text>(frame.elements()[0].element);
        expect(text.glyphs.size() == 2_u);
        expect(text.fontSize == 64.0_d);
    };
};

suite prelude_tests = [] {
    "hex colors"_test = [] {
        auto red = parseHexColor("#ff0000");
        expect(red.has_value() >> fatal);
        expect(*red == Color{1.0, 0.0, 0.0});
        expect(!parseHexColor("ff0000").has_value());
        expect(!parseHexColor("#ff00").has_value());
        expect(!parseHexColor("#gg0000").has_value());
    };

    "prelude binds builtins and styling"_test = [] {
        auto config = Config::create();
        expect(config.has_value() >> fatal);
        auto prelude = makePrelude(**config, BuiltinRegistry::standard());
        expect(prelude.has_value() >> fatal);
        const Env& env = **prelude;

        for (const char* name : {"fit", "line", "fill_rectangle", "str", "t", "glyph", "image"}) {
            expect(env.findLocal(name) != nullptr) << name;
        }
        expect(*env.lookupLen(ast::Idents{{"font_size"}}) == 64.0_d);
        expect(*env.lookupLen(ast::Idents{{"line_height"}}) == 80.0_d);
        expect(*env.lookupLen(ast::Idents{{"line_width"}}) == 4.0_d);
        expect(*env.lookupStr(ast::Idents{{"font_family"}}) == std::string("Cantarell"));
        expect(*env.lookupStr(ast::Idents{{"text_align"}}) == std::string("left"));
        expect(*env.lookupColor(ast::Idents{{"color"}}) == Color{});
    };

    "invalid configured color"_test = [] {
        YAML::Node overrides;
        overrides["style"]["color"] = "blue";
        auto config = Config::create("", overrides);
        expect(config.has_value() >> fatal);
        auto prelude = makePrelude(**config, BuiltinRegistry::standard());
        expect(!prelude.has_value());
    };
};
