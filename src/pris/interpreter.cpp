#include <pris/interpreter.h>
#include <pris/pretty.h>

#include <ytrace/ytrace.hpp>

#include <charconv>

namespace pris {

namespace {

Error operandError(ast::BinOp op, const Value& lhs, const Value& rhs) {
    Formatter fmt;
    fmt.print("Cannot apply '");
    fmt.print(ast::binOpToString(op));
    fmt.print("' to a " + lhs.type().toString() + " and a " + rhs.type().toString() + " (");
    fmt.printValue(lhs);
    fmt.print(" and ");
    fmt.printValue(rhs);
    fmt.print(").");
    return Error(Error::Kind::Type, std::move(fmt).intoString());
}

Value frameValue(std::shared_ptr<Frame> frame) {
    return Value(Frame::Ptr(std::move(frame)));
}

// Tracks call nesting for the lifetime of one call
class DepthGuard {
public:
    explicit DepthGuard(int& depth) : _depth(depth) { ++_depth; }
    ~DepthGuard() { --_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& _depth;
};

} // namespace

UnitScale UnitScale::fromConfig(const Config& config) {
    UnitScale units;
    units.width = config.get<double>(Config::KEY_CANVAS_WIDTH, units.width);
    units.height = config.get<double>(Config::KEY_CANVAS_HEIGHT, units.height);
    units.pt = config.get<double>(Config::KEY_UNITS_PT, units.pt);
    return units;
}

Interpreter::Interpreter(ResourceMap& resources, UnitScale units)
    : _resources(resources), _units(units) {}

//=============================================================================
// Terms
//=============================================================================

Result<Value> Interpreter::evaluate(const ast::Term& term, const Env::ConstPtr& env) {
    if (const auto* s = term.as<ast::StringLit>()) {
        return Value(s->value);
    }
    if (const auto* num = term.as<ast::Num>()) {
        return evalNum(*num, *env);
    }
    if (const auto* c = term.as<ast::Color>()) {
        return Value(Color{c->r / 255.0, c->g / 255.0, c->b / 255.0});
    }
    if (const auto* idents = term.as<ast::Idents>()) {
        return env->lookup(*idents);
    }
    if (const auto* coord = term.as<ast::Coord>()) {
        return evalCoord(*coord, env);
    }
    if (const auto* bin = term.as<ast::BinTerm>()) {
        return evalBinTerm(*bin, env);
    }
    if (const auto* fnCall = term.as<ast::FnCall>()) {
        return evalCall(*fnCall, env);
    }
    if (const auto* def = term.as<ast::FnDef>()) {
        return Value(std::make_shared<const Closure>(Closure{def->params, def->body, env}));
    }
    if (const auto* block = term.as<ast::Block>()) {
        return evaluateBlock(*block, env);
    }
    return Err<Value>("Interpreter::evaluate: unknown term");
}

Result<Value> Interpreter::evalNum(const ast::Num& num, const Env& env) {
    if (!num.unit) return Value::number(num.value);

    switch (*num.unit) {
        case ast::Unit::W: return Value::length(num.value * _units.width);
        case ast::Unit::H: return Value::length(num.value * _units.height);
        case ast::Unit::Pt: return Value::length(num.value * _units.pt);
        case ast::Unit::Em: {
            auto fontSize = env.lookupLen(ast::Idents{{"font_size"}});
            if (!fontSize) return std::unexpected(fontSize.error());
            return Value::length(num.value * *fontSize);
        }
    }
    return Err<Value>("Interpreter::evalNum: unknown unit");
}

Result<Value> Interpreter::evalCoord(const ast::Coord& coord, const Env::ConstPtr& env) {
    auto x = evaluate(*coord.x, env);
    if (!x) return x;
    auto y = evaluate(*coord.y, env);
    if (!y) return y;

    const Num* nx = x->as<Num>();
    if (!nx) {
        return std::unexpected(Error::type("the x component of a coordinate", "number or length",
                                           x->type().toString()));
    }
    const Num* ny = y->as<Num>();
    if (!ny || ny->dim != nx->dim) {
        return std::unexpected(Error::type("the y component of a coordinate",
                                           ValType::num(nx->dim).toString(),
                                           y->type().toString()));
    }
    return Value(Coord{nx->value, ny->value, nx->dim});
}

Result<Value> Interpreter::evalBinTerm(const ast::BinTerm& bin, const Env::ConstPtr& env) {
    auto lhs = evaluate(*bin.lhs, env);
    if (!lhs) return lhs;
    auto rhs = evaluate(*bin.rhs, env);
    if (!rhs) return rhs;
    return applyBinOp(bin.op, *lhs, *rhs);
}

Result<Value> Interpreter::applyBinOp(ast::BinOp op, const Value& lhs, const Value& rhs) {
    using ast::BinOp;

    // number op number
    if (const Num* a = lhs.as<Num>()) {
        if (const Num* b = rhs.as<Num>()) {
            Result<Num> result = Num{};
            switch (op) {
                case BinOp::Add: result = a->plus(*b); break;
                case BinOp::Sub: result = a->minus(*b); break;
                case BinOp::Mul: result = a->times(*b); break;
                case BinOp::Div: result = a->dividedBy(*b); break;
                case BinOp::Exp: result = a->power(*b); break;
                case BinOp::Adj: return std::unexpected(operandError(op, lhs, rhs));
            }
            if (!result) return std::unexpected(result.error());
            return Value(*result);
        }
        // number * coord
        if (const Coord* c = rhs.as<Coord>(); c && op == BinOp::Mul) {
            return Value(Coord{c->x * a->value, c->y * a->value, c->dim + a->dim});
        }
        return std::unexpected(operandError(op, lhs, rhs));
    }

    if (const Coord* a = lhs.as<Coord>()) {
        if (const Coord* b = rhs.as<Coord>(); b && (op == BinOp::Add || op == BinOp::Sub)) {
            if (a->dim != b->dim) {
                return std::unexpected(Error::type(
                    std::string("the right operand of '") + ast::binOpToString(op) + "'",
                    lhs.type().toString(), rhs.type().toString()));
            }
            double sign = op == BinOp::Add ? 1.0 : -1.0;
            return Value(Coord{a->x + sign * b->x, a->y + sign * b->y, a->dim});
        }
        if (const Num* n = rhs.as<Num>()) {
            if (op == BinOp::Mul) {
                return Value(Coord{a->x * n->value, a->y * n->value, a->dim + n->dim});
            }
            if (op == BinOp::Div) {
                if (n->value == 0.0) {
                    return std::unexpected(Error::value("Division by zero."));
                }
                return Value(Coord{a->x / n->value, a->y / n->value, a->dim - n->dim});
            }
        }
        return std::unexpected(operandError(op, lhs, rhs));
    }

    if (const auto* a = lhs.as<std::string>()) {
        if (const auto* b = rhs.as<std::string>(); b && op == BinOp::Add) {
            return Value(*a + *b);
        }
        return std::unexpected(operandError(op, lhs, rhs));
    }

    if (const auto* a = lhs.as<Frame::Ptr>()) {
        if (const auto* b = rhs.as<Frame::Ptr>(); b && op == BinOp::Adj) {
            // Continue the left frame at its anchor
            const Frame& left = **a;
            const Frame& right = **b;
            auto frame = std::make_shared<Frame>();
            frame->placeFrame(Vec2::zero(), left);
            frame->placeFrame(left.anchor(), right);
            frame->setAnchor(left.anchor() + right.anchor());
            return frameValue(std::move(frame));
        }
    }

    return std::unexpected(operandError(op, lhs, rhs));
}

//=============================================================================
// Calls
//=============================================================================

Result<Value> Interpreter::evalCall(const ast::FnCall& fnCall, const Env::ConstPtr& env) {
    auto callee = evaluate(*fnCall.callee, env);
    if (!callee) return callee;

    std::vector<Value> args;
    args.reserve(fnCall.args.size());
    for (const auto& arg : fnCall.args) {
        auto value = evaluate(*arg, env);
        if (!value) return value;
        args.push_back(std::move(*value));
    }

    // Errors name the callee as written
    Formatter name;
    name.printTerm(*fnCall.callee);
    return call(*callee, std::move(args), *env, name.str());
}

Result<Value> Interpreter::call(const Value& callee, std::vector<Value> args, const Env& env,
                                std::string_view name) {
    if (_depth >= MAX_CALL_DEPTH) {
        return std::unexpected(Error::other(
            "Maximum call depth of " + std::to_string(MAX_CALL_DEPTH) + " exceeded in '" +
            std::string(name) + "'."));
    }
    DepthGuard guard(_depth);

    if (const auto* builtin = callee.as<std::shared_ptr<const Builtin>>()) {
        ytrace("Interpreter::call: builtin {} with {} argument(s)", (*builtin)->name, args.size());
        return (*builtin)->fn(_resources, env, std::move(args));
    }

    if (const auto* closure = callee.as<std::shared_ptr<const Closure>>()) {
        const Closure& fn = **closure;
        if (args.size() != fn.params.size()) {
            return std::unexpected(Error::arity(name, static_cast<uint32_t>(fn.params.size()),
                                                static_cast<uint32_t>(args.size())));
        }

        auto defining = fn.scope();
        if (!defining) {
            return std::unexpected(Error::other(
                "The scope that defined '" + std::string(name) + "' no longer exists."));
        }
        auto scope = Env::create(std::move(defining));
        for (size_t i = 0; i < args.size(); i++) {
            if (auto res = scope->bind(fn.params[i], std::move(args[i])); !res) {
                return std::unexpected(res.error());
            }
        }
        return evaluateBlock(*fn.body, scope);
    }

    return std::unexpected(Error::type("'" + std::string(name) + "'", "function",
                                       callee.type().toString()));
}

//=============================================================================
// Blocks
//=============================================================================

Result<Value> Interpreter::evaluateBlock(const ast::Block& block, const Env::ConstPtr& parent) {
    auto scope = Env::create(parent);
    auto frame = std::make_shared<Frame>(scope);

    for (const auto& stmt : block.statements) {
        if (const auto* assign = std::get_if<ast::Assign>(&stmt)) {
            auto value = evaluate(*assign->value, scope);
            if (!value) return value;
            if (auto res = scope->bind(assign->name, std::move(*value)); !res) {
                return std::unexpected(res.error());
            }

        } else if (const auto* ret = std::get_if<ast::Return>(&stmt)) {
            return evaluate(*ret->value, scope);

        } else if (const auto* put = std::get_if<ast::Put>(&stmt)) {
            auto placed = evaluate(*put->frame, scope);
            if (!placed) return placed;
            const auto* placedFrame = placed->as<Frame::Ptr>();
            if (!placedFrame) {
                return std::unexpected(Error::type("the argument of 'put'", "frame",
                                                   placed->type().toString()));
            }

            Vec2 offset = Vec2::zero();
            if (put->at) {
                auto at = evaluate(*put->at, scope);
                if (!at) return at;
                const auto* coord = at->as<Coord>();
                if (!coord || coord->dim != 1) {
                    return std::unexpected(Error::type("the location of 'put'",
                                                       ValType::coord(1).toString(),
                                                       at->type().toString()));
                }
                offset = coord->toVec2();
            }

            frame->placeFrame(offset, **placedFrame);
            frame->setAnchor(offset + (*placedFrame)->anchor());
        }
    }

    return frameValue(std::move(frame));
}

Result<Frame::Ptr> Interpreter::evaluateProgram(const ast::Block& program,
                                                const Env::ConstPtr& prelude) {
    auto value = evaluateBlock(program, prelude);
    if (!value) return std::unexpected(value.error());

    const auto* frame = value->as<Frame::Ptr>();
    if (!frame) {
        return std::unexpected(Error::type("the document", "frame", value->type().toString()));
    }
    ydebug("Interpreter: document has {} element(s), {}x{}", (*frame)->elements().size(),
           (*frame)->boundingBox().width(), (*frame)->boundingBox().height());
    return *frame;
}

//=============================================================================
// Prelude
//=============================================================================

Result<Color> parseHexColor(std::string_view text) {
    if (text.size() != 7 || text[0] != '#') {
        return Err<Color>("Expected a color of the form #rrggbb, found '" + std::string(text) + "'");
    }
    double channels[3];
    for (int i = 0; i < 3; i++) {
        const char* begin = text.data() + 1 + 2 * i;
        unsigned value = 0;
        auto [end, ec] = std::from_chars(begin, begin + 2, value, 16);
        if (ec != std::errc() || end != begin + 2) {
            return Err<Color>("Expected a color of the form #rrggbb, found '" + std::string(text) + "'");
        }
        channels[i] = value / 255.0;
    }
    return Color{channels[0], channels[1], channels[2]};
}

Result<Env::Ptr> makePrelude(const Config& config, const BuiltinRegistry& registry) {
    auto env = Env::create();

    for (const auto& [name, builtin] : registry.builtins()) {
        if (auto res = env->bind(name, Value(builtin)); !res) {
            return Err<Env::Ptr>("makePrelude", res);
        }
    }

    auto color = parseHexColor(config.get<std::string>(Config::KEY_STYLE_COLOR, "#000000"));
    if (!color) return Err<Env::Ptr>("Invalid style/color", color);

    struct Length {
        const char* name;
        const char* key;
    };
    const Length lengths[] = {
        {"line_width", Config::KEY_STYLE_LINE_WIDTH},
        {"font_size", Config::KEY_FONT_SIZE},
        {"line_height", Config::KEY_FONT_LINE_HEIGHT},
    };
    struct Str {
        const char* name;
        const char* key;
    };
    const Str strings[] = {
        {"font_family", Config::KEY_FONT_FAMILY},
        {"font_style", Config::KEY_FONT_STYLE},
        {"text_align", Config::KEY_FONT_TEXT_ALIGN},
    };

    std::vector<std::pair<std::string, Value>> bindings;
    bindings.emplace_back("color", Value(*color));
    for (const auto& l : lengths) {
        auto value = config.get<double>(l.key);
        if (!value) return Err<Env::Ptr>(std::string("Config: ") + l.key + " must be a number");
        bindings.emplace_back(l.name, Value::length(*value));
    }
    for (const auto& s : strings) {
        auto value = config.get<std::string>(s.key);
        if (!value) return Err<Env::Ptr>(std::string("Config: ") + s.key + " must be a string");
        bindings.emplace_back(s.name, Value(*value));
    }

    for (auto& [name, value] : bindings) {
        if (auto res = env->bind(name, std::move(value)); !res) {
            return Err<Env::Ptr>("makePrelude", res);
        }
    }
    return Ok(std::move(env));
}

} // namespace pris
