#pragma once

#include <pris/ast.h>
#include <pris/builtins.h>
#include <pris/config.h>
#include <pris/env.h>
#include <pris/frame.h>
#include <pris/resources.h>
#include <pris/result.hpp>
#include <pris/value.h>
#include <vector>

namespace pris {

// Scale factors of the relative units. em is read from font_size at the
// point of use, so it does not appear here.
struct UnitScale {
    double width = 1920.0;   // 1w
    double height = 1080.0;  // 1h
    double pt = 1.0;         // 1pt

    static UnitScale fromConfig(const Config& config);
};

//=============================================================================
// Interpreter - evaluates terms against an environment
//
// Evaluation is a recursive walk; the first error aborts it and is returned
// unchanged.
//=============================================================================
class Interpreter {
public:
    explicit Interpreter(ResourceMap& resources, UnitScale units = {});

    Result<Value> evaluate(const ast::Term& term, const Env::ConstPtr& env);

    // Evaluate statements in a fresh scope under `parent`. Yields the value
    // of the first `return`, else the frame built by `put` statements.
    Result<Value> evaluateBlock(const ast::Block& block, const Env::ConstPtr& parent);

    // A whole document: a block that must produce a frame
    Result<Frame::Ptr> evaluateProgram(const ast::Block& program, const Env::ConstPtr& prelude);

    Result<Value> call(const Value& callee, std::vector<Value> args, const Env& env,
                       std::string_view name = "function");

    const UnitScale& units() const { return _units; }

    // Nested calls deeper than this fail instead of exhausting the stack
    static constexpr int MAX_CALL_DEPTH = 256;

private:
    Result<Value> evalNum(const ast::Num& num, const Env& env);
    Result<Value> evalCoord(const ast::Coord& coord, const Env::ConstPtr& env);
    Result<Value> evalBinTerm(const ast::BinTerm& bin, const Env::ConstPtr& env);
    Result<Value> evalCall(const ast::FnCall& call, const Env::ConstPtr& env);
    Result<Value> applyBinOp(ast::BinOp op, const Value& lhs, const Value& rhs);

    ResourceMap& _resources;
    UnitScale _units;
    int _depth = 0;
};

//=============================================================================
// Prelude - the outermost scope
//=============================================================================

// Parse "#rrggbb" into a color with channels in [0, 1]
Result<Color> parseHexColor(std::string_view text);

// All builtins of `registry` by name, plus color, line_width, font_family,
// font_style, font_size, line_height and text_align from `config`.
Result<Env::Ptr> makePrelude(const Config& config, const BuiltinRegistry& registry);

} // namespace pris
