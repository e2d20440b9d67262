#pragma once

#include <pris/env.h>
#include <pris/resources.h>
#include <pris/result.hpp>
#include <pris/value.h>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pris {

// Check argument count, then the type of each argument left to right.
// Builtins call this before destructuring their arguments.
Result<void> validateArgs(std::string_view fn,
                          const std::vector<ValType>& expected,
                          const std::vector<Value>& actual);

// Split on '\n'. A trailing newline yields a final empty line.
std::vector<std::string_view> splitLines(std::string_view text);

//=============================================================================
// BuiltinRegistry - name to native function
//=============================================================================
class BuiltinRegistry {
public:
    using Map = std::map<std::string, std::shared_ptr<const Builtin>, std::less<>>;

    // fit, line, fill_rectangle, str, t, glyph, image
    static BuiltinRegistry standard();

    // Replaces an existing builtin of the same name
    void add(std::string name, BuiltinFn fn);

    std::shared_ptr<const Builtin> find(std::string_view name) const;

    const Map& builtins() const { return _builtins; }

private:
    Map _builtins;
};

//=============================================================================
// The standard builtins
//
// Styling is read from the environment: color, line_width, font_family,
// font_style, font_size, line_height, text_align.
//=============================================================================
namespace builtins {

// fit(frame, (w, h)): scale a frame uniformly to fit inside a box
Result<Value> fit(ResourceMap& resources, const Env& env, std::vector<Value> args);

// line((x, y)): stroked segment from the origin
Result<Value> line(ResourceMap& resources, const Env& env, std::vector<Value> args);

// fill_rectangle((w, h)): filled rectangle with its corner at the origin
Result<Value> fillRectangle(ResourceMap& resources, const Env& env, std::vector<Value> args);

// str(n): format a number
Result<Value> str(ResourceMap& resources, const Env& env, std::vector<Value> args);

// t(text): shaped, aligned, multi-line text
Result<Value> t(ResourceMap& resources, const Env& env, std::vector<Value> args);

// glyph(index): a single glyph by font index
Result<Value> glyph(ResourceMap& resources, const Env& env, std::vector<Value> args);

// image(path): an svg image
Result<Value> image(ResourceMap& resources, const Env& env, std::vector<Value> args);

} // namespace builtins

} // namespace pris
