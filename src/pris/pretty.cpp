#include <pris/pretty.h>

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace pris {

namespace {

int channel(double c) {
    return static_cast<int>(std::lround(std::clamp(c, 0.0, 1.0) * 255.0));
}

} // namespace

void Formatter::printValue(const Value& value) {
    if (const auto* num = value.as<Num>()) {
        _out += ast::formatNumber(num->value);
        if (num->dim != 0) {
            _out += " (" + ValType::num(num->dim).toString() + ")";
        }
    } else if (const auto* coord = value.as<Coord>()) {
        _out += "(" + ast::formatNumber(coord->x) + ", " + ast::formatNumber(coord->y) + ")";
        if (coord->dim != 0) {
            _out += " (" + ValType::coord(coord->dim).toString() + ")";
        }
    } else if (const auto* color = value.as<Color>()) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                      channel(color->r), channel(color->g), channel(color->b));
        _out += buf;
    } else if (const auto* str = value.as<std::string>()) {
        _out += ast::toString(ast::Term{ast::StringLit{*str}});
    } else if (value.is<Frame::Ptr>()) {
        _out += "frame";
    } else if (const auto* closure = value.as<std::shared_ptr<const Closure>>()) {
        _out += "function(";
        for (size_t i = 0; i < (*closure)->params.size(); i++) {
            if (i > 0) _out += ", ";
            _out += (*closure)->params[i];
        }
        _out += ")";
    } else if (const auto* builtin = value.as<std::shared_ptr<const Builtin>>()) {
        _out += "builtin " + (*builtin)->name;
    }
}

} // namespace pris
