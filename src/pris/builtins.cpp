#include <pris/builtins.h>
#include <pris/pretty.h>

#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace pris {

namespace {

ast::Idents ident(const char* name) {
    return ast::Idents{{name}};
}

Value frameValue(std::shared_ptr<Frame> frame) {
    return Value(Frame::Ptr(std::move(frame)));
}

enum class TextAlign { Left, Center, Right };

// Font settings shared by t() and glyph()
struct FontStyle {
    std::string family;
    std::string style;
    double size = 0.0;
    double lineHeight = 0.0;
};

Result<FontStyle> lookupFontStyle(const Env& env) {
    FontStyle fs;
    auto family = env.lookupStr(ident("font_family"));
    if (!family) return std::unexpected(family.error());
    auto style = env.lookupStr(ident("font_style"));
    if (!style) return std::unexpected(style.error());
    auto size = env.lookupLen(ident("font_size"));
    if (!size) return std::unexpected(size.error());
    auto lineHeight = env.lookupLen(ident("line_height"));
    if (!lineHeight) return std::unexpected(lineHeight.error());

    fs.family = std::move(*family);
    fs.style = std::move(*style);
    fs.size = *size;
    fs.lineHeight = *lineHeight;
    return fs;
}

Result<TextAlign> parseTextAlign(const std::string& value) {
    if (value == "left") return TextAlign::Left;
    if (value == "center") return TextAlign::Center;
    if (value == "right") return TextAlign::Right;

    Formatter fmt;
    fmt.print("'");
    fmt.print(value);
    fmt.print("' is not a valid value for 'text_align'. ");
    fmt.print("Must be one of 'left', 'center', 'right'.");
    return std::unexpected(Error::value(std::move(fmt).intoString()));
}

struct TypesetLine {
    std::vector<Glyph> glyphs;
    double width = 0.0;
};

// Shape one line and turn font-unit offsets into absolute pen positions
Result<TypesetLine> typesetLine(Font& font, double fontSize, std::string_view text) {
    auto shaped = font.shape(text);
    if (!shaped) return std::unexpected(shaped.error());

    // Shaping is done at 1000 units per em
    double sizeFactor = fontSize / 1000.0;

    TypesetLine line;
    line.glyphs.reserve(shaped->size());
    double curX = 0.0;
    double curY = 0.0;
    for (const auto& g : *shaped) {
        curX += g.xOffset * sizeFactor;
        curY += g.yOffset * sizeFactor;
        line.glyphs.push_back(Glyph{g.index, curX, curY});
        curX += g.xAdvance * sizeFactor;
        curY += g.yAdvance * sizeFactor;
    }
    line.width = curX;
    return line;
}

} // namespace

//=============================================================================
// Argument validation
//=============================================================================

Result<void> validateArgs(std::string_view fn,
                          const std::vector<ValType>& expected,
                          const std::vector<Value>& actual) {
    if (expected.size() != actual.size()) {
        return std::unexpected(Error::arity(fn, static_cast<uint32_t>(expected.size()),
                                            static_cast<uint32_t>(actual.size())));
    }

    for (size_t i = 0; i < expected.size(); i++) {
        ValType type = actual[i].type();
        if (type != expected[i]) {
            return std::unexpected(Error::argType(fn, static_cast<uint32_t>(i),
                                                  expected[i].toString(), type.toString()));
        }
    }
    return Ok();
}

std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t pos = 0;
    while (true) {
        size_t nl = text.find('\n', pos);
        if (nl == std::string_view::npos) break;
        lines.push_back(text.substr(pos, nl - pos));
        pos = nl + 1;
    }
    lines.push_back(text.substr(pos));
    return lines;
}

//=============================================================================
// BuiltinRegistry
//=============================================================================

BuiltinRegistry BuiltinRegistry::standard() {
    BuiltinRegistry registry;
    registry.add("fit", builtins::fit);
    registry.add("line", builtins::line);
    registry.add("fill_rectangle", builtins::fillRectangle);
    registry.add("str", builtins::str);
    registry.add("t", builtins::t);
    registry.add("glyph", builtins::glyph);
    registry.add("image", builtins::image);
    return registry;
}

void BuiltinRegistry::add(std::string name, BuiltinFn fn) {
    auto builtin = std::make_shared<const Builtin>(Builtin{name, std::move(fn)});
    _builtins.insert_or_assign(std::move(name), std::move(builtin));
}

std::shared_ptr<const Builtin> BuiltinRegistry::find(std::string_view name) const {
    auto it = _builtins.find(name);
    if (it == _builtins.end()) return nullptr;
    return it->second;
}

namespace builtins {

//=============================================================================
// fit
//=============================================================================

Result<Value> fit(ResourceMap&, const Env&, std::vector<Value> args) {
    if (auto res = validateArgs("fit", {ValType::frame(), ValType::coord(1)}, args); !res) {
        return std::unexpected(res.error());
    }
    const Frame::Ptr& frame = *args[0].as<Frame::Ptr>();
    const Coord& size = *args[1].as<Coord>();

    if (size.x <= 0.0 || size.y <= 0.0) {
        return std::unexpected(Error::other(
            "Cannot fit frame in a box with width or height less than or equal to 0. "
            "Simply don't place the frame then."));
    }

    const BoundingBox& bb = frame->boundingBox();
    double scale = 0.0;
    if (bb.height() != 0.0) {
        if (bb.width() / bb.height() > size.x / size.y) {
            // Constrained by width
            scale = size.x / bb.width();
        } else {
            scale = size.y / bb.height();
        }
    } else if (bb.width() != 0.0) {
        if (bb.height() / bb.width() > size.y / size.x) {
            scale = size.y / bb.height();
        } else {
            scale = size.x / bb.width();
        }
    } else {
        return std::unexpected(Error::other("Cannot fit a frame of size (0w, 0w)."));
    }
    ydebug("fit: {}x{} into {}x{}, scale {}", bb.width(), bb.height(), size.x, size.y, scale);

    auto scaled = std::make_shared<Frame>(frame->env());
    scaled->placeElement(Vec2::zero(), Scaled{frame->elements(), scale});
    scaled->setAnchor(frame->anchor() * scale);
    scaled->unionBoundingBox(bb.scaled(scale));
    return frameValue(std::move(scaled));
}

//=============================================================================
// line, fill_rectangle
//=============================================================================

Result<Value> line(ResourceMap&, const Env& env, std::vector<Value> args) {
    if (auto res = validateArgs("line", {ValType::coord(1)}, args); !res) {
        return std::unexpected(res.error());
    }
    Vec2 offset = args[0].as<Coord>()->toVec2();

    auto color = env.lookupColor(ident("color"));
    if (!color) return std::unexpected(color.error());
    auto lineWidth = env.lookupLen(ident("line_width"));
    if (!lineWidth) return std::unexpected(lineWidth.error());

    StrokePolygon stroke{*color, *lineWidth, false, {Vec2::zero(), offset}};

    auto frame = std::make_shared<Frame>();
    frame->placeElement(Vec2::zero(), std::move(stroke));
    frame->setAnchor(offset);
    frame->unionBoundingBox(BoundingBox(Vec2::zero(), offset));
    return frameValue(std::move(frame));
}

Result<Value> fillRectangle(ResourceMap&, const Env& env, std::vector<Value> args) {
    if (auto res = validateArgs("fill_rectangle", {ValType::coord(1)}, args); !res) {
        return std::unexpected(res.error());
    }
    Vec2 size = args[0].as<Coord>()->toVec2();

    auto color = env.lookupColor(ident("color"));
    if (!color) return std::unexpected(color.error());

    FillPolygon rect{*color, {
        Vec2::zero(),
        Vec2{0.0, size.y},
        Vec2{size.x, size.y},
        Vec2{size.x, 0.0},
    }};

    auto frame = std::make_shared<Frame>();
    frame->placeElement(Vec2::zero(), std::move(rect));
    frame->setAnchor(size);
    frame->unionBoundingBox(BoundingBox(Vec2::zero(), size));
    return frameValue(std::move(frame));
}

//=============================================================================
// str
//=============================================================================

Result<Value> str(ResourceMap&, const Env&, std::vector<Value> args) {
    if (auto res = validateArgs("str", {ValType::num(0)}, args); !res) {
        return std::unexpected(res.error());
    }
    return Value(ast::formatNumber(args[0].as<Num>()->value));
}

//=============================================================================
// t, glyph
//=============================================================================

Result<Value> t(ResourceMap& resources, const Env& env, std::vector<Value> args) {
    if (auto res = validateArgs("t", {ValType::str()}, args); !res) {
        return std::unexpected(res.error());
    }
    const std::string& text = *args[0].as<std::string>();

    auto fs = lookupFontStyle(env);
    if (!fs) return std::unexpected(fs.error());
    auto alignName = env.lookupStr(ident("text_align"));
    if (!alignName) return std::unexpected(alignName.error());

    auto font = resources.font(fs->family, fs->style);
    if (!font) return std::unexpected(font.error());
    auto align = parseTextAlign(*alignName);
    if (!align) return std::unexpected(align.error());

    std::vector<Glyph> glyphs;
    double maxWidth = 0.0;
    double minOffset = 0.0;
    double curX = 0.0;
    double curY = 0.0;
    for (std::string_view textLine : splitLines(text)) {
        auto typeset = typesetLine(**font, fs->size, textLine);
        if (!typeset) return std::unexpected(typeset.error());

        double offset = 0.0;
        switch (*align) {
            case TextAlign::Left: offset = 0.0; break;
            case TextAlign::Center: offset = typeset->width * -0.5; break;
            case TextAlign::Right: offset = -typeset->width; break;
        }

        for (const auto& g : typeset->glyphs) {
            glyphs.push_back(g.offset(offset, curY));
        }

        maxWidth = std::max(maxWidth, typeset->width);
        minOffset = std::min(minOffset, offset);
        curY += fs->lineHeight;
        curX = offset + typeset->width;
    }

    auto color = env.lookupColor(ident("color"));
    if (!color) return std::unexpected(color.error());

    Text element{*color, fs->family, fs->style, fs->size, std::move(glyphs)};

    auto frame = std::make_shared<Frame>();
    frame->placeElement(Vec2::zero(), std::move(element));
    frame->setAnchor(Vec2{curX, curY - fs->lineHeight});
    frame->unionBoundingBox(BoundingBox(Vec2{minOffset, -fs->lineHeight}, Vec2{maxWidth, curY}));
    return frameValue(std::move(frame));
}

Result<Value> glyph(ResourceMap& resources, const Env& env, std::vector<Value> args) {
    if (auto res = validateArgs("glyph", {ValType::num(0)}, args); !res) {
        return std::unexpected(res.error());
    }
    double index = args[0].as<Num>()->value;

    if (!(index >= 0.0) || std::trunc(index) != index) {
        return std::unexpected(Error::value(
            "Expected an unsigned integer glyph index, found " + ast::formatNumber(index) + "."));
    }

    auto fs = lookupFontStyle(env);
    if (!fs) return std::unexpected(fs.error());
    auto font = resources.font(fs->family, fs->style);
    if (!font) return std::unexpected(font.error());

    uint64_t count = (*font)->glyphCount();
    if (index >= static_cast<double>(count)) {
        return std::unexpected(Error::value(
            "Glyph index " + ast::formatNumber(index) + " is out of range, font '" +
            fs->family + "' has " + std::to_string(count) + " glyphs."));
    }

    auto color = env.lookupColor(ident("color"));
    if (!color) return std::unexpected(color.error());

    Text element{*color, fs->family, fs->style, fs->size,
                 {Glyph{static_cast<uint64_t>(index), 0.0, 0.0}}};

    auto frame = std::make_shared<Frame>();
    frame->placeElement(Vec2::zero(), std::move(element));
    frame->setAnchor(Vec2::zero());
    frame->unionBoundingBox(BoundingBox(Vec2{0.0, -fs->lineHeight}, Vec2::zero()));
    return frameValue(std::move(frame));
}

//=============================================================================
// image
//=============================================================================

Result<Value> image(ResourceMap& resources, const Env&, std::vector<Value> args) {
    if (auto res = validateArgs("image", {ValType::str()}, args); !res) {
        return std::unexpected(res.error());
    }
    const std::string& path = *args[0].as<std::string>();

    if (!path.ends_with(".svg")) {
        return std::unexpected(Error::other(
            "Cannot load '" + path + "', only svg images are supported for now."));
    }

    auto svg = resources.image(path);
    if (!svg) return std::unexpected(svg.error());
    double width = (*svg)->width();
    double height = (*svg)->height();

    auto frame = std::make_shared<Frame>();
    frame->placeElement(Vec2::zero(), Svg{*svg});
    frame->unionBoundingBox(BoundingBox::sized(width, height));
    // Origin top left, anchor top right, so images adjoin horizontally
    frame->setAnchor(Vec2{width, 0.0});
    return frameValue(std::move(frame));
}

} // namespace builtins

} // namespace pris
