#pragma once

#include <pris/geometry.h>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace pris {

class VectorImage;

//=============================================================================
// Drawable primitives. A frame is an ordered list of these, each with an
// offset; the list order is the paint order, back to front.
//=============================================================================

// RGB in [0, 1]
struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;

    bool operator==(const Color&) const = default;
};

struct StrokePolygon {
    Color color;
    double lineWidth = 0.0;
    bool close = false;
    std::vector<Vec2> vertices;
};

struct FillPolygon {
    Color color;
    std::vector<Vec2> vertices;
};

// Positioned glyph, in canvas units relative to the text origin
struct Glyph {
    uint64_t index = 0;
    double x = 0.0;
    double y = 0.0;

    Glyph offset(double dx, double dy) const { return {index, x + dx, y + dy}; }
};

struct Text {
    Color color;
    std::string fontFamily;
    std::string fontStyle;
    double fontSize = 0.0;
    std::vector<Glyph> glyphs;
};

struct Svg {
    std::shared_ptr<const VectorImage> image;
};

struct PlacedElement;

// A group of elements drawn with a uniform scale about the origin
struct Scaled {
    std::vector<PlacedElement> elements;
    double scale = 1.0;
};

using Element = std::variant<StrokePolygon, FillPolygon, Text, Svg, Scaled>;

struct PlacedElement {
    Vec2 offset;
    Element element;
};

} // namespace pris
