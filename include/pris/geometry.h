#pragma once

namespace pris {

//=============================================================================
// Vec2
//=============================================================================
struct Vec2 {
    double x = 0.0;
    double y = 0.0;

    static Vec2 zero() { return {0.0, 0.0}; }

    Vec2 operator+(const Vec2& o) const { return {x + o.x, y + o.y}; }
    Vec2 operator-(const Vec2& o) const { return {x - o.x, y - o.y}; }
    Vec2 operator*(double s) const { return {x * s, y * s}; }

    bool operator==(const Vec2&) const = default;
};

//=============================================================================
// BoundingBox - axis-aligned, top-left corner plus size
//
// A default-constructed box is empty: it is the identity of unionWith().
// Non-empty boxes always have a non-negative size; constructors normalize
// a negative size by moving the corner.
//=============================================================================
class BoundingBox {
public:
    BoundingBox() = default;
    BoundingBox(Vec2 topLeft, Vec2 size);

    static BoundingBox empty() { return BoundingBox(); }
    static BoundingBox sized(double width, double height);

    // Smallest box containing both corners
    static BoundingBox fromCorners(Vec2 a, Vec2 b);

    bool isEmpty() const { return _empty; }

    double x() const { return _topLeft.x; }
    double y() const { return _topLeft.y; }
    double width() const { return _size.x; }
    double height() const { return _size.y; }
    Vec2 topLeft() const { return _topLeft; }
    Vec2 size() const { return _size; }
    Vec2 bottomRight() const { return _topLeft + _size; }

    // Grow to cover `other`. The empty box is the identity.
    void unionWith(const BoundingBox& other);
    BoundingBox united(const BoundingBox& other) const;

    BoundingBox translated(Vec2 offset) const;

    // Multiply corner and size by `factor` (factor > 0).
    BoundingBox scaled(double factor) const;

    bool operator==(const BoundingBox& other) const;

private:
    Vec2 _topLeft;
    Vec2 _size;
    bool _empty = true;
};

} // namespace pris
