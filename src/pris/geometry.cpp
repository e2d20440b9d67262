#include <pris/geometry.h>

#include <algorithm>

namespace pris {

BoundingBox::BoundingBox(Vec2 topLeft, Vec2 size) {
    *this = fromCorners(topLeft, topLeft + size);
}

BoundingBox BoundingBox::sized(double width, double height) {
    return BoundingBox(Vec2::zero(), Vec2{width, height});
}

BoundingBox BoundingBox::fromCorners(Vec2 a, Vec2 b) {
    BoundingBox box;
    box._topLeft = Vec2{std::min(a.x, b.x), std::min(a.y, b.y)};
    box._size = Vec2{std::max(a.x, b.x), std::max(a.y, b.y)} - box._topLeft;
    box._empty = false;
    return box;
}

void BoundingBox::unionWith(const BoundingBox& other) {
    if (other._empty) return;
    if (_empty) {
        *this = other;
        return;
    }

    Vec2 br = bottomRight();
    Vec2 obr = other.bottomRight();
    Vec2 tl{std::min(_topLeft.x, other._topLeft.x), std::min(_topLeft.y, other._topLeft.y)};
    Vec2 nbr{std::max(br.x, obr.x), std::max(br.y, obr.y)};
    _topLeft = tl;
    _size = nbr - tl;
}

BoundingBox BoundingBox::united(const BoundingBox& other) const {
    BoundingBox result = *this;
    result.unionWith(other);
    return result;
}

BoundingBox BoundingBox::translated(Vec2 offset) const {
    if (_empty) return *this;
    BoundingBox result = *this;
    result._topLeft = _topLeft + offset;
    return result;
}

BoundingBox BoundingBox::scaled(double factor) const {
    if (_empty) return *this;
    BoundingBox result = *this;
    result._topLeft = _topLeft * factor;
    result._size = _size * factor;
    return result;
}

bool BoundingBox::operator==(const BoundingBox& other) const {
    if (_empty || other._empty) return _empty == other._empty;
    return _topLeft == other._topLeft && _size == other._size;
}

} // namespace pris
