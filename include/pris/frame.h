#pragma once

#include <pris/elements.h>
#include <pris/geometry.h>
#include <memory>
#include <vector>

namespace pris {

class Env;

//=============================================================================
// Frame - placed elements, an anchor and a cumulative bounding box
//
// A frame is built through a non-const reference and then handed out as
// Frame::Ptr (shared_ptr<const Frame>). From that point on it is never
// mutated, so sharing it between values and other frames needs no copy.
//=============================================================================
class Frame {
public:
    using Ptr = std::shared_ptr<const Frame>;

    Frame() = default;

    // A frame built by a block keeps that block's scope, so members can be
    // looked up as frame.name.
    explicit Frame(std::shared_ptr<const Env> env) : _env(std::move(env)) {}

    // Append an element; paint order is append order.
    void placeElement(Vec2 offset, Element element);

    // Append all elements of `frame`, translated by `offset`, and grow the
    // bounding box by the translated box of `frame`.
    void placeFrame(Vec2 offset, const Frame& frame);

    // Where side-by-side composition continues from.
    void setAnchor(Vec2 anchor) { _anchor = anchor; }

    void unionBoundingBox(const BoundingBox& box) { _boundingBox.unionWith(box); }

    const std::vector<PlacedElement>& elements() const { return _elements; }
    Vec2 anchor() const { return _anchor; }
    const BoundingBox& boundingBox() const { return _boundingBox; }
    const std::shared_ptr<const Env>& env() const { return _env; }

private:
    std::vector<PlacedElement> _elements;
    Vec2 _anchor;
    BoundingBox _boundingBox;
    std::shared_ptr<const Env> _env;
};

} // namespace pris
