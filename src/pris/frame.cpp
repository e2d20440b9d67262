#include <pris/frame.h>

namespace pris {

void Frame::placeElement(Vec2 offset, Element element) {
    _elements.push_back(PlacedElement{offset, std::move(element)});
}

void Frame::placeFrame(Vec2 offset, const Frame& frame) {
    _elements.reserve(_elements.size() + frame._elements.size());
    for (const auto& placed : frame._elements) {
        _elements.push_back(PlacedElement{placed.offset + offset, placed.element});
    }
    _boundingBox.unionWith(frame._boundingBox.translated(offset));
}

} // namespace pris
