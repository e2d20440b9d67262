#pragma once

#include <memory>

namespace pris {
namespace base {

// Object - base for resource-owning interfaces that are only ever handled
// through shared_ptr (fonts, font providers, images, loaders).
class Object {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    virtual const char* typeName() const { return "Object"; }

    // Prevent copying/moving - use shared_ptr
    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() = default;
};

} // namespace base
} // namespace pris
