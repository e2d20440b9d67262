#pragma once

#include <pris/ast.h>
#include <pris/result.hpp>
#include <pris/value.h>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace pris {

//=============================================================================
// Env - one scope in a chain of scopes
//
// Lookups walk outward through the parents. A name can be bound once per
// scope; a child scope may shadow a binding of its parents.
//=============================================================================
class Env {
public:
    using Ptr = std::shared_ptr<Env>;
    using ConstPtr = std::shared_ptr<const Env>;

    explicit Env(ConstPtr parent = nullptr) : _parent(std::move(parent)) {}

    static Ptr create(ConstPtr parent = nullptr) { return std::make_shared<Env>(std::move(parent)); }

    // Fails when `name` is already bound in this scope.
    Result<void> bind(const std::string& name, Value value);

    // Search this scope only
    const Value* findLocal(std::string_view name) const;

    // Search this scope and then the parents
    const Value* find(std::string_view name) const;

    // Resolve a dotted path. The first segment resolves through the scope
    // chain, the following ones as members of the frame found so far.
    Result<Value> lookup(const ast::Idents& path) const;

    Result<std::string> lookupStr(const ast::Idents& path) const;
    Result<double> lookupLen(const ast::Idents& path) const;
    Result<double> lookupNum(const ast::Idents& path) const;
    Result<Color> lookupColor(const ast::Idents& path) const;

    const ConstPtr& parent() const { return _parent; }

    // Names bound in this scope, sorted
    std::vector<std::string> localNames() const;

private:
    ConstPtr _parent;
    std::map<std::string, Value, std::less<>> _bindings;
};

} // namespace pris
