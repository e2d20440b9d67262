#include <pris/env.h>

#include <ytrace/ytrace.hpp>

namespace pris {

Result<void> Env::bind(const std::string& name, Value value) {
    if (_bindings.contains(name)) {
        return std::unexpected(Error::other(
            "The name '" + name + "' is already bound in this scope."));
    }
    if (const auto* closure = value.as<std::shared_ptr<const Closure>>();
        closure && (*closure)->env.get() == this) {
        const Closure& fn = **closure;
        value = Value(std::make_shared<const Closure>(Closure{fn.params, fn.body, nullptr, fn.env}));
    }
    ytrace("Env::bind: {} : {}", name, value.type().toString());
    _bindings.emplace(name, std::move(value));
    return Ok();
}

const Value* Env::findLocal(std::string_view name) const {
    auto it = _bindings.find(name);
    if (it == _bindings.end()) return nullptr;
    return &it->second;
}

const Value* Env::find(std::string_view name) const {
    for (const Env* scope = this; scope; scope = scope->_parent.get()) {
        if (const Value* value = scope->findLocal(name)) return value;
    }
    return nullptr;
}

Result<Value> Env::lookup(const ast::Idents& path) const {
    if (path.parts.empty()) {
        return Err<Value>("Env::lookup: empty identifier path");
    }

    const Value* value = find(path.parts.front());
    if (!value) {
        return std::unexpected(Error::unresolved(path.toString()));
    }

    std::string resolved = path.parts.front();
    for (size_t i = 1; i < path.parts.size(); ++i) {
        const auto* frame = value->as<Frame::Ptr>();
        if (!frame) {
            return std::unexpected(Error::type("'" + resolved + "'", "frame",
                                               value->type().toString()));
        }
        const Env* members = (*frame)->env().get();
        value = members ? members->findLocal(path.parts[i]) : nullptr;
        if (!value) {
            return std::unexpected(Error::unresolved(path.toString()));
        }
        resolved += "." + path.parts[i];
    }

    // Reached through the scope chain, so a self-bound closure's scope is alive
    if (const auto* closure = value->as<std::shared_ptr<const Closure>>();
        closure && !(*closure)->env) {
        const Closure& fn = **closure;
        return Value(std::make_shared<const Closure>(
            Closure{fn.params, fn.body, fn.selfScope.lock(), {}}));
    }
    return *value;
}

Result<std::string> Env::lookupStr(const ast::Idents& path) const {
    auto value = lookup(path);
    if (!value) return std::unexpected(value.error());
    if (const auto* str = value->as<std::string>()) return *str;
    return std::unexpected(Error::type("'" + path.toString() + "'", "string",
                                       value->type().toString()));
}

Result<double> Env::lookupLen(const ast::Idents& path) const {
    auto value = lookup(path);
    if (!value) return std::unexpected(value.error());
    if (const auto* num = value->as<Num>(); num && num->dim == 1) return num->value;
    return std::unexpected(Error::type("'" + path.toString() + "'", "length",
                                       value->type().toString()));
}

Result<double> Env::lookupNum(const ast::Idents& path) const {
    auto value = lookup(path);
    if (!value) return std::unexpected(value.error());
    if (const auto* num = value->as<Num>(); num && num->dim == 0) return num->value;
    return std::unexpected(Error::type("'" + path.toString() + "'", "number",
                                       value->type().toString()));
}

Result<Color> Env::lookupColor(const ast::Idents& path) const {
    auto value = lookup(path);
    if (!value) return std::unexpected(value.error());
    if (const auto* color = value->as<Color>()) return *color;
    return std::unexpected(Error::type("'" + path.toString() + "'", "color",
                                       value->type().toString()));
}

std::vector<std::string> Env::localNames() const {
    std::vector<std::string> names;
    names.reserve(_bindings.size());
    for (const auto& [name, _] : _bindings) names.push_back(name);
    return names;
}

} // namespace pris
