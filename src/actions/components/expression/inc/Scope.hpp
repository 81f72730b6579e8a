#pragma once

#include "Value.hpp"
#include <string>


// Read-only name bindings visible to expressions. Layering a binding returns a new
// scope; the original is never touched.
class Scope {
public:
    Scope() = default;
    explicit Scope(Value::Map bindings) : bindings_(std::move(bindings)) {}

    Scope with(const std::string& name, Value value) const {
        Scope layered(*this);
        layered.bindings_[name] = std::move(value);
        return layered;
    }

    void set(const std::string& name, Value value) {
        bindings_[name] = std::move(value);
    }

    const Value* find(const std::string& name) const {
        auto it = bindings_.find(name);
        return it == bindings_.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& name) const {
        return bindings_.count(name) > 0;
    }

    const Value::Map& bindings() const { return bindings_; }

private:
    Value::Map bindings_;
};
