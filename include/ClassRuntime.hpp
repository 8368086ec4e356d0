#pragma once
#include <string>
#include <unordered_map>

#include "evaluator.hpp"

// A minimal runtime representation for classes
struct ClassValue {
    std::string name;
    ClassPtr super;  // parent class (if any)
    std::unordered_map<std::string, FunctionPtr> methods;
    // token for diagnostics
    Token token;

    // Walks the superclass chain; nullptr when no class defines it.
    FunctionPtr find_method(const std::string& method_name) const;

    // init's arity, or 0 when no class in the chain defines init
    size_t arity() const;
};

struct InstanceValue {
    ClassPtr klass;
    std::unordered_map<std::string, Value> fields;

    explicit InstanceValue(ClassPtr k) : klass(std::move(k)) {}
};
