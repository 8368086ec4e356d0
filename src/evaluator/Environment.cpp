// src/evaluator/Environment.cpp
#include "evaluator.hpp"

// ----------------- Environment methods -----------------

bool Environment::has(const std::string& name) const {
    for (const Environment* env = this; env; env = env->parent.get()) {
        if (env->values.count(name)) return true;
    }
    return false;
}

void Environment::define(const std::string& name, const Value& value) {
    values[name] = value;
}

Value Environment::get(const Token& name) const {
    for (const Environment* env = this; env; env = env->parent.get()) {
        auto it = env->values.find(name.value);
        if (it != env->values.end()) return it->second;
    }
    throw RuntimeError(name, "Undefined variable '" + name.value + "'.");
}

void Environment::assign(const Token& name, const Value& value) {
    for (Environment* env = this; env; env = env->parent.get()) {
        auto it = env->values.find(name.value);
        if (it != env->values.end()) {
            it->second = value;
            return;
        }
    }
    throw RuntimeError(name, "Undefined variable '" + name.value + "'.");
}
