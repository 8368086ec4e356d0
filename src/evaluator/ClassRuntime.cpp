// src/evaluator/ClassRuntime.cpp
#include "ClassRuntime.hpp"

FunctionPtr FunctionValue::bind(const InstancePtr& instance) const {
    auto env = std::make_shared<Environment>(closure);
    env->define("this", instance);
    return std::make_shared<FunctionValue>(declaration, env, is_initializer);
}

FunctionPtr ClassValue::find_method(const std::string& method_name) const {
    for (const ClassValue* cls = this; cls; cls = cls->super.get()) {
        auto it = cls->methods.find(method_name);
        if (it != cls->methods.end()) return it->second;
    }
    return nullptr;
}

size_t ClassValue::arity() const {
    FunctionPtr init = find_method("init");
    return init ? init->arity() : 0;
}
