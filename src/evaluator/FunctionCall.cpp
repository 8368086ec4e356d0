// src/evaluator/FunctionCall.cpp
#include <string>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

// Counts nested Lox calls for the lifetime of one call. Refuses to enter a
// call once the native stack is nearly exhausted, or past the optional depth cap.
class CallDepthGuard {
   public:
    CallDepthGuard(Evaluator& ev, const Token& tok) : ev(ev) {
        bool capped = ev.max_call_depth != 0 && ev.call_depth >= ev.max_call_depth;
        if (capped || ev.is_stack_near_limit()) {
            throw RuntimeError(tok, "Stack overflow.");
        }
        ++ev.call_depth;
    }
    ~CallDepthGuard() { --ev.call_depth; }

    CallDepthGuard(const CallDepthGuard&) = delete;
    CallDepthGuard& operator=(const CallDepthGuard&) = delete;

   private:
    Evaluator& ev;
};

void Evaluator::check_arity(size_t expected, size_t got, const Token& callToken) const {
    if (expected != got) {
        throw RuntimeError(callToken,
            "Expected " + std::to_string(expected) + " arguments but got " + std::to_string(got) + ".");
    }
}

Value Evaluator::call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken) {
    if (auto fn = std::get_if<FunctionPtr>(&callee)) {
        return call_function(*fn, args, callToken);
    }
    if (auto klass = std::get_if<ClassPtr>(&callee)) {
        return instantiate(*klass, args, callToken);
    }
    throw RuntimeError(callToken, "Can only call functions and classes.");
}

Value Evaluator::call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken) {
    check_arity(fn->arity(), args.size(), callToken);

    if (fn->is_native) {
        return fn->native_impl(args, callToken);
    }

    CallDepthGuard guard(*this, callToken);

    // the call scope hangs off the closure, not off the caller
    auto local = std::make_shared<Environment>(fn->closure);
    const auto& params = fn->declaration->params;
    for (size_t i = 0; i < params.size(); ++i) {
        local->define(params[i].value, args[i]);
    }

    ControlFlow cf = execute_block(fn->declaration->body, local);

    // init always hands back the instance, even on a bare `return;`
    if (fn->is_initializer) {
        return fn->closure->get(Token(TokenType::THIS, "this", fn->declaration->token.loc));
    }

    if (cf.kind == ControlFlow::Kind::Return) return cf.value;
    return std::monostate{};
}

Value Evaluator::instantiate(ClassPtr klass, const std::vector<Value>& args, const Token& callToken) {
    check_arity(klass->arity(), args.size(), callToken);

    auto instance = std::make_shared<InstanceValue>(klass);
    if (FunctionPtr init = klass->find_method("init")) {
        call_function(init->bind(instance), args, callToken);
    }
    return instance;
}
