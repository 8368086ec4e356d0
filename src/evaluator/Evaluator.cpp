// src/evaluator/Evaluator.cpp
#include "evaluator.hpp"

#include <algorithm>

#include "ClassRuntime.hpp"
#include "globals.hpp"

template <typename T>
static void remember(std::vector<std::weak_ptr<T>>& list, const std::shared_ptr<T>& ptr) {
    if (!ptr) return;
    // drop entries whose target is already gone before the list grows
    if (list.size() == list.capacity() && !list.empty()) {
        list.erase(std::remove_if(list.begin(), list.end(),
                       [](const std::weak_ptr<T>& w) { return w.expired(); }),
            list.end());
    }
    list.push_back(ptr);
}

Evaluator::Evaluator(ErrorReporter& reporter, std::ostream& out)
    : reporter(reporter), out(out), global_env(std::make_shared<Environment>(nullptr)) {
    init_globals(global_env);
}

// A function stored anywhere along the scope chain it closes over keeps that
// chain alive, and so does a bound method stored in its own instance. Empty
// those holders, then the globals, so the cycles are released.
Evaluator::~Evaluator() {
    for (auto& weak : cyclic_instances) {
        if (auto instance = weak.lock()) instance->fields.clear();
    }
    for (auto& weak : cyclic_scopes) {
        for (EnvPtr env = weak.lock(); env && env != global_env; env = env->parent) {
            env->values.clear();
        }
    }
    if (global_env) global_env->values.clear();
}

void Evaluator::track_cycles(const EnvPtr& env) {
    if (env == global_env) return;
    remember(cyclic_scopes, env);
}

void Evaluator::track_cycles(const InstancePtr& instance) {
    remember(cyclic_instances, instance);
}

// ----------------- Program evaluation -----------------
bool Evaluator::interpret(ProgramNode* program) {
    if (!program) return true;

    stack.mark();
    call_depth = 0;

    bool ok = true;
    try {
        for (auto& stmt_uptr : program->body) {
            ControlFlow cf = evaluate_statement(stmt_uptr.get(), global_env);
            // a top-level return or stray break ends the run quietly
            if (!cf.is_normal()) break;
        }
    } catch (const RuntimeError& e) {
        reporter.runtime_error(e);
        ok = false;
    }

    out.flush();
    return ok;
}

Value Evaluator::evaluate_expression(ExpressionNode* expr) {
    stack.mark();
    call_depth = 0;
    return evaluate_expression(expr, global_env);
}
