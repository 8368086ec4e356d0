#include <string>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

// ----------------- Statement evaluation -----------------
ControlFlow Evaluator::evaluate_statement(StatementNode* stmt, EnvPtr env) {
    if (!stmt) return ControlFlow::normal();
    if (is_stack_near_limit()) throw RuntimeError(stmt->token, "Stack overflow.");

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        evaluate_expression(es->expression.get(), env);
        return ControlFlow::normal();
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        Value v = evaluate_expression(ps->expression.get(), env);
        out << value_to_string(v) << '\n';
        return ControlFlow::normal();
    }

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        Value v = vd->value ? evaluate_expression(vd->value.get(), env) : Value{};
        env->define(vd->identifier, v);
        return ControlFlow::normal();
    }

    if (auto block = dynamic_cast<BlockStatementNode*>(stmt)) {
        return execute_block(block->body, std::make_shared<Environment>(env));
    }

    if (auto ifs = dynamic_cast<IfStatementNode*>(stmt)) {
        if (to_bool(evaluate_expression(ifs->condition.get(), env))) {
            return evaluate_statement(ifs->then_branch.get(), env);
        }
        if (ifs->else_branch) {
            return evaluate_statement(ifs->else_branch.get(), env);
        }
        return ControlFlow::normal();
    }

    if (auto ws = dynamic_cast<WhileStatementNode*>(stmt)) {
        while (to_bool(evaluate_expression(ws->condition.get(), env))) {
            // fresh scope per iteration
            auto body_env = std::make_shared<Environment>(env);
            ControlFlow cf = evaluate_statement(ws->body.get(), body_env);
            if (cf.kind == ControlFlow::Kind::Break) break;
            if (cf.kind == ControlFlow::Kind::Return) return cf;
        }
        return ControlFlow::normal();
    }

    if (dynamic_cast<BreakStatementNode*>(stmt)) {
        return ControlFlow::breaking();
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        Value v = rs->value ? evaluate_expression(rs->value.get(), env) : Value{};
        return ControlFlow::returning(v);
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        auto fn = std::make_shared<FunctionValue>(fd->function, env);
        env->define(fd->function->name, fn);
        track_cycles(env);
        return ControlFlow::normal();
    }

    if (auto cd = dynamic_cast<ClassDeclarationNode*>(stmt)) {
        return evaluate_class_declaration(cd, env);
    }

    throw RuntimeError(stmt->token, "Unsupported statement.");
}

// Runs statements in the given (already fresh) scope. Stops at the first
// non-normal outcome and hands it to the caller.
ControlFlow Evaluator::execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env) {
    for (const auto& stmt : body) {
        ControlFlow cf = evaluate_statement(stmt.get(), env);
        if (!cf.is_normal()) return cf;
    }
    return ControlFlow::normal();
}

ControlFlow Evaluator::evaluate_class_declaration(ClassDeclarationNode* node, EnvPtr env) {
    ClassPtr superclass;
    if (node->superclass) {
        Value sv = evaluate_expression(node->superclass.get(), env);
        if (!std::holds_alternative<ClassPtr>(sv)) {
            throw RuntimeError(node->superclass->token, "Superclass must be a class.");
        }
        superclass = std::get<ClassPtr>(sv);
    }

    // the name exists (as nil) while the methods are being built
    env->define(node->name, Value{});

    EnvPtr method_env = env;
    if (superclass) {
        method_env = std::make_shared<Environment>(env);
        method_env->define("super", superclass);
    }

    auto klass = std::make_shared<ClassValue>();
    klass->name = node->name;
    klass->super = superclass;
    klass->token = node->token;

    for (const auto& method : node->methods) {
        bool is_init = method->name == "init";
        klass->methods[method->name] = std::make_shared<FunctionValue>(method, method_env, is_init);
    }

    env->assign(node->token, klass);
    track_cycles(method_env);
    return ControlFlow::normal();
}
