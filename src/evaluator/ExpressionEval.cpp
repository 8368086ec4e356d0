#include <string>

#include "ClassRuntime.hpp"
#include "evaluator.hpp"

static Value literal_to_value(const Literal& lit) {
    if (auto pd = std::get_if<double>(&lit)) return *pd;
    if (auto ps = std::get_if<std::string>(&lit)) return *ps;
    if (auto pb = std::get_if<bool>(&lit)) return *pb;
    return std::monostate{};
}

// ----------------- Expression evaluation -----------------
Value Evaluator::evaluate_expression(ExpressionNode* expr, EnvPtr env) {
    if (!expr) return std::monostate{};
    if (is_stack_near_limit()) throw RuntimeError(expr->token, "Stack overflow.");

    if (auto lit = dynamic_cast<LiteralNode*>(expr)) {
        return literal_to_value(lit->value);
    }

    if (auto var = dynamic_cast<VariableNode*>(expr)) {
        return env->get(var->token);
    }

    if (auto assign = dynamic_cast<AssignmentNode*>(expr)) {
        Value v = evaluate_expression(assign->value.get(), env);
        env->assign(assign->token, v);
        return v;
    }

    if (auto group = dynamic_cast<GroupingNode*>(expr)) {
        return evaluate_expression(group->expression.get(), env);
    }

    if (auto bin = dynamic_cast<BinaryExpressionNode*>(expr)) {
        return evaluate_binary(bin, env);
    }

    if (auto logical = dynamic_cast<LogicalExpressionNode*>(expr)) {
        return evaluate_logical(logical, env);
    }

    if (auto unary = dynamic_cast<UnaryExpressionNode*>(expr)) {
        return evaluate_unary(unary, env);
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        return evaluate_call(call, env);
    }

    if (auto get = dynamic_cast<GetExpressionNode*>(expr)) {
        return evaluate_get(get, env);
    }

    if (auto set = dynamic_cast<SetExpressionNode*>(expr)) {
        return evaluate_set(set, env);
    }

    if (dynamic_cast<ThisExpressionNode*>(expr)) {
        return env->get(expr->token);
    }

    if (auto sup = dynamic_cast<SuperExpressionNode*>(expr)) {
        return evaluate_super(sup, env);
    }

    throw RuntimeError(expr->token, "Unsupported expression.");
}

Value Evaluator::evaluate_unary(UnaryExpressionNode* node, EnvPtr env) {
    Value operand = evaluate_expression(node->operand.get(), env);

    if (node->op == "!") {
        return !to_bool(operand);
    }
    if (node->op == "-") {
        return -to_number(operand, node->token, "Operand must be a number.");
    }

    throw RuntimeError(node->token, "Unknown unary operator '" + node->op + "'.");
}

Value Evaluator::evaluate_binary(BinaryExpressionNode* node, EnvPtr env) {
    // both operands are evaluated, left first, before any type check
    Value left = evaluate_expression(node->left.get(), env);
    Value right = evaluate_expression(node->right.get(), env);
    const std::string& op = node->op;

    if (op == "==") return is_equal(left, right);
    if (op == "!=") return !is_equal(left, right);

    if (op == "+") {
        if (std::holds_alternative<double>(left) && std::holds_alternative<double>(right)) {
            return std::get<double>(left) + std::get<double>(right);
        }
        if (std::holds_alternative<std::string>(left) && std::holds_alternative<std::string>(right)) {
            return std::get<std::string>(left) + std::get<std::string>(right);
        }
        throw RuntimeError(node->token, "Operands must be two numbers or two strings.");
    }

    const std::string msg = "Operands must be numbers.";
    double l = to_number(left, node->token, msg);
    double r = to_number(right, node->token, msg);

    if (op == "-") return l - r;
    if (op == "*") return l * r;
    if (op == "/") return l / r;  // IEEE: x/0 is inf or nan
    if (op == ">") return l > r;
    if (op == ">=") return l >= r;
    if (op == "<") return l < r;
    if (op == "<=") return l <= r;

    throw RuntimeError(node->token, "Unknown binary operator '" + op + "'.");
}

// Yields the operand that decided the result, not a coerced boolean.
Value Evaluator::evaluate_logical(LogicalExpressionNode* node, EnvPtr env) {
    Value left = evaluate_expression(node->left.get(), env);

    if (node->op == "or") {
        if (to_bool(left)) return left;
    } else {
        if (!to_bool(left)) return left;
    }

    return evaluate_expression(node->right.get(), env);
}

Value Evaluator::evaluate_call(CallExpressionNode* node, EnvPtr env) {
    Value callee = evaluate_expression(node->callee.get(), env);

    std::vector<Value> args;
    args.reserve(node->arguments.size());
    for (auto& arg : node->arguments) {
        args.push_back(evaluate_expression(arg.get(), env));
    }

    return call_value(callee, args, node->token);
}

Value Evaluator::evaluate_get(GetExpressionNode* node, EnvPtr env) {
    Value object = evaluate_expression(node->object.get(), env);

    if (!std::holds_alternative<InstancePtr>(object)) {
        throw RuntimeError(node->token, "Only instances have properties.");
    }
    InstancePtr inst = std::get<InstancePtr>(object);

    // fields shadow methods
    auto it = inst->fields.find(node->property);
    if (it != inst->fields.end()) return it->second;

    if (FunctionPtr method = inst->klass->find_method(node->property)) {
        return method->bind(inst);
    }

    throw RuntimeError(node->token, "Undefined property '" + node->property + "'.");
}

Value Evaluator::evaluate_set(SetExpressionNode* node, EnvPtr env) {
    Value object = evaluate_expression(node->object.get(), env);

    if (!std::holds_alternative<InstancePtr>(object)) {
        throw RuntimeError(node->token, "Only instances have fields.");
    }

    Value v = evaluate_expression(node->value.get(), env);
    InstancePtr instance = std::get<InstancePtr>(object);
    if (std::holds_alternative<FunctionPtr>(v)) track_cycles(instance);
    instance->fields[node->property] = v;
    return v;
}

// `super` is bound in the environment the method closes over, so lookup
// starts from the class that defines the running method, not from the
// runtime class of `this`.
Value Evaluator::evaluate_super(SuperExpressionNode* node, EnvPtr env) {
    Value sv = env->get(node->token);
    if (!std::holds_alternative<ClassPtr>(sv)) {
        throw RuntimeError(node->token, "Superclass must be a class.");
    }
    ClassPtr superclass = std::get<ClassPtr>(sv);

    Token this_tok(TokenType::THIS, "this", node->token.loc);
    Value tv = env->get(this_tok);
    if (!std::holds_alternative<InstancePtr>(tv)) {
        throw RuntimeError(node->token, "Can't use 'super' outside of a method.");
    }

    FunctionPtr method = superclass->find_method(node->method);
    if (!method) {
        throw RuntimeError(node->token, "Undefined property '" + node->method + "'.");
    }

    return method->bind(std::get<InstancePtr>(tv));
}
