#include <sstream>

#include "format/format.hpp"

std::string format_expression(ExpressionNode* expr) {
    if (!expr) return "";

    if (auto lit = dynamic_cast<LiteralNode*>(expr)) {
        return format_literal(lit->value);
    }

    if (auto id = dynamic_cast<VariableNode*>(expr)) {
        return id->name;
    }

    if (dynamic_cast<ThisExpressionNode*>(expr)) {
        return "this";
    }

    if (auto g = dynamic_cast<GroupingNode*>(expr)) {
        return "(group " + format_expression(g->expression.get()) + ")";
    }

    if (auto u = dynamic_cast<UnaryExpressionNode*>(expr)) {
        return "(" + u->op + " " + format_expression(u->operand.get()) + ")";
    }

    if (auto b = dynamic_cast<BinaryExpressionNode*>(expr)) {
        std::string left = format_expression(b->left.get());
        std::string right = format_expression(b->right.get());
        return "(" + b->op + " " + left + " " + right + ")";
    }

    if (auto l = dynamic_cast<LogicalExpressionNode*>(expr)) {
        std::string left = format_expression(l->left.get());
        std::string right = format_expression(l->right.get());
        return "(" + l->op + " " + left + " " + right + ")";
    }

    if (auto a = dynamic_cast<AssignmentNode*>(expr)) {
        return "(= " + a->name + " " + format_expression(a->value.get()) + ")";
    }

    if (auto call = dynamic_cast<CallExpressionNode*>(expr)) {
        std::ostringstream ss;
        ss << "(call " << format_expression(call->callee.get());
        for (auto& arg : call->arguments) {
            ss << " " << format_expression(arg.get());
        }
        ss << ")";
        return ss.str();
    }

    if (auto get = dynamic_cast<GetExpressionNode*>(expr)) {
        return "(. " + format_expression(get->object.get()) + " " + get->property + ")";
    }

    if (auto set = dynamic_cast<SetExpressionNode*>(expr)) {
        return "(= (. " + format_expression(set->object.get()) + " " + set->property + ") " +
            format_expression(set->value.get()) + ")";
    }

    if (auto sup = dynamic_cast<SuperExpressionNode*>(expr)) {
        return "(super " + sup->method + ")";
    }

    return "<expr>";
}
