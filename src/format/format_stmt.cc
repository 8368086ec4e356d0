#include <sstream>

#include "format/format.hpp"

static std::string format_body(const std::vector<std::unique_ptr<StatementNode>>& body) {
    std::ostringstream ss;
    for (auto& s : body) {
        ss << " " << format_statement(s.get());
    }
    return ss.str();
}

static std::string format_function(const FunctionNode* fn) {
    std::ostringstream ss;
    ss << "(fun " << fn->name << " (";
    for (size_t i = 0; i < fn->params.size(); i++) {
        if (i > 0) ss << " ";
        ss << fn->params[i].value;
    }
    ss << ")" << format_body(fn->body) << ")";
    return ss.str();
}

std::string format_statement(StatementNode* stmt) {
    if (!stmt) return "";

    if (auto es = dynamic_cast<ExpressionStatementNode*>(stmt)) {
        return "(expr " + format_expression(es->expression.get()) + ")";
    }

    if (auto ps = dynamic_cast<PrintStatementNode*>(stmt)) {
        return "(print " + format_expression(ps->expression.get()) + ")";
    }

    if (auto vd = dynamic_cast<VariableDeclarationNode*>(stmt)) {
        if (!vd->value) return "(var " + vd->identifier + ")";
        return "(var " + vd->identifier + " " + format_expression(vd->value.get()) + ")";
    }

    if (auto block = dynamic_cast<BlockStatementNode*>(stmt)) {
        return "(block" + format_body(block->body) + ")";
    }

    if (auto ifs = dynamic_cast<IfStatementNode*>(stmt)) {
        std::ostringstream ss;
        ss << "(if " << format_expression(ifs->condition.get())
           << " " << format_statement(ifs->then_branch.get());
        if (ifs->else_branch) ss << " " << format_statement(ifs->else_branch.get());
        ss << ")";
        return ss.str();
    }

    if (auto ws = dynamic_cast<WhileStatementNode*>(stmt)) {
        return "(while " + format_expression(ws->condition.get()) + " " + format_statement(ws->body.get()) + ")";
    }

    if (dynamic_cast<BreakStatementNode*>(stmt)) {
        return "(break)";
    }

    if (auto rs = dynamic_cast<ReturnStatementNode*>(stmt)) {
        if (!rs->value) return "(return)";
        return "(return " + format_expression(rs->value.get()) + ")";
    }

    if (auto fd = dynamic_cast<FunctionDeclarationNode*>(stmt)) {
        return format_function(fd->function.get());
    }

    if (auto cd = dynamic_cast<ClassDeclarationNode*>(stmt)) {
        std::ostringstream ss;
        ss << "(class " << cd->name;
        if (cd->superclass) ss << " < " << cd->superclass->name;
        for (auto& m : cd->methods) {
            ss << " " << format_function(m.get());
        }
        ss << ")";
        return ss.str();
    }

    return "<stmt>";
}
