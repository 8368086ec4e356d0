#include "ast.hpp"

void destroy_expressions(std::vector<std::unique_ptr<ExpressionNode>> pending) {
    while (!pending.empty()) {
        std::unique_ptr<ExpressionNode> node = std::move(pending.back());
        pending.pop_back();
        if (node) node->release_children(pending);
        // node is freed here with no children left to recurse into
    }
}

static void release_pair(std::unique_ptr<ExpressionNode>& left,
    std::unique_ptr<ExpressionNode>& right,
    std::vector<std::unique_ptr<ExpressionNode>>& out) {
    if (left) out.push_back(std::move(left));
    if (right) out.push_back(std::move(right));
}

void BinaryExpressionNode::release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) {
    release_pair(left, right, out);
}

BinaryExpressionNode::~BinaryExpressionNode() {
    std::vector<std::unique_ptr<ExpressionNode>> children;
    release_children(children);
    destroy_expressions(std::move(children));
}

void LogicalExpressionNode::release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) {
    release_pair(left, right, out);
}

LogicalExpressionNode::~LogicalExpressionNode() {
    std::vector<std::unique_ptr<ExpressionNode>> children;
    release_children(children);
    destroy_expressions(std::move(children));
}

void CallExpressionNode::release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) {
    if (callee) out.push_back(std::move(callee));
    for (auto& arg : arguments) {
        if (arg) out.push_back(std::move(arg));
    }
    arguments.clear();
}

CallExpressionNode::~CallExpressionNode() {
    std::vector<std::unique_ptr<ExpressionNode>> children;
    release_children(children);
    destroy_expressions(std::move(children));
}

void GetExpressionNode::release_children(std::vector<std::unique_ptr<ExpressionNode>>& out) {
    if (object) out.push_back(std::move(object));
}

GetExpressionNode::~GetExpressionNode() {
    std::vector<std::unique_ptr<ExpressionNode>> children;
    release_children(children);
    destroy_expressions(std::move(children));
}
