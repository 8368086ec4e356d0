#pragma once

#include <cstddef>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "ErrorReporter.hpp"
#include "LoxError.hpp"
#include "StackGuard.hpp"
#include "ast.hpp"
#include "token.hpp"

// Forward declaration
class Environment;

// Environment
using EnvPtr = std::shared_ptr<Environment>;

// Our language's value types
struct FunctionValue;
using FunctionPtr = std::shared_ptr<FunctionValue>;

struct ClassValue;
using ClassPtr = std::shared_ptr<ClassValue>;

struct InstanceValue;
using InstancePtr = std::shared_ptr<InstanceValue>;

// nil is std::monostate. Functions, classes and instances compare by identity.
using Value = std::variant<
    std::monostate,
    double,
    std::string,
    bool,
    FunctionPtr,
    ClassPtr,
    InstancePtr>;

using NativeImpl = std::function<Value(const std::vector<Value>&, const Token&)>;

// User function, method (possibly bound to an instance) or native function.
struct FunctionValue {
    std::string name;
    std::shared_ptr<FunctionNode> declaration;  // null for natives
    EnvPtr closure;
    bool is_initializer = false;

    bool is_native = false;
    size_t native_arity = 0;
    NativeImpl native_impl;

    FunctionValue(const std::shared_ptr<FunctionNode>& decl, const EnvPtr& env, bool initializer = false)
        : name(decl ? decl->name : ""), declaration(decl), closure(env), is_initializer(initializer) {}

    FunctionValue(const std::string& nm, size_t arity, NativeImpl impl)
        : name(nm), is_native(true), native_arity(arity), native_impl(std::move(impl)) {}

    size_t arity() const {
        if (is_native) return native_arity;
        return declaration ? declaration->params.size() : 0;
    }

    // Copy of this method whose closure binds `this` to the instance.
    FunctionPtr bind(const InstancePtr& instance) const;
};

// Environment with lexical parent pointer
class Environment {
   public:
    explicit Environment(EnvPtr parent = nullptr) : parent(std::move(parent)) {}

    std::unordered_map<std::string, Value> values;
    EnvPtr parent;

    // check if name exists in this environment or any parent
    bool has(const std::string& name) const;

    // bind (or rebind) in this scope only
    void define(const std::string& name, const Value& value);

    // searches up the chain; throws RuntimeError "Undefined variable 'x'."
    Value get(const Token& name) const;

    // mutates the nearest existing binding; never creates one
    void assign(const Token& name, const Value& value);
};

// Outcome of executing a statement. Calls consume Return, loops consume Break.
struct ControlFlow {
    enum class Kind { Normal,
        Return,
        Break };

    Kind kind = Kind::Normal;
    Value value;

    static ControlFlow normal() { return ControlFlow{}; }
    static ControlFlow returning(const Value& v) { return ControlFlow{Kind::Return, v}; }
    static ControlFlow breaking() { return ControlFlow{Kind::Break, Value{}}; }

    bool is_normal() const { return kind == Kind::Normal; }
};

// Evaluator
class Evaluator {
   public:
    explicit Evaluator(ErrorReporter& reporter, std::ostream& out = std::cout);
    ~Evaluator();

    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    // Run a whole program against the global environment. A runtime error is
    // reported and stops the run; returns false in that case. The caller must
    // keep the ProgramNode alive for the duration of the call.
    bool interpret(ProgramNode* program);

    // For REPL print on the go. Evaluates in the global environment and lets
    // RuntimeError propagate.
    Value evaluate_expression(ExpressionNode* expr);

    std::string value_to_string(const Value& v) const;

    EnvPtr globals() const { return global_env; }
    std::ostream& output() { return out; }

    // 0 (the default) means no cap; only the native stack limits recursion.
    void set_max_call_depth(size_t depth) { max_call_depth = depth; }
    size_t get_max_call_depth() const { return max_call_depth; }

   private:
    ErrorReporter& reporter;
    std::ostream& out;
    EnvPtr global_env;

    size_t call_depth = 0;
    size_t max_call_depth = 0;
    StackGuard stack;

    // Closure scopes of declared functions and methods, and instances holding a
    // function in a field. A closure can lead back to whatever holds the
    // function, so these are emptied when the evaluator goes away.
    std::vector<std::weak_ptr<Environment>> cyclic_scopes;
    std::vector<std::weak_ptr<InstanceValue>> cyclic_instances;
    void track_cycles(const EnvPtr& env);
    void track_cycles(const InstancePtr& instance);

    // Expression & statement evaluators. Pass the environment explicitly for lexical scoping.
    Value evaluate_expression(ExpressionNode* expr, EnvPtr env);
    ControlFlow evaluate_statement(StatementNode* stmt, EnvPtr env);
    ControlFlow execute_block(const std::vector<std::unique_ptr<StatementNode>>& body, EnvPtr env);

    Value evaluate_binary(BinaryExpressionNode* node, EnvPtr env);
    Value evaluate_unary(UnaryExpressionNode* node, EnvPtr env);
    Value evaluate_logical(LogicalExpressionNode* node, EnvPtr env);
    Value evaluate_call(CallExpressionNode* node, EnvPtr env);
    Value evaluate_get(GetExpressionNode* node, EnvPtr env);
    Value evaluate_set(SetExpressionNode* node, EnvPtr env);
    Value evaluate_super(SuperExpressionNode* node, EnvPtr env);

    ControlFlow evaluate_class_declaration(ClassDeclarationNode* node, EnvPtr env);

    // callable dispatch
    Value call_value(const Value& callee, const std::vector<Value>& args, const Token& callToken);
    Value call_function(FunctionPtr fn, const std::vector<Value>& args, const Token& callToken);
    Value instantiate(ClassPtr klass, const std::vector<Value>& args, const Token& callToken);
    void check_arity(size_t expected, size_t got, const Token& callToken) const;

    // helpers: conversions and formatting
    bool to_bool(const Value& v) const;
    bool is_equal(const Value& a, const Value& b) const;
    double to_number(const Value& v, const Token& token, const std::string& message) const;
    bool is_stack_near_limit() const { return stack.near_limit(); }

    friend class CallDepthGuard;
};
