#include "ClassRuntime.hpp"
#include "evaluator.hpp"
#include "format/format.hpp"

// only nil and false are falsey
bool Evaluator::to_bool(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return false;
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v);
    return true;
}

// No coercion: values of different types are never equal. Numbers follow
// IEEE (nan != nan); functions, classes and instances compare by identity.
bool Evaluator::is_equal(const Value& a, const Value& b) const {
    if (a.index() != b.index()) return false;

    if (std::holds_alternative<std::monostate>(a)) return true;
    if (std::holds_alternative<double>(a))
        return std::get<double>(a) == std::get<double>(b);
    if (std::holds_alternative<std::string>(a))
        return std::get<std::string>(a) == std::get<std::string>(b);
    if (std::holds_alternative<bool>(a))
        return std::get<bool>(a) == std::get<bool>(b);
    if (std::holds_alternative<FunctionPtr>(a))
        return std::get<FunctionPtr>(a) == std::get<FunctionPtr>(b);
    if (std::holds_alternative<ClassPtr>(a))
        return std::get<ClassPtr>(a) == std::get<ClassPtr>(b);
    if (std::holds_alternative<InstancePtr>(a))
        return std::get<InstancePtr>(a) == std::get<InstancePtr>(b);
    return false;
}

double Evaluator::to_number(const Value& v, const Token& token, const std::string& message) const {
    if (std::holds_alternative<double>(v)) {
        return std::get<double>(v);
    }
    throw RuntimeError(token, message);
}

std::string Evaluator::value_to_string(const Value& v) const {
    if (std::holds_alternative<std::monostate>(v)) return "nil";
    if (std::holds_alternative<double>(v)) {
        return format_number(std::get<double>(v));
    }
    if (std::holds_alternative<bool>(v)) return std::get<bool>(v) ? "true" : "false";
    if (std::holds_alternative<std::string>(v)) return std::get<std::string>(v);
    if (std::holds_alternative<FunctionPtr>(v)) {
        FunctionPtr fn = std::get<FunctionPtr>(v);
        if (!fn || fn->is_native) return "<native fn>";
        return "<fn " + fn->name + ">";
    }
    if (std::holds_alternative<ClassPtr>(v)) {
        ClassPtr cls = std::get<ClassPtr>(v);
        return cls ? cls->name : "<class>";
    }
    if (std::holds_alternative<InstancePtr>(v)) {
        InstancePtr inst = std::get<InstancePtr>(v);
        return (inst && inst->klass ? inst->klass->name : "<anonymous>") + " instance";
    }
    return "<unknown>";
}
