#include <chrono>

#include "evaluator.hpp"
#include "globals.hpp"

// clock(): wall-clock seconds since the Unix epoch, with sub-second precision
static Value native_clock(const std::vector<Value>& /*args*/, const Token& /*tok*/) {
    using namespace std::chrono;
    auto since_epoch = system_clock::now().time_since_epoch();
    return duration_cast<duration<double>>(since_epoch).count();
}

void init_globals(EnvPtr env) {
    if (!env) return;

    auto add_fn = [&](const std::string& name, size_t arity, NativeImpl impl) {
        auto fn = std::make_shared<FunctionValue>(name, arity, std::move(impl));
        env->define(name, fn);
    };

    add_fn("clock", 0, native_clock);
}
