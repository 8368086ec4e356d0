#pragma once
#include "evaluator.hpp"

// Registers the native functions (currently only clock) in the global scope.
void init_globals(EnvPtr env);
