#pragma once
#include <iostream>
#include <vector>

#include "token.hpp"

// Token dump used by `lox --tokens`.
void print_tokens(const std::vector<Token>& tokens, std::ostream& os = std::cerr);
