#include "print_tokens.hpp"

#include <string>
#include <unordered_map>

std::string token_type_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::OPENPARENTHESIS, "OPENPARENTHESIS"}, {TokenType::CLOSEPARENTHESIS, "CLOSEPARENTHESIS"},
        {TokenType::OPENBRACE, "OPENBRACE"}, {TokenType::CLOSEBRACE, "CLOSEBRACE"},
        {TokenType::COMMA, "COMMA"}, {TokenType::DOT, "DOT"}, {TokenType::SEMICOLON, "SEMICOLON"},
        {TokenType::MINUS, "MINUS"}, {TokenType::PLUS, "PLUS"}, {TokenType::SLASH, "SLASH"}, {TokenType::STAR, "STAR"},
        {TokenType::NOT, "NOT"}, {TokenType::NOTEQUAL, "NOTEQUAL"},
        {TokenType::ASSIGN, "ASSIGN"}, {TokenType::EQUALITY, "EQUALITY"},
        {TokenType::GREATERTHAN, "GREATERTHAN"}, {TokenType::GREATEROREQUALTHAN, "GREATEROREQUALTHAN"},
        {TokenType::LESSTHAN, "LESSTHAN"}, {TokenType::LESSOREQUALTHAN, "LESSOREQUALTHAN"},
        {TokenType::IDENTIFIER, "IDENTIFIER"}, {TokenType::STRING, "STRING"}, {TokenType::NUMBER, "NUMBER"},
        {TokenType::BOOLEAN, "BOOLEAN"}, {TokenType::NIL, "NIL"},
        {TokenType::AND, "AND"}, {TokenType::OR, "OR"}, {TokenType::CLASS, "CLASS"}, {TokenType::SUPER, "SUPER"},
        {TokenType::THIS, "THIS"}, {TokenType::FUN, "FUN"}, {TokenType::RETURN, "RETURN"}, {TokenType::VAR, "VAR"},
        {TokenType::PRINT, "PRINT"}, {TokenType::IF, "IF"}, {TokenType::ELSE, "ELSE"}, {TokenType::WHILE, "WHILE"},
        {TokenType::FOR, "FOR"}, {TokenType::BREAK, "BREAK"},
        {TokenType::EOF_TOKEN, "EOF_TOKEN"}};
    auto it = names.find(t);
    if (it != names.end()) return it->second;
    return "TOKEN(?)";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& os) {
    os << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        os << i << ": " << token_type_name(tok.type)
           << " value='" << tok.value << "'"
           << " file='" << tok.filename() << "'"
           << " line=" << tok.line() << " col=" << tok.col() << "\n";
    }
    os << "---- END TOKEN DUMP ----\n";
}
