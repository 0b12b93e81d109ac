#pragma once
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "token.hpp"

namespace pytch {

// Short uppercase name of a token kind ("IDENT", "LPAREN", "IN", "$endif", ...).
std::string token_name(TokenType t);

std::string trivium_kind_name(TriviumKind k);

void print_tokens(const std::vector<Token>& tokens, std::ostream& out = std::cerr);

nlohmann::json tokens_to_json(const std::vector<Token>& tokens);

}  // namespace pytch
