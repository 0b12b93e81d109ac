#include "print_debug.hpp"

#include <unordered_map>

namespace pytch {

std::string token_name(TokenType t) {
    static const std::unordered_map<TokenType, std::string> names = {
        {TokenType::IDENTIFIER, "IDENT"}, {TokenType::INT_LITERAL, "INT"}, {TokenType::STRING, "STRING"},
        {TokenType::AND, "AND"}, {TokenType::DEF, "DEF"}, {TokenType::ELSE, "ELSE"}, {TokenType::IF, "IF"},
        {TokenType::LET, "LET"}, {TokenType::OR, "OR"}, {TokenType::THEN, "THEN"},
        {TokenType::PLUS, "PLUS"}, {TokenType::MINUS, "MINUS"}, {TokenType::EQUALS, "EQUALS"},
        {TokenType::ARROW, "ARROW"}, {TokenType::ELLIPSIS, "ELLIPSIS"}, {TokenType::COMMA, "COMMA"},
        {TokenType::LPAREN, "LPAREN"}, {TokenType::RPAREN, "RPAREN"},
        {TokenType::SEMICOLON, "SEMICOLON"}, {TokenType::DUMMY_IN, "IN"}, {TokenType::DUMMY_ENDIF, "$endif"},
        {TokenType::EOF_TOKEN, "EOF"}
    };
    auto it = names.find(t);
    return it != names.end() ? it->second : "TOKEN(?)";
}

std::string trivium_kind_name(TriviumKind k) {
    switch (k) {
        case TriviumKind::WHITESPACE: return "whitespace";
        case TriviumKind::NEWLINE: return "newline";
        case TriviumKind::COMMENT: return "comment";
        case TriviumKind::BYTE_ORDER_MARK: return "bom";
    }
    return "?";
}

void print_tokens(const std::vector<Token>& tokens, std::ostream& out) {
    out << "---- TOKEN DUMP (" << tokens.size() << " tokens) ----\n";
    for (size_t i = 0; i < tokens.size(); ++i) {
        const Token& tok = tokens[i];
        out << i << ": " << token_name(tok.type)
            << " value='" << tok.value << "'"
            << " file='" << tok.filename() << "'"
            << " line=" << tok.line() << " col=" << tok.col()
            << " indent=" << tok.line_indent << "\n";
    }
    out << "---- END TOKEN DUMP ----\n";
}

nlohmann::json tokens_to_json(const std::vector<Token>& tokens) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& tok : tokens) {
        arr.push_back({
            {"type", token_name(tok.type)},
            {"value", tok.value},
            {"text", tok.text},
            {"line", tok.loc.line},
            {"col", tok.loc.col},
            {"end_line", tok.loc.end_line},
            {"end_col", tok.loc.end_col},
        });
    }
    return arr;
}

}  // namespace pytch
