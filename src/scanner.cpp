#include "scanner.hpp"

#include <cctype>
#include <sstream>
#include <unordered_map>

namespace pytch {

static bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

static bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

static bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Constructor
Scanner::Scanner(const std::string& source, const ScanOptions& options, const SourceManager* mgr)
    : src(source), filename(options.filename), skip_bom(options.skip_bom), src_mgr(mgr) {}

void Scanner::reset() {
    i = 0;
    line = 1;
    col = 1;
    started = false;
    done = false;
    eof_token = Token();
    current_line_indent = 0;
    last_token_line = 0;
    pending_leading.clear();
}

bool Scanner::eof() const {
    return i >= src.size();
}
char Scanner::peek(size_t offset) const {
    size_t idx = i + offset;
    if (idx >= src.size()) return '\0';
    return src[idx];
}
char Scanner::peek_next() const {
    return peek(1);
}

char Scanner::advance() {
    if (eof()) return '\0';
    char c = src[i++];
    if (c == '\n') {
        line++;
        col = 1;
    } else if (!is_utf8_continuation(c)) {
        // columns count code points, not bytes
        col++;
    }
    return c;
}

TokenLocation Scanner::location_at(int tok_line, int tok_col, size_t start_index) const {
    TokenLocation loc(filename, tok_line, tok_col, 0, src_mgr);
    loc.offset = start_index;
    loc.length = static_cast<int>(i - start_index);
    loc.end_line = line;
    loc.end_col = col;
    return loc;
}

void Scanner::fail(ErrorKind kind, const std::string& message, int tok_line, int tok_col, size_t start_index, int tok_length) const {
    TokenLocation loc(filename, tok_line, tok_col, tok_length, src_mgr);
    loc.offset = start_index;
    throw PytchError(kind, message, loc);
}

void Scanner::illegal_character(int tok_line, int tok_col, size_t start_index) {
    char c = peek();
    std::ostringstream ss;
    if (c == '\t') {
        ss << "I found a tab character here. Indentation and spacing must use spaces only.";
    } else if (c == '\r') {
        ss << "I found a carriage return here. Lines must end with '\\n' only.";
    } else if (is_forbidden_whitespace(c)) {
        ss << "I found a whitespace character (code " << (int)(unsigned char)c << ") that is not a space or a newline.";
    } else if (static_cast<unsigned char>(c) >= 0x80) {
        ss << "I found a non-ASCII character outside of a string or comment. Identifiers may only use ASCII letters, digits and '_'.";
    } else if (std::isprint(static_cast<unsigned char>(c))) {
        ss << "I don't recognize the character '" << c << "'.";
    } else {
        ss << "I found an unexpected control character (code " << (int)(unsigned char)c << ").";
    }
    fail(ErrorKind::IllegalCharacter, ss.str(), tok_line, tok_col, start_index);
}

// Prologue for a pass: byte-order mark plus any blank lines or comments
// before the first token all become that token's leading trivia.
void Scanner::begin() {
    started = true;
    if (skip_bom && src.size() >= 3 && (unsigned char)src[0] == 0xEF && (unsigned char)src[1] == 0xBB && (unsigned char)src[2] == 0xBF) {
        pending_leading.emplace_back(TriviumKind::BYTE_ORDER_MARK, src.substr(0, 3));
        // the mark does not occupy a column
        i = 3;
    }
    std::vector<Trivium> run = scan_trivia_run();
    pending_leading.insert(pending_leading.end(), run.begin(), run.end());
}

void Scanner::scan_comment(std::vector<Trivium>& out) {
    size_t start = i;
    while (!eof() && peek() != '\n') {
        if (is_forbidden_whitespace(peek())) {
            illegal_character(line, col, i);
        }
        advance();
    }
    out.emplace_back(TriviumKind::COMMENT, src.substr(start, i - start));
}

// Collects spaces, newlines and comments until the next significant
// character. Stops (without consuming) at anything else, including
// characters that are illegal; those are reported by scan_token.
std::vector<Trivium> Scanner::scan_trivia_run() {
    std::vector<Trivium> run;
    while (!eof()) {
        char c = peek();
        if (c == ' ') {
            size_t start = i;
            while (!eof() && peek() == ' ') advance();
            run.emplace_back(TriviumKind::WHITESPACE, src.substr(start, i - start));
        } else if (c == '\n') {
            advance();
            run.emplace_back(TriviumKind::NEWLINE, "\n");
        } else if (c == '#') {
            scan_comment(run);
        } else {
            break;
        }
    }
    return run;
}

Token Scanner::finish_token(TokenType type, const std::string& value, int tok_line, int tok_col, size_t start_index) {
    Token t{type, value, location_at(tok_line, tok_col, start_index)};
    t.text = src.substr(start_index, i - start_index);

    t.first_on_line = tok_line > last_token_line;
    if (t.first_on_line) {
        // everything before the token on its line is spaces
        current_line_indent = tok_col - 1;
    }
    t.line_indent = current_line_indent;
    last_token_line = tok_line;

    t.leading = std::move(pending_leading);
    pending_leading.clear();

    // Trailing trivia runs up to and including the last newline; whatever
    // follows it (the next line's indentation) leads the next token.
    std::vector<Trivium> run = scan_trivia_run();
    size_t split = 0;
    for (size_t k = 0; k < run.size(); ++k) {
        if (run[k].kind == TriviumKind::NEWLINE) split = k + 1;
    }
    t.trailing.assign(run.begin(), run.begin() + split);
    pending_leading.assign(run.begin() + split, run.end());
    return t;
}

Token Scanner::next_token() {
    if (done) return eof_token;
    if (!started) begin();

    if (eof()) {
        Token t{TokenType::EOF_TOKEN, "", location_at(line, col, i)};
        t.first_on_line = line > last_token_line;
        t.line_indent = t.first_on_line ? col - 1 : current_line_indent;
        t.leading = std::move(pending_leading);
        pending_leading.clear();
        done = true;
        eof_token = t;
        return t;
    }
    return scan_token();
}

std::vector<Token> Scanner::tokenize() {
    std::vector<Token> out;
    while (true) {
        out.push_back(next_token());
        if (out.back().type == TokenType::EOF_TOKEN) break;
    }
    return out;
}

Token Scanner::scan_token() {
    char c = peek();
    int tok_line = line;
    int tok_col = col;
    size_t start_index = i;

    // identifier or keyword
    if (is_ident_start(c)) {
        return scan_identifier_or_keyword(tok_line, tok_col, start_index);
    }

    if (std::isdigit((unsigned char)c)) {
        return scan_number(tok_line, tok_col, start_index);
    }

    if (c == '"' || c == '\'') {
        return scan_quoted_string(tok_line, tok_col, start_index, c);
    }

    switch (c) {
        case '+':
            advance();
            return finish_token(TokenType::PLUS, "+", tok_line, tok_col, start_index);
        case '-':
            advance();
            if (peek() == '>') {
                advance();
                return finish_token(TokenType::ARROW, "->", tok_line, tok_col, start_index);
            }
            return finish_token(TokenType::MINUS, "-", tok_line, tok_col, start_index);
        case '=':
            advance();
            return finish_token(TokenType::EQUALS, "=", tok_line, tok_col, start_index);
        case ',':
            advance();
            return finish_token(TokenType::COMMA, ",", tok_line, tok_col, start_index);
        case '(':
            advance();
            return finish_token(TokenType::LPAREN, "(", tok_line, tok_col, start_index);
        case ')':
            advance();
            return finish_token(TokenType::RPAREN, ")", tok_line, tok_col, start_index);
        case '.':
            if (peek_next() == '.' && peek(2) == '.') {
                advance();
                advance();
                advance();
                return finish_token(TokenType::ELLIPSIS, "...", tok_line, tok_col, start_index);
            }
            break;
        default:
            break;
    }

    // unknown char
    illegal_character(tok_line, tok_col, start_index);
}

Token Scanner::scan_number(int tok_line, int tok_col, size_t start_index) {
    std::string val;
    IntegerValue number;
    while (!eof() && std::isdigit((unsigned char)peek())) {
        char d = advance();
        val.push_back(d);
        number.multiply_small(10);
        number.add_small(d - '0');
    }

    // "123abc" is a malformed identifier, not a number followed by a name
    if (is_ident_start(peek())) {
        std::ostringstream ss;
        ss << "I found the letter '" << peek() << "' directly after the number '" << val
           << "'. Identifiers cannot start with a digit.";
        fail(ErrorKind::IllegalCharacter, ss.str(), line, col, i);
    }

    return finish_token(TokenType::INT_LITERAL, number.to_string(), tok_line, tok_col, start_index);
}

Token Scanner::scan_identifier_or_keyword(int tok_line, int tok_col, size_t start_index) {
    std::string id;
    while (!eof() && is_ident_char(peek())) {
        id.push_back(advance());
    }

    static const std::unordered_map<std::string, TokenType> keywords = {
        {"and", TokenType::AND},
        {"def", TokenType::DEF},
        {"else", TokenType::ELSE},
        {"if", TokenType::IF},
        {"let", TokenType::LET},
        {"or", TokenType::OR},
        {"then", TokenType::THEN},
    };

    auto it = keywords.find(id);
    if (it != keywords.end()) {
        return finish_token(it->second, id, tok_line, tok_col, start_index);
    }
    return finish_token(TokenType::IDENTIFIER, id, tok_line, tok_col, start_index);
}

// Body items are matched one at a time: an ordinary character, or a backslash
// and the single character after it, which is kept as-is.
Token Scanner::scan_quoted_string(int tok_line, int tok_col, size_t start_index, char quote) {
    // skip opening quote
    advance();
    std::string val;

    auto unterminated = [&]() {
        std::ostringstream ss;
        ss << "I was expecting a closing " << quote << " for the string that starts here, but "
           << (eof() ? "the file ended" : "the line ended") << " first.";
        fail(ErrorKind::UnterminatedString, ss.str(), tok_line, tok_col, start_index);
    };

    while (true) {
        if (eof() || peek() == '\n') {
            unterminated();
        }

        char c = peek();
        if (c == quote) {
            advance();
            break;
        }

        if (c == '\\') {
            int esc_line = line;
            int esc_col = col;
            size_t esc_index = i;
            advance();  // consume backslash
            if (eof()) {
                fail(ErrorKind::BadEscapeAtEof,
                    "I found a '\\' escape at the very end of the file. It needs a character after it.",
                    esc_line, esc_col, esc_index);
            }
            if (peek() == '\n') {
                unterminated();
            }
            if (is_forbidden_whitespace(peek())) {
                illegal_character(line, col, i);
            }
            // take the escaped character literally (whole UTF-8 sequence)
            val.push_back(advance());
            while (!eof() && is_utf8_continuation(peek())) val.push_back(advance());
            continue;
        }

        if (is_forbidden_whitespace(c)) {
            illegal_character(line, col, i);
        }

        val.push_back(advance());
    }

    return finish_token(TokenType::STRING, val, tok_line, tok_col, start_index);
}

}  // namespace pytch
