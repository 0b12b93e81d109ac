#pragma once

#include <string>
#include <vector>

#include "PytchError.hpp"
#include "scan_options.hpp"
#include "token.hpp"

namespace pytch {

// Turns a UTF-8 buffer into raw tokens, one per next_token() call.
// Tokens carry their trivia, so the raw stream reproduces the source exactly.
class Scanner {
   public:
    Scanner(const std::string& source, const ScanOptions& options = ScanOptions(), const SourceManager* mgr = nullptr);

    // Next raw token; EOF_TOKEN once the input is exhausted (and on every call after).
    // Throws PytchError on a lexical error.
    Token next_token();

    // Drains the remaining input.
    std::vector<Token> tokenize();

    // Rewind to the start of the buffer for a fresh pass.
    void reset();

    bool finished() const { return done; }
    const std::string& source() const { return src; }

   private:
    const std::string src;
    const std::string filename;
    const bool skip_bom;
    const SourceManager* src_mgr;

    size_t i = 0;
    int line = 1;
    int col = 1;

    bool started = false;
    bool done = false;
    Token eof_token;

    // indentation of the current line, and the line of the last token produced
    int current_line_indent = 0;
    int last_token_line = 0;

    // trivia waiting to become the next token's leading trivia
    std::vector<Trivium> pending_leading;

    // helpers
    bool eof() const;
    char peek(size_t offset = 0) const;
    char peek_next() const;
    char advance();

    TokenLocation location_at(int tok_line, int tok_col, size_t start_index) const;
    [[noreturn]] void fail(ErrorKind kind, const std::string& message, int tok_line, int tok_col, size_t start_index, int tok_length = 1) const;

    void begin();
    std::vector<Trivium> scan_trivia_run();
    void scan_comment(std::vector<Trivium>& out);

    Token finish_token(TokenType type, const std::string& value, int tok_line, int tok_col, size_t start_index);

    Token scan_token();
    Token scan_number(int tok_line, int tok_col, size_t start_index);
    Token scan_identifier_or_keyword(int tok_line, int tok_col, size_t start_index);
    Token scan_quoted_string(int tok_line, int tok_col, size_t start_index, char quote);
    [[noreturn]] void illegal_character(int tok_line, int tok_col, size_t start_index);
};

// Characters that look like whitespace but are rejected anywhere in the input.
inline bool is_forbidden_whitespace(char c) {
    return c == '\t' || c == '\r' || c == '\f' || c == '\v';
}

}  // namespace pytch
