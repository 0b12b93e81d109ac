#pragma once

#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "PytchError.hpp"
#include "scan_options.hpp"
#include "scanner.hpp"
#include "token.hpp"

namespace pytch {

// What pushed an indentation stack entry.
enum class ConstructKind {
    BINDING,      // 'let'
    CONDITIONAL,  // 'if'
    BRACKET,      // '('
    LINE_START    // first token of a statement line
};

struct IndentationStackEntry {
    ConstructKind construct = ConstructKind::LINE_START;
    int indentation_level = 0;  // always 0 for BRACKET
    int line = 0;
    TokenLocation opener;  // token that pushed the entry
};

// Dummy tokens a construct emits when its entry is popped.
struct ConstructRule {
    ConstructKind construct;
    const char* name;
    // popped because a later line starts at the same indentation
    std::optional<TokenType> on_replace;
    // popped by a dedent, a closing bracket or the end of input
    std::optional<TokenType> on_unwind;
    // the same-level line belongs to this construct (a binding's body, or the
    // statement replacing a line start), so replacement stops after it
    bool ends_replacement;
};

const ConstructRule& construct_rule(ConstructKind kind);

// Construct a raw token opens, if any.
std::optional<ConstructKind> construct_for(TokenType type);

const char* construct_kind_name(ConstructKind kind);

// Pulls raw tokens from a Scanner and inserts the synthetic SEMICOLON, IN and
// $endif tokens implied by indentation, so the parser sees a layout-free stream.
class Preparser {
   public:
    explicit Preparser(Scanner& scanner, const ScanOptions& options = ScanOptions(), std::ostream* trace_out = nullptr);

    // Next augmented token. EOF_TOKEN is returned last, and on every call after.
    // Throws PytchError; once an error has been thrown it is thrown again on
    // every later call.
    Token next();

    // Drains the remaining stream.
    std::vector<Token> run();

    // Rewinds the scanner and clears all state for a fresh pass.
    void reset();

    bool finished() const { return done && pending.empty(); }
    const std::vector<IndentationStackEntry>& stack() const { return stack_; }

    // Summed full width (text plus trivia) of the raw tokens consumed so far.
    size_t raw_width() const { return raw_width_; }

   private:
    Scanner& scanner;
    std::ostream* trace_out;
    bool color;

    std::vector<IndentationStackEntry> stack_;
    std::deque<Token> pending;

    bool done = false;
    Token eof_token;
    TokenType last_raw_type = TokenType::EOF_TOKEN;
    std::optional<PytchError> error;
    size_t raw_width_ = 0;

    void process(const Token& raw);
    void start_line(const Token& t);
    void continue_conditional(const Token& t);
    void close_bracket(const Token& t);
    void finish(const Token& eof);
    bool opens_body(int indent) const;

    void push(ConstructKind construct, int level, const Token& at);
    void pop(const std::optional<TokenType>& dummy, const Token& at);
    void emit_dummy(TokenType type, const Token& at);

    void trace(const std::string& action, const IndentationStackEntry& entry) const;
};

}  // namespace pytch
