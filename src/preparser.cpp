#include "preparser.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include "colors.hpp"
#include "print_debug.hpp"

namespace pytch {

const ConstructRule& construct_rule(ConstructKind kind) {
    // indexed by ConstructKind
    static const ConstructRule rules[] = {
        {ConstructKind::BINDING, "let", TokenType::DUMMY_IN, TokenType::DUMMY_IN, true},
        {ConstructKind::CONDITIONAL, "if", TokenType::DUMMY_ENDIF, TokenType::DUMMY_ENDIF, false},
        {ConstructKind::BRACKET, "bracket", std::nullopt, std::nullopt, true},
        {ConstructKind::LINE_START, "line", TokenType::SEMICOLON, std::nullopt, true},
    };
    return rules[static_cast<size_t>(kind)];
}

std::optional<ConstructKind> construct_for(TokenType type) {
    switch (type) {
        case TokenType::LET: return ConstructKind::BINDING;
        case TokenType::IF: return ConstructKind::CONDITIONAL;
        case TokenType::LPAREN: return ConstructKind::BRACKET;
        default: return std::nullopt;
    }
}

const char* construct_kind_name(ConstructKind kind) {
    switch (kind) {
        case ConstructKind::BINDING: return "BINDING";
        case ConstructKind::CONDITIONAL: return "CONDITIONAL";
        case ConstructKind::BRACKET: return "BRACKET";
        case ConstructKind::LINE_START: return "LINE_START";
    }
    return "?";
}

Preparser::Preparser(Scanner& scanner, const ScanOptions& options, std::ostream* trace_out)
    : scanner(scanner),
      trace_out(options.trace_preparser ? (trace_out ? trace_out : &std::cerr) : nullptr),
      color(options.color_diagnostics) {}

void Preparser::reset() {
    scanner.reset();
    stack_.clear();
    pending.clear();
    done = false;
    eof_token = Token();
    last_raw_type = TokenType::EOF_TOKEN;
    error.reset();
    raw_width_ = 0;
}

Token Preparser::next() {
    if (error) throw *error;

    while (pending.empty()) {
        if (done) return eof_token;
        try {
            process(scanner.next_token());
        } catch (const PytchError& e) {
            error.emplace(e);
            pending.clear();
            throw;
        }
    }

    Token t = std::move(pending.front());
    pending.pop_front();
    return t;
}

std::vector<Token> Preparser::run() {
    std::vector<Token> out;
    while (true) {
        out.push_back(next());
        if (out.back().type == TokenType::EOF_TOKEN) break;
    }
    return out;
}

void Preparser::process(const Token& raw) {
    raw_width_ += static_cast<size_t>(raw.full_width());

    if (raw.type == TokenType::EOF_TOKEN) {
        finish(raw);
        return;
    }

    if (raw.type == TokenType::RPAREN) {
        close_bracket(raw);
    } else {
        if (raw.first_on_line) {
            if (raw.type == TokenType::THEN || raw.type == TokenType::ELSE)
                continue_conditional(raw);
            else
                start_line(raw);
        }

        if (auto construct = construct_for(raw.type)) {
            int level = *construct == ConstructKind::BRACKET ? 0 : raw.line_indent;
            push(*construct, level, raw);
        }

        pending.push_back(raw);
    }
    last_raw_type = raw.type;
}

// True when the previous line ended on the token that opens a let or if body,
// so a deeper line is the first statement of that body.
bool Preparser::opens_body(int indent) const {
    if (stack_.empty()) return false;
    const IndentationStackEntry& top = stack_.back();
    if (top.construct != ConstructKind::BINDING && top.construct != ConstructKind::CONDITIONAL) return false;
    if (top.indentation_level >= indent) return false;
    if (top.construct == ConstructKind::BINDING) return last_raw_type == TokenType::EQUALS;
    return last_raw_type == TokenType::THEN || last_raw_type == TokenType::ELSE;
}

// Layout rules for the first token of a line: close whatever the dedent
// ended, then let a same-level line replace the statement before it.
void Preparser::start_line(const Token& t) {
    const int line = t.line();
    const int indent = t.line_indent;

    while (!stack_.empty()) {
        const IndentationStackEntry& top = stack_.back();
        if (top.construct == ConstructKind::BRACKET || top.indentation_level <= indent || top.line >= line) break;
        pop(construct_rule(top.construct).on_unwind, t);
    }

    bool replaced = false;
    while (!stack_.empty()) {
        const IndentationStackEntry& top = stack_.back();
        if (top.construct == ConstructKind::BRACKET || top.indentation_level != indent || top.line >= line) break;
        const ConstructRule& rule = construct_rule(top.construct);
        pop(rule.on_replace, t);
        replaced = true;
        if (rule.ends_replacement) break;
    }

    // Any other deeper line continues the expression above it. Lines inside
    // a bracket continue the bracketed expression.
    bool in_bracket = !stack_.empty() && stack_.back().construct == ConstructKind::BRACKET;
    if (!in_bracket && (stack_.empty() || replaced || opens_body(indent))) {
        push(ConstructKind::LINE_START, indent, t);
    }
}

// A line starting with 'then' or 'else' belongs to the nearest open 'if' at
// or left of its indentation; deeper constructs are closed first.
void Preparser::continue_conditional(const Token& t) {
    const int line = t.line();
    const int indent = t.line_indent;

    while (!stack_.empty()) {
        const IndentationStackEntry& top = stack_.back();
        if (top.construct == ConstructKind::BRACKET || top.line >= line) break;
        if (top.indentation_level < indent) break;
        if (top.construct == ConstructKind::CONDITIONAL && top.indentation_level == indent) break;
        pop(construct_rule(top.construct).on_unwind, t);
    }
}

void Preparser::close_bracket(const Token& t) {
    bool has_bracket = std::any_of(stack_.begin(), stack_.end(),
        [](const IndentationStackEntry& e) { return e.construct == ConstructKind::BRACKET; });
    if (!has_bracket) {
        throw PytchError(ErrorKind::UnmatchedCloseBracket,
            "I found a ')' here, but there is no '(' for it to close.", t.loc);
    }

    while (stack_.back().construct != ConstructKind::BRACKET) {
        pop(construct_rule(stack_.back().construct).on_unwind, t);
    }
    trace("close", stack_.back());
    stack_.pop_back();

    pending.push_back(t);
}

void Preparser::finish(const Token& eof) {
    auto open = std::find_if(stack_.rbegin(), stack_.rend(),
        [](const IndentationStackEntry& e) { return e.construct == ConstructKind::BRACKET; });
    if (open != stack_.rend()) {
        std::ostringstream ss;
        ss << "The file ended, but the '(' opened at " << open->opener.to_string() << " was never closed.";
        throw PytchError(ErrorKind::UnclosedBracketAtEof, ss.str(), eof.loc, open->opener);
    }

    while (!stack_.empty()) {
        pop(construct_rule(stack_.back().construct).on_unwind, eof);
    }

    pending.push_back(eof);
    eof_token = eof;
    done = true;
}

void Preparser::push(ConstructKind construct, int level, const Token& at) {
    IndentationStackEntry entry;
    entry.construct = construct;
    entry.indentation_level = level;
    entry.line = at.line();
    entry.opener = at.loc;
    stack_.push_back(entry);
    trace("push", entry);
}

void Preparser::pop(const std::optional<TokenType>& dummy, const Token& at) {
    trace("pop", stack_.back());
    stack_.pop_back();
    if (dummy) emit_dummy(*dummy, at);
}

// Synthetic tokens sit, zero-width, where the token that triggered them starts.
void Preparser::emit_dummy(TokenType type, const Token& at) {
    Token t{type, "", at.loc.collapsed()};
    t.line_indent = at.line_indent;
    pending.push_back(t);
    if (trace_out) {
        *trace_out << Color::paint(color, Color::bright_black, "[preparser] ")
                   << Color::paint(color, Color::green, std::string("emit ") + token_name(type))
                   << " at " << at.loc.to_string() << "\n";
    }
}

void Preparser::trace(const std::string& action, const IndentationStackEntry& entry) const {
    if (!trace_out) return;
    *trace_out << Color::paint(color, Color::bright_black, "[preparser] ")
               << Color::paint(color, Color::cyan, action + " " + construct_kind_name(entry.construct))
               << " level=" << entry.indentation_level << " line=" << entry.line
               << " depth=" << stack_.size() << "\n";
}

}  // namespace pytch
