#include "lex.hpp"

#include <sstream>
#include <stdexcept>

#include "PytchError.hpp"
#include "preparser.hpp"
#include "print_debug.hpp"
#include "scanner.hpp"

namespace pytch {

static std::string quoted(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
            case '\n': out += "\\n"; break;
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            default: out.push_back(c);
        }
    }
    out += "'";
    return out;
}

// Tokens whose value is implied by their kind are rendered without it.
static bool has_fixed_text(TokenType t) {
    switch (t) {
        case TokenType::IDENTIFIER:
        case TokenType::INT_LITERAL:
        case TokenType::STRING:
            return false;
        default:
            return true;
    }
}

std::string Lexation::render() const {
    std::ostringstream out;
    for (const auto& tok : tokens) {
        for (const auto& t : tok.leading) {
            out << "leading " << trivium_kind_name(t.kind) << " " << quoted(t.text) << "\n";
        }
        out << token_name(tok.type);
        if (!has_fixed_text(tok.type)) out << " " << quoted(tok.value);
        out << "\n";
        for (const auto& t : tok.trailing) {
            out << "trailing " << trivium_kind_name(t.kind) << " " << quoted(t.text) << "\n";
        }
    }
    return out.str();
}

Lexation lex(const std::string& source, const ScanOptions& options) {
    Lexation result;
    result.source = std::make_unique<SourceManager>(options.filename, source);

    Scanner scanner(source, options, result.source.get());
    Preparser preparser(scanner, options);
    try {
        result.tokens = preparser.run();
    } catch (PytchError& e) {
        // the message already carries the source trace
        e.detach_source();
        throw;
    }
    result.raw_width = preparser.raw_width();

    if (result.raw_width != source.size()) {
        std::ostringstream ss;
        ss << "Mismatch between source code length (" << source.size()
           << ") and total length of scanned tokens (" << result.raw_width
           << ") in " << options.filename << ". The token stream for this file is probably incorrect.";
        throw std::logic_error(ss.str());
    }

    return result;
}

}  // namespace pytch
