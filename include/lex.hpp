#pragma once

#include <memory>
#include <string>
#include <vector>

#include "SourceManager.hpp"
#include "scan_options.hpp"
#include "token.hpp"

namespace pytch {

// Result of running the scanner and preparser over a whole buffer.
struct Lexation {
    // Owns the text the token locations refer to.
    std::unique_ptr<SourceManager> source;
    std::vector<Token> tokens;
    // Summed full width of the raw tokens; equals the source size.
    size_t raw_width = 0;

    // One line per token and trivium:
    //   leading whitespace '  '
    //   IDENT 'foo'
    //   trailing newline '\n'
    std::string render() const;
};

// Scans and preparses `source`. Throws PytchError on the first lexical or
// bracket error, and std::logic_error if the raw tokens do not cover the
// source exactly.
Lexation lex(const std::string& source, const ScanOptions& options = ScanOptions());

}  // namespace pytch
