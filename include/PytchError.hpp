#pragma once
#include <optional>
#include <stdexcept>
#include <string>

#include "token.hpp"

namespace pytch {

enum class ErrorKind {
    // scanner
    IllegalCharacter,
    UnterminatedString,
    BadEscapeAtEof,
    // preparser
    UnmatchedCloseBracket,
    UnclosedBracketAtEof
};

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IllegalCharacter: return "IllegalCharacter";
        case ErrorKind::UnterminatedString: return "UnterminatedString";
        case ErrorKind::BadEscapeAtEof: return "BadEscapeAtEof";
        case ErrorKind::UnmatchedCloseBracket: return "UnmatchedCloseBracket";
        case ErrorKind::UnclosedBracketAtEof: return "UnclosedBracketAtEof";
    }
    return "Error";
}

class PytchError : public std::runtime_error {
   public:
    PytchError(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc,
        std::optional<TokenLocation> opener = std::nullopt)
        : std::runtime_error(format_message(kind, message, loc, opener)),
          kind_(kind),
          message_(message),
          loc_(loc),
          opener_(std::move(opener)) {}

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    const TokenLocation& location() const { return loc_; }
    // Position of the unmatched opening bracket, for bracket errors.
    const std::optional<TokenLocation>& opener() const { return opener_; }

    // Drops the SourceManager references once what() has been formatted, for
    // errors that outlive the source they were raised against.
    void detach_source() {
        loc_.src_mgr = nullptr;
        if (opener_) opener_->src_mgr = nullptr;
    }

   private:
    ErrorKind kind_;
    std::string message_;
    TokenLocation loc_;
    std::optional<TokenLocation> opener_;

    static std::string format_message(ErrorKind kind,
        const std::string& message,
        const TokenLocation& loc,
        const std::optional<TokenLocation>& opener) {
        std::string out = std::string(error_kind_name(kind)) + " at " + loc.to_string() + "\n" +
            message + "\n" +
            " --> Traced at:\n" +
            loc.get_line_trace();
        if (opener) {
            out += "\n --> Opened at " + opener->to_string() + ":\n" + opener->get_line_trace();
        }
        return out;
    }
};

// Raised while reading pytch.json.
class PytchConfigError : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
};

}  // namespace pytch
