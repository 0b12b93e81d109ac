#include "token.hpp"

#include <numeric>
#include <stdexcept>

namespace pytch {

IntegerValue Token::int_value() const {
    if (type != TokenType::INT_LITERAL) {
        throw std::logic_error("int_value() called on a non-integer token at " + loc.to_string());
    }
    return IntegerValue(value);
}

static int trivia_width(const std::vector<Trivium>& trivia) {
    return std::accumulate(trivia.begin(), trivia.end(), 0,
        [](int acc, const Trivium& t) { return acc + t.width(); });
}

int Token::leading_width() const {
    return trivia_width(leading);
}

int Token::trailing_width() const {
    return trivia_width(trailing);
}

std::string Token::full_text() const {
    std::string out;
    for (const auto& t : leading) out += t.text;
    out += text;
    for (const auto& t : trailing) out += t.text;
    return out;
}

}  // namespace pytch
