#include "integer_value.hpp"

#include <stdexcept>

namespace pytch {

namespace {
const std::string kInt64Max = "9223372036854775807";
}

IntegerValue::IntegerValue(const std::string& digits) : digits_(digits) {
    if (digits_.empty()) {
        throw std::invalid_argument("IntegerValue: empty digit string");
    }
    for (char c : digits_) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("IntegerValue: invalid digit '" + std::string(1, c) + "' in '" + digits + "'");
        }
    }
    strip_leading_zeros();
}

void IntegerValue::strip_leading_zeros() {
    size_t first = digits_.find_first_not_of('0');
    if (first == std::string::npos) {
        digits_ = "0";
    } else if (first > 0) {
        digits_.erase(0, first);
    }
}

void IntegerValue::multiply_small(int m) {
    if (m < 0) throw std::invalid_argument("IntegerValue: negative multiplier");
    if (m == 0 || is_zero()) {
        digits_ = "0";
        return;
    }
    long long carry = 0;
    for (int i = (int)digits_.size() - 1; i >= 0; --i) {
        int d = digits_[i] - '0';
        long long prod = 1LL * d * m + carry;
        digits_[i] = char('0' + (prod % 10));
        carry = prod / 10;
    }
    while (carry > 0) {
        digits_.insert(digits_.begin(), char('0' + (carry % 10)));
        carry /= 10;
    }
}

void IntegerValue::add_small(int add) {
    if (add < 0) throw std::invalid_argument("IntegerValue: negative addend");
    long long carry = add;
    for (int i = (int)digits_.size() - 1; i >= 0 && carry > 0; --i) {
        long long sum = (digits_[i] - '0') + carry;
        digits_[i] = char('0' + (sum % 10));
        carry = sum / 10;
    }
    while (carry > 0) {
        digits_.insert(digits_.begin(), char('0' + (carry % 10)));
        carry /= 10;
    }
}

int IntegerValue::compare(const IntegerValue& other) const {
    if (digits_.size() != other.digits_.size()) {
        return digits_.size() < other.digits_.size() ? -1 : 1;
    }
    int c = digits_.compare(other.digits_);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

bool IntegerValue::fits_int64() const {
    if (digits_.size() != kInt64Max.size()) return digits_.size() < kInt64Max.size();
    return digits_ <= kInt64Max;
}

int64_t IntegerValue::to_int64() const {
    if (!fits_int64()) {
        throw std::out_of_range("integer literal " + digits_ + " does not fit in 64 bits");
    }
    int64_t v = 0;
    for (char c : digits_) v = v * 10 + (c - '0');
    return v;
}

}  // namespace pytch
