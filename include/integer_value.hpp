#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace pytch {

// Non-negative integer of unbounded width, kept as decimal ASCII digits
// (most-significant first, no leading zeros, "0" for zero).
class IntegerValue {
   public:
    IntegerValue() : digits_("0") {}

    // Throws std::invalid_argument unless `digits` is a non-empty run of [0-9].
    explicit IntegerValue(const std::string& digits);

    const std::string& to_string() const { return digits_; }
    size_t digit_count() const { return digits_.size(); }
    bool is_zero() const { return digits_ == "0"; }

    void multiply_small(int m);
    void add_small(int add);

    bool fits_int64() const;
    // Throws std::out_of_range when the value does not fit.
    int64_t to_int64() const;

    int compare(const IntegerValue& other) const;

    bool operator==(const IntegerValue& o) const { return digits_ == o.digits_; }
    bool operator!=(const IntegerValue& o) const { return digits_ != o.digits_; }
    bool operator<(const IntegerValue& o) const { return compare(o) < 0; }
    bool operator>(const IntegerValue& o) const { return compare(o) > 0; }
    bool operator<=(const IntegerValue& o) const { return compare(o) <= 0; }
    bool operator>=(const IntegerValue& o) const { return compare(o) >= 0; }

   private:
    std::string digits_;

    void strip_leading_zeros();
};

inline std::ostream& operator<<(std::ostream& os, const IntegerValue& v) {
    return os << v.to_string();
}

}  // namespace pytch
