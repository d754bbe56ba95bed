#include "decimal.H"
#include "errors.H"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace perpdesk {

using int128 = __int128;

namespace {

constexpr int MAX_INPUT_FRACTION_DIGITS = 18;
constexpr int128 INT128_MAX_VALUE = static_cast<int128>(~static_cast<unsigned __int128>(0) >> 1);

int128 pow10(int exp) {
    int128 result = 1;
    for (int i = 0; i < exp; ++i) {
        result *= 10;
    }
    return result;
}

int128 divide_rounded(int128 num, int128 den, ROUNDING mode) {
    if (den == 0) {
        throw std::domain_error("Decimal division by zero");
    }

    bool negative = (num < 0) != (den < 0);
    int128 n = num < 0 ? -num : num;
    int128 d = den < 0 ? -den : den;
    int128 q = n / d;
    int128 r = n % d;

    if (r != 0) {
        switch (mode) {
            case ROUNDING::DOWN:
                break;
            case ROUNDING::UP:
                ++q;
                break;
            case ROUNDING::HALF_UP:
                if (r * 2 >= d) {
                    ++q;
                }
                break;
            case ROUNDING::HALF_EVEN:
                if (r * 2 > d || (r * 2 == d && (q & 1) != 0)) {
                    ++q;
                }
                break;
        }
    }
    return negative ? -q : q;
}

int64_t narrow(int128 v) {
    if (v > std::numeric_limits<int64_t>::max() || v < std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return static_cast<int64_t>(v);
}

Decimal parse_impl(std::string_view text, bool strict, ROUNDING mode) {
    if (text.empty()) {
        throw ValidationError("Invalid decimal: empty string");
    }

    size_t pos = 0;
    bool negative = false;
    if (text[0] == '-' || text[0] == '+') {
        negative = text[0] == '-';
        ++pos;
    }

    static const int128 MANTISSA_LIMIT = pow10(30);
    int128 mantissa = 0;
    int int_digits = 0;
    int frac_digits = 0;
    bool seen_dot = false;
    bool frac_nonzero_beyond_scale = false;

    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c == '.') {
            if (seen_dot) {
                throw ValidationError("Invalid decimal: " + std::string(text));
            }
            seen_dot = true;
            continue;
        }
        if (c < '0' || c > '9') {
            throw ValidationError("Invalid decimal: " + std::string(text));
        }

        if (seen_dot) {
            if (++frac_digits > MAX_INPUT_FRACTION_DIGITS) {
                throw ValidationError("Invalid decimal, too many digits: " + std::string(text));
            }
            if (frac_digits > Decimal::SCALE && c != '0') {
                frac_nonzero_beyond_scale = true;
            }
        } else {
            ++int_digits;
        }

        mantissa = mantissa * 10 + (c - '0');
        if (mantissa > MANTISSA_LIMIT) {
            throw ValidationError("Decimal out of range: " + std::string(text));
        }
    }

    if (int_digits + frac_digits == 0) {
        throw ValidationError("Invalid decimal: " + std::string(text));
    }

    if (strict && frac_nonzero_beyond_scale) {
        throw ValidationError("Decimal precision exceeds " + std::to_string(Decimal::SCALE) +
                              " decimals: " + std::string(text));
    }

    if (negative) {
        mantissa = -mantissa;
    }

    int128 scaled;
    if (frac_digits <= Decimal::SCALE) {
        scaled = mantissa * pow10(Decimal::SCALE - frac_digits);
    } else {
        scaled = divide_rounded(mantissa, pow10(frac_digits - Decimal::SCALE), mode);
    }

    try {
        return Decimal::from_raw(narrow(scaled));
    } catch (const std::overflow_error&) {
        throw ValidationError("Decimal out of range: " + std::string(text));
    }
}

} // namespace

Decimal::Decimal(int64_t whole) {
    value = narrow(static_cast<int128>(whole) * ONE);
}

Decimal::Decimal(std::string_view text) : Decimal(parse(text)) {}

Decimal Decimal::parse(std::string_view text) {
    return parse_impl(text, true, ROUNDING::DOWN);
}

Decimal Decimal::parse_rounded(std::string_view text, ROUNDING mode) {
    return parse_impl(text, false, mode);
}

Decimal Decimal::mul(Decimal a, Decimal b, ROUNDING mode) {
    int128 product = static_cast<int128>(a.value) * b.value;
    return from_raw(narrow(divide_rounded(product, ONE, mode)));
}

Decimal Decimal::div(Decimal a, Decimal b, ROUNDING mode) {
    int128 num = static_cast<int128>(a.value) * ONE;
    return from_raw(narrow(divide_rounded(num, b.value, mode)));
}

Decimal Decimal::mul_div(Decimal a, Decimal b, Decimal c, ROUNDING mode) {
    int128 num = static_cast<int128>(a.value) * b.value;
    return from_raw(narrow(divide_rounded(num, c.value, mode)));
}

Decimal Decimal::mul3(Decimal a, Decimal b, Decimal c, ROUNDING mode) {
    int128 ab = static_cast<int128>(a.value) * b.value;
    if (c.value != 0) {
        int128 limit = INT128_MAX_VALUE / (c.value < 0 ? -static_cast<int128>(c.value) : c.value);
        if ((ab < 0 ? -ab : ab) > limit) {
            throw std::overflow_error("Decimal overflow");
        }
    }
    return from_raw(narrow(divide_rounded(ab * c.value, static_cast<int128>(ONE) * ONE, mode)));
}

Decimal Decimal::weighted_average(Decimal q1, Decimal p1, Decimal q2, Decimal p2, ROUNDING mode) {
    int128 num = static_cast<int128>(q1.value) * p1.value + static_cast<int128>(q2.value) * p2.value;
    int128 den = static_cast<int128>(q1.value) + q2.value;
    return from_raw(narrow(divide_rounded(num, den, mode)));
}

Decimal Decimal::round(int places, ROUNDING mode) const {
    if (places < 0 || places > SCALE) {
        throw std::invalid_argument("Decimal places out of range: " + std::to_string(places));
    }
    int128 factor = pow10(SCALE - places);
    return from_raw(narrow(divide_rounded(value, factor, mode) * factor));
}

int Decimal::decimal_places() const {
    int64_t frac = value % ONE;
    if (frac == 0) {
        return 0;
    }
    if (frac < 0) {
        frac = -frac;
    }
    int places = SCALE;
    while (frac % 10 == 0) {
        frac /= 10;
        --places;
    }
    return places;
}

Decimal Decimal::abs() const {
    return value < 0 ? -*this : *this;
}

std::string Decimal::to_string() const {
    std::string text = to_string(SCALE);
    if (text.find('.') != std::string::npos) {
        while (text.back() == '0') {
            text.pop_back();
        }
        if (text.back() == '.') {
            text.pop_back();
        }
    }
    return text;
}

std::string Decimal::to_string(int places) const {
    Decimal rounded = round(places);
    int128 v = rounded.value;
    bool negative = v < 0;
    if (negative) {
        v = -v;
    }

    int64_t whole = static_cast<int64_t>(v / ONE);
    int64_t frac = static_cast<int64_t>(v % ONE);

    std::string text = negative ? "-" : "";
    text += std::to_string(whole);
    if (places > 0) {
        std::string digits = std::to_string(frac);
        digits.insert(0, SCALE - digits.size(), '0');
        text += '.';
        text += digits.substr(0, places);
    }
    return text;
}

Decimal Decimal::operator-() const {
    if (value == std::numeric_limits<int64_t>::min()) {
        throw std::overflow_error("Decimal overflow");
    }
    return from_raw(-value);
}

Decimal Decimal::operator+(Decimal other) const {
    int64_t result;
    if (__builtin_add_overflow(value, other.value, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    return from_raw(result);
}

Decimal Decimal::operator-(Decimal other) const {
    int64_t result;
    if (__builtin_sub_overflow(value, other.value, &result)) {
        throw std::overflow_error("Decimal overflow");
    }
    return from_raw(result);
}

Decimal& Decimal::operator+=(Decimal other) {
    *this = *this + other;
    return *this;
}

Decimal& Decimal::operator-=(Decimal other) {
    *this = *this - other;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Decimal& d) {
    return os << d.to_string();
}

Notional Notional::of(Decimal quantity, Decimal price) {
    Notional n;
    n.add(quantity, price);
    return n;
}

void Notional::add(Decimal quantity, Decimal price) {
    int128 term = static_cast<int128>(quantity.raw()) * price.raw();
    int128 sum;
    if (__builtin_add_overflow(raw, term, &sum)) {
        throw std::overflow_error("Notional overflow");
    }
    raw = sum;
}

Decimal Notional::average(Decimal quantity, ROUNDING mode) const {
    return Decimal::from_raw(narrow(divide_rounded(raw, quantity.raw(), mode)));
}

} // namespace perpdesk
