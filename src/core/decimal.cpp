#include "core/decimal.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>
#include <algorithm>

namespace orabridge {

namespace {

// Exponents beyond this would expand into absurd plain renderings
constexpr int64_t MAX_EXPONENT = 4096;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

Result<Decimal> invalid(std::string_view text) {
    return Result<Decimal>::error(ErrorCategory::CONVERSION_ERROR,
        std::format("invalid decimal literal: '{}'", text));
}

} // anonymous namespace

Result<Decimal> Decimal::parse(std::string_view text) {
    std::string_view sv = text;
    if (sv.empty()) {
        return invalid(text);
    }

    Decimal dec;

    if (sv.front() == '+' || sv.front() == '-') {
        dec.negative_ = (sv.front() == '-');
        sv.remove_prefix(1);
    }

    std::string digits;
    digits.reserve(sv.size());
    size_t int_digits = 0;
    size_t frac_digits = 0;
    bool seen_point = false;

    size_t i = 0;
    for (; i < sv.size(); ++i) {
        const char c = sv[i];
        if (is_digit(c)) {
            digits.push_back(c);
            if (seen_point) ++frac_digits; else ++int_digits;
        } else if (c == '.' && !seen_point) {
            seen_point = true;
        } else {
            break;
        }
    }

    if (int_digits == 0 && frac_digits == 0) {
        return invalid(text);
    }

    int64_t exponent = 0;
    if (i < sv.size()) {
        if (sv[i] != 'e' && sv[i] != 'E') {
            return invalid(text);
        }
        std::string_view exp_part = sv.substr(i + 1);
        if (!exp_part.empty() && exp_part.front() == '+') {
            exp_part.remove_prefix(1);
        }
        const auto parsed = utils::try_parse_int<int64_t>(exp_part);
        if (!parsed || *parsed > MAX_EXPONENT || *parsed < -MAX_EXPONENT) {
            return invalid(text);
        }
        exponent = *parsed;
    }

    const auto first_nonzero = digits.find_first_not_of('0');
    dec.unscaled_ = (first_nonzero == std::string::npos)
        ? std::string("0")
        : digits.substr(first_nonzero);
    dec.scale_ = static_cast<int64_t>(frac_digits) - exponent;

    if (dec.is_zero()) {
        dec.negative_ = false;
    }
    return Result<Decimal>::ok(std::move(dec));
}

bool Decimal::is_integer() const {
    if (scale_ <= 0 || is_zero()) {
        return true;
    }
    const auto n = static_cast<int64_t>(unscaled_.size());
    const int64_t frac = std::min(scale_, n);
    for (int64_t k = n - frac; k < n; ++k) {
        if (unscaled_[static_cast<size_t>(k)] != '0') {
            return false;
        }
    }
    return true;
}

std::string Decimal::to_integer_string() const {
    std::string out;
    if (scale_ <= 0) {
        out = unscaled_;
        if (!is_zero()) {
            out.append(static_cast<size_t>(-scale_), '0');
        }
    } else {
        const auto n = static_cast<int64_t>(unscaled_.size());
        out = (scale_ >= n) ? std::string("0")
                            : unscaled_.substr(0, static_cast<size_t>(n - scale_));
    }
    if (negative_ && out != "0") {
        out.insert(out.begin(), '-');
    }
    return out;
}

std::string Decimal::to_string() const {
    std::string out;
    if (negative_) {
        out.push_back('-');
    }

    if (scale_ <= 0) {
        out += unscaled_;
        if (!is_zero()) {
            out.append(static_cast<size_t>(-scale_), '0');
        }
        return out;
    }

    const auto n = static_cast<int64_t>(unscaled_.size());
    if (scale_ >= n) {
        out += "0.";
        out.append(static_cast<size_t>(scale_ - n), '0');
        out += unscaled_;
    } else {
        const auto split = static_cast<size_t>(n - scale_);
        out.append(unscaled_, 0, split);
        out.push_back('.');
        out.append(unscaled_, split, std::string::npos);
    }
    return out;
}

} // namespace orabridge
