#include <mcpline/tools/calculator.hpp>

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace mcpline {

namespace {

using Int = std::int64_t;

constexpr Int kIntMax = std::numeric_limits<Int>::max();
constexpr Int kIntMin = std::numeric_limits<Int>::min();

// Nesting limit for signs and parentheses; bounds the parser's recursion.
constexpr int kMaxDepth = 200;

// Raised inside the parser, converted to an Err at the EvaluateExpression
// boundary.
class CalcFault : public std::runtime_error {
public:
    explicit CalcFault(const std::string& reason) : std::runtime_error(reason) {}
};

[[noreturn]] void Fail(const std::string& reason) {
    throw CalcFault(reason);
}

bool IsInt(const Number& n) { return std::holds_alternative<Int>(n); }

double AsReal(const Number& n) {
    return IsInt(n) ? static_cast<double>(std::get<Int>(n)) : std::get<double>(n);
}

bool IsZero(const Number& n) {
    return IsInt(n) ? std::get<Int>(n) == 0 : std::get<double>(n) == 0.0;
}

// -- Integer arithmetic with overflow detection -----------------------------

Int CheckedAdd(Int a, Int b) {
    if ((b > 0 && a > kIntMax - b) || (b < 0 && a < kIntMin - b)) {
        Fail("integer overflow");
    }
    return a + b;
}

Int CheckedSub(Int a, Int b) {
    if ((b < 0 && a > kIntMax + b) || (b > 0 && a < kIntMin + b)) {
        Fail("integer overflow");
    }
    return a - b;
}

Int CheckedMul(Int a, Int b) {
    if (a == 0 || b == 0) return 0;
    if ((a == -1 && b == kIntMin) || (b == -1 && a == kIntMin)) {
        Fail("integer overflow");
    }
    if (a == -1) return -b;
    if (b == -1) return -a;
    Int result = a * b;  // checked below
    if (result / b != a) {
        Fail("integer overflow");
    }
    return result;
}

Int CheckedPow(Int base, Int exponent) {
    Int result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = CheckedMul(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = CheckedMul(base, base);
        }
    }
    return result;
}

// -- Operators ---------------------------------------------------------------

Number Negate(const Number& a) {
    if (IsInt(a)) {
        auto v = std::get<Int>(a);
        if (v == kIntMin) Fail("integer overflow");
        return -v;
    }
    return -std::get<double>(a);
}

Number Add(const Number& a, const Number& b) {
    if (IsInt(a) && IsInt(b)) return CheckedAdd(std::get<Int>(a), std::get<Int>(b));
    return AsReal(a) + AsReal(b);
}

Number Subtract(const Number& a, const Number& b) {
    if (IsInt(a) && IsInt(b)) return CheckedSub(std::get<Int>(a), std::get<Int>(b));
    return AsReal(a) - AsReal(b);
}

Number Multiply(const Number& a, const Number& b) {
    if (IsInt(a) && IsInt(b)) return CheckedMul(std::get<Int>(a), std::get<Int>(b));
    return AsReal(a) * AsReal(b);
}

Number Divide(const Number& a, const Number& b) {
    if (IsZero(b)) {
        Fail(IsInt(a) && IsInt(b) ? "division by zero" : "float division by zero");
    }
    return AsReal(a) / AsReal(b);
}

Number FloorDivide(const Number& a, const Number& b) {
    if (IsInt(a) && IsInt(b)) {
        auto x = std::get<Int>(a);
        auto y = std::get<Int>(b);
        if (y == 0) Fail("integer division or modulo by zero");
        if (x == kIntMin && y == -1) Fail("integer overflow");
        Int q = x / y;
        if (x % y != 0 && ((x < 0) != (y < 0))) {
            --q;
        }
        return q;
    }
    if (IsZero(b)) Fail("float floor division by zero");
    return std::floor(AsReal(a) / AsReal(b));
}

Number Modulo(const Number& a, const Number& b) {
    if (IsInt(a) && IsInt(b)) {
        auto x = std::get<Int>(a);
        auto y = std::get<Int>(b);
        if (y == 0) Fail("integer modulo by zero");
        if (y == -1) return Int{0};
        Int r = x % y;
        if (r != 0 && ((r < 0) != (y < 0))) {
            r += y;
        }
        return r;
    }
    if (IsZero(b)) Fail("float modulo");
    double x = AsReal(a);
    double y = AsReal(b);
    double r = std::fmod(x, y);
    if (r != 0.0 && ((r < 0) != (y < 0))) {
        r += y;
    }
    return r;
}

Number Power(const Number& base, const Number& exponent) {
    if (IsInt(base) && IsInt(exponent) && std::get<Int>(exponent) >= 0) {
        return CheckedPow(std::get<Int>(base), std::get<Int>(exponent));
    }
    double b = AsReal(base);
    double e = AsReal(exponent);
    if (b == 0.0 && e < 0) {
        Fail("0.0 cannot be raised to a negative power");
    }
    if (b < 0 && std::floor(e) != e) {
        Fail("complex results are not supported");
    }
    double result = std::pow(b, e);
    if (std::isinf(result) && std::isfinite(b) && std::isfinite(e)) {
        Fail("numerical result out of range");
    }
    return result;
}

// -- Parser ------------------------------------------------------------------

class ExpressionParser {
    class DepthGuard {
    public:
        explicit DepthGuard(int& depth) : depth_(depth) {
            if (++depth_ > kMaxDepth) {
                --depth_;
                Fail("too many nested parentheses");
            }
        }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        int& depth_;
    };

public:
    explicit ExpressionParser(std::string_view text) : text_(text) {}

    Number ParseAll() {
        SkipSpace();
        if (AtEnd()) Fail("invalid syntax");
        auto value = ParseSum();
        SkipSpace();
        if (!AtEnd()) Fail("invalid syntax");
        return value;
    }

private:
    Number ParseSum() {
        auto value = ParseTerm();
        for (;;) {
            SkipSpace();
            if (Match("+")) {
                value = Add(value, ParseTerm());
            } else if (Match("-")) {
                value = Subtract(value, ParseTerm());
            } else {
                return value;
            }
        }
    }

    Number ParseTerm() {
        auto value = ParseUnary();
        for (;;) {
            SkipSpace();
            if (LookingAt("**")) {
                return value;
            }
            if (Match("//")) {
                value = FloorDivide(value, ParseUnary());
            } else if (Match("*")) {
                value = Multiply(value, ParseUnary());
            } else if (Match("/")) {
                value = Divide(value, ParseUnary());
            } else if (Match("%")) {
                value = Modulo(value, ParseUnary());
            } else {
                return value;
            }
        }
    }

    // Every nesting level (sign or parenthesis) passes through ParseUnary.
    Number ParseUnary() {
        DepthGuard guard(depth_);
        SkipSpace();
        if (Match("-")) return Negate(ParseUnary());
        if (Match("+")) return ParseUnary();
        return ParsePower();
    }

    Number ParsePower() {
        auto base = ParsePrimary();
        SkipSpace();
        if (Match("**")) {
            return Power(base, ParseUnary());
        }
        return base;
    }

    Number ParsePrimary() {
        SkipSpace();
        if (AtEnd()) Fail("invalid syntax");

        const char c = text_[pos_];
        if (c == '(') {
            ++pos_;
            auto value = ParseSum();
            SkipSpace();
            if (!Match(")")) Fail("invalid syntax");
            return value;
        }
        if (std::isdigit(static_cast<unsigned char>(c)) || c == '.') {
            return ParseNumber();
        }
        if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            auto start = pos_;
            while (!AtEnd() && (std::isalnum(static_cast<unsigned char>(text_[pos_])) ||
                                text_[pos_] == '_')) {
                ++pos_;
            }
            Fail("name '" + std::string(text_.substr(start, pos_ - start)) +
                 "' is not defined");
        }
        Fail("invalid syntax");
    }

    Number ParseNumber() {
        const auto start = pos_;
        bool real = false;
        std::size_t digits = 0;

        digits += SkipDigits();
        if (!AtEnd() && text_[pos_] == '.') {
            real = true;
            ++pos_;
            digits += SkipDigits();
        }
        if (digits == 0) Fail("invalid syntax");

        if (!AtEnd() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
            real = true;
            ++pos_;
            if (!AtEnd() && (text_[pos_] == '+' || text_[pos_] == '-')) ++pos_;
            if (SkipDigits() == 0) Fail("invalid syntax");
        }

        std::string literal;
        for (char c : text_.substr(start, pos_ - start)) {
            if (c != '_') literal.push_back(c);
        }
        if (real) {
            return std::strtod(literal.c_str(), nullptr);
        }
        if (literal.size() > 1 && literal[0] == '0' &&
            literal.find_first_not_of('0') != std::string::npos) {
            Fail("leading zeros in decimal integer literals are not permitted");
        }
        Int value = 0;
        for (char d : literal) {
            value = CheckedAdd(CheckedMul(value, 10), d - '0');
        }
        return value;
    }

    // Digits with single '_' separators between them ("1_000").
    std::size_t SkipDigits() {
        std::size_t count = 0;
        while (!AtEnd()) {
            if (IsDigitAt(pos_)) {
                ++pos_;
                ++count;
            } else if (text_[pos_] == '_' && count > 0 && IsDigitAt(pos_ + 1)) {
                ++pos_;
            } else {
                break;
            }
        }
        return count;
    }

    bool IsDigitAt(std::size_t i) const {
        return i < text_.size() && std::isdigit(static_cast<unsigned char>(text_[i]));
    }

    void SkipSpace() {
        while (!AtEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool LookingAt(std::string_view token) const {
        return text_.substr(pos_, token.size()) == token;
    }

    bool Match(std::string_view token) {
        if (!LookingAt(token)) return false;
        pos_ += token.size();
        return true;
    }

    bool AtEnd() const { return pos_ >= text_.size(); }

    std::string_view text_;
    std::size_t pos_ = 0;
    int depth_ = 0;
};

} // anonymous namespace

Result<Number, std::string> EvaluateExpression(std::string_view expression) {
    try {
        ExpressionParser parser(expression);
        return Result<Number, std::string>::Ok(parser.ParseAll());
    } catch (const CalcFault& fault) {
        return Result<Number, std::string>::Err(fault.what());
    }
}

std::string FormatReal(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value < 0 ? "-inf" : "inf";
    if (value == 0.0) return std::signbit(value) ? "-0.0" : "0.0";

    // Shortest scientific form that reads back to the same double.
    char buf[40];
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*e", precision - 1, value);
        if (std::strtod(buf, nullptr) == value) break;
    }

    std::string sci(buf);
    const bool negative = sci[0] == '-';
    if (negative) sci.erase(0, 1);

    const auto e_pos = sci.find('e');
    std::string digits;
    for (char c : sci.substr(0, e_pos)) {
        if (c != '.') digits.push_back(c);
    }
    while (digits.size() > 1 && digits.back() == '0') {
        digits.pop_back();
    }
    const int exponent = std::atoi(sci.c_str() + e_pos + 1);

    std::string out;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            const auto int_len = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= int_len) {
                out = digits + std::string(int_len - digits.size(), '0') + ".0";
            } else {
                out = digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        } else {
            out = "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
        }
    } else {
        out = digits.substr(0, 1);
        if (digits.size() > 1) {
            out += "." + digits.substr(1);
        }
        char exp_buf[8];
        std::snprintf(exp_buf, sizeof(exp_buf), "e%c%02d",
                      exponent < 0 ? '-' : '+', std::abs(exponent));
        out += exp_buf;
    }
    return negative ? "-" + out : out;
}

std::string FormatNumber(const Number& value) {
    if (IsInt(value)) {
        return std::to_string(std::get<Int>(value));
    }
    return FormatReal(std::get<double>(value));
}

} // namespace mcpline
