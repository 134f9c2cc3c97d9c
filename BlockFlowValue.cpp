// BlockFlowValue.cpp
#include "BlockFlowValue.hpp"
#include "BlockFlowLog.hpp"
#include <fmt/format.h>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <locale>
#include <stdexcept>

namespace BlockFlow {

const char* const kMissingValueText = "—";

namespace {

bool sameNumber(double a, double b) {
    return a == b || (std::isnan(a) && std::isnan(b));
}

bool sameNumbers(const std::vector<double>& a, const std::vector<double>& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!sameNumber(a[i], b[i])) return false;
    }
    return true;
}

// "1.2346e+06" -> "1.2346e+6"
std::string trimExponent(std::string s) {
    auto e = s.find_first_of("eE");
    if (e == std::string::npos) return s;
    size_t digits = e + 1;
    if (digits < s.size() && (s[digits] == '+' || s[digits] == '-')) ++digits;
    size_t firstNonZero = digits;
    while (firstNonZero + 1 < s.size() && s[firstNonZero] == '0') ++firstNonZero;
    s.erase(digits, firstNonZero - digits);
    return s;
}

// Shortest round-trip text, spelled the way the display layer expects
// (NaN, Infinity, no "-0").
std::string plainNumber(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n > 0 ? "Infinity" : "-Infinity";
    if (n == 0.0) return "0";
    return trimExponent(fmt::format("{}", n));
}

std::string joinNumbers(const std::vector<double>& values, const char* sep) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) out += sep;
        out += plainNumber(values[i]);
    }
    return out;
}

// NaN and the infinities have no JSON number form; exactly integral values
// within 2^53 export as integers ("7", not "7.0").
nlohmann::json numberToJson(double n) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n > 0 ? "Infinity" : "-Infinity";
    if (std::trunc(n) == n && std::fabs(n) <= 9007199254740992.0) return static_cast<std::int64_t>(n);
    return n;
}

nlohmann::json numbersToJson(const std::vector<double>& values) {
    nlohmann::json out = nlohmann::json::array();
    for (double x : values) out.push_back(numberToJson(x));
    return out;
}

std::string compactScalar(double n, const std::string& locale) {
    if (std::isnan(n)) return "NaN";
    if (std::isinf(n)) return n > 0 ? "+∞" : "−∞";
    const double mag = std::fabs(n);
    if (mag == 0.0) return "0";
    // Scientific notation stays locale-neutral.
    if (mag >= 1e6 || mag < 1e-3) return trimExponent(fmt::format("{:.4e}", n));
    // Six significant digits can carry 999999.5 up to 1e6; that stays in fixed notation.
    const std::string neutral = fmt::format("{:.6g}", n);
    const bool carried = neutral.find('e') != std::string::npos;
    const double rounded = carried ? std::strtod(neutral.c_str(), nullptr) : n;
    if (!locale.empty()) {
        try {
            const std::locale loc(locale);
            return carried ? fmt::format(loc, "{:.0Lf}", rounded) : fmt::format(loc, "{:.6Lg}", n);
        } catch (const std::runtime_error&) {
            logDebug("value", "Unknown locale '{}', using neutral format", locale);
        }
    }
    return carried ? fmt::format("{:.0f}", rounded) : neutral;
}

} // namespace

Value mkScalar(double n) { return Scalar{n}; }

Value mkVector(std::vector<double> values) { return Vector{std::move(values)}; }

Value mkTable(std::vector<std::string> columns, std::vector<std::vector<double>> rows) {
    return Table{std::move(columns), std::move(rows)};
}

Value mkError(std::string message) { return Error{std::move(message)}; }

const char* kindName(const Value& v) {
    return std::visit(Overloaded{
        [](const Scalar&) { return "scalar"; },
        [](const Vector&) { return "vector"; },
        [](const Table&) { return "table"; },
        [](const Error&) { return "error"; },
    }, v);
}

std::optional<double> extractScalar(const InputValue& v) {
    if (!v) return std::nullopt;
    if (const auto* s = std::get_if<Scalar>(&*v)) return s->value;
    return std::nullopt;
}

bool operator==(const Scalar& a, const Scalar& b) { return sameNumber(a.value, b.value); }

bool operator==(const Vector& a, const Vector& b) { return sameNumbers(a.value, b.value); }

bool operator==(const Table& a, const Table& b) {
    if (a.columns != b.columns || a.rows.size() != b.rows.size()) return false;
    for (size_t r = 0; r < a.rows.size(); ++r) {
        if (!sameNumbers(a.rows[r], b.rows[r])) return false;
    }
    return true;
}

bool operator==(const Error& a, const Error& b) { return a.message == b.message; }

std::string formatValue(const Value& v, const std::string& locale) {
    return std::visit(Overloaded{
        [&](const Scalar& s) { return compactScalar(s.value, locale); },
        [](const Vector& vec) -> std::string {
            if (vec.value.empty()) return "[empty]";
            if (vec.value.size() <= 4) return "[" + joinNumbers(vec.value, ", ") + "]";
            return fmt::format("[{} items]", vec.value.size());
        },
        [](const Table& t) { return fmt::format("{}×{} table", t.rows.size(), t.columns.size()); },
        [](const Error& e) { return e.message; },
    }, v);
}

std::string formatValue(const Value* v, const std::string& locale) {
    return v ? formatValue(*v, locale) : std::string(kMissingValueText);
}

std::string formatValueFull(const Value& v) {
    return std::visit(Overloaded{
        [](const Scalar& s) -> std::string {
            const double n = s.value;
            if (std::isnan(n)) return "NaN";
            if (std::isinf(n)) return n > 0 ? "+Infinity" : "-Infinity";
            return trimExponent(fmt::format("{:.17g}", n));
        },
        [](const Vector& vec) { return "[" + joinNumbers(vec.value, ", ") + "]"; },
        [](const Table& t) {
            std::string out;
            for (size_t i = 0; i < t.columns.size(); ++i) {
                if (i) out += '\t';
                out += t.columns[i];
            }
            out += '\n';
            for (size_t r = 0; r < t.rows.size(); ++r) {
                if (r) out += '\n';
                out += joinNumbers(t.rows[r], "\t");
            }
            return out;
        },
        [](const Error& e) { return "Error: " + e.message; },
    }, v);
}

std::string formatValueFull(const Value* v) {
    return v ? formatValueFull(*v) : std::string(kMissingValueText);
}

nlohmann::json valueToJson(const Value& v) {
    return std::visit(Overloaded{
        [](const Scalar& s) { return numberToJson(s.value); },
        [](const Vector& vec) { return numbersToJson(vec.value); },
        [](const Table& t) {
            nlohmann::json rows = nlohmann::json::array();
            for (const auto& row : t.rows) rows.push_back(numbersToJson(row));
            return nlohmann::json{{"columns", t.columns}, {"rows", std::move(rows)}};
        },
        [](const Error& e) { return nlohmann::json{{"error", e.message}}; },
    }, v);
}

std::string formatValueJson(const Value& v) {
    return isTable(v) ? valueToJson(v).dump(2) : valueToJson(v).dump();
}

std::string formatValueJson(const Value* v) {
    return v ? formatValueJson(*v) : std::string("null");
}

} // namespace BlockFlow
