// BlockFlowValue.hpp
//
// The value algebra every block consumes and produces. A Value is one of four
// kinds held in a std::variant; consumers match with std::visit so a new kind
// is a compile error at every switch point rather than a silent fallthrough.
//
// Formatting comes in three flavours:
//   formatValue      compact text for node faces; optionally locale-aware
//   formatValueFull  full precision for clipboard / detail views
//   formatValueJson  locale-neutral JSON for machine export
#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace BlockFlow {

struct Scalar {
    double value = 0.0;
};

struct Vector {
    std::vector<double> value;
};

struct Table {
    std::vector<std::string> columns;
    std::vector<std::vector<double>> rows;
};

struct Error {
    std::string message;
};

using Value = std::variant<Scalar, Vector, Table, Error>;

// What an operation sees on one input port; std::nullopt means the port
// produced nothing this pass (unconnected, unbound, or upstream in a cycle).
using InputValue = std::optional<Value>;
using InputList = std::vector<InputValue>;

// std::visit helper for inline lambda sets
template <class... Ts> struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

Value mkScalar(double n);
Value mkVector(std::vector<double> values);
Value mkTable(std::vector<std::string> columns, std::vector<std::vector<double>> rows);
Value mkError(std::string message);

inline bool isScalar(const Value& v) { return std::holds_alternative<Scalar>(v); }
inline bool isVector(const Value& v) { return std::holds_alternative<Vector>(v); }
inline bool isTable(const Value& v) { return std::holds_alternative<Table>(v); }
inline bool isError(const Value& v) { return std::holds_alternative<Error>(v); }

// "scalar" | "vector" | "table" | "error"
const char* kindName(const Value& v);

// Unwrap a scalar input. Null and non-scalar inputs give std::nullopt.
std::optional<double> extractScalar(const InputValue& v);

// NaN compares equal to NaN here, so two passes over the same graph compare equal.
bool operator==(const Scalar& a, const Scalar& b);
bool operator==(const Vector& a, const Vector& b);
bool operator==(const Table& a, const Table& b);
bool operator==(const Error& a, const Error& b);
inline bool operator!=(const Scalar& a, const Scalar& b) { return !(a == b); }
inline bool operator!=(const Vector& a, const Vector& b) { return !(a == b); }
inline bool operator!=(const Table& a, const Table& b) { return !(a == b); }
inline bool operator!=(const Error& a, const Error& b) { return !(a == b); }

// Text shown for a node with no value this pass.
extern const char* const kMissingValueText;

// Compact display text. `locale` is a std::locale name (e.g. "de_DE.UTF-8");
// empty means the fixed, locale-neutral format. Unknown names fall back to it.
std::string formatValue(const Value& v, const std::string& locale = std::string());
std::string formatValue(const Value* v, const std::string& locale = std::string());

std::string formatValueFull(const Value& v);
std::string formatValueFull(const Value* v);

nlohmann::json valueToJson(const Value& v);
std::string formatValueJson(const Value& v);
std::string formatValueJson(const Value* v);

} // namespace BlockFlow
