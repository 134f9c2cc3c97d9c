// BlockFlowBlocks.cpp
//
// Registry bookkeeping plus the standard block set. Numeric blocks broadcast
// across kinds:
//   Scalar (+) Scalar -> Scalar
//   Scalar (+) Vector -> Vector, elementwise; Vector (+) Vector needs equal length
//   Scalar (+) Table  -> Table, cellwise;     Table (+) Table needs equal shape
//   Vector (+) Table  -> Error
// An Error input is returned as-is (left operand first); a missing input
// counts as NaN.
#include "BlockFlowBlocks.hpp"
#include "BlockFlowLog.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cfloat>
#include <cmath>
#include <limits>
#include <numeric>

namespace BlockFlow {

void BlockRegistry::registerBlock(BlockDef def) {
    if (def.type.empty()) {
        throw EngineError(ErrorCode::InvalidBlock, "Block type must not be empty");
    }
    if (!def.evaluate) {
        throw EngineError(ErrorCode::InvalidBlock, fmt::format("Block '{}' has no evaluate function", def.type));
    }
    if (blocks.count(def.type)) {
        throw EngineError(ErrorCode::DuplicateBlock, fmt::format("Block '{}' is already registered", def.type));
    }
    order.push_back(def.type);
    std::string type = def.type;
    blocks.emplace(std::move(type), std::move(def));
}

const BlockDef* BlockRegistry::find(const std::string& type) const {
    auto it = blocks.find(type);
    return it == blocks.end() ? nullptr : &it->second;
}

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

const InputValue& inputAt(const InputList& inputs, size_t index) {
    static const InputValue none;
    return index < inputs.size() ? inputs[index] : none;
}

template <typename F>
std::vector<double> mapNumbers(const std::vector<double>& values, F f) {
    std::vector<double> out;
    out.reserve(values.size());
    for (double x : values) out.push_back(f(x));
    return out;
}

template <typename F>
Value unaryBroadcast(const InputValue& in, F f) {
    if (!in) return mkScalar(f(kNaN));
    return std::visit(Overloaded{
        [&](const Scalar& s) -> Value { return mkScalar(f(s.value)); },
        [&](const Vector& v) -> Value { return mkVector(mapNumbers(v.value, f)); },
        [&](const Table& t) -> Value {
            std::vector<std::vector<double>> rows;
            rows.reserve(t.rows.size());
            for (const auto& row : t.rows) rows.push_back(mapNumbers(row, f));
            return mkTable(t.columns, std::move(rows));
        },
        [](const Error& e) -> Value { return e; },
    }, *in);
}

template <typename F>
Value binaryBroadcast(const InputValue& a, const InputValue& b, F f) {
    if (a && isError(*a)) return *a;
    if (b && isError(*b)) return *b;
    static const Value missing = mkScalar(kNaN);
    const Value& lhs = a ? *a : missing;
    const Value& rhs = b ? *b : missing;
    return std::visit(Overloaded{
        [&](const Scalar& x, const Scalar& y) -> Value { return mkScalar(f(x.value, y.value)); },
        [&](const Scalar& x, const Vector& y) -> Value {
            return mkVector(mapNumbers(y.value, [&](double v) { return f(x.value, v); }));
        },
        [&](const Vector& x, const Scalar& y) -> Value {
            return mkVector(mapNumbers(x.value, [&](double v) { return f(v, y.value); }));
        },
        [&](const Vector& x, const Vector& y) -> Value {
            if (x.value.size() != y.value.size()) {
                return mkError(fmt::format("Vector length mismatch: {} vs {}", x.value.size(), y.value.size()));
            }
            std::vector<double> out(x.value.size());
            for (size_t i = 0; i < out.size(); ++i) out[i] = f(x.value[i], y.value[i]);
            return mkVector(std::move(out));
        },
        [&](const Scalar& x, const Table& y) -> Value {
            std::vector<std::vector<double>> rows;
            for (const auto& row : y.rows) rows.push_back(mapNumbers(row, [&](double v) { return f(x.value, v); }));
            return mkTable(y.columns, std::move(rows));
        },
        [&](const Table& x, const Scalar& y) -> Value {
            std::vector<std::vector<double>> rows;
            for (const auto& row : x.rows) rows.push_back(mapNumbers(row, [&](double v) { return f(v, y.value); }));
            return mkTable(x.columns, std::move(rows));
        },
        [&](const Table& x, const Table& y) -> Value {
            bool sameShape = x.rows.size() == y.rows.size();
            for (size_t r = 0; sameShape && r < x.rows.size(); ++r) {
                sameShape = x.rows[r].size() == y.rows[r].size();
            }
            if (!sameShape) return mkError("Table shape mismatch");
            std::vector<std::vector<double>> rows(x.rows.size());
            for (size_t r = 0; r < rows.size(); ++r) {
                rows[r].resize(x.rows[r].size());
                for (size_t c = 0; c < rows[r].size(); ++c) rows[r][c] = f(x.rows[r][c], y.rows[r][c]);
            }
            return mkTable(x.columns, std::move(rows));
        },
        [](const auto& x, const auto& y) -> Value {
            return mkError(fmt::format("Cannot combine {} with {}", kindName(Value{x}), kindName(Value{y})));
        },
    }, lhs, rhs);
}

bool hasZero(const InputValue& v) {
    if (!v) return false;
    auto isZero = [](double x) { return x == 0.0; };
    return std::visit(Overloaded{
        [&](const Scalar& s) { return isZero(s.value); },
        [&](const Vector& vec) { return std::any_of(vec.value.begin(), vec.value.end(), isZero); },
        [&](const Table& t) {
            return std::any_of(t.rows.begin(), t.rows.end(), [&](const std::vector<double>& row) {
                return std::any_of(row.begin(), row.end(), isZero);
            });
        },
        [](const Error&) { return false; },
    }, *v);
}

// Scalar operand for blocks that do not broadcast: missing or non-scalar -> NaN.
double scalarOrNaN(const InputValue& v) { return extractScalar(v).value_or(kNaN); }

const InputValue* firstError(std::initializer_list<const InputValue*> inputs) {
    for (const InputValue* in : inputs) {
        if (*in && isError(**in)) return in;
    }
    return nullptr;
}

template <typename F>
Value reduceVector(const InputValue& in, const char* name, bool rejectEmpty, F f) {
    if (!in) return mkError(fmt::format("{}: no input", name));
    if (isError(*in)) return *in;
    const auto* vec = std::get_if<Vector>(&*in);
    if (!vec) return mkError(fmt::format("{}: expected vector", name));
    if (rejectEmpty && vec->value.empty()) return mkError(fmt::format("{}: empty vector", name));
    return mkScalar(f(vec->value));
}

const std::vector<PortDef> kPortsA{{"a", "A"}};
const std::vector<PortDef> kPortsAB{{"a", "A"}, {"b", "B"}};
const std::vector<PortDef> kPortsVec{{"vec", "Vector"}};

void add(BlockRegistry& registry, const char* type, const char* label, const char* category,
         std::vector<PortDef> inputs, EvaluateFn evaluate) {
    registry.registerBlock(BlockDef{type, label, category, std::move(inputs), std::move(evaluate)});
}

template <typename F>
void addUnary(BlockRegistry& registry, const char* type, const char* label, const char* category,
              std::vector<PortDef> inputs, F f) {
    add(registry, type, label, category, std::move(inputs),
        [f](const InputList& in, const NodeData&) { return unaryBroadcast(inputAt(in, 0), f); });
}

template <typename F>
void addBinary(BlockRegistry& registry, const char* type, const char* label, const char* category,
               std::vector<PortDef> inputs, F f) {
    add(registry, type, label, category, std::move(inputs),
        [f](const InputList& in, const NodeData&) { return binaryBroadcast(inputAt(in, 0), inputAt(in, 1), f); });
}

void addConstant(BlockRegistry& registry, const char* type, const char* label, double value) {
    add(registry, type, label, "constants", {},
        [value](const InputList&, const NodeData&) { return mkScalar(value); });
}

Value passThrough(const InputList& in, const NodeData&) {
    const InputValue& v = inputAt(in, 0);
    return v ? *v : mkScalar(kNaN);
}

Value sourceValue(const InputList&, const NodeData& data) { return mkScalar(data.value.value_or(0.0)); }

} // namespace

void registerStandardBlocks(BlockRegistry& registry) {
    // Input
    add(registry, "number", "Number", "input", {}, sourceValue);
    add(registry, "slider", "Slider", "input", {}, sourceValue);
    add(registry, "variableSource", "Variable", "input", {}, sourceValue);

    // Constants
    addConstant(registry, "pi", "Pi (π)", 3.141592653589793);
    addConstant(registry, "euler", "E (e)", 2.718281828459045);
    addConstant(registry, "tau", "Tau (τ)", 6.283185307179586);
    addConstant(registry, "phi", "Phi (φ)", 1.618033988749895);
    addConstant(registry, "ln2", "ln 2", 0.6931471805599453);
    addConstant(registry, "ln10", "ln 10", 2.302585092994046);
    addConstant(registry, "sqrt2", "√2", 1.4142135623730951);

    // Math
    addBinary(registry, "add", "Add", "math", kPortsAB, [](double a, double b) { return a + b; });
    addBinary(registry, "subtract", "Subtract", "math", kPortsAB, [](double a, double b) { return a - b; });
    addBinary(registry, "multiply", "Multiply", "math", kPortsAB, [](double a, double b) { return a * b; });
    add(registry, "divide", "Divide", "math", kPortsAB, [](const InputList& in, const NodeData&) {
        const InputValue& a = inputAt(in, 0);
        const InputValue& b = inputAt(in, 1);
        if (const InputValue* err = firstError({&a, &b})) return **err;
        if (hasZero(b)) return mkError("Division by zero");
        return binaryBroadcast(a, b, [](double x, double y) { return x / y; });
    });
    addUnary(registry, "negate", "Negate", "math", kPortsA, [](double x) { return -x; });
    addUnary(registry, "abs", "Abs", "math", kPortsA, [](double x) { return std::fabs(x); });
    addUnary(registry, "sqrt", "Sqrt", "math", kPortsA, [](double x) { return std::sqrt(x); });
    addBinary(registry, "power", "Power", "math", {{"base", "Base"}, {"exp", "Exp"}},
              [](double base, double exp) { return std::pow(base, exp); });
    addUnary(registry, "floor", "Floor", "math", kPortsA, [](double x) { return std::floor(x); });
    addUnary(registry, "ceil", "Ceil", "math", kPortsA, [](double x) { return std::ceil(x); });
    addUnary(registry, "round", "Round", "math", kPortsA, [](double x) { return std::round(x); });
    addBinary(registry, "mod", "Mod", "math", kPortsAB, [](double a, double b) { return std::fmod(a, b); });
    add(registry, "clamp", "Clamp", "math", {{"val", "Val"}, {"min", "Min"}, {"max", "Max"}},
        [](const InputList& in, const NodeData&) {
            const InputValue& val = inputAt(in, 0);
            const InputValue& lo = inputAt(in, 1);
            const InputValue& hi = inputAt(in, 2);
            if (const InputValue* err = firstError({&val, &lo, &hi})) return **err;
            const double low = scalarOrNaN(lo);
            const double high = scalarOrNaN(hi);
            return unaryBroadcast(val, [low, high](double x) { return std::min(std::max(x, low), high); });
        });

    // Trig
    const std::vector<PortDef> angle{{"a", "θ (rad)"}};
    addUnary(registry, "sin", "Sin", "trig", angle, [](double x) { return std::sin(x); });
    addUnary(registry, "cos", "Cos", "trig", angle, [](double x) { return std::cos(x); });
    addUnary(registry, "tan", "Tan", "trig", angle, [](double x) { return std::tan(x); });
    addUnary(registry, "asin", "Asin", "trig", kPortsA, [](double x) { return std::asin(x); });
    addUnary(registry, "acos", "Acos", "trig", kPortsA, [](double x) { return std::acos(x); });
    addUnary(registry, "atan", "Atan", "trig", kPortsA, [](double x) { return std::atan(x); });
    addBinary(registry, "atan2", "Atan2", "trig", {{"y", "Y"}, {"x", "X"}},
              [](double y, double x) { return std::atan2(y, x); });
    addUnary(registry, "degToRad", "Deg → Rad", "trig", {{"deg", "°"}},
             [](double d) { return d * 3.141592653589793 / 180.0; });
    addUnary(registry, "radToDeg", "Rad → Deg", "trig", {{"rad", "rad"}},
             [](double r) { return r * 180.0 / 3.141592653589793; });

    // Logic
    addBinary(registry, "greater", "Greater", "logic", kPortsAB, [](double a, double b) { return a > b ? 1.0 : 0.0; });
    addBinary(registry, "less", "Less", "logic", kPortsAB, [](double a, double b) { return a < b ? 1.0 : 0.0; });
    addBinary(registry, "equal", "Equal", "logic", kPortsAB,
              [](double a, double b) { return std::fabs(a - b) < DBL_EPSILON ? 1.0 : 0.0; });
    addBinary(registry, "max", "Max", "logic", kPortsAB, [](double a, double b) { return std::fmax(a, b); });
    addBinary(registry, "min", "Min", "logic", kPortsAB, [](double a, double b) { return std::fmin(a, b); });
    add(registry, "ifthenelse", "If / Then / Else", "logic",
        {{"cond", "If (≠0)"}, {"then", "Then"}, {"else", "Else"}},
        [](const InputList& in, const NodeData&) {
            const InputValue& cond = inputAt(in, 0);
            const InputValue& then = inputAt(in, 1);
            const InputValue& otherwise = inputAt(in, 2);
            if (const InputValue* err = firstError({&cond, &then, &otherwise})) return **err;
            return mkScalar(scalarOrNaN(cond) != 0.0 ? scalarOrNaN(then) : scalarOrNaN(otherwise));
        });

    // Output
    add(registry, "display", "Display", "output", {{"value", "Value"}}, passThrough);
    add(registry, "probe", "Probe", "output", {{"value", "Value"}}, passThrough);

    // Data
    add(registry, "vectorInput", "Vector Input", "data", {}, [](const InputList&, const NodeData& data) {
        return mkVector(data.vectorData.value_or(std::vector<double>{}));
    });
    add(registry, "tableInput", "Table Input", "data", {}, [](const InputList&, const NodeData& data) {
        if (!data.tableData) return mkTable({}, {});
        return mkTable(data.tableData->columns, data.tableData->rows);
    });

    // Vector ops
    add(registry, "vectorLength", "Length", "vectorOps", kPortsVec, [](const InputList& in, const NodeData&) {
        return reduceVector(inputAt(in, 0), "Length", false,
                            [](const std::vector<double>& v) { return static_cast<double>(v.size()); });
    });
    add(registry, "vectorSum", "Sum", "vectorOps", kPortsVec, [](const InputList& in, const NodeData&) {
        return reduceVector(inputAt(in, 0), "Sum", false,
                            [](const std::vector<double>& v) { return std::accumulate(v.begin(), v.end(), 0.0); });
    });
    add(registry, "vectorMean", "Mean", "vectorOps", kPortsVec, [](const InputList& in, const NodeData&) {
        return reduceVector(inputAt(in, 0), "Mean", true, [](const std::vector<double>& v) {
            return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
        });
    });
    add(registry, "vectorMin", "Min", "vectorOps", kPortsVec, [](const InputList& in, const NodeData&) {
        return reduceVector(inputAt(in, 0), "Min", true,
                            [](const std::vector<double>& v) { return *std::min_element(v.begin(), v.end()); });
    });
    add(registry, "vectorMax", "Max", "vectorOps", kPortsVec, [](const InputList& in, const NodeData&) {
        return reduceVector(inputAt(in, 0), "Max", true,
                            [](const std::vector<double>& v) { return *std::max_element(v.begin(), v.end()); });
    });

    logDebug("registry", "Registered {} standard blocks", registry.size());
}

std::unordered_map<std::string, double> buildConstantsTable(const BlockRegistry& registry) {
    std::unordered_map<std::string, double> constants;
    const NodeData empty;
    for (const auto& type : registry.types()) {
        const BlockDef* def = registry.find(type);
        if (!def || def->category != "constants" || !def->inputs.empty()) continue;
        try {
            auto value = extractScalar(def->evaluate({}, empty));
            if (value) constants.emplace(type, *value);
        } catch (const std::exception& e) {
            logWarn("registry", "Constant block '{}' threw: {}", type, e.what());
        }
    }
    return constants;
}

} // namespace BlockFlow
