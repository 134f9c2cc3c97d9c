// BlockFlowGraph.hpp
//
// Graph model read by the engine: nodes with their per-port configuration,
// directed edges between ports, and the binding layer that turns a port's
// declared source (literal / named constant / named variable) into a number.
//
// Node data comes in two shapes. Older graphs carry `manualValues` (port ->
// number); newer ones carry `inputBindings`. normalizeBindings() folds both
// into one view at read time and never rewrites the stored node.
#pragma once
#include "BlockFlowError.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace BlockFlow {

using PortId = std::string;
using EdgeId = std::string;

struct InputBinding {
    enum class Kind { Literal, Constant, Variable };

    Kind kind = Kind::Literal;
    double value = 0.0;   // Literal
    std::string ref;      // Constant: constant block type; Variable: variable id

    static InputBinding literal(double v) { return InputBinding{Kind::Literal, v, {}}; }
    static InputBinding constant(std::string opId) { return InputBinding{Kind::Constant, 0.0, std::move(opId)}; }
    static InputBinding variable(std::string varId) { return InputBinding{Kind::Variable, 0.0, std::move(varId)}; }
};

bool operator==(const InputBinding& a, const InputBinding& b);
inline bool operator!=(const InputBinding& a, const InputBinding& b) { return !(a == b); }

using BindingMap = std::map<PortId, InputBinding>;

struct TableData {
    std::vector<std::string> columns;
    std::vector<std::vector<double>> rows;
};

// Per-node payload owned by the editing layer.
struct NodeData {
    std::string blockType;
    std::string label;
    // Source blocks (number, slider, variableSource)
    std::optional<double> value;
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> step;
    // Legacy per-port numbers; used when a port is unconnected or overridden
    std::map<PortId, double> manualValues;
    std::map<PortId, InputBinding> inputBindings;
    // When true for a connected port, its binding replaces the upstream value
    std::map<PortId, bool> portOverrides;
    std::optional<std::vector<double>> vectorData;
    std::optional<TableData> tableData;

    bool overrideActive(const PortId& port) const {
        auto it = portOverrides.find(port);
        return it != portOverrides.end() && it->second;
    }
};

struct Node {
    NodeId id;
    NodeData data;
};

// At most one edge may target a given (target, targetHandle) pair; the
// editing layer guarantees it and the evaluator relies on it.
struct Edge {
    EdgeId id;
    NodeId source;
    PortId sourceHandle;
    NodeId target;
    PortId targetHandle;
};

// Named-reference table the caller fills in before a pass.
struct BindingTable {
    std::unordered_map<std::string, double> constants;
    std::unordered_map<std::string, double> variables;
};

// Literal -> its value; Constant/Variable -> table lookup; an unknown
// reference resolves to NaN and logs a warning.
double resolveBinding(const InputBinding& binding, const BindingTable& table);

// Legacy manualValues as literal bindings (empty map -> empty result).
BindingMap migrateManualValues(const std::map<PortId, double>& manualValues);

// Effective bindings of a node: migrated manualValues overlaid by inputBindings.
BindingMap normalizeBindings(const NodeData& data);

// Binding an editor should show for `port`: the explicit binding, else the
// legacy manual value as a literal, else literal 0.
InputBinding ensureBinding(const NodeData& data, const PortId& port);

} // namespace BlockFlow
