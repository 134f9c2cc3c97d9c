// BlockFlowGraph.cpp
#include "BlockFlowGraph.hpp"
#include "BlockFlowLog.hpp"
#include <limits>

namespace BlockFlow {

bool operator==(const InputBinding& a, const InputBinding& b) {
    if (a.kind != b.kind) return false;
    if (a.kind == InputBinding::Kind::Literal) return a.value == b.value;
    return a.ref == b.ref;
}

double resolveBinding(const InputBinding& binding, const BindingTable& table) {
    switch (binding.kind) {
        case InputBinding::Kind::Literal:
            return binding.value;
        case InputBinding::Kind::Constant: {
            auto it = table.constants.find(binding.ref);
            if (it != table.constants.end()) return it->second;
            logWarn("bindings", "Unknown constant '{}'", binding.ref);
            break;
        }
        case InputBinding::Kind::Variable: {
            auto it = table.variables.find(binding.ref);
            if (it != table.variables.end()) return it->second;
            logWarn("bindings", "Missing variable '{}'", binding.ref);
            break;
        }
    }
    return std::numeric_limits<double>::quiet_NaN();
}

BindingMap migrateManualValues(const std::map<PortId, double>& manualValues) {
    BindingMap bindings;
    for (const auto& [port, value] : manualValues) {
        bindings.emplace(port, InputBinding::literal(value));
    }
    return bindings;
}

BindingMap normalizeBindings(const NodeData& data) {
    BindingMap bindings = migrateManualValues(data.manualValues);
    for (const auto& [port, binding] : data.inputBindings) {
        bindings[port] = binding;
    }
    return bindings;
}

InputBinding ensureBinding(const NodeData& data, const PortId& port) {
    auto bound = data.inputBindings.find(port);
    if (bound != data.inputBindings.end()) return bound->second;
    auto legacy = data.manualValues.find(port);
    if (legacy != data.manualValues.end()) return InputBinding::literal(legacy->second);
    return InputBinding::literal(0.0);
}

} // namespace BlockFlow
