// BlockFlowBlocks.hpp
//
// Block contract and registry. A block is an operation type: its ordered
// input ports plus a pure evaluate function. Evaluate reports failure by
// returning an Error value; throwing breaks the contract, though the
// evaluator still contains it.
//
// The registry is an ordinary object. Build one at startup, register blocks
// into it, and hand it to the Evaluator by reference.
#pragma once
#include "BlockFlowGraph.hpp"
#include "BlockFlowValue.hpp"
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace BlockFlow {

struct PortDef {
    PortId id;
    std::string label;
};

// `inputs` is ordered like BlockDef::inputs; std::nullopt = no value.
using EvaluateFn = std::function<Value(const InputList& inputs, const NodeData& data)>;

struct BlockDef {
    std::string type;
    std::string label;
    std::string category;
    std::vector<PortDef> inputs;
    EvaluateFn evaluate;
};

class BlockRegistry {
public:
    BlockRegistry() = default;
    BlockRegistry(const BlockRegistry&) = delete;
    BlockRegistry& operator=(const BlockRegistry&) = delete;

    // Throws EngineError(DuplicateBlock) if the type is already registered,
    // EngineError(InvalidBlock) for an empty type or missing evaluate.
    void registerBlock(BlockDef def);

    const BlockDef* find(const std::string& type) const;
    bool contains(const std::string& type) const { return find(type) != nullptr; }
    size_t size() const { return blocks.size(); }
    // Types in registration order
    const std::vector<std::string>& types() const { return order; }

private:
    std::unordered_map<std::string, BlockDef> blocks;
    std::vector<std::string> order;
};

// Registers the built-in sources, constants, math, trig, logic, output,
// data and vector-reduction blocks.
void registerStandardBlocks(BlockRegistry& registry);

// Evaluates every zero-input block in the "constants" category and returns
// type -> number; the constant half of a BindingTable.
std::unordered_map<std::string, double> buildConstantsTable(const BlockRegistry& registry);

} // namespace BlockFlow
