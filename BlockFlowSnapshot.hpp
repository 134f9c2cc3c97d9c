// BlockFlowSnapshot.hpp
//
// JSON engine snapshot (version 1): the nodes, edges and variable values for
// one pass, in the shape the editor hands to the engine. Also structural
// validation and JSON export of a pass's results.
//
//   {
//     "version": 1,
//     "nodes": [{"id": "n1", "blockType": "number", "data": {"value": 3}}],
//     "edges": [{"id": "e1", "source": "n1", "sourceHandle": "out",
//                "target": "n2", "targetHandle": "a"}],
//     "variables": {"rate": 0.05}
//   }
#pragma once
#include "BlockFlowBlocks.hpp"
#include "BlockFlowCore.hpp"
#include "BlockFlowError.hpp"
#include "BlockFlowGraph.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace BlockFlow {

constexpr int kSnapshotVersion = 1;

struct Snapshot {
    int version = kSnapshotVersion;
    std::vector<Node> nodes;
    std::vector<Edge> edges;
    std::unordered_map<std::string, double> variables;
};

// Throws EngineError(InvalidSnapshot) on missing or mistyped fields.
Snapshot snapshotFromJson(const nlohmann::json& json);
NodeData nodeDataFromJson(const nlohmann::json& json);

// Throws EngineError(InvalidSnapshot) if the file cannot be read or parsed.
Snapshot loadSnapshotFile(const std::string& path);

// Throws EngineError(UnsupportedVersion) for any version but 1. Otherwise
// returns DANGLING_EDGE / DUPLICATE_NODE errors and FAN_IN_VIOLATION
// warnings; none of them stop a pass.
std::vector<Diagnostic> validate(const Snapshot& snapshot);

// Registry constants plus the snapshot's variables.
BindingTable makeBindingTable(const BlockRegistry& registry, const Snapshot& snapshot);

// [{"id", "blockType", "value"}, ...] in node-list order; "value" is null
// for nodes without a result this pass.
nlohmann::json resultsToJson(const ResultMap& results, const std::vector<Node>& nodes);
nlohmann::json diagnosticsToJson(const std::vector<Diagnostic>& diagnostics);

} // namespace BlockFlow
