// BlockFlowCore.hpp
//
// Evaluation engine. One pass takes the node list, the edge list and a
// binding table, and recomputes every node:
//
//   buildTopology  in/out adjacency and in-degree per node
//   schedule       Kahn's algorithm; nodes caught in (or only reachable
//                  through) a cycle never reach in-degree 0 and are left out
//   Evaluator      walks the order, resolves each input port, calls the block
//                  and records the value once in the ResultMap
//
// A pass is synchronous and keeps no state between calls; callers re-run it
// after every graph edit and drop the previous ResultMap.
#pragma once
#include "BlockFlowBlocks.hpp"
#include "BlockFlowError.hpp"
#include "BlockFlowGraph.hpp"
#include "BlockFlowValue.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace BlockFlow {

struct Snapshot;

// Edge pointers refer into the edge list passed to buildTopology and are only
// valid while it is alive and unmodified.
struct Topology {
    std::unordered_map<NodeId, std::vector<const Edge*>> inEdges;
    std::unordered_map<NodeId, std::vector<const Edge*>> outEdges;
    std::unordered_map<NodeId, size_t> inDegree;
};

// Every node id gets an entry. Edges with an unknown endpoint are ignored.
Topology buildTopology(const std::vector<Node>& nodes, const std::vector<Edge>& edges);

struct Schedule {
    std::vector<NodeId> order;        // topological; ties broken by node-list order
    std::vector<NodeId> unreachable;  // never enqueued, in node-list order
};

Schedule schedule(const std::vector<Node>& nodes, const Topology& topology);

// nodeId -> Value for one pass. Read-only to everyone but the Evaluator,
// which writes each key at most once.
class ResultMap {
public:
    using Storage = std::unordered_map<NodeId, Value>;
    using const_iterator = Storage::const_iterator;

    const Value* find(const NodeId& id) const;
    bool contains(const NodeId& id) const { return values.count(id) != 0; }
    size_t size() const { return values.size(); }
    bool empty() const { return values.empty(); }
    const_iterator begin() const { return values.begin(); }
    const_iterator end() const { return values.end(); }

    bool operator==(const ResultMap& other) const { return values == other.values; }
    bool operator!=(const ResultMap& other) const { return !(*this == other); }

private:
    friend class Evaluator;
    // False (and no change) if the key already has a value.
    bool record(const NodeId& id, Value value);

    Storage values;
};

// Counters for one run(); adapted from the runtime's perf counters.
struct PassStats {
    unsigned long long nodesEvaluated = 0;
    unsigned long long nodesUnreachable = 0;
    unsigned long long nodesSkipped = 0;   // no block registered for the type
    unsigned long long operationFaults = 0; // evaluate threw
    unsigned long long evalTimeNs = 0;
};

struct EvalReport {
    ResultMap results;
    std::vector<Diagnostic> diagnostics;
    PassStats stats;
};

class Evaluator {
public:
    explicit Evaluator(const BlockRegistry& registry) : registry(registry) {}

    // Full pass. Never throws because of a node: faults become Error values.
    ResultMap evaluate(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                       const BindingTable& bindings = BindingTable{}) const;

    // Validates the snapshot, evaluates it and reports cycle / unknown-block
    // diagnostics with pass statistics. Throws EngineError for an
    // unsupported snapshot version.
    EvalReport run(const Snapshot& snapshot, const BindingTable& bindings = BindingTable{}) const;

    // Positional inputs for `node` as the block at `def` would receive them.
    InputList resolveInputs(const Node& node, const BlockDef& def, const Topology& topology,
                            const ResultMap& results, const BindingTable& bindings) const;

private:
    ResultMap evaluatePass(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                           const BindingTable& bindings, Schedule& sched, PassStats& stats) const;

    const BlockRegistry& registry;
};

ResultMap evaluateGraph(const BlockRegistry& registry, const std::vector<Node>& nodes,
                        const std::vector<Edge>& edges, const BindingTable& bindings = BindingTable{});

} // namespace BlockFlow
