// BlockFlowCore.cpp
//
// Topology, scheduling and the evaluation pass.
#include "BlockFlowCore.hpp"
#include "BlockFlowLog.hpp"
#include "BlockFlowSnapshot.hpp"
#include <fmt/core.h>
#include <chrono>
#include <deque>
#include <unordered_set>

namespace BlockFlow {

Topology buildTopology(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    Topology topology;
    for (const auto& node : nodes) {
        topology.inEdges[node.id];
        topology.outEdges[node.id];
        topology.inDegree[node.id] = 0;
    }
    for (const auto& edge : edges) {
        auto in = topology.inEdges.find(edge.target);
        auto out = topology.outEdges.find(edge.source);
        if (in == topology.inEdges.end() || out == topology.outEdges.end()) {
            logDebug("engine", "Ignoring edge '{}' with unknown endpoint ({} -> {})", edge.id, edge.source, edge.target);
            continue;
        }
        in->second.push_back(&edge);
        out->second.push_back(&edge);
    }
    for (const auto& [id, incoming] : topology.inEdges) {
        topology.inDegree[id] = incoming.size();
    }
    return topology;
}

Schedule schedule(const std::vector<Node>& nodes, const Topology& topology) {
    Schedule result;
    std::unordered_map<NodeId, size_t> remaining = topology.inDegree;
    std::unordered_set<NodeId> seen;
    std::deque<NodeId> queue;

    for (const auto& node : nodes) {
        if (!seen.insert(node.id).second) continue;
        if (remaining[node.id] == 0) queue.push_back(node.id);
    }

    std::unordered_set<NodeId> ordered;
    while (!queue.empty()) {
        NodeId current = queue.front();
        queue.pop_front();
        ordered.insert(current);
        auto out = topology.outEdges.find(current);
        if (out != topology.outEdges.end()) {
            for (const Edge* edge : out->second) {
                auto deg = remaining.find(edge->target);
                if (deg == remaining.end() || deg->second == 0) continue;
                if (--deg->second == 0) queue.push_back(edge->target);
            }
        }
        result.order.push_back(std::move(current));
    }

    // Whatever never reached in-degree 0 sits in a cycle or behind one.
    seen.clear();
    for (const auto& node : nodes) {
        if (!seen.insert(node.id).second) continue;
        if (!ordered.count(node.id)) result.unreachable.push_back(node.id);
    }
    return result;
}

const Value* ResultMap::find(const NodeId& id) const {
    auto it = values.find(id);
    return it == values.end() ? nullptr : &it->second;
}

bool ResultMap::record(const NodeId& id, Value value) {
    return values.emplace(id, std::move(value)).second;
}

InputList Evaluator::resolveInputs(const Node& node, const BlockDef& def, const Topology& topology,
                                   const ResultMap& results, const BindingTable& bindings) const {
    static const std::vector<const Edge*> noEdges;
    auto inIt = topology.inEdges.find(node.id);
    const auto& incoming = inIt == topology.inEdges.end() ? noEdges : inIt->second;
    const BindingMap bound = normalizeBindings(node.data);

    InputList inputs;
    inputs.reserve(def.inputs.size());
    for (const auto& port : def.inputs) {
        const Edge* edge = nullptr;
        for (const Edge* e : incoming) {
            if (e->targetHandle == port.id) { edge = e; break; }
        }
        if (edge && !node.data.overrideActive(port.id)) {
            // Absent upstream only happens when it sits in a cycle.
            if (const Value* upstream = results.find(edge->source)) inputs.emplace_back(*upstream);
            else inputs.emplace_back(std::nullopt);
            continue;
        }
        auto binding = bound.find(port.id);
        if (binding != bound.end()) inputs.emplace_back(mkScalar(resolveBinding(binding->second, bindings)));
        else inputs.emplace_back(std::nullopt);
    }
    return inputs;
}

namespace {

Value invokeBlock(const BlockDef& def, const Node& node, const InputList& inputs, PassStats& stats) {
    try {
        return def.evaluate(inputs, node.data);
    } catch (const std::exception& e) {
        ++stats.operationFaults;
        logWarn("engine", "Block '{}' threw on node '{}': {}", def.type, node.id, e.what());
        return mkError(e.what());
    } catch (...) {
        ++stats.operationFaults;
        logWarn("engine", "Block '{}' threw a non-standard exception on node '{}'", def.type, node.id);
        return mkError("Unknown error");
    }
}

} // namespace

ResultMap Evaluator::evaluatePass(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                                  const BindingTable& bindings, Schedule& sched, PassStats& stats) const {
    const Topology topology = buildTopology(nodes, edges);
    sched = schedule(nodes, topology);

    std::unordered_map<NodeId, const Node*> nodeMap;
    for (const auto& node : nodes) nodeMap.emplace(node.id, &node);

    ResultMap results;
    for (const auto& nodeId : sched.order) {
        auto it = nodeMap.find(nodeId);
        if (it == nodeMap.end()) continue;
        const Node& node = *it->second;

        const BlockDef* def = registry.find(node.data.blockType);
        if (!def) {
            ++stats.nodesSkipped;
            logDebug("engine", "No block registered for '{}', node '{}' has no result", node.data.blockType, nodeId);
            continue;
        }

        InputList inputs = resolveInputs(node, *def, topology, results, bindings);
        results.record(nodeId, invokeBlock(*def, node, inputs, stats));
        ++stats.nodesEvaluated;
    }

    stats.nodesUnreachable = sched.unreachable.size();
    if (!sched.unreachable.empty()) {
        logDebug("engine", "{} node(s) in or behind a cycle were not evaluated", sched.unreachable.size());
    }
    return results;
}

ResultMap Evaluator::evaluate(const std::vector<Node>& nodes, const std::vector<Edge>& edges,
                              const BindingTable& bindings) const {
    Schedule sched;
    PassStats stats;
    return evaluatePass(nodes, edges, bindings, sched, stats);
}

EvalReport Evaluator::run(const Snapshot& snapshot, const BindingTable& bindings) const {
    EvalReport report;
    report.diagnostics = validate(snapshot);

    auto t0 = std::chrono::steady_clock::now();
    Schedule sched;
    report.results = evaluatePass(snapshot.nodes, snapshot.edges, bindings, sched, report.stats);
    auto t1 = std::chrono::steady_clock::now();
    report.stats.evalTimeNs = static_cast<unsigned long long>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());

    for (const auto& id : sched.unreachable) {
        report.diagnostics.push_back(Diagnostic{
            id, DiagLevel::Error, ErrorCode::CycleDetected,
            fmt::format("Node '{}' is in or downstream of a cycle", id)});
    }
    std::unordered_set<NodeId> seen;
    for (const auto& node : snapshot.nodes) {
        if (!seen.insert(node.id).second || registry.contains(node.data.blockType)) continue;
        report.diagnostics.push_back(Diagnostic{
            node.id, DiagLevel::Warning, ErrorCode::UnknownBlock,
            fmt::format("Node '{}' has unknown block type '{}'", node.id, node.data.blockType)});
    }
    return report;
}

ResultMap evaluateGraph(const BlockRegistry& registry, const std::vector<Node>& nodes,
                        const std::vector<Edge>& edges, const BindingTable& bindings) {
    return Evaluator(registry).evaluate(nodes, edges, bindings);
}

} // namespace BlockFlow
