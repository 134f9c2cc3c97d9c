// BlockFlowSnapshot.cpp
#include "BlockFlowSnapshot.hpp"
#include "BlockFlowLog.hpp"
#include <fmt/core.h>
#include <fstream>
#include <set>
#include <unordered_set>
#include <utility>

namespace BlockFlow {

namespace {

InputBinding bindingFromJson(const std::string& port, const nlohmann::json& json) {
    const std::string kind = json.at("kind").get<std::string>();
    if (kind == "literal") return InputBinding::literal(json.at("value").get<double>());
    if (kind == "const") return InputBinding::constant(json.at("constOpId").get<std::string>());
    if (kind == "var") return InputBinding::variable(json.at("varId").get<std::string>());
    throw EngineError(ErrorCode::InvalidSnapshot,
                      fmt::format("Unknown binding kind '{}' on port '{}'", kind, port));
}

std::optional<double> optionalNumber(const nlohmann::json& json, const char* key) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) return std::nullopt;
    return it->get<double>();
}

} // namespace

NodeData nodeDataFromJson(const nlohmann::json& json) {
    NodeData data;
    if (json.is_null()) return data;
    if (!json.is_object()) {
        throw EngineError(ErrorCode::InvalidSnapshot, "Node data must be an object");
    }
    data.blockType = json.value("blockType", std::string());
    data.label = json.value("label", std::string());
    data.value = optionalNumber(json, "value");
    data.min = optionalNumber(json, "min");
    data.max = optionalNumber(json, "max");
    data.step = optionalNumber(json, "step");

    if (json.contains("manualValues")) {
        for (const auto& item : json["manualValues"].items()) {
            data.manualValues[item.key()] = item.value().get<double>();
        }
    }
    if (json.contains("portOverrides")) {
        for (const auto& item : json["portOverrides"].items()) {
            data.portOverrides[item.key()] = item.value().get<bool>();
        }
    }
    if (json.contains("inputBindings")) {
        for (const auto& item : json["inputBindings"].items()) {
            data.inputBindings[item.key()] = bindingFromJson(item.key(), item.value());
        }
    }
    if (json.contains("vectorData")) {
        data.vectorData = json["vectorData"].get<std::vector<double>>();
    }
    if (json.contains("tableData")) {
        const auto& table = json["tableData"];
        data.tableData = TableData{table.at("columns").get<std::vector<std::string>>(),
                                   table.at("rows").get<std::vector<std::vector<double>>>()};
    }
    return data;
}

Snapshot snapshotFromJson(const nlohmann::json& json) {
    Snapshot snapshot;
    try {
        if (!json.is_object()) {
            throw EngineError(ErrorCode::InvalidSnapshot, "Snapshot must be a JSON object");
        }
        snapshot.version = json.at("version").get<int>();

        for (const auto& nodeJson : json.at("nodes")) {
            Node node;
            node.id = nodeJson.at("id").get<std::string>();
            node.data = nodeDataFromJson(nodeJson.contains("data") ? nodeJson["data"] : nlohmann::json());
            // The node-level blockType is authoritative; data.blockType is the editor's copy.
            if (nodeJson.contains("blockType")) node.data.blockType = nodeJson["blockType"].get<std::string>();
            if (node.data.blockType.empty()) {
                throw EngineError(ErrorCode::InvalidSnapshot, fmt::format("Node '{}' has no blockType", node.id));
            }
            snapshot.nodes.push_back(std::move(node));
        }

        if (json.contains("edges")) {
            for (const auto& edgeJson : json["edges"]) {
                Edge edge{
                    edgeJson.value("id", std::string()),
                    edgeJson.at("source").get<std::string>(),
                    edgeJson.value("sourceHandle", std::string("out")),
                    edgeJson.at("target").get<std::string>(),
                    edgeJson.at("targetHandle").get<std::string>()
                };
                if (edge.id.empty()) edge.id = fmt::format("e{}", snapshot.edges.size());
                snapshot.edges.push_back(std::move(edge));
            }
        }

        if (json.contains("variables")) {
            for (const auto& item : json["variables"].items()) {
                snapshot.variables[item.key()] = item.value().get<double>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw EngineError(ErrorCode::InvalidSnapshot, e.what());
    }
    logDebug("snapshot", "Loaded snapshot: {} nodes, {} edges, {} variables",
             snapshot.nodes.size(), snapshot.edges.size(), snapshot.variables.size());
    return snapshot;
}

Snapshot loadSnapshotFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.good()) {
        throw EngineError(ErrorCode::InvalidSnapshot, fmt::format("Could not open snapshot file: {}", path));
    }
    nlohmann::json json;
    try {
        in >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw EngineError(ErrorCode::InvalidSnapshot, fmt::format("{}: {}", path, e.what()));
    }
    return snapshotFromJson(json);
}

std::vector<Diagnostic> validate(const Snapshot& snapshot) {
    if (snapshot.version != kSnapshotVersion) {
        throw EngineError(ErrorCode::UnsupportedVersion,
                          fmt::format("Expected snapshot version {}, got {}", kSnapshotVersion, snapshot.version));
    }

    std::vector<Diagnostic> diags;
    std::unordered_set<NodeId> ids;
    for (const auto& node : snapshot.nodes) {
        if (!ids.insert(node.id).second) {
            diags.push_back(Diagnostic{node.id, DiagLevel::Error, ErrorCode::DuplicateNode,
                                       fmt::format("Node id '{}' appears more than once", node.id)});
        }
    }

    std::set<std::pair<NodeId, PortId>> targeted;
    for (const auto& edge : snapshot.edges) {
        if (!ids.count(edge.source)) {
            diags.push_back(Diagnostic{std::nullopt, DiagLevel::Error, ErrorCode::DanglingEdge,
                                       fmt::format("Edge '{}' references missing source node '{}'", edge.id, edge.source)});
        }
        if (!ids.count(edge.target)) {
            diags.push_back(Diagnostic{std::nullopt, DiagLevel::Error, ErrorCode::DanglingEdge,
                                       fmt::format("Edge '{}' references missing target node '{}'", edge.id, edge.target)});
            continue;
        }
        if (!targeted.emplace(edge.target, edge.targetHandle).second) {
            diags.push_back(Diagnostic{edge.target, DiagLevel::Warning, ErrorCode::FanInViolation,
                                       fmt::format("Edge '{}' is a second connection into port '{}' of node '{}'",
                                                   edge.id, edge.targetHandle, edge.target)});
        }
    }

    for (const auto& d : diags) {
        logWarn("snapshot", "{}: {}", errorCodeName(d.code), d.message);
    }
    return diags;
}

BindingTable makeBindingTable(const BlockRegistry& registry, const Snapshot& snapshot) {
    BindingTable table;
    table.constants = buildConstantsTable(registry);
    table.variables.insert(snapshot.variables.begin(), snapshot.variables.end());
    return table;
}

nlohmann::json resultsToJson(const ResultMap& results, const std::vector<Node>& nodes) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& node : nodes) {
        const Value* value = results.find(node.id);
        nlohmann::json entry = {
            {"id", node.id},
            {"blockType", node.data.blockType},
            {"value", value ? valueToJson(*value) : nlohmann::json()},
        };
        out.push_back(std::move(entry));
    }
    return out;
}

nlohmann::json diagnosticsToJson(const std::vector<Diagnostic>& diagnostics) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& d : diagnostics) {
        nlohmann::json entry = {
            {"nodeId", d.nodeId ? nlohmann::json(*d.nodeId) : nlohmann::json()},
            {"level", diagLevelName(d.level)},
            {"code", errorCodeName(d.code)},
            {"message", d.message},
        };
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace BlockFlow
