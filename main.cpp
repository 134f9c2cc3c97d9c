// main.cpp
//
// blockflow-eval: parses the CLI (CLI11), loads a JSON engine snapshot, runs
// one evaluation pass and prints every node's value in node-list order.
// Options may also come from a config file passed with --config.
#include "BlockFlowBlocks.hpp"
#include "BlockFlowCore.hpp"
#include "BlockFlowLog.hpp"
#include "BlockFlowSnapshot.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <string>

namespace {

std::string formatForOutput(const BlockFlow::Value* value, const std::string& format, const std::string& locale) {
    if (format == "full") return BlockFlow::formatValueFull(value);
    return BlockFlow::formatValue(value, locale);
}

} // namespace

int main(int argc, char** argv) {
    std::string graphPath;
    std::string format = "compact";
    std::string locale;
    std::string logLevelText = "warn";
    bool showDiagnostics = false;
    bool listBlocks = false;

    CLI::App app{"BlockFlow graph evaluator"};
    try {
        app.add_option("--graph", graphPath, "Path to engine snapshot JSON");
        app.add_option("--format", format, "Output format: compact|full|json")
            ->check(CLI::IsMember({"compact", "full", "json"}));
        app.add_option("--locale", locale, "Locale for compact display (e.g. de_DE.UTF-8)");
        app.add_option("--log-level", logLevelText, "Log level: debug|info|warn|error|off")
            ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
        app.add_flag("--diagnostics", showDiagnostics, "Print diagnostics and pass statistics");
        app.add_flag("--list-blocks", listBlocks, "List registered block types and exit");
        app.allow_extras(false);
        app.set_config("--config");
        app.set_help_all_flag("--help-all", "Show all help");
        app.parse(argc, argv);
    } catch (const CLI::ParseError &e) {
        return app.exit(e);
    }

    BlockFlow::LogLevel level = BlockFlow::LogLevel::Warn;
    BlockFlow::parseLogLevel(logLevelText, level);
    BlockFlow::setLogLevel(level);

    BlockFlow::BlockRegistry registry;
    BlockFlow::registerStandardBlocks(registry);

    if (listBlocks) {
        for (const auto& type : registry.types()) {
            const BlockFlow::BlockDef* def = registry.find(type);
            fmt::print("{:<16} {:<10} inputs={}\n", type, def->category, def->inputs.size());
        }
        return 0;
    }
    if (graphPath.empty()) {
        fmt::print(stderr, "--graph is required (see --help)\n");
        return 1;
    }

    BlockFlow::EvalReport report;
    BlockFlow::Snapshot snapshot;
    try {
        snapshot = BlockFlow::loadSnapshotFile(graphPath);
        const BlockFlow::Evaluator evaluator(registry);
        report = evaluator.run(snapshot, BlockFlow::makeBindingTable(registry, snapshot));
    } catch (const BlockFlow::EngineError& e) {
        BlockFlow::logError("cli", "{}", e.what());
        return 1;
    }
    BlockFlow::logInfo("cli", "Evaluated '{}': {} nodes, {} unreachable, {} ns",
                       graphPath, report.stats.nodesEvaluated, report.stats.nodesUnreachable,
                       report.stats.evalTimeNs);

    if (format == "json") {
        nlohmann::json out = {{"results", BlockFlow::resultsToJson(report.results, snapshot.nodes)}};
        if (showDiagnostics) {
            out["diagnostics"] = BlockFlow::diagnosticsToJson(report.diagnostics);
            out["stats"] = {
                {"nodesEvaluated", report.stats.nodesEvaluated},
                {"nodesUnreachable", report.stats.nodesUnreachable},
                {"nodesSkipped", report.stats.nodesSkipped},
                {"operationFaults", report.stats.operationFaults},
                {"evalTimeNs", report.stats.evalTimeNs},
            };
        }
        fmt::print("{}\n", out.dump(2));
        return 0;
    }

    for (const auto& node : snapshot.nodes) {
        fmt::print("{} ({}) = {}\n", node.id, node.data.blockType,
                   formatForOutput(report.results.find(node.id), format, locale));
    }
    if (showDiagnostics) {
        for (const auto& d : report.diagnostics) {
            fmt::print("[{}] {} {}\n", BlockFlow::diagLevelName(d.level), BlockFlow::errorCodeName(d.code), d.message);
        }
        fmt::print("stats: evaluated={} unreachable={} skipped={} faults={} time={}ns\n",
                   report.stats.nodesEvaluated, report.stats.nodesUnreachable, report.stats.nodesSkipped,
                   report.stats.operationFaults, report.stats.evalTimeNs);
    }
    return 0;
}
