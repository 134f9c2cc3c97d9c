// test_evaluator.cpp
#include <catch2/catch.hpp>

#include "BlockFlowBlocks.hpp"
#include "BlockFlowCore.hpp"
#include "BlockFlowSnapshot.hpp"
#include "test_helpers.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

using namespace BlockFlow;
using BlockFlowTest::LogCapture;
using BlockFlowTest::makeEdge;
using BlockFlowTest::makeNode;
using BlockFlowTest::numberNode;

namespace {

struct StandardFixture {
    StandardFixture() { registerStandardBlocks(registry); }
    BlockRegistry registry;
};

double scalarOf(const ResultMap& results, const NodeId& id) {
    const Value* value = results.find(id);
    REQUIRE(value != nullptr);
    REQUIRE(isScalar(*value));
    return std::get<Scalar>(*value).value;
}

std::string errorOf(const ResultMap& results, const NodeId& id) {
    const Value* value = results.find(id);
    REQUIRE(value != nullptr);
    REQUIRE(isError(*value));
    return std::get<Error>(*value).message;
}

} // namespace

TEST_CASE_METHOD(StandardFixture, "two numbers feed an add and a display", "[evaluator][scenario]") {
    const std::vector<Node> nodes{numberNode("n1", 3), numberNode("n2", 4), makeNode("sum", "add"),
                                  makeNode("out", "display")};
    const std::vector<Edge> edges{makeEdge("n1", "sum", "a"), makeEdge("n2", "sum", "b"),
                                  makeEdge("sum", "out", "value")};

    const ResultMap results = evaluateGraph(registry, nodes, edges);
    CHECK(results.size() == 4);
    CHECK(scalarOf(results, "sum") == 7.0);
    CHECK(scalarOf(results, "out") == 7.0);
}

TEST_CASE_METHOD(StandardFixture, "a cycle leaves only independent nodes resolved", "[evaluator][scenario]") {
    const std::vector<Node> nodes{makeNode("x", "add"), makeNode("y", "add"), numberNode("n", 5)};
    const std::vector<Edge> edges{makeEdge("x", "y", "a"), makeEdge("y", "x", "a")};

    const ResultMap results = evaluateGraph(registry, nodes, edges);
    CHECK(results.size() == 1);
    CHECK(scalarOf(results, "n") == 5.0);
    CHECK_FALSE(results.contains("x"));
    CHECK_FALSE(results.contains("y"));
}

TEST_CASE_METHOD(StandardFixture, "division by a literal zero is an error value", "[evaluator][scenario]") {
    Node div = makeNode("div", "divide");
    div.data.inputBindings = {{"a", InputBinding::literal(1)}, {"b", InputBinding::literal(0)}};
    Node sum = makeNode("sum", "add");
    sum.data.inputBindings = {{"b", InputBinding::literal(1)}};

    const ResultMap results = evaluateGraph(registry, {div, sum}, {makeEdge("div", "sum", "a")});
    CHECK_THAT(errorOf(results, "div"), Catch::Contains("Division by zero"));
    // Error values flow downstream unchanged
    CHECK_THAT(errorOf(results, "sum"), Catch::Contains("Division by zero"));
}

TEST_CASE_METHOD(StandardFixture, "port override replaces the upstream value", "[evaluator][scenario]") {
    Node sum = makeNode("sum", "add");
    sum.data.portOverrides = {{"a", true}};
    sum.data.inputBindings = {{"a", InputBinding::literal(10)}, {"b", InputBinding::literal(1)}};
    const std::vector<Edge> edges{makeEdge("n1", "sum", "a")};

    SECTION("override on") {
        const ResultMap results = evaluateGraph(registry, {numberNode("n1", 3), sum}, edges);
        CHECK(scalarOf(results, "sum") == 11.0);
    }
    SECTION("override off uses the upstream value") {
        sum.data.portOverrides["a"] = false;
        const ResultMap results = evaluateGraph(registry, {numberNode("n1", 3), sum}, edges);
        CHECK(scalarOf(results, "sum") == 4.0);
    }
    SECTION("override without a binding gives no value") {
        sum.data.inputBindings.erase("a");
        const ResultMap results = evaluateGraph(registry, {numberNode("n1", 3), sum}, edges);
        CHECK(std::isnan(scalarOf(results, "sum")));
    }
}

TEST_CASE_METHOD(StandardFixture, "unconnected ports resolve through bindings", "[evaluator][bindings]") {
    BindingTable table;
    table.constants = buildConstantsTable(registry);
    table.variables["rate"] = 0.5;

    Node sum = makeNode("sum", "add");
    sum.data.inputBindings = {{"a", InputBinding::variable("rate")}, {"b", InputBinding::constant("pi")}};
    Node legacy = makeNode("legacy", "multiply");
    legacy.data.manualValues = {{"a", 3.0}, {"b", 2.0}};
    Node unbound = makeNode("unbound", "display");

    const ResultMap results = evaluateGraph(registry, {sum, legacy, unbound}, {}, table);
    CHECK(scalarOf(results, "sum") == Approx(0.5 + 3.141592653589793));
    CHECK(scalarOf(results, "legacy") == 6.0);
    CHECK(std::isnan(scalarOf(results, "unbound")));
}

TEST_CASE_METHOD(StandardFixture, "resolveInputs follows the block's port order", "[evaluator]") {
    Node powNode = makeNode("p", "power");
    powNode.data.inputBindings = {{"exp", InputBinding::literal(3)}};
    const std::vector<Node> nodes{numberNode("n", 2), powNode};
    const std::vector<Edge> edges{makeEdge("n", "p", "base")};

    const Topology topology = buildTopology(nodes, edges);
    ResultMap upstream = evaluateGraph(registry, {numberNode("n", 2)}, {});
    const InputList inputs = Evaluator(registry).resolveInputs(powNode, *registry.find("power"), topology, upstream,
                                                               BindingTable{});
    REQUIRE(inputs.size() == 2);
    CHECK(extractScalar(inputs[0]) == 2.0);
    CHECK(extractScalar(inputs[1]) == 3.0);

    CHECK(scalarOf(evaluateGraph(registry, nodes, edges), "p") == 8.0);
}

TEST_CASE_METHOD(StandardFixture, "evaluation is idempotent and order independent", "[evaluator][determinism]") {
    Node scale = makeNode("scale", "multiply");
    scale.data.inputBindings = {{"b", InputBinding::literal(2)}};
    std::vector<Node> nodes{numberNode("a", 1.5), numberNode("b", -4), makeNode("sum", "add"), scale,
                            makeNode("out", "display")};
    const std::vector<Edge> edges{makeEdge("a", "sum", "a"), makeEdge("b", "sum", "b"), makeEdge("sum", "scale", "a"),
                                  makeEdge("scale", "out", "value")};

    const ResultMap baseline = evaluateGraph(registry, nodes, edges);
    CHECK(scalarOf(baseline, "out") == -5.0);
    CHECK(evaluateGraph(registry, nodes, edges) == baseline);

    std::vector<size_t> perm(nodes.size());
    std::iota(perm.begin(), perm.end(), 0);
    while (std::next_permutation(perm.begin(), perm.end())) {
        std::vector<Node> shuffled;
        for (size_t i : perm) shuffled.push_back(nodes[i]);
        CHECK(evaluateGraph(registry, shuffled, edges) == baseline);
    }
}

TEST_CASE("a throwing block does not abort the pass", "[evaluator][faults]") {
    BlockRegistry registry;
    registerStandardBlocks(registry);
    registry.registerBlock(BlockDef{"explode", "Explode", "test", {}, [](const InputList&, const NodeData&) -> Value {
        throw std::runtime_error("kaboom");
    }});
    registry.registerBlock(BlockDef{"weird", "Weird", "test", {}, [](const InputList&, const NodeData&) -> Value {
        throw 42;
    }});

    Snapshot snapshot;
    snapshot.nodes = {makeNode("e", "explode"), makeNode("w", "weird"), makeNode("shown", "display"),
                      numberNode("n", 9)};
    snapshot.edges = {makeEdge("e", "shown", "value")};

    LogCapture capture(LogLevel::Warn);
    const EvalReport report = Evaluator(registry).run(snapshot);
    CHECK(errorOf(report.results, "e") == "kaboom");
    CHECK(errorOf(report.results, "w") == "Unknown error");
    CHECK(errorOf(report.results, "shown") == "kaboom");
    CHECK(scalarOf(report.results, "n") == 9.0);
    CHECK(report.stats.operationFaults == 2);
    CHECK(report.stats.nodesEvaluated == 4);
    CHECK(capture.contains("engine", "kaboom"));
}

TEST_CASE_METHOD(StandardFixture, "run reports cycles and unknown blocks", "[evaluator][diagnostics]") {
    Snapshot snapshot;
    snapshot.nodes = {makeNode("x", "add"), makeNode("y", "add"), makeNode("m", "mystery"),
                      makeNode("seen", "display"), numberNode("n", 1)};
    snapshot.edges = {makeEdge("x", "y", "a"), makeEdge("y", "x", "a"), makeEdge("m", "seen", "value")};

    LogCapture capture(LogLevel::Off);
    const EvalReport report = Evaluator(registry).run(snapshot);

    CHECK(report.stats.nodesUnreachable == 2);
    CHECK(report.stats.nodesSkipped == 1);
    CHECK(report.stats.nodesEvaluated == 2);
    CHECK_FALSE(report.results.contains("m"));
    CHECK(std::isnan(scalarOf(report.results, "seen")));

    size_t cycles = 0;
    size_t unknown = 0;
    for (const auto& d : report.diagnostics) {
        if (d.code == ErrorCode::CycleDetected) {
            ++cycles;
            CHECK(d.level == DiagLevel::Error);
        }
        if (d.code == ErrorCode::UnknownBlock) {
            ++unknown;
            CHECK(d.level == DiagLevel::Warning);
            CHECK(d.nodeId == NodeId("m"));
        }
    }
    CHECK(cycles == 2);
    CHECK(unknown == 1);
}

TEST_CASE_METHOD(StandardFixture, "run rejects an unsupported snapshot version", "[evaluator][diagnostics]") {
    Snapshot snapshot;
    snapshot.version = 2;
    snapshot.nodes = {numberNode("n", 1)};
    try {
        Evaluator(registry).run(snapshot);
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        CHECK(e.code() == ErrorCode::UnsupportedVersion);
    }
}
