#include "ApplyResult.hpp"
#include "DependencyEngine.hpp"
#include "SubgraphNode.hpp"
#include "TestNode.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace DepFlow;
using DepFlow::test::MultiNode;
using DepFlow::test::TestNode;

namespace {

ValueMap values(long long c, long long d) {
    return ValueMap{{"c", c}, {"d", d}};
}

ValueMap inputs(long long a, long long b) {
    return ValueMap{{"a", a}, {"b", b}};
}

} // namespace

TEST(DependencyEngine, EmitsNodeCalculationEvents) {
    Editor editor;
    auto& n1 = editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<TestNode>("n2");
    editor.graph().connect("n1", "c", "n2", "a");

    DependencyEngine engine(editor);
    std::vector<BeforeNodeCalculationEventData> before;
    std::vector<AfterNodeCalculationEventData> after;
    engine.events.beforeNodeCalculation.subscribe("a", [&](const BeforeNodeCalculationEventData& d) { before.push_back(d); });
    engine.events.afterNodeCalculation.subscribe("b", [&](const AfterNodeCalculationEventData& d) { after.push_back(d); });

    n1.findInput("a")->value = 2;
    n1.findInput("b")->value = 3;
    n2.findInput("b")->value = 4;

    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());

    ASSERT_EQ(before.size(), 2u);
    EXPECT_EQ(before[0].node, &n1);
    EXPECT_EQ(before[0].inputValues, inputs(2, 3));
    EXPECT_EQ(before[1].node, &n2);
    EXPECT_EQ(before[1].inputValues, inputs(5, 4));

    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(after[0].node, &n1);
    EXPECT_EQ(after[0].outputValues, values(5, -1));
    EXPECT_EQ(after[1].node, &n2);
    EXPECT_EQ(after[1].outputValues, values(9, 1));

    EXPECT_EQ(result->at("n2").inputs, inputs(5, 4));
    EXPECT_EQ(result->at("n2").outputs, values(9, 1));
}

TEST(DependencyEngine, HandlesNodesWithoutCalculation) {
    Editor editor;
    auto node = std::make_unique<Node>("display", "Display", NodeKind::PassThrough);
    node->addInput("value", 3);
    editor.graph().addNode(std::move(node));

    DependencyEngine engine(editor);
    EXPECT_FALSE(engine.runOnce().has_value());
}

TEST(DependencyEngine, CollectsMultipleConnectionsInConnectionOrder) {
    Editor editor;
    editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<MultiNode>("n2");
    editor.graph().connect("n1", "c", "n2", "a");
    editor.graph().connect("n1", "d", "n2", "a");

    DependencyEngine engine(editor);
    engine.runOnce();

    EXPECT_EQ(n2.calls, 1);
    EXPECT_EQ(n2.received, Value::array({2, 0}));
}

TEST(DependencyEngine, UnconnectedMultiInputKeepsStoredValue) {
    Editor editor;
    auto& n = editor.graph().emplaceNode<MultiNode>("n");

    DependencyEngine engine(editor);
    engine.runOnce();
    EXPECT_EQ(n.received, Value::array({0}));
}

TEST(DependencyEngine, PruningDropsContributionsStagedBeforeTheHint) {
    Editor editor;
    auto& left = editor.graph().emplaceNode<TestNode>("left");
    auto& right = editor.graph().emplaceNode<TestNode>("right");
    auto& m = editor.graph().emplaceNode<MultiNode>("m");
    editor.graph().connect("left", "c", "m", "a");
    editor.graph().connect("right", "c", "m", "a");
    left.findInput("a")->value = 10;
    right.findInput("a")->value = 20;

    DependencyEngine engine(editor);
    const auto& order = engine.sortedComponents(editor.graph()).at(0).calculationOrder;
    ASSERT_EQ(order.size(), 3u);
    ASSERT_EQ(order.back(), &m);
    const Node* later = order[1];
    const Node* earlier = order[0];

    // The source ordered before the hinted one is skipped, so only the
    // hinted source's value reaches the multi-connection input.
    engine.setUpdatedNode(later->id());
    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->count(earlier->id()), 0u);
    const long long expected = later == &left ? 11 : 21;
    EXPECT_EQ(m.received, Value::array({expected}));
    EXPECT_EQ(result->at("m").inputs.at("a"), Value::array({expected}));
}

TEST(DependencyEngine, CalculatesOnlyTheHintedComponent) {
    Editor editor;
    auto& n1 = editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<TestNode>("n2");
    auto& n3 = editor.graph().emplaceNode<TestNode>("n3");
    editor.graph().connect("n1", "c", "n2", "a");

    DependencyEngine engine(editor);
    engine.setUpdatedNode("n1");
    auto result = engine.runOnce();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(n1.calls, 1);
    EXPECT_EQ(n2.calls, 1);
    EXPECT_EQ(n3.calls, 0);
    EXPECT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("n1").outputs, values(2, 0));
    EXPECT_EQ(result->at("n2").outputs, values(3, 1));
    EXPECT_FALSE(engine.updatedNode().has_value());
}

// n1 -> n2 -> n4
// n1 -> n3 -> n4
TEST(DependencyEngine, CalculatesDiamond) {
    Editor editor;
    for (const char* id : {"n1", "n2", "n3", "n4"}) editor.graph().emplaceNode<TestNode>(id);
    editor.graph().connect("n1", "c", "n2", "a");
    editor.graph().connect("n1", "d", "n3", "a");
    editor.graph().connect("n2", "c", "n4", "a");
    editor.graph().connect("n3", "d", "n4", "b");

    DependencyEngine engine(editor);
    auto result = engine.runOnce();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 4u);
    EXPECT_EQ(result->at("n1").outputs, values(2, 0));
    EXPECT_EQ(result->at("n2").outputs, values(3, 1));
    EXPECT_EQ(result->at("n3").outputs, values(1, -1));
    EXPECT_EQ(result->at("n4").outputs, values(2, 4));
}

TEST(DependencyEngine, RecalculatesOnlyNodesAffectedByTheUpdatedNode) {
    Editor editor;
    auto& n1 = editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<TestNode>("n2");
    auto& n3 = editor.graph().emplaceNode<TestNode>("n3");
    editor.graph().connect("n1", "c", "n2", "a");
    editor.graph().connect("n2", "c", "n3", "a");

    DependencyEngine engine(editor);
    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("n2").inputs, inputs(2, 1));
    EXPECT_EQ(result->at("n2").outputs, values(3, 1));
    EXPECT_EQ(result->at("n3").inputs, inputs(3, 1));
    EXPECT_EQ(result->at("n3").outputs, values(4, 2));
    applyResult(*result, editor);

    n1.calls = n2.calls = n3.calls = 0;
    n2.findInput("a")->value = 3;
    engine.setUpdatedNode("n2");
    result = engine.runOnce();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("n2").inputs, inputs(3, 1));
    EXPECT_EQ(result->at("n2").outputs, values(4, 2));
    EXPECT_EQ(result->at("n3").inputs, inputs(4, 1));
    EXPECT_EQ(result->at("n3").outputs, values(5, 3));
    EXPECT_EQ(n1.calls, 0);
    EXPECT_EQ(n2.calls, 1);
    EXPECT_EQ(n3.calls, 1);
}

TEST(DependencyEngine, ReusesOutputsWhenInputsDidNotChange) {
    Editor editor;
    auto& n1 = editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<TestNode>("n2");
    editor.graph().connect("n1", "c", "n2", "a");

    DependencyEngine engine(editor);
    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("n1").inputs, inputs(1, 1));
    EXPECT_EQ(result->at("n1").outputs, values(2, 0));
    EXPECT_EQ(result->at("n2").inputs, inputs(2, 1));
    EXPECT_EQ(result->at("n2").outputs, values(3, 1));
    applyResult(*result, editor);

    n1.calls = n2.calls = 0;
    engine.setUpdatedNode("n1");
    result = engine.runOnce();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 2u);
    EXPECT_EQ(result->at("n1").inputs, inputs(1, 1));
    EXPECT_EQ(result->at("n1").outputs, values(2, 0));
    EXPECT_EQ(result->at("n2").inputs, inputs(2, 1));
    EXPECT_EQ(result->at("n2").outputs, values(3, 1));
    EXPECT_EQ(n1.calls, 1);
    EXPECT_EQ(n2.calls, 0);
}

TEST(DependencyEngine, AlwaysRecalculateBypassesChangeDetection) {
    Editor editor;
    editor.graph().emplaceNode<TestNode>("n1");
    auto& n2 = editor.graph().emplaceNode<TestNode>("n2");
    n2.setAlwaysRecalculate(true);
    editor.graph().connect("n1", "c", "n2", "a");

    DependencyEngine engine(editor);
    applyResult(*engine.runOnce(), editor);

    n2.calls = 0;
    engine.setUpdatedNode("n1");
    engine.runOnce();
    EXPECT_EQ(n2.calls, 1);
}

TEST(DependencyEngine, HintOutsideTheGraphCalculatesNothing) {
    Editor editor;
    auto& n1 = editor.graph().emplaceNode<TestNode>("n1");

    DependencyEngine engine(editor);
    engine.setUpdatedNode("missing");
    EXPECT_FALSE(engine.runOnce().has_value());
    EXPECT_EQ(n1.calls, 0);
}

TEST(DependencyEngine, MissingOutputKeyFailsTheRun) {
    Editor editor;
    auto node = std::make_unique<FunctionNode>(
        "broken", "Broken", [](const ValueMap&, CalculationContext&) { return ValueMap{{"x", 1}}; });
    node->addOutput("y", 0);
    editor.graph().addNode(std::move(node));

    DependencyEngine engine(editor);
    try {
        engine.runOnce();
        FAIL() << "expected EngineError";
    } catch (const EngineError& e) {
        EXPECT_STREQ(e.what(), "Calculation return value from node broken (type Broken) is missing key \"y\"");
    }
    EXPECT_EQ(engine.status(), EngineStatus::Stopped);
}

TEST(DependencyEngine, CycleAbortsTheRun) {
    Editor editor;
    editor.graph().emplaceNode<TestNode>("n1");
    editor.graph().emplaceNode<TestNode>("n2");
    editor.graph().connect("n1", "c", "n2", "a");
    editor.graph().connect("n2", "c", "n1", "a");

    DependencyEngine engine(editor);
    EXPECT_THROW(engine.runOnce(), CycleError);
}

TEST(DependencyEngine, NodeErrorsPropagateUnchanged) {
    Editor editor;
    editor.graph().emplaceNode<FunctionNode>("thrower", "Thrower", [](const ValueMap&, CalculationContext&) -> ValueMap {
        throw std::out_of_range("bad input");
    });

    DependencyEngine engine(editor);
    EXPECT_THROW(engine.runOnce(), std::out_of_range);
}

TEST(DependencyEngine, TransferHookTransformsValuesInTransit) {
    Editor editor;
    editor.graph().emplaceNode<TestNode>("n1");
    editor.graph().emplaceNode<TestNode>("n2");
    editor.graph().connect("n1", "c", "n2", "a");

    DependencyEngine engine(editor);
    std::vector<ConnectionId> seen;
    engine.hooks.transferData.tap("scale", [&](Value v, const Connection& c) {
        seen.push_back(c.id);
        return Value(v.get<long long>() * 10);
    });

    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("n1").outputs, values(2, 0));
    EXPECT_EQ(result->at("n2").inputs, inputs(20, 1));
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "c1");
}

TEST(DependencyEngine, PassesCalculationDataToNodes) {
    Editor editor;
    auto node = std::make_unique<FunctionNode>(
        "clock", "Clock", [](const ValueMap&, CalculationContext& ctx) { return ValueMap{{"tick", ctx.calculationData.at("tick")}}; });
    node->addOutput("tick", 0);
    editor.graph().addNode(std::move(node));

    DependencyEngine engine(editor);
    auto result = engine.runOnce(Value{{"tick", 7}});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("clock").outputs.at("tick"), 7);
}

TEST(DependencyEngine, SkipsPassThroughNodes) {
    Editor editor;
    editor.graph().emplaceNode<TestNode>("n1");
    auto sink = std::make_unique<Node>("sink", "Display", NodeKind::PassThrough);
    sink->addInput("value", Value());
    editor.graph().addNode(std::move(sink));
    editor.graph().connect("n1", "c", "sink", "value");

    DependencyEngine engine(editor);
    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 1u);
    EXPECT_EQ(result->count("sink"), 0u);
}

// n1 -> [ sin -> inner1 -> sout ] -> n2
class SubgraphTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto inner = std::make_unique<Graph>("inner");
        inner->emplaceNode<SubgraphInputNode>("sin", "x");
        inner->emplaceNode<TestNode>("inner1");
        inner->emplaceNode<SubgraphOutputNode>("sout", "y");
        inner->connect("sin", "placeholder", "inner1", "a");
        inner->connect("inner1", "c", "sout", "placeholder");
        innerGraph = inner.get();

        editor.graph().emplaceNode<TestNode>("n1");
        graphNode = &editor.graph().emplaceNode<GraphNode>("g", std::move(inner));
        editor.graph().emplaceNode<TestNode>("n2");
        editor.graph().connect("n1", "c", "g", "x");
        editor.graph().connect("g", "y", "n2", "a");
    }

    Editor editor;
    Graph* innerGraph = nullptr;
    GraphNode* graphNode = nullptr;
};

TEST_F(SubgraphTest, DerivesPortsFromInterfaceNodes) {
    ASSERT_EQ(graphNode->inputs().size(), 1u);
    EXPECT_EQ(graphNode->inputs()[0].name, "x");
    ASSERT_EQ(graphNode->outputs().size(), 1u);
    EXPECT_EQ(graphNode->outputs()[0].name, "y");
    EXPECT_EQ(innerGraph->parent(), &editor.graph());
    EXPECT_EQ(editor.graphs().size(), 2u);
}

TEST_F(SubgraphTest, SurfacesInnerResults) {
    DependencyEngine engine(editor);
    auto result = engine.runOnce();

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 5u);
    EXPECT_EQ(result->at("inner1").inputs, inputs(2, 1));
    EXPECT_EQ(result->at("inner1").outputs, values(3, 1));
    EXPECT_EQ(result->at("sout").outputs.at("output"), 3);
    EXPECT_EQ(result->at("g").inputs.at("x"), 2);
    EXPECT_EQ(result->at("g").outputs.at("y"), 3);
    EXPECT_EQ(result->at("n2").inputs, inputs(3, 1));
    EXPECT_EQ(result->at("n2").outputs, values(4, 2));
    EXPECT_EQ(result->count("sin"), 0u);
}

TEST_F(SubgraphTest, InnerValueChangeRecalculatesTheOwningNode) {
    DependencyEngine engine(editor);
    std::vector<CalculationResult> runs;
    engine.events.afterRun.subscribe("test", [&](const CalculationResult& r) {
        runs.push_back(r);
        applyResult(r, editor);
    });
    engine.start();
    ASSERT_EQ(runs.size(), 1u);

    auto* n1 = static_cast<TestNode*>(editor.graph().findNode("n1"));
    n1->calls = 0;
    innerGraph->setInputValue("inner1", "b", 5);

    ASSERT_EQ(runs.size(), 2u);
    const auto& result = runs.back();
    EXPECT_EQ(n1->calls, 0);
    EXPECT_EQ(result.count("n1"), 0u);
    EXPECT_EQ(result.at("inner1").outputs, values(7, -3));
    EXPECT_EQ(result.at("g").outputs.at("y"), 7);
    EXPECT_EQ(result.at("n2").outputs, values(8, 6));
}

TEST(DependencyEngine, ContextCarriesStoredOutputs) {
    Editor editor;
    auto node = std::make_unique<FunctionNode>("acc", "Accumulator", [](const ValueMap& in, CalculationContext& ctx) {
        return ValueMap{{"total", ctx.storedOutputs.at("total").get<int>() + in.at("step").get<int>()}};
    });
    node->addInput("step", 2);
    node->addOutput("total", 10);
    editor.graph().addNode(std::move(node));

    DependencyEngine engine(editor);
    auto first = engine.runOnce();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->at("acc").outputs.at("total"), 12);
    applyResult(*first, editor);

    auto second = engine.runOnce();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->at("acc").outputs.at("total"), 14);
}

TEST(DependencyEngine, NestedGraphMayReuseTheRootGraphId) {
    auto inner = std::make_unique<Graph>("g");
    inner->emplaceNode<SubgraphInputNode>("sin", "x");
    inner->emplaceNode<SubgraphOutputNode>("sout", "y");
    inner->connect("sin", "placeholder", "sout", "placeholder");
    Graph* innerGraph = inner.get();

    Editor editor("g");
    editor.graph().emplaceNode<TestNode>("n1");
    editor.graph().emplaceNode<GraphNode>("wrap", std::move(inner));
    editor.graph().connect("n1", "c", "wrap", "x");

    DependencyEngine engine(editor);
    auto result = engine.runOnce();
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->at("sout").outputs.at("output"), 2);
    EXPECT_EQ(result->at("wrap").outputs.at("y"), 2);
    EXPECT_NE(&engine.sortedComponents(*innerGraph), &engine.sortedComponents(editor.graph()));
}
