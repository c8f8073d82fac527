// DependencyEngine.cpp
//
// Implements the per-run scheduling: component selection by update hint,
// input resolution against staged values, the recalculate-or-reuse decision,
// output validation and value propagation along outgoing connections.
#include "DependencyEngine.hpp"
#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace DepFlow {

namespace {
// Counts nested runGraph calls so only the outermost one consumes the hint
struct RunDepthGuard {
    explicit RunDepthGuard(int& depth) : depth(depth) { ++depth; }
    ~RunDepthGuard() { --depth; }
    int& depth;
};
}

DependencyEngine::DependencyEngine(Editor& editor) : BaseEngine(editor) {}

void DependencyEngine::start() {
    invalidateOrder();
    clearUpdatedNode();
    BaseEngine::start();
}

void DependencyEngine::setUpdatedNode(const NodeId& id) {
    std::lock_guard<std::mutex> lock(hintMutex);
    hint = id;
    hintPending = true;
}

void DependencyEngine::clearUpdatedNode() {
    std::lock_guard<std::mutex> lock(hintMutex);
    hint.reset();
    hintPending = false;
}

std::optional<NodeId> DependencyEngine::updatedNode() const {
    std::lock_guard<std::mutex> lock(hintMutex);
    return hint;
}

std::optional<NodeId> DependencyEngine::takeUpdatedNode() {
    std::lock_guard<std::mutex> lock(hintMutex);
    std::optional<NodeId> taken = std::move(hint);
    hint.reset();
    hintPending = false;
    return taken;
}

void DependencyEngine::onChange(bool recalculateOrder, Node* updatedNode) {
    if (recalculateOrder) invalidateOrder();
    {
        std::lock_guard<std::mutex> lock(hintMutex);
        std::optional<NodeId> next;
        if (!recalculateOrder && updatedNode) next = updatedNode->id();
        // Two different changes waiting for the same run cannot share a hint
        if (hintPending && hint != next) hint.reset();
        else hint = next;
        hintPending = true;
    }
    scheduleRun();
}

CalculationResult DependencyEngine::execute(const Value& calculationData) {
    refreshOrderIfInvalidated();

    // Values of unconnected inputs are gathered up front so that the run works
    // on one consistent snapshot of the external inputs.
    InputMap inputValues;
    for (const Node* n : editor.graph().nodes()) {
        for (const auto& intf : n->inputs()) {
            if (intf.connectionCount == 0) inputValues.emplace(intf.id, intf.value);
        }
    }
    return runGraph(editor.graph(), std::move(inputValues), calculationData);
}

CalculationResult DependencyEngine::runGraph(Graph& graph, InputMap inputs, const Value& calculationData) {
    std::optional<NodeId> updated;
    if (runDepth == 0) updated = takeUpdatedNode();
    RunDepthGuard depthGuard(runDepth);

    const auto& components = sortedComponents(graph);
    CalculationResult result;
    for (const auto& component : components) {
        if (updated) {
            const auto& order = component.calculationOrder;
            bool member = std::any_of(order.begin(), order.end(), [&](const Node* n) { return n->id() == *updated; });
            if (!member) continue;
        }
        calculateComponent(graph, component, updated, inputs, calculationData, result);
    }
    return result;
}

void DependencyEngine::calculateComponent(Graph& graph, const SortedComponent& component,
                                          const std::optional<NodeId>& updated, InputMap& inputs,
                                          const Value& calculationData, CalculationResult& result) {
    const auto& order = component.calculationOrder;
    size_t first = 0;
    if (updated) {
        auto it = std::find_if(order.begin(), order.end(), [&](const Node* n) { return n->id() == *updated; });
        if (it == order.end()) {
            throw EngineError(fmt::format("Updated node {} is not part of the component being calculated", *updated));
        }
        // Nodes ordered before the updated node are treated as unaffected. This
        // follows the calculation order only, not actual reachability.
        first = static_cast<size_t>(it - order.begin());
    }

    for (size_t i = first; i < order.size(); ++i) {
        Node& node = *order[i];
        if (node.kind() == NodeKind::PassThrough) continue;
        calculateNode(graph, component, node, updated, inputs, calculationData, result);
    }
}

void DependencyEngine::calculateNode(Graph& graph, const SortedComponent& component, Node& node,
                                     const std::optional<NodeId>& updated, InputMap& inputs,
                                     const Value& calculationData, CalculationResult& result) {
    ValueMap inputValues;
    bool inputsChanged = false;
    for (const auto& intf : node.inputs()) {
        auto staged = inputs.find(intf.id);
        const Value& value = staged != inputs.end() ? staged->second : intf.value;
        inputValues[intf.name] = value;
        if (!node.isInterfaceEqualTo(intf, value)) inputsChanged = true;
    }

    events.beforeNodeCalculation.emit(BeforeNodeCalculationEventData{&node, inputValues});

    const ValueMap storedOutputs = node.outputValues();
    NodeOutput output;
    if (!updated || node.id() == *updated || node.alwaysRecalculate() || inputsChanged) {
        SPDLOG_DEBUG("calculating {} ({})", node.id(), node.type());
        CalculationContext context{calculationData, *this, storedOutputs};
        output = node.calculate(inputValues, context);
    } else {
        SPDLOG_DEBUG("reusing outputs of {}: inputs unchanged", node.id());
        output.values = storedOutputs;
    }

    validateNodeCalculationOutput(node, output.values);
    events.afterNodeCalculation.emit(AfterNodeCalculationEventData{&node, output.values});

    result.insert_or_assign(node.id(), NodeResult{inputValues, output.values});
    for (auto& entry : output.subgraphResults) {
        result.insert_or_assign(entry.first, std::move(entry.second));
    }

    auto outgoing = component.connectionsFromNode.find(node.id());
    if (outgoing == component.connectionsFromNode.end()) return;

    for (const Connection& connection : outgoing->second) {
        const NodeInterface* source = nullptr;
        for (const auto& intf : node.outputs()) {
            if (intf.id == connection.from) source = &intf;
        }
        if (!source) {
            throw EngineError(fmt::format("Could not find output for interface {} on node {}", connection.from, node.id()));
        }
        const NodeInterface* target = graph.findInterface(connection.to);
        if (!target) {
            throw EngineError(fmt::format("Connection {} targets unknown interface {}", connection.id, connection.to));
        }

        Value value = hooks.transferData.execute(output.values.at(source->name), connection);
        if (target->allowMultipleConnections) {
            auto staged = inputs.find(connection.to);
            if (staged == inputs.end() || !staged->second.is_array()) {
                Value sequence = Value::array();
                sequence.push_back(std::move(value));
                inputs[connection.to] = std::move(sequence);
            } else {
                staged->second.push_back(std::move(value));
            }
        } else {
            inputs[connection.to] = std::move(value);
        }
    }
}

void DependencyEngine::validateNodeCalculationOutput(const Node& node, const ValueMap& outputValues) const {
    for (const auto& intf : node.outputs()) {
        if (!outputValues.count(intf.name)) {
            throw EngineError(fmt::format("Calculation return value from node {} (type {}) is missing key \"{}\"",
                                          node.id(), node.type(), intf.name));
        }
    }
}

} // namespace DepFlow
