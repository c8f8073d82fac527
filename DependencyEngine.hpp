// DependencyEngine.hpp
//
// Incremental scheduler. Walks each weakly-connected component in
// topological order, recalculates a node only when it can produce something
// new (no update hint, it is the hinted node, it always recalculates, or one
// of its resolved inputs changed) and stages produced values on the inputs
// they are connected to.
#pragma once
#include "BaseEngine.hpp"
#include <mutex>
#include <optional>

namespace DepFlow {

class DependencyEngine : public BaseEngine {
public:
    explicit DependencyEngine(Editor& editor);

    // Stopped -> Idle with a full recalculation and a rebuilt order
    void start() override;

    CalculationResult runGraph(Graph& graph, InputMap inputs, const Value& calculationData) override;

    // Node whose input is known to have just changed. Consumed by the next run.
    void setUpdatedNode(const NodeId& id);
    void clearUpdatedNode();
    std::optional<NodeId> updatedNode() const;

protected:
    CalculationResult execute(const Value& calculationData) override;
    void onChange(bool recalculateOrder, Node* updatedNode) override;

private:
    mutable std::mutex hintMutex;
    std::optional<NodeId> hint;
    // A notification has set or cleared the hint and no run consumed it yet
    bool hintPending = false;
    // runGraph nesting on the running thread (subgraph nodes call back in)
    int runDepth = 0;

    std::optional<NodeId> takeUpdatedNode();

    void calculateComponent(Graph& graph, const SortedComponent& component, const std::optional<NodeId>& updated,
                            InputMap& inputs, const Value& calculationData, CalculationResult& result);
    void calculateNode(Graph& graph, const SortedComponent& component, Node& node,
                       const std::optional<NodeId>& updated, InputMap& inputs, const Value& calculationData,
                       CalculationResult& result);
    void validateNodeCalculationOutput(const Node& node, const ValueMap& outputValues) const;
};

} // namespace DepFlow
