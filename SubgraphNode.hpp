// SubgraphNode.hpp
//
// Hierarchical nodes. A GraphNode owns a nested graph whose
// SubgraphInputNode/SubgraphOutputNode members define the GraphNode's own
// inputs and outputs. Calculating the GraphNode runs the nested graph on the
// same engine and surfaces the inner nodes' entries in the outer result.
#pragma once
#include "FlowGraph.hpp"
#include <memory>
#include <string>
#include <vector>

namespace DepFlow {

// Entry point of a nested graph; its placeholder output carries the value of
// the GraphNode input with the same name. Never calculated itself.
class SubgraphInputNode : public Node {
public:
    static constexpr const char* TypeName = "SubgraphInput";

    SubgraphInputNode(NodeId id, std::string interfaceName);

    const std::string& interfaceName() const { return name; }

private:
    std::string name;
};

// Exit point of a nested graph: forwards its placeholder input to "output".
class SubgraphOutputNode : public Node {
public:
    static constexpr const char* TypeName = "SubgraphOutput";

    SubgraphOutputNode(NodeId id, std::string interfaceName);

    const std::string& interfaceName() const { return name; }

    NodeOutput calculate(const ValueMap& inputs, CalculationContext& context) override;

private:
    std::string name;
};

class GraphNode : public Node {
public:
    static constexpr const char* TypeName = "Subgraph";

    // Inputs/outputs are derived from the interface nodes already in the subgraph.
    GraphNode(NodeId id, std::unique_ptr<Graph> subgraph);

    Graph* subgraph() override { return inner.get(); }

    NodeOutput calculate(const ValueMap& inputs, CalculationContext& context) override;

    void onPlaced(Graph& graph) override;

private:
    struct InterfaceMapping {
        NodeId innerNode;
        std::string name;
    };

    std::unique_ptr<Graph> inner;
    std::vector<InterfaceMapping> inputMappings;
    std::vector<InterfaceMapping> outputMappings;
};

} // namespace DepFlow
