// SubgraphNode.cpp
//
// Subgraph interface nodes and the GraphNode that runs its nested graph
// through the calculating engine, mapping outer inputs onto the connections
// leaving each SubgraphInputNode.
#include "SubgraphNode.hpp"
#include "DependencyEngine.hpp"
#include <fmt/core.h>

namespace DepFlow {

SubgraphInputNode::SubgraphInputNode(NodeId id, std::string interfaceName)
    : Node(std::move(id), TypeName, NodeKind::PassThrough), name(std::move(interfaceName)) {
    setTitle("Subgraph Input");
    addOutput("placeholder", Value());
}

SubgraphOutputNode::SubgraphOutputNode(NodeId id, std::string interfaceName)
    : Node(std::move(id), TypeName, NodeKind::Computable), name(std::move(interfaceName)) {
    setTitle("Subgraph Output");
    addInput("placeholder", Value());
    addOutput("output", Value());
}

NodeOutput SubgraphOutputNode::calculate(const ValueMap& inputs, CalculationContext& context) {
    (void)context;
    NodeOutput out;
    out.values["output"] = inputs.at("placeholder");
    return out;
}

GraphNode::GraphNode(NodeId id, std::unique_ptr<Graph> subgraph)
    : Node(std::move(id), TypeName, NodeKind::Computable), inner(std::move(subgraph)) {
    if (!inner) {
        throw FlowError(fmt::format("GraphNode {} needs a subgraph", this->id()));
    }
    for (Node* n : inner->nodes()) {
        if (auto* in = dynamic_cast<SubgraphInputNode*>(n)) {
            addInput(in->interfaceName(), Value());
            inputMappings.push_back({in->id(), in->interfaceName()});
        } else if (auto* out = dynamic_cast<SubgraphOutputNode*>(n)) {
            addOutput(out->interfaceName(), Value());
            outputMappings.push_back({out->id(), out->interfaceName()});
        }
    }
}

void GraphNode::onPlaced(Graph& graph) {
    inner->setOwner(&graph, this);
}

NodeOutput GraphNode::calculate(const ValueMap& inputs, CalculationContext& context) {
    // Unconnected inner inputs act as the nested run's external inputs
    InputMap graphInputs;
    for (const Node* n : inner->nodes()) {
        for (const auto& intf : n->inputs()) {
            if (intf.connectionCount == 0) graphInputs.emplace(intf.id, intf.value);
        }
    }

    // Every connection leaving an input node carries the matching outer value
    for (const auto& mapping : inputMappings) {
        const Node* inputNode = inner->findNode(mapping.innerNode);
        if (!inputNode) continue;
        const PortId& placeholder = inputNode->outputs().front().id;
        const Value& value = inputs.at(mapping.name);
        for (const auto& connection : inner->connections()) {
            if (connection.from != placeholder) continue;
            const NodeInterface* target = inner->findInterface(connection.to);
            if (target && target->allowMultipleConnections) {
                auto& staged = graphInputs[connection.to];
                if (!staged.is_array()) staged = Value::array();
                staged.push_back(value);
            } else {
                graphInputs[connection.to] = value;
            }
        }
    }

    NodeOutput out;
    out.subgraphResults = context.engine.runGraph(*inner, std::move(graphInputs), context.calculationData);

    for (const auto& mapping : outputMappings) {
        auto entry = out.subgraphResults.find(mapping.innerNode);
        if (entry != out.subgraphResults.end() && entry->second.outputs.count("output")) {
            out.values[mapping.name] = entry->second.outputs.at("output");
        } else {
            out.values[mapping.name] = context.storedOutputs.at(mapping.name);
        }
    }
    return out;
}

} // namespace DepFlow
