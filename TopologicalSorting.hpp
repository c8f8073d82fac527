// TopologicalSorting.hpp
//
// Graph algorithms used by the scheduler, also usable on their own:
// Kahn ordering with cycle detection, weakly-connected components, and the
// combination of both (one calculation order per component).
//
// Every entry point accepts either a Graph or an explicit node/connection set.
// Connections whose endpoints are not owned by a node of the set are ignored.
#pragma once
#include "FlowGraph.hpp"
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace DepFlow {

class CycleError : public std::runtime_error {
public:
    CycleError() : std::runtime_error("Cycle detected") {}
};

struct SortedComponent {
    // Every connection's source node precedes its destination node
    std::vector<Node*> calculationOrder;
    // Node id -> connections leaving that node, in connection-list order
    std::unordered_map<NodeId, std::vector<Connection>> connectionsFromNode;
    // Port id -> id of the node that owns it
    std::unordered_map<PortId, NodeId> interfaceIdToNodeId;
};

struct GraphComponent {
    std::vector<Node*> nodes;
    std::vector<Connection> connections;
};

// Throws CycleError if the set cannot be linearized
SortedComponent sortTopologically(const Graph& graph);
SortedComponent sortTopologically(const std::vector<Node*>& nodes, const std::vector<Connection>& connections);

bool containsCycle(const Graph& graph);
bool containsCycle(const std::vector<Node*>& nodes, const std::vector<Connection>& connections);

// Partition into maximal weakly-connected regions. A component's connections
// are those with at least one endpoint among its nodes.
std::vector<GraphComponent> connectedComponents(const Graph& graph);
std::vector<GraphComponent> connectedComponents(const std::vector<Node*>& nodes,
                                                const std::vector<Connection>& connections);

// connectedComponents followed by sortTopologically on each component
std::vector<SortedComponent> getSortedComponents(const Graph& graph);
std::vector<SortedComponent> getSortedComponents(const std::vector<Node*>& nodes,
                                                 const std::vector<Connection>& connections);

} // namespace DepFlow
