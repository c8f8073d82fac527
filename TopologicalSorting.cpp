// TopologicalSorting.cpp
//
// Kahn's algorithm over node ids plus an iterative DFS for weakly-connected
// components. Both work on the port id -> node id map of the given set, so
// they need nothing from the graph but the nodes and connections themselves.
#include "TopologicalSorting.hpp"
#include <algorithm>
#include <unordered_set>

namespace DepFlow {

namespace {

std::unordered_map<PortId, NodeId> mapInterfacesToNodes(const std::vector<Node*>& nodes) {
    std::unordered_map<PortId, NodeId> interfaceIdToNodeId;
    for (const Node* n : nodes) {
        for (const auto& intf : n->inputs()) interfaceIdToNodeId[intf.id] = n->id();
        for (const auto& intf : n->outputs()) interfaceIdToNodeId[intf.id] = n->id();
    }
    return interfaceIdToNodeId;
}

const NodeId* ownerOf(const std::unordered_map<PortId, NodeId>& interfaceIdToNodeId, const PortId& port) {
    auto it = interfaceIdToNodeId.find(port);
    return it == interfaceIdToNodeId.end() ? nullptr : &it->second;
}

} // namespace

SortedComponent sortTopologically(const std::vector<Node*>& nodes, const std::vector<Connection>& connections) {
    SortedComponent sorted;
    sorted.interfaceIdToNodeId = mapInterfacesToNodes(nodes);
    const auto& owners = sorted.interfaceIdToNodeId;

    std::unordered_map<NodeId, Node*> nodeById;
    for (Node* n : nodes) nodeById[n->id()] = n;

    // Node id -> distinct downstream node ids, and how many upstream nodes still point at each id
    std::unordered_map<NodeId, std::vector<NodeId>> adjacency;
    std::unordered_map<NodeId, int> inDegree;
    for (const Node* n : nodes) {
        adjacency[n->id()];
        inDegree[n->id()] = 0;
        sorted.connectionsFromNode[n->id()];
    }
    for (const auto& c : connections) {
        const NodeId* from = ownerOf(owners, c.from);
        if (!from) continue;
        sorted.connectionsFromNode[*from].push_back(c);
        const NodeId* to = ownerOf(owners, c.to);
        if (!to) continue;
        auto& downstream = adjacency[*from];
        if (std::find(downstream.begin(), downstream.end(), *to) == downstream.end()) {
            downstream.push_back(*to);
            ++inDegree[*to];
        }
    }

    // Ready nodes are kept on a stack; order among siblings is not part of the contract
    std::vector<Node*> ready;
    for (Node* n : nodes) {
        if (inDegree[n->id()] == 0) ready.push_back(n);
    }

    size_t remainingEdges = 0;
    for (const auto& entry : adjacency) remainingEdges += entry.second.size();

    while (!ready.empty()) {
        Node* n = ready.back();
        ready.pop_back();
        sorted.calculationOrder.push_back(n);
        auto& downstream = adjacency[n->id()];
        for (const NodeId& m : downstream) {
            --remainingEdges;
            if (--inDegree[m] == 0) ready.push_back(nodeById.at(m));
        }
        downstream.clear();
    }

    if (remainingEdges > 0) {
        throw CycleError();
    }
    return sorted;
}

SortedComponent sortTopologically(const Graph& graph) {
    return sortTopologically(graph.nodes(), graph.connections());
}

bool containsCycle(const std::vector<Node*>& nodes, const std::vector<Connection>& connections) {
    try {
        sortTopologically(nodes, connections);
        return false;
    } catch (const CycleError&) {
        return true;
    }
}

bool containsCycle(const Graph& graph) {
    return containsCycle(graph.nodes(), graph.connections());
}

std::vector<GraphComponent> connectedComponents(const std::vector<Node*>& nodes,
                                                const std::vector<Connection>& connections) {
    const auto owners = mapInterfacesToNodes(nodes);

    std::unordered_map<NodeId, Node*> nodeById;
    for (Node* n : nodes) nodeById[n->id()] = n;

    // Indexes into `connections`
    std::unordered_map<NodeId, std::vector<size_t>> successors;
    std::unordered_map<NodeId, std::vector<size_t>> predecessors;
    for (size_t i = 0; i < connections.size(); ++i) {
        const NodeId* from = ownerOf(owners, connections[i].from);
        const NodeId* to = ownerOf(owners, connections[i].to);
        if (from) successors[*from].push_back(i);
        if (to) predecessors[*to].push_back(i);
    }

    std::vector<GraphComponent> components;
    std::unordered_set<NodeId> visited;
    std::vector<bool> taken(connections.size(), false);

    auto takeConnection = [&](size_t idx, GraphComponent& component) {
        if (taken[idx]) return;
        taken[idx] = true;
        component.connections.push_back(connections[idx]);
    };

    for (Node* start : nodes) {
        if (visited.count(start->id())) continue;
        GraphComponent component;
        std::vector<NodeId> stack{start->id()};
        while (!stack.empty()) {
            NodeId id = stack.back();
            stack.pop_back();
            if (!visited.insert(id).second) continue;
            component.nodes.push_back(nodeById.at(id));

            for (size_t idx : successors[id]) {
                takeConnection(idx, component);
                const NodeId* to = ownerOf(owners, connections[idx].to);
                if (to && !visited.count(*to)) stack.push_back(*to);
            }
            for (size_t idx : predecessors[id]) {
                takeConnection(idx, component);
                const NodeId* from = ownerOf(owners, connections[idx].from);
                if (from && !visited.count(*from)) stack.push_back(*from);
            }
        }
        components.push_back(std::move(component));
    }

    return components;
}

std::vector<GraphComponent> connectedComponents(const Graph& graph) {
    return connectedComponents(graph.nodes(), graph.connections());
}

std::vector<SortedComponent> getSortedComponents(const std::vector<Node*>& nodes,
                                                 const std::vector<Connection>& connections) {
    std::vector<SortedComponent> sorted;
    for (const auto& component : connectedComponents(nodes, connections)) {
        sorted.push_back(sortTopologically(component.nodes, component.connections));
    }
    return sorted;
}

std::vector<SortedComponent> getSortedComponents(const Graph& graph) {
    return getSortedComponents(graph.nodes(), graph.connections());
}

} // namespace DepFlow
