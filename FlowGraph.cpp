// FlowGraph.cpp
//
// Graph model bookkeeping: port ids, connection counts, id indexes and change
// notifications.
#include "FlowGraph.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace DepFlow {

namespace {
std::string makePortId(const NodeId& nodeId, const std::string& name, const char* direction) {
    return nodeId + ":" + name + ":" + direction;
}
}

Node::Node(NodeId id, std::string type, NodeKind kind)
    : nodeId(std::move(id)), typeName(std::move(type)), nodeKind(kind), nodeTitle(typeName) {
    if (nodeId.empty()) {
        throw FlowError("Node of type '" + typeName + "' needs a non-empty id");
    }
}

NodeInterface& Node::addInput(const std::string& name, Value initial, bool allowMultipleConnections) {
    if (findInput(name)) {
        throw FlowError(fmt::format("Node {} already has an input named '{}'", nodeId, name));
    }
    NodeInterface intf;
    intf.id = makePortId(nodeId, name, "input");
    intf.nodeId = nodeId;
    intf.name = name;
    intf.value = std::move(initial);
    intf.allowMultipleConnections = allowMultipleConnections;
    inputPorts.push_back(std::move(intf));
    return inputPorts.back();
}

NodeInterface& Node::addOutput(const std::string& name, Value initial) {
    if (findOutput(name)) {
        throw FlowError(fmt::format("Node {} already has an output named '{}'", nodeId, name));
    }
    NodeInterface intf;
    intf.id = makePortId(nodeId, name, "output");
    intf.nodeId = nodeId;
    intf.name = name;
    intf.value = std::move(initial);
    outputPorts.push_back(std::move(intf));
    return outputPorts.back();
}

NodeInterface* Node::findInput(const std::string& name) {
    auto it = std::find_if(inputPorts.begin(), inputPorts.end(), [&](const NodeInterface& p) { return p.name == name; });
    return it == inputPorts.end() ? nullptr : &*it;
}

NodeInterface* Node::findOutput(const std::string& name) {
    auto it = std::find_if(outputPorts.begin(), outputPorts.end(), [&](const NodeInterface& p) { return p.name == name; });
    return it == outputPorts.end() ? nullptr : &*it;
}

const NodeInterface* Node::findInput(const std::string& name) const {
    return const_cast<Node*>(this)->findInput(name);
}

const NodeInterface* Node::findOutput(const std::string& name) const {
    return const_cast<Node*>(this)->findOutput(name);
}

NodeInterface* Node::findInterface(const PortId& portId) {
    for (auto& p : inputPorts) if (p.id == portId) return &p;
    for (auto& p : outputPorts) if (p.id == portId) return &p;
    return nullptr;
}

ValueMap Node::outputValues() const {
    ValueMap values;
    for (const auto& p : outputPorts) values[p.name] = p.value;
    return values;
}

NodeOutput Node::calculate(const ValueMap& inputs, CalculationContext& context) {
    (void)inputs;
    (void)context;
    throw FlowError(fmt::format("Node {} (type {}) has no calculation step", nodeId, typeName));
}

bool Node::isInterfaceEqualTo(const NodeInterface& intf, const Value& value) const {
    return intf.value == value;
}

FunctionNode::FunctionNode(NodeId id, std::string type, CalculateFn fn)
    : Node(std::move(id), std::move(type), NodeKind::Computable), fn(std::move(fn)) {}

NodeOutput FunctionNode::calculate(const ValueMap& inputs, CalculationContext& context) {
    NodeOutput out;
    out.values = fn(inputs, context);
    return out;
}

Graph::Graph(GraphId id) : graphId(std::move(id)) {}

Node& Graph::addNode(std::unique_ptr<Node> node) {
    if (!node) {
        throw FlowError("Cannot add null node to graph " + graphId);
    }
    const NodeId& id = node->id();
    if (nodeIndex.count(id)) {
        throw FlowError(fmt::format("Node with id '{}' already exists in graph {}", id, graphId));
    }
    auto registerPorts = [&](std::vector<NodeInterface>& ports) {
        for (auto& p : ports) {
            if (portOwner.count(p.id)) {
                throw FlowError(fmt::format("Port id '{}' already exists in graph {}", p.id, graphId));
            }
        }
    };
    registerPorts(node->inputs());
    registerPorts(node->outputs());
    for (auto& p : node->inputs()) { p.connectionCount = 0; portOwner[p.id] = node.get(); }
    for (auto& p : node->outputs()) { p.connectionCount = 0; portOwner[p.id] = node.get(); }

    Node* raw = node.get();
    nodeIndex[id] = raw;
    nodeList.push_back(std::move(node));
    raw->onPlaced(*this);
    notifyStructureChanged(this);
    return *raw;
}

void Graph::removeNode(const NodeId& id) {
    auto it = nodeIndex.find(id);
    if (it == nodeIndex.end()) return;
    Node* node = it->second;

    auto touches = [&](const Connection& c) {
        return findInterfaceOwner(c.from) == node || findInterfaceOwner(c.to) == node;
    };
    for (const auto& c : connectionList) {
        if (!touches(c)) continue;
        if (auto* from = findInterface(c.from)) --from->connectionCount;
        if (auto* to = findInterface(c.to)) --to->connectionCount;
    }
    connectionList.erase(std::remove_if(connectionList.begin(), connectionList.end(), touches), connectionList.end());

    for (const auto& p : node->inputs()) portOwner.erase(p.id);
    for (const auto& p : node->outputs()) portOwner.erase(p.id);
    nodeIndex.erase(it);
    nodeList.erase(std::remove_if(nodeList.begin(), nodeList.end(),
                                  [&](const std::unique_ptr<Node>& n) { return n.get() == node; }),
                   nodeList.end());
    notifyStructureChanged(this);
}

const Connection& Graph::addConnection(const PortId& from, const PortId& to) {
    std::string id;
    do {
        id = "c" + std::to_string(nextConnectionId++);
    } while (std::any_of(connectionList.begin(), connectionList.end(), [&](const Connection& c) { return c.id == id; }));
    return addConnection(std::move(id), from, to);
}

const Connection& Graph::addConnection(ConnectionId id, const PortId& from, const PortId& to) {
    if (std::any_of(connectionList.begin(), connectionList.end(), [&](const Connection& c) { return c.id == id; })) {
        throw FlowError(fmt::format("Connection with id '{}' already exists in graph {}", id, graphId));
    }
    Node* fromNode = findInterfaceOwner(from);
    Node* toNode = findInterfaceOwner(to);
    if (!fromNode || !toNode) {
        throw FlowError(fmt::format("Connection {} references unknown port ({} -> {})", id, from, to));
    }
    auto isIn = [](const std::vector<NodeInterface>& ports, const PortId& pid) {
        return std::any_of(ports.begin(), ports.end(), [&](const NodeInterface& p) { return p.id == pid; });
    };
    if (!isIn(fromNode->outputs(), from) || !isIn(toNode->inputs(), to)) {
        throw FlowError(fmt::format("Connection {} must go from an output to an input ({} -> {})", id, from, to));
    }
    NodeInterface* toIntf = toNode->findInterface(to);
    if (toIntf->connectionCount > 0 && !toIntf->allowMultipleConnections) {
        throw FlowError(fmt::format("Input {} does not accept multiple connections", to));
    }
    ++fromNode->findInterface(from)->connectionCount;
    ++toIntf->connectionCount;
    connectionList.push_back(Connection{std::move(id), from, to});
    // Copy the id before notifying: listeners may add connections and reallocate the list.
    const ConnectionId added = connectionList.back().id;
    notifyStructureChanged(this);
    auto it = std::find_if(connectionList.begin(), connectionList.end(), [&](const Connection& c) { return c.id == added; });
    return *it;
}

const Connection& Graph::connect(const NodeId& fromNode, const std::string& fromPort,
                                 const NodeId& toNode, const std::string& toPort) {
    return addConnection(makePortId(fromNode, fromPort, "output"), makePortId(toNode, toPort, "input"));
}

void Graph::removeConnection(const ConnectionId& id) {
    auto it = std::find_if(connectionList.begin(), connectionList.end(), [&](const Connection& c) { return c.id == id; });
    if (it == connectionList.end()) return;
    if (auto* from = findInterface(it->from)) --from->connectionCount;
    if (auto* to = findInterface(it->to)) --to->connectionCount;
    connectionList.erase(it);
    notifyStructureChanged(this);
}

Node* Graph::findNode(const NodeId& id) const {
    auto it = nodeIndex.find(id);
    return it == nodeIndex.end() ? nullptr : it->second;
}

Node* Graph::findInterfaceOwner(const PortId& id) const {
    auto it = portOwner.find(id);
    return it == portOwner.end() ? nullptr : it->second;
}

NodeInterface* Graph::findInterface(const PortId& id) const {
    Node* owner = findInterfaceOwner(id);
    return owner ? owner->findInterface(id) : nullptr;
}

std::vector<Node*> Graph::nodes() const {
    std::vector<Node*> out;
    out.reserve(nodeList.size());
    for (const auto& n : nodeList) out.push_back(n.get());
    return out;
}

void Graph::setInputValue(const NodeId& nodeId, const std::string& port, Value value) {
    Node* node = findNode(nodeId);
    if (!node) {
        throw FlowError(fmt::format("Node '{}' not found in graph {}", nodeId, graphId));
    }
    NodeInterface* intf = node->findInput(port);
    if (!intf) {
        throw FlowError(fmt::format("Node '{}' has no input named '{}'", nodeId, port));
    }
    intf->value = std::move(value);
    notifyValueChanged(node);
}

void Graph::notifyStructureChanged(Graph* changed) {
    events.structureChanged.emit(changed);
    if (parentGraph) parentGraph->notifyStructureChanged(changed);
}

void Graph::notifyValueChanged(Node* node) {
    events.valueChanged.emit(node);
    if (parentGraph && owner) parentGraph->notifyValueChanged(owner);
}

Editor::Editor(GraphId rootId) : root(std::move(rootId)) {}

std::vector<Graph*> Editor::graphs() {
    std::vector<Graph*> out;
    std::vector<Graph*> stack{&root};
    while (!stack.empty()) {
        Graph* g = stack.back();
        stack.pop_back();
        out.push_back(g);
        auto nodes = g->nodes();
        // reversed so nested graphs come out in node order
        for (auto it = nodes.rbegin(); it != nodes.rend(); ++it) {
            if (Graph* sub = (*it)->subgraph()) stack.push_back(sub);
        }
    }
    return out;
}

} // namespace DepFlow
