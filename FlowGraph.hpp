// FlowGraph.hpp
//
// In-memory graph model consumed by the engines: nodes with named input and
// output ports, connections between ports, and graphs that own both. Nodes,
// ports and connections refer to each other through string ids resolved by
// the owning Graph (arena + index), so the structure may reference itself
// freely while the directed graph used for scheduling stays acyclic.
//
// The graph is the editing surface's state. The engines only read it and
// write computed values back through ApplyResult.
#pragma once
#include "EngineEvents.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace DepFlow {

using NodeId = std::string;
using PortId = std::string;
using ConnectionId = std::string;
using GraphId = std::string;
// Dynamically typed value flowing on ports. Multi-connection inputs resolve to arrays.
using Value = nlohmann::json;
using ValueMap = std::map<std::string, Value>;
// Port id -> value, used for the external inputs of a run and for staging.
using InputMap = std::unordered_map<PortId, Value>;

// Graph model misuse: duplicate ids, unknown ports, invalid connections.
class FlowError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A port (input or output) declared on a node
struct NodeInterface {
    PortId id;
    NodeId nodeId;
    std::string name;
    Value value;
    bool allowMultipleConnections = false;
    size_t connectionCount = 0; // maintained by the owning graph
};

// Directed wire from an output port to an input port
struct Connection {
    ConnectionId id;
    PortId from;
    PortId to;
};

struct NodeResult {
    ValueMap inputs;
    ValueMap outputs;
};

// Node id -> resolved inputs and produced outputs of one run
using CalculationResult = std::map<NodeId, NodeResult>;

// What a calculation step returns. subgraphResults is non-empty only for nodes
// that ran a nested graph and want its entries surfaced in the outer result.
struct NodeOutput {
    ValueMap values;
    CalculationResult subgraphResults;
};

class DependencyEngine;

struct CalculationContext {
    const Value& calculationData;
    DependencyEngine& engine;
    // Output values stored on the node before this calculation
    const ValueMap& storedOutputs;
};

// Resolved once per node: PassThrough nodes are skipped by the scheduler.
enum class NodeKind { Computable, PassThrough };

class Graph;

class Node {
public:
    Node(NodeId id, std::string type, NodeKind kind);
    virtual ~Node() = default;
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    const NodeId& id() const { return nodeId; }
    const std::string& type() const { return typeName; }
    NodeKind kind() const { return nodeKind; }

    const std::string& title() const { return nodeTitle; }
    void setTitle(std::string title) { nodeTitle = std::move(title); }

    bool alwaysRecalculate() const { return recalculateAlways; }
    void setAlwaysRecalculate(bool value) { recalculateAlways = value; }

    // Ports are declared before the node is placed in a graph.
    NodeInterface& addInput(const std::string& name, Value initial, bool allowMultipleConnections = false);
    NodeInterface& addOutput(const std::string& name, Value initial);

    const std::vector<NodeInterface>& inputs() const { return inputPorts; }
    const std::vector<NodeInterface>& outputs() const { return outputPorts; }
    std::vector<NodeInterface>& inputs() { return inputPorts; }
    std::vector<NodeInterface>& outputs() { return outputPorts; }

    NodeInterface* findInput(const std::string& name);
    NodeInterface* findOutput(const std::string& name);
    const NodeInterface* findInput(const std::string& name) const;
    const NodeInterface* findOutput(const std::string& name) const;
    // Searches inputs and outputs
    NodeInterface* findInterface(const PortId& portId);

    // Current stored output values by port name
    ValueMap outputValues() const;

    // The calculation step. Only invoked for Computable nodes; the returned
    // values must cover every declared output.
    virtual NodeOutput calculate(const ValueMap& inputs, CalculationContext& context);

    // Change detection for a resolved input value. Structural equality by
    // default; nodes whose values carry incidental wrappers can override.
    virtual bool isInterfaceEqualTo(const NodeInterface& intf, const Value& value) const;

    // Nested graph owned by this node, if any (see GraphNode)
    virtual Graph* subgraph() { return nullptr; }

    // Called once the node has been added to a graph
    virtual void onPlaced(Graph& graph) { (void)graph; }

private:
    NodeId nodeId;
    std::string typeName;
    NodeKind nodeKind;
    std::string nodeTitle;
    bool recalculateAlways = false;
    std::vector<NodeInterface> inputPorts;
    std::vector<NodeInterface> outputPorts;
};

// Node whose calculation step is a plain function of its inputs
class FunctionNode : public Node {
public:
    using CalculateFn = std::function<ValueMap(const ValueMap&, CalculationContext&)>;

    FunctionNode(NodeId id, std::string type, CalculateFn fn);

    NodeOutput calculate(const ValueMap& inputs, CalculationContext& context) override;

private:
    CalculateFn fn;
};

class Graph {
public:
    explicit Graph(GraphId id);
    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;

    const GraphId& id() const { return graphId; }

    // Takes ownership; throws FlowError on duplicate node or port ids.
    Node& addNode(std::unique_ptr<Node> node);
    template <typename T, typename... Args>
    T& emplaceNode(Args&&... args) {
        auto node = std::make_unique<T>(std::forward<Args>(args)...);
        T& ref = *node;
        addNode(std::move(node));
        return ref;
    }
    // Removes the node together with every connection touching it
    void removeNode(const NodeId& id);

    // Output port -> input port. Throws FlowError if either port is unknown,
    // the direction is wrong, or a single-connection input is already taken.
    const Connection& addConnection(const PortId& from, const PortId& to);
    const Connection& addConnection(ConnectionId id, const PortId& from, const PortId& to);
    const Connection& connect(const NodeId& fromNode, const std::string& fromPort,
                              const NodeId& toNode, const std::string& toPort);
    void removeConnection(const ConnectionId& id);

    Node* findNode(const NodeId& id) const;
    NodeInterface* findInterface(const PortId& id) const;
    // Node that owns the port, nullptr if unknown
    Node* findInterfaceOwner(const PortId& id) const;

    // Nodes in insertion order
    std::vector<Node*> nodes() const;
    const std::vector<Connection>& connections() const { return connectionList; }

    // Writes an input port value and announces it on valueChanged
    void setInputValue(const NodeId& nodeId, const std::string& port, Value value);

    // Links a nested graph to the graph holding its GraphNode. Notifications
    // bubble up; a value change surfaces there as a change of ownerNode.
    void setOwner(Graph* parent, Node* ownerNode) {
        parentGraph = parent;
        owner = ownerNode;
    }
    Graph* parent() const { return parentGraph; }

    struct Events {
        Event<Graph*> structureChanged;
        Event<Node*> valueChanged;
    } events;

private:
    GraphId graphId;
    Graph* parentGraph = nullptr;
    Node* owner = nullptr;
    std::vector<std::unique_ptr<Node>> nodeList;
    std::unordered_map<NodeId, Node*> nodeIndex;
    std::unordered_map<PortId, Node*> portOwner;
    std::vector<Connection> connectionList;
    unsigned long long nextConnectionId = 1;

    void notifyStructureChanged(Graph* changed);
    void notifyValueChanged(Node* node);
};

// Owns the root graph; nested graphs are reached through their GraphNodes.
class Editor {
public:
    explicit Editor(GraphId rootId = "root");

    Graph& graph() { return root; }
    const Graph& graph() const { return root; }

    // Root first, then every nested graph depth-first
    std::vector<Graph*> graphs();

private:
    Graph root;
};

} // namespace DepFlow
