// FlowLoader.cpp
//
// JSON flow loading and the built-in node library. Node types declare their
// own ports; a flow only picks types, wires ports together and overrides
// initial input values.
#include "FlowLoader.hpp"
#include "SubgraphNode.hpp"
#include <fmt/core.h>
#include <fstream>
#include <functional>
#include <limits>
#include <spdlog/spdlog.h>

namespace DepFlow {

namespace {

using json = nlohmann::json;

const Value& requireNumber(const Value& v, const NodeId& nodeId, const char* port) {
    if (!v.is_number()) {
        throw std::runtime_error(fmt::format("Node {} expects a number on '{}', got {}", nodeId, port, v.dump()));
    }
    return v;
}

// Integers that fit in a signed 64-bit value, unsigned ones included
bool asInteger(const Value& v, long long& out) {
    if (v.is_number_unsigned()) {
        const auto u = v.get<unsigned long long>();
        if (u > static_cast<unsigned long long>(std::numeric_limits<long long>::max())) return false;
        out = static_cast<long long>(u);
        return true;
    }
    if (!v.is_number_integer()) return false;
    out = v.get<long long>();
    return true;
}

// Integer arithmetic stays integral while the result fits in 64 bits; floats,
// out-of-range unsigned operands and overflowing results are computed in double
template <typename IntegerOp, typename DoubleOp>
Value combineNumbers(const Value& a, const Value& b, IntegerOp integerOp, DoubleOp doubleOp) {
    long long x = 0, y = 0, r = 0;
    if (asInteger(a, x) && asInteger(b, y) && !integerOp(x, y, &r)) return r;
    return doubleOp(a.get<double>(), b.get<double>());
}

Value addNumbers(const Value& a, const Value& b) {
    return combineNumbers(a, b, [](long long x, long long y, long long* r) { return __builtin_add_overflow(x, y, r); },
                          std::plus<double>());
}

Value subtractNumbers(const Value& a, const Value& b) {
    return combineNumbers(a, b, [](long long x, long long y, long long* r) { return __builtin_sub_overflow(x, y, r); },
                          std::minus<double>());
}

Value multiplyNumbers(const Value& a, const Value& b) {
    return combineNumbers(a, b, [](long long x, long long y, long long* r) { return __builtin_mul_overflow(x, y, r); },
                          std::multiplies<double>());
}

std::unique_ptr<Node> makeValueNode(const NodeId& id, const json&) {
    auto node = std::make_unique<FunctionNode>(id, "Value", [](const ValueMap& in, CalculationContext&) {
        return ValueMap{{"value", in.at("value")}};
    });
    node->addInput("value", 0);
    node->addOutput("value", 0);
    return node;
}

std::unique_ptr<Node> makeMathNode(const NodeId& id, const json&) {
    auto node = std::make_unique<FunctionNode>(id, "Math", [id](const ValueMap& in, CalculationContext&) {
        const Value& a = requireNumber(in.at("a"), id, "a");
        const Value& b = requireNumber(in.at("b"), id, "b");
        return ValueMap{{"c", addNumbers(a, b)}, {"d", subtractNumbers(a, b)}};
    });
    node->addInput("a", 1);
    node->addInput("b", 1);
    node->addOutput("c", 0);
    node->addOutput("d", 0);
    return node;
}

std::unique_ptr<Node> makeAddNode(const NodeId& id, const json&) {
    auto node = std::make_unique<FunctionNode>(id, "Add", [id](const ValueMap& in, CalculationContext&) {
        return ValueMap{{"sum", addNumbers(requireNumber(in.at("a"), id, "a"), requireNumber(in.at("b"), id, "b"))}};
    });
    node->addInput("a", 0);
    node->addInput("b", 0);
    node->addOutput("sum", 0);
    return node;
}

std::unique_ptr<Node> makeMultiplyNode(const NodeId& id, const json&) {
    auto node = std::make_unique<FunctionNode>(id, "Multiply", [id](const ValueMap& in, CalculationContext&) {
        return ValueMap{{"product", multiplyNumbers(requireNumber(in.at("a"), id, "a"), requireNumber(in.at("b"), id, "b"))}};
    });
    node->addInput("a", 1);
    node->addInput("b", 1);
    node->addOutput("product", 1);
    return node;
}

// Fan-in: every connection into "values" contributes one element
std::unique_ptr<Node> makeSumNode(const NodeId& id, const json&) {
    auto node = std::make_unique<FunctionNode>(id, "Sum", [id](const ValueMap& in, CalculationContext&) {
        const Value& values = in.at("values");
        Value sum = 0;
        if (values.is_array()) {
            for (const auto& v : values) sum = addNumbers(sum, requireNumber(v, id, "values"));
        } else {
            sum = requireNumber(values, id, "values");
        }
        return ValueMap{{"sum", sum}};
    });
    node->addInput("values", Value::array(), true);
    node->addOutput("sum", 0);
    return node;
}

// Sink for inspection; has no calculation step
std::unique_ptr<Node> makeDisplayNode(const NodeId& id, const json&) {
    auto node = std::make_unique<Node>(id, "Display", NodeKind::PassThrough);
    node->addInput("value", Value());
    return node;
}

} // namespace

FlowLoader::FlowLoader() {
    registerNodeType("Value", makeValueNode);
    registerNodeType("Math", makeMathNode);
    registerNodeType("Add", makeAddNode);
    registerNodeType("Multiply", makeMultiplyNode);
    registerNodeType("Sum", makeSumNode);
    registerNodeType("Display", makeDisplayNode);
    registerNodeType(SubgraphInputNode::TypeName, [](const NodeId& id, const json& nodeJson) -> std::unique_ptr<Node> {
        return std::make_unique<SubgraphInputNode>(id, nodeJson.value("name", id));
    });
    registerNodeType(SubgraphOutputNode::TypeName, [](const NodeId& id, const json& nodeJson) -> std::unique_ptr<Node> {
        return std::make_unique<SubgraphOutputNode>(id, nodeJson.value("name", id));
    });
}

void FlowLoader::registerNodeType(const std::string& type, NodeCreator creator) {
    creators[type] = std::move(creator);
}

bool FlowLoader::hasNodeType(const std::string& type) const {
    return type == GraphNode::TypeName || creators.count(type) > 0;
}

std::unique_ptr<Editor> FlowLoader::loadEditor(const json& flow) const {
    try {
        auto editor = std::make_unique<Editor>(flow.value("id", std::string("root")));
        loadGraph(flow, editor->graph());
        return editor;
    } catch (const json::exception& e) {
        throw FlowError(fmt::format("Invalid flow: {}", e.what()));
    }
}

void FlowLoader::loadGraph(const json& flow, Graph& graph) const {
    const json subgraphs = flow.contains("subgraphs") ? flow.at("subgraphs") : json::object();

    if (flow.contains("nodes")) {
        for (const auto& nodeJson : flow.at("nodes")) {
            graph.addNode(createNode(nodeJson, subgraphs));
        }
    }

    if (flow.contains("connections")) {
        for (const auto& connJson : flow.at("connections")) {
            const auto fromNode = connJson.at("fromNode").get<std::string>();
            const auto fromPort = connJson.at("fromPort").get<std::string>();
            const auto toNode = connJson.at("toNode").get<std::string>();
            const auto toPort = connJson.at("toPort").get<std::string>();
            Node* from = graph.findNode(fromNode);
            Node* to = graph.findNode(toNode);
            NodeInterface* out = from ? from->findOutput(fromPort) : nullptr;
            NodeInterface* in = to ? to->findInput(toPort) : nullptr;
            if (!out || !in) {
                throw FlowError(fmt::format("Connection {}.{} -> {}.{} references an unknown port",
                                            fromNode, fromPort, toNode, toPort));
            }
            if (connJson.contains("id")) {
                graph.addConnection(connJson.at("id").get<std::string>(), out->id, in->id);
            } else {
                graph.addConnection(out->id, in->id);
            }
        }
    }
    SPDLOG_DEBUG("loaded graph {}: {} node(s), {} connection(s)", graph.id(), graph.nodes().size(),
                 graph.connections().size());
}

std::unique_ptr<Node> FlowLoader::createNode(const json& nodeJson, const json& subgraphs) const {
    const auto id = nodeJson.at("id").get<std::string>();
    const auto type = nodeJson.at("type").get<std::string>();

    std::unique_ptr<Node> node;
    if (type == GraphNode::TypeName) {
        if (!subgraphs.contains(id)) {
            throw FlowError(fmt::format("Subgraph node {} has no entry in \"subgraphs\"", id));
        }
        const json& sub = subgraphs.at(id);
        auto inner = std::make_unique<Graph>(sub.value("id", id + "/subgraph"));
        loadGraph(sub, *inner);
        node = std::make_unique<GraphNode>(id, std::move(inner));
    } else {
        auto it = creators.find(type);
        if (it == creators.end()) {
            throw FlowError(fmt::format("Unknown node type '{}' for node {}", type, id));
        }
        node = it->second(id, nodeJson);
    }

    if (nodeJson.contains("title")) node->setTitle(nodeJson.at("title").get<std::string>());
    node->setAlwaysRecalculate(nodeJson.value("alwaysRecalculate", false));
    if (nodeJson.contains("values")) {
        for (const auto& item : nodeJson.at("values").items()) {
            NodeInterface* intf = node->findInput(item.key());
            if (!intf) {
                throw FlowError(fmt::format("Node {} (type {}) has no input named '{}'", id, type, item.key()));
            }
            intf->value = item.value();
        }
    }
    return node;
}

json FlowLoader::readFile(const std::string& path) {
    for (const std::string& candidate : {path, "../" + path, "../../" + path}) {
        std::ifstream f(candidate);
        if (!f.good()) continue;
        try {
            json flow;
            f >> flow;
            return flow;
        } catch (const json::parse_error& e) {
            throw FlowError(fmt::format("Could not parse flow file {}: {}", candidate, e.what()));
        }
    }
    throw FlowError("Could not find flow file: " + path);
}

json valueMapToJson(const ValueMap& values) {
    json out = json::object();
    for (const auto& entry : values) out[entry.first] = entry.second;
    return out;
}

json resultToJson(const CalculationResult& result) {
    json out = json::object();
    for (const auto& entry : result) {
        out[entry.first] = {{"inputs", valueMapToJson(entry.second.inputs)},
                            {"outputs", valueMapToJson(entry.second.outputs)}};
    }
    return out;
}

json componentsToJson(const std::vector<SortedComponent>& components) {
    json out = json::array();
    for (const auto& component : components) {
        json order = json::array();
        json connections = json::array();
        for (const Node* n : component.calculationOrder) {
            order.push_back(n->id());
            auto it = component.connectionsFromNode.find(n->id());
            if (it == component.connectionsFromNode.end()) continue;
            for (const auto& c : it->second) connections.push_back(c.id);
        }
        out.push_back({{"order", order}, {"connections", connections}});
    }
    return out;
}

} // namespace DepFlow
