// FlowLoader.hpp
//
// Builds graphs from JSON flow descriptions and serializes what the engine
// produces (results, calculation orders) back to JSON.
//
// Flow format:
//   {
//     "id": "root",
//     "nodes": [ { "id": "n1", "type": "Math", "title": "...", "values": { "a": 2 },
//                  "alwaysRecalculate": false, "name": "..." } ],
//     "connections": [ { "id": "c1", "fromNode": "n1", "fromPort": "c",
//                        "toNode": "n2", "toPort": "a" } ],
//     "subgraphs": { "<Subgraph node id>": { ...same structure... } }
//   }
#pragma once
#include "FlowGraph.hpp"
#include "TopologicalSorting.hpp"
#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace DepFlow {

class FlowLoader {
public:
    // Creates a node of a registered type; nodeJson is the node's flow entry.
    using NodeCreator = std::function<std::unique_ptr<Node>(const NodeId& id, const nlohmann::json& nodeJson)>;

    // Registers the built-in types: Value, Math, Add, Multiply, Sum, Display,
    // SubgraphInput, SubgraphOutput (Subgraph is handled by the loader itself).
    FlowLoader();

    void registerNodeType(const std::string& type, NodeCreator creator);
    bool hasNodeType(const std::string& type) const;

    std::unique_ptr<Editor> loadEditor(const nlohmann::json& flow) const;
    // Adds the flow's nodes and connections to an existing graph
    void loadGraph(const nlohmann::json& flow, Graph& graph) const;

    // Reads a flow file, also trying ../ and ../../ like the runtime always has
    static nlohmann::json readFile(const std::string& path);

private:
    std::unordered_map<std::string, NodeCreator> creators;

    std::unique_ptr<Node> createNode(const nlohmann::json& nodeJson, const nlohmann::json& subgraphs) const;
};

nlohmann::json valueMapToJson(const ValueMap& values);
nlohmann::json resultToJson(const CalculationResult& result);
// [{ "order": [ids...], "connections": [ids...] }, ...]
nlohmann::json componentsToJson(const std::vector<SortedComponent>& components);

} // namespace DepFlow
