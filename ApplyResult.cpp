// ApplyResult.cpp
//
// Result write-back. Node ids are resolved once across every graph of the
// editor, since results of nested runs are keyed by inner node ids.
#include "ApplyResult.hpp"
#include <spdlog/spdlog.h>
#include <unordered_map>

namespace DepFlow {

void applyResult(const CalculationResult& result, Editor& editor) {
    std::unordered_map<NodeId, Node*> nodes;
    for (Graph* g : editor.graphs()) {
        for (Node* n : g->nodes()) nodes.emplace(n->id(), n);
    }

    for (const auto& entry : result) {
        auto it = nodes.find(entry.first);
        if (it == nodes.end()) {
            SPDLOG_DEBUG("applyResult: node {} no longer exists", entry.first);
            continue;
        }
        Node* node = it->second;
        for (const auto& output : entry.second.outputs) {
            if (NodeInterface* intf = node->findOutput(output.first)) intf->value = output.second;
        }
        for (const auto& input : entry.second.inputs) {
            if (NodeInterface* intf = node->findInput(input.first)) intf->value = input.second;
        }
    }
}

} // namespace DepFlow
