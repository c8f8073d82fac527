// ApplyResult.hpp
//
// Folding a run's result back into the graph model.
#pragma once
#include "FlowGraph.hpp"

namespace DepFlow {

// Writes a calculation result back into the editor's graphs (root and nested).
// Each entry's outputs go to the node's output ports and its resolved inputs
// to the node's input ports. Node ids or port names that no longer exist are
// skipped: a result may be applied after the graph has been edited. Values
// are written directly, without valueChanged notifications.
void applyResult(const CalculationResult& result, Editor& editor);

} // namespace DepFlow
