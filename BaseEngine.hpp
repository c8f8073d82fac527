// BaseEngine.hpp
//
// Run lifecycle shared by engines: listens to the editor's graph for
// structure and value changes, coalesces them into single-flight runs,
// caches sorted components per graph instance, and exposes run/node events plus the
// hooks outer layers use to feed calculation data and transform values in
// transit.
#pragma once
#include "EngineEvents.hpp"
#include "FlowGraph.hpp"
#include "TopologicalSorting.hpp"
#include <atomic>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace DepFlow {

// Violated invariant between the engine and the graph model
class EngineError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

enum class EngineStatus { Stopped, Idle, Running, Paused };

const char* statusName(EngineStatus status);

struct BeforeNodeCalculationEventData {
    const Node* node;
    ValueMap inputValues;
};

struct AfterNodeCalculationEventData {
    const Node* node;
    ValueMap outputValues;
};

struct RunFailedEventData {
    std::string message;
};

class BaseEngine {
public:
    explicit BaseEngine(Editor& editor);
    virtual ~BaseEngine();
    BaseEngine(const BaseEngine&) = delete;
    BaseEngine& operator=(const BaseEngine&) = delete;

    // Stopped/Paused/Idle -> Idle, followed by a run. Called while a run is in
    // flight, the run is queued behind it instead.
    virtual void start();
    void stop();
    void pause();
    void resume();
    EngineStatus status() const;
    // True while a notification is waiting for its run
    bool runPending() const;

    // One run of the root graph with the current port values as external
    // inputs. Errors propagate to the caller. Empty when nothing was calculated.
    std::optional<CalculationResult> runOnce(const Value& calculationData = Value());

    // Run a graph with the given external input values (port id -> value)
    virtual CalculationResult runGraph(Graph& graph, InputMap inputs, const Value& calculationData) = 0;

    // Cached sorted components of a graph, rebuilt on a cache miss
    const std::vector<SortedComponent>& sortedComponents(const Graph& graph);

    struct Events {
        Event<Value> beforeRun;
        Event<CalculationResult> afterRun;
        Event<RunFailedEventData> runFailed;
        Event<EngineStatus> statusChange;
        Event<BeforeNodeCalculationEventData> beforeNodeCalculation;
        Event<AfterNodeCalculationEventData> afterNodeCalculation;
    } events;

    struct Hooks {
        // Supplies the calculation data of coordinated runs; starts from null
        SequentialHook<Value, Graph> gatherCalculationData;
        // Applied to every value carried over a connection
        SequentialHook<Value, Connection> transferData;
    } hooks;

protected:
    virtual CalculationResult execute(const Value& calculationData) = 0;
    // Graph notification. recalculateOrder is set for structural changes.
    virtual void onChange(bool recalculateOrder, Node* updatedNode) = 0;

    // Request a coordinated run; runs now on this thread if the coordinator
    // is idle, otherwise leaves it pending for the active run loop, resume()
    // or start().
    void scheduleRun();

    void invalidateOrder() { recalculateOrder = true; }
    // Clears the sorted-component cache if a structural change was seen
    void refreshOrderIfInvalidated();

    Editor& editor;

private:
    mutable std::mutex stateMutex;
    // Stopped, Idle or Paused; reported as Running while a run is in flight
    // and the engine is Idle
    EngineStatus lifecycle = EngineStatus::Stopped;
    // A run loop or runOnce is executing; at most one at a time
    bool running = false;
    bool pending = false;
    std::atomic<bool> recalculateOrder{true};
    // Keyed by graph instance: nested graphs may reuse the root's id
    std::unordered_map<const Graph*, std::vector<SortedComponent>> order;
    std::string listenerKey;

    // Requires stateMutex
    EngineStatus reportedStatus() const;
    void emitStatusIfChanged(EngineStatus before, EngineStatus after);
    void drainPendingRuns();
};

} // namespace DepFlow
