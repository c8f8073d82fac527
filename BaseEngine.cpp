// BaseEngine.cpp
//
// Single-flight run coordinator. A notification marks a run as pending; the
// thread that finds the coordinator idle becomes the runner and keeps running
// until nothing is pending, so bursts of notifications collapse into as few
// runs as possible and the last notification is always followed by a run.
// Whether a run is in flight is tracked apart from the Stopped/Idle/Paused
// lifecycle; lifecycle calls made from inside a run never start a second one.
#include "BaseEngine.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace DepFlow {

const char* statusName(EngineStatus status) {
    switch (status) {
        case EngineStatus::Stopped: return "stopped";
        case EngineStatus::Idle: return "idle";
        case EngineStatus::Running: return "running";
        case EngineStatus::Paused: return "paused";
    }
    return "?";
}

BaseEngine::BaseEngine(Editor& editor)
    : editor(editor), listenerKey(fmt::format("engine@{}", static_cast<const void*>(this))) {
    auto& graphEvents = editor.graph().events;
    graphEvents.structureChanged.subscribe(listenerKey, [this](Graph* const&) { onChange(true, nullptr); });
    graphEvents.valueChanged.subscribe(listenerKey, [this](Node* const& node) { onChange(false, node); });
}

BaseEngine::~BaseEngine() {
    auto& graphEvents = editor.graph().events;
    graphEvents.structureChanged.unsubscribe(listenerKey);
    graphEvents.valueChanged.unsubscribe(listenerKey);
}

void BaseEngine::start() {
    EngineStatus before, after;
    bool inFlight;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        before = reportedStatus();
        lifecycle = EngineStatus::Idle;
        pending = true;
        inFlight = running;
        after = reportedStatus();
    }
    emitStatusIfChanged(before, after);
    if (inFlight) {
        SPDLOG_DEBUG("start requested during a run, queued behind it");
        return;
    }
    drainPendingRuns();
}

void BaseEngine::stop() {
    EngineStatus before, after;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        before = reportedStatus();
        lifecycle = EngineStatus::Stopped;
        after = reportedStatus();
    }
    emitStatusIfChanged(before, after);
}

void BaseEngine::pause() {
    EngineStatus before, after;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (lifecycle == EngineStatus::Stopped) return;
        before = reportedStatus();
        lifecycle = EngineStatus::Paused;
        after = reportedStatus();
    }
    emitStatusIfChanged(before, after);
}

void BaseEngine::resume() {
    EngineStatus before, after;
    bool inFlight;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (lifecycle != EngineStatus::Paused) return;
        before = reportedStatus();
        lifecycle = EngineStatus::Idle;
        inFlight = running;
        after = reportedStatus();
    }
    emitStatusIfChanged(before, after);
    // the active run loop picks up whatever is pending
    if (!inFlight) drainPendingRuns();
}

EngineStatus BaseEngine::status() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return reportedStatus();
}

bool BaseEngine::runPending() const {
    std::lock_guard<std::mutex> lock(stateMutex);
    return pending;
}

EngineStatus BaseEngine::reportedStatus() const {
    if (running && lifecycle == EngineStatus::Idle) return EngineStatus::Running;
    return lifecycle;
}

void BaseEngine::emitStatusIfChanged(EngineStatus before, EngineStatus after) {
    if (before == after) return;
    SPDLOG_DEBUG("engine {}", statusName(after));
    events.statusChange.emit(after);
}

void BaseEngine::scheduleRun() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        pending = true;
        if (running || lifecycle != EngineStatus::Idle) {
            SPDLOG_DEBUG("run requested while {}, left pending", statusName(reportedStatus()));
            return;
        }
    }
    drainPendingRuns();
}

void BaseEngine::drainPendingRuns() {
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (running || lifecycle != EngineStatus::Idle || !pending) return;
        running = true;
    }
    emitStatusIfChanged(EngineStatus::Idle, EngineStatus::Running);

    unsigned runs = 0;
    for (;;) {
        EngineStatus before = EngineStatus::Running, after = EngineStatus::Running;
        bool done = false;
        {
            // Checking for more work and leaving the loop happen under one lock,
            // so a request arriving in between cannot be dropped.
            std::lock_guard<std::mutex> lock(stateMutex);
            if (lifecycle != EngineStatus::Idle || !pending) {
                // stopped or paused meanwhile, or nothing left to do
                before = reportedStatus();
                running = false;
                after = reportedStatus();
                done = true;
            } else {
                pending = false;
            }
        }
        if (done) {
            emitStatusIfChanged(before, after);
            break;
        }
        if (runs++ > 0) SPDLOG_DEBUG("rerunning for changes received during the previous run");

        try {
            Value calculationData = hooks.gatherCalculationData.execute(Value(), editor.graph());
            events.beforeRun.emit(calculationData);
            CalculationResult result = execute(calculationData);
            events.afterRun.emit(result);
        } catch (const std::exception& e) {
            SPDLOG_ERROR("Calculation failed: {}", e.what());
            events.runFailed.emit(RunFailedEventData{e.what()});
        }
    }
}

std::optional<CalculationResult> BaseEngine::runOnce(const Value& calculationData) {
    EngineStatus before, after;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        if (running) {
            throw EngineError("runOnce called while a run is in progress");
        }
        before = reportedStatus();
        running = true;
        after = reportedStatus();
    }
    emitStatusIfChanged(before, after);

    auto finish = [&]() {
        EngineStatus was, now;
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            was = reportedStatus();
            running = false;
            now = reportedStatus();
        }
        emitStatusIfChanged(was, now);
    };

    CalculationResult result;
    try {
        events.beforeRun.emit(calculationData);
        result = execute(calculationData);
    } catch (const std::exception&) {
        finish();
        throw;
    }
    finish();
    events.afterRun.emit(result);
    // notifications that arrived during this run
    drainPendingRuns();

    if (result.empty()) return std::nullopt;
    return result;
}

const std::vector<SortedComponent>& BaseEngine::sortedComponents(const Graph& graph) {
    auto it = order.find(&graph);
    if (it == order.end()) {
        auto components = getSortedComponents(graph);
        SPDLOG_DEBUG("graph {}: {} component(s) sorted", graph.id(), components.size());
        it = order.emplace(&graph, std::move(components)).first;
    }
    return it->second;
}

void BaseEngine::refreshOrderIfInvalidated() {
    if (recalculateOrder.exchange(false)) {
        order.clear();
    }
}

} // namespace DepFlow
