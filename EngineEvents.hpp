// EngineEvents.hpp
//
// Keyed multi-subscriber events and sequential hooks. The graph model uses
// events to announce structure/value changes; the engines use both to let
// outer layers observe node calculations and intercept values in transit.
#pragma once
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace DepFlow {

// Ordered fan-out event. Subscribers are identified by key: subscribing an
// existing key replaces its listener in place, unsubscribing is idempotent.
template <typename T>
class Event {
public:
    using Listener = std::function<void(const T&)>;

    void subscribe(const std::string& key, Listener listener) {
        for (auto& entry : listeners) {
            if (entry.first == key) {
                entry.second = std::move(listener);
                return;
            }
        }
        listeners.emplace_back(key, std::move(listener));
    }

    void unsubscribe(const std::string& key) {
        for (auto it = listeners.begin(); it != listeners.end(); ++it) {
            if (it->first == key) {
                listeners.erase(it);
                return;
            }
        }
    }

    // Listeners may (un)subscribe while being notified; the emission works on a copy.
    void emit(const T& data) const {
        auto snapshot = listeners;
        for (const auto& entry : snapshot) entry.second(data);
    }

    size_t size() const { return listeners.size(); }

private:
    std::vector<std::pair<std::string, Listener>> listeners;
};

// Chain of keyed taps; each tap receives the previous tap's value plus a
// read-only context and returns the value handed to the next tap.
template <typename T, typename Ctx>
class SequentialHook {
public:
    using Tap = std::function<T(T, const Ctx&)>;

    void tap(const std::string& key, Tap fn) {
        for (auto& entry : taps) {
            if (entry.first == key) {
                entry.second = std::move(fn);
                return;
            }
        }
        taps.emplace_back(key, std::move(fn));
    }

    void untap(const std::string& key) {
        for (auto it = taps.begin(); it != taps.end(); ++it) {
            if (it->first == key) {
                taps.erase(it);
                return;
            }
        }
    }

    T execute(T value, const Ctx& ctx) const {
        for (const auto& entry : taps) value = entry.second(std::move(value), ctx);
        return value;
    }

    bool empty() const { return taps.empty(); }

private:
    std::vector<std::pair<std::string, Tap>> taps;
};

} // namespace DepFlow
