// main.cpp
//
// Headless DepFlow runtime. Parses the CLI (CLI11), loads the JSON flow, runs
// a full calculation through the dependency engine and then applies each
// --set override as a value change, so every override is followed by an
// incremental run hinted at the changed node. Each run's result is printed
// to stdout as one JSON document; logs go to stderr.
#include "ApplyResult.hpp"
#include "DependencyEngine.hpp"
#include "FlowLoader.hpp"
#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

struct InputOverride {
    std::string node;
    std::string port;
    nlohmann::json value;
};

// node.port=<json>; a right-hand side that is not valid JSON is taken as a string
InputOverride parseOverride(const std::string& text) {
    const auto eq = text.find('=');
    if (eq == std::string::npos) {
        throw std::runtime_error(fmt::format("--set expects node.port=<json>, got '{}'", text));
    }
    const std::string target = text.substr(0, eq);
    const auto dot = target.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == target.size()) {
        throw std::runtime_error(fmt::format("--set expects node.port=<json>, got '{}'", text));
    }
    const std::string rhs = text.substr(eq + 1);
    nlohmann::json value = nlohmann::json::parse(rhs, nullptr, false);
    if (value.is_discarded()) value = rhs;
    return InputOverride{target.substr(0, dot), target.substr(dot + 1), value};
}

} // namespace

int main(int argc, char** argv) {
    std::string flowPath;
    std::vector<std::string> overrides;
    bool printOrder = false;
    bool pretty = false;
    std::string logLevel = "info";

    CLI::App app{"DepFlow runtime"};
    try {
        app.add_option("--flow", flowPath, "Path to flow JSON file")->required();
        app.add_option("--set", overrides, "Override an input after the initial run: node.port=<json>");
        app.add_flag("--order", printOrder, "Print the sorted components before running");
        app.add_flag("--pretty", pretty, "Indent JSON output");
        app.add_option("--log-level", logLevel, "Log level: debug|info|warn|error|off")
            ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
        app.allow_extras(false);
        app.set_config("--config");
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // stdout carries the JSON results, so logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("depflow"));
    spdlog::set_level(spdlog::level::from_str(logLevel));

    const int indent = pretty ? 2 : -1;
    try {
        std::vector<InputOverride> parsedOverrides;
        for (const auto& text : overrides) parsedOverrides.push_back(parseOverride(text));

        DepFlow::FlowLoader loader;
        auto editor = loader.loadEditor(DepFlow::FlowLoader::readFile(flowPath));
        SPDLOG_INFO("loaded flow {} ({} node(s))", flowPath, editor->graph().nodes().size());

        DepFlow::DependencyEngine engine(*editor);

        if (printOrder) {
            nlohmann::json doc = {{"order", DepFlow::componentsToJson(engine.sortedComponents(editor->graph()))}};
            fmt::print("{}\n", doc.dump(indent));
        }

        int runIndex = 0;
        bool failed = false;
        engine.events.afterRun.subscribe("cli", [&](const DepFlow::CalculationResult& result) {
            nlohmann::json doc = {{"run", runIndex++}, {"result", DepFlow::resultToJson(result)}};
            fmt::print("{}\n", doc.dump(indent));
            DepFlow::applyResult(result, *editor);
        });
        engine.events.runFailed.subscribe("cli", [&](const DepFlow::RunFailedEventData& data) {
            fmt::print(stderr, "error: {}\n", data.message);
            failed = true;
        });

        engine.start();
        for (const auto& o : parsedOverrides) {
            if (failed) break;
            SPDLOG_DEBUG("set {}.{} = {}", o.node, o.port, o.value.dump());
            editor->graph().setInputValue(o.node, o.port, o.value);
        }
        engine.stop();
        return failed ? 1 : 0;
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return 1;
    }
}
