#include "LogUtils.hpp"
#include "ParameterContext.hpp"
#include "PipelineEngine.hpp"
#include "SignalManager.hpp"
#include "WorkflowLoader.hpp"
#include <iostream>
#include <csignal>
#include <nlohmann/json.hpp>

namespace {

constexpr int exit_success = 0;
constexpr int exit_failure = 1;
constexpr int exit_usage = 2;
constexpr int exit_cancelled = 130;

void signal_handler(int signum) {
    LogUtils::info("Interrupt signal ({}) received. Stopping active runs...", signum);
    RunRegistry::instance().stop_all();
}

nlohmann::json error_json(const ErrorContext& error) {
    return {
        {"step_id", error.step_id},
        {"type", error.type()},
        {"message", error.message}
    };
}

void print_failure(const EngineError& e) {
    nlohmann::json meta = {{"status", "failed"}, {"error", error_json(e.context())}};
    if (const auto* recovery = dynamic_cast<const RecoveryError*>(&e)) {
        meta["error"]["primary"] = error_json(recovery->primary());
        meta["error"]["recovery"] = error_json(recovery->recovery());
    }
    std::cout << nlohmann::json{{"_meta", meta}}.dump(2) << std::endl;
}

int list_actions(const WorkflowConfig& config) {
    nlohmann::json actions = nlohmann::json::array();
    for (const auto& action : config.actions) {
        actions.push_back({{"id", action.key}, {"title", action.title}});
    }
    std::cout << actions.dump(2) << std::endl;
    return exit_success;
}

int execute(const RunRequest& request) {
    const WorkflowConfig config = WorkflowLoader::load_file(request.config_file);
    if (request.list_actions) {
        return list_actions(config);
    }

    auto engine = request.dry_run ? PipelineEngine::create_dry_run(config)
                                  : std::make_unique<PipelineEngine>(config);

    if (request.resolve_only) {
        auto vars = engine->resolve(request.action, request.form);
        std::cout << Value(vars).to_json().dump(2) << std::endl;
        return exit_success;
    }

    try {
        RunResult result = engine->run(request.action, request.form, [](const std::string& line) {
            LogUtils::debug("{}", line);
        });
        std::cout << result.to_json().dump(2) << std::endl;
        if (result.status == RunStatus::Recovered) {
            LogUtils::warn("Action '{}' recovered from {}", request.action, result.error->describe());
        }
        return exit_success;
    } catch (const CancelledError& e) {
        LogUtils::warn("Action '{}' was cancelled", request.action);
        print_failure(e);
        return exit_cancelled;
    } catch (const EngineError& e) {
        LogUtils::error("Action '{}' failed: {}", request.action, e.what());
        print_failure(e);
        return exit_failure;
    }
}

}

int main(int argc, char* argv[]) {
    int result = exit_success;

    try {
        // 1. Create parameter context and initialize
        ParameterContext context;
        if (!context.init(argc, argv)) {
            return exit_success;
        }
        const RunRequest& request = context.get_request();

        // 2. Signals are consumed by a watcher thread, so block them before any thread starts
        SignalManager::register_signal(SIGINT, signal_handler);
        SignalManager::register_signal(SIGTERM, signal_handler);
        SignalManager::setup();

        LogUtils::init(request.log_level);

        // 3. Load the workflow and run the requested action
        try {
            result = execute(request);
        } catch (const ConfigError& e) {
            LogUtils::error("Configuration error: {}", e.what());
            result = exit_failure;
        } catch (const std::exception& e) {
            LogUtils::error("Error during execution: {}", e.what());
            result = exit_failure;
        }

    } catch (const UsageError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        std::cerr << "Use --help or -? to show usage information" << std::endl;
        return exit_usage;
    } catch (const std::exception& e) {
        LogUtils::error("Error: {}", e.what());
        result = exit_failure;
    }

    SignalManager::teardown();
    LogUtils::shutdown();
    return result;
}
