#pragma once

#include "ConfigData.hpp"
#include "EngineError.hpp"
#include "RunRegistry.hpp"
#include "RunResult.hpp"
#include "Scope.hpp"
#include "StepExecutionStrategy.hpp"
#include <memory>
#include <optional>
#include <string>


// Result of one step or pipeline walk; failures stay values until the public boundary
struct StepOutcome {
    std::optional<ErrorContext> error;

    bool ok() const { return !error.has_value(); }

    static StepOutcome success() { return StepOutcome{}; }
    static StepOutcome failure(ErrorContext context) { return StepOutcome{std::move(context)}; }
};

// Interprets action pipelines against a validated workflow
class PipelineEngine {
public:
    explicit PipelineEngine(const WorkflowConfig& config);

    // Constructor, allow custom strategy
    PipelineEngine(const WorkflowConfig& config, std::unique_ptr<StepExecutionStrategy> strategy);

    // Engine that reports commands instead of spawning them
    static std::unique_ptr<PipelineEngine> create_dry_run(const WorkflowConfig& config) {
        return std::make_unique<PipelineEngine>(
            config, std::make_unique<DebugStepStrategy>(config)
        );
    }

    // Resolved global vars for the given form, nothing is executed
    Value::Map resolve(const std::string& action_id, const Value::Map& form) const;

    // Runs the action on the calling thread. Throws the primary failure, or
    // RecoveryError when the on_error pipeline fails too.
    RunResult run(const std::string& action_id, const Value::Map& form, const RunLogger& log = nullptr);

    void stop(const std::string& action_id);
    void stop_all();
    bool is_running(const std::string& action_id) const;

    const WorkflowConfig& config() const { return config_; }

private:
    // Mutable state of one pipeline walk (primary or recovery)
    struct Invocation {
        const Action& action;
        const Value::Map& form;
        const Value::Map& vars;
        const Value::Map& env;
        RunResult& result;
        CancellationToken& token;
        const RunLogger& log;
        std::string key_prefix;         // "on_error." inside the recovery pipeline
        Value::Map step_view;           // what `step` shows to expressions, keyed like the result
        Value::Map extra;               // additional bindings such as `error`
        size_t recorded = 0;
        Value::Map recovery_view;       // `recovery`: on_error results by their own id
    };

    const Action& find_action(const std::string& action_id) const;
    Value::Map resolve_vars(const Value::Map& form, const Value::Map& env) const;
    Scope base_scope(const Value::Map& form, const Value::Map& vars, const Value::Map& env) const;
    Scope build_scope(const Invocation& inv, const Value::Map& loop) const;

    StepOutcome run_steps(const Pipeline& steps, Invocation& inv, const Value::Map& loop);
    StepOutcome run_step(const Step& step, Invocation& inv, const Value::Map& loop, std::string& step_id);
    StepOutcome run_foreach(const ForeachBody& body, const Scope& scope, Invocation& inv,
                            const Value::Map& loop, const std::string& step_id);

    // Unique result key; a taken id gets _2, _3, ... appended
    std::string allocate_key(const Invocation& inv, const std::string& step_id) const;
    void record(Invocation& inv, const std::string& key, const StepResult& result);
    void emit(const Invocation& inv, const std::string& line) const;

    const WorkflowConfig& config_;
    std::unique_ptr<StepExecutionStrategy> strategy_;
    RunRegistry& registry_;
};
