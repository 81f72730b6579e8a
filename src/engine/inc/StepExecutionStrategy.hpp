#pragma once

#include "CancellationToken.hpp"
#include "ConfigData.hpp"
#include "Scope.hpp"
#include "StepResult.hpp"
#include <string>


// Everything a strategy needs to execute one run step
struct StepInvocation {
    std::string step_id;
    const RunConfig& run;
    const Scope& scope;
    const Action& action;
    CancellationToken& token;
    const RunLogger& log;
};

// Abstract base class: step execution strategy
class StepExecutionStrategy {
public:
    explicit StepExecutionStrategy(const WorkflowConfig& config) : config_(config) {}

    virtual ~StepExecutionStrategy() = default;

    // Interface for executing a run step
    virtual StepResult execute(const StepInvocation& invocation) = 0;

protected:
    void emit(const StepInvocation& invocation, const std::string& line) const;

    const WorkflowConfig& config_;
};

// Production environment strategy: spawns the process
class ProductionStepStrategy : public StepExecutionStrategy {
public:
    explicit ProductionStepStrategy(const WorkflowConfig& config) : StepExecutionStrategy(config) {}

    StepResult execute(const StepInvocation& invocation) override;
};

// Debug environment strategy: prepares and reports the command without running it
class DebugStepStrategy : public StepExecutionStrategy {
public:
    explicit DebugStepStrategy(const WorkflowConfig& config) : StepExecutionStrategy(config) {}

    StepResult execute(const StepInvocation& invocation) override;
};
