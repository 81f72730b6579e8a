#include "PipelineEngine.hpp"
#include "LogUtils.hpp"
#include "ProcessUtils.hpp"
#include "TemplateRenderer.hpp"
#include <fmt/format.h>

namespace {

// Releases a registry slot however the walk ends
class RunSlot {
public:
    RunSlot(RunRegistry& registry, const std::string& action_id, bool inherit_stop)
        : registry_(registry), action_id_(action_id), token_(registry.acquire(action_id, inherit_stop)) {}

    ~RunSlot() { registry_.release(action_id_, token_); }

    RunSlot(const RunSlot&) = delete;
    RunSlot& operator=(const RunSlot&) = delete;

    CancellationToken& token() { return *token_; }

private:
    RunRegistry& registry_;
    std::string action_id_;
    RunRegistry::TokenPtr token_;
};

Value::Map environment_map() {
    Value::Map env;
    for (const auto& [key, value] : ProcessUtils::current_environment()) {
        env.emplace(key, Value(value));
    }
    return env;
}

Value error_value(const ErrorContext& error) {
    return Value(Value::Map{
        {"step_id", error.step_id},
        {"type", error.type()},
        {"message", error.message}
    });
}

} // namespace

PipelineEngine::PipelineEngine(const WorkflowConfig& config)
    : PipelineEngine(config, std::make_unique<ProductionStepStrategy>(config)) {}

PipelineEngine::PipelineEngine(const WorkflowConfig& config, std::unique_ptr<StepExecutionStrategy> strategy)
    : config_(config), strategy_(std::move(strategy)), registry_(RunRegistry::instance()) {}

const Action& PipelineEngine::find_action(const std::string& action_id) const {
    const Action* action = config_.find_action(action_id);
    if (!action) {
        throw ConfigError("Unknown action: " + action_id);
    }
    if (!action->pipeline && !action->run) {
        throw ConfigError("Action " + action_id + " must include pipeline or run");
    }
    return *action;
}

Scope PipelineEngine::base_scope(const Value::Map& form, const Value::Map& vars, const Value::Map& env) const {
    Scope scope;
    scope.set("vars", Value(vars));
    scope.set("form", Value(form));
    scope.set("env", Value(env));
    scope.set("step", Value(Value::Map{}));
    scope.set("cwd", ProcessUtils::current_directory());
    scope.set("home", ProcessUtils::home_directory());
    scope.set("temp", ProcessUtils::temp_directory());
    scope.set("os", ProcessUtils::os_name());
    return scope;
}

Value::Map PipelineEngine::resolve_vars(const Value::Map& form, const Value::Map& env) const {
    Value::Map vars;
    for (const auto& [name, declaration] : config_.vars) {
        // {default: x} declares x; any other map is the value itself
        Value raw = declaration;
        if (declaration.is_map() && declaration.as_map().count("default")) {
            raw = declaration.get_attribute("default");
        }
        try {
            vars[name] = TemplateRenderer::render(raw, base_scope(form, vars, env));
        } catch (const EngineError& e) {
            LogUtils::error("Failed to resolve var '{}': {}", name, e.what());
            throw;
        }
        LogUtils::debug("Resolved var {} = {}", name, vars[name].to_string());
    }
    return vars;
}

Value::Map PipelineEngine::resolve(const std::string& action_id, const Value::Map& form) const {
    find_action(action_id);
    return resolve_vars(form, environment_map());
}

Scope PipelineEngine::build_scope(const Invocation& inv, const Value::Map& loop) const {
    Scope scope = base_scope(inv.form, inv.vars, inv.env);
    scope.set("step", Value(inv.step_view));
    if (!inv.key_prefix.empty()) {
        scope.set("recovery", Value(inv.recovery_view));
    }
    for (const auto& [name, value] : inv.extra) {
        scope.set(name, value);
    }
    for (const auto& [name, value] : loop) {
        scope.set(name, value);
    }
    return scope;
}

std::string PipelineEngine::allocate_key(const Invocation& inv, const std::string& step_id) const {
    std::string key = inv.key_prefix + step_id;
    for (int suffix = 2; inv.result.contains(key); ++suffix) {
        key = fmt::format("{}{}_{}", inv.key_prefix, step_id, suffix);
    }
    return key;
}

void PipelineEngine::record(Invocation& inv, const std::string& key, const StepResult& result) {
    inv.result.steps.emplace_back(key, result);
    const Value value = result.to_value();
    inv.step_view[key] = value;
    if (!inv.key_prefix.empty()) {
        inv.recovery_view[key.substr(inv.key_prefix.size())] = value;
    }
    ++inv.recorded;
}

void PipelineEngine::emit(const Invocation& inv, const std::string& line) const {
    LogUtils::info("{}", line);
    if (inv.log) {
        inv.log(line);
    }
}

StepOutcome PipelineEngine::run_steps(const Pipeline& steps, Invocation& inv, const Value::Map& loop) {
    for (const auto& step : steps) {
        std::string step_id;
        StepOutcome outcome = run_step(step, inv, loop, step_id);
        if (outcome.ok()) {
            continue;
        }

        const ErrorContext& error = *outcome.error;
        const bool recoverable = error.kind != ErrorKind::Config && error.kind != ErrorKind::Cancelled;
        if (step.continue_on_error && recoverable) {
            emit(inv, fmt::format("[warn] {}: {}", step_id, error.message));
            continue;
        }
        return outcome;
    }
    return StepOutcome::success();
}

StepOutcome PipelineEngine::run_step(const Step& step, Invocation& inv, const Value::Map& loop, std::string& step_id) {
    step_id = step.id.empty() ? fmt::format("step_{}", inv.recorded + 1) : step.id;

    try {
        Scope scope = build_scope(inv, loop);
        if (!step.id.empty()) {
            step_id = TemplateRenderer::render_string(step.id, scope);
        }

        if (inv.token.is_cancelled()) {
            throw CancelledError(step_id);
        }

        if (step.when && !TemplateRenderer::render(*step.when, scope).truthy()) {
            emit(inv, fmt::format("[skip] {} (when=false)", step_id));
            return StepOutcome::success();
        }

        if (const auto* run = std::get_if<RunConfig>(&step.body)) {
            const std::string key = allocate_key(inv, step_id);
            step_id = key;

            StepResult result = strategy_->execute(StepInvocation{key, *run, scope, inv.action, inv.token, inv.log});
            record(inv, key, result);
            if (result.exit_code != 0) {
                return StepOutcome::failure(ProcessExitError(key, result.exit_code).context());
            }
            return StepOutcome::success();
        }

        if (const auto* pipeline = std::get_if<PipelineBody>(&step.body)) {
            return run_steps(pipeline->steps, inv, loop);
        }

        return run_foreach(std::get<ForeachBody>(step.body), scope, inv, loop, step_id);

    } catch (const EngineError& e) {
        ErrorContext context = e.context();
        if (context.step_id.empty()) {
            context.step_id = step_id;
        }
        LogUtils::debug("Step {} failed: {} ({})", context.step_id, context.message, context.type());
        return StepOutcome::failure(std::move(context));
    }
}

StepOutcome PipelineEngine::run_foreach(const ForeachBody& body, const Scope& scope, Invocation& inv,
                                        const Value::Map& loop, const std::string& step_id) {
    const Value items = TemplateRenderer::render(body.in, scope);
    if (!items.is_list()) {
        throw EvaluationError("foreach.in must evaluate to a list, got " + items.type_name(), step_id);
    }

    const auto& list = items.as_list();
    for (size_t index = 0; index < list.size(); ++index) {
        Value::Map nested = loop;
        nested[body.as] = list[index];
        nested["loop"] = Value(Value::Map{{"index", index}});

        StepOutcome outcome = run_steps(body.steps, inv, nested);
        if (!outcome.ok()) {
            return outcome;
        }
    }
    return StepOutcome::success();
}

RunResult PipelineEngine::run(const std::string& action_id, const Value::Map& form, const RunLogger& log) {
    const Action& action = find_action(action_id);
    const Pipeline pipeline = action.effective_pipeline();

    RunSlot slot(registry_, action_id, true);
    LogUtils::info("Running action '{}' ({} step(s))", action_id, pipeline.size());

    const Value::Map env = environment_map();
    const Value::Map vars = resolve_vars(form, env);

    RunResult result;
    Invocation primary{action, form, vars, env, result, slot.token(), log, "", {}, {}, 0};
    StepOutcome outcome = run_steps(pipeline, primary, {});
    if (outcome.ok()) {
        LogUtils::info("Action '{}' completed", action_id);
        return result;
    }

    const ErrorContext failure = *outcome.error;
    LogUtils::warn("Action '{}' failed at {}", action_id, failure.describe());
    if (!action.has_recovery()) {
        throw_error(failure);
    }

    // Recovery runs on a fresh token so cleanup still happens after a stop
    RunSlot recovery_slot(registry_, action_id, false);
    emit(primary, fmt::format("[on_error] {}: {}", failure.step_id, failure.message));

    Invocation recovery{action, form, vars, env, result, recovery_slot.token(), log,
                        "on_error.", primary.step_view, {{"error", error_value(failure)}}, 0};
    StepOutcome recovered = run_steps(action.on_error, recovery, {});
    if (!recovered.ok()) {
        LogUtils::error("Recovery of action '{}' failed at {}", action_id, recovered.error->describe());
        throw RecoveryError(failure, *recovered.error);
    }

    LogUtils::info("Action '{}' recovered", action_id);
    result.status = RunStatus::Recovered;
    result.error = failure;
    return result;
}

void PipelineEngine::stop(const std::string& action_id) {
    registry_.stop(action_id);
}

void PipelineEngine::stop_all() {
    registry_.stop_all();
}

bool PipelineEngine::is_running(const std::string& action_id) const {
    return registry_.active_runs(action_id) > 0;
}
