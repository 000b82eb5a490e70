/*
 * Warden C++ - Guest Task Implementation
 */
#include <warden/runtime/task.hpp>

namespace warden {

const char* task_state_to_string(TaskState state) {
    switch (state) {
        case TaskState::RUNNABLE: return "runnable";
        case TaskState::SUSPENDED: return "suspended";
        case TaskState::WAITING: return "waiting";
        case TaskState::COMPLETED: return "completed";
        case TaskState::FAILED: return "failed";
    }
    return "unknown";
}

// ============================================================================
// TaskStep
// ============================================================================

TaskStep TaskStep::await(const Operation& op) {
    TaskStep s;
    s.kind = AWAIT;
    s.op = op;
    return s;
}

TaskStep TaskStep::done(const Json& value) {
    TaskStep s;
    s.kind = RETURN;
    s.value = value;
    return s;
}

TaskStep TaskStep::fail(const ErrorPayload& error) {
    TaskStep s;
    s.kind = FAIL;
    s.error = error;
    return s;
}

TaskStep TaskStep::fail(const std::string& code, const std::string& message) {
    return fail(ErrorPayload(code, message));
}

TaskStep TaskStep::join(const std::vector<TaskId>& children) {
    TaskStep s;
    s.kind = JOIN;
    s.children = children;
    return s;
}

// ============================================================================
// FunctionTask
// ============================================================================

FunctionTask::FunctionTask(StartFn start, ResumeFn resume)
    : start_(start)
    , resume_(resume)
{
}

TaskStep FunctionTask::start(TaskContext& ctx) {
    if (!start_) {
        return TaskStep::done();
    }
    return start_(ctx);
}

TaskStep FunctionTask::resume(TaskContext& ctx, const Outcome& outcome) {
    if (resume_) {
        return resume_(ctx, outcome);
    }
    if (outcome.success) {
        return TaskStep::done(outcome.value);
    }
    return TaskStep::fail(outcome.error);
}

std::unique_ptr<GuestTask> make_operation_task(const Operation& op) {
    return std::unique_ptr<GuestTask>(new FunctionTask(
        [op](TaskContext&) { return TaskStep::await(op); }));
}

// ============================================================================
// Plan parsing
// ============================================================================

namespace {

bool require_string(const Json& j, const char* key, std::string& out, std::string& error) {
    if (!j[key].is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = j[key].get<std::string>();
    return true;
}

bool optional_bool(const Json& j, const char* key, bool& out, std::string& error) {
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_boolean()) {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

} // anonymous namespace

bool PlanStep::from_json(const Json& j, PlanStep& out, std::string& error) {
    if (!j.is_object()) {
        error = "plan step must be an object";
        return false;
    }

    PlanStep step;
    std::string path;

    if (j.contains("tool")) {
        std::string name;
        if (!require_string(j, "tool", name, error)) return false;
        Json args = j.contains("args") ? j["args"] : Json::object();
        if (!args.is_object()) {
            error = "'args' of tool '" + name + "' must be an object";
            return false;
        }
        step.op = Operation::tool_call(name, args);
    } else if (j.contains("sleep")) {
        if (!j["sleep"].is_number_integer()) {
            error = "'sleep' must be an integer number of milliseconds";
            return false;
        }
        step.op = Operation::sleep(j["sleep"].get<int64_t>());
    } else if (j.contains("read")) {
        if (!require_string(j, "read", path, error)) return false;
        step.op = Operation::vfs_read(path);
    } else if (j.contains("write")) {
        if (!require_string(j, "write", path, error)) return false;
        std::string data;
        if (j.contains("data")) {
            data = j["data"].is_string() ? j["data"].get<std::string>() : j["data"].dump(-1, ' ', false, Json::error_handler_t::replace);
        }
        step.op = Operation::vfs_write(path, data);
    } else if (j.contains("list")) {
        if (!require_string(j, "list", path, error)) return false;
        step.op = Operation::vfs_list(path);
    } else if (j.contains("stat")) {
        if (!require_string(j, "stat", path, error)) return false;
        step.op = Operation::vfs_stat(path);
    } else if (j.contains("mkdir")) {
        if (!require_string(j, "mkdir", path, error)) return false;
        bool recursive = false;
        if (!optional_bool(j, "recursive", recursive, error)) return false;
        step.op = Operation::vfs_mkdir(path, recursive);
    } else if (j.contains("remove")) {
        if (!require_string(j, "remove", path, error)) return false;
        step.op = Operation::vfs_remove(path);
    } else if (j.contains("log")) {
        step.kind = LOG;
        step.text = j["log"].is_string() ? j["log"].get<std::string>() : j["log"].dump(-1, ' ', false, Json::error_handler_t::replace);
        std::string stream = "stdout";
        if (j.contains("stream") && !require_string(j, "stream", stream, error)) return false;
        step.to_stderr = stream == "stderr";
    } else if (j.contains("parallel")) {
        const Json& branches = j["parallel"];
        if (!branches.is_array()) {
            error = "'parallel' must be an array of steps";
            return false;
        }
        step.kind = PARALLEL;
        for (size_t i = 0; i < branches.size(); ++i) {
            PlanStep branch;
            if (!PlanStep::from_json(branches[i], branch, error)) {
                error = "parallel[" + std::to_string(i) + "]: " + error;
                return false;
            }
            step.branches.push_back(branch);
        }
    } else {
        error = "unrecognised plan step: " + j.dump(-1, ' ', false, Json::error_handler_t::replace);
        return false;
    }

    out = step;
    return true;
}

bool Plan::from_json(const Json& j, Plan& out, std::string& error) {
    const Json* steps = &j;
    Plan plan;

    if (j.is_object()) {
        if (!j.contains("steps")) {
            error = "plan requires 'steps'";
            return false;
        }
        steps = &j["steps"];
        if (!optional_bool(j, "continue_on_error", plan.continue_on_error, error)) return false;
    }
    if (!steps->is_array()) {
        error = "plan 'steps' must be an array";
        return false;
    }

    for (size_t i = 0; i < steps->size(); ++i) {
        PlanStep step;
        if (!PlanStep::from_json((*steps)[i], step, error)) {
            error = "steps[" + std::to_string(i) + "]: " + error;
            return false;
        }
        plan.steps.push_back(step);
    }

    out = plan;
    return true;
}

// ============================================================================
// PlanTask
// ============================================================================

PlanTask::PlanTask(const std::vector<PlanStep>& steps, bool continue_on_error)
    : steps_(steps)
    , continue_on_error_(continue_on_error)
    , branch_(false)
    , index_(0)
    , results_(Json::array())
{
}

PlanTask::PlanTask(const PlanStep& step, bool continue_on_error)
    : steps_(1, step)
    , continue_on_error_(continue_on_error)
    , branch_(true)
    , index_(0)
    , results_(Json::array())
{
}

TaskStep PlanTask::start(TaskContext& ctx) {
    return advance(ctx);
}

TaskStep PlanTask::resume(TaskContext& ctx, const Outcome& outcome) {
    if (outcome.success) {
        results_.push_back(outcome.value);
    } else if (continue_on_error_) {
        Json failed = Json::object();
        failed["error"] = outcome.error.to_json();
        results_.push_back(failed);
    } else {
        return TaskStep::fail(outcome.error);
    }

    ++index_;
    return advance(ctx);
}

TaskStep PlanTask::advance(TaskContext& ctx) {
    while (index_ < steps_.size()) {
        const PlanStep& step = steps_[index_];

        switch (step.kind) {
            case PlanStep::LOG:
                if (step.to_stderr) {
                    ctx.console_error(step.text);
                } else {
                    ctx.console_log(step.text);
                }
                results_.push_back(Json());
                ++index_;
                break;

            case PlanStep::OPERATION:
                return TaskStep::await(step.op);

            case PlanStep::PARALLEL: {
                std::vector<TaskId> children;
                for (size_t i = 0; i < step.branches.size(); ++i) {
                    children.push_back(ctx.spawn(std::unique_ptr<GuestTask>(
                        new PlanTask(step.branches[i], continue_on_error_))));
                }
                return TaskStep::join(children);
            }
        }
    }

    if (branch_) {
        return TaskStep::done(results_.empty() ? Json() : results_[0]);
    }
    return TaskStep::done(results_);
}

std::unique_ptr<GuestTask> make_plan_task(const Plan& plan) {
    return std::unique_ptr<GuestTask>(new PlanTask(plan.steps, plan.continue_on_error));
}

} // namespace warden
