/*
 * warden C++17 - Guest Tasks
 *
 * A guest program is a set of cooperative tasks. Each task is a small state
 * machine driven by the scheduler: start() runs it until it needs something
 * from the outside world, resume() hands it the Outcome of that thing. The
 * returned TaskStep tells the scheduler what the task is waiting for next.
 */
#ifndef warden_RUNTIME_TASK_HPP
#define warden_RUNTIME_TASK_HPP

#include <warden/runtime/request.hpp>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace warden {

enum class TaskState {
    RUNNABLE,
    SUSPENDED,   // waiting on one outstanding Request
    WAITING,     // joined on child tasks
    COMPLETED,
    FAILED
};

const char* task_state_to_string(TaskState state);

inline bool task_state_is_terminal(TaskState state) {
    return state == TaskState::COMPLETED || state == TaskState::FAILED;
}

struct TaskStep {
    enum Kind {
        AWAIT,    // suspend on an operation
        RETURN,   // completed with value
        FAIL,     // unrecovered error
        JOIN      // wait for spawned children
    };

    Kind kind;
    Operation op;
    Json value;
    ErrorPayload error;
    std::vector<TaskId> children;

    TaskStep() : kind(RETURN) {}

    static TaskStep await(const Operation& op);
    static TaskStep done(const Json& value = Json());
    static TaskStep fail(const ErrorPayload& error);
    static TaskStep fail(const std::string& code, const std::string& message);
    static TaskStep join(const std::vector<TaskId>& children);
};

class GuestTask;

// What a running task may ask of the scheduler without suspending.
class TaskContext {
public:
    virtual ~TaskContext() {}

    // Spawned tasks start runnable and run after the current task yields.
    virtual TaskId spawn(std::unique_ptr<GuestTask> task) = 0;

    virtual void console_log(const std::string& line) = 0;
    virtual void console_error(const std::string& line) = 0;

    virtual TaskId current_task() const = 0;
};

class GuestTask {
public:
    virtual ~GuestTask() {}

    virtual TaskStep start(TaskContext& ctx) = 0;

    // Outcome of the last AWAIT, or of a JOIN: ok(array of child values in
    // join order) if every child completed, else the first failed child's
    // error.
    virtual TaskStep resume(TaskContext& ctx, const Outcome& outcome) = 0;
};

// ============================================================================
// FunctionTask - task from callbacks (tests, embedding)
// ============================================================================

class FunctionTask : public GuestTask {
public:
    typedef std::function<TaskStep(TaskContext&)> StartFn;
    typedef std::function<TaskStep(TaskContext&, const Outcome&)> ResumeFn;

    // Without a resume callback the task finishes with the first outcome
    // it receives: its value on success, its error otherwise.
    explicit FunctionTask(StartFn start, ResumeFn resume = ResumeFn());

    TaskStep start(TaskContext& ctx) override;
    TaskStep resume(TaskContext& ctx, const Outcome& outcome) override;

private:
    StartFn start_;
    ResumeFn resume_;
};

// Single operation whose outcome is the task result.
std::unique_ptr<GuestTask> make_operation_task(const Operation& op);

// ============================================================================
// Plans - JSON-described guest programs used by the CLI
// ============================================================================
//
//   {"continue_on_error": false,
//    "steps": [
//      {"tool": "stripe.charges.create", "args": {"amount": 500}},
//      {"sleep": 100},
//      {"write": "/workspace/out.txt", "data": "hello"},
//      {"read": "/workspace/out.txt"},
//      {"list": "/workspace"}, {"stat": "/workspace/out.txt"},
//      {"mkdir": "/workspace/a/b", "recursive": true}, {"remove": "/workspace/a/b"},
//      {"log": "text"}, {"log": "text", "stream": "stderr"},
//      {"parallel": [ {"tool": "a"}, {"tool": "b"} ]}
//    ]}

struct PlanStep {
    enum Kind {
        OPERATION,
        LOG,
        PARALLEL
    };

    Kind kind;
    Operation op;
    std::string text;
    bool to_stderr;
    std::vector<PlanStep> branches;

    PlanStep() : kind(OPERATION), to_stderr(false) {}

    static bool from_json(const Json& j, PlanStep& out, std::string& error);
};

struct Plan {
    std::vector<PlanStep> steps;
    bool continue_on_error;

    Plan() : continue_on_error(false) {}

    static bool from_json(const Json& j, Plan& out, std::string& error);
};

// Runs steps in order and completes with the array of step results (null
// for log steps, the array of branch results for parallel steps). A failed
// step fails the task unless continue_on_error is set, in which case its
// result is {"error": {...}}.
class PlanTask : public GuestTask {
public:
    PlanTask(const std::vector<PlanStep>& steps, bool continue_on_error);

    TaskStep start(TaskContext& ctx) override;
    TaskStep resume(TaskContext& ctx, const Outcome& outcome) override;

private:
    // Branch of a parallel step: completes with its single step result
    PlanTask(const PlanStep& step, bool continue_on_error);

    TaskStep advance(TaskContext& ctx);

    std::vector<PlanStep> steps_;
    bool continue_on_error_;
    bool branch_;
    size_t index_;
    Json results_;
};

std::unique_ptr<GuestTask> make_plan_task(const Plan& plan);

} // namespace warden

#endif // warden_RUNTIME_TASK_HPP
