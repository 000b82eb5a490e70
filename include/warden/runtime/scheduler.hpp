/*
 * warden C++17 - Cooperative Scheduler
 *
 * In-process ExecutionEnvironment. Exactly one task runs guest code at a
 * time; tasks only yield when they issue an operation or join children.
 * Runnable tasks are served FIFO, so completion order depends only on the
 * order in which the host resumes requests.
 */
#ifndef warden_RUNTIME_SCHEDULER_HPP
#define warden_RUNTIME_SCHEDULER_HPP

#include <warden/runtime/environment.hpp>
#include <deque>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace warden {

class Scheduler : public ExecutionEnvironment, public TaskContext {
public:
    Scheduler();
    ~Scheduler() override;

    // ExecutionEnvironment
    void begin(std::unique_ptr<GuestTask> root, const ToolBindings& bindings,
               RequestIdAllocator& ids) override;
    bool has_work() const override;
    bool step(Request& out) override;
    void resume(RequestId id, const Outcome& outcome) override;
    void cancel(const std::string& reason) override;
    GuestResult finish() override;

    // TaskContext
    TaskId spawn(std::unique_ptr<GuestTask> task) override;
    void console_log(const std::string& line) override;
    void console_error(const std::string& line) override;
    TaskId current_task() const override { return current_; }

    // Introspection
    bool task_state(TaskId id, TaskState& out) const;
    size_t task_count() const { return tasks_.size(); }
    size_t outstanding_count() const { return outstanding_.size(); }
    bool root_finished() const { return root_done_; }

private:
    Scheduler(const Scheduler&);
    Scheduler& operator=(const Scheduler&);

    struct TaskRecord {
        TaskId id;
        TaskId parent;
        std::unique_ptr<GuestTask> task;
        TaskState state;
        bool started;
        Outcome inbox;
        RequestId waiting_on;
        std::vector<TaskId> joined;
        Json value;
        ErrorPayload error;

        TaskRecord() : id(0), parent(0), state(TaskState::RUNNABLE), started(false), waiting_on(0) {}
    };

    // Act on what a task returned. Returns true if it produced a request.
    bool apply(TaskRecord& rec, const TaskStep& step, Request& out);

    bool resolve_tool(const std::string& name, std::string& host_method) const;
    void make_runnable(TaskRecord& rec, const Outcome& outcome);
    void on_terminated(TaskRecord& rec);
    bool join_ready(const TaskRecord& rec) const;
    Outcome join_outcome(const TaskRecord& rec) const;
    void abandon_all();
    void reset();

    std::map<TaskId, TaskRecord> tasks_;
    std::deque<TaskId> runnable_;
    std::map<RequestId, TaskId> outstanding_;
    ToolBindings bindings_;
    RequestIdAllocator* ids_;
    TaskId next_task_id_;
    TaskId root_id_;
    TaskId current_;
    bool root_done_;
    bool cancelled_;
    std::string cancel_reason_;
    std::string stdout_;
    std::string stderr_;
};

} // namespace warden

#endif // warden_RUNTIME_SCHEDULER_HPP
