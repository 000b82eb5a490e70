/*
 * Warden C++ - Cooperative Scheduler Implementation
 */
#include <warden/runtime/scheduler.hpp>
#include <warden/core/logger.hpp>

namespace warden {

Scheduler::Scheduler()
    : ids_(nullptr)
    , next_task_id_(1)
    , root_id_(0)
    , current_(0)
    , root_done_(false)
    , cancelled_(false)
{
}

Scheduler::~Scheduler() {
}

void Scheduler::reset() {
    tasks_.clear();
    runnable_.clear();
    outstanding_.clear();
    bindings_.clear();
    ids_ = nullptr;
    next_task_id_ = 1;
    root_id_ = 0;
    current_ = 0;
    root_done_ = false;
    cancelled_ = false;
    cancel_reason_.clear();
    stdout_.clear();
    stderr_.clear();
}

// ============================================================================
// ExecutionEnvironment
// ============================================================================

void Scheduler::begin(std::unique_ptr<GuestTask> root, const ToolBindings& bindings,
                      RequestIdAllocator& ids) {
    reset();
    bindings_ = bindings;
    ids_ = &ids;
    if (!root) {
        LOG_WARN("[Scheduler] begin() without a guest task");
        return;
    }
    root_id_ = spawn(std::move(root));
    LOG_DEBUG("[Scheduler] Started root task %llu with %zu tool bindings",
              static_cast<unsigned long long>(root_id_), bindings_.size());
}

bool Scheduler::has_work() const {
    if (root_done_ || cancelled_) return false;
    return !runnable_.empty() || !outstanding_.empty();
}

bool Scheduler::step(Request& out) {
    while (!runnable_.empty() && !root_done_ && !cancelled_) {
        TaskId id = runnable_.front();
        runnable_.pop_front();

        std::map<TaskId, TaskRecord>::iterator it = tasks_.find(id);
        if (it == tasks_.end() || it->second.state != TaskState::RUNNABLE) {
            continue;
        }
        TaskRecord& rec = it->second;

        current_ = id;
        TaskStep next;
        try {
            if (rec.started) {
                Outcome inbox = rec.inbox;
                rec.inbox = Outcome();
                next = rec.task->resume(*this, inbox);
            } else {
                rec.started = true;
                next = rec.task->start(*this);
            }
        } catch (const std::exception& e) {
            LOG_DEBUG("[Scheduler] Task %llu raised: %s",
                      static_cast<unsigned long long>(id), e.what());
            next = TaskStep::fail(error_code::GUEST_ERROR, e.what());
        }
        current_ = 0;

        if (apply(rec, next, out)) {
            return true;
        }
    }
    return false;
}

void Scheduler::resume(RequestId id, const Outcome& outcome) {
    std::map<RequestId, TaskId>::iterator it = outstanding_.find(id);
    if (it == outstanding_.end()) {
        LOG_ERROR("[Scheduler] resume() for unknown request %llu",
                  static_cast<unsigned long long>(id));
        throw UnknownRequestId(id);
    }

    TaskId task_id = it->second;
    outstanding_.erase(it);

    TaskRecord& rec = tasks_[task_id];
    rec.waiting_on = 0;
    make_runnable(rec, outcome);
}

void Scheduler::cancel(const std::string& reason) {
    if (root_done_) return;

    LOG_INFO("[Scheduler] Cancelled with %zu outstanding requests: %s",
             outstanding_.size(), reason.c_str());
    cancelled_ = true;
    cancel_reason_ = reason;
    abandon_all();
}

GuestResult Scheduler::finish() {
    GuestResult result;
    result.stdout_text = stdout_;
    result.stderr_text = stderr_;

    std::map<TaskId, TaskRecord>::iterator root = tasks_.find(root_id_);
    if (cancelled_) {
        result.error = ErrorPayload(error_code::CANCELLED,
                                    cancel_reason_.empty() ? "execution cancelled" : cancel_reason_);
    } else if (root == tasks_.end()) {
        result.error = ErrorPayload(error_code::GUEST_ERROR, "no guest task was started");
    } else if (root->second.state == TaskState::COMPLETED) {
        result.success = true;
        result.value = root->second.value;
    } else if (root->second.state == TaskState::FAILED) {
        result.error = root->second.error;
    } else {
        result.error = ErrorPayload(error_code::GUEST_ERROR,
                                    std::string("guest stalled in state ") +
                                    task_state_to_string(root->second.state));
    }

    reset();
    return result;
}

// ============================================================================
// TaskContext
// ============================================================================

TaskId Scheduler::spawn(std::unique_ptr<GuestTask> task) {
    TaskId id = next_task_id_++;
    TaskRecord& rec = tasks_[id];
    rec.id = id;
    rec.parent = current_;
    rec.task = std::move(task);
    rec.state = TaskState::RUNNABLE;
    runnable_.push_back(id);
    return id;
}

void Scheduler::console_log(const std::string& line) {
    stdout_ += line;
    stdout_ += "\n";
}

void Scheduler::console_error(const std::string& line) {
    stderr_ += line;
    stderr_ += "\n";
}

bool Scheduler::task_state(TaskId id, TaskState& out) const {
    std::map<TaskId, TaskRecord>::const_iterator it = tasks_.find(id);
    if (it == tasks_.end()) return false;
    out = it->second.state;
    return true;
}

// ============================================================================
// Internals
// ============================================================================

bool Scheduler::resolve_tool(const std::string& name, std::string& host_method) const {
    ToolBindings::const_iterator it = bindings_.find(name);
    if (it != bindings_.end()) {
        host_method = it->second;
        return true;
    }
    // Guests may also use the host's own spelling
    for (it = bindings_.begin(); it != bindings_.end(); ++it) {
        if (it->second == name) {
            host_method = name;
            return true;
        }
    }
    return false;
}

bool Scheduler::apply(TaskRecord& rec, const TaskStep& step, Request& out) {
    switch (step.kind) {
        case TaskStep::AWAIT: {
            Request req;
            req.op = step.op;

            if (req.op.kind == RequestKind::TOOL_CALL &&
                !resolve_tool(step.op.method, req.op.method)) {
                // Unknown identifier: fails inside the guest, nothing reaches the host
                make_runnable(rec, Outcome::fail(error_code::REFERENCE_ERROR,
                                                 step.op.method + " is not defined"));
                return false;
            }

            req.id = ids_->next();
            req.task_id = rec.id;
            rec.state = TaskState::SUSPENDED;
            rec.waiting_on = req.id;
            outstanding_[req.id] = rec.id;

            LOG_DEBUG("[Scheduler] Task %llu suspended on request %llu (%s)",
                      static_cast<unsigned long long>(rec.id),
                      static_cast<unsigned long long>(req.id),
                      req.op.describe().c_str());
            out = req;
            return true;
        }

        case TaskStep::RETURN:
            rec.state = TaskState::COMPLETED;
            rec.value = step.value;
            on_terminated(rec);
            return false;

        case TaskStep::FAIL:
            rec.state = TaskState::FAILED;
            rec.error = step.error;
            on_terminated(rec);
            return false;

        case TaskStep::JOIN: {
            for (size_t i = 0; i < step.children.size(); ++i) {
                std::map<TaskId, TaskRecord>::const_iterator child = tasks_.find(step.children[i]);
                if (child == tasks_.end() || child->second.parent != rec.id) {
                    rec.state = TaskState::FAILED;
                    rec.error = ErrorPayload(error_code::GUEST_ERROR,
                                             "cannot join task " + std::to_string(step.children[i]) +
                                             ": not a child of this task");
                    on_terminated(rec);
                    return false;
                }
            }

            rec.joined = step.children;
            if (join_ready(rec)) {
                make_runnable(rec, join_outcome(rec));
            } else {
                rec.state = TaskState::WAITING;
            }
            return false;
        }
    }
    return false;
}

void Scheduler::make_runnable(TaskRecord& rec, const Outcome& outcome) {
    rec.inbox = outcome;
    rec.state = TaskState::RUNNABLE;
    runnable_.push_back(rec.id);
}

bool Scheduler::join_ready(const TaskRecord& rec) const {
    for (size_t i = 0; i < rec.joined.size(); ++i) {
        std::map<TaskId, TaskRecord>::const_iterator child = tasks_.find(rec.joined[i]);
        if (child != tasks_.end() && !task_state_is_terminal(child->second.state)) {
            return false;
        }
    }
    return true;
}

Outcome Scheduler::join_outcome(const TaskRecord& rec) const {
    Json values = Json::array();
    for (size_t i = 0; i < rec.joined.size(); ++i) {
        std::map<TaskId, TaskRecord>::const_iterator child = tasks_.find(rec.joined[i]);
        if (child == tasks_.end()) {
            values.push_back(Json());
            continue;
        }
        if (child->second.state == TaskState::FAILED) {
            return Outcome::fail(child->second.error);
        }
        values.push_back(child->second.value);
    }
    return Outcome::ok(values);
}

void Scheduler::on_terminated(TaskRecord& rec) {
    LOG_DEBUG("[Scheduler] Task %llu %s",
              static_cast<unsigned long long>(rec.id), task_state_to_string(rec.state));

    if (rec.id == root_id_) {
        root_done_ = true;
        if (!runnable_.empty() || !outstanding_.empty()) {
            LOG_DEBUG("[Scheduler] Root finished; abandoning %zu runnable and %zu suspended tasks",
                      runnable_.size(), outstanding_.size());
        }
        abandon_all();
        return;
    }

    std::map<TaskId, TaskRecord>::iterator parent = tasks_.find(rec.parent);
    if (parent == tasks_.end() || parent->second.state != TaskState::WAITING) {
        return;
    }
    if (join_ready(parent->second)) {
        make_runnable(parent->second, join_outcome(parent->second));
    }
}

void Scheduler::abandon_all() {
    runnable_.clear();
    outstanding_.clear();
}

} // namespace warden
