/*
 * warden C++17 - Execution Environment Interface
 *
 * The boundary between the host and whatever runs guest code. The host
 * drives it with a simple loop:
 *
 *   env.begin(task, bindings, ids);
 *   while (env.has_work()) {
 *       Request req;
 *       while (env.step(req)) { ...collect... }
 *       for each collected request: env.resume(req.id, service(req));
 *   }
 *   GuestResult result = env.finish();
 *
 * Scheduler is the in-process implementation. An out-of-process runtime
 * carries Request / Outcome through their JSON envelopes instead.
 */
#ifndef warden_RUNTIME_ENVIRONMENT_HPP
#define warden_RUNTIME_ENVIRONMENT_HPP

#include <warden/runtime/request.hpp>
#include <warden/runtime/task.hpp>
#include <map>
#include <memory>
#include <string>

namespace warden {

// Guest identifier -> host tool name
typedef std::map<std::string, std::string> ToolBindings;

struct GuestResult {
    bool success;
    Json value;
    ErrorPayload error;
    std::string stdout_text;
    std::string stderr_text;

    GuestResult() : success(false) {}
};

class ExecutionEnvironment {
public:
    virtual ~ExecutionEnvironment() {}

    // Install the top-level task. Request ids are drawn from `ids`, which
    // the session owns so they stay unique across executions.
    virtual void begin(std::unique_ptr<GuestTask> root, const ToolBindings& bindings,
                       RequestIdAllocator& ids) = 0;

    // True while any task is runnable or has an outstanding request.
    virtual bool has_work() const = 0;

    // Run guest code until a new request exists. Returns false when the
    // guest is finished or blocked only on requests already handed out.
    virtual bool step(Request& out) = 0;

    // Deliver the outcome of one request and make only its task runnable.
    // Throws UnknownRequestId for ids that are unknown or already resolved.
    virtual void resume(RequestId id, const Outcome& outcome) = 0;

    // Drop every task and outstanding request without delivering results.
    virtual void cancel(const std::string& reason) = 0;

    // Final result of the top-level task plus captured console output.
    // Resets the environment for the next begin().
    virtual GuestResult finish() = 0;
};

} // namespace warden

#endif // warden_RUNTIME_ENVIRONMENT_HPP
