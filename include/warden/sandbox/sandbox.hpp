/*
 * warden C++17 - Sandbox
 *
 * Host side of a guest execution. Owns one Session, the tool registry and
 * an ExecutionEnvironment, and runs the request loop:
 *
 *   step() until no new request -> authorize/service each -> resume()
 *
 * Tool calls are authorized against the session's capability table before
 * the tool runs; a denial is handed to the guest as an error outcome and
 * the tool is never invoked. Sleep and VFS requests are governed by host
 * policy only.
 *
 * A Sandbox is driven from one thread at a time; independent sandboxes
 * share no state and may run in parallel.
 */
#ifndef warden_SANDBOX_SANDBOX_HPP
#define warden_SANDBOX_SANDBOX_HPP

#include <warden/audit/audit.hpp>
#include <warden/runtime/environment.hpp>
#include <warden/sandbox/tool.hpp>
#include <warden/session/session.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace warden {

class Config;

struct SandboxConfig {
    std::string session_id;     // empty = random uuid
    int64_t sleep_max_ms;       // requested sleeps are clamped to this (0 = no cap)
    bool sleep_virtual;         // advance a virtual clock instead of blocking
    int64_t max_steps;          // requests serviced per execution (0 = unlimited)
    int64_t timeout_ms;         // wall clock per execution (0 = none)
    VfsPolicy vfs;
    AuditConfig audit;

    SandboxConfig()
        : sleep_max_ms(5000)
        , sleep_virtual(false)
        , max_steps(0)
        , timeout_ms(0) {}

    static SandboxConfig from_config(const Config& cfg);
};

struct ExecutionResult {
    bool success;
    std::string stdout_text;
    std::string stderr_text;
    Json return_value;
    std::string error;          // human-readable, empty on success
    ErrorPayload error_payload;
    int64_t tool_calls;         // authorized tool invocations
    int64_t requests_serviced;
    bool cancelled;

    ExecutionResult()
        : success(false)
        , tool_calls(0)
        , requests_serviced(0)
        , cancelled(false) {}

    Json to_json() const;

    // Plain-text rendering for feeding back to an agent
    std::string to_tool_message() const;
};

class Sandbox {
public:
    // Throws PatternConfigError for an invalid capability list.
    // `handler` serves tools registered without their own executor.
    // `env` defaults to the in-process Scheduler.
    Sandbox(const ToolRegistry& tools,
            const std::vector<MethodCapability>& capabilities,
            ToolHandler handler = ToolHandler(),
            const SandboxConfig& config = SandboxConfig(),
            std::unique_ptr<ExecutionEnvironment> env = std::unique_ptr<ExecutionEnvironment>());
    ~Sandbox();

    // Run a guest program to completion (or cancellation). Session state
    // (VFS, quotas) carries over between calls. ProtocolError from a
    // misbehaving environment propagates after the execution is torn down.
    ExecutionResult execute(std::unique_ptr<GuestTask> task);

    // Produce the outcome for one request. Exposed for environments that
    // are driven externally.
    Outcome service(const Request& request);

    // Request cancellation of the running execution; safe from any thread.
    void cancel();

    // Pre-flight checks, by host tool name; never consume quota
    bool can_call(const std::string& method, const Json& args = Json::object()) const;
    AuthorizationResult check(const std::string& method, const Json& args = Json::object()) const;
    bool remaining_calls(const std::string& key, int64_t& out) const;
    std::map<std::string, int64_t> call_counts() const;

    // Clear VFS and pending requests; quotas are kept
    void teardown();

    Session& session() { return session_; }
    const Session& session() const { return session_; }
    AuditCollector& audit() { return audit_; }
    const ToolRegistry& tools() const { return tools_; }
    const SandboxConfig& config() const { return config_; }

    int64_t virtual_clock_ms() const { return virtual_clock_ms_; }

private:
    Sandbox(const Sandbox&);
    Sandbox& operator=(const Sandbox&);

    Outcome service_tool_call(const Request& request);
    Outcome service_sleep(const Request& request);
    Outcome service_vfs(const Request& request);
    ToolOutcome invoke_tool(const std::string& method, const Json& args);
    void abort_execution(const std::string& reason);

    ToolRegistry tools_;
    ToolHandler handler_;
    SandboxConfig config_;
    Session session_;
    AuditCollector audit_;
    std::unique_ptr<ExecutionEnvironment> env_;
    std::mutex execute_mutex_;
    std::atomic<bool> cancel_requested_;
    int64_t virtual_clock_ms_;
    int64_t tool_calls_;
};

} // namespace warden

#endif // warden_SANDBOX_SANDBOX_HPP
