/*
 * Warden C++ - Sandbox Implementation
 */
#include <warden/sandbox/sandbox.hpp>
#include <warden/runtime/scheduler.hpp>
#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

namespace warden {

namespace {

// "ENOENT: no such file or directory: /x" -> "ENOENT"
std::string vfs_errno(const std::string& error) {
    size_t colon = error.find(':');
    return colon == std::string::npos ? error : error.substr(0, colon);
}

Outcome vfs_failure(const Request& req, const std::string& error) {
    Json data = Json::object();
    data["path"] = req.op.path;
    data["errno"] = vfs_errno(error);
    return Outcome::fail(error_code::VFS_ERROR, error, data);
}

} // anonymous namespace

// ============================================================================
// SandboxConfig / ExecutionResult
// ============================================================================

SandboxConfig SandboxConfig::from_config(const Config& cfg) {
    SandboxConfig config;
    config.session_id = cfg.get_string("session_id", "");
    config.sleep_max_ms = cfg.get_int("sleep.max_ms", config.sleep_max_ms);
    config.sleep_virtual = cfg.get_bool("sleep.virtual", config.sleep_virtual);
    config.max_steps = cfg.get_int("execute.max_steps", config.max_steps);
    config.timeout_ms = cfg.get_int("execute.timeout_ms", config.timeout_ms);
    config.vfs = VfsPolicy::from_config(cfg);
    config.audit = AuditConfig::from_config(cfg);
    return config;
}

Json ExecutionResult::to_json() const {
    Json j = Json::object();
    j["success"] = success;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["return_value"] = return_value;
    if (success) {
        j["error"] = nullptr;
    } else {
        j["error"] = error_payload.to_json();
    }
    j["tool_calls"] = tool_calls;
    j["requests_serviced"] = requests_serviced;
    j["cancelled"] = cancelled;
    return j;
}

std::string ExecutionResult::to_tool_message() const {
    std::vector<std::string> parts;
    if (!stdout_text.empty()) parts.push_back(rtrim(stdout_text));
    if (!stderr_text.empty()) parts.push_back("[stderr]: " + rtrim(stderr_text));
    if (!success && !error.empty()) parts.push_back("[error]: " + error);
    if (success && !return_value.is_null()) {
        parts.push_back("[result]: " + return_value.dump(-1, ' ', false, Json::error_handler_t::replace));
    }
    return parts.empty() ? "(no output)" : join(parts, "\n");
}

// ============================================================================
// Sandbox
// ============================================================================

Sandbox::Sandbox(const ToolRegistry& tools,
                 const std::vector<MethodCapability>& capabilities,
                 ToolHandler handler,
                 const SandboxConfig& config,
                 std::unique_ptr<ExecutionEnvironment> env)
    : tools_(tools)
    , handler_(handler)
    , config_(config)
    , session_(config.session_id.empty() ? generate_uuid() : config.session_id,
               capabilities, config.vfs)
    , audit_(session_.id(), config.audit)
    , env_(std::move(env))
    , cancel_requested_(false)
    , virtual_clock_ms_(0)
    , tool_calls_(0)
{
    if (!env_) {
        env_.reset(new Scheduler());
    }
    LOG_INFO("[Sandbox] Session %s ready: %zu tools, %zu capabilities",
             session_.id().c_str(), tools_.size(), session_.capabilities().capability_count());
}

Sandbox::~Sandbox() {
}

ExecutionResult Sandbox::execute(std::unique_ptr<GuestTask> task) {
    std::lock_guard<std::mutex> lock(execute_mutex_);

    ExecutionResult result;
    cancel_requested_ = false;
    tool_calls_ = 0;
    session_.count_execution();
    int64_t turn = audit_.next_turn();

    Json start = Json::object();
    start["turn_id"] = turn;
    audit_.record(audit_type::EXECUTE_START, start);
    LOG_DEBUG("[Sandbox] Execution %lld started", static_cast<long long>(turn));

    int64_t deadline = config_.timeout_ms > 0 ? monotonic_ms() + config_.timeout_ms : 0;
    std::string stop_reason;

    try {
        env_->begin(std::move(task), tools_.bindings(), session_.request_ids());

        while (env_->has_work() && stop_reason.empty()) {
            if (cancel_requested_) {
                stop_reason = "execution cancelled by host";
                break;
            }

            // 1. Let the guest run until every runnable task is blocked
            std::vector<Request> batch;
            Request req;
            while (env_->step(req)) {
                session_.track(req);
                batch.push_back(req);
            }

            // Top-level task finished while siblings were still issuing
            // requests: those tasks are abandoned, their requests never run
            if (!env_->has_work()) {
                session_.discard_pending();
                break;
            }
            if (batch.empty()) {
                stop_reason = "guest stalled with no serviceable requests";
                break;
            }

            // 2. Service in issue order, resuming each task individually
            for (size_t i = 0; i < batch.size(); ++i) {
                if (cancel_requested_) {
                    stop_reason = "execution cancelled by host";
                    break;
                }
                if (config_.max_steps > 0 && result.requests_serviced >= config_.max_steps) {
                    stop_reason = "step limit of " + std::to_string(config_.max_steps) + " requests exceeded";
                    break;
                }
                if (deadline > 0 && monotonic_ms() > deadline) {
                    stop_reason = "execution timed out after " + std::to_string(config_.timeout_ms) + "ms";
                    break;
                }

                Outcome outcome = service(batch[i]);
                result.requests_serviced += 1;
                session_.resolve(batch[i].id);
                env_->resume(batch[i].id, outcome);
            }
        }
    } catch (const ProtocolError& e) {
        LOG_ERROR("[Sandbox] Protocol violation: %s", e.what());
        abort_execution(e.what());
        env_->finish();
        throw;
    } catch (const std::exception& e) {
        LOG_ERROR("[Sandbox] Execution failed while servicing: %s", e.what());
        abort_execution(e.what());
        env_->finish();
        throw;
    } catch (...) {
        LOG_ERROR("[Sandbox] Execution failed while servicing: unknown exception");
        abort_execution("unknown exception");
        env_->finish();
        throw;
    }

    if (!stop_reason.empty()) {
        abort_execution(stop_reason);
        result.cancelled = true;
    }

    GuestResult guest = env_->finish();
    result.success = guest.success;
    result.return_value = guest.value;
    result.stdout_text = guest.stdout_text;
    result.stderr_text = guest.stderr_text;
    result.error_payload = guest.error;
    result.tool_calls = tool_calls_;
    if (!guest.success) {
        result.error = guest.error.code + ": " + guest.error.message;
    }

    Json end = Json::object();
    end["turn_id"] = turn;
    end["success"] = result.success;
    end["requests_serviced"] = result.requests_serviced;
    end["tool_calls"] = result.tool_calls;
    if (!result.success) end["error"] = result.error_payload.to_json();
    audit_.record(audit_type::EXECUTE_END, end);

    LOG_DEBUG("[Sandbox] Execution %lld finished: success=%d requests=%lld",
              static_cast<long long>(turn), result.success ? 1 : 0,
              static_cast<long long>(result.requests_serviced));
    return result;
}

void Sandbox::abort_execution(const std::string& reason) {
    env_->cancel(reason);
    size_t dropped = session_.discard_pending();

    Json data = Json::object();
    data["reason"] = reason;
    data["pending_dropped"] = dropped;
    audit_.record(audit_type::CANCEL, data);
    LOG_WARN("[Sandbox] Execution aborted: %s", reason.c_str());
}

void Sandbox::cancel() {
    cancel_requested_ = true;
}

void Sandbox::teardown() {
    session_.teardown();
}

// ============================================================================
// Request servicing
// ============================================================================

Outcome Sandbox::service(const Request& request) {
    LOG_DEBUG("[Sandbox] Servicing request %llu from task %llu: %s",
              static_cast<unsigned long long>(request.id),
              static_cast<unsigned long long>(request.task_id),
              request.op.describe().c_str());

    switch (request.op.kind) {
        case RequestKind::TOOL_CALL:
            return service_tool_call(request);
        case RequestKind::SLEEP:
            return service_sleep(request);
        default:
            return service_vfs(request);
    }
}

Outcome Sandbox::service_tool_call(const Request& request) {
    const std::string& method = request.op.method;
    const Json& args = request.op.args;
    std::string hash = AuditCollector::params_hash(args);

    // Authorization strictly precedes the call
    AuthorizationResult auth = session_.capabilities().authorize(method, args);
    if (!auth.success) {
        Json data = auth.error.to_json();
        data["params_hash"] = hash;
        audit_.record(audit_type::CAPABILITY_DENIED, data);
        return Outcome::fail(capability_error_kind_to_string(auth.error.kind),
                             auth.error.message(), auth.error.to_json());
    }

    tool_calls_ += 1;
    Json call = Json::object();
    call["method"] = method;
    call["params_hash"] = hash;
    call["capability"] = auth.grant.capability_key;
    call["remaining"] = auth.grant.remaining;
    audit_.record(audit_type::TOOL_CALL, call);

    ToolOutcome outcome = invoke_tool(method, args);
    if (!outcome.success) {
        Json data = Json::object();
        data["method"] = method;
        data["error"] = outcome.error;
        audit_.record(audit_type::TOOL_ERROR, data);
        LOG_WARN("[Sandbox] Tool %s failed: %s", method.c_str(), outcome.error.c_str());

        Json payload = Json::object();
        payload["method"] = method;
        return Outcome::fail(error_code::TOOL_ERROR, outcome.error, payload);
    }
    return Outcome::ok(outcome.value);
}

ToolOutcome Sandbox::invoke_tool(const std::string& method, const Json& args) {
    const HostTool* tool = tools_.find(method);
    ToolHandler handler = (tool != nullptr && tool->execute) ? tool->execute : handler_;
    if (!handler) {
        return ToolOutcome::fail("no handler available for tool '" + method + "'");
    }

    try {
        return handler(method, args);
    } catch (const std::exception& e) {
        return ToolOutcome::fail(std::string("tool raised: ") + e.what());
    } catch (...) {
        return ToolOutcome::fail("tool raised a non-standard exception");
    }
}

Outcome Sandbox::service_sleep(const Request& request) {
    int64_t requested = request.op.duration_ms;
    if (requested < 0) {
        return Outcome::fail(error_code::SLEEP_ERROR, "sleep duration must be non-negative");
    }

    int64_t duration = requested;
    if (config_.sleep_max_ms > 0 && duration > config_.sleep_max_ms) {
        duration = config_.sleep_max_ms;
    }

    if (config_.sleep_virtual) {
        virtual_clock_ms_ += duration;
    } else {
        sleep_ms(duration);
    }

    Json data = Json::object();
    data["requested_ms"] = requested;
    data["slept_ms"] = duration;
    data["virtual"] = config_.sleep_virtual;
    audit_.record(audit_type::SLEEP, data);
    return Outcome::ok();
}

Outcome Sandbox::service_vfs(const Request& request) {
    VirtualFs& vfs = session_.vfs();
    const std::string& path = request.op.path;
    std::string error;

    switch (request.op.kind) {
        case RequestKind::VFS_READ: {
            std::string data;
            Json audit_data = Json::object();
            audit_data["path"] = path;
            if (!vfs.read(path, data, error)) {
                audit_data["error"] = error;
                audit_.record(audit_type::VFS_READ, audit_data);
                return vfs_failure(request, error);
            }
            audit_data["bytes"] = data.size();
            audit_.record(audit_type::VFS_READ, audit_data);
            return Outcome::ok(data);
        }

        case RequestKind::VFS_WRITE: {
            Json audit_data = Json::object();
            audit_data["path"] = path;
            audit_data["bytes"] = request.op.data.size();
            if (!vfs.write(path, request.op.data, error)) {
                audit_data["error"] = error;
                audit_.record(audit_type::VFS_WRITE, audit_data);
                return vfs_failure(request, error);
            }
            audit_.record(audit_type::VFS_WRITE, audit_data);
            return Outcome::ok();
        }

        case RequestKind::VFS_LIST: {
            std::vector<VfsEntry> entries;
            if (!vfs.list(path, entries, error)) return vfs_failure(request, error);
            Json arr = Json::array();
            for (size_t i = 0; i < entries.size(); ++i) {
                Json e = Json::object();
                e["name"] = entries[i].name;
                e["type"] = entries[i].type;
                e["size"] = entries[i].size;
                arr.push_back(e);
            }
            return Outcome::ok(arr);
        }

        case RequestKind::VFS_STAT: {
            VfsStat st;
            if (!vfs.stat(path, st, error)) return vfs_failure(request, error);
            Json j = Json::object();
            j["type"] = st.type;
            j["size"] = st.size;
            return Outcome::ok(j);
        }

        case RequestKind::VFS_MKDIR:
            if (!vfs.mkdir(path, request.op.recursive, error)) return vfs_failure(request, error);
            return Outcome::ok();

        case RequestKind::VFS_REMOVE:
            if (!vfs.remove(path, error)) return vfs_failure(request, error);
            return Outcome::ok();

        default:
            break;
    }
    return Outcome::fail(error_code::GUEST_ERROR,
                         std::string("unsupported request kind ") + request_kind_to_string(request.op.kind));
}

// ============================================================================
// Pre-flight
// ============================================================================

bool Sandbox::can_call(const std::string& method, const Json& args) const {
    return session_.capabilities().can_call(method, args);
}

AuthorizationResult Sandbox::check(const std::string& method, const Json& args) const {
    return session_.capabilities().check(method, args);
}

bool Sandbox::remaining_calls(const std::string& key, int64_t& out) const {
    return session_.capabilities().remaining_calls(key, out);
}

std::map<std::string, int64_t> Sandbox::call_counts() const {
    return session_.capabilities().call_counts();
}

} // namespace warden
