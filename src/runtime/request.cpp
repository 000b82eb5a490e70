/*
 * Warden C++ - Request Protocol Implementation
 */
#include <warden/runtime/request.hpp>
#include <warden/core/utils.hpp>

#include <sstream>

namespace warden {

namespace error_code {
    const char* const NO_MATCHING_RULE = "no_matching_rule";
    const char* const CONSTRAINT_VIOLATION = "constraint_violation";
    const char* const QUOTA_EXCEEDED = "quota_exceeded";
    const char* const TOOL_ERROR = "tool_error";
    const char* const VFS_ERROR = "vfs_error";
    const char* const SLEEP_ERROR = "sleep_error";
    const char* const REFERENCE_ERROR = "reference_error";
    const char* const CANCELLED = "cancelled";
    const char* const GUEST_ERROR = "guest_error";
}

namespace {

struct KindName {
    RequestKind kind;
    const char* name;
};

const KindName kKindNames[] = {
    { RequestKind::TOOL_CALL,  "tool_call" },
    { RequestKind::SLEEP,      "sleep" },
    { RequestKind::VFS_READ,   "vfs_read" },
    { RequestKind::VFS_WRITE,  "vfs_write" },
    { RequestKind::VFS_LIST,   "vfs_list" },
    { RequestKind::VFS_STAT,   "vfs_stat" },
    { RequestKind::VFS_MKDIR,  "vfs_mkdir" },
    { RequestKind::VFS_REMOVE, "vfs_remove" },
};

} // anonymous namespace

const char* request_kind_to_string(RequestKind kind) {
    for (size_t i = 0; i < sizeof(kKindNames) / sizeof(kKindNames[0]); ++i) {
        if (kKindNames[i].kind == kind) return kKindNames[i].name;
    }
    return "unknown";
}

bool request_kind_from_string(const std::string& name, RequestKind& out) {
    for (size_t i = 0; i < sizeof(kKindNames) / sizeof(kKindNames[0]); ++i) {
        if (name == kKindNames[i].name) {
            out = kKindNames[i].kind;
            return true;
        }
    }
    return false;
}

// ============================================================================
// Operation
// ============================================================================

Operation Operation::tool_call(const std::string& method, const Json& args) {
    Operation op;
    op.kind = RequestKind::TOOL_CALL;
    op.method = method;
    op.args = args.is_null() ? Json::object() : args;
    return op;
}

Operation Operation::sleep(int64_t duration_ms) {
    Operation op;
    op.kind = RequestKind::SLEEP;
    op.duration_ms = duration_ms;
    return op;
}

Operation Operation::vfs_read(const std::string& path) {
    Operation op;
    op.kind = RequestKind::VFS_READ;
    op.path = path;
    return op;
}

Operation Operation::vfs_write(const std::string& path, const std::string& data) {
    Operation op;
    op.kind = RequestKind::VFS_WRITE;
    op.path = path;
    op.data = data;
    return op;
}

Operation Operation::vfs_list(const std::string& path) {
    Operation op;
    op.kind = RequestKind::VFS_LIST;
    op.path = path;
    return op;
}

Operation Operation::vfs_stat(const std::string& path) {
    Operation op;
    op.kind = RequestKind::VFS_STAT;
    op.path = path;
    return op;
}

Operation Operation::vfs_mkdir(const std::string& path, bool recursive) {
    Operation op;
    op.kind = RequestKind::VFS_MKDIR;
    op.path = path;
    op.recursive = recursive;
    return op;
}

Operation Operation::vfs_remove(const std::string& path) {
    Operation op;
    op.kind = RequestKind::VFS_REMOVE;
    op.path = path;
    return op;
}

std::string Operation::describe() const {
    std::ostringstream oss;
    oss << request_kind_to_string(kind);
    switch (kind) {
        case RequestKind::TOOL_CALL:
            oss << " " << method;
            break;
        case RequestKind::SLEEP:
            oss << " " << duration_ms << "ms";
            break;
        case RequestKind::VFS_WRITE:
            oss << " " << path << " (" << data.size() << " bytes)";
            break;
        default:
            oss << " " << path;
            break;
    }
    return oss.str();
}

// ============================================================================
// Request envelope
// ============================================================================

Json Request::to_json() const {
    Json j = Json::object();
    j["id"] = id;
    j["task_id"] = task_id;
    j["kind"] = request_kind_to_string(op.kind);

    switch (op.kind) {
        case RequestKind::TOOL_CALL:
            j["method"] = op.method;
            j["args"] = op.args;
            break;
        case RequestKind::SLEEP:
            j["duration_ms"] = op.duration_ms;
            break;
        case RequestKind::VFS_WRITE:
            j["path"] = op.path;
            j["data_b64"] = base64_encode(op.data);
            break;
        case RequestKind::VFS_MKDIR:
            j["path"] = op.path;
            j["recursive"] = op.recursive;
            break;
        default:
            j["path"] = op.path;
            break;
    }
    return j;
}

bool Request::from_json(const Json& j, Request& out, std::string& error) {
    if (!j.is_object()) {
        error = "request must be an object";
        return false;
    }
    if (!j.contains("id") || !j["id"].is_number_integer() ||
        (!j["id"].is_number_unsigned() && j["id"].get<int64_t>() <= 0)) {
        error = "request 'id' must be a positive integer";
        return false;
    }
    if (!j.contains("task_id") || !j["task_id"].is_number_integer() ||
        (!j["task_id"].is_number_unsigned() && j["task_id"].get<int64_t>() < 0)) {
        error = "request 'task_id' must be a non-negative integer";
        return false;
    }
    if (!j.contains("kind") || !j["kind"].is_string()) {
        error = "request 'kind' is missing";
        return false;
    }

    Request req;
    req.id = j["id"].get<RequestId>();
    req.task_id = j["task_id"].get<TaskId>();
    if (!request_kind_from_string(j["kind"].get<std::string>(), req.op.kind)) {
        error = "unknown request kind '" + j["kind"].get<std::string>() + "'";
        return false;
    }

    switch (req.op.kind) {
        case RequestKind::TOOL_CALL:
            if (!j.contains("method") || !j["method"].is_string()) {
                error = "tool_call requires 'method'";
                return false;
            }
            req.op.method = j["method"].get<std::string>();
            req.op.args = j.contains("args") ? j["args"] : Json::object();
            if (!req.op.args.is_object()) {
                error = "tool_call 'args' must be an object";
                return false;
            }
            break;

        case RequestKind::SLEEP:
            if (!j.contains("duration_ms") || !j["duration_ms"].is_number_integer()) {
                error = "sleep requires integer 'duration_ms'";
                return false;
            }
            req.op.duration_ms = j["duration_ms"].get<int64_t>();
            break;

        default:
            if (!j.contains("path") || !j["path"].is_string()) {
                error = std::string(request_kind_to_string(req.op.kind)) + " requires 'path'";
                return false;
            }
            req.op.path = j["path"].get<std::string>();
            if (req.op.kind == RequestKind::VFS_WRITE) {
                std::string b64 = j.contains("data_b64") && j["data_b64"].is_string()
                                      ? j["data_b64"].get<std::string>() : "";
                if (!base64_decode(b64, req.op.data)) {
                    error = "vfs_write 'data_b64' is not valid base64";
                    return false;
                }
            }
            if (req.op.kind == RequestKind::VFS_MKDIR && j.contains("recursive")) {
                if (!j["recursive"].is_boolean()) {
                    error = "vfs_mkdir 'recursive' must be a boolean";
                    return false;
                }
                req.op.recursive = j["recursive"].get<bool>();
            }
            break;
    }

    out = req;
    return true;
}

// ============================================================================
// ErrorPayload / Outcome
// ============================================================================

Json ErrorPayload::to_json() const {
    Json j = Json::object();
    j["code"] = code;
    j["message"] = message;
    if (!data.is_null()) j["data"] = data;
    return j;
}

ErrorPayload ErrorPayload::from_json(const Json& j) {
    ErrorPayload e;
    if (!j.is_object()) {
        e.code = error_code::GUEST_ERROR;
        e.message = j.is_string() ? j.get<std::string>() : j.dump(-1, ' ', false, Json::error_handler_t::replace);
        return e;
    }
    e.code = j.value("code", std::string(error_code::GUEST_ERROR));
    e.message = j.value("message", std::string());
    if (j.contains("data")) e.data = j["data"];
    return e;
}

Json Outcome::to_json() const {
    Json j = Json::object();
    j["ok"] = success;
    if (success) {
        j["value"] = value;
    } else {
        j["error"] = error.to_json();
    }
    return j;
}

Outcome Outcome::from_json(const Json& j) {
    if (!j.is_object() || !j.contains("ok") || !j["ok"].is_boolean()) {
        return Outcome::fail(error_code::GUEST_ERROR, "malformed outcome envelope");
    }
    if (j["ok"].get<bool>()) {
        return Outcome::ok(j.contains("value") ? j["value"] : Json());
    }
    return Outcome::fail(ErrorPayload::from_json(j.contains("error") ? j["error"] : Json()));
}

} // namespace warden
