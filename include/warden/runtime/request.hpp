/*
 * warden C++17 - Host/Guest Request Protocol
 *
 * Every externally visible action a guest task attempts is suspended and
 * surfaced to the host as a Request. The host answers each Request with
 * exactly one Outcome (a JSON value or an ErrorPayload), delivered through
 * ExecutionEnvironment::resume().
 *
 * Wire envelope (for environments living outside this process):
 *   {"id": 7, "task_id": 2, "kind": "tool_call", "method": "stripe/charges/create", "args": {...}}
 *   {"id": 8, "task_id": 3, "kind": "vfs_write", "path": "/workspace/x", "data_b64": "aGk="}
 *   {"ok": true, "value": ...}   /   {"ok": false, "error": {"code": ..., "message": ...}}
 */
#ifndef warden_RUNTIME_REQUEST_HPP
#define warden_RUNTIME_REQUEST_HPP

#include <warden/core/json.hpp>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace warden {

typedef uint64_t RequestId;
typedef uint64_t TaskId;

enum class RequestKind {
    TOOL_CALL,
    SLEEP,
    VFS_READ,
    VFS_WRITE,
    VFS_LIST,
    VFS_STAT,
    VFS_MKDIR,
    VFS_REMOVE
};

const char* request_kind_to_string(RequestKind kind);
bool request_kind_from_string(const std::string& name, RequestKind& out);

// ============================================================================
// Errors
// ============================================================================

// Host integration broke the protocol contract (double resume, unknown id,
// second outstanding request for one task). Always thrown, never returned.
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

class UnknownRequestId : public ProtocolError {
public:
    explicit UnknownRequestId(RequestId id)
        : ProtocolError("unknown or already resolved request id " + std::to_string(id))
        , id_(id) {}

    RequestId id() const { return id_; }

private:
    RequestId id_;
};

// ============================================================================
// Operation / Request
// ============================================================================

// What guest code asks for. The scheduler stamps it with an id and the
// issuing task to form a Request.
struct Operation {
    RequestKind kind;
    std::string method;     // TOOL_CALL: tool as named by the guest
    Json args;              // TOOL_CALL arguments
    std::string path;       // VFS_*
    std::string data;       // VFS_WRITE bytes
    int64_t duration_ms;    // SLEEP
    bool recursive;         // VFS_MKDIR

    Operation() : kind(RequestKind::TOOL_CALL), args(Json::object()), duration_ms(0), recursive(false) {}

    static Operation tool_call(const std::string& method, const Json& args = Json::object());
    static Operation sleep(int64_t duration_ms);
    static Operation vfs_read(const std::string& path);
    static Operation vfs_write(const std::string& path, const std::string& data);
    static Operation vfs_list(const std::string& path);
    static Operation vfs_stat(const std::string& path);
    static Operation vfs_mkdir(const std::string& path, bool recursive = false);
    static Operation vfs_remove(const std::string& path);

    std::string describe() const;
};

struct Request {
    RequestId id;
    TaskId task_id;
    Operation op;

    Request() : id(0), task_id(0) {}

    RequestKind kind() const { return op.kind; }

    Json to_json() const;
    static bool from_json(const Json& j, Request& out, std::string& error);
};

// Session-wide source of request ids. Ids start at 1 and are never reused.
class RequestIdAllocator {
public:
    RequestIdAllocator() : next_(1) {}

    RequestId next() { return next_.fetch_add(1); }
    RequestId peek() const { return next_.load(); }

private:
    std::atomic<uint64_t> next_;
};

// ============================================================================
// Outcome
// ============================================================================

// Error codes seen by guests
namespace error_code {
    extern const char* const NO_MATCHING_RULE;
    extern const char* const CONSTRAINT_VIOLATION;
    extern const char* const QUOTA_EXCEEDED;
    extern const char* const TOOL_ERROR;
    extern const char* const VFS_ERROR;
    extern const char* const SLEEP_ERROR;
    extern const char* const REFERENCE_ERROR;
    extern const char* const CANCELLED;
    extern const char* const GUEST_ERROR;
}

struct ErrorPayload {
    std::string code;
    std::string message;
    Json data;

    ErrorPayload() {}
    ErrorPayload(const std::string& c, const std::string& m, const Json& d = Json())
        : code(c), message(m), data(d) {}

    Json to_json() const;
    static ErrorPayload from_json(const Json& j);
};

struct Outcome {
    bool success;
    Json value;
    ErrorPayload error;

    Outcome() : success(false) {}

    static Outcome ok(const Json& value = Json()) {
        Outcome o;
        o.success = true;
        o.value = value;
        return o;
    }

    static Outcome fail(const ErrorPayload& error) {
        Outcome o;
        o.success = false;
        o.error = error;
        return o;
    }

    static Outcome fail(const std::string& code, const std::string& message, const Json& data = Json()) {
        return fail(ErrorPayload(code, message, data));
    }

    Json to_json() const;
    static Outcome from_json(const Json& j);
};

} // namespace warden

#endif // warden_RUNTIME_REQUEST_HPP
