/*
 * warden C++17 - Session State
 *
 * Host-side state that outlives a single execution: the VFS, the
 * capability table with its quota counters, request id allocation, and
 * the map of requests currently handed out to the host (one per task).
 */
#ifndef warden_SESSION_SESSION_HPP
#define warden_SESSION_SESSION_HPP

#include <warden/capability/capability_table.hpp>
#include <warden/runtime/request.hpp>
#include <warden/session/vfs.hpp>
#include <map>
#include <string>
#include <vector>

namespace warden {

class Session {
public:
    Session(const std::string& id, const std::vector<MethodCapability>& capabilities,
            const VfsPolicy& policy = VfsPolicy());

    const std::string& id() const { return id_; }

    VirtualFs& vfs() { return vfs_; }
    const VirtualFs& vfs() const { return vfs_; }

    CapabilityTable& capabilities() { return capabilities_; }
    const CapabilityTable& capabilities() const { return capabilities_; }

    RequestIdAllocator& request_ids() { return request_ids_; }

    // Record a request handed to the host. Throws ProtocolError if its task
    // already has one outstanding or the id is already pending.
    void track(const Request& request);

    // Remove and return the pending request with this id.
    // Throws UnknownRequestId if there is none.
    Request resolve(RequestId id);

    bool is_pending(RequestId id) const;
    std::vector<Request> pending() const;
    size_t pending_count() const { return pending_.size(); }

    // Forget all pending requests (cancellation, abandoned tasks)
    size_t discard_pending();

    // Clear VFS and pending state. Quota counters are kept.
    void teardown();

    int64_t executions() const { return executions_; }
    void count_execution() { ++executions_; }

private:
    Session(const Session&);
    Session& operator=(const Session&);

    std::string id_;
    VirtualFs vfs_;
    CapabilityTable capabilities_;
    RequestIdAllocator request_ids_;
    std::map<TaskId, Request> pending_;
    int64_t executions_;
};

} // namespace warden

#endif // warden_SESSION_SESSION_HPP
