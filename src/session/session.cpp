/*
 * Warden C++ - Session Implementation
 */
#include <warden/session/session.hpp>
#include <warden/core/logger.hpp>

namespace warden {

Session::Session(const std::string& id, const std::vector<MethodCapability>& capabilities,
                 const VfsPolicy& policy)
    : id_(id)
    , vfs_(policy)
    , capabilities_(capabilities)
    , executions_(0)
{
    LOG_DEBUG("[Session] %s created", id_.c_str());
}

void Session::track(const Request& request) {
    std::map<TaskId, Request>::const_iterator it = pending_.find(request.task_id);
    if (it != pending_.end()) {
        LOG_ERROR("[Session] Task %llu issued request %llu while %llu is outstanding",
                  static_cast<unsigned long long>(request.task_id),
                  static_cast<unsigned long long>(request.id),
                  static_cast<unsigned long long>(it->second.id));
        throw ProtocolError("task " + std::to_string(request.task_id) +
                            " already has outstanding request " + std::to_string(it->second.id));
    }
    if (is_pending(request.id)) {
        throw ProtocolError("request id " + std::to_string(request.id) + " is already pending");
    }
    pending_[request.task_id] = request;
}

Request Session::resolve(RequestId id) {
    for (std::map<TaskId, Request>::iterator it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.id == id) {
            Request req = it->second;
            pending_.erase(it);
            return req;
        }
    }
    throw UnknownRequestId(id);
}

bool Session::is_pending(RequestId id) const {
    for (std::map<TaskId, Request>::const_iterator it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second.id == id) return true;
    }
    return false;
}

std::vector<Request> Session::pending() const {
    std::vector<Request> out;
    for (std::map<TaskId, Request>::const_iterator it = pending_.begin(); it != pending_.end(); ++it) {
        out.push_back(it->second);
    }
    return out;
}

size_t Session::discard_pending() {
    size_t count = pending_.size();
    if (count > 0) {
        LOG_DEBUG("[Session] %s discarding %zu pending requests", id_.c_str(), count);
    }
    pending_.clear();
    return count;
}

void Session::teardown() {
    size_t files = vfs_.file_count();
    discard_pending();
    vfs_.clear();
    LOG_INFO("[Session] %s torn down (%zu files dropped)", id_.c_str(), files);
}

} // namespace warden
