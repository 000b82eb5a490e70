/*
 * Warden C++ - Virtual Filesystem Implementation
 */
#include <warden/session/vfs.hpp>
#include <warden/core/config.hpp>
#include <warden/core/logger.hpp>
#include <warden/core/utils.hpp>

namespace warden {

namespace {

std::string vfs_error(const char* code, const char* message, const std::string& path) {
    return std::string(code) + ": " + message + ": " + path;
}

} // anonymous namespace

// ============================================================================
// VfsPolicy
// ============================================================================

VfsPolicy::VfsPolicy()
    : max_file_bytes(0)
{
    writable_roots.push_back("/workspace");
    writable_roots.push_back("/tmp");
}

VfsPolicy VfsPolicy::from_config(const Config& cfg) {
    VfsPolicy policy;
    policy.writable_roots = cfg.get_string_list("vfs.writable_roots", policy.writable_roots);
    int64_t max_bytes = cfg.get_int("vfs.max_file_bytes", 0);
    policy.max_file_bytes = max_bytes > 0 ? static_cast<size_t>(max_bytes) : 0;
    return policy;
}

// ============================================================================
// VirtualFs
// ============================================================================

VirtualFs::VirtualFs(const VfsPolicy& policy)
    : policy_(policy)
{
    for (size_t i = 0; i < policy_.writable_roots.size(); ++i) {
        const std::string& root = policy_.writable_roots[i];
        if (root.empty() || root[0] != '/') {
            LOG_WARN("[VirtualFs] Ignoring non-absolute writable root '%s'", root.c_str());
            continue;
        }
        std::string normalized = normalize_path(root);
        if (normalized == "/") {
            LOG_WARN("[VirtualFs] Refusing '/' as a writable root");
            continue;
        }
        roots_.push_back(normalized);
    }
    seed_roots();
}

void VirtualFs::seed_roots() {
    dirs_.insert("/");
    for (size_t i = 0; i < roots_.size(); ++i) {
        std::string dir = roots_[i];
        while (dir != "/") {
            dirs_.insert(dir);
            dir = parent_path(dir);
        }
    }
}

bool VirtualFs::canonical(const std::string& path, std::string& out, std::string& error) const {
    if (path.empty() || path[0] != '/') {
        error = vfs_error("EINVAL", "path must be absolute", path);
        return false;
    }
    out = normalize_path(path);
    return true;
}

bool VirtualFs::is_writable(const std::string& path) const {
    for (size_t i = 0; i < roots_.size(); ++i) {
        if (path_is_under(path, roots_[i])) return true;
    }
    return false;
}

bool VirtualFs::is_root(const std::string& path) const {
    if (path == "/") return true;
    for (size_t i = 0; i < roots_.size(); ++i) {
        if (roots_[i] == path) return true;
    }
    return false;
}

bool VirtualFs::exists(const std::string& path) const {
    return is_file(path) || is_dir(path);
}

bool VirtualFs::is_file(const std::string& path) const {
    if (path.empty() || path[0] != '/') return false;
    return files_.count(normalize_path(path)) > 0;
}

bool VirtualFs::is_dir(const std::string& path) const {
    if (path.empty() || path[0] != '/') return false;
    return dirs_.count(normalize_path(path)) > 0;
}

bool VirtualFs::read(const std::string& path, std::string& out, std::string& error) const {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (dirs_.count(p)) {
        error = vfs_error("EISDIR", "illegal operation on a directory", p);
        return false;
    }
    std::map<std::string, std::string>::const_iterator it = files_.find(p);
    if (it == files_.end()) {
        error = vfs_error("ENOENT", "no such file or directory", p);
        return false;
    }
    out = it->second;
    return true;
}

bool VirtualFs::write(const std::string& path, const std::string& data, std::string& error) {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (!is_writable(p)) {
        error = vfs_error("EACCES", "permission denied", p);
        return false;
    }
    if (dirs_.count(p)) {
        error = vfs_error("EISDIR", "illegal operation on a directory", p);
        return false;
    }
    if (policy_.max_file_bytes > 0 && data.size() > policy_.max_file_bytes) {
        error = vfs_error("EFBIG", "file too large", p);
        return false;
    }

    std::string parent = parent_path(p);
    if (files_.count(parent)) {
        error = vfs_error("ENOTDIR", "not a directory", parent);
        return false;
    }
    if (!dirs_.count(parent)) {
        error = vfs_error("ENOENT", "no such file or directory", parent);
        return false;
    }

    files_[p] = data;
    return true;
}

bool VirtualFs::list(const std::string& path, std::vector<VfsEntry>& out, std::string& error) const {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (files_.count(p)) {
        error = vfs_error("ENOTDIR", "not a directory", p);
        return false;
    }
    if (!dirs_.count(p)) {
        error = vfs_error("ENOENT", "no such file or directory", p);
        return false;
    }

    std::string prefix = (p == "/") ? p : p + "/";
    std::map<std::string, VfsEntry> children;

    for (std::set<std::string>::const_iterator it = dirs_.lower_bound(prefix);
         it != dirs_.end() && starts_with(*it, prefix); ++it) {
        if (*it == p || parent_path(*it) != p) continue;
        VfsEntry entry;
        entry.name = it->substr(prefix.size());
        entry.type = "dir";
        children[entry.name] = entry;
    }
    for (std::map<std::string, std::string>::const_iterator it = files_.lower_bound(prefix);
         it != files_.end() && starts_with(it->first, prefix); ++it) {
        if (parent_path(it->first) != p) continue;
        VfsEntry entry;
        entry.name = it->first.substr(prefix.size());
        entry.type = "file";
        entry.size = it->second.size();
        children[entry.name] = entry;
    }

    out.clear();
    for (std::map<std::string, VfsEntry>::const_iterator it = children.begin(); it != children.end(); ++it) {
        out.push_back(it->second);
    }
    return true;
}

bool VirtualFs::stat(const std::string& path, VfsStat& out, std::string& error) const {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (dirs_.count(p)) {
        out.type = "dir";
        out.size = 0;
        return true;
    }
    std::map<std::string, std::string>::const_iterator it = files_.find(p);
    if (it == files_.end()) {
        error = vfs_error("ENOENT", "no such file or directory", p);
        return false;
    }
    out.type = "file";
    out.size = it->second.size();
    return true;
}

bool VirtualFs::mkdir(const std::string& path, bool recursive, std::string& error) {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (dirs_.count(p)) {
        if (recursive) return true;
        error = vfs_error("EEXIST", "file already exists", p);
        return false;
    }
    if (files_.count(p)) {
        error = vfs_error("EEXIST", "file already exists", p);
        return false;
    }
    if (!is_writable(p)) {
        error = vfs_error("EACCES", "permission denied", p);
        return false;
    }

    if (!recursive) {
        std::string parent = parent_path(p);
        if (files_.count(parent)) {
            error = vfs_error("ENOTDIR", "not a directory", parent);
            return false;
        }
        if (!dirs_.count(parent)) {
            error = vfs_error("ENOENT", "no such file or directory", parent);
            return false;
        }
        dirs_.insert(p);
        return true;
    }

    // Collect missing ancestors, checking none of them is a file
    std::vector<std::string> missing;
    std::string dir = p;
    while (!dirs_.count(dir)) {
        if (files_.count(dir)) {
            error = vfs_error("ENOTDIR", "not a directory", dir);
            return false;
        }
        missing.push_back(dir);
        dir = parent_path(dir);
    }
    for (size_t i = 0; i < missing.size(); ++i) {
        dirs_.insert(missing[i]);
    }
    return true;
}

bool VirtualFs::remove(const std::string& path, std::string& error) {
    std::string p;
    if (!canonical(path, p, error)) return false;

    if (is_root(p)) {
        error = vfs_error("EBUSY", "resource busy or locked", p);
        return false;
    }
    if (!is_writable(p)) {
        error = vfs_error("EACCES", "permission denied", p);
        return false;
    }

    if (files_.erase(p) > 0) {
        return true;
    }
    if (!dirs_.count(p)) {
        error = vfs_error("ENOENT", "no such file or directory", p);
        return false;
    }

    std::string prefix = p + "/";
    std::set<std::string>::const_iterator d = dirs_.lower_bound(prefix);
    std::map<std::string, std::string>::const_iterator f = files_.lower_bound(prefix);
    if ((d != dirs_.end() && starts_with(*d, prefix)) ||
        (f != files_.end() && starts_with(f->first, prefix))) {
        error = vfs_error("ENOTEMPTY", "directory not empty", p);
        return false;
    }

    dirs_.erase(p);
    return true;
}

void VirtualFs::clear() {
    files_.clear();
    dirs_.clear();
    seed_roots();
}

bool VirtualFs::restore_file(const std::string& path, const std::string& data, std::string& error) {
    std::string p;
    if (!canonical(path, p, error)) return false;
    if (!mkdir(parent_path(p), true, error)) return false;
    return write(p, data, error);
}

size_t VirtualFs::total_bytes() const {
    size_t total = 0;
    for (std::map<std::string, std::string>::const_iterator it = files_.begin(); it != files_.end(); ++it) {
        total += it->second.size();
    }
    return total;
}

} // namespace warden
