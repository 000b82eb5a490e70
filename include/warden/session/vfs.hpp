/*
 * warden C++17 - Virtual Filesystem
 *
 * In-memory tree owned by a Session. Paths are absolute and normalized
 * ("/workspace/a/../b" -> "/workspace/b"). Everything is readable; writes,
 * mkdir and remove are only allowed beneath the policy's writable roots.
 * Errors are reported as "<ERRNO>: <message>: <path>".
 */
#ifndef warden_SESSION_VFS_HPP
#define warden_SESSION_VFS_HPP

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace warden {

class Config;

struct VfsPolicy {
    std::vector<std::string> writable_roots;
    size_t max_file_bytes;   // 0 = unlimited

    VfsPolicy();

    static VfsPolicy from_config(const Config& cfg);
};

struct VfsStat {
    std::string type;   // "file" or "dir"
    size_t size;

    VfsStat() : size(0) {}
};

struct VfsEntry {
    std::string name;
    std::string type;
    size_t size;

    VfsEntry() : size(0) {}
};

class VirtualFs {
public:
    explicit VirtualFs(const VfsPolicy& policy = VfsPolicy());

    bool read(const std::string& path, std::string& out, std::string& error) const;

    // Create or replace a file. The parent directory must exist.
    bool write(const std::string& path, const std::string& data, std::string& error);

    // Children sorted by name
    bool list(const std::string& path, std::vector<VfsEntry>& out, std::string& error) const;

    bool stat(const std::string& path, VfsStat& out, std::string& error) const;
    bool mkdir(const std::string& path, bool recursive, std::string& error);

    // Files and empty directories. Writable roots cannot be removed.
    bool remove(const std::string& path, std::string& error);

    bool exists(const std::string& path) const;
    bool is_file(const std::string& path) const;
    bool is_dir(const std::string& path) const;

    // Drop everything except "/" and the writable roots
    void clear();

    // Snapshot / restore for the session store. Parent directories of a
    // restored file are created as needed.
    const std::map<std::string, std::string>& files() const { return files_; }
    bool restore_file(const std::string& path, const std::string& data, std::string& error);

    size_t file_count() const { return files_.size(); }
    size_t total_bytes() const;

    const VfsPolicy& policy() const { return policy_; }

private:
    // Absolute, normalized form of `path`; false if it is not absolute
    bool canonical(const std::string& path, std::string& out, std::string& error) const;
    bool is_writable(const std::string& path) const;
    bool is_root(const std::string& path) const;
    void seed_roots();

    VfsPolicy policy_;
    std::vector<std::string> roots_;
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_;
};

} // namespace warden

#endif // warden_SESSION_VFS_HPP
