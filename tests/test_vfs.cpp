#include <gtest/gtest.h>
#include <warden/core/config.hpp>
#include <warden/session/vfs.hpp>

using namespace warden;

namespace {

bool starts_with_code(const std::string& error, const std::string& code) {
    return error.compare(0, code.size() + 1, code + ":") == 0;
}

} // namespace

TEST(VirtualFsTest, RootsExistOnConstruction) {
    VirtualFs fs;
    EXPECT_TRUE(fs.is_dir("/"));
    EXPECT_TRUE(fs.is_dir("/workspace"));
    EXPECT_TRUE(fs.is_dir("/tmp"));
    EXPECT_FALSE(fs.exists("/etc"));
}

TEST(VirtualFsTest, WriteThenReadNormalizesPaths) {
    VirtualFs fs;
    std::string error;
    ASSERT_TRUE(fs.write("/workspace/./notes.txt", "hello", error)) << error;

    std::string data;
    ASSERT_TRUE(fs.read("/workspace/sub/../notes.txt", data, error)) << error;
    EXPECT_EQ("hello", data);
    EXPECT_TRUE(fs.is_file("/workspace/notes.txt"));
    EXPECT_EQ(1u, fs.file_count());
    EXPECT_EQ(5u, fs.total_bytes());
}

TEST(VirtualFsTest, WritesOutsideRootsAreDenied) {
    VirtualFs fs;
    std::string error;
    EXPECT_FALSE(fs.write("/etc/passwd", "x", error));
    EXPECT_TRUE(starts_with_code(error, "EACCES")) << error;

    EXPECT_FALSE(fs.write("/workspace/../etc/passwd", "x", error));
    EXPECT_TRUE(starts_with_code(error, "EACCES")) << error;

    EXPECT_FALSE(fs.write("/workspacex/a", "x", error));
    EXPECT_TRUE(starts_with_code(error, "EACCES")) << error;
}

TEST(VirtualFsTest, RelativePathsAreInvalid) {
    VirtualFs fs;
    std::string error;
    std::string data;
    EXPECT_FALSE(fs.read("workspace/a", data, error));
    EXPECT_TRUE(starts_with_code(error, "EINVAL")) << error;
}

TEST(VirtualFsTest, ReadErrors) {
    VirtualFs fs;
    std::string error;
    std::string data;
    EXPECT_FALSE(fs.read("/workspace/missing", data, error));
    EXPECT_EQ("ENOENT: no such file or directory: /workspace/missing", error);
    EXPECT_FALSE(fs.read("/workspace", data, error));
    EXPECT_TRUE(starts_with_code(error, "EISDIR")) << error;
}

TEST(VirtualFsTest, WriteRequiresParentDirectory) {
    VirtualFs fs;
    std::string error;
    EXPECT_FALSE(fs.write("/workspace/a/b.txt", "x", error));
    EXPECT_TRUE(starts_with_code(error, "ENOENT")) << error;

    ASSERT_TRUE(fs.write("/workspace/a", "file", error));
    EXPECT_FALSE(fs.write("/workspace/a/b.txt", "x", error));
    EXPECT_TRUE(starts_with_code(error, "ENOTDIR")) << error;

    EXPECT_FALSE(fs.write("/workspace", "x", error));
    EXPECT_TRUE(starts_with_code(error, "EISDIR")) << error;
}

TEST(VirtualFsTest, FileSizeLimit) {
    VfsPolicy policy;
    policy.max_file_bytes = 4;
    VirtualFs fs(policy);
    std::string error;
    EXPECT_TRUE(fs.write("/tmp/ok", "1234", error));
    EXPECT_FALSE(fs.write("/tmp/big", "12345", error));
    EXPECT_TRUE(starts_with_code(error, "EFBIG")) << error;
}

TEST(VirtualFsTest, MkdirAndList) {
    VirtualFs fs;
    std::string error;
    EXPECT_FALSE(fs.mkdir("/workspace/a/b", false, error));
    EXPECT_TRUE(starts_with_code(error, "ENOENT")) << error;

    ASSERT_TRUE(fs.mkdir("/workspace/a/b", true, error)) << error;
    EXPECT_TRUE(fs.is_dir("/workspace/a"));
    EXPECT_TRUE(fs.mkdir("/workspace/a/b", true, error));
    EXPECT_FALSE(fs.mkdir("/workspace/a/b", false, error));
    EXPECT_TRUE(starts_with_code(error, "EEXIST")) << error;
    EXPECT_FALSE(fs.mkdir("/opt/x", true, error));
    EXPECT_TRUE(starts_with_code(error, "EACCES")) << error;

    ASSERT_TRUE(fs.write("/workspace/z.txt", "zz", error));
    ASSERT_TRUE(fs.write("/workspace/a/inner.txt", "i", error));

    std::vector<VfsEntry> entries;
    ASSERT_TRUE(fs.list("/workspace", entries, error)) << error;
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("a", entries[0].name);
    EXPECT_EQ("dir", entries[0].type);
    EXPECT_EQ("z.txt", entries[1].name);
    EXPECT_EQ("file", entries[1].type);
    EXPECT_EQ(2u, entries[1].size);

    ASSERT_TRUE(fs.list("/", entries, error));
    ASSERT_EQ(2u, entries.size());
    EXPECT_EQ("tmp", entries[0].name);
    EXPECT_EQ("workspace", entries[1].name);

    EXPECT_FALSE(fs.list("/workspace/z.txt", entries, error));
    EXPECT_TRUE(starts_with_code(error, "ENOTDIR")) << error;
}

TEST(VirtualFsTest, Stat) {
    VirtualFs fs;
    std::string error;
    ASSERT_TRUE(fs.write("/tmp/f", "abc", error));

    VfsStat st;
    ASSERT_TRUE(fs.stat("/tmp/f", st, error));
    EXPECT_EQ("file", st.type);
    EXPECT_EQ(3u, st.size);
    ASSERT_TRUE(fs.stat("/tmp", st, error));
    EXPECT_EQ("dir", st.type);
    EXPECT_FALSE(fs.stat("/tmp/none", st, error));
}

TEST(VirtualFsTest, Remove) {
    VirtualFs fs;
    std::string error;
    ASSERT_TRUE(fs.mkdir("/workspace/d", false, error));
    ASSERT_TRUE(fs.write("/workspace/d/f", "x", error));

    EXPECT_FALSE(fs.remove("/workspace/d", error));
    EXPECT_TRUE(starts_with_code(error, "ENOTEMPTY")) << error;
    EXPECT_TRUE(fs.remove("/workspace/d/f", error));
    EXPECT_TRUE(fs.remove("/workspace/d", error));
    EXPECT_FALSE(fs.exists("/workspace/d"));

    EXPECT_FALSE(fs.remove("/workspace/d", error));
    EXPECT_TRUE(starts_with_code(error, "ENOENT")) << error;
    EXPECT_FALSE(fs.remove("/workspace", error));
    EXPECT_TRUE(starts_with_code(error, "EBUSY")) << error;
    EXPECT_FALSE(fs.remove("/", error));
    EXPECT_TRUE(starts_with_code(error, "EBUSY")) << error;
}

TEST(VirtualFsTest, ClearKeepsRoots) {
    VirtualFs fs;
    std::string error;
    ASSERT_TRUE(fs.mkdir("/workspace/x/y", true, error));
    ASSERT_TRUE(fs.write("/workspace/x/y/f", "1", error));
    fs.clear();
    EXPECT_EQ(0u, fs.file_count());
    EXPECT_FALSE(fs.exists("/workspace/x"));
    EXPECT_TRUE(fs.is_dir("/workspace"));
}

TEST(VirtualFsTest, RestoreCreatesParents) {
    VirtualFs fs;
    std::string error;
    ASSERT_TRUE(fs.restore_file("/workspace/deep/er/file", "data", error)) << error;
    EXPECT_TRUE(fs.is_dir("/workspace/deep/er"));
    EXPECT_FALSE(fs.restore_file("/etc/file", "data", error));
}

TEST(VirtualFsTest, CustomRootsFromConfig) {
    Config cfg(Json{{"vfs", {{"writable_roots", Json::array({"/data/out", "relative", "/"})},
                             {"max_file_bytes", 16}}}});
    VfsPolicy policy = VfsPolicy::from_config(cfg);
    EXPECT_EQ(3u, policy.writable_roots.size());
    EXPECT_EQ(16u, policy.max_file_bytes);

    VirtualFs fs(policy);
    std::string error;
    EXPECT_TRUE(fs.is_dir("/data"));
    EXPECT_TRUE(fs.write("/data/out/a", "x", error)) << error;
    EXPECT_FALSE(fs.write("/data/a", "x", error));
    EXPECT_FALSE(fs.write("/workspace/a", "x", error));
}
