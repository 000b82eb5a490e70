#include <gtest/gtest.h>
#include <warden/session/session.hpp>
#include <warden/store/session_store.hpp>

#include <cstdio>
#include <unistd.h>

using namespace warden;

namespace {

std::vector<MethodCapability> store_caps() {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("send_email", ConstraintSet(), 5));
    caps.push_back(MethodCapability("search"));
    return caps;
}

class SessionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "warden_store_" + std::to_string(getpid()) + ".db";
        std::remove(path_.c_str());
    }

    void TearDown() override {
        std::remove(path_.c_str());
        std::remove((path_ + "-wal").c_str());
        std::remove((path_ + "-shm").c_str());
    }

    std::string path_;
};

} // namespace

TEST_F(SessionStoreTest, SnapshotSurvivesReopen) {
    {
        Session session("alpha", store_caps());
        std::string error;
        ASSERT_TRUE(session.vfs().mkdir("/workspace/out", false, error));
        ASSERT_TRUE(session.vfs().write("/workspace/out/a.txt", std::string("bin\0ary", 7), error));
        ASSERT_TRUE(session.capabilities().authorize("send_email", Json::object()).success);
        ASSERT_TRUE(session.capabilities().authorize("send_email", Json::object()).success);

        SessionStore store;
        ASSERT_TRUE(store.open(path_)) << store.last_error();
        ASSERT_TRUE(store.save_session(session)) << store.last_error();
    }

    SessionStore store;
    ASSERT_TRUE(store.open(path_)) << store.last_error();
    EXPECT_TRUE(store.has_session("alpha"));

    Session restored("alpha", store_caps());
    ASSERT_TRUE(store.load_session("alpha", restored)) << store.last_error();

    std::string data;
    std::string error;
    ASSERT_TRUE(restored.vfs().read("/workspace/out/a.txt", data, error)) << error;
    EXPECT_EQ(std::string("bin\0ary", 7), data);

    int64_t remaining = 0;
    ASSERT_TRUE(restored.capabilities().remaining_calls("cap:method:send_email", remaining));
    EXPECT_EQ(3, remaining);
}

TEST_F(SessionStoreTest, UnknownSessionLoadsAsNoOp) {
    SessionStore store;
    ASSERT_TRUE(store.open(path_));
    EXPECT_FALSE(store.has_session("ghost"));

    Session session("ghost", store_caps());
    EXPECT_TRUE(store.load_session("ghost", session));
    EXPECT_EQ(0u, session.vfs().file_count());
}

TEST_F(SessionStoreTest, RestoreNeverLowersLiveCounters) {
    SessionStore store;
    ASSERT_TRUE(store.open(path_));

    Session saved("beta", store_caps());
    saved.capabilities().authorize("send_email", Json::object());
    ASSERT_TRUE(store.save_session(saved));

    Session live("beta", store_caps());
    for (int i = 0; i < 4; ++i) {
        live.capabilities().authorize("send_email", Json::object());
    }
    ASSERT_TRUE(store.load_session("beta", live));
    EXPECT_EQ(4, live.capabilities().usage()["cap:method:send_email"]);
}

TEST_F(SessionStoreTest, RestoreIsCappedByCurrentLimit) {
    SessionStore store;
    ASSERT_TRUE(store.open(path_));

    std::vector<MethodCapability> generous;
    generous.push_back(MethodCapability("send_email", ConstraintSet(), 100));
    Session saved("gamma", generous);
    for (int i = 0; i < 20; ++i) {
        saved.capabilities().authorize("send_email", Json::object());
    }
    ASSERT_TRUE(store.save_session(saved));

    Session strict("gamma", store_caps());
    ASSERT_TRUE(store.load_session("gamma", strict));
    EXPECT_EQ(5, strict.capabilities().usage()["cap:method:send_email"]);
    EXPECT_FALSE(strict.capabilities().can_call("send_email", Json::object()));
}

TEST_F(SessionStoreTest, SaveReplacesPreviousSnapshot) {
    SessionStore store;
    ASSERT_TRUE(store.open(path_));
    Session session("delta", store_caps());
    std::string error;
    ASSERT_TRUE(session.vfs().write("/tmp/old", "1", error));
    ASSERT_TRUE(store.save_session(session));

    session.teardown();
    ASSERT_TRUE(session.vfs().write("/tmp/new", "2", error));
    ASSERT_TRUE(store.save_session(session));

    Session restored("delta", store_caps());
    ASSERT_TRUE(store.load_session("delta", restored));
    EXPECT_FALSE(restored.vfs().exists("/tmp/old"));
    EXPECT_TRUE(restored.vfs().is_file("/tmp/new"));
}

TEST_F(SessionStoreTest, ListAndDelete) {
    SessionStore store;
    ASSERT_TRUE(store.open(path_));
    Session a("a", store_caps());
    Session b("b", store_caps());
    ASSERT_TRUE(store.save_session(a));
    ASSERT_TRUE(store.save_session(b));

    std::vector<std::string> ids = store.list_sessions();
    ASSERT_EQ(2u, ids.size());
    EXPECT_EQ("a", ids[0]);
    EXPECT_EQ("b", ids[1]);

    ASSERT_TRUE(store.delete_session("a"));
    EXPECT_FALSE(store.has_session("a"));
    EXPECT_TRUE(store.has_session("b"));
}

TEST(SessionStoreClosedTest, OperationsFailWhenClosed) {
    SessionStore store;
    Session session("x", store_caps());
    EXPECT_FALSE(store.is_open());
    EXPECT_FALSE(store.save_session(session));
    EXPECT_EQ("database is not open", store.last_error());
    EXPECT_FALSE(store.load_session("x", session));
}

TEST(SessionStoreClosedTest, InMemoryDatabase) {
    SessionStore store;
    ASSERT_TRUE(store.open(":memory:")) << store.last_error();
    Session session("mem", store_caps());
    EXPECT_TRUE(store.save_session(session));
    EXPECT_TRUE(store.has_session("mem"));
}
