#include <gtest/gtest.h>
#include <warden/session/session.hpp>

using namespace warden;

namespace {

std::vector<MethodCapability> limited_caps() {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("search", ConstraintSet(), 2));
    return caps;
}

Request make_request(RequestId id, TaskId task) {
    Request req;
    req.id = id;
    req.task_id = task;
    req.op = Operation::sleep(1);
    return req;
}

} // namespace

TEST(SessionTest, TrackAndResolve) {
    Session session("s1", limited_caps());
    session.track(make_request(1, 1));
    session.track(make_request(2, 2));
    EXPECT_EQ(2u, session.pending_count());
    EXPECT_TRUE(session.is_pending(2));

    Request req = session.resolve(2);
    EXPECT_EQ(2u, req.task_id);
    EXPECT_FALSE(session.is_pending(2));
    EXPECT_THROW(session.resolve(2), UnknownRequestId);
    EXPECT_THROW(session.resolve(50), UnknownRequestId);
}

TEST(SessionTest, OneOutstandingRequestPerTask) {
    Session session("s1", limited_caps());
    session.track(make_request(1, 1));
    EXPECT_THROW(session.track(make_request(2, 1)), ProtocolError);
    EXPECT_THROW(session.track(make_request(1, 3)), ProtocolError);

    session.resolve(1);
    EXPECT_NO_THROW(session.track(make_request(2, 1)));
}

TEST(SessionTest, DiscardPending) {
    Session session("s1", limited_caps());
    session.track(make_request(1, 1));
    session.track(make_request(2, 2));
    EXPECT_EQ(2u, session.discard_pending());
    EXPECT_EQ(0u, session.pending_count());
    EXPECT_TRUE(session.pending().empty());
}

TEST(SessionTest, TeardownClearsFilesButKeepsQuota) {
    Session session("s1", limited_caps());
    std::string error;
    ASSERT_TRUE(session.vfs().write("/workspace/a", "1", error));
    ASSERT_TRUE(session.capabilities().authorize("search", Json::object()).success);
    session.track(make_request(1, 1));

    session.teardown();
    EXPECT_EQ(0u, session.vfs().file_count());
    EXPECT_EQ(0u, session.pending_count());

    int64_t remaining = 0;
    ASSERT_TRUE(session.capabilities().remaining_calls("cap:method:search", remaining));
    EXPECT_EQ(1, remaining);
}

TEST(SessionTest, RequestIdsAreSessionWide) {
    Session session("s1", limited_caps());
    RequestId a = session.request_ids().next();
    RequestId b = session.request_ids().next();
    EXPECT_LT(a, b);
    EXPECT_EQ("s1", session.id());
    EXPECT_EQ(0, session.executions());
    session.count_execution();
    EXPECT_EQ(1, session.executions());
}
