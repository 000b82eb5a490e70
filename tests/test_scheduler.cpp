#include <gtest/gtest.h>
#include <warden/runtime/scheduler.hpp>

#include <stdexcept>
#include <vector>

using namespace warden;

namespace {

ToolBindings test_bindings() {
    ToolBindings b;
    b["search"] = "search";
    b["stripe_charges_create"] = "stripe/charges/create";
    return b;
}

std::unique_ptr<GuestTask> task(FunctionTask::StartFn start,
                                FunctionTask::ResumeFn resume = FunctionTask::ResumeFn()) {
    return std::unique_ptr<GuestTask>(new FunctionTask(start, resume));
}

// Spawns one child per operation, joins them and returns the joined values.
std::unique_ptr<GuestTask> fan_out(const std::vector<Operation>& ops) {
    return task([ops](TaskContext& ctx) {
        std::vector<TaskId> children;
        for (size_t i = 0; i < ops.size(); ++i) {
            children.push_back(ctx.spawn(make_operation_task(ops[i])));
        }
        return TaskStep::join(children);
    });
}

std::vector<Request> drain(Scheduler& s) {
    std::vector<Request> out;
    Request req;
    while (s.step(req)) {
        out.push_back(req);
    }
    return out;
}

} // namespace

TEST(SchedulerTest, SingleToolCallRoundTrip) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_operation_task(Operation::tool_call("stripe_charges_create", Json{{"amount", 5}})),
            test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(1u, reqs.size());
    EXPECT_EQ(RequestKind::TOOL_CALL, reqs[0].kind());
    EXPECT_EQ("stripe/charges/create", reqs[0].op.method);
    EXPECT_EQ(1u, reqs[0].task_id);
    EXPECT_TRUE(s.has_work());

    s.resume(reqs[0].id, Outcome::ok(Json{{"id", "ch_1"}}));
    EXPECT_TRUE(drain(s).empty());
    EXPECT_FALSE(s.has_work());

    GuestResult result = s.finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ("ch_1", result.value["id"].get<std::string>());
}

TEST(SchedulerTest, HostSpellingAlsoResolves) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_operation_task(Operation::tool_call("stripe/charges/create")), test_bindings(), ids);
    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(1u, reqs.size());
    EXPECT_EQ("stripe/charges/create", reqs[0].op.method);
}

TEST(SchedulerTest, UnknownToolIsAGuestReferenceError) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_operation_task(Operation::tool_call("launch_missiles")), test_bindings(), ids);

    EXPECT_TRUE(drain(s).empty());
    EXPECT_EQ(1u, ids.peek());

    GuestResult result = s.finish();
    ASSERT_FALSE(result.success);
    EXPECT_EQ("reference_error", result.error.code);
    EXPECT_EQ("launch_missiles is not defined", result.error.message);
}

TEST(SchedulerTest, ResumeUnblocksOnlyTheOwningTask) {
    Scheduler s;
    RequestIdAllocator ids;
    std::vector<Operation> ops;
    ops.push_back(Operation::tool_call("search", Json{{"q", "a"}}));
    ops.push_back(Operation::tool_call("search", Json{{"q", "b"}}));
    s.begin(fan_out(ops), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(2u, reqs.size());
    EXPECT_EQ(2u, reqs[0].task_id);
    EXPECT_EQ(3u, reqs[1].task_id);

    s.resume(reqs[1].id, Outcome::ok("b"));
    EXPECT_TRUE(drain(s).empty());

    TaskState state;
    ASSERT_TRUE(s.task_state(3, state));
    EXPECT_EQ(TaskState::COMPLETED, state);
    ASSERT_TRUE(s.task_state(2, state));
    EXPECT_EQ(TaskState::SUSPENDED, state);
    ASSERT_TRUE(s.task_state(1, state));
    EXPECT_EQ(TaskState::WAITING, state);
    EXPECT_EQ(1u, s.outstanding_count());
    EXPECT_TRUE(s.has_work());
}

TEST(SchedulerTest, SecondResumeOfSameIdThrows) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_operation_task(Operation::sleep(10)), test_bindings(), ids);
    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(1u, reqs.size());

    s.resume(reqs[0].id, Outcome::ok());
    EXPECT_THROW(s.resume(reqs[0].id, Outcome::ok()), UnknownRequestId);
    EXPECT_THROW(s.resume(999, Outcome::ok()), UnknownRequestId);
}

TEST(SchedulerTest, JoinReturnsValuesInJoinOrderRegardlessOfCompletionOrder) {
    Scheduler s;
    RequestIdAllocator ids;
    std::vector<Operation> ops;
    ops.push_back(Operation::tool_call("search", Json{{"q", "first"}}));
    ops.push_back(Operation::tool_call("search", Json{{"q", "second"}}));
    s.begin(fan_out(ops), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(2u, reqs.size());
    s.resume(reqs[1].id, Outcome::ok("second"));
    s.resume(reqs[0].id, Outcome::ok("first"));
    EXPECT_TRUE(drain(s).empty());

    GuestResult result = s.finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(Json::array({"first", "second"}), result.value);
}

TEST(SchedulerTest, JoinReportsFirstFailedChildInJoinOrder) {
    Scheduler s;
    RequestIdAllocator ids;
    std::vector<Operation> ops;
    ops.push_back(Operation::tool_call("search"));
    ops.push_back(Operation::tool_call("search"));
    ops.push_back(Operation::tool_call("search"));
    s.begin(fan_out(ops), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(3u, reqs.size());
    s.resume(reqs[2].id, Outcome::fail(error_code::TOOL_ERROR, "third broke"));
    s.resume(reqs[1].id, Outcome::fail(error_code::TOOL_ERROR, "second broke"));
    s.resume(reqs[0].id, Outcome::ok(1));
    drain(s);

    GuestResult result = s.finish();
    ASSERT_FALSE(result.success);
    EXPECT_EQ("second broke", result.error.message);
}

TEST(SchedulerTest, RunnableTasksAreServedFifo) {
    Scheduler s;
    RequestIdAllocator ids;
    std::vector<TaskId> order;

    s.begin(task([&order](TaskContext& ctx) {
        std::vector<TaskId> children;
        for (int i = 0; i < 3; ++i) {
            children.push_back(ctx.spawn(task(
                [](TaskContext&) { return TaskStep::await(Operation::sleep(1)); },
                [&order](TaskContext& c, const Outcome&) {
                    order.push_back(c.current_task());
                    return TaskStep::done();
                })));
        }
        return TaskStep::join(children);
    }), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(3u, reqs.size());
    s.resume(reqs[2].id, Outcome::ok());
    s.resume(reqs[0].id, Outcome::ok());
    s.resume(reqs[1].id, Outcome::ok());
    drain(s);

    ASSERT_EQ(3u, order.size());
    EXPECT_EQ(reqs[2].task_id, order[0]);
    EXPECT_EQ(reqs[0].task_id, order[1]);
    EXPECT_EQ(reqs[1].task_id, order[2]);
    EXPECT_TRUE(s.finish().success);
}

TEST(SchedulerTest, RootCompletionAbandonsOtherTasks) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(task([](TaskContext& ctx) {
        ctx.spawn(make_operation_task(Operation::sleep(1000)));
        return TaskStep::done("early");
    }), test_bindings(), ids);

    EXPECT_TRUE(drain(s).empty());
    EXPECT_TRUE(s.root_finished());
    EXPECT_FALSE(s.has_work());
    EXPECT_EQ(0u, s.outstanding_count());

    GuestResult result = s.finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ("early", result.value.get<std::string>());
}

TEST(SchedulerTest, RootCompletionDropsOutstandingRequests) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(task([](TaskContext& ctx) {
        ctx.spawn(make_operation_task(Operation::sleep(1000)));
        return TaskStep::await(Operation::sleep(1));
    }, [](TaskContext&, const Outcome&) {
        return TaskStep::done(true);
    }), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(2u, reqs.size());
    EXPECT_EQ(1u, reqs[0].task_id);

    s.resume(reqs[0].id, Outcome::ok());
    EXPECT_TRUE(drain(s).empty());
    EXPECT_FALSE(s.has_work());
    EXPECT_THROW(s.resume(reqs[1].id, Outcome::ok()), UnknownRequestId);
}

TEST(SchedulerTest, CancelDropsEverything) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_operation_task(Operation::sleep(50)), test_bindings(), ids);
    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(1u, reqs.size());

    s.cancel("step limit reached");
    EXPECT_FALSE(s.has_work());
    EXPECT_THROW(s.resume(reqs[0].id, Outcome::ok()), UnknownRequestId);

    GuestResult result = s.finish();
    ASSERT_FALSE(result.success);
    EXPECT_EQ("cancelled", result.error.code);
    EXPECT_EQ("step limit reached", result.error.message);
}

TEST(SchedulerTest, TaskExceptionsBecomeGuestErrors) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(task([](TaskContext&) -> TaskStep {
        throw std::runtime_error("boom");
    }), test_bindings(), ids);

    drain(s);
    GuestResult result = s.finish();
    ASSERT_FALSE(result.success);
    EXPECT_EQ("guest_error", result.error.code);
    EXPECT_EQ("boom", result.error.message);
}

TEST(SchedulerTest, JoiningAForeignTaskFails) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(task([](TaskContext&) {
        return TaskStep::join(std::vector<TaskId>(1, 77));
    }), test_bindings(), ids);

    drain(s);
    GuestResult result = s.finish();
    ASSERT_FALSE(result.success);
    EXPECT_EQ("guest_error", result.error.code);
}

TEST(SchedulerTest, ConsoleOutputIsCaptured) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(task([](TaskContext& ctx) {
        ctx.console_log("hello");
        ctx.console_error("careful");
        return TaskStep::done();
    }), test_bindings(), ids);

    drain(s);
    GuestResult result = s.finish();
    EXPECT_TRUE(result.success);
    EXPECT_EQ("hello\n", result.stdout_text);
    EXPECT_EQ("careful\n", result.stderr_text);
}

TEST(SchedulerTest, RequestIdsComeFromTheSharedAllocator) {
    Scheduler s;
    RequestIdAllocator ids;

    s.begin(make_operation_task(Operation::sleep(1)), test_bindings(), ids);
    std::vector<Request> first = drain(s);
    s.resume(first[0].id, Outcome::ok());
    drain(s);
    s.finish();

    s.begin(make_operation_task(Operation::sleep(1)), test_bindings(), ids);
    std::vector<Request> second = drain(s);
    ASSERT_EQ(1u, second.size());
    EXPECT_GT(second[0].id, first[0].id);
    EXPECT_EQ(1u, second[0].task_id);
}

TEST(SchedulerTest, FinishWithoutRootReportsError) {
    Scheduler s;
    RequestIdAllocator ids;
    s.begin(std::unique_ptr<GuestTask>(), test_bindings(), ids);
    EXPECT_FALSE(s.has_work());
    GuestResult result = s.finish();
    EXPECT_FALSE(result.success);
    EXPECT_EQ("guest_error", result.error.code);
}

TEST(PlanTest, ParsesStepsAndParallelBranches) {
    Json j = {
        {"continue_on_error", true},
        {"steps", Json::array({
            Json{{"tool", "search"}, {"args", {{"q", "x"}}}},
            Json{{"log", "hi"}},
            Json{{"parallel", Json::array({Json{{"sleep", 5}}, Json{{"read", "/workspace/a"}}})}},
            Json{{"mkdir", "/workspace/d"}, {"recursive", true}}
        })}
    };
    Plan plan;
    std::string error;
    ASSERT_TRUE(Plan::from_json(j, plan, error)) << error;
    EXPECT_TRUE(plan.continue_on_error);
    ASSERT_EQ(4u, plan.steps.size());
    EXPECT_EQ(PlanStep::LOG, plan.steps[1].kind);
    ASSERT_EQ(PlanStep::PARALLEL, plan.steps[2].kind);
    EXPECT_EQ(2u, plan.steps[2].branches.size());
    EXPECT_TRUE(plan.steps[3].op.recursive);

    EXPECT_FALSE(Plan::from_json(Json::array({Json{{"fly", 1}}}), plan, error));
    EXPECT_NE(std::string::npos, error.find("steps[0]"));
}

TEST(PlanTest, MistypedFieldsAreRejectedNotThrown) {
    Plan plan;
    std::string error;

    Json huge_sleep = Json::array({Json{{"sleep", 1e300}}});
    ASSERT_NO_THROW(EXPECT_FALSE(Plan::from_json(huge_sleep, plan, error)));
    EXPECT_NE(std::string::npos, error.find("sleep"));

    Json odd_mkdir = Json::array({Json{{"mkdir", "/workspace/d"}, {"recursive", "yes"}}});
    ASSERT_NO_THROW(EXPECT_FALSE(Plan::from_json(odd_mkdir, plan, error)));
    EXPECT_NE(std::string::npos, error.find("recursive"));

    Json odd_flag = {{"continue_on_error", 1}, {"steps", Json::array()}};
    ASSERT_NO_THROW(EXPECT_FALSE(Plan::from_json(odd_flag, plan, error)));
    EXPECT_NE(std::string::npos, error.find("continue_on_error"));

    Json odd_stream = Json::array({Json{{"log", "x"}, {"stream", 2}}});
    ASSERT_NO_THROW(EXPECT_FALSE(Plan::from_json(odd_stream, plan, error)));
    EXPECT_NE(std::string::npos, error.find("stream"));
}

TEST(PlanTest, PlanTaskCollectsResults) {
    Plan plan;
    std::string error;
    ASSERT_TRUE(Plan::from_json(Json::array({
        Json{{"tool", "search"}},
        Json{{"log", "between"}},
        Json{{"parallel", Json::array({Json{{"sleep", 1}}, Json{{"tool", "search"}}})}}
    }), plan, error)) << error;

    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_plan_task(plan), test_bindings(), ids);

    std::vector<Request> reqs = drain(s);
    ASSERT_EQ(1u, reqs.size());
    s.resume(reqs[0].id, Outcome::ok("r1"));

    reqs = drain(s);
    ASSERT_EQ(2u, reqs.size());
    EXPECT_EQ(RequestKind::SLEEP, reqs[0].kind());
    s.resume(reqs[1].id, Outcome::ok("r2"));
    s.resume(reqs[0].id, Outcome::ok());
    drain(s);

    GuestResult result = s.finish();
    ASSERT_TRUE(result.success);
    EXPECT_EQ(Json::array({"r1", nullptr, Json::array({nullptr, "r2"})}), result.value);
    EXPECT_EQ("between\n", result.stdout_text);
}

TEST(PlanTest, StopsAtFirstFailureUnlessContinuing) {
    Plan plan;
    std::string error;
    ASSERT_TRUE(Plan::from_json(Json::array({Json{{"tool", "nope"}}, Json{{"log", "after"}}}),
                                plan, error));

    Scheduler s;
    RequestIdAllocator ids;
    s.begin(make_plan_task(plan), test_bindings(), ids);
    drain(s);
    GuestResult stopped = s.finish();
    EXPECT_FALSE(stopped.success);
    EXPECT_EQ("reference_error", stopped.error.code);
    EXPECT_TRUE(stopped.stdout_text.empty());

    plan.continue_on_error = true;
    s.begin(make_plan_task(plan), test_bindings(), ids);
    drain(s);
    GuestResult continued = s.finish();
    ASSERT_TRUE(continued.success);
    EXPECT_EQ("reference_error", continued.value[0]["error"]["code"].get<std::string>());
    EXPECT_EQ("after\n", continued.stdout_text);
}
