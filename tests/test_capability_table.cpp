#include <gtest/gtest.h>
#include <warden/capability/capability_table.hpp>
#include <warden/capability/pattern.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace warden;

namespace {

std::vector<MethodCapability> transfer_caps() {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("transfer_money",
                                    ConstraintSet(std::vector<Constraint>{Param("amount").le(1000)}),
                                    10));
    return caps;
}

} // namespace

TEST(CapabilityTableTest, QuotaIsEnforcedAfterMaxCalls) {
    CapabilityTable table(transfer_caps());
    Json args = {{"amount", 100}};

    for (int i = 0; i < 10; ++i) {
        AuthorizationResult r = table.authorize("transfer_money", args);
        ASSERT_TRUE(r.success) << "call " << i;
        EXPECT_EQ(i + 1, r.grant.calls_used);
        EXPECT_EQ(9 - i, r.grant.remaining);
    }

    AuthorizationResult denied = table.authorize("transfer_money", args);
    ASSERT_FALSE(denied.success);
    EXPECT_EQ(CapabilityErrorKind::QUOTA_EXCEEDED, denied.error.kind);
    EXPECT_EQ(10, denied.error.max_calls);
    EXPECT_EQ("transfer_money", denied.error.pattern);
}

TEST(CapabilityTableTest, ConstraintViolationDoesNotConsumeQuota) {
    CapabilityTable table(transfer_caps());

    AuthorizationResult r = table.authorize("transfer_money", Json{{"amount", 50000}});
    ASSERT_FALSE(r.success);
    EXPECT_EQ(CapabilityErrorKind::CONSTRAINT_VIOLATION, r.error.kind);
    EXPECT_EQ("amount", r.error.parameter);
    EXPECT_EQ("amount <= 1000", r.error.predicate);
    EXPECT_EQ(Json(50000), r.error.attempted_value);

    int64_t remaining = 0;
    ASSERT_TRUE(table.remaining_calls("cap:method:transfer_money", remaining));
    EXPECT_EQ(10, remaining);

    Json err = r.error.to_json();
    EXPECT_EQ("constraint_violation", err["kind"].get<std::string>());
    EXPECT_EQ("amount <= 1000", err["predicate"].get<std::string>());
}

TEST(CapabilityTableTest, UnmatchedMethodIsDenied) {
    CapabilityTable table(transfer_caps());
    AuthorizationResult r = table.authorize("delete_account", Json::object());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(CapabilityErrorKind::NO_MATCHING_RULE, r.error.kind);
    EXPECT_EQ("delete_account", r.error.method);
    EXPECT_TRUE(r.error.pattern.empty());
    EXPECT_NE(std::string::npos, r.error.message().find("delete_account"));
}

TEST(CapabilityTableTest, EmptyTableDeniesEverything) {
    CapabilityTable table(std::vector<MethodCapability>{});
    EXPECT_FALSE(table.can_call("anything", Json::object()));
    EXPECT_EQ(0u, table.capability_count());
}

TEST(CapabilityTableTest, FirstMatchingRuleWins) {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("stripe/charges/*",
                                    ConstraintSet(std::vector<Constraint>{Param("amount").le(100)})));
    caps.push_back(MethodCapability("stripe/**"));
    CapabilityTable table(caps);

    // The narrow rule matches first and its constraint fails; the broad rule
    // is never consulted.
    AuthorizationResult r = table.authorize("stripe/charges/create", Json{{"amount", 500}});
    ASSERT_FALSE(r.success);
    EXPECT_EQ(CapabilityErrorKind::CONSTRAINT_VIOLATION, r.error.kind);
    EXPECT_EQ("stripe/charges/*", r.error.pattern);

    AuthorizationResult other = table.authorize("stripe/customers/list", Json::object());
    ASSERT_TRUE(other.success);
    EXPECT_EQ(1u, other.grant.capability_index);
    EXPECT_EQ("cap:method:stripe/**", other.grant.capability_key);
}

TEST(CapabilityTableTest, CheckDoesNotConsume) {
    CapabilityTable table(transfer_caps());
    Json args = {{"amount", 1}};
    for (int i = 0; i < 20; ++i) {
        EXPECT_TRUE(table.check("transfer_money", args).success);
    }
    EXPECT_EQ(0, table.usage()["cap:method:transfer_money"]);
    EXPECT_EQ(10, table.call_counts()["cap:method:transfer_money"]);
}

TEST(CapabilityTableTest, UnlimitedRuleReportsUnlimited) {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("search/*"));
    CapabilityTable table(caps);

    for (int i = 0; i < 100; ++i) {
        ASSERT_TRUE(table.authorize("search/web", Json::object()).success);
    }
    int64_t remaining = 0;
    ASSERT_TRUE(table.remaining_calls("cap:method:search/*", remaining));
    EXPECT_EQ(UNLIMITED_CALLS, remaining);
    EXPECT_FALSE(table.remaining_calls("cap:method:nope", remaining));
}

TEST(CapabilityTableTest, ZeroQuotaDeniesFirstCall) {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("send_email", ConstraintSet(), 0));
    CapabilityTable table(caps);
    AuthorizationResult r = table.authorize("send_email", Json::object());
    ASSERT_FALSE(r.success);
    EXPECT_EQ(CapabilityErrorKind::QUOTA_EXCEEDED, r.error.kind);
}

TEST(CapabilityTableTest, ConcurrentCallersNeverExceedQuota) {
    CapabilityTable table(transfer_caps());
    std::atomic<int> granted(0);
    std::vector<std::thread> threads;

    for (int t = 0; t < 8; ++t) {
        threads.push_back(std::thread([&table, &granted]() {
            for (int i = 0; i < 50; ++i) {
                if (table.authorize("transfer_money", Json{{"amount", 1}}).success) {
                    granted++;
                }
            }
        }));
    }
    for (size_t i = 0; i < threads.size(); ++i) {
        threads[i].join();
    }

    EXPECT_EQ(10, granted.load());
    EXPECT_EQ(10, table.usage()["cap:method:transfer_money"]);
}

TEST(CapabilityTableTest, RestoreUsageNeverLowersOrExceedsLimit) {
    CapabilityTable table(transfer_caps());
    table.authorize("transfer_money", Json{{"amount", 1}});
    table.authorize("transfer_money", Json{{"amount", 1}});
    table.authorize("transfer_money", Json{{"amount", 1}});

    table.restore_usage("cap:method:transfer_money", 1);
    EXPECT_EQ(3, table.usage()["cap:method:transfer_money"]);

    table.restore_usage("cap:method:transfer_money", 7);
    EXPECT_EQ(7, table.usage()["cap:method:transfer_money"]);

    table.restore_usage("cap:method:transfer_money", 500);
    EXPECT_EQ(10, table.usage()["cap:method:transfer_money"]);

    table.restore_usage("cap:method:unknown", 3);
    EXPECT_EQ(1u, table.usage().size());
}

TEST(CapabilityTableTest, InvalidPatternIsAConfigError) {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("stripe/**/create"));
    EXPECT_THROW({ CapabilityTable table(caps); }, PatternConfigError);
}

TEST(CapabilityTableTest, IdenticalTablesMakeIdenticalDecisions) {
    CapabilityTable a(transfer_caps());
    CapabilityTable b(transfer_caps());
    const char* methods[] = {"transfer_money", "transfer_money", "other", "transfer_money"};
    Json amounts[] = {Json(10), Json(5000), Json(1), Json("x")};

    for (int i = 0; i < 4; ++i) {
        Json args = {{"amount", amounts[i]}};
        AuthorizationResult ra = a.authorize(methods[i], args);
        AuthorizationResult rb = b.authorize(methods[i], args);
        EXPECT_EQ(ra.success, rb.success);
        EXPECT_EQ(ra.error.to_json(), rb.error.to_json());
    }
}

TEST(ParseCapabilitiesTest, ParsesConfigEntries) {
    Json arr = Json::array({
        Json{{"pattern", "transfer_money"}, {"constraints", {{"amount", "<=1000"}}}, {"max_calls", 10}},
        Json{{"method_pattern", "search/*"}},
        Json{{"pattern", "noop"}, {"max_calls", nullptr}}
    });
    std::vector<MethodCapability> caps = parse_capabilities(arr);
    ASSERT_EQ(3u, caps.size());
    EXPECT_EQ(10, caps[0].max_calls);
    EXPECT_EQ(1u, caps[0].constraints.size());
    EXPECT_EQ("search/*", caps[1].method_pattern);
    EXPECT_FALSE(caps[1].has_limit());
    EXPECT_FALSE(caps[2].has_limit());
}

TEST(ParseCapabilitiesTest, DefaultMaxCallsAppliesOnlyWithoutKey) {
    Json arr = Json::array({
        Json{{"pattern", "a"}},
        Json{{"pattern", "b"}, {"max_calls", 3}},
        Json{{"pattern", "c"}, {"max_calls", nullptr}}
    });
    std::vector<MethodCapability> caps = parse_capabilities(arr, 5);
    EXPECT_EQ(5, caps[0].max_calls);
    EXPECT_EQ(3, caps[1].max_calls);
    EXPECT_EQ(UNLIMITED_CALLS, caps[2].max_calls);
}

TEST(ParseCapabilitiesTest, RejectsBadEntries) {
    EXPECT_THROW(parse_capabilities(Json{{"pattern", "a"}}), PatternConfigError);
    EXPECT_THROW(parse_capabilities(Json::array({Json{{"max_calls", 1}}})), PatternConfigError);
    EXPECT_THROW(parse_capabilities(Json::array({Json{{"pattern", "a"}, {"max_calls", -2}}})), PatternConfigError);
    EXPECT_THROW(parse_capabilities(Json::array({Json{{"pattern", "a"}, {"max_calls", "ten"}}})), PatternConfigError);
    EXPECT_TRUE(parse_capabilities(Json()).empty());
}

TEST(CapabilityTableTest, DenialWithInvalidUtf8ValueStillReports) {
    std::vector<MethodCapability> caps;
    caps.push_back(MethodCapability("pay",
                                    ConstraintSet(std::vector<Constraint>{
                                        Param("currency").is_in(Json::array({"usd"}))})));
    CapabilityTable table(caps);

    Json args = Json::object();
    args["currency"] = std::string("\xff\xfe");
    AuthorizationResult r;
    ASSERT_NO_THROW(r = table.authorize("pay", args));
    ASSERT_FALSE(r.success);
    EXPECT_EQ(CapabilityErrorKind::CONSTRAINT_VIOLATION, r.error.kind);
    EXPECT_NE(std::string::npos, r.error.message().find("currency"));
    EXPECT_EQ("constraint_violation", r.error.to_json()["kind"].get<std::string>());
}
