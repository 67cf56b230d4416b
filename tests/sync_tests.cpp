#include <gtest/gtest.h>

#include <SyncEngine.hpp>

#include "test_helpers.hpp"

using namespace NWorkspace;
using namespace std::chrono_literals;

static TRetryPolicy FastPolicy() {
    TRetryPolicy p;
    p.MaxAttempts = 3;
    p.BaseDelay = 100ms;
    p.MaxDelay = 350ms;
    return p;
}

TEST(Retry, DelayDoublesUpToCap) {
    auto p = FastPolicy();
    EXPECT_EQ(p.DelayFor(0), 100ms);
    EXPECT_EQ(p.DelayFor(1), 200ms);
    EXPECT_EQ(p.DelayFor(2), 350ms);
    EXPECT_EQ(p.DelayFor(30), 350ms);
}

TEST(Retry, TransientFailuresAreRetried) {
    TTestEnv env(FastPolicy());
    env.Remote->Seed("AAAA2222", {MakeRecord("products", "p1", {{"name", "Coffee"}})});
    env.Remote->FailNextFetches(2);

    auto snap = env.Sync->Pull(MakeWorkspace("A", "AAAA2222"));

    EXPECT_EQ(snap.RecordCount(), 1u);
    EXPECT_EQ(env.Remote->FetchCount(), 3u);
    ASSERT_EQ(env.Sleeps->size(), 2u);
    EXPECT_EQ((*env.Sleeps)[0], 100ms);
    EXPECT_EQ((*env.Sleeps)[1], 200ms);
}

TEST(Retry, GivesUpAfterMaxAttempts) {
    TTestEnv env(FastPolicy());
    env.Remote->Seed("AAAA2222", {});
    env.Remote->FailNextFetches(10);

    try {
        env.Sync->Pull(MakeWorkspace("A", "AAAA2222"));
        FAIL() << "pull succeeded";
    } catch (const TWorkspaceError& e) {
        EXPECT_EQ(e.Code(), EWorkspaceError::RemoteUnreachable);
    }
    EXPECT_EQ(env.Remote->FetchCount(), 3u);
}

TEST(Retry, RejectionIsNotRetried) {
    TTestEnv env(FastPolicy());

    EXPECT_THROW(env.Sync->Pull(MakeWorkspace("A", "NOPE7777")), TWorkspaceError);
    EXPECT_EQ(env.Remote->FetchCount(), 1u);
    EXPECT_TRUE(env.Sleeps->empty());
}

TEST(Sync, NoCurrentWorkspaceIsNotFound) {
    TTestEnv env;
    try {
        env.Sync->SyncCurrent();
        FAIL() << "sync without workspace";
    } catch (const TWorkspaceError& e) {
        EXPECT_EQ(e.Code(), EWorkspaceError::NotFound);
    }
}

TEST(Sync, FirstSyncHydratesUnownedCache) {
    TTestEnv env;
    env.Remote->Seed("AAAA2222", {MakeRecord("products", "p1", {{"name", "Coffee"}})});
    env.Registry->Add(MakeWorkspace("A", "AAAA2222"));

    auto report = env.Sync->SyncCurrent();

    EXPECT_TRUE(report.Adopted);
    EXPECT_EQ(env.Cache->OwnerId(), "A");
    EXPECT_EQ(Flatten(env.Cache->Dump()), Flatten(env.Remote->Fetch("AAAA2222").Tables));
    auto a = env.Registry->Get("A");
    EXPECT_EQ(a->SyncStatus, ESyncStatus::Synced);
    EXPECT_TRUE(a->LastSyncAt);
}

TEST(Sync, PushesOutboxThenMerges) {
    TTestEnv env;
    env.SetupTwoShops();
    env.Cache->Upsert("products", "p5", {{"name", "Cake"}});
    env.Remote->Submit("AAAA2222", {TMutation{"other_device", "customers", "c2", EMutationOp::Upsert, {{"name", "Keo"}}, Now()}});

    auto report = env.Sync->SyncCurrent();

    EXPECT_FALSE(report.Adopted);
    EXPECT_EQ(report.Pushed, 1u);
    EXPECT_TRUE(env.Cache->PendingMutations().empty());
    EXPECT_TRUE(env.Cache->Get("customers", "c2"));
    EXPECT_EQ(Flatten(env.Cache->Dump()), Flatten(env.Remote->Fetch("AAAA2222").Tables));
}

TEST(Sync, FailureKeepsCacheAndMarksError) {
    TTestEnv env(FastPolicy());
    env.SetupTwoShops();
    env.Cache->Upsert("products", "p5", {{"name", "Cake"}});
    auto before = env.Cache->Dump();
    env.Remote->SetReachable(false);

    EXPECT_THROW(env.Sync->SyncCurrent(), TWorkspaceError);

    EXPECT_EQ(Flatten(env.Cache->Dump()), Flatten(before));
    EXPECT_EQ(env.Cache->PendingMutations().size(), 1u);
    EXPECT_EQ(env.Registry->Get("A")->SyncStatus, ESyncStatus::Error);
}

TEST(Sync, RepeatedPushAfterLostAckChangesNothing) {
    TTestEnv env;
    env.SetupTwoShops();
    env.Cache->Upsert("products", "p5", {{"name", "Cake"}});
    auto pending = env.Cache->PendingMutations();
    auto a = *env.Registry->Get("A");

    env.Sync->Push(a, pending);
    auto once = Flatten(env.Remote->Fetch("AAAA2222").Tables);
    auto ack = env.Sync->Push(a, pending);

    EXPECT_TRUE(ack.Applied.empty());
    EXPECT_EQ(Flatten(env.Remote->Fetch("AAAA2222").Tables), once);

    env.Sync->PushOutbox(a);
    EXPECT_TRUE(env.Cache->PendingMutations().empty());
}

TEST(Sync, WritesBeforeFirstSyncAreDelivered) {
    TTestEnv env;
    env.Remote->Seed("AAAA2222", {MakeRecord("products", "p1", {{"name", "Coffee"}})});
    env.Registry->Add(MakeWorkspace("A", "AAAA2222"));
    env.Cache->Upsert("products", "p9", {{"name", "Written offline"}});

    auto report = env.Sync->SyncCurrent();

    EXPECT_EQ(report.Pushed, 1u);
    EXPECT_EQ(env.Cache->OwnerId(), "A");
    EXPECT_TRUE(env.Cache->PendingMutations().empty());
    ASSERT_TRUE(env.Cache->Get("products", "p9"));
    EXPECT_EQ(env.Cache->Get("products", "p9")->Data["name"], "Written offline");
    EXPECT_TRUE(env.Cache->Get("products", "p1"));
    EXPECT_EQ(Flatten(env.Remote->Fetch("AAAA2222").Tables)["products/p9"]["name"], "Written offline");
}

TEST(Sync, FailedFirstSyncKeepsEarlyWrites) {
    TTestEnv env(FastPolicy());
    env.Remote->Seed("AAAA2222", {});
    env.Registry->Add(MakeWorkspace("A", "AAAA2222"));
    env.Cache->Upsert("products", "p9", {{"name", "Written offline"}});
    env.Remote->SetReachable(false);

    EXPECT_THROW(env.Sync->SyncCurrent(), TWorkspaceError);
    EXPECT_EQ(env.Cache->PendingMutations().size(), 1u);

    env.Remote->SetReachable(true);
    env.Sync->SyncCurrent();

    EXPECT_TRUE(env.Cache->PendingMutations().empty());
    EXPECT_EQ(env.Remote->Fetch("AAAA2222").RecordCount(), 1u);
}

TEST(Sync, WorkspaceListMovesToAnotherDevice) {
    TTestEnv first;
    first.SetupTwoShops();
    first.Sync->PublishWorkspaceList("noy");

    auto registry = std::make_shared<TWorkspaceRegistry>(std::make_shared<TMemoryStorage>());
    auto cache = std::make_shared<TLocalCacheStore>(std::make_shared<TMemoryStorage>());
    TSyncEngine device(registry, cache, first.Remote);

    EXPECT_EQ(device.RestoreWorkspaceList("somebody-else"), 0u);
    EXPECT_EQ(device.RestoreWorkspaceList("noy"), 2u);
    EXPECT_EQ(device.RestoreWorkspaceList("noy"), 0u);
    EXPECT_EQ(registry->CurrentId(), "A");
    EXPECT_EQ(registry->Get("B")->CompanyCode, "BBBB3333");

    device.SyncCurrent();
    EXPECT_EQ(Flatten(cache->Dump()), Flatten(first.Remote->Fetch("AAAA2222").Tables));
}

TEST(Sync, RehydratesCacheOwnedByAnotherWorkspace) {
    TTestEnv env;
    env.SetupTwoShops();
    env.Cache->Adopt(env.Remote->Fetch("BBBB3333"), "B");

    auto report = env.Sync->SyncCurrent();

    EXPECT_TRUE(report.Adopted);
    EXPECT_EQ(env.Cache->OwnerId(), "A");
    EXPECT_EQ(Flatten(env.Cache->Dump()), Flatten(env.Remote->Fetch("AAAA2222").Tables));
}
