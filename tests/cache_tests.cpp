#include <algorithm>
#include <gtest/gtest.h>

#include <LocalCacheStore.hpp>

#include "test_helpers.hpp"

using namespace NWorkspace;

static TRecordSnapshot MakeSnapshot(std::vector<TRecord> records, const std::string& code = "AAAA2222") {
    TRecordSnapshot snap;
    snap.CompanyCode = code;
    for (auto& r : records) {
        snap.Tables[r.Table].push_back(r);
    }
    return snap;
}

TEST(Cache, DefaultTablesRegistered) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());

    auto names = cache.TableNames();
    EXPECT_EQ(names.size(), DefaultTableNames().size());
    EXPECT_NE(std::find(names.begin(), names.end(), "stock_adjustments"), names.end());
    EXPECT_TRUE(cache.OwnerId().empty());
    EXPECT_EQ(cache.TotalCount(), 0u);
}

TEST(Cache, RegisterRejectsDuplicateTable) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());

    cache.RegisterTable(std::make_unique<TJsonCacheTable>("tables_layout"));
    EXPECT_EQ(cache.Count("tables_layout"), 0u);
    EXPECT_THROW(cache.RegisterTable(std::make_unique<TJsonCacheTable>("products")), TWorkspaceError);
}

TEST(Cache, WritesQueuePendingMutations) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());

    auto rec = cache.Upsert("products", "p1", {{"name", "Coffee"}});
    cache.Upsert("products", "p1", {{"name", "Iced coffee"}});
    EXPECT_TRUE(cache.Remove("products", "p1"));
    EXPECT_FALSE(cache.Remove("products", "p1"));

    EXPECT_EQ(rec.Table, "products");
    auto pending = cache.PendingMutations();
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(pending[0].Op, EMutationOp::Upsert);
    EXPECT_EQ(pending[2].Op, EMutationOp::Remove);
    EXPECT_NE(pending[0].MutationId, pending[1].MutationId);
    EXPECT_FALSE(cache.Get("products", "p1"));
}

TEST(Cache, UnknownTableIsNotFound) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());

    try {
        cache.Upsert("ghosts", "g1", json::object());
        FAIL() << "write to unregistered table";
    } catch (const TWorkspaceError& e) {
        EXPECT_EQ(e.Code(), EWorkspaceError::NotFound);
    }
    EXPECT_TRUE(cache.PendingMutations().empty());
}

TEST(Cache, AdoptReplacesEveryTable) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({MakeRecord("customers", "c9", {{"name", "Old"}})}, "CCCC4444"), "C");
    auto before = cache.Generation();

    auto snap = MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}}),
                              MakeRecord("orders", "o1", {{"total", 1}})});
    auto previous = cache.Adopt(snap, "A");

    EXPECT_EQ(Flatten(cache.Dump()), Flatten(snap.Tables));
    EXPECT_EQ(cache.OwnerId(), "A");
    EXPECT_TRUE(cache.PendingMutations().empty());
    EXPECT_GT(cache.Generation(), before);
    EXPECT_FALSE(previous.Empty());
    EXPECT_EQ(previous.OwnerId(), "C");
}

TEST(Cache, UnownedWritesFollowFirstOwner) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Upsert("customers", "c9", {{"name", "Walk-in"}});

    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");

    EXPECT_EQ(cache.OwnerCode(), "AAAA2222");
    ASSERT_EQ(cache.PendingMutations().size(), 1u);
    EXPECT_EQ(cache.Get("customers", "c9")->Data["name"], "Walk-in");
    EXPECT_TRUE(cache.Get("products", "p1"));
    EXPECT_TRUE(cache.ParkedMutations().empty());
}

TEST(Cache, UndeliveredWritesParkUntilOwnerReturns) {
    auto storage = std::make_shared<TMemoryStorage>();
    TLocalCacheStore cache(storage);
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
    cache.Upsert("products", "p1", {{"name", "Local coffee"}});
    cache.Upsert("products", "p2", {{"name", "Tea"}});
    auto pending = cache.PendingMutations();

    cache.Adopt(MakeSnapshot({MakeRecord("orders", "o1", {{"total", 1}})}, "BBBB3333"), "B", {pending[1].MutationId});

    EXPECT_TRUE(cache.PendingMutations().empty());
    EXPECT_FALSE(cache.Get("products", "p1"));
    auto parked = cache.ParkedMutations();
    ASSERT_EQ(parked.size(), 1u);
    ASSERT_EQ(parked["AAAA2222"].size(), 1u);
    EXPECT_EQ(parked["AAAA2222"][0].MutationId, pending[0].MutationId);
    EXPECT_EQ(TLocalCacheStore(storage).ParkedMutations().size(), 1u);

    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");

    EXPECT_TRUE(cache.ParkedMutations().empty());
    EXPECT_EQ(cache.Get("products", "p1")->Data["name"], "Local coffee");
    ASSERT_EQ(cache.PendingMutations().size(), 1u);
    EXPECT_EQ(cache.PendingMutations()[0].MutationId, pending[0].MutationId);
}

TEST(Cache, AcknowledgeClearsParkedWrites) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({}), "A");
    cache.Upsert("products", "p1", {{"name", "Coffee"}});
    auto id = cache.PendingMutations()[0].MutationId;
    cache.Adopt(MakeSnapshot({}, "BBBB3333"), "B");
    ASSERT_EQ(cache.ParkedMutations().size(), 1u);

    cache.Acknowledge({id});

    EXPECT_TRUE(cache.ParkedMutations().empty());
}

TEST(Cache, ClaimGivesUnownedWritesAnOwner) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Upsert("products", "p1", {{"name", "Coffee"}});

    cache.Claim("A", "AAAA2222");

    EXPECT_EQ(cache.OwnerId(), "A");
    EXPECT_EQ(cache.OwnerCode(), "AAAA2222");
    EXPECT_EQ(cache.PendingMutations().size(), 1u);
    EXPECT_TRUE(cache.Get("products", "p1"));
    EXPECT_THROW(cache.Claim("B", "BBBB3333"), TWorkspaceError);
    EXPECT_EQ(cache.OwnerId(), "A");
}

TEST(Cache, AdoptUnknownTableLeavesLiveTablesUntouched) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
    auto before = cache.Dump();

    auto bad = MakeSnapshot({MakeRecord("products", "p2", {{"name", "Tea"}}),
                             MakeRecord("ghosts", "g1", json::object())});
    try {
        cache.Adopt(bad, "B");
        FAIL() << "unknown table adopted";
    } catch (const TWorkspaceError& e) {
        EXPECT_EQ(e.Code(), EWorkspaceError::CacheCommitFailure);
    }

    EXPECT_EQ(Flatten(cache.Dump()), Flatten(before));
    EXPECT_EQ(cache.OwnerId(), "A");
}

TEST(Cache, AdoptPersistFailureLeavesLiveTablesUntouched) {
    auto storage = std::make_shared<TFlakyStorage>();
    TLocalCacheStore cache(storage);
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
    auto persisted = storage->LoadState();

    storage->FailSaves = 1;
    EXPECT_THROW(cache.Adopt(MakeSnapshot({MakeRecord("products", "p2", {{"name", "Tea"}})}), "B"), TWorkspaceError);

    EXPECT_EQ(cache.OwnerId(), "A");
    EXPECT_TRUE(cache.Get("products", "p1"));
    EXPECT_FALSE(cache.Get("products", "p2"));
    EXPECT_EQ(storage->LoadState(), persisted);
}

TEST(Cache, RestoreBringsBackPreviousGeneration) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
    cache.Upsert("customers", "c1", {{"name", "Noy"}});
    auto before = cache.Dump();

    auto previous = cache.Adopt(MakeSnapshot({MakeRecord("products", "p2", {{"name", "Tea"}})}), "B");
    cache.Restore(std::move(previous));

    EXPECT_EQ(Flatten(cache.Dump()), Flatten(before));
    EXPECT_EQ(cache.OwnerId(), "A");
    EXPECT_EQ(cache.PendingMutations().size(), 1u);
    EXPECT_THROW(cache.Restore(TCacheGeneration{}), TWorkspaceError);
}

TEST(Cache, ClearAllDropsOwnerAndOutbox) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
    cache.Upsert("products", "p2", {{"name", "Tea"}});

    cache.ClearAll();

    EXPECT_EQ(cache.TotalCount(), 0u);
    EXPECT_TRUE(cache.OwnerId().empty());
    EXPECT_TRUE(cache.PendingMutations().empty());
}

TEST(Cache, JournalReplayAfterRestart) {
    auto storage = std::make_shared<TMemoryStorage>();
    {
        TLocalCacheStore cache(storage);
        cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}})}), "A");
        cache.Upsert("products", "p2", {{"name", "Tea"}});
        cache.Upsert("customers", "c1", {{"name", "Noy"}});
        cache.Remove("products", "p1");
    }

    TLocalCacheStore reopened(storage);
    EXPECT_EQ(reopened.OwnerId(), "A");
    EXPECT_FALSE(reopened.Get("products", "p1"));
    ASSERT_TRUE(reopened.Get("products", "p2"));
    EXPECT_EQ(reopened.Get("products", "p2")->Data["name"], "Tea");
    EXPECT_EQ(reopened.PendingMutations().size(), 3u);
}

TEST(Cache, JournalOfOlderGenerationIgnored) {
    auto storage = std::make_shared<TMemoryStorage>();
    TMutation stale;
    stale.MutationId = "mut_stale";
    stale.Table = "products";
    stale.RecordId = "p9";
    stale.Data = {{"name", "Ghost"}};
    stale.Timestamp = FromMillis(5);
    storage->SaveState(json{{"owner_id", "A"}, {"generation", 7}, {"tables", json::object()}, {"pending", json::array()}});
    storage->AppendJournal(json{{"generation", 6}, {"mutation", MutationToJson(stale)}});

    TLocalCacheStore cache(storage);

    EXPECT_EQ(cache.Generation(), 7u);
    EXPECT_FALSE(cache.Get("products", "p9"));
    EXPECT_TRUE(cache.PendingMutations().empty());
}

TEST(Cache, FailedJournalAppendRejectsWrite) {
    auto storage = std::make_shared<TFlakyStorage>();
    TLocalCacheStore cache(storage);

    storage->FailJournal = true;
    EXPECT_THROW(cache.Upsert("products", "p1", {{"name", "Coffee"}}), TWorkspaceError);
    EXPECT_FALSE(cache.Get("products", "p1"));
    EXPECT_TRUE(cache.PendingMutations().empty());
}

TEST(Cache, MergeKeepsNewerLocalWrites) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Coffee"}}),
                              MakeRecord("products", "p3", {{"name", "Juice"}})}),
                "A");
    cache.Upsert("products", "p1", {{"name", "Local coffee"}});
    cache.Upsert("customers", "c1", {{"name", "Offline customer"}});

    auto remote = MakeSnapshot({MakeRecord("products", "p1", {{"name", "Remote coffee"}}, 2000),
                                MakeRecord("products", "p2", {{"name", "Tea"}}, 2000)});
    auto stats = cache.Merge(remote);

    EXPECT_EQ(cache.Get("products", "p1")->Data["name"], "Local coffee");
    EXPECT_EQ(cache.Get("products", "p2")->Data["name"], "Tea");
    EXPECT_FALSE(cache.Get("products", "p3"));
    EXPECT_TRUE(cache.Get("customers", "c1"));
    EXPECT_EQ(stats.Upserted, 1u);
    EXPECT_EQ(stats.Removed, 1u);
    EXPECT_EQ(stats.KeptLocal, 2u);
    EXPECT_EQ(cache.PendingMutations().size(), 2u);
}

TEST(Cache, MergeTakesNewerRemoteValue) {
    TLocalCacheStore cache(std::make_shared<TMemoryStorage>());
    cache.Adopt(MakeSnapshot({}), "A");
    cache.Upsert("products", "p1", {{"name", "Local"}});

    auto later = ToMillis(Now()) + 60 * 60 * 1000;
    cache.Merge(MakeSnapshot({MakeRecord("products", "p1", {{"name", "Remote"}}, later)}));

    EXPECT_EQ(cache.Get("products", "p1")->Data["name"], "Remote");
    EXPECT_EQ(cache.OwnerId(), "A");
}

TEST(Cache, AcknowledgeCheckpointsOutbox) {
    auto storage = std::make_shared<TMemoryStorage>();
    std::string keep;
    {
        TLocalCacheStore cache(storage);
        cache.Adopt(MakeSnapshot({}), "A");
        cache.Upsert("products", "p1", {{"name", "Coffee"}});
        cache.Upsert("products", "p2", {{"name", "Tea"}});
        auto pending = cache.PendingMutations();
        keep = pending[1].MutationId;

        cache.Acknowledge({pending[0].MutationId});
        EXPECT_EQ(cache.PendingMutations().size(), 1u);
        EXPECT_TRUE(storage->LoadJournal().empty());
    }

    TLocalCacheStore reopened(storage);
    auto pending = reopened.PendingMutations();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].MutationId, keep);
    EXPECT_EQ(reopened.Count("products"), 2u);
}
