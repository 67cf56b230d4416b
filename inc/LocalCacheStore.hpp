#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "CacheTable.hpp"
#include "common.hpp"
#include "storage.hpp"

namespace NWorkspace {

    struct TCacheContents {
        std::map<std::string, std::unique_ptr<ICacheTable>> Tables;
        std::string OwnerId;
        std::string OwnerCode;
        std::vector<TMutation> Pending;
        // Undelivered writes of workspaces the cache moved away from, by company code.
        std::map<std::string, std::vector<TMutation>> Parked;
        uint64_t Generation = 0;
    };

    // A table set that was swapped out, kept so the caller can put it back.
    class TCacheGeneration {
    public:
        TCacheGeneration() = default;

        bool Empty() const {
            return !Contents;
        }

        std::string OwnerId() const {
            return Contents ? Contents->OwnerId : std::string();
        }

    private:
        friend class TLocalCacheStore;
        explicit TCacheGeneration(std::shared_ptr<TCacheContents> contents)
            : Contents(std::move(contents)) {
        }

        std::shared_ptr<TCacheContents> Contents;
    };

    struct TMergeStats {
        size_t Upserted = 0;
        size_t Removed = 0;
        size_t KeptLocal = 0;
    };

    class TLocalCacheStore {
    public:
        explicit TLocalCacheStore(std::shared_ptr<IStorage> storage);
        TLocalCacheStore(std::shared_ptr<IStorage> storage, std::vector<std::unique_ptr<ICacheTable>> tables);

        void RegisterTable(std::unique_ptr<ICacheTable> table);

        // Whole-state transitions. Each one is all-or-nothing: the new table set is
        // built and persisted aside, then swapped in with a single pointer exchange.
        void ClearAll();
        // Pending writes of the outgoing owner that are not in `delivered` are parked under its
        // company code. Writes parked under the snapshot's code come back as pending and are
        // replayed over the snapshot where they are newer.
        TCacheGeneration Adopt(const TRecordSnapshot& snapshot, const WorkspaceId& ownerId,
                               const std::vector<std::string>& delivered = {});
        void Restore(TCacheGeneration generation);
        TMergeStats Merge(const TRecordSnapshot& snapshot);

        TRecord Upsert(const std::string& table, const std::string& id, const json& data);
        bool Remove(const std::string& table, const std::string& id);
        std::optional<TRecord> Get(const std::string& table, const std::string& id) const;
        std::vector<TRecord> List(const std::string& table) const;
        size_t Count(const std::string& table) const;
        size_t TotalCount() const;

        std::vector<TMutation> PendingMutations() const;
        // Drops the ids from the outbox and from every parked outbox.
        void Acknowledge(const std::vector<std::string>& mutationIds);
        std::map<std::string, std::vector<TMutation>> ParkedMutations() const;

        // Gives an unowned cache, and the writes made in it, to a workspace.
        void Claim(const WorkspaceId& ownerId, const std::string& companyCode);

        std::string OwnerId() const;
        std::string OwnerCode() const;
        uint64_t Generation() const;
        std::vector<std::string> TableNames() const;

        // Every table's records keyed by table name, for comparisons and export.
        std::map<std::string, std::vector<TRecord>> Dump() const;

    private:
        void Reload();
        void Persist(const TCacheContents& contents);
        std::shared_ptr<TCacheContents> MakeShadow(const TCacheContents& from) const;
        std::shared_ptr<TCacheContents> MakeCopy(const TCacheContents& from) const;
        void ClearJournalAfterCheckpoint();
        void ApplyMutation(TCacheContents& contents, const TMutation& m);
        ICacheTable& RequireTable(const TCacheContents& contents, const std::string& table) const;

        static json ContentsToJson(const TCacheContents& contents);

    private:
        std::shared_ptr<IStorage> Storage;
        mutable std::mutex Mutex_;
        std::shared_ptr<TCacheContents> Live;
    };

} // namespace NWorkspace
