#include <LocalCacheStore.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <set>
#include <unordered_set>

namespace NWorkspace {

    namespace {

        std::vector<std::unique_ptr<ICacheTable>> MakeDefaultTables() {
            std::vector<std::unique_ptr<ICacheTable>> out;
            for (auto const& name : DefaultTableNames()) {
                out.push_back(std::make_unique<TJsonCacheTable>(name));
            }
            return out;
        }

        void ApplyToTable(ICacheTable& table, const TMutation& m) {
            if (m.Op == EMutationOp::Upsert) {
                table.Upsert(TRecord{m.Table, m.RecordId, m.Data, m.Timestamp});
            } else {
                table.Remove(m.RecordId);
            }
        }

        std::vector<TMutation> MutationsFromJson(const json& rows) {
            std::vector<TMutation> out;
            for (auto const& jm : rows) {
                TMutation m;
                FromJsonInternal(jm, m);
                out.push_back(std::move(m));
            }
            return out;
        }

        json MutationsToJson(const std::vector<TMutation>& mutations) {
            json rows = json::array();
            for (auto const& m : mutations) {
                rows.push_back(MutationToJson(m));
            }
            return rows;
        }

    } // namespace

    TLocalCacheStore::TLocalCacheStore(std::shared_ptr<IStorage> storage)
        : TLocalCacheStore(std::move(storage), MakeDefaultTables()) {
    }

    TLocalCacheStore::TLocalCacheStore(std::shared_ptr<IStorage> storage, std::vector<std::unique_ptr<ICacheTable>> tables)
        : Storage(std::move(storage))
        , Live(std::make_shared<TCacheContents>()) {
        for (auto& t : tables) {
            RegisterTable(std::move(t));
        }
        Reload();
    }

    void TLocalCacheStore::RegisterTable(std::unique_ptr<ICacheTable> table) {
        if (!table) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Null cache table");
        }
        std::lock_guard lk(Mutex_);
        const std::string name = table->Name();
        if (Live->Tables.count(name)) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Cache table " + name + " registered twice");
        }
        Live->Tables.emplace(name, std::move(table));
    }

    void TLocalCacheStore::Reload() {
        std::lock_guard lk(Mutex_);
        json snap = Storage->LoadState();
        auto& contents = *Live;
        try {
            if (snap.is_object()) {
                contents.OwnerId = snap.value("owner_id", "");
                contents.OwnerCode = snap.value("owner_code", "");
                contents.Generation = snap.value("generation", static_cast<uint64_t>(0));
                if (snap.contains("tables") && snap["tables"].is_object()) {
                    for (auto const& [name, rows] : snap["tables"].items()) {
                        auto it = contents.Tables.find(name);
                        if (it == contents.Tables.end()) {
                            spdlog::warn("Persisted cache table {} is not registered, keeping it as a plain table", name);
                            it = contents.Tables.emplace(name, std::make_unique<TJsonCacheTable>(name)).first;
                        }
                        std::vector<TRecord> records;
                        for (auto const& jr : rows) {
                            TRecord r;
                            FromJsonInternal(jr, r);
                            records.push_back(std::move(r));
                        }
                        it->second->BulkLoad(records);
                    }
                }
                if (snap.contains("pending") && snap["pending"].is_array()) {
                    contents.Pending = MutationsFromJson(snap["pending"]);
                }
                if (snap.contains("parked") && snap["parked"].is_object()) {
                    for (auto const& [code, rows] : snap["parked"].items()) {
                        contents.Parked[code] = MutationsFromJson(rows);
                    }
                }
            }

            size_t replayed = 0;
            for (auto const& entry : Storage->LoadJournal()) {
                if (!entry.is_object() || entry.value("generation", static_cast<uint64_t>(0)) != contents.Generation || !entry.contains("mutation")) {
                    continue;
                }
                TMutation m;
                FromJsonInternal(entry["mutation"], m);
                ApplyMutation(contents, m);
                ++replayed;
            }
            if (replayed > 0) {
                spdlog::info("Replayed {} journaled cache mutation(s)", replayed);
            }
        } catch (const json::exception& e) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, std::string("Unreadable cache state: ") + e.what());
        }
    }

    json TLocalCacheStore::ContentsToJson(const TCacheContents& contents) {
        json snap = json::object();
        snap["owner_id"] = contents.OwnerId;
        snap["owner_code"] = contents.OwnerCode;
        snap["generation"] = contents.Generation;
        snap["tables"] = json::object();
        for (auto const& kv : contents.Tables) {
            json rows = json::array();
            for (auto const& r : kv.second->List()) {
                rows.push_back(RecordToJson(r));
            }
            snap["tables"][kv.first] = std::move(rows);
        }
        snap["pending"] = MutationsToJson(contents.Pending);
        snap["parked"] = json::object();
        for (auto const& kv : contents.Parked) {
            snap["parked"][kv.first] = MutationsToJson(kv.second);
        }
        return snap;
    }

    void TLocalCacheStore::Persist(const TCacheContents& contents) {
        try {
            Storage->SaveState(ContentsToJson(contents));
        } catch (const std::exception& e) {
            throw TWorkspaceError(EWorkspaceError::CacheCommitFailure, std::string("Cannot persist cache state: ") + e.what());
        }
    }

    void TLocalCacheStore::ClearJournalAfterCheckpoint() {
        try {
            Storage->ClearJournal();
        } catch (const std::exception& e) {
            // entries left behind carry an older generation and are skipped on load
            spdlog::warn("Cache journal not truncated after checkpoint: {}", e.what());
        }
    }

    std::shared_ptr<TCacheContents> TLocalCacheStore::MakeShadow(const TCacheContents& from) const {
        auto shadow = std::make_shared<TCacheContents>();
        for (auto const& kv : from.Tables) {
            shadow->Tables.emplace(kv.first, kv.second->MakeEmpty());
        }
        shadow->Parked = from.Parked;
        shadow->Generation = from.Generation + 1;
        return shadow;
    }

    std::shared_ptr<TCacheContents> TLocalCacheStore::MakeCopy(const TCacheContents& from) const {
        auto copy = std::make_shared<TCacheContents>();
        for (auto const& kv : from.Tables) {
            copy->Tables.emplace(kv.first, kv.second->Clone());
        }
        copy->OwnerId = from.OwnerId;
        copy->OwnerCode = from.OwnerCode;
        copy->Pending = from.Pending;
        copy->Parked = from.Parked;
        copy->Generation = from.Generation + 1;
        return copy;
    }

    ICacheTable& TLocalCacheStore::RequireTable(const TCacheContents& contents, const std::string& table) const {
        auto it = contents.Tables.find(table);
        if (it == contents.Tables.end()) {
            throw TWorkspaceError(EWorkspaceError::NotFound, "Unknown cache table " + table);
        }
        return *it->second;
    }

    void TLocalCacheStore::ApplyMutation(TCacheContents& contents, const TMutation& m) {
        ApplyToTable(RequireTable(contents, m.Table), m);
        contents.Pending.push_back(m);
    }

    void TLocalCacheStore::ClearAll() {
        std::lock_guard lk(Mutex_);
        auto shadow = MakeShadow(*Live);
        shadow->Parked.clear();
        size_t dropped = Live->Pending.size();
        for (auto const& kv : Live->Parked) {
            dropped += kv.second.size();
        }
        Persist(*shadow);
        ClearJournalAfterCheckpoint();
        Live = std::move(shadow);
        if (dropped > 0) {
            spdlog::warn("Dropped {} undelivered write(s) with the local cache", dropped);
        }
        spdlog::info("Local cache cleared ({} tables)", Live->Tables.size());
    }

    TCacheGeneration TLocalCacheStore::Adopt(const TRecordSnapshot& snapshot, const WorkspaceId& ownerId,
                                             const std::vector<std::string>& delivered) {
        if (ownerId.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Adopted cache needs an owner");
        }
        std::set<std::string> done(delivered.begin(), delivered.end());

        std::lock_guard lk(Mutex_);
        auto shadow = MakeShadow(*Live);
        shadow->OwnerId = ownerId;
        shadow->OwnerCode = snapshot.CompanyCode;
        for (auto const& [name, records] : snapshot.Tables) {
            auto it = shadow->Tables.find(name);
            if (it == shadow->Tables.end()) {
                throw TWorkspaceError(EWorkspaceError::CacheCommitFailure, "Snapshot carries unregistered table " + name);
            }
            try {
                it->second->BulkLoad(records);
            } catch (const std::exception& e) {
                throw TWorkspaceError(EWorkspaceError::CacheCommitFailure, "Cannot load table " + name + ": " + e.what());
            }
        }

        // Writes made in an unowned cache follow it to its first owner.
        std::vector<TMutation> carried;
        size_t parked = 0;
        for (auto const& m : Live->Pending) {
            if (done.count(m.MutationId)) {
                continue;
            }
            if (Live->OwnerId.empty() || Live->OwnerCode.empty()) {
                carried.push_back(m);
            } else {
                shadow->Parked[Live->OwnerCode].push_back(m);
                ++parked;
            }
        }
        if (!snapshot.CompanyCode.empty()) {
            auto it = shadow->Parked.find(snapshot.CompanyCode);
            if (it != shadow->Parked.end()) {
                auto reclaimed = std::move(it->second);
                shadow->Parked.erase(it);
                reclaimed.insert(reclaimed.end(), carried.begin(), carried.end());
                carried = std::move(reclaimed);
            }
        }
        for (auto const& m : carried) {
            auto it = shadow->Tables.find(m.Table);
            if (it == shadow->Tables.end()) {
                throw TWorkspaceError(EWorkspaceError::CacheCommitFailure, "Pending write targets unregistered table " + m.Table);
            }
            auto current = it->second->Get(m.RecordId);
            if (!current || current->UpdatedAt < m.Timestamp) {
                ApplyToTable(*it->second, m);
            }
            shadow->Pending.push_back(m);
        }

        Persist(*shadow);
        ClearJournalAfterCheckpoint();

        if (parked > 0) {
            spdlog::warn("Parked {} undelivered write(s) of {} until it can reach the remote", parked, Live->OwnerId);
        }
        if (!shadow->Pending.empty()) {
            spdlog::info("{} pending write(s) carried into workspace {}", shadow->Pending.size(), ownerId);
        }
        TCacheGeneration previous(Live);
        Live = std::move(shadow);
        spdlog::info("Local cache now holds workspace {} ({} records, generation {})", ownerId, snapshot.RecordCount(), Live->Generation);
        return previous;
    }

    void TLocalCacheStore::Restore(TCacheGeneration generation) {
        if (generation.Empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Nothing to restore");
        }
        std::lock_guard lk(Mutex_);
        auto contents = std::move(generation.Contents);
        contents->Generation = Live->Generation + 1;
        Persist(*contents);
        ClearJournalAfterCheckpoint();
        Live = std::move(contents);
        spdlog::warn("Local cache restored to workspace {}", Live->OwnerId.empty() ? "<none>" : Live->OwnerId);
    }

    TMergeStats TLocalCacheStore::Merge(const TRecordSnapshot& snapshot) {
        std::lock_guard lk(Mutex_);
        TMergeStats stats;

        auto next = MakeCopy(*Live);

        // latest outstanding local write per record
        std::map<std::pair<std::string, std::string>, TTimePoint> pending;
        for (auto const& m : next->Pending) {
            auto key = std::make_pair(m.Table, m.RecordId);
            auto it = pending.find(key);
            if (it == pending.end() || it->second < m.Timestamp) {
                pending[key] = m.Timestamp;
            }
        }

        for (auto const& kv : snapshot.Tables) {
            if (!next->Tables.count(kv.first)) {
                throw TWorkspaceError(EWorkspaceError::CacheCommitFailure, "Snapshot carries unregistered table " + kv.first);
            }
        }

        for (auto& [name, table] : next->Tables) {
            std::unordered_set<std::string> remoteIds;
            auto rit = snapshot.Tables.find(name);
            if (rit != snapshot.Tables.end()) {
                for (auto const& remote : rit->second) {
                    remoteIds.insert(remote.Id);
                    auto p = pending.find({name, remote.Id});
                    if (p != pending.end() && p->second > remote.UpdatedAt) {
                        ++stats.KeptLocal;
                        continue;
                    }
                    auto local = table->Get(remote.Id);
                    if (!local || local->Data != remote.Data || local->UpdatedAt != remote.UpdatedAt) {
                        table->Upsert(remote);
                        ++stats.Upserted;
                    }
                }
            }
            for (auto const& local : table->List()) {
                if (remoteIds.count(local.Id)) {
                    continue;
                }
                if (pending.count({name, local.Id})) {
                    ++stats.KeptLocal;
                    continue;
                }
                table->Remove(local.Id);
                ++stats.Removed;
            }
        }

        Persist(*next);
        ClearJournalAfterCheckpoint();
        Live = std::move(next);
        spdlog::debug("Merged remote changes: {} upserted, {} removed, {} kept local", stats.Upserted, stats.Removed, stats.KeptLocal);
        return stats;
    }

    TRecord TLocalCacheStore::Upsert(const std::string& table, const std::string& id, const json& data) {
        if (id.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Record id cannot be empty");
        }
        std::lock_guard lk(Mutex_);
        RequireTable(*Live, table);

        TMutation m;
        m.MutationId = GenerateMutationId();
        m.Table = table;
        m.RecordId = id;
        m.Op = EMutationOp::Upsert;
        m.Data = data;
        m.Timestamp = Now();

        Storage->AppendJournal(json{{"generation", Live->Generation}, {"mutation", MutationToJson(m)}});
        ApplyMutation(*Live, m);
        return TRecord{table, id, data, m.Timestamp};
    }

    bool TLocalCacheStore::Remove(const std::string& table, const std::string& id) {
        std::lock_guard lk(Mutex_);
        auto& t = RequireTable(*Live, table);
        if (!t.Get(id)) {
            return false;
        }

        TMutation m;
        m.MutationId = GenerateMutationId();
        m.Table = table;
        m.RecordId = id;
        m.Op = EMutationOp::Remove;
        m.Timestamp = Now();

        Storage->AppendJournal(json{{"generation", Live->Generation}, {"mutation", MutationToJson(m)}});
        ApplyMutation(*Live, m);
        return true;
    }

    std::optional<TRecord> TLocalCacheStore::Get(const std::string& table, const std::string& id) const {
        std::lock_guard lk(Mutex_);
        return RequireTable(*Live, table).Get(id);
    }

    std::vector<TRecord> TLocalCacheStore::List(const std::string& table) const {
        std::lock_guard lk(Mutex_);
        return RequireTable(*Live, table).List();
    }

    size_t TLocalCacheStore::Count(const std::string& table) const {
        std::lock_guard lk(Mutex_);
        return RequireTable(*Live, table).Size();
    }

    size_t TLocalCacheStore::TotalCount() const {
        std::lock_guard lk(Mutex_);
        size_t n = 0;
        for (auto const& kv : Live->Tables) {
            n += kv.second->Size();
        }
        return n;
    }

    std::vector<TMutation> TLocalCacheStore::PendingMutations() const {
        std::lock_guard lk(Mutex_);
        return Live->Pending;
    }

    void TLocalCacheStore::Acknowledge(const std::vector<std::string>& mutationIds) {
        if (mutationIds.empty()) {
            return;
        }
        std::set<std::string> acked(mutationIds.begin(), mutationIds.end());

        auto isAcked = [&](const TMutation& m) {
            return acked.count(m.MutationId) > 0;
        };

        std::lock_guard lk(Mutex_);
        auto next = MakeCopy(*Live);
        size_t dropped = 0;
        auto drop = [&](std::vector<TMutation>& list) {
            auto tail = std::remove_if(list.begin(), list.end(), isAcked);
            dropped += static_cast<size_t>(std::distance(tail, list.end()));
            list.erase(tail, list.end());
        };
        drop(next->Pending);
        for (auto it = next->Parked.begin(); it != next->Parked.end();) {
            drop(it->second);
            it = it->second.empty() ? next->Parked.erase(it) : std::next(it);
        }
        if (dropped == 0) {
            return;
        }

        Persist(*next);
        ClearJournalAfterCheckpoint();
        Live = std::move(next);
    }

    std::map<std::string, std::vector<TMutation>> TLocalCacheStore::ParkedMutations() const {
        std::lock_guard lk(Mutex_);
        return Live->Parked;
    }

    void TLocalCacheStore::Claim(const WorkspaceId& ownerId, const std::string& companyCode) {
        if (ownerId.empty() || companyCode.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Cache owner needs an id and a company code");
        }
        std::lock_guard lk(Mutex_);
        if (Live->OwnerId == ownerId) {
            return;
        }
        if (!Live->OwnerId.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Local cache already belongs to " + Live->OwnerId);
        }
        auto next = MakeCopy(*Live);
        next->OwnerId = ownerId;
        next->OwnerCode = companyCode;
        Persist(*next);
        ClearJournalAfterCheckpoint();
        Live = std::move(next);
        spdlog::info("Local cache with {} pending write(s) now belongs to {}", Live->Pending.size(), ownerId);
    }

    std::string TLocalCacheStore::OwnerId() const {
        std::lock_guard lk(Mutex_);
        return Live->OwnerId;
    }

    std::string TLocalCacheStore::OwnerCode() const {
        std::lock_guard lk(Mutex_);
        return Live->OwnerCode;
    }

    uint64_t TLocalCacheStore::Generation() const {
        std::lock_guard lk(Mutex_);
        return Live->Generation;
    }

    std::vector<std::string> TLocalCacheStore::TableNames() const {
        std::lock_guard lk(Mutex_);
        std::vector<std::string> out;
        for (auto const& kv : Live->Tables) {
            out.push_back(kv.first);
        }
        return out;
    }

    std::map<std::string, std::vector<TRecord>> TLocalCacheStore::Dump() const {
        std::lock_guard lk(Mutex_);
        std::map<std::string, std::vector<TRecord>> out;
        for (auto const& kv : Live->Tables) {
            out[kv.first] = kv.second->List();
        }
        return out;
    }

} // namespace NWorkspace
