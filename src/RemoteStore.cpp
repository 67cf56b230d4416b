#include <RemoteStore.hpp>
#include <FileJsonStorage.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>

namespace NWorkspace {

    TPushAck TRemoteRecordSet::Apply(const std::vector<TMutation>& mutations) {
        for (auto const& m : mutations) {
            if (m.MutationId.empty() || m.Table.empty() || m.RecordId.empty()) {
                throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Malformed mutation in batch for " + MaskCompanyCode(CompanyCode, 2));
            }
        }

        TPushAck ack;
        for (auto const& m : mutations) {
            if (AppliedIds.count(m.MutationId)) {
                ack.Ignored.push_back(m.MutationId);
                continue;
            }
            AppliedIds.insert(m.MutationId);

            TKey key{m.Table, m.RecordId};
            std::optional<TTimePoint> stamp;
            if (auto it = Records.find(key); it != Records.end()) {
                stamp = it->second.UpdatedAt;
            }
            if (auto it = Tombstones.find(key); it != Tombstones.end()) {
                stamp = stamp ? std::max(*stamp, it->second) : it->second;
            }
            if (stamp && m.Timestamp <= *stamp) {
                ack.Ignored.push_back(m.MutationId);
                continue;
            }

            if (m.Op == EMutationOp::Upsert) {
                Records[key] = TRecord{m.Table, m.RecordId, m.Data, m.Timestamp};
                Tombstones.erase(key);
            } else {
                Records.erase(key);
                Tombstones[key] = m.Timestamp;
            }
            ack.Applied.push_back(m.MutationId);
        }
        return ack;
    }

    void TRemoteRecordSet::Put(const TRecord& record) {
        TKey key{record.Table, record.Id};
        Records[key] = record;
        Tombstones.erase(key);
    }

    TRecordSnapshot TRemoteRecordSet::ToSnapshot() const {
        TRecordSnapshot snap;
        snap.CompanyCode = CompanyCode;
        snap.FetchedAt = Now();
        for (auto const& kv : Records) {
            snap.Tables[kv.first.first].push_back(kv.second);
        }
        return snap;
    }

    json TRemoteRecordSet::ToJson() const {
        json j = json::object();
        j["company_code"] = CompanyCode;
        j["records"] = json::array();
        for (auto const& kv : Records) {
            j["records"].push_back(RecordToJson(kv.second));
        }
        j["tombstones"] = json::array();
        for (auto const& kv : Tombstones) {
            j["tombstones"].push_back(json{{"table", kv.first.first}, {"id", kv.first.second}, {"at", ToMillis(kv.second)}});
        }
        j["applied"] = AppliedIds;
        return j;
    }

    TRemoteRecordSet TRemoteRecordSet::FromJson(const json& j) {
        TRemoteRecordSet set(j.at("company_code").get<std::string>());
        for (auto const& jr : j.value("records", json::array())) {
            TRecord r;
            FromJsonInternal(jr, r);
            set.Records[{r.Table, r.Id}] = std::move(r);
        }
        for (auto const& jt : j.value("tombstones", json::array())) {
            set.Tombstones[{jt.at("table").get<std::string>(), jt.at("id").get<std::string>()}] = FromMillis(jt.at("at").get<long long>());
        }
        for (auto const& id : j.value("applied", json::array())) {
            set.AppliedIds.insert(id.get<std::string>());
        }
        return set;
    }

    void TMemoryRemoteStore::CheckAvailable(const std::string& companyCode) const {
        if (!Reachable) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, "Remote store is offline");
        }
        if (Revoked.count(companyCode)) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Access to " + MaskCompanyCode(companyCode, 2) + " was revoked");
        }
    }

    TRecordSnapshot TMemoryRemoteStore::Fetch(const std::string& companyCode) {
        ++FetchCount_;
        TFetchHook hook;
        {
            std::scoped_lock lk(Mutex_);
            hook = FetchHook;
        }
        if (hook) {
            hook(companyCode);
        }

        std::scoped_lock lk(Mutex_);
        if (FailingFetches > 0) {
            --FailingFetches;
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, "Fetch timed out");
        }
        CheckAvailable(companyCode);
        auto it = Sets.find(companyCode);
        if (it == Sets.end()) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Unknown company code " + MaskCompanyCode(companyCode, 2));
        }
        return it->second.ToSnapshot();
    }

    TPushAck TMemoryRemoteStore::Submit(const std::string& companyCode, const std::vector<TMutation>& mutations) {
        ++SubmitCount_;
        std::scoped_lock lk(Mutex_);
        CheckAvailable(companyCode);
        auto it = Sets.try_emplace(companyCode, TRemoteRecordSet(companyCode)).first;
        return it->second.Apply(mutations);
    }

    void TMemoryRemoteStore::PublishWorkspaceList(const std::string& account, const json& document) {
        std::scoped_lock lk(Mutex_);
        if (!Reachable) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, "Remote store is offline");
        }
        WorkspaceLists[account] = document;
    }

    std::optional<json> TMemoryRemoteStore::FetchWorkspaceList(const std::string& account) {
        std::scoped_lock lk(Mutex_);
        if (!Reachable) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, "Remote store is offline");
        }
        auto it = WorkspaceLists.find(account);
        if (it == WorkspaceLists.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void TMemoryRemoteStore::Seed(const std::string& companyCode, const std::vector<TRecord>& records) {
        std::scoped_lock lk(Mutex_);
        auto it = Sets.try_emplace(companyCode, TRemoteRecordSet(companyCode)).first;
        for (auto const& r : records) {
            it->second.Put(r);
        }
    }

    void TMemoryRemoteStore::SetReachable(bool reachable) {
        std::scoped_lock lk(Mutex_);
        Reachable = reachable;
    }

    void TMemoryRemoteStore::Revoke(const std::string& companyCode) {
        std::scoped_lock lk(Mutex_);
        Revoked.insert(companyCode);
    }

    void TMemoryRemoteStore::Reinstate(const std::string& companyCode) {
        std::scoped_lock lk(Mutex_);
        Revoked.erase(companyCode);
    }

    void TMemoryRemoteStore::FailNextFetches(size_t count) {
        std::scoped_lock lk(Mutex_);
        FailingFetches = count;
    }

    void TMemoryRemoteStore::SetFetchHook(TFetchHook hook) {
        std::scoped_lock lk(Mutex_);
        FetchHook = std::move(hook);
    }

    TFileRemoteStore::TFileRemoteStore(std::filesystem::path dir)
        : Dir_(std::move(dir)) {
    }

    void TFileRemoteStore::CheckReachable() const {
        std::error_code ec;
        if (!std::filesystem::is_directory(Dir_, ec)) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, "Remote directory " + Dir_.string() + " is not available");
        }
    }

    namespace {

        bool IsFileSafe(const std::string& key) {
            return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
                return std::isalnum(c) || c == '-' || c == '_';
            });
        }

    } // namespace

    std::filesystem::path TFileRemoteStore::PathFor(const std::string& companyCode) const {
        if (!IsFileSafe(companyCode)) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Malformed company code");
        }
        return Dir_ / (companyCode + ".json");
    }

    std::filesystem::path TFileRemoteStore::ListPathFor(const std::string& account) const {
        if (!IsFileSafe(account)) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Malformed account name");
        }
        return Dir_ / "accounts" / (account + ".json");
    }

    TRecordSnapshot TFileRemoteStore::Fetch(const std::string& companyCode) {
        std::scoped_lock lk(Mutex_);
        CheckReachable();
        auto path = PathFor(companyCode);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, "Unknown company code " + MaskCompanyCode(companyCode, 2));
        }

        TFileJsonStorage storage(path, path.string() + ".log");
        json doc;
        try {
            doc = storage.LoadState();
        } catch (const TWorkspaceError& e) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, e.what());
        }
        try {
            return TRemoteRecordSet::FromJson(doc).ToSnapshot();
        } catch (const json::exception& e) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, std::string("Remote record set is damaged: ") + e.what());
        }
    }

    TPushAck TFileRemoteStore::Submit(const std::string& companyCode, const std::vector<TMutation>& mutations) {
        std::scoped_lock lk(Mutex_);
        CheckReachable();
        auto path = PathFor(companyCode);
        TFileJsonStorage storage(path, path.string() + ".log");

        try {
            json doc = storage.LoadState();
            TRemoteRecordSet set(companyCode);
            if (!doc.empty()) {
                set = TRemoteRecordSet::FromJson(doc);
            } else {
                spdlog::info("Creating remote record set for {}", MaskCompanyCode(companyCode, 2));
            }

            TPushAck ack = set.Apply(mutations);
            storage.SaveState(set.ToJson());
            storage.AppendJournal(json{{"at", ToMillis(Now())}, {"applied", ack.Applied.size()}, {"ignored", ack.Ignored.size()}});
            return ack;
        } catch (const json::exception& e) {
            throw TWorkspaceError(EWorkspaceError::RemoteRejected, std::string("Remote record set is damaged: ") + e.what());
        } catch (const TWorkspaceError& e) {
            if (e.Code() != EWorkspaceError::StorageFailure) {
                throw;
            }
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, e.what());
        }
    }

    void TFileRemoteStore::PublishWorkspaceList(const std::string& account, const json& document) {
        std::scoped_lock lk(Mutex_);
        CheckReachable();
        auto path = ListPathFor(account);
        TFileJsonStorage storage(path, path.string() + ".log");
        try {
            storage.SaveState(document);
            storage.AppendJournal(json{{"at", ToMillis(Now())}, {"op", "publish"}});
        } catch (const TWorkspaceError& e) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, e.what());
        }
    }

    std::optional<json> TFileRemoteStore::FetchWorkspaceList(const std::string& account) {
        std::scoped_lock lk(Mutex_);
        CheckReachable();
        auto path = ListPathFor(account);
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return std::nullopt;
        }
        TFileJsonStorage storage(path, path.string() + ".log");
        try {
            return storage.LoadState();
        } catch (const TWorkspaceError& e) {
            throw TWorkspaceError(EWorkspaceError::RemoteUnreachable, e.what());
        }
    }

} // namespace NWorkspace
