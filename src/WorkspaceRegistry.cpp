#include <WorkspaceRegistry.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace NWorkspace {

    TWorkspaceRegistry::TWorkspaceRegistry(std::shared_ptr<IStorage> storage)
        : Storage(std::move(storage)) {
        Reload();
    }

    void TWorkspaceRegistry::Reload() {
        std::lock_guard lk(Mutex_);
        json snap = Storage->LoadState();
        try {
            State = StateFromJson(snap);
        } catch (const json::exception& e) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, std::string("Unreadable workspace registry: ") + e.what());
        }
        spdlog::debug("Loaded {} workspace(s), current={}", State.Workspaces.size(), State.CurrentId.value_or("<none>"));
    }

    TRegistryState TWorkspaceRegistry::StateFromJson(const json& j) {
        TRegistryState st;
        if (j.is_object() && j.contains("workspaces") && j["workspaces"].is_array()) {
            for (auto const& jw : j["workspaces"]) {
                TWorkspace w;
                FromJsonInternal(jw, w);
                st.Workspaces[w.Id] = w;
            }
        }
        if (j.is_object() && j.contains("current_id") && j["current_id"].is_string()) {
            st.CurrentId = j["current_id"].get<std::string>();
        }

        if (st.CurrentId && st.Workspaces.find(*st.CurrentId) == st.Workspaces.end()) {
            spdlog::warn("Stored current workspace {} is not in the registry, dropping it", *st.CurrentId);
            st.CurrentId.reset();
        }
        bool seenDefault = false;
        for (auto& kv : st.Workspaces) {
            if (!kv.second.IsDefault) {
                continue;
            }
            if (seenDefault) {
                spdlog::warn("Workspace {} is a second default, clearing its flag", kv.first);
                kv.second.IsDefault = false;
            }
            seenDefault = true;
        }
        return st;
    }

    json TWorkspaceRegistry::StateToJson(const TRegistryState& state) {
        json snap = json::object();
        snap["workspaces"] = json::array();
        for (auto const& kv : state.Workspaces) {
            snap["workspaces"].push_back(WorkspaceToJson(kv.second));
        }
        snap["current_id"] = state.CurrentId ? json(*state.CurrentId) : json(nullptr);
        return snap;
    }

    void TWorkspaceRegistry::Commit(TRegistryState next, json journalEntry) {
        Storage->SaveState(StateToJson(next));
        State = std::move(next);
        journalEntry["at"] = ToMillis(Now());
        try {
            Storage->AppendJournal(journalEntry);
        } catch (const std::exception& e) {
            // the state document is already durable, the journal is an audit trail
            spdlog::error("Registry journal append failed: {}", e.what());
        }
    }

    TWorkspace& TWorkspaceRegistry::Require(TRegistryState& state, const WorkspaceId& id) const {
        auto it = state.Workspaces.find(id);
        if (it == state.Workspaces.end()) {
            throw TWorkspaceError(EWorkspaceError::NotFound, "Unknown workspace " + id);
        }
        return it->second;
    }

    TWorkspace TWorkspaceRegistry::Add(TWorkspace workspace) {
        if (workspace.CompanyCode.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Workspace needs a company code");
        }
        if (workspace.Name.empty()) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Workspace needs a name");
        }

        std::lock_guard lk(Mutex_);
        if (workspace.Id.empty()) {
            workspace.Id = GenerateWorkspaceId();
        }
        if (State.Workspaces.count(workspace.Id)) {
            throw TWorkspaceError(EWorkspaceError::DuplicateWorkspace, "Workspace " + workspace.Id + " already registered");
        }

        auto now = Now();
        if (workspace.CreatedAt == TTimePoint{}) {
            workspace.CreatedAt = now;
        }
        workspace.LastAccessedAt = std::max(workspace.LastAccessedAt, workspace.CreatedAt);

        TRegistryState next = State;
        if (next.Workspaces.empty() || workspace.IsDefault) {
            for (auto& kv : next.Workspaces) {
                kv.second.IsDefault = false;
            }
            workspace.IsDefault = true;
        }
        if (!next.CurrentId) {
            next.CurrentId = workspace.Id;
        }
        next.Workspaces[workspace.Id] = workspace;

        Commit(std::move(next), json{{"op", "add"}, {"id", workspace.Id}, {"name", workspace.Name}});
        spdlog::info("Registered workspace {} ({}) code={}", workspace.Id, workspace.Name, MaskCompanyCode(workspace.CompanyCode, 2));
        return workspace;
    }

    TRemoveResult TWorkspaceRegistry::Remove(const WorkspaceId& id) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        TWorkspace removed = Require(next, id);
        if (next.CurrentId && *next.CurrentId == id) {
            throw TWorkspaceError(EWorkspaceError::CannotRemoveCurrent, "Switch away from " + id + " before removing it");
        }
        next.Workspaces.erase(id);

        Commit(std::move(next), json{{"op", "remove"}, {"id", id}});
        if (removed.IsDefault) {
            spdlog::warn("Removed default workspace {}, no default is set now", id);
        } else {
            spdlog::info("Removed workspace {}", id);
        }
        return TRemoveResult{removed, removed.IsDefault};
    }

    void TWorkspaceRegistry::SetDefault(const WorkspaceId& id) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        Require(next, id);
        for (auto& kv : next.Workspaces) {
            kv.second.IsDefault = (kv.first == id);
        }
        Commit(std::move(next), json{{"op", "set_default"}, {"id", id}});
    }

    void TWorkspaceRegistry::SetCurrent(const WorkspaceId& id) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        auto& target = Require(next, id);
        target.LastAccessedAt = std::max(target.LastAccessedAt, Now());
        next.CurrentId = id;
        Commit(std::move(next), json{{"op", "set_current"}, {"id", id}});
    }

    TWorkspace TWorkspaceRegistry::Update(const WorkspaceId& id, const TWorkspacePatch& patch) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        auto& w = Require(next, id);
        if (patch.Name) {
            if (patch.Name->empty()) {
                throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Workspace name cannot be empty");
            }
            w.Name = *patch.Name;
        }
        if (patch.ShopType) {
            w.ShopType = *patch.ShopType;
        }
        if (patch.Currency) {
            w.Currency = *patch.Currency;
        }
        if (patch.Address) {
            w.Address = *patch.Address;
        }
        if (patch.Logo) {
            w.Logo = *patch.Logo;
        }
        TWorkspace updated = w;
        Commit(std::move(next), json{{"op", "update"}, {"id", id}});
        return updated;
    }

    void TWorkspaceRegistry::MarkSynced(const WorkspaceId& id, TTimePoint at) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        auto& w = Require(next, id);
        w.LastSyncAt = w.LastSyncAt ? std::max(*w.LastSyncAt, at) : at;
        w.SyncStatus = ESyncStatus::Synced;
        Commit(std::move(next), json{{"op", "synced"}, {"id", id}});
    }

    void TWorkspaceRegistry::MarkSyncStatus(const WorkspaceId& id, ESyncStatus status) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;
        auto& w = Require(next, id);
        if (w.SyncStatus == status) {
            return;
        }
        w.SyncStatus = status;
        Commit(std::move(next), json{{"op", "sync_status"}, {"id", id}, {"status", ToString(status)}});
    }

    void TWorkspaceRegistry::Clear() {
        std::lock_guard lk(Mutex_);
        Commit(TRegistryState{}, json{{"op", "clear"}});
        spdlog::info("Workspace registry cleared");
    }

    size_t TWorkspaceRegistry::MergeFrom(const std::vector<TWorkspace>& incoming, const std::optional<WorkspaceId>& currentId) {
        std::lock_guard lk(Mutex_);
        TRegistryState next = State;

        bool hasDefault = std::any_of(next.Workspaces.begin(), next.Workspaces.end(),
                                      [](auto const& kv) { return kv.second.IsDefault; });
        size_t added = 0;
        for (auto w : incoming) {
            if (w.Id.empty() || w.CompanyCode.empty() || next.Workspaces.count(w.Id)) {
                continue;
            }
            bool sameCode = std::any_of(next.Workspaces.begin(), next.Workspaces.end(),
                                        [&](auto const& kv) { return kv.second.CompanyCode == w.CompanyCode; });
            if (sameCode) {
                continue;
            }
            if (w.IsDefault && hasDefault) {
                w.IsDefault = false;
            }
            hasDefault = hasDefault || w.IsDefault;
            next.Workspaces[w.Id] = w;
            ++added;
        }
        if (!next.CurrentId && currentId && next.Workspaces.count(*currentId)) {
            next.CurrentId = currentId;
        }

        if (added == 0 && next.CurrentId == State.CurrentId) {
            return 0;
        }
        Commit(std::move(next), json{{"op", "merge"}, {"added", added}});
        spdlog::info("Merged {} workspace(s) into the registry", added);
        return added;
    }

    size_t TWorkspaceRegistry::Import(const json& document) {
        TRegistryState incoming;
        try {
            incoming = StateFromJson(document);
        } catch (const json::exception& e) {
            throw TWorkspaceError(EWorkspaceError::InvalidArgument, std::string("Unreadable workspace list: ") + e.what());
        }
        std::vector<TWorkspace> workspaces;
        for (auto& kv : incoming.Workspaces) {
            kv.second.LastSyncAt.reset();
            kv.second.SyncStatus = ESyncStatus::Never;
            workspaces.push_back(kv.second);
        }
        return MergeFrom(workspaces, incoming.CurrentId);
    }

    std::vector<TWorkspace> TWorkspaceRegistry::List() const {
        std::lock_guard lk(Mutex_);
        std::vector<TWorkspace> out;
        out.reserve(State.Workspaces.size());
        for (auto const& kv : State.Workspaces) {
            out.push_back(kv.second);
        }
        return out;
    }

    std::optional<TWorkspace> TWorkspaceRegistry::Get(const WorkspaceId& id) const {
        std::lock_guard lk(Mutex_);
        auto it = State.Workspaces.find(id);
        if (it == State.Workspaces.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::optional<TWorkspace> TWorkspaceRegistry::GetCurrent() const {
        std::lock_guard lk(Mutex_);
        if (!State.CurrentId) {
            return std::nullopt;
        }
        return State.Workspaces.at(*State.CurrentId);
    }

    std::optional<WorkspaceId> TWorkspaceRegistry::CurrentId() const {
        std::lock_guard lk(Mutex_);
        return State.CurrentId;
    }

    std::optional<TWorkspace> TWorkspaceRegistry::GetDefault() const {
        std::lock_guard lk(Mutex_);
        for (auto const& kv : State.Workspaces) {
            if (kv.second.IsDefault) {
                return kv.second;
            }
        }
        return std::nullopt;
    }

    std::optional<TWorkspace> TWorkspaceRegistry::FindByCompanyCode(const std::string& companyCode) const {
        std::lock_guard lk(Mutex_);
        for (auto const& kv : State.Workspaces) {
            if (kv.second.CompanyCode == companyCode) {
                return kv.second;
            }
        }
        return std::nullopt;
    }

    bool TWorkspaceRegistry::HasMultiple() const {
        return Size() > 1;
    }

    size_t TWorkspaceRegistry::Size() const {
        std::lock_guard lk(Mutex_);
        return State.Workspaces.size();
    }

    json TWorkspaceRegistry::Export() const {
        std::lock_guard lk(Mutex_);
        return StateToJson(State);
    }

} // namespace NWorkspace
