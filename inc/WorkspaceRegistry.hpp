#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "common.hpp"
#include "storage.hpp"

namespace NWorkspace {

    struct TRemoveResult {
        TWorkspace Removed;
        // The registry has no default afterwards; picking a new one is the caller's decision.
        bool WasDefault = false;
    };

    struct TRegistryState {
        std::map<WorkspaceId, TWorkspace> Workspaces;
        std::optional<WorkspaceId> CurrentId;
    };

    class TWorkspaceRegistry {
    public:
        explicit TWorkspaceRegistry(std::shared_ptr<IStorage> storage);

        TWorkspace Add(TWorkspace workspace);
        TRemoveResult Remove(const WorkspaceId& id);
        void SetDefault(const WorkspaceId& id);
        void SetCurrent(const WorkspaceId& id);
        TWorkspace Update(const WorkspaceId& id, const TWorkspacePatch& patch);
        void MarkSynced(const WorkspaceId& id, TTimePoint at);
        void MarkSyncStatus(const WorkspaceId& id, ESyncStatus status);
        void Clear();

        // Adds workspaces not known locally and adopts currentId if none is set.
        // Returns the number of workspaces added.
        size_t MergeFrom(const std::vector<TWorkspace>& incoming, const std::optional<WorkspaceId>& currentId);
        // MergeFrom for a document written by Export on another device. Sync state starts over.
        size_t Import(const json& document);

        std::vector<TWorkspace> List() const;
        std::optional<TWorkspace> Get(const WorkspaceId& id) const;
        std::optional<TWorkspace> GetCurrent() const;
        std::optional<WorkspaceId> CurrentId() const;
        std::optional<TWorkspace> GetDefault() const;
        std::optional<TWorkspace> FindByCompanyCode(const std::string& companyCode) const;
        bool HasMultiple() const;
        size_t Size() const;

        json Export() const;

    private:
        void Reload();
        // Persists `next` as one unit and only then makes it the live state.
        void Commit(TRegistryState next, json journalEntry);

        static json StateToJson(const TRegistryState& state);
        static TRegistryState StateFromJson(const json& j);

        TWorkspace& Require(TRegistryState& state, const WorkspaceId& id) const;

    private:
        std::shared_ptr<IStorage> Storage;
        mutable std::mutex Mutex_;
        TRegistryState State;
    };

} // namespace NWorkspace
