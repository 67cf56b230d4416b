#pragma once
#include <memory>
#include <mutex>
#include <optional>

#include "LocalCacheStore.hpp"
#include "SyncEngine.hpp"
#include "WorkspaceRegistry.hpp"
#include "common.hpp"

namespace NWorkspace {

    enum class ESwitchState {
        Idle,
        Staging,
        Committing,
        RolledBack
    };

    enum class ESyncOutcome {
        Completed,
        Deferred
    };

    inline const char* ToString(ESwitchState s) {
        switch (s) {
            case ESwitchState::Idle:
                return "idle";
            case ESwitchState::Staging:
                return "staging";
            case ESwitchState::Committing:
                return "committing";
            case ESwitchState::RolledBack:
                return "rolled back";
        }
        return "idle";
    }

    // What the user confirms before a switch.
    struct TSwitchPreview {
        std::optional<TWorkspace> Source;
        TWorkspace Target;
    };

    // Moves the client from one workspace to another. At most one switch is in
    // flight; a second request is rejected rather than queued. Remote calls run
    // without the state lock so State(), CancelSwitch() and SyncCurrent() answer
    // while a pull is outstanding.
    class TWorkspaceSwitcher {
    public:
        TWorkspaceSwitcher(std::shared_ptr<TWorkspaceRegistry> registry,
                           std::shared_ptr<TLocalCacheStore> cache,
                           std::shared_ptr<TSyncEngine> sync);

        TSwitchPreview PreviewSwitch(const WorkspaceId& targetId) const;
        TWorkspace RequestSwitch(const WorkspaceId& targetId);
        bool CancelSwitch();

        // Clears an unacknowledged terminal failure. Returns false if there was none.
        bool Acknowledge();

        ESyncOutcome SyncCurrent();

        TRemoveResult DeleteWorkspace(const WorkspaceId& id);
        void SignOutAll();

        std::optional<TWorkspace> CurrentWorkspace() const;
        std::optional<WorkspaceId> TargetWorkspace() const;
        ESwitchState State() const;
        std::optional<TWorkspaceError> PendingFailure() const;

    private:
        TWorkspace RunSwitch(const TSwitchPreview& preview);
        void ThrowIfCancelled(const TWorkspace& target);
        void FinishSwitch(const TWorkspaceError* failure);
        void RunDeferredSync();
        void SetState(ESwitchState state);

    private:
        std::shared_ptr<TWorkspaceRegistry> Registry;
        std::shared_ptr<TLocalCacheStore> Cache;
        std::shared_ptr<TSyncEngine> Sync;

        mutable std::mutex Mutex_;
        // serializes cache-changing work: a switch, a sync, a sign-out
        std::mutex OperationMutex_;

        ESwitchState State_ = ESwitchState::Idle;
        std::optional<WorkspaceId> Target_;
        bool CancelRequested = false;
        bool SyncDeferred = false;
        std::optional<TWorkspaceError> PendingFailure_;
    };

} // namespace NWorkspace
