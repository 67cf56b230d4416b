#include <WorkspaceSwitcher.hpp>
#include <spdlog/spdlog.h>

namespace NWorkspace {

    TWorkspaceSwitcher::TWorkspaceSwitcher(std::shared_ptr<TWorkspaceRegistry> registry,
                                           std::shared_ptr<TLocalCacheStore> cache,
                                           std::shared_ptr<TSyncEngine> sync)
        : Registry(std::move(registry))
        , Cache(std::move(cache))
        , Sync(std::move(sync)) {
    }

    TSwitchPreview TWorkspaceSwitcher::PreviewSwitch(const WorkspaceId& targetId) const {
        auto target = Registry->Get(targetId);
        if (!target) {
            throw TWorkspaceError(EWorkspaceError::NotFound, "Unknown workspace " + targetId);
        }
        auto current = Registry->GetCurrent();
        if (current && current->Id == targetId) {
            throw TWorkspaceError(EWorkspaceError::AlreadyCurrent, targetId + " is already the current workspace");
        }
        return TSwitchPreview{current, *target};
    }

    TWorkspace TWorkspaceSwitcher::RequestSwitch(const WorkspaceId& targetId) {
        TSwitchPreview preview;
        {
            std::lock_guard lk(Mutex_);
            if (PendingFailure_) {
                throw TWorkspaceError(EWorkspaceError::AcknowledgementRequired, std::string("Acknowledge the previous failure first (") + PendingFailure_->what() + ")");
            }
            if (State_ != ESwitchState::Idle) {
                throw TWorkspaceError(EWorkspaceError::SwitchInProgress, "A switch to " + Target_.value_or("?") + " is already running");
            }
            preview = PreviewSwitch(targetId);
            State_ = ESwitchState::Staging;
            Target_ = targetId;
            CancelRequested = false;
        }
        spdlog::info("Switching workspace {} -> {}", preview.Source ? preview.Source->Id : "<none>", targetId);

        TWorkspace result;
        try {
            std::lock_guard op(OperationMutex_);
            result = RunSwitch(preview);
        } catch (const TWorkspaceError& e) {
            spdlog::error("Switch to {} failed: {}", targetId, e.what());
            FinishSwitch(&e);
            RunDeferredSync();
            throw;
        } catch (const std::exception& e) {
            spdlog::error("Switch to {} aborted: {}", targetId, e.what());
            FinishSwitch(nullptr);
            throw;
        }

        FinishSwitch(nullptr);
        spdlog::info("Now working in {} ({})", result.Id, result.Name);
        RunDeferredSync();
        return result;
    }

    TWorkspace TWorkspaceSwitcher::RunSwitch(const TSwitchPreview& preview) {
        const auto& target = preview.Target;

        // Staging: nothing local changes until the commit below, except that writes made
        // before the cache had an owner are given to the source first.
        std::vector<std::string> delivered;
        if (preview.Source) {
            const auto& source = *preview.Source;
            auto owner = Cache->OwnerId();
            if (owner.empty() && !Cache->PendingMutations().empty()) {
                Cache->Claim(source.Id, source.CompanyCode);
                owner = source.Id;
            }
            auto pending = owner == source.Id ? Cache->PendingMutations() : std::vector<TMutation>{};
            if (!pending.empty()) {
                spdlog::info("Delivering {} pending mutation(s) of {} before leaving it", pending.size(), source.Id);
                try {
                    auto ack = Sync->Push(source, pending);
                    delivered = ack.Applied;
                    delivered.insert(delivered.end(), ack.Ignored.begin(), ack.Ignored.end());
                } catch (const TWorkspaceError& e) {
                    // the commit parks them under the source's company code
                    spdlog::warn("Pending writes of {} not delivered, keeping them for a later sync: {}", source.Id, e.what());
                }
            }
        }
        ThrowIfCancelled(target);
        auto snapshot = Sync->Pull(target);
        {
            std::lock_guard lk(Mutex_);
            if (CancelRequested) {
                throw TWorkspaceError(EWorkspaceError::Cancelled, "Switch to " + target.Id + " cancelled");
            }
            State_ = ESwitchState::Committing;
        }

        // Committing
        // writes made while the pull ran are not in `delivered` and get parked too
        auto previous = Cache->Adopt(snapshot, target.Id, delivered);
        try {
            Registry->SetCurrent(target.Id);
        } catch (const std::exception& e) {
            SetState(ESwitchState::RolledBack);
            spdlog::error("Cannot make {} current ({}), restoring the previous cache", target.Id, e.what());
            try {
                Cache->Restore(std::move(previous));
            } catch (const std::exception& re) {
                spdlog::critical("Rollback failed: cache holds {} while the registry points elsewhere; the next sync re-hydrates it ({})", target.Id, re.what());
                throw TWorkspaceError(EWorkspaceError::CacheCommitFailure,
                                      std::string("Switch commit failed (") + e.what() + ") and rollback failed (" + re.what() + ")");
            }
            throw TWorkspaceError(EWorkspaceError::CacheCommitFailure,
                                  std::string("Switch commit failed, previous workspace restored: ") + e.what());
        }

        try {
            Registry->MarkSynced(target.Id, Now());
        } catch (const std::exception& e) {
            // the switch itself is committed at this point
            spdlog::warn("Switched to {} but its sync time was not recorded: {}", target.Id, e.what());
        }
        return Registry->Get(target.Id).value_or(target);
    }

    void TWorkspaceSwitcher::ThrowIfCancelled(const TWorkspace& target) {
        std::lock_guard lk(Mutex_);
        if (CancelRequested) {
            throw TWorkspaceError(EWorkspaceError::Cancelled, "Switch to " + target.Id + " cancelled");
        }
    }

    void TWorkspaceSwitcher::SetState(ESwitchState state) {
        std::lock_guard lk(Mutex_);
        State_ = state;
    }

    void TWorkspaceSwitcher::FinishSwitch(const TWorkspaceError* failure) {
        std::lock_guard lk(Mutex_);
        if (failure && failure->IsTerminal()) {
            PendingFailure_ = *failure;
        }
        State_ = ESwitchState::Idle;
        Target_.reset();
        CancelRequested = false;
    }

    void TWorkspaceSwitcher::RunDeferredSync() {
        {
            std::lock_guard lk(Mutex_);
            if (!SyncDeferred) {
                return;
            }
            SyncDeferred = false;
        }
        spdlog::info("Running deferred sync");
        try {
            std::lock_guard op(OperationMutex_);
            Sync->SyncCurrent();
        } catch (const TWorkspaceError& e) {
            // the registry already carries the error status of the workspace
            spdlog::error("Deferred sync failed: {}", e.what());
            if (e.IsTerminal()) {
                std::lock_guard lk(Mutex_);
                if (!PendingFailure_) {
                    PendingFailure_ = e;
                }
            }
        }
    }

    bool TWorkspaceSwitcher::CancelSwitch() {
        std::lock_guard lk(Mutex_);
        if (State_ != ESwitchState::Staging) {
            return false;
        }
        CancelRequested = true;
        spdlog::info("Cancellation requested for switch to {}", Target_.value_or("?"));
        return true;
    }

    bool TWorkspaceSwitcher::Acknowledge() {
        std::lock_guard lk(Mutex_);
        if (!PendingFailure_) {
            return false;
        }
        spdlog::info("Failure acknowledged: {}", PendingFailure_->what());
        PendingFailure_.reset();
        return true;
    }

    ESyncOutcome TWorkspaceSwitcher::SyncCurrent() {
        {
            std::lock_guard lk(Mutex_);
            if (State_ != ESwitchState::Idle) {
                SyncDeferred = true;
                spdlog::info("Sync deferred until the switch to {} finishes", Target_.value_or("?"));
                return ESyncOutcome::Deferred;
            }
        }

        try {
            std::lock_guard op(OperationMutex_);
            Sync->SyncCurrent();
        } catch (const TWorkspaceError& e) {
            if (e.IsTerminal()) {
                std::lock_guard lk(Mutex_);
                PendingFailure_ = e;
            }
            throw;
        }
        return ESyncOutcome::Completed;
    }

    TRemoveResult TWorkspaceSwitcher::DeleteWorkspace(const WorkspaceId& id) {
        std::lock_guard lk(Mutex_);
        if (State_ != ESwitchState::Idle && Target_ == id) {
            throw TWorkspaceError(EWorkspaceError::SwitchInProgress, id + " is the target of the running switch");
        }
        // remote data stays; the workspace can be joined again with its company code
        return Registry->Remove(id);
    }

    void TWorkspaceSwitcher::SignOutAll() {
        std::lock_guard lk(Mutex_);
        if (State_ != ESwitchState::Idle) {
            throw TWorkspaceError(EWorkspaceError::SwitchInProgress, "Cannot sign out while a switch is running");
        }
        std::lock_guard op(OperationMutex_);
        Cache->ClearAll();
        Registry->Clear();
        PendingFailure_.reset();
        SyncDeferred = false;
        spdlog::info("Signed out of all workspaces");
    }

    std::optional<TWorkspace> TWorkspaceSwitcher::CurrentWorkspace() const {
        return Registry->GetCurrent();
    }

    std::optional<WorkspaceId> TWorkspaceSwitcher::TargetWorkspace() const {
        std::lock_guard lk(Mutex_);
        return Target_;
    }

    ESwitchState TWorkspaceSwitcher::State() const {
        std::lock_guard lk(Mutex_);
        return State_;
    }

    std::optional<TWorkspaceError> TWorkspaceSwitcher::PendingFailure() const {
        std::lock_guard lk(Mutex_);
        return PendingFailure_;
    }

} // namespace NWorkspace
