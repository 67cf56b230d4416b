#include <SyncEngine.hpp>
#include <spdlog/spdlog.h>

namespace NWorkspace {

    TSyncEngine::TSyncEngine(std::shared_ptr<TWorkspaceRegistry> registry,
                             std::shared_ptr<TLocalCacheStore> cache,
                             std::shared_ptr<IRemoteStore> remote,
                             TRetryPolicy policy,
                             TSleeper sleeper)
        : Registry(std::move(registry))
        , Cache(std::move(cache))
        , Remote(std::move(remote))
        , Policy_(policy)
        , Sleeper(std::move(sleeper)) {
    }

    TRecordSnapshot TSyncEngine::Pull(const TWorkspace& workspace) {
        auto snapshot = RetryTransient(Policy_, Sleeper, "Pull of " + workspace.Id, [&] {
            return Remote->Fetch(workspace.CompanyCode);
        });
        spdlog::debug("Pulled {} record(s) for {}", snapshot.RecordCount(), workspace.Id);
        return snapshot;
    }

    TPushAck TSyncEngine::PushTo(const std::string& companyCode, const std::string& label, const std::vector<TMutation>& mutations) {
        if (mutations.empty()) {
            return {};
        }
        auto ack = RetryTransient(Policy_, Sleeper, "Push to " + label, [&] {
            return Remote->Submit(companyCode, mutations);
        });
        spdlog::debug("Pushed {} mutation(s) for {}: {} applied, {} ignored",
                      mutations.size(), label, ack.Applied.size(), ack.Ignored.size());
        return ack;
    }

    TPushAck TSyncEngine::Push(const TWorkspace& workspace, const std::vector<TMutation>& mutations) {
        return PushTo(workspace.CompanyCode, workspace.Id, mutations);
    }

    std::vector<std::string> TSyncEngine::TryDeliver(const std::string& companyCode, const std::string& label,
                                                     const std::vector<TMutation>& mutations) {
        if (companyCode.empty() || mutations.empty()) {
            return {};
        }
        try {
            auto ack = PushTo(companyCode, label, mutations);
            std::vector<std::string> done = ack.Applied;
            done.insert(done.end(), ack.Ignored.begin(), ack.Ignored.end());
            return done;
        } catch (const TWorkspaceError& e) {
            spdlog::warn("{} write(s) for {} stay undelivered: {}", mutations.size(), label, e.what());
            return {};
        }
    }

    size_t TSyncEngine::DeliverParked() {
        size_t delivered = 0;
        for (auto const& [code, mutations] : Cache->ParkedMutations()) {
            auto done = TryDeliver(code, MaskCompanyCode(code, 2), mutations);
            Cache->Acknowledge(done);
            delivered += done.size();
        }
        if (delivered > 0) {
            spdlog::info("Delivered {} parked write(s)", delivered);
        }
        return delivered;
    }

    TPushAck TSyncEngine::PushOutbox(const TWorkspace& workspace) {
        if (Cache->OwnerId() != workspace.Id) {
            return {};
        }
        auto ack = Push(workspace, Cache->PendingMutations());
        std::vector<std::string> done = ack.Applied;
        done.insert(done.end(), ack.Ignored.begin(), ack.Ignored.end());
        Cache->Acknowledge(done);
        return ack;
    }

    TSyncReport TSyncEngine::SyncCurrent() {
        auto current = Registry->GetCurrent();
        if (!current) {
            throw TWorkspaceError(EWorkspaceError::NotFound, "No current workspace to sync");
        }

        TSyncReport report;
        report.Workspace = current->Id;
        Registry->MarkSyncStatus(current->Id, ESyncStatus::Pending);
        try {
            auto owner = Cache->OwnerId();
            if (owner.empty() && !Cache->PendingMutations().empty()) {
                spdlog::warn("Local cache has pending writes but no owner, they belong to {}", current->Id);
                Cache->Claim(current->Id, current->CompanyCode);
                owner = current->Id;
            }
            if (owner == current->Id) {
                auto ack = PushOutbox(*current);
                report.Pushed = ack.Applied.size();
                report.Ignored = ack.Ignored.size();
            } else if (!owner.empty()) {
                // left behind by a failed rollback; what is not delivered here gets parked by the adopt below
                Cache->Acknowledge(TryDeliver(Cache->OwnerCode(), owner, Cache->PendingMutations()));
            }
            report.ParkedDelivered = DeliverParked();

            auto snapshot = Pull(*current);
            report.RecordCount = snapshot.RecordCount();
            if (owner == current->Id) {
                report.Merged = Cache->Merge(snapshot);
            } else {
                spdlog::warn("Cache holds {} but current workspace is {}, re-hydrating", owner.empty() ? "<none>" : owner, current->Id);
                Cache->Adopt(snapshot, current->Id);
                report.Adopted = true;
            }
            Registry->MarkSynced(current->Id, Now());
        } catch (const TWorkspaceError& e) {
            spdlog::error("Sync of {} failed: {}", current->Id, e.what());
            try {
                Registry->MarkSyncStatus(current->Id, ESyncStatus::Error);
            } catch (const std::exception& inner) {
                spdlog::error("Cannot record sync failure for {}: {}", current->Id, inner.what());
            }
            throw;
        }

        spdlog::info("Synced {}: pushed {}, {} record(s) remote{}", current->Id, report.Pushed, report.RecordCount, report.Adopted ? ", cache re-hydrated" : "");
        return report;
    }

    void TSyncEngine::PublishWorkspaceList(const std::string& account) {
        auto document = Registry->Export();
        RetryTransient(Policy_, Sleeper, "Publish of the workspace list", [&] {
            Remote->PublishWorkspaceList(account, document);
        });
        spdlog::debug("Published {} workspace(s) for {}", document["workspaces"].size(), account);
    }

    size_t TSyncEngine::RestoreWorkspaceList(const std::string& account) {
        auto document = RetryTransient(Policy_, Sleeper, "Fetch of the workspace list", [&] {
            return Remote->FetchWorkspaceList(account);
        });
        if (!document) {
            spdlog::debug("No published workspace list for {}", account);
            return 0;
        }
        return Registry->Import(*document);
    }

} // namespace NWorkspace
