#pragma once
#include <memory>
#include <vector>

#include "LocalCacheStore.hpp"
#include "RemoteStore.hpp"
#include "WorkspaceRegistry.hpp"
#include "common.hpp"
#include "retry.hpp"

namespace NWorkspace {

    struct TSyncReport {
        WorkspaceId Workspace;
        size_t Pushed = 0;
        size_t Ignored = 0;
        // true when the pull replaced the cache instead of merging into it
        bool Adopted = false;
        TMergeStats Merged;
        size_t RecordCount = 0;
        size_t ParkedDelivered = 0;
    };

    class TSyncEngine {
    public:
        TSyncEngine(std::shared_ptr<TWorkspaceRegistry> registry,
                    std::shared_ptr<TLocalCacheStore> cache,
                    std::shared_ptr<IRemoteStore> remote,
                    TRetryPolicy policy = {},
                    TSleeper sleeper = ThreadSleeper());

        // Fetches the workspace's full record set. Nothing is applied locally.
        TRecordSnapshot Pull(const TWorkspace& workspace);
        TPushAck Push(const TWorkspace& workspace, const std::vector<TMutation>& mutations);

        // Pushes the cache outbox if the cache belongs to `workspace` and acknowledges what the remote took.
        TPushAck PushOutbox(const TWorkspace& workspace);

        // Best effort: parked writes of other workspaces go to their record sets, failures stay parked.
        size_t DeliverParked();

        TSyncReport SyncCurrent();

        // The workspace list kept on the remote under `account`, so another device can pick it up.
        void PublishWorkspaceList(const std::string& account);
        // Merges the published list into the registry. Returns the number of workspaces added.
        size_t RestoreWorkspaceList(const std::string& account);

        const TRetryPolicy& Policy() const {
            return Policy_;
        }

    private:
        TPushAck PushTo(const std::string& companyCode, const std::string& label, const std::vector<TMutation>& mutations);
        // Ids the remote took or already had. Failures are logged and leave the writes where they are.
        std::vector<std::string> TryDeliver(const std::string& companyCode, const std::string& label, const std::vector<TMutation>& mutations);

    private:
        std::shared_ptr<TWorkspaceRegistry> Registry;
        std::shared_ptr<TLocalCacheStore> Cache;
        std::shared_ptr<IRemoteStore> Remote;
        TRetryPolicy Policy_;
        TSleeper Sleeper;
    };

} // namespace NWorkspace
