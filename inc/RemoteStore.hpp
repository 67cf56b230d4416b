#pragma once
#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common.hpp"

namespace NWorkspace {

    // The remote-authoritative record log of every workspace, located by company code.
    // Timeouts and transport errors surface as RemoteUnreachable, refusals as RemoteRejected.
    struct IRemoteStore {
        virtual ~IRemoteStore() = default;
        virtual TRecordSnapshot Fetch(const std::string& companyCode) = 0;
        virtual TPushAck Submit(const std::string& companyCode, const std::vector<TMutation>& mutations) = 0;

        // A user's own workspace list, replaced as a whole on every publish.
        virtual void PublishWorkspaceList(const std::string& account, const json& document) = 0;
        virtual std::optional<json> FetchWorkspaceList(const std::string& account) = 0;
    };

    // One company's record set with last-write-wins resolution.
    class TRemoteRecordSet {
    public:
        TRemoteRecordSet() = default;
        explicit TRemoteRecordSet(std::string companyCode)
            : CompanyCode(std::move(companyCode)) {
        }

        // Equal timestamps keep the stored value. Mutation ids already seen are ignored.
        TPushAck Apply(const std::vector<TMutation>& mutations);
        void Put(const TRecord& record);

        TRecordSnapshot ToSnapshot() const;
        json ToJson() const;
        static TRemoteRecordSet FromJson(const json& j);

    private:
        using TKey = std::pair<std::string, std::string>;

        std::string CompanyCode;
        std::map<TKey, TRecord> Records;
        std::map<TKey, TTimePoint> Tombstones;
        std::set<std::string> AppliedIds;
    };

    class TMemoryRemoteStore: public IRemoteStore {
    public:
        using TFetchHook = std::function<void(const std::string& companyCode)>;

        TRecordSnapshot Fetch(const std::string& companyCode) override;
        TPushAck Submit(const std::string& companyCode, const std::vector<TMutation>& mutations) override;
        void PublishWorkspaceList(const std::string& account, const json& document) override;
        std::optional<json> FetchWorkspaceList(const std::string& account) override;

        // Creates the record set if needed and stores the records as they are.
        void Seed(const std::string& companyCode, const std::vector<TRecord>& records);
        void SetReachable(bool reachable);
        void Revoke(const std::string& companyCode);
        void Reinstate(const std::string& companyCode);
        // The next `count` fetches fail as unreachable before touching any data.
        void FailNextFetches(size_t count);
        // Runs at the start of every fetch without the store lock held.
        void SetFetchHook(TFetchHook hook);

        size_t FetchCount() const {
            return FetchCount_.load();
        }

        size_t SubmitCount() const {
            return SubmitCount_.load();
        }

    private:
        void CheckAvailable(const std::string& companyCode) const;

    private:
        mutable std::mutex Mutex_;
        std::map<std::string, TRemoteRecordSet> Sets;
        std::map<std::string, json> WorkspaceLists;
        std::set<std::string> Revoked;
        bool Reachable = true;
        size_t FailingFetches = 0;
        TFetchHook FetchHook;
        std::atomic<size_t> FetchCount_{0};
        std::atomic<size_t> SubmitCount_{0};
    };

    // A directory holding one JSON document per company code, and workspace lists under
    // accounts/. A missing directory behaves like a network share that is not mounted.
    class TFileRemoteStore: public IRemoteStore {
    public:
        explicit TFileRemoteStore(std::filesystem::path dir);

        TRecordSnapshot Fetch(const std::string& companyCode) override;
        TPushAck Submit(const std::string& companyCode, const std::vector<TMutation>& mutations) override;
        void PublishWorkspaceList(const std::string& account, const json& document) override;
        std::optional<json> FetchWorkspaceList(const std::string& account) override;

        const std::filesystem::path& Dir() const {
            return Dir_;
        }

    private:
        std::filesystem::path PathFor(const std::string& companyCode) const;
        std::filesystem::path ListPathFor(const std::string& account) const;
        void CheckReachable() const;

    private:
        std::filesystem::path Dir_;
        std::mutex Mutex_;
    };

} // namespace NWorkspace
