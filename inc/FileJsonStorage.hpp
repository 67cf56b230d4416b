#pragma once
#include "storage.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <mutex>
#include <string>

namespace NWorkspace {

    class TFileJsonStorage: public IStorage {
    public:
        TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath);

        void SaveState(const json& snapshot) override;
        json LoadState() override;
        void AppendJournal(const json& entry) override;
        std::vector<json> LoadJournal() override;
        void ClearJournal() override;

        const std::filesystem::path& SnapshotPath() const {
            return SnapshotPath_;
        }

    private:
        void AtomicWrite(const std::filesystem::path& path, const std::string& content);

    private:
        std::filesystem::path SnapshotPath_;
        std::filesystem::path JournalPath_;
        std::mutex Mutex_;
    };

} // namespace NWorkspace
