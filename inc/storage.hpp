#pragma once
#include "common.hpp"
#include <vector>
#include <mutex>
#include <optional>

namespace NWorkspace {

    // A durable state document written as one unit, plus an append-only journal.
    struct IStorage {
        virtual ~IStorage() = default;
        virtual void SaveState(const json& snapshot) = 0;
        virtual json LoadState() = 0;
        virtual void AppendJournal(const json& entry) = 0;
        virtual std::vector<json> LoadJournal() = 0;
        virtual void ClearJournal() = 0;
    };

    class TMemoryStorage: public IStorage {
    public:
        TMemoryStorage() = default;

        void SaveState(const json& snapshot) override {
            std::scoped_lock lk(Mutex_);
            Snapshot = snapshot;
        }

        json LoadState() override {
            std::scoped_lock lk(Mutex_);
            return Snapshot;
        }

        void AppendJournal(const json& entry) override {
            std::scoped_lock lk(Mutex_);
            Journal.push_back(entry);
        }

        std::vector<json> LoadJournal() override {
            std::scoped_lock lk(Mutex_);
            return Journal;
        }

        void ClearJournal() override {
            std::scoped_lock lk(Mutex_);
            Journal.clear();
        }

    private:
        json Snapshot = json::object();
        std::vector<json> Journal;
        std::mutex Mutex_;
    };

} // namespace NWorkspace
