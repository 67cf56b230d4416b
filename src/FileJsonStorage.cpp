#include <FileJsonStorage.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace NWorkspace {

    TFileJsonStorage::TFileJsonStorage(std::filesystem::path snapshotPath, std::filesystem::path journalPath)
        : SnapshotPath_(std::move(snapshotPath))
        , JournalPath_(std::move(journalPath)) {
    }

    void TFileJsonStorage::AtomicWrite(const std::filesystem::path& path, const std::string& content) {
        std::error_code ec;
        auto tmp = path;
        tmp += ".tmp";

        if (!path.parent_path().empty()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw TWorkspaceError(EWorkspaceError::StorageFailure, "Cannot create directory " + path.parent_path().string() + ": " + ec.message());
            }
        }

        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Cannot open temp file for writing: " + tmp.string());
        }
        ofs << content;
        ofs.close();
        if (!ofs) {
            std::filesystem::remove(tmp, ec);
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Short write to " + tmp.string());
        }

        std::filesystem::rename(tmp, path, ec);
        if (ec) {
            std::error_code ignored;
            std::filesystem::remove(tmp, ignored);
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Atomic rename failed: " + ec.message());
        }
    }

    void TFileJsonStorage::SaveState(const json& snapshot) {
        std::scoped_lock lk(Mutex_);
        AtomicWrite(SnapshotPath_, snapshot.dump(2));
    }

    json TFileJsonStorage::LoadState() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(SnapshotPath_)) {
            return json::object();
        }
        std::ifstream ifs(SnapshotPath_);
        if (!ifs) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Cannot open " + SnapshotPath_.string());
        }
        try {
            json j;
            ifs >> j;
            return j;
        } catch (const json::parse_error& e) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Corrupt state file " + SnapshotPath_.string() + ": " + e.what());
        }
    }

    void TFileJsonStorage::AppendJournal(const json& entry) {
        std::scoped_lock lk(Mutex_);
        if (!JournalPath_.parent_path().empty()) {
            std::error_code ec;
            std::filesystem::create_directories(JournalPath_.parent_path(), ec);
            if (ec) {
                throw TWorkspaceError(EWorkspaceError::StorageFailure, "Cannot create directory " + JournalPath_.parent_path().string() + ": " + ec.message());
            }
        }
        std::ofstream ofs(JournalPath_, std::ios::app);
        if (!ofs) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Cannot open journal file for append: " + JournalPath_.string());
        }
        ofs << entry.dump() << '\n';
        ofs.flush();
        if (!ofs) {
            throw TWorkspaceError(EWorkspaceError::StorageFailure, "Journal append failed: " + JournalPath_.string());
        }
    }

    std::vector<json> TFileJsonStorage::LoadJournal() {
        std::scoped_lock lk(Mutex_);
        std::vector<json> out;
        if (!std::filesystem::exists(JournalPath_)) {
            return out;
        }
        std::ifstream ifs(JournalPath_);
        std::string line;
        size_t lineNo = 0;
        while (std::getline(ifs, line)) {
            ++lineNo;
            if (line.empty()) {
                continue;
            }
            try {
                out.push_back(json::parse(line));
            } catch (const json::parse_error& e) {
                // a crash mid-append leaves a torn last line
                spdlog::warn("Skipping unreadable journal line {} in {}: {}", lineNo, JournalPath_.string(), e.what());
            }
        }
        return out;
    }

    void TFileJsonStorage::ClearJournal() {
        std::scoped_lock lk(Mutex_);
        if (!std::filesystem::exists(JournalPath_)) {
            return;
        }
        AtomicWrite(JournalPath_, "");
    }

} // namespace NWorkspace
