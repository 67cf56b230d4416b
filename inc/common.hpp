#pragma once
#include <string>
#include <vector>
#include <map>
#include <chrono>
#include <optional>
#include <random>
#include <nlohmann/json.hpp>

#include "errors.hpp"

using json = nlohmann::json;

namespace NWorkspace {

    using WorkspaceId = std::string;
    using TTimePoint = std::chrono::system_clock::time_point;

    enum class ESyncStatus {
        Never,
        Synced,
        Pending,
        Error
    };

    struct TWorkspace {
        WorkspaceId Id;
        std::string Name;
        std::string ShopType;
        std::string Currency;
        std::optional<std::string> Address;
        std::string CompanyCode; // credential-adjacent, log it masked
        std::optional<std::string> Logo;
        bool IsDefault = false;
        TTimePoint CreatedAt{};
        TTimePoint LastAccessedAt{};
        std::optional<TTimePoint> LastSyncAt;
        ESyncStatus SyncStatus = ESyncStatus::Never;
    };

    // Descriptive fields a caller may change after creation.
    struct TWorkspacePatch {
        std::optional<std::string> Name;
        std::optional<std::string> ShopType;
        std::optional<std::string> Currency;
        std::optional<std::string> Address;
        std::optional<std::string> Logo;
    };

    struct TRecord {
        std::string Table;
        std::string Id;
        json Data = json::object();
        TTimePoint UpdatedAt{};
    };

    enum class EMutationOp {
        Upsert,
        Remove
    };

    struct TMutation {
        std::string MutationId;
        std::string Table;
        std::string RecordId;
        EMutationOp Op = EMutationOp::Upsert;
        json Data = json::object();
        TTimePoint Timestamp{};
    };

    struct TRecordSnapshot {
        std::string CompanyCode;
        std::map<std::string, std::vector<TRecord>> Tables;
        TTimePoint FetchedAt{};

        size_t RecordCount() const {
            size_t n = 0;
            for (auto const& kv : Tables) {
                n += kv.second.size();
            }
            return n;
        }
    };

    struct TPushAck {
        std::vector<std::string> Applied;
        std::vector<std::string> Ignored; // already applied, or older than the remote value
    };

    inline TTimePoint Now() {
        return std::chrono::system_clock::now();
    }

    inline long long ToMillis(TTimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
    }

    inline TTimePoint FromMillis(long long ms) {
        return TTimePoint(std::chrono::milliseconds(ms));
    }

    inline const char* ToString(ESyncStatus s) {
        switch (s) {
            case ESyncStatus::Never:
                return "never";
            case ESyncStatus::Synced:
                return "synced";
            case ESyncStatus::Pending:
                return "pending";
            case ESyncStatus::Error:
                return "error";
        }
        return "never";
    }

    inline ESyncStatus SyncStatusFromString(const std::string& s) {
        if (s == "synced") {
            return ESyncStatus::Synced;
        }
        if (s == "pending") {
            return ESyncStatus::Pending;
        }
        if (s == "error") {
            return ESyncStatus::Error;
        }
        return ESyncStatus::Never;
    }

    inline void ToJSON(json& j, TWorkspace const& w) {
        j = json{{"id", w.Id}, {"name", w.Name}, {"shop_type", w.ShopType}, {"currency", w.Currency}, {"company_code", w.CompanyCode}, {"is_default", w.IsDefault}, {"created_at", ToMillis(w.CreatedAt)}, {"last_accessed_at", ToMillis(w.LastAccessedAt)}, {"sync_status", ToString(w.SyncStatus)}};
        if (w.Address) {
            j["address"] = *w.Address;
        }
        if (w.Logo) {
            j["logo"] = *w.Logo;
        }
        if (w.LastSyncAt) {
            j["last_sync_at"] = ToMillis(*w.LastSyncAt);
        }
    }

    inline void FromJsonInternal(json const& j, TWorkspace& w) {
        w.Id = j.at("id").get<std::string>();
        w.Name = j.value("name", "");
        w.ShopType = j.value("shop_type", "");
        w.Currency = j.value("currency", "");
        w.CompanyCode = j.at("company_code").get<std::string>();
        w.IsDefault = j.value("is_default", false);
        w.CreatedAt = FromMillis(j.value("created_at", 0LL));
        w.LastAccessedAt = FromMillis(j.value("last_accessed_at", 0LL));
        w.SyncStatus = SyncStatusFromString(j.value("sync_status", "never"));
        if (j.contains("address")) {
            w.Address = j.at("address").get<std::string>();
        }
        if (j.contains("logo")) {
            w.Logo = j.at("logo").get<std::string>();
        }
        if (j.contains("last_sync_at")) {
            w.LastSyncAt = FromMillis(j.at("last_sync_at").get<long long>());
        }
    }

    inline void ToJSON(json& j, TRecord const& r) {
        j = json{{"table", r.Table}, {"id", r.Id}, {"data", r.Data}, {"updated_at", ToMillis(r.UpdatedAt)}};
    }

    inline void FromJsonInternal(json const& j, TRecord& r) {
        r.Table = j.at("table").get<std::string>();
        r.Id = j.at("id").get<std::string>();
        r.Data = j.value("data", json::object());
        r.UpdatedAt = FromMillis(j.value("updated_at", 0LL));
    }

    inline void ToJSON(json& j, TMutation const& m) {
        j = json{{"mutation_id", m.MutationId}, {"table", m.Table}, {"record_id", m.RecordId}, {"op", m.Op == EMutationOp::Upsert ? "upsert" : "remove"}, {"data", m.Data}, {"timestamp", ToMillis(m.Timestamp)}};
    }

    inline void FromJsonInternal(json const& j, TMutation& m) {
        m.MutationId = j.at("mutation_id").get<std::string>();
        m.Table = j.at("table").get<std::string>();
        m.RecordId = j.at("record_id").get<std::string>();
        m.Op = j.value("op", "upsert") == "remove" ? EMutationOp::Remove : EMutationOp::Upsert;
        m.Data = j.value("data", json::object());
        m.Timestamp = FromMillis(j.value("timestamp", 0LL));
    }

    inline json RecordToJson(const TRecord& r) {
        json j;
        ToJSON(j, r);
        return j;
    }

    inline json MutationToJson(const TMutation& m) {
        json j;
        ToJSON(j, m);
        return j;
    }

    inline json WorkspaceToJson(const TWorkspace& w) {
        json j;
        ToJSON(j, w);
        return j;
    }

    inline std::mt19937_64& RandomEngine() {
        thread_local std::mt19937_64 engine{std::random_device{}()};
        return engine;
    }

    inline std::string RandomString(const std::string& alphabet, size_t len) {
        std::uniform_int_distribution<size_t> pick(0, alphabet.size() - 1);
        std::string out;
        out.reserve(len);
        for (size_t i = 0; i < len; ++i) {
            out.push_back(alphabet[pick(RandomEngine())]);
        }
        return out;
    }

    inline std::string ToBase36(unsigned long long v) {
        static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        if (v == 0) {
            return "0";
        }
        std::string out;
        while (v > 0) {
            out.insert(out.begin(), digits[v % 36]);
            v /= 36;
        }
        return out;
    }

    // ws_<base36 millis>_<6 random base36 chars>
    inline WorkspaceId GenerateWorkspaceId() {
        return "ws_" + ToBase36(static_cast<unsigned long long>(ToMillis(Now()))) + "_" +
               RandomString("0123456789abcdefghijklmnopqrstuvwxyz", 6);
    }

    inline std::string GenerateMutationId() {
        return "mut_" + ToBase36(static_cast<unsigned long long>(ToMillis(Now()))) + "_" +
               RandomString("0123456789abcdefghijklmnopqrstuvwxyz", 10);
    }

    // No 0/O or 1/I, the code is read aloud and typed by hand.
    inline std::string GenerateCompanyCode() {
        return RandomString("ABCDEFGHJKLMNPQRSTUVWXYZ23456789", 8);
    }

    inline std::string MaskCompanyCode(const std::string& code, size_t visibleSuffix = 0) {
        if (visibleSuffix >= code.size()) {
            visibleSuffix = 0;
        }
        std::string out;
        size_t masked = code.size() - visibleSuffix;
        for (size_t i = 0; i < masked; ++i) {
            out += "\xE2\x80\xA2"; // U+2022
        }
        out += code.substr(masked);
        return out;
    }

} // namespace NWorkspace
