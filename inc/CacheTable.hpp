#pragma once
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common.hpp"

namespace NWorkspace {

    // Capability every operational table implements so the cache can clear,
    // bulk-load and shadow the whole registered set without knowing table names.
    struct ICacheTable {
        virtual ~ICacheTable() = default;
        virtual const std::string& Name() const = 0;

        // An empty table of the same kind, used as the shadow during a swap.
        virtual std::unique_ptr<ICacheTable> MakeEmpty() const = 0;
        virtual std::unique_ptr<ICacheTable> Clone() const = 0;

        virtual void Clear() = 0;
        virtual void BulkLoad(const std::vector<TRecord>& records) = 0;

        virtual void Upsert(const TRecord& record) = 0;
        virtual bool Remove(const std::string& id) = 0;
        virtual std::optional<TRecord> Get(const std::string& id) const = 0;
        virtual std::vector<TRecord> List() const = 0;
        virtual size_t Size() const = 0;
    };

    class TJsonCacheTable final: public ICacheTable {
    public:
        explicit TJsonCacheTable(std::string name)
            : Name_(std::move(name)) {
        }

        const std::string& Name() const override {
            return Name_;
        }

        std::unique_ptr<ICacheTable> MakeEmpty() const override {
            return std::make_unique<TJsonCacheTable>(Name_);
        }

        std::unique_ptr<ICacheTable> Clone() const override {
            return std::make_unique<TJsonCacheTable>(*this);
        }

        void Clear() override {
            Rows.clear();
        }

        void BulkLoad(const std::vector<TRecord>& records) override {
            for (auto const& r : records) {
                if (r.Id.empty()) {
                    throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Record without id in table " + Name_);
                }
                if (!r.Table.empty() && r.Table != Name_) {
                    throw TWorkspaceError(EWorkspaceError::InvalidArgument, "Record " + r.Id + " belongs to " + r.Table + ", not " + Name_);
                }
                TRecord copy = r;
                copy.Table = Name_;
                Rows[copy.Id] = std::move(copy);
            }
        }

        void Upsert(const TRecord& record) override {
            TRecord copy = record;
            copy.Table = Name_;
            Rows[copy.Id] = std::move(copy);
        }

        bool Remove(const std::string& id) override {
            return Rows.erase(id) > 0;
        }

        std::optional<TRecord> Get(const std::string& id) const override {
            auto it = Rows.find(id);
            if (it == Rows.end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::vector<TRecord> List() const override {
            std::vector<TRecord> out;
            out.reserve(Rows.size());
            for (auto const& kv : Rows) {
                out.push_back(kv.second);
            }
            return out;
        }

        size_t Size() const override {
            return Rows.size();
        }

    private:
        std::string Name_;
        std::map<std::string, TRecord> Rows;
    };

    inline const std::vector<std::string>& DefaultTableNames() {
        static const std::vector<std::string> names = {
            "products", "categories", "units", "customers",
            "orders", "branches", "staff", "stock_adjustments",
            "ingredients", "recipes", "suppliers", "accounts",
            "expenses", "employees", "promotions", "memberships"};
        return names;
    }

} // namespace NWorkspace
