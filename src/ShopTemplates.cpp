#include <ShopTemplates.hpp>
#include <algorithm>
#include <cctype>

namespace NWorkspace {

    const std::vector<TShopTemplate>& ShopTemplates() {
        static const std::vector<TShopTemplate> templates = {
            {"cafe",
             {{"cat-hot-drinks", "Hot Drinks", "☕", 1},
              {"cat-cold-drinks", "Cold Drinks", "🧊", 2},
              {"cat-pastries", "Pastries", "🥐", 3},
              {"cat-snacks", "Snacks", "🍪", 4}},
             {{"prod-espresso", "Espresso", "cat-hot-drinks", 15000},
              {"prod-americano", "Americano", "cat-hot-drinks", 18000},
              {"prod-latte", "Latte", "cat-hot-drinks", 25000},
              {"prod-iced-latte", "Iced Latte", "cat-cold-drinks", 28000},
              {"prod-iced-tea", "Iced Tea", "cat-cold-drinks", 15000},
              {"prod-croissant", "Croissant", "cat-pastries", 20000},
              {"prod-sandwich", "Sandwich", "cat-snacks", 35000}}},
            {"restaurant",
             {{"cat-appetizers", "Appetizers", "🥗", 1},
              {"cat-main", "Main Course", "🍛", 2},
              {"cat-rice-noodles", "Rice & Noodles", "🍜", 3},
              {"cat-drinks", "Drinks", "🥤", 4},
              {"cat-desserts", "Desserts", "🍨", 5}},
             {{"prod-spring-rolls", "Spring Rolls", "cat-appetizers", 25000},
              {"prod-laap", "Laap (Minced Meat Salad)", "cat-main", 40000},
              {"prod-ping-kai", "Grilled Chicken", "cat-main", 45000},
              {"prod-fried-rice", "Fried Rice", "cat-rice-noodles", 35000},
              {"prod-pho", "Pho Noodle Soup", "cat-rice-noodles", 35000},
              {"prod-water", "Bottled Water", "cat-drinks", 5000},
              {"prod-sticky-rice-mango", "Mango Sticky Rice", "cat-desserts", 25000}}},
            {"retail",
             {{"cat-electronics", "Electronics", "📱", 1},
              {"cat-clothing", "Clothing", "👕", 2},
              {"cat-accessories", "Accessories", "👜", 3},
              {"cat-home", "Home & Living", "🏠", 4}},
             {}},
            {"grocery",
             {{"cat-fresh", "Fresh Produce", "🥬", 1},
              {"cat-beverages", "Beverages", "🥤", 2},
              {"cat-snacks-grocery", "Snacks", "🍿", 3},
              {"cat-daily", "Daily Essentials", "🧴", 4},
              {"cat-frozen", "Frozen Foods", "🧊", 5}},
             {{"prod-water-bottle", "Water 1.5L", "cat-beverages", 5000},
              {"prod-coke", "Coca-Cola 330ml", "cat-beverages", 8000},
              {"prod-chips", "Potato Chips", "cat-snacks-grocery", 10000},
              {"prod-instant-noodles", "Instant Noodles", "cat-snacks-grocery", 5000},
              {"prod-rice-5kg", "Rice 5kg", "cat-daily", 50000},
              {"prod-cooking-oil", "Cooking Oil 1L", "cat-daily", 25000}}},
        };
        return templates;
    }

    const TShopTemplate* FindShopTemplate(const std::string& shopType) {
        auto const& all = ShopTemplates();
        auto it = std::find_if(all.begin(), all.end(), [&](const TShopTemplate& t) { return t.ShopType == shopType; });
        return it == all.end() ? nullptr : &*it;
    }

    bool TracksStockByDefault(const std::string& shopType) {
        static const std::vector<std::string> prepared = {
            "cafe", "restaurant", "noodles", "karaoke", "service", "dry_clean", "car_care"};
        return std::find(prepared.begin(), prepared.end(), shopType) == prepared.end();
    }

    std::vector<TMutation> StarterMutations(const std::string& shopType) {
        std::vector<TMutation> out;
        const auto* shop = FindShopTemplate(shopType);
        if (!shop) {
            return out;
        }

        auto now = Now();
        auto add = [&](const std::string& table, const std::string& id, json data) {
            TMutation m;
            m.MutationId = GenerateMutationId();
            m.Table = table;
            m.RecordId = id;
            m.Op = EMutationOp::Upsert;
            m.Data = std::move(data);
            m.Timestamp = now;
            out.push_back(std::move(m));
        };

        for (auto const& c : shop->Categories) {
            add("categories", c.Id, json{{"name", c.Name}, {"icon", c.Icon}, {"sort_order", c.SortOrder}});
        }
        const bool trackStock = TracksStockByDefault(shopType);
        for (auto const& p : shop->Products) {
            std::string sku = p.Id;
            std::transform(sku.begin(), sku.end(), sku.begin(), [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
            add("products", p.Id, json{{"name", p.Name}, {"sku", sku}, {"category_id", p.CategoryId}, {"price", p.Price}, {"stock", 0}, {"status", "active"}, {"track_stock", trackStock}});
        }
        return out;
    }

} // namespace NWorkspace
