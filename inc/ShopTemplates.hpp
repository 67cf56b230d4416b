#pragma once
#include <string>
#include <vector>

#include "common.hpp"

namespace NWorkspace {

    struct TTemplateCategory {
        std::string Id;
        std::string Name;
        std::string Icon;
        int SortOrder = 0;
    };

    struct TTemplateProduct {
        std::string Id;
        std::string Name;
        std::string CategoryId;
        long long Price = 0;
    };

    struct TShopTemplate {
        std::string ShopType;
        std::vector<TTemplateCategory> Categories;
        std::vector<TTemplateProduct> Products;
    };

    const std::vector<TShopTemplate>& ShopTemplates();
    const TShopTemplate* FindShopTemplate(const std::string& shopType);

    // Kitchens and services sell what they prepare, so their products start without stock tracking.
    bool TracksStockByDefault(const std::string& shopType);

    // Starter categories and products for a new workspace, as writes to submit to its record set.
    // Unknown shop types get none.
    std::vector<TMutation> StarterMutations(const std::string& shopType);

} // namespace NWorkspace
