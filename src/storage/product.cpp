#include "storage/product.h"

namespace catalog {

nlohmann::json Product::toJson() const {
    nlohmann::json j;
    j[FIELD_ID] = id;
    j[FIELD_NAME] = name;
    j[FIELD_PRICE] = price;
    return j;
}

nlohmann::json Product::toJsonArray(const std::vector<Product>& products) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : products) arr.push_back(p.toJson());
    return arr;
}

ProductDraft ProductDraft::fromJson(const nlohmann::json& j) {
    ProductDraft d;
    if (!j.is_object()) return d;

    auto name_it = j.find(Product::FIELD_NAME);
    if (name_it != j.end() && !name_it->is_null()) {
        if (name_it->is_string()) {
            d.name = name_it->get<std::string>();
        } else {
            d.name_malformed = true;
        }
    }

    auto price_it = j.find(Product::FIELD_PRICE);
    if (price_it != j.end() && !price_it->is_null()) {
        if (price_it->is_number()) {
            d.price = price_it->get<double>();
        } else {
            d.price_malformed = true;
        }
    }
    return d;
}

} // namespace catalog
