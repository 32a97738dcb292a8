#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace catalog {

/**
 * @brief A catalog product.
 *
 * id == 0 means transient (not yet admitted into a ProductStore).
 * Wire format: {"id": 1, "nome": "...", "preco": 12.5}
 */
struct Product {
    static constexpr const char* FIELD_ID = "id";
    static constexpr const char* FIELD_NAME = "nome";
    static constexpr const char* FIELD_PRICE = "preco";

    int64_t id = 0;
    std::string name;
    double price = 0.0;

    bool isPersisted() const { return id != 0; }

    nlohmann::json toJson() const;
    static nlohmann::json toJsonArray(const std::vector<Product>& products);
};

inline bool operator==(const Product& a, const Product& b) {
    return a.id == b.id && a.name == b.name && a.price == b.price;
}

/**
 * @brief Client-submitted product candidate, as decoded from a request body.
 *
 * Fields stay optional so validation can tell "missing" from "wrong type".
 * A client supplied "id" is never read: identity is assigned by the store.
 */
struct ProductDraft {
    std::optional<std::string> name;
    std::optional<double> price;
    bool name_malformed = false;   // present but not a string
    bool price_malformed = false;  // present but not a number

    static ProductDraft fromJson(const nlohmann::json& j);
};

} // namespace catalog
