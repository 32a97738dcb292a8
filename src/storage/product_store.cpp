#include "storage/product_store.h"
#include "utils/logger.h"

#include <mutex>

namespace catalog {

Product ProductStore::insert(Product candidate) {
    if (candidate.isPersisted()) {
        throw InvalidStateError(
            "Cannot insert product with existing id " + std::to_string(candidate.id));
    }

    {
        std::unique_lock<std::shared_mutex> lock(mu_);
        candidate.id = next_id_;
        products_.emplace(candidate.id, candidate);
        ++next_id_;
    }

    CATALOG_DEBUG("Stored product {} ('{}')", candidate.id, candidate.name);
    return candidate;
}

std::vector<Product> ProductStore::listAll() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    std::vector<Product> out;
    out.reserve(products_.size());
    for (const auto& kv : products_) out.push_back(kv.second);
    return out;
}

size_t ProductStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return products_.size();
}

int64_t ProductStore::nextId() const {
    std::shared_lock<std::shared_mutex> lock(mu_);
    return next_id_;
}

} // namespace catalog
