#pragma once

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "storage/product.h"

namespace catalog {

/**
 * @brief Thrown when a caller breaks the store contract, e.g. inserting a
 * product that already carries an identity. The store is left unchanged.
 */
class InvalidStateError : public std::runtime_error {
public:
    explicit InvalidStateError(const std::string& message)
        : std::runtime_error(message)
    {}
};

/**
 * @brief In-memory product store
 *
 * Sole owner of the product collection and the identity counter. Identities
 * start at 1, grow by one per insert and are never reused. One shared_mutex
 * guards both: insert() is exclusive, reads are shared, so a reader sees either
 * a whole insert or none of it.
 *
 * Contents live exactly as long as the object; a new store is empty and hands
 * out id 1 again.
 */
class ProductStore {
public:
    ProductStore() = default;
    ~ProductStore() = default;

    ProductStore(const ProductStore&) = delete;
    ProductStore& operator=(const ProductStore&) = delete;

    /**
     * @brief Admit a transient product and stamp it with the next identity
     * @param candidate Product with id == 0
     * @return Copy of the stored product, id set
     * @throws InvalidStateError if candidate.id != 0
     */
    Product insert(Product candidate);

    /**
     * @brief Snapshot of all products in identity (= insertion) order
     */
    std::vector<Product> listAll() const;

    size_t size() const;

    // Identity the next successful insert will receive
    int64_t nextId() const;

private:
    mutable std::shared_mutex mu_;
    std::map<int64_t, Product> products_;
    int64_t next_id_ = 1;
};

} // namespace catalog
