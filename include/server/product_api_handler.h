#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "storage/product.h"
#include "storage/product_store.h"

namespace catalog { namespace server {

/**
 * @brief A single rejected field of a create request
 */
struct FieldError {
    std::string field;    // wire name, e.g. "nome"
    std::string message;

    nlohmann::json toJson() const {
        return nlohmann::json{{"field", field}, {"message", message}};
    }
};

/**
 * @brief Outcome of ProductApiHandler::handleCreate
 */
struct CreateResult {
    enum class Status { Created, ValidationFailed };

    Status status = Status::ValidationFailed;
    Product product;                 // set when status == Created
    std::vector<FieldError> errors;  // set when status == ValidationFailed

    bool ok() const { return status == Status::Created; }
};

/**
 * @brief Products API Handler
 *
 * Transport-agnostic core of the /api/produtos resource:
 * - POST /api/produtos -> handleCreate
 * - GET  /api/produtos -> handleList
 *
 * Holds the store by reference; the store must outlive the handler.
 */
class ProductApiHandler {
public:
    explicit ProductApiHandler(ProductStore& store);

    /**
     * @brief Validate a draft and, if valid, persist it
     * @return Created + stored product, or ValidationFailed + field errors.
     *         The store is not touched on validation failure.
     * @throws InvalidStateError propagated from the store
     */
    CreateResult handleCreate(const ProductDraft& draft);

    /**
     * @brief All stored products in identity order (possibly empty)
     */
    std::vector<Product> handleList() const;

    // Field-level checks, exposed for reuse and tests
    static std::vector<FieldError> validate(const ProductDraft& draft);

private:
    ProductStore& store_;
};

}} // namespace catalog::server
