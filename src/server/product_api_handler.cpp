#include "server/product_api_handler.h"
#include "utils/logger.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace catalog { namespace server {

namespace {

bool isBlank(const std::string& s) {
    return std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

ProductApiHandler::ProductApiHandler(ProductStore& store)
    : store_(store)
{
}

std::vector<FieldError> ProductApiHandler::validate(const ProductDraft& draft) {
    std::vector<FieldError> errors;

    if (draft.name_malformed) {
        errors.push_back({Product::FIELD_NAME, "must be a string"});
    } else if (!draft.name.has_value()) {
        errors.push_back({Product::FIELD_NAME, "is required"});
    } else if (isBlank(*draft.name)) {
        errors.push_back({Product::FIELD_NAME, "must not be blank"});
    }

    if (draft.price_malformed) {
        errors.push_back({Product::FIELD_PRICE, "must be a number"});
    } else if (!draft.price.has_value()) {
        errors.push_back({Product::FIELD_PRICE, "is required"});
    } else if (!std::isfinite(*draft.price)) {
        errors.push_back({Product::FIELD_PRICE, "must be a finite number"});
    } else if (*draft.price < 0.0) {
        errors.push_back({Product::FIELD_PRICE, "must be greater than or equal to 0"});
    }

    return errors;
}

CreateResult ProductApiHandler::handleCreate(const ProductDraft& draft) {
    CreateResult result;
    result.errors = validate(draft);
    if (!result.errors.empty()) {
        CATALOG_DEBUG("Rejected product draft: {} invalid field(s), first '{}'",
            result.errors.size(), result.errors.front().field);
        result.status = CreateResult::Status::ValidationFailed;
        return result;
    }

    Product candidate;
    candidate.name = *draft.name;
    // -0.0 passes the >= 0 check; store it as plain zero
    candidate.price = (*draft.price == 0.0) ? 0.0 : *draft.price;

    result.product = store_.insert(std::move(candidate));
    result.status = CreateResult::Status::Created;
    CATALOG_INFO("Created product {} ('{}', {})",
        result.product.id, result.product.name, result.product.price);
    return result;
}

std::vector<Product> ProductApiHandler::handleList() const {
    return store_.listAll();
}

}} // namespace catalog::server
