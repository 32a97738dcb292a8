#include <gtest/gtest.h>
#include "server/product_api_handler.h"
#include "storage/product_store.h"

#include <cmath>
#include <set>
#include <thread>
#include <vector>

using namespace catalog;
using namespace catalog::server;

class ProductApiHandlerTest : public ::testing::Test {
protected:
    ProductDraft draft(std::optional<std::string> name, std::optional<double> price) {
        ProductDraft d;
        d.name = std::move(name);
        d.price = price;
        return d;
    }

    static bool hasFieldError(const CreateResult& r, const std::string& field) {
        for (const auto& e : r.errors) {
            if (e.field == field) return true;
        }
        return false;
    }

    ProductStore store_;
    ProductApiHandler handler_{store_};
};

TEST_F(ProductApiHandlerTest, CreateValidProduct) {
    auto r = handler_.handleCreate(draft(std::string("Smartphone Modelo X"), 1299.99));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.status, CreateResult::Status::Created);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.product.id, 1);
    EXPECT_EQ(r.product.name, "Smartphone Modelo X");
    EXPECT_DOUBLE_EQ(r.product.price, 1299.99);

    auto list = handler_.handleList();
    ASSERT_EQ(list.size(), 1u);
    EXPECT_EQ(list[0], r.product);
}

TEST_F(ProductApiHandlerTest, ZeroPriceIsAccepted) {
    auto r = handler_.handleCreate(draft(std::string("Brinde"), 0.0));
    ASSERT_TRUE(r.ok());
    EXPECT_DOUBLE_EQ(r.product.price, 0.0);
}

TEST_F(ProductApiHandlerTest, EmptyNameIsRejected) {
    auto r = handler_.handleCreate(draft(std::string(""), 10.0));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.status, CreateResult::Status::ValidationFailed);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].field, "nome");
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(store_.nextId(), 1);
}

TEST_F(ProductApiHandlerTest, WhitespaceOnlyNameIsRejected) {
    auto r = handler_.handleCreate(draft(std::string(" \t\n "), 10.0));
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(hasFieldError(r, "nome"));
}

TEST_F(ProductApiHandlerTest, MissingNameIsRejected) {
    auto r = handler_.handleCreate(draft(std::nullopt, 10.0));
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(hasFieldError(r, "nome"));
}

TEST_F(ProductApiHandlerTest, NegativePriceIsRejected) {
    auto r = handler_.handleCreate(draft(std::string("x"), -1.0));
    EXPECT_FALSE(r.ok());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].field, "preco");
    EXPECT_EQ(store_.size(), 0u);
    EXPECT_EQ(store_.nextId(), 1);
}

TEST_F(ProductApiHandlerTest, MissingPriceIsRejected) {
    auto r = handler_.handleCreate(draft(std::string("x"), std::nullopt));
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(hasFieldError(r, "preco"));
}

TEST_F(ProductApiHandlerTest, MalformedFieldsAreRejected) {
    ProductDraft d;
    d.name_malformed = true;
    d.price_malformed = true;
    auto r = handler_.handleCreate(d);
    EXPECT_FALSE(r.ok());
    EXPECT_TRUE(hasFieldError(r, "nome"));
    EXPECT_TRUE(hasFieldError(r, "preco"));
}

TEST_F(ProductApiHandlerTest, AllInvalidFieldsAreReportedTogether) {
    auto r = handler_.handleCreate(draft(std::string(""), -5.0));
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.errors.size(), 2u);
    EXPECT_TRUE(hasFieldError(r, "nome"));
    EXPECT_TRUE(hasFieldError(r, "preco"));
}

TEST_F(ProductApiHandlerTest, RejectedAttemptsDoNotConsumeIds) {
    handler_.handleCreate(draft(std::string(""), 10.0));
    handler_.handleCreate(draft(std::string("x"), -1.0));
    auto r = handler_.handleCreate(draft(std::string("ok"), 1.0));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.product.id, 1);
}

TEST_F(ProductApiHandlerTest, ListOnEmptyStoreIsEmpty) {
    EXPECT_TRUE(handler_.handleList().empty());
}

TEST_F(ProductApiHandlerTest, ListFollowsSubmissionOrder) {
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(handler_.handleCreate(draft("item" + std::to_string(i), i * 1.5)).ok());
    }
    auto list = handler_.handleList();
    ASSERT_EQ(list.size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(list[i].id, i + 1);
        EXPECT_EQ(list[i].name, "item" + std::to_string(i));
    }
    EXPECT_EQ(handler_.handleList(), list);
}

TEST_F(ProductApiHandlerTest, ConcurrentCreatesYieldIdsOneToN) {
    constexpr int kThreads = 6;
    constexpr int kPerThread = 100;
    std::vector<std::vector<int64_t>> ids(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([this, &ids, t] {
            for (int i = 0; i < kPerThread; ++i) {
                auto r = handler_.handleCreate(draft(std::string("p"), 1.0));
                if (r.ok()) ids[t].push_back(r.product.id);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::set<int64_t> all;
    for (const auto& v : ids) all.insert(v.begin(), v.end());
    ASSERT_EQ(all.size(), static_cast<size_t>(kThreads * kPerThread));
    EXPECT_EQ(*all.begin(), 1);
    EXPECT_EQ(*all.rbegin(), kThreads * kPerThread);
}

TEST_F(ProductApiHandlerTest, NegativeZeroPriceIsNormalized) {
    auto r = handler_.handleCreate(draft(std::string("Brinde"), -0.0));
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.product.price, 0.0);
    EXPECT_FALSE(std::signbit(r.product.price));
    EXPECT_FALSE(std::signbit(store_.listAll().front().price));
}
