/**
 * @file test_keyed_state_store.cpp
 * @brief Unit tests for KeyedStateStore
 */

#include <gtest/gtest.h>
#include "shopstream/compute/keyed_state_store.h"

using namespace shopstream;
using namespace shopstream::compute;

class KeyedStateStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        store = std::make_unique<KeyedStateStore>();
    }

    static ProductRecord product(const std::string& id, const std::string& name) {
        ProductRecord p;
        p.id = id;
        p.name = name;
        p.brand = "Acme";
        return p;
    }

    static SaleEvent sale(int64_t order_id, const std::string& product_id, int64_t time) {
        SaleEvent s;
        s.order_id = order_id;
        s.product_id = product_id;
        s.customer_id = "C1";
        s.event_time = time;
        return s;
    }

    static PendingView pending(const std::string& product_id, const std::string& user_id,
                               int64_t time, int64_t deadline) {
        PendingView p;
        p.view.product_id = product_id;
        p.view.user_id = user_id;
        p.view.view_time = time;
        p.view.event_time = time;
        p.deadline = deadline;
        return p;
    }

    std::unique_ptr<KeyedStateStore> store;
};

TEST_F(KeyedStateStoreTest, LatestDimensionWins) {
    store->upsertDimension(EntityType::Product, "P1", product("P1", "old"));
    store->upsertDimension(EntityType::Product, "P1", product("P1", "new"));

    auto p = store->getProduct("P1");
    ASSERT_TRUE(p.has_value());
    EXPECT_EQ(p->name, "new");
    EXPECT_EQ(store->productCount(), 1u);
    EXPECT_FALSE(store->getUser("P1").has_value());

    auto dimension = store->getDimension(EntityType::Product, "P1");
    ASSERT_TRUE(dimension.has_value());
    EXPECT_TRUE(std::holds_alternative<ProductRecord>(*dimension));
}

TEST_F(KeyedStateStoreTest, DimensionTypeMismatchThrows) {
    UserRecord user;
    user.id = "U1";
    EXPECT_THROW(store->upsertDimension(EntityType::Product, "U1", user),
                 std::invalid_argument);
}

TEST_F(KeyedStateStoreTest, BestSaleIsMostRecentAtOrBeforeBound) {
    EXPECT_TRUE(store->bufferFact(sale(1, "P1", 100)));
    EXPECT_TRUE(store->bufferFact(sale(2, "P1", 200)));
    EXPECT_TRUE(store->bufferFact(sale(3, "P1", 300)));
    EXPECT_TRUE(store->bufferFact(sale(4, "P2", 150)));

    auto best = store->findBestSale("P1", 250);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->order_id, 2);

    best = store->findBestSale("P1", 300);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->order_id, 3);

    EXPECT_FALSE(store->findBestSale("P1", 99).has_value());
    EXPECT_FALSE(store->findBestSale("P3", 1000).has_value());
}

TEST_F(KeyedStateStoreTest, SaleTieBrokenByHigherOrderId) {
    store->bufferFact(sale(7, "P1", 100));
    store->bufferFact(sale(9, "P1", 100));

    auto best = store->findBestSale("P1", 100);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->order_id, 9);
}

TEST_F(KeyedStateStoreTest, DuplicateSaleIgnored) {
    EXPECT_TRUE(store->bufferFact(sale(1, "P1", 100)));
    EXPECT_FALSE(store->bufferFact(sale(1, "P1", 100)));
    EXPECT_EQ(store->saleCount(), 1u);
}

TEST_F(KeyedStateStoreTest, DrainMatchingFactsByProductAndUser) {
    EXPECT_TRUE(store->bufferFact(pending("P1", "U1", 100, 200)));
    EXPECT_TRUE(store->bufferFact(pending("P1", "U2", 110, 210)));
    EXPECT_TRUE(store->bufferFact(pending("P2", "U1", 120, 220)));
    EXPECT_FALSE(store->bufferFact(pending("P1", "U1", 100, 200)));  // same id

    auto by_product = store->drainMatchingFacts(EntityType::Product, "P1");
    ASSERT_EQ(by_product.size(), 2u);
    EXPECT_EQ(by_product[0].view.user_id, "U1");  // arrival order
    EXPECT_EQ(by_product[1].view.user_id, "U2");
    EXPECT_LT(by_product[0].arrival_seq, by_product[1].arrival_seq);

    auto by_user = store->drainMatchingFacts(EntityType::User, "U1");
    ASSERT_EQ(by_user.size(), 1u);
    EXPECT_EQ(by_user[0].view.product_id, "P2");
    EXPECT_EQ(store->pendingViewCount(), 0u);

    // Re-buffering keeps the original arrival order
    uint64_t original = by_product[1].arrival_seq;
    store->bufferFact(by_product[1]);
    auto again = store->drainMatchingFacts(EntityType::User, "U2");
    ASSERT_EQ(again.size(), 1u);
    EXPECT_EQ(again[0].arrival_seq, original);
}

TEST_F(KeyedStateStoreTest, EvictExpiresPendingViewsByDeadline) {
    store->bufferFact(pending("P1", "U1", 100, 200));
    store->bufferFact(pending("P1", "U2", 150, 250));

    EXPECT_TRUE(store->evictOlderThan(NO_WATERMARK).expired_views.empty());

    auto result = store->evictOlderThan(200);
    ASSERT_EQ(result.expired_views.size(), 1u);
    EXPECT_EQ(result.expired_views[0].view.user_id, "U1");
    EXPECT_EQ(store->pendingViewCount(), 1u);
    EXPECT_TRUE(store->hasPendingView(pending("P1", "U2", 150, 250).view.id()));
}

TEST_F(KeyedStateStoreTest, EvictKeepsNewestSaleBehindHorizon) {
    KeyedStateStore exact(0);
    exact.bufferFact(sale(1, "P1", 100));
    exact.bufferFact(sale(2, "P1", 200));
    exact.bufferFact(sale(3, "P1", 300));
    exact.bufferFact(sale(4, "P1", 900));

    auto result = exact.evictOlderThan(500);
    EXPECT_EQ(result.evicted_sales, 2u);
    EXPECT_EQ(exact.saleCount(), 2u);

    // A view at the watermark still finds the right sale
    auto best = exact.findBestSale("P1", 500);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->order_id, 3);
}

TEST_F(KeyedStateStoreTest, EvictRetainsSalesForPendingAndOnTimeViews) {
    KeyedStateStore lateness_aware(0, 100);
    lateness_aware.bufferFact(sale(1, "P1", 100));
    lateness_aware.bufferFact(sale(2, "P1", 200));
    lateness_aware.bufferFact(sale(3, "P1", 300));

    // Watermark 350 - lateness 100 = 250: sale 2 is still needed
    lateness_aware.evictOlderThan(350);
    EXPECT_EQ(lateness_aware.saleCount(), 2u);
    ASSERT_TRUE(lateness_aware.findBestSale("P1", 260).has_value());
    EXPECT_EQ(lateness_aware.findBestSale("P1", 260)->order_id, 2);

    // A pending view at 150 holds sale 1 as well
    KeyedStateStore exact(0);
    exact.bufferFact(sale(1, "P1", 100));
    exact.bufferFact(sale(2, "P1", 200));
    exact.bufferFact(pending("P1", "U1", 150, 10000));
    exact.evictOlderThan(1000);
    EXPECT_EQ(exact.saleCount(), 2u);
    EXPECT_EQ(exact.findBestSale("P1", 150)->order_id, 1);
}

TEST_F(KeyedStateStoreTest, EvictWithMatchWindow) {
    KeyedStateStore windowed(50);
    windowed.bufferFact(sale(1, "P1", 100));
    windowed.bufferFact(sale(2, "P1", 140));
    windowed.bufferFact(sale(3, "P1", 200));

    // bound = 100 + 50: sale 2 is the newest at or below it
    windowed.evictOlderThan(100);
    EXPECT_EQ(windowed.saleCount(), 2u);
    EXPECT_EQ(windowed.findBestSale("P1", 150)->order_id, 2);
}

TEST_F(KeyedStateStoreTest, RemoveOldestPending) {
    store->bufferFact(pending("P1", "U1", 300, 400));
    store->bufferFact(pending("P1", "U2", 100, 200));
    store->bufferFact(pending("P1", "U3", 200, 300));

    auto removed = store->removeOldestPending(2);
    ASSERT_EQ(removed.size(), 2u);
    EXPECT_EQ(removed[0].view.user_id, "U1");
    EXPECT_EQ(removed[1].view.user_id, "U2");
    EXPECT_EQ(store->pendingViewCount(), 1u);

    auto rest = store->drainAllPending();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0].view.user_id, "U3");
}

TEST_F(KeyedStateStoreTest, SnapshotAndRestore) {
    store->upsertDimension(EntityType::Product, "P1", product("P1", "Anvil"));
    UserRecord user;
    user.id = "U1";
    user.first_name = "Ada";
    store->upsertDimension(EntityType::User, "U1", user);
    store->bufferFact(sale(1, "P1", 100));
    store->bufferFact(pending("P2", "U1", 150, 250));
    store->bufferFact(pending("P3", "U1", 160, 260));
    store->markFinalized("P5|U1|120", 220);

    auto snap = store->snapshot();
    EXPECT_EQ(snap.products.size(), 1u);
    EXPECT_EQ(snap.users.size(), 1u);
    EXPECT_EQ(snap.sales.size(), 1u);
    ASSERT_EQ(snap.pending_views.size(), 2u);

    KeyedStateStore restored;
    restored.restore(snap);
    EXPECT_EQ(restored.getProduct("P1")->name, "Anvil");
    EXPECT_EQ(restored.getUser("U1")->first_name, "Ada");
    EXPECT_EQ(restored.findBestSale("P1", 100)->order_id, 1);
    EXPECT_EQ(restored.pendingViewCount(), 2u);
    EXPECT_TRUE(restored.isFinalized("P5|U1|120"));

    // Arrival order and numbering continue after restore
    restored.bufferFact(pending("P4", "U1", 170, 270));
    auto oldest = restored.removeOldestPending(3);
    ASSERT_EQ(oldest.size(), 3u);
    EXPECT_EQ(oldest[0].view.product_id, "P2");
    EXPECT_EQ(oldest[2].view.product_id, "P4");
    EXPECT_GT(oldest[2].arrival_seq, oldest[1].arrival_seq);

    store->clear();
    EXPECT_EQ(store->productCount(), 0u);
    EXPECT_EQ(store->pendingViewCount(), 0u);
    EXPECT_FALSE(store->isFinalized("P5|U1|120"));
}

TEST_F(KeyedStateStoreTest, FinalizedViewsForgottenAfterRetention) {
    KeyedStateStore bounded(0, 0, 50);
    EXPECT_TRUE(bounded.markFinalized("P1|U1|100", 200));
    EXPECT_FALSE(bounded.markFinalized("P1|U1|100", 200));
    EXPECT_TRUE(bounded.markFinalized("P2|U1|300", 400));

    EXPECT_EQ(bounded.evictOlderThan(250).forgotten_views, 0u);
    EXPECT_TRUE(bounded.isFinalized("P1|U1|100"));

    EXPECT_EQ(bounded.evictOlderThan(251).forgotten_views, 1u);
    EXPECT_FALSE(bounded.isFinalized("P1|U1|100"));
    EXPECT_TRUE(bounded.isFinalized("P2|U1|300"));
    EXPECT_EQ(bounded.finalizedViewCount(), 1u);

    // Unbounded retention keeps every id
    store->markFinalized("P1|U1|100", 200);
    store->evictOlderThan(1000000);
    EXPECT_TRUE(store->isFinalized("P1|U1|100"));
}

TEST_F(KeyedStateStoreTest, UnboundedWindowKeepsOnlyNewestSale) {
    store->bufferFact(sale(1, "P1", 100));
    store->bufferFact(sale(2, "P1", 200));
    store->bufferFact(sale(3, "P2", 50));

    auto result = store->evictOlderThan(10);
    EXPECT_EQ(result.evicted_sales, 1u);
    EXPECT_EQ(store->findBestSale("P1", UNBOUNDED)->order_id, 2);
    EXPECT_EQ(store->findBestSale("P2", UNBOUNDED)->order_id, 3);
}

TEST_F(KeyedStateStoreTest, NegativeDurationsRejected) {
    EXPECT_THROW(KeyedStateStore bad(-1), std::invalid_argument);
    EXPECT_THROW(KeyedStateStore bad(0, -1), std::invalid_argument);
    EXPECT_THROW(KeyedStateStore bad(0, 0, -1), std::invalid_argument);
}

TEST_F(KeyedStateStoreTest, Statistics) {
    store->upsertDimension(EntityType::Product, "P1", product("P1", "Anvil"));
    store->bufferFact(sale(1, "P1", 100));
    store->bufferFact(sale(2, "P1", 200));
    store->evictOlderThan(300);

    auto stats = store->getStats();
    EXPECT_EQ(stats["products"], 1);
    EXPECT_EQ(stats["buffered_sales"], 1);
    EXPECT_EQ(stats["evicted_sales"], 1);
    EXPECT_EQ(stats["dimension_updates"], 1);
}
