/**
 * @file keyed_state_store.h
 * @brief Keyed join state: dimension tables, buffered sales, pending views
 *
 * All memory is held in keyed maps with explicit eviction driven by the
 * global watermark, so state is bounded by active key cardinality plus the
 * in-flight lateness window rather than by total stream volume.
 */

#pragma once

#include "shopstream/core/records.h"
#include "shopstream/utils/common.h"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace shopstream {
namespace compute {

/**
 * @brief Dimension value as stored per entity key
 */
using DimensionRecord = std::variant<ProductRecord, UserRecord>;

/**
 * @brief A view waiting for its join to complete
 */
struct PendingView {
    ViewEvent view;
    int64_t deadline = 0;        ///< Finalize once the global watermark reaches this
    uint64_t arrival_seq = 0;    ///< Assigned by the store (from 1); orders "oldest first"
};

/**
 * @brief Full copy of the store contents (checkpoint payload)
 */
struct StateSnapshot {
    std::vector<ProductRecord> products;
    std::vector<UserRecord> users;
    std::vector<SaleEvent> sales;
    std::vector<PendingView> pending_views;
    uint64_t next_arrival_seq = 1;
    std::vector<std::pair<std::string, int64_t>> finalized_views;  ///< (view id, deadline)
};

/**
 * @brief Result of a watermark-driven eviction pass
 */
struct EvictionResult {
    std::vector<PendingView> expired_views;   ///< Deadline reached, to be finalized
    size_t evicted_sales = 0;                 ///< Sales that can never be a best match again
    size_t forgotten_views = 0;               ///< Finalized ids past their retention
};

/**
 * @brief Keyed state store for the enrichment join
 *
 * Design:
 * - Dimension tables are hash maps, latest write wins
 * - Sales are buffered per product id, ordered by (event_time, order_id)
 * - Pending views are indexed by id, product id, user id, deadline and
 *   arrival order
 * - Ids of finalized views are remembered until the watermark passes
 *   their deadline plus the finalized retention, so redeliveries are
 *   recognized
 * - One writer (the join loop); snapshot() and the getters may be called
 *   from other threads and take a shared lock
 */
class KeyedStateStore {
public:
    /**
     * @param match_window_ms Sale match window used when pruning sales
     * @param view_lateness_ms Views with event_time > watermark - lateness
     *        can still arrive on time; their sales are retained
     * @param finalized_retention_ms How long past its deadline a finalized
     *        view id is remembered (UNBOUNDED: until restore or clear)
     */
    explicit KeyedStateStore(int64_t match_window_ms = UNBOUNDED,
                             int64_t view_lateness_ms = 0,
                             int64_t finalized_retention_ms = UNBOUNDED);

    // ========== Dimensions ==========

    /**
     * @brief Insert or overwrite the dimension record for key
     * @throws std::invalid_argument if the record type does not match entity_type
     */
    void upsertDimension(EntityType entity_type, const std::string& key,
                         const DimensionRecord& record);

    /**
     * @brief Latest dimension record for key, if any
     */
    std::optional<DimensionRecord> getDimension(EntityType entity_type,
                                                const std::string& key) const;

    std::optional<ProductRecord> getProduct(const std::string& id) const;
    std::optional<UserRecord> getUser(const std::string& id) const;

    // ========== Facts ==========

    /**
     * @brief Buffer a sale under its product id
     * @return false if the same order was already buffered
     */
    bool bufferFact(const SaleEvent& sale);

    /**
     * @brief Buffer a pending view under its product and user ids
     * @return false if a view with the same id is already pending
     *
     * A zero arrival_seq is replaced by the next sequence number; views
     * re-buffered after drainMatchingFacts() keep their original one.
     */
    bool bufferFact(const PendingView& pending);

    /**
     * @brief Most recent sale for product_id with event_time <= upper_bound
     */
    std::optional<SaleEvent> findBestSale(const std::string& product_id,
                                          int64_t upper_bound) const;

    /**
     * @brief Remove and return the pending views joined on this key
     * @return Views in arrival order
     *
     * EntityType::Product matches view.product_id, EntityType::User
     * matches view.user_id.
     */
    std::vector<PendingView> drainMatchingFacts(EntityType entity_type,
                                                const std::string& key);

    bool hasPendingView(const std::string& view_id) const;

    /**
     * @brief Remember that a view was emitted
     * @return false if it was already marked
     */
    bool markFinalized(const std::string& view_id, int64_t deadline);

    bool isFinalized(const std::string& view_id) const;

    /**
     * @brief Remove and return up to n pending views, oldest arrival first
     */
    std::vector<PendingView> removeOldestPending(size_t n);

    /**
     * @brief Remove and return every pending view (arrival order)
     */
    std::vector<PendingView> drainAllPending();

    // ========== Eviction ==========

    /**
     * @brief Expire pending views and prune sales behind the watermark
     * @param watermark Global low watermark
     *
     * Pending views whose deadline <= watermark are removed and returned.
     * For each product, sales older than the newest sale at or below
     * min(watermark - view lateness, oldest pending view time) + match
     * window are dropped: no pending view, and no view that can still
     * arrive on time, would pick them. Finalized ids whose deadline plus
     * the finalized retention is below the watermark are forgotten.
     */
    EvictionResult evictOlderThan(int64_t watermark);

    // ========== Snapshot ==========

    /**
     * @brief Copy the full contents under a brief exclusive lock
     */
    StateSnapshot snapshot() const;

    /**
     * @brief Replace the full contents with a snapshot
     */
    void restore(const StateSnapshot& snapshot);

    void clear();

    // ========== Statistics ==========

    size_t productCount() const;
    size_t userCount() const;
    size_t saleCount() const;
    size_t pendingViewCount() const;
    size_t finalizedViewCount() const;

    std::map<std::string, int64_t> getStats() const;

private:
    using SaleKey = std::pair<int64_t, int64_t>;  // (event_time, order_id)

    void insertPendingLocked(const PendingView& pending);
    PendingView erasePendingLocked(const std::string& view_id);
    std::vector<PendingView> drainIdsLocked(const std::set<std::string>& ids);
    std::vector<PendingView> removeOldestPendingAllLocked();
    void clearLocked();

    int64_t match_window_ms_;
    int64_t view_lateness_ms_;
    int64_t finalized_retention_ms_;

    // Dimension tables
    std::unordered_map<std::string, ProductRecord> products_;
    std::unordered_map<std::string, UserRecord> users_;

    // Sales by product id
    std::unordered_map<std::string, std::map<SaleKey, SaleEvent>> sales_;
    size_t sale_count_ = 0;

    // Pending views
    std::unordered_map<std::string, PendingView> pending_;
    std::unordered_map<std::string, std::set<std::string>> pending_by_product_;
    std::unordered_map<std::string, std::set<std::string>> pending_by_user_;
    std::set<std::pair<int64_t, std::string>> pending_by_deadline_;
    std::set<std::pair<uint64_t, std::string>> pending_by_arrival_;
    std::multiset<int64_t> pending_event_times_;
    uint64_t next_arrival_seq_ = 1;

    // Finalized view ids
    std::unordered_map<std::string, int64_t> finalized_;
    std::set<std::pair<int64_t, std::string>> finalized_by_deadline_;

    // Statistics
    int64_t dimension_updates_ = 0;
    int64_t total_evicted_sales_ = 0;
    int64_t total_expired_views_ = 0;
    int64_t total_forgotten_views_ = 0;

    mutable std::shared_mutex mutex_;
};

} // namespace compute
} // namespace shopstream
