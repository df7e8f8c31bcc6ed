#pragma once

#include "shopstream/compute/keyed_state_store.h"
#include "shopstream/compute/watermark_coordinator.h"
#include "shopstream/core/records.h"
#include "shopstream/utils/config.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace shopstream {

/**
 * @brief Lifecycle of a view inside the join
 */
enum class ViewState {
    Arrived,     ///< Seen, not yet evaluated
    Pending,     ///< Held in the state store, re-evaluated on new sales/dimensions
    Finalized    ///< Emitted; never mutated again
};

/**
 * @brief Receives every finalized record, in emission order
 *
 * May block (bounded output queue); that is how sink backpressure reaches
 * the join loop.
 */
using EmitCallback = std::function<void(const EnrichedRecord&)>;

/**
 * @brief Streaming left-outer enrichment join
 *
 * Joins each view with the latest product (by product_id), the latest
 * user (by user_id) and the most recent sale of the same product with
 * sale.event_time <= view.event_time + match_window.
 *
 * Emission policy:
 * - A view whose join is complete (sale, product and user all found) is
 *   finalized on arrival or on the first re-evaluation that completes it
 * - Otherwise it stays pending until the global watermark reaches
 *   view.event_time + lateness, then is finalized with whatever is known
 *   (absent parts become nulls)
 * - A view arriving after its deadline has passed is finalized at once
 * - A redelivered view that is still pending, or that was finalized within
 *   the store's finalized retention, is dropped; emitted records are never
 *   revised
 *
 * Single-threaded: only the join loop calls into this class.
 */
class EnrichmentJoin {
public:
    /**
     * @param config Join configuration
     * @param store State store (not owned)
     * @param coordinator Watermark coordinator (not owned)
     * @param emit Output callback
     */
    EnrichmentJoin(const JoinConfig& config,
                   compute::KeyedStateStore* store,
                   compute::WatermarkCoordinator* coordinator,
                   EmitCallback emit);

    /**
     * @brief Dispatch one decoded event by its stream
     */
    void process(const StreamEvent& event);

    void on_product(const ProductRecord& product);
    void on_user(const UserRecord& user);
    void on_sale(const SaleEvent& sale);

    /**
     * @brief Handle a view
     * @return Pending if held, Finalized if emitted
     */
    ViewState on_view(const ViewEvent& view);

    /**
     * @brief Report a source watermark and finalize what it releases
     * @return Number of views finalized
     */
    size_t advance_watermark(StreamKind source, int64_t watermark);

    /**
     * @brief Finalize pending views whose deadline the global watermark reached
     * @return Number of views finalized
     */
    size_t finalize_expired();

    /**
     * @brief Join a view against the current state without changing it
     */
    EnrichedRecord evaluate(const ViewEvent& view, bool* complete = nullptr) const;

    /**
     * @brief Number of records emitted so far (also the last emission sequence)
     */
    uint64_t emitted_count() const { return emitted_.load(); }

    /**
     * @brief Continue emission numbering after a restore
     */
    void set_emitted_count(uint64_t count) { emitted_.store(count); }

    /**
     * @brief Get join statistics
     */
    std::map<std::string, int64_t> get_stats() const;

    void reset();

private:
    void reevaluate(EntityType entity_type, const std::string& key);
    void emit(const ViewEvent& view, const EnrichedRecord& record);
    void enforce_capacity();
    int64_t deadline_for(const ViewEvent& view) const;

    JoinConfig config_;
    compute::KeyedStateStore* store_;
    compute::WatermarkCoordinator* coordinator_;
    EmitCallback emit_;

    std::atomic<uint64_t> emitted_{0};

    // Statistics
    int64_t views_processed_ = 0;
    int64_t sales_processed_ = 0;
    int64_t dimension_updates_ = 0;
    int64_t finalized_matched_ = 0;
    int64_t finalized_unmatched_ = 0;
    int64_t finalized_on_arrival_ = 0;
    int64_t finalized_on_reevaluation_ = 0;
    int64_t finalized_at_deadline_ = 0;
    int64_t forced_finalizations_ = 0;
    int64_t late_views_ = 0;
    int64_t late_sales_ = 0;
    int64_t duplicate_views_ = 0;
    int64_t redelivered_views_ = 0;
    int64_t duplicate_sales_ = 0;
};

} // namespace shopstream
