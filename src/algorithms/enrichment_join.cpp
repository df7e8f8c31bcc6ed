#include "shopstream/algorithms/enrichment_join.h"
#include "shopstream/core/errors.h"
#include <iostream>
#include <stdexcept>

namespace shopstream {

EnrichmentJoin::EnrichmentJoin(const JoinConfig& config,
                               compute::KeyedStateStore* store,
                               compute::WatermarkCoordinator* coordinator,
                               EmitCallback emit)
    : config_(config),
      store_(store),
      coordinator_(coordinator),
      emit_(std::move(emit)) {
    if (!store_ || !coordinator_) {
        throw std::invalid_argument("EnrichmentJoin: null pointer arguments");
    }
    if (!emit_) {
        throw std::invalid_argument("EnrichmentJoin: emit callback is required");
    }
    if (config_.lateness_ms == UNBOUNDED || config_.lateness_ms < 0) {
        throw std::invalid_argument("EnrichmentJoin: lateness must be bounded");
    }
}

void EnrichmentJoin::process(const StreamEvent& event) {
    switch (event.kind) {
        case StreamKind::Products:
            on_product(std::get<ProductRecord>(event.record));
            break;
        case StreamKind::Users:
            on_user(std::get<UserRecord>(event.record));
            break;
        case StreamKind::Sales:
            on_sale(std::get<SaleEvent>(event.record));
            break;
        case StreamKind::Views:
            on_view(std::get<ViewEvent>(event.record));
            break;
    }
}

void EnrichmentJoin::on_product(const ProductRecord& product) {
    store_->upsertDimension(EntityType::Product, product.id, product);
    dimension_updates_++;
    reevaluate(EntityType::Product, product.id);
}

void EnrichmentJoin::on_user(const UserRecord& user) {
    store_->upsertDimension(EntityType::User, user.id, user);
    dimension_updates_++;
    reevaluate(EntityType::User, user.id);
}

void EnrichmentJoin::on_sale(const SaleEvent& sale) {
    sales_processed_++;
    if (sale.event_time < coordinator_->globalWatermark()) {
        late_sales_++;
    }
    if (!store_->bufferFact(sale)) {
        duplicate_sales_++;
        return;
    }
    reevaluate(EntityType::Product, sale.product_id);
}

ViewState EnrichmentJoin::on_view(const ViewEvent& view) {
    views_processed_++;

    const std::string id = view.id();
    if (store_->hasPendingView(id)) {
        duplicate_views_++;
        return ViewState::Pending;
    }
    if (store_->isFinalized(id)) {
        // Redelivery of an emitted view; its record stands
        duplicate_views_++;
        redelivered_views_++;
        return ViewState::Finalized;
    }

    bool complete = false;
    EnrichedRecord record = evaluate(view, &complete);
    int64_t deadline = deadline_for(view);
    int64_t watermark = coordinator_->globalWatermark();

    if (view.event_time < watermark) {
        late_views_++;
    }

    if (complete) {
        finalized_on_arrival_++;
        emit(view, record);
        return ViewState::Finalized;
    }

    if (watermark != NO_WATERMARK && deadline <= watermark) {
        // Too late to wait for anything
        finalized_at_deadline_++;
        emit(view, record);
        return ViewState::Finalized;
    }

    enforce_capacity();

    compute::PendingView pending;
    pending.view = view;
    pending.deadline = deadline;
    store_->bufferFact(pending);
    return ViewState::Pending;
}

size_t EnrichmentJoin::advance_watermark(StreamKind source, int64_t watermark) {
    if (!coordinator_->updateSourceWatermark(source, watermark)) {
        return 0;
    }
    return finalize_expired();
}

size_t EnrichmentJoin::finalize_expired() {
    auto eviction = store_->evictOlderThan(coordinator_->globalWatermark());
    for (const auto& pending : eviction.expired_views) {
        finalized_at_deadline_++;
        emit(pending.view, evaluate(pending.view));
    }
    return eviction.expired_views.size();
}

EnrichedRecord EnrichmentJoin::evaluate(const ViewEvent& view, bool* complete) const {
    EnrichedRecord record;
    record.product_id = view.product_id;
    record.user_id = view.user_id;
    record.view_time = view.view_time;

    auto product = store_->getProduct(view.product_id);
    if (product) {
        record.product_name = product->name;
        record.brand = product->brand;
    }

    auto user = store_->getUser(view.user_id);
    if (user) {
        record.first_name = user->first_name;
        record.last_name = user->last_name;
    }

    auto sale = store_->findBestSale(
        view.product_id, saturating_add(view.event_time, config_.match_window_ms));
    if (sale) {
        record.order_id = sale->order_id;
        record.order_date = sale->event_time;
    }

    if (complete) {
        *complete = product.has_value() && user.has_value() && sale.has_value();
    }
    return record;
}

std::map<std::string, int64_t> EnrichmentJoin::get_stats() const {
    return {
        {"views_processed", views_processed_},
        {"sales_processed", sales_processed_},
        {"dimension_updates", dimension_updates_},
        {"emitted", static_cast<int64_t>(emitted_.load())},
        {"finalized_matched", finalized_matched_},
        {"finalized_unmatched", finalized_unmatched_},
        {"finalized_on_arrival", finalized_on_arrival_},
        {"finalized_on_reevaluation", finalized_on_reevaluation_},
        {"finalized_at_deadline", finalized_at_deadline_},
        {"forced_finalizations", forced_finalizations_},
        {"late_views", late_views_},
        {"late_sales", late_sales_},
        {"duplicate_views", duplicate_views_},
        {"redelivered_views", redelivered_views_},
        {"duplicate_sales", duplicate_sales_},
        {"pending_views", static_cast<int64_t>(store_->pendingViewCount())}
    };
}

void EnrichmentJoin::reset() {
    store_->clear();
    emitted_.store(0);
    views_processed_ = 0;
    sales_processed_ = 0;
    dimension_updates_ = 0;
    finalized_matched_ = 0;
    finalized_unmatched_ = 0;
    finalized_on_arrival_ = 0;
    finalized_on_reevaluation_ = 0;
    finalized_at_deadline_ = 0;
    forced_finalizations_ = 0;
    late_views_ = 0;
    late_sales_ = 0;
    duplicate_views_ = 0;
    redelivered_views_ = 0;
    duplicate_sales_ = 0;
}

// ========== Private Helper Methods ==========

void EnrichmentJoin::reevaluate(EntityType entity_type, const std::string& key) {
    auto waiting = store_->drainMatchingFacts(entity_type, key);
    for (auto& pending : waiting) {
        bool complete = false;
        EnrichedRecord record = evaluate(pending.view, &complete);
        if (complete) {
            finalized_on_reevaluation_++;
            emit(pending.view, record);
        } else {
            // Keeps its arrival_seq
            store_->bufferFact(pending);
        }
    }
}

void EnrichmentJoin::emit(const ViewEvent& view, const EnrichedRecord& record) {
    store_->markFinalized(view.id(), deadline_for(view));
    if (record.order_id) {
        finalized_matched_++;
    } else {
        finalized_unmatched_++;
    }
    emitted_.fetch_add(1);
    emit_(record);
}

void EnrichmentJoin::enforce_capacity() {
    if (config_.max_pending_views == 0) {
        return;
    }
    size_t pending = store_->pendingViewCount();
    if (pending < config_.max_pending_views) {
        return;
    }

    if (config_.capacity_policy == CapacityPolicy::Fail) {
        std::cerr << "EnrichmentJoin: CRITICAL pending views reached "
                  << config_.max_pending_views
                  << " (global watermark " << coordinator_->globalWatermark()
                  << "); a source is likely stalled" << std::endl;
        throw StateStoreCapacityExceeded(
            "pending views reached " + std::to_string(config_.max_pending_views));
    }

    size_t excess = pending - config_.max_pending_views + 1;
    auto oldest = store_->removeOldestPending(excess);
    std::cerr << "EnrichmentJoin: force-finalizing " << oldest.size()
              << " oldest pending views (capacity " << config_.max_pending_views << ")"
              << std::endl;
    for (const auto& victim : oldest) {
        forced_finalizations_++;
        emit(victim.view, evaluate(victim.view));
    }
}

int64_t EnrichmentJoin::deadline_for(const ViewEvent& view) const {
    return saturating_add(view.event_time, config_.lateness_ms);
}

} // namespace shopstream
