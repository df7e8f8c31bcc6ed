#include "shopstream/compute/keyed_state_store.h"
#include <algorithm>
#include <limits>
#include <mutex>
#include <stdexcept>

namespace shopstream {
namespace compute {

KeyedStateStore::KeyedStateStore(int64_t match_window_ms, int64_t view_lateness_ms,
                                 int64_t finalized_retention_ms)
    : match_window_ms_(match_window_ms),
      view_lateness_ms_(view_lateness_ms),
      finalized_retention_ms_(finalized_retention_ms) {
    if (match_window_ms_ < 0) {
        throw std::invalid_argument("KeyedStateStore: negative match window");
    }
    if (view_lateness_ms_ < 0) {
        throw std::invalid_argument("KeyedStateStore: negative view lateness");
    }
    if (finalized_retention_ms_ < 0) {
        throw std::invalid_argument("KeyedStateStore: negative finalized retention");
    }
}

// ========== Dimensions ==========

void KeyedStateStore::upsertDimension(EntityType entity_type,
                                      const std::string& key,
                                      const DimensionRecord& record) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (entity_type == EntityType::Product) {
        if (!std::holds_alternative<ProductRecord>(record)) {
            throw std::invalid_argument("upsertDimension: expected a product record");
        }
        products_[key] = std::get<ProductRecord>(record);
    } else {
        if (!std::holds_alternative<UserRecord>(record)) {
            throw std::invalid_argument("upsertDimension: expected a user record");
        }
        users_[key] = std::get<UserRecord>(record);
    }
    dimension_updates_++;
}

std::optional<DimensionRecord> KeyedStateStore::getDimension(
    EntityType entity_type, const std::string& key) const {
    if (entity_type == EntityType::Product) {
        auto product = getProduct(key);
        if (product) {
            return DimensionRecord(*product);
        }
        return std::nullopt;
    }
    auto user = getUser(key);
    if (user) {
        return DimensionRecord(*user);
    }
    return std::nullopt;
}

std::optional<ProductRecord> KeyedStateStore::getProduct(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = products_.find(id);
    if (it == products_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<UserRecord> KeyedStateStore::getUser(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = users_.find(id);
    if (it == users_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ========== Facts ==========

bool KeyedStateStore::bufferFact(const SaleEvent& sale) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& by_time = sales_[sale.product_id];
    auto inserted = by_time.emplace(SaleKey(sale.event_time, sale.order_id), sale);
    if (!inserted.second) {
        return false;
    }
    sale_count_++;
    return true;
}

bool KeyedStateStore::bufferFact(const PendingView& pending) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (pending_.count(pending.view.id()) > 0) {
        return false;
    }

    PendingView stored = pending;
    if (stored.arrival_seq == 0) {
        stored.arrival_seq = next_arrival_seq_++;
    } else if (stored.arrival_seq >= next_arrival_seq_) {
        next_arrival_seq_ = stored.arrival_seq + 1;
    }
    insertPendingLocked(stored);
    return true;
}

std::optional<SaleEvent> KeyedStateStore::findBestSale(const std::string& product_id,
                                                       int64_t upper_bound) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = sales_.find(product_id);
    if (it == sales_.end() || it->second.empty()) {
        return std::nullopt;
    }

    // First key strictly after (upper_bound, max order id), then step back
    const auto& by_time = it->second;
    auto upper = by_time.upper_bound(
        SaleKey(upper_bound, std::numeric_limits<int64_t>::max()));
    if (upper == by_time.begin()) {
        return std::nullopt;
    }
    --upper;
    return upper->second;
}

std::vector<PendingView> KeyedStateStore::drainMatchingFacts(EntityType entity_type,
                                                             const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& index = (entity_type == EntityType::Product) ? pending_by_product_
                                                       : pending_by_user_;
    auto it = index.find(key);
    if (it == index.end()) {
        return {};
    }

    // Copy: erasing pending views mutates this index entry
    std::set<std::string> ids = it->second;
    return drainIdsLocked(ids);
}

bool KeyedStateStore::hasPendingView(const std::string& view_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pending_.count(view_id) > 0;
}

bool KeyedStateStore::markFinalized(const std::string& view_id, int64_t deadline) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (!finalized_.emplace(view_id, deadline).second) {
        return false;
    }
    finalized_by_deadline_.emplace(deadline, view_id);
    return true;
}

bool KeyedStateStore::isFinalized(const std::string& view_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return finalized_.count(view_id) > 0;
}

std::vector<PendingView> KeyedStateStore::removeOldestPending(size_t n) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<PendingView> removed;
    while (removed.size() < n && !pending_by_arrival_.empty()) {
        std::string id = pending_by_arrival_.begin()->second;
        removed.push_back(erasePendingLocked(id));
    }
    return removed;
}

std::vector<PendingView> KeyedStateStore::drainAllPending() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return removeOldestPendingAllLocked();
}

// ========== Eviction ==========

EvictionResult KeyedStateStore::evictOlderThan(int64_t watermark) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    EvictionResult result;
    if (watermark == NO_WATERMARK) {
        return result;
    }

    // Expire pending views (deadline order)
    while (!pending_by_deadline_.empty() &&
           pending_by_deadline_.begin()->first <= watermark) {
        std::string id = pending_by_deadline_.begin()->second;
        result.expired_views.push_back(erasePendingLocked(id));
    }

    // Prune dominated sales
    int64_t horizon = saturating_sub(watermark, view_lateness_ms_);
    if (!pending_event_times_.empty()) {
        horizon = std::min(horizon, *pending_event_times_.begin());
    }
    int64_t bound = saturating_add(horizon, match_window_ms_);

    for (auto it = sales_.begin(); it != sales_.end();) {
        auto& by_time = it->second;
        auto keep = by_time.upper_bound(SaleKey(bound, std::numeric_limits<int64_t>::max()));
        if (keep != by_time.begin()) {
            --keep;  // newest sale at or below bound survives
            size_t dropped = static_cast<size_t>(std::distance(by_time.begin(), keep));
            by_time.erase(by_time.begin(), keep);
            result.evicted_sales += dropped;
        }
        if (by_time.empty()) {
            it = sales_.erase(it);
        } else {
            ++it;
        }
    }

    // Forget finalized ids past their retention
    if (finalized_retention_ms_ != UNBOUNDED) {
        while (!finalized_by_deadline_.empty() &&
               saturating_add(finalized_by_deadline_.begin()->first,
                              finalized_retention_ms_) < watermark) {
            finalized_.erase(finalized_by_deadline_.begin()->second);
            finalized_by_deadline_.erase(finalized_by_deadline_.begin());
            result.forgotten_views++;
        }
    }

    sale_count_ -= result.evicted_sales;
    total_evicted_sales_ += static_cast<int64_t>(result.evicted_sales);
    total_expired_views_ += static_cast<int64_t>(result.expired_views.size());
    total_forgotten_views_ += static_cast<int64_t>(result.forgotten_views);
    return result;
}

// ========== Snapshot ==========

StateSnapshot KeyedStateStore::snapshot() const {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    StateSnapshot snap;
    snap.products.reserve(products_.size());
    for (const auto& [id, product] : products_) {
        snap.products.push_back(product);
    }
    snap.users.reserve(users_.size());
    for (const auto& [id, user] : users_) {
        snap.users.push_back(user);
    }
    snap.sales.reserve(sale_count_);
    for (const auto& [product_id, by_time] : sales_) {
        for (const auto& [key, sale] : by_time) {
            snap.sales.push_back(sale);
        }
    }
    snap.pending_views.reserve(pending_.size());
    for (const auto& [seq, id] : pending_by_arrival_) {
        snap.pending_views.push_back(pending_.at(id));
    }
    snap.next_arrival_seq = next_arrival_seq_;
    snap.finalized_views.reserve(finalized_.size());
    for (const auto& [deadline, id] : finalized_by_deadline_) {
        snap.finalized_views.emplace_back(id, deadline);
    }
    return snap;
}

void KeyedStateStore::restore(const StateSnapshot& snapshot) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    clearLocked();
    for (const auto& product : snapshot.products) {
        products_[product.id] = product;
    }
    for (const auto& user : snapshot.users) {
        users_[user.id] = user;
    }
    for (const auto& sale : snapshot.sales) {
        if (sales_[sale.product_id].emplace(SaleKey(sale.event_time, sale.order_id), sale).second) {
            sale_count_++;
        }
    }
    for (const auto& pending : snapshot.pending_views) {
        insertPendingLocked(pending);
    }
    next_arrival_seq_ = std::max<uint64_t>(snapshot.next_arrival_seq, 1);
    for (const auto& pending : snapshot.pending_views) {
        next_arrival_seq_ = std::max(next_arrival_seq_, pending.arrival_seq + 1);
    }
    for (const auto& [id, deadline] : snapshot.finalized_views) {
        if (finalized_.emplace(id, deadline).second) {
            finalized_by_deadline_.emplace(deadline, id);
        }
    }
}

void KeyedStateStore::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    clearLocked();
}

// ========== Statistics ==========

size_t KeyedStateStore::productCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return products_.size();
}

size_t KeyedStateStore::userCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return users_.size();
}

size_t KeyedStateStore::saleCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sale_count_;
}

size_t KeyedStateStore::pendingViewCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return pending_.size();
}

size_t KeyedStateStore::finalizedViewCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return finalized_.size();
}

std::map<std::string, int64_t> KeyedStateStore::getStats() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return {
        {"products", static_cast<int64_t>(products_.size())},
        {"users", static_cast<int64_t>(users_.size())},
        {"buffered_sales", static_cast<int64_t>(sale_count_)},
        {"pending_views", static_cast<int64_t>(pending_.size())},
        {"dimension_updates", dimension_updates_},
        {"evicted_sales", total_evicted_sales_},
        {"expired_views", total_expired_views_},
        {"finalized_views", static_cast<int64_t>(finalized_.size())},
        {"forgotten_views", total_forgotten_views_}
    };
}

// ========== Private Helper Methods ==========

void KeyedStateStore::insertPendingLocked(const PendingView& pending) {
    std::string id = pending.view.id();
    pending_[id] = pending;
    pending_by_product_[pending.view.product_id].insert(id);
    pending_by_user_[pending.view.user_id].insert(id);
    pending_by_deadline_.emplace(pending.deadline, id);
    pending_by_arrival_.emplace(pending.arrival_seq, id);
    pending_event_times_.insert(pending.view.event_time);
}

PendingView KeyedStateStore::erasePendingLocked(const std::string& view_id) {
    auto it = pending_.find(view_id);
    PendingView pending = it->second;
    pending_.erase(it);

    auto erase_index = [&view_id](std::unordered_map<std::string, std::set<std::string>>& index,
                                  const std::string& key) {
        auto idx = index.find(key);
        if (idx != index.end()) {
            idx->second.erase(view_id);
            if (idx->second.empty()) {
                index.erase(idx);
            }
        }
    };
    erase_index(pending_by_product_, pending.view.product_id);
    erase_index(pending_by_user_, pending.view.user_id);
    pending_by_deadline_.erase({pending.deadline, view_id});
    pending_by_arrival_.erase({pending.arrival_seq, view_id});
    auto time_it = pending_event_times_.find(pending.view.event_time);
    if (time_it != pending_event_times_.end()) {
        pending_event_times_.erase(time_it);
    }
    return pending;
}

std::vector<PendingView> KeyedStateStore::drainIdsLocked(const std::set<std::string>& ids) {
    std::vector<PendingView> drained;
    drained.reserve(ids.size());
    for (const auto& id : ids) {
        drained.push_back(erasePendingLocked(id));
    }
    std::sort(drained.begin(), drained.end(),
              [](const PendingView& a, const PendingView& b) {
                  return a.arrival_seq < b.arrival_seq;
              });
    return drained;
}

std::vector<PendingView> KeyedStateStore::removeOldestPendingAllLocked() {
    std::vector<PendingView> removed;
    removed.reserve(pending_.size());
    while (!pending_by_arrival_.empty()) {
        std::string id = pending_by_arrival_.begin()->second;
        removed.push_back(erasePendingLocked(id));
    }
    return removed;
}

void KeyedStateStore::clearLocked() {
    products_.clear();
    users_.clear();
    sales_.clear();
    sale_count_ = 0;
    pending_.clear();
    pending_by_product_.clear();
    pending_by_user_.clear();
    pending_by_deadline_.clear();
    pending_by_arrival_.clear();
    pending_event_times_.clear();
    next_arrival_seq_ = 1;
    finalized_.clear();
    finalized_by_deadline_.clear();
}

} // namespace compute
} // namespace shopstream
