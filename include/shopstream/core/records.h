#pragma once

#include <cctype>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace shopstream {

/**
 * @brief The four input streams
 */
enum class StreamKind {
    Products = 0,   ///< Catalog updates (dimension)
    Users = 1,      ///< Customer profile updates (dimension)
    Sales = 2,      ///< Purchase events (fact)
    Views = 3       ///< Page-view events (fact, drives the join)
};

constexpr size_t STREAM_KIND_COUNT = 4;

constexpr StreamKind ALL_STREAM_KINDS[STREAM_KIND_COUNT] = {
    StreamKind::Products, StreamKind::Users, StreamKind::Sales, StreamKind::Views};

/**
 * @brief Dimension entity types held in the state store
 */
enum class EntityType {
    Product,
    User
};

/**
 * @brief Catalog entry; latest write per id wins
 */
struct ProductRecord {
    std::string id;
    std::string brand;
    std::string name;
    double sale_price = 0.0;
    double rating = 0.0;
    int64_t event_time = 0;   // optional on the wire
};

/**
 * @brief Customer profile; latest write per id wins
 */
struct UserRecord {
    std::string id;
    std::string first_name;
    std::string last_name;
    std::string email;
    std::string phone;
    std::string address;
    std::string city;
    std::string state;
    std::string zip_code;
    int64_t event_time = 0;   // optional on the wire
};

/**
 * @brief Purchase fact, one per order_id
 */
struct SaleEvent {
    int64_t order_id = 0;
    std::string product_id;
    std::string customer_id;
    int64_t event_time = 0;
};

/**
 * @brief Page-view fact
 */
struct ViewEvent {
    std::string product_id;
    std::string user_id;
    int64_t view_time = 0;
    std::string page_url;
    std::string ip;
    int64_t event_time = 0;

    /**
     * @brief Composite identity shared with the enriched output
     */
    std::string id() const;
};

/**
 * @brief Joined output row
 *
 * Fields that could not be joined are empty optionals and serialize as
 * JSON null.
 */
struct EnrichedRecord {
    std::string product_id;
    std::string user_id;
    std::optional<std::string> first_name;
    std::optional<std::string> last_name;
    std::optional<std::string> product_name;
    std::optional<std::string> brand;
    std::optional<int64_t> order_id;
    std::optional<int64_t> order_date;
    int64_t view_time = 0;

    /**
     * @brief Stable upsert id: "<product_id>|<user_id>|<view_time>"
     */
    std::string id() const;

    bool operator==(const EnrichedRecord& other) const;
    bool operator!=(const EnrichedRecord& other) const { return !(*this == other); }
};

/**
 * @brief Composite id "<product_id>|<user_id>|<view_time>"
 *
 * '|' and backslash characters inside the components are escaped with a
 * backslash, so distinct (product_id, user_id, view_time) triples never
 * share an id.
 */
std::string make_record_id(const std::string& product_id,
                           const std::string& user_id,
                           int64_t view_time);

using StreamRecord = std::variant<ProductRecord, UserRecord, SaleEvent, ViewEvent>;

/**
 * @brief One decoded record as handed from a source adapter to the join loop
 */
struct StreamEvent {
    StreamKind kind = StreamKind::Views;
    StreamRecord record;
    int64_t event_time = 0;
    int32_t partition = 0;
    int64_t offset = 0;
};

/**
 * @brief Convert stream kind to string
 */
inline std::string stream_kind_to_string(StreamKind kind) {
    switch (kind) {
        case StreamKind::Products: return "products";
        case StreamKind::Users: return "users";
        case StreamKind::Sales: return "sales";
        case StreamKind::Views: return "views";
        default: return "unknown";
    }
}

/**
 * @brief Convert string to stream kind
 */
inline StreamKind string_to_stream_kind(const std::string& str) {
    std::string lower = str;
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "products" || lower == "catalog") return StreamKind::Products;
    if (lower == "users" || lower == "profiles") return StreamKind::Users;
    if (lower == "sales" || lower == "purchases") return StreamKind::Sales;
    if (lower == "views" || lower == "pageviews") return StreamKind::Views;

    throw std::invalid_argument("Unknown stream kind: " + str);
}

inline size_t stream_index(StreamKind kind) {
    return static_cast<size_t>(kind);
}

inline bool is_dimension_stream(StreamKind kind) {
    return kind == StreamKind::Products || kind == StreamKind::Users;
}

} // namespace shopstream
