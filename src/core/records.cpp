#include "shopstream/core/records.h"
#include "shopstream/core/record_codec.h"

namespace shopstream {

namespace {

void append_escaped(std::string& out, const std::string& component) {
    for (char c : component) {
        if (c == '|' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
}

} // anonymous namespace

std::string make_record_id(const std::string& product_id,
                           const std::string& user_id,
                           int64_t view_time) {
    std::string id;
    id.reserve(product_id.size() + user_id.size() + 24);
    append_escaped(id, product_id);
    id.push_back('|');
    append_escaped(id, user_id);
    id.push_back('|');
    id += std::to_string(view_time);
    return id;
}

std::string ViewEvent::id() const {
    return make_record_id(product_id, user_id, view_time);
}

std::string EnrichedRecord::id() const {
    return make_record_id(product_id, user_id, view_time);
}

bool EnrichedRecord::operator==(const EnrichedRecord& other) const {
    return product_id == other.product_id &&
           user_id == other.user_id &&
           first_name == other.first_name &&
           last_name == other.last_name &&
           product_name == other.product_name &&
           brand == other.brand &&
           order_id == other.order_id &&
           order_date == other.order_date &&
           view_time == other.view_time;
}

namespace {

using nlohmann::json;

// Ids arrive as strings from some producers and as integers from others
std::string get_id(const json& j, const char* key) {
    const auto& value = j.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<int64_t>());
    }
    if (value.is_number()) {
        return value.dump();
    }
    throw std::invalid_argument(std::string("field '") + key + "' is not an id");
}

std::string get_string_or(const json& j, const char* key, const std::string& fallback = "") {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    return it->dump();
}

int64_t get_int_or(const json& j, const char* key, int64_t fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return std::stoll(it->get<std::string>());
    }
    return it->get<int64_t>();
}

double get_double_or(const json& j, const char* key, double fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (it->is_string()) {
        return std::stod(it->get<std::string>());
    }
    return it->get<double>();
}

template <typename T>
void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
std::optional<T> get_optional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

} // anonymous namespace

// ========== ProductRecord ==========

void to_json(json& j, const ProductRecord& record) {
    j = json{{"id", record.id},
             {"brand", record.brand},
             {"name", record.name},
             {"sale_price", record.sale_price},
             {"rating", record.rating},
             {"event_time", record.event_time}};
}

void from_json(const json& j, ProductRecord& record) {
    record.id = get_id(j, "id");
    record.brand = get_string_or(j, "brand");
    record.name = get_string_or(j, "name");
    record.sale_price = get_double_or(j, "sale_price", 0.0);
    record.rating = get_double_or(j, "rating", 0.0);
    record.event_time = get_int_or(j, "event_time", 0);
}

// ========== UserRecord ==========

void to_json(json& j, const UserRecord& record) {
    j = json{{"id", record.id},
             {"first_name", record.first_name},
             {"last_name", record.last_name},
             {"email", record.email},
             {"phone", record.phone},
             {"address", record.address},
             {"city", record.city},
             {"state", record.state},
             {"zip_code", record.zip_code},
             {"event_time", record.event_time}};
}

void from_json(const json& j, UserRecord& record) {
    record.id = get_id(j, "id");
    record.first_name = get_string_or(j, "first_name");
    record.last_name = get_string_or(j, "last_name");
    record.email = get_string_or(j, "email");
    record.phone = get_string_or(j, "phone");
    record.address = get_string_or(j, "address");
    record.city = get_string_or(j, "city");
    record.state = get_string_or(j, "state");
    record.zip_code = get_string_or(j, "zip_code");
    record.event_time = get_int_or(j, "event_time", 0);
}

// ========== SaleEvent ==========

void to_json(json& j, const SaleEvent& event) {
    j = json{{"order_id", event.order_id},
             {"product_id", event.product_id},
             {"customer_id", event.customer_id},
             {"event_time", event.event_time}};
}

void from_json(const json& j, SaleEvent& event) {
    if (j.find("order_id") == j.end()) {
        throw std::invalid_argument("sale event without order_id");
    }
    event.order_id = get_int_or(j, "order_id", 0);
    event.product_id = get_id(j, "product_id");
    event.customer_id = get_string_or(j, "customer_id");
    event.event_time = j.at("event_time").get<int64_t>();
}

// ========== ViewEvent ==========

void to_json(json& j, const ViewEvent& event) {
    j = json{{"product_id", event.product_id},
             {"user_id", event.user_id},
             {"view_time", event.view_time},
             {"page_url", event.page_url},
             {"ip", event.ip},
             {"event_time", event.event_time}};
}

void from_json(const json& j, ViewEvent& event) {
    event.product_id = get_id(j, "product_id");
    event.user_id = get_id(j, "user_id");
    event.view_time = get_int_or(j, "view_time", 0);
    event.page_url = get_string_or(j, "page_url");
    event.ip = get_string_or(j, "ip");
    event.event_time = j.at("event_time").get<int64_t>();
}

// ========== EnrichedRecord ==========

void to_json(json& j, const EnrichedRecord& record) {
    j = json::object();
    j["product_id"] = record.product_id;
    j["user_id"] = record.user_id;
    put_optional(j, "first_name", record.first_name);
    put_optional(j, "last_name", record.last_name);
    put_optional(j, "product_name", record.product_name);
    put_optional(j, "brand", record.brand);
    put_optional(j, "order_id", record.order_id);
    put_optional(j, "order_date", record.order_date);
    j["view_time"] = record.view_time;
}

void from_json(const json& j, EnrichedRecord& record) {
    record.product_id = get_id(j, "product_id");
    record.user_id = get_id(j, "user_id");
    record.first_name = get_optional<std::string>(j, "first_name");
    record.last_name = get_optional<std::string>(j, "last_name");
    record.product_name = get_optional<std::string>(j, "product_name");
    record.brand = get_optional<std::string>(j, "brand");
    record.order_id = get_optional<int64_t>(j, "order_id");
    record.order_date = get_optional<int64_t>(j, "order_date");
    record.view_time = j.at("view_time").get<int64_t>();
}

// ========== Dispatch ==========

StreamRecord decode_record(StreamKind kind, const std::string& payload) {
    try {
        json j = json::parse(payload);
        if (!j.is_object()) {
            throw std::invalid_argument("payload is not a JSON object");
        }
        switch (kind) {
            case StreamKind::Products: return j.get<ProductRecord>();
            case StreamKind::Users: return j.get<UserRecord>();
            case StreamKind::Sales: return j.get<SaleEvent>();
            case StreamKind::Views: return j.get<ViewEvent>();
        }
    } catch (const json::exception& e) {
        throw std::invalid_argument(
            "malformed " + stream_kind_to_string(kind) + " record: " + e.what());
    } catch (const std::logic_error& e) {
        // std::stoll / std::stod failures and our own invalid_argument
        throw std::invalid_argument(
            "malformed " + stream_kind_to_string(kind) + " record: " + e.what());
    }
    throw std::invalid_argument("unknown stream kind");
}

std::string encode_enriched(const EnrichedRecord& record) {
    return json(record).dump();
}

int64_t record_event_time(const StreamRecord& record) {
    return std::visit([](const auto& r) { return r.event_time; }, record);
}

} // namespace shopstream
