#pragma once

#include "shopstream/core/records.h"
#include <nlohmann/json.hpp>
#include <string>

namespace shopstream {

/**
 * @brief JSON mapping of the record types
 *
 * Found by nlohmann::json through ADL, so `nlohmann::json j = record;`
 * and `j.get<ProductRecord>()` work directly. Id fields accept JSON
 * strings or numbers; decoding errors surface as std::invalid_argument
 * from decode_record().
 */
void to_json(nlohmann::json& j, const ProductRecord& record);
void from_json(const nlohmann::json& j, ProductRecord& record);

void to_json(nlohmann::json& j, const UserRecord& record);
void from_json(const nlohmann::json& j, UserRecord& record);

void to_json(nlohmann::json& j, const SaleEvent& event);
void from_json(const nlohmann::json& j, SaleEvent& event);

void to_json(nlohmann::json& j, const ViewEvent& event);
void from_json(const nlohmann::json& j, ViewEvent& event);

void to_json(nlohmann::json& j, const EnrichedRecord& record);
void from_json(const nlohmann::json& j, EnrichedRecord& record);

/**
 * @brief Decode one source payload for the given stream
 * @throws std::invalid_argument if the payload is not valid JSON or
 *         misses a required field
 */
StreamRecord decode_record(StreamKind kind, const std::string& payload);

/**
 * @brief Encode an enriched record as the sink document body
 */
std::string encode_enriched(const EnrichedRecord& record);

/**
 * @brief Event time carried by a decoded record
 */
int64_t record_event_time(const StreamRecord& record);

} // namespace shopstream
