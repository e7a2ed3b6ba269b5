#pragma once

#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "value.h"
#include "json_interop.h"

namespace jpatch {

/**
 * Serialize a document value to CBOR (RFC 7049) through nlohmann::json.
 *
 * CBOR has no signed/unsigned distinction for non-negative integers: they
 * come back as unsigned numbers, which compare equal to the originals.
 */
inline std::vector<uint8_t> to_bytes(const value& doc) {
    return nlohmann::json::to_cbor(export_json(doc));
}

/**
 * Deserialize a document value from CBOR.
 *
 * @throws nlohmann::json::parse_error if the data is not valid CBOR.
 * @throws std::invalid_argument if the data holds a CBOR byte string.
 */
inline value from_bytes(const std::vector<uint8_t>& data) {
    return import_json(nlohmann::json::from_cbor(data));
}

} // namespace jpatch
