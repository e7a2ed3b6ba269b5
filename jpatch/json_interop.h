#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "value.h"
#include "error.h"
#include "operation.h"
#include "patch.h"

// =============================================================================
// jpatch <-> nlohmann::json
//
// The pointer and patch engines work on decoded jpatch::value trees.  Text
// parsing and printing stay with nlohmann::json; this header converts between
// the two models:
//
//   import_json / export_json      document values (lossless both ways)
//   to_json / from_json            ADL hooks: json j = v; j.get<value>()
//   record_from_json / patch_from_json
//                                  RFC 6902 operation objects
//   record_to_json / operation_to_json / patch_to_json
//   error_to_json                  structured diagnostics
// =============================================================================

namespace jpatch {

// ---- documents ----

/**
 * Recursively convert a nlohmann::json document into a jpatch::value.
 * Throws std::invalid_argument for binary and discarded values, which have
 * no JSON Patch meaning.
 */
inline value import_json(const nlohmann::json& doc) {
    switch (doc.type()) {
        case nlohmann::json::value_t::null:
            return value::make_null();

        case nlohmann::json::value_t::boolean:
            return value::make_bool(doc.get<bool>());

        case nlohmann::json::value_t::number_integer:
            return value::make_int(doc.get<int64_t>());

        case nlohmann::json::value_t::number_unsigned:
            return value::make_unsigned(doc.get<uint64_t>());

        case nlohmann::json::value_t::number_float:
            return value::make_float(doc.get<double>());

        case nlohmann::json::value_t::string:
            return value::make_string(doc.get<std::string>());

        case nlohmann::json::value_t::array: {
            array_t elements;
            elements.reserve(doc.size());
            for (const auto& elem : doc) {
                elements.push_back(import_json(elem));
            }
            return value(std::move(elements));
        }

        case nlohmann::json::value_t::object: {
            object_t members;
            for (auto it = doc.begin(); it != doc.end(); ++it) {
                members.emplace(it.key(), import_json(it.value()));
            }
            return value(std::move(members));
        }

        case nlohmann::json::value_t::binary:
            throw std::invalid_argument("jpatch::import_json: binary values are not supported");

        case nlohmann::json::value_t::discarded:
            throw std::invalid_argument("jpatch::import_json: discarded value");
    }
    throw std::invalid_argument("jpatch::import_json: unknown value type");
}

/** Recursively rebuild a nlohmann::json document from a jpatch::value. */
inline nlohmann::json export_json(const value& v) {
    switch (v.type()) {
        case value_type::null:
            return nlohmann::json(nullptr);

        case value_type::boolean:
            return nlohmann::json(v.get_bool());

        case value_type::number: {
            const number& n = v.get_number();
            switch (n.get_kind()) {
                case number::kind::integer:          return nlohmann::json(n.get_int());
                case number::kind::unsigned_integer: return nlohmann::json(n.get_unsigned());
                case number::kind::floating:         return nlohmann::json(n.get_float());
            }
            return nlohmann::json(n.as_double());
        }

        case value_type::string:
            return nlohmann::json(v.get_string());

        case value_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (const value& elem : v.get_array()) {
                arr.push_back(export_json(elem));
            }
            return arr;
        }

        case value_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& member : v.get_object()) {
                obj[member.first] = export_json(member.second);
            }
            return obj;
        }
    }
    return nlohmann::json(nullptr);
}

// nlohmann::json ADL hooks.
inline void to_json(nlohmann::json& j, const value& v)   { j = export_json(v); }
inline void from_json(const nlohmann::json& j, value& v) { v = import_json(j); }

// ---- operations ----

/**
 * Read one RFC 6902 operation object.  A missing member, or a member of the
 * wrong type, is left absent in the record so that validate() reports it.
 * A non-object input gives a record with an empty op.
 */
inline operation_record record_from_json(const nlohmann::json& j) {
    operation_record rec;
    if (!j.is_object()) {
        return rec;
    }
    auto string_member = [&j](const char* name) -> std::optional<std::string> {
        auto it = j.find(name);
        if (it == j.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };

    rec.op   = string_member("op").value_or(std::string());
    rec.path = string_member("path");
    rec.from = string_member("from");

    auto it = j.find("value");
    if (it != j.end()) {
        rec.value = import_json(*it);
    }
    return rec;
}

/** Read an RFC 6902 patch document.  Throws std::invalid_argument unless it is an array. */
inline std::vector<operation_record> patch_from_json(const nlohmann::json& j) {
    if (!j.is_array()) {
        throw std::invalid_argument("jpatch::patch_from_json: patch document must be an array");
    }
    std::vector<operation_record> records;
    records.reserve(j.size());
    for (const auto& elem : j) {
        records.push_back(record_from_json(elem));
    }
    return records;
}

inline nlohmann::json record_to_json(const operation_record& rec) {
    nlohmann::json j = nlohmann::json::object();
    j["op"] = rec.op;
    if (rec.path)  j["path"]  = *rec.path;
    if (rec.from)  j["from"]  = *rec.from;
    if (rec.value) j["value"] = export_json(*rec.value);
    return j;
}

inline nlohmann::json operation_to_json(const operation& op) {
    return record_to_json(to_record(op));
}

inline nlohmann::json patch_to_json(const std::vector<operation>& operations) {
    nlohmann::json arr = nlohmann::json::array();
    for (const operation& op : operations) {
        arr.push_back(operation_to_json(op));
    }
    return arr;
}

// ---- diagnostics ----

inline nlohmann::json error_to_json(const error& e) {
    nlohmann::json j;
    j["kind"]         = to_string(e.kind);
    j["message"]      = e.message;
    j["pointer"]      = e.pointer;
    j["current_path"] = e.current_path;
    if (e.segment)  j["segment"]  = *e.segment;
    if (e.index)    j["index"]    = *e.index;
    if (e.length)   j["length"]   = *e.length;
    if (e.expected) j["expected"] = export_json(*e.expected);
    if (e.actual)   j["actual"]   = export_json(*e.actual);
    return j;
}

inline nlohmann::json error_to_json(const patch_error& e) {
    nlohmann::json j;
    j["kind"]         = to_string(e.kind);
    j["failed_index"] = e.failed_index;
    j["failed"]       = record_to_json(e.failed);
    j["applied"]      = nlohmann::json::array();
    j["remaining"]    = nlohmann::json::array();
    for (const operation_record& rec : e.applied)   j["applied"].push_back(record_to_json(rec));
    for (const operation_record& rec : e.remaining) j["remaining"].push_back(record_to_json(rec));
    j["cause"]         = error_to_json(e.cause);
    j["last_document"] = export_json(e.last_document);
    return j;
}

} // namespace jpatch
