#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

#include "value.h"
#include "error.h"

// =============================================================================
// jpatch operations: RFC 6902 operation records
//
// Two forms of the same operation:
//
//   operation_record  Flat, loosely typed: what a decoder produces from an
//                     {"op": ..., "path": ..., "value": ..., "from": ...}
//                     object.  Any field may be missing and op may be any
//                     string.
//
//   operation         Closed variant of six structs, each holding exactly the
//                     fields its kind requires.  A typed operation cannot be
//                     missing a field, so it needs no validation.
//
// validate() turns a record into an operation or reports the first problem.
// The builders in jpatch::ops assemble typed operations without checks.
// =============================================================================

namespace jpatch {

enum class op_kind : uint8_t { add, remove, replace, move, copy, test };

inline const char* to_string(op_kind kind) noexcept {
    switch (kind) {
        case op_kind::add:     return "add";
        case op_kind::remove:  return "remove";
        case op_kind::replace: return "replace";
        case op_kind::move:    return "move";
        case op_kind::copy:    return "copy";
        case op_kind::test:    return "test";
    }
    return "unknown";
}

inline std::optional<op_kind> parse_op_kind(const std::string& name) {
    if (name == "add")     return op_kind::add;
    if (name == "remove")  return op_kind::remove;
    if (name == "replace") return op_kind::replace;
    if (name == "move")    return op_kind::move;
    if (name == "copy")    return op_kind::copy;
    if (name == "test")    return op_kind::test;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// operation_record: flat form
// ---------------------------------------------------------------------------
struct operation_record {
    std::string                  op;
    std::optional<std::string>   path;
    std::optional<jpatch::value> value;   // presence matters, null is a value
    std::optional<std::string>   from;

    friend bool operator==(const operation_record& a, const operation_record& b) {
        return a.op == b.op && a.path == b.path && a.value == b.value && a.from == b.from;
    }
    friend bool operator!=(const operation_record& a, const operation_record& b) { return !(a == b); }
};

// ---------------------------------------------------------------------------
// typed operations
// ---------------------------------------------------------------------------
struct add_op     { std::string path; jpatch::value value; };
struct remove_op  { std::string path; };
struct replace_op { std::string path; jpatch::value value; };
struct move_op    { std::string from; std::string path; };
struct copy_op    { std::string from; std::string path; };
struct test_op    { std::string path; jpatch::value value; };

using operation = std::variant<add_op, remove_op, replace_op, move_op, copy_op, test_op>;

/** Kind of a typed operation; follows the variant index. */
inline op_kind kind_of(const operation& op) noexcept {
    return static_cast<op_kind>(op.index());
}

/** Flat form of a typed operation, for diagnostics and encoding. */
inline operation_record to_record(const operation& op) {
    operation_record rec;
    rec.op = to_string(kind_of(op));
    std::visit([&rec](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        rec.path = o.path;
        if constexpr (std::is_same_v<T, add_op> || std::is_same_v<T, replace_op> ||
                      std::is_same_v<T, test_op>) {
            rec.value = o.value;
        }
        if constexpr (std::is_same_v<T, move_op> || std::is_same_v<T, copy_op>) {
            rec.from = o.from;
        }
    }, op);
    return rec;
}

/**
 * Check a record and convert it to its typed operation.
 *
 * Fails with invalid_operation_kind for an unknown op, missing_path when no
 * path is present (any kind), missing_value for add/replace/test without a
 * value, and missing_from for move/copy without a from.  Fields a kind does
 * not use are ignored.
 */
inline result<operation> validate(const operation_record& rec) {
    std::optional<op_kind> kind = parse_op_kind(rec.op);
    if (!kind) {
        return detail::make_error(error_kind::invalid_operation_kind,
                                  "Invalid operation type '" + rec.op + "'",
                                  rec.path.value_or(std::string()));
    }
    if (!rec.path) {
        return detail::make_error(error_kind::missing_path,
                                  std::string(to_string(*kind)) +
                                  " operation missing required 'path' field",
                                  std::string());
    }

    const std::string& path = *rec.path;
    auto missing_value = [&]() {
        return detail::make_error(error_kind::missing_value,
                                  std::string(to_string(*kind)) +
                                  " operation missing required 'value' field", path);
    };
    auto missing_from = [&]() {
        return detail::make_error(error_kind::missing_from,
                                  std::string(to_string(*kind)) +
                                  " operation missing required 'from' field", path);
    };

    switch (*kind) {
        case op_kind::add:
            if (!rec.value) return missing_value();
            return operation(add_op{path, *rec.value});
        case op_kind::remove:
            return operation(remove_op{path});
        case op_kind::replace:
            if (!rec.value) return missing_value();
            return operation(replace_op{path, *rec.value});
        case op_kind::move:
            if (!rec.from) return missing_from();
            return operation(move_op{*rec.from, path});
        case op_kind::copy:
            if (!rec.from) return missing_from();
            return operation(copy_op{*rec.from, path});
        case op_kind::test:
            if (!rec.value) return missing_value();
            return operation(test_op{path, *rec.value});
    }
    return detail::make_error(error_kind::unsupported_operation,
                              "Unsupported operation '" + rec.op + "'", path);
}

// ---------------------------------------------------------------------------
// builders
// ---------------------------------------------------------------------------
namespace ops {

inline operation add(std::string path, value v)     { return add_op{std::move(path), std::move(v)}; }
inline operation remove(std::string path)           { return remove_op{std::move(path)}; }
inline operation replace(std::string path, value v) { return replace_op{std::move(path), std::move(v)}; }
inline operation move(std::string from, std::string path) { return move_op{std::move(from), std::move(path)}; }
inline operation copy(std::string from, std::string path) { return copy_op{std::move(from), std::move(path)}; }
inline operation test(std::string path, value v)    { return test_op{std::move(path), std::move(v)}; }

} // namespace ops

} // namespace jpatch
