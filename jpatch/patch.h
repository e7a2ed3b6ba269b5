#pragma once

#include <cstddef>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "value.h"
#include "error.h"
#include "pointer.h"
#include "operation.h"

// =============================================================================
// jpatch patch engine: RFC 6902 JSON Patch
//
// Six handlers (apply_add ... apply_test) built on the pointer engine, a
// dispatcher (apply_operation) and the all-or-nothing driver (apply_patch).
//
// apply_patch threads the document through the operations left to right.
// The first failing operation aborts the patch; the caller gets a
// patch_error describing the failure, the operations applied before it, the
// operations never attempted, and the last fully applied document.  The
// input document is never modified, so the caller's copy is always the
// pre-patch state.
// =============================================================================

namespace jpatch {

// ---------------------------------------------------------------------------
// patch_error: failure of a whole patch
// ---------------------------------------------------------------------------
struct patch_error {
    error_kind kind = error_kind::patch_aborted;

    std::size_t                   failed_index = 0;
    operation_record              failed;
    std::vector<operation_record> applied;
    std::vector<operation_record> remaining;

    error         cause;
    jpatch::value last_document;   // result of the applied prefix

    std::string describe() const {
        std::ostringstream out;
        out << to_string(kind) << ": JSON Patch operation " << failed_index
            << " ('" << failed.op << "') failed after " << applied.size()
            << " applied, " << remaining.size() << " not attempted: "
            << cause.describe();
        return out.str();
    }
};

// ---- operation handlers ----

/**
 * add: like set_pointer, except that on an array the terminal index inserts
 * and shifts later elements right instead of overwriting.  On an object an
 * existing key is overwritten, exactly as replace would.
 */
inline result<value> apply_add(const value& doc, const add_op& op) {
    return detail::write_pointer(doc, op.path, op.value, detail::array_write::insert);
}

inline result<value> apply_remove(const value& doc, const remove_op& op) {
    return remove_pointer(doc, op.path);
}

/** replace: the target must already exist; a missing path fails like resolve_pointer. */
inline result<value> apply_replace(const value& doc, const replace_op& op) {
    result<value> existing = resolve_pointer(doc, op.path);
    if (!existing) return existing;
    return set_pointer(doc, op.path, op.value);
}

/**
 * move: read from, remove it, then write at path against the document with
 * from already removed, so indices after from shift before path is applied.
 */
inline result<value> apply_move(const value& doc, const move_op& op) {
    result<value> moved = resolve_pointer(doc, op.from);
    if (!moved) return moved;
    result<value> without_source = remove_pointer(doc, op.from);
    if (!without_source) return without_source;
    return set_pointer(without_source.value(), op.path, moved.value());
}

inline result<value> apply_copy(const value& doc, const copy_op& op) {
    result<value> copied = resolve_pointer(doc, op.from);
    if (!copied) return copied;
    return set_pointer(doc, op.path, copied.value());
}

inline result<value> apply_test(const value& doc, const test_op& op) {
    result<value> actual = resolve_pointer(doc, op.path);
    if (!actual) return actual;
    if (actual.value() == op.value) {
        return doc;
    }
    error e = detail::make_error(error_kind::test_failed,
                                 "Test operation failed: values do not match", op.path);
    e.expected = op.value;
    e.actual   = actual.value();
    return e;
}

// ---- dispatch ----

inline result<value> apply_operation(const value& doc, const operation& op) {
    return std::visit([&doc](const auto& o) -> result<value> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, add_op>)          return apply_add(doc, o);
        else if constexpr (std::is_same_v<T, remove_op>)  return apply_remove(doc, o);
        else if constexpr (std::is_same_v<T, replace_op>) return apply_replace(doc, o);
        else if constexpr (std::is_same_v<T, move_op>)    return apply_move(doc, o);
        else if constexpr (std::is_same_v<T, copy_op>)    return apply_copy(doc, o);
        else                                              return apply_test(doc, o);
    }, op);
}

/** Validate the record, then dispatch it. */
inline result<value> apply_operation(const value& doc, const operation_record& rec) {
    result<operation> op = validate(rec);
    if (!op) return op.error();
    return apply_operation(doc, op.value());
}

// ---- patch ----

namespace detail {

inline const operation_record& as_record(const operation_record& rec) { return rec; }
inline operation_record        as_record(const operation& op)         { return to_record(op); }

template<typename Op>
result<value, patch_error> apply_all(const value& doc, const std::vector<Op>& operations) {
    value current = doc;
    for (std::size_t i = 0; i < operations.size(); ++i) {
        result<value> next = apply_operation(current, operations[i]);
        if (!next) {
            patch_error failure;
            failure.failed_index  = i;
            failure.failed        = as_record(operations[i]);
            failure.cause         = next.error();
            failure.last_document = current;
            for (std::size_t j = 0; j < i; ++j) {
                failure.applied.push_back(as_record(operations[j]));
            }
            for (std::size_t j = i + 1; j < operations.size(); ++j) {
                failure.remaining.push_back(as_record(operations[j]));
            }
            return failure;
        }
        current = std::move(next).value();
    }
    return current;
}

} // namespace detail

/**
 * Apply operations in order.  Either every operation succeeds and the new
 * document is returned, or the first failure aborts the patch with a
 * patch_error; no partially patched document is returned as a success.
 */
inline result<value, patch_error> apply_patch(const value& doc, const std::vector<operation>& operations) {
    return detail::apply_all(doc, operations);
}

/** Same as above for flat records; each record is validated when reached. */
inline result<value, patch_error> apply_patch(const value& doc, const std::vector<operation_record>& records) {
    return detail::apply_all(doc, records);
}

} // namespace jpatch
