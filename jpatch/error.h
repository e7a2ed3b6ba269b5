#pragma once

#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "value.h"

// =============================================================================
// jpatch error model
//
// Every pointer and patch function reports failure through result<T, E>
// rather than by throwing.  The error record carries the structured context
// of the failure (pointer, offending segment, path walked so far, index and
// container length, expected/actual values) next to a human readable message.
//
// result<T, E>::value() on a failed result throws jpatch::exception, so code
// that prefers exceptions can unwrap directly.
// =============================================================================

namespace jpatch {

enum class error_kind : uint8_t {
    // pointer syntax
    invalid_pointer_format,
    invalid_index,
    negative_index,
    // navigation
    path_not_found,
    index_out_of_bounds,
    primitive_navigation,
    append_not_navigable,
    // mutation
    cannot_set_on_primitive,
    cannot_remove_root,
    append_not_removable,
    primitive_remove,
    // operation level
    invalid_operation_kind,
    missing_path,
    missing_value,
    missing_from,
    unsupported_operation,
    // semantic
    test_failed,
    // patch level
    patch_aborted
};

/** Stable snake_case name of an error kind. */
inline const char* to_string(error_kind kind) noexcept {
    switch (kind) {
        case error_kind::invalid_pointer_format:  return "invalid_pointer_format";
        case error_kind::invalid_index:           return "invalid_index";
        case error_kind::negative_index:          return "negative_index";
        case error_kind::path_not_found:          return "path_not_found";
        case error_kind::index_out_of_bounds:     return "index_out_of_bounds";
        case error_kind::primitive_navigation:    return "primitive_navigation";
        case error_kind::append_not_navigable:    return "append_not_navigable";
        case error_kind::cannot_set_on_primitive: return "cannot_set_on_primitive";
        case error_kind::cannot_remove_root:      return "cannot_remove_root";
        case error_kind::append_not_removable:    return "append_not_removable";
        case error_kind::primitive_remove:        return "primitive_remove";
        case error_kind::invalid_operation_kind:  return "invalid_operation_kind";
        case error_kind::missing_path:            return "missing_path";
        case error_kind::missing_value:           return "missing_value";
        case error_kind::missing_from:            return "missing_from";
        case error_kind::unsupported_operation:   return "unsupported_operation";
        case error_kind::test_failed:             return "test_failed";
        case error_kind::patch_aborted:           return "patch_aborted";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// error: one failed pointer / operation step
// ---------------------------------------------------------------------------
struct error {
    error_kind  kind = error_kind::invalid_pointer_format;
    std::string message;

    std::string                pointer;       // pointer string as given by the caller
    std::optional<std::string> segment;       // offending (unescaped) segment
    std::vector<std::string>   current_path;  // segments walked, offending one included

    std::optional<std::size_t> index;         // parsed array index (index errors)
    std::optional<std::size_t> length;        // array length at the failure point

    std::optional<jpatch::value> expected;    // test_failed only
    std::optional<jpatch::value> actual;      // test_failed only

    /** One-line rendering: "<kind>: <message> (pointer '/a/1', segment '1', ...)". */
    std::string describe() const {
        std::ostringstream out;
        out << to_string(kind) << ": " << message;

        std::vector<std::string> details;
        if (!pointer.empty() || segment) {
            details.push_back("pointer '" + pointer + "'");
        }
        if (segment) {
            details.push_back("segment '" + *segment + "'");
        }
        if (index) {
            details.push_back("index " + std::to_string(*index));
        }
        if (length) {
            details.push_back("length " + std::to_string(*length));
        }
        if (!details.empty()) {
            out << " (";
            for (std::size_t i = 0; i < details.size(); ++i) {
                if (i) out << ", ";
                out << details[i];
            }
            out << ")";
        }
        return out.str();
    }
};

// ---------------------------------------------------------------------------
// exception: thrown when a failed result is unwrapped
// ---------------------------------------------------------------------------
class exception : public std::runtime_error {
public:
    exception(error_kind kind, const std::string& what_arg)
        : std::runtime_error(what_arg), kind_(kind) {}

    error_kind kind() const noexcept { return kind_; }

private:
    error_kind kind_;
};

// ---------------------------------------------------------------------------
// result<T, E>: success value or error
//
// E must expose a `kind` member and a describe() method; both error and
// patch_error do.
// ---------------------------------------------------------------------------
template<typename T, typename E = error>
class result {
public:
    result(T val) : data_(std::in_place_index<0>, std::move(val)) {}
    result(E err) : data_(std::in_place_index<1>, std::move(err)) {}

    bool ok() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return ok(); }

    /** The success value.  Throws jpatch::exception if this result is a failure. */
    const T& value() const & {
        ensure_ok();
        return std::get<0>(data_);
    }

    T&& value() && {
        ensure_ok();
        return std::get<0>(std::move(data_));
    }

    /** The failure.  Throws std::logic_error if this result is a success. */
    const E& error() const {
        if (ok()) {
            throw std::logic_error("jpatch::result::error: result holds a value");
        }
        return std::get<1>(data_);
    }

    T value_or(T fallback) const {
        return ok() ? std::get<0>(data_) : std::move(fallback);
    }

private:
    void ensure_ok() const {
        if (!ok()) {
            const E& err = std::get<1>(data_);
            throw exception(err.kind, err.describe());
        }
    }

    std::variant<T, E> data_;
};

namespace detail {

// Error with pointer context; the caller fills in index / length when known.
inline error make_error(error_kind kind,
                        std::string message,
                        const std::string& pointer,
                        std::optional<std::string> segment = std::nullopt,
                        std::vector<std::string> current_path = {}) {
    error e;
    e.kind         = kind;
    e.message      = std::move(message);
    e.pointer      = pointer;
    e.segment      = std::move(segment);
    e.current_path = std::move(current_path);
    return e;
}

} // namespace detail

} // namespace jpatch
