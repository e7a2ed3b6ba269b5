#pragma once

#include <cstddef>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include "value.h"
#include "error.h"

// =============================================================================
// jpatch pointer engine: RFC 6901 JSON Pointer
//
//   escape_segment / unescape_segment     "~" <-> "~0", "/" <-> "~1"
//   pointer_to_segments / segments_to_pointer
//   parse_array_index                     "-" is the append sentinel
//   resolve_pointer                       read the value at a pointer
//   set_pointer                           new document with a value written
//   remove_pointer                        new document with a value removed
//
// set_pointer and remove_pointer never touch their input: they rebuild the
// containers on the path from the root to the target and share everything
// else with the original document.
// =============================================================================

namespace jpatch {

// ---- segment escaping ----

namespace detail {

inline std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    std::size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

} // namespace detail

/** "a/b~c" -> "a~1b~0c".  "~" is escaped first so "~1" is never re-escaped. */
inline std::string escape_segment(const std::string& segment) {
    return detail::replace_all(detail::replace_all(segment, "~", "~0"), "/", "~1");
}

/** "a~1b~0c" -> "a/b~c".  "~01" unescapes to "~1", not "/". */
inline std::string unescape_segment(const std::string& segment) {
    return detail::replace_all(detail::replace_all(segment, "~1", "/"), "~0", "~");
}

// ---- pointer <-> segments ----

/**
 * Split a pointer into unescaped segments.
 *   ""       -> []
 *   "/"      -> [""]
 *   "/a//c"  -> ["a", "", "c"]
 * A non-empty pointer must start with '/'.
 */
inline result<std::vector<std::string>> pointer_to_segments(const std::string& pointer) {
    std::vector<std::string> segments;
    if (pointer.empty()) {
        return std::move(segments);
    }
    if (pointer.front() != '/') {
        return detail::make_error(error_kind::invalid_pointer_format,
                                  "Invalid JSON Pointer: must start with '/'", pointer);
    }
    std::size_t start = 1;
    for (;;) {
        std::size_t slash = pointer.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(unescape_segment(pointer.substr(start)));
            break;
        }
        segments.push_back(unescape_segment(pointer.substr(start, slash - start)));
        start = slash + 1;
    }
    return std::move(segments);
}

inline std::string segments_to_pointer(const std::vector<std::string>& segments) {
    std::string pointer;
    for (const std::string& segment : segments) {
        pointer += '/';
        pointer += escape_segment(segment);
    }
    return pointer;
}

// ---- array index tokens ----

struct array_index {
    std::size_t position  = 0;
    bool        is_append = false;   // the "-" token; position is meaningless

    static array_index append() noexcept { return array_index{0, true}; }
    static array_index at(std::size_t pos) noexcept { return array_index{pos, false}; }
};

/**
 * "-" -> append sentinel; "12" -> 12 (leading zeros accepted).
 * "-3" fails negative_index; anything else (including "" and numbers that
 * overflow size_t) fails invalid_index.  No bounds check.
 */
inline result<array_index> parse_array_index(const std::string& segment) {
    if (segment == "-") {
        return array_index::append();
    }

    auto all_digits = [](const std::string& s, std::size_t from) {
        if (s.size() <= from) return false;
        for (std::size_t i = from; i < s.size(); ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
        }
        return true;
    };

    if (segment.empty()) {
        return detail::make_error(error_kind::invalid_index,
                                  "Invalid array index", std::string(), segment);
    }
    if (segment.front() == '-' && all_digits(segment, 1)) {
        return detail::make_error(error_kind::negative_index,
                                  "Array index cannot be negative", std::string(), segment);
    }
    if (!all_digits(segment, 0)) {
        return detail::make_error(error_kind::invalid_index,
                                  "Invalid array index", std::string(), segment);
    }

    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t pos = 0;
    for (char c : segment) {
        std::size_t digit = static_cast<std::size_t>(c - '0');
        if (pos > (max - digit) / 10) {
            return detail::make_error(error_kind::invalid_index,
                                      "Array index too large", std::string(), segment);
        }
        pos = pos * 10 + digit;
    }
    return array_index::at(pos);
}

namespace detail {

// parse_array_index knows only the segment; attach where it happened.
inline error with_pointer_context(error e,
                                  const std::string& pointer,
                                  const std::vector<std::string>& current_path) {
    e.pointer      = pointer;
    e.current_path = current_path;
    return e;
}

inline error index_out_of_bounds(std::string message,
                                 const std::string& pointer,
                                 const std::string& segment,
                                 const std::vector<std::string>& current_path,
                                 std::size_t index,
                                 std::size_t length) {
    error e = make_error(error_kind::index_out_of_bounds, std::move(message),
                         pointer, segment, current_path);
    e.index  = index;
    e.length = length;
    return e;
}

// How a write treats an existing element at the terminal array segment.
enum class array_write : uint8_t {
    overwrite,  // set / replace: replace in place
    insert      // add: shift later elements right
};

// Recursive copy-on-write writer shared by set_pointer and the add operation.
// An absent object key and an appended array slot start from an empty object
// when further segments follow.
inline result<value> write_step(const value& current,
                                const std::vector<std::string>& segments,
                                std::size_t depth,
                                const std::string& pointer,
                                const value& new_value,
                                array_write mode,
                                std::vector<std::string>& path) {
    if (depth == segments.size()) {
        return new_value;
    }

    const std::string& segment = segments[depth];
    path.push_back(segment);
    const bool terminal = depth + 1 == segments.size();

    switch (current.type()) {
        case value_type::object: {
            const value* child = current.find(segment);
            result<value> sub = write_step(child ? *child : value::object(), segments,
                                           depth + 1, pointer, new_value, mode, path);
            if (!sub) return sub;
            return current.with_member(segment, std::move(sub).value());
        }

        case value_type::array: {
            result<array_index> idx = parse_array_index(segment);
            if (!idx) return with_pointer_context(idx.error(), pointer, path);

            const std::size_t length = current.size();
            const array_index where  = idx.value();

            if (where.is_append || where.position == length) {
                result<value> sub = write_step(value::object(), segments, depth + 1,
                                               pointer, new_value, mode, path);
                if (!sub) return sub;
                return current.with_appended(std::move(sub).value());
            }
            if (where.position > length) {
                return index_out_of_bounds("Cannot insert at array index beyond length",
                                           pointer, segment, path, where.position, length);
            }
            if (terminal && mode == array_write::insert) {
                return current.with_inserted(where.position, new_value);
            }
            result<value> sub = write_step(current.get_array()[where.position], segments,
                                           depth + 1, pointer, new_value, mode, path);
            if (!sub) return sub;
            return current.with_element(where.position, std::move(sub).value());
        }

        case value_type::null:
        case value_type::boolean:
        case value_type::number:
        case value_type::string:
            return make_error(error_kind::cannot_set_on_primitive,
                              "Cannot set property on primitive value",
                              pointer, segment, path);
    }
    return make_error(error_kind::cannot_set_on_primitive,
                      "Cannot set property on primitive value", pointer, segment, path);
}

inline result<value> write_pointer(const value& doc,
                                   const std::string& pointer,
                                   const value& new_value,
                                   array_write mode) {
    result<std::vector<std::string>> segments = pointer_to_segments(pointer);
    if (!segments) return segments.error();
    std::vector<std::string> path;
    return write_step(doc, segments.value(), 0, pointer, new_value, mode, path);
}

inline result<value> remove_step(const value& current,
                                 const std::vector<std::string>& segments,
                                 std::size_t depth,
                                 const std::string& pointer,
                                 std::vector<std::string>& path) {
    const std::string& segment = segments[depth];
    path.push_back(segment);
    const bool terminal = depth + 1 == segments.size();

    switch (current.type()) {
        case value_type::object: {
            const value* child = current.find(segment);
            if (!child) {
                return make_error(error_kind::path_not_found,
                                  "Path not found in object for removal",
                                  pointer, segment, path);
            }
            if (terminal) {
                return current.without_member(segment);
            }
            result<value> sub = remove_step(*child, segments, depth + 1, pointer, path);
            if (!sub) return sub;
            return current.with_member(segment, std::move(sub).value());
        }

        case value_type::array: {
            result<array_index> idx = parse_array_index(segment);
            if (!idx) return with_pointer_context(idx.error(), pointer, path);

            const array_index where = idx.value();
            if (where.is_append) {
                return terminal
                    ? make_error(error_kind::append_not_removable,
                                 "Cannot remove append index '-'", pointer, segment, path)
                    : make_error(error_kind::append_not_navigable,
                                 "Cannot navigate using append index '-'", pointer, segment, path);
            }
            if (where.position >= current.size()) {
                return index_out_of_bounds(terminal ? "Array index out of bounds for removal"
                                                    : "Array index out of bounds for navigation",
                                           pointer, segment, path, where.position, current.size());
            }
            if (terminal) {
                return current.without_element(where.position);
            }
            result<value> sub = remove_step(current.get_array()[where.position], segments,
                                            depth + 1, pointer, path);
            if (!sub) return sub;
            return current.with_element(where.position, std::move(sub).value());
        }

        case value_type::null:
        case value_type::boolean:
        case value_type::number:
        case value_type::string:
            break;
    }
    return terminal
        ? make_error(error_kind::primitive_remove,
                     "Cannot remove from primitive value", pointer, segment, path)
        : make_error(error_kind::primitive_navigation,
                     "Cannot navigate into primitive value", pointer, segment, path);
}

} // namespace detail

// ---- resolve / set / remove ----

/**
 * Return the value addressed by pointer.  The root pointer "" yields doc.
 * Fails with path_not_found, index_out_of_bounds, append_not_navigable,
 * primitive_navigation, or any pointer syntax error.
 */
inline result<value> resolve_pointer(const value& doc, const std::string& pointer) {
    result<std::vector<std::string>> segments = pointer_to_segments(pointer);
    if (!segments) return segments.error();

    const value* current = &doc;
    std::vector<std::string> path;

    for (const std::string& segment : segments.value()) {
        path.push_back(segment);

        switch (current->type()) {
            case value_type::object: {
                const value* child = current->find(segment);
                if (!child) {
                    return detail::make_error(error_kind::path_not_found,
                                              "Path not found in object",
                                              pointer, segment, path);
                }
                current = child;
                break;
            }

            case value_type::array: {
                result<array_index> idx = parse_array_index(segment);
                if (!idx) return detail::with_pointer_context(idx.error(), pointer, path);

                if (idx.value().is_append) {
                    return detail::make_error(error_kind::append_not_navigable,
                                              "Cannot navigate using append index '-'",
                                              pointer, segment, path);
                }
                const std::size_t position = idx.value().position;
                if (position >= current->size()) {
                    return detail::index_out_of_bounds("Array index out of bounds", pointer,
                                                       segment, path, position, current->size());
                }
                current = &current->get_array()[position];
                break;
            }

            case value_type::null:
            case value_type::boolean:
            case value_type::number:
            case value_type::string:
                return detail::make_error(error_kind::primitive_navigation,
                                          "Cannot navigate into primitive value",
                                          pointer, segment, path);
        }
    }
    return *current;
}

/**
 * Return a copy of doc with new_value written at pointer.
 *
 *   - "" replaces the whole document.
 *   - Missing object keys along the way are created as empty objects.
 *   - On arrays, "-" or index == size appends; index < size replaces in
 *     place; index > size fails index_out_of_bounds.
 *   - Descending into a primitive fails cannot_set_on_primitive.
 */
inline result<value> set_pointer(const value& doc, const std::string& pointer, const value& new_value) {
    return detail::write_pointer(doc, pointer, new_value, detail::array_write::overwrite);
}

/**
 * Return a copy of doc without the value at pointer.
 *
 * The root cannot be removed.  The terminal segment must name an existing
 * key or an in-bounds array index ("-" fails append_not_removable); array
 * removal splices.  Intermediate segments fail exactly as resolve_pointer.
 */
inline result<value> remove_pointer(const value& doc, const std::string& pointer) {
    result<std::vector<std::string>> segments = pointer_to_segments(pointer);
    if (!segments) return segments.error();
    if (segments.value().empty()) {
        return detail::make_error(error_kind::cannot_remove_root,
                                  "Cannot remove root document", pointer);
    }
    std::vector<std::string> path;
    return detail::remove_step(doc, segments.value(), 0, pointer, path);
}

} // namespace jpatch
