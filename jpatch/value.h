#pragma once

#include <cstdint>
#include <cstddef>
#include <initializer_list>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// =============================================================================
// jpatch::value
//
// Immutable JSON document value with structural sharing.
//
// Design:
//   - Closed std::variant over the six JSON alternatives.  value_type mirrors
//     the variant index so callers can switch over it exhaustively.
//   - Arrays and objects are held through shared_ptr<const container>.
//     Copying a value copies a handle, never the subtree.
//   - "Mutators" (with_member, without_element, ...) return a NEW value whose
//     top-level container is a fresh copy of this one with a single slot
//     changed.  Every child handle is shared with the original, so a
//     copy-on-write update along a pointer costs O(depth), not O(document).
//   - Numbers keep the precision the decoder chose: signed, unsigned or
//     floating point.
//
// Invariant: a container reachable from a value is never modified after the
// value that owns it has been constructed.
// =============================================================================

namespace jpatch {

// Discriminator, in variant index order.
enum class value_type : uint8_t {
    null    = 0,
    boolean = 1,
    number  = 2,
    string  = 3,
    array   = 4,
    object  = 5
};

// ---------------------------------------------------------------------------
// number: integer / unsigned / float with nlohmann::json comparison rules
// ---------------------------------------------------------------------------
class number {
public:
    enum class kind : uint8_t { integer, unsigned_integer, floating };

    number() noexcept : kind_(kind::integer), int_val_(0) {}
    number(int64_t n) noexcept : kind_(kind::integer), int_val_(n) {}
    number(uint64_t n) noexcept : kind_(kind::unsigned_integer), uint_val_(n) {}
    number(double d) noexcept : kind_(kind::floating), float_val_(d) {}

    kind get_kind() const noexcept { return kind_; }

    bool is_integer()  const noexcept { return kind_ == kind::integer; }
    bool is_unsigned() const noexcept { return kind_ == kind::unsigned_integer; }
    bool is_float()    const noexcept { return kind_ == kind::floating; }

    int64_t  get_int()      const noexcept { return int_val_; }
    uint64_t get_unsigned() const noexcept { return uint_val_; }
    double   get_float()    const noexcept { return float_val_; }

    double as_double() const noexcept {
        switch (kind_) {
            case kind::integer:          return static_cast<double>(int_val_);
            case kind::unsigned_integer: return static_cast<double>(uint_val_);
            case kind::floating:         return float_val_;
        }
        return 0.0;
    }

    /**
     * Integers compare exactly, including across signedness (a negative
     * signed value never equals an unsigned one).  Any comparison that
     * involves a float is done in double precision.
     */
    friend bool operator==(const number& a, const number& b) noexcept {
        if (a.is_float() || b.is_float()) {
            return a.as_double() == b.as_double();
        }
        if (a.kind_ == b.kind_) {
            return a.is_integer() ? a.int_val_ == b.int_val_
                                  : a.uint_val_ == b.uint_val_;
        }
        const number& s = a.is_integer() ? a : b;
        const number& u = a.is_integer() ? b : a;
        return s.int_val_ >= 0 && static_cast<uint64_t>(s.int_val_) == u.uint_val_;
    }

    friend bool operator!=(const number& a, const number& b) noexcept { return !(a == b); }

private:
    kind kind_;
    union {
        int64_t  int_val_;
        uint64_t uint_val_;
        double   float_val_;
    };
};

class value;

using array_t  = std::vector<value>;
using object_t = std::map<std::string, value>;

// ---------------------------------------------------------------------------
// value: the document node
// ---------------------------------------------------------------------------
class value {
public:
    // ---- constructors ----

    value() noexcept : data_(std::in_place_type<std::nullptr_t>, nullptr) {}
    value(std::nullptr_t) noexcept : data_(std::in_place_type<std::nullptr_t>, nullptr) {}
    value(bool b) noexcept : data_(std::in_place_type<bool>, b) {}
    value(number n) noexcept : data_(std::in_place_type<number>, n) {}
    value(const char* s) : data_(std::in_place_type<std::string>, s) {}
    value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}
    value(array_t elements)
        : data_(std::in_place_type<array_ptr>,
                std::make_shared<const array_t>(std::move(elements))) {}
    value(object_t members)
        : data_(std::in_place_type<object_ptr>,
                std::make_shared<const object_t>(std::move(members))) {}

    template<typename T,
             typename std::enable_if<std::is_integral<T>::value &&
                                     !std::is_same<T, bool>::value &&
                                     std::is_signed<T>::value, int>::type = 0>
    value(T n) noexcept : data_(std::in_place_type<number>, static_cast<int64_t>(n)) {}

    template<typename T,
             typename std::enable_if<std::is_integral<T>::value &&
                                     !std::is_same<T, bool>::value &&
                                     std::is_unsigned<T>::value, int>::type = 0>
    value(T n) noexcept : data_(std::in_place_type<number>, static_cast<uint64_t>(n)) {}

    template<typename T,
             typename std::enable_if<std::is_floating_point<T>::value, int>::type = 0>
    value(T d) noexcept : data_(std::in_place_type<number>, static_cast<double>(d)) {}

    // ---- factories ----

    static value make_null() noexcept                  { return value(); }
    static value make_bool(bool b) noexcept            { return value(b); }
    static value make_int(int64_t n) noexcept          { return value(number(n)); }
    static value make_unsigned(uint64_t n) noexcept    { return value(number(n)); }
    static value make_float(double d) noexcept         { return value(number(d)); }
    static value make_string(std::string s)            { return value(std::move(s)); }

    /** Build an array literal: value::array({1, "two", nullptr}). */
    static value array(std::initializer_list<value> elements = {}) {
        return value(array_t(elements));
    }

    /** Build an object literal: value::object({{"a", 1}, {"b", true}}). */
    static value object(std::initializer_list<object_t::value_type> members = {}) {
        return value(object_t(members));
    }

    // ---- type queries ----

    value_type type() const noexcept { return static_cast<value_type>(data_.index()); }

    bool is_null()   const noexcept { return type() == value_type::null; }
    bool is_bool()   const noexcept { return type() == value_type::boolean; }
    bool is_number() const noexcept { return type() == value_type::number; }
    bool is_string() const noexcept { return type() == value_type::string; }
    bool is_array()  const noexcept { return type() == value_type::array; }
    bool is_object() const noexcept { return type() == value_type::object; }

    /** Null, boolean, number or string: nothing to navigate into. */
    bool is_primitive() const noexcept { return !is_array() && !is_object(); }

    // ---- accessors (throw std::bad_variant_access on type mismatch) ----

    bool               get_bool()   const { return std::get<bool>(data_); }
    const number&      get_number() const { return std::get<number>(data_); }
    const std::string& get_string() const { return std::get<std::string>(data_); }
    const array_t&     get_array()  const { return *std::get<array_ptr>(data_); }
    const object_t&    get_object() const { return *std::get<object_ptr>(data_); }

    // ---- container queries ----

    /** Element / member count for containers, 0 for primitives. */
    std::size_t size() const noexcept {
        if (is_array())  return std::get<array_ptr>(data_)->size();
        if (is_object()) return std::get<object_ptr>(data_)->size();
        return 0;
    }

    bool empty() const noexcept { return size() == 0; }

    /** Pointer to the member named key, or nullptr if absent / not an object. */
    const value* find(const std::string& key) const {
        if (!is_object()) return nullptr;
        const object_t& members = get_object();
        auto it = members.find(key);
        return it == members.end() ? nullptr : &it->second;
    }

    bool contains(const std::string& key) const { return find(key) != nullptr; }

    const value& at(std::size_t index) const {
        if (!is_array() || index >= size()) {
            throw std::out_of_range("value::at: index out of range");
        }
        return get_array()[index];
    }

    const value& at(const std::string& key) const {
        const value* member = find(key);
        if (!member) {
            throw std::out_of_range("value::at: key not found: " + key);
        }
        return *member;
    }

    // ---- copy-on-write updates (object) ----

    /** Copy of this object with key bound to v (inserted or overwritten). */
    value with_member(const std::string& key, value v) const {
        object_t members = get_object();
        members[key] = std::move(v);
        return value(std::move(members));
    }

    /** Copy of this object without key.  Absent keys are not an error here. */
    value without_member(const std::string& key) const {
        object_t members = get_object();
        members.erase(key);
        return value(std::move(members));
    }

    // ---- copy-on-write updates (array) ----

    /** Copy of this array with the element at index replaced.  index < size(). */
    value with_element(std::size_t index, value v) const {
        array_t elements = get_array();
        elements.at(index) = std::move(v);
        return value(std::move(elements));
    }

    /** Copy of this array with v inserted before index.  index <= size(). */
    value with_inserted(std::size_t index, value v) const {
        const array_t& src = get_array();
        if (index > src.size()) {
            throw std::out_of_range("value::with_inserted: index out of range");
        }
        array_t elements;
        elements.reserve(src.size() + 1);
        elements.insert(elements.end(), src.begin(), src.begin() + static_cast<std::ptrdiff_t>(index));
        elements.push_back(std::move(v));
        elements.insert(elements.end(), src.begin() + static_cast<std::ptrdiff_t>(index), src.end());
        return value(std::move(elements));
    }

    value with_appended(value v) const {
        return with_inserted(size(), std::move(v));
    }

    /** Copy of this array with the element at index spliced out.  index < size(). */
    value without_element(std::size_t index) const {
        const array_t& src = get_array();
        if (index >= src.size()) {
            throw std::out_of_range("value::without_element: index out of range");
        }
        array_t elements;
        elements.reserve(src.size() - 1);
        elements.insert(elements.end(), src.begin(), src.begin() + static_cast<std::ptrdiff_t>(index));
        elements.insert(elements.end(), src.begin() + static_cast<std::ptrdiff_t>(index) + 1, src.end());
        return value(std::move(elements));
    }

    // ---- identity ----

    /**
     * True if both values are containers backed by the same storage node.
     * Primitives never share storage.
     */
    bool shares_storage_with(const value& other) const noexcept {
        if (is_array() && other.is_array()) {
            return std::get<array_ptr>(data_) == std::get<array_ptr>(other.data_);
        }
        if (is_object() && other.is_object()) {
            return std::get<object_ptr>(data_) == std::get<object_ptr>(other.data_);
        }
        return false;
    }

    // ---- structural equality ----

    friend bool operator==(const value& a, const value& b) {
        if (a.type() != b.type()) return false;
        switch (a.type()) {
            case value_type::null:
                return true;
            case value_type::boolean:
                return a.get_bool() == b.get_bool();
            case value_type::number:
                return a.get_number() == b.get_number();
            case value_type::string:
                return a.get_string() == b.get_string();
            case value_type::array:
                return a.shares_storage_with(b) || a.get_array() == b.get_array();
            case value_type::object:
                return a.shares_storage_with(b) || a.get_object() == b.get_object();
        }
        return false;
    }

    friend bool operator!=(const value& a, const value& b) { return !(a == b); }

private:
    using array_ptr  = std::shared_ptr<const array_t>;
    using object_ptr = std::shared_ptr<const object_t>;

    std::variant<std::nullptr_t, bool, number, std::string, array_ptr, object_ptr> data_;
};

/** Stable lowercase name of a value type ("null", "array", ...). */
inline const char* to_string(value_type t) noexcept {
    switch (t) {
        case value_type::null:    return "null";
        case value_type::boolean: return "boolean";
        case value_type::number:  return "number";
        case value_type::string:  return "string";
        case value_type::array:   return "array";
        case value_type::object:  return "object";
    }
    return "unknown";
}

} // namespace jpatch
