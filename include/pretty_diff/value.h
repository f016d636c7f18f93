// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Typed dynamic Value and the ValueRef inspection handle.
///
/// Value pairs a `const Type*` with a std::variant payload:
/// - Scalars: bool, int64_t (int kinds), uint64_t (uint kinds), double
///   (float kinds), std::complex<double>, std::string
/// - ValueVector (immer::vector of boxes): array elements, slice elements,
///   struct fields in declaration order
/// - ValueEntries (immer::vector of key/value boxes): map entries in
///   insertion order
/// - Pointer: non-owning `const Value*`, nullptr is a nil pointer
/// - Handle: address of a func, chan or unsafe pointer
/// - ValueBox: the dynamic value held by an interface
///
/// A default constructed Value has no type: it is the absent (nil) value.
///
/// ValueRef is the read-only view the differ walks. It tracks whether the
/// viewed storage is addressable; pointer targets and slice elements also
/// carry an identity for cycle detection.

#pragma once

#include <pretty_diff/config.h>

#include <pretty_diff/api.h>
#include <pretty_diff/concepts.h>
#include <pretty_diff/type.h>

#include <immer/box.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <complex>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace pretty_diff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PRETTY_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PRETTY_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

} // namespace detail

struct Value;

using ValueBox    = immer::box<Value>;
using ValueVector = immer::vector<ValueBox>;

struct MapEntry {
    ValueBox key;
    ValueBox value;
};

using ValueEntries = immer::vector<MapEntry>;

struct Pointer {
    const Value* target = nullptr;

    bool operator==(const Pointer&) const = default;
};

struct Handle {
    std::uintptr_t address = 0;

    bool operator==(const Handle&) const = default;
};

struct PRETTY_DIFF_API Value
{
    using storage = std::variant<std::monostate,
                                 bool,
                                 int64_t,
                                 uint64_t,
                                 double,
                                 std::complex<double>,
                                 std::string,
                                 ValueVector,
                                 ValueEntries,
                                 Pointer,
                                 Handle,
                                 ValueBox>;

    const Type* type = nullptr;
    storage data;

    Value() noexcept = default;
    Value(const Type* t, storage d) : type(t), data(std::move(d)) {}

    // ============================================================
    // Factories
    //
    // Every factory checks that `type` has the matching kind and throws
    // std::invalid_argument otherwise. Composite factories coerce their
    // children into the slot type: a typed child stored in an interface
    // slot is wrapped automatically, any other mismatch throws.
    // ============================================================

    static Value of_bool(const Type* type, bool v);
    static Value of_int(const Type* type, int64_t v);
    static Value of_uint(const Type* type, uint64_t v);
    static Value of_float(const Type* type, double v);
    static Value of_complex(const Type* type, std::complex<double> v);
    static Value of_string(const Type* type, std::string v);

    /// Fixed-length array; the element count must equal the type's length
    static Value array(const Type* type, std::initializer_list<Value> elems);
    static Value slice(const Type* type, std::initializer_list<Value> elems);
    static Value slice(const Type* type, const std::vector<Value>& elems);

    /// Struct with fields given in declaration order
    static Value record(const Type* type, std::initializer_list<Value> fields);

    /// Map; a key structurally equal to an earlier one replaces its value
    static Value map(const Type* type, std::initializer_list<std::pair<Value, Value>> entries);

    /// Pointer to caller-owned storage. `target` must outlive the Value.
    static Value pointer(const Type* type, const Value* target);

    /// Interface holding `held` (absent Value for a nil interface)
    static Value boxed(const Type* type, Value held = Value{});

    /// Func, chan or unsafe pointer identified by address
    static Value handle(const Type* type, std::uintptr_t address);

    /// Zero value of `type`: false, 0, "", empty containers, nil pointers
    static Value zero(const Type* type);

    /// Converts `v` into a value storable in a slot of type `slot`
    static Value coerce(const Type* slot, Value v);

    /// Scalar of `type` from a C++ payload, converted to the kind of `type`.
    /// Floating-point payloads are rejected by int and uint kinds, negative
    /// payloads by uint kinds.
    template <typename T>
    static Value scalar(const Type* type, T&& v) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, Value>) {
            return coerce(type, std::forward<T>(v));
        } else if constexpr (std::is_same_v<U, bool>) {
            return of_bool(type, v);
        } else if constexpr (std::is_same_v<U, std::complex<double>> ||
                             std::is_same_v<U, std::complex<float>>) {
            return of_complex(type, std::complex<double>(v));
        } else if constexpr (SignedPayload<T> || UnsignedPayload<T> || FloatPayload<T>) {
            if (!type) throw std::invalid_argument("scalar: null type");
            switch (type->kind()) {
                case Kind::Int:
                    if constexpr (FloatPayload<T>) {
                        throw std::invalid_argument("scalar: floating-point payload for " + type->name());
                    } else {
                        return of_int(type, static_cast<int64_t>(v));
                    }
                case Kind::Uint:
                    if constexpr (FloatPayload<T>) {
                        throw std::invalid_argument("scalar: floating-point payload for " + type->name());
                    } else {
                        if constexpr (SignedPayload<T>) {
                            if (v < 0) throw std::invalid_argument("scalar: negative payload for " + type->name());
                        }
                        return of_uint(type, static_cast<uint64_t>(v));
                    }
                case Kind::Float:   return of_float(type, static_cast<double>(v));
                case Kind::Complex: return of_complex(type, std::complex<double>(static_cast<double>(v), 0.0));
                default:
                    throw std::invalid_argument("scalar: " + type->name() + " does not hold numbers");
            }
        } else {
            static_assert(StringLike<T>, "unsupported scalar payload");
            return of_string(type, std::string(std::forward<T>(v)));
        }
    }

    // ============================================================
    // Queries
    // ============================================================

    [[nodiscard]] bool is_valid() const noexcept { return type != nullptr; }
    [[nodiscard]] Kind kind() const noexcept { return type ? type->kind() : Kind::Invalid; }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    /// Element count of array/slice/map, byte length of string, else 0
    [[nodiscard]] std::size_t size() const noexcept;

    /// Element `index` of an array or slice; absent Value (and a verbose
    /// log line) when out of range or not a sequence
    [[nodiscard]] Value at(std::size_t index) const;

    /// Struct field by name; absent Value (and a verbose log line) when the
    /// field does not exist
    [[nodiscard]] Value field_or(std::string_view name, Value default_val = Value{}) const;
};

/// Map entry view produced by ValueRef::map_entry(); never addressable
struct MapEntryRef;

// ============================================================
// ValueRef - the inspection handle
// ============================================================

class PRETTY_DIFF_API ValueRef {
public:
    ValueRef() noexcept = default;

    /// Root view: not addressable
    explicit ValueRef(const Value& value) noexcept : value_(&value) {}

    /// Addressable storage of its own when `addressable`
    ValueRef(const Value& value, bool addressable) noexcept
        : value_(&value), addressable_(addressable), has_identity_(addressable) {}

    ValueRef(const Value& value, bool addressable, bool has_identity) noexcept
        : value_(&value), addressable_(addressable), has_identity_(has_identity && addressable) {}

    [[nodiscard]] bool is_valid() const noexcept { return value_ && value_->type; }
    [[nodiscard]] const Type* type() const noexcept { return value_ ? value_->type : nullptr; }
    [[nodiscard]] Kind kind() const noexcept { return value_ ? value_->kind() : Kind::Invalid; }

    [[nodiscard]] bool can_addr() const noexcept { return addressable_ && is_valid(); }

    /// Pointer targets and slice elements. Struct fields and array elements
    /// are addressable but live in slots that copies of the parent share, so
    /// their address does not identify them.
    [[nodiscard]] bool has_identity() const noexcept { return has_identity_ && is_valid(); }

    /// Storage address; meaningful as an identity only when has_identity()
    [[nodiscard]] const void* address() const noexcept { return value_; }

    [[nodiscard]] const Value& value() const { return *value_; }

    [[nodiscard]] bool as_bool() const { return std::get<bool>(value_->data); }
    [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(value_->data); }
    [[nodiscard]] uint64_t as_uint() const { return std::get<uint64_t>(value_->data); }
    [[nodiscard]] double as_float() const { return std::get<double>(value_->data); }
    [[nodiscard]] std::complex<double> as_complex() const { return std::get<std::complex<double>>(value_->data); }
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(value_->data); }

    /// Address of a pointer's target, or of a func/chan/unsafe handle
    [[nodiscard]] std::uintptr_t pointer() const;

    /// Nil pointer, nil interface, or zero handle
    [[nodiscard]] bool is_nil() const;

    /// Array/slice/map element count, string byte length
    [[nodiscard]] std::size_t len() const;

    /// Array or slice element. Slice elements are always addressable,
    /// array elements inherit addressability from the array.
    [[nodiscard]] ValueRef index(std::size_t i) const;

    [[nodiscard]] std::size_t num_fields() const;

    /// Struct field; addressable iff the struct is
    [[nodiscard]] ValueRef field(std::size_t i) const;

    /// Pointee (addressable) or interface payload (not addressable);
    /// invalid view when nil
    [[nodiscard]] ValueRef elem() const;

    [[nodiscard]] MapEntryRef map_entry(std::size_t i) const;

private:
    const Value* value_ = nullptr;
    bool addressable_ = false;
    bool has_identity_ = false;
};

struct MapEntryRef {
    ValueRef key;
    ValueRef value;
};

// ============================================================
// Rendering
// ============================================================

/// Composite literal rendering: `Point{X:1, Y:2}`, `[]int{1, 2}`,
/// `map[string]int{"a":1}`, `&Node{...}`, quoted strings, `nil`.
/// A pointer back into a value that is still being rendered prints
/// `(CYCLIC REFERENCE)`.
[[nodiscard]] PRETTY_DIFF_API std::string value_to_string(const ValueRef& val);
[[nodiscard]] PRETTY_DIFF_API std::string value_to_string(const Value& val);

/// Double-quoted string with C-style escapes for quotes, backslashes and
/// control bytes. Well-formed UTF-8 is kept, other bytes above 0x7f are
/// written as `\xNN`.
[[nodiscard]] PRETTY_DIFF_API std::string quote_string(std::string_view s);

/// Shortest round-trip digits, in `1.5e+06` form when the decimal exponent
/// is below -4 or at least 6; `NaN`, `+Inf`, `-Inf` for special values
[[nodiscard]] PRETTY_DIFF_API std::string format_float(double v, unsigned bits = 64);

/// `(re+imi)`
[[nodiscard]] PRETTY_DIFF_API std::string format_complex(std::complex<double> v, unsigned bits = 128);

/// Print a Value with one line per leaf, indented by depth
PRETTY_DIFF_API void print_value(const Value& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace pretty_diff
