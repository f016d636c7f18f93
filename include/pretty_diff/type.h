// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type.h
/// @brief Kind taxonomy and type descriptors for inspected values.
///
/// Every Value carries a `const Type*`. Two values have the same type iff
/// they point at the same descriptor. TypeRegistry owns the descriptors and
/// interns unnamed composite types, so asking twice for `[]int` returns the
/// same pointer, while named types (structs, `MyInt`) are unique by name.
///
/// Recursive types are declared first and defined afterwards:
/// @code
///   TypeRegistry types;
///   Type* node = types.declare_struct("Node");
///   types.define_fields(node, {{"Val", types.int_type()},
///                              {"Next", types.pointer_to(node)}});
/// @endcode

#pragma once

#include <pretty_diff/api.h>
#include <pretty_diff/value_fwd.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pretty_diff {

enum class Kind : std::uint8_t {
    Invalid = 0,
    Bool,
    Int,
    Uint,
    Float,
    Complex,
    String,
    Array,
    Slice,
    Map,
    Pointer,
    Struct,
    Interface,
    Func,
    Chan,
    UnsafePointer,
};

/// Lower-case kind name ("int", "slice", "unsafe.Pointer", ...)
[[nodiscard]] PRETTY_DIFF_API std::string kind_name(Kind kind);

struct Field {
    std::string name;
    const Type* type = nullptr;
};

class PRETTY_DIFF_API Type {
public:
    /// Scalar or opaque type. Composite types come from TypeRegistry.
    Type(Kind kind, std::string name, unsigned bits = 0)
        : kind_(kind), name_(std::move(name)), bits_(bits) {}

    Type(const Type&) = delete;
    Type& operator=(const Type&) = delete;

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    /// Bit width for numeric kinds (0 means platform int/uint)
    [[nodiscard]] unsigned bits() const noexcept { return bits_; }

    /// Element type of array, slice, pointer, chan; value type of map
    [[nodiscard]] const Type* elem() const noexcept { return elem_; }

    /// Key type of map
    [[nodiscard]] const Type* key() const noexcept { return key_; }

    /// Array length
    [[nodiscard]] std::size_t length() const noexcept { return length_; }

    [[nodiscard]] const std::vector<Field>& fields() const noexcept { return fields_; }
    [[nodiscard]] std::size_t num_fields() const noexcept { return fields_.size(); }

    /// Field index by name, or num_fields() when absent
    [[nodiscard]] std::size_t field_index(std::string_view name) const noexcept;

    /// True until define_fields() ran on a declared struct
    [[nodiscard]] bool is_incomplete() const noexcept { return incomplete_; }

private:
    friend class TypeRegistry;

    Kind kind_;
    std::string name_;
    unsigned bits_ = 0;
    const Type* elem_ = nullptr;
    const Type* key_ = nullptr;
    std::size_t length_ = 0;
    std::vector<Field> fields_;
    bool incomplete_ = false;
};

/// True for kinds that may be used as map keys
[[nodiscard]] PRETTY_DIFF_API bool is_comparable_key(const Type* type) noexcept;

/// Owns and interns Type descriptors. Thread-safe.
///
/// Values store raw `const Type*`: the registry must outlive every Value
/// built from its types. Descriptors from different registries never
/// compare equal, even when their names match.
class PRETTY_DIFF_API TypeRegistry {
public:
    TypeRegistry();
    ~TypeRegistry();

    TypeRegistry(const TypeRegistry&) = delete;
    TypeRegistry& operator=(const TypeRegistry&) = delete;

    /// Predeclared type by name: bool, int, int8..int64, uint, uint8..uint64,
    /// uintptr, float32, float64, complex64, complex128, string,
    /// "interface {}", unsafe.Pointer. Throws std::out_of_range otherwise.
    [[nodiscard]] const Type* builtin(std::string_view name) const;

    [[nodiscard]] const Type* bool_type() const { return builtin("bool"); }
    [[nodiscard]] const Type* int_type() const { return builtin("int"); }
    [[nodiscard]] const Type* uint_type() const { return builtin("uint"); }
    [[nodiscard]] const Type* float64_type() const { return builtin("float64"); }
    [[nodiscard]] const Type* complex128_type() const { return builtin("complex128"); }
    [[nodiscard]] const Type* string_type() const { return builtin("string"); }
    [[nodiscard]] const Type* any_type() const { return builtin("interface {}"); }
    [[nodiscard]] const Type* unsafe_pointer_type() const { return builtin("unsafe.Pointer"); }

    const Type* array_of(const Type* elem, std::size_t length);
    const Type* slice_of(const Type* elem);

    /// Throws std::invalid_argument when `key` can never be a map key
    const Type* map_of(const Type* key, const Type* value);

    const Type* pointer_to(const Type* elem);
    const Type* chan_of(const Type* elem);

    /// Function type identified by its signature, e.g. "func(int) string"
    const Type* func_type(std::string signature);

    /// Named interface type (all interfaces hold any dynamic value)
    const Type* define_interface(std::string name);

    /// Named type with the representation of `underlying` (not struct/interface)
    const Type* define_named(std::string name, const Type* underlying);

    /// Struct type in one step
    const Type* define_struct(std::string name, std::vector<Field> fields);

    /// Forward declaration for self-referential structs
    Type* declare_struct(std::string name);
    void define_fields(Type* type, std::vector<Field> fields);

    /// Anonymous struct, interned by its field list
    const Type* struct_of(std::vector<Field> fields);

    /// Named type lookup; nullptr when unknown
    [[nodiscard]] const Type* find(std::string_view name) const;

private:
    const Type* intern(std::string canonical, std::unique_ptr<Type> type);
    Type* add_named(std::unique_ptr<Type> type);

    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<Type>> owned_;
    std::unordered_map<std::string, const Type*> by_name_;
};

} // namespace pretty_diff
