// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of struct, slice and map Values.
///
/// Builders know the slot types of the value they build, so plain C++
/// payloads are converted to the field / element / key type directly:
///
/// @code
///   #include <pretty_diff/builders.h>
///
///   const Type* point = types.define_struct("Point", {{"X", types.int_type()},
///                                                     {"Y", types.int_type()}});
///   Value p = StructBuilder(point).set("X", 1).set("Y", 2).finish();
///
///   Value xs = SliceBuilder(types.slice_of(types.string_type()))
///       .push_back("a")
///       .push_back("b")
///       .finish();
///
///   Value m = MapBuilder(types.map_of(types.string_type(), types.int_type()))
///       .set("a", 1)
///       .set("b", 2)
///       .finish();
/// @endcode

#pragma once

#include <pretty_diff/value.h>
#include <pretty_diff/key_match.h>

#include <immer/vector_transient.hpp>

#include <format>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace pretty_diff {

/// Builder for struct values. Unset fields keep their zero value.
class StructBuilder {
public:
    explicit StructBuilder(const Type* type)
        : type_(checked(type)), fields_(std::get<ValueVector>(Value::zero(type).data).transient()) {}

    StructBuilder(StructBuilder&&) noexcept = default;
    StructBuilder& operator=(StructBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    StructBuilder(const StructBuilder&) = delete;
    StructBuilder& operator=(const StructBuilder&) = delete;

    /// Set a field by name
    /// @throws std::invalid_argument for an unknown field or a payload the
    ///         field type cannot hold
    template <typename T>
    StructBuilder& set(std::string_view field, T&& val) {
        const auto i = type_->field_index(field);
        if (i == type_->num_fields()) {
            throw std::invalid_argument(std::format("{} has no field '{}'", type_->name(), field));
        }
        fields_.set(i, ValueBox{Value::scalar(type_->fields()[i].type, std::forward<T>(val))});
        return *this;
    }

    [[nodiscard]] Value finish() {
        return Value{type_, fields_.persistent()};
    }

private:
    static const Type* checked(const Type* type) {
        if (!type || type->kind() != Kind::Struct || type->is_incomplete()) {
            throw std::invalid_argument("StructBuilder needs a defined struct type");
        }
        return type;
    }

    const Type* type_;
    ValueVector::transient_type fields_;
};

/// Builder for slice values
class SliceBuilder {
public:
    explicit SliceBuilder(const Type* type)
        : type_(type), elems_(ValueVector{}.transient()) {
        if (!type_ || type_->kind() != Kind::Slice) {
            throw std::invalid_argument("SliceBuilder needs a slice type");
        }
    }

    SliceBuilder(SliceBuilder&&) noexcept = default;
    SliceBuilder& operator=(SliceBuilder&&) noexcept = default;
    SliceBuilder(const SliceBuilder&) = delete;
    SliceBuilder& operator=(const SliceBuilder&) = delete;

    template <typename T>
    SliceBuilder& push_back(T&& val) {
        elems_.push_back(ValueBox{Value::scalar(type_->elem(), std::forward<T>(val))});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return elems_.size(); }

    [[nodiscard]] Value finish() {
        return Value{type_, elems_.persistent()};
    }

private:
    const Type* type_;
    ValueVector::transient_type elems_;
};

/// Builder for map values. Setting a key structurally equal to an existing
/// one replaces its value and keeps its position.
class MapBuilder {
public:
    explicit MapBuilder(const Type* type) : type_(type) {
        if (!type_ || type_->kind() != Kind::Map) {
            throw std::invalid_argument("MapBuilder needs a map type");
        }
    }

    template <typename K, typename V>
    MapBuilder& set(K&& key, V&& val) {
        MapEntry entry{ValueBox{Value::scalar(type_->key(), std::forward<K>(key))},
                       ValueBox{Value::scalar(type_->elem(), std::forward<V>(val))}};
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            if (key_equal(ValueRef{*entries_[i].key}, ValueRef{*entry.key})) {
                entries_ = std::move(entries_).set(i, std::move(entry));
                return *this;
            }
        }
        entries_ = std::move(entries_).push_back(std::move(entry));
        return *this;
    }

    /// Check if the builder contains a key structurally equal to `key`
    template <typename K>
    [[nodiscard]] bool contains(K&& key) const {
        Value candidate = Value::scalar(type_->key(), std::forward<K>(key));
        for (const auto& entry : entries_) {
            if (key_equal(ValueRef{*entry.key}, ValueRef{candidate})) return true;
        }
        return false;
    }

    [[nodiscard]] std::size_t size() const { return entries_.size(); }

    [[nodiscard]] Value finish() const {
        return Value{type_, entries_};
    }

private:
    const Type* type_;
    ValueEntries entries_;
};

} // namespace pretty_diff
