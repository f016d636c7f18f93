// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/key_match.h>
#include <pretty_diff/errors.h>

namespace pretty_diff {

bool key_equal(const ValueRef& a, const ValueRef& b)
{
    if (!a.is_valid() && !b.is_valid()) {
        return true;
    }
    if (!a.is_valid() || !b.is_valid() || a.type() != b.type()) {
        return false;
    }

    switch (a.kind()) {
        case Kind::Bool:
            return a.as_bool() == b.as_bool();
        case Kind::Int:
            return a.as_int() == b.as_int();
        case Kind::Uint:
            return a.as_uint() == b.as_uint();
        case Kind::Float:
            return a.as_float() == b.as_float();
        case Kind::Complex:
            return a.as_complex() == b.as_complex();
        case Kind::String:
            return a.as_string() == b.as_string();
        case Kind::Array:
            for (std::size_t i = 0; i < a.len(); ++i) {
                if (!key_equal(a.index(i), b.index(i))) return false;
            }
            return true;
        case Kind::Struct:
            for (std::size_t i = 0; i < a.num_fields(); ++i) {
                if (!key_equal(a.field(i), b.field(i))) return false;
            }
            return true;
        case Kind::Pointer:
        case Kind::Chan:
        case Kind::UnsafePointer:
            return a.pointer() == b.pointer();
        case Kind::Interface:
            return key_equal(a.elem(), b.elem());
        default:
            throw InvalidMapKeyError(a.type()->name());
    }
}

KeyPartition key_diff(const ValueRef& a, const ValueRef& b)
{
    KeyPartition result;
    const std::size_t a_len = a.len();
    const std::size_t b_len = b.len();

    for (std::size_t i = 0; i < a_len; ++i) {
        auto a_entry = a.map_entry(i);
        bool in_both = false;
        for (std::size_t j = 0; j < b_len; ++j) {
            auto b_entry = b.map_entry(j);
            if (key_equal(a_entry.key, b_entry.key)) {
                result.both.emplace_back(a_entry, b_entry);
                in_both = true;
                break;
            }
        }
        if (!in_both) {
            result.only_left.push_back(a_entry);
        }
    }

    for (std::size_t j = 0; j < b_len; ++j) {
        auto b_entry = b.map_entry(j);
        bool in_both = false;
        for (std::size_t i = 0; i < a_len; ++i) {
            if (key_equal(a.map_entry(i).key, b_entry.key)) {
                in_both = true;
                break;
            }
        }
        if (!in_both) {
            result.only_right.push_back(b_entry);
        }
    }

    return result;
}

} // namespace pretty_diff
