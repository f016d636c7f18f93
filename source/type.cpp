// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <pretty_diff/type.h>

#include <format>
#include <stdexcept>

namespace pretty_diff {

namespace {

struct BuiltinSpec {
    const char* name;
    Kind kind;
    unsigned bits;
};

constexpr BuiltinSpec kBuiltins[] = {
    {"bool", Kind::Bool, 0},
    {"int", Kind::Int, 0},
    {"int8", Kind::Int, 8},
    {"int16", Kind::Int, 16},
    {"int32", Kind::Int, 32},
    {"int64", Kind::Int, 64},
    {"uint", Kind::Uint, 0},
    {"uint8", Kind::Uint, 8},
    {"uint16", Kind::Uint, 16},
    {"uint32", Kind::Uint, 32},
    {"uint64", Kind::Uint, 64},
    {"uintptr", Kind::Uint, 0},
    {"float32", Kind::Float, 32},
    {"float64", Kind::Float, 64},
    {"complex64", Kind::Complex, 64},
    {"complex128", Kind::Complex, 128},
    {"string", Kind::String, 0},
    {"interface {}", Kind::Interface, 0},
    {"unsafe.Pointer", Kind::UnsafePointer, 0},
};

void require_type(const Type* type, const char* what)
{
    if (!type) {
        throw std::invalid_argument(std::format("{}: null type", what));
    }
}

} // anonymous namespace

std::string kind_name(Kind kind)
{
    switch (kind) {
        case Kind::Invalid:       return "invalid";
        case Kind::Bool:          return "bool";
        case Kind::Int:           return "int";
        case Kind::Uint:          return "uint";
        case Kind::Float:         return "float";
        case Kind::Complex:       return "complex";
        case Kind::String:        return "string";
        case Kind::Array:         return "array";
        case Kind::Slice:         return "slice";
        case Kind::Map:           return "map";
        case Kind::Pointer:       return "ptr";
        case Kind::Struct:        return "struct";
        case Kind::Interface:     return "interface";
        case Kind::Func:          return "func";
        case Kind::Chan:          return "chan";
        case Kind::UnsafePointer: return "unsafe.Pointer";
    }
    return std::format("kind({})", static_cast<unsigned>(kind));
}

std::size_t Type::field_index(std::string_view name) const noexcept
{
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (fields_[i].name == name) return i;
    }
    return fields_.size();
}

bool is_comparable_key(const Type* type) noexcept
{
    if (!type) return false;
    switch (type->kind()) {
        case Kind::Slice:
        case Kind::Map:
        case Kind::Func:
        case Kind::Invalid:
            return false;
        case Kind::Array:
            return is_comparable_key(type->elem());
        case Kind::Struct:
            for (const auto& f : type->fields()) {
                if (!is_comparable_key(f.type)) return false;
            }
            return true;
        default:
            return true;
    }
}

// ============================================================
// TypeRegistry
// ============================================================

TypeRegistry::TypeRegistry()
{
    owned_.reserve(64);
    for (const auto& info : kBuiltins) {
        auto type = std::make_unique<Type>(info.kind, info.name, info.bits);
        by_name_.emplace(type->name(), type.get());
        owned_.push_back(std::move(type));
    }
}

TypeRegistry::~TypeRegistry() = default;

const Type* TypeRegistry::builtin(std::string_view name) const
{
    std::lock_guard lock(mutex_);
    auto it = by_name_.find(std::string(name));
    if (it == by_name_.end()) {
        throw std::out_of_range(std::format("unknown builtin type '{}'", name));
    }
    return it->second;
}

const Type* TypeRegistry::find(std::string_view name) const
{
    std::lock_guard lock(mutex_);
    auto it = by_name_.find(std::string(name));
    return it == by_name_.end() ? nullptr : it->second;
}

const Type* TypeRegistry::intern(std::string canonical, std::unique_ptr<Type> type)
{
    std::lock_guard lock(mutex_);
    if (auto it = by_name_.find(canonical); it != by_name_.end()) {
        return it->second;
    }
    const Type* result = type.get();
    by_name_.emplace(std::move(canonical), result);
    owned_.push_back(std::move(type));
    return result;
}

Type* TypeRegistry::add_named(std::unique_ptr<Type> type)
{
    if (type->name().empty()) {
        throw std::invalid_argument("named type requires a name");
    }
    std::lock_guard lock(mutex_);
    if (by_name_.count(type->name())) {
        throw std::invalid_argument(std::format("type '{}' already defined", type->name()));
    }
    Type* result = type.get();
    by_name_.emplace(result->name(), result);
    owned_.push_back(std::move(type));
    return result;
}

const Type* TypeRegistry::array_of(const Type* elem, std::size_t length)
{
    require_type(elem, "array_of");
    auto name = std::format("[{}]{}", length, elem->name());
    auto type = std::make_unique<Type>(Kind::Array, name);
    type->elem_ = elem;
    type->length_ = length;
    return intern(std::move(name), std::move(type));
}

const Type* TypeRegistry::slice_of(const Type* elem)
{
    require_type(elem, "slice_of");
    auto name = "[]" + elem->name();
    auto type = std::make_unique<Type>(Kind::Slice, name);
    type->elem_ = elem;
    return intern(std::move(name), std::move(type));
}

const Type* TypeRegistry::map_of(const Type* key, const Type* value)
{
    require_type(key, "map_of");
    require_type(value, "map_of");
    if (!is_comparable_key(key)) {
        throw std::invalid_argument(std::format("invalid map key type {}", key->name()));
    }
    auto name = std::format("map[{}]{}", key->name(), value->name());
    auto type = std::make_unique<Type>(Kind::Map, name);
    type->key_ = key;
    type->elem_ = value;
    return intern(std::move(name), std::move(type));
}

const Type* TypeRegistry::pointer_to(const Type* elem)
{
    require_type(elem, "pointer_to");
    auto name = "*" + elem->name();
    auto type = std::make_unique<Type>(Kind::Pointer, name);
    type->elem_ = elem;
    return intern(std::move(name), std::move(type));
}

const Type* TypeRegistry::chan_of(const Type* elem)
{
    require_type(elem, "chan_of");
    auto name = "chan " + elem->name();
    auto type = std::make_unique<Type>(Kind::Chan, name);
    type->elem_ = elem;
    return intern(std::move(name), std::move(type));
}

const Type* TypeRegistry::func_type(std::string signature)
{
    if (signature.rfind("func", 0) != 0) {
        throw std::invalid_argument(std::format("'{}' is not a func signature", signature));
    }
    auto type = std::make_unique<Type>(Kind::Func, signature);
    return intern(std::move(signature), std::move(type));
}

const Type* TypeRegistry::define_interface(std::string name)
{
    return add_named(std::make_unique<Type>(Kind::Interface, std::move(name)));
}

const Type* TypeRegistry::define_named(std::string name, const Type* underlying)
{
    require_type(underlying, "define_named");
    if (underlying->kind() == Kind::Struct || underlying->kind() == Kind::Interface) {
        throw std::invalid_argument("use define_struct / define_interface for named structs and interfaces");
    }
    auto type = std::make_unique<Type>(underlying->kind(), std::move(name), underlying->bits());
    type->elem_ = underlying->elem_;
    type->key_ = underlying->key_;
    type->length_ = underlying->length_;
    return add_named(std::move(type));
}

const Type* TypeRegistry::define_struct(std::string name, std::vector<Field> fields)
{
    Type* type = declare_struct(std::move(name));
    define_fields(type, std::move(fields));
    return type;
}

Type* TypeRegistry::declare_struct(std::string name)
{
    auto type = std::make_unique<Type>(Kind::Struct, std::move(name));
    type->incomplete_ = true;
    return add_named(std::move(type));
}

void TypeRegistry::define_fields(Type* type, std::vector<Field> fields)
{
    require_type(type, "define_fields");
    if (type->kind() != Kind::Struct || !type->incomplete_) {
        throw std::invalid_argument(std::format("'{}' is not a declared struct", type->name()));
    }
    for (std::size_t i = 0; i < fields.size(); ++i) {
        require_type(fields[i].type, "define_fields");
        for (std::size_t j = 0; j < i; ++j) {
            if (fields[j].name == fields[i].name) {
                throw std::invalid_argument(
                    std::format("duplicate field '{}' in {}", fields[i].name, type->name()));
            }
        }
    }
    std::lock_guard lock(mutex_);
    type->fields_ = std::move(fields);
    type->incomplete_ = false;
}

const Type* TypeRegistry::struct_of(std::vector<Field> fields)
{
    std::string name = "struct {";
    for (std::size_t i = 0; i < fields.size(); ++i) {
        require_type(fields[i].type, "struct_of");
        name += (i == 0 ? " " : "; ") + fields[i].name + " " + fields[i].type->name();
    }
    name += fields.empty() ? "}" : " }";
    auto type = std::make_unique<Type>(Kind::Struct, name);
    type->fields_ = std::move(fields);
    return intern(std::move(name), std::move(type));
}

} // namespace pretty_diff
