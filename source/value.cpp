// value.cpp - Value factories, ValueRef accessors and rendering

#include <pretty_diff/value.h>
#include <pretty_diff/errors.h>
#include <pretty_diff/key_match.h>

#include <immer/vector_transient.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>

namespace pretty_diff {

namespace {

void require_kind(const Type* type, Kind kind, const char* factory)
{
    if (!type) {
        throw std::invalid_argument(std::format("Value::{}: null type", factory));
    }
    if (type->kind() != kind) {
        throw std::invalid_argument(std::format("Value::{}: {} is a {}, not a {}",
                                                factory, type->name(),
                                                kind_name(type->kind()), kind_name(kind)));
    }
}

bool is_handle_kind(Kind kind) noexcept
{
    return kind == Kind::Func || kind == Kind::Chan || kind == Kind::UnsafePointer;
}

template <typename Range>
ValueVector build_elements(const Type* elem_type, const Range& elems)
{
    auto t = ValueVector{}.transient();
    for (const auto& v : elems) {
        t.push_back(ValueBox{Value::coerce(elem_type, v)});
    }
    return t.persistent();
}

} // anonymous namespace

// ============================================================
// Factories
// ============================================================

Value Value::of_bool(const Type* type, bool v)
{
    require_kind(type, Kind::Bool, "of_bool");
    return Value{type, v};
}

Value Value::of_int(const Type* type, int64_t v)
{
    require_kind(type, Kind::Int, "of_int");
    return Value{type, v};
}

Value Value::of_uint(const Type* type, uint64_t v)
{
    require_kind(type, Kind::Uint, "of_uint");
    return Value{type, v};
}

Value Value::of_float(const Type* type, double v)
{
    require_kind(type, Kind::Float, "of_float");
    if (type->bits() == 32) {
        v = static_cast<double>(static_cast<float>(v));
    }
    return Value{type, v};
}

Value Value::of_complex(const Type* type, std::complex<double> v)
{
    require_kind(type, Kind::Complex, "of_complex");
    if (type->bits() == 64) {
        v = std::complex<double>(static_cast<float>(v.real()), static_cast<float>(v.imag()));
    }
    return Value{type, v};
}

Value Value::of_string(const Type* type, std::string v)
{
    require_kind(type, Kind::String, "of_string");
    return Value{type, std::move(v)};
}

Value Value::array(const Type* type, std::initializer_list<Value> elems)
{
    require_kind(type, Kind::Array, "array");
    if (elems.size() != type->length()) {
        throw std::invalid_argument(std::format("Value::array: {} needs {} elements, got {}",
                                                type->name(), type->length(), elems.size()));
    }
    return Value{type, build_elements(type->elem(), elems)};
}

Value Value::slice(const Type* type, std::initializer_list<Value> elems)
{
    require_kind(type, Kind::Slice, "slice");
    return Value{type, build_elements(type->elem(), elems)};
}

Value Value::slice(const Type* type, const std::vector<Value>& elems)
{
    require_kind(type, Kind::Slice, "slice");
    return Value{type, build_elements(type->elem(), elems)};
}

Value Value::record(const Type* type, std::initializer_list<Value> fields)
{
    require_kind(type, Kind::Struct, "record");
    if (type->is_incomplete()) {
        throw std::invalid_argument(std::format("Value::record: {} has no fields defined yet", type->name()));
    }
    if (fields.size() != type->num_fields()) {
        throw std::invalid_argument(std::format("Value::record: {} has {} fields, got {}",
                                                type->name(), type->num_fields(), fields.size()));
    }
    auto t = ValueVector{}.transient();
    std::size_t i = 0;
    for (const auto& v : fields) {
        t.push_back(ValueBox{coerce(type->fields()[i++].type, v)});
    }
    return Value{type, t.persistent()};
}

Value Value::map(const Type* type, std::initializer_list<std::pair<Value, Value>> entries)
{
    require_kind(type, Kind::Map, "map");
    ValueEntries result;
    for (const auto& [k, v] : entries) {
        MapEntry entry{ValueBox{coerce(type->key(), k)}, ValueBox{coerce(type->elem(), v)}};
        bool replaced = false;
        for (std::size_t i = 0; i < result.size(); ++i) {
            if (key_equal(ValueRef{*result[i].key}, ValueRef{*entry.key})) {
                result = std::move(result).set(i, std::move(entry));
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result = std::move(result).push_back(std::move(entry));
        }
    }
    return Value{type, std::move(result)};
}

Value Value::pointer(const Type* type, const Value* target)
{
    require_kind(type, Kind::Pointer, "pointer");
    if (target && target->type != type->elem()) {
        throw std::invalid_argument(std::format("Value::pointer: {} cannot point at {}",
                                                type->name(),
                                                target->type ? target->type->name() : "nil"));
    }
    return Value{type, Pointer{target}};
}

Value Value::boxed(const Type* type, Value held)
{
    require_kind(type, Kind::Interface, "boxed");
    // An interface never holds another interface: store the dynamic value
    while (held.kind() == Kind::Interface) {
        const auto& inner = std::get<ValueBox>(held.data);
        Value unwrapped = inner.get();
        held = std::move(unwrapped);
    }
    return Value{type, ValueBox{std::move(held)}};
}

Value Value::handle(const Type* type, std::uintptr_t address)
{
    if (!type || !is_handle_kind(type->kind())) {
        throw std::invalid_argument(std::format("Value::handle: {} is not a func, chan or unsafe.Pointer",
                                                type ? type->name() : "null type"));
    }
    return Value{type, Handle{address}};
}

Value Value::zero(const Type* type)
{
    if (!type) return Value{};
    switch (type->kind()) {
        case Kind::Bool:      return Value{type, false};
        case Kind::Int:       return Value{type, int64_t{0}};
        case Kind::Uint:      return Value{type, uint64_t{0}};
        case Kind::Float:     return Value{type, 0.0};
        case Kind::Complex:   return Value{type, std::complex<double>{}};
        case Kind::String:    return Value{type, std::string{}};
        case Kind::Slice:     return Value{type, ValueVector{}};
        case Kind::Map:       return Value{type, ValueEntries{}};
        case Kind::Pointer:   return Value{type, Pointer{}};
        case Kind::Interface: return Value{type, ValueBox{Value{}}};
        case Kind::Func:
        case Kind::Chan:
        case Kind::UnsafePointer:
            return Value{type, Handle{}};
        case Kind::Array: {
            auto t = ValueVector{}.transient();
            for (std::size_t i = 0; i < type->length(); ++i) {
                t.push_back(ValueBox{zero(type->elem())});
            }
            return Value{type, t.persistent()};
        }
        case Kind::Struct: {
            auto t = ValueVector{}.transient();
            for (const auto& f : type->fields()) {
                t.push_back(ValueBox{zero(f.type)});
            }
            return Value{type, t.persistent()};
        }
        case Kind::Invalid:
            break;
    }
    throw UnsupportedKindError(kind_name(type->kind()));
}

Value Value::coerce(const Type* slot, Value v)
{
    if (!slot) {
        throw std::invalid_argument("Value::coerce: null slot type");
    }
    if (v.type == slot) {
        return v;
    }
    if (slot->kind() == Kind::Interface) {
        return boxed(slot, std::move(v));
    }
    throw std::invalid_argument(std::format("cannot use {} as {}",
                                            v.type ? v.type->name() : "nil", slot->name()));
}

// ============================================================
// Queries
// ============================================================

std::size_t Value::size() const noexcept
{
    if (auto* v = get_if<ValueVector>(); v && kind() != Kind::Struct) return v->size();
    if (auto* m = get_if<ValueEntries>()) return m->size();
    if (auto* s = get_if<std::string>()) return s->size();
    return 0;
}

Value Value::at(std::size_t index) const
{
    if (kind() == Kind::Array || kind() == Kind::Slice) {
        const auto& elems = std::get<ValueVector>(data);
        if (index < elems.size()) return elems[index].get();
    }
    detail::log_index_error("Value::at", index, "out of range or not a sequence");
    return Value{};
}

Value Value::field_or(std::string_view name, Value default_val) const
{
    if (kind() == Kind::Struct) {
        auto i = type->field_index(name);
        if (i < type->num_fields()) return std::get<ValueVector>(data)[i].get();
    }
    detail::log_access_error("Value::field_or",
                             std::format("no field '{}' in {}", name, type ? type->name() : "nil"));
    return default_val;
}

// ============================================================
// ValueRef
// ============================================================

std::uintptr_t ValueRef::pointer() const
{
    if (kind() == Kind::Pointer) {
        return reinterpret_cast<std::uintptr_t>(std::get<Pointer>(value_->data).target);
    }
    return std::get<Handle>(value_->data).address;
}

bool ValueRef::is_nil() const
{
    switch (kind()) {
        case Kind::Pointer:   return std::get<Pointer>(value_->data).target == nullptr;
        case Kind::Interface: return !std::get<ValueBox>(value_->data)->is_valid();
        case Kind::Func:
        case Kind::Chan:
        case Kind::UnsafePointer:
            return std::get<Handle>(value_->data).address == 0;
        case Kind::Invalid:
            return true;
        default:
            return false;
    }
}

std::size_t ValueRef::len() const
{
    switch (kind()) {
        case Kind::Array:
        case Kind::Slice:  return std::get<ValueVector>(value_->data).size();
        case Kind::Map:    return std::get<ValueEntries>(value_->data).size();
        case Kind::String: return std::get<std::string>(value_->data).size();
        default:
            throw std::logic_error("ValueRef::len on " + kind_name(kind()));
    }
}

ValueRef ValueRef::index(std::size_t i) const
{
    const auto& elems = std::get<ValueVector>(value_->data);
    if (i >= elems.size()) {
        throw std::out_of_range(std::format("ValueRef::index {} out of range [0, {})", i, elems.size()));
    }
    // Slices reference their backing storage; arrays are stored in place
    if (kind() == Kind::Slice) {
        return ValueRef{elems[i].get(), true, true};
    }
    return ValueRef{elems[i].get(), addressable_, false};
}

std::size_t ValueRef::num_fields() const
{
    return std::get<ValueVector>(value_->data).size();
}

ValueRef ValueRef::field(std::size_t i) const
{
    const auto& fields = std::get<ValueVector>(value_->data);
    if (i >= fields.size()) {
        throw std::out_of_range(std::format("ValueRef::field {} out of range [0, {})", i, fields.size()));
    }
    return ValueRef{fields[i].get(), addressable_, false};
}

ValueRef ValueRef::elem() const
{
    if (kind() == Kind::Pointer) {
        const auto* target = std::get<Pointer>(value_->data).target;
        return target ? ValueRef{*target, true, true} : ValueRef{};
    }
    const auto& held = std::get<ValueBox>(value_->data).get();
    return held.is_valid() ? ValueRef{held, false} : ValueRef{};
}

MapEntryRef ValueRef::map_entry(std::size_t i) const
{
    const auto& entries = std::get<ValueEntries>(value_->data);
    const auto& entry = entries[i];
    return MapEntryRef{ValueRef{entry.key.get(), false}, ValueRef{entry.value.get(), false}};
}

// ============================================================
// Rendering
// ============================================================

namespace {

// Length of the well-formed UTF-8 sequence starting at s[i], 0 if ill-formed
std::size_t utf8_sequence_length(std::string_view s, std::size_t i) noexcept
{
    const auto lead = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    unsigned char lo = 0x80;
    unsigned char hi = 0xbf;
    if (lead >= 0xc2 && lead <= 0xdf) {
        len = 2;
    } else if (lead >= 0xe0 && lead <= 0xef) {
        len = 3;
        if (lead == 0xe0) lo = 0xa0;      // overlong
        if (lead == 0xed) hi = 0x9f;      // surrogates
    } else if (lead >= 0xf0 && lead <= 0xf4) {
        len = 4;
        if (lead == 0xf0) lo = 0x90;      // overlong
        if (lead == 0xf4) hi = 0x8f;      // above U+10FFFF
    } else {
        return 0;
    }
    if (i + len > s.size()) return 0;
    for (std::size_t k = 1; k < len; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if (c < (k == 1 ? lo : 0x80) || c > (k == 1 ? hi : 0xbf)) return 0;
    }
    return len;
}

} // anonymous namespace

std::string quote_string(std::string_view s)
{
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (std::size_t i = 0; i < s.size(); ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\a': out += "\\a"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\v': out += "\\v"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    out += std::format("\\x{:02x}", static_cast<unsigned>(c));
                } else if (c < 0x80) {
                    out += static_cast<char>(c);
                } else if (const std::size_t len = utf8_sequence_length(s, i); len > 0) {
                    out.append(s.substr(i, len));
                    i += len - 1;
                } else {
                    out += std::format("\\x{:02x}", static_cast<unsigned>(c));
                }
        }
    }
    out += '"';
    return out;
}

namespace {

// Shortest round-trip digits, scientific when the exponent is below -4 or
// at least 6, fixed otherwise (the %g rule)
template <typename F>
std::string shortest_general(F v)
{
    char buf[64];
    auto sci = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string_view text(buf, static_cast<std::size_t>(sci.ptr - buf));
    const auto e = text.find('e');
    int exponent = 0;
    const char* digits = text.data() + e + (text[e + 1] == '+' ? 2 : 1);
    if (std::from_chars(digits, text.data() + text.size(), exponent).ec != std::errc{} ||
        exponent < -4 || exponent >= 6) {
        return std::string(text);
    }
    auto fixed = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
    return std::string(buf, fixed.ptr);
}

} // anonymous namespace

std::string format_float(double v, unsigned bits)
{
    if (std::isnan(v)) return "NaN";
    if (std::isinf(v)) return v > 0 ? "+Inf" : "-Inf";
    if (bits == 32) return shortest_general(static_cast<float>(v));
    return shortest_general(v);
}

std::string format_complex(std::complex<double> v, unsigned bits)
{
    const unsigned part_bits = bits == 64 ? 32 : 64;
    std::string imag = format_float(v.imag(), part_bits);
    if (imag.front() != '-' && imag.front() != '+') {
        imag.insert(imag.begin(), '+');
    }
    return "(" + format_float(v.real(), part_bits) + imag + "i)";
}

namespace {

class Renderer {
public:
    std::string render(const ValueRef& v) {
        std::string out;
        append(v, out);
        return out;
    }

private:
    void append(const ValueRef& v, std::string& out) {
        if (!v.is_valid()) {
            out += "nil";
            return;
        }
        const Type* type = v.type();
        switch (v.kind()) {
            case Kind::Bool:
                out += v.as_bool() ? "true" : "false";
                return;
            case Kind::Int:
                out += std::to_string(v.as_int());
                return;
            case Kind::Uint:
                out += std::to_string(v.as_uint());
                return;
            case Kind::Float:
                out += format_float(v.as_float(), type->bits());
                return;
            case Kind::Complex:
                out += format_complex(v.as_complex(), type->bits());
                return;
            case Kind::String:
                out += quote_string(v.as_string());
                return;
            case Kind::Array:
            case Kind::Slice: {
                Scope scope(*this, v);
                out += type->name();
                out += '{';
                for (std::size_t i = 0; i < v.len(); ++i) {
                    if (i > 0) out += ", ";
                    append(v.index(i), out);
                }
                out += '}';
                return;
            }
            case Kind::Map: {
                Scope scope(*this, v);
                out += type->name();
                out += '{';
                for (std::size_t i = 0; i < v.len(); ++i) {
                    if (i > 0) out += ", ";
                    auto entry = v.map_entry(i);
                    append(entry.key, out);
                    out += ':';
                    append(entry.value, out);
                }
                out += '}';
                return;
            }
            case Kind::Struct: {
                Scope scope(*this, v);
                out += type->name();
                out += '{';
                for (std::size_t i = 0; i < v.num_fields(); ++i) {
                    if (i > 0) out += ", ";
                    out += type->fields()[i].name;
                    out += ':';
                    append(v.field(i), out);
                }
                out += '}';
                return;
            }
            case Kind::Pointer: {
                if (v.is_nil()) {
                    out += "nil";
                    return;
                }
                ValueRef target = v.elem();
                if (in_progress(&target.value())) {
                    out += "(CYCLIC REFERENCE)";
                    return;
                }
                out += '&';
                Scope scope(*this, v);
                append(target, out);
                return;
            }
            case Kind::Interface:
                append(v.elem(), out);
                return;
            case Kind::Func:
            case Kind::Chan:
            case Kind::UnsafePointer:
                if (v.is_nil()) {
                    out += "nil";
                } else {
                    out += std::format("({})({:#x})", type->name(), v.pointer());
                }
                return;
            case Kind::Invalid:
                break;
        }
        throw UnsupportedKindError(kind_name(v.kind()));
    }

    [[nodiscard]] bool in_progress(const Value* value) const {
        return std::find(stack_.begin(), stack_.end(), value) != stack_.end();
    }

    // Marks a composite as being rendered until the scope ends
    struct Scope {
        Scope(Renderer& r, const ValueRef& v) : renderer(r) { r.stack_.push_back(&v.value()); }
        ~Scope() { renderer.stack_.pop_back(); }
        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;
        Renderer& renderer;
    };

    std::vector<const Value*> stack_;
};

} // anonymous namespace

std::string value_to_string(const ValueRef& val)
{
    return Renderer{}.render(val);
}

std::string value_to_string(const Value& val)
{
    return Renderer{}.render(ValueRef{val});
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');
    ValueRef v{val};
    switch (v.kind()) {
        case Kind::Array:
        case Kind::Slice:
            for (std::size_t i = 0; i < v.len(); ++i) {
                std::cout << indent << prefix << "[" << i << "]:\n";
                print_value(v.index(i).value(), "", depth + 1);
            }
            return;
        case Kind::Struct:
            for (std::size_t i = 0; i < v.num_fields(); ++i) {
                std::cout << indent << prefix << val.type->fields()[i].name << ":\n";
                print_value(v.field(i).value(), "", depth + 1);
            }
            return;
        case Kind::Map:
            for (std::size_t i = 0; i < v.len(); ++i) {
                auto entry = v.map_entry(i);
                std::cout << indent << prefix << "[" << value_to_string(entry.key) << "]:\n";
                print_value(entry.value.value(), "", depth + 1);
            }
            return;
        default:
            std::cout << indent << prefix << value_to_string(v) << "\n";
    }
}

} // namespace pretty_diff
