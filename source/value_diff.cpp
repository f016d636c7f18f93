// value_diff.cpp - Differ and the diff entry points

#include <pretty_diff/value_diff.h>
#include <pretty_diff/errors.h>
#include <pretty_diff/key_match.h>

#include <format>

namespace pretty_diff {

namespace {

// Kinds whose storage takes part in cycle detection
bool tracks_identity(Kind kind) noexcept
{
    switch (kind) {
        case Kind::Array:
        case Kind::Slice:
        case Kind::Map:
        case Kind::Pointer:
        case Kind::Struct:
        case Kind::Interface:
            return true;
        default:
            return false;
    }
}

std::string bracket(const ValueRef& key)
{
    return "[" + value_to_string(key) + "]";
}

class CountingPrinter final : public Printer {
public:
    [[nodiscard]] std::size_t count() const noexcept { return count_; }

protected:
    void write_line(std::string_view) override { ++count_; }

private:
    std::size_t count_ = 0;
};

} // anonymous namespace

// ============================================================
// Differ
// ============================================================

Differ Differ::relabel(std::string_view name) const
{
    Differ child = *this;
    if (!label_.empty() && !name.empty() && name.front() != '[') {
        child.label_ += '.';
    }
    child.label_ += name;
    return child;
}

void Differ::diff(const ValueRef& a, const ValueRef& b) const
{
    if (!a.is_valid() && b.is_valid()) {
        printf("nil != {}", value_to_string(b));
        return;
    }
    if (a.is_valid() && !b.is_valid()) {
        printf("{} != nil", value_to_string(a));
        return;
    }
    if (!a.is_valid() && !b.is_valid()) {
        return;
    }

    const Type* at = a.type();
    const Type* bt = b.type();
    if (at != bt) {
        printf("{} != {}", at->name(), bt->name());
        return;
    }

    if (a.has_identity() && b.has_identity() && tracks_identity(at->kind())) {
        switch (guard_->enter(identity_of(a), identity_of(b))) {
            case CycleGuard::Visit::First:
                break;
            case CycleGuard::Visit::Repeat:
                return;
            case CycleGuard::Visit::LeftRevisited:
                printf("{} (previously visited) != {}", value_to_string(a), value_to_string(b));
                return;
            case CycleGuard::Visit::RightRevisited:
                printf("{} != {} (previously visited)", value_to_string(a), value_to_string(b));
                return;
        }
    }

    switch (const Kind kind = at->kind(); kind) {
        case Kind::Bool:
            if (a.as_bool() != b.as_bool()) {
                printf("{} != {}", a.as_bool(), b.as_bool());
            }
            break;
        case Kind::Int:
            if (a.as_int() != b.as_int()) {
                printf("{} != {}", a.as_int(), b.as_int());
            }
            break;
        case Kind::Uint:
            if (a.as_uint() != b.as_uint()) {
                printf("{} != {}", a.as_uint(), b.as_uint());
            }
            break;
        case Kind::Float:
            if (a.as_float() != b.as_float()) {
                printf("{} != {}", format_float(a.as_float(), at->bits()),
                                   format_float(b.as_float(), bt->bits()));
            }
            break;
        case Kind::Complex:
            if (a.as_complex() != b.as_complex()) {
                printf("{} != {}", format_complex(a.as_complex(), at->bits()),
                                   format_complex(b.as_complex(), bt->bits()));
            }
            break;
        case Kind::String:
            if (a.as_string() != b.as_string()) {
                printf("{} != {}", quote_string(a.as_string()), quote_string(b.as_string()));
            }
            break;
        case Kind::Array: {
            const std::size_t n = a.len();
            for (std::size_t i = 0; i < n; ++i) {
                relabel(std::format("[{}]", i)).diff(a.index(i), b.index(i));
            }
            break;
        }
        case Kind::Slice: {
            const std::size_t len_a = a.len();
            const std::size_t len_b = b.len();
            if (len_a != len_b) {
                printf("{}[{}] != {}[{}]", at->name(), len_a, bt->name(), len_b);
                break;
            }
            for (std::size_t i = 0; i < len_a; ++i) {
                relabel(std::format("[{}]", i)).diff(a.index(i), b.index(i));
            }
            break;
        }
        case Kind::Struct:
            for (std::size_t i = 0; i < a.num_fields(); ++i) {
                relabel(at->fields()[i].name).diff(a.field(i), b.field(i));
            }
            break;
        case Kind::Map:
            diff_map(a, b);
            break;
        case Kind::Pointer:
            if (a.is_nil() && !b.is_nil()) {
                printf("nil != {}", value_to_string(b));
            } else if (!a.is_nil() && b.is_nil()) {
                printf("{} != nil", value_to_string(a));
            } else if (!a.is_nil() && !b.is_nil()) {
                diff(a.elem(), b.elem());
            }
            break;
        case Kind::Interface:
            diff(a.elem(), b.elem());
            break;
        case Kind::Func:
        case Kind::Chan:
        case Kind::UnsafePointer:
            if (a.pointer() != b.pointer()) {
                printf("{:#x} != {:#x}", a.pointer(), b.pointer());
            }
            break;
        default:
            throw UnsupportedKindError(kind_name(kind));
    }
}

void Differ::diff_map(const ValueRef& a, const ValueRef& b) const
{
    const KeyPartition keys = key_diff(a, b);

    for (const auto& entry : keys.only_left) {
        relabel(bracket(entry.key)).printf("{} != (missing)", value_to_string(entry.value));
    }
    for (const auto& [left, right] : keys.both) {
        relabel(bracket(left.key)).diff(left.value, right.value);
    }
    for (const auto& entry : keys.only_right) {
        relabel(bracket(entry.key)).printf("(missing) != {}", value_to_string(entry.value));
    }
}

// ============================================================
// Entry points
// ============================================================

void print_diff(Printer& out, const Value& a, const Value& b)
{
    CycleGuard guard;
    Differ{out, guard}.diff(ValueRef{a}, ValueRef{b});
}

std::vector<std::string> diff(const Value& a, const Value& b)
{
    LinePrinter out;
    print_diff(out, a, b);
    return out.take();
}

void write_diff(std::ostream& os, const Value& a, const Value& b)
{
    StreamPrinter out{os};
    print_diff(out, a, b);
}

bool has_any_difference(const Value& a, const Value& b)
{
    CountingPrinter out;
    print_diff(out, a, b);
    return out.count() > 0;
}

} // namespace pretty_diff
