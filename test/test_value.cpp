// test_value.cpp - Tests for Value construction, ValueRef access, builders and rendering
// Module 2: Core Value functionality

#include <catch2/catch_all.hpp>
#include <pretty_diff/builders.h>
#include <pretty_diff/value.h>

#include <cmath>
#include <limits>
#include <stdexcept>

using namespace pretty_diff;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE_FALSE(v.is_valid());
    REQUIRE(v.kind() == Kind::Invalid);
    REQUIRE(std::holds_alternative<std::monostate>(v.data));
}

TEST_CASE("Value scalar construction", "[value][construction]") {
    TypeRegistry types;

    SECTION("bool") {
        Value v = Value::of_bool(types.bool_type(), true);
        REQUIRE(v.kind() == Kind::Bool);
        REQUIRE(*v.get_if<bool>());
    }

    SECTION("int") {
        Value v = Value::of_int(types.builtin("int16"), -1000);
        REQUIRE(v.kind() == Kind::Int);
        REQUIRE(*v.get_if<int64_t>() == -1000);
    }

    SECTION("float32 is rounded to single precision") {
        Value v = Value::of_float(types.builtin("float32"), 0.1);
        REQUIRE(*v.get_if<double>() == static_cast<double>(0.1f));
    }

    SECTION("scalar() converts to the kind of the type") {
        REQUIRE(*Value::scalar(types.uint_type(), 7).get_if<uint64_t>() == 7u);
        REQUIRE(*Value::scalar(types.float64_type(), 3).get_if<double>() == 3.0);
        REQUIRE(*Value::scalar(types.string_type(), "hi").get_if<std::string>() == "hi");
        REQUIRE(Value::scalar(types.complex128_type(), 2).get_if<std::complex<double>>()->real() == 2.0);
    }

    SECTION("wrong kind throws") {
        REQUIRE_THROWS_AS(Value::of_int(types.string_type(), 1), std::invalid_argument);
        REQUIRE_THROWS_AS(Value::of_string(nullptr, "x"), std::invalid_argument);
        REQUIRE_THROWS_AS(Value::scalar(types.bool_type(), 1), std::invalid_argument);
    }

    SECTION("lossy numeric payloads throw") {
        REQUIRE_THROWS_AS(Value::scalar(types.int_type(), 1.5), std::invalid_argument);
        REQUIRE_THROWS_AS(Value::scalar(types.uint_type(), 2.0f), std::invalid_argument);
        REQUIRE_THROWS_AS(Value::scalar(types.uint_type(), -1), std::invalid_argument);
        REQUIRE(*Value::scalar(types.uint_type(), 7u).get_if<uint64_t>() == 7u);
        REQUIRE(*Value::scalar(types.int_type(), static_cast<unsigned char>(200)).get_if<int64_t>() == 200);
    }
}

TEST_CASE("Value container construction", "[value][construction]") {
    TypeRegistry types;
    const Type* i = types.int_type();
    auto num = [&](int64_t n) { return Value::of_int(i, n); };

    SECTION("slice") {
        Value v = Value::slice(types.slice_of(i), {num(1), num(2), num(3)});
        REQUIRE(v.kind() == Kind::Slice);
        REQUIRE(v.size() == 3);
        REQUIRE(*v.at(2).get_if<int64_t>() == 3);
    }

    SECTION("array length is checked") {
        REQUIRE(Value::array(types.array_of(i, 2), {num(1), num(2)}).size() == 2);
        REQUIRE_THROWS_AS(Value::array(types.array_of(i, 2), {num(1)}), std::invalid_argument);
    }

    SECTION("element type is checked") {
        REQUIRE_THROWS_AS(Value::slice(types.slice_of(i), {Value::of_string(types.string_type(), "x")}),
                          std::invalid_argument);
    }

    SECTION("interface slots wrap their elements") {
        Value v = Value::slice(types.slice_of(types.any_type()), {num(1)});
        ValueRef elem = ValueRef{v}.index(0);
        REQUIRE(elem.kind() == Kind::Interface);
        REQUIRE(elem.elem().kind() == Kind::Int);
    }

    SECTION("record field count is checked") {
        const Type* point = types.define_struct("Point", {{"X", i}, {"Y", i}});
        REQUIRE(Value::record(point, {num(1), num(2)}).field_or("Y").get_if<int64_t>() != nullptr);
        REQUIRE_THROWS_AS(Value::record(point, {num(1)}), std::invalid_argument);
    }

    SECTION("map keeps insertion order and replaces equal keys") {
        const Type* s = types.string_type();
        const Type* m = types.map_of(s, i);
        Value v = Value::map(m, {{Value::of_string(s, "b"), num(1)},
                                 {Value::of_string(s, "a"), num(2)},
                                 {Value::of_string(s, "b"), num(3)}});
        REQUIRE(v.size() == 2);
        REQUIRE(value_to_string(v) == "map[string]int{\"b\":3, \"a\":2}");
    }

    SECTION("pointer target type is checked") {
        Value n = num(5);
        REQUIRE(Value::pointer(types.pointer_to(i), &n).kind() == Kind::Pointer);
        REQUIRE_THROWS_AS(Value::pointer(types.pointer_to(types.string_type()), &n), std::invalid_argument);
    }

    SECTION("interfaces never nest") {
        const Type* any = types.any_type();
        Value inner = Value::boxed(any, num(4));
        Value outer = Value::boxed(any, inner);
        REQUIRE(ValueRef{outer}.elem().kind() == Kind::Int);
    }

    SECTION("handle requires a handle kind") {
        REQUIRE_THROWS_AS(Value::handle(i, 0x10), std::invalid_argument);
        REQUIRE(Value::handle(types.chan_of(i), 0x10).kind() == Kind::Chan);
    }
}

TEST_CASE("Value zero values", "[value][construction]") {
    TypeRegistry types;
    const Type* i = types.int_type();
    const Type* point = types.define_struct("Point", {{"X", i}, {"Tags", types.slice_of(types.string_type())}});

    REQUIRE(value_to_string(Value::zero(i)) == "0");
    REQUIRE(value_to_string(Value::zero(types.string_type())) == "\"\"");
    REQUIRE(value_to_string(Value::zero(types.array_of(i, 2))) == "[2]int{0, 0}");
    REQUIRE(value_to_string(Value::zero(point)) == "Point{X:0, Tags:[]string{}}");
    REQUIRE(value_to_string(Value::zero(types.pointer_to(i))) == "nil");
    REQUIRE(value_to_string(Value::zero(types.any_type())) == "nil");
}

// ============================================================
// Access Tests
// ============================================================

TEST_CASE("Value convenience accessors", "[value][access]") {
    TypeRegistry types;
    const Type* i = types.int_type();
    Value xs = Value::slice(types.slice_of(i), {Value::of_int(i, 10)});

    REQUIRE(*xs.at(0).get_if<int64_t>() == 10);
    REQUIRE_FALSE(xs.at(5).is_valid());
    REQUIRE_FALSE(xs.field_or("X").is_valid());
    REQUIRE(*xs.field_or("X", Value::of_int(i, -1)).get_if<int64_t>() == -1);
}

TEST_CASE("ValueRef addressability", "[value][access]") {
    TypeRegistry types;
    const Type* i = types.int_type();
    auto num = [&](int64_t n) { return Value::of_int(i, n); };

    SECTION("roots are not addressable") {
        Value v = num(1);
        REQUIRE_FALSE(ValueRef{v}.can_addr());
        REQUIRE(ValueRef(v, true).can_addr());
    }

    SECTION("slice elements are always addressable") {
        Value v = Value::slice(types.slice_of(i), {num(1)});
        REQUIRE(ValueRef{v}.index(0).can_addr());
    }

    SECTION("array elements and fields inherit addressability") {
        Value arr = Value::array(types.array_of(i, 1), {num(1)});
        REQUIRE_FALSE(ValueRef{arr}.index(0).can_addr());
        REQUIRE(ValueRef(arr, true).index(0).can_addr());

        const Type* point = types.define_struct("Point", {{"X", i}});
        Value p = Value::record(point, {num(1)});
        REQUIRE_FALSE(ValueRef{p}.field(0).can_addr());
        REQUIRE(ValueRef(p, true).field(0).can_addr());
    }

    SECTION("pointer targets are addressable") {
        Value n = num(5);
        Value p = Value::pointer(types.pointer_to(i), &n);
        ValueRef target = ValueRef{p}.elem();
        REQUIRE(target.can_addr());
        REQUIRE(target.address() == &n);
    }

    SECTION("only pointer targets and slice elements carry an identity") {
        Value n = num(5);
        REQUIRE(ValueRef{Value::pointer(types.pointer_to(i), &n)}.elem().has_identity());

        Value v = Value::slice(types.slice_of(i), {num(1)});
        REQUIRE(ValueRef{v}.index(0).has_identity());

        Value arr = Value::array(types.array_of(i, 1), {num(1)});
        REQUIRE(ValueRef(arr, true).index(0).can_addr());
        REQUIRE_FALSE(ValueRef(arr, true).index(0).has_identity());

        const Type* point = types.define_struct("Point", {{"X", i}});
        Value p = Value::record(point, {num(1)});
        REQUIRE_FALSE(ValueRef(p, true).field(0).has_identity());
        REQUIRE_FALSE(ValueRef{v}.has_identity());
    }

    SECTION("copies of a struct share field slots") {
        const Type* point = types.define_struct("Point", {{"X", i}});
        Value p = Value::record(point, {num(1)});
        Value copy = p;
        REQUIRE(ValueRef(p, true).field(0).address() == ValueRef(copy, true).field(0).address());
    }

    SECTION("map entries and interface payloads are not addressable") {
        Value m = Value::map(types.map_of(i, i), {{num(1), num(2)}});
        auto entry = ValueRef(m, true).map_entry(0);
        REQUIRE_FALSE(entry.key.can_addr());
        REQUIRE_FALSE(entry.value.can_addr());

        Value boxed = Value::boxed(types.any_type(), num(3));
        REQUIRE_FALSE(ValueRef(boxed, true).elem().can_addr());
    }

    SECTION("nil pointers and interfaces have no element") {
        Value p = Value::zero(types.pointer_to(i));
        REQUIRE(ValueRef{p}.is_nil());
        REQUIRE_FALSE(ValueRef{p}.elem().is_valid());
        Value e = Value::zero(types.any_type());
        REQUIRE(ValueRef{e}.is_nil());
        REQUIRE_FALSE(ValueRef{e}.elem().is_valid());
    }

    SECTION("out of range index throws") {
        Value v = Value::slice(types.slice_of(i), std::vector<Value>{});
        REQUIRE_THROWS_AS(ValueRef{v}.index(0), std::out_of_range);
    }
}

// ============================================================
// Builder Tests
// ============================================================

TEST_CASE("StructBuilder", "[value][builder]") {
    TypeRegistry types;
    const Type* user = types.define_struct("User", {{"Name", types.string_type()},
                                                    {"Age", types.int_type()},
                                                    {"Meta", types.any_type()}});

    SECTION("unset fields stay zero") {
        Value v = StructBuilder(user).set("Name", "Alice").finish();
        REQUIRE(value_to_string(v) == "User{Name:\"Alice\", Age:0, Meta:nil}");
    }

    SECTION("interface fields accept typed values") {
        Value v = StructBuilder(user).set("Meta", Value::of_bool(types.bool_type(), true)).finish();
        REQUIRE(value_to_string(v) == "User{Name:\"\", Age:0, Meta:true}");
    }

    SECTION("unknown field throws") {
        StructBuilder builder(user);
        REQUIRE_THROWS_AS(builder.set("Email", "x"), std::invalid_argument);
    }

    SECTION("non-struct type throws") {
        REQUIRE_THROWS_AS(StructBuilder(types.int_type()), std::invalid_argument);
    }
}

TEST_CASE("SliceBuilder and MapBuilder", "[value][builder]") {
    TypeRegistry types;

    SECTION("slice") {
        SliceBuilder builder(types.slice_of(types.string_type()));
        builder.push_back("a").push_back(std::string{"b"});
        REQUIRE(builder.size() == 2);
        REQUIRE(value_to_string(builder.finish()) == "[]string{\"a\", \"b\"}");
    }

    SECTION("map replaces equal keys in place") {
        MapBuilder builder(types.map_of(types.string_type(), types.int_type()));
        builder.set("x", 1).set("y", 2).set("x", 3);
        REQUIRE(builder.size() == 2);
        REQUIRE(builder.contains("y"));
        REQUIRE_FALSE(builder.contains("z"));
        REQUIRE(value_to_string(builder.finish()) == "map[string]int{\"x\":3, \"y\":2}");
    }

    SECTION("wrong container type throws") {
        REQUIRE_THROWS_AS(SliceBuilder(types.int_type()), std::invalid_argument);
        REQUIRE_THROWS_AS(MapBuilder(types.slice_of(types.int_type())), std::invalid_argument);
    }
}

// ============================================================
// Rendering Tests
// ============================================================

TEST_CASE("value_to_string scalars", "[value][render]") {
    TypeRegistry types;

    REQUIRE(value_to_string(Value::of_bool(types.bool_type(), false)) == "false");
    REQUIRE(value_to_string(Value::of_int(types.int_type(), -42)) == "-42");
    REQUIRE(value_to_string(Value::of_float(types.float64_type(), 1.5)) == "1.5");
    REQUIRE(value_to_string(Value::of_float(types.float64_type(), 2.0)) == "2");
    REQUIRE(value_to_string(Value::of_complex(types.complex128_type(), {1, -2})) == "(1-2i)");
    REQUIRE(value_to_string(Value::of_string(types.string_type(), "a\"b\n")) == "\"a\\\"b\\n\"");
    REQUIRE(value_to_string(Value{}) == "nil");
}

TEST_CASE("format_float special values", "[value][render]") {
    REQUIRE(format_float(std::numeric_limits<double>::quiet_NaN()) == "NaN");
    REQUIRE(format_float(std::numeric_limits<double>::infinity()) == "+Inf");
    REQUIRE(format_float(-std::numeric_limits<double>::infinity()) == "-Inf");
    REQUIRE(format_float(0.1f, 32) == "0.1");
    REQUIRE(format_complex({0, 1}) == "(0+1i)");
}

TEST_CASE("format_float switches to exponent form", "[value][render]") {
    REQUIRE(format_float(123456.0) == "123456");
    REQUIRE(format_float(1234567.0) == "1.234567e+06");
    REQUIRE(format_float(1e21) == "1e+21");
    REQUIRE(format_float(0.0001) == "0.0001");
    REQUIRE(format_float(0.00001) == "1e-05");
    REQUIRE(format_float(-2.5e-7) == "-2.5e-07");
    REQUIRE(format_float(0.0) == "0");
    REQUIRE(format_float(1e6f, 32) == "1e+06");
    REQUIRE(format_complex({1e6, 1}) == "(1e+06+1i)");
}

TEST_CASE("quote_string escapes control bytes", "[value][render]") {
    REQUIRE(quote_string("") == "\"\"");
    REQUIRE(quote_string("tab\there") == "\"tab\\there\"");
    REQUIRE(quote_string("\x01") == "\"\\x01\"");
    REQUIRE(quote_string("back\\slash") == "\"back\\\\slash\"");
}

TEST_CASE("quote_string keeps UTF-8 and escapes stray bytes", "[value][render]") {
    REQUIRE(quote_string("h\xc3\xa9") == "\"h\xc3\xa9\"");
    REQUIRE(quote_string("\xe2\x82\xac") == "\"\xe2\x82\xac\"");
    REQUIRE(quote_string("\xff") == "\"\\xff\"");
    REQUIRE(quote_string("a\xc3") == "\"a\\xc3\"");
    REQUIRE(quote_string("\xc0\xaf") == "\"\\xc0\\xaf\"");
    REQUIRE(quote_string("\xed\xa0\x80") == "\"\\xed\\xa0\\x80\"");
}

TEST_CASE("value_to_string composites", "[value][render]") {
    TypeRegistry types;
    const Type* i = types.int_type();
    Type* node = types.declare_struct("Node");
    const Type* next = types.pointer_to(node);
    types.define_fields(node, {{"Val", i}, {"Next", next}});

    SECTION("pointers render their target") {
        Value n = Value::of_int(i, 5);
        REQUIRE(value_to_string(Value::pointer(types.pointer_to(i), &n)) == "&5");
    }

    SECTION("self loop") {
        Value a = Value::zero(node);
        a = Value::record(node, {Value::of_int(i, 1), Value::pointer(next, &a)});
        REQUIRE(value_to_string(a) == "Node{Val:1, Next:(CYCLIC REFERENCE)}");
    }

    SECTION("two node ring") {
        Value a = Value::zero(node);
        Value b = Value::zero(node);
        a = Value::record(node, {Value::of_int(i, 1), Value::pointer(next, &b)});
        b = Value::record(node, {Value::of_int(i, 2), Value::pointer(next, &a)});
        REQUIRE(value_to_string(a) == "Node{Val:1, Next:&Node{Val:2, Next:(CYCLIC REFERENCE)}}");
    }

    SECTION("handles") {
        const Type* fn = types.func_type("func()");
        REQUIRE(value_to_string(Value::handle(fn, 0x1f)) == "(func())(0x1f)");
        REQUIRE(value_to_string(Value::handle(fn, 0)) == "nil");
    }
}
