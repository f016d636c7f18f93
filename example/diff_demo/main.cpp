// main.cpp
// Diff Demo - Comparing two versions of a small document model
//
// This example builds two versions of the same data with the builders and
// shows the three ways to consume the differences:
//
// 1. diff()        - collect the lines into a std::vector<std::string>
// 2. write_diff()  - stream the lines to std::cout
// 3. log_diff()    - forward the lines to the append-only DebugLogger
//
// The last part shows that self-referential data is compared safely.

#include <pretty_diff/builders.h>
#include <pretty_diff/debug_log.h>
#include <pretty_diff/errors.h>
#include <pretty_diff/value_diff.h>

#include <iostream>
#include <string>
#include <vector>

using namespace pretty_diff;

// ============================================================
// Document Schema
// ============================================================

struct Schema
{
    TypeRegistry types;
    const Type* str = types.string_type();
    const Type* num = types.int_type();
    const Type* tags = types.slice_of(str);
    const Type* attrs = types.map_of(str, types.any_type());
    const Type* item = types.define_struct("Item", {{"Title", str}, {"Done", types.bool_type()}});
    const Type* items = types.slice_of(item);
    const Type* doc = types.define_struct("Document", {{"Owner", str},
                                                       {"Version", num},
                                                       {"Tags", tags},
                                                       {"Attrs", attrs},
                                                       {"Items", items}});

    Value make_item(const char* title, bool done) const
    {
        return StructBuilder(item).set("Title", title).set("Done", done).finish();
    }
};

Value version_one(const Schema& s)
{
    return StructBuilder(s.doc)
        .set("Owner", "alice")
        .set("Version", 1)
        .set("Tags", SliceBuilder(s.tags).push_back("draft").push_back("notes").finish())
        .set("Attrs", MapBuilder(s.attrs)
                          .set("pages", Value::of_int(s.num, 3))
                          .set("lang", Value::of_string(s.str, "en"))
                          .finish())
        .set("Items", SliceBuilder(s.items)
                          .push_back(s.make_item("write intro", true))
                          .push_back(s.make_item("add figures", false))
                          .finish())
        .finish();
}

Value version_two(const Schema& s)
{
    return StructBuilder(s.doc)
        .set("Owner", "alice")
        .set("Version", 2)
        .set("Tags", SliceBuilder(s.tags).push_back("final").finish())
        .set("Attrs", MapBuilder(s.attrs)
                          .set("pages", Value::of_string(s.str, "three"))
                          .set("reviewer", Value::of_string(s.str, "bob"))
                          .finish())
        .set("Items", SliceBuilder(s.items)
                          .push_back(s.make_item("write intro", true))
                          .push_back(s.make_item("add figures", true))
                          .finish())
        .finish();
}

// ============================================================
// Demos
// ============================================================

void demo_collect(const Value& before, const Value& after)
{
    std::cout << "\n=== diff() ===\n";
    const auto lines = diff(before, after);
    std::cout << lines.size() << " differences\n";
    for (const auto& line : lines) {
        std::cout << "  " << line << "\n";
    }
}

void demo_stream(const Value& before, const Value& after)
{
    std::cout << "\n=== write_diff() ===\n";
    write_diff(std::cout, before, after);
}

void demo_log(const Value& before, const Value& after, int argc, char** argv)
{
    std::cout << "\n=== log_diff() ===\n";
    DebugLogOptions options;
    options.command_line.assign(argv, argv + argc);
    DebugLogger logger{options};
    log_diff(logger, before, after);
    std::cout << "appended to " << options.path.string() << "\n";
}

void demo_cycles(Schema& s)
{
    std::cout << "\n=== cyclic values ===\n";
    Type* node = s.types.declare_struct("Node");
    const Type* next = s.types.pointer_to(node);
    s.types.define_fields(node, {{"Val", s.num}, {"Next", next}});

    // a -> b -> a against c -> c
    Value a = Value::zero(node);
    Value b = Value::zero(node);
    Value c = Value::zero(node);
    a = Value::record(node, {Value::of_int(s.num, 1), Value::pointer(next, &b)});
    b = Value::record(node, {Value::of_int(s.num, 1), Value::pointer(next, &a)});
    c = Value::record(node, {Value::of_int(s.num, 1), Value::pointer(next, &c)});

    std::cout << "a: " << value_to_string(a) << "\n";
    std::cout << "c: " << value_to_string(c) << "\n";
    write_diff(std::cout, a, c);
    std::cout << "a vs a has differences: " << std::boolalpha << has_any_difference(a, a) << "\n";
}

int main(int argc, char** argv)
{
    Schema schema;
    const Value before = version_one(schema);
    const Value after = version_two(schema);

    std::cout << "before:\n";
    print_value(before, "  ");

    demo_collect(before, after);
    demo_stream(before, after);

    try {
        demo_log(before, after, argc, argv);
    } catch (const FileAppendError& e) {
        std::cerr << "debug log unavailable: " << e.what() << "\n";
    }

    demo_cycles(schema);
    return 0;
}
