// main.cpp
// Diff Demo - comparing two snapshots of a small address book
//
// Shows the three ways of consuming a diff:
//   1. diff()        eager, with a summary line
//   2. diff_iter()   lazy, stopping at the first change
//   3. DiffOptions   one options object shared by several runs

#include <recdiff/builders.h>
#include <recdiff/record_type.h>
#include <recdiff/value_diff.h>

#include <iostream>
#include <memory>

using namespace recdiff;

// ============================================================
// Schema
// ============================================================

namespace {

struct Schema {
    RecordTypePtr contact;
    CollectionTypePtr contacts;
    RecordTypePtr book;
};

Schema make_schema()
{
    Schema s;
    s.contact = make_record_type("Contact", {
        FieldMeta{.name = "email"},
        FieldMeta{.name = "id"},
        FieldMeta{.name = "name"},
        FieldMeta{.name = "phones"},
        FieldMeta{.name = "updated", .extraneous = true, .doc = "last write timestamp"},
    }, {"id"});
    s.contacts = make_collection_type("Contacts", CollectionKind::List, s.contact);
    s.book = make_record_type("AddressBook", {
        FieldMeta{.name = "contacts"},
        FieldMeta{.name = "owner"},
    });
    return s;
}

Value contact(const Schema& s, int id, const char* name, const char* email,
              std::initializer_list<Value> phones, int updated)
{
    return RecordBuilder(s.contact)
        .set("id", id)
        .set("name", name)
        .set("email", email)
        .set("phones", Value::sequence(phones))
        .set("updated", updated)
        .finish();
}

} // namespace

// ============================================================
// Main
// ============================================================

int main()
{
    const Schema s = make_schema();

    Value before = make_record(s.book, {
        {"owner", Value{"Ann"}},
        {"contacts", make_list(s.contacts, {
            contact(s, 1, "Bob  Smith", "bob@example.com", {Value{"555-0100"}}, 100),
            contact(s, 2, "Cy", "cy@example.com", {Value{"555-0200"}, Value{"555-0201"}}, 100),
        })},
    });

    Value after = make_record(s.book, {
        {"owner", Value{"Ann"}},
        {"contacts", make_list(s.contacts, {
            contact(s, 2, "Cy", "CY@example.com", {Value{"555-0201"}}, 200),
            contact(s, 3, "Di", "di@example.com", {}, 200),
            contact(s, 1, "Bob Smith", "bob@example.com", {Value{"555-0100"}}, 200),
        })},
    });

    std::cout << "=== Before ===\n";
    print_value(before, "", 1);

    // -------------------------------------------------------
    // 1. Eager diff
    // -------------------------------------------------------
    std::cout << "\n=== diff(before, after) ===\n";
    diff(before, after).print();

    std::cout << "\n=== diff(before, after, {.ignore_case = true}) ===\n";
    diff(before, after, {.ignore_case = true}).print();

    // -------------------------------------------------------
    // 2. Lazy diff
    // -------------------------------------------------------
    std::cout << "\n=== first change only ===\n";
    auto stream = diff_iter(before, after);
    if (auto first = stream.next()) {
        std::cout << "  " << *first << "\n";
    }

    // -------------------------------------------------------
    // 3. Shared options, restricted to phone numbers
    // -------------------------------------------------------
    auto opts = std::make_shared<DiffOptions>();
    opts->compare_filter = MultiFieldSelector{FieldSelector{"contacts", PathElement{}, "phones"}};
    opts->unchanged = true;

    std::cout << "\n=== phones only, " << opts->compare_filter->path() << " ===\n";
    for (const ChangeEntry& e : diff_iter(before, after, opts)) {
        std::cout << "  " << e << "\n";
    }

    // Errors are exceptions
    try {
        auto mismatch = diff_iter(before, Value::sequence({}));
        (void)mismatch;
    } catch (const TypeMismatch& e) {
        std::cout << "\nTypeMismatch: " << e.what() << "\n";
    }

    return 0;
}
