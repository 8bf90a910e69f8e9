// test_diff.cpp - Tests for the record comparer and diff entry points
// Module 5: Record diff, DiffStream and Diff

#include <catch2/catch_all.hpp>
#include <recdiff/builders.h>
#include <recdiff/record_type.h>
#include <recdiff/value_diff.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string>
#include <vector>

using namespace recdiff;

// ============================================================
// Helper Functions
// ============================================================

namespace {

RecordTypePtr address_type()
{
    static const RecordTypePtr type = make_record_type("Address", {
        FieldMeta{.name = "city"},
        FieldMeta{.name = "zip"},
    });
    return type;
}

RecordTypePtr person_type()
{
    static const RecordTypePtr type = make_record_type("Person", {
        FieldMeta{.name = "address"},
        FieldMeta{.name = "attrs"},
        FieldMeta{.name = "etag", .extraneous = true},
        FieldMeta{.name = "name"},
        FieldMeta{.name = "nick"},
        FieldMeta{.name = "tags"},
    });
    return type;
}

Value tags(std::initializer_list<Value> items)
{
    return Value::sequence(items);
}

std::vector<ChangeEntry> collect(DiffStream stream)
{
    std::vector<ChangeEntry> out;
    for (const auto& e : stream) {
        out.push_back(e);
    }
    return out;
}

ChangeEntry entry(ChangeKind kind, FieldSelector base, FieldSelector other)
{
    return ChangeEntry{kind, std::move(base), std::move(other)};
}

ChangeEntry swapped(const ChangeEntry& e)
{
    ChangeKind kind = e.kind;
    if (kind == ChangeKind::Added) kind = ChangeKind::Removed;
    else if (kind == ChangeKind::Removed) kind = ChangeKind::Added;
    return ChangeEntry{kind, e.other, e.base};
}

} // namespace

// ============================================================
// Testable properties
// ============================================================

TEST_CASE("Person scenario: whitespace and duplicate tags", "[diff][scenario]") {
    auto a = make_record(person_type(), {{"name", Value{"Jo  hn"}}, {"tags", tags({Value{"x"}, Value{"x"}})}});
    auto b = make_record(person_type(), {{"name", Value{"Jo hn"}}, {"tags", tags({Value{"x"}})}});

    auto d = diff(a, b, {.ignore_ws = true, .unchanged = false});

    REQUIRE(d.size() == 1);
    REQUIRE(d[0] == entry(ChangeKind::Removed, {"tags", std::size_t{1}}, {"tags"}));
    REQUIRE(d[0].to_string() == "<ChangeEntry: REMOVED .tags[1]>");
}

TEST_CASE("Duck typing scenario: shared id field", "[diff][scenario][duck]") {
    auto type_a = make_record_type("TypeA", {FieldMeta{.name = "id"}, FieldMeta{.name = "only_a"}});
    auto type_b = make_record_type("TypeB", {FieldMeta{.name = "id"}, FieldMeta{.name = "only_b"}});
    auto a = make_record(type_a, {{"id", Value{1}}});
    auto b = make_record(type_b, {{"id", Value{2}}, {"only_b", Value{"x"}}});

    SECTION("duck typed: one Modified at id") {
        auto d = diff(a, b, {.duck_type = true});
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {"id"}, {"id"}));
        REQUIRE(d.summary() == "TypeA vs TypeB: 1 item(s)");
    }

    SECTION("without duck typing the types must match") {
        REQUIRE_THROWS_AS(diff_iter(a, b), TypeMismatch);
    }

    SECTION("record against a plain map") {
        auto m = Value::map({{"id", Value{1}}, {"only_a", Value{"y"}}});
        auto d = diff(a, m, {.duck_type = true});
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Added, {"only_a"}, {"only_a"}));
    }
}

TEST_CASE("Reflexivity", "[diff][property]") {
    auto a = make_record(person_type(), {
        {"name", Value{"Ann"}},
        {"tags", tags({Value{"x"}, Value{"y"}})},
        {"address", make_record(address_type(), {{"city", Value{"Oslo"}}})},
        {"attrs", Value::map({{"k", Value{1}}})},
    });

    SECTION("default options: nothing") {
        REQUIRE(diff(a, a).empty());
        REQUIRE_FALSE(has_any_difference(a, a));
    }

    SECTION("unchanged: only Unchanged entries") {
        auto d = diff(a, a, {.unchanged = true});
        REQUIRE_FALSE(d.empty());
        REQUIRE(d.count(ChangeKind::Unchanged) == d.size());
        REQUIRE_FALSE(d.has_changes());
        // name, tags[0], tags[1], address.city, attrs.k
        REQUIRE(d.size() == 5);
    }
}

TEST_CASE("Symmetry of kinds", "[diff][property]") {
    auto a = make_record(person_type(), {{"name", Value{"A"}}, {"tags", tags({Value{"x"}, Value{"z"}})}});
    auto b = make_record(person_type(), {
        {"name", Value{"B"}},
        {"nick", Value{"N"}},
        {"tags", tags({Value{"x"}, Value{"y"}})},
    });

    auto forward = diff(a, b);
    auto backward = diff(b, a);

    REQUIRE(forward.size() == 4);
    REQUIRE(forward.size() == backward.size());
    for (const auto& e : forward) {
        auto expected = swapped(e);
        REQUIRE(std::find(backward.begin(), backward.end(), expected) != backward.end());
    }
}

TEST_CASE("Multiset correctness", "[diff][property]") {
    auto a = tags({Value{"x"}, Value{"x"}, Value{"y"}});
    auto b = tags({Value{"x"}, Value{"y"}, Value{"y"}});

    auto d = diff(a, b);
    REQUIRE(d.size() == 2);
    REQUIRE(d[0] == entry(ChangeKind::Removed, {std::size_t{1}}, {}));
    REQUIRE(d[1] == entry(ChangeKind::Added, {}, {std::size_t{2}}));
}

TEST_CASE("Filter containment", "[diff][property][filter]") {
    auto a = make_record(person_type(), {
        {"name", Value{"A"}},
        {"tags", tags({Value{"x"}})},
        {"address", make_record(address_type(), {{"city", Value{"Oslo"}}, {"zip", Value{"0150"}}})},
    });
    auto b = make_record(person_type(), {
        {"name", Value{"B"}},
        {"tags", tags({Value{"y"}})},
        {"address", make_record(address_type(), {{"city", Value{"Bergen"}}, {"zip", Value{"5003"}}})},
    });

    SECTION("only the selected field is reported") {
        auto d = diff(a, b, {.compare_filter = MultiFieldSelector{FieldSelector{"name"}}});
        REQUIRE(d.size() == 1);
        REQUIRE(d[0].base == FieldSelector{"name"});
    }

    SECTION("excluded paths never show up, even with unchanged") {
        auto d = diff(a, b, {.unchanged = true,
                             .compare_filter = MultiFieldSelector{FieldSelector{"name"},
                                                                  FieldSelector{"address", "city"}}});
        for (const auto& e : d) {
            REQUIRE_FALSE(e.base.startswith(FieldSelector{"tags"}));
            REQUIRE_FALSE(e.other.startswith(FieldSelector{"tags"}));
            REQUIRE_FALSE(e.base.startswith(FieldSelector{"address", "zip"}));
        }
        REQUIRE(d.size() == 2);
    }
}

// ============================================================
// Record comparer decision table
// ============================================================

TEST_CASE("Record comparer: set, unset and null", "[diff][record]") {
    auto base = make_record(person_type(), {{"name", Value{"Ann"}}});

    SECTION("field set only on the other side is Added") {
        auto other = make_record(person_type(), {{"name", Value{"Ann"}}, {"nick", Value{"A"}}});
        auto d = diff(base, other);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Added, {"nick"}, {"nick"}));
    }

    SECTION("field set only on the base side is Removed") {
        auto other = make_record(person_type(), {});
        auto d = diff(base, other);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Removed, {"name"}, {"name"}));
    }

    SECTION("null is a value") {
        auto other = make_record(person_type(), {{"name", Value{"Ann"}}, {"nick", Value{}}});
        auto d = diff(base, other);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0].kind == ChangeKind::Added);
    }

    SECTION("empty values count as unset with ignore_empty_slots") {
        auto other = make_record(person_type(), {{"name", Value{"Ann"}}, {"nick", Value{"  "}}});
        REQUIRE(diff(base, other).size() == 1);
        REQUIRE(diff(base, other, {.ignore_empty_slots = true}).empty());
    }

    SECTION("changed scalar is Modified") {
        auto other = make_record(person_type(), {{"name", Value{"Anne"}}});
        auto d = diff(base, other);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {"name"}, {"name"}));
    }

    SECTION("case only matters without ignore_case") {
        auto other = make_record(person_type(), {{"name", Value{"ANN"}}});
        REQUIRE(diff(base, other).size() == 1);
        REQUIRE(diff(base, other, {.ignore_case = true}).empty());
    }

    SECTION("shape change is Modified") {
        auto other = make_record(person_type(), {{"name", tags({Value{"Ann"}})}});
        auto d = diff(base, other);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0].kind == ChangeKind::Modified);
    }
}

TEST_CASE("Record comparer: extraneous fields", "[diff][record]") {
    auto a = make_record(person_type(), {{"etag", Value{"v1"}}});
    auto b = make_record(person_type(), {{"etag", Value{"v2"}}});

    REQUIRE(diff(a, b).empty());

    auto d = diff(a, b, {.extraneous = true});
    REQUIRE(d.size() == 1);
    REQUIRE(d[0] == entry(ChangeKind::Modified, {"etag"}, {"etag"}));
}

TEST_CASE("Record comparer: nested containers", "[diff][record]") {
    SECTION("nested record") {
        auto a = make_record(person_type(), {{"address", make_record(address_type(), {{"city", Value{"Oslo"}}})}});
        auto b = make_record(person_type(), {{"address", make_record(address_type(), {{"city", Value{"Bergen"}}})}});
        auto d = diff(a, b);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {"address", "city"}, {"address", "city"}));
    }

    SECTION("nested record of another type") {
        auto other_type = make_record_type("Location", {FieldMeta{.name = "city"}});
        auto a = make_record(person_type(), {{"address", make_record(address_type(), {{"city", Value{"Oslo"}}})}});
        auto b = make_record(person_type(), {{"address", make_record(other_type, {{"city", Value{"Oslo"}}})}});
        REQUIRE_THROWS_AS(diff(a, b), TypeMismatch);
        REQUIRE(diff(a, b, {.duck_type = true}).empty());
    }

    SECTION("distinct types sharing a name") {
        auto twin = make_record_type("Address", {FieldMeta{.name = "city"}, FieldMeta{.name = "zip"}});
        auto a = make_record(person_type(), {{"address", make_record(address_type(), {{"city", Value{"Oslo"}}})}});
        auto b = make_record(person_type(), {{"address", make_record(twin, {{"city", Value{"Oslo"}}})}});
        REQUIRE_THROWS_AS(diff(a, b), TypeMismatch);
        REQUIRE(diff(a, b, {.duck_type = true}).empty());
    }

    SECTION("scalar mapping") {
        auto a = make_record(person_type(), {{"attrs", Value::map({{"a", Value{1}}, {"b", Value{2}}})}});
        auto b = make_record(person_type(), {{"attrs", Value::map({{"a", Value{1}}, {"b", Value{3}}})}});
        auto d = diff(a, b);
        REQUIRE(d.size() == 2);
        REQUIRE(d[0] == entry(ChangeKind::Removed, {"attrs", "b"}, {"attrs"}));
        REQUIRE(d[1] == entry(ChangeKind::Added, {"attrs"}, {"attrs", "b"}));
    }

    SECTION("sequence order does not matter") {
        auto a = make_record(person_type(), {{"tags", tags({Value{"x"}, Value{"y"}})}});
        auto b = make_record(person_type(), {{"tags", tags({Value{"y"}, Value{"x"}})}});
        REQUIRE(diff(a, b).empty());

        auto d = diff(a, b, {.unchanged = true});
        REQUIRE(d.size() == 2);
        REQUIRE(d[0] == entry(ChangeKind::Unchanged, {"tags", std::size_t{0}}, {"tags", std::size_t{1}}));
    }

    SECTION("sequence items are normalized") {
        auto a = make_record(person_type(), {{"tags", tags({Value{" x "}, Value{""}})}});
        auto b = make_record(person_type(), {{"tags", tags({Value{"x"}})}});
        REQUIRE(diff(a, b).size() == 1);
        REQUIRE(diff(a, b, {.ignore_empty_slots = true}).empty());
    }
}

TEST_CASE("Duck typing across shapes", "[diff][record][duck]") {
    auto inner = make_record_type("Inner", {FieldMeta{.name = "x"}});
    auto labels = make_collection_type("Labels", CollectionKind::List);
    auto outer = make_record_type("Outer", {FieldMeta{.name = "inner"}, FieldMeta{.name = "labels"}});

    auto a = make_record(outer, {
        {"inner", make_record(inner, {{"x", Value{1}}})},
        {"labels", make_list(labels, {Value{"a"}, Value{"b"}})},
    });

    SECTION("nested record against a nested map") {
        auto b = Value::map({
            {"inner", Value::map({{"x", Value{1}}})},
            {"labels", tags({Value{"b"}, Value{"a"}})},
        });
        REQUIRE_THROWS_AS(diff_iter(a, b), TypeMismatch);
        REQUIRE(diff(a, b, {.duck_type = true}).empty());
    }

    SECTION("changes inside the map are reported per field") {
        auto b = Value::map({
            {"inner", Value::map({{"x", Value{2}}})},
            {"labels", tags({Value{"a"}, Value{"b"}, Value{"c"}})},
        });
        auto d = diff(a, b, {.duck_type = true});
        REQUIRE(d.size() == 2);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {"inner", "x"}, {"inner", "x"}));
        REQUIRE(d[1] == entry(ChangeKind::Added, {"labels"}, {"labels", std::size_t{2}}));
    }

    SECTION("without duck typing nested shapes must agree") {
        auto b = make_record(outer, {
            {"inner", Value::map({{"x", Value{1}}})},
            {"labels", make_list(labels, {Value{"a"}, Value{"b"}})},
        });
        auto d = diff(a, b);
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {"inner"}, {"inner"}));
    }

    SECTION("sequence against a mapping") {
        REQUIRE(diff(tags({Value{1}}), Value::map({{"k", Value{1}}}), {.duck_type = true}).empty());
        REQUIRE_THROWS_AS(diff_iter(tags({Value{1}}), Value::map({{"k", Value{1}}})), TypeMismatch);
    }
}

TEST_CASE("items_equal override", "[diff][record]") {
    auto type = make_record_type("Reading", {FieldMeta{.name = "value"}});
    auto a = make_record(type, {{"value", Value{1.0}}});
    auto b = make_record(type, {{"value", Value{1.0000001}}});

    REQUIRE(diff(a, b).size() == 1);

    DiffFlags flags;
    flags.items_equal = [](const Value& x, const Value& y) {
        return std::abs(x.as_double() - y.as_double()) < 1e-3;
    };
    REQUIRE(diff(a, b, flags).empty());
}

TEST_CASE("compare_as field hook", "[diff][record][hooks]") {
    auto type = make_record_type("Account", {
        FieldMeta{.name = "email", .compare_as = [](const Value& v) {
            std::string s = v.as_string();
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
            return Value{s};
        }},
    });
    auto a = make_record(type, {{"email", Value{"Jo@Example.com"}}});
    auto b = make_record(type, {{"email", Value{"jo@example.COM"}}});
    REQUIRE(diff(a, b).empty());
}

// ============================================================
// Root values
// ============================================================

TEST_CASE("Root values", "[diff][root]") {
    SECTION("scalars") {
        REQUIRE(diff(Value{"a "}, Value{"a"}).empty());

        auto d = diff(Value{1}, Value{2});
        REQUIRE(d.size() == 1);
        REQUIRE(d[0] == entry(ChangeKind::Modified, {}, {}));
        REQUIRE(d.summary() == "int: 1 item(s)");
    }

    SECTION("different shapes") {
        REQUIRE_THROWS_AS(diff_iter(Value{1}, tags({Value{1}})), TypeMismatch);

        auto d = diff(Value{1}, tags({Value{1}}), {.duck_type = true});
        REQUIRE(d.size() == 1);
        REQUIRE(d[0].kind == ChangeKind::Modified);
    }

    SECTION("TypeMismatch is a DiffError") {
        REQUIRE_THROWS_AS(diff_iter(Value{1}, Value::map({})), DiffError);
    }
}

// ============================================================
// Options objects and flags
// ============================================================

TEST_CASE("Options object and inline flags", "[diff][options]") {
    auto a = make_record(person_type(), {{"name", Value{"Ann"}}});
    auto b = make_record(person_type(), {{"name", Value{"ANN"}}});

    SECTION("options object") {
        auto opts = std::make_shared<DiffOptions>();
        opts->ignore_case = true;
        REQUIRE(diff(a, b, opts).empty());
    }

    SECTION("both at once is a conflict") {
        auto opts = std::make_shared<DiffOptions>();
        REQUIRE_THROWS_AS(diff_iter(a, b, opts, {.unchanged = true}), DiffOptionsConflict);
        REQUIRE_THROWS_AS(diff_iter(a, b, opts, {.unchanged = true}), ConfigurationError);
    }

    SECTION("null options object falls back to flags") {
        REQUIRE(diff(a, b, DiffOptionsPtr{}, {.ignore_case = true}).empty());
    }

    SECTION("one options object serves several runs") {
        auto opts = std::make_shared<const DiffOptions>(DiffFlags{.unchanged = true});
        auto first = diff(a, a, opts);
        auto second = diff(b, b, opts);
        REQUIRE(first.size() == 1);
        REQUIRE(second.size() == 1);
    }
}

// ============================================================
// DiffStream laziness
// ============================================================

TEST_CASE("DiffStream is lazy", "[diff][stream]") {
    auto other_type = make_record_type("Location", {FieldMeta{.name = "city"}});
    auto a = make_record(person_type(), {
        {"address", make_record(address_type(), {{"city", Value{"Oslo"}}})},
        {"attrs", Value::map({{"k", Value{1}}})},
    });

    SECTION("entries come one at a time, in field order") {
        auto b = make_record(person_type(), {
            {"address", make_record(address_type(), {{"city", Value{"Bergen"}}})},
            {"attrs", Value::map({{"k", Value{2}}})},
            {"name", Value{"X"}},
        });
        auto stream = diff_iter(a, b);
        auto first = stream.next();
        REQUIRE(first.has_value());
        REQUIRE(first->base == FieldSelector{"address", "city"});
        REQUIRE_FALSE(stream.done());

        auto rest = collect(std::move(stream));
        REQUIRE(rest.size() == 3);
        REQUIRE(rest.back() == entry(ChangeKind::Added, {"name"}, {"name"}));
    }

    SECTION("errors deeper in the tree surface only when reached") {
        auto b = make_record(person_type(), {
            {"address", make_record(other_type, {{"city", Value{"Oslo"}}})},
        });
        auto c = make_record(person_type(), {
            {"address", make_record(address_type(), {{"city", Value{"Oslo"}}})},
            {"attrs", Value::map({{"k", Value{1}}})},
            {"etag", Value{"ignored"}},
        });
        // a vs c is fine; a vs b only fails once the address field is reached
        REQUIRE(diff(a, c).empty());
        auto stream = diff_iter(a, b);
        REQUIRE_THROWS_AS(stream.next(), TypeMismatch);
    }

    SECTION("stopping early is fine") {
        SequenceBuilder big_a;
        SequenceBuilder big_b;
        for (int i = 0; i < 1000; ++i) {
            big_a.push_back(Value{i});
            big_b.push_back(Value{i + 1});
        }
        auto x = make_record(person_type(), {{"tags", big_a.finish()}});
        auto y = make_record(person_type(), {{"tags", big_b.finish()}});

        std::size_t seen = 0;
        for (const auto& e : diff_iter(x, y)) {
            (void)e;
            if (++seen == 1) break;
        }
        REQUIRE(seen == 1);
        REQUIRE(has_any_difference(x, y));
    }
}

TEST_CASE("Diff result", "[diff][result]") {
    auto a = make_record(person_type(), {{"name", Value{"A"}}});
    auto b = make_record(person_type(), {{"name", Value{"B"}}, {"nick", Value{"b"}}});

    auto d = diff(a, b);
    REQUIRE(d.size() == 2);
    REQUIRE(d.base_type_name() == "Person");
    REQUIRE(d.other_type_name() == "Person");
    REQUIRE(d.summary() == "Person: 2 item(s)");
    REQUIRE(d.count(ChangeKind::Modified) == 1);
    REQUIRE(d.count(ChangeKind::Added) == 1);
    REQUIRE(d.has_changes());
}
