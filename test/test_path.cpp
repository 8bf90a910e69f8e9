// test_path.cpp - Tests for FieldSelector and MultiFieldSelector
// Module 2: Paths into record trees

#include <catch2/catch_all.hpp>
#include <recdiff/field_selector.h>
#include <recdiff/multi_field_selector.h>

#include <string>
#include <vector>

using namespace recdiff;

// ============================================================
// FieldSelector Tests
// ============================================================

TEST_CASE("FieldSelector construction", "[path][selector]") {
    SECTION("default construction (root)") {
        FieldSelector fs;
        REQUIRE(fs.empty());
        REQUIRE(fs.size() == 0);
        REQUIRE(fs.path() == "(root)");
    }

    SECTION("from elements") {
        FieldSelector fs{"people", std::size_t{0}, "name"};
        REQUIRE(fs.size() == 3);
        REQUIRE(std::get<std::string>(fs[0]) == "people");
        REQUIRE(std::get<std::size_t>(fs[1]) == 0);
        REQUIRE(fs.path() == ".people[0].name");
    }

    SECTION("null key renders as a wildcard") {
        FieldSelector fs{"tags", PathElement{}};
        REQUIRE(fs.path() == ".tags[*]");
    }

    SECTION("push_back and pop_back") {
        FieldSelector fs;
        fs.push_back(std::string{"a"}).push_back(std::size_t{2});
        REQUIRE(fs.path() == ".a[2]");
        fs.pop_back();
        REQUIRE(fs.path() == ".a");
    }
}

TEST_CASE("FieldSelector concatenation", "[path][selector]") {
    FieldSelector base{"people"};

    SECTION("plus element leaves the original alone") {
        auto child = base + "name";
        REQUIRE(child.size() == 2);
        REQUIRE(base.size() == 1);
    }

    SECTION("plus index") {
        REQUIRE((base + std::size_t{4}).path() == ".people[4]");
    }

    SECTION("plus selector") {
        auto joined = base + FieldSelector{std::size_t{1}, "id"};
        REQUIRE(joined == FieldSelector{"people", std::size_t{1}, "id"});
    }
}

TEST_CASE("FieldSelector queries", "[path][selector]") {
    FieldSelector fs{"a", "b", std::size_t{1}};

    SECTION("startswith") {
        REQUIRE(fs.startswith(FieldSelector{}));
        REQUIRE(fs.startswith(FieldSelector{"a"}));
        REQUIRE(fs.startswith(FieldSelector{"a", "b"}));
        REQUIRE(fs.startswith(fs));
        REQUIRE_FALSE(fs.startswith(FieldSelector{"b"}));
        REQUIRE_FALSE(FieldSelector{"a"}.startswith(fs));
    }

    SECTION("ordering") {
        REQUIRE(FieldSelector{"a"} < FieldSelector{"b"});
        REQUIRE(FieldSelector{"a"} < FieldSelector{"a", "b"});
        REQUIRE_FALSE(fs < fs);
    }
}

// ============================================================
// MultiFieldSelector Tests
// ============================================================

TEST_CASE("MultiFieldSelector contains", "[path][multi]") {
    MultiFieldSelector mfs{
        FieldSelector{"name"},
        FieldSelector{"people", PathElement{}, "id"},
    };

    SECTION("selected path and its subtree") {
        REQUIRE(mfs.contains(FieldSelector{"name"}));
        REQUIRE(mfs.contains(FieldSelector{"name", "first"}));
    }

    SECTION("ancestors of a selected path") {
        REQUIRE(mfs.contains(FieldSelector{"people"}));
        REQUIRE(mfs.contains(FieldSelector{"people", std::size_t{3}}));
    }

    SECTION("wildcard matches any key") {
        REQUIRE(mfs.contains(FieldSelector{"people", std::size_t{3}, "id"}));
        REQUIRE(mfs.contains(FieldSelector{"people", "bob", "id"}));
        REQUIRE_FALSE(mfs.contains(FieldSelector{"people", std::size_t{3}, "age"}));
    }

    SECTION("unselected paths") {
        REQUIRE_FALSE(mfs.contains(FieldSelector{"age"}));
    }

    SECTION("empty selector selects nothing") {
        MultiFieldSelector none;
        REQUIRE(none.empty());
        REQUIRE_FALSE(none.contains(FieldSelector{"name"}));
    }

    SECTION("root selector selects everything") {
        MultiFieldSelector everything{FieldSelector{}};
        REQUIRE(everything.selects_all());
        REQUIRE(everything.contains(FieldSelector{"anything", std::size_t{9}}));
    }
}

TEST_CASE("MultiFieldSelector sub-selectors", "[path][multi]") {
    MultiFieldSelector mfs{
        FieldSelector{"people", PathElement{}, "id"},
        FieldSelector{"people", std::size_t{0}, "name"},
    };

    SECTION("at merges exact and wildcard branches") {
        auto first = mfs.at("people").at(std::size_t{0});
        REQUIRE(first.contains(FieldSelector{"id"}));
        REQUIRE(first.contains(FieldSelector{"name"}));

        auto second = mfs.at("people").at(std::size_t{1});
        REQUIRE(second.contains(FieldSelector{"id"}));
        REQUIRE_FALSE(second.contains(FieldSelector{"name"}));
    }

    SECTION("any keeps only the wildcard branch") {
        auto items = mfs.at(FieldSelector{"people"}).any();
        REQUIRE(items.contains(FieldSelector{"id"}));
        REQUIRE_FALSE(items.contains(FieldSelector{"name"}));
    }

    SECTION("below a selected subtree everything is selected") {
        MultiFieldSelector whole{FieldSelector{"people"}};
        REQUIRE(whole.at("people").selects_all());
        REQUIRE(whole.at(FieldSelector{"people", std::size_t{2}}).selects_all());
    }

    SECTION("path listing") {
        MultiFieldSelector two{FieldSelector{"a"}, FieldSelector{"b", PathElement{}, "c"}};
        REQUIRE(two.path() == "{.a, .b[*].c}");
        REQUIRE(two.selectors().size() == 2);
    }

    SECTION("adding a parent collapses its children") {
        MultiFieldSelector sel{FieldSelector{"a", "b"}};
        sel.add(FieldSelector{"a"});
        REQUIRE(sel.selectors() == std::vector<FieldSelector>{FieldSelector{"a"}});
    }
}
