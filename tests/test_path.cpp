#include "hmarshal/path.hpp"

#include "test_support.hpp"

#include <iostream>
#include <set>

using namespace hmarshal;

static void test_normalize() {
    CHECK(normalize_path("/") == "/");
    CHECK(normalize_path("//a///b/") == "/a/b");
    CHECK(normalize_path("/a/./b/.") == "/a/b");
    CHECK(normalize_path("/./") == "/");
    CHECK_THROWS_KIND(normalize_path(""), ErrorKind::InvalidPath);
    CHECK_THROWS_KIND(normalize_path("a/b"), ErrorKind::InvalidPath);
    CHECK_THROWS_KIND(normalize_path("/a/../b"), ErrorKind::InvalidPath);
}

static void test_segments() {
    auto parts = split_path("/x/yy/z");
    CHECK(parts.size() == 3);
    CHECK(parts[1] == "yy");
    CHECK(split_path("/").empty());
    CHECK(join_path(parts, 2) == "x/yy");
    CHECK(join_path(parts, 10) == "x/yy/z");
    CHECK(parent_path("/x/yy/z") == "/x/yy");
    CHECK(parent_path("/x") == "/");
    CHECK(leaf_name("/x/yy/z") == "z");
    CHECK(leaf_name("/").empty());
    CHECK(append_path("/", "a") == "/a");
    CHECK(append_path("/a", "b") == "/a/b");
}

static void test_child_names() {
    CHECK(child_path("/data", 0) == "/data/0");
    CHECK(child_path("/", 12) == "/12");

    std::set<std::string> seen;
    for (std::size_t i = 0; i < 1000; ++i) {
        std::string p = child_path("/a/b", i);
        CHECK(seen.insert(p).second);
        CHECK(child_index(leaf_name(p)) == i);
    }

    CHECK(child_index("0") == std::size_t{0});
    CHECK(!child_index("").has_value());
    CHECK(!child_index("007").has_value());
    CHECK(!child_index("1a").has_value());
    CHECK(!child_index("-1").has_value());
    CHECK(!child_index("99999999999999999999999").has_value());

    // deep nesting grows the path by one short segment per level
    std::string p = "/root";
    for (int depth = 0; depth < 2000; ++depth) p = child_path(p, 3);
    CHECK(p.size() == 5 + 2 * 2000);
}

int main() {
    test_normalize();
    test_segments();
    test_child_names();
    std::cout << "All tests passed.\n";
    return 0;
}
