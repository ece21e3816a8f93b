#include <parity/compare/comparator.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>

using parity::compare::line_diff;

namespace {

auto count_of(const std::string& text, const std::string& needle) -> std::size_t {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos;
         pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

auto numbered(int from, int to, int changed = 0) -> std::string {
    std::string out;
    for (int i = from; i <= to; ++i) {
        out += i == changed ? "changed\n" : std::to_string(i) + "\n";
    }
    return out;
}

}  // namespace

TEST_CASE("Equal texts have no diff", "[compare][diff]") {
    REQUIRE(line_diff("", "").empty());
    REQUIRE(line_diff("a\nb\n", "a\nb\n").empty());
}

TEST_CASE("A replaced line shows as a removal and an addition", "[compare][diff]") {
    REQUIRE(line_diff("a\nb\nc\n", "a\nx\nc\n") ==
            "--- want\n"
            "+++ got\n"
            "@@ -1,3 +1,3 @@\n"
            " a\n"
            "-b\n"
            "+x\n"
            " c\n");
}

TEST_CASE("Insertions and deletions at the edges", "[compare][diff]") {
    SECTION("into empty text") {
        REQUIRE(line_diff("", "a\n") == "--- want\n+++ got\n@@ -0,0 +1 @@\n+a\n");
    }

    SECTION("trailing line removed") {
        REQUIRE(line_diff("a\nb\n", "a\n") == "--- want\n+++ got\n@@ -1,2 +1 @@\n a\n-b\n");
    }
}

TEST_CASE("Context is limited to three lines", "[compare][diff]") {
    auto diff = line_diff(numbered(1, 10), numbered(1, 10, 5));
    REQUIRE(diff ==
            "--- want\n"
            "+++ got\n"
            "@@ -2,7 +2,7 @@\n"
            " 2\n"
            " 3\n"
            " 4\n"
            "-5\n"
            "+changed\n"
            " 6\n"
            " 7\n"
            " 8\n");
}

TEST_CASE("Distant changes form separate hunks", "[compare][diff]") {
    std::string want = numbered(1, 30);
    std::string got = numbered(1, 30, 3);
    got.replace(got.find("\n27\n"), 4, "\nlate\n");
    auto diff = line_diff(want, got);
    REQUIRE(count_of(diff, "@@ -") == 2);
    REQUIRE(count_of(diff, "\n-") == 2);
    REQUIRE(count_of(diff, "\n+") == 3);
    REQUIRE(diff.find("+late\n") != std::string::npos);
}

TEST_CASE("Moved lines are matched by longest common subsequence", "[compare][diff]") {
    auto diff = line_diff("a\nb\nc\nd\n", "b\nc\nd\na\n");
    REQUIRE(diff ==
            "--- want\n"
            "+++ got\n"
            "@@ -1,4 +1,4 @@\n"
            "-a\n"
            " b\n"
            " c\n"
            " d\n"
            "+a\n");
}
