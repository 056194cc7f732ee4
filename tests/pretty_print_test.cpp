#include "pretty_print.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace ordmap {
namespace {

using Map = OrderedMap<int, std::string>;

void quoted(std::ostream& os, const std::string& s) { os << '"' << s << '"'; }

std::string render(const Map& m) {
    std::ostringstream out;
    pp(out, m);
    return out.str();
}

std::string renderDiff(const Map& x, const Map& y) {
    std::ostringstream out;
    ppDiff(
        out, x, y, [](const std::string& a, const std::string& b) { return a == b; }, StreamPrinter(),
        StreamPrinter(), [](std::ostream& os, const std::string& l, const std::string& r) { os << l << "->" << r; });
    return out.str();
}

TEST(PrettyPrint, Bindings) {
    EXPECT_EQ(render(Map::ofAlist({{2, "b"}, {1, "a"}})), "[1 ↦ a, 2 ↦ b]");
    EXPECT_EQ(render(Map::singleton(7, "x")), "[7 ↦ x]");
}

TEST(PrettyPrint, EmptyMap) {
    EXPECT_EQ(render(Map::empty()), "[]");
}

TEST(PrettyPrint, CustomPrinters) {
    std::ostringstream out;
    pp(out, Map::ofAlist({{1, "a"}, {2, "b"}}), [](std::ostream& os, int k) { os << '#' << k; }, quoted);
    EXPECT_EQ(out.str(), "[#1 ↦ \"a\", #2 ↦ \"b\"]");
}

TEST(PrettyPrint, DiffMarksEachKind) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}, {3, "c"}});
    Map y = Map::ofAlist({{2, "b"}, {3, "C"}, {4, "d"}});
    EXPECT_EQ(renderDiff(x, y), "[-- [1 ↦ a]; [3 ↦ c->C]; ++ [4 ↦ d]]; ");
}

TEST(PrettyPrint, DiffOfSingleBindings) {
    Map empty = Map::empty();
    Map one = Map::singleton(1, "x");
    EXPECT_EQ(renderDiff(empty, one), "[++ [1 ↦ x]]; ");
    EXPECT_EQ(renderDiff(one, empty), "[-- [1 ↦ x]]; ");
}

TEST(PrettyPrint, DiffOfAgreeingMapsWritesNothing) {
    Map x = Map::ofAlist({{1, "a"}, {2, "b"}});
    EXPECT_EQ(renderDiff(x, x), "");
    EXPECT_EQ(renderDiff(x, Map::ofAlist({{2, "b"}, {1, "a"}})), "");
    EXPECT_EQ(renderDiff(Map::empty(), Map::empty()), "");
}

} // namespace
} // namespace ordmap
