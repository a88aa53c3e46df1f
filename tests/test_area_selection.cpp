#include <gtest/gtest.h>
#include <sstream>
#include "tool/area_selection.hpp"

using namespace stopgraph;

namespace {

tool::AreaSelection prompt(const std::string& answers) {
    std::istringstream in(answers);
    std::ostringstream out;
    return tool::promptArea(in, out);
}

void expectDefaultArea(const tool::AreaSelection& selection) {
    EXPECT_TRUE(selection.used_fallback);
    EXPECT_FALSE(selection.show_all);
    EXPECT_FALSE(selection.is_custom);
    EXPECT_EQ(selection.area_name, "madrid");
    ASSERT_TRUE(selection.bounds.has_value());
    EXPECT_DOUBLE_EQ(selection.bounds->getMinLat(), 40.0);
    EXPECT_DOUBLE_EQ(selection.bounds->getMaxLon(), -3.0);
}

} // namespace

TEST(AreaSelectionTest, SelectsPresetByName) {
    tool::AreaSelection selection = tool::selectAreaByName("EXTREMADURA");

    EXPECT_EQ(selection.area_name, "extremadura");
    EXPECT_FALSE(selection.used_fallback);
    ASSERT_TRUE(selection.bounds.has_value());
    EXPECT_DOUBLE_EQ(selection.bounds->getMinLat(), 38.0);
    EXPECT_DOUBLE_EQ(selection.bounds->getMinLon(), -7.0);
}

TEST(AreaSelectionTest, AllShowsEveryPreset) {
    tool::AreaSelection selection = tool::selectAreaByName("all");
    EXPECT_TRUE(selection.show_all);
    EXPECT_FALSE(selection.bounds.has_value());
}

TEST(AreaSelectionTest, UnknownNameFallsBack) {
    expectDefaultArea(tool::selectAreaByName("atlantis"));
}

TEST(AreaSelectionTest, CustomArea) {
    tool::AreaSelection selection = tool::customArea("39.5", " 40.5 ", "-4", "-3.5");

    EXPECT_TRUE(selection.is_custom);
    EXPECT_FALSE(selection.used_fallback);
    EXPECT_EQ(selection.area_name, "personalizada");
    ASSERT_TRUE(selection.bounds.has_value());
    EXPECT_DOUBLE_EQ(selection.bounds->getMaxLat(), 40.5);
    EXPECT_DOUBLE_EQ(selection.bounds->getMinLon(), -4.0);
}

TEST(AreaSelectionTest, InvalidCustomBoundFallsBack) {
    expectDefaultArea(tool::customArea("39.5", "forty", "-4", "-3.5"));
    expectDefaultArea(tool::customArea("", "40.5", "-4", "-3.5"));
}

TEST(AreaSelectionTest, MenuPresetOptions) {
    EXPECT_EQ(prompt("1\n").area_name, "madrid");
    EXPECT_EQ(prompt(" 2 \n").area_name, "centro_espana");
    EXPECT_EQ(prompt("3\n").area_name, "extremadura");
    EXPECT_TRUE(prompt("5\n").show_all);
}

TEST(AreaSelectionTest, MenuCustomOption) {
    tool::AreaSelection selection = prompt("4\n39.5\n40.5\n-4\n-3.5\n");

    EXPECT_TRUE(selection.is_custom);
    ASSERT_TRUE(selection.bounds.has_value());
    EXPECT_DOUBLE_EQ(selection.bounds->getMinLat(), 39.5);
    EXPECT_DOUBLE_EQ(selection.bounds->getMaxLon(), -3.5);
}

TEST(AreaSelectionTest, MenuFallbacks) {
    expectDefaultArea(prompt("9\n"));
    expectDefaultArea(prompt("madrid\n"));
    expectDefaultArea(prompt(""));
    expectDefaultArea(prompt("4\n40\n41\nx\n-3\n"));
    expectDefaultArea(prompt("4\n40\n"));
}

TEST(AreaSelectionTest, YesNoPrompt) {
    std::ostringstream out;

    std::istringstream yes_es("s\n");
    EXPECT_TRUE(tool::promptYesNo(yes_es, out, "Show sample?"));

    std::istringstream yes_en("Yes\n");
    EXPECT_TRUE(tool::promptYesNo(yes_en, out, "Show sample?"));

    std::istringstream no("n\n");
    EXPECT_FALSE(tool::promptYesNo(no, out, "Show sample?"));

    std::istringstream empty("");
    EXPECT_FALSE(tool::promptYesNo(empty, out, "Show sample?"));

    EXPECT_NE(out.str().find("Show sample? (s/n): "), std::string::npos);
}
