#include <gtest/gtest.h>
#include "plugin_template.hpp"

TEST(PluginTemplate, CarriesNameAndDescription) {
    auto src = plugin_template("Spread", "Mean absolute spread");
    EXPECT_NE(src.find("-- Plugin: Spread"), std::string::npos);
    EXPECT_NE(src.find("-- Description: Mean absolute spread"), std::string::npos);
    EXPECT_NE(src.find("function calculate(series1, series2)"), std::string::npos);
    EXPECT_NE(src.find("Implement the calculate function"), std::string::npos);
}

TEST(PluginTemplate, DefaultDescription) {
    auto src = plugin_template();
    EXPECT_NE(src.find("-- Plugin: Custom Metric"), std::string::npos);
    EXPECT_NE(src.find("A custom metric plugin"), std::string::npos);
}
