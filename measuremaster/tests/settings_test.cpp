#include "controller/settings.hpp"

#include <gtest/gtest.h>

using controller::AppSettings;

TEST(AppSettingsTest, Defaults) {
    auto& s = AppSettings::instance();
    EXPECT_EQ(s.defaultUnits(), "mm");
    EXPECT_DOUBLE_EQ(s.defaultLength(), 100.0);
    EXPECT_EQ(s.jpegQuality(), 95);
    EXPECT_TRUE(s.autoPaste());
    EXPECT_TRUE(s.guideHorizontal());
    EXPECT_TRUE(s.guideDiagonal135());
    EXPECT_EQ(s.logLevel(), "info");
    EXPECT_TRUE(s.logFile().isEmpty());
}

TEST(AppSettingsTest, SetterChainsAndPersists) {
    auto& s = AppSettings::instance();
    const QString units = s.defaultUnits();
    const double length = s.defaultLength();

    s.setDefaultUnits("in").setDefaultLength(2.5);
    s.sync();
    EXPECT_EQ(s.defaultUnits(), "in");
    EXPECT_DOUBLE_EQ(s.defaultLength(), 2.5);

    s.setDefaultUnits(units).setDefaultLength(length);
    s.sync();
    EXPECT_EQ(s.defaultUnits(), units);
}
