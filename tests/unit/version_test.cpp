#include <gtest/gtest.h>

#include <string>

#include "fxp/version.hpp"

TEST(VersionTest, MajorMinorPatch) {
    EXPECT_EQ(fxp::Version::major, 0);
    EXPECT_EQ(fxp::Version::minor, 1);
    EXPECT_EQ(fxp::Version::patch, 0);
}

TEST(VersionTest, VersionStringMatchesComponents) {
    EXPECT_STREQ(fxp::Version::string, "0.1.0");
    auto composed = std::to_string(FXP_VERSION_MAJOR) + "." + std::to_string(FXP_VERSION_MINOR) +
                    "." + std::to_string(FXP_VERSION_PATCH);
    EXPECT_EQ(composed, fxp::Version::string);
}
