#include <gtest/gtest.h>

#include "fxp/foundation/string_utils.hpp"

using namespace fxp::foundation;

TEST(StringUtilsTest, TrimCopy) {
    EXPECT_EQ(trimCopy("  KILL\t\n"), "KILL");
    EXPECT_EQ(trimCopy("   "), "");
    EXPECT_EQ(trimCopy(""), "");
    EXPECT_EQ(trimCopy("looted dogtag"), "looted dogtag");
}

TEST(StringUtilsTest, ToUpperCopyLeavesNonLettersAlone) {
    EXPECT_EQ(toUpperCopy("Dogtag"), "DOGTAG");
    EXPECT_EQ(toUpperCopy("hs_2x"), "HS_2X");
}
