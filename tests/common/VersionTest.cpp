#include "Version.h"
#include <gtest/gtest.h>

TEST(VersionTest, ShortAndFullVersion) {
    EXPECT_EQ(FCE::getVersion(), "1.0.0");
    EXPECT_EQ(FCE::getVersion(true), "1.0.0-alpha");
}
