#include "common/FileLoadingHelper.h"
#include "common/StateNameHelper.h"
#include <gtest/gtest.h>

using namespace FCE;

TEST(StateNameHelperTest, EmptyNameIsInvalid) {
    EXPECT_FALSE(StateNameHelper::isValidStateName(""));
    EXPECT_TRUE(StateNameHelper::isValidStateName("done"));
    EXPECT_TRUE(StateNameHelper::isValidStateName("with space"));
}

TEST(StateNameHelperTest, SymbolsAreUpperCaseIdentifiers) {
    EXPECT_EQ(StateNameHelper::toSymbol("in_progress"), "IN_PROGRESS");
    EXPECT_EQ(StateNameHelper::toSymbol("awaiting-review"), "AWAITING_REVIEW");
    EXPECT_EQ(StateNameHelper::toSymbol("step 2"), "STEP_2");
    EXPECT_EQ(StateNameHelper::toSymbol("DONE"), "DONE");
}

TEST(FileLoadingHelperTest, NormalizePathStripsFileScheme) {
    EXPECT_EQ(FileLoadingHelper::normalizePath("file:///tmp/flow.json"), "/tmp/flow.json");
    EXPECT_EQ(FileLoadingHelper::normalizePath("file:flow.json"), "flow.json");
    EXPECT_EQ(FileLoadingHelper::normalizePath("flow.json"), "flow.json");
}
