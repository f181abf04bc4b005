#include "runtime/HandlerRegistry.h"
#include "common/FSMErrors.h"
#include "model/MachineDefinitionBuilder.h"
#include "runtime/FiniteStateMachine.h"
#include <gtest/gtest.h>
#include <vector>

using namespace FCE;

class HandlerRegistryTest : public ::testing::Test {
protected:
    TransitionHandler recordingHandler(const std::string &name) {
        return [this, name](FiniteStateMachine &, const std::string &target) { calls_.push_back(name + ":" + target); };
    }

    std::vector<std::string> calls_;
};

TEST_F(HandlerRegistryTest, EmptyRegistryResolvesNothing) {
    HandlerRegistry registry;

    HandlerSet set = registry.resolve("anything");
    EXPECT_TRUE(set.empty());
    EXPECT_EQ(set.wildcard, nullptr);
    EXPECT_EQ(set.specific, nullptr);
    EXPECT_FALSE(registry.hasWildcardHandler());
    EXPECT_TRUE(registry.getHandledStates().empty());
}

TEST_F(HandlerRegistryTest, WildcardResolvesForEveryState) {
    HandlerRegistry registry;
    registry.setWildcardHandler(recordingHandler("any"));

    for (const std::string state : {"created", "waiting", "done", "not-even-declared"}) {
        HandlerSet set = registry.resolve(state);
        EXPECT_NE(set.wildcard, nullptr) << state;
        EXPECT_EQ(set.specific, nullptr) << state;
    }
}

TEST_F(HandlerRegistryTest, SpecificResolvesOnlyForItsState) {
    HandlerRegistry registry;
    registry.setStateHandler("in_progress", recordingHandler("in_progress"));

    EXPECT_NE(registry.resolve("in_progress").specific, nullptr);
    EXPECT_EQ(registry.resolve("in_progress").wildcard, nullptr);
    EXPECT_EQ(registry.resolve("waiting").specific, nullptr);
    EXPECT_TRUE(registry.hasStateHandler("in_progress"));
    EXPECT_FALSE(registry.hasStateHandler("waiting"));
}

TEST_F(HandlerRegistryTest, RegisteringAgainReplacesHandler) {
    HandlerRegistry registry;
    registry.setStateHandler("done", recordingHandler("first"));
    registry.setStateHandler("done", recordingHandler("second"));
    registry.setWildcardHandler(recordingHandler("any-first"));
    registry.setWildcardHandler(recordingHandler("any-second"));

    HandlerSet set = registry.resolve("done");
    ASSERT_NE(set.wildcard, nullptr);
    ASSERT_NE(set.specific, nullptr);

    MachineDefinitionBuilder builder;
    builder.withTransitions("start", {"done"}).withTerminalState("done").withDefaultState("start");
    FiniteStateMachine machine(builder.build());
    (*set.wildcard)(machine, "done");
    (*set.specific)(machine, "done");

    std::vector<std::string> expected = {"any-second:done", "second:done"};
    EXPECT_EQ(calls_, expected);
    EXPECT_EQ(registry.getHandledStates().size(), 1u);
}

TEST_F(HandlerRegistryTest, HandledStatesAreSorted) {
    HandlerRegistry registry;
    registry.setStateHandler("waiting", recordingHandler("w"));
    registry.setStateHandler("done", recordingHandler("d"));
    registry.setStateHandler("in_progress", recordingHandler("i"));

    std::vector<std::string> expected = {"done", "in_progress", "waiting"};
    EXPECT_EQ(registry.getHandledStates(), expected);
}

TEST_F(HandlerRegistryTest, NonCallableHandlersAreRejected) {
    HandlerRegistry registry;

    EXPECT_THROW(registry.setWildcardHandler(nullptr), InvalidHandlerError);
    EXPECT_THROW(registry.setStateHandler("done", nullptr), InvalidHandlerError);
    EXPECT_THROW(registry.setStateHandler("", recordingHandler("x")), InvalidHandlerError);

    EXPECT_FALSE(registry.hasWildcardHandler());
    EXPECT_FALSE(registry.hasStateHandler("done"));
}
