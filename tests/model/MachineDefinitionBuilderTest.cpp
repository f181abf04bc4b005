#include "model/MachineDefinitionBuilder.h"
#include "common/FSMErrors.h"
#include "common/StateNameHelper.h"
#include "runtime/FiniteStateMachine.h"
#include <gtest/gtest.h>

using namespace FCE;

class MachineDefinitionBuilderTest : public ::testing::Test {
protected:
    MachineDefinitionBuilder createPublishingBuilder() {
        MachineDefinitionBuilder builder;
        builder.withTransitions("draft", {"awaiting_review"})
            .withTransitions("awaiting_review", {"reviewed", "draft"})
            .withTransitions("reviewed", {"published", "rejected"})
            .withTerminalState("published")
            .withTerminalState("rejected")
            .withDefaultState("draft");
        return builder;
    }

    static void noop(FiniteStateMachine &, const std::string &) {}
};

TEST_F(MachineDefinitionBuilderTest, BuildsImmutableDefinition) {
    auto definition = createPublishingBuilder().build();

    ASSERT_NE(definition, nullptr);
    EXPECT_EQ(definition->getDefaultState(), "draft");
    EXPECT_EQ(definition->getTable().size(), 5u);
    EXPECT_TRUE(definition->getTable().isAllowed("reviewed", "published"));
    EXPECT_FALSE(definition->getTable().isAllowed("reviewed", "awaiting_review"));
    EXPECT_FALSE(definition->getHandlers().hasWildcardHandler());
}

TEST_F(MachineDefinitionBuilderTest, NoStatesIsRejected) {
    EXPECT_THROW(MachineDefinitionBuilder().withDefaultState("start").build(), NoStatesDefinedError);
}

TEST_F(MachineDefinitionBuilderTest, MissingDefaultIsRejected) {
    MachineDefinitionBuilder builder;
    builder.withTransitions("start", {"end"}).withTerminalState("end");

    EXPECT_THROW(builder.build(), InvalidDefaultError);
}

TEST_F(MachineDefinitionBuilderTest, UnknownDefaultIsRejected) {
    auto builder = createPublishingBuilder();
    builder.withDefaultState("archived");

    try {
        builder.build();
        FAIL() << "Expected InvalidDefaultError";
    } catch (const InvalidDefaultError &e) {
        EXPECT_EQ(e.getCode(), ErrorCode::InvalidDefault);
        EXPECT_NE(std::string(e.what()).find("archived"), std::string::npos);
    }
}

TEST_F(MachineDefinitionBuilderTest, StateDeclaredTwiceIsRejected) {
    auto builder = createPublishingBuilder();
    builder.withTransitions("draft", {"published"});

    EXPECT_THROW(builder.build(), MalformedDefinitionError);
}

TEST_F(MachineDefinitionBuilderTest, ImplicitTerminalDestinationIsRejected) {
    MachineDefinitionBuilder builder;
    builder.withTransitions("start", {"end"}).withDefaultState("start");

    EXPECT_THROW(builder.build(), MalformedDefinitionError) << "Destinations must be declared, even terminal ones";
}

TEST_F(MachineDefinitionBuilderTest, HandlerForUnknownStateIsRejected) {
    auto builder = createPublishingBuilder();
    builder.onTransitionTo("archived", &MachineDefinitionBuilderTest::noop);

    try {
        builder.build();
        FAIL() << "Expected InvalidStateError";
    } catch (const InvalidStateError &e) {
        EXPECT_EQ(e.getState(), "archived");
    }
}

TEST_F(MachineDefinitionBuilderTest, EmptyHandlerIsRejected) {
    auto builder = createPublishingBuilder();

    EXPECT_THROW(builder.onAnyTransition(TransitionHandler{}), InvalidHandlerError);
    EXPECT_THROW(builder.onTransitionTo("published", TransitionHandler{}), InvalidHandlerError);
}

TEST_F(MachineDefinitionBuilderTest, HandlersAreCarriedIntoDefinition) {
    auto definition = createPublishingBuilder()
                          .onAnyTransition(&MachineDefinitionBuilderTest::noop)
                          .onTransitionTo("published", &MachineDefinitionBuilderTest::noop)
                          .build();

    EXPECT_TRUE(definition->getHandlers().hasWildcardHandler());
    EXPECT_TRUE(definition->getHandlers().hasStateHandler("published"));
    EXPECT_FALSE(definition->getHandlers().hasStateHandler("rejected"));
}

TEST_F(MachineDefinitionBuilderTest, BuilderCanBeReusedForSeveralDefinitions) {
    auto builder = createPublishingBuilder();

    auto first = builder.build();
    auto second = builder.build();

    EXPECT_NE(first.get(), second.get());
    EXPECT_EQ(first->getTable().getAllStates(), second->getTable().getAllStates());
}

TEST_F(MachineDefinitionBuilderTest, SymbolsResolveToStateNames) {
    MachineDefinitionBuilder builder;
    builder.withTransitions("in_progress", {"awaiting-review"})
        .withTransitions("awaiting-review", {"in_progress", "done"})
        .withTerminalState("done")
        .withDefaultState("in_progress");
    auto definition = builder.build();

    EXPECT_EQ(definition->getStateForSymbol("IN_PROGRESS"), std::optional<std::string>("in_progress"));
    EXPECT_EQ(definition->getStateForSymbol("AWAITING_REVIEW"), std::optional<std::string>("awaiting-review"));
    EXPECT_EQ(definition->getStateForSymbol("DONE"), std::optional<std::string>("done"));
    EXPECT_FALSE(definition->getStateForSymbol("done").has_value()) << "Symbols are upper case";
    EXPECT_EQ(definition->getSymbols().size(), 3u);
}

TEST_F(MachineDefinitionBuilderTest, CollidingSymbolsStillBuildAndTransition) {
    MachineDefinitionBuilder builder;
    builder.withTransitions("draft", {"Draft"})
        .withTerminalState("Draft")
        .withTransitions("in-progress", {"in_progress"})
        .withTerminalState("in_progress")
        .withTransitions("审核", {"发布"})
        .withTerminalState("发布")
        .withTransitions("start", {"draft", "in-progress", "审核"})
        .withDefaultState("start");

    std::shared_ptr<const MachineDefinition> definition;
    ASSERT_NO_THROW(definition = builder.build());
    EXPECT_EQ(definition->getTable().size(), 7u);

    EXPECT_TRUE(definition->isAmbiguousSymbol("DRAFT"));
    EXPECT_TRUE(definition->isAmbiguousSymbol("IN_PROGRESS"));
    EXPECT_TRUE(definition->isAmbiguousSymbol(StateNameHelper::toSymbol("审核")));
    EXPECT_FALSE(definition->getStateForSymbol("DRAFT").has_value());
    EXPECT_FALSE(definition->getStateForSymbol("IN_PROGRESS").has_value());
    EXPECT_EQ(definition->getStateForSymbol("START"), std::optional<std::string>("start"));
    EXPECT_FALSE(definition->isAmbiguousSymbol("START"));
    EXPECT_EQ(definition->getSymbols().size(), 1u);

    FiniteStateMachine drafting(definition);
    ASSERT_TRUE(drafting.transitionTo("draft"));
    ASSERT_TRUE(drafting.transitionTo("Draft"));
    EXPECT_TRUE(drafting.isTerminal());

    FiniteStateMachine working(definition, "in-progress");
    EXPECT_TRUE(working.transitionTo("in_progress"));

    FiniteStateMachine reviewing(definition, "审核");
    EXPECT_TRUE(reviewing.transitionTo("发布"));
    EXPECT_EQ(reviewing.getCurrentState(), "发布");
}
