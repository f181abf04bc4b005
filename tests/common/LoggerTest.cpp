#include "common/Logger.h"
#include "model/MachineDefinitionBuilder.h"
#include "mocks/MockLoggerBackend.h"
#include "runtime/FiniteStateMachine.h"
#include <gtest/gtest.h>

using namespace FCE;
using FCE::Test::MockLoggerBackend;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        records_ = std::make_shared<std::vector<MockLoggerBackend::Record>>();
        Logger::setBackend(std::make_unique<MockLoggerBackend>(records_));
    }

    void TearDown() override {
        // Next use recreates the default spdlog backend
        Logger::setBackend(nullptr);
    }

    MockLoggerBackend::RecordBuffer records_;
};

TEST_F(LoggerTest, MacrosReachInjectedBackend) {
    LOG_INFO("Loaded {} states", 4);
    LOG_WARN("Unknown state '{}'", "archived");

    EXPECT_TRUE(MockLoggerBackend::contains(records_, LogLevel::Info, "Loaded 4 states"));
    EXPECT_TRUE(MockLoggerBackend::contains(records_, LogLevel::Warn, "Unknown state 'archived'"));
    EXPECT_EQ(MockLoggerBackend::count(records_, LogLevel::Error), 0);
}

TEST_F(LoggerTest, MessagesArePrefixedWithFunctionName) {
    LOG_DEBUG("prefixed");

    ASSERT_FALSE(records_->empty());
    const auto &message = records_->back().message;
    EXPECT_NE(message.find("() - prefixed"), std::string::npos) << message;
}

TEST_F(LoggerTest, LevelFiltersMessages) {
    Logger::setLevel(LogLevel::Warn);

    LOG_DEBUG("hidden");
    LOG_INFO("hidden");
    LOG_ERROR("shown");

    EXPECT_EQ(MockLoggerBackend::count(records_, LogLevel::Debug), 0);
    EXPECT_EQ(MockLoggerBackend::count(records_, LogLevel::Info), 0);
    EXPECT_EQ(MockLoggerBackend::count(records_, LogLevel::Error), 1);
}

TEST_F(LoggerTest, RejectedTransitionIsLoggedAsWarning) {
    MachineDefinitionBuilder builder;
    builder.withTransitions("start", {"end"}).withTerminalState("end").withDefaultState("start");
    FiniteStateMachine fsm(builder.build(), "end");

    EXPECT_FALSE(fsm.transitionTo("start"));
    EXPECT_FALSE(fsm.transitionTo("nope"));

    EXPECT_TRUE(MockLoggerBackend::contains(records_, LogLevel::Warn, "start"));
    EXPECT_TRUE(MockLoggerBackend::contains(records_, LogLevel::Warn, "nope"));
    EXPECT_EQ(MockLoggerBackend::count(records_, LogLevel::Warn), 2);
}
