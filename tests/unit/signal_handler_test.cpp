#include "runtime/signal_handler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <csignal>

using namespace waypoint::runtime;

namespace {
std::atomic<int> foreign_handler_calls{0};
void foreign_handler(int) { foreign_handler_calls.fetch_add(1); }
}  // namespace

class SignalHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        SignalHandler::reset();
        SignalHandler::install();
    }

    void TearDown() override {
        SignalHandler::restore();
        SignalHandler::reset();
    }
};

TEST_F(SignalHandlerTest, NotRequestedInitially) {
    EXPECT_TRUE(SignalHandler::is_installed());
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());
}

TEST_F(SignalHandlerTest, SigtermRequestsShutdown) {
    std::raise(SIGTERM);
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
}

TEST_F(SignalHandlerTest, SigintRequestsShutdown) {
    std::raise(SIGINT);
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
}

TEST_F(SignalHandlerTest, RequestShutdownWithoutSignal) {
    SignalHandler::request_shutdown();
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
}

TEST_F(SignalHandlerTest, ResetClearsFlag) {
    std::raise(SIGTERM);
    ASSERT_TRUE(SignalHandler::is_shutdown_requested());

    SignalHandler::reset();
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());
}

TEST(SignalHandlerRestoreTest, RestorePutsBackPreviousHandler) {
    SignalHandler::reset();
    foreign_handler_calls.store(0);
    std::signal(SIGTERM, foreign_handler);

    SignalHandler::install();
    std::raise(SIGTERM);
    EXPECT_TRUE(SignalHandler::is_shutdown_requested());
    EXPECT_EQ(foreign_handler_calls.load(), 0);

    SignalHandler::restore();
    EXPECT_FALSE(SignalHandler::is_installed());
    SignalHandler::reset();

    std::raise(SIGTERM);
    EXPECT_EQ(foreign_handler_calls.load(), 1);
    EXPECT_FALSE(SignalHandler::is_shutdown_requested());

    std::signal(SIGTERM, SIG_DFL);
}

TEST(SignalHandlerRestoreTest, InstallTwiceKeepsOriginalHandler) {
    SignalHandler::reset();
    foreign_handler_calls.store(0);
    std::signal(SIGINT, foreign_handler);

    SignalHandler::install();
    SignalHandler::install();
    SignalHandler::restore();
    SignalHandler::reset();

    std::raise(SIGINT);
    EXPECT_EQ(foreign_handler_calls.load(), 1);

    std::signal(SIGINT, SIG_DFL);
}
