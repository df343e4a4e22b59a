#include "vermouth/signal-handler.hpp"

#include <gtest/gtest.h>

#include <csignal>

namespace vermouth {

class SignalHandlerTest : public ::testing::Test {
 protected:
  void SetUp() override { SignalHandler::ResetStopRequest(); }

  void TearDown() override {
    SignalHandler::Disable();
    SignalHandler::ResetStopRequest();
  }
};

TEST_F(SignalHandlerTest, NoStopRequestedInitially) { EXPECT_FALSE(SignalHandler::IsStopRequested()); }

TEST_F(SignalHandlerTest, SigtermRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGTERM), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
}

TEST_F(SignalHandlerTest, SigintRequestsStop) {
  SignalHandler::Enable();
  ASSERT_EQ(std::raise(SIGINT), 0);
  EXPECT_TRUE(SignalHandler::IsStopRequested());
}

}  // namespace vermouth
