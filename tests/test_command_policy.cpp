#include <gtest/gtest.h>

#include "command_policy.hpp"

using namespace mvs;

static CommandRequest request(const char* command) {
  CommandRequest r;
  r.installation = "1001";
  r.command = command;
  return r;
}

TEST(CommandPolicy, DirectAlwaysPermits) {
  DirectExecutePolicy p;
  EXPECT_TRUE(p.permit(request("arm_away")));
  EXPECT_TRUE(p.permit(request("disarm")));
  EXPECT_STREQ(p.name(), "direct");
}

TEST(CommandPolicy, ApproveAsksEveryTime) {
  int asked = 0;
  ConditionalApprovePolicy p([&](const CommandRequest& r){
    asked++;
    return r.command != "disarm";
  });
  EXPECT_TRUE(p.permit(request("arm_home")));
  EXPECT_FALSE(p.permit(request("disarm")));
  EXPECT_EQ(asked, 2);
}

TEST(CommandPolicy, ApproveWithoutApproverRefuses) {
  ConditionalApprovePolicy p{CommandDecision{}};
  EXPECT_FALSE(p.permit(request("arm_away")));
}

TEST(CommandPolicy, AutonomousBudget) {
  AutonomousLoopPolicy p([](const CommandRequest&){ return true; }, 2);
  EXPECT_TRUE(p.permit(request("arm_night")));
  EXPECT_TRUE(p.permit(request("disarm")));
  EXPECT_FALSE(p.permit(request("arm_away")));
  EXPECT_EQ(p.actions_taken(), 2);
}

TEST(CommandPolicy, AutonomousDeclinedDoesNotSpendBudget) {
  bool yes = false;
  AutonomousLoopPolicy p([&](const CommandRequest&){ return yes; }, 1);
  EXPECT_FALSE(p.permit(request("arm_away")));
  EXPECT_EQ(p.actions_taken(), 0);
  yes = true;
  EXPECT_TRUE(p.permit(request("arm_away")));
  EXPECT_FALSE(p.permit(request("arm_away")));
}

TEST(CommandPolicy, MakeByName) {
  EXPECT_STREQ(make_policy("")->name(), "direct");
  EXPECT_STREQ(make_policy("direct")->name(), "direct");
  EXPECT_STREQ(make_policy("approve")->name(), "approve");
  EXPECT_STREQ(make_policy("autonomous", [](const CommandRequest&){ return true; }, 3)->name(), "autonomous");
  EXPECT_THROW(make_policy("yolo"), std::runtime_error);
}
