#include <gtest/gtest.h>

#include "talk_state_machine.h"

#include <utility>
#include <vector>

TEST(TalkStateMachineTest, StartsIdle) {
  TalkStateMachine sm;
  EXPECT_EQ(sm.getState(), kTalkStateIdle);
}

TEST(TalkStateMachineTest, FullTurnPath) {
  TalkStateMachine sm;
  EXPECT_TRUE(sm.transitionTo(kTalkStateAwaiting));
  EXPECT_TRUE(sm.transitionTo(kTalkStateRecording));
  EXPECT_TRUE(sm.transitionTo(kTalkStateFinalizing));
  EXPECT_TRUE(sm.transitionTo(kTalkStateIdle));
}

TEST(TalkStateMachineTest, RejectsInvalidTransitions) {
  TalkStateMachine sm;
  EXPECT_FALSE(sm.transitionTo(kTalkStateFinalizing));
  EXPECT_EQ(sm.getState(), kTalkStateIdle);

  ASSERT_TRUE(sm.transitionTo(kTalkStateRecording));
  ASSERT_TRUE(sm.transitionTo(kTalkStateFinalizing));
  EXPECT_FALSE(sm.canTransitionTo(kTalkStateRecording));
  EXPECT_FALSE(sm.transitionTo(kTalkStateAwaiting));
  EXPECT_EQ(sm.getState(), kTalkStateFinalizing);
}

TEST(TalkStateMachineTest, EveryStateCanReturnToIdle) {
  for (TalkState s : {kTalkStateAwaiting, kTalkStateRecording}) {
    TalkStateMachine sm;
    ASSERT_TRUE(sm.transitionTo(s));
    EXPECT_TRUE(sm.canTransitionTo(kTalkStateIdle)) << GetTalkStateName(s);
  }
}

TEST(TalkStateMachineTest, ListenersSeeTransitions) {
  TalkStateMachine sm;
  std::vector<std::pair<TalkState, TalkState>> seen;
  int id = sm.addStateChangeListener(
      [&seen](TalkState from, TalkState to) { seen.emplace_back(from, to); });

  sm.transitionTo(kTalkStateRecording);
  sm.transitionTo(kTalkStateRecording); // 相同状态不通知
  sm.removeStateChangeListener(id);
  sm.transitionTo(kTalkStateIdle);

  ASSERT_EQ(seen.size(), 1u);
  EXPECT_EQ(seen[0].first, kTalkStateIdle);
  EXPECT_EQ(seen[0].second, kTalkStateRecording);
}

TEST(TalkStateMachineTest, ResetNotifies) {
  TalkStateMachine sm;
  int calls = 0;
  sm.addStateChangeListener([&calls](TalkState, TalkState) { calls++; });
  sm.transitionTo(kTalkStateAwaiting);
  sm.reset();
  EXPECT_EQ(sm.getState(), kTalkStateIdle);
  EXPECT_EQ(calls, 2);
}
