// tests/event_dispatcher_test.cpp

#include "amicall/event_dispatcher.hpp"

#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace amicall {
namespace {

using test::make_event;

class EventDispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    CallRecord r;
    r.call_id = "call_1";
    r.channel = "SIP/1000";
    r.start_time = WallClock::now();
    tracker_.reserve(r);
    tracker_.commit("call_1");
  }

  CallTracker tracker_;
  CallbackRegistry callbacks_;
  EventDispatcher dispatcher_{tracker_, callbacks_};
};

TEST_F(EventDispatcherTest, HandlersRunInRegistrationOrder) {
  std::vector<int> order;
  callbacks_.add("Hangup", [&](const Message&) { order.push_back(1); });
  callbacks_.add("Hangup", [&](const Message&) { order.push_back(2); });
  callbacks_.add("Newchannel", [&](const Message&) { order.push_back(99); });

  dispatcher_.handle(make_event({{"Event", "Hangup"}, {"Channel", "SIP/9"}}));
  EXPECT_EQ(order, (std::vector<int>{1, 2}));
}

TEST_F(EventDispatcherTest, ThrowingHandlerDoesNotStopOthers) {
  int calls = 0;
  callbacks_.add("Hangup", [](const Message&) { throw std::runtime_error("boom"); });
  callbacks_.add("Hangup", [&](const Message&) { calls++; });
  callbacks_.add(lifecycle::kCallEnded, [&](const Message&) { calls++; });

  dispatcher_.handle(make_event({{"Event", "Hangup"}, {"Channel", "SIP/1000"}, {"Cause", "16"}}));
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(tracker_.find("call_1")->status, CallStatus::Ended);
}

TEST_F(EventDispatcherTest, TrackerIsUpdatedBeforeCallbacksRun) {
  CallStatus seen = CallStatus::Originating;
  callbacks_.add("Bridge", [&](const Message&) { seen = tracker_.find("call_1")->status; });

  dispatcher_.handle(make_event({{"Event", "Bridge"}, {"Channel1", "SIP/1000"},
                                 {"Channel2", "SIP/2000"}}));
  EXPECT_EQ(seen, CallStatus::Connected);
}

TEST_F(EventDispatcherTest, LifecycleFiresOncePerTransition) {
  int answered = 0;
  int ended = 0;
  callbacks_.add(lifecycle::kCallAnswered, [&](const Message& ev) {
    EXPECT_EQ(ev.get("SubEvent"), "Answer");
    answered++;
  });
  callbacks_.add(lifecycle::kCallEnded, [&](const Message&) { ended++; });

  auto answer = make_event({{"Event", "Dial"}, {"Channel", "SIP/1000"}, {"SubEvent", "Answer"}});
  dispatcher_.handle(answer);
  dispatcher_.handle(answer);
  auto hangup = make_event({{"Event", "Hangup"}, {"Channel", "SIP/1000"}, {"Cause", "16"}});
  dispatcher_.handle(hangup);
  dispatcher_.handle(hangup);

  EXPECT_EQ(answered, 1);
  EXPECT_EQ(ended, 1);
}

TEST_F(EventDispatcherTest, UntrackedCallsRaiseNoLifecycleEvents) {
  int raw = 0;
  int ended = 0;
  callbacks_.add("Hangup", [&](const Message&) { raw++; });
  callbacks_.add(lifecycle::kCallEnded, [&](const Message&) { ended++; });

  dispatcher_.handle(make_event({{"Event", "Hangup"}, {"Channel", "SIP/7777"}}));
  EXPECT_EQ(raw, 1);
  EXPECT_EQ(ended, 0);
}

TEST_F(EventDispatcherTest, OriginateFailureRaisesCallFailed) {
  std::string reason;
  callbacks_.add(lifecycle::kCallFailed, [&](const Message& ev) { reason = ev.get("Reason"); });

  dispatcher_.handle(make_event({{"Event", "OriginateResponse"}, {"Response", "Failure"},
                                 {"Channel", "SIP/1000"}, {"Reason", "0"}}));
  EXPECT_EQ(reason, "0");
}

TEST_F(EventDispatcherTest, HandlerMayRegisterCallbacks) {
  int late = 0;
  callbacks_.add("Newchannel", [&](const Message&) {
    callbacks_.add("Newchannel", [&](const Message&) { late++; });
  });

  dispatcher_.handle(make_event({{"Event", "Newchannel"}, {"Channel", "SIP/5"}}));
  EXPECT_EQ(late, 0);
  EXPECT_EQ(callbacks_.count("Newchannel"), 2u);

  dispatcher_.handle(make_event({{"Event", "Newchannel"}, {"Channel", "SIP/5"}}));
  EXPECT_EQ(late, 1);
}

TEST(CallbackRegistryTest, ReplaceDropsEarlierHandlers) {
  CallbackRegistry reg;
  reg.add("call_ended", [](const Message&) {});
  reg.add("call_ended", [](const Message&) {});
  reg.replace("call_ended", [](const Message&) {});
  EXPECT_EQ(reg.count("call_ended"), 1u);

  reg.remove("call_ended");
  EXPECT_EQ(reg.count("call_ended"), 0u);
  EXPECT_TRUE(reg.handlers("call_ended").empty());
}

TEST(LifecycleTest, NamesMapToStatuses) {
  EXPECT_STREQ(lifecycle::name_for(CallStatus::Connected), lifecycle::kCallConnected);
  EXPECT_TRUE(lifecycle::name_for(CallStatus::Ringing) == nullptr);
  EXPECT_TRUE(lifecycle::is_lifecycle_name("call_failed"));
  EXPECT_FALSE(lifecycle::is_lifecycle_name("Hangup"));
}

}  // namespace
}  // namespace amicall
