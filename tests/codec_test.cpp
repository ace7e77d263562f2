// tests/codec_test.cpp
// Wire framing: encoding, block splitting, classification, partial input.

#include "amicall/codec.hpp"

#include <gtest/gtest.h>

#include <string>

namespace amicall {
namespace {

TEST(CodecTest, EncodesOneLinePerFieldAndBlankTerminator) {
  Message action = Message::action("Hangup");
  action.add("Channel", "SIP/1000");
  action.add("ActionID", "7");

  EXPECT_EQ(codec::encode(action),
            "Action: Hangup\r\nChannel: SIP/1000\r\nActionID: 7\r\n\r\n");
}

TEST(CodecTest, DecodesResponseAndEventInOneBuffer) {
  std::string wire =
      "Response: Success\r\nActionID: 3\r\nMessage: Originate successfully queued\r\n\r\n"
      "Event: Newchannel\r\nChannel: SIP/1000\r\nUniqueid: 123\r\n\r\n";

  auto result = codec::decode(wire);
  ASSERT_EQ(result.messages.size(), 2u);
  EXPECT_TRUE(result.remainder.empty());

  EXPECT_EQ(result.messages[0].kind(), MessageKind::Response);
  EXPECT_EQ(result.messages[0].get("ActionID"), "3");
  EXPECT_EQ(result.messages[0].get("Message"), "Originate successfully queued");

  EXPECT_EQ(result.messages[1].kind(), MessageKind::Event);
  EXPECT_EQ(result.messages[1].get("Uniqueid"), "123");
}

TEST(CodecTest, KeepsIncompleteBlockForNextRead) {
  auto first = codec::decode("Event: Hangup\r\nChannel: SIP/1000\r\nCau");
  EXPECT_TRUE(first.messages.empty());
  EXPECT_EQ(first.remainder, "Event: Hangup\r\nChannel: SIP/1000\r\nCau");

  auto second = codec::decode(first.remainder + "se: 16\r\n\r\nEvent: Dial\r\n");
  ASSERT_EQ(second.messages.size(), 1u);
  EXPECT_EQ(second.messages[0].get("Cause"), "16");
  EXPECT_EQ(second.remainder, "Event: Dial\r\n");
}

TEST(CodecTest, ByteAtATimeFeedYieldsSameMessages) {
  const std::string wire =
      "Event: Dial\r\nSubEvent: Begin\r\nChannel: SIP/1000\r\n\r\n"
      "Response: Error\r\nActionID: 9\r\nMessage: Permission denied\r\n\r\n";

  std::string buffer;
  std::vector<Message> got;
  for (char c : wire) {
    buffer.push_back(c);
    auto r = codec::decode(buffer);
    buffer = r.remainder;
    for (auto& m : r.messages) got.push_back(m);
  }
  ASSERT_EQ(got.size(), 2u);
  EXPECT_EQ(got[0].get("SubEvent"), "Begin");
  EXPECT_EQ(got[1].get("Message"), "Permission denied");
  EXPECT_TRUE(buffer.empty());
}

TEST(CodecTest, SkipsLinesWithoutSeparator) {
  auto r = codec::decode("Event: Hangup\r\ngarbage line\r\nChannel:SIP/1\r\nCause: 16\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].fields().size(), 2u);
  EXPECT_FALSE(r.messages[0].has("Channel"));
  EXPECT_EQ(r.messages[0].get("Cause"), "16");
}

TEST(CodecTest, SplitsOnFirstSeparatorOnly) {
  auto r = codec::decode("Response: Error\r\nMessage: Channel: SIP/1 not found\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].get("Message"), "Channel: SIP/1 not found");
}

TEST(CodecTest, DropsBlockWithoutEventOrResponse) {
  auto r = codec::decode("Foo: bar\r\nBaz: qux\r\n\r\nEvent: Hangup\r\nChannel: SIP/1\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].get("Event"), "Hangup");
  EXPECT_EQ(r.discarded, 1u);
}

TEST(CodecTest, CountsEachDroppedBlock) {
  auto r = codec::decode("Foo: bar\r\n\r\nResponse: Success\r\n\r\nnonsense\r\n\r\nFoo: ba");
  EXPECT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.discarded, 2u);
  EXPECT_EQ(r.remainder, "Foo: ba");

  EXPECT_EQ(codec::decode("Event: Hangup\r\n\r\n").discarded, 0u);
}

TEST(CodecTest, EventFieldWinsOverResponseField) {
  // OriginateResponse is an event that also carries a Response field.
  auto r = codec::decode(
      "Event: OriginateResponse\r\nResponse: Failure\r\nChannel: SIP/1000\r\nReason: 0\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].kind(), MessageKind::Event);
}

TEST(CodecTest, IgnoresStrayBlankLinesBetweenBlocks) {
  auto r = codec::decode("\r\n\r\nEvent: Hangup\r\nChannel: SIP/1\r\n\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.remainder, "\r\n");
}

TEST(CodecTest, FieldNamesAreCaseSensitive) {
  auto r = codec::decode("Event: Newchannel\r\nUniqueID: 1\r\nUniqueid: 2\r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].get("Uniqueid"), "2");
  EXPECT_EQ(r.messages[0].get("UniqueID"), "1");
  EXPECT_EQ(r.messages[0].get("uniqueid"), "");
}

TEST(CodecTest, EmptyValueIsKept) {
  auto r = codec::decode("Event: Hangup\r\nCause-txt: \r\n\r\n");
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_TRUE(r.messages[0].has("Cause-txt"));
  EXPECT_EQ(r.messages[0].get("Cause-txt"), "");
}

TEST(CodecTest, DecodeOfEncodedActionRecoversFields) {
  Message action = Message::action("Originate");
  action.add("Channel", "PJSIP/+15551234");
  action.add("Context", "outbound");
  action.add("Exten", "s");
  action.add("Priority", "1");
  action.add("Variable", "CALL_ID=call_1_2");
  action.add("CallerID", "AI Agent <1000>");
  action.add("ActionID", "42");

  auto r = codec::decode(codec::encode(action));
  ASSERT_EQ(r.messages.size(), 1u);
  EXPECT_EQ(r.messages[0].kind(), MessageKind::Action);
  EXPECT_EQ(r.messages[0].fields(), action.fields());
  EXPECT_TRUE(r.remainder.empty());
}

TEST(CodecTest, RepeatedKeysSurviveInOrder) {
  Message action = Message::action("Originate");
  action.add("Variable", "A=1");
  action.add("Variable", "B=2");

  auto r = codec::decode(codec::encode(action));
  ASSERT_EQ(r.messages.size(), 1u);
  ASSERT_EQ(r.messages[0].fields().size(), 3u);
  EXPECT_EQ(r.messages[0].fields()[2].second, "B=2");
  EXPECT_EQ(r.messages[0].get("Variable"), "A=1");
}

}  // namespace
}  // namespace amicall
