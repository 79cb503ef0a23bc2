#include <format>
#include <gtest/gtest.h>
#include <interface/wire/wire_message.h>
#include <string>
#include <vector>

using namespace ldb;

TEST(EmmyCodec, EncodesIdLineThenJsonBody)
{
  EmmyCodec codec{};
  auto message = WireMessage::Make(WireCommand::Ready);
  const auto bytes = codec.Encode(message);
  ASSERT_TRUE(bytes.starts_with("3\n"));
  ASSERT_TRUE(bytes.ends_with("\n"));
  const auto body = Dict::parse(bytes.substr(2, bytes.size() - 3));
  EXPECT_EQ(body["cmd"], 3);
}

TEST(EmmyCodec, RunControlIsAnActionRequest)
{
  EmmyCodec codec{};
  const auto bytes = codec.Encode(WireMessage::Make(WireCommand::StepOut));
  ASSERT_TRUE(bytes.starts_with("9\n"));
  const auto body = Dict::parse(bytes.substr(2));
  EXPECT_EQ(body["action"], 4);

  auto decoded = codec.Decode(std::string_view{ bytes }.substr(0, bytes.size() - 1));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->mCommand, WireCommand::StepOut);
}

TEST(EmmyCodec, EvalRequestCarriesSequenceAsCorrelation)
{
  EmmyCodec codec{};
  auto message = WireMessage::Make(WireCommand::Eval, Dict{ { "expr", "x" } });
  message.mCorrelationId = "7";
  const auto bytes = codec.Encode(message);
  const auto body = Dict::parse(bytes.substr(bytes.find('\n') + 1));
  EXPECT_EQ(body["seq"], 7);
  EXPECT_EQ(body["cmd"], 11);

  auto reply = codec.Decode("12\n{\"cmd\":12,\"seq\":7,\"success\":true,\"value\":{}}");
  ASSERT_TRUE(reply.has_value());
  EXPECT_EQ(reply->mCommand, WireCommand::EvalResult);
  EXPECT_EQ(reply->mCorrelationId, "7");
  EXPECT_FALSE(reply->mPayload.contains("cmd"));
}

TEST(EmmyCodec, ExtractKeepsPartialRecordBuffered)
{
  EmmyCodec codec{};
  const std::string buffer = "13\n{\"cmd\":13,\"stacks\":[]}\n17\n{\"cmd\":17,";
  std::vector<std::string_view> records{};
  const auto consumed = codec.ExtractRecords(buffer, records);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(buffer.substr(consumed), "17\n{\"cmd\":17,");

  // Header alone is not a record.
  records.clear();
  EXPECT_EQ(codec.ExtractRecords("14\n", records), 0u);
  EXPECT_TRUE(records.empty());
}

TEST(EmmyCodec, MalformedRecordsAreErrorsNotCrashes)
{
  EmmyCodec codec{};
  auto badId = codec.Decode("abc\n{}");
  ASSERT_FALSE(badId.has_value());
  EXPECT_EQ(badId.error().mRecord, "abc\n{}");

  auto badJson = codec.Decode("13\n{not json");
  ASSERT_FALSE(badJson.has_value());
  EXPECT_FALSE(badJson.error().mReason.empty());

  EXPECT_FALSE(codec.Decode("13\n[1,2]").has_value());
  EXPECT_FALSE(codec.Decode("9\n{\"action\":42}").has_value());
}

TEST(EmmyCodec, UnknownIdsDecodeAsUnknown)
{
  EmmyCodec codec{};
  auto decoded = codec.Decode("99\n{}");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->mCommand, WireCommand::Unknown);
  EXPECT_EQ(decoded->mProtocolCommand, "99");
}

TEST(LineJsonCodec, EncodesDelimitedRecord)
{
  LineJsonCodec codec{};
  auto message = WireMessage::Make(WireCommand::Continue);
  const auto bytes = codec.Encode(message);
  ASSERT_TRUE(bytes.ends_with("|*|\n"));
  const auto record = Dict::parse(bytes.substr(0, bytes.size() - 4));
  EXPECT_EQ(record["cmd"], "continue");
  EXPECT_EQ(record["callbackId"], "0");
  EXPECT_TRUE(record["info"].is_object());
}

TEST(LineJsonCodec, ReplyKeepsCallbackId)
{
  LineJsonCodec codec{};
  auto message = WireMessage::Make(WireCommand::Init, Dict{ { "stopOnEntry", "false" } });
  message.mCorrelationId = "123456";
  const auto bytes = codec.Encode(message);

  std::vector<std::string_view> records{};
  ASSERT_EQ(codec.ExtractRecords(bytes, records), bytes.size());
  ASSERT_EQ(records.size(), 1u);
  auto decoded = codec.Decode(records.front());
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->mCommand, WireCommand::Init);
  EXPECT_EQ(decoded->mCorrelationId, "123456");
  EXPECT_TRUE(decoded->ExpectsReply());
  EXPECT_EQ(decoded->mPayload["stopOnEntry"], "false");
}

TEST(LineJsonCodec, StopKindsAllDecodeAsBreakNotify)
{
  LineJsonCodec codec{};
  for (const auto *name : { "stopOnBreakpoint", "stopOnEntry", "stopOnStep", "stopOnStepIn", "stopOnStepOut" }) {
    auto decoded = codec.Decode(std::format(R"({{"cmd":"{}","info":[],"callbackId":"0"}})", name));
    ASSERT_TRUE(decoded.has_value()) << name;
    EXPECT_EQ(decoded->mCommand, WireCommand::BreakNotify) << name;
    EXPECT_EQ(decoded->mProtocolCommand, name);
    EXPECT_FALSE(decoded->ExpectsReply());
  }
}

TEST(LineJsonCodec, EnvelopeFieldsArePreserved)
{
  LineJsonCodec codec{};
  auto decoded = codec.Decode(R"({"cmd":"stopOnBreakpoint","stack":[{"file":"a.lua","line":"3"}],"callbackId":"0"})");
  ASSERT_TRUE(decoded.has_value());
  ASSERT_TRUE(decoded->mEnvelope.contains("stack"));
  EXPECT_EQ(decoded->mEnvelope["stack"].size(), 1u);
}

TEST(LineJsonCodec, PartialLineStaysBuffered)
{
  LineJsonCodec codec{};
  const std::string buffer = "{\"cmd\":\"output\",\"info\":{\"content\":\"hi\"}}|*|\n\n{\"cmd\":\"stop";
  std::vector<std::string_view> records{};
  const auto consumed = codec.ExtractRecords(buffer, records);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(buffer.substr(consumed), "{\"cmd\":\"stop");
}

TEST(LineJsonCodec, MalformedRecordsAreErrors)
{
  LineJsonCodec codec{};
  EXPECT_FALSE(codec.Decode("{\"cmd\":").has_value());
  EXPECT_FALSE(codec.Decode("[]").has_value());
  auto noCommand = codec.Decode("{\"info\":{}}");
  ASSERT_FALSE(noCommand.has_value());
  EXPECT_EQ(noCommand.error().mRecord, "{\"info\":{}}");
}
