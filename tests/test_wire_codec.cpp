// Tests for the Atlas, Global Cache and CEC bridge codecs.
#include "avlink/test_hooks.h"

#include <gtest/gtest.h>

#include <string>

namespace {

avlink::DeviceEndpoint EndpointOf(avlink::ProtocolKind kind, uint8_t cec_address = 0) {
  avlink::DeviceEndpoint endpoint;
  endpoint.id = "dev";
  endpoint.address = "10.0.0.5";
  endpoint.port = 1;
  endpoint.kind = kind;
  endpoint.cec_logical_address = cec_address;
  return endpoint;
}

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(CodecFactoryTest, PicksCodecAndDefaultsPerKind) {
  auto atlas = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  auto itach = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kGlobalCache));
  auto cec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kCecBridge));
  ASSERT_NE(atlas, nullptr);
  ASSERT_NE(itach, nullptr);
  ASSERT_NE(cec, nullptr);

  EXPECT_EQ(atlas->kind(), avlink::ProtocolKind::kAtlas);
  EXPECT_EQ(atlas->DefaultTimeout().count(), 2000);
  EXPECT_EQ(itach->DefaultTimeout().count(), 1000);
  EXPECT_EQ(cec->DefaultTimeout().count(), 5000);

  EXPECT_TRUE(atlas->SupportsSubscriptions());
  EXPECT_FALSE(itach->SupportsSubscriptions());
  EXPECT_FALSE(cec->SupportsSubscriptions());
}

TEST(AtlasCodecTest, EncodesGetWithRequestId) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  std::string frame;
  ASSERT_TRUE(codec->Encode(avlink::Command::Get("ZoneGain_0"), &frame, nullptr));
  EXPECT_EQ(frame.back(), '\n');
  EXPECT_TRUE(Contains(frame, "\"jsonrpc\":\"2.0\""));
  EXPECT_TRUE(Contains(frame, "\"method\":\"get\""));
  EXPECT_TRUE(Contains(frame, "\"param\":\"ZoneGain_0\""));
  EXPECT_TRUE(Contains(frame, "\"fmt\":\"val\""));
  EXPECT_TRUE(Contains(frame, "\"id\""));
  EXPECT_EQ(frame.find('\n'), frame.size() - 1);
}

TEST(AtlasCodecTest, EncodesSetInRequestedFormat) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  std::string frame;
  ASSERT_TRUE(codec->Encode(
      avlink::Command::Set("ZoneGain_0", 50.0, avlink::ValueFormat::kPct), &frame, nullptr));
  EXPECT_TRUE(Contains(frame, "\"method\":\"set\""));
  EXPECT_TRUE(Contains(frame, "\"pct\":50"));

  ASSERT_TRUE(codec->Encode(avlink::Command::Set("ZoneName_0", std::string("Patio"),
                                                 avlink::ValueFormat::kStr),
                            &frame, nullptr));
  EXPECT_TRUE(Contains(frame, "\"str\":\"Patio\""));
}

TEST(AtlasCodecTest, SubscriptionsExpectNoReply) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  const auto sub = avlink::Command::Subscribe("ZoneMeter_0");
  std::string frame;
  ASSERT_TRUE(codec->Encode(sub, &frame, nullptr));
  EXPECT_TRUE(Contains(frame, "\"method\":\"sub\""));
  EXPECT_FALSE(Contains(frame, "\"id\""));
  EXPECT_FALSE(codec->ExpectsResponse(sub));
  EXPECT_TRUE(codec->ExpectsResponse(avlink::Command::Get("ZoneMeter_0")));
}

TEST(AtlasCodecTest, RejectsSetWithoutValue) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  std::string frame;
  std::string error;
  EXPECT_FALSE(codec->Encode(avlink::Command::Set("ZoneGain_0", avlink::ParamValue{}), &frame,
                             &error));
  EXPECT_FALSE(error.empty());
}

TEST(AtlasCodecTest, DecodesUpdatesAndResponses) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  avlink::Response response;
  avlink::ParameterUpdate update;
  std::string error;

  ASSERT_EQ(codec->Decode(
                R"({"jsonrpc":"2.0","method":"update","params":{"param":"ZoneGain_0","val":-12}})",
                &response, &update, &error),
            avlink::DecodeResult::kUpdate);
  EXPECT_EQ(update.parameter, "ZoneGain_0");
  EXPECT_DOUBLE_EQ(std::get<double>(update.value), -12.0);
  EXPECT_EQ(update.format, avlink::ValueFormat::kVal);

  ASSERT_EQ(codec->Decode(
                R"({"jsonrpc":"2.0","method":"getResp","params":{"param":"ZoneName_0","str":"Bar"}})",
                &response, &update, &error),
            avlink::DecodeResult::kResponse);
  EXPECT_EQ(response.parameter, "ZoneName_0");
  EXPECT_EQ(std::get<std::string>(response.value), "Bar");

  avlink::Response ack;
  ASSERT_EQ(codec->Decode(R"({"jsonrpc":"2.0","id":3,"result":"OK"})", &ack, &update, &error),
            avlink::DecodeResult::kResponse);
  EXPECT_EQ(std::get<std::string>(ack.value), "OK");
}

TEST(AtlasCodecTest, ReportsDeviceErrorsAndGarbage) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  avlink::Response response;
  avlink::ParameterUpdate update;
  std::string error;

  EXPECT_EQ(codec->Decode(
                R"({"jsonrpc":"2.0","id":1,"error":{"code":-32601,"message":"Method not found"}})",
                &response, &update, &error),
            avlink::DecodeResult::kDeviceError);
  EXPECT_EQ(error, "Method not found");

  EXPECT_EQ(codec->Decode("{not json", &response, &update, &error),
            avlink::DecodeResult::kMalformed);
  EXPECT_EQ(codec->Decode("[1,2]", &response, &update, &error),
            avlink::DecodeResult::kMalformed);
  EXPECT_EQ(codec->Decode(R"({"jsonrpc":"2.0","method":"notify"})", &response, &update, &error),
            avlink::DecodeResult::kIgnored);
}

TEST(WireCodecTest, ExtractFrameSkipsBlankLines) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kAtlas));
  std::string buffer = "first\n\n  second  \npartial";
  auto frame = codec->ExtractFrame(&buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(*frame, "first");
  frame = codec->ExtractFrame(&buffer);
  ASSERT_TRUE(frame.has_value());
  EXPECT_EQ(*frame, "second");
  EXPECT_FALSE(codec->ExtractFrame(&buffer).has_value());
  EXPECT_EQ(buffer, "partial");
}

TEST(GlobalCacheCodecTest, EncodesCarriageReturnFrames) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kGlobalCache));
  std::string frame;
  ASSERT_TRUE(codec->Encode(avlink::Command::Get("version"), &frame, nullptr));
  EXPECT_EQ(frame, "getversion\r");
  ASSERT_TRUE(codec->Encode(avlink::Command::Get("NET"), &frame, nullptr));
  EXPECT_EQ(frame, "get_NET\r");
  ASSERT_TRUE(codec->Encode(
      avlink::Command::Set("sendir", std::string("1:1,1,38000,1,1,343,171")), &frame, nullptr));
  EXPECT_EQ(frame, "sendir,1:1,1,38000,1,1,343,171\r");

  std::string error;
  EXPECT_FALSE(codec->Encode(avlink::Command::Subscribe("NET"), &frame, &error));
  EXPECT_FALSE(error.empty());
}

TEST(GlobalCacheCodecTest, DecodesRepliesAndErrors) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kGlobalCache));
  avlink::Response response;
  avlink::ParameterUpdate update;
  std::string error;
  EXPECT_EQ(codec->Decode("710-1001-05", &response, &update, &error),
            avlink::DecodeResult::kResponse);
  EXPECT_EQ(std::get<std::string>(response.value), "710-1001-05");
  EXPECT_EQ(codec->Decode("ERR_1:1,008", &response, &update, &error),
            avlink::DecodeResult::kDeviceError);
  EXPECT_EQ(error, "ERR_1:1,008");
  EXPECT_EQ(codec->Decode("busyIR,1:1,1", &response, &update, &error),
            avlink::DecodeResult::kDeviceError);
}

TEST(CecBridgeCodecTest, EncodesBridgeCommands) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kCecBridge, 4));
  std::string frame;
  ASSERT_TRUE(codec->Encode(avlink::Command::Set("tx", std::string("14:44:22")), &frame,
                            nullptr));
  EXPECT_EQ(frame, "tx 14:44:22\n");
  ASSERT_TRUE(codec->Encode(avlink::Command::Set("on", avlink::ParamValue{}), &frame, nullptr));
  EXPECT_EQ(frame, "on 4\n");
  ASSERT_TRUE(codec->Encode(avlink::Command::Set("standby", avlink::ParamValue{}), &frame,
                            nullptr));
  EXPECT_EQ(frame, "standby 4\n");
  ASSERT_TRUE(codec->Encode(avlink::Command::Get("power"), &frame, nullptr));
  EXPECT_EQ(frame, "pow 4\n");

  std::string error;
  EXPECT_FALSE(codec->Encode(avlink::Command::Get("volume"), &frame, &error));
  EXPECT_FALSE(codec->Encode(avlink::Command::Set("tx", avlink::ParamValue{}), &frame, &error));
  EXPECT_FALSE(codec->Encode(avlink::Command::Subscribe("power"), &frame, &error));
}

TEST(CecBridgeCodecTest, DecodesPowerStatusAndFailures) {
  auto codec = avlink::MakeCodec(EndpointOf(avlink::ProtocolKind::kCecBridge));
  avlink::Response response;
  avlink::ParameterUpdate update;
  std::string error;
  ASSERT_EQ(codec->Decode("power status: standby", &response, &update, &error),
            avlink::DecodeResult::kResponse);
  EXPECT_EQ(response.parameter, "power");
  EXPECT_EQ(std::get<std::string>(response.value), "standby");

  EXPECT_EQ(codec->Decode("TRAFFIC: [ 123] << 10:44:22", &response, &update, &error),
            avlink::DecodeResult::kResponse);
  EXPECT_EQ(codec->Decode("ERROR: TRANSMIT_FAILED", &response, &update, &error),
            avlink::DecodeResult::kDeviceError);
}
