#include <gtest/gtest.h>
#include "protocols/ws/model/Inbound.hpp"

#include <nlohmann/json.hpp>

using namespace ds::protocols::ws::model;
using json = nlohmann::json;

TEST(InboundTest, ParsesStartScan) {
    const auto msg = parseInbound(json::parse(R"({"type":"start_scan","payload":{"drivePath":"/data","scanDepth":3}})"));
    ASSERT_TRUE(std::holds_alternative<StartScan>(msg));

    const auto& req = std::get<StartScan>(msg);
    EXPECT_EQ(req.drivePath, "/data");
    ASSERT_TRUE(req.scanDepth.has_value());
    EXPECT_EQ(*req.scanDepth, 3);
    EXPECT_EQ(typeOf(msg), "start_scan");
}

TEST(InboundTest, StartScanDepthIsOptional) {
    const auto msg = parseInbound(json::parse(R"({"type":"start_scan","payload":{"drivePath":"/"}})"));
    EXPECT_FALSE(std::get<StartScan>(msg).scanDepth.has_value());
}

TEST(InboundTest, StartScanWithoutPayloadYieldsEmptyPath) {
    const auto msg = parseInbound(json::parse(R"({"type":"start_scan"})"));
    EXPECT_TRUE(std::get<StartScan>(msg).drivePath.empty());
}

TEST(InboundTest, ParsesStopScan) {
    const auto msg = parseInbound(json::parse(R"({"type":"stop_scan","payload":{"taskId":"scan_1_1"}})"));
    ASSERT_TRUE(std::holds_alternative<StopScan>(msg));
    EXPECT_EQ(std::get<StopScan>(msg).taskId, "scan_1_1");
}

TEST(InboundTest, RejectsMalformedMessages) {
    EXPECT_THROW(parseInbound(json::array()), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"payload":{}})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":42})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"delete_everything"})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"stop_scan","payload":{}})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"stop_scan","payload":{"taskId":7}})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"start_scan","payload":"nope"})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"start_scan","payload":{"drivePath":5}})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"start_scan","payload":{"drivePath":"/","scanDepth":"2"}})")), ProtocolError);
    EXPECT_THROW(parseInbound(json::parse(R"({"type":"start_scan","payload":{"drivePath":"/","scanDepth":1.5}})")), ProtocolError);
}
