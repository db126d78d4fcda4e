#include <gtest/gtest.h>
#include "protocols/ws/Router.hpp"
#include "scan/Controller.hpp"
#include "scan/Engine.hpp"
#include "scan/TaskRegistry.hpp"
#include "concurrency/ThreadPool.hpp"
#include "support/FakeChannel.hpp"
#include "support/FakeMetadata.hpp"

using namespace ds::test;
using json = nlohmann::json;

class RouterTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeMetadata> fs_ = std::make_shared<FakeMetadata>();
    std::shared_ptr<ds::scan::TaskRegistry> registry_ = std::make_shared<ds::scan::TaskRegistry>();
    std::shared_ptr<ds::concurrency::ThreadPool> pool_ = std::make_shared<ds::concurrency::ThreadPool>("test-router", 1);
    std::shared_ptr<FakeChannel> channel_ = std::make_shared<FakeChannel>();
    std::unique_ptr<ds::protocols::ws::Router> router_;

    void SetUp() override {
        fs_->addFile("/data/a.txt", 100);

        auto engine = std::make_shared<ds::scan::Engine>(fs_);
        router_ = std::make_unique<ds::protocols::ws::Router>(
            std::make_shared<ds::scan::Controller>(registry_, engine, pool_, ds::config::ScanConfig{}));
    }

    void TearDown() override {
        fs_->release();
        pool_->stop();
    }

    void route(json msg) const { router_->routeMessage(std::move(msg), channel_); }

    std::string lastError() const {
        return channel_->first("error").at("payload").at("error").get<std::string>();
    }
};

TEST_F(RouterTest, UnknownTypeRepliesWithError) {
    route({{"type", "format_disk"}, {"payload", json::object()}});

    EXPECT_EQ(channel_->types(), std::vector<std::string>{"error"});
    EXPECT_NE(lastError().find("format_disk"), std::string::npos);
}

TEST_F(RouterTest, MissingTypeRepliesWithError) {
    route({{"payload", {{"drivePath", "/data"}}}});

    EXPECT_EQ(channel_->types(), std::vector<std::string>{"error"});
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(RouterTest, MalformedPayloadRepliesWithError) {
    route({{"type", "start_scan"}, {"payload", {{"drivePath", "/data"}, {"scanDepth", "deep"}}}});
    route({{"type", "stop_scan"}, {"payload", json::object()}});
    route({{"type", "start_scan"}, {"payload", "not an object"}});

    EXPECT_EQ(channel_->count("error"), 3u);
    EXPECT_EQ(channel_->messages().size(), 3u);
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(RouterTest, NonObjectMessageRepliesWithError) {
    route(json::array({1, 2, 3}));
    EXPECT_EQ(channel_->types(), std::vector<std::string>{"error"});
}

TEST_F(RouterTest, StartScanRunsToCompletion) {
    route({{"type", "start_scan"}, {"payload", {{"drivePath", "/data"}, {"scanDepth", 2}}}});
    ASSERT_TRUE(channel_->waitFor("scan_complete"));
    pool_->stop();

    EXPECT_EQ(channel_->types(), (std::vector<std::string>{"scan_started", "scan_complete"}));
    EXPECT_EQ(channel_->first("scan_complete").at("payload").at("stats").at("totalSize"), 100);
}

TEST_F(RouterTest, StartScanWithBadRootRepliesWithScanError) {
    route({{"type", "start_scan"}, {"payload", {{"drivePath", "/missing"}}}});

    EXPECT_EQ(channel_->types(), std::vector<std::string>{"scan_error"});
    EXPECT_EQ(channel_->count("error"), 0u);
}

TEST_F(RouterTest, StopScanForUnknownTaskIsSilent) {
    route({{"type", "stop_scan"}, {"payload", {{"taskId", "scan_0_0"}}}});
    EXPECT_TRUE(channel_->messages().empty());
}

TEST_F(RouterTest, StopScanAbortsRunningScan) {
    fs_->blockListing("/data");
    route({{"type", "start_scan"}, {"payload", {{"drivePath", "/data"}}}});
    fs_->waitUntilBlocked();

    const auto id = channel_->first("scan_started").at("payload").at("taskId").get<std::string>();
    route({{"type", "stop_scan"}, {"payload", {{"taskId", id}}}});
    fs_->release();
    pool_->stop();

    EXPECT_EQ(channel_->types(), (std::vector<std::string>{"scan_started", "scan_stopped"}));
    EXPECT_EQ(registry_->size(), 0u);
}

TEST_F(RouterTest, DisconnectAbortsChannelScans) {
    fs_->blockListing("/data");
    route({{"type", "start_scan"}, {"payload", {{"drivePath", "/data"}}}});
    fs_->waitUntilBlocked();

    router_->onDisconnect(channel_->channelId());
    fs_->release();
    pool_->stop();

    EXPECT_EQ(registry_->size(), 0u);
    EXPECT_EQ(channel_->count("scan_complete"), 0u);
}
