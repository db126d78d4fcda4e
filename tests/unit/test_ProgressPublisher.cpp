#include <gtest/gtest.h>
#include "scan/ProgressPublisher.hpp"
#include "scan/model/Progress.hpp"
#include "scan/model/Stats.hpp"
#include "support/FakeChannel.hpp"

using namespace ds::scan;
using namespace ds::test;

TEST(ProgressPublisherTest, WrapsPayloadInEnvelope) {
    const auto channel = std::make_shared<FakeChannel>();
    const ProgressPublisher publisher(channel);

    EXPECT_TRUE(publisher.publish("scan_started", {{"taskId", "scan_1"}}));

    const auto messages = channel->messages();
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].at("type"), "scan_started");
    EXPECT_EQ(messages[0].at("payload").at("taskId"), "scan_1");
}

TEST(ProgressPublisherTest, DropsWhenChannelClosed) {
    const auto channel = std::make_shared<FakeChannel>();
    channel->setOpen(false);
    const ProgressPublisher publisher(channel);

    EXPECT_FALSE(publisher.isConnected());
    EXPECT_FALSE(publisher.publish("scan_started", {}));
    EXPECT_TRUE(channel->messages().empty());
}

TEST(ProgressPublisherTest, DropsWhenChannelGone) {
    auto channel = std::make_shared<FakeChannel>();
    const ProgressPublisher publisher(channel);
    channel.reset();

    EXPECT_FALSE(publisher.isConnected());
    EXPECT_FALSE(publisher.publish("scan_started", {}));
}

TEST(ProgressPublisherTest, PublishesProgressSnapshot) {
    const auto channel = std::make_shared<FakeChannel>();
    const ProgressPublisher publisher(channel);

    model::Stats stats;
    stats.recordFile("txt", 10);
    stats.scannedCount = 1;

    EXPECT_TRUE(publisher.progress(model::Progress("scan_1", stats, "/data/a.txt")));

    const auto msg = channel->first("scan_progress");
    ASSERT_FALSE(msg.is_null());
    EXPECT_EQ(msg.at("payload").at("currentPath"), "/data/a.txt");
    EXPECT_EQ(msg.at("payload").at("scannedCount"), 1);
}

TEST(ProgressPublisherTest, InvalidUtf8IsReplacedNotThrown) {
    const auto channel = std::make_shared<FakeChannel>();
    const ProgressPublisher publisher(channel);

    model::Stats stats;
    stats.scannedCount = 1;

    EXPECT_TRUE(publisher.progress(model::Progress("scan_1", stats, "/data/\xff\xfe/a.txt")));

    const auto raw = channel->raw();
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_NE(raw[0].find("\xEF\xBF\xBD\xEF\xBF\xBD"), std::string::npos);
    EXPECT_EQ(channel->first("scan_progress").at("payload").at("currentPath"), "/data/\xEF\xBF\xBD\xEF\xBF\xBD/a.txt");
}
