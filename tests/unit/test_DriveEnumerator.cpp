#include <gtest/gtest.h>
#include "drives/Enumerator.hpp"

#include <nlohmann/json.hpp>
#include <sstream>

using namespace ds::drives;

TEST(DriveEnumeratorTest, ParsesMountsAndSkipsPseudoFilesystems) {
    std::istringstream in(
        "sysfs /sys sysfs rw,nosuid 0 0\n"
        "proc /proc proc rw 0 0\n"
        "/dev/sda1 / ext4 rw,relatime 0 0\n"
        "/dev/sdb1 /mnt/My\\040Disk xfs rw 0 0\n"
        "server:/export /mnt/nfs nfs4 rw 0 0\n"
        "cgroup2 /sys/fs/cgroup cgroup2 rw 0 0\n"
        "/dev/sda1 / ext4 rw,relatime 0 0\n"
        "garbage\n");

    const auto drives = Enumerator::parse(in);
    ASSERT_EQ(drives.size(), 3u);

    EXPECT_EQ(drives[0].path, "/");
    EXPECT_EQ(drives[0].name, "/");
    EXPECT_EQ(drives[0].kind, "local");

    EXPECT_EQ(drives[1].path, "/mnt/My Disk");
    EXPECT_EQ(drives[1].kind, "local");

    EXPECT_EQ(drives[2].path, "/mnt/nfs");
    EXPECT_EQ(drives[2].kind, "network");
}

TEST(DriveEnumeratorTest, UnescapesOctalSequences) {
    EXPECT_EQ(Enumerator::unescape("/a\\040b\\011c"), "/a b\tc");
    EXPECT_EQ(Enumerator::unescape("/plain"), "/plain");
    EXPECT_EQ(Enumerator::unescape("/bad\\09x"), "/bad\\09x");
}

TEST(DriveEnumeratorTest, FallsBackWhenUnavailable) {
    const auto drives = Enumerator::list("/nonexistent/mounts");
    ASSERT_EQ(drives.size(), 1u);
    EXPECT_EQ(drives[0].path, "/");
    EXPECT_EQ(drives[0].kind, "local");
}

TEST(DriveEnumeratorTest, ListIsNeverEmpty) {
    EXPECT_FALSE(Enumerator::list().empty());
}

TEST(DriveEnumeratorTest, SerializesDrive) {
    const nlohmann::json j = Enumerator::fallback();
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j.at(0).at("name"), "/");
    EXPECT_EQ(j.at(0).at("path"), "/");
    EXPECT_EQ(j.at(0).at("kind"), "local");
}
