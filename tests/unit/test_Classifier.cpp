#include <gtest/gtest.h>
#include "scan/Classifier.hpp"

using namespace ds::scan;

TEST(ClassifierTest, ExtensionIsLowercasedWithoutDot) {
    EXPECT_EQ(Classifier::extensionOf("/data/Report.PDF"), "pdf");
    EXPECT_EQ(Classifier::extensionOf("/data/archive.tar.gz"), "gz");
}

TEST(ClassifierTest, MissingExtensionUsesSentinel) {
    EXPECT_EQ(Classifier::extensionOf("/data/Makefile"), NO_EXTENSION);
    EXPECT_EQ(Classifier::extensionOf("/data/.bashrc"), NO_EXTENSION);
    EXPECT_EQ(Classifier::extensionOf("/data/trailing."), NO_EXTENSION);
}

TEST(ClassifierTest, DescribesKnownAndUnknownExtensions) {
    EXPECT_EQ(Classifier::describe("txt"), "Text File");
    EXPECT_EQ(Classifier::describe("cpp"), "C++ Source File");
    EXPECT_EQ(Classifier::describe(NO_EXTENSION), "No Extension");
    EXPECT_EQ(Classifier::describe("xyz"), "XYZ");
}

TEST(ClassifierTest, ExecutableExtensionsAreApplications) {
    EXPECT_TRUE(Classifier::isApplication("/data/setup.exe", "exe"));
    EXPECT_TRUE(Classifier::isApplication("/data/Installer.msi", "msi"));
    EXPECT_FALSE(Classifier::isApplication("/data/notes.txt", "txt"));
}

TEST(ClassifierTest, ApplicationDirectoriesMatchCaseInsensitively) {
    EXPECT_TRUE(Classifier::isInApplicationDirectory("/mnt/c/PROGRAM FILES/Tool/readme.txt"));
    EXPECT_TRUE(Classifier::isInApplicationDirectory("/Applications/Foo.app/Contents/Info.plist"));
    EXPECT_TRUE(Classifier::isInApplicationDirectory("C:\\Windows\\System32\\drivers\\etc"));
    EXPECT_FALSE(Classifier::isInApplicationDirectory("/home/user/documents/app.txt"));
}

TEST(ClassifierTest, ApplicationNameDropsExtension) {
    EXPECT_EQ(Classifier::applicationName("/data/Setup.exe", "exe"), "Setup");
    EXPECT_EQ(Classifier::applicationName("/Applications/bin/tool", NO_EXTENSION), "tool");
}

TEST(ClassifierTest, FolderDisplayNames) {
    EXPECT_EQ(Classifier::folderDisplayName(""), "Unknown Folder");
    EXPECT_EQ(Classifier::folderDisplayName("/"), "Root");
    EXPECT_EQ(Classifier::folderDisplayName("/mnt/c/Program Files"), "Programs");
    EXPECT_EQ(Classifier::folderDisplayName("/home/user/Downloads"), "Downloads");
    EXPECT_EQ(Classifier::folderDisplayName("/mnt/c/Program Files/Vendor/bin"), "Vendor");
    EXPECT_EQ(Classifier::folderDisplayName("/data/sub"), "sub");
}
