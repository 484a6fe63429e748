#include <gtest/gtest.h>
#include "common/utils.hpp"
#include "test_utils.hpp"
#include <iterator>

TEST(UtilsTest, CaseInsensitiveCompareIsAsciiOnly) {
    EXPECT_TRUE(utils::equalsIgnoreCase("/Data/Projects", "/data/PROJECTS"));
    EXPECT_FALSE(utils::equalsIgnoreCase("/data/a", "/data/ab"));
    EXPECT_FALSE(utils::equalsIgnoreCase("\xc3\x89t\xc3\xa9", "\xc3\xa9t\xc3\xa9"));
}

TEST(UtilsTest, SplitsRemotePaths) {
    std::string host;
    std::string path;
    ASSERT_TRUE(utils::splitRemotePath("backup01:/vol/data", host, path));
    EXPECT_EQ(host, "backup01");
    EXPECT_EQ(path, "/vol/data");

    ASSERT_TRUE(utils::splitRemotePath("//nas02/share/dir", host, path));
    EXPECT_EQ(host, "nas02");
    EXPECT_EQ(path, "/share/dir");

    EXPECT_FALSE(utils::splitRemotePath("/srv/data", host, path));
    EXPECT_FALSE(utils::splitRemotePath("D:/data", host, path));
    EXPECT_FALSE(utils::splitRemotePath("relative/a:b", host, path));
}

TEST(UtilsTest, VolumeForDriveAndRemotePaths) {
    EXPECT_EQ(utils::volumeForPath("d:/data/x"), "D:");
    EXPECT_EQ(utils::volumeForPath("backup01:/vol/data"), "backup01:/vol");
    EXPECT_FALSE(utils::volumeForPath("/").empty());
}

TEST(UtilsTest, PathContainment) {
    EXPECT_TRUE(utils::isPathWithin("/data/a/b", "/data/a"));
    EXPECT_TRUE(utils::isPathWithin("/DATA/A/b", "/data/a/"));
    EXPECT_TRUE(utils::isPathWithin("/data/a", "/data/a"));
    EXPECT_FALSE(utils::isPathWithin("/data/ab", "/data/a"));
    EXPECT_FALSE(utils::isPathWithin("/data", "/data/a"));
}

TEST(UtilsTest, Iso8601RoundTrip) {
    auto now = std::chrono::system_clock::now();
    std::string text = utils::formatIso8601(now);
    EXPECT_EQ(text.size(), 24u);
    EXPECT_EQ(text.back(), 'Z');

    std::chrono::system_clock::time_point parsed;
    ASSERT_TRUE(utils::parseIso8601(text, parsed));
    auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - parsed).count();
    EXPECT_GE(delta, 0);
    EXPECT_LT(delta, 1);

    EXPECT_FALSE(utils::parseIso8601("not a date", parsed));
}

TEST(UtilsTest, AtomicWriteReplacesContent) {
    TempDirectory temp;
    std::string path = (temp.path() / "nested" / "file.json").string();
    std::string error;

    ASSERT_TRUE(utils::writeFileAtomically(path, "first", error)) << error;
    ASSERT_TRUE(utils::writeFileAtomically(path, "second", error)) << error;

    std::ifstream file(path);
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "second");

    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(temp.path() / "nested")) {
        (void)entry;
        entries++;
    }
    EXPECT_EQ(entries, 1u);
}

TEST(UtilsTest, Sha256KnownDigest) {
    EXPECT_EQ(utils::sha256Hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(UtilsTest, ShellQuoteAndRunCommand) {
    EXPECT_EQ(utils::shellQuote("it's"), "'it'\\''s'");

    std::string output;
    EXPECT_EQ(utils::runCommand("echo " + utils::shellQuote("it's here"), output), 0);
    EXPECT_EQ(output, "it's here\n");
    EXPECT_EQ(utils::runCommand("exit 3", output), 3);
}

TEST(UtilsTest, SanitizeName) {
    EXPECT_EQ(utils::sanitizeName("Nightly Docs/2024:v1.0"), "Nightly_Docs_2024_v1.0");
}
