/**
 * @file test_userdirs.cpp
 * @brief Unit tests for the default scan root lookup
 *
 * @see wellKnownUserDirectories
 * @see parseUserDirsLine
 */

#include "testtree.hpp"
#include "userdirs.hpp"

#include <cstdlib>

namespace fs = std::filesystem;

/**
 * @test ParsesQuotedHomeRelativeLine
 */
TEST(UserDirsParseTest, ParsesQuotedHomeRelativeLine) {
    std::string key;
    fs::path value;

    ASSERT_TRUE(parseUserDirsLine("XDG_MUSIC_DIR=\"$HOME/Musik\"", "/home/u", key, value));
    EXPECT_EQ(key, "XDG_MUSIC_DIR");
    EXPECT_EQ(value.string(), "/home/u/Musik");
}

/**
 * @test ParsesAbsoluteAndDisabledEntries
 * @brief Absolute paths pass through, "$HOME/" alone maps to home
 */
TEST(UserDirsParseTest, ParsesAbsoluteAndDisabledEntries) {
    std::string key;
    fs::path value;

    ASSERT_TRUE(parseUserDirsLine("XDG_VIDEOS_DIR=\"/media/videos\"", "/home/u", key, value));
    EXPECT_EQ(value.string(), "/media/videos");

    ASSERT_TRUE(parseUserDirsLine("XDG_DESKTOP_DIR=\"$HOME/\"", "/home/u", key, value));
    EXPECT_EQ(value.string(), "/home/u");
}

/**
 * @test SkipsCommentsAndGarbage
 */
TEST(UserDirsParseTest, SkipsCommentsAndGarbage) {
    std::string key;
    fs::path value;

    EXPECT_FALSE(parseUserDirsLine("# This file is written by xdg-user-dirs-update", "/h", key, value));
    EXPECT_FALSE(parseUserDirsLine("", "/h", key, value));
    EXPECT_FALSE(parseUserDirsLine("   ", "/h", key, value));
    EXPECT_FALSE(parseUserDirsLine("no equals sign", "/h", key, value));
    EXPECT_FALSE(parseUserDirsLine("XDG_MUSIC_DIR=\"\"", "/h", key, value));
}

/**
 * @class UserDirsTest
 * @brief Fixture using the scratch tree as home directory
 *
 * XDG_CONFIG_HOME is pointed at test_dir/.config for the duration of each
 * test so the developer's own user-dirs.dirs is never read.
 */
class UserDirsTest : public TestTree {
protected:
    std::string saved_config;
    bool had_config = false;

    void SetUp() override {
        TestTree::SetUp();
        if (const char* value = std::getenv("XDG_CONFIG_HOME")) {
            had_config = true;
            saved_config = value;
        }
        setenv("XDG_CONFIG_HOME", (test_dir / ".config").c_str(), 1);
    }

    void TearDown() override {
        if (had_config) {
            setenv("XDG_CONFIG_HOME", saved_config.c_str(), 1);
        } else {
            unsetenv("XDG_CONFIG_HOME");
        }
        TestTree::TearDown();
    }
};

/**
 * @test FallsBackToDefaultNames
 * @brief Without a config file the English folder names are used
 */
TEST_F(UserDirsTest, FallsBackToDefaultNames) {
    fs::create_directories(test_dir / "Documents");
    fs::create_directories(test_dir / "Music");

    auto dirs = wellKnownUserDirectories(test_dir);

    ASSERT_EQ(dirs.size(), 2u);
    EXPECT_EQ(dirs[0].string(), (test_dir / "Documents").string());
    EXPECT_EQ(dirs[1].string(), (test_dir / "Music").string());
}

/**
 * @test HonoursUserDirsFile
 * @brief Localised folders and disabled entries from user-dirs.dirs
 */
TEST_F(UserDirsTest, HonoursUserDirsFile) {
    fs::create_directories(test_dir / "Bilder");
    fs::create_directories(test_dir / "Desktop");
    writeFile(".config/user-dirs.dirs",
              "# generated\n"
              "XDG_PICTURES_DIR=\"$HOME/Bilder\"\n"
              "XDG_DESKTOP_DIR=\"$HOME/\"\n");

    auto dirs = wellKnownUserDirectories(test_dir);

    ASSERT_EQ(dirs.size(), 1u);
    EXPECT_EQ(dirs[0].string(), (test_dir / "Bilder").string());
}
