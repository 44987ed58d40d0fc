#include "config.h"

#include <gtest/gtest.h>
#include <string>

TEST(Config, DefaultsMatchTheClassicGame) {
    GameConfig cfg = parseArgs({});
    EXPECT_EQ(cfg.mazeW, 35);
    EXPECT_EQ(cfg.mazeH, 25);
    EXPECT_EQ(cfg.cellSize, 20);
    EXPECT_EQ(cfg.fps, 60);
    EXPECT_EQ(cfg.startLevel, 1);
    EXPECT_FALSE(cfg.hasSeed);
    EXPECT_FALSE(cfg.showHelp);
}

TEST(Config, ParsesSeedAndLevel) {
    GameConfig cfg = parseArgs({ "--seed=123", "--level=3" });
    EXPECT_TRUE(cfg.hasSeed);
    EXPECT_EQ(cfg.seed, 123u);
    EXPECT_EQ(cfg.startLevel, 3);
}

TEST(Config, HelpFlag) {
    EXPECT_TRUE(parseArgs({ "--help" }).showHelp);
    EXPECT_TRUE(parseArgs({ "-h" }).showHelp);
    EXPECT_NE(std::string(usageText()).find("--seed"), std::string::npos);
}

TEST(Config, RejectsBadValues) {
    EXPECT_THROW(parseArgs({ "--level=0" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--level=-2" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--level=99999999999" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--seed=abc" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--seed=" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--seed=99999999999999999999999" }), ConfigError);
    EXPECT_THROW(parseArgs({ "--fast" }), ConfigError);
}

TEST(Config, ErrorNamesTheOption) {
    try {
        parseArgs({ "--bogus" });
        FAIL() << "expected ConfigError";
    }
    catch (const ConfigError& e) {
        EXPECT_NE(std::string(e.what()).find("--bogus"), std::string::npos);
    }
}

TEST(Config, KeepsBaseValues) {
    GameConfig base;
    base.mazeW = 21;
    GameConfig cfg = parseArgs({ "--level=2" }, base);
    EXPECT_EQ(cfg.mazeW, 21);
    EXPECT_EQ(cfg.startLevel, 2);
}

TEST(Config, SplitsCommandLine) {
    auto args = splitCommandLine("  --seed=1 \t --level=2  ");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[0], "--seed=1");
    EXPECT_EQ(args[1], "--level=2");
    EXPECT_TRUE(splitCommandLine("").empty());
}
