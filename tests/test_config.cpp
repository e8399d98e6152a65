#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include "config.hpp"

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path = ::testing::TempDir() + "nuconsole_config_test.txt";
        std::remove(path.c_str());
    }

    void TearDown() override {
        std::remove(path.c_str());
    }

    void write(const std::string& content) {
        std::ofstream file(path);
        file << content;
    }

    std::string path;
};

TEST_F(ConfigTest, MissingFileGivesDefaults) {
    Config config = Config::load_from_file(path);
    EXPECT_FALSE(config.debug);
    EXPECT_EQ(config.spinner_interval_ms, 100);
    EXPECT_EQ(config.waiting_message, "Thinking...");
}

TEST_F(ConfigTest, ReadsKeysIgnoringCommentsAndWhitespace) {
    write("# console settings\n"
          "\n"
          "  debug = true  \n"
          "spinner_interval_ms=120\n"
          "waiting_message = Waiting for model...\n");

    Config config = Config::load_from_file(path);
    EXPECT_TRUE(config.debug);
    EXPECT_EQ(config.spinner_interval_ms, 120);
    EXPECT_EQ(config.waiting_message, "Waiting for model...");
}

TEST_F(ConfigTest, EmptyWaitingMessageKeepsDefault) {
    write("waiting_message=\n");
    EXPECT_EQ(Config::load_from_file(path).waiting_message, "Thinking...");
}

TEST_F(ConfigTest, RejectsBadInterval) {
    write("spinner_interval_ms=fast\n");
    EXPECT_THROW(Config::load_from_file(path), std::invalid_argument);

    write("spinner_interval_ms=5000\n");
    EXPECT_THROW(Config::load_from_file(path), std::out_of_range);
}

TEST(TrimTest, StripsBothEnds) {
    EXPECT_EQ(trim("  a b \t\n"), "a b");
    EXPECT_EQ(trim("   "), "");
}
