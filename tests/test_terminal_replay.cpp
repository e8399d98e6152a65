#include <gtest/gtest.h>
#include "terminal_replay.hpp"

TEST(TerminalReplayTest, CarriageReturnOverwrites) {
    auto screen = replay_terminal("hello\rJ");
    ASSERT_EQ(screen.size(), 1u);
    EXPECT_EQ(screen[0], "Jello");
}

TEST(TerminalReplayTest, EraseToEndOfLine) {
    auto screen = replay_terminal("spinner text\r\033[Kmsg\n");
    ASSERT_EQ(screen.size(), 1u);
    EXPECT_EQ(screen[0], "msg");
}

TEST(TerminalReplayTest, EraseWholeLineAndDropColours) {
    auto screen = replay_terminal("\033[31mred\033[0m\nabc\033[2K\n");
    ASSERT_EQ(screen.size(), 2u);
    EXPECT_EQ(screen[0], "red");
    EXPECT_EQ(screen[1], "");
}
