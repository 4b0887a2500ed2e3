#include "gtest/gtest.h"
#include "Utils/StatusLines.h"
#include "fake_terminal.h"

#include <memory>

using taskpool::utils::StatusLines;
using tests::FakeTerminal;

TEST(StatusLines, WritesLinesInOrder)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines lines(term);

    EXPECT_TRUE(lines.set_line(0, "a"));
    EXPECT_TRUE(lines.set_line(1, "b"));
    EXPECT_EQ(term->row(1), "a");
    EXPECT_EQ(term->row(2), "b");
    EXPECT_EQ(term->cursor_row(), 3);
    EXPECT_EQ(lines.lowest_printed_line().value_or(-1), 1);
}

TEST(StatusLines, SkippedLinesAreLeftBlank)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines lines(term);

    lines.set_line(0, "a");
    lines.set_line(2, "c");
    EXPECT_EQ(term->row(2), "");
    EXPECT_EQ(term->row(3), "c");

    lines.set_line(1, "b");
    EXPECT_EQ(term->row(1), "a");
    EXPECT_EQ(term->row(2), "b");
    EXPECT_EQ(term->row(3), "c");
    // parked below the lowest line again
    EXPECT_EQ(term->cursor_row(), 4);
}

TEST(StatusLines, RewritesALineInPlace)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines lines(term);

    lines.set_line(0, "job 0: 10%");
    lines.set_line(1, "job 1: 10%");
    lines.set_line(2, "job 2: 10%");
    lines.set_line(0, "job 0: 100%");

    EXPECT_EQ(term->row(1), "job 0: 100%");
    EXPECT_EQ(term->row(2), "job 1: 10%");
    EXPECT_EQ(term->row(3), "job 2: 10%");
    EXPECT_EQ(term->cursor_row(), 4);
    EXPECT_EQ(lines.lowest_printed_line().value_or(-1), 2);
}

TEST(StatusLines, StartsWhereTheCursorIs)
{
    auto term = std::make_shared<FakeTerminal>(10, 4);
    StatusLines lines(term);

    lines.set_line(0, "first");
    EXPECT_EQ(term->row(4), "first");
    EXPECT_EQ(term->cursor_row(), 5);
}

TEST(StatusLines, GrowsTheBufferBelowTheWindow)
{
    auto term = std::make_shared<FakeTerminal>(3);
    StatusLines lines(term);

    EXPECT_TRUE(lines.set_line(5, "z"));
    EXPECT_EQ(term->buffer()[5], "z");
    EXPECT_EQ(term->cursor_row(), 3);
    EXPECT_EQ(lines.lowest_printed_line().value_or(-1), 5);
}

TEST(StatusLines, ScrolledOffLinesAreRefused)
{
    auto term = std::make_shared<FakeTerminal>(3);
    StatusLines lines(term);

    for (int i = 0; i < 5; ++i) ASSERT_TRUE(lines.set_line(i, std::to_string(i)));
    ASSERT_EQ(term->scrolled(), 3u);

    EXPECT_FALSE(lines.set_line(0, "x"));
    EXPECT_EQ(term->buffer()[0], "0");

    // line 3 is still on screen (row 1)
    EXPECT_TRUE(lines.set_line(3, "X"));
    EXPECT_EQ(term->row(1), "X");
    EXPECT_EQ(term->row(2), "4");
    EXPECT_EQ(term->cursor_row(), 3);
}

TEST(StatusLines, NegativeLineIsRefused)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines lines(term);

    EXPECT_FALSE(lines.set_line(-1, "nope"));
    EXPECT_FALSE(lines.lowest_printed_line().has_value());
    EXPECT_EQ(term->cursor_row(), 1);
}

TEST(StatusLines, ResetStartsANewBlockBelow)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines lines(term);

    lines.set_line(0, "a");
    lines.set_line(1, "b");
    term->write("Round 1 done\n");
    lines.reset();
    EXPECT_FALSE(lines.lowest_printed_line().has_value());

    lines.set_line(0, "c");
    EXPECT_EQ(term->row(1), "a");
    EXPECT_EQ(term->row(2), "b");
    EXPECT_EQ(term->row(3), "Round 1 done");
    EXPECT_EQ(term->row(4), "c");
}

TEST(StatusLines, SessionsTrackTheirOwnLowestLine)
{
    auto term = std::make_shared<FakeTerminal>(10);
    StatusLines first(term);
    StatusLines second(term);

    first.set_line(2, "x");
    EXPECT_EQ(first.lowest_printed_line().value_or(-1), 2);
    EXPECT_FALSE(second.lowest_printed_line().has_value());
}
