#include "CommandLine.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

using badgegate::ui::cli::splitCommandLine;

TEST(CommandLineTest, SplitsSimpleWords)
{
    EXPECT_THAT(splitCommandLine("login 1234567890"), ::testing::ElementsAre("login", "1234567890"));
}

TEST(CommandLineTest, CollapsesWhitespace)
{
    EXPECT_THAT(splitCommandLine("   scan \t  5   "), ::testing::ElementsAre("scan", "5"));
}

TEST(CommandLineTest, EmptyInputHasNoArguments)
{
    EXPECT_TRUE(splitCommandLine("").empty());
    EXPECT_TRUE(splitCommandLine("   ").empty());
}

TEST(CommandLineTest, PipesAreOrdinaryCharacters)
{
    EXPECT_THAT(splitCommandLine("can a|b"), ::testing::ElementsAre("can", "a|b"));
}

TEST(CommandLineTest, SingleQuotesAreLiteral)
{
    EXPECT_THAT(splitCommandLine("manual 'Max Mustermann'"), ::testing::ElementsAre("manual", "Max Mustermann"));
    EXPECT_THAT(splitCommandLine("'a\\\"b'"), ::testing::ElementsAre("a\\\"b"));
}

TEST(CommandLineTest, DoubleQuotesUnescapeQuoteAndBackslash)
{
    EXPECT_THAT(splitCommandLine("\"Anna Schmidt\""), ::testing::ElementsAre("Anna Schmidt"));
    EXPECT_THAT(splitCommandLine("\"quote\\\"here\""), ::testing::ElementsAre("quote\"here"));
    EXPECT_THAT(splitCommandLine("\"back\\\\slash\""), ::testing::ElementsAre("back\\slash"));
    EXPECT_THAT(splitCommandLine("\"path\\to\""), ::testing::ElementsAre("path\\to"));
}

TEST(CommandLineTest, AdjacentPartsConcatenate)
{
    EXPECT_THAT(splitCommandLine("abc\"def\""), ::testing::ElementsAre("abcdef"));
    EXPECT_THAT(splitCommandLine("'abc'\"def\""), ::testing::ElementsAre("abcdef"));
}

TEST(CommandLineTest, EmptyQuotesYieldEmptyArgument)
{
    EXPECT_THAT(splitCommandLine("login ''"), ::testing::ElementsAre("login", ""));
}

TEST(CommandLineTest, BackslashEscapesOutsideQuotes)
{
    EXPECT_THAT(splitCommandLine("a\\ b"), ::testing::ElementsAre("a b"));
    EXPECT_THAT(splitCommandLine("\\#x"), ::testing::ElementsAre("#x"));
    EXPECT_THAT(splitCommandLine("abc\\"), ::testing::ElementsAre("abc\\"));
}

TEST(CommandLineTest, CommentEndsLine)
{
    EXPECT_THAT(splitCommandLine("status # reader state"), ::testing::ElementsAre("status"));
    EXPECT_TRUE(splitCommandLine("# nothing").empty());
    EXPECT_THAT(splitCommandLine("can a#b"), ::testing::ElementsAre("can", "a#b"));
}

TEST(CommandLineTest, UnterminatedQuoteRunsToEnd)
{
    EXPECT_THAT(splitCommandLine("\"abc def"), ::testing::ElementsAre("abc def"));
    EXPECT_THAT(splitCommandLine("'abc"), ::testing::ElementsAre("abc"));
}
