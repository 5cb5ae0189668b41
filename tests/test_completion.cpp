#include <gtest/gtest.h>
#include <lineedit/complete/providers.hpp>

using namespace lineedit;

TEST(Completion, TwoCandidatesOnOneRow) {
    EXPECT_EQ(format_candidates({"foo bar", "foo bar baz"}),
              "\n\r    foo bar    foo bar baz    \n");
}

TEST(Completion, ColumnsAlignAcrossRows) {
    EXPECT_EQ(format_candidates({"a", "bb", "c", "dddd"}),
              "\n\r    a       bb    c    "
              "\n\r    dddd    \n");
}

TEST(Completion, WidthCountsCharactersNotBytes) {
    EXPECT_EQ(format_candidates({"\xc3\xa9t\xc3\xa9", "x"}),
              "\n\r    \xc3\xa9t\xc3\xa9    x    \n");
}

TEST(Help, KeyAndDescriptionColumns) {
    std::vector<HelpEntry> entries{{"tab", "complete"}, {"?", "help"}};
    EXPECT_EQ(format_help(entries),
              "\n\r  tab   complete   "
              "\n\r  ?     help       \n");
}

TEST(Table, EmptyTableIsJustANewline) {
    EXPECT_EQ(format_table({}, "  ", 2), "\n");
}

TEST(Providers, AbsentByDefault) {
    Providers p;
    EXPECT_FALSE(p.completion.has_value());
    EXPECT_FALSE(p.hint.has_value());
    EXPECT_FALSE(p.help.has_value());
}
