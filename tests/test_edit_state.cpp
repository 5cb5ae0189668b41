#include <gtest/gtest.h>
#include <lineedit/edit/edit_state.hpp>
#include <random>

using namespace lineedit;

static EditState make(const std::u32string& text, std::size_t cursor) {
    EditState s; s.buffer = text; s.cursor = cursor; return s;
}

TEST(EditPrimitives, InsertSplicesAtCursor) {
    auto s = make(U"fo bar", 2);
    s.insert(U'o');
    EXPECT_EQ(s.buffer, U"foo bar");
    EXPECT_EQ(s.cursor, 3u);
}

TEST(EditPrimitives, BackspaceAndDeleteAtEdges) {
    auto s = make(U"ab", 0);
    EXPECT_FALSE(s.backspace());
    EXPECT_TRUE(s.erase_forward());
    EXPECT_EQ(s.buffer, U"b");
    s.cursor = 1;
    EXPECT_FALSE(s.erase_forward());
    EXPECT_TRUE(s.backspace());
    EXPECT_EQ(s.buffer, U"");
    EXPECT_EQ(s.cursor, 0u);
}

TEST(EditPrimitives, TransposeAtEndSwapsLastTwo) {
    auto s = make(U"fo obra", 7);
    EXPECT_TRUE(s.transpose());
    EXPECT_EQ(s.buffer, U"fo obar");
    EXPECT_EQ(s.cursor, 7u);
}

TEST(EditPrimitives, TransposeInsideAdvances) {
    auto s = make(U"fo obar", 3);
    EXPECT_TRUE(s.transpose());
    EXPECT_EQ(s.buffer, U"foo bar");
    EXPECT_EQ(s.cursor, 4u);
}

TEST(EditPrimitives, TransposeNeedsCharacterBeforeCursor) {
    auto empty = make(U"", 0);
    EXPECT_FALSE(empty.transpose());
    auto start = make(U"ab", 0);
    EXPECT_FALSE(start.transpose());
    EXPECT_EQ(start.buffer, U"ab");
    auto single = make(U"a", 1);
    EXPECT_FALSE(single.transpose());
}

TEST(EditPrimitives, MotionBounds) {
    auto s = make(U"abc", 0);
    EXPECT_FALSE(s.move_left());
    EXPECT_FALSE(s.move_home());
    EXPECT_TRUE(s.move_end());
    EXPECT_EQ(s.cursor, 3u);
    EXPECT_FALSE(s.move_right());
    EXPECT_FALSE(s.move_end());
    EXPECT_TRUE(s.move_left());
    EXPECT_TRUE(s.move_home());
    EXPECT_EQ(s.cursor, 0u);
}

TEST(EditPrimitives, KillToEnd) {
    auto s = make(U"foo bar", 5);
    s.kill_to_end();
    EXPECT_EQ(s.buffer, U"foo b");
    EXPECT_EQ(s.cursor, 5u);
}

TEST(EditPrimitives, DeletePreviousWord) {
    auto s = make(U"foo  bar ", 9);
    s.delete_previous_word();
    EXPECT_EQ(s.buffer, U"foo  ");
    EXPECT_EQ(s.cursor, 5u);
    s.delete_previous_word();
    EXPECT_EQ(s.buffer, U"");
    EXPECT_EQ(s.cursor, 0u);
}

TEST(EditPrimitives, DeletePreviousWordDropsTextAfterCursor) {
    auto s = make(U"one two three", 7);
    s.delete_previous_word();
    EXPECT_EQ(s.buffer, U"one ");
    EXPECT_EQ(s.cursor, 4u);
}

TEST(EditState, ResetClearsRenderMemory) {
    auto s = make(U"abc", 2);
    s.commit_frame(1, 3);
    EXPECT_EQ(s.previous_cursor, 2u);
    s.reset();
    EXPECT_TRUE(s.buffer.empty());
    EXPECT_EQ(s.cursor, 0u);
    EXPECT_EQ(s.previous_cursor, 0u);
    EXPECT_EQ(s.previous_row, 0);
    EXPECT_EQ(s.max_rows, 0);
}

TEST(EditState, CursorStaysInRangeUnderRandomEdits) {
    std::mt19937 rng(12345);
    EditState s;
    for (int i = 0; i < 5000; ++i) {
        switch (rng() % 11) {
            case 0: case 1: s.insert(rng() % 3 == 0 ? U' ' : U'a' + static_cast<char32_t>(rng() % 26)); break;
            case 2: s.backspace(); break;
            case 3: s.erase_forward(); break;
            case 4: s.transpose(); break;
            case 5: s.move_left(); break;
            case 6: s.move_right(); break;
            case 7: if (rng() % 2) s.move_home(); else s.move_end(); break;
            case 8: if (rng() % 8 == 0) s.kill_to_end(); break;
            case 9: if (rng() % 8 == 0) s.delete_previous_word(); break;
            case 10: s.assign(U"history line"); break;
        }
        ASSERT_LE(s.cursor, s.buffer.size()) << "after step " << i;
    }
}
