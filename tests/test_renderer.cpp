/*
 * Renderer tests - LineEdit
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <lineedit/render/renderer.hpp>

using namespace lineedit;

static EditState make(const std::u32string& text, std::size_t cursor) {
    EditState s; s.buffer = text; s.cursor = cursor; return s;
}

static Geometry cols(int n) { Geometry g; g.columns = n; return g; }

TEST(VisualWidth, SkipsEscapeSequences) {
    EXPECT_EQ(visual_width(std::string("\x1b[1;31mred\x1b[0m> "), default_width), 5);
    EXPECT_EQ(visual_width(std::string("a\tb"), default_width), 6);
    EXPECT_EQ(visual_width(std::string("a\tb"), make_width_fn(8)), 10);
}

TEST(Geometry, ZeroFallsBackToDefaults) {
    Geometry g = normalized(Geometry{0, 0});
    EXPECT_EQ(g.columns, 80);
    EXPECT_EQ(g.rows, 24);
    g = normalized(Geometry{132, 50});
    EXPECT_EQ(g.columns, 132);
}

TEST(RenderSingleRow, EmptyLine) {
    Frame f = render_line("> ", EditState{}, Hint{}, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r> \x1b[0K\r\x1b[2C");
    EXPECT_EQ(f.cursor_row, 0);
    EXPECT_EQ(f.max_rows, 0);
}

TEST(RenderSingleRow, CursorInsideLine) {
    Frame f = render_line("> ", make(U"foo bar", 3), Hint{}, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r> foo bar\x1b[0K\r\x1b[5C");
}

TEST(RenderSingleRow, ColoredPromptCountsVisibleColumnsOnly) {
    Frame f = render_line("\x1b[33m> \x1b[0m", make(U"ab", 1), Hint{}, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r\x1b[33m> \x1b[0mab\x1b[0K\r\x1b[3C");
}

TEST(RenderSingleRow, TabTakesFourColumns) {
    Frame f = render_line("> ", make(U"a\tb", 3), Hint{}, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r> a\tb\x1b[0K\r\x1b[8C");
}

TEST(RenderSingleRow, CustomWidthFunction) {
    auto wide = [](char32_t ch) { return ch >= 0x1100 ? 2 : 1; };
    Frame f = render_line("> ", make(U"\u4e16\u754c", 2), Hint{}, Geometry{}, wide);
    EXPECT_EQ(f.bytes, "\r> \xe4\xb8\x96\xe7\x95\x8c\x1b[0K\r\x1b[6C");
}

TEST(RenderHint, PlainHintAfterBuffer) {
    Hint h; h.text = "bar";
    Frame f = render_line("> ", make(U"foo ", 4), h, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r> foo bar\x1b[0K\r\x1b[6C");
}

TEST(RenderHint, StyledHint) {
    Hint h; h.text = "bar"; h.style = Style::Yellow;
    Frame f = render_line("> ", make(U"foo ", 4), h, Geometry{}, default_width);
    EXPECT_EQ(f.bytes, "\r> foo \x1b[33mbar\x1b[0m\x1b[0K\r\x1b[6C");
}

TEST(RenderMultiRow, WrappedLineCursorAtEnd) {
    Frame f = render_line("> ", make(U"abcdefghijkl", 12), Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\r> abcdefghijkl\x1b[0K\r\x1b[4C");
    EXPECT_EQ(f.cursor_row, 1);
    EXPECT_EQ(f.max_rows, 1);
}

TEST(RenderMultiRow, MovingToFirstRowClearsLowerRow) {
    auto s = make(U"abcdefghijkl", 0);
    s.previous_row = 1; s.max_rows = 1; s.previous_cursor = 12;
    Frame f = render_line("> ", s, Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\x1b[2K\x1b[1A\r> abcdefghijkl\x1b[0K\x1b[1A\r\x1b[2C");
    EXPECT_EQ(f.cursor_row, 0);
    EXPECT_EQ(f.max_rows, 1);
}

TEST(RenderMultiRow, ShrinkingLineErasesStaleRows) {
    auto s = make(U"ab", 2);
    s.previous_row = 0; s.max_rows = 1;
    Frame f = render_line("> ", s, Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\x1b[1B\x1b[2K\x1b[1A\r> ab\x1b[0K\r\x1b[4C");
    EXPECT_EQ(f.max_rows, 1); // tallest extent is kept
}

TEST(RenderMultiRow, ExactMarginForcesNewline) {
    Frame f = render_line("> ", make(U"abcdefgh", 8), Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\r> abcdefgh\x1b[0K\n\r\r");
    EXPECT_EQ(f.cursor_row, 1);
    EXPECT_EQ(f.max_rows, 1);
}

TEST(RenderMultiRow, ShrinkAfterExactMarginClearsTheForcedRow) {
    auto s = make(U"abcdefgh", 8);
    Frame f = render_line("> ", s, Hint{}, cols(10), default_width);
    s.commit_frame(f.cursor_row, f.max_rows);
    ASSERT_EQ(s.max_rows, 1); // rows 0 and 1 drawn

    s.backspace();
    f = render_line("> ", s, Hint{}, cols(10), default_width);
    // the empty row the cursor was parked on is cleared, then the line is
    // redrawn on row 0 with nothing to move up over
    EXPECT_EQ(f.bytes, "\x1b[2K\x1b[1A\r> abcdefg\x1b[0K\r\x1b[9C");
    EXPECT_EQ(f.cursor_row, 0);
    EXPECT_EQ(f.max_rows, 1);
}

TEST(RenderMultiRow, ExactMarginWithCursorInsideStaysOnOneRow) {
    Frame f = render_line("> ", make(U"abcdefgh", 0), Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\r> abcdefgh\x1b[0K\r\x1b[2C");
    EXPECT_EQ(f.max_rows, 0);
}

TEST(RenderMultiRow, EmptyPromptAndBufferDoNotWrap) {
    Frame f = render_line("", EditState{}, Hint{}, cols(10), default_width);
    EXPECT_EQ(f.bytes, "\r\x1b[0K\r");
}

TEST(RenderFrames, RenderingTwiceIsStable) {
    auto s = make(U"abcdefghijklmnopqrstuvw", 5);
    Frame first = render_line("> ", s, Hint{}, cols(10), default_width);
    s.commit_frame(first.cursor_row, first.max_rows);
    Frame second = render_line("> ", s, Hint{}, cols(10), default_width);
    s.commit_frame(second.cursor_row, second.max_rows);
    Frame third = render_line("> ", s, Hint{}, cols(10), default_width);
    EXPECT_EQ(second.bytes, third.bytes);
    EXPECT_EQ(second.max_rows, third.max_rows);
}

TEST(RenderBlock, EraseBlockWalksUpFromBottom) {
    EditState s; s.max_rows = 2; s.previous_row = 0;
    EXPECT_EQ(move_to_bottom(s), "\x1b[2B");
    EXPECT_EQ(erase_block(s), "\x1b[2B\x1b[2K\x1b[1A\x1b[2K\x1b[1A\r");
    s.previous_row = 2;
    EXPECT_EQ(move_to_bottom(s), "");
}
