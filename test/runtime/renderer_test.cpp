#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>
#include "mock.hpp"

TEST_CASE("Single Line Snippets", "[renderer]") {
    SECTION("Labeled span with context") {
        auto out = render(bad_file(), { LabeledSpan::labeled(SourceSpan(9, 4), "this bit here") });
        auto expected = std::string(
            "   ╭─[bad_file.rs:2:3]\n"
            " 1 │ source\n"
            " 2 │   text\n"
            "   ·   ──┬─\n"
            "   ·     ╰── this bit here\n"
            " 3 │     here\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Several labels on one line") {
        auto source = bad_file("source\n  text text text text text\n    here");
        auto out = render(source, {
            LabeledSpan::labeled(SourceSpan(9, 4), "x"),
            LabeledSpan::labeled(SourceSpan(14, 4), "y"),
            LabeledSpan::labeled(SourceSpan(24, 4), "z")
        });
        auto expected = std::string(
            "   ╭─[bad_file.rs:2:3]\n"
            " 1 │ source\n"
            " 2 │   text text text text text\n"
            "   ·   ──┬─ ──┬─      ──┬─\n"
            "   ·     │    │         ╰── z\n"
            "   ·     │    ╰── y\n"
            "   ·     ╰── x\n"
            " 3 │     here\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Point label") {
        auto out = render(bad_file(), { LabeledSpan::labeled(SourceSpan::point(9), "here") });
        auto it = LineIterator{ .str = out };
        REQUIRE(it.next() == "   ╭─[bad_file.rs:2:3]");
        REQUIRE(it.next() == " 1 │ source");
        REQUIRE(it.next() == " 2 │   text");
        REQUIRE(it.next() == "   ·   ▲");
        REQUIRE(it.next() == "   ·   ╰── here");
    }

    SECTION("Point at the end of the source") {
        auto out = render(Source{ .text = "abc" }, { LabeledSpan::underline(SourceSpan::point(3)) });
        auto expected = std::string(
            "   ╭─[1:4]\n"
            " 1 │ abc\n"
            "   ·    ▲\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Point after the last line terminator") {
        auto source = Source{ .text = "abc\n" };
        auto labels = std::vector<LabeledSpan>{ LabeledSpan::labeled(SourceSpan::point(4), "eof") };

        auto out = render(source, labels);
        auto expected = std::string(
            "   ╭─[2:1]\n"
            " 1 │ abc\n"
            " 2 │ \n"
            "   · ▲\n"
            "   · ╰── eof\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);

        auto tight = render(source, labels, { .context_lines_before = 0, .context_lines_after = 0 });
        auto it = LineIterator{ .str = tight };
        REQUIRE(it.next() == "   ╭─[2:1]");
        REQUIRE(it.next() == " 2 │");
        REQUIRE(it.next() == "   · ▲");
        REQUIRE(it.next() == "   · ╰── eof");
        REQUIRE(it.next() == "   ╰────");
    }

    SECTION("Point in an empty source") {
        auto out = render(Source{ .text = "" }, { LabeledSpan::labeled(SourceSpan::point(0), "nothing") });
        auto it = LineIterator{ .str = out };
        REQUIRE(it.next() == "   ╭─[1:1]");
        REQUIRE(it.next() == " 1 │");
        REQUIRE(it.next() == "   · ▲");
        REQUIRE(it.next() == "   · ╰── nothing");
        REQUIRE(it.next() == "   ╰────");
    }

    SECTION("Nested labels on one line") {
        auto out = render(Source{ .text = "0123456789" }, {
            LabeledSpan::labeled(SourceSpan(0, 10), "outer"),
            LabeledSpan::labeled(SourceSpan(2, 1), "inner")
        });
        auto expected = std::string(
            "   ╭─[1:1]\n"
            " 1 │ 0123456789\n"
            "   · ──┬──┬────\n"
            "   ·   │  ╰── outer\n"
            "   ·   ╰── inner\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Point inside an underline") {
        auto out = render(Source{ .text = "abcdefgh" }, {
            LabeledSpan::underline(SourceSpan(0, 6)),
            LabeledSpan::labeled(SourceSpan::point(3), "p")
        });
        auto expected = std::string(
            "   ╭─[1:1]\n"
            " 1 │ abcdefgh\n"
            "   · ───▲──\n"
            "   ·    ╰── p\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Overlapping underlines") {
        auto source = Source{ .text = "abcdefgh" };
        auto plain = render(source, {
            LabeledSpan::underline(SourceSpan(0, 4)),
            LabeledSpan::underline(SourceSpan(2, 4))
        });
        REQUIRE(plain == "   ╭─[1:1]\n 1 │ abcdefgh\n   · ──────\n   ╰────\n");

        auto labeled = render(source, {
            LabeledSpan::labeled(SourceSpan(0, 4), "x"),
            LabeledSpan::labeled(SourceSpan(2, 4), "y")
        });
        auto expected = std::string(
            "   ╭─[1:1]\n"
            " 1 │ abcdefgh\n"
            "   · ──┬─┬─\n"
            "   ·   │ ╰── y\n"
            "   ·   ╰── x\n"
            "   ╰────\n"
        );
        REQUIRE(labeled == expected);
    }

    SECTION("Multi-line label text") {
        auto out = render(bad_file(), { LabeledSpan::labeled(SourceSpan(9, 4), "first\nsecond") });
        auto it = LineIterator{ .str = out };
        for (auto i = 0; i < 4; ++i) it.next();
        REQUIRE(it.next() == "   ·     ╰── first");
        REQUIRE(it.next() == "   ·     │   second");
        REQUIRE(it.next() == " 3 │     here");
    }

    SECTION("Wide characters") {
        auto out = render(Source{ .text = "你好 world" }, { LabeledSpan::labeled(SourceSpan(7, 5), "w") });
        auto expected = std::string(
            "   ╭─[1:8]\n"
            " 1 │ 你好 world\n"
            "   ·      ──┬──\n"
            "   ·        ╰── w\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Tabs") {
        auto out = render(Source{ .text = "\tx = 1" }, { LabeledSpan::labeled(SourceSpan(1, 1), "x") });
        auto expected = std::string(
            "   ╭─[1:2]\n"
            " 1 │     x = 1\n"
            "   ·     ┬\n"
            "   ·     ╰── x\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }
}

TEST_CASE("Multi Line Snippets", "[renderer]") {
    constexpr auto five_lines = "line1\nline2\nline3\nline4\nline5\n";

    SECTION("Span over adjacent lines") {
        auto out = render(bad_file(), { LabeledSpan::labeled(SourceSpan(9, 11), "these two lines") });
        auto expected = std::string(
            "   ╭─[bad_file.rs:2:3]\n"
            " 1 │     source\n"
            " 2 │ ╭─▶   text\n"
            " 3 │ ├─▶     here\n"
            "   · ╰──── these two lines\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Nested spans") {
        auto out = render(Source{ .text = five_lines }, {
            LabeledSpan::labeled(SourceSpan(0, 30), "block 1"),
            LabeledSpan::labeled(SourceSpan(10, 9), "block 2")
        });
        auto expected = std::string(
            "   ╭─[1:1]\n"
            " 1 │ ╭──▶ line1\n"
            " 2 │ │╭─▶ line2\n"
            " 3 │ ││   line3\n"
            " 4 │ │├─▶ line4\n"
            "   · │╰──── block 2\n"
            " 5 │ ├──▶ line5\n"
            "   · ╰───── block 1\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Unlabeled inner span") {
        auto out = render(Source{ .text = five_lines }, {
            LabeledSpan::labeled(SourceSpan(0, 30), "block 1"),
            LabeledSpan::underline(SourceSpan(10, 9))
        });
        auto it = LineIterator{ .str = out };
        for (auto i = 0; i < 4; ++i) it.next();
        REQUIRE(it.next() == " 4 │ │╰─▶ line4");
        REQUIRE(it.next() == " 5 │ ├──▶ line5");
        REQUIRE(it.next() == "   · ╰───── block 1");
    }
}

TEST_CASE("Snippet Windows", "[renderer]") {
    SECTION("Distant labels get separate windows") {
        auto config = RenderConfig{ .context_lines_before = 0, .context_lines_after = 0 };
        auto out = render(Source{ .text = "line1\nline2\nline3\nline4\nline5\n" }, {
            LabeledSpan::labeled(SourceSpan(0, 5), "a"),
            LabeledSpan::labeled(SourceSpan(24, 5), "b")
        }, config);
        auto expected = std::string(
            "   ╭─[1:1]\n"
            " 1 │ line1\n"
            "   · ──┬──\n"
            "   ·   ╰── a\n"
            "   ╰────\n"
            "   ╭─[5:1]\n"
            " 5 │ line5\n"
            "   · ──┬──\n"
            "   ·   ╰── b\n"
            "   ╰────\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Unreadable label") {
        auto out = render(bad_file("source\n  text"), {
            LabeledSpan::labeled(SourceSpan(50, 6), "bad"),
            LabeledSpan::labeled(SourceSpan(0, 6), "ok")
        });
        auto expected = std::string(
            "   ╭─[bad_file.rs:1:1]\n"
            " 1 │ source\n"
            "   · ───┬──\n"
            "   ·    ╰── ok\n"
            " 2 │   text\n"
            "   ╰────\n"
            "  Failed to read contents for label 'bad' (offset: 50, length: 6): OutOfBounds\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Only unreadable labels") {
        auto out = render(bad_file(), { LabeledSpan::underline(SourceSpan(100, 1)) });
        REQUIRE(out == "  Failed to read contents for label '<none>' (offset: 100, length: 1): OutOfBounds\n");
    }

    SECTION("No labels") {
        REQUIRE(render(bad_file(), {}).empty());
    }

    SECTION("Anonymous source") {
        auto source = bad_file();
        source.name.clear();
        auto out = render(source, { LabeledSpan::labeled(SourceSpan(9, 4), "this bit here") });
        REQUIRE(LineIterator{ .str = out }.next() == "   ╭─[2:3]");
    }

    SECTION("Ascii glyphs") {
        auto config = RenderConfig{ .glyphs = core::term::glyphs::ascii };
        auto out = render(bad_file(), { LabeledSpan::labeled(SourceSpan(9, 4), "this bit here") }, config);
        auto expected = std::string(
            "   ,-[bad_file.rs:2:3]\n"
            " 1 | source\n"
            " 2 |   text\n"
            "   :   ^^|^\n"
            "   :     `-- this bit here\n"
            " 3 |     here\n"
            "   `----\n"
        );
        REQUIRE(out == expected);
    }

    SECTION("Line numbers are right aligned") {
        auto text = std::string();
        for (auto i = 1; i <= 10; ++i) text += "l" + std::to_string(i) + "\n";
        // "l9\n" starts at byte 24.
        auto out = render(Source{ .text = text }, { LabeledSpan::underline(SourceSpan(24, 2)) });
        auto it = LineIterator{ .str = out };
        REQUIRE(it.next() == "    ╭─[9:1]");
        REQUIRE(it.next() == "  8 │ l8");
        REQUIRE(it.next() == "  9 │ l9");
        REQUIRE(it.next() == "    · ──");
        REQUIRE(it.next() == " 10 │ l10");
        REQUIRE(it.next() == "    ╰────");
    }

    SECTION("Writing through a terminal") {
        auto out = std::string();
        {
            auto term = Terminal(Writer<std::string>(out));
            auto labels = std::vector<LabeledSpan>{ LabeledSpan::labeled(SourceSpan(9, 4), "this bit here") };
            render_snippets(term, bad_file(), labels);
        }
        REQUIRE(out == render(bad_file(), { LabeledSpan::labeled(SourceSpan(9, 4), "this bit here") }));
    }
}
