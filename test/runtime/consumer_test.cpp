#include <catch2/catch_test_macros.hpp>
#include <string>
#include "mock.hpp"

namespace {
    auto make(std::string name, Severity severity, std::optional<dsize_t> offset, std::string message) -> Diagnostic {
        auto d = Diagnostic {
            .severity = severity,
            .message = std::move(message),
            .source = Source { .name = std::move(name), .text = "0123456789\nabcdefghij\n" }
        };
        if (offset) d.labels.push_back(LabeledSpan::underline(SourceSpan(*offset, 1)));
        return d;
    }
}

TEST_CASE("Stream Consumer", "[stream_consumer]") {
    auto out = std::string();
    {
        auto consumer = StreamDiagnosticConsumer(Terminal(Writer<std::string>(out)));
        consumer.consume(Diagnostic{ .message = "first" });
        consumer.consume(Diagnostic{ .severity = Severity::Warning, .message = "second" });
        consumer.flush();
    }
    REQUIRE(out == "  × first\n\n  ⚠ second\n");

    SECTION("Reset drops the separator") {
        out.clear();
        auto consumer = StreamDiagnosticConsumer(Terminal(Writer<std::string>(out)), NarratableReportHandler{});
        consumer.consume(Diagnostic{ .message = "a" });
        consumer.reset();
        consumer.consume(Diagnostic{ .message = "b" });
        consumer.flush();
        REQUIRE(out == "a\n    Diagnostic severity: error\nb\n    Diagnostic severity: error\n");
    }
}

TEST_CASE("Error Tracking Consumer", "[error_consumer]") {
    auto stream_consumer = TestConsumer();

    {
        auto consumer = ErrorTrackingDiagnosticConsumer(&stream_consumer);
        REQUIRE(consumer.seen_error() == false);

        consumer.consume(make("tst.cpp", Severity::Error, 3, "Test 3"));
        REQUIRE(consumer.seen_error() == true);

        consumer.reset();
        REQUIRE(consumer.seen_error() == false);
    }

    {
        auto consumer = ErrorTrackingDiagnosticConsumer(&stream_consumer);
        consumer.consume(make("tst.cpp", Severity::Warning, 3, "Test 3"));
        consumer.consume(make("tst.cpp", Severity::Advice, 3, "Test 3"));
        REQUIRE(consumer.seen_error() == false);

        consumer.flush();
        REQUIRE(stream_consumer.flushes == 1);
    }

    REQUIRE(stream_consumer.diagnostics.size() == 3);
}

TEST_CASE("Sorting Consumer", "[sorting_consumer]") {
    auto mock_consumer = TestConsumer();

    SECTION("Orders by source and offset") {
        auto consumer = SortingDiagnosticConsumer(&mock_consumer);
        consumer.consume(make("b.cpp", Severity::Error, 10, "b10"));
        consumer.consume(make("a.cpp", Severity::Error, 12, "a12"));
        consumer.consume(make("b.cpp", Severity::Error, 2, "b2"));
        consumer.consume(make("a.cpp", Severity::Warning, 1, "a1"));
        REQUIRE(consumer.size() == 4);
        REQUIRE(mock_consumer.diagnostics.empty());

        consumer.flush();
        REQUIRE(consumer.size() == 0);
        REQUIRE(mock_consumer.flushes == 1);

        auto const& ds = mock_consumer.diagnostics;
        REQUIRE(ds.size() == 4);
        REQUIRE(ds[0].message == "a1");
        REQUIRE(ds[1].message == "a12");
        REQUIRE(ds[2].message == "b2");
        REQUIRE(ds[3].message == "b10");
    }

    SECTION("Unlabeled diagnostics come first and keep their order") {
        auto consumer = SortingDiagnosticConsumer(&mock_consumer);
        consumer.consume(make("a.cpp", Severity::Error, 5, "labeled"));
        consumer.consume(make("a.cpp", Severity::Error, std::nullopt, "first"));
        consumer.consume(make("a.cpp", Severity::Error, std::nullopt, "second"));
        consumer.flush();

        auto const& ds = mock_consumer.diagnostics;
        REQUIRE(ds.size() == 3);
        REQUIRE(ds[0].message == "first");
        REQUIRE(ds[1].message == "second");
        REQUIRE(ds[2].message == "labeled");
    }

    SECTION("Forwarded reports are rendered") {
        auto consumer = SortingDiagnosticConsumer(&mock_consumer);
        consumer.consume(make("b.cpp", Severity::Error, 12, "later"));
        consumer.consume(make("a.cpp", Severity::Error, 0, "earlier"));
        consumer.flush();

        auto it = mock_consumer.line_iter();
        REQUIRE(it.next() == "  × earlier");
        REQUIRE(it.next() == "   ╭─[a.cpp:1:1]");
        REQUIRE(it.next() == " 1 │ 0123456789");
        REQUIRE(it.next() == "   · ─");
        REQUIRE(it.next() == " 2 │ abcdefghij");
        REQUIRE(it.next() == "   ╰────");
        REQUIRE(it.next() == "  × later");
        REQUIRE(it.next() == "   ╭─[b.cpp:2:2]");
    }
}
